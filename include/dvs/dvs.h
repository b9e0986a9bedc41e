#pragma once

/// @file dvs.h
/// Umbrella header: include this to get the full dvs C++ API.

#include "error.h"
#include "hash.h"
#include "types.h"
#include "config.h"
#include "storage.h"
#include "metadata.h"
#include "manifest.h"
#include "layout.h"
#include "state.h"
#include "path_guard.h"
#include "repository.h"

#include <string>
#include <vector>

namespace dvs {

/// Glob pattern matching against the local filesystem.
/// Matches regular files using dotfile-aware glob rules, skipping `.git`,
/// `.dvs` and sidecar files. Returns sorted `/`-separated paths relative
/// to `root`.
///
/// @code
///     for (auto& rel : dvs::disk_glob("data/**/*.csv"))
///         std::cout << rel << "\n";
/// @endcode
std::vector<std::string> disk_glob(const std::string& pattern,
                                   const std::string& root = ".");

} // namespace dvs
