#include "internal.h"
#include "dvs/error.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <string>
#include <thread>

#ifdef DVS_POSIX_LOCK
#  include <cerrno>
#  include <cstring>
#  include <fcntl.h>
#  include <sys/file.h>
#  include <unistd.h>
#endif

#ifdef _WIN32
#  include <windows.h>
#endif

namespace dvs {
namespace lock {

namespace fss = std::filesystem;

namespace {

constexpr auto LOCK_TIMEOUT = std::chrono::seconds(30);
constexpr auto LOCK_POLL    = std::chrono::milliseconds(50);

/// "<path> (held by pid N)" when the holder left its pid behind.
std::string describe_holder(const fss::path& lock_path) {
    std::ifstream in(lock_path);
    std::string pid;
    if (in >> pid) return lock_path.string() + " (held by pid " + pid + ")";
    return lock_path.string();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RepoLock
// ---------------------------------------------------------------------------

#ifdef DVS_POSIX_LOCK

RepoLock::RepoLock(const fss::path& locks_dir)
    : path_(locks_dir / "repo.lock")
{
    io::ensure_dir(locks_dir);
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw IoError("cannot open lock file: " + path_.string() + ": " +
                      std::strerror(errno));
    }

    auto deadline = std::chrono::steady_clock::now() + LOCK_TIMEOUT;
    bool waited = false;
    while (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        if (err != EWOULDBLOCK) {
            ::close(fd_);
            throw IoError("flock failed on " + path_.string() + ": " + std::strerror(err));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd_);
            throw LockTimeoutError(describe_holder(path_));
        }
        if (!waited) {
            spdlog::info("waiting for {}", describe_holder(path_));
            waited = true;
        }
        std::this_thread::sleep_for(LOCK_POLL);
    }

    // The pid is informational only; a failed write does not void the lock.
    auto pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd_, 0) != 0 ||
        ::pwrite(fd_, pid.data(), pid.size(), 0) != static_cast<ssize_t>(pid.size())) {
        spdlog::debug("cannot record pid in {}: {}", path_.string(), std::strerror(errno));
    }
}

RepoLock::~RepoLock() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
}

#elif defined(_WIN32)

RepoLock::RepoLock(const fss::path& locks_dir)
    : path_(locks_dir / "repo.lock")
{
    io::ensure_dir(locks_dir);
    auto deadline = std::chrono::steady_clock::now() + LOCK_TIMEOUT;
    while (true) {
        handle_ = CreateFileW(path_.c_str(), GENERIC_READ | GENERIC_WRITE,
                              FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr,
                              OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle_ == INVALID_HANDLE_VALUE) {
            throw IoError("cannot open lock file: " + path_.string());
        }
        OVERLAPPED ov = {};
        if (LockFileEx(handle_, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                       0, MAXDWORD, MAXDWORD, &ov)) {
            break;
        }
        CloseHandle(handle_);
        if (std::chrono::steady_clock::now() >= deadline) {
            throw LockTimeoutError(path_.string());
        }
        std::this_thread::sleep_for(LOCK_POLL);
    }
}

RepoLock::~RepoLock() {
    OVERLAPPED ov = {};
    UnlockFileEx(handle_, 0, MAXDWORD, MAXDWORD, &ov);
    CloseHandle(handle_);
}

#else

// Single process only.
RepoLock::RepoLock(const fss::path& locks_dir) : path_(locks_dir / "repo.lock") {}
RepoLock::~RepoLock() = default;

#endif

void with_repo_lock(const fss::path& locks_dir, const std::function<void()>& fn) {
    RepoLock held(locks_dir);
    fn();
}

} // namespace lock
} // namespace dvs
