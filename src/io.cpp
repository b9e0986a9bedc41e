#include "internal.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

namespace dvs {
namespace io {

namespace fss = std::filesystem;

void ensure_dir(const fss::path& dir) {
    std::error_code ec;
    fss::create_directories(dir, ec);
    // Another writer may have created it between our check and mkdir.
    if (ec && !fss::is_directory(dir)) {
        throw IoError("cannot create directory: " + dir.string() + ": " +
                      ec.message());
    }
    if (!fss::is_directory(dir)) {
        throw IoError("not a directory: " + dir.string());
    }
}

std::string read_text(const fss::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) {
        throw IoError("cannot open file: " + p.string() + ": " +
                      std::strerror(errno));
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    if (ifs.bad()) {
        throw IoError("read failed: " + p.string());
    }
    return ss.str();
}

fss::path temp_sibling(const fss::path& dest) {
    static std::atomic<uint64_t> counter{0};
    auto stamp = static_cast<uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    std::string name = "." + dest.filename().string() + ".tmp-" +
                       std::to_string(stamp ^ tid) + "-" +
                       std::to_string(counter.fetch_add(1));
    return dest.parent_path() / name;
}

namespace {

void rename_into_place(const fss::path& tmp, const fss::path& dest) {
    std::error_code ec;
    fss::rename(tmp, dest, ec);
    if (ec) {
        std::error_code rm_ec;
        fss::remove(tmp, rm_ec);
        throw IoError("cannot rename " + tmp.string() + " to " +
                      dest.string() + ": " + ec.message());
    }
}

void write_buffer(const fss::path& dest, const char* data, size_t len) {
    auto tmp = temp_sibling(dest);
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw IoError("cannot create file: " + tmp.string() + ": " +
                          std::strerror(errno));
        }
        ofs.write(data, static_cast<std::streamsize>(len));
        ofs.flush();
        if (!ofs) {
            ofs.close();
            std::error_code ec;
            fss::remove(tmp, ec);
            throw IoError("write failed: " + tmp.string());
        }
    }
    rename_into_place(tmp, dest);
}

} // anonymous namespace

void write_atomic(const fss::path& dest, const std::string& data) {
    write_buffer(dest, data.data(), data.size());
}

void write_atomic(const fss::path& dest, const std::vector<uint8_t>& data) {
    write_buffer(dest, reinterpret_cast<const char*>(data.data()), data.size());
}

void copy_atomic(const fss::path& src, const fss::path& dest) {
    std::ifstream in(src, std::ios::binary);
    if (!in) {
        throw IoError("cannot open file: " + src.string() + ": " +
                      std::strerror(errno));
    }

    auto tmp = temp_sibling(dest);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IoError("cannot create file: " + tmp.string() + ": " +
                          std::strerror(errno));
        }
        std::vector<char> buf(CHUNK_SIZE);
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            auto n = in.gcount();
            if (n > 0) out.write(buf.data(), n);
        }
        out.flush();
        if (in.bad() || !out) {
            out.close();
            std::error_code ec;
            fss::remove(tmp, ec);
            throw IoError("copy failed: " + src.string() + " -> " + dest.string());
        }
    }
    rename_into_place(tmp, dest);
}

void append_line(const fss::path& p, const std::string& line) {
    std::ofstream ofs(p, std::ios::binary | std::ios::app);
    if (!ofs) {
        throw IoError("cannot open file for append: " + p.string() + ": " +
                      std::strerror(errno));
    }
    ofs << line << '\n';
    ofs.flush();
    if (!ofs) {
        throw IoError("append failed: " + p.string());
    }
}

} // namespace io
} // namespace dvs
