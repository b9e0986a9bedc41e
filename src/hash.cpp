#include "dvs/hash.h"
#include "internal.h"

#include <openssl/evp.h>

#include <cerrno>
#include <cstring>
#include <fstream>

namespace dvs {

// ---------------------------------------------------------------------------
// HashAlgo
// ---------------------------------------------------------------------------

const char* hash_algo_name(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:  return "sha256";
        case HashAlgo::Fnv1a64: return "fnv1a64";
        case HashAlgo::Md5:     return "md5";
    }
    return "sha256"; // unreachable
}

std::optional<HashAlgo> hash_algo_from_name(const std::string& name) {
    if (name == "sha256")  return HashAlgo::Sha256;
    if (name == "fnv1a64") return HashAlgo::Fnv1a64;
    if (name == "md5")     return HashAlgo::Md5;
    return std::nullopt;
}

size_t hash_algo_hex_len(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:  return 64;
        case HashAlgo::Fnv1a64: return 16;
        case HashAlgo::Md5:     return 32;
    }
    return 64; // unreachable
}

// ---------------------------------------------------------------------------
// Oid
// ---------------------------------------------------------------------------

namespace {

bool is_lower_hex(const std::string& s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

std::string to_hex(const unsigned char* bytes, size_t len) {
    static const char kHex[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i]     = kHex[(bytes[i] >> 4) & 0xF];
        out[2 * i + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

} // anonymous namespace

Oid Oid::make(HashAlgo algo, std::string hex) {
    if (hex.size() != hash_algo_hex_len(algo)) {
        throw InvalidOidError(std::string(hash_algo_name(algo)) +
                              " digest must be " +
                              std::to_string(hash_algo_hex_len(algo)) +
                              " hex chars, got " + std::to_string(hex.size()));
    }
    if (!is_lower_hex(hex)) {
        throw InvalidOidError("non-hex digit in digest: " + hex);
    }
    return Oid{algo, std::move(hex)};
}

Oid Oid::parse(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        throw InvalidOidError("missing algorithm prefix: " + text);
    }
    auto algo = hash_algo_from_name(text.substr(0, colon));
    if (!algo) {
        throw InvalidOidError("unknown algorithm: " + text.substr(0, colon));
    }
    return make(*algo, text.substr(colon + 1));
}

std::string Oid::to_string() const {
    return std::string(hash_algo_name(algo)) + ":" + hex;
}

std::filesystem::path Oid::storage_subpath() const {
    return std::filesystem::path(hash_algo_name(algo)) /
           hex.substr(0, 2) / hex.substr(2);
}

// ---------------------------------------------------------------------------
// Hasher
// ---------------------------------------------------------------------------

namespace {

constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME  = 0x100000001b3ULL;

[[noreturn]] void throw_evp(const char* what) {
    throw FileOpError(ErrorKind::HashError, std::string(what) + " failed");
}

} // anonymous namespace

struct Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;   ///< Sha256 / Md5.
    uint64_t    fnv = FNV_OFFSET; ///< Fnv1a64 running state.
    bool        done = false;

    ~Impl() {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

Hasher::Hasher(HashAlgo algo) : algo_(algo), impl_(std::make_unique<Impl>()) {
    if (algo_ == HashAlgo::Fnv1a64) return;

    impl_->ctx = EVP_MD_CTX_new();
    if (!impl_->ctx) throw_evp("EVP_MD_CTX_new");
    const EVP_MD* md = algo_ == HashAlgo::Md5 ? EVP_md5() : EVP_sha256();
    if (EVP_DigestInit_ex(impl_->ctx, md, nullptr) != 1)
        throw_evp("EVP_DigestInit_ex");
}

Hasher::~Hasher() = default;
Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;

void Hasher::update(const void* data, size_t len) {
    if (len == 0) return;
    if (algo_ == HashAlgo::Fnv1a64) {
        auto* p = static_cast<const unsigned char*>(data);
        uint64_t h = impl_->fnv;
        for (size_t i = 0; i < len; ++i) {
            h ^= p[i];
            h *= FNV_PRIME;
        }
        impl_->fnv = h;
        return;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1)
        throw_evp("EVP_DigestUpdate");
}

std::string Hasher::finish() {
    if (impl_->done) {
        throw FileOpError(ErrorKind::HashError, "hasher already finished");
    }
    impl_->done = true;

    if (algo_ == HashAlgo::Fnv1a64) {
        unsigned char be[8];
        for (int i = 0; i < 8; ++i)
            be[i] = static_cast<unsigned char>(impl_->fnv >> (56 - 8 * i));
        return to_hex(be, sizeof(be));
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int  len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, out, &len) != 1)
        throw_evp("EVP_DigestFinal_ex");
    return to_hex(out, len);
}

// ---------------------------------------------------------------------------
// One-shot helpers
// ---------------------------------------------------------------------------

std::string hash_bytes(const void* data, size_t len, HashAlgo algo) {
    Hasher h(algo);
    h.update(data, len);
    return h.finish();
}

std::pair<DigestSet, uint64_t>
hash_file(const std::filesystem::path& path, const std::vector<HashAlgo>& algos) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw IoError("cannot open file: " + path.string() + ": " +
                      std::strerror(errno));
    }

    std::vector<Hasher> hashers;
    for (HashAlgo a : algos) {
        bool seen = false;
        for (const auto& h : hashers) seen = seen || h.algo() == a;
        if (!seen) hashers.emplace_back(a);
    }

    std::vector<char> buf(io::CHUNK_SIZE);
    uint64_t total = 0;
    while (ifs) {
        ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = static_cast<size_t>(ifs.gcount());
        if (n == 0) break;
        for (auto& h : hashers) h.update(buf.data(), n);
        total += n;
    }
    if (ifs.bad()) {
        throw IoError("read failed: " + path.string());
    }

    DigestSet digests;
    for (auto& h : hashers) digests[h.algo()] = h.finish();
    return {std::move(digests), total};
}

Oid hash_file_oid(const std::filesystem::path& path, HashAlgo algo) {
    auto result = hash_file(path, {algo});
    return Oid{algo, result.first.at(algo)};
}

} // namespace dvs
