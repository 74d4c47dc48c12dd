#pragma once

#include <string>
#include <string_view>
#include <expected>
#include <openssl/evp.h>

namespace ztgate {

enum class HashError {
    ContextAllocFailed,
    DigestFailed
};

struct HashErrorInfo {
    HashError error;
    std::string message;
};

inline constexpr size_t kSha256HexLength = 64;

// SHA-256 of `data`, lowercase hex.
std::expected<std::string, HashErrorInfo> sha256_hex(std::string_view data);

// Incremental SHA-256 over several parts, for hash preimages built from fields.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Sha256& update(std::string_view data);
    std::expected<std::string, HashErrorInfo> finish_hex();

private:
    EVP_MD_CTX* ctx_;
    bool failed_ = false;
};

// Shannon entropy in bits per byte.
double shannon_entropy(std::string_view s);

// Overwrite the bytes of `s` before it is released.
void secure_wipe(std::string& s);

} // namespace ztgate
