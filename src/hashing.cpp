#include "hashing.hpp"
#include <array>
#include <cmath>
#include <openssl/crypto.h>

namespace ztgate {

namespace {

std::string to_hex(const unsigned char* digest, unsigned int len) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(static_cast<size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out[i * 2] = kHex[(digest[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[digest[i] & 0xF];
    }
    return out;
}

} // namespace

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        failed_ = true;
    }
}

Sha256::~Sha256() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

Sha256& Sha256::update(std::string_view data) {
    if (failed_ || data.empty()) return *this;
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) failed_ = true;
    return *this;
}

std::expected<std::string, HashErrorInfo> Sha256::finish_hex() {
    if (!ctx_) {
        return std::unexpected(HashErrorInfo{HashError::ContextAllocFailed, "EVP_MD_CTX_new failed"});
    }
    if (failed_) {
        return std::unexpected(HashErrorInfo{HashError::DigestFailed, "SHA-256 digest update failed"});
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &len) != 1) {
        failed_ = true;
        return std::unexpected(HashErrorInfo{HashError::DigestFailed, "EVP_DigestFinal_ex failed"});
    }
    // The context is finalized; further updates are a caller error.
    failed_ = true;
    return to_hex(digest, len);
}

std::expected<std::string, HashErrorInfo> sha256_hex(std::string_view data) {
    Sha256 h;
    h.update(data);
    return h.finish_hex();
}

double shannon_entropy(std::string_view s) {
    if (s.empty()) return 0.0;
    std::array<size_t, 256> freq{};
    for (char c : s) ++freq[static_cast<unsigned char>(c)];

    double entropy = 0.0;
    const double len = static_cast<double>(s.size());
    for (size_t count : freq) {
        if (count == 0) continue;
        double p = static_cast<double>(count) / len;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

void secure_wipe(std::string& s) {
    if (!s.empty()) OPENSSL_cleanse(s.data(), s.size());
    s.clear();
}

} // namespace ztgate
