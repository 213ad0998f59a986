#include "archive/digest.hpp"
#include <openssl/evp.h>
#include <fmt/core.h>
#include <memory>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;

string sha256_hex(string_view data) {
    unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx)
        throw internal_error("EVP_MD_CTX_new failed");

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1)
        throw internal_error("SHA-256 computation failed");

    string result;
    result.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i)
        result += fmt::format("{:02x}", md[i]);
    return result;
}

bool is_valid_digest(const string &digest) {
    if (digest.size() != 64) return false;
    for (char c : digest)
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
            return false;
    return true;
}

void verify_digest(string_view bytes, const string &digest) {
    if (!is_valid_digest(digest))
        throw archive_error("malformed digest " + digest);
    string actual = sha256_hex(bytes);
    if (actual != digest)
        throw archive_error(fmt::format("digest mismatch: expected {}, got {}", digest, actual));
}

}  // namespace arbiter
