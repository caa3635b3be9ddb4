#include <kiln/crypto/sha256.h>

#include <openssl/evp.h>
#include <fmt/format.h>

#include <array>
#include <memory>

namespace kiln::crypto {

Result<std::string> sha256Hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
    if (!ctx) {
        return Error{ErrorCode::InternalError, "Failed to create EVP_MD_CTX"};
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Error{ErrorCode::InternalError, "Failed to initialize SHA256"};
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return Error{ErrorCode::InternalError, "Failed to update SHA256"};
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &hashLen) != 1) {
        return Error{ErrorCode::InternalError, "Failed to finalize SHA256"};
    }

    std::string result;
    result.reserve(hashLen * 2);
    for (unsigned int i = 0; i < hashLen; ++i) {
        result += fmt::format("{:02x}", hash[i]);
    }
    return result;
}

} // namespace kiln::crypto
