#include "coordinator/auth.hpp"

#include <openssl/crypto.h>
#include <openssl/sha.h>
#include <stdexcept>
#include <utility>

#include "utils/common.hpp"

namespace warden::coordinator {
namespace {

std::string Sha256(std::string_view input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, input.data(), input.size());
    SHA256_Final(hash, &ctx);
    return std::string(reinterpret_cast<const char*>(hash), sizeof(hash));
}

}  // namespace

SecretAuthenticator::SecretAuthenticator(std::string shared_secret) {
    if (shared_secret.empty()) {
        throw std::invalid_argument("shared secret must not be empty");
    }
    secret_digest_ = Sha256(shared_secret);
    OPENSSL_cleanse(shared_secret.data(), shared_secret.size());
}

bool SecretAuthenticator::Verify(std::string_view presented) const {
    const auto digest = Sha256(presented);
    return CRYPTO_memcmp(digest.data(), secret_digest_.data(), SHA256_DIGEST_LENGTH) == 0;
}

std::optional<std::string> ExtractCredential(const std::optional<std::string>& sandbox_secret_header,
                                             const std::optional<std::string>& authorization_header) {
    if (sandbox_secret_header && !sandbox_secret_header->empty()) {
        return sandbox_secret_header;
    }
    static constexpr std::string_view kBearer = "Bearer ";
    if (authorization_header && utils::StartsWith(*authorization_header, kBearer)) {
        auto token = authorization_header->substr(kBearer.size());
        if (!token.empty()) {
            return token;
        }
    }
    return std::nullopt;
}

}  // namespace warden::coordinator
