#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace warden::coordinator {

// Checks caller credentials against the shared secret. Both sides are hashed
// before a constant-time compare, so neither the position of the first
// mismatching byte nor a length difference changes the work done.
class SecretAuthenticator {
public:
    explicit SecretAuthenticator(std::string shared_secret);

    bool Verify(std::string_view presented) const;

private:
    std::string secret_digest_;
};

// Pulls the credential out of an X-Sandbox-Secret value or an
// "Authorization: Bearer <token>" value, preferring the former.
std::optional<std::string> ExtractCredential(const std::optional<std::string>& sandbox_secret_header,
                                             const std::optional<std::string>& authorization_header);

}  // namespace warden::coordinator
