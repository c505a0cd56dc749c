#include "coordinator/auth.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

namespace warden::coordinator {
namespace {

TEST(SecretAuthenticatorTest, AcceptsExactSecret) {
    SecretAuthenticator auth("s3cret-value");
    EXPECT_TRUE(auth.Verify("s3cret-value"));
}

TEST(SecretAuthenticatorTest, RejectsNearMisses) {
    SecretAuthenticator auth("s3cret-value");
    EXPECT_FALSE(auth.Verify("x3cret-value"));
    EXPECT_FALSE(auth.Verify("s3cret-valuX"));
    EXPECT_FALSE(auth.Verify("s3cret-valu"));
    EXPECT_FALSE(auth.Verify("s3cret-value-and-more"));
    EXPECT_FALSE(auth.Verify(""));
}

TEST(SecretAuthenticatorTest, RequiresSecret) {
    EXPECT_THROW(SecretAuthenticator(""), std::invalid_argument);
}

TEST(ExtractCredentialTest, PrefersSandboxHeader) {
    EXPECT_EQ(ExtractCredential(std::string("a"), std::string("Bearer b")), "a");
}

TEST(ExtractCredentialTest, FallsBackToBearerToken) {
    EXPECT_EQ(ExtractCredential(std::nullopt, std::string("Bearer b")), "b");
    EXPECT_EQ(ExtractCredential(std::string(""), std::string("Bearer b")), "b");
}

TEST(ExtractCredentialTest, IgnoresOtherSchemes) {
    EXPECT_FALSE(ExtractCredential(std::nullopt, std::string("Basic dXNlcg==")).has_value());
    EXPECT_FALSE(ExtractCredential(std::nullopt, std::string("Bearer ")).has_value());
    EXPECT_FALSE(ExtractCredential(std::nullopt, std::nullopt).has_value());
}

}  // namespace
}  // namespace warden::coordinator
