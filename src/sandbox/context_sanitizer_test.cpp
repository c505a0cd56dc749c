#include "sandbox/context_sanitizer.hpp"

#include <string>

#include <gtest/gtest.h>

#include "sandbox/types.hpp"

namespace warden::sandbox {
namespace {

TEST(ContextSanitizerTest, PassesPrimitiveContext) {
    const auto context = utils::Json::parse(R"({"items": [1, 2.5, "x", true, null], "meta": {"k": "v"}})");
    EXPECT_EQ(SanitizeContext(context, {}), context);
}

TEST(ContextSanitizerTest, TreatsNullAsEmpty) {
    const auto context = SanitizeContext(nullptr, {});
    EXPECT_TRUE(context.is_object());
    EXPECT_TRUE(context.empty());
}

TEST(ContextSanitizerTest, RejectsNonObjects) {
    EXPECT_THROW(SanitizeContext(utils::Json::array(), {}), InvalidRequestError);
    EXPECT_THROW(SanitizeContext("text", {}), InvalidRequestError);
}

TEST(ContextSanitizerTest, RejectsReservedKeysAtAnyDepth) {
    EXPECT_THROW(SanitizeContext(utils::Json::parse(R"({"_secret": 1})"), {}), InvalidRequestError);
    EXPECT_THROW(SanitizeContext(utils::Json::parse(R"({"a": {"__class__": 1}})"), {}), InvalidRequestError);
}

TEST(ContextSanitizerTest, RequiresIdentifierKeysAtTopLevel) {
    EXPECT_THROW(SanitizeContext(utils::Json::parse(R"({"not valid": 1})"), {}), InvalidRequestError);
    EXPECT_THROW(SanitizeContext(utils::Json::parse(R"({"1abc": 1})"), {}), InvalidRequestError);
    EXPECT_NO_THROW(SanitizeContext(utils::Json::parse(R"({"a": {"not valid": 1}})"), {}));
}

TEST(ContextSanitizerTest, RejectsKeysShadowingBuiltins) {
    EXPECT_THROW(SanitizeContext(utils::Json::parse(R"({"print": 1})"), {}), InvalidRequestError);
    EXPECT_THROW(SanitizeContext(utils::Json::parse(R"({"len": 1})"), {}), InvalidRequestError);
}

TEST(ContextSanitizerTest, BoundsDepth) {
    ContextLimits limits;
    limits.max_depth = 2;
    EXPECT_NO_THROW(SanitizeContext(utils::Json::parse(R"({"a": [[1]]})"), limits));
    EXPECT_THROW(SanitizeContext(utils::Json::parse(R"({"a": [[[1]]]})"), limits), InvalidRequestError);
}

TEST(ContextSanitizerTest, BoundsSize) {
    ContextLimits limits;
    limits.max_bytes = 64;
    EXPECT_NO_THROW(SanitizeContext({{"a", std::string(32, 'x')}}, limits));
    EXPECT_THROW(SanitizeContext({{"a", std::string(100, 'x')}}, limits), InvalidRequestError);
}

TEST(ContextSanitizerTest, RejectsBinaryValues) {
    utils::Json context = utils::Json::object();
    context["blob"] = utils::Json::binary({1, 2, 3});
    EXPECT_THROW(SanitizeContext(context, {}), InvalidRequestError);
}

}  // namespace
}  // namespace warden::sandbox
