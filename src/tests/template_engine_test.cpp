#include <gtest/gtest.h>

#include "credentials/template_engine.hpp"
#include "utils/errors.hpp"

namespace playrun::credentials {
namespace {

const nlohmann::json& Context() {
    static const nlohmann::json kContext = {
        {"api_token", "ABC123"},
        {"host", " example.org "},
        {"verify", false},
        {"port", 8443},
        {"tower", {{"filename", "/tmp/playrun_x/custom_credential_1"}}}
    };
    return kContext;
}

TEST(TemplateEngineTest, SubstitutesVariablesAndKeepsLiteralText) {
    const auto result = RenderTemplate("[mycloud]\ntoken={{api_token}}\n", Context());
    EXPECT_EQ(result.text, "[mycloud]\ntoken=ABC123\n");
    EXPECT_EQ(result.referenced, std::set<std::string>({"api_token"}));
}

TEST(TemplateEngineTest, ToleratesWhitespaceInsidePlaceholders) {
    EXPECT_EQ(RenderTemplate("{{  api_token  }}", Context()).text, "ABC123");
}

TEST(TemplateEngineTest, ResolvesNestedAttributes) {
    const auto result = RenderTemplate("{{tower.filename}}", Context());
    EXPECT_EQ(result.text, "/tmp/playrun_x/custom_credential_1");
    EXPECT_EQ(result.referenced, std::set<std::string>({"tower"}));
}

TEST(TemplateEngineTest, AppliesWhitelistedMethodsAndFilters) {
    EXPECT_EQ(RenderTemplate("{{api_token.lower()}}", Context()).text, "abc123");
    EXPECT_EQ(RenderTemplate("{{host.strip().upper()}}", Context()).text, "EXAMPLE.ORG");
    EXPECT_EQ(RenderTemplate("{{host | trim | title}}", Context()).text, "Example.Org");
    EXPECT_EQ(RenderTemplate("{{'literal' | upper}}", Context()).text, "LITERAL");
}

TEST(TemplateEngineTest, RendersScalarsLikePython) {
    EXPECT_EQ(RenderTemplate("{{verify}}", Context()).text, "False");
    EXPECT_EQ(RenderTemplate("{{port}}", Context()).text, "8443");
    EXPECT_EQ(RenderTemplate("{{42}}", Context()).text, "42");
}

TEST(TemplateEngineTest, SingleBracesPassThrough) {
    EXPECT_EQ(RenderTemplate("{\"token\": \"{{api_token}}\"}", Context()).text, "{\"token\": \"ABC123\"}");
}

TEST(TemplateEngineTest, UndefinedVariableIsAnError) {
    try {
        RenderTemplate("{{missing}}", Context());
        FAIL() << "expected TemplateError";
    } catch (const TemplateError& ex) {
        EXPECT_STREQ(ex.what(), "'missing' is undefined");
    }
}

TEST(TemplateEngineTest, UnknownMethodIsAnError) {
    try {
        RenderTemplate("{{api_token.foo()}}", Context());
        FAIL() << "expected TemplateError";
    } catch (const TemplateError& ex) {
        EXPECT_STREQ(ex.what(), "'str' object has no attribute 'foo'");
    }
}

TEST(TemplateEngineTest, OversizedIntegerLiteralIsATemplateError) {
    try {
        RenderTemplate("{{ 99999999999999999999 }}", Context());
        FAIL() << "expected TemplateError";
    } catch (const TemplateError& ex) {
        EXPECT_STREQ(ex.what(), "integer literal out of range in '99999999999999999999'");
    }
}

TEST(TemplateEngineTest, IntegerAttributeErrorNamesTheType) {
    try {
        RenderTemplate("{{port.host}}", Context());
        FAIL() << "expected TemplateError";
    } catch (const TemplateError& ex) {
        EXPECT_STREQ(ex.what(), "'int' object has no attribute 'host'");
    }
}

TEST(TemplateEngineTest, RejectsCallsAndUnknownAttributes) {
    EXPECT_THROW(RenderTemplate("{{api_token()}}", Context()), TemplateError);
    EXPECT_THROW(RenderTemplate("{{tower.missing}}", Context()), TemplateError);
    EXPECT_THROW(RenderTemplate("{{api_token | reverse}}", Context()), TemplateError);
}

TEST(TemplateEngineTest, RejectsMalformedTemplates) {
    EXPECT_THROW(RenderTemplate("{{api_token", Context()), TemplateError);
    EXPECT_THROW(RenderTemplate("{{ }}", Context()), TemplateError);
    EXPECT_THROW(RenderTemplate("{{'open}}", Context()), TemplateError);
    EXPECT_THROW(RenderTemplate("{% if api_token %}x{% endif %}", Context()), TemplateError);
    EXPECT_THROW(RenderTemplate("{# note #}", Context()), TemplateError);
}

}  // namespace
}  // namespace playrun::credentials
