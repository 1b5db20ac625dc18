#include <gtest/gtest.h>
#include <cstring>
#include <main/utils/template_renderer.hpp>

namespace {
    const TemplateVar kVars[] = {
        { "reading", "300" },
        { "device",  "plantbot" },
    };
    constexpr std::size_t kVarCount = sizeof(kVars) / sizeof(kVars[0]);
}

TEST(TemplateRendererTest, ExpandsPlaceholdersWithOrWithoutSpaces) {
    char out[64];
    ASSERT_TRUE(TemplateRenderer::render("{{reading}} / {{ device }} / {{  reading\t}}",
                                         kVars, kVarCount, out, sizeof(out)));
    EXPECT_STREQ("300 / plantbot / 300", out);
}

TEST(TemplateRendererTest, PlainTextPassesThrough) {
    char out[32];
    ASSERT_TRUE(TemplateRenderer::render("no placeholders", kVars, kVarCount, out, sizeof(out)));
    EXPECT_STREQ("no placeholders", out);
}

TEST(TemplateRendererTest, UnknownPlaceholderRendersEmpty) {
    char out[32];
    ASSERT_TRUE(TemplateRenderer::render("a{{ missing }}b", kVars, kVarCount, out, sizeof(out)));
    EXPECT_STREQ("ab", out);
}

TEST(TemplateRendererTest, UnterminatedPlaceholderIsLiteral) {
    char out[32];
    ASSERT_TRUE(TemplateRenderer::render("x {{ reading", kVars, kVarCount, out, sizeof(out)));
    EXPECT_STREQ("x {{ reading", out);
}

TEST(TemplateRendererTest, OverflowReturnsFalseWithTerminatedPrefix) {
    char out[8];
    EXPECT_FALSE(TemplateRenderer::render("device={{ device }}", kVars, kVarCount, out, sizeof(out)));
    EXPECT_EQ(7u, std::strlen(out));
    EXPECT_STREQ("device=", out);
}

TEST(TemplateRendererTest, ExactFitSucceeds) {
    char out[4];
    EXPECT_TRUE(TemplateRenderer::render("{{ reading }}", kVars, kVarCount, out, sizeof(out)));
    EXPECT_STREQ("300", out);
}

TEST(TemplateRendererTest, NullTemplateRendersEmpty) {
    char out[4] = "zzz";
    EXPECT_TRUE(TemplateRenderer::render(nullptr, kVars, kVarCount, out, sizeof(out)));
    EXPECT_STREQ("", out);
}
