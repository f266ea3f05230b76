#include <gtest/gtest.h>
#include "engine/aliases.hpp"
#include "engine/text.hpp"

using namespace incidex::engine;

TEST(TextTest, Utf8LengthCountsCodePoints) {
    EXPECT_EQ(text::utf8_length(""), 0u);
    EXPECT_EQ(text::utf8_length("abc"), 3u);
    EXPECT_EQ(text::utf8_length("Descripción"), 11u);
}

TEST(TextTest, Utf8TruncateNeverSplitsSequences) {
    EXPECT_EQ(text::utf8_truncate("Solución", 6), "Soluci");
    EXPECT_EQ(text::utf8_truncate("Solución", 7), "Solució");
    EXPECT_EQ(text::utf8_truncate("short", 100), "short");
    EXPECT_EQ(text::utf8_truncate("abc", 0), "");
}

TEST(TextTest, TrimAndLower) {
    EXPECT_EQ(text::trim("  \t hello world \r\n"), "hello world");
    EXPECT_EQ(text::trim(" \n "), "");
    EXPECT_EQ(text::to_lower("Incident-Row"), "incident-row");
}

TEST(TextTest, ExtensionIsLowercasedWithDot) {
    EXPECT_EQ(text::extension_of("data/Incidents.CSV"), ".csv");
    EXPECT_EQ(text::extension_of("export.tsv"), ".tsv");
    EXPECT_EQ(text::extension_of("README"), "");
}

TEST(AliasTest, FirstPresentAliasWins) {
    Metadata fields = {{"descripcion", "second"}, {"description", "first"}};
    auto match = aliases::resolve(fields, aliases::kDescription);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->first, "description");
    EXPECT_EQ(match->second, "first");
}

TEST(AliasTest, ResolveOrFallsBack) {
    Metadata fields = {{"Fecha", "2024-01-02"}};
    EXPECT_EQ(aliases::resolve_or(fields, aliases::kDisplayDate, "N/A"), "2024-01-02");
    EXPECT_EQ(aliases::resolve_or(fields, aliases::kDisplayResolution, "Not recorded"), "Not recorded");
    EXPECT_FALSE(aliases::resolve(fields, aliases::kId).has_value());
}

TEST(AliasTest, ProjectColumnDoublesAsTitle) {
    EXPECT_TRUE(aliases::contains(aliases::kTitle, "Proyecto"));
    EXPECT_TRUE(aliases::contains(aliases::kProject, "Proyecto"));
    EXPECT_FALSE(aliases::contains(aliases::kProject, "title"));
}
