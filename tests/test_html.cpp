#include <gtest/gtest.h>
#include "engine/page_fetcher.hpp"

using namespace incidex::engine;

TEST(HtmlTest, MatchesIncidentClassesOnBlockElements) {
    const std::string html = R"(
        <html><body>
          <div class="Incident-Card"><h2>Database down</h2> <p>Primary lost quorum</p></div>
          <span class="incident">not a block element</span>
          <ul><li class="ticket open">Printer jam on floor 3</li></ul>
          <table><tr class="issue-row"><td>VPN</td><td>timeout</td></tr></table>
          <div class="news">unrelated</div>
        </body></html>)";

    auto blocks = extract_incident_blocks(html);
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0], "Database down Primary lost quorum");
    EXPECT_EQ(blocks[1], "Printer jam on floor 3");
    EXPECT_EQ(blocks[2], "VPN timeout");
}

TEST(HtmlTest, NestedMatchesAreReportedSeparately) {
    auto blocks = extract_incident_blocks(
        R"(<div class="incidencias"><div class="incidencia">Fallo de red</div></div>)");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0], "Fallo de red");
    EXPECT_EQ(blocks[1], "Fallo de red");
}

TEST(HtmlTest, ScriptAndStyleTextIsSkipped) {
    auto blocks = extract_incident_blocks(
        R"(<div class="incident">Visible<script>var hidden = 1;</script><style>.x{}</style></div>)");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0], "Visible");
}

TEST(HtmlTest, NoMatchesOnPlainPage) {
    EXPECT_TRUE(extract_incident_blocks("<p>Nothing to see</p>").empty());
}
