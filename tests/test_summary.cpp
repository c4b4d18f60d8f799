#include <gtest/gtest.h>
#include "../main/src/summary.hpp"
#include "../main/src/blame.hpp"
#include "../main/src/localization.hpp"

#include <sstream>

class SummaryTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }
};

TEST_F(SummaryTest, PicksOnlyParentlessPackages) {
    PackageGraph graph = build_graph({
        PackageRecord{"app", 1, {{"lib"}}, {}},
        PackageRecord{"lib", 1, {}, {}},
        PackageRecord{"tool", 1, {}, {}},
    });

    auto roots = pick_root_packages(graph);
    ASSERT_EQ(roots.size(), 2u);
    EXPECT_EQ(roots[0]->name, "app");
    EXPECT_EQ(roots[1]->name, "tool");
}

TEST_F(SummaryTest, SortsDescendingWithNameTieBreak) {
    PackageGraph graph = build_graph({
        PackageRecord{"zeta", 500, {}, {}},
        PackageRecord{"alpha", 500, {}, {}},
        PackageRecord{"big", 9000, {}, {}},
        PackageRecord{"small", 3, {}, {}},
    });
    BlameEngine().run(graph);

    auto entries = summarize(pick_root_packages(graph), 50);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].name, "big");
    EXPECT_EQ(entries[1].name, "alpha");
    EXPECT_EQ(entries[2].name, "zeta");
    EXPECT_EQ(entries[3].name, "small");
    EXPECT_DOUBLE_EQ(entries[0].size_bytes, 9000);
}

TEST_F(SummaryTest, TruncatesToRequestedCount) {
    std::vector<PackageRecord> records;
    for (int i = 0; i < 80; ++i) {
        records.push_back(PackageRecord{"pkg" + std::to_string(i), static_cast<std::uint64_t>(i), {}, {}});
    }
    PackageGraph graph = build_graph(records);

    auto entries = summarize(pick_root_packages(graph), DEFAULT_MAX_RESULTS);
    ASSERT_EQ(entries.size(), DEFAULT_MAX_RESULTS);
    EXPECT_EQ(entries.front().name, "pkg79");
    EXPECT_EQ(entries.back().name, "pkg30");

    EXPECT_TRUE(summarize(pick_root_packages(graph), 0).empty());
}

TEST_F(SummaryTest, FormatsInDecimalMegabytes) {
    SummaryEntry entry{"vim", 28000000};
    EXPECT_EQ(format_summary_line(entry), "vim" + std::string(32, ' ') + "   28.0 MB");

    SummaryEntry tiny{"libtiny", 49999};
    EXPECT_EQ(format_summary_line(tiny), "libtiny" + std::string(28, ' ') + "    0.0 MB");
}

TEST_F(SummaryTest, PrintEndsWithBlankLine) {
    std::ostringstream out;
    print_summary({{"a", 1500000}, {"b", 1000000}}, out);

    std::string text = out.str();
    EXPECT_EQ(text, format_summary_line({"a", 1500000}) + "\n" + format_summary_line({"b", 1000000}) + "\n\n");
}
