#include <gtest/gtest.h>
#include "level_assigner.hpp"
#include "test_helpers.hpp"

namespace {

PDF_Heading_Candidate make_candidate(const std::string& text, unsigned int page, double size, double y,
                                     std::size_t size_rank, std::size_t order, double x = 72) {
    PDF_Heading_Candidate candidate;
    candidate.fragment = make_fragment(text, page, size, x, y);
    candidate.size_rank = size_rank;
    candidate.order = order;
    candidate.score = 0.5;
    return candidate;
}

} // namespace

class LevelAssignerTest : public ::testing::Test {
protected:
    Outline_Configuration config;
};

TEST_F(LevelAssignerTest, EmptyInputGivesEmptyOutline) {
    EXPECT_TRUE(assign_levels({}, config).empty());
}

TEST_F(LevelAssignerTest, LargestBucketIsH1) {
    std::vector<PDF_Heading_Candidate> candidates = {
        make_candidate("Part one", 1, 20, 100, 0, 0),
        make_candidate("Section", 1, 16, 200, 1, 1),
        make_candidate("Subsection", 1, 13, 300, 2, 2),
    };

    auto outline = assign_levels(candidates, config);

    ASSERT_EQ(outline.size(), 3u);
    EXPECT_EQ(outline[0].level, Heading_Level::H1);
    EXPECT_EQ(outline[1].level, Heading_Level::H2);
    EXPECT_EQ(outline[2].level, Heading_Level::H3);
}

TEST_F(LevelAssignerTest, DeeperBucketsFoldIntoH3) {
    std::vector<PDF_Heading_Candidate> candidates = {
        make_candidate("Level one", 1, 24, 100, 0, 0),
        make_candidate("Level two", 1, 20, 150, 1, 1),
        make_candidate("Level three", 1, 16, 200, 2, 2),
        make_candidate("Level four", 1, 13, 250, 3, 3),
    };

    auto outline = assign_levels(candidates, config);

    ASSERT_EQ(outline.size(), 4u);
    EXPECT_EQ(outline[2].level, Heading_Level::H3);
    EXPECT_EQ(outline[3].level, Heading_Level::H3);
}

TEST_F(LevelAssignerTest, AbsentLevelsAreNotPadded) {
    // only the 2nd and 4th candidate buckets are used
    std::vector<PDF_Heading_Candidate> candidates = {
        make_candidate("Chapter", 1, 20, 100, 1, 0),
        make_candidate("Minor", 1, 13, 200, 3, 1),
    };

    auto outline = assign_levels(candidates, config);

    ASSERT_EQ(outline.size(), 2u);
    EXPECT_EQ(outline[0].level, Heading_Level::H1);
    EXPECT_EQ(outline[1].level, Heading_Level::H2);
}

TEST_F(LevelAssignerTest, SortsByPageThenVerticalPosition) {
    // classifier order: by size rank, not by position
    std::vector<PDF_Heading_Candidate> candidates = {
        make_candidate("Page three chapter", 3, 20, 100, 0, 9),
        make_candidate("Page one chapter", 1, 20, 400, 0, 2),
        make_candidate("Page one section", 1, 16, 150, 1, 1),
        make_candidate("Page two section", 2, 16, 80, 1, 5),
    };

    auto outline = assign_levels(candidates, config);

    ASSERT_EQ(outline.size(), 4u);
    EXPECT_EQ(outline[0].text, "Page one section");
    EXPECT_EQ(outline[1].text, "Page one chapter");
    EXPECT_EQ(outline[2].text, "Page two section");
    EXPECT_EQ(outline[3].text, "Page three chapter");
    for (std::size_t i = 1; i < outline.size(); ++i) {
        bool ordered = outline[i - 1].page < outline[i].page ||
                       (outline[i - 1].page == outline[i].page && outline[i - 1].y <= outline[i].y);
        EXPECT_TRUE(ordered);
    }
}

TEST_F(LevelAssignerTest, OverlappingDuplicatesKeepFirstInDocumentOrder) {
    std::vector<PDF_Heading_Candidate> candidates = {
        make_candidate("Overview (shadow)", 1, 16, 200.2, 0, 7),
        make_candidate("Overview", 1, 16, 200, 0, 3),
    };

    auto outline = assign_levels(candidates, config);

    ASSERT_EQ(outline.size(), 1u);
    EXPECT_EQ(outline[0].text, "Overview");
}

TEST_F(LevelAssignerTest, RepeatedTextOnSamePageIsMerged) {
    std::vector<PDF_Heading_Candidate> candidates = {
        make_candidate("Results", 1, 16, 100, 0, 0),
        make_candidate("RESULTS", 1, 16, 500, 0, 1),
        make_candidate("Results", 2, 16, 100, 0, 2),
    };

    EXPECT_EQ(assign_levels(candidates, config).size(), 2u);

    config.merge_repeated_headings = false;
    EXPECT_EQ(assign_levels(candidates, config).size(), 3u);
}

TEST_F(LevelAssignerTest, HigherLevelNeverHasSmallerFont) {
    std::vector<PDF_Heading_Candidate> candidates = {
        make_candidate("A", 1, 14, 100, 2, 0),
        make_candidate("B", 1, 22, 200, 0, 1),
        make_candidate("C", 2, 17, 100, 1, 2),
        make_candidate("D", 2, 12, 200, 3, 3),
        make_candidate("E", 3, 22, 100, 0, 4),
    };

    auto outline = assign_levels(candidates, config);

    for (const PDF_Outline_Entry& a : outline) {
        for (const PDF_Outline_Entry& b : outline) {
            if (static_cast<int>(a.level) < static_cast<int>(b.level)) {
                EXPECT_GE(a.font_size, b.font_size) << a.text << " vs " << b.text;
            }
        }
    }
}

TEST_F(LevelAssignerTest, LevelNames) {
    EXPECT_STREQ(heading_level_name(Heading_Level::H1), "H1");
    EXPECT_STREQ(heading_level_name(Heading_Level::H2), "H2");
    EXPECT_STREQ(heading_level_name(Heading_Level::H3), "H3");
}
