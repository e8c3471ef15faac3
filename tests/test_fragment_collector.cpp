#include <gtest/gtest.h>
#include "fragment_collector.hpp"
#include "outline_errors.hpp"
#include "test_helpers.hpp"

class FragmentCollectorTest : public ::testing::Test {
protected:
    Outline_Configuration config;
};

TEST_F(FragmentCollectorTest, MergesWordsOnTheSameLine) {
    PDF_Fragment annual = make_fragment("Annual", 1, 24, 72, 100);
    PDF_Fragment report = make_fragment("Report", 1, 24, annual.x + annual.width + 6, 100.5);

    PDF_Normalized_Document document = collect_fragments({make_page(1, {annual, report})}, config);

    ASSERT_EQ(document.fragments.size(), 1u);
    EXPECT_EQ(document.fragments[0].text, "Annual Report");
    EXPECT_DOUBLE_EQ(document.fragments[0].x, 72);
    EXPECT_DOUBLE_EQ(document.fragments[0].y, 100);
    EXPECT_DOUBLE_EQ(document.fragments[0].width, report.x + report.width - 72);
}

TEST_F(FragmentCollectorTest, JoinsAbuttingCharactersWithoutSpace) {
    std::vector<PDF_Fragment> characters;
    double x = 72;
    for (char c : std::string("Scope")) {
        PDF_Fragment fragment = make_fragment(std::string(1, c), 1, 12, x, 200);
        x += fragment.width;
        characters.push_back(fragment);
    }

    PDF_Normalized_Document document = collect_fragments({make_page(1, characters)}, config);

    ASSERT_EQ(document.fragments.size(), 1u);
    EXPECT_EQ(document.fragments[0].text, "Scope");
}

TEST_F(FragmentCollectorTest, KeepsSeparateLinesApart) {
    std::vector<PDF_Fragment> fragments = {
        make_fragment("First line", 1, 11, 72, 100),
        make_fragment("Second line", 1, 11, 72, 114),
    };

    PDF_Normalized_Document document = collect_fragments({make_page(1, fragments)}, config);

    ASSERT_EQ(document.fragments.size(), 2u);
    EXPECT_EQ(document.fragments[1].text, "Second line");
}

TEST_F(FragmentCollectorTest, DoesNotMergeAcrossWideGapsOrSizes) {
    PDF_Fragment left = make_fragment("Name", 1, 11, 72, 300);
    PDF_Fragment column = make_fragment("Value", 1, 11, 400, 300);
    PDF_Fragment bigger = make_fragment("Heading", 1, 16, column.x + column.width + 2, 300);

    PDF_Normalized_Document document = collect_fragments({make_page(1, {left, column, bigger})}, config);

    ASSERT_EQ(document.fragments.size(), 3u);
}

TEST_F(FragmentCollectorTest, DropsBlankFragmentsAndCollapsesWhitespace) {
    std::vector<PDF_Fragment> fragments = {
        make_fragment("   ", 1, 11, 72, 100),
        make_fragment("  Results   and\tdiscussion ", 1, 11, 72, 200),
        make_fragment("", 1, 11, 72, 300),
    };

    PDF_Normalized_Document document = collect_fragments({make_page(1, fragments)}, config);

    ASSERT_EQ(document.fragments.size(), 1u);
    EXPECT_EQ(document.fragments[0].text, "Results and discussion");
}

TEST_F(FragmentCollectorTest, StyleFollowsCharacterMajority) {
    PDF_Fragment number = make_fragment("1.1", 1, 14, 72, 100);
    PDF_Fragment words = make_fragment("Background", 1, 14, number.x + number.width + 4, 100, true);

    PDF_Normalized_Document document = collect_fragments({make_page(1, {number, words})}, config);

    ASSERT_EQ(document.fragments.size(), 1u);
    EXPECT_EQ(document.fragments[0].text, "1.1 Background");
    EXPECT_TRUE(document.fragments[0].is_bold);
    EXPECT_FALSE(document.fragments[0].is_italic);
}

TEST_F(FragmentCollectorTest, TagsPagesAndKeepsGeometry) {
    std::vector<PDF_Fragment> fragments = {
        make_fragment("On page one", 1, 11, 72, 100),
        make_fragment("On page two", 2, 11, 72, 100),
    };
    PDF_Raw_Page without_geometry = make_page(2, fragments, false);

    PDF_Normalized_Document document = collect_fragments({make_page(1, fragments), without_geometry}, config);

    ASSERT_EQ(document.fragments.size(), 2u);
    EXPECT_EQ(document.fragments[0].page, 1u);
    EXPECT_EQ(document.fragments[1].page, 2u);
    ASSERT_EQ(document.pages.size(), 2u);
    EXPECT_TRUE(document.pages.at(1).height.has_value());
    EXPECT_FALSE(document.pages.at(2).height.has_value());
}

TEST_F(FragmentCollectorTest, SameVisualLine) {
    PDF_Fragment a = make_fragment("abc", 1, 10, 72, 100);
    EXPECT_TRUE(same_visual_line(a, make_fragment("def", 1, 10, a.x + a.width + 3, 102), config));
    EXPECT_FALSE(same_visual_line(a, make_fragment("def", 1, 10, a.x + a.width + 3, 106), config));
    EXPECT_FALSE(same_visual_line(a, make_fragment("def", 2, 10, a.x + a.width + 3, 100), config));
    EXPECT_FALSE(same_visual_line(a, make_fragment("def", 1, 10, 20, 100), config));
}

TEST_F(FragmentCollectorTest, NoPagesIsUnreadable) {
    EXPECT_THROW(collect_fragments({}, config), unreadable_document_error);
}

TEST_F(FragmentCollectorTest, PagesWithoutTextIsParseError) {
    std::vector<PDF_Raw_Page> pages = {make_page(1, {}), make_page(2, {make_fragment(" ", 2, 11, 72, 100)})};
    EXPECT_THROW(collect_fragments(pages, config), parse_error);
}
