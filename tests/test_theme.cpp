#include <gtest/gtest.h>
#include <cli/theme.hpp>

TEST(Theme, StatusWordColorsByOutcome) {
    EXPECT_EQ(theme::status_word("completed"), theme::color::GREEN + "completed" + theme::color::RESET);
    EXPECT_EQ(theme::status_word("success"), theme::green("success"));
    EXPECT_EQ(theme::status_word("failed"), theme::red("failed"));
    EXPECT_EQ(theme::status_word("partial"), theme::yellow("partial"));
    EXPECT_EQ(theme::status_word("pending"), theme::dim("pending"));
}

TEST(Theme, RowsEndWithNewline) {
    for (const auto& row : {theme::ok("a"), theme::fail("b"), theme::step("c"),
                            theme::warn("d"), theme::kv("Key", "v")}) {
        ASSERT_FALSE(row.empty());
        EXPECT_EQ(row.back(), '\n');
    }
    EXPECT_NE(theme::kv("Files", "3").find("3"), std::string::npos);
    EXPECT_EQ(theme::divider().front(), '\n');
}
