#include <gtest/gtest.h>
#include "engine/FileDialog.hpp"

#include <cstring>

using namespace neta;

// =============================================================================
// Selection Parsing Tests
// =============================================================================

TEST(FileDialogParseTest, OnePathPerLine) {
    auto paths = file_dialog::parseSelection("/home/me/cat.png\n/home/me/dog.jpg\n");
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], "/home/me/cat.png");
    EXPECT_EQ(paths[1], "/home/me/dog.jpg");
}

TEST(FileDialogParseTest, NoTrailingNewline) {
    auto paths = file_dialog::parseSelection("/a.png");
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], "/a.png");
}

TEST(FileDialogParseTest, StripsCarriageReturnsAndBlankLines) {
    auto paths = file_dialog::parseSelection("/a.png\r\n\r\n\n/b.png\r\n");
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], "/a.png");
    EXPECT_EQ(paths[1], "/b.png");
}

TEST(FileDialogParseTest, KeepsSpacesInsidePaths) {
    auto paths = file_dialog::parseSelection("/my pics/a b.png\n");
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], "/my pics/a b.png");
}

TEST(FileDialogParseTest, EmptyOutputIsCancel) {
    EXPECT_TRUE(file_dialog::parseSelection("").empty());
    EXPECT_TRUE(file_dialog::parseSelection("\n").empty());
}

// =============================================================================
// Shell Quoting Tests
// =============================================================================

TEST(FileDialogQuoteTest, WrapsInSingleQuotes) {
    EXPECT_EQ(file_dialog::shellQuote("Add images"), "'Add images'");
    EXPECT_EQ(file_dialog::shellQuote(""), "''");
}

TEST(FileDialogQuoteTest, EscapesSingleQuotes) {
    EXPECT_EQ(file_dialog::shellQuote("it's"), "'it'\\''s'");
}

TEST(FileDialogQuoteTest, LeavesShellCharactersInert) {
    EXPECT_EQ(file_dialog::shellQuote("$(rm -rf ~); `x` \"y\""),
              "'$(rm -rf ~); `x` \"y\"'");
    EXPECT_EQ(file_dialog::shellQuote("a\nb"), "'a\nb'");
}

// =============================================================================
// Backend Tests
// =============================================================================

TEST(FileDialogBackendTest, NullDialogPicksNothing) {
    NullFileDialog dialog;
    EXPECT_FALSE(dialog.isAvailable());
    EXPECT_STREQ(dialog.backendName(), "none");
    EXPECT_TRUE(dialog.pickFiles("Add images").empty());
}

TEST(FileDialogBackendTest, FactoryMatchesBuild) {
    auto dialog = createFileDialog();
    ASSERT_NE(dialog, nullptr);
#if defined(NETA_FILE_DIALOG_PORTAL) && defined(__linux__)
    EXPECT_STREQ(dialog->backendName(), "portal");
#else
    EXPECT_STREQ(dialog->backendName(), "none");
    EXPECT_FALSE(dialog->isAvailable());
#endif
}
