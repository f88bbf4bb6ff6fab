/**
 * @file test_treerenderer.cpp
 * @brief Unit tests for the FTXUI-based TreeRenderer
 *
 * @see TreeRenderer
 */

#include <gtest/gtest.h>
#include "treerenderer.hpp"
#include <ftxui/screen/screen.hpp>
#include <sstream>

using namespace ftxui;

TEST(TreeRendererTest, LineElementKeepsTextLayout) {
    DisplayLine line;
    line.kind = LineKind::Directory;
    line.prefix = "│   ";
    line.connector = "└── ";
    line.label = "src";
    line.suffix = "/";

    auto screen = Screen::Create(Dimension::Fixed(12), Dimension::Fixed(1));
    Render(screen, TreeRenderer::lineElement(line));

    EXPECT_EQ(screen.at(0, 0), "│");
    EXPECT_EQ(screen.at(4, 0), "└");
    EXPECT_EQ(screen.at(8, 0), "s");
    EXPECT_EQ(screen.at(10, 0), "c");
    EXPECT_EQ(screen.at(11, 0), "/");
}

TEST(TreeRendererTest, RendersLabelTreeAndFooter) {
    DirectoryNode root;
    root.name = "root";
    root.signature = "d:root";
    root.files.push_back(FileEntry{"notes.txt"});
    root.immediateFileCount = 1;
    root.totalFileCount = 1;

    std::ostringstream out;
    TreeRenderer::render(out, "demo/", root, LayoutOptions{});
    const std::string text = out.str();

    EXPECT_NE(text.find("demo/"), std::string::npos);
    EXPECT_NE(text.find("notes.txt"), std::string::npos);
    EXPECT_NE(text.find("[1 directories, 1 files]"), std::string::npos);
}
