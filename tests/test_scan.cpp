#include "scan.hpp"
#include "struc.hpp"

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class ScanTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root = fs::temp_directory_path() / ("webprune_scan_" + std::to_string(getpid()) + "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(root);
    fs::create_directories(root / "css");
    fs::create_directories(root / "js" / "lib");
  }
  void TearDown() override
  {
    fs::remove_all(root);
  }
  void write(fs::path const& rel, std::string const& contents)
  {
    std::ofstream(root / rel, std::ios::binary) << contents;
  }
  fs::path root;
};

TEST_F(ScanTest, Classify) {
  EXPECT_EQ(classify("a/app.js"), kind_js);
  EXPECT_EQ(classify("a/STYLE.CSS"), kind_css);
  EXPECT_EQ(classify("index.html"), kind_html);
  EXPECT_EQ(classify("old.HTM"), kind_html);
  EXPECT_EQ(classify("readme.txt"), kind_other);
  EXPECT_EQ(classify("app.jsx"), kind_other);
}

TEST_F(ScanTest, ScanFilesClassifiesRecursively) {
  write("index.html", "<p></p>");
  write("about.htm", "<p></p>");
  write("css/style.css", ".a{}");
  write("js/app.js", "");
  write("js/lib/Util.JS", "");
  write("notes.txt", "");

  project_files files = scan_files(root.string());
  ASSERT_EQ(files.css.size(), 1u);
  ASSERT_EQ(files.js.size(), 2u);
  ASSERT_EQ(files.html.size(), 2u);
  EXPECT_EQ(fs::path(files.css[0]).filename().string(), "style.css");
  EXPECT_EQ(fs::path(files.js[0]).filename().string(), "app.js");
  EXPECT_EQ(fs::path(files.js[1]).filename().string(), "Util.JS");
  EXPECT_FALSE(files.empty());
}

TEST_F(ScanTest, EmptyProject) {
  write("index.html", "<p></p>");
  project_files files = scan_files(root.string());
  EXPECT_TRUE(files.empty());
  EXPECT_EQ(files.html.size(), 1u);
}

TEST_F(ScanTest, MissingRootThrows) {
  EXPECT_THROW(scan_files((root / "nope").string()), std::runtime_error);
}

TEST_F(ScanTest, FileRootIsEmptyProject) {
  write("style.css", ".a{}");
  project_files files = scan_files((root / "style.css").string());
  EXPECT_TRUE(files.empty());
  EXPECT_TRUE(files.css.empty());
  EXPECT_TRUE(files.html.empty());
}

TEST_F(ScanTest, ReadFileSafeDecodes) {
  write("utf8.css", ".caf\xc3\xa9 {}\r\n");
  write("latin1.css", ".caf\xe9 {}\n");
  EXPECT_EQ(read_file_safe((root / "utf8.css").string()), ".caf\xc3\xa9 {}\n");
  EXPECT_EQ(read_file_safe((root / "latin1.css").string()), ".caf\xc3\xa9 {}\n");
}

TEST_F(ScanTest, ReadFileSafeUnreadableIsEmpty) {
  EXPECT_EQ(read_file_safe((root / "missing.css").string()), "");
  EXPECT_THROW(import_file((root / "missing.css").string()), file_error);
}

TEST_F(ScanTest, ExportFile) {
  std::string path = (root / "out.css").string();
  export_file(path, ".a { }\n");
  EXPECT_EQ(import_file(path), ".a { }\n");
  EXPECT_THROW(export_file((root / "no" / "such" / "dir.css").string(), "x"), file_error);
}
