#include <gtest/gtest.h>

#include "valkyrie/errors.hpp"
#include "valkyrie/tools.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>

#include <unistd.h>

using namespace valkyrie;
namespace fs = std::filesystem;

class ToolsFsTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("valkyrie_tools_" + tools::GenerateCode(10));
        fs::create_directories(root_ / "nested" / "deeper");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void Touch(const fs::path& relative, const std::string& content) {
        std::ofstream out(root_ / relative, std::ios::binary);
        out << content;
    }

    fs::path root_;
};

TEST_F(ToolsFsTest, ListFilesIsRecursiveAndSorted) {
    Touch("b.txt", "b");
    Touch("a.txt", "a");
    Touch("nested/c.txt", "c");
    Touch("nested/deeper/d.txt", "d");
    auto files = tools::ListFiles(root_);
    ASSERT_EQ(files.size(), 4u);
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
    for (const auto& file : files) {
        EXPECT_TRUE(file.is_absolute());
        EXPECT_TRUE(fs::is_regular_file(file));
    }
    EXPECT_EQ(files.back().filename(), "d.txt");
}

TEST_F(ToolsFsTest, ListFilesMissingRoot) {
    EXPECT_THROW(tools::ListFiles(root_ / "nope"), DirectoryReadError);
}

TEST_F(ToolsFsTest, ListFilesUnreadableSubdirectory) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission bits are not enforced for root";
    }
    Touch("a.txt", "a");
    fs::create_directories(root_ / "nested" / "locked");
    fs::permissions(root_ / "nested" / "locked", fs::perms::none);
    EXPECT_THROW(tools::ListFiles(root_), DirectoryReadError);
    fs::permissions(root_ / "nested" / "locked", fs::perms::owner_all);
}

TEST_F(ToolsFsTest, ReadAndWriteBytes) {
    tools::Bytes data = {0x00, 0xff, 0x10, 0x00};
    fs::path target = root_ / "out" / "blob.bin";
    tools::WriteFileAtomic(target, data);
    EXPECT_EQ(tools::ReadFileBytes(target), data);
    EXPECT_FALSE(fs::exists(root_ / "out" / "blob.bin.tmp"));
}

TEST_F(ToolsFsTest, WriteFileAtomicReplacesExisting) {
    Touch("replace.bin", "old contents that are longer");
    tools::WriteFileAtomic(root_ / "replace.bin", tools::Bytes{'n', 'e', 'w'});
    EXPECT_EQ(tools::ReadFileBytes(root_ / "replace.bin"), (tools::Bytes{'n', 'e', 'w'}));
}

TEST_F(ToolsFsTest, ReadMissingFile) {
    EXPECT_THROW(tools::ReadFileBytes(root_ / "missing.bin"), ArchiveIoError);
}

TEST(ToolsTest, FormatSize) {
    EXPECT_EQ(tools::FormatSize(1000000000), "1.00 GB");
    EXPECT_EQ(tools::FormatSize(1000000), "1.00 MB");
    EXPECT_EQ(tools::FormatSize(1000), "1.00 KB");
    EXPECT_EQ(tools::FormatSize(500), "500.00 B");
    EXPECT_EQ(tools::FormatSize(0), "0.00 B");
}

TEST(ToolsTest, GenerateCodeLengthAndAlphabet) {
    std::string code = tools::GenerateCode(64);
    EXPECT_EQ(code.size(), 64u);
    for (char ch : code) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(ch))) << ch;
    }
    tools::CodeOptions digits_only;
    digits_only.letters = false;
    for (char ch : tools::GenerateCode(100, digits_only)) {
        EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(ch))) << ch;
    }
    EXPECT_TRUE(tools::GenerateCode(0).empty());
    EXPECT_NE(tools::GenerateCode(32), tools::GenerateCode(32));
}

TEST(ToolsTest, GenerateCodeWithPunctuation) {
    tools::CodeOptions symbols;
    symbols.letters = false;
    symbols.digits = false;
    symbols.punctuation = true;
    for (char ch : tools::GenerateCode(200, symbols)) {
        EXPECT_TRUE(std::ispunct(static_cast<unsigned char>(ch))) << ch;
    }
}

TEST(ToolsTest, GenerateCodeNeedsAlphabet) {
    tools::CodeOptions nothing;
    nothing.letters = false;
    nothing.digits = false;
    EXPECT_THROW(tools::GenerateCode(8, nothing), std::invalid_argument);
}

TEST(ToolsTest, HashHexKnownValues) {
    const std::string data = "This is some data to hash";
    EXPECT_EQ(tools::HashHex(data, "md5"), "fbe8ee5bbfd9ec0c6f1949ba2ac9e0d7");
    EXPECT_EQ(tools::HashHex(data, "sha1"), "6acc0ca14c9cd14671c1034a36396066c00ad053");
    EXPECT_EQ(tools::HashHex(data, "sha256"), "09b0d6cdcb1dc978740a4510cfbce9308423817d78447a7345bafc2950c8ff7b");
    EXPECT_EQ(tools::HashHex(data, "sha512"),
              "6b0e3ed391e918823f5faf249c3e077ad9f5681d1d9b6c19f4e669caae3d8abe"
              "fbf0bb9d443150ab62632e69554d0d22ae6be9c70334005ba0566bd6c2eff822");
}

TEST(ToolsTest, MachineIdIsStable) {
    std::string id = tools::MachineId();
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(id, tools::MachineId());
}
