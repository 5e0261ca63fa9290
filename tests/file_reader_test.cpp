#include <gtest/gtest.h>
#include "file_reader.hpp"
#include <fstream>

namespace {

class FileReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("piidig_reader_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        fs::remove_all(dir);
        fs::create_directories(dir / "nested");
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    std::string write(const fs::path& rel, const std::string& content) {
        fs::path p = dir / rel;
        std::ofstream(p, std::ios::binary) << content;
        return p.string();
    }

    fs::path dir;
};

}

TEST_F(FileReaderTest, ReadsTextAndStripsBom) {
    TextFileReader reader;
    EXPECT_EQ(reader.read(write("a.txt", "手机：13812345678")), "手机：13812345678");
    EXPECT_EQ(reader.read(write("bom.txt", "\xEF\xBB\xBFhello")), "hello");
}

TEST_F(FileReaderTest, FailuresCarryReason) {
    TextFileReader reader;
    try {
        reader.read((dir / "missing.txt").string());
        FAIL() << "expected SourceReadFailure";
    } catch (const SourceReadFailure& e) {
        EXPECT_STREQ(e.what(), "file does not exist");
        EXPECT_EQ(e.source, (dir / "missing.txt").string());
    }
    EXPECT_THROW(reader.read(dir.string()), SourceReadFailure);
    EXPECT_THROW(reader.read(write("bad.txt", "abc\xC3")), SourceReadFailure);
}

TEST_F(FileReaderTest, CollectsTextFilesSorted) {
    std::string b = write("b.txt", "x");
    std::string a = write("nested/a.TXT", "x");
    write("skip.bin", "x");

    auto files = collectSourceFiles({dir.string(), "explicit.dat"});
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], b);
    EXPECT_EQ(files[1], a);
    EXPECT_EQ(files[2], "explicit.dat");
}
