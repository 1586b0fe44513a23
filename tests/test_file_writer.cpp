#include "io/file_writer.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace {

class FileWriterTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }
};

TEST_F(FileWriterTests, OpenInMissingDirectory_Fails) {
    kiosk::FileWriter w;
    auto res = kiosk::FileWriter::Open(tmp.Path() + "/no_such_dir/out.bin", 0644, w);
    ASSERT_FALSE(res.ok);
}

TEST_F(FileWriterTests, WriteAll_WritesExactBytes) {
    const std::string out_path = MakePath("out.bin");

    kiosk::FileWriter w;
    auto res = kiosk::FileWriter::Open(out_path, 0644, w);
    ASSERT_TRUE(res.ok) << res.msg;

    std::vector<std::uint8_t> data(1024 * 1024 + 123);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>((i ^ 0x5A) & 0xFF);

    auto wr = w.WriteAll(std::span<const std::uint8_t>(data.data(), data.size()));
    ASSERT_TRUE(wr.ok) << wr.msg;
    ASSERT_TRUE(w.FsyncNow().ok);
    ASSERT_TRUE(w.Close().ok);

    auto read_back = testutil::ReadTextFile(out_path);
    ASSERT_TRUE(read_back.has_value());
    EXPECT_EQ(*read_back, std::string(data.begin(), data.end()));
}

TEST_F(FileWriterTests, Open_TruncatesExistingFile) {
    const std::string out_path = MakePath("cfg.json");
    ASSERT_TRUE(testutil::WriteTextFile(out_path, "a much longer previous content"));

    kiosk::FileWriter w;
    ASSERT_TRUE(kiosk::FileWriter::Open(out_path, 0600, w).ok);
    const std::string text = "{}";
    ASSERT_TRUE(w.WriteAll(std::span<const std::uint8_t>(
                               reinterpret_cast<const std::uint8_t*>(text.data()), text.size()))
                    .ok);
    ASSERT_TRUE(w.Close().ok);

    EXPECT_EQ(testutil::ReadTextFile(out_path).value_or(""), "{}");
}

} // namespace
