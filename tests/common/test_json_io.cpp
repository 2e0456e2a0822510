/**
 * @file test_json_io.cpp
 * @brief Tests for JSON file loading and string trimming
 */

#include "cpaudit/common.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace cpaudit::common::test {

namespace {

std::filesystem::path ensure_temp_dir(const std::string& name)
{
    auto temp_dir = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
    std::filesystem::create_directories(temp_dir, ec);
    return temp_dir;
}

void write_text_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream out(path);
    ASSERT_TRUE(out.is_open());
    out << content;
}

}  // namespace

TEST(JsonIoTest, ReadsJsonDocument)
{
    auto dir = ensure_temp_dir("cpaudit_json_io_ok");
    write_text_file(dir / "objects.json", R"([{"uid": "a", "name": "A", "type": "host"}])");

    auto payload = read_json_file(dir / "objects.json");
    ASSERT_TRUE(payload);
    ASSERT_TRUE(payload->is_array());
    EXPECT_EQ(payload->at(0).at("name"), "A");
}

TEST(JsonIoTest, MissingFileIsIoError)
{
    auto dir = ensure_temp_dir("cpaudit_json_io_missing");
    auto payload = read_json_file(dir / "absent.json");
    ASSERT_FALSE(payload);
    EXPECT_EQ(payload.error().code, "IOError");
}

TEST(JsonIoTest, MalformedFileIsParseError)
{
    auto dir = ensure_temp_dir("cpaudit_json_io_malformed");
    write_text_file(dir / "broken.json", R"([{"uid": "a",)");

    auto payload = read_json_file(dir / "broken.json");
    ASSERT_FALSE(payload);
    EXPECT_EQ(payload.error().code, "ParseError");
    EXPECT_NE(payload.error().message.find("broken.json"), std::string::npos);
}

TEST(JsonIoTest, TrimRemovesSurroundingWhitespace)
{
    EXPECT_EQ(trim("  web server \n"), "web server");
    EXPECT_EQ(trim("\t\n "), "");
    EXPECT_EQ(trim("dmz"), "dmz");
}

}  // namespace cpaudit::common::test
