#include <catch2/catch_test_macros.hpp>
#include <pulse/core/filesystem.hpp>
#include <cstdio>
#include <filesystem>

using namespace pulse::core;

TEST_CASE("FileSystem text round trip", "[core][filesystem]") {
    const std::string path = (std::filesystem::temp_directory_path() / "pulse_fs_test.txt").string();

    REQUIRE(FileSystem::write_text(path, "line one\nline two\n"));
    REQUIRE(FileSystem::read_text(path) == "line one\nline two\n");

    std::remove(path.c_str());
    REQUIRE(FileSystem::read_text(path).empty());
}

TEST_CASE("FileSystem missing file", "[core][filesystem]") {
    REQUIRE(FileSystem::read_text("/nonexistent/pulse/file.json").empty());
    REQUIRE_FALSE(FileSystem::write_text("/nonexistent/pulse/file.json", "x"));
}
