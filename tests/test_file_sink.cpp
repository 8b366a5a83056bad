#include <catch2/catch_test_macros.hpp>
#include "audit/file_sink.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace promptshield;

namespace {

std::string temp_log_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("promptshield_" + name);
    std::filesystem::remove_all(dir);
    return dir.string();
}

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

} // anonymous namespace

TEST_CASE("FileSink: appends one line per write", "[audit][file_sink]") {
    const auto dir = temp_log_dir("file_sink_append");
    FileSink::Config cfg;
    cfg.output_file = dir + "/nested/events.log";

    {
        FileSink sink(cfg);
        CHECK(sink.name() == "file:" + cfg.output_file);
        CHECK(sink.write("first"));
        CHECK(sink.write("second"));
        sink.flush();
        CHECK(sink.current_file_size() == std::string("first\nsecond\n").size());
    }

    CHECK(read_lines(cfg.output_file) == std::vector<std::string>{"first", "second"});

    // Reopening appends and resumes size accounting
    FileSink reopened(cfg);
    CHECK(reopened.current_file_size() == std::string("first\nsecond\n").size());

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileSink: size-based rotation shifts numbered files", "[audit][file_sink][rotation]") {
    const auto dir = temp_log_dir("file_sink_rotation");
    FileSink::Config cfg;
    cfg.output_file = dir + "/events.log";
    cfg.max_file_size_bytes = 10;
    cfg.max_files = 3;
    cfg.time_based_rotation = false;

    FileSink sink(cfg);
    REQUIRE(sink.write("0123456789"));   // 11 bytes, over the limit
    REQUIRE(sink.write("line-b"));       // rotates first
    REQUIRE(sink.write("line-c-long"));  // 7 bytes so far, no rotation
    REQUIRE(sink.write("line-d"));       // rotates again
    sink.flush();

    CHECK(sink.rotation_count() == 2);
    CHECK(read_lines(cfg.output_file) == std::vector<std::string>{"line-d"});
    CHECK(read_lines(FileSink::rotated_path(cfg.output_file, 1)) ==
          std::vector<std::string>{"line-b", "line-c-long"});
    CHECK(read_lines(FileSink::rotated_path(cfg.output_file, 2)) ==
          std::vector<std::string>{"0123456789"});

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileSink: keeps at most max_files rotated files", "[audit][file_sink][rotation]") {
    const auto dir = temp_log_dir("file_sink_retention");
    FileSink::Config cfg;
    cfg.output_file = dir + "/events.log";
    cfg.max_file_size_bytes = 1;
    cfg.max_files = 2;
    cfg.time_based_rotation = false;

    FileSink sink(cfg);
    for (int i = 0; i < 6; ++i) {
        REQUIRE(sink.write("event-" + std::to_string(i)));
    }
    sink.flush();

    CHECK(std::filesystem::exists(cfg.output_file));
    CHECK(std::filesystem::exists(FileSink::rotated_path(cfg.output_file, 2)));
    CHECK_FALSE(std::filesystem::exists(FileSink::rotated_path(cfg.output_file, 3)));
    CHECK(read_lines(cfg.output_file) == std::vector<std::string>{"event-5"});
    CHECK(read_lines(FileSink::rotated_path(cfg.output_file, 1)) ==
          std::vector<std::string>{"event-4"});
    CHECK(read_lines(FileSink::rotated_path(cfg.output_file, 2)) ==
          std::vector<std::string>{"event-3"});

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileSink: rotated_path naming", "[audit][file_sink]") {
    CHECK(FileSink::rotated_path("logs/a.log", 0) == "logs/a.log");
    CHECK(FileSink::rotated_path("logs/a.log", 3) == "logs/a.log.3");
}

TEST_CASE("FileSink: unwritable path throws", "[audit][file_sink]") {
    FileSink::Config cfg;
    cfg.output_file = "/proc/promptshield_no_such_dir/events.log";
    CHECK_THROWS_AS(FileSink(cfg), std::runtime_error);
}
