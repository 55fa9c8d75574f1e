// tests/test_rotating_writer.cpp
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "../src/rotating_writer.hpp"

namespace fs = std::filesystem;

static size_t count_lines(const std::string &path) {
    std::ifstream in(path);
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) ++n;
    return n;
}

int main() {
    if (normal_file_name(0) != "log-19700101-0000.jsonl" || normal_file_name(1704164645) != "log-20240102-0304.jsonl") {
        std::cerr << "normal naming wrong: " << normal_file_name(1704164645) << "\n";
        return 2;
    }
    if (flagged_file_name(1704164640) != "flagged-1704164640.jsonl") {
        std::cerr << "flagged naming wrong\n";
        return 3;
    }

    fs::path dir = fs::temp_directory_path() / ("rpcsentry_writer_" + std::to_string(getpid()));
    fs::remove_all(dir);

    RotatingWriter w(dir.string(), 60, flagged_file_name);
    if (!fs::is_directory(dir)) {
        std::cerr << "directory not created\n";
        return 4;
    }
    if (w.current_path()) {
        std::cerr << "no file should be open before the first write\n";
        return 5;
    }

    if (!w.write(nlohmann::json{{"n", 0}}, 0.0) || !w.write(nlohmann::json{{"n", 30}}, 30.0) ||
        !w.write(nlohmann::json{{"n", 59}}, 59.9)) {
        std::cerr << "write failed\n";
        return 6;
    }
    auto first = w.current_path();
    if (!first || fs::path(*first).filename() != "flagged-0.jsonl") {
        std::cerr << "first bucket path wrong\n";
        return 7;
    }
    // flushed on every write
    if (count_lines(*first) != 3) {
        std::cerr << "expected 3 lines in the first bucket, got " << count_lines(*first) << "\n";
        return 8;
    }

    if (!w.write(nlohmann::json{{"n", 61}}, 61.0)) return 9;
    auto second = w.current_path();
    if (!second || *second == *first || fs::path(*second).filename() != "flagged-60.jsonl") {
        std::cerr << "t=61 must open a new bucket\n";
        return 10;
    }
    if (count_lines(*first) != 3 || count_lines(*second) != 1) {
        std::cerr << "records landed in the wrong bucket\n";
        return 11;
    }
    nlohmann::json back = nlohmann::json::parse(std::ifstream(*second));
    if (back["n"] != 61) {
        std::cerr << "record not written as JSON\n";
        return 12;
    }

    // going back to an old bucket appends, never truncates
    w.write_line("{\"late\":true}", 10.0);
    if (count_lines(*first) != 4 || *w.current_path() != *first) {
        std::cerr << "reopened bucket was not appended to\n";
        return 13;
    }

    // the period is clamped to 60 seconds
    RotatingWriter small((dir / "small").string(), 5, normal_file_name);
    if (small.period_seconds() != 60 || small.bucket_start_for(119.0) != 60 || small.bucket_start_for(-1.0) != -60) {
        std::cerr << "period not clamped or floor wrong\n";
        return 14;
    }

    w.close();
    if (w.current_path()) {
        std::cerr << "closed writer still reports a path\n";
        return 15;
    }
    if (w.records_written() != 5) {
        std::cerr << "expected 5 records, got " << w.records_written() << "\n";
        return 16;
    }

    // an unusable directory reports failure instead of throwing
    std::ofstream(dir / "blocker") << "file";
    RotatingWriter broken((dir / "blocker" / "sub").string(), 60, normal_file_name);
    if (broken.write(nlohmann::json{{"x", 1}}, 1.0)) {
        std::cerr << "write into a non-directory should fail\n";
        return 17;
    }

    // after a failed write the bucket is still reported, so retention skips it
    RotatingWriter full("/dev", 60, [](int64_t) { return std::string("full"); });
    if (full.write_line("{}", 30.0) || !full.current_path() || *full.current_path() != "/dev/full") {
        std::cerr << "failed write should keep reporting its bucket\n";
        return 18;
    }
    if (full.write_line("{}", 45.0) || !full.current_path() || *full.current_path() != "/dev/full") {
        std::cerr << "retry into the same bucket should keep its path\n";
        return 19;
    }

    // timestamps that do not fit in int64 seconds are dropped
    auto before = small.records_written();
    if (small.bucket_start_for(1e300) || small.bucket_start_for(-1e300) ||
        small.write_line("{}", 1e300) || small.records_written() != before || small.current_path()) {
        std::cerr << "out-of-range timestamp accepted\n";
        return 20;
    }

    fs::remove_all(dir);
    std::cout << "test_rotating_writer: OK\n";
    return 0;
}
