// tests/test_retention_sweeper.cpp
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include "../src/retention_sweeper.hpp"
#include "../src/rotating_writer.hpp"

namespace fs = std::filesystem;

static void touch(const fs::path &p, std::chrono::hours age) {
    std::ofstream(p) << "{}\n";
    fs::last_write_time(p, fs::file_time_type::clock::now() - age);
}

static double now_seconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

int main() {
    fs::path dir = fs::temp_directory_path() / ("rpcsentry_sweeper_" + std::to_string(getpid()));
    fs::remove_all(dir);

    RotatingWriter w(dir.string(), 60, flagged_file_name);
    // the open bucket is ancient but must survive
    if (!w.write_line("{}", 60.0)) {
        std::cerr << "write failed\n";
        return 2;
    }
    fs::last_write_time(*w.current_path(), fs::file_time_type::clock::now() - std::chrono::hours(100));

    touch(dir / "old.jsonl", std::chrono::hours(5));
    touch(dir / "young.jsonl", std::chrono::hours(0));
    touch(dir / "old.txt", std::chrono::hours(5));

    RetentionSweeper off(RetentionPolicy{dir.string(), 0, 60}, &w);
    if (off.sweep(now_seconds()) != 0 || !fs::exists(dir / "old.jsonl")) {
        std::cerr << "ttl 0 must delete nothing\n";
        return 3;
    }

    RetentionSweeper s(RetentionPolicy{dir.string(), 3600, 60}, &w);
    size_t removed = s.sweep(now_seconds());
    if (removed != 1 || fs::exists(dir / "old.jsonl")) {
        std::cerr << "expected only old.jsonl removed, removed " << removed << "\n";
        return 4;
    }
    if (!fs::exists(*w.current_path())) {
        std::cerr << "the open file was deleted\n";
        return 5;
    }
    if (!fs::exists(dir / "young.jsonl") || !fs::exists(dir / "old.txt")) {
        std::cerr << "young or non-jsonl file removed\n";
        return 6;
    }

    // once the writer moves on, the old bucket is fair game
    std::string previous = *w.current_path();
    w.write_line("{}", 600.0);
    fs::last_write_time(previous, fs::file_time_type::clock::now() - std::chrono::hours(100));
    if (s.sweep(now_seconds()) != 1 || fs::exists(previous) || s.total_deleted() != 2) {
        std::cerr << "closed bucket not swept\n";
        return 7;
    }

    // a missing directory is not an error
    RetentionSweeper none(RetentionPolicy{(dir / "nope").string(), 60, 60}, nullptr);
    if (none.sweep(now_seconds()) != 0) return 8;

    fs::remove_all(dir);
    std::cout << "test_retention_sweeper: OK\n";
    return 0;
}
