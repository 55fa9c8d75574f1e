#include "retention_sweeper.hpp"
#include "rotating_writer.hpp"
#include "util_log.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace {

// file_time_type has no portable epoch in C++17; shift through the two clocks.
double to_unix_seconds(fs::file_time_type ft) {
    using namespace std::chrono;
    auto sys = time_point_cast<system_clock::duration>(ft - fs::file_time_type::clock::now() + system_clock::now());
    return duration<double>(sys.time_since_epoch()).count();
}

bool same_file(const fs::path &a, const std::string &b) {
    std::error_code ec;
    if (fs::equivalent(a, b, ec)) return true;
    return a.lexically_normal() == fs::path(b).lexically_normal();
}

}

RetentionSweeper::RetentionSweeper(RetentionPolicy policy, const RotatingWriter *w)
    : pol(std::move(policy)), writer(w) {}

size_t RetentionSweeper::sweep(double now) {
    if (pol.ttl_seconds <= 0) return 0;

    std::error_code ec;
    if (!fs::is_directory(pol.directory, ec)) return 0;

    std::optional<std::string> current;
    if (writer) current = writer->current_path();
    size_t removed = 0;

    fs::directory_iterator it(pol.directory, ec);
    if (ec) {
        safe_log("RetentionSweeper: cannot list " + pol.directory + ": " + ec.message());
        return 0;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            safe_log("RetentionSweeper: listing " + pol.directory + " stopped: " + ec.message());
            break;
        }
        const fs::path p = it->path();
        if (p.extension() != ".jsonl") continue;
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        if (current && same_file(p, *current)) continue;

        auto mtime = fs::last_write_time(p, fec);
        if (fec) {
            safe_log("RetentionSweeper: stat " + p.string() + " failed: " + fec.message());
            continue;
        }
        if (now - to_unix_seconds(mtime) <= static_cast<double>(pol.ttl_seconds)) continue;

        if (fs::remove(p, fec)) {
            removed += 1;
        } else if (fec) {
            safe_log("RetentionSweeper: remove " + p.string() + " failed: " + fec.message());
        }
    }
    if (removed > 0) {
        deleted += removed;
        safe_log("RetentionSweeper: removed " + std::to_string(removed) + " file(s) from " + pol.directory);
    }
    return removed;
}
