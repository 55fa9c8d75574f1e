#include "rotating_writer.hpp"
#include "numeric.hpp"
#include "util_log.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;

std::string normal_file_name(int64_t bucket_start) {
    std::time_t t = static_cast<std::time_t>(bucket_start);
    std::tm tmv{};
    char buf[32];
    if (gmtime_r(&t, &tmv) == nullptr ||
        std::strftime(buf, sizeof(buf), "log-%Y%m%d-%H%M.jsonl", &tmv) == 0) {
        // year outside what struct tm can hold
        return "log-" + std::to_string(bucket_start) + ".jsonl";
    }
    return buf;
}

std::string flagged_file_name(int64_t bucket_start) {
    return "flagged-" + std::to_string(bucket_start) + ".jsonl";
}

RotatingWriter::RotatingWriter(std::string directory, int64_t period_seconds, NameFn naming)
    : dir(std::move(directory)),
      period(std::max<int64_t>(kMinPeriodSeconds, period_seconds)),
      name_for(std::move(naming)) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) safe_log("RotatingWriter: cannot create " + dir + ": " + ec.message());
}

RotatingWriter::~RotatingWriter() {
    close();
}

std::optional<int64_t> RotatingWriter::bucket_start_for(double ts) const {
    auto whole = to_integral<int64_t>(std::floor(ts));
    if (!whole || *whole < std::numeric_limits<int64_t>::min() + period) return std::nullopt;
    const int64_t secs = *whole;
    // floor division, also for timestamps before the epoch
    int64_t q = secs / period;
    if (secs % period != 0 && secs < 0) q -= 1;
    return q * period;
}

std::optional<std::string> RotatingWriter::current_path() const {
    if (!bucket) return std::nullopt;
    return path;
}

void RotatingWriter::close_handle() {
    if (out.is_open()) {
        out.flush();
        out.close();
    }
    out.clear();
}

void RotatingWriter::close() {
    close_handle();
    bucket.reset();
}

bool RotatingWriter::roll_to(int64_t b) {
    close_handle();
    // the bucket stays current even if opening fails, so the sweeper keeps off it
    bucket = b;
    path = (fs::path(dir) / name_for(b)).string();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        safe_log("RotatingWriter: cannot create " + dir + ": " + ec.message());
        return false;
    }
    out.open(path, std::ios::out | std::ios::app);
    if (!out) {
        safe_log("RotatingWriter: cannot open " + path);
        close_handle();
        return false;
    }
    return true;
}

bool RotatingWriter::write_line(const std::string &line, double ts) {
    if (!std::isfinite(ts)) {
        safe_log("RotatingWriter: non-finite timestamp, record dropped");
        return false;
    }
    auto b = bucket_start_for(ts);
    if (!b) {
        safe_log("RotatingWriter: timestamp out of range, record dropped");
        return false;
    }
    if (!bucket || *bucket != *b || !out.is_open()) {
        if (!roll_to(*b)) return false;
    }
    out << line << '\n';
    out.flush();
    if (!out) {
        safe_log("RotatingWriter: write to " + path + " failed");
        // reopened on the next write to this bucket
        close_handle();
        return false;
    }
    written += 1;
    return true;
}

bool RotatingWriter::write(const nlohmann::json &record, double ts) {
    return write_line(record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), ts);
}
