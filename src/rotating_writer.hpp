#pragma once
#include <cstdint>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// log-YYYYMMDD-HHMM.jsonl (UTC) for the given bucket start
std::string normal_file_name(int64_t bucket_start);
// flagged-<epoch>.jsonl
std::string flagged_file_name(int64_t bucket_start);

// Append-only JSONL sink whose file changes every `period_seconds`.
// At most one handle is open; switching buckets closes the old handle
// before the next one is opened. Every write is flushed.
class RotatingWriter {
public:
    using NameFn = std::function<std::string(int64_t bucket_start)>;

    static constexpr int64_t kMinPeriodSeconds = 60;

    RotatingWriter(std::string directory, int64_t period_seconds, NameFn naming);
    ~RotatingWriter();

    RotatingWriter(const RotatingWriter&) = delete;
    RotatingWriter& operator=(const RotatingWriter&) = delete;

    // False (and logged) on any filesystem error; the writer stays usable.
    bool write(const nlohmann::json &record, double ts);
    bool write_line(const std::string &line, double ts);

    // Path of the current bucket, if any. Stays set after a failed write
    // until the writer moves to another bucket or close() is called.
    std::optional<std::string> current_path() const;

    // nullopt for timestamps that do not fit in int64 seconds
    std::optional<int64_t> bucket_start_for(double ts) const;
    const std::string &directory() const noexcept { return dir; }
    int64_t period_seconds() const noexcept { return period; }
    uint64_t records_written() const noexcept { return written; }

    void close();

private:
    bool roll_to(int64_t bucket);
    void close_handle();

    std::string dir;
    int64_t period;
    NameFn name_for;
    std::optional<int64_t> bucket;
    std::string path;
    std::ofstream out;
    uint64_t written = 0;
};
