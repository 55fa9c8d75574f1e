#pragma once
#include <cstdint>
#include <string>

class RotatingWriter;

struct RetentionPolicy {
    std::string directory;
    int64_t ttl_seconds = 0;             // <= 0: never delete
    int64_t sweep_interval_seconds = 60;
};

// Deletes expired *.jsonl files of one directory. The file the writer
// currently has open is never touched.
class RetentionSweeper {
public:
    RetentionSweeper(RetentionPolicy policy, const RotatingWriter *writer);

    // Number of files removed. `now` is unix seconds.
    size_t sweep(double now);

    const RetentionPolicy &policy() const noexcept { return pol; }
    uint64_t total_deleted() const noexcept { return deleted; }

private:
    RetentionPolicy pol;
    const RotatingWriter *writer;
    uint64_t deleted = 0;
};
