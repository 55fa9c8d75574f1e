#pragma once
#include <cstdint>
#include <fstream>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

#include "classifier.hpp"

// Per-source tally over a flagged log.
struct SourceSummary {
    std::string source;
    uint64_t count = 0;
    std::map<std::string, uint64_t> methods;
    uint64_t latency = 0;  // records over the latency half of the trigger
    uint64_t error = 0;    // records over the error half
};

struct SummaryOptions {
    std::string group_field = "sample";  // "sample" or "ip"
    std::string split_dir;               // empty: no per-source copies
};

// Groups flagged JSONL records (bare alerts or monitor {ts,topic,data} lines)
// by hashed sample or ip. With a split_dir every accepted line is also
// appended to <split_dir>/<source>.log.
class AttackSummarizer {
public:
    AttackSummarizer(const AnomalyClassifier &classifier, SummaryOptions opts);

    AttackSummarizer(const AttackSummarizer&) = delete;
    AttackSummarizer& operator=(const AttackSummarizer&) = delete;

    // False when the line is blank, not JSON, or has no usable key.
    bool add_line(const std::string &line);

    // Throws std::runtime_error when the input cannot be opened.
    uint64_t add_file(const std::string &path);

    // Highest count first; ties keep first-seen order.
    std::vector<SourceSummary> summary() const;
    nlohmann::json to_json() const;

    uint64_t accepted() const noexcept { return n_accepted; }
    uint64_t skipped() const noexcept { return n_skipped; }

private:
    bool source_key(const nlohmann::json &obj, std::string &key) const;
    void split(const std::string &key, const std::string &line);

    const AnomalyClassifier &classifier;
    SummaryOptions opts;
    std::vector<SourceSummary> sources;
    std::unordered_map<std::string, size_t> index;
    std::map<std::string, std::ofstream> writers;
    uint64_t n_accepted = 0;
    uint64_t n_skipped = 0;
};

// Safe file name for a source key; [A-Za-z0-9_.-] kept, the rest becomes '_'.
std::string sanitize_source_name(const std::string &key);

// Writes the summary array to `path`, creating parent directories.
bool write_summary(const AttackSummarizer &s, const std::string &path);
