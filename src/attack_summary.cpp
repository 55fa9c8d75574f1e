#include "attack_summary.hpp"
#include "persistence_sink.hpp"
#include "util_log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim(const std::string &s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Strings and numbers make keys; null, "" and containers do not.
bool key_from(const json &v, std::string &out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return !out.empty();
    }
    if (v.is_number()) {
        out = v.dump();
        return true;
    }
    return false;
}

double number_in(const json &obj, const char *group, const char *key) {
    auto g = obj.find(group);
    if (g == obj.end() || !g->is_object()) return 0.0;
    auto v = g->find(key);
    if (v == g->end() || !v->is_number()) return 0.0;
    return v->get<double>();
}

}

std::string sanitize_source_name(const std::string &key) {
    std::string out = key;
    for (char &c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '_' && c != '.' && c != '-') c = '_';
    }
    return out;
}

AttackSummarizer::AttackSummarizer(const AnomalyClassifier &c, SummaryOptions o)
    : classifier(c), opts(std::move(o)) {}

bool AttackSummarizer::source_key(const json &obj, std::string &key) const {
    const std::string &field = opts.group_field;
    auto it = obj.find(field);
    if (it != obj.end()) return key_from(*it, key);

    auto sample = obj.find("sample");
    if (field == "ip" && sample != obj.end() && sample->is_string()) return key_from(*sample, key);

    // monitor lines nest the record under "data"
    auto data = obj.find("data");
    if (data == obj.end() || !data->is_object()) return false;
    auto inner = data->find(field);
    if (inner != data->end()) return key_from(*inner, key);
    auto inner_sample = data->find("sample");
    if (field == "ip" && inner_sample != data->end() && inner_sample->is_string()) return key_from(*inner_sample, key);
    return false;
}

bool AttackSummarizer::add_line(const std::string &raw) {
    const std::string line = trim(raw);
    if (line.empty()) {
        n_skipped += 1;
        return false;
    }
    json obj = payload_to_json(line);
    std::string key;
    // payload_to_json wraps non-JSON text as {"raw": ...}, which carries no key
    if (!obj.is_object() || !source_key(obj, key)) {
        n_skipped += 1;
        return false;
    }

    auto data = obj.find("data");
    const json &record = (data != obj.end() && data->is_object()) ? *data : obj;
    std::string method = "unknown";
    auto m = record.find("method");
    if (m != record.end() && m->is_string() && !m->get_ref<const std::string &>().empty()) {
        method = m->get<std::string>();
    }

    auto slot = index.find(key);
    if (slot == index.end()) {
        slot = index.emplace(key, sources.size()).first;
        SourceSummary fresh;
        fresh.source = key;
        sources.push_back(std::move(fresh));
    }
    SourceSummary &s = sources[slot->second];
    s.count += 1;
    s.methods[method] += 1;
    if (classifier.latency_trigger(number_in(record, "metrics", "p95"), number_in(record, "z", "lat"))) {
        s.latency += 1;
    }
    if (classifier.error_trigger(number_in(record, "metrics", "err_rate"), number_in(record, "z", "err"))) {
        s.error += 1;
    }

    if (!opts.split_dir.empty()) split(key, line);
    n_accepted += 1;
    return true;
}

void AttackSummarizer::split(const std::string &key, const std::string &line) {
    const std::string path = (fs::path(opts.split_dir) / (sanitize_source_name(key) + ".log")).string();
    auto it = writers.find(path);
    if (it == writers.end()) {
        std::error_code ec;
        fs::create_directories(opts.split_dir, ec);
        if (ec) {
            safe_log("AttackSummarizer: cannot create " + opts.split_dir + ": " + ec.message());
            return;
        }
        it = writers.emplace(path, std::ofstream(path, std::ios::out | std::ios::app | std::ios::binary)).first;
        if (!it->second) {
            safe_log("AttackSummarizer: cannot open " + path);
            writers.erase(it);
            return;
        }
    }
    it->second << line << '\n';
    it->second.flush();
    if (!it->second) safe_log("AttackSummarizer: write to " + path + " failed");
}

uint64_t AttackSummarizer::add_file(const std::string &path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) throw std::runtime_error("input file not found: " + path);
    uint64_t added = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (add_line(line)) added += 1;
    }
    return added;
}

std::vector<SourceSummary> AttackSummarizer::summary() const {
    std::vector<SourceSummary> out = sources;
    std::stable_sort(out.begin(), out.end(),
                     [](const SourceSummary &a, const SourceSummary &b) { return a.count > b.count; });
    return out;
}

json AttackSummarizer::to_json() const {
    json arr = json::array();
    for (const auto &s : summary()) {
        json methods = json::object();
        for (const auto &kv : s.methods) methods[kv.first] = kv.second;
        json entry;
        entry["ip"] = s.source;
        entry["count"] = s.count;
        entry["methods"] = methods;
        entry["types"] = {{"latency", s.latency}, {"error", s.error}};
        arr.push_back(std::move(entry));
    }
    return arr;
}

bool write_summary(const AttackSummarizer &s, const std::string &path) {
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            safe_log("write_summary: cannot create " + parent.string() + ": " + ec.message());
            return false;
        }
    }
    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
        safe_log("write_summary: cannot open " + path);
        return false;
    }
    out << s.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
    out.flush();
    if (!out) {
        safe_log("write_summary: write to " + path + " failed");
        return false;
    }
    return true;
}
