#include "topic.hpp"
#include <vector>

static std::vector<std::string> split_levels(const std::string &s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, slash - start));
        start = slash + 1;
    }
    return out;
}

bool valid_topic_pattern(const std::string &pattern) {
    if (pattern.empty()) return false;
    auto levels = split_levels(pattern);
    for (size_t i = 0; i < levels.size(); ++i) {
        const std::string &lv = levels[i];
        if (lv.find('#') != std::string::npos && (lv != "#" || i + 1 != levels.size())) return false;
        if (lv.find('+') != std::string::npos && lv != "+") return false;
    }
    return true;
}

bool topic_matches(const std::string &pattern, const std::string &topic) {
    if (!valid_topic_pattern(pattern)) return false;
    auto p = split_levels(pattern);
    auto t = split_levels(topic);

    // wildcards never match $SYS-style topics at the first level
    if (!topic.empty() && topic[0] == '$' && (p[0] == "#" || p[0] == "+")) return false;

    size_t i = 0;
    for (; i < p.size(); ++i) {
        if (p[i] == "#") return true;
        if (i >= t.size()) return false;
        if (p[i] != "+" && p[i] != t[i]) return false;
    }
    return i == t.size();
}
