#include "parser.hpp"
#include "numeric.hpp"
#include "source_hash.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>

using json = nlohmann::json;

std::optional<double> parse_iso8601(const std::string &s) {
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0, consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        // space separator is common in hand-written logs
        if (std::sscanf(s.c_str(), "%4d-%2d-%2d %2d:%2d:%2d%n",
                        &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
            return std::nullopt;
        }
    }
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    double t = static_cast<double>(timegm(&tm));

    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        size_t start = pos;
        ++pos;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
        t += std::strtod(s.substr(start, pos - start).c_str(), nullptr);
    }

    if (pos == s.size() || s[pos] == 'Z' || s[pos] == 'z') return t;

    if (s[pos] == '+' || s[pos] == '-') {
        int oh = 0, om = 0;
        const char *tz = s.c_str() + pos + 1;
        if (std::sscanf(tz, "%2d:%2d", &oh, &om) != 2 && std::sscanf(tz, "%2d%2d", &oh, &om) != 2) {
            return std::nullopt;
        }
        double offset = oh * 3600.0 + om * 60.0;
        return s[pos] == '+' ? t - offset : t + offset;
    }
    return std::nullopt;
}

// number or numeric string
static std::optional<double> as_number(const json &v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        const std::string &str = v.get_ref<const std::string &>();
        if (str.empty()) return std::nullopt;
        char *end = nullptr;
        double d = std::strtod(str.c_str(), &end);
        if (end != str.c_str() + str.size()) return std::nullopt;
        return d;
    }
    return std::nullopt;
}

std::optional<Event> parse_event_line(const std::string &line, const std::string &salt, double received_at) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    auto mit = j.find("method");
    if (mit == j.end() || !mit->is_string()) return std::nullopt;

    Event ev;
    ev.method = mit->get<std::string>();
    if (ev.method.empty()) return std::nullopt;
    ev.time = received_at;

    auto tit = j.find("time");
    if (tit != j.end() && tit->is_string()) {
        auto t = parse_iso8601(tit->get<std::string>());
        if (t) ev.time = *t;
    }

    auto lit = j.find("lat_ms");
    if (lit != j.end() && !lit->is_null()) {
        auto lat = as_number(*lit);
        if (!lat || !std::isfinite(*lat) || *lat < 0.0) return std::nullopt;
        ev.latency_ms = *lat;
    }

    auto sit = j.find("status");
    if (sit != j.end() && !sit->is_null()) {
        auto st = as_number(*sit);
        if (!st) return std::nullopt;
        auto code = to_integral<int>(*st);
        if (!code) return std::nullopt;
        ev.status_code = *code;
    }

    auto iit = j.find("ip");
    if (iit != j.end() && iit->is_string() && !iit->get_ref<const std::string &>().empty()) {
        ev.source_id = hash_source(iit->get<std::string>(), salt);
    }
    return ev;
}
