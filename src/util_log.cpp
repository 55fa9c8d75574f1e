#include "util_log.hpp"
#include <mutex>
#include <fstream>
#include <iostream>
#include <ctime>

static std::mutex g_log_mu_internal;
static std::string g_log_path_internal = "rpcsentry.err.log";

static std::string utc_stamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

void set_log_file(const std::string &path) {
    std::lock_guard<std::mutex> lk(g_log_mu_internal);
    g_log_path_internal = path;
}

void safe_log(const std::string &s) {
    std::lock_guard<std::mutex> lk(g_log_mu_internal);
    const std::string line = utc_stamp() + " " + s;
    // write to stderr so console shows messages too
    std::cerr << line << std::endl;
    if (g_log_path_internal.empty()) return;
    std::ofstream f(g_log_path_internal, std::ios::app);
    if (f) f << line << std::endl;
}
