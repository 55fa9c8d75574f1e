#include "log_tailer.hpp"
#include "util_log.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

LogTailer::LogTailer(std::string path) : path_(std::move(path)) {}

bool LogTailer::reopen() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (!missing_logged_) {
            safe_log("LogTailer: waiting for " + path_);
            missing_logged_ = true;
        }
        return false;
    }

    in_.clear();
    in_.open(path_, std::ios::in | std::ios::binary);
    if (!in_) {
        safe_log("LogTailer: failed to open " + path_);
        in_.clear();
        return false;
    }
    if (missing_logged_) {
        safe_log("LogTailer: following " + path_);
        missing_logged_ = false;
    }

    uint64_t size = static_cast<uint64_t>(fs::file_size(path_, ec));
    if (ec) {
        safe_log("LogTailer: file_size failed for " + path_ + ": " + ec.message());
        in_.close();
        return false;
    }

    if (!offset_) {
        // first open: no history replay
        offset_ = size;
    } else if (*offset_ > size) {
        safe_log("LogTailer: " + path_ + " shrank below offset " + std::to_string(*offset_)
                 + ", continuing from end");
        offset_ = size;
    }

    in_.seekg(static_cast<std::streamoff>(*offset_), std::ios::beg);
    if (!in_) {
        safe_log("LogTailer: seek failed on " + path_);
        in_.close();
        in_.clear();
        return false;
    }
    return true;
}

LogTailer::Poll LogTailer::poll() {
    if (!in_.is_open() && !reopen()) {
        return Poll{std::nullopt, kMissingPoll};
    }

    std::string line;
    if (std::getline(in_, line) && !in_.eof()) {
        *offset_ += static_cast<uint64_t>(line.size()) + 1;
        lines_ += 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return Poll{std::move(line), std::chrono::milliseconds(0)};
    }

    // caught up (a trailing partial line stays unread until its newline lands)
    in_.close();
    in_.clear();
    return Poll{std::nullopt, kIdlePoll};
}
