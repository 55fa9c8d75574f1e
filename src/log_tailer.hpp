#pragma once
#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

// Follows a growing file (tail -f), one complete line per poll().
// The first open starts at end-of-file; later opens resume from the recorded
// offset, or from end-of-file if the file shrank below it. The file is closed
// whenever the reader catches up, so rotation and deletion are picked up on
// the next poll. I/O errors are logged and retried, never thrown.
class LogTailer {
public:
    static constexpr std::chrono::milliseconds kIdlePoll{20};
    static constexpr std::chrono::milliseconds kMissingPoll{250};

    struct Poll {
        std::optional<std::string> line;
        std::chrono::milliseconds retry_after{0};  // meaningful when line is empty
    };

    explicit LogTailer(std::string path);

    Poll poll();

    const std::string &path() const noexcept { return path_; }
    std::optional<uint64_t> offset() const noexcept { return offset_; }
    uint64_t lines_read() const noexcept { return lines_; }

private:
    bool reopen();

    std::string path_;
    std::ifstream in_;
    std::optional<uint64_t> offset_;
    uint64_t lines_ = 0;
    bool missing_logged_ = false;
};
