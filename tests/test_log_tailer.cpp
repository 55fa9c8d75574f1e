// tests/test_log_tailer.cpp
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include "../src/log_tailer.hpp"

namespace fs = std::filesystem;

static void append(const fs::path &p, const std::string &s) {
    std::ofstream f(p, std::ios::app | std::ios::binary);
    f << s;
}

int main() {
    fs::path dir = fs::temp_directory_path() / ("rpcsentry_tailer_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path log = dir / "rpc.jsonl";

    LogTailer t(log.string());

    // absent file: long idle
    auto p = t.poll();
    if (p.line || p.retry_after != LogTailer::kMissingPoll) {
        std::cerr << "missing file should idle 250ms\n";
        return 2;
    }

    // history is not replayed
    append(log, "old-1\nold-2\n");
    p = t.poll();
    if (p.line || p.retry_after != LogTailer::kIdlePoll || t.offset() != 12u) {
        std::cerr << "first open must start at the end\n";
        return 3;
    }

    append(log, "new-1\r\nnew-2\npart");
    p = t.poll();
    if (!p.line || *p.line != "new-1") {
        std::cerr << "expected new-1\n";
        return 4;
    }
    p = t.poll();
    if (!p.line || *p.line != "new-2") {
        std::cerr << "expected new-2\n";
        return 5;
    }
    // partial line waits for its newline
    p = t.poll();
    if (p.line || p.retry_after != LogTailer::kIdlePoll) {
        std::cerr << "partial line emitted\n";
        return 6;
    }
    append(log, "ial\n");
    p = t.poll();
    if (!p.line || *p.line != "partial") {
        std::cerr << "completed line not emitted whole\n";
        return 7;
    }
    if (t.lines_read() != 3) {
        std::cerr << "expected 3 lines read\n";
        return 8;
    }

    // truncation: resume from the new end
    { std::ofstream f(log, std::ios::trunc); f << "x\n"; }
    // the first poll drains the handle opened before the truncation
    t.poll();
    p = t.poll();
    if (p.line || t.offset() != 2u) {
        std::cerr << "truncated file should resume at its end, offset " << *t.offset() << "\n";
        return 9;
    }
    append(log, "after-truncate\n");
    p = t.poll();
    if (!p.line || *p.line != "after-truncate") {
        std::cerr << "line after truncation missed\n";
        return 10;
    }

    // deletion and re-creation
    fs::remove(log);
    t.poll();
    p = t.poll();
    if (p.line || p.retry_after != LogTailer::kMissingPoll) {
        std::cerr << "deleted file should idle 250ms\n";
        return 11;
    }
    append(log, "fresh\n");
    p = t.poll();
    if (p.line) {
        std::cerr << "recreated file smaller than offset should start at its end\n";
        return 12;
    }
    append(log, "fresh-2\n");
    p = t.poll();
    if (!p.line || *p.line != "fresh-2") {
        std::cerr << "line after recreation missed\n";
        return 13;
    }

    fs::remove_all(dir);
    std::cout << "test_log_tailer: OK\n";
    return 0;
}
