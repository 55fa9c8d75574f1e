#pragma once
#include <string>

// Thread-safe diagnostic log: stderr plus an append-only file copy.
void safe_log(const std::string &s);

// Path of the file copy; empty disables it. Default "rpcsentry.err.log".
void set_log_file(const std::string &path);
