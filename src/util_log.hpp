#pragma once
#include <string>

// Thread-safe diagnostics log: stderr plus an append-only file.
void safe_log(const std::string &s);

// Redirect the diagnostics file (empty path disables the file copy).
void set_log_path(const std::string &path);
