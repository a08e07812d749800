#pragma once

#include <string>
#include <vector>

namespace kicadfile {

// Parse a numeric token, returning default if missing/invalid
double parse_double(const std::string& str, double default_val = 0.0);
int parse_int(const std::string& str, int default_val = 0);
bool parse_bool(const std::string& str, bool default_val = false);

// Format a double for KiCad output (6 decimal places, trailing zeros trimmed)
std::string fmt(double val);

// Generate a UUID string (v4-like, deterministic from seed or random)
std::string generate_uuid();
std::string generate_uuid_from_seed(const std::string& seed);

// Lowercase copy
std::string to_lower(std::string s);

// Always double-quote a string for s-expression output
std::string sq(const std::string& s);

// "R2" < "R10"; digit runs compare by value
bool natural_less(const std::string& a, const std::string& b);

// Shell-style glob match (fnmatch), optionally case-insensitive
bool glob_match(const std::string& pattern, const std::string& text, bool icase = false);

// Split "Lib:Name" into its halves; no colon gives an empty library
std::pair<std::string, std::string> split_lib_id(const std::string& lib_id);

// Environment lookup, empty when unset
std::string env_or_empty(const char* name);

// ── File system ─────────────────────────────────────────────────────

bool file_exists(const std::string& path);
bool is_directory(const std::string& path);
std::string parent_dir(const std::string& path);
std::string file_stem(const std::string& path);
std::string join_path(const std::string& dir, const std::string& name);
std::vector<std::string> list_dir(const std::string& dir, const std::string& suffix);

// Whole-file read; throws IoError
std::string read_file(const std::string& path);

// Content of a file at the start of a read-modify-write cycle.
struct FileSnapshot {
    std::string path;
    std::string content;
};

FileSnapshot read_snapshot(const std::string& path);

// Atomic replace: temp file in the same directory, then rename.
// The target is re-read first; if it no longer matches the snapshot
// IOConflict is thrown and the file is left untouched.
void commit_file(const FileSnapshot& snapshot, const std::string& content);

// Atomic create; IOConflict when the path already exists.
void create_file(const std::string& path, const std::string& content);

} // namespace kicadfile
