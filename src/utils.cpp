#include "utils.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <functional>
#include <iomanip>
#include <random>
#include <sstream>

#include <dirent.h>
#include <fnmatch.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kicadfile {

double parse_double(const std::string& str, double default_val) {
    if (str.empty()) return default_val;
    try {
        size_t used = 0;
        double v = std::stod(str, &used);
        return used == str.size() ? v : default_val;
    } catch (const std::exception&) {
        return default_val;
    }
}

int parse_int(const std::string& str, int default_val) {
    if (str.empty()) return default_val;
    try {
        size_t used = 0;
        int v = std::stoi(str, &used);
        return used == str.size() ? v : default_val;
    } catch (const std::exception&) {
        return default_val;
    }
}

bool parse_bool(const std::string& str, bool default_val) {
    std::string s = to_lower(str);
    if (s == "true" || s == "yes" || s == "1") return true;
    if (s == "false" || s == "no" || s == "0") return false;
    return default_val;
}

std::string fmt(double val) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << val;
    std::string s = oss.str();
    // Trim trailing zeros after decimal point
    if (s.find('.') != std::string::npos) {
        size_t last_nonzero = s.find_last_not_of('0');
        if (last_nonzero != std::string::npos && s[last_nonzero] == '.') {
            s.erase(last_nonzero); // remove the dot too
        } else {
            s.erase(last_nonzero + 1);
        }
    }
    // Avoid "-0"
    if (s == "-0") s = "0";
    return s;
}

static std::mt19937_64& get_rng() {
    static std::mt19937_64 rng(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return rng;
}

static std::string format_uuid(uint64_t a, uint64_t b) {
    char buf[40];
    std::snprintf(buf, sizeof(buf),
        "%08x-%04x-%04x-%04x-%012llx",
        (unsigned)(a >> 32),
        (unsigned)((a >> 16) & 0xFFFF),
        ((unsigned)(a & 0x0FFF)) | 0x4000,       // version 4
        ((unsigned)((b >> 48) & 0x3FFF)) | 0x8000, // variant
        (unsigned long long)(b & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::string generate_uuid() {
    auto& rng = get_rng();
    return format_uuid(rng(), rng());
}

std::string generate_uuid_from_seed(const std::string& seed) {
    std::hash<std::string> hasher;
    uint64_t h1 = hasher(seed);
    uint64_t h2 = hasher(seed + "_2");
    return format_uuid(h1, h2);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string sq(const std::string& s) {
    std::string result = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') result += '\\';
        if (c == '\n') { result += "\\n"; continue; }
        result += c;
    }
    result += '"';
    return result;
}

bool natural_less(const std::string& a, const std::string& b) {
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        bool da = std::isdigit((unsigned char)a[i]);
        bool db = std::isdigit((unsigned char)b[j]);
        if (da && db) {
            size_t ie = i, je = j;
            while (ie < a.size() && std::isdigit((unsigned char)a[ie])) ie++;
            while (je < b.size() && std::isdigit((unsigned char)b[je])) je++;
            // Strip leading zeros, then compare by length and digits
            size_t is = a.find_first_not_of('0', i);
            size_t js = b.find_first_not_of('0', j);
            if (is > ie) is = ie;
            if (js > je) js = je;
            if (ie - is != je - js) return ie - is < je - js;
            int c = a.compare(is, ie - is, b, js, je - js);
            if (c != 0) return c < 0;
            i = ie;
            j = je;
        } else {
            if (a[i] != b[j]) return a[i] < b[j];
            i++;
            j++;
        }
    }
    return a.size() - i < b.size() - j;
}

bool glob_match(const std::string& pattern, const std::string& text, bool icase) {
    if (icase) return fnmatch(to_lower(pattern).c_str(), to_lower(text).c_str(), 0) == 0;
    return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

std::pair<std::string, std::string> split_lib_id(const std::string& lib_id) {
    auto colon = lib_id.find(':');
    if (colon == std::string::npos) return {"", lib_id};
    return {lib_id.substr(0, colon), lib_id.substr(colon + 1)};
}

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

// ── File system ─────────────────────────────────────────────────────

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string parent_dir(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

std::string file_stem(const std::string& path) {
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = name.rfind('.');
    return dot == std::string::npos || dot == 0 ? name : name.substr(0, dot);
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::vector<std::string> list_dir(const std::string& dir, const std::string& suffix) {
    std::vector<std::string> out;
    DIR* d = opendir(dir.c_str());
    if (!d) return out;
    while (struct dirent* e = readdir(d)) {
        std::string name = e->d_name;
        if (name == "." || name == "..") continue;
        if (name.size() < suffix.size()) continue;
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;
        out.push_back(join_path(dir, name));
    }
    closedir(d);
    std::sort(out.begin(), out.end());
    return out;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) {
        if (!file_exists(path)) throw NotFoundError("file", path, {{"path", path}});
        throw IoError(path, "cannot open for reading");
    }
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    if (in.bad()) throw IoError(path, "read failed");
    return content;
}

FileSnapshot read_snapshot(const std::string& path) {
    return FileSnapshot{path, read_file(path)};
}

// Write content into a fresh temp file beside target; returns its path.
static std::string write_temp_beside(const std::string& target, const std::string& content) {
    std::string tmpl = join_path(parent_dir(target), "." + file_stem(target) + ".XXXXXX");
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = mkstemp(buf.data());
    if (fd < 0) throw IoError(target, std::string("cannot create temp file: ") + std::strerror(errno));
    std::string tmp(buf.data());

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw IoError(target, std::string("write failed: ") + std::strerror(err));
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        ::unlink(tmp.c_str());
        throw IoError(target, "flush failed");
    }
    ::chmod(tmp.c_str(), 0644);
    return tmp;
}

void commit_file(const FileSnapshot& snapshot, const std::string& content) {
    std::string tmp = write_temp_beside(snapshot.path, content);

    std::string current;
    try {
        current = read_file(snapshot.path);
    } catch (const Error&) {
        ::unlink(tmp.c_str());
        throw IOConflict(snapshot.path, "file disappeared during modification");
    }
    if (current != snapshot.content) {
        ::unlink(tmp.c_str());
        throw IOConflict(snapshot.path, "file changed on disk since it was read");
    }

    if (std::rename(tmp.c_str(), snapshot.path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw IoError(snapshot.path, std::string("rename failed: ") + std::strerror(err));
    }
}

void create_file(const std::string& path, const std::string& content) {
    if (!is_directory(parent_dir(path)))
        throw IoError(path, "parent directory does not exist");
    std::string tmp = write_temp_beside(path, content);
    // link() fails with EEXIST instead of replacing an existing file
    if (::link(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        if (err == EEXIST) throw IOConflict(path, "file already exists");
        throw IoError(path, std::string("create failed: ") + std::strerror(err));
    }
    ::unlink(tmp.c_str());
}

} // namespace kicadfile
