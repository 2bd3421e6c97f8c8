#include <nanoclaw/core/utils.hpp>
#include <nanoclaw/core/logger.hpp>

#include <algorithm>
#include <numeric>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <pwd.h>
#include <openssl/rand.h>

namespace nanoclaw {

// ============ Time utilities ============

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

int64_t monotonic_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string format_timestamp_utc(int64_t timestamp_ms) {
    time_t t = static_cast<time_t>(timestamp_ms / 1000);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[48];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(timestamp_ms % 1000));
    return std::string(out);
}

std::string format_timestamp_local(int64_t timestamp_ms) {
    time_t t = static_cast<time_t>(timestamp_ms / 1000);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    long offset_min = tm_buf.tm_gmtoff / 60;
    char sign = offset_min < 0 ? '-' : '+';
    if (offset_min < 0) offset_min = -offset_min;

    char out[48];
    snprintf(out, sizeof(out), "%s.%03d%c%02ld:%02ld", buf,
             static_cast<int>(timestamp_ms % 1000), sign, offset_min / 60, offset_min % 60);
    return std::string(out);
}

std::string file_timestamp(int64_t timestamp_ms) {
    std::string ts = format_timestamp_utc(timestamp_ms);
    std::replace(ts.begin(), ts.end(), ':', '-');
    std::replace(ts.begin(), ts.end(), '.', '-');
    return ts;
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;

    size_t len = max_len;
    while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) {
        --len;  // Back up if in the middle of a multi-byte sequence
    }
    return s.substr(0, len);
}

std::string tail_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;

    size_t start = s.size() - max_len;
    while (start < s.size() && (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) {
        ++start;  // Skip continuation bytes of a cut character
    }
    return s.substr(start);
}

// ============ Path utilities ============

std::string normalize_path(const std::string& path) {
    if (path.empty()) return path;

    std::vector<std::string> parts = split(path, '/');
    std::vector<std::string> result;

    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty() || parts[i] == ".") {
            continue;
        }
        if (parts[i] == "..") {
            if (!result.empty() && result.back() != "..") {
                result.pop_back();
            } else if (path[0] != '/') {
                result.push_back("..");
            }
        } else {
            result.push_back(parts[i]);
        }
    }

    std::string normalized = join(result, "/");
    if (path[0] == '/') {
        normalized = "/" + normalized;
    }

    return normalized.empty() ? "." : normalized;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = a.back() == '/';
    bool b_starts_slash = b[0] == '/';

    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

std::string base_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') {
        p.pop_back();
    }
    size_t pos = p.rfind('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string home_directory() {
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home);
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }
    return "";
}

std::string expand_home(const std::string& path) {
    if (path == "~") {
        return home_directory();
    }
    if (starts_with(path, "~/")) {
        return join_path(home_directory(), path.substr(2));
    }
    return path;
}

bool resolve_real_path(const std::string& path, std::string& out) {
    char resolved[PATH_MAX];
    if (realpath(path.c_str(), resolved) == nullptr) {
        return false;
    }
    out = resolved;
    return true;
}

bool path_is_within(const std::string& path, const std::string& parent) {
    std::string p = normalize_path(path);
    std::string root = normalize_path(parent);
    if (root == "/") {
        return !p.empty() && p[0] == '/';
    }
    if (p.size() < root.size() || p.compare(0, root.size(), root) != 0) {
        return false;
    }
    return p.size() == root.size() || p[root.size()] == '/';
}

bool ensure_directory(const std::string& path, unsigned int mode) {
    if (path.empty()) return false;

    std::string current;
    for (size_t i = 0; i < path.size(); ++i) {
        current += path[i];
        if (path[i] == '/' || i == path.size() - 1) {
            if (current == "/") continue;
            if (mkdir(current.c_str(), static_cast<mode_t>(mode)) != 0 && errno != EEXIST) {
                LOG_ERROR("Failed to create directory %s: %s", current.c_str(), strerror(errno));
                return false;
            }
        }
    }
    return is_directory(path);
}

bool path_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

// ============ File utilities ============

bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path.c_str(), std::ios::in | std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return !file.bad();
}

bool write_file_atomic(const std::string& path, const std::string& content) {
    std::string tmp = path + ".tmp-" + generate_uuid();
    {
        std::ofstream file(tmp.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file) {
            LOG_ERROR("Failed to open %s for writing: %s", tmp.c_str(), strerror(errno));
            return false;
        }
        file << content;
        file.flush();
        if (!file) {
            LOG_ERROR("Failed to write %s", tmp.c_str());
            file.close();
            unlink(tmp.c_str());
            return false;
        }
    }
    if (rename(tmp.c_str(), path.c_str()) != 0) {
        LOG_ERROR("Failed to rename %s -> %s: %s", tmp.c_str(), path.c_str(), strerror(errno));
        unlink(tmp.c_str());
        return false;
    }
    return true;
}

// ============ UUID utilities ============

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, 16) != 1) {
        // CSPRNG unavailable; uniqueness is all callers rely on here
        int64_t seed = current_timestamp_ms() ^ (static_cast<int64_t>(getpid()) << 20);
        for (int i = 0; i < 16; ++i) {
            bytes[i] = static_cast<unsigned char>((seed >> ((i % 8) * 8)) ^ (i * 37));
        }
    }

    // Set version 4
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

} // namespace nanoclaw
