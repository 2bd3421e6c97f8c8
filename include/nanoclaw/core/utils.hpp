#ifndef nanoclaw_CORE_UTILS_HPP
#define nanoclaw_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace nanoclaw {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Milliseconds on a monotonic clock, for deadlines and durations
int64_t monotonic_ms();

// UTC ISO 8601 with milliseconds (2026-01-31T12:00:00.123Z)
std::string format_timestamp_utc(int64_t timestamp_ms);

// Host local time, ISO 8601 with offset (2026-01-31T13:00:00.123+01:00)
std::string format_timestamp_local(int64_t timestamp_ms);

// UTC timestamp usable as a file name (2026-01-31T12-00-00-123Z)
std::string file_timestamp(int64_t timestamp_ms);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

std::vector<std::string> split(const std::string& s, char delimiter);

std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Last max_len bytes of s, starting on a UTF-8 character boundary
std::string tail_safe(const std::string& s, size_t max_len);

// ============ Path utilities ============

// Normalize path (resolve . and ..)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Last path component ("/a/b/" -> "b")
std::string base_name(const std::string& path);

// $HOME, or the passwd entry when HOME is unset. Empty if neither exists.
std::string home_directory();

// "~" and "~/x" expand against home_directory(); other paths are unchanged
std::string expand_home(const std::string& path);

// realpath(3); false if the path does not exist
bool resolve_real_path(const std::string& path, std::string& out);

// True if path equals parent or lies beneath it (component-wise, no I/O)
bool path_is_within(const std::string& path, const std::string& parent);

// mkdir -p. Succeeds if the directory already exists.
bool ensure_directory(const std::string& path, unsigned int mode = 0755);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);

// ============ File utilities ============

bool read_file(const std::string& path, std::string& out);

// Write to a sibling temp file, then rename over path
bool write_file_atomic(const std::string& path, const std::string& content);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

} // namespace nanoclaw

#endif // nanoclaw_CORE_UTILS_HPP
