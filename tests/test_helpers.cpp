#include "test_helpers.hpp"
#include <nanoclaw/core/utils.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace nanoclaw {
namespace test_support {

TempDir::TempDir() {
    char tmpl[] = "/tmp/nanoclaw_test_XXXXXX";
    if (mkdtemp(tmpl) == nullptr) {
        throw std::runtime_error("mkdtemp failed");
    }
    // /tmp may itself be a symlink; the validator compares resolved paths
    std::string real;
    path_ = resolve_real_path(tmpl, real) ? real : std::string(tmpl);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::string TempDir::sub(const std::string& relative) const {
    return join_path(path_, relative);
}

void write_text(const std::string& path, const std::string& content) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path.c_str(), std::ios::out | std::ios::trunc | std::ios::binary);
    out << content;
}

std::string read_text(const std::string& path) {
    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string write_script(const std::string& path, const std::string& body) {
    write_text(path, "#!/bin/sh\n" + body + "\n");
    chmod(path.c_str(), 0755);
    return path;
}

std::string allowlist_path_for(const std::string& root) {
    return join_path(root, "config/nanoclaw/mount-allowlist.json");
}

Settings make_settings(const std::string& root) {
    Settings s;
    s.project_root = join_path(root, "project");
    s.groups_dir = join_path(s.project_root, "groups");
    s.data_dir = join_path(s.project_root, "data");
    s.env_file = join_path(s.project_root, ".env");
    s.allowlist_path = allowlist_path_for(root);
    s.main_group_folder = "main";
    s.container_command = "/bin/false";
    s.container_image = "nanoclaw-agent:test";
    s.container_timeout_ms = 10000;
    s.max_output_bytes = 1024 * 1024;
    s.kill_grace_ms = 200;
    s.log_level = "info";
    s.log_verbose = false;
    s.timezone = "UTC";
    std::filesystem::create_directories(s.project_root);
    return s;
}

Group make_group(const std::string& folder, bool is_main) {
    Group g;
    g.jid = folder + "@g.us";
    g.name = "Group " + folder;
    g.folder = folder;
    g.trigger = "@Andy";
    g.is_main = is_main;
    return g;
}

std::vector<std::string> list_files(const std::string& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file()) {
            names.push_back(it->path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string framed(const std::string& json) {
    return "---NANOCLAW_OUTPUT_START---\n" + json + "\n---NANOCLAW_OUTPUT_END---\n";
}

} // namespace test_support
} // namespace nanoclaw
