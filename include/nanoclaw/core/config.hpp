/*
 * nanoclaw C++ - Configuration
 *
 * JSON configuration document with dotted-key lookups:
 *   cfg.get_int("container.timeout_ms", 300000)
 */
#ifndef nanoclaw_CORE_CONFIG_HPP
#define nanoclaw_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace nanoclaw {

class Config {
public:
    Config();
    explicit Config(const Json& root);

    // Load from a JSON file. A missing file leaves an empty config and
    // succeeds; an unreadable or malformed file fails with error().
    bool load(const std::string& path);

    std::string get_string(const std::string& key, const std::string& default_val) const;
    int64_t get_int(const std::string& key, int64_t default_val) const;
    bool get_bool(const std::string& key, bool default_val) const;
    std::vector<std::string> get_string_list(const std::string& key) const;

    bool has(const std::string& key) const;
    void set_string(const std::string& key, const std::string& value);

    const Json& root() const { return root_; }
    const std::string& error() const { return error_; }

private:
    const Json* find(const std::string& key) const;

    Json root_;
    std::string error_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_CONFIG_HPP
