/*
 * nanoclaw C++ - Configuration Implementation
 */
#include <nanoclaw/core/config.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

#include <cstdlib>

namespace nanoclaw {

Config::Config() : root_(Json::object()) {}

Config::Config(const Json& root) : root_(root.is_object() ? root : Json::object()) {}

bool Config::load(const std::string& path) {
    error_.clear();
    if (!path_exists(path)) {
        LOG_INFO("[Config] %s not found, using defaults", path.c_str());
        root_ = Json::object();
        return true;
    }

    std::string content;
    if (!read_file(path, content)) {
        error_ = "cannot read " + path;
        return false;
    }

    try {
        Json parsed = Json::parse(content);
        if (!parsed.is_object()) {
            error_ = path + ": top-level value must be an object";
            return false;
        }
        root_ = parsed;
    } catch (const Json::exception& e) {
        error_ = path + ": " + e.what();
        return false;
    }

    LOG_DEBUG("[Config] Loaded %s", path.c_str());
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

bool Config::has(const std::string& key) const {
    const Json* v = find(key);
    return v != nullptr && !v->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number() || v->is_boolean()) return v->dump();
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number()) return static_cast<int64_t>(v->get<double>());
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        char* end = nullptr;
        long long parsed = strtoll(s.c_str(), &end, 10);
        if (!s.empty() && end && *end == '\0') {
            return static_cast<int64_t>(parsed);
        }
        LOG_WARN("[Config] %s: '%s' is not an integer, using %lld",
                 key.c_str(), s.c_str(), static_cast<long long>(default_val));
    }
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "1" || s == "yes") return true;
        if (s == "false" || s == "0" || s == "no") return false;
    }
    return default_val;
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Json* v = find(key);
    if (!v || !v->is_array()) return out;
    for (Json::const_iterator it = v->begin(); it != v->end(); ++it) {
        if (it->is_string()) out.push_back(it->get<std::string>());
    }
    return out;
}

void Config::set_string(const std::string& key, const std::string& value) {
    Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) child = Json::object();
        node = &child;
    }
    (*node)[parts.back()] = value;
}

} // namespace nanoclaw
