/*
 * nanoclaw C++ - JSON alias
 *
 * All host/sandbox IPC, snapshots, config and registry files are JSON.
 */
#ifndef nanoclaw_CORE_JSON_HPP
#define nanoclaw_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace nanoclaw {

typedef nlohmann::json Json;

// Serialize for files the sandbox reads. Invalid UTF-8 in user text is
// replaced rather than throwing.
inline std::string dump_json(const Json& value, int indent = -1) {
    return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

} // namespace nanoclaw

#endif // nanoclaw_CORE_JSON_HPP
