/*
 * nanoclaw C++ - Environment Projector
 *
 * Writes <data_dir>/env/env, the only environment a sandbox sees: the
 * allowed secrets from the host .env file plus TZ. Rewritten before every run.
 */
#ifndef nanoclaw_CORE_ENV_PROJECTOR_HPP
#define nanoclaw_CORE_ENV_PROJECTOR_HPP

#include "settings.hpp"
#include <string>
#include <vector>

namespace nanoclaw {

class EnvironmentProjector {
public:
    explicit EnvironmentProjector(const Settings& settings);

    static const std::vector<std::string>& allowed_names();

    // Keep NAME=value lines whose NAME is allowed; drop blanks and comments
    static std::vector<std::string> filter_lines(const std::string& content);

    // From /etc/localtime or /etc/timezone; "UTC" if neither says
    static std::string detect_system_timezone();

    // Configured override, else detected
    std::string timezone() const;

    std::string render() const;

    // Path of the written file
    std::string env_file_path() const;

    bool write(std::string& error) const;

private:
    const Settings& settings_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_ENV_PROJECTOR_HPP
