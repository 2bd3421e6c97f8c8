/*
 * nanoclaw C++ - Application
 *
 * Process-wide singleton owning configuration, resolved settings and the
 * host-side components. main() drives it through init(), run(), shutdown().
 */
#ifndef nanoclaw_CORE_APPLICATION_HPP
#define nanoclaw_CORE_APPLICATION_HPP

#include "config.hpp"
#include "settings.hpp"
#include "group_registry.hpp"
#include "pairing_store.hpp"
#include "host_state.hpp"
#include "orchestrator.hpp"
#include <memory>
#include <string>

namespace nanoclaw {

struct AppInfo {
    static constexpr const char* NAME = "nanoclaw";
    static constexpr const char* VERSION = "0.1.0";
};

class Application {
public:
    enum class Mode {
        RUN_JOB,
        LIST_GROUPS,
        REGISTER_GROUP,
        ISSUE_PAIRING,
        VERIFY_PAIRING,
        LIST_PAIRINGS
    };

    static Application& instance();

    // False when there is nothing to run: --help/--version (is_running()
    // becomes false) or a fatal startup error (is_running() stays true).
    bool init(int argc, char* argv[]);

    // Process exit code
    int run();

    void shutdown();

    bool is_running() const { return running_; }

    const Settings& settings() const { return settings_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool setup_components();

    int run_job();
    int list_groups();
    int register_group();
    int issue_pairing();
    int verify_pairing();
    int list_pairings();
    std::string pairings_path() const;

    bool running_;
    Mode mode_;
    std::string config_file_;
    std::string group_folder_;
    std::string chat_jid_;
    std::string session_id_;
    std::string group_name_;
    std::string pairing_code_;
    int64_t chat_id_;
    bool scheduled_;

    Config config_;
    Settings settings_;
    std::unique_ptr<GroupRegistry> registry_;
    std::unique_ptr<PairingStore> pairings_;
    std::unique_ptr<JsonTaskSource> tasks_;
    std::unique_ptr<JsonChatDirectory> chats_;
    std::unique_ptr<Orchestrator> orchestrator_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_APPLICATION_HPP
