/*
 * nanoclaw C++ - Application Implementation
 */
#include <nanoclaw/core/application.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

#include <iostream>
#include <iterator>
#include <cstdlib>
#include <cstring>

namespace nanoclaw {

// ============================================================================
// Utility Functions
// ============================================================================

static void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - multi-tenant agent sandbox orchestrator\n\n"
              << "Usage:\n"
              << "  " << prog << " [--config FILE] --group FOLDER [--chat JID] [--session ID] [--scheduled]\n"
              << "  " << prog << " [--config FILE] --list-groups\n"
              << "  " << prog << " [--config FILE] --register JID --name NAME [--group FOLDER]\n"
              << "  " << prog << " [--config FILE] --pair JID --name TITLE [--chat-id N]\n"
              << "  " << prog << " [--config FILE] --verify-code CODE\n"
              << "  " << prog << " [--config FILE] --pending-pairings\n\n"
              << "Runs one job for a registered group. The prompt is read from stdin and\n"
              << "the result object is printed as JSON on stdout.\n\n"
              << "Options:\n"
              << "  --config FILE   Configuration file (default: config.json)\n"
              << "  --group FOLDER  Group folder to run as\n"
              << "  --chat JID      Chat identity passed to the agent\n"
              << "  --session ID    Resume an existing agent session\n"
              << "  --scheduled     Mark the job as a scheduled task\n"
              << "  --list-groups   Print registered groups and exit\n"
              << "  --register JID  Register a chat as a new group\n"
              << "  --name NAME     Display name for --register or --pair\n"
              << "  --pair JID      Issue a pairing code for a chat\n"
              << "  --chat-id N     Numeric chat id stored with --pair\n"
              << "  --verify-code CODE\n"
              << "                  Confirm a pairing code and register its chat\n"
              << "  --pending-pairings\n"
              << "                  Print unexpired pairing codes and exit\n"
              << "  -h, --help      Show this help message\n"
              << "  -v, --version   Show version\n";
}

static void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , mode_(Mode::RUN_JOB)
    , config_file_("config.json")
    , chat_id_(0)
    , scheduled_(false)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const bool has_value = i + 1 < argc;
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && has_value) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--group") == 0 && has_value) {
            group_folder_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--chat") == 0 && has_value) {
            chat_jid_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--session") == 0 && has_value) {
            session_id_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--scheduled") == 0) {
            scheduled_ = true;
            continue;
        }
        if (strcmp(argv[i], "--list-groups") == 0) {
            mode_ = Mode::LIST_GROUPS;
            continue;
        }
        if (strcmp(argv[i], "--register") == 0 && has_value) {
            mode_ = Mode::REGISTER_GROUP;
            chat_jid_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--pair") == 0 && has_value) {
            mode_ = Mode::ISSUE_PAIRING;
            chat_jid_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--chat-id") == 0 && has_value) {
            chat_id_ = std::strtoll(argv[++i], nullptr, 10);
            continue;
        }
        if (strcmp(argv[i], "--verify-code") == 0 && has_value) {
            mode_ = Mode::VERIFY_PAIRING;
            pairing_code_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--pending-pairings") == 0) {
            mode_ = Mode::LIST_PAIRINGS;
            continue;
        }
        if (strcmp(argv[i], "--name") == 0 && has_value) {
            group_name_ = std::string(argv[++i]);
            continue;
        }
        std::cerr << "Unknown or incomplete option: " << argv[i] << "\n";
        print_usage(argv[0]);
        return false;
    }

    if (mode_ == Mode::RUN_JOB && group_folder_.empty()) {
        std::cerr << "Missing --group\n";
        print_usage(argv[0]);
        return false;
    }
    if (mode_ == Mode::REGISTER_GROUP && group_name_.empty()) {
        std::cerr << "--register needs --name\n";
        return false;
    }
    if (mode_ == Mode::ISSUE_PAIRING && group_name_.empty()) {
        std::cerr << "--pair needs --name\n";
        return false;
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(settings_.log_level));
}

bool Application::setup_components() {
    registry_.reset(new GroupRegistry(settings_));
    std::string error;
    if (!registry_->load(error)) {
        LOG_ERROR("Failed to load group registry: %s", error.c_str());
        return false;
    }

    // Codes expire within the hour; an unreadable file only loses pending ones
    pairings_.reset(new PairingStore());
    if (!pairings_->load(pairings_path(), error)) {
        LOG_WARN("Discarding pending pairings: %s", error.c_str());
    }

    tasks_.reset(new JsonTaskSource(join_path(settings_.data_dir, "tasks.json")));
    chats_.reset(new JsonChatDirectory(join_path(settings_.data_dir, "chats.json")));
    orchestrator_.reset(new Orchestrator(settings_, *registry_, *tasks_, *chats_));
    return true;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    if (!config_.load(config_file_)) {
        LOG_ERROR("Failed to load config: %s", config_.error().c_str());
        return false;
    }

    // Resolved once; nothing below reads the environment again
    settings_ = Settings::from_environment(config_);
    setup_logging();

    LOG_DEBUG("%s v%s starting (project root %s)", AppInfo::NAME, AppInfo::VERSION,
              settings_.project_root.c_str());

    return setup_components();
}

int Application::run() {
    switch (mode_) {
        case Mode::LIST_GROUPS:
            return list_groups();
        case Mode::REGISTER_GROUP:
            return register_group();
        case Mode::ISSUE_PAIRING:
            return issue_pairing();
        case Mode::VERIFY_PAIRING:
            return verify_pairing();
        case Mode::LIST_PAIRINGS:
            return list_pairings();
        case Mode::RUN_JOB:
        default:
            return run_job();
    }
}

int Application::run_job() {
    Group group;
    if (!registry_->find_by_folder(group_folder_, group)) {
        LOG_ERROR("No registered group with folder '%s'", group_folder_.c_str());
        std::cout << dump_json(to_json(JobResult::fail("Unknown group folder: " + group_folder_)), 2) << std::endl;
        return 1;
    }

    std::string prompt((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    if (trim(prompt).empty()) {
        LOG_ERROR("Empty prompt on stdin");
        std::cout << dump_json(to_json(JobResult::fail("Empty prompt")), 2) << std::endl;
        return 1;
    }

    JobInput input;
    input.prompt = prompt;
    input.session_id = session_id_;
    input.group_folder = group.folder;
    input.chat_jid = chat_jid_.empty() ? group.jid : chat_jid_;
    input.is_main = group.is_main;
    input.is_scheduled_task = scheduled_;

    JobResult result = orchestrator_->submit(group, input);
    std::cout << dump_json(to_json(result), 2) << std::endl;
    return result.success() ? 0 : 1;
}

int Application::list_groups() {
    std::vector<Group> groups = registry_->all();
    Json list = Json::array();
    for (size_t i = 0; i < groups.size(); ++i) {
        Json g = to_json(groups[i]);
        g["jid"] = groups[i].jid;
        g["isMain"] = groups[i].is_main;
        list.push_back(g);
    }
    std::cout << dump_json(list, 2) << std::endl;
    return 0;
}

int Application::register_group() {
    Group group;
    group.jid = chat_jid_;
    group.name = group_name_;
    group.folder = group_folder_.empty() ? GroupRegistry::registration_folder_for(group_name_) : group_folder_;
    group.trigger = config_.get_string("assistant.trigger", "@Andy");

    std::string error;
    if (!registry_->register_group(group, error)) {
        LOG_ERROR("Registration failed: %s", error.c_str());
        return 1;
    }
    std::cout << group.folder << std::endl;
    return 0;
}

std::string Application::pairings_path() const {
    return join_path(settings_.data_dir, "pending_pairings.json");
}

int Application::issue_pairing() {
    Group existing;
    if (registry_->find_by_jid(chat_jid_, existing)) {
        LOG_ERROR("%s is already registered as %s", chat_jid_.c_str(), existing.folder.c_str());
        return 1;
    }

    std::string code = pairings_->issue(chat_jid_, chat_id_, group_name_, current_timestamp_ms());
    std::string error;
    if (!pairings_->save(pairings_path(), error)) {
        LOG_ERROR("Failed to store pairing code: %s", error.c_str());
        return 1;
    }
    std::cout << code << std::endl;
    return 0;
}

int Application::verify_pairing() {
    Group group;
    std::string error;
    bool registered = registry_->register_pairing(*pairings_, pairing_code_,
                                                  config_.get_string("assistant.trigger", "@Andy"),
                                                  current_timestamp_ms(), group, error);

    // The code is consumed either way
    std::string save_error;
    if (!pairings_->save(pairings_path(), save_error)) {
        LOG_WARN("Failed to update pending pairings: %s", save_error.c_str());
    }

    if (!registered) {
        LOG_ERROR("Pairing failed: %s", error.c_str());
        return 1;
    }
    Json j = to_json(group);
    j["jid"] = group.jid;
    std::cout << dump_json(j, 2) << std::endl;
    return 0;
}

int Application::list_pairings() {
    std::vector<PendingSummary> pending = pairings_->pending(current_timestamp_ms());
    Json list = Json::array();
    for (size_t i = 0; i < pending.size(); ++i) {
        Json p;
        p["code"] = pending[i].code;
        p["chatTitle"] = pending[i].chat_title;
        p["expiresInMinutes"] = pending[i].expires_in_minutes;
        list.push_back(p);
    }
    std::cout << dump_json(list, 2) << std::endl;
    return 0;
}

void Application::shutdown() {
    orchestrator_.reset();
    pairings_.reset();
    chats_.reset();
    tasks_.reset();
    registry_.reset();
    LOG_DEBUG("Shutdown complete");
}

} // namespace nanoclaw
