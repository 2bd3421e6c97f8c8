/*
 * nanoclaw C++ - multi-tenant agent sandbox orchestrator
 *
 * Usage:
 *   echo "prompt" | ./nanoclaw --group main
 *
 * Configuration is read from config.json (or --config FILE).
 */
#include <nanoclaw/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = nanoclaw::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.is_running() ? 1 : 0;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
