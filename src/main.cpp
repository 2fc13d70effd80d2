#include "config.hpp"
#include "http_server.hpp"
#include "logging.hpp"
#include "request_handler.hpp"
#include "update_registry.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    std::optional<ServerConfig> config;
    try {
        config = parse_command_line(argc, argv, std::cout);
    } catch (const ConfigError& e) {
        std::cerr << "update_server: " << e.what() << "\n";
        return 1;
    }
    if (!config)
        return 0;

    init_logging(config->log_level);

    try {
        UpdateRegistry registry(config->directory, naming_for_channel(config->channel));
        RequestHandler handler(registry, config->publish_path());
        UPDATE_SERVER_LOG_INFO("serving updates", {string_field("directory", config->directory),
                                                   string_field("channel", config->channel),
                                                   string_field("path", config->publish_path())});

        std::cout << "http://localhost:" << config->port << "/" << std::endl;
        UpdateServer server(*config, handler);
        server.run();
    } catch (const NoUpdatesError& e) {
        UPDATE_SERVER_LOG_ERROR(e.what());
        shutdown_logging();
        return 1;
    } catch (const std::exception& e) {
        UPDATE_SERVER_LOG_ERROR("fatal", {string_field("error", e.what())});
        shutdown_logging();
        return 1;
    }

    shutdown_logging();
    return 0;
}
