#pragma once
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

constexpr int kMaxThreads = 256;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 8080;
    std::string directory;
    // URL segment the updates are published under; empty means the last
    // component of `directory`.
    std::string path;
    std::string channel = "nightly";
    int threads = 1;
    std::string log_level = "info";

    std::string publish_path() const;
    void validate() const;
};

// Defaults, with the current working directory as the update directory.
ServerConfig default_config();

// Overlays the keys present in a JSON object; unknown keys are ignored.
void apply_config_json(ServerConfig& config, const nlohmann::json& j);
void load_config_file(ServerConfig& config, const std::string& file);

// Defaults < --config file < flags. Returns nullopt after printing usage
// for --help. Throws ConfigError on bad flags or values.
std::optional<ServerConfig> parse_command_line(int argc, const char* const argv[], std::ostream& out);
