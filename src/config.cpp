#include "config.hpp"
#include "logging.hpp"
#include "update_file.hpp"
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;
namespace po = boost::program_options;
using json = nlohmann::json;

std::string ServerConfig::publish_path() const {
    if (!path.empty())
        return path;
    auto dir = fs::absolute(directory).lexically_normal();
    if (!dir.has_filename())
        dir = dir.parent_path();
    return dir.filename().string();
}

void ServerConfig::validate() const {
    if (port == 0)
        throw ConfigError("port must be between 1 and 65535");
    if (threads < 1 || threads > kMaxThreads)
        throw ConfigError("threads must be between 1 and " + std::to_string(kMaxThreads));
    if (!is_log_level(log_level))
        throw ConfigError("unknown log level: " + log_level);
    if (directory.empty())
        throw ConfigError("directory must not be empty");
    try {
        naming_for_channel(channel);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

ServerConfig default_config() {
    ServerConfig config;
    config.directory = fs::current_path().string();
    return config;
}

namespace {

unsigned short to_port(long long value) {
    if (value < 1 || value > std::numeric_limits<unsigned short>::max())
        throw ConfigError("port out of range: " + std::to_string(value));
    return static_cast<unsigned short>(value);
}

} // namespace

void apply_config_json(ServerConfig& config, const json& j) {
    if (!j.is_object())
        throw ConfigError("config must be a JSON object");
    try {
        if (j.contains("host")) config.host = j.at("host").get<std::string>();
        if (j.contains("port")) config.port = to_port(j.at("port").get<long long>());
        if (j.contains("directory")) config.directory = j.at("directory").get<std::string>();
        if (j.contains("path")) config.path = j.at("path").get<std::string>();
        if (j.contains("channel")) config.channel = j.at("channel").get<std::string>();
        if (j.contains("threads")) config.threads = j.at("threads").get<int>();
        if (j.contains("log_level")) config.log_level = j.at("log_level").get<std::string>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("bad config value: ") + e.what());
    }
}

void load_config_file(ServerConfig& config, const std::string& file) {
    std::ifstream in(file);
    if (!in)
        throw ConfigError("cannot open config file " + file);
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse " + file + ": " + e.what());
    }
    apply_config_json(config, j);
}

std::optional<ServerConfig> parse_command_line(int argc, const char* const argv[], std::ostream& out) {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "show this help")
        ("config", po::value<std::string>(), "JSON config file")
        ("port,p", po::value<long long>(), "port to serve on (default 8080)")
        ("directory,d", po::value<std::string>(), "directory of update files (default: cwd)")
        ("path", po::value<std::string>(), "URL path the updates are published under")
        ("channel", po::value<std::string>(), "update channel: nightly or stable")
        ("host", po::value<std::string>(), "address to bind (default 0.0.0.0)")
        ("threads", po::value<int>(), "worker threads")
        ("log-level", po::value<std::string>(), "trace, debug, info, warn, error");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }

    if (vm.count("help")) {
        out << "Usage: update_server [options]\n" << desc;
        return std::nullopt;
    }

    auto config = default_config();
    if (vm.count("config"))
        load_config_file(config, vm["config"].as<std::string>());

    if (vm.count("port")) config.port = to_port(vm["port"].as<long long>());
    if (vm.count("directory")) config.directory = vm["directory"].as<std::string>();
    if (vm.count("path")) config.path = vm["path"].as<std::string>();
    if (vm.count("channel")) config.channel = vm["channel"].as<std::string>();
    if (vm.count("host")) config.host = vm["host"].as<std::string>();
    if (vm.count("threads")) config.threads = vm["threads"].as<int>();
    if (vm.count("log-level")) config.log_level = vm["log-level"].as<std::string>();

    config.validate();
    return config;
}
