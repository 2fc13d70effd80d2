#include "application_ini.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <filesystem>

namespace pt = boost::property_tree;

std::string application_ini_name(const std::string& stamp) {
    return "application_" + stamp + ".ini";
}

ApplicationInfo read_application_ini(const std::string& path) {
    if (!std::filesystem::is_regular_file(path))
        throw MetadataError("missing application ini: " + path);

    pt::ptree tree;
    try {
        pt::read_ini(path, tree);
    } catch (const pt::ini_parser_error& e) {
        throw MetadataError("cannot parse " + path + ": " + e.message());
    }

    auto app = tree.get_child_optional("App");
    if (!app)
        throw MetadataError(path + " has no [App] section");

    // option names are case-insensitive; the last match wins
    auto get = [&](const char* key) {
        const std::string* value = nullptr;
        for (const auto& option : *app) {
            if (boost::algorithm::iequals(option.first, key))
                value = &option.second.data();
        }
        if (!value)
            throw MetadataError(path + " has no App." + key);
        return *value;
    };
    return {get("BuildID"), get("Version")};
}
