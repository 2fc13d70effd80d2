#pragma once
#include <stdexcept>
#include <string>

// Raised when an application_<stamp>.ini companion is missing or incomplete.
class MetadataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ApplicationInfo {
    std::string build_id;
    std::string version;
};

std::string application_ini_name(const std::string& stamp);

// Reads App.BuildID and App.Version from an application.ini file.
ApplicationInfo read_application_ini(const std::string& path);
