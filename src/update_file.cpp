#include "update_file.hpp"
#include "crypto.hpp"
#include <stdexcept>

namespace fs = std::filesystem;

bool UpdateNaming::matches(const std::string& filename) const {
    return filename.size() >= prefix.size() + suffix.size()
        && filename.compare(0, prefix.size(), prefix) == 0
        && filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string UpdateNaming::stamp(const std::string& filename) const {
    if (!matches(filename))
        throw std::invalid_argument(filename + " is not named " + prefix + "<stamp>" + suffix);
    return filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
}

UpdateNaming naming_for_channel(const std::string& channel) {
    if (channel == "nightly")
        return {"b2g_update_", ".mar"};
    if (channel == "stable")
        return {"b2g_stable_update_", ".mar"};
    throw std::invalid_argument("unknown update channel: " + channel);
}

UpdateFile::UpdateFile(const std::string& directory, const std::string& filename,
                       const UpdateNaming& naming, Hasher hasher)
    : directory_(directory)
    , filename_(filename)
    , path_((fs::path(directory) / filename).string())
    , stamp_(naming.stamp(filename))
    , modified_time_(fs::last_write_time(path_))
    , size_(fs::file_size(path_))
    , hasher_(std::move(hasher))
{
    if (!hasher_) {
        hasher_ = [](const std::string& path) { return hex_encode(sha512_file(path)); };
    }
}

const std::string& UpdateFile::hash() const {
    return hash_.get([this] { return hasher_(path_); });
}

const ApplicationInfo& UpdateFile::application() const {
    return application_.get([this] {
        return read_application_ini((fs::path(directory_) / application_ini_name(stamp_)).string());
    });
}
