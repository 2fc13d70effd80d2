#pragma once
#include "application_ini.hpp"
#include "lazy.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

// Filename convention of one update channel: <prefix><stamp><suffix>.
struct UpdateNaming {
    std::string prefix;
    std::string suffix = ".mar";

    bool matches(const std::string& filename) const;
    // Throws std::invalid_argument if the filename does not match.
    std::string stamp(const std::string& filename) const;
};

UpdateNaming naming_for_channel(const std::string& channel);

// One .mar file seen in the watched directory. Size and modification time
// are read once at construction; the hash and the companion application ini
// are resolved on first use and kept for the lifetime of the object, even if
// the file is rewritten in place afterwards.
class UpdateFile {
public:
    using Hasher = std::function<std::string(const std::string& path)>;

    UpdateFile(const std::string& directory, const std::string& filename,
               const UpdateNaming& naming, Hasher hasher = {});

    UpdateFile(const UpdateFile&) = delete;
    UpdateFile& operator=(const UpdateFile&) = delete;

    const std::string& directory() const { return directory_; }
    const std::string& filename() const { return filename_; }
    const std::string& path() const { return path_; }
    const std::string& stamp() const { return stamp_; }
    std::filesystem::file_time_type modified_time() const { return modified_time_; }
    std::uintmax_t size() const { return size_; }

    // Hex SHA-512 of the file content.
    const std::string& hash() const;
    // Throws MetadataError if application_<stamp>.ini is missing or incomplete.
    const ApplicationInfo& application() const;

    bool hash_resolved() const { return hash_.resolved(); }
    bool application_resolved() const { return application_.resolved(); }

private:
    std::string directory_;
    std::string filename_;
    std::string path_;
    std::string stamp_;
    std::filesystem::file_time_type modified_time_;
    std::uintmax_t size_;
    Hasher hasher_;

    mutable Lazy<std::string> hash_;
    mutable Lazy<ApplicationInfo> application_;
};
