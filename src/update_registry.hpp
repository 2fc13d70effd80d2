#pragma once
#include "update_file.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>

class NoUpdatesError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Cache of the update files seen in one directory, plus the current one
// (greatest modification time, ties going to the greatest filename).
// Entries are never evicted, even after their file is deleted.
class UpdateRegistry {
public:
    // Scans once. Throws std::filesystem::filesystem_error if the directory
    // cannot be listed and NoUpdatesError if it holds no update files.
    UpdateRegistry(const std::string& directory, const UpdateNaming& naming,
                   UpdateFile::Hasher hasher = {});

    // Rescans the directory. Returns false if it could not be listed, in
    // which case the cache and current update are left as they were.
    bool scan();

    std::shared_ptr<const UpdateFile> current() const;
    size_t size() const;
    const std::string& directory() const { return directory_; }
    const UpdateNaming& naming() const { return naming_; }

private:
    std::error_code scan_locked();
    void select_current_locked();

    std::string directory_;
    UpdateNaming naming_;
    UpdateFile::Hasher hasher_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const UpdateFile>> cache_;
    std::shared_ptr<const UpdateFile> current_;
};
