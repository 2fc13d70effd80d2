#include "update_registry.hpp"
#include "logging.hpp"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

UpdateRegistry::UpdateRegistry(const std::string& directory, const UpdateNaming& naming,
                               UpdateFile::Hasher hasher)
    : directory_(directory)
    , naming_(naming)
    , hasher_(std::move(hasher))
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ec = scan_locked())
        throw fs::filesystem_error("cannot list update directory", directory_, ec);
    if (!current_)
        throw NoUpdatesError("No updates found in " + directory_);
}

bool UpdateRegistry::scan() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ec = scan_locked()) {
        UPDATE_SERVER_LOG_WARN("scan failed, serving cached updates",
                               {string_field("directory", directory_), string_field("error", ec.message())});
        return false;
    }
    return true;
}

std::shared_ptr<const UpdateFile> UpdateRegistry::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

size_t UpdateRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::error_code UpdateRegistry::scan_locked() {
    std::error_code ec;
    std::vector<std::string> names;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        auto name = it->path().filename().string();
        std::error_code type_ec;
        if (naming_.matches(name) && it->is_regular_file(type_ec))
            names.push_back(std::move(name));
    }
    if (ec)
        return ec;

    for (auto& name : names) {
        auto path = fs::path(directory_) / name;
        auto cached = cache_.find(name);
        if (cached != cache_.end()) {
            std::error_code stat_ec;
            auto mtime = fs::last_write_time(path, stat_ec);
            auto bytes = stat_ec ? 0 : fs::file_size(path, stat_ec);
            if (!stat_ec && mtime == cached->second->modified_time() && bytes == cached->second->size())
                continue;
        }
        try {
            cache_[name] = std::make_shared<const UpdateFile>(directory_, name, naming_, hasher_);
        } catch (const fs::filesystem_error& e) {
            // removed between listing and stat
            UPDATE_SERVER_LOG_DEBUG("skipping update file", {string_field("file", name), string_field("error", e.what())});
        }
    }

    select_current_locked();
    return {};
}

void UpdateRegistry::select_current_locked() {
    std::shared_ptr<const UpdateFile> best;
    for (const auto& [name, update] : cache_) {
        if (!best || update->modified_time() > best->modified_time()
            || (update->modified_time() == best->modified_time() && name > best->filename()))
            best = update;
    }
    if (best && (!current_ || current_->filename() != best->filename())) {
        UPDATE_SERVER_LOG_INFO("current update", {string_field("file", best->filename()),
                                                  int_field("size", static_cast<std::int64_t>(best->size()))});
    }
    current_ = std::move(best);
}
