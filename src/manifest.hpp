#pragma once
#include "update_file.hpp"
#include <optional>
#include <string>

struct ManifestQuery {
    std::optional<std::string> dogfood_id;
};

// Builds the update.xml document pointing clients at `update`, which is
// published under http://update.boot2gecko.org/<path>/. Resolves the
// update's hash and application ini; MetadataError propagates.
std::string render_manifest(const UpdateFile& update, const std::string& path,
                            const ManifestQuery& query = {});

std::string xml_escape(const std::string& value);
