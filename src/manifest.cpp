#include "manifest.hpp"
#include <sstream>

std::string xml_escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out += c;
        }
    }
    return out;
}

std::string render_manifest(const UpdateFile& update, const std::string& path,
                            const ManifestQuery& query) {
    const auto& app = update.application();
    auto version = xml_escape(app.version);

    std::string query_suffix;
    if (query.dogfood_id)
        query_suffix = "?dogfooding_prerelease_id=" + *query.dogfood_id;

    std::ostringstream out;
    out << "<?xml version=\"1.0\"?>\n"
        << "<updates>\n"
        << "  <update type=\"minor\" appVersion=\"" << version << "\" version=\"" << version
        << "\" extensionVersion=\"" << version << "\" buildID=\"" << xml_escape(app.build_id)
        << "\" licenseURL=\"http://www.mozilla.com/test/sample-eula.html\""
        << " detailsURL=\"http://www.mozilla.com/test/sample-details.html\">\n"
        << "    <patch type=\"complete\" URL=\"http://update.boot2gecko.org/"
        << xml_escape(path + "/" + update.filename() + query_suffix)
        << "\" hashFunction=\"SHA512\" hashValue=\"" << update.hash()
        << "\" size=\"" << update.size() << "\"/>\n"
        << "  </update>\n"
        << "</updates>";
    return out.str();
}
