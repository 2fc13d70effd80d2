#include "request_handler.hpp"
#include "logging.hpp"
#include "manifest.hpp"
#include <cctype>

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size()
                   && std::isxdigit(static_cast<unsigned char>(s[i + 1]))
                   && std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t start = 0;
    while (start <= query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos)
            end = query.size();
        auto pair = query.substr(start, end - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string::npos)
                params[url_decode(pair)] = "";
            else
                params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
        start = end + 1;
    }
    return params;
}

RequestHandler::RequestHandler(UpdateRegistry& registry, std::string path)
    : registry_(registry)
    , path_(std::move(path))
{
}

http_response RequestHandler::handle(const http_request& req) {
    if (!registry_.scan())
        UPDATE_SERVER_LOG_DEBUG("rescan failed, using cached state");

    std::string target(req.target().data(), req.target().size());
    auto qpos = target.find('?');
    if (req.method() != http::verb::get || target.substr(0, qpos) != "/") {
        UPDATE_SERVER_LOG_DEBUG("not found", {string_field("method", std::string(req.method_string().data(), req.method_string().size())),
                                              string_field("target", target)});
        return make_response(req, http::status::not_found);
    }

    auto update = registry_.current();
    if (!update)
        return make_response(req, http::status::not_found);

    ManifestQuery query;
    if (qpos != std::string::npos) {
        auto params = parse_query(target.substr(qpos + 1));
        auto dogfood = params.find("dogfood_id");
        if (dogfood != params.end() && !dogfood->second.empty())
            query.dogfood_id = dogfood->second;
    }

    std::string body;
    try {
        body = render_manifest(*update, path_, query);
    } catch (const std::exception& e) {
        UPDATE_SERVER_LOG_ERROR("cannot render manifest", {string_field("file", update->filename()),
                                                           string_field("error", e.what())});
        return make_response(req, http::status::internal_server_error);
    }

    UPDATE_SERVER_LOG_DEBUG("served manifest", {string_field("file", update->filename()),
                                                bool_field("dogfood", query.dogfood_id.has_value())});
    auto res = make_response(req, http::status::ok, std::move(body));
    res.set(http::field::content_type, "text/xml");
    return res;
}

http_response RequestHandler::make_response(const http_request& req, http::status status, std::string body) const {
    http_response res{status, req.version()};
    res.set(http::field::server, "update_server");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}
