#pragma once
#include "update_registry.hpp"
#include <boost/beast/http.hpp>
#include <map>
#include <string>

namespace http = boost::beast::http;

using http_request = http::request<http::string_body>;
using http_response = http::response<http::string_body>;

std::string url_decode(const std::string& s);
// "a=1&b=2" -> {a: 1, b: 2}; a repeated key keeps its last value.
std::map<std::string, std::string> parse_query(const std::string& query);

// Answers GET / with the manifest of the current update; 404 otherwise.
// Every request rescans the directory first.
class RequestHandler {
public:
    RequestHandler(UpdateRegistry& registry, std::string path);

    http_response handle(const http_request& req);

private:
    http_response make_response(const http_request& req, http::status status, std::string body = {}) const;

    UpdateRegistry& registry_;
    std::string path_;
};
