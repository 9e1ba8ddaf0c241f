#pragma once

#include "networking/HttpServer.h"
#include "store/StoreGateway.h"

#include <boost/json/object.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace livestate::api {

// Stateless request handler of the HTTP service. Every mutating request is
// exactly one gateway write; nothing here waits on socket delivery.
//
//   GET  /health
//   GET  /resources/{id}
//   PUT  /resources/{id}   JSON or form-encoded body, optional If-Match
//   POST /resources/{id}   same as PUT
class ResourceHandler {
public:
    explicit ResourceHandler(store::StoreGateway& gateway) : gateway_(gateway) {}

    networking::HttpResponse operator()(const networking::HttpRequest& req);

private:
    networking::HttpResponse read_resource(const networking::HttpRequest& req, const std::string& resource);
    networking::HttpResponse write_resource(const networking::HttpRequest& req, const std::string& resource);

    store::StoreGateway& gateway_;
};

// "a=1&b=x+y" -> {"a":"1","b":"x y"}; nullopt when a pair has no '='.
std::optional<boost::json::object> parse_form(std::string_view body);

// Percent-decoding with '+' as space.
std::string url_decode(std::string_view s);

} // namespace livestate::api
