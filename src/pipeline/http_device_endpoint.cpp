#include "http_device_endpoint.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>

HttpDeviceEndpoint::HttpDeviceEndpoint(std::shared_ptr<Transport> transport, EndpointConfig paths)
    : transport_(std::move(transport)), paths_(std::move(paths)) {}

std::string HttpDeviceEndpoint::parse_token(const std::string& body) {
    // JSON is a YAML subset, so yaml-cpp reads the reply
    YAML::Node root;
    try {
        root = YAML::Load(body);
    } catch (const YAML::Exception& e) {
        throw AuthError(fmt::format("login reply is not JSON: {}", e.msg));
    }
    if (!root.IsMap()) throw AuthError("login reply is not a JSON object");

    if (root["code"]) {
        int code = root["code"].as<int>(-1);
        if (code != 0) {
            std::string msg = root["msg"] ? root["msg"].as<std::string>("") : std::string();
            throw AuthError(msg.empty() ? fmt::format("login refused (code {})", code)
                                        : fmt::format("login refused (code {}): {}", code, msg));
        }
    }

    std::string token = root["token"] ? root["token"].as<std::string>("") : std::string();
    if (token.empty()) throw AuthError("login reply carries no token");
    return token;
}

std::string HttpDeviceEndpoint::authenticate(const Credentials& credentials) {
    auto req = HttpRequest::post(paths_.auth_path,
                                 form_encode({{"username", credentials.username},
                                              {"password", credentials.password}}),
                                 "application/x-www-form-urlencoded",
                                 true);   // a repeated login is harmless
    auto resp = transport_->send(req);

    if (resp.status_code == 401 || resp.status_code == 403) {
        throw AuthError(fmt::format("login as '{}' rejected (HTTP {})",
                                    credentials.username, resp.status_code));
    }
    if (!resp.ok()) {
        throw TransportError(fmt::format("POST {}: unexpected HTTP {}", paths_.auth_path, resp.status_code));
    }
    return parse_token(resp.body);
}

void HttpDeviceEndpoint::deliver_and_trigger(const std::string& token, const std::string& artifact) {
    auto req = HttpRequest::post(paths_.deliver_path, artifact, "application/gzip");
    req.headers["Authorization"] = "Bearer " + token;

    rprov_log(fmt::format("endpoint: uploading {} bytes to {}", artifact.size(), paths_.deliver_path));
    auto resp = transport_->send(req);

    if (resp.status_code == 401 || resp.status_code == 403) {
        throw AuthError(fmt::format("token refused on delivery (HTTP {})", resp.status_code));
    }
    if (!resp.ok()) {
        throw TransportError(fmt::format("POST {}: unexpected HTTP {}", paths_.deliver_path, resp.status_code));
    }
}
