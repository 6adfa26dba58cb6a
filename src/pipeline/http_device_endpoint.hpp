#pragma once

#include <memory>
#include <string>
#include <net/http_transport.hpp>
#include "device_endpoint.hpp"

// Form-login + bearer-token upload over a Transport.
class HttpDeviceEndpoint : public DeviceEndpoint {
public:
    HttpDeviceEndpoint(std::shared_ptr<Transport> transport, EndpointConfig paths = {});

    std::string authenticate(const Credentials& credentials) override;
    void deliver_and_trigger(const std::string& token, const std::string& artifact) override;

    // Pull the token out of a JSON login reply. Throws AuthError.
    static std::string parse_token(const std::string& body);

private:
    std::shared_ptr<Transport> transport_;
    EndpointConfig paths_;
};
