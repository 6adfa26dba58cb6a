#pragma once

#include <string>
#include <core/types.hpp>

// Device-side login and injection surface.
class DeviceEndpoint {
public:
    virtual ~DeviceEndpoint() = default;

    // Returns a session token. Throws AuthError on rejected credentials,
    // TransportError when the device cannot be reached.
    virtual std::string authenticate(const Credentials& credentials) = 0;

    // Upload the artifact and start it. Throws AuthError if the token is
    // refused, TransportError otherwise.
    virtual void deliver_and_trigger(const std::string& token, const std::string& artifact) = 0;
};
