#pragma once
#include <string>

// Signing provider for the authenticated endpoint. createJwt() returns an
// opaque bearer token or throws.
class IAuthenticator {
public:
    virtual ~IAuthenticator() = default;
    [[nodiscard]] virtual std::string createJwt() const = 0;
};
