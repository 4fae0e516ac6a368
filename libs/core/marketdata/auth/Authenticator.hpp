/*
Slipstream — Authenticator
Role: Creates signed JSON Web Tokens (JWTs) for the authenticated WebSocket endpoint.
Inputs/Outputs: API key name and EC private key (inline or from 'key.json'); outputs a signed JWT string.
Threading: createJwt() is const and keeps no state between calls; safe from any thread.
Performance: JWT creation is a cryptographic operation, performed once per user-channel control frame.
Integration: Passed to StreamingClient as a shared IAuthenticator.
Observability: Logs key-file loading under the "auth" category.
Related: Authenticator.cpp, IAuthenticator.hpp, StreamingClient.hpp.
Assumptions: The secret is a PEM-encoded EC key usable for ES256.
*/
#pragma once
#include "IAuthenticator.hpp"
#include <chrono>
#include <string>

class Authenticator : public IAuthenticator {
public:
    // Token lifetime accepted by the service.
    static constexpr std::chrono::seconds kTokenLifetime{120};

    Authenticator(std::string keyId, std::string privateKey);

    /// Loads {"key": ..., "secret": ...} from a JSON file. Throws on missing fields.
    static Authenticator fromKeyFile(const std::string& keyFile = "key.json");

    /// Return a freshly-signed ES256 JWT.  Throws on failure.
    [[nodiscard]] std::string createJwt() const override;

    const std::string& keyId() const { return m_keyId; }

    // Non-copyable, movable.
    Authenticator(const Authenticator&)            = delete;
    Authenticator& operator=(const Authenticator&) = delete;
    Authenticator(Authenticator&&)                 = default;
    Authenticator& operator=(Authenticator&&)      = default;

private:
    std::string m_keyId;        // kid / sub
    std::string m_privateKey;   // PEM (ES256)
};
