#include "Authenticator.hpp"
#include "Log.hpp"
#include "../StreamError.hpp"
#include <nlohmann/json.hpp>
#include <jwt-cpp/jwt.h>
#include <openssl/rand.h>
#include <array>
#include <fstream>

namespace {

std::string randomNonce() {
    std::array<unsigned char, 16> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        throw StreamError(ErrorKind::Authentication, "Authenticator: failed to generate random nonce");
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string nonce;
    nonce.reserve(raw.size() * 2);
    for (unsigned char b : raw) {
        nonce.push_back(kHex[b >> 4]);
        nonce.push_back(kHex[b & 0x0F]);
    }
    return nonce;
}

} // namespace

Authenticator::Authenticator(std::string keyId, std::string privateKey)
    : m_keyId(std::move(keyId))
    , m_privateKey(std::move(privateKey))
{
    if (m_keyId.empty()) {
        throw StreamError(ErrorKind::Authentication, "Authenticator: API key name is empty");
    }
    if (m_privateKey.empty()) {
        throw StreamError(ErrorKind::Authentication, "Authenticator: API secret is empty");
    }
}

Authenticator Authenticator::fromKeyFile(const std::string& keyFile) {
    std::ifstream in(keyFile);
    if (!in.is_open()) {
        throw StreamError(ErrorKind::Authentication, "Authenticator: failed to open key file: " + keyFile);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& ex) {
        throw StreamError(ErrorKind::Authentication,
                          "Authenticator: failed to parse JSON from key file: " + std::string(ex.what()));
    }

    std::string key = j.value("key", "");
    std::string secret = j.value("secret", "");
    if (key.empty()) {
        throw StreamError(ErrorKind::Authentication, "Authenticator: missing 'key' field in " + keyFile);
    }
    if (secret.empty()) {
        throw StreamError(ErrorKind::Authentication, "Authenticator: missing 'secret' field in " + keyFile);
    }

    LOG_I("auth", "loaded API key from {}", keyFile);
    return Authenticator(std::move(key), std::move(secret));
}

std::string Authenticator::createJwt() const {
    const auto now = std::chrono::system_clock::now();
    try {
        return jwt::create()
            .set_subject(m_keyId)                             // sub: key name
            .set_issuer("cdp")
            .set_not_before(now)
            .set_expires_at(now + kTokenLifetime)
            .set_header_claim("kid", jwt::claim(m_keyId))
            .set_header_claim("nonce", jwt::claim(randomNonce()))
            .sign(jwt::algorithm::es256("", m_privateKey));
    } catch (const StreamError&) {
        throw;
    } catch (const std::exception& ex) {
        throw StreamError(ErrorKind::Authentication, std::string("Authenticator: JWT generation failed: ") + ex.what());
    }
}
