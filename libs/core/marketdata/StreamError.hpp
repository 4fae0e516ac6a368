#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    Connection,      // transport failed to establish, dropped, or a write failed
    Protocol,        // frame could not be parsed, or the provider sent an error frame
    Caller,          // disabled endpoint, not connected, invalid configuration
    Authentication,  // signing provider missing or failed
};

inline const char* toString(ErrorKind k) {
    switch (k) {
        case ErrorKind::Connection:     return "connection";
        case ErrorKind::Protocol:       return "protocol";
        case ErrorKind::Caller:         return "caller";
        case ErrorKind::Authentication: return "authentication";
    }
    return "unknown";
}

class StreamError : public std::runtime_error {
public:
    StreamError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what)
        , m_kind(kind)
    {}

    [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};
