#pragma once
#include <stdexcept>
#include <string>

namespace core::types {

    enum class ErrorKind {
        Configuration,
        NotFound,
        Connectivity,
        Transfer,
        Protocol,
        Timeout
    };

    inline std::string toString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Configuration: return "configuration";
            case ErrorKind::NotFound: return "not_found";
            case ErrorKind::Connectivity: return "connectivity";
            case ErrorKind::Transfer: return "transfer";
            case ErrorKind::Protocol: return "protocol";
            case ErrorKind::Timeout: return "timeout";
        }
        return "unknown";
    }

    class PrinterLinkException : public std::runtime_error {
    public:
        PrinterLinkException(ErrorKind kind, const std::string &msg)
            : std::runtime_error(msg), kind_(kind) {}

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    /**
     * @brief Address, access code or serial missing. Raised before any network call.
     */
    class ConfigurationException : public PrinterLinkException {
    public:
        explicit ConfigurationException(const std::string &msg)
            : PrinterLinkException(ErrorKind::Configuration, msg) {}
    };

    class NotFoundException : public PrinterLinkException {
    public:
        explicit NotFoundException(const std::string &path)
            : PrinterLinkException(ErrorKind::NotFound, "File not found: " + path) {}
    };

    class ConnectivityException : public PrinterLinkException {
    public:
        explicit ConnectivityException(const std::string &msg)
            : PrinterLinkException(ErrorKind::Connectivity, msg) {}
    };

    class TransferException : public PrinterLinkException {
    public:
        explicit TransferException(const std::string &msg)
            : PrinterLinkException(ErrorKind::Transfer, msg) {}
    };

    /**
     * @brief Undecodable frame or payload. Never leaves the component that decoded it.
     */
    class ProtocolException : public PrinterLinkException {
    public:
        explicit ProtocolException(const std::string &msg)
            : PrinterLinkException(ErrorKind::Protocol, msg) {}
    };

    class TimeoutException : public PrinterLinkException {
    public:
        TimeoutException() : PrinterLinkException(ErrorKind::Timeout, "Timeout waiting for response") {}

        explicit TimeoutException(const std::string &msg)
            : PrinterLinkException(ErrorKind::Timeout, msg) {}
    };

}
