// src/BridgeErrors.cpp
#include "BridgeErrors.hpp"
#include <string>

namespace {

class LinkCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "serial_link"; }

    std::string message(int ev) const override {
        switch (static_cast<LinkError>(ev)) {
            case LinkError::NotConnected: return "UART port is not connected";
            case LinkError::OpenFailed: return "Failed to open UART port";
            case LinkError::Timeout: return "UART write timed out";
            case LinkError::IOError: return "UART I/O error";
        }
        return "Unknown serial link error";
    }
};

class RegistryCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "client_registry"; }

    std::string message(int ev) const override {
        switch (static_cast<RegistryError>(ev)) {
            case RegistryError::AlreadyRemoved: return "Client already removed";
        }
        return "Unknown registry error";
    }
};

} // namespace

const boost::system::error_category& linkCategory() {
    static LinkCategory category;
    return category;
}

const boost::system::error_category& registryCategory() {
    static RegistryCategory category;
    return category;
}

boost::system::error_code make_error_code(LinkError e) {
    return {static_cast<int>(e), linkCategory()};
}

boost::system::error_code make_error_code(RegistryError e) {
    return {static_cast<int>(e), registryCategory()};
}
