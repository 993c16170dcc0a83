// include/BridgeErrors.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <type_traits>

enum class LinkError {
    NotConnected = 1,
    OpenFailed,
    Timeout,
    IOError
};

// Benign: unregistering a client twice
enum class RegistryError {
    AlreadyRemoved = 1
};

const boost::system::error_category& linkCategory();
const boost::system::error_category& registryCategory();

boost::system::error_code make_error_code(LinkError e);
boost::system::error_code make_error_code(RegistryError e);

namespace boost {
namespace system {
template <>
struct is_error_code_enum<LinkError> : std::true_type {};
template <>
struct is_error_code_enum<RegistryError> : std::true_type {};
} // namespace system
} // namespace boost
