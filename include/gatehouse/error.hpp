#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace gatehouse {

enum class error_code {
  unknown_method,
  validation_error,
  timeout,
  host_unavailable,
  remote_error,
  not_supported,
  registration_error,
  depth_exceeded,
  invalid_request,
  internal,
};

inline std::string_view to_string(error_code code) {
  switch (code) {
  case error_code::unknown_method:
    return "UnknownMethod";
  case error_code::validation_error:
    return "ValidationError";
  case error_code::timeout:
    return "Timeout";
  case error_code::host_unavailable:
    return "HostUnavailable";
  case error_code::remote_error:
    return "RemoteError";
  case error_code::not_supported:
    return "NotSupported";
  case error_code::registration_error:
    return "RegistrationError";
  case error_code::depth_exceeded:
    return "DepthExceeded";
  case error_code::invalid_request:
    return "InvalidRequest";
  case error_code::internal:
    return "Internal";
  }
  return "Internal";
}

/// Unrecognised names map to `fallback`.
inline error_code error_code_from_string(std::string_view name,
                                         error_code fallback = error_code::internal) {
  for (auto code : {error_code::unknown_method, error_code::validation_error,
                    error_code::timeout, error_code::host_unavailable,
                    error_code::remote_error, error_code::not_supported,
                    error_code::registration_error, error_code::depth_exceeded,
                    error_code::invalid_request, error_code::internal}) {
    if (to_string(code) == name) {
      return code;
    }
  }
  return fallback;
}

/// Error raised by every gateway operation that can fail.
/// `what()` is the human-readable message sent back to clients.
class gateway_error : public std::runtime_error {
public:
  gateway_error(error_code code, const std::string &message,
                nlohmann::json data = nullptr)
      : std::runtime_error(message), code_(code), data_(std::move(data)) {}

  error_code code() const { return code_; }
  const nlohmann::json &data() const { return data_; }

private:
  error_code code_;
  nlohmann::json data_;
};

inline gateway_error unknown_method_error(const std::string &method) {
  return gateway_error(error_code::unknown_method,
                       "No extension found for method: " + method,
                       {{"method", method}});
}

} // namespace gatehouse
