#pragma once

#include <waypoint/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace waypoint::common {

enum class error_code : uint32_t {
  validation = 1,
  stale_authorization = 2,
  watermark_timeout = 3,
  cancelled = 4,
  execution_revert = 5,
  transport = 6,
  rpc = 7,
  signature = 8,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"validation",
                                            error_code::validation},
    std::pair<std::string_view, error_code>{"stale_authorization",
                                            error_code::stale_authorization},
    std::pair<std::string_view, error_code>{"watermark_timeout",
                                            error_code::watermark_timeout},
    std::pair<std::string_view, error_code>{"cancelled",
                                            error_code::cancelled},
    std::pair<std::string_view, error_code>{"execution_revert",
                                            error_code::execution_revert},
    std::pair<std::string_view, error_code>{"transport",
                                            error_code::transport},
    std::pair<std::string_view, error_code>{"rpc", error_code::rpc},
    std::pair<std::string_view, error_code>{"signature",
                                            error_code::signature}};

}  // namespace waypoint::common

namespace waypoint::schema {

template <>
struct enum_names<waypoint::common::error_code> {
  static constexpr auto kMappings = waypoint::common::kErrorCodeMappings;
};

}  // namespace waypoint::schema

namespace waypoint::common {

inline constexpr std::string_view to_string(const error_code value) {
  return waypoint::schema::to_string(value);
}

/// Failure raised by every protocol component.
///
/// `detail` carries diagnostic payload that is not part of the message, such
/// as an HTTP response body for `error_code::transport`.
class error final : public std::runtime_error {
 public:
  error(error_code code, const std::string& message, std::string detail = {})
      : std::runtime_error(message), code_(code), detail_(std::move(detail)) {}

  error_code code() const noexcept { return code_; }
  const std::string& detail() const noexcept { return detail_; }

 private:
  error_code code_;
  std::string detail_;
};

[[noreturn]] inline void raise(error_code code,
                               const std::string& message,
                               std::string detail = {}) {
  throw error{code, message, std::move(detail)};
}

}  // namespace waypoint::common
