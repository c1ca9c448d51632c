// gedcom/record/lookup_result.hpp - Result type for record accessors
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace gedcom
{

// ============================================================================
// Error Types
// ============================================================================

/**
 * Why an accessor could not produce a value.
 */
enum class LookupError : uint8_t {
  NotFound,             ///< the child record or field is absent
  UnresolvedReference,  ///< a pointer names no record, or a record of the wrong kind
  OutOfRange,           ///< positional access past the end
  MalformedValue,       ///< the value exists but cannot be interpreted
};

[[nodiscard]] constexpr std::string_view to_string(LookupError error) noexcept
{
  switch (error) {
    case LookupError::NotFound:
      return "not found";
    case LookupError::UnresolvedReference:
      return "unresolved reference";
    case LookupError::OutOfRange:
      return "out of range";
    case LookupError::MalformedValue:
      return "malformed value";
  }
  return "unknown";
}

struct LookupFailureInfo
{
  LookupError kind = LookupError::NotFound;
  std::string message;
};

/**
 * Thrown by LookupResult::value() when the result holds a failure.
 */
class LookupFailure : public std::runtime_error
{
public:
  explicit LookupFailure(const LookupFailureInfo & info)
  : std::runtime_error(std::string(to_string(info.kind)) + ": " + info.message), kind_(info.kind)
  {
  }

  [[nodiscard]] LookupError kind() const noexcept { return kind_; }

private:
  LookupError kind_;
};

// ============================================================================
// LookupResult
// ============================================================================

/**
 * Either the value an accessor computed or the reason it could not.
 *
 * @code
 *   auto birth = person->birth();
 *   if (birth) {
 *     auto date = (*birth)->date();
 *   } else if (birth.error() == LookupError::NotFound) {
 *     ...
 *   }
 * @endcode
 */
template <typename T>
class LookupResult
{
public:
  using ValueType = T;

  LookupResult(T value) : data_(std::move(value)) {}  // NOLINT(google-explicit-constructor)

  LookupResult(LookupFailureInfo failure)  // NOLINT(google-explicit-constructor)
  : data_(std::move(failure))
  {
  }

  [[nodiscard]] static LookupResult failure(LookupError kind, std::string message)
  {
    return LookupResult(LookupFailureInfo{kind, std::move(message)});
  }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  explicit operator bool() const { return has_value(); }

  /// The value; throws LookupFailure when the lookup failed
  [[nodiscard]] const T & value() const &
  {
    if (!has_value()) {
      throw LookupFailure(std::get<LookupFailureInfo>(data_));
    }
    return std::get<T>(data_);
  }

  [[nodiscard]] T value_or(T fallback) const
  {
    return has_value() ? std::get<T>(data_) : std::move(fallback);
  }

  /// Failure kind (undefined behavior if has_value())
  [[nodiscard]] LookupError error() const { return std::get<LookupFailureInfo>(data_).kind; }

  [[nodiscard]] const std::string & message() const
  {
    return std::get<LookupFailureInfo>(data_).message;
  }

  /// The failure, for forwarding into a result of another type
  [[nodiscard]] const LookupFailureInfo & failure_info() const
  {
    return std::get<LookupFailureInfo>(data_);
  }

  const T * operator->() const { return &value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, LookupFailureInfo> data_;
};

}  // namespace gedcom
