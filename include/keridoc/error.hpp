/**
 * @file error.hpp
 * @brief Error classes and exception hierarchy for DID synthesis and parsing
 */

#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace keridoc {

/**
 * @brief Error codes for programmatic error handling
 */
enum class DidErrorCode : uint32_t {
  SUCCESS = 0,
  INVALID_DID_FORMAT = 1000,
  INVALID_IDENTIFIER = 1001,
  INVALID_BASE64 = 1002,
  MISMATCHED_IDENTIFIER = 2000,
  UNKNOWN_IDENTIFIER = 2001,
  INVALID_POLICY = 3000,
  INVALID_KEY_MATERIAL = 3001,
  EMPTY_DOCUMENT = 4000,
  MISSING_DOCUMENT_FIELD = 4001
};

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(DidErrorCode code) noexcept {
  switch (code) {
    case DidErrorCode::SUCCESS:
      return "Success";
    case DidErrorCode::INVALID_DID_FORMAT:
      return "Invalid DID format";
    case DidErrorCode::INVALID_IDENTIFIER:
      return "Invalid identifier prefix";
    case DidErrorCode::INVALID_BASE64:
      return "Invalid base64 encoding";
    case DidErrorCode::MISMATCHED_IDENTIFIER:
      return "DID does not contain the expected identifier";
    case DidErrorCode::UNKNOWN_IDENTIFIER:
      return "Unknown identifier";
    case DidErrorCode::INVALID_POLICY:
      return "Invalid signing policy";
    case DidErrorCode::INVALID_KEY_MATERIAL:
      return "Invalid key material";
    case DidErrorCode::EMPTY_DOCUMENT:
      return "Empty DID document";
    case DidErrorCode::MISSING_DOCUMENT_FIELD:
      return "Missing DID document field";
    default:
      return "Unknown error";
  }
}

/**
 * @brief Base exception class for all keridoc errors
 */
class DidError : public std::runtime_error {
 public:
  /**
   * @brief Construct an error with message and error code
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit DidError(DidErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  /**
   * @brief Get the error code
   * @return The error code
   */
  [[nodiscard]] DidErrorCode errorCode() const noexcept { return error_code_; }

 private:
  DidErrorCode error_code_;
};

/**
 * @brief Exception for DID strings that match none of the accepted grammars
 *
 * Carries the offending DID and the grammar it was checked against so callers
 * can render a diagnostic without re-parsing.
 */
class InvalidDidFormatError : public DidError {
 public:
  InvalidDidFormatError(std::string_view did, std::string_view expected)
      : InvalidDidFormatError(DidErrorCode::INVALID_DID_FORMAT, did, expected,
                              "is not a valid") {}

  [[nodiscard]] const std::string& did() const noexcept { return did_; }
  [[nodiscard]] const std::string& expected() const noexcept {
    return expected_;
  }

 protected:
  InvalidDidFormatError(DidErrorCode code, std::string_view subject,
                        std::string_view expected, std::string_view verb)
      : DidError(code, std::string(subject) + " " + std::string(verb) + " " +
                           std::string(expected)),
        did_(subject),
        expected_(expected) {}

 private:
  std::string did_;
  std::string expected_;
};

/**
 * @brief Exception for identifier segments that fail the prefix grammar
 *
 * Derives from InvalidDidFormatError: a DID whose identifier is malformed is
 * itself malformed.
 */
class InvalidIdentifierError : public InvalidDidFormatError {
 public:
  InvalidIdentifierError(std::string_view identifier, std::string_view reason)
      : InvalidDidFormatError(DidErrorCode::INVALID_IDENTIFIER, identifier,
                              reason, "is an invalid identifier:") {}

  [[nodiscard]] const std::string& identifier() const noexcept { return did(); }
};

class InvalidBase64Error : public DidError {
 public:
  explicit InvalidBase64Error(std::string_view details)
      : DidError(
            DidErrorCode::INVALID_BASE64,
            std::string("Invalid base64 encoding: ") + std::string(details)) {}
};

/**
 * @brief Exception for a DID whose embedded identifier differs from the one
 * the caller asserted
 */
class MismatchedIdentifierError : public DidError {
 public:
  MismatchedIdentifierError(std::string_view did, std::string_view identifier)
      : DidError(DidErrorCode::MISMATCHED_IDENTIFIER,
                 std::string(did) + " does not contain identifier " +
                     std::string(identifier)) {}
};

/**
 * @brief Exception for identifiers without key state
 */
class UnknownIdentifierError : public DidError {
 public:
  UnknownIdentifierError(std::string_view identifier, std::string_view did)
      : DidError(DidErrorCode::UNKNOWN_IDENTIFIER,
                 std::string("Unknown identifier ") + std::string(identifier) +
                     " for " + std::string(did)),
        identifier_(identifier) {}

  [[nodiscard]] const std::string& identifier() const noexcept {
    return identifier_;
  }

 private:
  std::string identifier_;
};

class InvalidPolicyError : public DidError {
 public:
  explicit InvalidPolicyError(std::string_view details)
      : DidError(
            DidErrorCode::INVALID_POLICY,
            std::string("Invalid signing policy: ") + std::string(details)) {}
};

class InvalidKeyMaterialError : public DidError {
 public:
  explicit InvalidKeyMaterialError(std::string_view details)
      : DidError(DidErrorCode::INVALID_KEY_MATERIAL,
                 std::string("Invalid key material: ") + std::string(details)) {
  }
};

class EmptyDocumentError : public DidError {
 public:
  explicit EmptyDocumentError(std::string_view details)
      : DidError(DidErrorCode::EMPTY_DOCUMENT,
                 std::string("Empty DID document: ") + std::string(details)) {}
};

class MissingDocumentFieldError : public DidError {
 public:
  explicit MissingDocumentFieldError(std::string_view field)
      : DidError(DidErrorCode::MISSING_DOCUMENT_FIELD,
                 std::string("Expected '") + std::string(field) +
                     "' in DID document JSON"),
        field_(field) {}

  [[nodiscard]] const std::string& field() const noexcept { return field_; }

 private:
  std::string field_;
};

/**
 * @brief Result type for callers that prefer not to use exceptions
 * Inspired by Rust's Result and C++23's std::expected
 *
 * error() returns the stored E, so a derived exception is sliced to its
 * base there. When the result was built from a caught exception, value()
 * rethrows that exception with its dynamic type intact.
 */
template <typename T, typename E = DidError>
class Result {
 public:
  Result(const T& value) : data_(value) {}
  Result(T&& value) : data_(std::move(value)) {}
  Result(const E& error) : data_(error) {}
  Result(E&& error) : data_(std::move(error)) {}

  static Result success(T value) { return Result(std::move(value)); }
  static Result error(E error) { return Result(std::move(error)); }

  /// Error result that keeps the exception being handled for value()
  static Result error(E error, std::exception_ptr original) {
    Result result(std::move(error));
    result.original_ = std::move(original);
    return result;
  }

  bool isSuccess() const noexcept { return std::holds_alternative<T>(data_); }
  bool isError() const noexcept { return std::holds_alternative<E>(data_); }
  explicit operator bool() const noexcept { return isSuccess(); }

  // Value access (throws the original exception, else the stored error)
  const T& value() const& {
    if (isError()) {
      throwError();
    }
    return std::get<T>(data_);
  }

  T&& value() && {
    if (isError()) {
      throwError();
    }
    return std::move(std::get<T>(data_));
  }

  const T& valueOr(const T& defaultValue) const& noexcept {
    return isSuccess() ? std::get<T>(data_) : defaultValue;
  }

  const E& error() const& {
    if (isSuccess()) {
      throw std::logic_error("Accessing error on successful result");
    }
    return std::get<E>(data_);
  }

 private:
  [[noreturn]] void throwError() const {
    if (original_) {
      std::rethrow_exception(original_);
    }
    throw std::get<E>(data_);
  }

  std::variant<T, E> data_;
  std::exception_ptr original_;
};

template <typename T>
using DidResult = Result<T, DidError>;

}  // namespace keridoc
