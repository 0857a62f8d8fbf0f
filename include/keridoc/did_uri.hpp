/**
 * @file did_uri.hpp
 * @brief Parsing and canonical re-encoding of did:keri, did:web and did:webs
 *
 * Grammar accepted for the web schemes (scheme matched case-insensitively):
 *
 *   did:web[s]:<domain>[%3A<port>][:<segment>]*:<identifier>[?<query>]
 *
 * The domain may not contain '%' or ':'. The port separator is percent
 * encoded in canonical form; the legacy form with a bare ':' is only accepted
 * by parseLegacyUnencodedPort() and reEncode(), which rewrite it.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "error.hpp"

namespace keridoc {

constexpr std::string_view DID_KERI_PREFIX = "did:keri:";
constexpr std::string_view DID_WEB_PREFIX = "did:web:";
constexpr std::string_view DID_WEBS_PREFIX = "did:webs:";
constexpr std::string_view ENCODED_PORT_SEPARATOR = "%3A";

/**
 * @brief DID method families handled by the parser
 */
enum class DidScheme { Keri, Web, Webs };

/**
 * @brief Scheme name as it appears after "did:"
 */
constexpr std::string_view schemeName(DidScheme scheme) noexcept {
  switch (scheme) {
    case DidScheme::Keri:
      return "keri";
    case DidScheme::Web:
      return "web";
    case DidScheme::Webs:
      return "webs";
  }
  return "";
}

/// Query values are coerced in the order bool, integer, string
using QueryValue = std::variant<bool, int64_t, std::string>;
using QueryMap = std::map<std::string, QueryValue>;

/**
 * @brief Parsed DID
 *
 * For Keri only the identifier is populated. For Web and Webs the domain is
 * always present; query holds the coerced parameters and raw_query the
 * original text starting at '?', kept so re-encoding is lossless.
 */
struct DidUri {
  DidScheme scheme = DidScheme::Keri;
  std::string identifier;
  std::optional<std::string> domain;
  std::optional<uint16_t> port;
  std::vector<std::string> path;
  QueryMap query;
  std::optional<std::string> raw_query;

  [[nodiscard]] bool isWeb() const noexcept {
    return scheme == DidScheme::Web || scheme == DidScheme::Webs;
  }

  /**
   * @brief Path segments joined with ':'; empty when there are none
   */
  [[nodiscard]] std::string joinedPath() const;

  /**
   * @brief Canonical text, percent-encoded port, query preserved
   */
  [[nodiscard]] std::string toString() const;

  /**
   * @brief Canonical text without the query component
   */
  [[nodiscard]] std::string toStringWithoutQuery() const;

  bool operator==(const DidUri& other) const = default;
};

/**
 * @brief Parse a DID in canonical encoding
 * @throws InvalidDidFormatError when no grammar matches
 * @throws InvalidIdentifierError when the identifier fails the prefix grammar
 */
DidUri parseDid(std::string_view did);

/**
 * @brief Non-throwing variant of parseDid
 *
 * error() exposes the code and message; value() on a failed result rethrows
 * the exception parseDid raised, e.g. InvalidIdentifierError.
 */
DidResult<DidUri> tryParseDid(std::string_view did);

/**
 * @brief Parse a did:keri DID and return its identifier
 */
std::string parseDidKeri(std::string_view did);

/**
 * @brief Parse a web DID whose port separator is a bare ':'
 *
 * The first segment after the domain is taken as the port when it is all
 * digits and at least one more segment follows it. Used only to repair
 * legacy input; the result serializes canonically.
 */
DidUri parseLegacyUnencodedPort(std::string_view did);

/**
 * @brief Rewrite a DID into canonical form
 *
 * Canonical web DIDs come back re-serialized, legacy web DIDs get their port
 * separator percent-encoded, and did:keri DIDs are validated and returned
 * unchanged. Path, identifier and query are preserved.
 */
std::string reEncode(std::string_view did);

/**
 * @brief Parse a query component ("?a=1&b=true" or "a=1&b=true")
 *
 * Keys without a value and keys with an empty value are dropped; the first
 * occurrence of a repeated key wins. Values are percent-decoded, '+' decodes
 * to a space.
 */
QueryMap parseQuery(std::string_view raw);

/**
 * @brief Remove the query from a web DID and re-serialize it canonically
 *
 * did:keri DIDs carry no query and are returned unchanged.
 */
std::string stripQuery(std::string_view did);

/**
 * @brief Case-insensitive scheme detection; nullopt for other methods
 */
std::optional<DidScheme> detectScheme(std::string_view did) noexcept;

}  // namespace keridoc
