/**
 * @file did_document.hpp
 * @brief DID document and DID resolution result records
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "verification_method.hpp"

namespace keridoc {

/// JSON field names of the resolution envelope
constexpr std::string_view DD_FIELD = "didDocument";
constexpr std::string_view DID_RES_META_FIELD = "didResolutionMetadata";
constexpr std::string_view DD_META_FIELD = "didDocumentMetadata";
constexpr std::string_view VMETH_FIELD = "verificationMethod";

constexpr std::string_view DID_JSON_CONTENT_TYPE = "application/did+json";

/// strftime pattern of the retrieved timestamp
constexpr const char* DID_TIME_FORMAT = "%Y-%m-%dT%H:%M:%SZ";

/**
 * @brief Service endpoint entry, one per (endpoint identifier, role)
 */
struct ServiceEndpoint {
  std::string id;    ///< "#<endpoint identifier>/<role>"
  std::string type;  ///< Role name
  /// protocol -> host, in enumeration order
  std::vector<std::pair<std::string, std::string>> serviceEndpoint;

  bool operator==(const ServiceEndpoint&) const = default;
};

struct DidDocument {
  std::string id;
  std::vector<VerificationMethod> verificationMethod;
  std::vector<ServiceEndpoint> service;
  std::vector<std::string> alsoKnownAs;

  [[nodiscard]] bool empty() const noexcept {
    return id.empty() && verificationMethod.empty() && service.empty() &&
           alsoKnownAs.empty();
  }

  bool operator==(const DidDocument&) const = default;
};

/**
 * @brief Network location of a witness, indexed by the witness position in
 * the key state's witness list
 */
struct WitnessLocation {
  uint64_t idx = 0;
  std::string scheme;
  std::string url;

  bool operator==(const WitnessLocation&) const = default;
};

struct DidResolutionMetadata {
  std::string contentType = std::string(DID_JSON_CONTENT_TYPE);
  std::string retrieved;

  bool operator==(const DidResolutionMetadata&) const = default;
};

struct DidDocumentMetadata {
  std::vector<WitnessLocation> witnesses;
  std::string versionId;
  std::vector<std::string> equivalentId;

  bool operator==(const DidDocumentMetadata&) const = default;
};

struct DidResolutionResult {
  DidDocument didDocument;
  DidResolutionMetadata didResolutionMetadata;
  DidDocumentMetadata didDocumentMetadata;

  bool operator==(const DidResolutionResult&) const = default;
};

/**
 * @brief Format a time point as YYYY-MM-DDTHH:MM:SSZ in UTC
 */
std::string formatDidTimestamp(std::chrono::system_clock::time_point when);

/**
 * @brief Check that text has the YYYY-MM-DDTHH:MM:SSZ shape
 */
bool isDidTimestamp(std::string_view text) noexcept;

}  // namespace keridoc
