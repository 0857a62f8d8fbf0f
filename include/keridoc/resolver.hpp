/**
 * @file resolver.hpp
 * @brief Synthesis of DID documents and resolution results from key state
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "aliases.hpp"
#include "did_document.hpp"
#include "json_serialization.hpp"
#include "services.hpp"

namespace keridoc {

/**
 * @brief Settings of a DocumentSynthesizer
 */
class ResolverOptions {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  ResolverOptions() = default;

  ResolverOptions& withAliasSchema(std::string_view schema) {
    alias_schema_ = std::string(schema);
    return *this;
  }

  ResolverOptions& withContentType(std::string_view content_type) {
    content_type_ = std::string(content_type);
    return *this;
  }

  ResolverOptions& withClock(Clock clock) {
    clock_ = std::move(clock);
    return *this;
  }

  [[nodiscard]] const std::string& aliasSchema() const noexcept {
    return alias_schema_;
  }
  [[nodiscard]] const std::string& contentType() const noexcept {
    return content_type_;
  }
  [[nodiscard]] std::chrono::system_clock::time_point now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
  }

 private:
  std::string alias_schema_ = std::string(DES_ALIASES_SCHEMA);
  std::string content_type_ = std::string(DID_JSON_CONTENT_TYPE);
  Clock clock_;
};

/**
 * @brief Builds DID documents for identifiers known to a key state service
 *
 * Holds references to the injected services; they must outlive the
 * synthesizer. Every call is independent and either returns a complete
 * document or throws.
 */
class DocumentSynthesizer {
 public:
  /**
   * @param key_states Key state lookups
   * @param registry Credential registry, or nullptr when aliases are not
   * tracked
   * @param options Resolver settings
   */
  DocumentSynthesizer(const KeyStateService& key_states,
                      const CredentialRegistry* registry,
                      ResolverOptions options = {});

  /**
   * @brief Build the DID document for did
   * @param did did:keri, did:web or did:webs DID
   * @param identifier Identifier the caller expects did to carry; empty to
   * take it from the DID
   * @throws InvalidDidFormatError, InvalidIdentifierError for a bad DID
   * @throws MismatchedIdentifierError when did carries another identifier
   * @throws UnknownIdentifierError when there is no key state
   * @throws InvalidPolicyError, InvalidKeyMaterialError for bad key state
   */
  DidDocument resolve(std::string_view did, std::string_view identifier) const;

  /**
   * @brief Build the document wrapped in a resolution result
   */
  DidResolutionResult resolveWithMetadata(std::string_view did,
                                          std::string_view identifier) const;

  /**
   * @brief JSON of the document, or of the resolution result when meta
   */
  json_serialization::Json resolveJson(std::string_view did,
                                       std::string_view identifier,
                                       bool meta) const;

  [[nodiscard]] const ResolverOptions& options() const noexcept {
    return options_;
  }

 private:
  struct Synthesis {
    DidDocument document;
    DesignatedAliases aliases;
    KeyState state;
  };

  Synthesis synthesize(std::string_view did, std::string_view identifier) const;
  std::vector<WitnessLocation> witnessLocations(const KeyState& state) const;

  const KeyStateService& key_states_;
  const CredentialRegistry* registry_;
  ResolverOptions options_;
};

/**
 * @brief Flatten an endpoint table into service entries
 *
 * One entry per (endpoint identifier, role) in enumeration order, with id
 * "#<endpoint identifier>/<role>" and type set to the role.
 */
std::vector<ServiceEndpoint> addEnds(const EndpointTable& ends);

}  // namespace keridoc
