#include "keridoc/resolver.hpp"

#include "keridoc/did_uri.hpp"
#include "keridoc/error.hpp"
#include "keridoc/logging.hpp"

namespace keridoc {

std::vector<ServiceEndpoint> addEnds(const EndpointTable& ends) {
  std::vector<ServiceEndpoint> services;
  for (const auto& role : ends) {
    for (const auto& [endpoint_id, locations] : role.endpoints) {
      ServiceEndpoint service;
      service.id = "#" + endpoint_id + "/" + role.role;
      service.type = role.role;
      service.serviceEndpoint = locations;
      services.push_back(std::move(service));
    }
  }
  return services;
}

DocumentSynthesizer::DocumentSynthesizer(const KeyStateService& key_states,
                                         const CredentialRegistry* registry,
                                         ResolverOptions options)
    : key_states_(key_states),
      registry_(registry),
      options_(std::move(options)) {}

DocumentSynthesizer::Synthesis DocumentSynthesizer::synthesize(
    std::string_view did, std::string_view identifier) const {
  const DidUri uri = parseDid(did);
  if (!identifier.empty() && uri.identifier != identifier) {
    throw MismatchedIdentifierError(did, identifier);
  }
  const std::string& aid = uri.identifier;
  KDOC_LOG_DEBUG("Generating DID document for {} with identifier {}", did,
                 aid);

  auto state = key_states_.getState(aid);
  if (!state) {
    throw UnknownIdentifierError(aid, did);
  }

  Synthesis synthesis;
  synthesis.document.id = std::string(did);
  synthesis.document.verificationMethod = encodeVerificationMethods(
      state->verifying_keys, state->signing_threshold, did, aid);

  // Endpoints and aliases are only published for locally controlled
  // identifiers.
  if (key_states_.hasLocalIdentity(aid)) {
    auto roles = addEnds(key_states_.getRoleEndpoints(aid));
    auto witnesses = addEnds(key_states_.getWitnessEndpoints(aid));
    synthesis.document.service = std::move(roles);
    synthesis.document.service.insert(synthesis.document.service.end(),
                                      witnesses.begin(), witnesses.end());

    if (registry_) {
      synthesis.aliases = classifyAliases(
          resolveAliases(aid, *registry_, options_.aliasSchema()));
    }
  }
  synthesis.document.alsoKnownAs = synthesis.aliases.also_known_as;
  synthesis.state = std::move(*state);
  return synthesis;
}

std::vector<WitnessLocation> DocumentSynthesizer::witnessLocations(
    const KeyState& state) const {
  std::vector<WitnessLocation> locations;
  for (size_t idx = 0; idx < state.witnesses.size(); ++idx) {
    for (const auto& record :
         key_states_.getWitnessLocations(state.witnesses[idx])) {
      locations.push_back(
          WitnessLocation{static_cast<uint64_t>(idx), record.scheme, record.url});
    }
  }
  return locations;
}

DidDocument DocumentSynthesizer::resolve(std::string_view did,
                                         std::string_view identifier) const {
  return synthesize(did, identifier).document;
}

DidResolutionResult DocumentSynthesizer::resolveWithMetadata(
    std::string_view did, std::string_view identifier) const {
  Synthesis synthesis = synthesize(did, identifier);

  DidResolutionResult result;
  result.didDocumentMetadata.witnesses = witnessLocations(synthesis.state);
  result.didDocumentMetadata.versionId =
      std::to_string(synthesis.state.sequence_number);
  result.didDocumentMetadata.equivalentId =
      std::move(synthesis.aliases.equivalent_id);
  result.didResolutionMetadata.contentType = options_.contentType();
  result.didResolutionMetadata.retrieved = formatDidTimestamp(options_.now());
  result.didDocument = std::move(synthesis.document);
  return result;
}

json_serialization::Json DocumentSynthesizer::resolveJson(
    std::string_view did, std::string_view identifier, bool meta) const {
  if (meta) {
    return json_serialization::toJson(resolveWithMetadata(did, identifier));
  }
  return json_serialization::toJson(resolve(did, identifier));
}

}  // namespace keridoc
