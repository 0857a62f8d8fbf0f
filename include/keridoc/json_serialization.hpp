/**
 * @file json_serialization.hpp
 * @brief JSON encoding of DID documents and resolution results
 *
 * Field names and nesting are the DID Core shapes; objects keep insertion
 * order so equal records always serialize to identical bytes.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "did_document.hpp"
#include "verification_method.hpp"

namespace keridoc {

/**
 * @brief JSON serialization utilities for DID records
 */
namespace json_serialization {

using Json = nlohmann::ordered_json;

void to_json(Json& j, const jwk::OkpJwk& key);
void to_json(Json& j, const VerificationMethod& method);
void to_json(Json& j, const ServiceEndpoint& endpoint);
void to_json(Json& j, const DidDocument& document);
void to_json(Json& j, const WitnessLocation& witness);
void to_json(Json& j, const DidResolutionResult& result);

/**
 * @brief Decoders used when documents come back over the wire
 * @throws MissingDocumentFieldError when a required field is absent
 * @throws nlohmann::json::exception when a field has the wrong type
 */
void from_json(const Json& j, jwk::OkpJwk& key);
void from_json(const Json& j, VerificationMethod& method);
void from_json(const Json& j, ServiceEndpoint& endpoint);
void from_json(const Json& j, DidDocument& document);
void from_json(const Json& j, WitnessLocation& witness);
void from_json(const Json& j, DidResolutionResult& result);

Json toJson(const DidDocument& document);
Json toJson(const DidResolutionResult& result);

/**
 * @brief Get pretty printed JSON for a DID document
 * @param document The document to serialize
 * @param indent Number of spaces to indent (default: 2)
 */
std::string to_pretty_json(const DidDocument& document, int indent = 2);
std::string to_pretty_json(const DidResolutionResult& result, int indent = 2);

std::string to_compact_json(const DidDocument& document);
std::string to_compact_json(const DidResolutionResult& result);

}  // namespace json_serialization

}  // namespace keridoc
