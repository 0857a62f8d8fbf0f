/**
 * @file scheme_converter.hpp
 * @brief Rewriting documents between the did:web and did:webs schemes
 *
 * Only the document id and the controller of every verification method are
 * rewritten, and only at the scheme position. Inputs are never modified; each
 * call returns a converted copy.
 */

#pragma once

#include <string>
#include <string_view>

#include "did_document.hpp"
#include "json_serialization.hpp"

namespace keridoc {

/**
 * @brief did:webs DID as served through did:web
 * @throws EmptyDocumentError when document is empty
 */
DidDocument toWeb(const DidDocument& document);
DidResolutionResult toWeb(const DidResolutionResult& result);

/**
 * @brief did:web DID back to did:webs
 *
 * Values already carrying did:webs are left alone, so applying it twice
 * gives the same document.
 * @throws EmptyDocumentError when document is empty
 */
DidDocument fromWeb(const DidDocument& document);
DidResolutionResult fromWeb(const DidResolutionResult& result);

/**
 * @brief JSON forms of toWeb and fromWeb
 *
 * The JSON is rewritten in place: every other member, including ones with no
 * counterpart in DidDocument, is returned unchanged.
 * @param json A DID document, or a resolution result when meta is true
 * @param meta Whether json is wrapped in a resolution result
 * @throws EmptyDocumentError when json is null or empty
 * @throws MissingDocumentFieldError when meta is true and didDocument is
 * absent, or the document lacks id or verificationMethod
 */
json_serialization::Json toWebJson(const json_serialization::Json& json,
                                   bool meta);
json_serialization::Json fromWebJson(const json_serialization::Json& json,
                                     bool meta);

/// Scheme rewrite of a single DID string, used for id and controller values
std::string toWebDid(std::string_view did);
std::string fromWebDid(std::string_view did);

}  // namespace keridoc
