#include "keridoc/scheme_converter.hpp"

#include "keridoc/did_uri.hpp"
#include "keridoc/error.hpp"
#include "keridoc/logging.hpp"

namespace keridoc {

namespace {

using json_serialization::Json;

constexpr std::string_view WEB_SCHEME = "did:web:";
constexpr std::string_view WEBS_SCHEME = "did:webs:";

using DidRewrite = std::string (*)(std::string_view);

DidDocument rewriteDocument(const DidDocument& document, DidRewrite rewrite) {
  if (document.empty()) {
    throw EmptyDocumentError("no DID document to convert");
  }
  DidDocument converted = document;
  converted.id = rewrite(document.id);
  for (auto& method : converted.verificationMethod) {
    method.controller = rewrite(method.controller);
  }
  KDOC_LOG_DEBUG("Converted DID document {} to {}", document.id, converted.id);
  return converted;
}

Json rewriteJson(const Json& json, bool meta, DidRewrite rewrite) {
  if (json.is_null() || json.empty()) {
    throw EmptyDocumentError("no DID document JSON to convert");
  }
  if (!json.is_object()) {
    throw EmptyDocumentError("DID document JSON is not an object");
  }

  if (meta) {
    const std::string field(DD_FIELD);
    if (!json.contains(field)) {
      throw MissingDocumentFieldError(DD_FIELD);
    }
    // Keep the metadata as received; only the nested document changes.
    Json converted = json;
    converted[field] = rewriteJson(json.at(field), false, rewrite);
    return converted;
  }

  // Edited in place: members with no DidDocument counterpart must survive.
  const std::string idField("id");
  const std::string methodsField(VMETH_FIELD);
  if (!json.contains(idField) || !json.at(idField).is_string()) {
    throw MissingDocumentFieldError(idField);
  }
  if (!json.contains(methodsField) || !json.at(methodsField).is_array()) {
    throw MissingDocumentFieldError(VMETH_FIELD);
  }

  Json converted = json;
  const auto id = json.at(idField).get<std::string>();
  converted[idField] = rewrite(id);
  for (auto& method : converted[methodsField]) {
    if (method.is_object() && method.contains("controller") &&
        method["controller"].is_string()) {
      method["controller"] = rewrite(method["controller"].get<std::string>());
    }
  }
  KDOC_LOG_DEBUG("Converted DID document JSON {} to {}", id,
                 converted[idField].get<std::string>());
  return converted;
}

}  // namespace

std::string toWebDid(std::string_view did) {
  if (!did.starts_with(WEBS_SCHEME)) {
    return std::string(did);
  }
  return std::string(WEB_SCHEME) +
         std::string(did.substr(WEBS_SCHEME.size()));
}

std::string fromWebDid(std::string_view did) {
  if (!did.starts_with(WEB_SCHEME)) {
    return std::string(did);
  }
  return std::string(WEBS_SCHEME) + std::string(did.substr(WEB_SCHEME.size()));
}

DidDocument toWeb(const DidDocument& document) {
  return rewriteDocument(document, &toWebDid);
}

DidResolutionResult toWeb(const DidResolutionResult& result) {
  DidResolutionResult converted = result;
  converted.didDocument = toWeb(result.didDocument);
  return converted;
}

DidDocument fromWeb(const DidDocument& document) {
  return rewriteDocument(document, &fromWebDid);
}

DidResolutionResult fromWeb(const DidResolutionResult& result) {
  DidResolutionResult converted = result;
  converted.didDocument = fromWeb(result.didDocument);
  return converted;
}

Json toWebJson(const Json& json, bool meta) {
  return rewriteJson(json, meta, &toWebDid);
}

Json fromWebJson(const Json& json, bool meta) {
  return rewriteJson(json, meta, &fromWebDid);
}

}  // namespace keridoc
