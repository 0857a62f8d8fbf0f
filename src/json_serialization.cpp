/**
 * @file json_serialization.cpp
 * @brief JSON serialization implementation for DID records
 */

#include "keridoc/json_serialization.hpp"

#include "keridoc/error.hpp"

namespace keridoc {
namespace json_serialization {

namespace {

const Json& requireField(const Json& j, std::string_view field) {
  const std::string key(field);
  if (!j.is_object() || !j.contains(key)) {
    throw MissingDocumentFieldError(field);
  }
  return j.at(key);
}

template <typename T>
std::vector<T> decodeArray(const Json& j) {
  std::vector<T> items;
  items.reserve(j.size());
  for (const auto& item : j) {
    T value;
    from_json(item, value);
    items.push_back(std::move(value));
  }
  return items;
}

template <typename T>
Json encodeArray(const std::vector<T>& items) {
  Json array = Json::array();
  for (const auto& item : items) {
    Json entry;
    to_json(entry, item);
    array.push_back(std::move(entry));
  }
  return array;
}

}  // namespace

void to_json(Json& j, const jwk::OkpJwk& key) {
  j = Json::object();
  j["kid"] = key.kid;
  j["kty"] = key.kty;
  j["crv"] = key.crv;
  j["x"] = key.x;
}

void to_json(Json& j, const VerificationMethod& method) {
  j = Json::object();
  j["id"] = method.id;
  j["type"] = std::string(method.typeName());
  j["controller"] = method.controller;

  if (const auto* key = std::get_if<jwk::OkpJwk>(&method.material)) {
    to_json(j["publicKeyJwk"], *key);
  } else if (const auto* simple =
                 std::get_if<ThresholdCondition>(&method.material)) {
    j["threshold"] = simple->threshold;
    j["conditionThreshold"] = simple->conditions;
  } else if (const auto* weighted =
                 std::get_if<WeightedThresholdCondition>(&method.material)) {
    j["threshold"] = weighted->threshold;
    Json conditions = Json::array();
    for (const auto& condition : weighted->conditions) {
      Json entry = Json::object();
      entry["condition"] = condition.condition;
      entry["weight"] = condition.weight;
      conditions.push_back(std::move(entry));
    }
    j["conditionWeightedThreshold"] = std::move(conditions);
  }
}

void to_json(Json& j, const ServiceEndpoint& endpoint) {
  j = Json::object();
  j["id"] = endpoint.id;
  j["type"] = endpoint.type;
  Json locations = Json::object();
  for (const auto& [protocol, host] : endpoint.serviceEndpoint) {
    locations[protocol] = host;
  }
  j["serviceEndpoint"] = std::move(locations);
}

void to_json(Json& j, const DidDocument& document) {
  j = Json::object();
  j["id"] = document.id;
  j[std::string(VMETH_FIELD)] = encodeArray(document.verificationMethod);
  j["service"] = encodeArray(document.service);
  j["alsoKnownAs"] = document.alsoKnownAs;
}

void to_json(Json& j, const WitnessLocation& witness) {
  j = Json::object();
  j["idx"] = witness.idx;
  j["scheme"] = witness.scheme;
  j["url"] = witness.url;
}

void to_json(Json& j, const DidResolutionResult& result) {
  j = Json::object();
  to_json(j[std::string(DD_FIELD)], result.didDocument);

  Json resolution = Json::object();
  resolution["contentType"] = result.didResolutionMetadata.contentType;
  resolution["retrieved"] = result.didResolutionMetadata.retrieved;
  j[std::string(DID_RES_META_FIELD)] = std::move(resolution);

  Json metadata = Json::object();
  metadata["witnesses"] = encodeArray(result.didDocumentMetadata.witnesses);
  metadata["versionId"] = result.didDocumentMetadata.versionId;
  metadata["equivalentId"] = result.didDocumentMetadata.equivalentId;
  j[std::string(DD_META_FIELD)] = std::move(metadata);
}

void from_json(const Json& j, jwk::OkpJwk& key) {
  key.kid = j.value("kid", std::string{});
  key.kty = requireField(j, "kty").get<std::string>();
  key.crv = requireField(j, "crv").get<std::string>();
  key.x = requireField(j, "x").get<std::string>();
}

void from_json(const Json& j, VerificationMethod& method) {
  method.id = requireField(j, "id").get<std::string>();
  method.controller = requireField(j, "controller").get<std::string>();
  const auto type = requireField(j, "type").get<std::string>();

  if (type == VM_TYPE_JSON_WEB_KEY) {
    jwk::OkpJwk key;
    from_json(requireField(j, "publicKeyJwk"), key);
    method.material = std::move(key);
  } else if (type == VM_TYPE_CONDITIONAL_PROOF) {
    if (j.contains("conditionWeightedThreshold")) {
      WeightedThresholdCondition weighted;
      weighted.threshold = requireField(j, "threshold").get<double>();
      for (const auto& entry : j.at("conditionWeightedThreshold")) {
        weighted.conditions.push_back(WeightedCondition{
            requireField(entry, "condition").get<std::string>(),
            requireField(entry, "weight").get<int64_t>()});
      }
      method.material = std::move(weighted);
    } else {
      ThresholdCondition simple;
      simple.threshold = requireField(j, "threshold").get<uint64_t>();
      simple.conditions = requireField(j, "conditionThreshold")
                              .get<std::vector<std::string>>();
      method.material = std::move(simple);
    }
  } else {
    throw MissingDocumentFieldError(std::string(VMETH_FIELD) +
                                    ".type of JsonWebKey or " +
                                    std::string(VM_TYPE_CONDITIONAL_PROOF));
  }
}

void from_json(const Json& j, ServiceEndpoint& endpoint) {
  endpoint.id = requireField(j, "id").get<std::string>();
  endpoint.type = requireField(j, "type").get<std::string>();
  endpoint.serviceEndpoint.clear();
  for (const auto& item : requireField(j, "serviceEndpoint").items()) {
    endpoint.serviceEndpoint.emplace_back(item.key(),
                                          item.value().get<std::string>());
  }
}

void from_json(const Json& j, DidDocument& document) {
  document.id = requireField(j, "id").get<std::string>();
  document.verificationMethod =
      decodeArray<VerificationMethod>(requireField(j, VMETH_FIELD));
  document.service = j.contains("service")
                         ? decodeArray<ServiceEndpoint>(j.at("service"))
                         : std::vector<ServiceEndpoint>{};
  document.alsoKnownAs =
      j.value("alsoKnownAs", std::vector<std::string>{});
}

void from_json(const Json& j, WitnessLocation& witness) {
  witness.idx = requireField(j, "idx").get<uint64_t>();
  witness.scheme = requireField(j, "scheme").get<std::string>();
  witness.url = requireField(j, "url").get<std::string>();
}

void from_json(const Json& j, DidResolutionResult& result) {
  from_json(requireField(j, DD_FIELD), result.didDocument);

  if (j.contains(std::string(DID_RES_META_FIELD))) {
    const auto& resolution = j.at(std::string(DID_RES_META_FIELD));
    result.didResolutionMetadata.contentType = resolution.value(
        "contentType", std::string(DID_JSON_CONTENT_TYPE));
    result.didResolutionMetadata.retrieved =
        resolution.value("retrieved", std::string{});
  }
  if (j.contains(std::string(DD_META_FIELD))) {
    const auto& metadata = j.at(std::string(DD_META_FIELD));
    result.didDocumentMetadata.witnesses =
        metadata.contains("witnesses")
            ? decodeArray<WitnessLocation>(metadata.at("witnesses"))
            : std::vector<WitnessLocation>{};
    result.didDocumentMetadata.versionId =
        metadata.value("versionId", std::string{});
    result.didDocumentMetadata.equivalentId =
        metadata.value("equivalentId", std::vector<std::string>{});
  }
}

Json toJson(const DidDocument& document) {
  Json j;
  to_json(j, document);
  return j;
}

Json toJson(const DidResolutionResult& result) {
  Json j;
  to_json(j, result);
  return j;
}

std::string to_pretty_json(const DidDocument& document, int indent) {
  return toJson(document).dump(indent);
}

std::string to_pretty_json(const DidResolutionResult& result, int indent) {
  return toJson(result).dump(indent);
}

std::string to_compact_json(const DidDocument& document) {
  return toJson(document).dump();
}

std::string to_compact_json(const DidResolutionResult& result) {
  return toJson(result).dump();
}

}  // namespace json_serialization
}  // namespace keridoc
