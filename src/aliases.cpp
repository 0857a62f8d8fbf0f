#include "keridoc/aliases.hpp"

#include "keridoc/did_uri.hpp"
#include "keridoc/logging.hpp"

namespace keridoc {

namespace {

bool isSelfAttested(const CredentialRecord& credential,
                    std::string_view identifier) {
  if (credential.issuer != identifier) return false;
  return !credential.issuee || credential.issuee->empty() ||
         *credential.issuee == credential.issuer;
}

bool isUnrevoked(const CredentialRecord& credential) {
  return credential.status_event_type == STATUS_ISSUED ||
         credential.status_event_type == STATUS_BACKER_ISSUED;
}

}  // namespace

std::vector<std::string> resolveAliases(std::string_view identifier,
                                        const CredentialRegistry& registry,
                                        std::string_view schema) {
  std::vector<std::string> aliases;
  for (const auto& credential : registry.findSelfAttested(identifier, schema)) {
    if (credential.schema != schema || !isSelfAttested(credential, identifier)) {
      continue;
    }
    if (!isUnrevoked(credential)) {
      KDOC_LOG_DEBUG("Skipping alias credential {} with status {}",
                     credential.said, credential.status_event_type);
      continue;
    }

    const auto ids = credential.attributes.find("ids");
    if (ids == credential.attributes.end() || !ids->is_array()) {
      KDOC_LOG_WARN("Alias credential {} has no ids list", credential.said);
      continue;
    }
    for (const auto& alias : *ids) {
      if (alias.is_string()) {
        aliases.push_back(alias.get<std::string>());
      } else {
        KDOC_LOG_WARN("Ignoring non-string alias {} in credential {}",
                      alias.dump(), credential.said);
      }
    }
  }
  return aliases;
}

DesignatedAliases classifyAliases(const std::vector<std::string>& aliases) {
  DesignatedAliases classified;
  for (const auto& alias : aliases) {
    if (detectScheme(alias) == DidScheme::Webs) {
      classified.equivalent_id.push_back(alias);
    }
    classified.also_known_as.push_back(alias);
  }
  return classified;
}

}  // namespace keridoc
