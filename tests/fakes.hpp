#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "keridoc/base64.hpp"
#include "keridoc/services.hpp"

namespace keridoc::testing {

/// Deterministic raw key or digest bytes
inline std::vector<uint8_t> rawBytes(size_t size, uint8_t seed) {
    std::vector<uint8_t> raw(size);
    for (size_t i = 0; i < size; ++i) {
        raw[i] = static_cast<uint8_t>(seed + i * 7);
    }
    return raw;
}

/// Qualified prefix: the code replaces the leading characters of the
/// encoding of zero lead bytes followed by raw.
inline std::string makePrefix(std::string_view code, const std::vector<uint8_t>& raw) {
    const size_t lead = (code.size() * 3 + 3) / 4;
    std::vector<uint8_t> padded(lead, 0);
    padded.insert(padded.end(), raw.begin(), raw.end());
    return std::string(code) + base64UrlEncode(padded).substr(code.size());
}

inline std::string makeAid(uint8_t seed) {
    return makePrefix("E", rawBytes(32, seed));
}

inline VerifyingKey makeKey(uint8_t seed) {
    auto raw = rawBytes(32, seed);
    return VerifyingKey{makePrefix("D", raw), raw};
}

class InMemoryKeyStateService : public KeyStateService {
public:
    std::map<std::string, KeyState, std::less<>> states;
    std::map<std::string, std::vector<LocationRecord>, std::less<>> witness_locations;
    std::map<std::string, EndpointTable, std::less<>> role_endpoints;
    std::map<std::string, EndpointTable, std::less<>> witness_endpoints;
    std::set<std::string, std::less<>> local;

    std::optional<KeyState> getState(std::string_view identifier) const override {
        auto it = states.find(identifier);
        if (it == states.end()) return std::nullopt;
        return it->second;
    }

    std::vector<LocationRecord> getWitnessLocations(std::string_view witness) const override {
        auto it = witness_locations.find(witness);
        return it == witness_locations.end() ? std::vector<LocationRecord>{} : it->second;
    }

    EndpointTable getRoleEndpoints(std::string_view identifier) const override {
        auto it = role_endpoints.find(identifier);
        return it == role_endpoints.end() ? EndpointTable{} : it->second;
    }

    EndpointTable getWitnessEndpoints(std::string_view identifier) const override {
        auto it = witness_endpoints.find(identifier);
        return it == witness_endpoints.end() ? EndpointTable{} : it->second;
    }

    bool hasLocalIdentity(std::string_view identifier) const override {
        return local.find(identifier) != local.end();
    }
};

// Returns every credential of the issuer so the caller's own filters are
// exercised.
class InMemoryCredentialRegistry : public CredentialRegistry {
public:
    std::vector<CredentialRecord> credentials;

    std::vector<CredentialRecord> findSelfAttested(std::string_view identifier,
                                                   std::string_view) const override {
        std::vector<CredentialRecord> found;
        for (const auto& credential : credentials) {
            if (credential.issuer == identifier) {
                found.push_back(credential);
            }
        }
        return found;
    }
};

}  // namespace keridoc::testing
