/**
 * @file resolve_example.cpp
 * @brief Example synthesizing a did:webs document and serving it as did:web
 *
 * This example shows how to:
 * 1. Implement the key state and credential registry interfaces over
 *    in-memory data
 * 2. Normalize a legacy did:webs DID and resolve it with metadata
 * 3. Convert the result to did:web and back
 *
 * Set KERIDOC_LOG_LEVEL (trace, debug, info, ...) to see library logging.
 */

#include "keridoc/base64.hpp"
#include "keridoc/did_uri.hpp"
#include "keridoc/error.hpp"
#include "keridoc/json_serialization.hpp"
#include "keridoc/logging.hpp"
#include "keridoc/resolver.hpp"
#include "keridoc/scheme_converter.hpp"

#include <iostream>
#include <map>

using namespace keridoc;

namespace {

std::string qualify(std::string_view code, uint8_t seed) {
    std::vector<uint8_t> padded(33, 0);
    for (size_t i = 1; i < padded.size(); ++i) {
        padded[i] = static_cast<uint8_t>(seed * 13 + i);
    }
    return std::string(code) + base64UrlEncode(padded).substr(code.size());
}

VerifyingKey createKey(uint8_t seed) {
    std::vector<uint8_t> raw(32);
    for (size_t i = 0; i < raw.size(); ++i) {
        raw[i] = static_cast<uint8_t>(seed * 13 + i + 1);
    }
    return VerifyingKey{qualify("D", seed), raw};
}

class ExampleKeyStates : public KeyStateService {
public:
    ExampleKeyStates(std::string aid, std::string witness)
        : aid_(std::move(aid)), witness_(std::move(witness)) {}

    std::optional<KeyState> getState(std::string_view identifier) const override {
        if (identifier != aid_) return std::nullopt;
        KeyState state;
        state.verifying_keys = {createKey(1), createKey(2), createKey(3)};
        state.signing_threshold = SigningPolicy::weighted(
            std::vector<std::string>{"1/2", "1/4", "1/4"});
        state.witnesses = {witness_};
        state.sequence_number = 2;
        return state;
    }

    std::vector<LocationRecord> getWitnessLocations(std::string_view witness) const override {
        if (witness != witness_) return {};
        return {{"http", "http://witness.example.com:5642/"}};
    }

    EndpointTable getRoleEndpoints(std::string_view) const override {
        return {RoleEndpoints{"agent", {{witness_, {{"http", "http://agent.example.com/"}}}}}};
    }

    EndpointTable getWitnessEndpoints(std::string_view) const override {
        return {RoleEndpoints{"witness", {{witness_, {{"http", "http://witness.example.com:5642/"}}}}}};
    }

    bool hasLocalIdentity(std::string_view identifier) const override {
        return identifier == aid_;
    }

private:
    std::string aid_;
    std::string witness_;
};

class ExampleRegistry : public CredentialRegistry {
public:
    explicit ExampleRegistry(std::string aid) : aid_(std::move(aid)) {}

    std::vector<CredentialRecord> findSelfAttested(std::string_view identifier,
                                                   std::string_view schema) const override {
        if (identifier != aid_ || schema != DES_ALIASES_SCHEMA) return {};
        CredentialRecord credential;
        credential.said = qualify("E", 9);
        credential.issuer = aid_;
        credential.schema = std::string(DES_ALIASES_SCHEMA);
        credential.attributes = {{"ids", {"did:web:example.com:" + aid_, "did:webs:example.com:" + aid_}}};
        credential.status_event_type = std::string(STATUS_ISSUED);
        return {credential};
    }

private:
    std::string aid_;
};

}  // namespace

int main() {
    // The logger reads KERIDOC_LOG_LEVEL when it is first created.
    logging::Logger::getInstance();

    std::cout << "KERI did:webs Resolution Example\n";
    std::cout << "================================\n\n";

    const std::string aid = qualify("E", 7);
    ExampleKeyStates key_states(aid, qualify("B", 8));
    ExampleRegistry registry(aid);
    DocumentSynthesizer synthesizer(key_states, &registry);

    try {
        // Step 1: Legacy DIDs put the port after a bare colon
        const std::string legacy = "did:webs:example.com:7676:dws:" + aid;
        const std::string did = reEncode(legacy);
        std::cout << "1. Re-encoded DID\n   " << legacy << "\n-> " << did << "\n\n";

        // Step 2: Resolve with metadata
        auto result = synthesizer.resolveWithMetadata(did, aid);
        std::cout << "2. Resolution result:\n"
                  << json_serialization::to_pretty_json(result) << "\n\n";

        // Step 3: did:web view of the same document
        auto web = toWeb(result.didDocument);
        std::cout << "3. did:web document id: " << web.id << "\n";
        std::cout << "   Restored id: " << fromWeb(web).id << "\n\n";

        // Step 4: Errors carry the offending input
        try {
            synthesizer.resolve("did:webs:example.com:EBad", "");
        } catch (const InvalidIdentifierError& e) {
            std::cout << "4. Rejected identifier " << e.identifier() << ": " << e.what() << "\n";
        }
    } catch (const DidError& e) {
        std::cerr << "Error: " << e.what() << " (code "
                  << static_cast<int>(e.errorCode()) << ")\n";
        return 1;
    }

    return 0;
}
