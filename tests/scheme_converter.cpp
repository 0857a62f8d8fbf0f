#include <doctest/doctest.h>
#include "keridoc/error.hpp"
#include "keridoc/scheme_converter.hpp"
#include "fakes.hpp"

using namespace keridoc;
using namespace keridoc::testing;
using json_serialization::Json;

namespace {

DidDocument websDocument(const std::string& did, const std::string& aid) {
    DidDocument document;
    document.id = did;
    document.verificationMethod = encodeVerificationMethods(
        {makeKey(50), makeKey(51), makeKey(52)}, SigningPolicy::simple(2), did, aid);
    document.alsoKnownAs = {"did:webs:other.example:" + aid};
    return document;
}

}  // namespace

TEST_CASE("ToWebRewritesIdAndControllers") {
    const std::string aid = makeAid(50);
    const DidDocument document = websDocument("did:webs:example.com%3A8080:" + aid, aid);

    DidDocument web = toWeb(document);
    CHECK(web.id == "did:web:example.com%3A8080:" + aid);
    for (const auto& method : web.verificationMethod) {
        CHECK(method.controller == "did:web:example.com%3A8080:" + aid);
    }
    // Aliases and the input document stay untouched.
    CHECK(web.alsoKnownAs == document.alsoKnownAs);
    CHECK(document.id == "did:webs:example.com%3A8080:" + aid);
}

TEST_CASE("FromWebRestoresWebs") {
    const std::string aid = makeAid(51);
    const std::vector<std::string> dids = {
        "did:webs:example.com:" + aid,
        "did:webs:example.com%3A8080:path:" + aid,
        "did:webs:example.com:a:b:" + aid + "?versionId=2",
    };
    for (const auto& did : dids) {
        CAPTURE(did);
        const DidDocument document = websDocument(did, aid);
        CHECK(fromWeb(toWeb(document)) == document);
    }
}

TEST_CASE("FromWebIsIdempotent") {
    const std::string aid = makeAid(52);
    const DidDocument document = websDocument("did:webs:example.com:" + aid, aid);
    CHECK(fromWeb(document) == document);
    CHECK(fromWeb(fromWeb(toWeb(document))) == document);
}

TEST_CASE("ConverterOnlyTouchesTheSchemePosition") {
    CHECK(toWebDid("did:webs:did:webs.example:x") == "did:web:did:webs.example:x");
    CHECK(toWebDid("did:keri:x") == "did:keri:x");
    CHECK(fromWebDid("did:web:did:web.example:x") == "did:webs:did:web.example:x");
    CHECK(fromWebDid("did:webs:example.com:x") == "did:webs:example.com:x");
    CHECK(fromWebDid("did:keri:x") == "did:keri:x");
}

TEST_CASE("ConvertResolutionResult") {
    const std::string aid = makeAid(53);
    DidResolutionResult result;
    result.didDocument = websDocument("did:webs:example.com:" + aid, aid);
    result.didDocumentMetadata.versionId = "1";
    result.didDocumentMetadata.equivalentId = {"did:webs:example.com:" + aid};

    auto web = toWeb(result);
    CHECK(web.didDocument.id == "did:web:example.com:" + aid);
    CHECK(web.didDocumentMetadata == result.didDocumentMetadata);
    CHECK(fromWeb(web) == result);
}

TEST_CASE("EmptyDocumentIsRejected") {
    CHECK_THROWS_AS(toWeb(DidDocument{}), EmptyDocumentError);
    CHECK_THROWS_AS(fromWeb(DidDocument{}), EmptyDocumentError);
    CHECK_THROWS_AS(toWeb(DidResolutionResult{}), EmptyDocumentError);
    CHECK_THROWS_AS(toWebJson(Json(), false), EmptyDocumentError);
    CHECK_THROWS_AS(toWebJson(Json::object(), true), EmptyDocumentError);
    CHECK_THROWS_AS(fromWebJson(Json::array(), false), EmptyDocumentError);
}

TEST_CASE("JsonConversion") {
    const std::string aid = makeAid(54);
    const DidDocument document = websDocument("did:webs:example.com:" + aid, aid);
    const Json j = json_serialization::toJson(document);

    Json web = toWebJson(j, false);
    CHECK(web["id"] == "did:web:example.com:" + aid);
    CHECK(web["verificationMethod"][0]["controller"] == "did:web:example.com:" + aid);
    CHECK(fromWebJson(web, false) == j);
}

TEST_CASE("JsonConversionWithMetadata") {
    const std::string aid = makeAid(55);
    DidResolutionResult result;
    result.didDocument = websDocument("did:webs:example.com:" + aid, aid);
    result.didResolutionMetadata.retrieved = "2024-01-02T03:04:05Z";
    const Json j = json_serialization::toJson(result);

    Json web = toWebJson(j, true);
    CHECK(web["didDocument"]["id"] == "did:web:example.com:" + aid);
    CHECK(web["didResolutionMetadata"] == j["didResolutionMetadata"]);
    CHECK(fromWebJson(web, true) == j);
}

TEST_CASE("JsonConversionMissingDocumentField") {
    const std::string aid = makeAid(56);
    Json j = json_serialization::toJson(websDocument("did:webs:example.com:" + aid, aid));

    try {
        fromWebJson(j, true);
        FAIL("expected MissingDocumentFieldError");
    } catch (const MissingDocumentFieldError& e) {
        CHECK(e.field() == "didDocument");
        CHECK(e.errorCode() == DidErrorCode::MISSING_DOCUMENT_FIELD);
    }

    j.erase("id");
    CHECK_THROWS_AS(toWebJson(j, false), MissingDocumentFieldError);
}

TEST_CASE("JsonConversionKeepsForeignMembers") {
    const Json served = Json::parse(R"({
        "@context": ["https://www.w3.org/ns/did/v1", "https://w3id.org/security/suites/ed25519-2020/v1"],
        "id": "did:web:example.com:dids:alice",
        "verificationMethod": [
            {
                "id": "#key-1",
                "type": "Ed25519VerificationKey2020",
                "controller": "did:web:example.com:dids:alice",
                "publicKeyMultibase": "z6MkhaXgBZDvotDkL5257faiztiGiC2QtKLGpbnnEGta2doK"
            },
            {
                "id": "#key-2",
                "type": "JsonWebKey",
                "controller": "did:web:example.com:dids:alice",
                "publicKeyJwk": {"kty": "OKP", "crv": "Ed25519", "x": "abc"}
            }
        ],
        "authentication": ["#key-1"],
        "service": [
            {"id": "#files", "type": "LinkedDomains", "serviceEndpoint": "https://x.example"}
        ]
    })");

    Json expected = served;
    expected["id"] = "did:webs:example.com:dids:alice";
    expected["verificationMethod"][0]["controller"] = "did:webs:example.com:dids:alice";
    expected["verificationMethod"][1]["controller"] = "did:webs:example.com:dids:alice";

    const Json webs = fromWebJson(served, false);
    CHECK(webs == expected);
    CHECK(webs.dump() == expected.dump());
    CHECK(toWebJson(webs, false) == served);

    Json wrapped;
    wrapped["didDocument"] = served;
    wrapped["didDocumentMetadata"] = Json::object();
    const Json wrappedWebs = fromWebJson(wrapped, true);
    CHECK(wrappedWebs["didDocument"] == expected);
    CHECK(wrappedWebs["didDocumentMetadata"] == Json::object());
}

TEST_CASE("JsonConversionRequiresVerificationMethods") {
    Json j = Json::parse(R"({"id": "did:web:example.com:dids:alice"})");
    try {
        fromWebJson(j, false);
        FAIL("expected MissingDocumentFieldError");
    } catch (const MissingDocumentFieldError& e) {
        CHECK(e.field() == "verificationMethod");
    }

    j["verificationMethod"] = Json::array();
    CHECK(fromWebJson(j, false)["id"] == "did:webs:example.com:dids:alice");
}
