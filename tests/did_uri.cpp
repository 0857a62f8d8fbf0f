#include <doctest/doctest.h>
#include "keridoc/did_uri.hpp"
#include "fakes.hpp"

using namespace keridoc;
using namespace keridoc::testing;

TEST_CASE("ParseWebsWithEncodedPortPathAndQuery") {
    const std::string aid = makeAid(1);
    auto uri = parseDid("did:webs:example.com%3A8080:path:" + aid + "?versionId=1");

    CHECK(uri.scheme == DidScheme::Webs);
    REQUIRE(uri.domain.has_value());
    CHECK(*uri.domain == "example.com");
    REQUIRE(uri.port.has_value());
    CHECK(*uri.port == 8080);
    CHECK(uri.joinedPath() == "path");
    CHECK(uri.identifier == aid);
    REQUIRE(uri.query.count("versionId") == 1);
    CHECK(std::get<int64_t>(uri.query.at("versionId")) == 1);
    CHECK(uri.raw_query == std::optional<std::string>("?versionId=1"));
}

TEST_CASE("ParseWebWithoutPortOrPath") {
    const std::string aid = makeAid(2);
    auto uri = parseDid("did:web:example.com:" + aid);

    CHECK(uri.scheme == DidScheme::Web);
    CHECK(*uri.domain == "example.com");
    CHECK_FALSE(uri.port.has_value());
    CHECK(uri.path.empty());
    CHECK(uri.identifier == aid);
    CHECK(uri.query.empty());
    CHECK_FALSE(uri.raw_query.has_value());
}

TEST_CASE("ParseWebMultiSegmentPath") {
    const std::string aid = makeAid(3);
    auto uri = parseDid("did:webs:127.0.0.1%3a7676:dws:users:" + aid);

    CHECK(*uri.domain == "127.0.0.1");
    CHECK(*uri.port == 7676);
    CHECK(uri.path == std::vector<std::string>{"dws", "users"});
    CHECK(uri.joinedPath() == "dws:users");
    CHECK(uri.toString() == "did:webs:127.0.0.1%3A7676:dws:users:" + aid);
}

TEST_CASE("ParseKeri") {
    const std::string aid = makeAid(4);
    auto uri = parseDid("did:keri:" + aid);
    CHECK(uri.scheme == DidScheme::Keri);
    CHECK(uri.identifier == aid);
    CHECK_FALSE(uri.domain.has_value());
    CHECK(parseDidKeri("did:keri:" + aid) == aid);
    CHECK(uri.toString() == "did:keri:" + aid);
}

TEST_CASE("ParseRejectsMalformedDids") {
    const std::string aid = makeAid(5);
    CHECK_THROWS_AS(parseDid("did:example:" + aid), InvalidDidFormatError);
    CHECK_THROWS_AS(parseDid("did:webs:example.com"), InvalidDidFormatError);
    CHECK_THROWS_AS(parseDid("did:webs:example.com:"), InvalidDidFormatError);
    CHECK_THROWS_AS(parseDid("did:webs:example.com::" + aid), InvalidDidFormatError);
    CHECK_THROWS_AS(parseDid("did:webs::" + aid), InvalidDidFormatError);
    CHECK_THROWS_AS(parseDid("did:webs:example.com%3A:" + aid), InvalidDidFormatError);
    CHECK_THROWS_AS(parseDid("did:webs:example.com%3A70000:" + aid), InvalidDidFormatError);
    CHECK_THROWS_AS(parseDid("did:webs:example.com%20:" + aid), InvalidDidFormatError);
    CHECK_THROWS_AS(parseDid("did:keri:"), InvalidDidFormatError);
    CHECK_THROWS_AS(parseDid("did:keri:" + aid + ":extra"), InvalidDidFormatError);
}

TEST_CASE("ParseRejectsBadIdentifierInEveryScheme") {
    CHECK_THROWS_AS(parseDid("did:keri:EBad"), InvalidIdentifierError);
    CHECK_THROWS_AS(parseDid("did:web:example.com:EBad"), InvalidIdentifierError);
    CHECK_THROWS_AS(parseDid("did:webs:example.com%3A8080:path:EBad?versionId=1"),
                    InvalidIdentifierError);
    CHECK_THROWS_AS(reEncode("did:webs:example.com:8080:EBad"), InvalidIdentifierError);

    try {
        parseDid("did:webs:example.com:EBad");
        FAIL("expected InvalidIdentifierError");
    } catch (const InvalidIdentifierError& e) {
        CHECK(e.identifier() == "EBad");
        CHECK(e.errorCode() == DidErrorCode::INVALID_IDENTIFIER);
    }
}

TEST_CASE("InvalidDidFormatCarriesGrammar") {
    try {
        parseDid("did:webs:example.com");
        FAIL("expected InvalidDidFormatError");
    } catch (const InvalidDidFormatError& e) {
        CHECK(e.did() == "did:webs:example.com");
        CHECK(e.expected().find("%3A<port>") != std::string::npos);
        CHECK(e.errorCode() == DidErrorCode::INVALID_DID_FORMAT);
    }
}

TEST_CASE("TryParseDidReportsErrors") {
    auto ok = tryParseDid("did:keri:" + makeAid(6));
    CHECK(ok.isSuccess());
    CHECK(ok.value().scheme == DidScheme::Keri);

    auto bad = tryParseDid("did:web:");
    CHECK(bad.isError());
    CHECK(bad.error().errorCode() == DidErrorCode::INVALID_DID_FORMAT);
}

TEST_CASE("TryParseDidKeepsErrorType") {
    auto bad = tryParseDid("did:webs:example.com:EBad");
    REQUIRE(bad.isError());
    CHECK(bad.error().errorCode() == DidErrorCode::INVALID_IDENTIFIER);
    CHECK_THROWS_AS(bad.value(), InvalidIdentifierError);

    try {
        (void)bad.value();
        FAIL("expected InvalidDidFormatError");
    } catch (const InvalidDidFormatError& e) {
        CHECK(e.did() == "EBad");
        CHECK(e.errorCode() == DidErrorCode::INVALID_IDENTIFIER);
    }

    CHECK_THROWS_AS(std::move(bad).value(), InvalidIdentifierError);
}

TEST_CASE("DetectSchemeIgnoresCase") {
    CHECK(detectScheme("did:keri:x") == DidScheme::Keri);
    CHECK(detectScheme("did:web:x") == DidScheme::Web);
    CHECK(detectScheme("did:webs:x") == DidScheme::Webs);
    CHECK(detectScheme("DID:WEBS:x") == DidScheme::Webs);
    CHECK_FALSE(detectScheme("did:key:x").has_value());
    CHECK_FALSE(detectScheme("https://example.com").has_value());
}

TEST_CASE("QueryCoercion") {
    auto query = parseQuery("?versionId=12&meta=TRUE&off=false&name=a+b%21&n=%2B7&big=99999999999999999999");

    CHECK(std::get<int64_t>(query.at("versionId")) == 12);
    CHECK(std::get<bool>(query.at("meta")) == true);
    CHECK(std::get<bool>(query.at("off")) == false);
    CHECK(std::get<std::string>(query.at("name")) == "a b!");
    CHECK(std::get<int64_t>(query.at("n")) == 7);
    CHECK(std::get<std::string>(query.at("big")) == "99999999999999999999");
}

TEST_CASE("QueryDropsBlankValuesAndKeepsFirstOccurrence") {
    auto query = parseQuery("a=1&a=2&empty=&flag&b=x");
    CHECK(query.size() == 2);
    CHECK(std::get<int64_t>(query.at("a")) == 1);
    CHECK(std::get<std::string>(query.at("b")) == "x");
    CHECK(query.count("empty") == 0);
    CHECK(query.count("flag") == 0);
    CHECK(parseQuery("").empty());
    CHECK(parseQuery("?").empty());
}

TEST_CASE("LegacyPortParsing") {
    const std::string aid = makeAid(7);
    auto uri = parseLegacyUnencodedPort("did:webs:example.com:8080:path:" + aid);
    CHECK(*uri.port == 8080);
    CHECK(uri.path == std::vector<std::string>{"path"});

    auto bare = parseLegacyUnencodedPort("did:webs:example.com:" + aid);
    CHECK_FALSE(bare.port.has_value());
    CHECK(bare.identifier == aid);

    CHECK_THROWS_AS(parseLegacyUnencodedPort("did:webs:example.com%3A8080:" + aid),
                    InvalidDidFormatError);
    CHECK_THROWS_AS(parseLegacyUnencodedPort("did:keri:" + aid), InvalidDidFormatError);
}

TEST_CASE("ReEncodeLegacyMatchesCanonical") {
    const std::string aid = makeAid(8);
    const std::vector<std::string> schemes = {"did:webs:", "did:web:"};
    const std::vector<std::string> ports = {"", "8080", "1"};
    const std::vector<std::string> paths = {"", "path", "a:b:c"};
    const std::vector<std::string> queries = {"", "?versionId=1", "?meta=true&x=y"};

    for (const auto& scheme : schemes) {
        for (const auto& port : ports) {
            for (const auto& path : paths) {
                for (const auto& query : queries) {
                    std::string legacy = scheme + "example.com";
                    std::string canonical = legacy;
                    if (!port.empty()) {
                        legacy += ":" + port;
                        canonical += "%3A" + port;
                    }
                    std::string tail = (path.empty() ? "" : ":" + path) + ":" + aid + query;
                    legacy += tail;
                    canonical += tail;

                    CAPTURE(legacy);
                    CHECK(reEncode(legacy) == canonical);
                    CHECK(reEncode(canonical) == canonical);
                }
            }
        }
    }
}

TEST_CASE("ReEncodeNormalizesPortCase") {
    const std::string aid = makeAid(9);
    CHECK(reEncode("did:webs:example.com%3a8080:" + aid) ==
          "did:webs:example.com%3A8080:" + aid);
    CHECK(reEncode("did:keri:" + aid) == "did:keri:" + aid);
    CHECK_THROWS_AS(reEncode("did:peer:" + aid), InvalidDidFormatError);
}

TEST_CASE("StripQuery") {
    const std::string aid = makeAid(10);
    const std::string did = "did:webs:example.com%3A8080:path:" + aid;

    CHECK(stripQuery(did + "?versionId=1&meta=true") == did);
    CHECK(stripQuery(did) == did);
    CHECK(stripQuery("did:web:example.com:" + aid + "?x=1") == "did:web:example.com:" + aid);
    CHECK(stripQuery("did:keri:" + aid) == "did:keri:" + aid);
    CHECK_THROWS_AS(stripQuery("did:jwk:abc"), InvalidDidFormatError);
}

TEST_CASE("StripQueryIsIdempotent") {
    const std::string aid = makeAid(11);
    const std::vector<std::string> dids = {
        "did:webs:example.com:" + aid + "?versionId=3",
        "did:web:example.com%3A443:a:b:" + aid + "?meta=true",
        "did:webs:example.com%3A8080:" + aid,
        "did:keri:" + aid,
    };
    for (const auto& did : dids) {
        CAPTURE(did);
        const std::string once = stripQuery(did);
        CHECK(stripQuery(once) == once);
    }
}
