#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "keridoc/base64.hpp"
#include <array>

using namespace keridoc;

TEST_CASE("Base64UrlEncode - Empty input") {
    std::vector<uint8_t> empty;
    std::string encoded = base64UrlEncode(empty);
    CHECK(encoded.empty());
}

TEST_CASE("Base64UrlEncode - Unpadded tails") {
    CHECK(base64UrlEncode(std::vector<uint8_t>{0x4d}) == "TQ");
    CHECK(base64UrlEncode(std::vector<uint8_t>{0x4d, 0x61}) == "TWE");
    CHECK(base64UrlEncode(std::vector<uint8_t>{0x4d, 0x61, 0x6e, 0x79}) == "TWFueQ");
}

TEST_CASE("Base64UrlEncode - URL-safe characters") {
    std::vector<uint8_t> data = {0xfb, 0xff};
    CHECK(base64UrlEncode(data) == "-_8");

    std::vector<uint8_t> binary = {0x00, 0x01, 0x02, 0x03, 0xff, 0xfe, 0xfd};
    CHECK(base64UrlEncode(binary) == "AAECA__-_Q");
}

TEST_CASE("Base64UrlEncode - Zero lead byte gives a leading A") {
    // Qualified identifiers rely on this: 33 bytes with a zero lead byte
    // encode to 44 characters starting with 'A'.
    std::vector<uint8_t> data(33, 0x11);
    data[0] = 0x00;
    std::string encoded = base64UrlEncode(data);
    CHECK(encoded.size() == 44);
    CHECK(encoded.front() == 'A');
}

TEST_CASE("Base64UrlDecode - Known values") {
    CHECK(base64UrlDecode("").empty());
    CHECK(base64UrlDecode("TQ") == std::vector<uint8_t>{0x4d});
    CHECK(base64UrlDecode("-_8") == std::vector<uint8_t>{0xfb, 0xff});
}

TEST_CASE("Base64UrlDecode - Invalid characters") {
    CHECK_THROWS_AS(base64UrlDecode("TW@u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TW+u"), InvalidBase64Error); // Standard base64 chars not allowed
    CHECK_THROWS_AS(base64UrlDecode("TW/u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TW u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TW\nu"), InvalidBase64Error);
}

TEST_CASE("Base64UrlDecode - Dangling character") {
    CHECK_THROWS_AS(base64UrlDecode("TWFuT"), InvalidBase64Error);
}

TEST_CASE("Base64UrlDecode - Padding handling") {
    CHECK(base64UrlDecode("TWE=") == std::vector<uint8_t>{0x4d, 0x61});
    CHECK(base64UrlDecode("TQ==") == std::vector<uint8_t>{0x4d});
}

TEST_CASE("Base64UrlDecode - Error code") {
    try {
        base64UrlDecode("$$$$");
        FAIL("expected InvalidBase64Error");
    } catch (const InvalidBase64Error& e) {
        CHECK(e.errorCode() == DidErrorCode::INVALID_BASE64);
    }
}

TEST_CASE("IsBase64UrlText") {
    CHECK(isBase64UrlText("EN6Oh5XSD5_q2Hgu-aqpdfbVepdpYpFlgz6zvJL5b_r5"));
    CHECK(isBase64UrlText(""));
    CHECK_FALSE(isBase64UrlText("abc="));
    CHECK_FALSE(isBase64UrlText("a+b"));
}

TEST_CASE("Base64UrlEncode - Use std::array") {
    std::array<uint8_t, 3> arr = {0x4d, 0x61, 0x6e};
    CHECK(base64UrlEncode(arr) == "TWFu");
}
