#include "keridoc/prefix.hpp"

#include <array>

#include "keridoc/base64.hpp"
#include "keridoc/error.hpp"

namespace keridoc {

namespace {

// Longest codes first so "1AAA" is never mistaken for a one character code.
constexpr std::array<PrefixCode, 17> kPrefixCodes = {{
    {"1AAA", "ECDSA secp256k1 non-transferable", 33, 48},
    {"1AAB", "ECDSA secp256k1", 33, 48},
    {"1AAC", "Ed448 non-transferable", 57, 80},
    {"1AAD", "Ed448", 57, 80},
    {"1AAI", "ECDSA secp256r1 non-transferable", 33, 48},
    {"1AAJ", "ECDSA secp256r1", 33, 48},
    {"0D", "Blake3-512 digest", 64, 88},
    {"0E", "Blake2b-512 digest", 64, 88},
    {"0F", "SHA3-512 digest", 64, 88},
    {"0G", "SHA2-512 digest", 64, 88},
    {"B", "Ed25519 non-transferable", 32, 44},
    {"D", "Ed25519", 32, 44},
    {"E", "Blake3-256 digest", 32, 44},
    {"F", "Blake2b-256 digest", 32, 44},
    {"G", "Blake2s-256 digest", 32, 44},
    {"H", "SHA3-256 digest", 32, 44},
    {"I", "SHA2-256 digest", 32, 44},
}};

static_assert(kPrefixCodes.front().full_size % 4 == 0,
              "qualified primitives align on 24 bit boundaries");

}  // namespace

std::optional<PrefixCode> lookupPrefixCode(std::string_view prefix) noexcept {
  for (const auto& entry : kPrefixCodes) {
    if (prefix.substr(0, entry.code.size()) == entry.code) {
      return entry;
    }
  }
  return std::nullopt;
}

std::string describePrefixFailure(std::string_view prefix) {
  if (prefix.empty()) {
    return "identifier is empty";
  }
  if (!isBase64UrlText(prefix)) {
    return "identifier contains characters outside the base64url alphabet";
  }

  auto code = lookupPrefixCode(prefix);
  if (!code) {
    return "unknown derivation code '" + std::string(prefix.substr(0, 1)) +
           "'";
  }
  if (prefix.size() != code->full_size) {
    return "derivation code " + std::string(code->code) + " (" +
           std::string(code->name) + ") requires " +
           std::to_string(code->full_size) + " characters, got " +
           std::to_string(prefix.size());
  }

  // The code displaces lead pad bits; decoded with the code zeroed out the
  // lead bytes must all be zero.
  std::string padded(code->code.size(), 'A');
  padded.append(prefix.substr(code->code.size()));
  std::vector<uint8_t> decoded;
  try {
    decoded = base64UrlDecode(padded);
  } catch (const InvalidBase64Error& e) {
    return e.what();
  }
  const size_t lead = decoded.size() - code->raw_size;
  for (size_t i = 0; i < lead; ++i) {
    if (decoded[i] != 0) {
      return "non-zero pad bits after derivation code " +
             std::string(code->code);
    }
  }
  return {};
}

void validatePrefix(std::string_view prefix) {
  std::string failure = describePrefixFailure(prefix);
  if (!failure.empty()) {
    throw InvalidIdentifierError(prefix, failure);
  }
}

}  // namespace keridoc
