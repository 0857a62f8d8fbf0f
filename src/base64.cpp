#include "keridoc/base64.hpp"

#include <array>

namespace keridoc {

namespace {

constexpr std::string_view kUrlAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr std::array<int8_t, 256> makeDecodeTable() {
  std::array<int8_t, 256> table{};
  for (auto& entry : table) entry = -1;
  for (size_t i = 0; i < kUrlAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kUrlAlphabet[i])] =
        static_cast<int8_t>(i);
  }
  return table;
}

constexpr std::array<int8_t, 256> kDecodeTable = makeDecodeTable();

static_assert(kDecodeTable['A'] == 0 && kDecodeTable['_'] == 63,
              "base64url decode table is misaligned");

}  // namespace

std::string base64UrlEncodeImpl(std::span<const uint8_t> data) {
  std::string result;
  result.reserve((data.size() * 4 + 2) / 3);

  size_t i = 0;
  for (; i + 3 <= data.size(); i += 3) {
    uint32_t triple = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8) |
                      uint32_t{data[i + 2]};
    result.push_back(kUrlAlphabet[(triple >> 18) & 0x3F]);
    result.push_back(kUrlAlphabet[(triple >> 12) & 0x3F]);
    result.push_back(kUrlAlphabet[(triple >> 6) & 0x3F]);
    result.push_back(kUrlAlphabet[triple & 0x3F]);
  }

  const size_t rest = data.size() - i;
  if (rest == 1) {
    uint32_t single = uint32_t{data[i]} << 16;
    result.push_back(kUrlAlphabet[(single >> 18) & 0x3F]);
    result.push_back(kUrlAlphabet[(single >> 12) & 0x3F]);
  } else if (rest == 2) {
    uint32_t pair = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8);
    result.push_back(kUrlAlphabet[(pair >> 18) & 0x3F]);
    result.push_back(kUrlAlphabet[(pair >> 12) & 0x3F]);
    result.push_back(kUrlAlphabet[(pair >> 6) & 0x3F]);
  }
  return result;
}

std::vector<uint8_t> base64UrlDecode(std::string_view encoded) {
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.remove_suffix(1);
  }
  if (encoded.size() % 4 == 1) {
    throw InvalidBase64Error("dangling character at end of input");
  }

  std::vector<uint8_t> result;
  result.reserve((encoded.size() * 3) / 4);

  uint32_t accumulator = 0;
  int bits = 0;
  for (char c : encoded) {
    int8_t sextet = kDecodeTable[static_cast<unsigned char>(c)];
    if (sextet < 0) {
      throw InvalidBase64Error("Invalid character in base64 string");
    }
    accumulator = (accumulator << 6) | static_cast<uint32_t>(sextet);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      result.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
    }
  }
  return result;
}

bool isBase64UrlText(std::string_view text) noexcept {
  for (char c : text) {
    if (kDecodeTable[static_cast<unsigned char>(c)] < 0) {
      return false;
    }
  }
  return true;
}

}  // namespace keridoc
