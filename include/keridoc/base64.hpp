/**
 * @file base64.hpp
 * @brief Base64url (RFC 4648 section 5) codec used for key material and
 * qualified identifier prefixes
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace keridoc {

/**
 * @brief Encode bytes as unpadded base64url
 * @param data Input byte span
 * @return Base64url string without '=' padding
 */
std::string base64UrlEncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Concept for byte containers suitable for base64 encoding
 */
template <typename T>
concept Base64Data = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Encode data as unpadded base64url
 */
template <Base64Data T>
std::string base64UrlEncode(const T& data) {
  return base64UrlEncodeImpl({std::data(data), std::size(data)});
}

/**
 * @brief Decode a base64url string; trailing '=' padding is tolerated
 * @throws InvalidBase64Error if a character outside the url-safe alphabet
 * is found or the length cannot carry whole bytes
 */
std::vector<uint8_t> base64UrlDecode(std::string_view data);

/**
 * @brief Check whether every character belongs to the base64url alphabet
 */
bool isBase64UrlText(std::string_view text) noexcept;

}  // namespace keridoc
