#include "keridoc/did_uri.hpp"

#include <cctype>
#include <charconv>

#include "keridoc/logging.hpp"
#include "keridoc/prefix.hpp"

namespace keridoc {

namespace {

constexpr std::string_view kWebGrammar =
    "did:web(s):<domain>[%3A<port>][:<path>]:<identifier>[?<query>]";
constexpr std::string_view kLegacyGrammar =
    "did:web(s):<domain>[:<port>][:<path>]:<identifier>[?<query>]";
constexpr std::string_view kKeriGrammar = "did:keri:<identifier>";
constexpr std::string_view kAnyGrammar = "did:keri, did:web or did:webs DID";

bool startsWithIgnoreCase(std::string_view text,
                          std::string_view prefix) noexcept {
  if (text.size() < prefix.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(text[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

bool allDigits(std::string_view text) noexcept {
  if (text.empty()) return false;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

int hexValue(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Malformed escapes are kept literally.
std::string percentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0 &&
               hexValue(text[i + 2]) >= 0) {
      out.push_back(
          static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string_view trimSpaces(std::string_view text) noexcept {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    text.remove_suffix(1);
  return text;
}

QueryValue coerceQueryValue(const std::string& value) {
  std::string lowered;
  lowered.reserve(value.size());
  for (char c : value) {
    lowered.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lowered == "true") return true;
  if (lowered == "false") return false;

  std::string_view digits = trimSpaces(value);
  if (!digits.empty() && digits.front() == '+') digits.remove_prefix(1);
  if (!digits.empty()) {
    int64_t number = 0;
    auto [end, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (ec == std::errc() && end == digits.data() + digits.size()) {
      return number;
    }
  }
  return value;
}

/**
 * @brief Cursor over the body of a web DID (everything before '?')
 */
class WebDidScanner {
 public:
  WebDidScanner(std::string_view did, std::string_view body, bool legacy)
      : did_(did), body_(body), legacy_(legacy) {}

  void scan(DidUri& out) {
    size_t domain_end = body_.find_first_of("%:");
    if (domain_end == std::string_view::npos) {
      fail();
    }
    if (domain_end == 0) {
      fail();
    }
    out.domain = std::string(body_.substr(0, domain_end));
    pos_ = domain_end;

    if (body_[pos_] == '%') {
      if (legacy_) fail();
      scanEncodedPort(out);
    }

    if (pos_ >= body_.size() || body_[pos_] != ':') {
      fail();
    }
    ++pos_;

    std::vector<std::string> segments = splitSegments();
    if (legacy_ && segments.size() >= 2 && allDigits(segments.front())) {
      out.port = toPort(segments.front());
      segments.erase(segments.begin());
    }

    out.identifier = std::move(segments.back());
    segments.pop_back();
    out.path = std::move(segments);
  }

 private:
  [[noreturn]] void fail() const {
    throw InvalidDidFormatError(did_, legacy_ ? kLegacyGrammar : kWebGrammar);
  }

  void scanEncodedPort(DidUri& out) {
    if (!startsWithIgnoreCase(body_.substr(pos_), ENCODED_PORT_SEPARATOR)) {
      fail();
    }
    pos_ += ENCODED_PORT_SEPARATOR.size();
    size_t start = pos_;
    while (pos_ < body_.size() &&
           std::isdigit(static_cast<unsigned char>(body_[pos_]))) {
      ++pos_;
    }
    out.port = toPort(body_.substr(start, pos_ - start));
  }

  uint16_t toPort(std::string_view digits) const {
    if (digits.empty() || digits.size() > 5) fail();
    uint32_t value = 0;
    for (char c : digits) {
      value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    if (value > 65535) fail();
    return static_cast<uint16_t>(value);
  }

  std::vector<std::string> splitSegments() const {
    std::vector<std::string> segments;
    size_t start = pos_;
    while (true) {
      size_t colon = body_.find(':', start);
      std::string_view segment = body_.substr(
          start, colon == std::string_view::npos ? std::string_view::npos
                                                 : colon - start);
      if (segment.empty()) fail();
      segments.emplace_back(segment);
      if (colon == std::string_view::npos) break;
      start = colon + 1;
    }
    return segments;
  }

  std::string_view did_;
  std::string_view body_;
  bool legacy_;
  size_t pos_ = 0;
};

DidUri parseWeb(std::string_view did, DidScheme scheme, bool legacy) {
  const size_t prefix_len = scheme == DidScheme::Webs
                                ? DID_WEBS_PREFIX.size()
                                : DID_WEB_PREFIX.size();
  std::string_view rest = did.substr(prefix_len);

  DidUri uri;
  uri.scheme = scheme;

  size_t question = rest.find('?');
  std::string_view body = rest.substr(0, question);
  if (question != std::string_view::npos) {
    uri.raw_query = std::string(rest.substr(question));
  }

  WebDidScanner(did, body, legacy).scan(uri);
  validatePrefix(uri.identifier);

  if (uri.raw_query) {
    uri.query = parseQuery(*uri.raw_query);
  }
  return uri;
}

std::string serializeWeb(const DidUri& uri, bool with_query) {
  std::string out = "did:";
  out += schemeName(uri.scheme);
  out += ':';
  out += uri.domain.value_or("");
  if (uri.port) {
    out += ENCODED_PORT_SEPARATOR;
    out += std::to_string(*uri.port);
  }
  for (const auto& segment : uri.path) {
    out += ':';
    out += segment;
  }
  out += ':';
  out += uri.identifier;
  if (with_query && uri.raw_query) {
    out += *uri.raw_query;
  }
  return out;
}

}  // namespace

std::string DidUri::joinedPath() const {
  std::string joined;
  for (size_t i = 0; i < path.size(); ++i) {
    if (i > 0) joined += ':';
    joined += path[i];
  }
  return joined;
}

std::string DidUri::toString() const {
  if (scheme == DidScheme::Keri) {
    return std::string(DID_KERI_PREFIX) + identifier;
  }
  return serializeWeb(*this, true);
}

std::string DidUri::toStringWithoutQuery() const {
  if (scheme == DidScheme::Keri) {
    return std::string(DID_KERI_PREFIX) + identifier;
  }
  return serializeWeb(*this, false);
}

std::optional<DidScheme> detectScheme(std::string_view did) noexcept {
  if (startsWithIgnoreCase(did, DID_KERI_PREFIX)) return DidScheme::Keri;
  if (startsWithIgnoreCase(did, DID_WEBS_PREFIX)) return DidScheme::Webs;
  if (startsWithIgnoreCase(did, DID_WEB_PREFIX)) return DidScheme::Web;
  return std::nullopt;
}

std::string parseDidKeri(std::string_view did) {
  if (!startsWithIgnoreCase(did, DID_KERI_PREFIX)) {
    throw InvalidDidFormatError(did, kKeriGrammar);
  }
  std::string_view identifier = did.substr(DID_KERI_PREFIX.size());
  if (identifier.empty() || identifier.find(':') != std::string_view::npos) {
    throw InvalidDidFormatError(did, kKeriGrammar);
  }
  validatePrefix(identifier);
  return std::string(identifier);
}

DidUri parseDid(std::string_view did) {
  auto scheme = detectScheme(did);
  if (!scheme) {
    throw InvalidDidFormatError(did, kAnyGrammar);
  }
  if (*scheme == DidScheme::Keri) {
    DidUri uri;
    uri.scheme = DidScheme::Keri;
    uri.identifier = parseDidKeri(did);
    return uri;
  }
  return parseWeb(did, *scheme, false);
}

DidResult<DidUri> tryParseDid(std::string_view did) {
  try {
    return DidResult<DidUri>::success(parseDid(did));
  } catch (const DidError& e) {
    return DidResult<DidUri>::error(e, std::current_exception());
  }
}

DidUri parseLegacyUnencodedPort(std::string_view did) {
  auto scheme = detectScheme(did);
  if (!scheme || *scheme == DidScheme::Keri) {
    throw InvalidDidFormatError(did, kLegacyGrammar);
  }
  return parseWeb(did, *scheme, true);
}

std::string reEncode(std::string_view did) {
  auto scheme = detectScheme(did);
  if (!scheme) {
    throw InvalidDidFormatError(did, kAnyGrammar);
  }
  if (*scheme == DidScheme::Keri) {
    return std::string(DID_KERI_PREFIX) + parseDidKeri(did);
  }

  // A '%' directly after the domain means the port is already encoded.
  std::string_view rest =
      did.substr(*scheme == DidScheme::Webs ? DID_WEBS_PREFIX.size()
                                            : DID_WEB_PREFIX.size());
  size_t domain_end = rest.find_first_of("%:");
  bool encoded =
      domain_end != std::string_view::npos && rest[domain_end] == '%';

  DidUri uri = encoded ? parseWeb(did, *scheme, false)
                       : parseWeb(did, *scheme, true);
  std::string canonical = uri.toString();
  if (canonical != did) {
    KDOC_LOG_DEBUG("Re-encoded {} as {}", did, canonical);
  }
  return canonical;
}

QueryMap parseQuery(std::string_view raw) {
  QueryMap result;
  if (!raw.empty() && raw.front() == '?') {
    raw.remove_prefix(1);
  }
  while (!raw.empty()) {
    size_t amp = raw.find('&');
    std::string_view pair = raw.substr(0, amp);
    raw = amp == std::string_view::npos ? std::string_view{}
                                        : raw.substr(amp + 1);

    size_t eq = pair.find('=');
    if (eq == std::string_view::npos) continue;
    std::string key = percentDecode(pair.substr(0, eq));
    std::string value = percentDecode(pair.substr(eq + 1));
    if (value.empty()) continue;
    result.emplace(std::move(key), coerceQueryValue(value));
  }
  return result;
}

std::string stripQuery(std::string_view did) {
  auto scheme = detectScheme(did);
  if (!scheme) {
    throw InvalidDidFormatError(did, kAnyGrammar);
  }
  if (*scheme == DidScheme::Keri) {
    return std::string(did);
  }
  return parseWeb(did, *scheme, false).toStringWithoutQuery();
}

}  // namespace keridoc
