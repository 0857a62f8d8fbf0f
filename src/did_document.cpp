#include "keridoc/did_document.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace keridoc {

std::string formatDidTimestamp(std::chrono::system_clock::time_point when) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif
  std::ostringstream out;
  out << std::put_time(&utc, DID_TIME_FORMAT);
  return out.str();
}

bool isDidTimestamp(std::string_view text) noexcept {
  constexpr std::string_view shape = "dddd-dd-ddTdd:dd:ddZ";
  if (text.size() != shape.size()) return false;
  for (size_t i = 0; i < shape.size(); ++i) {
    if (shape[i] == 'd') {
      if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    } else if (text[i] != shape[i]) {
      return false;
    }
  }
  return true;
}

}  // namespace keridoc
