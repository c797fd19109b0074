#include "board-ident/acquisition/UidStrategy.hpp"

#include <cctype>

namespace boardident {
namespace acquisition {

std::string normalize_uid(const std::string &token) {
  std::string text = token;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    text.erase(0, 2);

  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == ':' || c == '-')
      continue;
    if (!std::isxdigit(static_cast<unsigned char>(c)))
      return "";
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

std::string hex_encode(const uint8_t *data, size_t size) {
  static const char digits[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

} // namespace acquisition
} // namespace boardident
