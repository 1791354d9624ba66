#include "storage/key_value_store.h"
#include <cctype>

std::string encodeKeySegment(const std::string &segment) {
  std::string encoded;
  encoded.reserve(segment.size());
  for (char c : segment) {
    if (c == '%') {
      encoded += "%25";
    } else if (c == '/') {
      encoded += "%2F";
    } else {
      encoded += c;
    }
  }
  return encoded;
}

std::string decodeKeySegment(const std::string &segment) {
  std::string decoded;
  decoded.reserve(segment.size());
  for (size_t i = 0; i < segment.size(); ++i) {
    if (segment[i] == '%' && i + 2 < segment.size() &&
        std::isxdigit(static_cast<unsigned char>(segment[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(segment[i + 2]))) {
      decoded += static_cast<char>(std::stoi(segment.substr(i + 1, 2), nullptr, 16));
      i += 2;
    } else {
      decoded += segment[i];
    }
  }
  return decoded;
}
