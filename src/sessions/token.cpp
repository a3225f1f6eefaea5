#include "docsandbox/sessions/token.hpp"

#include <openssl/rand.h>

#include <array>
#include <iomanip>
#include <sstream>

namespace docsandbox::sessions {

namespace {

constexpr std::size_t TOKEN_LENGTH = 36;

bool is_hyphen_position(const std::size_t index) {
  return index == 8 || index == 13 || index == 18 || index == 23;
}

} // namespace

common::Result<std::string> generate_token() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return common::Result<std::string>::failure("random source unavailable",
                                                common::ErrorCode::StorageError);
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return common::Result<std::string>::success(stream.str());
}

bool is_valid_token(const std::string &token) {
  if (token.size() != TOKEN_LENGTH) {
    return false;
  }
  for (std::size_t i = 0; i < token.size(); ++i) {
    const char ch = token[i];
    if (is_hyphen_position(i)) {
      if (ch != '-') {
        return false;
      }
      continue;
    }
    if (!((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'))) {
      return false;
    }
  }
  return true;
}

} // namespace docsandbox::sessions
