#include "ephem_core/util/session_id.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ephem_core {

namespace {
constexpr size_t SESSION_ID_BYTES = 16;
constexpr size_t MAX_SESSION_ID_LENGTH = 128;
}  // namespace

std::string generate_session_id() {
  unsigned char bytes[SESSION_ID_BYTES];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("RAND_bytes failed to generate a session id (openssl error " +
                             std::to_string(ERR_get_error()) + ")");
  }

  std::stringstream ss;
  for (unsigned char b : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return ss.str();
}

bool is_valid_session_id(const std::string& session_id) {
  if (session_id.empty() || session_id.size() > MAX_SESSION_ID_LENGTH) {
    return false;
  }
  for (char c : session_id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_' || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

}  // namespace ephem_core
