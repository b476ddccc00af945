#pragma once

#include <string>

namespace ephem_core {

// 32 lowercase hex characters from 16 bytes of OpenSSL randomness
std::string generate_session_id();

// Caller-supplied ids: 1-128 characters of [A-Za-z0-9_-]
bool is_valid_session_id(const std::string& session_id);

}  // namespace ephem_core
