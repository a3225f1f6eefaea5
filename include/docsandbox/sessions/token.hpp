#pragma once

#include "docsandbox/common/result.hpp"

#include <string>

namespace docsandbox::sessions {

[[nodiscard]] common::Result<std::string> generate_token();

[[nodiscard]] bool is_valid_token(const std::string &token);

} // namespace docsandbox::sessions
