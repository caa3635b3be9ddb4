#pragma once

#include <kiln/core/types.h>

#include <string>
#include <string_view>

namespace kiln::crypto {

// Lowercase hex SHA-256 digest of `data`.
Result<std::string> sha256Hex(std::string_view data);

} // namespace kiln::crypto
