#pragma once

#include "kaddht_export.h"
#include <string>
#include <optional>

namespace kaddht {

/**
 * RFC 4648 base32 (standard alphabet) without padding
 */
KADDHT_API std::string base32_encode(const std::string& data);

/**
 * Decode unpadded RFC 4648 base32
 * @return Decoded bytes, or nullopt on an invalid character, impossible length
 *         or non-zero trailing bits
 */
KADDHT_API std::optional<std::string> base32_decode(const std::string& text);

} // namespace kaddht
