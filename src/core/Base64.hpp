// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace meetlink::base64
{

/// @brief Encodes binary data as standard (RFC 4648) base64 with padding.
[[nodiscard]] auto encode(std::span<const std::byte> data) -> std::string;

/// @brief Decodes standard base64. Whitespace is ignored, padding is optional.
/// @return The decoded bytes, or a ParseError on an invalid character or length.
[[nodiscard]] auto decode(std::string_view text) -> Result<std::vector<std::byte>>;

} // namespace meetlink::base64
