#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tacit {

// Decodes one code point at `offset`. Returns the number of bytes consumed,
// or 0 when the sequence is malformed.
std::size_t decode_utf8(std::string_view text, std::size_t offset, char32_t& out);

void append_utf8(std::string& out, char32_t code_point);
std::string to_utf8(const std::u32string& text);
std::u32string from_utf8(std::string_view text);

}  // namespace tacit
