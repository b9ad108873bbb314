#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace taskmcp::util::base64
{

/// Decodes standard base64. Whitespace is skipped; decoding stops at padding.
/// Other characters outside the alphabet throw ValidationError.
std::vector<std::uint8_t> decode(const std::string& input);

std::string encode(const std::vector<std::uint8_t>& data);
std::string encode(const std::string& data);

} // namespace taskmcp::util::base64
