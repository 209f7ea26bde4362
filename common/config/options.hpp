#pragma once

#include "../types/config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace l2stream::config {

// Unsigned integer in decimal or 0x-prefixed hex
std::optional<uint32_t> parse_number(std::string_view text);

// Builds a Config from daemon options (arguments after the subcommand).
// On failure returns nullopt and stores a message naming the option in `error`.
std::optional<Config> parse_options(const std::vector<std::string>& args, std::string& error);

// Option summary for usage output
const char* options_help();

} // namespace l2stream::config
