#pragma once

#include "shell/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vc::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

bool hasFlag(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& sv);
std::optional<std::int64_t> parseInt64(const std::string& sv);

}
