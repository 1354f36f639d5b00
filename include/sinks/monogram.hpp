#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace agent_presence::sinks {

// Glyph for `letter` from `<dir>/<LETTER>.txt`, or the built-in block letter
// when the file is missing or unreadable. Non A-Z letters map to 'A'.
std::vector<std::string> load_monogram(char letter, const std::filesystem::path& dir);

std::vector<std::string> fallback_monogram(char letter);

}  // namespace agent_presence::sinks
