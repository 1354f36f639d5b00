#include "sinks/monogram.hpp"

#include <cctype>
#include <fstream>
#include <string>
#include <vector>

namespace agent_presence::sinks {
namespace {

constexpr std::size_t kMaxGlyphLines = 64;

char normalize_letter(const char letter) {
  const auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
  if (upper < 'A' || upper > 'Z') {
    return 'A';
  }
  return upper;
}

void rstrip(std::string& line) {
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back())) != 0) {
    line.pop_back();
  }
}

}  // namespace

std::vector<std::string> load_monogram(const char letter, const std::filesystem::path& dir) {
  const char normalized = normalize_letter(letter);
  std::ifstream input(dir / (std::string(1, normalized) + ".txt"));
  if (!input.is_open()) {
    return fallback_monogram(normalized);
  }

  std::vector<std::string> lines;
  std::string line;
  while (lines.size() < kMaxGlyphLines && std::getline(input, line)) {
    rstrip(line);
    lines.push_back(line);
  }
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  if (input.bad() || lines.empty()) {
    return fallback_monogram(normalized);
  }
  return lines;
}

std::vector<std::string> fallback_monogram(const char letter) {
  const std::string l(1, normalize_letter(letter));
  return {
      "  " + l + "  ",
      " " + l + l + l + " ",
      l + "   " + l,
      l + l + l + l + l,
      l + "   " + l,
  };
}

}  // namespace agent_presence::sinks
