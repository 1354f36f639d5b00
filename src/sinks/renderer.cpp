#include "sinks/renderer.hpp"

namespace agent_presence::sinks {

accent_color color_for_state(const model::activity_state state) noexcept {
  switch (state) {
    case model::activity_state::IDLE:
      return accent_color::CYAN;
    case model::activity_state::WORK:
      return accent_color::GREEN;
    case model::activity_state::THINK:
      return accent_color::YELLOW;
    case model::activity_state::ALERT:
      return accent_color::RED;
    case model::activity_state::SLEEP:
      return accent_color::BLUE;
  }
  return accent_color::CYAN;
}

const char* to_string(const accent_color color) noexcept {
  switch (color) {
    case accent_color::CYAN:
      return "cyan";
    case accent_color::GREEN:
      return "green";
    case accent_color::YELLOW:
      return "yellow";
    case accent_color::RED:
      return "red";
    case accent_color::BLUE:
      return "blue";
  }
  return "cyan";
}

int ansi256_code(const accent_color color) noexcept {
  // Muted tones: dusty cyan, sage, warm gold, brick, steel blue.
  switch (color) {
    case accent_color::CYAN:
      return 73;
    case accent_color::GREEN:
      return 108;
    case accent_color::YELLOW:
      return 179;
    case accent_color::RED:
      return 167;
    case accent_color::BLUE:
      return 67;
  }
  return 73;
}

std::string printable_text(const std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20U) {
      out += '^';
      out += static_cast<char>(byte + 0x40U);
    } else if (byte == 0x7FU) {
      out += "^?";
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace agent_presence::sinks
