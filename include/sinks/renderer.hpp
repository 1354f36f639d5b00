#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "model/status_record.hpp"

namespace agent_presence::sinks {

enum class accent_color : std::uint8_t {
  CYAN = 0,
  GREEN = 1,
  YELLOW = 2,
  RED = 3,
  BLUE = 4,
};

[[nodiscard]] accent_color color_for_state(model::activity_state state) noexcept;
[[nodiscard]] const char* to_string(accent_color color) noexcept;
// xterm-256 palette index used for the accent.
[[nodiscard]] int ansi256_code(accent_color color) noexcept;

// `text` with C0 control bytes and DEL spelled in caret notation ("^[", "^?"),
// the way curses draws them, so user text can never emit terminal sequences.
[[nodiscard]] std::string printable_text(std::string_view text);

// Everything one paint needs. Two equal frames produce the same screen.
struct RenderFrame {
  std::vector<std::string> monogram{};
  model::activity_state state{model::activity_state::IDLE};
  std::string message{};
  std::string name{};
  std::string clock{};

  bool operator==(const RenderFrame& other) const = default;
};

class Renderer {
 public:
  virtual ~Renderer() = default;

  virtual void render(const RenderFrame& frame) = 0;

  // True when the output surface changed (e.g. terminal resize) and the
  // current frame must be painted again even though it did not change.
  [[nodiscard]] virtual bool invalidated() { return false; }

  // Releases the output surface. Called once when the display stops.
  virtual void teardown() {}
};

}  // namespace agent_presence::sinks
