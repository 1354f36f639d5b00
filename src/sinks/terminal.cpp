#include "sinks/terminal.hpp"

#include <cstdlib>
#include <string>

#include <sys/ioctl.h>
#include <unistd.h>

namespace agent_presence::sinks {
namespace {

constexpr int kPulseWidth = 32;

constexpr int kGreyBright = 252;
constexpr int kGreyMid = 244;
constexpr int kGreyDark = 240;
constexpr int kGreyDarker = 236;

constexpr const char* kEnterScreen = "\x1b[?1049h\x1b[?25l";
constexpr const char* kLeaveScreen = "\x1b[0m\x1b[?25h\x1b[?1049l";
constexpr const char* kClearScreen = "\x1b[0m\x1b[2J";

bool is_continuation(const char c) {
  return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
}

int utf8_length(const std::string& text) {
  int count = 0;
  for (const char c : text) {
    if (!is_continuation(c)) {
      ++count;
    }
  }
  return count;
}

std::string utf8_truncate(const std::string& text, const int max_columns) {
  if (max_columns <= 0) {
    return {};
  }
  int columns = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_continuation(text[i])) {
      continue;
    }
    if (columns == max_columns) {
      return text.substr(0, i);
    }
    ++columns;
  }
  return text;
}

std::string upper(std::string value) {
  for (auto& c : value) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return value;
}

// Writes `text` at 0-based (row, col), clipped to the screen like a
// curses addstr that refuses to touch the last column.
void put(std::string& out, const TerminalSize size, const int row, const int col, const std::string& text,
         const int color) {
  if (row < 0 || row >= size.rows || col < 0 || col >= size.cols) {
    return;
  }
  const std::string clipped = utf8_truncate(text, size.cols - col - 1);
  if (clipped.empty()) {
    return;
  }
  out += "\x1b[" + std::to_string(row + 1) + ';' + std::to_string(col + 1) + 'H';
  out += "\x1b[38;5;" + std::to_string(color) + 'm';
  out += clipped;
  out += "\x1b[0m";
}

void put_centered(std::string& out, const TerminalSize size, const int row, const std::string& text,
                  const int color) {
  put(out, size, row, size.cols / 2 - utf8_length(text) / 2, text, color);
}

std::string build_pulse(const int pos, const int width, const bool sleeping) {
  std::string pulse;
  for (int i = 0; i < width; ++i) {
    if (sleeping) {
      pulse += "─";
      continue;
    }
    const int offset = std::abs(i - pos);
    const int dist = offset < width - offset ? offset : width - offset;
    switch (dist) {
      case 0:
        pulse += "█";
        break;
      case 1:
        pulse += "▓";
        break;
      case 2:
        pulse += "▒";
        break;
      case 3:
        pulse += "░";
        break;
      default:
        pulse += "─";
        break;
    }
  }
  return pulse;
}

}  // namespace

TerminalRenderer::TerminalRenderer(std::FILE* out, std::optional<TerminalSize> fixed_size)
    : out_(out), fixed_size_(fixed_size) {}

TerminalRenderer::~TerminalRenderer() { teardown(); }

void TerminalRenderer::render(const RenderFrame& frame) {
  if (!screen_active_) {
    std::fputs(kEnterScreen, out_);
    screen_active_ = true;
  }

  const auto size = query_size();
  std::string screen = kClearScreen;
  screen += compose(frame, size);
  std::fwrite(screen.data(), 1, screen.size(), out_);
  std::fflush(out_);
  painted_size_ = size;
}

bool TerminalRenderer::invalidated() {
  return painted_size_.has_value() && *painted_size_ != query_size();
}

void TerminalRenderer::teardown() {
  if (!screen_active_) {
    return;
  }
  std::fputs(kLeaveScreen, out_);
  std::fflush(out_);
  screen_active_ = false;
  painted_size_.reset();
}

std::string TerminalRenderer::compose(const RenderFrame& frame, const TerminalSize size) {
  std::string out;
  const bool sleeping = frame.state == model::activity_state::SLEEP;
  const int accent = ansi256_code(color_for_state(frame.state));
  const int cy = size.rows / 2;
  const int glyph_rows = static_cast<int>(frame.monogram.size());

  const int mark_y = cy - glyph_rows / 2 - 3;
  const int glyph_color = sleeping ? kGreyMid : kGreyBright;
  for (int i = 0; i < glyph_rows; ++i) {
    put_centered(out, size, mark_y + i, printable_text(frame.monogram[static_cast<std::size_t>(i)]), glyph_color);
  }

  const int pulse_y = mark_y + glyph_rows + 1;
  put(out, size, pulse_y, size.cols / 2 - kPulseWidth / 2, build_pulse(kPulseWidth / 2, kPulseWidth, sleeping),
      sleeping ? kGreyDarker : accent);

  put_centered(out, size, pulse_y + 3, upper(model::to_string(frame.state)), accent);

  if (!frame.message.empty()) {
    put_centered(out, size, pulse_y + 5, utf8_truncate(printable_text(frame.message), size.cols - 4), kGreyDark);
  }

  put(out, size, 0, 0, "+", kGreyDarker);
  put(out, size, 0, size.cols - 2, "+", kGreyDarker);
  put(out, size, size.rows - 2, 0, "+", kGreyDarker);
  put(out, size, size.rows - 2, size.cols - 2, "+", kGreyDarker);

  put_centered(out, size, 1, printable_text(frame.clock), kGreyDarker);
  put_centered(out, size, size.rows - 2, printable_text(frame.name), kGreyDarker);

  return out;
}

TerminalSize TerminalRenderer::query_size() const {
  if (fixed_size_.has_value()) {
    return *fixed_size_;
  }

  winsize ws{};
  if (::ioctl(fileno(out_), TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
    return TerminalSize{static_cast<int>(ws.ws_row), static_cast<int>(ws.ws_col)};
  }
  return TerminalSize{};
}

}  // namespace agent_presence::sinks
