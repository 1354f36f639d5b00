#pragma once

#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>

#include "sinks/renderer.hpp"

namespace agent_presence::sinks {

struct TerminalSize {
  int rows{24};
  int cols{80};

  bool operator==(const TerminalSize& other) const = default;
};

// Full-screen ANSI painter: monogram, pulse bar, state label, message,
// clock and name, centered on the alternate screen.
class TerminalRenderer final : public Renderer {
 public:
  explicit TerminalRenderer(std::FILE* out = stdout, std::optional<TerminalSize> fixed_size = std::nullopt);
  ~TerminalRenderer() override;

  TerminalRenderer(const TerminalRenderer&) = delete;
  TerminalRenderer& operator=(const TerminalRenderer&) = delete;

  void render(const RenderFrame& frame) override;
  [[nodiscard]] bool invalidated() override;
  void teardown() override;

  // Screen contents for `frame` at `size`, without terminal setup codes.
  [[nodiscard]] static std::string compose(const RenderFrame& frame, TerminalSize size);

 private:
  [[nodiscard]] TerminalSize query_size() const;

  std::FILE* out_;
  std::optional<TerminalSize> fixed_size_;
  std::optional<TerminalSize> painted_size_{};
  bool screen_active_{false};
};

}  // namespace agent_presence::sinks
