#pragma once

#include <cstdio>

#include "sinks/renderer.hpp"

namespace agent_presence::sinks {

// One line per rendered frame; for headless runs and log capture.
class StdoutDebugRenderer final : public Renderer {
 public:
  explicit StdoutDebugRenderer(std::FILE* out = stdout) : out_(out) {}

  void render(const RenderFrame& frame) override;

 private:
  std::FILE* out_;
};

}  // namespace agent_presence::sinks
