#include "sinks/stdout_debug.hpp"

#include <string>

namespace agent_presence::sinks {

void StdoutDebugRenderer::render(const RenderFrame& frame) {
  const auto color = color_for_state(frame.state);
  const std::string name = printable_text(frame.name);
  const std::string message = printable_text(frame.message);
  std::fprintf(out_, "[display] %s %s state=%s color=%s message=\"%s\"\n", frame.clock.c_str(), name.c_str(),
               model::to_string(frame.state), to_string(color), message.c_str());
  std::fflush(out_);
}

}  // namespace agent_presence::sinks
