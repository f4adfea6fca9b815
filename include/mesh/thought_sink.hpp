#pragma once

#include <string>

namespace agentmesh {
namespace mesh {

// Host-side receiver for messages injected by the context loop.
// Implementations may be called from the mesh event loop thread and must
// not block for long.
class ThoughtSink {
public:
  virtual ~ThoughtSink() = default;

  virtual void AddProcessedThought(const std::string &content,
                                   const std::string &source) = 0;
};

} // namespace mesh
} // namespace agentmesh
