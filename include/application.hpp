#pragma once

#include "mesh/mesh_config.hpp"
#include "mesh/mesh_node.hpp"
#include "mesh/thought_sink.hpp"
#include <atomic>
#include <csignal>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace agentmesh {
namespace app {

// Application configuration
struct AppConfig {
  mesh::MeshConfig mesh;

  // Read lines from stdin and broadcast them
  bool interactive = true;
};

// Prints messages injected by the mesh to stdout
class ConsoleThoughtSink : public mesh::ThoughtSink {
public:
  void AddProcessedThought(const std::string &content,
                           const std::string &source) override;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }

private:
  std::mutex mutex_;
  std::atomic<uint64_t> count_{0};
};

// Application - host process embedding one mesh node
// Initializes the node, handles signals, forwards console input, coordinates
// shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  mesh::MeshNode &mesh_node() { return *mesh_node_; }

  // Status
  bool is_running() const { return running_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

  // Handle one console line: a /command or text to broadcast
  void handle_input_line(const std::string &line);

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Declared before the node so it outlives the node's loop
  ConsoleThoughtSink sink_;
  std::unique_ptr<mesh::MeshNode> mesh_node_;

  std::unique_ptr<std::thread> input_thread_;

  void start_input_loop();
  void stop_input_loop();
  void input_loop();

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace agentmesh
