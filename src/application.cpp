#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <poll.h>
#include <thread>
#include <unistd.h>  // For write(), read(), STDOUT_FILENO (async-signal-safe)

namespace agentmesh {
namespace app {

void ConsoleThoughtSink::AddProcessedThought(const std::string &content,
                                             const std::string &source) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << "[" << source << "] " << content << std::endl;
  count_.fetch_add(1, std::memory_order_relaxed);
}

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  const auto endpoint =
      config_.mesh.host + ":" + std::to_string(config_.mesh.port);

  // Print startup banner (use std::cout for immediate visibility before logger
  // fully initialized)
  std::cout << GetStartupBanner(config_.mesh.agent_name, endpoint) << std::flush;

  LOG_APP_INFO("Initializing agentmesh...");

  mesh_node_ = std::make_unique<mesh::MeshNode>(config_.mesh);

  if (!mesh_node_->Initialize()) {
    LOG_APP_ERROR("Failed to initialize mesh node");
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }
  if (!mesh_node_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  setup_signal_handlers();

  if (!mesh_node_->StartContextLoop(sink_)) {
    LOG_APP_ERROR("Failed to start context loop");
    return false;
  }

  running_ = true;

  if (config_.interactive) {
    start_input_loop();
  }

  if (mesh_node_->listening()) {
    LOG_APP_INFO("Listening on {}:{}", config_.mesh.host, config_.mesh.port);
  } else {
    LOG_APP_INFO("Port {} taken, running as client only", config_.mesh.port);
  }
  LOG_APP_INFO("Connected peers: {}", mesh_node_->link_count());

  LOG_APP_INFO("Type a line to broadcast it, /help for commands, Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    if (mesh_node_) {
      mesh_node_->Cleanup();
    }
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down agentmesh...");

  running_ = false;

  stop_input_loop();

  if (mesh_node_) {
    mesh_node_->Cleanup();
  }

  LOG_APP_INFO("Shutdown complete ({} message(s) received)", sink_.count());
}

void Application::handle_input_line(const std::string &line) {
  if (util::IsBlank(line)) {
    return;
  }

  if (line == "/quit" || line == "/exit") {
    request_shutdown();
    return;
  }

  if (line == "/help") {
    std::cout << "Commands:\n"
              << "  /peers     Show connected peer ports\n"
              << "  /messages  Print and clear queued messages\n"
              << "  /status    Show node status\n"
              << "  /quit      Stop this agent\n"
              << "Anything else is broadcast to all peers." << std::endl;
    return;
  }

  if (line == "/peers") {
    auto ports = mesh_node_->connected_ports();
    std::cout << "Links: " << mesh_node_->link_count() << ", ports:";
    for (auto port : ports) {
      std::cout << " " << port;
    }
    std::cout << std::endl;
    return;
  }

  if (line == "/messages") {
    auto result = mesh_node_->Execute("get_messages", {});
    std::cout << result.message << std::endl;
    for (const auto &msg : result.metadata["messages"]) {
      std::cout << "  " << msg.value("agent", std::string(mesh::UNKNOWN_AGENT))
                << ": " << msg.value("message", std::string()) << std::endl;
    }
    return;
  }

  if (line == "/status") {
    std::cout << "Agent: " << config_.mesh.agent_name
              << "\nListening: " << (mesh_node_->listening() ? "yes" : "no")
              << "\nLinks: " << mesh_node_->link_count()
              << "\nDropped messages: " << mesh_node_->dropped_messages()
              << std::endl;
    return;
  }

  if (line[0] == '/') {
    auto result = mesh_node_->Execute(line.substr(1), {});
    std::cout << result.message;
    if (!result.guidance.empty()) {
      std::cout << " (" << result.guidance << ")";
    }
    std::cout << std::endl;
    return;
  }

  auto result = mesh_node_->Execute("broadcast", {line});
  if (!result.success) {
    LOG_APP_WARN("{}", result.message);
  }
}

void Application::start_input_loop() {
  input_thread_ = std::make_unique<std::thread>(&Application::input_loop, this);
}

void Application::stop_input_loop() {
  if (input_thread_ && input_thread_->joinable()) {
    input_thread_->join();
    input_thread_.reset();
  }
}

void Application::input_loop() {
  std::string pending;
  char buf[1024];

  while (running_ && !shutdown_requested_) {
    // Poll so the thread notices shutdown without waiting for input
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int ready = poll(&pfd, 1, 200);
    if (ready <= 0) {
      continue;
    }

    ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
      LOG_APP_INFO("Console input closed");
      break;
    }

    pending.append(buf, static_cast<size_t>(n));
    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      handle_input_line(line);
    }
  }
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char* msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);  // Literal length, no strlen()
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace agentmesh
