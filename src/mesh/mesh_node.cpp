#include "mesh/mesh_node.hpp"
#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <future>
#include <set>

namespace agentmesh {
namespace mesh {

namespace {

MeshNode::TransportFactory DefaultTransportFactory() {
  return [](boost::asio::io_context &io) {
    return std::make_shared<network::RealTransport>(io);
  };
}

} // namespace

MeshNode::MeshNode(MeshConfig config)
    : MeshNode(std::move(config), DefaultTransportFactory()) {}

MeshNode::MeshNode(MeshConfig config, TransportFactory transport_factory)
    : config_(std::move(config)),
      transport_(transport_factory ? transport_factory(io_context_)
                                   : DefaultTransportFactory()(io_context_)),
      queue_(config_.queue_capacity), discovery_timer_(io_context_) {
  auto is_running = [this]() { return running_.load(std::memory_order_acquire); };

  PeerReader::Context ctx{registry_, queue_, config_.max_line_bytes, is_running};

  PeerDiscovery::Config discovery_config;
  discovery_config.host = config_.host;
  discovery_config.base_port = config_.port;
  discovery_config.range = config_.discovery_range;
  discovery_config.connect_timeout = config_.connect_timeout;
  discovery_ = std::make_unique<PeerDiscovery>(*transport_, ctx, discovery_config);

  const auto window = discovery_->WindowPorts();
  listener_ = std::make_unique<PeerListener>(
      *transport_, ctx, std::set<uint16_t>(window.begin(), window.end()));

  broadcaster_ = std::make_unique<Broadcaster>(
      io_context_, registry_, config_.agent_name, config_.max_message_length,
      config_.broadcast_timeout, is_running);

  injector_ = std::make_unique<ContextInjector>(
      io_context_, queue_, config_.agent_name, config_.drain_interval,
      is_running);

  LOG_MESH_TRACE("MeshNode created for agent '{}' on {}:{}", config_.agent_name,
                 config_.host, config_.port);
}

MeshNode::~MeshNode() { Cleanup(); }

template <typename Fn> auto MeshNode::RunOnLoop(Fn fn) -> decltype(fn()) {
  using Result = decltype(fn());
  auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
  auto future = task->get_future();
  boost::asio::post(io_context_, [task]() { (*task)(); });
  return future.get();
}

bool MeshNode::InLoopThread() {
  return io_context_.get_executor().running_in_this_thread();
}

bool MeshNode::Initialize() {
  std::unique_lock<std::mutex> lock(lifecycle_mutex_);

  if (running_.load(std::memory_order_acquire)) {
    LOG_MESH_WARN("Mesh node already initialized");
    return false;
  }

  std::string error;
  if (!ValidateMeshConfig(config_, error)) {
    LOG_MESH_ERROR("Invalid mesh configuration: {}", error);
    return false;
  }

  LOG_MESH_INFO("Initializing on port {} as agent '{}'", config_.port,
                config_.agent_name);

  running_.store(true, std::memory_order_release);
  io_context_.restart();
  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));
  loop_thread_ = std::thread([this]() { io_context_.run(); });

  auto result = RunOnLoop([this]() {
    discovery_->Start();
    return listener_->Start(config_.host, config_.port);
  });

  switch (result) {
  case network::ListenResult::Listening:
    listening_.store(true, std::memory_order_release);
    LOG_MESH_INFO("Server started on {}:{}", config_.host, config_.port);
    break;
  case network::ListenResult::AddressInUse:
    LOG_MESH_WARN("Port {} in use, connecting as client only", config_.port);
    break;
  case network::ListenResult::Failed:
    LOG_MESH_ERROR("Failed to start server on {}:{}", config_.host,
                   config_.port);
    running_.store(false, std::memory_order_release);
    StopLoop();
    return false;
  }

  lock.unlock();

  // Let the listener settle, then look for peers twice so agents started
  // at about the same time find each other
  std::this_thread::sleep_for(config_.settle_delay);
  DiscoverPeers();
  std::this_thread::sleep_for(config_.second_pass_delay);
  DiscoverPeers();

  return true;
}

void MeshNode::Cleanup() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (!running_.load(std::memory_order_acquire) && !loop_thread_.joinable()) {
    return;
  }
  if (InLoopThread()) {
    LOG_MESH_ERROR("Cleanup called from the event loop thread, ignored");
    return;
  }

  running_.store(false, std::memory_order_release);

  if (loop_thread_.joinable()) {
    RunOnLoop([this]() {
      context_active_ = false;
      discovery_timer_.cancel();
      injector_->Stop();
      discovery_->Stop();
      listener_->Stop();

      auto links = registry_.Clear();
      for (auto &link : links) {
        if (link.connection) {
          link.connection->close();
        }
      }
      if (!links.empty()) {
        LOG_MESH_DEBUG("Closed {} link(s)", links.size());
      }
    });

    // Flush disconnect notifications posted by the closes above
    RunOnLoop([]() {});
  }

  listening_.store(false, std::memory_order_release);
  StopLoop();

  LOG_MESH_INFO("Mesh node for '{}' stopped", config_.agent_name);
}

void MeshNode::StopLoop() {
  if (work_guard_) {
    work_guard_.reset();
  }
  io_context_.stop();
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  io_context_.restart();
}

bool MeshNode::Broadcast(const std::string &text) {
  bool delivered = broadcaster_->BroadcastSync(text);
  if (delivered) {
    LOG_MESH_INFO("Broadcast sent to {} peer(s)", registry_.size());
  }
  return delivered;
}

bool MeshNode::IsAvailable() const {
  const bool has_server = listening();
  const size_t links = registry_.size();

  if (!has_server && links == 0) {
    LOG_MESH_WARN("Not available: server={}, clients={}", has_server, links);
  }
  return has_server || links > 0;
}

bool MeshNode::StartContextLoop(ThoughtSink &sink) {
  if (!running()) {
    LOG_MESH_WARN("Cannot start context loop, mesh is not running");
    return false;
  }
  if (InLoopThread()) {
    LOG_MESH_ERROR("StartContextLoop called from the event loop thread");
    return false;
  }

  return RunOnLoop([this, &sink]() {
    if (context_active_) {
      return false;
    }
    context_active_ = true;
    context_started_ = util::GetSteadyTime();
    injector_->Start(sink);
    ScheduleDiscovery(std::chrono::milliseconds(0));
    LOG_MESH_DEBUG("Context loop started");
    return true;
  });
}

std::chrono::milliseconds MeshNode::NextDiscoveryInterval() const {
  auto elapsed = util::GetSteadyTime() - context_started_;
  if (elapsed < config_.warmup_window) {
    return config_.warmup_interval;
  }
  return config_.steady_interval;
}

void MeshNode::ScheduleDiscovery(std::chrono::milliseconds delay) {
  if (!running() || !context_active_) {
    return;
  }

  discovery_timer_.expires_after(delay);
  discovery_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (!ec && running() && context_active_) {
      discovery_->Scan();
      ScheduleDiscovery(NextDiscoveryInterval());
    }
  });
}

size_t MeshNode::DiscoverPeers() {
  if (!running() || InLoopThread()) {
    return 0;
  }

  auto promise = std::make_shared<std::promise<size_t>>();
  auto future = promise->get_future();
  boost::asio::post(io_context_, [this, promise]() {
    discovery_->Scan([promise](size_t found) { promise->set_value(found); });
  });

  // Each attempt is bounded by the connect timeout; a queued follow-up scan
  // can double the wait
  const auto window = discovery_->WindowPorts().size();
  const auto bound = 2 * (config_.connect_timeout + std::chrono::milliseconds(250)) *
                         static_cast<int64_t>(window) +
                     std::chrono::seconds(1);
  if (future.wait_for(bound) != std::future_status::ready) {
    LOG_MESH_WARN("Peer discovery did not finish within {}ms",
                  std::chrono::duration_cast<std::chrono::milliseconds>(bound)
                      .count());
    return 0;
  }

  try {
    return future.get();
  } catch (const std::future_error &e) {
    LOG_MESH_DEBUG("Peer discovery abandoned: {}", e.what());
    return 0;
  }
}

CommandResult MeshNode::Execute(const std::string &command,
                                const std::vector<std::string> &args) {
  CommandResult result;

  if (command == "broadcast") {
    if (args.empty()) {
      result.message = "No message provided";
      return result;
    }
    if (!Broadcast(args[0])) {
      result.message = "Broadcast failed";
      return result;
    }
    const size_t recipients = registry_.size();
    result.success = true;
    result.message = "Broadcast to " + std::to_string(recipients) + " agent(s)";
    result.metadata["recipients"] = recipients;
    return result;
  }

  if (command == "get_messages") {
    auto drained = queue_.Drain();
    nlohmann::json messages = nlohmann::json::array();
    for (const auto &msg : drained) {
      messages.push_back(nlohmann::json{{"agent", msg.agent},
                                        {"message", msg.message},
                                        {"timestamp", msg.timestamp}});
    }
    result.success = true;
    result.message = "Retrieved " + std::to_string(drained.size()) + " message(s)";
    result.metadata["messages"] = std::move(messages);
    result.metadata["count"] = drained.size();
    return result;
  }

  result.message = "Unknown command: " + command;
  result.guidance = "Available: broadcast, get_messages";
  return result;
}

} // namespace mesh
} // namespace agentmesh
