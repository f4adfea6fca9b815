#include "mesh/context_injector.hpp"
#include "mesh/mesh_config.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace agentmesh {
namespace mesh {

ContextInjector::ContextInjector(boost::asio::io_context &io_context,
                                 InboundQueue &queue, std::string agent_name,
                                 std::chrono::milliseconds interval,
                                 RunningCheck is_running)
    : timer_(io_context), queue_(queue), agent_name_(std::move(agent_name)),
      interval_(interval), is_running_(std::move(is_running)) {}

ContextInjector::~ContextInjector() { Stop(); }

void ContextInjector::Start(ThoughtSink &sink) {
  sink_ = &sink;
  if (active_) {
    return;
  }
  active_ = true;
  ScheduleNext();
}

void ContextInjector::Stop() {
  active_ = false;
  timer_.cancel();
}

void ContextInjector::ScheduleNext() {
  timer_.expires_after(interval_);
  timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted || !active_) {
      return;
    }
    if (is_running_ && !is_running_()) {
      active_ = false;
      return;
    }
    DrainOnce();
    if (active_) {
      ScheduleNext();
    }
  });
}

size_t ContextInjector::DrainOnce() {
  if (!sink_) {
    return 0;
  }

  size_t handed = 0;
  while (active_ && (!is_running_ || is_running_())) {
    auto msg = queue_.TryPop();
    if (!msg) {
      break;
    }

    if (msg->agent == agent_name_) {
      ++self_filtered_;
      continue;
    }
    if (msg->message.empty()) {
      continue;
    }

    try {
      sink_->AddProcessedThought(msg->agent + " said: " + msg->message,
                                 defaults::SOURCE_TAG);
    } catch (const std::exception &e) {
      LOG_MESH_ERROR("Context loop error: {}", e.what());
      break;
    }

    ++handed;
    ++injected_;
    LOG_MESH_DEBUG("Injected from {}: {}", msg->agent,
                   util::TruncateUtf8(msg->message, 60));
  }
  return handed;
}

} // namespace mesh
} // namespace agentmesh
