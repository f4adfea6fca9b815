#include "mesh/broadcaster.hpp"
#include "mesh/wire_codec.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <future>
#include <vector>

namespace agentmesh {
namespace mesh {

// Outcome of one broadcast across all Links
struct Broadcaster::Fanout {
  size_t pending{0};
  size_t accepted{0};
  std::vector<Link> failed;
  DoneCallback on_done;
};

Broadcaster::Broadcaster(boost::asio::io_context &io_context,
                         ConnectionRegistry &registry, std::string agent_name,
                         size_t max_message_length,
                         std::chrono::milliseconds sync_timeout,
                         RunningCheck is_running)
    : io_context_(io_context), registry_(registry),
      agent_name_(std::move(agent_name)),
      max_message_length_(max_message_length), sync_timeout_(sync_timeout),
      is_running_(std::move(is_running)) {}

void Broadcaster::BroadcastAsync(const std::string &text, DoneCallback on_done) {
  auto finish = [&on_done](bool delivered) {
    if (on_done) {
      on_done(delivered);
    }
  };

  if (util::IsBlank(text)) {
    finish(false);
    return;
  }
  if (is_running_ && !is_running_()) {
    finish(false);
    return;
  }

  auto links = registry_.Snapshot();
  if (links.empty()) {
    LOG_MESH_DEBUG("No peer connections, broadcast skipped");
    finish(false);
    return;
  }

  MeshMessage msg;
  msg.agent = agent_name_;
  if (text.size() > max_message_length_) {
    msg.message = util::TruncateUtf8(text, max_message_length_);
    LOG_MESH_DEBUG("Broadcast truncated from {} to {} bytes", text.size(),
                   msg.message.size());
  } else {
    msg.message = text;
  }
  msg.timestamp = util::GetTimeDouble();

  auto payload = std::make_shared<const std::string>(EncodeMessage(msg));

  auto fanout = std::make_shared<Fanout>();
  fanout->pending = links.size();
  fanout->on_done = std::move(on_done);

  for (const auto &link : links) {
    if (!link.connection || !link.connection->is_open()) {
      OnWriteDone(fanout, link, false);
      continue;
    }
    link.connection->send(payload, [this, fanout, link](bool ok) {
      OnWriteDone(fanout, link, ok);
    });
  }
}

void Broadcaster::OnWriteDone(const std::shared_ptr<Fanout> &fanout,
                              const Link &link, bool ok) {
  if (ok) {
    ++fanout->accepted;
  } else {
    fanout->failed.push_back(link);
  }
  if (--fanout->pending > 0) {
    return;
  }

  for (const auto &dead : fanout->failed) {
    if (registry_.Remove(dead.id)) {
      LOG_MESH_WARN("Failed to send to peer on link {}, removed", dead.id);
    }
    if (dead.connection) {
      dead.connection->close();
    }
  }

  const bool delivered = fanout->accepted > 0;
  if (delivered) {
    last_broadcast_time_.store(util::GetTimeDouble(), std::memory_order_relaxed);
    delivered_.fetch_add(1, std::memory_order_relaxed);
    LOG_MESH_DEBUG("Broadcast sent to {} peer(s), {} failed", fanout->accepted,
                   fanout->failed.size());
  }

  auto on_done = std::move(fanout->on_done);
  fanout->on_done = nullptr;
  if (on_done) {
    on_done(delivered);
  }
}

bool Broadcaster::BroadcastSync(const std::string &text) {
  if (is_running_ && !is_running_()) {
    LOG_MESH_WARN("Cannot broadcast, mesh is not running");
    return false;
  }
  if (io_context_.get_executor().running_in_this_thread()) {
    LOG_MESH_ERROR("Synchronous broadcast called from the event loop thread");
    return false;
  }
  if (util::IsBlank(text)) {
    return false;
  }
  if (registry_.empty()) {
    LOG_MESH_WARN("No peer connections, broadcast skipped");
    return false;
  }

  auto promise = std::make_shared<std::promise<bool>>();
  auto future = promise->get_future();

  try {
    boost::asio::post(io_context_, [this, text, promise]() {
      BroadcastAsync(text, [promise](bool delivered) {
        promise->set_value(delivered);
      });
    });
  } catch (const std::exception &e) {
    LOG_MESH_ERROR("Failed to schedule broadcast: {}", e.what());
    return false;
  }

  if (future.wait_for(sync_timeout_) != std::future_status::ready) {
    LOG_MESH_WARN("Broadcast not confirmed within {}ms", sync_timeout_.count());
    return false;
  }

  try {
    return future.get();
  } catch (const std::future_error &e) {
    // Loop stopped before the broadcast ran
    LOG_MESH_DEBUG("Broadcast abandoned: {}", e.what());
    return false;
  }
}

} // namespace mesh
} // namespace agentmesh
