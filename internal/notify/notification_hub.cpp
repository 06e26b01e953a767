#include "notification_hub.hpp"

#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace artifact::notify {

using artifact::manager::v1::ClientMessage;
using artifact::manager::v1::Event;
using artifact::observability::IntField;
using artifact::observability::StringField;

Event NotificationHub::MakeEvent(const std::string& type) {
  Event event;
  event.set_type(type);
  *event.mutable_emitted_at() = util::ToProto(util::Now());
  return event;
}

NotificationHub::SubscriptionId NotificationHub::Subscribe(const std::string& channel, Listener listener) {
  SubscriptionId id;
  {
    std::lock_guard lock(mutex_);
    id = ++next_id_;
  }

  auto welcome = MakeEvent(events::kConnectionEstablished);
  welcome.set_channel(channel);
  welcome.set_message("connected");
  if (!Deliver(id, listener, welcome)) {
    return id;
  }

  {
    std::lock_guard lock(mutex_);
    subscribers_.emplace(id, Subscriber{channel, std::move(listener)});
    channels_[channel].insert(id);
  }

  ARTIFACT_LOG_DEBUG("Realtime subscriber added", {StringField("channel", channel), IntField("subscription", static_cast<int64_t>(id))});
  return id;
}

void NotificationHub::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto            it = subscribers_.find(id);
  if (it == subscribers_.end()) return;

  auto channel = channels_.find(it->second.channel);
  if (channel != channels_.end()) {
    channel->second.erase(id);
    if (channel->second.empty()) channels_.erase(channel);
  }
  subscribers_.erase(it);
}

bool NotificationHub::Deliver(SubscriptionId id, const Listener& listener, const Event& event) {
  bool keep = false;
  try {
    keep = listener(event);
  } catch (const std::exception& e) {
    ARTIFACT_LOG_WARN("Realtime listener failed", {IntField("subscription", static_cast<int64_t>(id)), StringField("error", e.what())});
  }
  if (!keep) {
    Unsubscribe(id);
  }
  return keep;
}

std::size_t NotificationHub::Publish(const std::string& channel, Event event) {
  event.set_channel(channel);
  if (!event.has_emitted_at()) {
    *event.mutable_emitted_at() = util::ToProto(util::Now());
  }

  std::vector<std::pair<SubscriptionId, Listener>> targets;
  {
    std::lock_guard lock(mutex_);
    auto            it = channels_.find(channel);
    if (it == channels_.end()) return 0;
    for (const auto id : it->second) {
      targets.emplace_back(id, subscribers_.at(id).listener);
    }
  }

  std::size_t reached = 0;
  for (const auto& [id, listener] : targets) {
    if (Deliver(id, listener, event)) ++reached;
  }
  return reached;
}

void NotificationHub::PublishJobEvent(const std::string& job_id, const Event& event) {
  Event stamped = event;
  stamped.set_job_id(job_id);
  Publish(job_id, stamped);
  Publish(kJobsChannel, stamped);
}

Event NotificationHub::HandleClientMessage(const std::string& channel, const ClientMessage& message) const {
  if (message.type() == "ping") {
    auto pong = MakeEvent(events::kPong);
    pong.set_channel(channel);
    return pong;
  }

  auto error = MakeEvent(events::kError);
  error.set_channel(channel);
  error.set_error("unsupported message type: " + message.type());
  return error;
}

std::size_t NotificationHub::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

} // namespace artifact::notify
