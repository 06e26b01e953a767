#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <set>
#include <unordered_map>

#include "artifact/manager/v1.hpp"

namespace artifact::notify {

namespace events {
constexpr const char* kConnectionEstablished = "connection.established";
constexpr const char* kPong                  = "pong";
constexpr const char* kJobStatus             = "job.status";
constexpr const char* kGenerationProgress    = "generation.progress";
constexpr const char* kGenerationComplete    = "generation.complete";
constexpr const char* kGenerationError       = "generation.error";
constexpr const char* kError                 = "error";
} // namespace events

constexpr const char* kJobsChannel    = "jobs";
constexpr const char* kDefaultChannel = "default";

/*
  Fan-out of realtime events to per-channel subscribers.

  Delivery is at most once and only to subscribers present at publish
  time; nothing is replayed. Listeners run on the publishing thread without
  the hub lock held. A listener returning false is unsubscribed.
*/
class NotificationHub {
 public:
  using SubscriptionId = uint64_t;
  using Listener       = std::function<bool(const artifact::manager::v1::Event&)>;

  // connection.established reaches the listener before any published event
  SubscriptionId Subscribe(const std::string& channel, Listener listener);
  void           Unsubscribe(SubscriptionId id);

  // stamps channel and emitted_at; returns the number of listeners reached
  std::size_t Publish(const std::string& channel, artifact::manager::v1::Event event);

  // publishes to the job's own channel and to the shared jobs channel
  void PublishJobEvent(const std::string& job_id, const artifact::manager::v1::Event& event);

  // ping -> pong, anything else -> error; never touches job or version state
  artifact::manager::v1::Event HandleClientMessage(const std::string& channel, const artifact::manager::v1::ClientMessage& message) const;

  std::size_t SubscriberCount() const;

  static artifact::manager::v1::Event MakeEvent(const std::string& type);

 private:
  struct Subscriber {
    std::string channel;
    Listener    listener;
  };

  bool Deliver(SubscriptionId id, const Listener& listener, const artifact::manager::v1::Event& event);

  mutable std::mutex                                        mutex_;
  SubscriptionId                                            next_id_ = 0;
  std::unordered_map<SubscriptionId, Subscriber>            subscribers_;
  std::unordered_map<std::string, std::set<SubscriptionId>> channels_;
};

} // namespace artifact::notify
