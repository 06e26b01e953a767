#pragma once

#include <cstddef>
#include <string>

#include "artifact/manager/v1.hpp"
#include "internal/notify/notification_hub.hpp"
#include "service_context.hpp"

namespace artifact::service {

/*
  Realtime subscriptions on top of the notification hub.

  Open() attaches a connection to a channel; the listener receives
  connection.established first and then every event published on the
  channel until Close() or until it returns false.
*/
class RealtimeService {
 public:
  explicit RealtimeService(ServiceContext ctx);

  artifact::notify::NotificationHub::SubscriptionId Open(const std::string& channel, artifact::notify::NotificationHub::Listener listener);

  void Close(artifact::notify::NotificationHub::SubscriptionId id);

  artifact::manager::v1::Event Handle(const std::string& channel, const artifact::manager::v1::ClientMessage& message);

  std::size_t Subscribers() const;

 private:
  ServiceContext ctx_;
};

} // namespace artifact::service
