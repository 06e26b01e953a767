#include "realtime_server.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

#include "grpc_error.hpp"
#include "internal/notify/notification_hub.hpp"

namespace artifact::grpc {

using artifact::manager::v1::ClientMessage;
using artifact::manager::v1::Event;

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(200);

// Per-connection event queue shared by the hub listener, the reader and
// the writer.
struct Outbox {
  std::mutex              mutex;
  std::condition_variable cv;
  std::deque<Event>       events;
  bool                    closed = false;

  bool Push(const Event& event) {
    {
      std::lock_guard lock(mutex);
      if (closed) return false;
      events.push_back(event);
    }
    cv.notify_one();
    return true;
  }

  void Close() {
    {
      std::lock_guard lock(mutex);
      closed = true;
    }
    cv.notify_all();
  }
};

} // namespace

RealtimeServer::RealtimeServer(std::shared_ptr<artifact::service::RealtimeService> svc) : service_(std::move(svc)) {
}

std::string RealtimeServer::ChannelFrom(const ::grpc::ServerContext& ctx) {
  const auto& metadata = ctx.client_metadata();
  auto        it       = metadata.find(kChannelMetadataKey);
  if (it == metadata.end() || it->second.empty()) {
    return artifact::notify::kDefaultChannel;
  }
  return std::string(it->second.data(), it->second.size());
}

::grpc::Status RealtimeServer::Connect(::grpc::ServerContext* ctx, ::grpc::ServerReaderWriter<Event, ClientMessage>* stream) {
  const auto channel = ChannelFrom(*ctx);
  auto       outbox  = std::make_shared<Outbox>();

  artifact::notify::NotificationHub::SubscriptionId subscription = 0;
  try {
    subscription = service_->Open(channel, [outbox](const Event& event) { return outbox->Push(event); });
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  // Client half-close or cancellation ends Read and closes the outbox; the
  // writer then flushes what is left.
  bool        client_closed = false;
  std::thread reader([&, outbox] {
    ClientMessage message;
    while (stream->Read(&message)) {
      outbox->Push(service_->Handle(channel, message));
    }
    {
      std::lock_guard lock(outbox->mutex);
      client_closed = true;
    }
    outbox->cv.notify_all();
  });

  bool write_failed = false;
  while (!ctx->IsCancelled()) {
    std::deque<Event> batch;
    bool              done = false;
    {
      std::unique_lock lock(outbox->mutex);
      outbox->cv.wait_for(lock, kCancelPollInterval, [&] { return !outbox->events.empty() || client_closed; });
      batch.swap(outbox->events);
      done = client_closed;
    }

    for (const auto& event : batch) {
      if (!stream->Write(event)) {
        write_failed = true;
        break;
      }
    }
    if (write_failed || done) break;
  }

  outbox->Close();
  service_->Close(subscription);
  bool reader_done = false;
  {
    std::lock_guard lock(outbox->mutex);
    reader_done = client_closed;
  }
  if (!reader_done) {
    ctx->TryCancel();
  }
  reader.join();

  if (ctx->IsCancelled()) {
    return ::grpc::Status::CANCELLED;
  }
  return ::grpc::Status::OK;
}

} // namespace artifact::grpc
