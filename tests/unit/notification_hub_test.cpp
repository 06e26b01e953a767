#include "internal/notify/notification_hub.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using artifact::manager::v1::ClientMessage;
using artifact::manager::v1::Event;
using artifact::notify::NotificationHub;
namespace events = artifact::notify::events;

struct Recorder {
  std::mutex         mutex;
  std::vector<Event> events;

  NotificationHub::Listener Listener() {
    return [this](const Event& event) {
      std::lock_guard lock(mutex);
      events.push_back(event);
      return true;
    };
  }

  std::vector<std::string> Types() {
    std::lock_guard          lock(mutex);
    std::vector<std::string> out;
    for (const auto& event : events) out.push_back(event.type());
    return out;
  }
};

void TestWelcomeArrivesFirst() {
  NotificationHub hub;
  Recorder        recorder;

  hub.Subscribe("job-1", recorder.Listener());
  assert(recorder.events.size() == 1);
  assert(recorder.events[0].type() == events::kConnectionEstablished);
  assert(recorder.events[0].channel() == "job-1");
  assert(recorder.events[0].has_emitted_at());
  assert(hub.SubscriberCount() == 1);
}

void TestPingPongAndUnsupportedMessage() {
  NotificationHub hub;

  ClientMessage ping;
  ping.set_type("ping");
  const auto pong = hub.HandleClientMessage("default", ping);
  assert(pong.type() == events::kPong);
  assert(pong.channel() == "default");

  ClientMessage other;
  other.set_type("subscribe");
  const auto error = hub.HandleClientMessage("default", other);
  assert(error.type() == events::kError);
  assert(error.error() == "unsupported message type: subscribe");
}

void TestPublishReachesOnlyChannelSubscribers() {
  NotificationHub hub;
  Recorder        a, b, other;

  hub.Subscribe("job-1", a.Listener());
  hub.Subscribe("job-1", b.Listener());
  hub.Subscribe("job-2", other.Listener());

  const auto reached = hub.Publish("job-1", NotificationHub::MakeEvent(events::kJobStatus));
  assert(reached == 2);
  assert(a.Types().size() == 2 && a.Types()[1] == events::kJobStatus);
  assert(a.events[1].channel() == "job-1");
  assert(b.Types().size() == 2);
  assert(other.Types().size() == 1);

  assert(hub.Publish("nobody-listens", NotificationHub::MakeEvent(events::kJobStatus)) == 0);
}

void TestJobEventsFanOutToJobsChannel() {
  NotificationHub hub;
  Recorder        per_job, all_jobs;

  hub.Subscribe("job-7", per_job.Listener());
  hub.Subscribe(artifact::notify::kJobsChannel, all_jobs.Listener());

  hub.PublishJobEvent("job-7", NotificationHub::MakeEvent(events::kGenerationProgress));

  assert(per_job.events.size() == 2);
  assert(per_job.events[1].job_id() == "job-7");
  assert(per_job.events[1].channel() == "job-7");
  assert(all_jobs.events.size() == 2);
  assert(all_jobs.events[1].job_id() == "job-7");
  assert(all_jobs.events[1].channel() == artifact::notify::kJobsChannel);
}

void TestFailingListenersAreDropped() {
  NotificationHub hub;
  Recorder        healthy;
  int             refusing_calls = 0;

  hub.Subscribe("c", healthy.Listener());
  hub.Subscribe("c", [&refusing_calls](const Event& event) {
    ++refusing_calls;
    return event.type() == events::kConnectionEstablished;
  });
  hub.Subscribe("c", [](const Event& event) -> bool {
    if (event.type() == events::kConnectionEstablished) return true;
    throw std::runtime_error("socket closed");
  });
  assert(hub.SubscriberCount() == 3);

  assert(hub.Publish("c", NotificationHub::MakeEvent(events::kJobStatus)) == 1);
  assert(hub.SubscriberCount() == 1);

  hub.Publish("c", NotificationHub::MakeEvent(events::kJobStatus));
  assert(refusing_calls == 2);
  assert(healthy.events.size() == 3);
}

void TestListenerRejectingWelcomeIsNeverRegistered() {
  NotificationHub hub;
  hub.Subscribe("c", [](const Event&) { return false; });
  assert(hub.SubscriberCount() == 0);
}

void TestUnsubscribeStopsDelivery() {
  NotificationHub hub;
  Recorder        recorder;

  const auto id = hub.Subscribe("c", recorder.Listener());
  hub.Unsubscribe(id);
  hub.Unsubscribe(id);

  assert(hub.Publish("c", NotificationHub::MakeEvent(events::kJobStatus)) == 0);
  assert(recorder.events.size() == 1);
  assert(hub.SubscriberCount() == 0);
}

void TestConcurrentPublishAndSubscribe() {
  NotificationHub  hub;
  std::atomic<int> delivered{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&hub, &delivered, t] {
      for (int i = 0; i < 200; ++i) {
        if (i % 20 == 0) {
          const auto id = hub.Subscribe("shared", [&delivered](const Event&) {
            ++delivered;
            return true;
          });
          if (t % 2 == 0) hub.Unsubscribe(id);
        }
        hub.Publish("shared", NotificationHub::MakeEvent(events::kJobStatus));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  // two of four threads keep their ten subscriptions each
  assert(hub.SubscriberCount() == 20);
  assert(delivered.load() > 0);
}

} // namespace

int main() {
  TestWelcomeArrivesFirst();
  TestPingPongAndUnsupportedMessage();
  TestPublishReachesOnlyChannelSubscribers();
  TestJobEventsFanOutToJobsChannel();
  TestFailingListenersAreDropped();
  TestListenerRejectingWelcomeIsNeverRegistered();
  TestUnsubscribeStopsDelivery();
  TestConcurrentPublishAndSubscribe();

  std::cout << "artifact_manager_unit_notification_hub: pass\n";
  return 0;
}
