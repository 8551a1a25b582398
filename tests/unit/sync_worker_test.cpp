#include "internal/sync/sync_worker.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "support/fakes.hpp"

namespace {

using namespace std::chrono_literals;

using millsync::model::MutationStatus;
using millsync::sync::SyncPassResult;
using millsync::sync::SyncTrigger;
using millsync::sync::SyncTriggerQueue;
using millsync::sync::SyncWorker;
using millsync::testing::Device;
using millsync::testing::Expect;

// Collects pass notifications from the worker thread.
class PassLog {
 public:
  void Record(SyncTrigger trigger, const SyncPassResult& result) {
    {
      std::lock_guard lock(mutex_);
      passes_.push_back({trigger, result.succeeded});
    }
    cv_.notify_all();
  }

  bool WaitFor(std::size_t count, std::chrono::milliseconds timeout = 5s) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return passes_.size() >= count; });
  }

  std::vector<std::pair<SyncTrigger, std::size_t>> Passes() {
    std::lock_guard lock(mutex_);
    return passes_;
  }

 private:
  std::mutex                                       mutex_;
  std::condition_variable                          cv_;
  std::vector<std::pair<SyncTrigger, std::size_t>> passes_;
};

millsync::service::CustomerInput Farmer(const std::string& phone) {
  millsync::service::CustomerInput input;
  input.name  = "Farmer " + phone;
  input.phone = phone;
  return input;
}

void TestTriggerQueueCollapsesDuplicates() {
  SyncTriggerQueue queue;
  queue.Enqueue(SyncTrigger::kExplicit);
  queue.Enqueue(SyncTrigger::kExplicit);
  queue.Enqueue(SyncTrigger::kConnectivityRestored);
  queue.Enqueue(SyncTrigger::kExplicit);

  assert(*queue.Dequeue() == SyncTrigger::kExplicit);
  assert(*queue.Dequeue() == SyncTrigger::kConnectivityRestored);

  // an idle wait with a timeout stands for the periodic tick
  assert(*queue.Dequeue(5ms) == SyncTrigger::kPeriodic);

  queue.Enqueue(SyncTrigger::kAppResumed);
  queue.Shutdown();
  assert(!queue.Dequeue());
  queue.Enqueue(SyncTrigger::kExplicit);
  assert(!queue.Dequeue(5ms));
}

void TestShutdownWakesBlockedConsumer() {
  SyncTriggerQueue queue;
  std::optional<SyncTrigger> got = SyncTrigger::kExplicit;

  std::thread consumer([&] { got = queue.Dequeue(); });
  std::this_thread::sleep_for(20ms);
  queue.Shutdown();
  consumer.join();
  assert(!got);
}

void TestWorkerRunsPassPerTrigger() {
  Device d;
  Expect(d.service().CreateCustomer(Farmer("0771234567")));

  PassLog log;
  d.app.worker->SetPassListener([&](SyncTrigger trigger, const SyncPassResult& result) { log.Record(trigger, result); });
  d.app.worker->Start();
  d.app.worker->Trigger(SyncTrigger::kExplicit);

  assert(log.WaitFor(1));
  assert(log.Passes()[0].first == SyncTrigger::kExplicit);
  assert(log.Passes()[0].second == 1);

  // local writes wake the worker on their own
  Expect(d.service().CreateCustomer(Farmer("0711111111")));
  assert(log.WaitFor(2));

  d.app.worker->Stop();
  assert(d.Records(MutationStatus::kSynced).size() == 2);

  // a second Stop is harmless
  d.app.worker->Stop();
}

void TestWorkerSkipsPassesWhileOffline() {
  Device  d;
  PassLog log;
  d.app.worker->SetPassListener([&](SyncTrigger trigger, const SyncPassResult& result) { log.Record(trigger, result); });
  d.app.worker->Start();

  d.service().OnConnectivityChanged(false);
  assert(!d.app.worker->IsOnline());
  Expect(d.service().CreateCustomer(Farmer("0771234567")));
  d.app.worker->Trigger(SyncTrigger::kAppResumed);
  std::this_thread::sleep_for(100ms);
  assert(log.Passes().empty());
  assert(d.remote->Calls().empty());

  d.service().OnConnectivityChanged(true);
  assert(log.WaitFor(1));
  d.app.worker->Stop();

  assert(d.Records(MutationStatus::kSynced).size() == 1);
}

void TestPeriodicPasses() {
  Device  d;
  auto    triggers = std::make_shared<SyncTriggerQueue>();
  PassLog log;

  SyncWorker worker(triggers, d.app.orchestrator, 10ms);
  worker.SetPassListener([&](SyncTrigger trigger, const SyncPassResult& result) { log.Record(trigger, result); });
  worker.Start();

  assert(log.WaitFor(2));
  worker.Stop();

  for (const auto& pass : log.Passes()) {
    assert(pass.first == SyncTrigger::kPeriodic);
  }
}

void TestStopCancelsPassInFlight() {
  millsync::runtime::config::RuntimeConfig config;
  config.mutable_sync()->set_use_batch_endpoints(false);
  Device slow(config);
  for (const auto* phone : {"0771000001", "0771000002", "0771000003"}) {
    Expect(slow.service().CreateCustomer(Farmer(phone)));
  }

  std::mutex              mutex;
  std::condition_variable cv;
  bool                    entered = false;
  slow.remote->SetHandler([&](const millsync::testing::RecordedCall&) -> std::optional<millsync::remote::RemoteResult> {
    {
      std::lock_guard lock(mutex);
      entered = true;
    }
    cv.notify_all();
    std::this_thread::sleep_for(50ms);
    return std::nullopt;
  });

  slow.app.worker->Start();
  slow.app.worker->Trigger(SyncTrigger::kExplicit);
  {
    std::unique_lock lock(mutex);
    assert(cv.wait_for(lock, 5s, [&] { return entered; }));
  }
  slow.app.worker->Stop();

  std::size_t synced = 0;
  for (const auto& record : slow.Records()) {
    assert(record.status == MutationStatus::kPending || record.status == MutationStatus::kSynced);
    if (record.status == MutationStatus::kSynced) ++synced;
  }
  assert(synced < 3);
}

} // namespace

int main() {
  TestTriggerQueueCollapsesDuplicates();
  TestShutdownWakesBlockedConsumer();
  TestWorkerRunsPassPerTrigger();
  TestWorkerSkipsPassesWhileOffline();
  TestPeriodicPasses();
  TestStopCancelsPassInFlight();

  std::cout << "millsync_unit_sync_worker: pass\n";
  return 0;
}
