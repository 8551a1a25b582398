#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/factory.hpp"
#include "internal/remote/endpoints.hpp"
#include "internal/remote/json_codec.hpp"
#include "internal/remote/remote_api.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "millsync/v1.hpp"

namespace millsync::testing {

class ManualClock final : public util::Clock {
 public:
  explicit ManualClock(uint64_t start_ms = 1'700'000'000'000ULL) : now_ms_(start_ms) {
  }

  util::TimePoint Now() const override {
    return util::FromUnixMillis(now_ms_.load());
  }

  void Advance(std::chrono::milliseconds delta) {
    now_ms_ += static_cast<uint64_t>(delta.count());
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

class SequentialIds final : public util::IdGenerator {
 public:
  std::string Next() override {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "mut-%04d", ++next_);
    return buf;
  }

 private:
  int next_ = 0;
};

struct RecordedCall {
  remote::HttpMethod method = remote::HttpMethod::kGet;
  std::string        path;
  std::string        body;
};

/*
  In-process stand-in for the ERP server.

  Without a handler it behaves like a healthy server: creates get "srv-N"
  ids, batch creates acknowledge every entry, updates echo the id in the
  path, deletes answer empty. A handler sees every call first and may answer
  it by returning a result.
*/
class FakeRemoteApi final : public remote::RemoteApi {
 public:
  using Handler = std::function<std::optional<remote::RemoteResult>(const RecordedCall&)>;

  void SetOffline(bool offline) {
    std::lock_guard lock(mutex_);
    offline_ = offline;
  }

  void SetHandler(Handler handler) {
    std::lock_guard lock(mutex_);
    handler_ = std::move(handler);
  }

  // Body served for GET <collection>/updates.
  void SetUpdates(model::EntityType type, std::string json) {
    std::lock_guard lock(mutex_);
    updates_[remote::CollectionPath(type)] = std::move(json);
  }

  std::vector<RecordedCall> Calls() {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  std::size_t CountCalls(remote::HttpMethod method, const std::string& path_prefix) {
    std::lock_guard lock(mutex_);
    std::size_t     count = 0;
    for (const auto& call : calls_) {
      if (call.method == method && call.path.rfind(path_prefix, 0) == 0) ++count;
    }
    return count;
  }

  void ClearCalls() {
    std::lock_guard lock(mutex_);
    calls_.clear();
  }

  remote::RemoteResult Get(const std::string& path, const util::CancelToken& cancel) override {
    return Dispatch({remote::HttpMethod::kGet, path, {}}, cancel);
  }

  remote::RemoteResult Post(const std::string& path, const std::string& json_body, const util::CancelToken& cancel) override {
    return Dispatch({remote::HttpMethod::kPost, path, json_body}, cancel);
  }

  remote::RemoteResult Put(const std::string& path, const std::string& json_body, const util::CancelToken& cancel) override {
    return Dispatch({remote::HttpMethod::kPut, path, json_body}, cancel);
  }

  remote::RemoteResult Patch(const std::string& path, const std::string& json_body, const util::CancelToken& cancel) override {
    return Dispatch({remote::HttpMethod::kPatch, path, json_body}, cancel);
  }

  remote::RemoteResult Delete(const std::string& path, const util::CancelToken& cancel) override {
    return Dispatch({remote::HttpMethod::kDelete, path, {}}, cancel);
  }

  static remote::RemoteResult Answer(int status_code, std::string data = {}, std::string message = {}) {
    remote::Response response;
    response.success     = status_code >= 200 && status_code < 300;
    response.status_code = status_code;
    response.data        = std::move(data);
    response.message     = std::move(message);
    return remote::RemoteResult::Ok(std::move(response));
  }

  static std::string Ack(const std::string& server_id) {
    millsync::v1::SyncedEntity ack;
    ack.set_server_id(server_id);
    return remote::ToJson(ack);
  }

 private:
  remote::RemoteResult Dispatch(RecordedCall call, const util::CancelToken& cancel) {
    Handler handler;
    {
      std::lock_guard lock(mutex_);
      calls_.push_back(call);
      if (offline_) return remote::RemoteResult::Fail(util::Failure::Network("connection refused"));
      handler = handler_;
    }
    if (cancel.IsCancelled()) return remote::RemoteResult::Fail(util::Failure::Network("cancelled"));

    if (handler) {
      if (auto answered = handler(call)) return std::move(*answered);
    }
    return Serve(call);
  }

  remote::RemoteResult Serve(const RecordedCall& call) {
    std::lock_guard lock(mutex_);

    const auto last_slash = call.path.find_last_of('/');
    const auto tail       = call.path.substr(last_slash + 1);

    switch (call.method) {
      case remote::HttpMethod::kGet: {
        const auto pos = call.path.find("/updates");
        if (pos == std::string::npos) return Answer(404);
        auto it = updates_.find(call.path.substr(0, pos));
        return Answer(200, it == updates_.end() ? std::string{} : it->second);
      }

      case remote::HttpMethod::kPost:
        if (tail == "batch") return Answer(200, BatchAck(call));
        if (tail == "add-stock" || tail == "deduct-stock" || tail == "adjust") return Answer(200, "{}");
        return Answer(201, Ack("srv-" + std::to_string(++next_server_id_)));

      case remote::HttpMethod::kPut:
      case remote::HttpMethod::kPatch:
        return Answer(200, Ack(tail));

      case remote::HttpMethod::kDelete:
        return Answer(200);
    }
    return Answer(500);
  }

  std::string BatchAck(const RecordedCall& call) {
    std::vector<int64_t> local_ids;
    if (call.path.rfind("/customers", 0) == 0) {
      millsync::v1::CustomerList list;
      remote::FromJson(call.body, &list);
      for (const auto& entry : list.customers()) local_ids.push_back(entry.local_id());
    } else if (call.path.rfind("/inventory", 0) == 0) {
      millsync::v1::InventoryList list;
      remote::FromJson(call.body, &list);
      for (const auto& entry : list.inventory()) local_ids.push_back(entry.local_id());
    } else {
      millsync::v1::TransactionList list;
      remote::FromJson(call.body, &list);
      for (const auto& entry : list.transactions()) local_ids.push_back(entry.local_id());
    }

    millsync::v1::BatchSyncResponse response;
    for (const auto local_id : local_ids) {
      auto* synced = response.add_synced();
      synced->set_local_id(local_id);
      synced->set_server_id("srv-" + std::to_string(++next_server_id_));
    }
    return remote::ToJson(response);
  }

  std::mutex                         mutex_;
  bool                               offline_ = false;
  Handler                            handler_;
  std::map<std::string, std::string> updates_;
  std::vector<RecordedCall>          calls_;
  int                                next_server_id_ = 0;
};

// One device wired the way the factory wires it, over memory storage and the fakes above.
struct Device {
  std::shared_ptr<ManualClock>   clock  = std::make_shared<ManualClock>();
  std::shared_ptr<FakeRemoteApi> remote = std::make_shared<FakeRemoteApi>();
  factory::Application           app;

  explicit Device(millsync::runtime::config::RuntimeConfig config = {}) {
    factory::Overrides overrides;
    overrides.clock = clock;
    overrides.ids   = std::make_shared<SequentialIds>();
    app             = factory::Build(config, remote, overrides);
  }

  service::MillService& service() {
    return *app.service;
  }

  std::vector<db::model::MutationRecord> Records(std::optional<model::MutationStatus> status = std::nullopt) {
    auto tx = app.repository->Begin();
    return app.queue->ListByStatus(*tx, status);
  }

  db::model::EntityRecord Entity(model::EntityType type, int64_t local_id) {
    auto tx   = app.repository->Begin();
    auto meta = app.ledger->Raw(*tx, {type, local_id});
    if (!meta) throw util::NotFound(model::ToString({type, local_id}));
    return *meta;
  }

  bool HasEntity(model::EntityType type, int64_t local_id) {
    auto tx = app.repository->Begin();
    return app.ledger->Raw(*tx, {type, local_id}).has_value();
  }
};

template <typename T>
T Expect(const util::Outcome<T>& outcome) {
  if (!outcome) {
    std::fprintf(stderr, "unexpected failure: %s\n", outcome.failure().message.c_str());
  }
  return outcome.value();
}

} // namespace millsync::testing
