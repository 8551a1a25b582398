#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/ledger/entity_ledger.hpp"
#include "internal/sync/sync_queue.hpp"

namespace millsync::sync {

struct PullMergeResult {
  std::size_t             received = 0;
  std::size_t             applied  = 0;
  std::optional<uint64_t> cursor_ms;
};

/*
  Merges `/<kind>/updates` snapshots into the ledger.

  Unknown server ids are inserted as synced rows. A known row takes the
  remote copy only when the remote is newer and the row has nothing waiting
  to be sent; otherwise the local copy wins and goes out on a later pass.
*/
class PullMerger {
 public:
  PullMerger(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::EntityLedger> ledger, std::shared_ptr<SyncQueue> queue);

  static bool SupportsPull(model::EntityType type);

  static std::string CursorScope(model::EntityType type);

  std::optional<uint64_t> Cursor(db::Transaction& tx, model::EntityType type);

  // Parses `json`, merges every entry and advances the cursor. Throws on a malformed body.
  PullMergeResult Merge(db::Transaction& tx, model::EntityType type, const std::string& json);

  // Replaces a known row with the server's copy of it (one entity body as JSON),
  // whatever the local state. Inventory keeps its local stock figures.
  void ApplyServerCopy(db::Transaction& tx, model::EntityRef entity, const std::string& json);

 private:
  template <typename Body>
  bool MergeOne(db::Transaction& tx, Body remote);

  template <typename Body>
  void Overwrite(db::Transaction& tx, int64_t local_id, Body remote);

  void LinkReferences(db::Transaction&, millsync::v1::Customer&) {
  }
  void LinkReferences(db::Transaction&, millsync::v1::InventoryItem&) {
  }
  void LinkReferences(db::Transaction& tx, millsync::v1::Transaction& txn);

  std::optional<int64_t> LocalIdOf(db::Transaction& tx, model::EntityType type, const std::string& server_id);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<ledger::EntityLedger> ledger_;
  std::shared_ptr<SyncQueue>            queue_;
};

} // namespace millsync::sync
