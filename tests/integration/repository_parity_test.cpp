#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"

namespace {

using millsync::db::EntityFilter;
using millsync::db::MutationFilter;
using millsync::db::Repository;
using millsync::db::memory::MemoryRepository;
using millsync::db::model::EntityRecord;
using millsync::db::model::MutationRecord;
using millsync::db::model::StockMovementRecord;
using millsync::model::EntityRef;
using millsync::model::EntityType;
using millsync::model::MutationOperation;
using millsync::model::MutationPriority;
using millsync::model::MutationStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

EntityRecord Customer(int64_t local_id, const std::string& phone, uint64_t updated_at_ms) {
  EntityRecord record;
  record.type          = EntityType::kCustomer;
  record.local_id      = local_id;
  record.natural_key   = phone;
  record.body          = std::string("\x0a\x03" "abc", 5);
  record.created_at_ms = updated_at_ms;
  record.updated_at_ms = updated_at_ms;
  return record;
}

MutationRecord Mutation(const std::string& id, uint64_t sequence, EntityRef entity) {
  MutationRecord record;
  record.id            = id;
  record.sequence      = sequence;
  record.entity_type   = entity.type;
  record.entity_id     = entity.local_id;
  record.operation     = MutationOperation::kCreate;
  record.created_at_ms = 1000 + sequence;
  record.updated_at_ms = 1000 + sequence;
  record.payload.mutable_customer()->set_name("Customer " + id);
  return record;
}

void VerifyEntityLedger(Repository& repo) {
  auto tx = repo.Begin();

  auto first = Customer(1, "0771234567", 100);
  assert(repo.InsertEntity(*tx, first));
  assert(!repo.InsertEntity(*tx, first));
  assert(repo.InsertEntity(*tx, Customer(2, "0711111111", 200)));

  auto loaded = repo.GetEntity(*tx, EntityType::kCustomer, 1);
  assert(loaded.has_value());
  assert(loaded->body == first.body);
  assert(!loaded->server_id);
  assert(loaded->sync_status == MutationStatus::kPending);
  assert(!repo.GetEntity(*tx, EntityType::kInventory, 1));

  loaded->server_id   = "srv-1";
  loaded->sync_status = MutationStatus::kSynced;
  assert(repo.UpdateEntity(*tx, *loaded));
  assert(!repo.UpdateEntity(*tx, Customer(99, "", 0)));

  auto by_server = repo.FindEntityByServerId(*tx, EntityType::kCustomer, "srv-1");
  assert(by_server && by_server->local_id == 1);
  assert(!repo.FindEntityByServerId(*tx, EntityType::kInventory, "srv-1"));

  auto by_key = repo.FindEntityByNaturalKey(*tx, EntityType::kCustomer, "0711111111");
  assert(by_key && by_key->local_id == 2);

  by_key->is_deleted = true;
  assert(repo.UpdateEntity(*tx, *by_key));
  assert(!repo.FindEntityByNaturalKey(*tx, EntityType::kCustomer, "0711111111"));

  assert(repo.ListEntities(*tx, EntityType::kCustomer, {}).size() == 2);

  EntityFilter live;
  live.include_deleted = false;
  const auto live_rows = repo.ListEntities(*tx, EntityType::kCustomer, live);
  assert(live_rows.size() == 1 && live_rows[0].local_id == 1);

  EntityFilter unsynced;
  unsynced.unsynced_only = true;
  const auto unsynced_rows = repo.ListEntities(*tx, EntityType::kCustomer, unsynced);
  assert(unsynced_rows.size() == 1 && unsynced_rows[0].local_id == 2);

  EntityFilter recent;
  recent.updated_after_ms = 150;
  const auto recent_rows = repo.ListEntities(*tx, EntityType::kCustomer, recent);
  assert(recent_rows.size() == 1 && recent_rows[0].local_id == 2);

  assert(repo.DeleteEntity(*tx, EntityType::kCustomer, 2));
  assert(!repo.GetEntity(*tx, EntityType::kCustomer, 2));

  tx->Commit();
}

void VerifySequences(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.NextSequence(*tx, "txn:BUY:20231114") == 1);
  assert(repo.NextSequence(*tx, "txn:BUY:20231114") == 2);
  assert(repo.NextSequence(*tx, "txn:SELL:20231114") == 1);
  tx->Commit();

  auto next = repo.Begin();
  assert(repo.NextSequence(*next, "txn:BUY:20231114") == 3);
  next->Rollback();

  auto again = repo.Begin();
  assert(repo.NextSequence(*again, "txn:BUY:20231114") == 3);
  again->Commit();
}

void VerifyStockHistory(Repository& repo) {
  auto tx = repo.Begin();

  std::vector<int64_t> ids;
  for (int i = 0; i < 3; ++i) {
    StockMovementRecord movement;
    movement.item_local_id  = 7;
    movement.kind           = i == 0 ? millsync::v1::MOVEMENT_KIND_OPENING : millsync::v1::MOVEMENT_KIND_STOCK_IN;
    movement.quantity_delta = 100.5 * (i + 1);
    movement.bags_delta     = i + 1;
    movement.unit_price     = 52.25;
    movement.reference      = "BUY-20231114-000" + std::to_string(i);
    movement.note           = "note " + std::to_string(i);
    movement.recorded_at_ms = 5000 + i;
    assert(repo.AppendStockMovement(*tx, movement));
    assert(movement.id > 0);
    ids.push_back(movement.id);
  }

  StockMovementRecord other;
  other.item_local_id  = 8;
  other.kind           = millsync::v1::MOVEMENT_KIND_STOCK_OUT;
  other.quantity_delta = -10;
  assert(repo.AppendStockMovement(*tx, other));

  assert(ids[0] < ids[1] && ids[1] < ids[2]);

  const auto history = repo.ListStockMovements(*tx, 7);
  assert(history.size() == 3);
  for (std::size_t i = 0; i < history.size(); ++i) {
    assert(history[i].id == ids[i]);
    assert(history[i].bags_delta == static_cast<int32_t>(i + 1));
    assert(history[i].reference == "BUY-20231114-000" + std::to_string(i));
  }
  assert(history[0].kind == millsync::v1::MOVEMENT_KIND_OPENING);
  assert(history[2].quantity_delta == 301.5);
  assert(history[2].unit_price == 52.25);
  assert(history[2].note == "note 2");
  assert(history[2].recorded_at_ms == 5002);

  assert(repo.ListStockMovements(*tx, 8).size() == 1);
  assert(repo.ListStockMovements(*tx, 9).empty());

  tx->Commit();
}

void VerifyMutationQueue(Repository& repo) {
  auto tx = repo.Begin();

  const EntityRef customer{EntityType::kCustomer, 1};
  const EntityRef txn{EntityType::kTransaction, 4};

  auto third = Mutation("m-3", 3, customer);
  third.operation          = MutationOperation::kUpdate;
  third.entity_server_id   = "srv-1";
  third.status             = MutationStatus::kFailed;
  third.priority           = MutationPriority::kHigh;
  third.error_message      = "HTTP 503: busy";
  third.retry_count        = 2;
  third.max_retries        = 5;
  third.last_attempt_at_ms = 7000;
  third.next_retry_at_ms   = 9000;

  auto second = Mutation("m-2", 2, txn);
  second.depends_on = {customer, EntityRef{EntityType::kInventory, 2}};

  assert(repo.InsertMutation(*tx, third));
  assert(repo.InsertMutation(*tx, Mutation("m-1", 1, customer)));
  assert(repo.InsertMutation(*tx, second));
  assert(!repo.InsertMutation(*tx, Mutation("m-1", 10, customer)));
  assert(!repo.InsertMutation(*tx, Mutation("m-x", 2, customer)));

  const auto all = repo.ListMutations(*tx, {});
  assert(all.size() == 3);
  assert(all[0].id == "m-1" && all[1].id == "m-2" && all[2].id == "m-3");

  const auto loaded = repo.GetMutation(*tx, "m-3");
  assert(loaded.has_value());
  assert(loaded->operation == MutationOperation::kUpdate);
  assert(loaded->entity_server_id == std::optional<std::string>("srv-1"));
  assert(loaded->status == MutationStatus::kFailed);
  assert(loaded->priority == MutationPriority::kHigh);
  assert(loaded->error_message == "HTTP 503: busy");
  assert(loaded->retry_count == 2 && loaded->max_retries == 5);
  assert(loaded->last_attempt_at_ms == std::optional<uint64_t>(7000));
  assert(loaded->next_retry_at_ms == std::optional<uint64_t>(9000));
  assert(loaded->payload.customer().name() == "Customer m-3");

  const auto with_deps = repo.GetMutation(*tx, "m-2");
  assert(with_deps->depends_on.size() == 2);
  assert(with_deps->depends_on[0] == customer);
  assert(with_deps->depends_on[1] == (EntityRef{EntityType::kInventory, 2}));
  assert(!with_deps->entity_server_id);
  assert(!with_deps->next_retry_at_ms);

  MutationFilter by_status;
  by_status.status = MutationStatus::kPending;
  assert(repo.ListMutations(*tx, by_status).size() == 2);

  MutationFilter by_entity;
  by_entity.entity = customer;
  const auto for_customer = repo.ListMutations(*tx, by_entity);
  assert(for_customer.size() == 2);
  assert(for_customer[0].id == "m-1" && for_customer[1].id == "m-3");

  MutationFilter limited;
  limited.limit = 1;
  assert(repo.ListMutations(*tx, limited).size() == 1);

  auto update   = *loaded;
  update.status = MutationStatus::kPending;
  update.next_retry_at_ms.reset();
  assert(repo.UpdateMutation(*tx, update));
  assert(!repo.GetMutation(*tx, "m-3")->next_retry_at_ms);
  assert(!repo.UpdateMutation(*tx, Mutation("missing", 42, customer)));

  assert(repo.DeleteMutation(*tx, "m-1"));
  assert(!repo.GetMutation(*tx, "m-1"));
  assert(repo.ListMutations(*tx, {}).size() == 2);

  tx->Commit();
}

void VerifyCursors(Repository& repo) {
  auto tx = repo.Begin();
  assert(!repo.GetSyncCursor(*tx, "pull:customer"));
  assert(repo.SetSyncCursor(*tx, "pull:customer", 1700000000123ULL));
  assert(repo.SetSyncCursor(*tx, "pull:customer", 1700000000456ULL));
  assert(*repo.GetSyncCursor(*tx, "pull:customer") == 1700000000456ULL);
  assert(!repo.GetSyncCursor(*tx, "pull:inventory"));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, Customer(50, "0700000050", 1)));
    assert(repo.InsertMutation(*tx, Mutation("rolled-back", 500, EntityRef{EntityType::kCustomer, 50})));
    tx->Rollback();
  }
  {
    // dropped without Commit
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, Customer(51, "0700000051", 1)));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetEntity(*check_tx, EntityType::kCustomer, 50));
  assert(!repo.GetEntity(*check_tx, EntityType::kCustomer, 51));
  assert(!repo.GetMutation(*check_tx, "rolled-back"));
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    auto row      = Customer(300, "0770000300", 3000);
    row.server_id = "srv-300";
    assert(repo->InsertEntity(*tx, row));
    assert(repo->InsertMutation(*tx, Mutation("durable", 3000, row.Ref())));
    assert(repo->SetSyncCursor(*tx, "pull:transaction", 3000));
    assert(repo->NextSequence(*tx, "durable") == 1);
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto row = repo->GetEntity(*tx, EntityType::kCustomer, 300);
  assert(row.has_value());
  assert(row->server_id == std::optional<std::string>("srv-300"));
  assert(repo->GetMutation(*tx, "durable").has_value());
  assert(*repo->GetSyncCursor(*tx, "pull:transaction") == 3000);
  assert(repo->NextSequence(*tx, "durable") == 2);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("millsync_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<millsync::db::sqlite::SqliteDB>(db_path);
    millsync::db::sqlite::ApplySchema(*db);
    return std::make_shared<millsync::db::sqlite::SqliteRepository>(db);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::error_code ec;
        std::filesystem::remove(db_path, ec);
        std::filesystem::remove(db_path + "-wal", ec);
        std::filesystem::remove(db_path + "-shm", ec);
      },
  };
}

void VerifySchemaIsIdempotent() {
  const auto db_path = (std::filesystem::temp_directory_path() / ("millsync_schema_" + std::to_string(NowMs()) + ".db")).string();
  {
    millsync::db::sqlite::SqliteDB db(db_path);
    assert(millsync::db::sqlite::ApplySchema(db) == static_cast<int>(millsync::db::sqlite::SchemaMigrations().size()));
    assert(millsync::db::sqlite::ApplySchema(db) == 0);
  }
  std::error_code ec;
  std::filesystem::remove(db_path, ec);
  std::filesystem::remove(db_path + "-wal", ec);
  std::filesystem::remove(db_path + "-shm", ec);
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyEntityLedger(*repo);
  VerifySequences(*repo);
  VerifyStockHistory(*repo);
  VerifyMutationQueue(*repo);
  VerifyCursors(*repo);
  VerifyRollbackBehavior(*repo);

  repo.reset();
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifySchemaIsIdempotent();

  std::cout << "millsync_integration_repository_parity: pass\n";
  return 0;
}
