// db::model headers open millsync::db::model; the filter types must still
// name the top-level sync enums when they are included afterwards.
#include "internal/db/model/mutation_record.hpp"
#include "internal/db/api/types.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using millsync::db::MutationFilter;
using millsync::db::model::MutationRecord;
using millsync::model::EntityRef;
using millsync::model::EntityType;
using millsync::model::MutationOperation;
using millsync::model::MutationStatus;

MutationRecord Record(const std::string& id, int64_t sequence, EntityRef entity, MutationStatus status) {
  MutationRecord r;
  r.id          = id;
  r.sequence    = sequence;
  r.entity_type = entity.type;
  r.entity_id   = entity.local_id;
  r.operation   = MutationOperation::kCreate;
  r.status      = status;
  r.payload.mutable_customer()->set_local_id(entity.local_id);
  return r;
}

void TestFilterByStatusAndEntity() {
  millsync::db::memory::MemoryRepository repo;

  const EntityRef first{EntityType::kCustomer, 1};
  const EntityRef second{EntityType::kCustomer, 2};
  {
    auto tx = repo.Begin();
    assert(repo.InsertMutation(*tx, Record("a", 1, first, MutationStatus::kPending)));
    assert(repo.InsertMutation(*tx, Record("b", 2, second, MutationStatus::kConflict)));
    assert(repo.InsertMutation(*tx, Record("c", 3, first, MutationStatus::kConflict)));
    tx->Commit();
  }

  auto tx = repo.Begin();

  MutationFilter conflicts;
  conflicts.status = MutationStatus::kConflict;
  auto listed      = repo.ListMutations(*tx, conflicts);
  assert(listed.size() == 2);
  assert(listed[0].id == "b");
  assert(listed[1].id == "c");

  MutationFilter for_first;
  for_first.entity = first;
  for_first.limit  = 1;
  listed           = repo.ListMutations(*tx, for_first);
  assert(listed.size() == 1);
  assert(listed[0].id == "a");
}

} // namespace

int main() {
  TestFilterByStatusAndEntity();

  std::cout << "millsync_unit_mutation_filter: pass\n";
  return 0;
}
