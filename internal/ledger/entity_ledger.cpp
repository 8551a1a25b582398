#include "entity_ledger.hpp"

#include <algorithm>
#include <cctype>

namespace millsync::ledger {

std::string EntityTraits<millsync::v1::InventoryItem>::NaturalKey(const millsync::v1::InventoryItem& body) {
  return InventoryKey(body.type(), body.variety());
}

std::string InventoryKey(millsync::v1::ItemType type, const std::string& variety) {
  std::string key = millsync::v1::ItemType_Name(type) + ":" + variety;
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return key;
}

EntityLedger::EntityLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

std::optional<db::model::EntityRecord> EntityLedger::Raw(db::Transaction& tx, model::EntityRef ref) {
  return repository_->GetEntity(tx, ref.type, ref.local_id);
}

void EntityLedger::Store(db::Transaction& tx, const db::model::EntityRecord& meta) {
  db::ThrowIfDbError(repository_->UpdateEntity(tx, meta), "update " + model::ToString(meta.Ref()));
}

void EntityLedger::Adopt(db::Transaction& tx, db::model::EntityRecord& meta) {
  meta.local_id    = AllocateLocalId(tx, meta.type);
  meta.sync_status = model::MutationStatus::kSynced;
  if (meta.created_at_ms == 0) meta.created_at_ms = clock_->NowMillis();
  db::ThrowIfDbError(repository_->InsertEntity(tx, meta), "adopt " + model::ToString(meta.Ref()));
}

void EntityLedger::Remove(db::Transaction& tx, model::EntityRef ref) {
  db::ThrowIfDbError(repository_->DeleteEntity(tx, ref.type, ref.local_id), "remove " + model::ToString(ref));
}

std::optional<std::string> EntityLedger::ServerIdOf(db::Transaction& tx, model::EntityRef ref) {
  auto meta = Raw(tx, ref);
  if (!meta || !meta->server_id || meta->server_id->empty()) return std::nullopt;
  return meta->server_id;
}

int64_t EntityLedger::AllocateLocalId(db::Transaction& tx, model::EntityType type) {
  return repository_->NextSequence(tx, "entity:" + std::string(model::EntityTypeName(type)));
}

} // namespace millsync::ledger
