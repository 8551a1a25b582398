#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "millsync/v1/entities.pb.h"

namespace millsync::ledger {

template <typename Body>
struct EntityTraits;

template <>
struct EntityTraits<millsync::v1::Customer> {
  static constexpr model::EntityType kType = model::EntityType::kCustomer;
  static std::string NaturalKey(const millsync::v1::Customer& body) {
    return body.phone();
  }
};

template <>
struct EntityTraits<millsync::v1::InventoryItem> {
  static constexpr model::EntityType kType = model::EntityType::kInventory;
  static std::string NaturalKey(const millsync::v1::InventoryItem& body);
};

template <>
struct EntityTraits<millsync::v1::Transaction> {
  static constexpr model::EntityType kType = model::EntityType::kTransaction;
  static std::string NaturalKey(const millsync::v1::Transaction& body) {
    return body.transaction_number();
  }
};

template <>
struct EntityTraits<millsync::v1::Payment> {
  static constexpr model::EntityType kType = model::EntityType::kPayment;
  static std::string NaturalKey(const millsync::v1::Payment&) {
    return {};
  }
};

template <>
struct EntityTraits<millsync::v1::MillingRecord> {
  static constexpr model::EntityType kType = model::EntityType::kMilling;
  static std::string NaturalKey(const millsync::v1::MillingRecord&) {
    return {};
  }
};

template <>
struct EntityTraits<millsync::v1::User> {
  static constexpr model::EntityType kType = model::EntityType::kUser;
  static std::string NaturalKey(const millsync::v1::User& body) {
    return body.phone();
  }
};

// "paddy:samba"; variety is compared case-insensitively.
std::string InventoryKey(millsync::v1::ItemType type, const std::string& variety);

template <typename Body>
struct Entity {
  db::model::EntityRecord meta;
  Body                    body;

  int64_t LocalId() const {
    return meta.local_id;
  }

  model::EntityRef Ref() const {
    return meta.Ref();
  }
};

/*
  Typed view over the repository's entity rows.

  Local modifications go through Create/Save/Tombstone, which stamp
  updated_at and mark the entity unsynced. The sync engine writes through
  Store(), which leaves timestamps to the caller.
*/
class EntityLedger {
 public:
  EntityLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  template <typename Body>
  Entity<Body> Create(db::Transaction& tx, Body body) {
    const uint64_t now = clock_->NowMillis();

    Entity<Body> entity;
    entity.meta.type          = EntityTraits<Body>::kType;
    entity.meta.local_id      = AllocateLocalId(tx, EntityTraits<Body>::kType);
    entity.meta.sync_status   = model::MutationStatus::kPending;
    entity.meta.created_at_ms = now;
    entity.meta.updated_at_ms = now;
    entity.body               = std::move(body);
    entity.body.set_local_id(entity.meta.local_id);
    entity.body.set_updated_at_ms(now);
    Encode(entity.meta, entity.body);

    db::ThrowIfDbError(repository_->InsertEntity(tx, entity.meta), "insert " + model::ToString(entity.Ref()));
    return entity;
  }

  template <typename Body>
  std::optional<Entity<Body>> Find(db::Transaction& tx, int64_t local_id) {
    auto meta = repository_->GetEntity(tx, EntityTraits<Body>::kType, local_id);
    if (!meta) return std::nullopt;
    return Decode<Body>(*meta);
  }

  // Live entity or util::NotFound.
  template <typename Body>
  Entity<Body> Get(db::Transaction& tx, int64_t local_id) {
    auto entity = Find<Body>(tx, local_id);
    if (!entity || entity->meta.is_deleted) {
      throw util::NotFound(std::string(model::EntityTypeName(EntityTraits<Body>::kType)) + " " + std::to_string(local_id) + " not found");
    }
    return std::move(*entity);
  }

  template <typename Body>
  std::optional<Entity<Body>> FindByServerId(db::Transaction& tx, const std::string& server_id) {
    auto meta = repository_->FindEntityByServerId(tx, EntityTraits<Body>::kType, server_id);
    if (!meta) return std::nullopt;
    return Decode<Body>(*meta);
  }

  template <typename Body>
  std::optional<Entity<Body>> FindByNaturalKey(db::Transaction& tx, const std::string& key) {
    auto meta = repository_->FindEntityByNaturalKey(tx, EntityTraits<Body>::kType, key);
    if (!meta) return std::nullopt;
    return Decode<Body>(*meta);
  }

  template <typename Body>
  std::vector<Entity<Body>> List(db::Transaction& tx, const db::EntityFilter& filter) {
    std::vector<Entity<Body>> out;
    for (const auto& meta : repository_->ListEntities(tx, EntityTraits<Body>::kType, filter)) {
      out.push_back(Decode<Body>(meta));
    }
    return out;
  }

  template <typename Body>
  void Save(db::Transaction& tx, Entity<Body>& entity) {
    entity.meta.sync_status   = model::MutationStatus::kPending;
    entity.meta.updated_at_ms = clock_->NowMillis();
    Encode(entity.meta, entity.body);
    Store(tx, entity.meta);
    entity = Decode<Body>(entity.meta);
  }

  template <typename Body>
  void Tombstone(db::Transaction& tx, Entity<Body>& entity) {
    entity.meta.is_deleted = true;
    Save(tx, entity);
  }

  std::optional<db::model::EntityRecord> Raw(db::Transaction& tx, model::EntityRef ref);

  void Store(db::Transaction& tx, const db::model::EntityRecord& meta);

  // Inserts a row that already exists on the server (pulled). The row is Synced.
  void Adopt(db::Transaction& tx, db::model::EntityRecord& meta);

  // Hard delete; only for tombstones whose Delete synced or rows the server never saw.
  void Remove(db::Transaction& tx, model::EntityRef ref);

  std::optional<std::string> ServerIdOf(db::Transaction& tx, model::EntityRef ref);

  template <typename Body>
  static Entity<Body> Decode(const db::model::EntityRecord& meta) {
    Entity<Body> entity;
    entity.meta = meta;
    if (!entity.body.ParseFromString(meta.body)) {
      throw util::StorageError("corrupt body for " + model::ToString(meta.Ref()));
    }
    entity.body.set_local_id(meta.local_id);
    entity.body.set_server_id(meta.server_id.value_or(""));
    entity.body.set_updated_at_ms(meta.updated_at_ms);
    return entity;
  }

  template <typename Body>
  static void Encode(db::model::EntityRecord& meta, const Body& body) {
    meta.natural_key = EntityTraits<Body>::NaturalKey(body);
    meta.body        = body.SerializeAsString();
  }

 private:
  int64_t AllocateLocalId(db::Transaction& tx, model::EntityType type);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace millsync::ledger
