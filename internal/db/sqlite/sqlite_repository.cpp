#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <sstream>

#include "internal/util/errors.hpp"

namespace millsync::db::sqlite {

using millsync::db::ErrorCode;
using millsync::db::Result;
using millsync::model::EntityRef;
using millsync::model::EntityType;
using millsync::model::MutationOperation;
using millsync::model::MutationPriority;
using millsync::model::MutationStatus;

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Stmt PrepareOrNull(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return Stmt(nullptr, &sqlite3_finalize);
  }
  return Stmt(st, &sqlite3_finalize);
}

// Reads have no Result channel; a statement that cannot be prepared is a broken store.
Stmt PrepareOrThrow(sqlite3* db, const char* sql) {
  auto st = PrepareOrNull(db, sql);
  if (!st) throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (ColIsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (ColIsNull(st, col)) return std::nullopt;
  return ColU64(st, col);
}

// "type:id;type:id"
std::string EncodeDependencies(const std::vector<EntityRef>& refs) {
  std::ostringstream out;
  for (std::size_t i = 0; i < refs.size(); ++i) {
    if (i > 0) out << ';';
    out << static_cast<int>(refs[i].type) << ':' << refs[i].local_id;
  }
  return out.str();
}

std::vector<EntityRef> DecodeDependencies(const std::string& text) {
  std::vector<EntityRef> refs;
  std::istringstream     in(text);
  std::string            token;
  while (std::getline(in, token, ';')) {
    const auto colon = token.find(':');
    if (colon == std::string::npos) {
      throw util::StorageError("corrupt depends_on entry: " + token);
    }
    refs.push_back({static_cast<EntityType>(std::stoi(token.substr(0, colon))), std::stoll(token.substr(colon + 1))});
  }
  return refs;
}

constexpr const char* kEntityColumns =
    "entity_type,local_id,server_id,sync_status,is_deleted,natural_key,body,created_at_ms,updated_at_ms";

model::EntityRecord ReadEntity(sqlite3_stmt* st) {
  model::EntityRecord r;
  r.type          = static_cast<EntityType>(ColI32(st, 0));
  r.local_id      = ColI64(st, 1);
  r.server_id     = ColOptText(st, 2);
  r.sync_status   = static_cast<MutationStatus>(ColI32(st, 3));
  r.is_deleted    = ColI32(st, 4) != 0;
  r.natural_key   = ColText(st, 5);
  r.body          = ColBlob(st, 6);
  r.created_at_ms = ColU64(st, 7);
  r.updated_at_ms = ColU64(st, 8);
  return r;
}

constexpr const char* kMutationColumns =
    "id,sequence,entity_type,entity_id,entity_server_id,operation,status,priority,payload,depends_on,"
    "error_message,retry_count,max_retries,last_attempt_at_ms,next_retry_at_ms,created_at_ms,updated_at_ms";

model::MutationRecord ReadMutation(sqlite3_stmt* st) {
  model::MutationRecord r;
  r.id               = ColText(st, 0);
  r.sequence         = ColU64(st, 1);
  r.entity_type      = static_cast<EntityType>(ColI32(st, 2));
  r.entity_id        = ColI64(st, 3);
  r.entity_server_id = ColOptText(st, 4);
  r.operation        = static_cast<MutationOperation>(ColI32(st, 5));
  r.status           = static_cast<MutationStatus>(ColI32(st, 6));
  r.priority         = static_cast<MutationPriority>(ColI32(st, 7));
  if (!r.payload.ParseFromString(ColBlob(st, 8))) {
    throw util::StorageError("corrupt payload for mutation " + r.id);
  }
  r.depends_on         = DecodeDependencies(ColText(st, 9));
  r.error_message      = ColText(st, 10);
  r.retry_count        = static_cast<uint32_t>(ColI64(st, 11));
  r.max_retries        = static_cast<uint32_t>(ColI64(st, 12));
  r.last_attempt_at_ms = ColOptU64(st, 13);
  r.next_retry_at_ms   = ColOptU64(st, 14);
  r.created_at_ms      = ColU64(st, 15);
  r.updated_at_ms      = ColU64(st, 16);
  return r;
}

// Binds every column except id, starting at `first`.
void BindMutationColumns(sqlite3_stmt* st, int first, const model::MutationRecord& r) {
  std::string payload;
  r.payload.SerializeToString(&payload);

  BindU64(st, first, r.sequence);
  BindI32(st, first + 1, static_cast<int>(r.entity_type));
  BindI64(st, first + 2, r.entity_id);
  BindOptText(st, first + 3, r.entity_server_id);
  BindI32(st, first + 4, static_cast<int>(r.operation));
  BindI32(st, first + 5, static_cast<int>(r.status));
  BindI32(st, first + 6, static_cast<int>(r.priority));
  BindBlob(st, first + 7, payload);
  BindText(st, first + 8, EncodeDependencies(r.depends_on));
  BindText(st, first + 9, r.error_message);
  BindI64(st, first + 10, r.retry_count);
  BindI64(st, first + 11, r.max_retries);
  BindOptU64(st, first + 12, r.last_attempt_at_ms);
  BindOptU64(st, first + 13, r.next_retry_at_ms);
  BindU64(st, first + 14, r.created_at_ms);
  BindU64(st, first + 15, r.updated_at_ms);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

int64_t SqliteRepository::NextSequence(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  auto bump = PrepareOrThrow(db, "INSERT INTO id_sequence(name,value) VALUES(?,1) ON CONFLICT(name) DO UPDATE SET value=value+1;");
  BindText(bump.get(), 1, name);
  if (sqlite3_step(bump.get()) != SQLITE_DONE) {
    throw util::StorageError("advance sequence " + name + ": " + sqlite3_errmsg(db));
  }

  auto read = PrepareOrThrow(db, "SELECT value FROM id_sequence WHERE name=?;");
  BindText(read.get(), 1, name);
  if (sqlite3_step(read.get()) != SQLITE_ROW) {
    throw util::StorageError("read sequence " + name + ": " + sqlite3_errmsg(db));
  }
  return ColI64(read.get(), 0);
}

// ------------------------------------------------------------------
// Entity ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrNull(db,
                          "INSERT INTO entity(entity_type,local_id,server_id,sync_status,is_deleted,natural_key,body,created_at_ms,updated_at_ms) "
                          "VALUES(?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(r.type));
  BindI64(st.get(), 2, r.local_id);
  BindOptText(st.get(), 3, r.server_id);
  BindI32(st.get(), 4, static_cast<int>(r.sync_status));
  BindI32(st.get(), 5, r.is_deleted ? 1 : 0);
  BindText(st.get(), 6, r.natural_key);
  BindBlob(st.get(), 7, r.body);
  BindU64(st.get(), 8, r.created_at_ms);
  BindU64(st.get(), 9, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, millsync::model::ToString(r.Ref()));
  return Translate(db, rc);
}

Result SqliteRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrNull(db,
                          "UPDATE entity SET server_id=?,sync_status=?,is_deleted=?,natural_key=?,body=?,created_at_ms=?,updated_at_ms=? "
                          "WHERE entity_type=? AND local_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindOptText(st.get(), 1, r.server_id);
  BindI32(st.get(), 2, static_cast<int>(r.sync_status));
  BindI32(st.get(), 3, r.is_deleted ? 1 : 0);
  BindText(st.get(), 4, r.natural_key);
  BindBlob(st.get(), 5, r.body);
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.updated_at_ms);
  BindI32(st.get(), 8, static_cast<int>(r.type));
  BindI64(st.get(), 9, r.local_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, millsync::model::ToString(r.Ref()));
  return Translate(db, rc);
}

std::optional<model::EntityRecord> SqliteRepository::GetEntity(Transaction& t, EntityType type, int64_t local_id) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kEntityColumns + " FROM entity WHERE entity_type=? AND local_id=?;";
  auto  st  = PrepareOrThrow(db, sql.c_str());

  BindI32(st.get(), 1, static_cast<int>(type));
  BindI64(st.get(), 2, local_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadEntity(st.get());
}

std::optional<model::EntityRecord> SqliteRepository::FindEntityByServerId(Transaction& t, EntityType type, const std::string& server_id) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kEntityColumns + " FROM entity WHERE entity_type=? AND server_id=? ORDER BY local_id LIMIT 1;";
  auto  st  = PrepareOrThrow(db, sql.c_str());

  BindI32(st.get(), 1, static_cast<int>(type));
  BindText(st.get(), 2, server_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadEntity(st.get());
}

std::optional<model::EntityRecord> SqliteRepository::FindEntityByNaturalKey(Transaction& t, EntityType type, const std::string& natural_key) {
  auto* db = TX(t).Handle();
  auto  sql =
      std::string("SELECT ") + kEntityColumns + " FROM entity WHERE entity_type=? AND natural_key=? AND is_deleted=0 ORDER BY local_id LIMIT 1;";
  auto st = PrepareOrThrow(db, sql.c_str());

  BindI32(st.get(), 1, static_cast<int>(type));
  BindText(st.get(), 2, natural_key);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadEntity(st.get());
}

std::vector<model::EntityRecord> SqliteRepository::ListEntities(Transaction& t, EntityType type, const EntityFilter& filter) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kEntityColumns + " FROM entity WHERE entity_type=?";
  if (filter.unsynced_only) sql += " AND sync_status<>" + std::to_string(static_cast<int>(MutationStatus::kSynced));
  if (!filter.include_deleted) sql += " AND is_deleted=0";
  if (filter.updated_after_ms) sql += " AND updated_at_ms>?";
  sql += " ORDER BY local_id;";

  auto st = PrepareOrThrow(db, sql.c_str());
  BindI32(st.get(), 1, static_cast<int>(type));
  if (filter.updated_after_ms) BindU64(st.get(), 2, *filter.updated_after_ms);

  std::vector<model::EntityRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadEntity(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteEntity(Transaction& t, EntityType type, int64_t local_id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrNull(db, "DELETE FROM entity WHERE entity_type=? AND local_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(type));
  BindI64(st.get(), 2, local_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Stock history
// ------------------------------------------------------------------

Result SqliteRepository::AppendStockMovement(Transaction& t, model::StockMovementRecord& r) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrNull(db,
                          "INSERT INTO stock_movement(item_local_id,kind,quantity_delta,bags_delta,unit_price,reference,note,recorded_at_ms) "
                          "VALUES(?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.item_local_id);
  BindI32(st.get(), 2, static_cast<int>(r.kind));
  BindDouble(st.get(), 3, r.quantity_delta);
  BindI32(st.get(), 4, r.bags_delta);
  BindDouble(st.get(), 5, r.unit_price);
  BindText(st.get(), 6, r.reference);
  BindText(st.get(), 7, r.note);
  BindU64(st.get(), 8, r.recorded_at_ms);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = sqlite3_last_insert_rowid(db);
  return Translate(db, rc);
}

std::vector<model::StockMovementRecord> SqliteRepository::ListStockMovements(Transaction& t, int64_t item_local_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT id,item_local_id,kind,quantity_delta,bags_delta,unit_price,reference,note,recorded_at_ms "
                            "FROM stock_movement WHERE item_local_id=? ORDER BY id;");
  BindI64(st.get(), 1, item_local_id);

  std::vector<model::StockMovementRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::StockMovementRecord r;
    r.id             = ColI64(st.get(), 0);
    r.item_local_id  = ColI64(st.get(), 1);
    r.kind           = static_cast<millsync::v1::MovementKind>(ColI32(st.get(), 2));
    r.quantity_delta = ColDouble(st.get(), 3);
    r.bags_delta     = ColI32(st.get(), 4);
    r.unit_price     = ColDouble(st.get(), 5);
    r.reference      = ColText(st.get(), 6);
    r.note           = ColText(st.get(), 7);
    r.recorded_at_ms = ColU64(st.get(), 8);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Mutation queue
// ------------------------------------------------------------------

Result SqliteRepository::InsertMutation(Transaction& t, const model::MutationRecord& r) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("INSERT INTO sync_queue(") + kMutationColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
  auto  st  = PrepareOrNull(db, sql.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindMutationColumns(st.get(), 2, r);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateMutation(Transaction& t, const model::MutationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db,
                           "UPDATE sync_queue SET sequence=?,entity_type=?,entity_id=?,entity_server_id=?,operation=?,status=?,priority=?,"
                           "payload=?,depends_on=?,error_message=?,retry_count=?,max_retries=?,last_attempt_at_ms=?,next_retry_at_ms=?,"
                           "created_at_ms=?,updated_at_ms=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindMutationColumns(st.get(), 1, r);
  BindText(st.get(), 17, r.id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.id);
  return Translate(db, rc);
}

std::optional<model::MutationRecord> SqliteRepository::GetMutation(Transaction& t, const std::string& id) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kMutationColumns + " FROM sync_queue WHERE id=?;";
  auto  st  = PrepareOrThrow(db, sql.c_str());
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadMutation(st.get());
}

std::vector<model::MutationRecord> SqliteRepository::ListMutations(Transaction& t, const MutationFilter& filter) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kMutationColumns + " FROM sync_queue WHERE 1=1";
  if (filter.status) sql += " AND status=?";
  if (filter.entity) sql += " AND entity_type=? AND entity_id=?";
  sql += " ORDER BY sequence";
  if (filter.limit) sql += " LIMIT " + std::to_string(*filter.limit);
  sql += ";";

  auto st  = PrepareOrThrow(db, sql.c_str());
  int  idx = 1;
  if (filter.status) BindI32(st.get(), idx++, static_cast<int>(*filter.status));
  if (filter.entity) {
    BindI32(st.get(), idx++, static_cast<int>(filter.entity->type));
    BindI64(st.get(), idx++, filter.entity->local_id);
  }

  std::vector<model::MutationRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadMutation(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteMutation(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrNull(db, "DELETE FROM sync_queue WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Pull cursors
// ------------------------------------------------------------------

std::optional<uint64_t> SqliteRepository::GetSyncCursor(Transaction& t, const std::string& scope) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT value_ms FROM sync_cursor WHERE scope=?;");
  BindText(st.get(), 1, scope);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ColU64(st.get(), 0);
}

Result SqliteRepository::SetSyncCursor(Transaction& t, const std::string& scope, uint64_t value_ms) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrNull(db, "INSERT INTO sync_cursor(scope,value_ms) VALUES(?,?) ON CONFLICT(scope) DO UPDATE SET value_ms=excluded.value_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, scope);
  BindU64(st.get(), 2, value_ms);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace millsync::db::sqlite
