#pragma once

#include <string>
#include <vector>

#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/mutation_record.hpp"
#include "internal/ledger/entity_ledger.hpp"

namespace millsync::sync {

// Parents whose server ids must be known before the payload can be sent.
std::vector<model::EntityRef> DependenciesOf(const millsync::v1::MutationPayload& payload);

// Snapshot of the entity as the ledger holds it now; a tombstone for deleted rows.
millsync::v1::MutationPayload SnapshotOf(const db::model::EntityRecord& meta);

// True for payloads that carry a full entity body (as opposed to a delta or tombstone).
bool IsSnapshot(const millsync::v1::MutationPayload& payload);

struct Resolution {
  enum class Kind {
    kReady,
    // a server id is not known yet; try again later
    kDeferred,
    // a referenced row no longer exists locally
    kOrphaned,
  };

  Kind                          kind = Kind::kReady;
  std::string                   reason;
  millsync::v1::MutationPayload payload;
};

/*
  Prepares a record for transmission: fills record.entity_server_id for
  Update/Delete and copies every known server id into the nested references
  of the outbound payload. The stored payload is left untouched.
*/
Resolution ResolveOutbound(db::Transaction& tx, ledger::EntityLedger& ledger, db::model::MutationRecord& record);

} // namespace millsync::sync
