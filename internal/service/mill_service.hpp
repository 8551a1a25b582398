#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/mutation_record.hpp"
#include "internal/ledger/stock_ledger.hpp"
#include "internal/service/service_context.hpp"
#include "internal/sync/sync_orchestrator.hpp"
#include "internal/sync/sync_queue.hpp"
#include "internal/sync/sync_status.hpp"
#include "internal/sync/sync_trigger_queue.hpp"
#include "internal/util/failure.hpp"
#include "millsync/v1/entities.pb.h"

namespace millsync::service {

struct CustomerInput {
  std::string                name;
  std::string                phone;
  std::string                secondary_phone;
  std::string                address;
  std::string                nic_number;
  millsync::v1::CustomerType type = millsync::v1::CUSTOMER_TYPE_FARMER;
  std::string                notes;
};

struct InventoryItemInput {
  millsync::v1::ItemType type = millsync::v1::ITEM_TYPE_PADDY;
  std::string            variety;
  std::string            description;

  // Create only; ignored by UpdateInventoryItem
  double  opening_quantity       = 0;
  int32_t opening_bags           = 0;
  double  opening_price_per_kg   = 0;

  double      selling_price_per_kg = 0;
  double      minimum_stock        = 0;
  std::string warehouse_location;
};

struct StockAdjustment {
  int64_t     item_local_id = 0;
  double      new_quantity  = 0;
  int32_t     new_bags      = 0;
  std::string reason;
};

struct LineItemInput {
  int64_t inventory_local_id = 0;
  int32_t bags               = 0;
  double  quantity           = 0;
  double  price_per_kg       = 0;
};

struct TransactionInput {
  int64_t                     customer_local_id = 0;
  std::vector<LineItemInput>  items;
  double                      discount       = 0;
  double                      paid_amount    = 0;
  millsync::v1::PaymentMethod payment_method = millsync::v1::PAYMENT_METHOD_CASH;
  std::string                 notes;
};

struct PaymentInput {
  int64_t                     transaction_local_id = 0;
  double                      amount               = 0;
  millsync::v1::PaymentMethod method               = millsync::v1::PAYMENT_METHOD_CASH;
  std::string                 notes;
};

struct MillingInput {
  int64_t     paddy_item_local_id = 0;
  int64_t     rice_item_local_id  = 0;
  double      paddy_quantity      = 0;
  int32_t     paddy_bags          = 0;
  double      rice_quantity       = 0;
  int32_t     rice_bags           = 0;
  std::string notes;
};

// A Failed or Conflict record waiting for the user.
struct SyncIssue {
  std::string                 id;
  model::EntityRef            entity;
  model::MutationOperation    operation = model::MutationOperation::kUnspecified;
  model::MutationStatus       status    = model::MutationStatus::kFailed;
  std::string                 error_message;
  uint32_t                    retry_count   = 0;
  uint64_t                    updated_at_ms = 0;
};

enum class ConflictResolution {
  // re-send the current local row
  kKeepLocal,
  // fetch the server's copy and store it over the local row
  kKeepServer,
};

/*
  Domain operations of the mill plus the sync controls the UI drives.

  Every write runs as one repository transaction covering the ledger rows,
  the stock history and the queued mutations; a failure anywhere leaves no
  trace. Nothing here throws: failures come back as util::Failure values.
*/
class MillService {
 public:
  explicit MillService(ServiceContext ctx);

  // ---------------------------------------------------------------------
  // Customers
  // ---------------------------------------------------------------------

  util::Outcome<millsync::v1::Customer> CreateCustomer(const CustomerInput& input);
  util::Outcome<millsync::v1::Customer> UpdateCustomer(int64_t local_id, const CustomerInput& input);
  util::Outcome<bool>                   DeleteCustomer(int64_t local_id);
  util::Outcome<millsync::v1::Customer> GetCustomer(int64_t local_id);
  util::Outcome<std::vector<millsync::v1::Customer>> ListCustomers();

  // ---------------------------------------------------------------------
  // Inventory
  // ---------------------------------------------------------------------

  util::Outcome<millsync::v1::InventoryItem> CreateInventoryItem(const InventoryItemInput& input);
  util::Outcome<millsync::v1::InventoryItem> UpdateInventoryItem(int64_t local_id, const InventoryItemInput& input);
  // Only an item with no stock left can be deleted.
  util::Outcome<bool>                        DeleteInventoryItem(int64_t local_id);
  util::Outcome<millsync::v1::InventoryItem> AdjustStock(const StockAdjustment& adjustment);
  util::Outcome<millsync::v1::InventoryItem> GetInventoryItem(int64_t local_id);
  util::Outcome<std::vector<millsync::v1::InventoryItem>> ListInventory();
  util::Outcome<std::vector<millsync::v1::StockMovement>> ListStockMovements(int64_t item_local_id);

  // ---------------------------------------------------------------------
  // Trading
  // ---------------------------------------------------------------------

  util::Outcome<millsync::v1::Transaction>   CreateBuyTransaction(const TransactionInput& input);
  util::Outcome<millsync::v1::Transaction>   CreateSellTransaction(const TransactionInput& input);
  util::Outcome<millsync::v1::Transaction>   CancelTransaction(int64_t local_id, const std::string& reason);
  util::Outcome<millsync::v1::Payment>       RecordPayment(const PaymentInput& input);
  util::Outcome<millsync::v1::Transaction>   GetTransaction(int64_t local_id);
  util::Outcome<millsync::v1::MillingRecord> RecordMilling(const MillingInput& input);

  // ---------------------------------------------------------------------
  // Sync controls
  // ---------------------------------------------------------------------

  // Runs a pass on the calling thread. Network failure while offline.
  util::Outcome<sync::SyncPassResult> SyncNow();

  void OnConnectivityChanged(bool online);

  // App came back to the foreground.
  void OnAppResumed();

  util::Outcome<std::size_t>            GetPendingSyncCount();
  sync::SyncStatus                      GetSyncStatus() const;
  util::Outcome<sync::QueueStats>       GetSyncStats();
  util::Outcome<std::vector<SyncIssue>> ListSyncIssues();
  util::Outcome<bool>                   ResetForRetry(const std::string& record_id);
  util::Outcome<std::size_t>            RetryAllFailed();
  util::Outcome<bool>                   DiscardConflict(const std::string& record_id);
  util::Outcome<bool>                   ResolveConflict(const std::string& record_id, ConflictResolution resolution);
  util::Outcome<std::size_t>            PurgeSynced();
  util::Outcome<std::size_t>            RecoverInFlight();

 private:
  millsync::v1::Transaction CreateTrade(millsync::v1::TransactionType type, const TransactionInput& input);

  std::string NextTransactionNumber(db::Transaction& tx, millsync::v1::TransactionType type);

  void Enqueue(db::Transaction& tx, const db::model::EntityRecord& meta, model::MutationOperation operation, millsync::v1::MutationPayload payload,
               model::MutationPriority priority);

  template <typename Body>
  void EnqueueSnapshot(db::Transaction& tx, const ledger::Entity<Body>& entity, model::MutationOperation operation,
                       model::MutationPriority priority = model::MutationPriority::kNormal);

  template <typename Body>
  void EnqueueDelete(db::Transaction& tx, const ledger::Entity<Body>& entity);

  void EnqueueMovement(db::Transaction& tx, const ledger::AppliedMovement& applied);

  void EnsureUniqueCustomerPhone(db::Transaction& tx, const std::string& phone, int64_t self_local_id);
  void EnsureUniqueInventoryKey(db::Transaction& tx, millsync::v1::ItemType type, const std::string& variety, int64_t self_local_id);

  void Wake(sync::SyncTrigger trigger);

  ServiceContext    ctx_;
  std::atomic<bool> online_{true};
};

} // namespace millsync::service
