#include "mill_service.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <string_view>
#include <type_traits>

#include "internal/ledger/entity_ledger.hpp"
#include "internal/ledger/stock_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sync/payloads.hpp"
#include "internal/sync/reconciler.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/util/errors.hpp"

namespace millsync::service {

using millsync::v1::Customer;
using millsync::v1::InventoryItem;
using millsync::v1::MillingRecord;
using millsync::v1::MutationPayload;
using millsync::v1::Payment;
using millsync::v1::Transaction;
using millsync::v1::TransactionType;
using model::MutationOperation;
using model::MutationPriority;

namespace {

constexpr double kAmountEpsilon = 1e-6;

template <typename Fn>
auto Guard(std::string_view operation, Fn&& fn) -> util::Outcome<std::invoke_result_t<Fn>> {
  using T = std::invoke_result_t<Fn>;
  try {
    return util::Outcome<T>::Ok(fn());
  } catch (const std::exception& e) {
    auto failure = util::ToFailure(e);
    MILLSYNC_LOG_WARN("Operation failed", {observability::StringField("op", operation),
                                           observability::StringField("kind", util::FailureKindName(failure.kind)),
                                           observability::StringField("error", failure.message)});
    return util::Outcome<T>::Fail(std::move(failure));
  }
}

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw util::ValidationError(message);
  }
}

bool Positive(double value) {
  return std::isfinite(value) && value > 0;
}

bool NonNegative(double value) {
  return std::isfinite(value) && value >= 0;
}

millsync::v1::PaymentStatus PaymentStatusFor(double paid, double due) {
  if (due <= kAmountEpsilon) return millsync::v1::PAYMENT_STATUS_COMPLETED;
  if (paid > kAmountEpsilon) return millsync::v1::PAYMENT_STATUS_PARTIAL;
  return millsync::v1::PAYMENT_STATUS_PENDING;
}

std::string ItemLabel(const InventoryItem& item) {
  return item.variety().empty() ? millsync::v1::ItemType_Name(item.type()) : item.variety();
}

void SetBody(MutationPayload& payload, const Customer& body) {
  *payload.mutable_customer() = body;
}
void SetBody(MutationPayload& payload, const InventoryItem& body) {
  *payload.mutable_inventory() = body;
}
void SetBody(MutationPayload& payload, const Transaction& body) {
  *payload.mutable_transaction() = body;
}
void SetBody(MutationPayload& payload, const Payment& body) {
  *payload.mutable_payment() = body;
}
void SetBody(MutationPayload& payload, const MillingRecord& body) {
  *payload.mutable_milling() = body;
}

void ValidateCustomer(const CustomerInput& input) {
  Require(!input.name.empty(), "Customer name is required");
  Require(!input.phone.empty(), "Customer phone is required");
}

void ApplyCustomerInput(const CustomerInput& input, Customer& body) {
  body.set_name(input.name);
  body.set_phone(input.phone);
  body.set_secondary_phone(input.secondary_phone);
  body.set_address(input.address);
  body.set_nic_number(input.nic_number);
  body.set_type(input.type);
  body.set_notes(input.notes);
}

void ApplyInventoryInput(const InventoryItemInput& input, InventoryItem& body) {
  body.set_type(input.type);
  body.set_variety(input.variety);
  body.set_description(input.description);
  body.set_selling_price_per_kg(input.selling_price_per_kg);
  body.set_minimum_stock(input.minimum_stock);
  body.set_warehouse_location(input.warehouse_location);
}

void ValidateInventory(const InventoryItemInput& input) {
  Require(input.type != millsync::v1::ITEM_TYPE_UNSPECIFIED, "Item type is required");
  Require(!input.variety.empty(), "Item variety is required");
  Require(NonNegative(input.selling_price_per_kg) && NonNegative(input.minimum_stock), "Prices and minimum stock cannot be negative");
}

std::string UtcDate(uint64_t unix_ms) {
  const std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
  std::tm           tm{};
  gmtime_r(&secs, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y%m%d");
  return out.str();
}

} // namespace

MillService::MillService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------------
// Queue helpers
// ------------------------------------------------------------------

void MillService::Enqueue(db::Transaction& tx, const db::model::EntityRecord& meta, MutationOperation operation, MutationPayload payload,
                          MutationPriority priority) {
  sync::EnqueueRequest request;
  request.entity = meta.Ref();
  if (meta.server_id && !meta.server_id->empty()) request.entity_server_id = meta.server_id;
  request.operation  = operation;
  request.priority   = priority;
  request.depends_on = sync::DependenciesOf(payload);
  request.payload    = std::move(payload);
  ctx_.queue->Enqueue(tx, std::move(request));
}

template <typename Body>
void MillService::EnqueueSnapshot(db::Transaction& tx, const ledger::Entity<Body>& entity, MutationOperation operation, MutationPriority priority) {
  MutationPayload payload;
  SetBody(payload, entity.body);
  Enqueue(tx, entity.meta, operation, std::move(payload), priority);
}

template <typename Body>
void MillService::EnqueueDelete(db::Transaction& tx, const ledger::Entity<Body>& entity) {
  const bool known = entity.meta.server_id && !entity.meta.server_id->empty();
  if (!known) {
    const auto outstanding = ctx_.queue->OutstandingFor(tx, entity.Ref());
    const bool creating    = std::any_of(outstanding.begin(), outstanding.end(), [](const auto& r) { return r.operation == MutationOperation::kCreate; });

    // the server never saw this row and no Create is on its way
    if (!creating) {
      for (const auto& record : ctx_.queue->RecordsFor(tx, entity.Ref())) {
        ctx_.queue->Remove(tx, record.id);
      }
      ctx_.ledger->Remove(tx, entity.Ref());

      MILLSYNC_LOG_INFO("Unsynced entity removed locally", {observability::StringField("entity", model::ToString(entity.Ref()))});
      return;
    }
  }

  MutationPayload payload;
  payload.mutable_tombstone()->set_local_id(entity.LocalId());
  payload.mutable_tombstone()->set_server_id(entity.meta.server_id.value_or(""));
  Enqueue(tx, entity.meta, MutationOperation::kDelete, std::move(payload), MutationPriority::kLow);
}

void MillService::EnqueueMovement(db::Transaction& tx, const ledger::AppliedMovement& applied) {
  MutationPayload payload;
  *payload.mutable_movement() = applied.ToProto();
  Enqueue(tx, applied.item.meta, MutationOperation::kUpdate, std::move(payload), MutationPriority::kNormal);
}

void MillService::EnsureUniqueCustomerPhone(db::Transaction& tx, const std::string& phone, int64_t self_local_id) {
  auto existing = ctx_.ledger->FindByNaturalKey<Customer>(tx, phone);
  if (existing && existing->LocalId() != self_local_id) {
    throw util::ValidationError("A customer with phone " + phone + " already exists");
  }
}

void MillService::EnsureUniqueInventoryKey(db::Transaction& tx, millsync::v1::ItemType type, const std::string& variety, int64_t self_local_id) {
  auto existing = ctx_.ledger->FindByNaturalKey<InventoryItem>(tx, ledger::InventoryKey(type, variety));
  if (existing && existing->LocalId() != self_local_id) {
    throw util::ValidationError("Inventory item " + variety + " already exists");
  }
}

std::string MillService::NextTransactionNumber(db::Transaction& tx, TransactionType type) {
  const std::string prefix = type == millsync::v1::TRANSACTION_TYPE_BUY ? "BUY" : "SELL";
  const std::string date   = UtcDate(ctx_.clock->NowMillis());
  const auto        count  = ctx_.repository->NextSequence(tx, "txn:" + prefix + ":" + date);

  std::ostringstream out;
  if (!ctx_.device_id.empty()) out << ctx_.device_id << '-';
  out << prefix << '-' << date << '-' << std::setw(4) << std::setfill('0') << count;
  return out.str();
}

void MillService::Wake(sync::SyncTrigger trigger) {
  if (ctx_.worker && online_) {
    ctx_.worker->Trigger(trigger);
  }
}

// ------------------------------------------------------------------
// Customers
// ------------------------------------------------------------------

util::Outcome<Customer> MillService::CreateCustomer(const CustomerInput& input) {
  auto outcome = Guard("create_customer", [&] {
    ValidateCustomer(input);

    auto tx = ctx_.repository->Begin();
    EnsureUniqueCustomerPhone(*tx, input.phone, 0);

    Customer body;
    ApplyCustomerInput(input, body);
    body.set_is_active(true);

    auto customer = ctx_.ledger->Create(*tx, std::move(body));
    EnqueueSnapshot(*tx, customer, MutationOperation::kCreate, MutationPriority::kHigh);
    tx->Commit();

    MILLSYNC_LOG_INFO("Customer created", {observability::IntField("local_id", customer.LocalId()), observability::StringField("name", input.name)});
    return customer.body;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<Customer> MillService::UpdateCustomer(int64_t local_id, const CustomerInput& input) {
  auto outcome = Guard("update_customer", [&] {
    ValidateCustomer(input);

    auto tx       = ctx_.repository->Begin();
    auto customer = ctx_.ledger->Get<Customer>(*tx, local_id);
    EnsureUniqueCustomerPhone(*tx, input.phone, local_id);

    ApplyCustomerInput(input, customer.body);
    ctx_.ledger->Save(*tx, customer);
    EnqueueSnapshot(*tx, customer, MutationOperation::kUpdate);
    tx->Commit();
    return customer.body;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<bool> MillService::DeleteCustomer(int64_t local_id) {
  auto outcome = Guard("delete_customer", [&] {
    auto tx       = ctx_.repository->Begin();
    auto customer = ctx_.ledger->Get<Customer>(*tx, local_id);

    ctx_.ledger->Tombstone(*tx, customer);
    EnqueueDelete(*tx, customer);
    tx->Commit();

    MILLSYNC_LOG_INFO("Customer deleted", {observability::IntField("local_id", local_id)});
    return true;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<Customer> MillService::GetCustomer(int64_t local_id) {
  return Guard("get_customer", [&] {
    auto tx = ctx_.repository->Begin();
    return ctx_.ledger->Get<Customer>(*tx, local_id).body;
  });
}

util::Outcome<std::vector<Customer>> MillService::ListCustomers() {
  return Guard("list_customers", [&] {
    db::EntityFilter filter;
    filter.include_deleted = false;

    auto                  tx = ctx_.repository->Begin();
    std::vector<Customer> out;
    for (auto& customer : ctx_.ledger->List<Customer>(*tx, filter)) {
      out.push_back(std::move(customer.body));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Inventory
// ------------------------------------------------------------------

util::Outcome<InventoryItem> MillService::CreateInventoryItem(const InventoryItemInput& input) {
  auto outcome = Guard("create_inventory_item", [&] {
    ValidateInventory(input);
    Require(NonNegative(input.opening_quantity) && input.opening_bags >= 0, "Opening stock cannot be negative");
    Require(NonNegative(input.opening_price_per_kg), "Opening price cannot be negative");

    auto tx = ctx_.repository->Begin();
    EnsureUniqueInventoryKey(*tx, input.type, input.variety, 0);

    InventoryItem body;
    ApplyInventoryInput(input, body);
    body.set_current_quantity(input.opening_quantity);
    body.set_current_bags(input.opening_bags);
    body.set_opening_quantity(input.opening_quantity);
    body.set_opening_bags(input.opening_bags);
    body.set_average_price_per_kg(input.opening_price_per_kg);
    body.set_is_active(true);

    auto item = ctx_.ledger->Create(*tx, std::move(body));
    if (input.opening_quantity > 0 || input.opening_bags > 0) {
      ctx_.stock->RecordOpening(*tx, item, input.opening_price_per_kg);
    }
    EnqueueSnapshot(*tx, item, MutationOperation::kCreate, MutationPriority::kHigh);
    tx->Commit();

    MILLSYNC_LOG_INFO("Inventory item created", {observability::IntField("local_id", item.LocalId()), observability::StringField("variety", input.variety),
                                                 observability::DoubleField("opening_kg", input.opening_quantity)});
    return item.body;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<InventoryItem> MillService::UpdateInventoryItem(int64_t local_id, const InventoryItemInput& input) {
  auto outcome = Guard("update_inventory_item", [&] {
    ValidateInventory(input);

    auto tx   = ctx_.repository->Begin();
    auto item = ctx_.ledger->Get<InventoryItem>(*tx, local_id);
    EnsureUniqueInventoryKey(*tx, input.type, input.variety, local_id);

    ApplyInventoryInput(input, item.body);
    ctx_.ledger->Save(*tx, item);
    EnqueueSnapshot(*tx, item, MutationOperation::kUpdate);
    tx->Commit();
    return item.body;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<bool> MillService::DeleteInventoryItem(int64_t local_id) {
  auto outcome = Guard("delete_inventory_item", [&] {
    auto tx   = ctx_.repository->Begin();
    auto item = ctx_.ledger->Get<InventoryItem>(*tx, local_id);
    Require(item.body.current_quantity() <= kAmountEpsilon && item.body.current_bags() == 0,
            "Cannot delete " + ItemLabel(item.body) + " while it still holds stock");

    ctx_.ledger->Tombstone(*tx, item);
    EnqueueDelete(*tx, item);
    tx->Commit();
    return true;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<InventoryItem> MillService::AdjustStock(const StockAdjustment& adjustment) {
  auto outcome = Guard("adjust_stock", [&] {
    Require(NonNegative(adjustment.new_quantity) && adjustment.new_bags >= 0, "Adjusted stock cannot be negative");

    auto tx   = ctx_.repository->Begin();
    auto item = ctx_.ledger->Get<InventoryItem>(*tx, adjustment.item_local_id);

    const double  quantity_delta = adjustment.new_quantity - item.body.current_quantity();
    const int32_t bags_delta     = adjustment.new_bags - item.body.current_bags();
    if (std::fabs(quantity_delta) <= kAmountEpsilon && bags_delta == 0) {
      return item.body;
    }

    ledger::MovementRequest request;
    request.item_local_id  = item.LocalId();
    request.kind           = millsync::v1::MOVEMENT_KIND_ADJUSTMENT;
    request.quantity_delta = quantity_delta;
    request.bags_delta     = bags_delta;
    request.note           = adjustment.reason;

    auto applied = ctx_.stock->Apply(*tx, request);
    EnqueueMovement(*tx, applied);
    tx->Commit();

    MILLSYNC_LOG_INFO("Stock adjusted", {observability::IntField("local_id", item.LocalId()), observability::DoubleField("delta_kg", quantity_delta),
                                         observability::StringField("reason", adjustment.reason)});
    return applied.item.body;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<InventoryItem> MillService::GetInventoryItem(int64_t local_id) {
  return Guard("get_inventory_item", [&] {
    auto tx = ctx_.repository->Begin();
    return ctx_.ledger->Get<InventoryItem>(*tx, local_id).body;
  });
}

util::Outcome<std::vector<InventoryItem>> MillService::ListInventory() {
  return Guard("list_inventory", [&] {
    db::EntityFilter filter;
    filter.include_deleted = false;

    auto                       tx = ctx_.repository->Begin();
    std::vector<InventoryItem> out;
    for (auto& item : ctx_.ledger->List<InventoryItem>(*tx, filter)) {
      out.push_back(std::move(item.body));
    }
    return out;
  });
}

util::Outcome<std::vector<millsync::v1::StockMovement>> MillService::ListStockMovements(int64_t item_local_id) {
  return Guard("list_stock_movements", [&] {
    auto tx   = ctx_.repository->Begin();
    auto item = ctx_.ledger->Find<InventoryItem>(*tx, item_local_id);
    if (!item) {
      throw util::NotFound("inventory " + std::to_string(item_local_id) + " not found");
    }

    std::vector<millsync::v1::StockMovement> out;
    for (const auto& record : ctx_.stock->History(*tx, item_local_id)) {
      out.push_back(ledger::AppliedMovement{*item, record}.ToProto());
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Trading
// ------------------------------------------------------------------

Transaction MillService::CreateTrade(TransactionType type, const TransactionInput& input) {
  const bool buying = type == millsync::v1::TRANSACTION_TYPE_BUY;

  Require(!input.items.empty(), "At least one item is required");
  Require(NonNegative(input.discount), "Discount cannot be negative");
  Require(NonNegative(input.paid_amount), "Paid amount cannot be negative");
  for (const auto& line : input.items) {
    Require(Positive(line.quantity), "Item quantity must be greater than zero");
    Require(NonNegative(line.price_per_kg), "Item price cannot be negative");
    Require(line.bags >= 0, "Bag count cannot be negative");
  }

  auto tx       = ctx_.repository->Begin();
  auto customer = ctx_.ledger->Get<Customer>(*tx, input.customer_local_id);

  Transaction body;
  body.set_type(type);
  body.set_status(millsync::v1::TRANSACTION_STATUS_COMPLETED);
  body.set_customer_local_id(customer.LocalId());
  body.set_customer_server_id(customer.meta.server_id.value_or(""));
  body.set_customer_name(customer.body.name());

  std::map<int64_t, double> required;
  double                    subtotal = 0;
  for (const auto& line : input.items) {
    const auto item = ctx_.ledger->Get<InventoryItem>(*tx, line.inventory_local_id);

    auto* entry = body.add_items();
    entry->set_inventory_local_id(item.LocalId());
    entry->set_inventory_server_id(item.meta.server_id.value_or(""));
    entry->set_item_type(item.body.type());
    entry->set_variety(item.body.variety());
    entry->set_bags(line.bags);
    entry->set_quantity(line.quantity);
    entry->set_price_per_kg(line.price_per_kg);
    entry->set_total_amount(line.quantity * line.price_per_kg);

    subtotal += entry->total_amount();
    required[item.LocalId()] += line.quantity;
  }

  const double total = subtotal - input.discount;
  Require(total >= -kAmountEpsilon, "Discount exceeds the transaction subtotal");
  Require(input.paid_amount <= total + kAmountEpsilon, "Paid amount exceeds the transaction total");
  const double due = std::max(0.0, total - input.paid_amount);

  // nothing is written when a sale cannot be covered
  if (!buying) {
    ctx_.stock->EnsureAvailable(*tx, required);
  }

  body.set_transaction_number(NextTransactionNumber(*tx, type));
  body.set_subtotal(subtotal);
  body.set_discount(input.discount);
  body.set_total_amount(total);
  body.set_paid_amount(input.paid_amount);
  body.set_due_amount(due);
  body.set_payment_status(PaymentStatusFor(input.paid_amount, due));
  body.set_payment_method(input.payment_method);
  body.set_notes(input.notes);
  body.set_transaction_date_ms(ctx_.clock->NowMillis());

  auto txn = ctx_.ledger->Create(*tx, std::move(body));
  EnqueueSnapshot(*tx, txn, MutationOperation::kCreate);

  for (const auto& line : txn.body.items()) {
    ledger::MovementRequest request;
    request.item_local_id  = line.inventory_local_id();
    request.kind           = buying ? millsync::v1::MOVEMENT_KIND_STOCK_IN : millsync::v1::MOVEMENT_KIND_STOCK_OUT;
    request.quantity_delta = buying ? line.quantity() : -line.quantity();
    request.bags_delta     = buying ? line.bags() : -line.bags();
    request.unit_price     = buying ? line.price_per_kg() : 0;
    request.reference      = txn.body.transaction_number();

    EnqueueMovement(*tx, ctx_.stock->Apply(*tx, request));
  }

  // balance is positive when the customer owes the mill
  if (buying) {
    customer.body.set_balance(customer.body.balance() - due);
    customer.body.set_total_purchases(customer.body.total_purchases() + total);
  } else {
    customer.body.set_balance(customer.body.balance() + due);
    customer.body.set_total_sales(customer.body.total_sales() + total);
  }
  ctx_.ledger->Save(*tx, customer);
  EnqueueSnapshot(*tx, customer, MutationOperation::kUpdate);

  tx->Commit();

  MILLSYNC_LOG_INFO("Transaction recorded", {observability::StringField("number", txn.body.transaction_number()),
                                             observability::IntField("local_id", txn.LocalId()), observability::DoubleField("total", total),
                                             observability::IntField("lines", txn.body.items_size())});
  return txn.body;
}

util::Outcome<Transaction> MillService::CreateBuyTransaction(const TransactionInput& input) {
  auto outcome = Guard("create_buy", [&] { return CreateTrade(millsync::v1::TRANSACTION_TYPE_BUY, input); });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<Transaction> MillService::CreateSellTransaction(const TransactionInput& input) {
  auto outcome = Guard("create_sell", [&] { return CreateTrade(millsync::v1::TRANSACTION_TYPE_SELL, input); });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<Transaction> MillService::CancelTransaction(int64_t local_id, const std::string& reason) {
  auto outcome = Guard("cancel_transaction", [&] {
    auto tx  = ctx_.repository->Begin();
    auto txn = ctx_.ledger->Get<Transaction>(*tx, local_id);
    Require(txn.body.status() != millsync::v1::TRANSACTION_STATUS_CANCELLED, "Transaction " + txn.body.transaction_number() + " is already cancelled");

    const bool buying = txn.body.type() == millsync::v1::TRANSACTION_TYPE_BUY;

    for (const auto& line : txn.body.items()) {
      ledger::MovementRequest request;
      request.item_local_id  = line.inventory_local_id();
      request.kind           = buying ? millsync::v1::MOVEMENT_KIND_REVERSAL_OUT : millsync::v1::MOVEMENT_KIND_REVERSAL_IN;
      request.quantity_delta = buying ? -line.quantity() : line.quantity();
      request.bags_delta     = buying ? -line.bags() : line.bags();
      request.reference      = txn.body.transaction_number() + "-CANCEL";
      request.note           = reason;

      EnqueueMovement(*tx, ctx_.stock->Apply(*tx, request));
    }

    auto customer = ctx_.ledger->Find<Customer>(*tx, txn.body.customer_local_id());
    if (customer && !customer->meta.is_deleted) {
      const double due   = txn.body.due_amount();
      const double total = txn.body.total_amount();
      if (buying) {
        customer->body.set_balance(customer->body.balance() + due);
        customer->body.set_total_purchases(customer->body.total_purchases() - total);
      } else {
        customer->body.set_balance(customer->body.balance() - due);
        customer->body.set_total_sales(customer->body.total_sales() - total);
      }
      ctx_.ledger->Save(*tx, *customer);
      EnqueueSnapshot(*tx, *customer, MutationOperation::kUpdate);
    }

    txn.body.set_status(millsync::v1::TRANSACTION_STATUS_CANCELLED);
    txn.body.set_cancel_reason(reason);
    ctx_.ledger->Save(*tx, txn);
    EnqueueSnapshot(*tx, txn, MutationOperation::kUpdate);

    tx->Commit();

    MILLSYNC_LOG_INFO("Transaction cancelled", {observability::StringField("number", txn.body.transaction_number()),
                                                observability::StringField("reason", reason)});
    return txn.body;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<Payment> MillService::RecordPayment(const PaymentInput& input) {
  auto outcome = Guard("record_payment", [&] {
    Require(Positive(input.amount), "Payment amount must be greater than zero");

    auto tx  = ctx_.repository->Begin();
    auto txn = ctx_.ledger->Get<Transaction>(*tx, input.transaction_local_id);
    Require(txn.body.status() != millsync::v1::TRANSACTION_STATUS_CANCELLED, "Cannot pay a cancelled transaction");
    Require(input.amount <= txn.body.due_amount() + kAmountEpsilon, "Payment amount exceeds due amount");

    const double paid = txn.body.paid_amount() + input.amount;
    const double due  = std::max(0.0, txn.body.total_amount() - paid);
    txn.body.set_paid_amount(paid);
    txn.body.set_due_amount(due);
    txn.body.set_payment_status(PaymentStatusFor(paid, due));
    txn.body.set_payment_method(input.method);
    ctx_.ledger->Save(*tx, txn);
    EnqueueSnapshot(*tx, txn, MutationOperation::kUpdate);

    Payment body;
    body.set_transaction_local_id(txn.LocalId());
    body.set_transaction_server_id(txn.meta.server_id.value_or(""));
    body.set_amount(input.amount);
    body.set_method(input.method);
    body.set_notes(input.notes);
    body.set_paid_at_ms(ctx_.clock->NowMillis());

    auto payment = ctx_.ledger->Create(*tx, std::move(body));
    EnqueueSnapshot(*tx, payment, MutationOperation::kCreate);

    auto customer = ctx_.ledger->Find<Customer>(*tx, txn.body.customer_local_id());
    if (customer && !customer->meta.is_deleted) {
      const bool buying = txn.body.type() == millsync::v1::TRANSACTION_TYPE_BUY;
      customer->body.set_balance(customer->body.balance() + (buying ? input.amount : -input.amount));
      ctx_.ledger->Save(*tx, *customer);
      EnqueueSnapshot(*tx, *customer, MutationOperation::kUpdate);
    }

    tx->Commit();

    MILLSYNC_LOG_INFO("Payment recorded", {observability::StringField("number", txn.body.transaction_number()),
                                           observability::DoubleField("amount", input.amount), observability::DoubleField("due", due)});
    return payment.body;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<Transaction> MillService::GetTransaction(int64_t local_id) {
  return Guard("get_transaction", [&] {
    auto tx = ctx_.repository->Begin();
    return ctx_.ledger->Get<Transaction>(*tx, local_id).body;
  });
}

util::Outcome<MillingRecord> MillService::RecordMilling(const MillingInput& input) {
  auto outcome = Guard("record_milling", [&] {
    Require(Positive(input.paddy_quantity), "Paddy quantity must be greater than zero");
    Require(Positive(input.rice_quantity), "Rice quantity must be greater than zero");
    Require(input.rice_quantity <= input.paddy_quantity + kAmountEpsilon, "Rice output cannot exceed paddy input");
    Require(input.paddy_bags >= 0 && input.rice_bags >= 0, "Bag count cannot be negative");
    Require(input.paddy_item_local_id != input.rice_item_local_id, "Paddy and rice must be different items");

    auto tx    = ctx_.repository->Begin();
    auto paddy = ctx_.ledger->Get<InventoryItem>(*tx, input.paddy_item_local_id);
    auto rice  = ctx_.ledger->Get<InventoryItem>(*tx, input.rice_item_local_id);
    Require(paddy.body.type() == millsync::v1::ITEM_TYPE_PADDY, ItemLabel(paddy.body) + " is not a paddy item");
    Require(rice.body.type() == millsync::v1::ITEM_TYPE_RICE, ItemLabel(rice.body) + " is not a rice item");

    ctx_.stock->EnsureAvailable(*tx, {{paddy.LocalId(), input.paddy_quantity}});

    MillingRecord body;
    body.set_paddy_item_local_id(paddy.LocalId());
    body.set_paddy_item_server_id(paddy.meta.server_id.value_or(""));
    body.set_rice_item_local_id(rice.LocalId());
    body.set_rice_item_server_id(rice.meta.server_id.value_or(""));
    body.set_paddy_quantity(input.paddy_quantity);
    body.set_paddy_bags(input.paddy_bags);
    body.set_rice_quantity(input.rice_quantity);
    body.set_rice_bags(input.rice_bags);
    body.set_wastage_quantity(input.paddy_quantity - input.rice_quantity);
    body.set_efficiency_percent(input.rice_quantity / input.paddy_quantity * 100.0);
    body.set_notes(input.notes);
    body.set_milled_at_ms(ctx_.clock->NowMillis());

    auto milling = ctx_.ledger->Create(*tx, std::move(body));
    EnqueueSnapshot(*tx, milling, MutationOperation::kCreate);

    const std::string reference = "MILL-" + std::to_string(milling.LocalId());

    ledger::MovementRequest out;
    out.item_local_id  = paddy.LocalId();
    out.kind           = millsync::v1::MOVEMENT_KIND_MILLING_OUT;
    out.quantity_delta = -input.paddy_quantity;
    out.bags_delta     = -input.paddy_bags;
    out.reference      = reference;
    EnqueueMovement(*tx, ctx_.stock->Apply(*tx, out));

    ledger::MovementRequest in;
    in.item_local_id  = rice.LocalId();
    in.kind           = millsync::v1::MOVEMENT_KIND_MILLING_IN;
    in.quantity_delta = input.rice_quantity;
    in.bags_delta     = input.rice_bags;
    in.reference      = reference;
    EnqueueMovement(*tx, ctx_.stock->Apply(*tx, in));

    tx->Commit();

    MILLSYNC_LOG_INFO("Milling recorded", {observability::IntField("local_id", milling.LocalId()), observability::DoubleField("paddy_kg", input.paddy_quantity),
                                           observability::DoubleField("rice_kg", input.rice_quantity),
                                           observability::DoubleField("efficiency", milling.body.efficiency_percent())});
    return milling.body;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

// ------------------------------------------------------------------
// Sync controls
// ------------------------------------------------------------------

util::Outcome<sync::SyncPassResult> MillService::SyncNow() {
  if (!online_) {
    return util::Outcome<sync::SyncPassResult>::Fail(util::Failure::Network("device is offline"));
  }
  if (!ctx_.orchestrator) {
    return util::Outcome<sync::SyncPassResult>::Fail(util::Failure::Server("sync is not configured"));
  }

  auto result = ctx_.orchestrator->RunSyncPass();
  if (result.already_running) {
    return util::Outcome<sync::SyncPassResult>::Fail(util::Failure{util::FailureKind::kSyncConflict, "a sync pass is already running", 0});
  }
  if (result.auth_required) {
    return util::Outcome<sync::SyncPassResult>::Fail(util::Failure::Auth("server rejected the stored credentials"));
  }
  if (result.unreachable && result.succeeded == 0) {
    return util::Outcome<sync::SyncPassResult>::Fail(util::Failure::Network("server unreachable"));
  }
  return util::Outcome<sync::SyncPassResult>::Ok(std::move(result));
}

void MillService::OnConnectivityChanged(bool online) {
  const bool was_online = online_.exchange(online);

  ctx_.status->SetOnline(online);
  if (ctx_.worker) ctx_.worker->SetOnline(online);

  if (online != was_online) {
    MILLSYNC_LOG_INFO("Connectivity changed", {observability::BoolField("online", online)});
  }
  if (online && !was_online) {
    Wake(sync::SyncTrigger::kConnectivityRestored);
  }
}

void MillService::OnAppResumed() {
  Wake(sync::SyncTrigger::kAppResumed);
}

util::Outcome<std::size_t> MillService::GetPendingSyncCount() {
  return Guard("pending_sync_count", [&] {
    auto tx = ctx_.repository->Begin();
    return ctx_.queue->PendingCount(*tx);
  });
}

sync::SyncStatus MillService::GetSyncStatus() const {
  return ctx_.status->Snapshot();
}

util::Outcome<sync::QueueStats> MillService::GetSyncStats() {
  return Guard("sync_stats", [&] {
    auto tx = ctx_.repository->Begin();
    return ctx_.queue->Stats(*tx);
  });
}

util::Outcome<std::vector<SyncIssue>> MillService::ListSyncIssues() {
  return Guard("list_sync_issues", [&] {
    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.queue->ListByStatus(*tx, model::MutationStatus::kFailed);
    for (auto& record : ctx_.queue->ListByStatus(*tx, model::MutationStatus::kConflict)) {
      records.push_back(std::move(record));
    }
    std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });

    std::vector<SyncIssue> issues;
    for (const auto& record : records) {
      issues.push_back(SyncIssue{record.id, record.Entity(), record.operation, record.status, record.error_message, record.retry_count,
                                 record.updated_at_ms});
    }
    return issues;
  });
}

util::Outcome<bool> MillService::ResetForRetry(const std::string& record_id) {
  auto outcome = Guard("reset_for_retry", [&] {
    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.queue->Get(*tx, record_id);

    std::optional<MutationPayload> current;
    auto                           meta = ctx_.ledger->Raw(*tx, record.Entity());
    if (meta && !meta->is_deleted && sync::IsSnapshot(record.payload)) {
      current = sync::SnapshotOf(*meta);
    }

    ctx_.queue->ResetForRetry(*tx, record_id, current);
    ctx_.reconciler->RefreshEntityStatus(*tx, record.Entity());
    tx->Commit();

    MILLSYNC_LOG_INFO("Mutation reset for retry", {observability::StringField("id", record_id)});
    return true;
  });
  if (outcome) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<std::size_t> MillService::RetryAllFailed() {
  auto outcome = Guard("retry_all_failed", [&] {
    auto tx    = ctx_.repository->Begin();
    auto reset = ctx_.queue->ResetAllFailed(*tx);
    for (const auto& record : reset) {
      ctx_.reconciler->RefreshEntityStatus(*tx, record.Entity());
    }
    tx->Commit();
    return reset.size();
  });
  if (outcome && outcome.value() > 0) Wake(sync::SyncTrigger::kExplicit);
  return outcome;
}

util::Outcome<bool> MillService::DiscardConflict(const std::string& record_id) {
  return Guard("discard_conflict", [&] {
    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.queue->Discard(*tx, record_id);
    ctx_.reconciler->RefreshEntityStatus(*tx, record.Entity());
    tx->Commit();
    return true;
  });
}

util::Outcome<bool> MillService::ResolveConflict(const std::string& record_id, ConflictResolution resolution) {
  if (resolution == ConflictResolution::kKeepLocal) {
    return ResetForRetry(record_id);
  }

  if (!online_) {
    return util::Outcome<bool>::Fail(util::Failure::Network("device is offline"));
  }
  if (!ctx_.orchestrator) {
    return util::Outcome<bool>::Fail(util::Failure::Server("sync is not configured"));
  }

  auto outcome = ctx_.orchestrator->KeepServerCopy(record_id);
  if (!outcome) {
    MILLSYNC_LOG_WARN("Operation failed", {observability::StringField("op", "resolve_conflict"),
                                           observability::StringField("kind", util::FailureKindName(outcome.failure().kind)),
                                           observability::StringField("error", outcome.failure().message)});
  }
  return outcome;
}

util::Outcome<std::size_t> MillService::PurgeSynced() {
  return Guard("purge_synced", [&] {
    auto       tx     = ctx_.repository->Begin();
    const auto purged = ctx_.queue->PurgeSynced(*tx);
    tx->Commit();
    return purged;
  });
}

util::Outcome<std::size_t> MillService::RecoverInFlight() {
  return Guard("recover_in_flight", [&] {
    if (ctx_.orchestrator) return ctx_.orchestrator->RecoverInFlight();

    auto       tx        = ctx_.repository->Begin();
    const auto recovered = ctx_.queue->RecoverInFlight(*tx);
    tx->Commit();
    return recovered;
  });
}

} // namespace millsync::service
