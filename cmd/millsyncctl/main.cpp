#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/offline_remote_api.hpp"

using millsync::util::Outcome;

static void Usage() {
  std::cout << "Usage:\n"
            << "  millsyncctl <config.yaml> status\n"
            << "  millsyncctl <config.yaml> issues\n"
            << "  millsyncctl <config.yaml> inventory\n"
            << "  millsyncctl <config.yaml> stock <item_local_id>\n"
            << "  millsyncctl <config.yaml> retry <mutation_id>\n"
            << "  millsyncctl <config.yaml> retry-all\n"
            << "  millsyncctl <config.yaml> discard <mutation_id>\n"
            << "  millsyncctl <config.yaml> purge-synced\n"
            << "  millsyncctl <config.yaml> recover\n";
}

template <typename T>
static bool Report(const Outcome<T>& outcome) {
  if (outcome) return true;
  const auto& failure = outcome.failure();
  std::cerr << millsync::util::FailureKindName(failure.kind) << ": " << failure.message << "\n";
  return false;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];

  try {
    auto config = millsync::config::ConfigLoader::LoadFromYaml(config_path);
    millsync::observability::InitializeLogging(config);

    // inspection tool; passes are left to the device's own worker
    auto app     = millsync::factory::Build(config, std::make_shared<millsync::remote::OfflineRemoteApi>());
    auto service = app.service;

    // ------------------------------------------------------------

    if (cmd == "status") {
      auto stats = service->GetSyncStats();
      if (!Report(stats)) return 2;

      const auto& s = stats.value();
      std::cout << "pending=" << s.pending << " syncing=" << s.syncing << " synced=" << s.synced << " failed=" << s.failed
                << " conflict=" << s.conflict << "\n";
      for (const auto& [type, count] : s.unsynced_by_type) {
        std::cout << "  " << millsync::model::EntityTypeName(type) << " unsynced=" << count << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "issues") {
      auto issues = service->ListSyncIssues();
      if (!Report(issues)) return 2;

      for (const auto& issue : issues.value()) {
        std::cout << issue.id << " " << millsync::model::ToString(issue.entity) << " " << millsync::model::OperationName(issue.operation) << " "
                  << millsync::model::StatusName(issue.status) << " retries=" << issue.retry_count << " error=" << issue.error_message << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "inventory") {
      auto items = service->ListInventory();
      if (!Report(items)) return 2;

      for (const auto& item : items.value()) {
        std::cout << item.local_id() << " " << millsync::v1::ItemType_Name(item.type()) << " " << item.variety() << " kg=" << item.current_quantity()
                  << " bags=" << item.current_bags() << " avg_price=" << item.average_price_per_kg() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stock") {
      if (argc < 4) return 1;

      const int64_t item_id = std::stoll(argv[3]);
      auto          history = service->ListStockMovements(item_id);
      if (!Report(history)) return 2;

      for (const auto& movement : history.value()) {
        std::cout << millsync::v1::MovementKind_Name(movement.kind()) << " kg=" << movement.quantity_delta() << " bags=" << movement.bags_delta()
                  << " ref=" << movement.reference() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "retry") {
      if (argc < 4) return 1;
      if (!Report(service->ResetForRetry(argv[3]))) return 2;
      std::cout << "reset\n";
      return 0;
    }

    if (cmd == "retry-all") {
      auto reset = service->RetryAllFailed();
      if (!Report(reset)) return 2;
      std::cout << "reset=" << reset.value() << "\n";
      return 0;
    }

    if (cmd == "discard") {
      if (argc < 4) return 1;
      if (!Report(service->DiscardConflict(argv[3]))) return 2;
      std::cout << "discarded\n";
      return 0;
    }

    if (cmd == "purge-synced") {
      auto purged = service->PurgeSynced();
      if (!Report(purged)) return 2;
      std::cout << "purged=" << purged.value() << "\n";
      return 0;
    }

    if (cmd == "recover") {
      auto recovered = service->RecoverInFlight();
      if (!Report(recovered)) return 2;
      std::cout << "recovered=" << recovered.value() << "\n";
      return 0;
    }

    Usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
