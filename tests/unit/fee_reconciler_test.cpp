#include "internal/fees/fee_reconciler.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/fees/fee_policy.hpp"
#include "tests/support/manual_clock.hpp"

namespace {

using settle::fees::FeeReconciler;
using settle::model::FeeKind;
using settle::model::ItemKind;
using settle::testing::ManualClock;

void Append(settle::db::Repository& repo, ItemKind kind, const std::string& ref, FeeKind fee_kind, std::uint64_t amount) {
  auto       tx     = repo.Begin();
  const auto result = repo.InsertFeeEntry(*tx, settle::fees::MakeFeeEntry(kind, ref, fee_kind, amount));
  assert(result);
  tx->Commit();
}

void TestSummaryRebuiltFromEntries() {
  auto          repo  = std::make_shared<settle::db::memory::MemoryRepository>();
  auto          clock = std::make_shared<ManualClock>(5000);
  FeeReconciler reconciler(repo, clock);

  assert(!reconciler.Summary().has_value());

  Append(*repo, ItemKind::kTokenDeposit, "sig-1", FeeKind::kFlat, 100);
  Append(*repo, ItemKind::kTokenDeposit, "sig-1", FeeKind::kDynamic, 25);
  Append(*repo, ItemKind::kRegisterCredit, "tx-1", FeeKind::kRefundFlat, 7000);

  auto summary = reconciler.Refresh();
  assert(summary.token_units_total == 125);
  assert(summary.register_units_total == 7000);
  assert(summary.entry_count == 3);
  assert(summary.refreshed_at == 5000);

  Append(*repo, ItemKind::kTokenDeposit, "sig-2", FeeKind::kMicroForfeit, 3);
  clock->Advance(60);
  summary = reconciler.Refresh();
  assert(summary.token_units_total == 128);
  assert(summary.entry_count == 4);

  const auto stored = reconciler.Summary();
  assert(stored.has_value());
  assert(stored->token_units_total == 128);
  assert(stored->refreshed_at == 5060);
}

void TestEmptyLedgerSummary() {
  auto          repo  = std::make_shared<settle::db::memory::MemoryRepository>();
  auto          clock = std::make_shared<ManualClock>(10);
  FeeReconciler reconciler(repo, clock);

  const auto summary = reconciler.Refresh();
  assert(summary.entry_count == 0);
  assert(summary.token_units_total == 0);
  assert(reconciler.Summary().has_value());
}

} // namespace

int main() {
  TestSummaryRebuiltFromEntries();
  TestEmptyLedgerSummary();

  std::cout << "settle_unit_fee_reconciler: pass\n";
  return 0;
}
