#include "internal/engine/settlement_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "tests/support/fake_ledger.hpp"
#include "tests/support/fake_publisher.hpp"
#include "tests/support/flow_fixture.hpp"
#include "tests/support/manual_clock.hpp"

namespace {

using settle::chain::ConfirmStatus;
using settle::engine::EngineOptions;
using settle::engine::SettlementEngine;
using settle::model::ItemKind;
using settle::model::ItemStatus;
using settle::testing::FakeLedger;
using settle::testing::FakePublisher;
using settle::testing::kStartTime;
using settle::testing::ManualClock;

constexpr ItemKind kToken = ItemKind::kTokenDeposit;

struct Harness {
  std::shared_ptr<settle::db::memory::MemoryRepository> repo      = std::make_shared<settle::db::memory::MemoryRepository>();
  std::shared_ptr<ManualClock>                           clock     = std::make_shared<ManualClock>(kStartTime);
  std::shared_ptr<FakeLedger>                            token     = std::make_shared<FakeLedger>();
  std::shared_ptr<FakeLedger>                            reg       = std::make_shared<FakeLedger>();
  std::shared_ptr<FakePublisher>                         publisher = std::make_shared<FakePublisher>();
  EngineOptions                                          options   = settle::testing::DefaultEngineOptions();

  Harness() {
    options.token_deposit_fees.flat_fee_units = 10000;
    reg->AddAccount("dest-1", "USDD");
    token->AddAccount("src-sig-1", "USDC");
  }

  std::unique_ptr<SettlementEngine> Engine() {
    return std::make_unique<SettlementEngine>(repo, token, reg, publisher, clock, options);
  }
};

void TestDetectAndSettleInOnePass() {
  Harness h;
  h.token->AddEvent("sig-1", kStartTime - 10, "src-sig-1", 1000000, "register:dest-1");
  auto engine = h.Engine();

  const auto detected = engine->RunDetectionPass(kToken);
  assert(detected.scanned == 1);
  assert(detected.inserted == 1);
  assert(detected.errored == 0);
  assert(detected.proposed_watermark == kStartTime - 10 - 600);

  const auto pass = engine->RunAdvancementPass(kToken);
  assert(pass.scanned == 1);
  assert(pass.processed == 1);
  assert(pass.errored == 0);
  assert(!pass.busy && !pass.stopped && !pass.budget_exhausted);

  assert(h.reg->submitted.size() == 1);
  assert(h.reg->submitted[0].amount_units == 99000000);
  assert(engine->Store().GetTerminal(kToken, "sig-1").has_value());

  // the event is still inside the scan window; it is recognised as settled
  const auto again = engine->RunDetectionPass(kToken);
  assert(again.inserted == 0);
  assert(again.duplicates == 1);
  assert(again.proposed_watermark == kStartTime - 600);
  assert(h.reg->SubmitCount() == 1);

  const auto maintenance = engine->RunMaintenance();
  assert(maintenance.errors == 0);
  assert(maintenance.watermark_committed);
  assert(h.publisher->published.at("token") == kStartTime - 600);
  assert(maintenance.fee_summary.has_value());
  assert(maintenance.fee_summary->token_units_total == 10000);
  assert(maintenance.fee_summary->entry_count == 1);
  assert(maintenance.stuck == 0);
}

void TestFetchFailureKeepsWatermark() {
  Harness h;
  h.token->fail_fetch = true;
  auto engine         = h.Engine();

  const auto detected = engine->RunDetectionPass(kToken);
  assert(detected.errored == 1);
  assert(detected.inserted == 0);
  assert(!detected.proposed_watermark.has_value());

  const auto maintenance = engine->RunMaintenance();
  assert(!maintenance.watermark_committed);
  assert(h.publisher->publish_calls == 0);
}

void TestEventWithoutIdIsCounted() {
  Harness h;
  h.token->AddEvent("", kStartTime, "src-x", 1000000, "register:dest-1");
  h.token->AddEvent("sig-1", kStartTime, "src-sig-1", 1000000, "register:dest-1");
  auto engine = h.Engine();

  const auto detected = engine->RunDetectionPass(kToken);
  assert(detected.scanned == 2);
  assert(detected.inserted == 1);
  assert(detected.errored == 1);
  assert(!detected.proposed_watermark.has_value());
}

void TestFailingItemDoesNotBlockOthers() {
  Harness h;
  // sig-bad needs a refund, and the token ledger cannot look up its source
  h.token->fail_lookup = true;
  h.token->AddAccount("src-bad", "USDC");
  h.token->AddEvent("sig-bad", kStartTime - 20, "src-bad", 1000000, "no destination here");
  h.token->AddEvent("sig-1", kStartTime - 10, "src-sig-1", 1000000, "register:dest-1");
  auto engine = h.Engine();
  engine->RunDetectionPass(kToken);

  const auto pass = engine->RunAdvancementPass(kToken);
  assert(pass.scanned == 2);
  assert(pass.errored == 1);
  assert(pass.processed == 1);

  const auto bad = engine->Store().Get(kToken, "sig-bad");
  assert(bad.has_value());
  assert(bad->status == ItemStatus::kToBeRefunded);

  h.token->fail_lookup = false;
  const auto retry     = engine->RunAdvancementPass(kToken);
  assert(retry.refunded == 1);
  assert(h.token->submitted.size() == 1);
  assert(h.token->submitted[0].destination == "src-bad");
}

void TestItemReservedElsewhereIsSkipped() {
  Harness h;
  h.token->AddEvent("sig-1", kStartTime, "src-sig-1", 1000000, "register:dest-1");
  auto engine = h.Engine();
  engine->RunDetectionPass(kToken);

  settle::reservation::ReservationManager other(h.repo, h.clock, "other-worker");
  assert(other.Acquire("item", "token_deposit:sig-1", 300));

  auto pass = engine->RunAdvancementPass(kToken);
  assert(pass.skipped == 1);
  assert(pass.processed == 0);
  assert(h.reg->submitted.empty());

  // a crashed holder's reservation lapses after its ttl
  h.clock->Advance(301);
  engine->RunMaintenance();
  pass = engine->RunAdvancementPass(kToken);
  assert(pass.processed == 1);
}

void TestStopEndsPassBeforeNextItem() {
  Harness h;
  h.token->AddEvent("sig-1", kStartTime, "src-sig-1", 1000000, "register:dest-1");
  auto engine = h.Engine();
  engine->RunDetectionPass(kToken);

  engine->RequestStop();
  assert(engine->StopRequested());
  const auto pass = engine->RunAdvancementPass(kToken);
  assert(pass.stopped);
  assert(pass.scanned == 0);
  assert(engine->Store().Get(kToken, "sig-1")->status == ItemStatus::kDetected);

  engine->ClearStop();
  assert(!engine->StopRequested());
  const auto resumed = engine->RunAdvancementPass(kToken);
  assert(!resumed.stopped);
  assert(resumed.processed == 1);
}

void TestExhaustedBudgetEndsPass() {
  Harness h;
  h.options.pass_budget = std::chrono::milliseconds(0);
  h.token->AddEvent("sig-1", kStartTime, "src-sig-1", 1000000, "register:dest-1");
  auto engine = h.Engine();
  engine->RunDetectionPass(kToken);

  const auto pass = engine->RunAdvancementPass(kToken);
  assert(pass.budget_exhausted);
  assert(pass.scanned == 0);
}

void TestWaitingItemsDoNotUseUpPassCap() {
  Harness h;
  h.options.max_items_per_pass                  = 2;
  h.options.register_credit_fees.flat_fee_units = 1000000;
  h.token->AddAccount("sol-1", "USDC");

  // three older credits wait for a mapping
  h.reg->AddEvent("rtx-a", kStartTime - 60, "racct-a", 100000000, "", "owner-racct-a");
  h.reg->AddEvent("rtx-b", kStartTime - 50, "racct-b", 100000000, "", "owner-racct-b");
  h.reg->AddEvent("rtx-c", kStartTime - 40, "racct-c", 100000000, "", "owner-racct-c");
  for (const std::string id : {"rtx-1", "rtx-2", "rtx-3"}) {
    h.reg->mappings.push_back({id, "owner-racct-1", "sol-1"});
  }
  h.reg->AddEvent("rtx-1", kStartTime - 30, "racct-1", 100000000, "", "owner-racct-1");
  h.reg->AddEvent("rtx-2", kStartTime - 20, "racct-1", 100000000, "", "owner-racct-1");
  h.reg->AddEvent("rtx-3", kStartTime - 10, "racct-1", 100000000, "", "owner-racct-1");
  auto engine = h.Engine();
  assert(engine->RunDetectionPass(ItemKind::kRegisterCredit).inserted == 6);

  auto pass = engine->RunAdvancementPass(ItemKind::kRegisterCredit);
  assert(pass.deferred == 3);
  assert(pass.processed == 2);
  assert(pass.scanned == 5);
  assert(engine->Store().GetTerminal(ItemKind::kRegisterCredit, "rtx-1").has_value());
  assert(engine->Store().GetTerminal(ItemKind::kRegisterCredit, "rtx-2").has_value());
  assert(engine->Store().Get(ItemKind::kRegisterCredit, "rtx-3")->status == ItemStatus::kPendingMapping);

  pass = engine->RunAdvancementPass(ItemKind::kRegisterCredit);
  assert(pass.deferred == 3);
  assert(pass.processed == 1);
  assert(h.token->SubmitCount() == 3);
}

void TestMaintenanceReportsStuckItems() {
  Harness h;
  h.reg->new_transfer_status = ConfirmStatus::kPending;
  h.token->AddEvent("sig-1", kStartTime, "src-sig-1", 1000000, "register:dest-1");
  auto engine = h.Engine();
  engine->RunDetectionPass(kToken);

  auto pass = engine->RunAdvancementPass(kToken);
  assert(pass.advanced == 1);
  assert(engine->Store().Get(kToken, "sig-1")->status == ItemStatus::kValueTransferred);

  h.clock->Advance(1800);
  pass = engine->RunAdvancementPass(kToken);
  assert(pass.stuck == 1);

  // parked items are left alone by later passes
  pass = engine->RunAdvancementPass(kToken);
  assert(pass.scanned == 0);

  const auto maintenance = engine->RunMaintenance();
  assert(maintenance.stuck == 1);
  assert(maintenance.open_counts.at(kToken).at(ItemStatus::kNeedsReconciliation) == 1);
  assert(h.reg->SubmitCount() == 1);
}

void TestRecoverSeedsWatermarkFromPublisher() {
  Harness h;
  h.publisher->published["token"] = kStartTime - 100;
  auto engine                     = h.Engine();
  engine->Recover();

  assert(engine->Watermarks().Committed("token") == kStartTime - 100);
  assert(!engine->Watermarks().Committed("register").has_value());

  engine->RunDetectionPass(kToken);
  assert(h.token->last_fetch_since == kStartTime - 100);
}

void TestRegisterDirectionRunsIndependently() {
  Harness h;
  h.options.register_credit_fees.flat_fee_units = 1000000;
  h.token->AddAccount("sol-1", "USDC");
  h.reg->mappings.push_back({"rtx-1", "owner-racct-1", "sol-1"});
  h.reg->AddEvent("rtx-1", kStartTime, "racct-1", 100000000, "", "owner-racct-1");
  auto engine = h.Engine();

  assert(engine->RunDetectionPass(ItemKind::kRegisterCredit).inserted == 1);
  assert(engine->RunDetectionPass(kToken).inserted == 0);

  const auto pass = engine->RunAdvancementPass(ItemKind::kRegisterCredit);
  assert(pass.processed == 1);
  assert(h.token->submitted.size() == 1);
  assert(h.token->submitted[0].amount_units == 990000);
  assert(h.token->submitted[0].memo == "credit:rtx-1");
}

} // namespace

int main() {
  TestDetectAndSettleInOnePass();
  TestFetchFailureKeepsWatermark();
  TestEventWithoutIdIsCounted();
  TestFailingItemDoesNotBlockOthers();
  TestItemReservedElsewhereIsSkipped();
  TestStopEndsPassBeforeNextItem();
  TestExhaustedBudgetEndsPass();
  TestWaitingItemsDoNotUseUpPassCap();
  TestMaintenanceReportsStuckItems();
  TestRecoverSeedsWatermarkFromPublisher();
  TestRegisterDirectionRunsIndependently();

  std::cout << "settle_unit_settlement_engine: pass\n";
  return 0;
}
