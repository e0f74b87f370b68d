#include "internal/fees/backing_guard.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "tests/support/fake_ledger.hpp"

namespace {

using settle::fees::BackingGuard;
using settle::fees::BackingOptions;
using settle::model::ItemKind;
using settle::testing::FakeLedger;

BackingOptions Options(std::uint32_t bps, std::uint32_t token_decimals = 6, std::uint32_t register_decimals = 6) {
  BackingOptions options;
  options.pause_threshold_bps = bps;
  options.token_decimals      = token_decimals;
  options.register_decimals   = register_decimals;
  return options;
}

void TestAssessThreshold() {
  auto snapshot = BackingGuard::Assess(900, 1000, Options(9000));
  assert(snapshot.ratio_bps == 9000);
  assert(!snapshot.paused);

  snapshot = BackingGuard::Assess(899, 1000, Options(9000));
  assert(snapshot.ratio_bps == 8990);
  assert(snapshot.paused);

  snapshot = BackingGuard::Assess(0, 0, Options(9000));
  assert(snapshot.ratio_bps == -1);
  assert(!snapshot.paused);

  snapshot = BackingGuard::Assess(0, 1000, Options(0));
  assert(!snapshot.paused);
}

void TestAssessAlignsDecimals() {
  // 1.00 token (6 dp) against 1.00 register (8 dp)
  auto snapshot = BackingGuard::Assess(1000000, 100000000, Options(10000, 6, 8));
  assert(snapshot.ratio_bps == 10000);
  assert(!snapshot.paused);

  snapshot = BackingGuard::Assess(999999, 100000000, Options(10000, 6, 8));
  assert(snapshot.paused);
}

void TestPausedBeforeFirstEvaluation() {
  auto token = std::make_shared<FakeLedger>();
  auto reg   = std::make_shared<FakeLedger>();

  BackingGuard guard(token, reg, Options(9000));
  assert(guard.PausesPayouts(ItemKind::kTokenDeposit));
  assert(!guard.PausesPayouts(ItemKind::kRegisterCredit));
  assert(!guard.Last().has_value());

  BackingGuard disabled(token, reg, Options(0));
  assert(!disabled.PausesPayouts(ItemKind::kTokenDeposit));
}

void TestEvaluateReadsLedgers() {
  auto token = std::make_shared<FakeLedger>();
  auto reg   = std::make_shared<FakeLedger>();
  token->collateral = 800;
  reg->supply       = 1000;

  auto options              = Options(9000);
  options.pause_redemptions = true;
  BackingGuard guard(token, reg, options);

  auto snapshot = guard.Evaluate();
  assert(snapshot.paused);
  assert(snapshot.collateral_units == 800);
  assert(guard.PausesPayouts(ItemKind::kTokenDeposit));
  assert(guard.PausesPayouts(ItemKind::kRegisterCredit));

  token->collateral = 1000;
  snapshot          = guard.Evaluate();
  assert(!snapshot.paused);
  assert(!guard.PausesPayouts(ItemKind::kTokenDeposit));
  assert(guard.Last()->ratio_bps == 10000);
}

void TestRedemptionsContinueUnlessConfigured() {
  auto token = std::make_shared<FakeLedger>();
  auto reg   = std::make_shared<FakeLedger>();
  token->collateral = 100;
  reg->supply       = 1000;

  BackingGuard guard(token, reg, Options(9000));
  guard.Evaluate();
  assert(guard.PausesPayouts(ItemKind::kTokenDeposit));
  assert(!guard.PausesPayouts(ItemKind::kRegisterCredit));
}

void TestUnreadableLedgersFailClosed() {
  auto token = std::make_shared<FakeLedger>();
  auto reg   = std::make_shared<FakeLedger>();
  token->collateral    = 5000;
  reg->supply          = 1000;
  token->fail_balances = true;

  BackingGuard guard(token, reg, Options(9000));
  const auto   snapshot = guard.Evaluate();
  assert(snapshot.unavailable);
  assert(snapshot.paused);
  assert(guard.PausesPayouts(ItemKind::kTokenDeposit));

  token->fail_balances = false;
  assert(!guard.Evaluate().paused);
  assert(!guard.PausesPayouts(ItemKind::kTokenDeposit));
}

} // namespace

int main() {
  TestAssessThreshold();
  TestAssessAlignsDecimals();
  TestPausedBeforeFirstEvaluation();
  TestEvaluateReadsLedgers();
  TestRedemptionsContinueUnlessConfigured();
  TestUnreadableLedgersFailClosed();

  std::cout << "settle_unit_backing_guard: pass\n";
  return 0;
}
