#include "internal/engine/token_deposit_flow.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"
#include "tests/support/flow_fixture.hpp"

namespace {

using settle::chain::ConfirmStatus;
using settle::chain::SubmitStatus;
using settle::engine::StepKind;
using settle::engine::TokenDepositFlow;
using settle::governor::AttemptGovernor;
using settle::model::FeeKind;
using settle::model::ItemKind;
using settle::model::ItemStatus;
using settle::model::Outcome;
using settle::testing::FlowFixture;

constexpr ItemKind kKind = ItemKind::kTokenDeposit;

// 1.00 USDC deposit; flat 0.01 and 1% dynamic leave 0.98 USDC = 98_000_000 register units.
void ConfigureFees(FlowFixture& f) {
  f.options.token_deposit_fees.flat_fee_units    = 10000;
  f.options.token_deposit_fees.dynamic_fee_bps   = 100;
  f.options.token_deposit_fees.min_deposit_units = 500000;
  f.options.token_deposit_fees.refund_fee_units  = 5000;
}

FlowFixture Fixture() {
  FlowFixture f;
  ConfigureFees(f);
  f.reg->AddAccount("dest-1", "USDD");
  f.reg->AddAccount("wrong-asset", "XRD");
  f.token->AddAccount("src-sig-1", "USDC");
  f.Build();
  return f;
}

void TestHappyPath() {
  auto             f = Fixture();
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "register:dest-1");

  auto step = flow.Advance(record);
  assert(step.kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kReadyForProcessing);
  assert(record.destination == "dest-1");

  step = flow.Advance(record);
  assert(step.kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kValueTransferred);
  assert(record.transfer_id == "tx-1");
  assert(f.reg->submitted.size() == 1);
  assert(f.reg->submitted[0].destination == "dest-1");
  assert(f.reg->submitted[0].amount_units == 98000000);
  assert(f.reg->submitted[0].memo == "deposit:sig-1");

  step = flow.Advance(record);
  assert(step.kind == StepKind::kCompleted);
  assert(step.outcome == Outcome::kProcessed);

  const auto terminal = f.store->GetTerminal(kKind, "sig-1");
  assert(terminal.has_value());
  assert(terminal->payout_units == 98000000);
  assert(terminal->fee_units == 20000);
  assert(terminal->transfer_id == "tx-1");
  assert(!f.store->Get(kKind, "sig-1").has_value());

  const auto entries = f.FeeEntries();
  assert(entries.size() == 2);
  assert(entries[0].kind == FeeKind::kFlat && entries[0].amount_token_units == 10000);
  assert(entries[1].kind == FeeKind::kDynamic && entries[1].amount_token_units == 10000);
  assert(f.governor->Count(AttemptGovernor::Key(kKind, "payout", "sig-1")) == 0);
}

void TestMicroDepositIsForfeited() {
  auto             f = Fixture();
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000, "register:dest-1");

  const auto step = flow.Advance(record);
  assert(step.kind == StepKind::kCompleted);
  assert(step.outcome == Outcome::kFeeOnly);
  assert(f.reg->submitted.empty());
  assert(f.token->submitted.empty());

  const auto entries = f.FeeEntries();
  assert(entries.size() == 1);
  assert(entries[0].kind == FeeKind::kMicroForfeit);
  assert(entries[0].amount_token_units == 1000);
  assert(f.store->GetTerminal(kKind, "sig-1")->outcome == Outcome::kFeeOnly);
}

void TestMalformedReferenceIsRefunded() {
  auto             f = Fixture();
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "hello there");

  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kToBeRefunded);
  assert(record.note == "malformed destination reference");

  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kRefundSent);
  assert(f.token->submitted.size() == 1);
  assert(f.token->submitted[0].destination == "src-sig-1");
  assert(f.token->submitted[0].amount_units == 995000);
  assert(f.token->submitted[0].memo == "refund:sig-1");

  const auto step = flow.Advance(record);
  assert(step.kind == StepKind::kCompleted);
  assert(step.outcome == Outcome::kRefunded);
  const auto entries = f.FeeEntries();
  assert(entries.size() == 1);
  assert(entries[0].kind == FeeKind::kRefundFlat);
  assert(entries[0].amount_token_units == 5000);
  assert(f.reg->submitted.empty());
}

void TestDestinationChecks() {
  auto             f = Fixture();
  TokenDepositFlow flow(f.Context());

  auto wrong = f.Detect(kKind, "sig-1", 1000000, "register:wrong-asset");
  flow.Advance(wrong);
  assert(wrong.status == ItemStatus::kToBeRefunded);

  auto missing = f.Detect(kKind, "sig-2", 1000000, "register:nobody");
  flow.Advance(missing);
  assert(missing.status == ItemStatus::kToBeRefunded);
  assert(missing.note == "destination account not found");
}

void TestBackingPauseDefersPayout() {
  auto f            = Fixture();
  f.token->collateral = 100;
  f.reg->supply       = 100000000;
  f.backing->Evaluate();

  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "register:dest-1");

  // validation still runs while paused
  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(flow.Advance(record).kind == StepKind::kDeferred);
  assert(record.status == ItemStatus::kReadyForProcessing);
  assert(f.reg->submitted.empty());

  f.token->collateral = 1000000;
  f.backing->Evaluate();
  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kValueTransferred);
}

void TestRejectedPayoutRetriesThenRefunds() {
  auto f = Fixture();
  f.reg->script = {SubmitStatus::kRejected, SubmitStatus::kRejected, SubmitStatus::kRejected};
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "register:dest-1");
  flow.Advance(record);

  assert(flow.Advance(record).kind == StepKind::kDeferred);
  assert(record.status == ItemStatus::kReadyForProcessing);
  assert(f.reg->SubmitCount() == 1);

  // cooldown
  assert(flow.Advance(record).kind == StepKind::kDeferred);
  assert(f.reg->SubmitCount() == 1);

  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kDeferred);
  assert(f.reg->SubmitCount() == 2);

  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(f.reg->SubmitCount() == 3);
  assert(record.status == ItemStatus::kToBeRefunded);
  assert(f.store->Get(kKind, "sig-1")->status == ItemStatus::kToBeRefunded);
}

void TestAmbiguousSubmissionFoundByMemo() {
  auto f = Fixture();
  f.reg->script = {SubmitStatus::kAmbiguous};
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "register:dest-1");
  flow.Advance(record);

  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kValueTransferred);
  assert(record.transfer_id.empty());

  const auto step = flow.Advance(record);
  assert(step.kind == StepKind::kCompleted);
  assert(f.reg->SubmitCount() == 1);
  assert(f.store->GetTerminal(kKind, "sig-1")->transfer_id == "tx-1");
}

void TestAmbiguousSubmissionThatNeverLandedIsResent() {
  auto f = Fixture();
  f.reg->script          = {SubmitStatus::kAmbiguous};
  f.reg->ambiguous_lands = false;
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "register:dest-1");
  flow.Advance(record);
  flow.Advance(record);
  assert(record.status == ItemStatus::kValueTransferred);

  // not resent before the cooldown
  assert(flow.Advance(record).kind == StepKind::kDeferred);
  assert(f.reg->SubmitCount() == 1);

  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kReadyForProcessing);

  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kValueTransferred);
  assert(f.reg->SubmitCount() == 2);
  assert(flow.Advance(record).kind == StepKind::kCompleted);
  assert(f.reg->TransfersWithMemo("deposit:sig-1").size() == 1);
}

void TestLostFinalAttemptNeedsReconciliation() {
  auto f = Fixture();
  f.reg->script          = {SubmitStatus::kRejected, SubmitStatus::kRejected, SubmitStatus::kAmbiguous};
  f.reg->ambiguous_lands = false;
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "register:dest-1");
  flow.Advance(record);

  assert(flow.Advance(record).kind == StepKind::kDeferred);
  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kDeferred);
  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kValueTransferred);
  assert(record.transfer_id.empty());

  assert(flow.Advance(record).kind == StepKind::kDeferred);
  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kParked);
  assert(record.status == ItemStatus::kNeedsReconciliation);
  assert(f.store->Get(kKind, "sig-1")->status == ItemStatus::kNeedsReconciliation);

  // the third payout may still land, so nothing is refunded
  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kParked);
  assert(f.reg->SubmitCount() == 3);
  assert(f.token->SubmitCount() == 0);
}

void TestFailedTransferIsNotResurrected() {
  auto f = Fixture();
  f.reg->new_transfer_status = ConfirmStatus::kFailed;
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "register:dest-1");
  flow.Advance(record);
  flow.Advance(record);
  assert(record.transfer_id == "tx-1");

  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kReadyForProcessing);

  assert(flow.Advance(record).kind == StepKind::kDeferred);
  assert(record.status == ItemStatus::kReadyForProcessing);

  f.clock->Advance(300);
  f.reg->new_transfer_status = ConfirmStatus::kConfirmed;
  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.transfer_id == "tx-2");
  assert(flow.Advance(record).kind == StepKind::kCompleted);
  assert(f.store->GetTerminal(kKind, "sig-1")->transfer_id == "tx-2");
}

void TestConfirmationTimeoutParksItem() {
  auto f = Fixture();
  f.reg->new_transfer_status = ConfirmStatus::kPending;
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "register:dest-1");
  flow.Advance(record);
  flow.Advance(record);

  f.clock->Advance(1799);
  assert(flow.Advance(record).kind == StepKind::kDeferred);

  f.clock->Advance(1);
  assert(flow.Advance(record).kind == StepKind::kParked);
  assert(record.status == ItemStatus::kNeedsReconciliation);
  assert(flow.Advance(record).kind == StepKind::kParked);
  assert(f.reg->SubmitCount() == 1);
  assert(f.token->SubmitCount() == 0);
}

void TestRefundFailureFallsBackToQuarantine() {
  auto f = Fixture();
  f.token->script = {SubmitStatus::kRejected, SubmitStatus::kTransient, SubmitStatus::kRejected};
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "garbage");
  flow.Advance(record);
  assert(record.status == ItemStatus::kToBeRefunded);

  assert(flow.Advance(record).kind == StepKind::kDeferred);
  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kDeferred);
  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kToBeQuarantined);

  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kQuarantineSent);
  const auto moves = f.token->TransfersWithMemo("quarantine:sig-1");
  assert(moves.size() == 1);
  assert(moves[0].request.destination == "token-quarantine");
  assert(moves[0].request.amount_units == 995000);

  const auto step = flow.Advance(record);
  assert(step.kind == StepKind::kCompleted);
  assert(step.outcome == Outcome::kQuarantined);
  assert(f.FeeEntries().at(0).kind == FeeKind::kQuarantineFlat);
}

void TestUnrefundableSourceWithoutQuarantineAccountParks() {
  auto f = Fixture();
  f.options.token_ledger.quarantine_account.clear();
  f.token->AddAccount("src-closed", "USDC", false);
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-9", 1000000, "nope", "src-closed");

  flow.Advance(record);
  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kToBeQuarantined);

  assert(flow.Advance(record).kind == StepKind::kParked);
  assert(record.status == ItemStatus::kQuarantineFailed);
  assert(f.token->SubmitCount() == 0);
}

void TestQuarantineFailuresExhaustToQuarantineFailed() {
  auto f = Fixture();
  f.options.quarantine_max_attempts = 2;
  f.token->AddAccount("src-closed", "USDC", false);
  f.Build();
  f.token->script = {SubmitStatus::kRejected, SubmitStatus::kRejected};
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-9", 1000000, "nope", "src-closed");

  flow.Advance(record);
  flow.Advance(record);
  assert(record.status == ItemStatus::kToBeQuarantined);

  assert(flow.Advance(record).kind == StepKind::kDeferred);
  assert(record.status == ItemStatus::kToBeQuarantined);
  assert(flow.Advance(record).kind == StepKind::kDeferred);
  assert(f.token->SubmitCount() == 1);

  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kParked);
  assert(record.status == ItemStatus::kQuarantineFailed);
  assert(f.store->ListParked(kKind).size() == 1);

  f.clock->Advance(300);
  assert(flow.Advance(record).kind == StepKind::kParked);
  assert(f.token->SubmitCount() == 2);
  assert(f.token->TransfersWithMemo("quarantine:sig-9").empty());
  assert(f.governor->Count(AttemptGovernor::Key(kKind, "quarantine", "sig-9")) == 2);
}

void TestEarlierTransferRecoveredAfterCrash() {
  auto             f = Fixture();
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "register:dest-1");
  flow.Advance(record);

  // a previous run submitted but died before recording it
  f.governor->RecordAttempt(AttemptGovernor::Key(kKind, "payout", "sig-1"));
  f.reg->SubmitTransfer({"dest-1", 98000000, "deposit:sig-1"});

  assert(flow.Advance(record).kind == StepKind::kAdvanced);
  assert(record.status == ItemStatus::kValueTransferred);
  assert(record.transfer_id == "tx-1");
  assert(f.reg->SubmitCount() == 1);
}

void TestLedgerTimeoutLeavesStateUnchanged() {
  auto             f = Fixture();
  TokenDepositFlow flow(f.Context());
  auto             record = f.Detect(kKind, "sig-1", 1000000, "register:dest-1");

  f.reg->fail_lookup = true;
  bool threw         = false;
  try {
    flow.Advance(record);
  } catch (const settle::util::TransientError&) {
    threw = true;
  }
  assert(threw);
  assert(f.store->Get(kKind, "sig-1")->status == ItemStatus::kDetected);
}

} // namespace

int main() {
  TestHappyPath();
  TestMicroDepositIsForfeited();
  TestMalformedReferenceIsRefunded();
  TestDestinationChecks();
  TestBackingPauseDefersPayout();
  TestRejectedPayoutRetriesThenRefunds();
  TestAmbiguousSubmissionFoundByMemo();
  TestAmbiguousSubmissionThatNeverLandedIsResent();
  TestLostFinalAttemptNeedsReconciliation();
  TestFailedTransferIsNotResurrected();
  TestConfirmationTimeoutParksItem();
  TestRefundFailureFallsBackToQuarantine();
  TestUnrefundableSourceWithoutQuarantineAccountParks();
  TestQuarantineFailuresExhaustToQuarantineFailed();
  TestEarlierTransferRecoveredAfterCrash();
  TestLedgerTimeoutLeavesStateUnchanged();

  std::cout << "settle_unit_token_deposit_flow: pass\n";
  return 0;
}
