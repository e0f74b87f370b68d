#include "internal/store/deposit_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/fees/fee_policy.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/manual_clock.hpp"

namespace {

using settle::db::model::DepositRecord;
using settle::model::FeeKind;
using settle::model::ItemKind;
using settle::model::ItemStatus;
using settle::model::Outcome;
using settle::store::Completion;
using settle::store::DepositStore;
using settle::store::DetectResult;
using settle::testing::ManualClock;

struct Fixture {
  std::shared_ptr<settle::db::memory::MemoryRepository> repo  = std::make_shared<settle::db::memory::MemoryRepository>();
  std::shared_ptr<ManualClock>                          clock = std::make_shared<ManualClock>(1000);
  DepositStore                                          store{repo, clock};
};

DepositRecord Detected(const std::string& id, ItemKind kind, std::int64_t at, std::uint64_t amount = 5000) {
  DepositRecord record;
  record.id             = id;
  record.kind           = kind;
  record.detected_at    = at;
  record.source_address = "src-" + id;
  record.owner          = "owner-" + id;
  record.amount_units   = amount;
  record.memo           = "register:dest";
  return record;
}

void TestRecordDetectedIsIdempotent() {
  Fixture f;
  auto    record = Detected("sig-1", ItemKind::kTokenDeposit, 900);
  // status from the caller is ignored
  record.status = ItemStatus::kValueTransferred;

  assert(f.store.RecordDetected(record) == DetectResult::kInserted);
  assert(f.store.RecordDetected(record) == DetectResult::kDuplicateOpen);

  const auto stored = f.store.Get(ItemKind::kTokenDeposit, "sig-1");
  assert(stored.has_value());
  assert(stored->status == ItemStatus::kDetected);
  assert(stored->status_since == 1000);
  assert(stored->amount_units == 5000);

  // same id in the other direction is a different item
  assert(f.store.RecordDetected(Detected("sig-1", ItemKind::kRegisterCredit, 900)) == DetectResult::kInserted);
  assert(f.store.Get(ItemKind::kRegisterCredit, "sig-1")->status == ItemStatus::kPendingMapping);
}

void TestTransitionChecksStatus() {
  Fixture f;
  f.store.RecordDetected(Detected("sig-1", ItemKind::kTokenDeposit, 900));
  auto record = *f.store.Get(ItemKind::kTokenDeposit, "sig-1");

  f.clock->Advance(5);
  record.destination = "dest";
  auto moved         = f.store.Transition(record, ItemStatus::kReadyForProcessing);
  assert(moved.status == ItemStatus::kReadyForProcessing);
  assert(moved.status_since == 1005);
  assert(f.store.Get(ItemKind::kTokenDeposit, "sig-1")->destination == "dest");

  // stale copy loses
  bool threw = false;
  try {
    f.store.Transition(record, ItemStatus::kToBeRefunded);
  } catch (const settle::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  // edge not in the state machine
  threw = false;
  try {
    f.store.Transition(moved, ItemStatus::kRefundSent);
  } catch (const settle::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.store.Get(ItemKind::kTokenDeposit, "sig-1")->status == ItemStatus::kReadyForProcessing);
}

void TestSaveKeepsStatusSince() {
  Fixture f;
  f.store.RecordDetected(Detected("sig-1", ItemKind::kTokenDeposit, 900));
  auto record = *f.store.Get(ItemKind::kTokenDeposit, "sig-1");

  f.clock->Advance(50);
  record.note  = "waiting";
  auto saved   = f.store.Save(record);
  assert(saved.status_since == 1000);
  assert(f.store.Get(ItemKind::kTokenDeposit, "sig-1")->note == "waiting");

  bool threw = false;
  try {
    auto missing = Detected("nope", ItemKind::kTokenDeposit, 1);
    missing.status = ItemStatus::kDetected;
    f.store.Save(missing);
  } catch (const settle::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestCompleteMovesToTerminal() {
  Fixture f;
  f.store.RecordDetected(Detected("sig-1", ItemKind::kTokenDeposit, 900, 100));
  auto record = *f.store.Get(ItemKind::kTokenDeposit, "sig-1");

  Completion completion;
  completion.outcome   = Outcome::kFeeOnly;
  completion.fee_units = 100;
  completion.reason    = "below minimum deposit";
  completion.fees.push_back(settle::fees::MakeFeeEntry(ItemKind::kTokenDeposit, "sig-1", FeeKind::kMicroForfeit, 100));

  f.clock->Advance(7);
  const auto terminal = f.store.Complete(record, completion);
  assert(terminal.completed_at == 1007);
  assert(!f.store.Get(ItemKind::kTokenDeposit, "sig-1").has_value());

  const auto stored = f.store.GetTerminal(ItemKind::kTokenDeposit, "sig-1");
  assert(stored.has_value());
  assert(stored->outcome == Outcome::kFeeOnly);
  assert(stored->fee_units == 100);
  assert(stored->reason == "below minimum deposit");

  auto tx      = f.repo->Begin();
  auto entries = f.repo->ListFeeEntries(*tx);
  tx->Commit();
  assert(entries.size() == 1);
  assert(entries[0].amount_token_units == 100);
  assert(entries[0].created_at == 1007);

  // redelivered event after completion is not re-opened
  assert(f.store.RecordDetected(Detected("sig-1", ItemKind::kTokenDeposit, 900, 100)) == DetectResult::kAlreadyCompleted);
  assert(!f.store.Get(ItemKind::kTokenDeposit, "sig-1").has_value());
}

void TestCompleteRejectsWrongOutcome() {
  Fixture f;
  f.store.RecordDetected(Detected("sig-1", ItemKind::kTokenDeposit, 900));
  auto record = *f.store.Get(ItemKind::kTokenDeposit, "sig-1");

  Completion completion;
  completion.outcome = Outcome::kProcessed;
  bool threw         = false;
  try {
    f.store.Complete(record, completion);
  } catch (const settle::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.store.Get(ItemKind::kTokenDeposit, "sig-1").has_value());
}

void TestListingAndCounts() {
  Fixture f;
  f.store.RecordDetected(Detected("c", ItemKind::kTokenDeposit, 300));
  f.store.RecordDetected(Detected("a", ItemKind::kTokenDeposit, 100));
  f.store.RecordDetected(Detected("b", ItemKind::kTokenDeposit, 200));
  f.store.RecordDetected(Detected("r", ItemKind::kRegisterCredit, 50));

  auto listed = f.store.ListActionable(ItemKind::kTokenDeposit);
  assert(listed.size() == 3);
  assert(listed[0].id == "a");
  assert(listed[1].id == "b");
  assert(listed[2].id == "c");
  assert(f.store.ListActionable(ItemKind::kTokenDeposit, {}, 2).size() == 2);
  const auto rest = f.store.ListActionable(ItemKind::kTokenDeposit, {}, 1, settle::store::ListCursor{100, "a"});
  assert(rest.size() == 1);
  assert(rest[0].id == "b");
  assert(f.store.ListActionable(ItemKind::kTokenDeposit, {}, 0, settle::store::ListCursor{300, "c"}).empty());
  assert(f.store.OldestOpen(ItemKind::kTokenDeposit) == std::int64_t{100});
  assert(f.store.OldestOpen(ItemKind::kRegisterCredit) == std::int64_t{50});

  // park one item: detected -> to_be_refunded -> to_be_quarantined -> quarantine_failed
  auto record = f.store.Transition(listed[0], ItemStatus::kToBeRefunded);
  record      = f.store.Transition(record, ItemStatus::kToBeQuarantined);
  record      = f.store.Transition(record, ItemStatus::kQuarantineFailed);

  assert(f.store.ListActionable(ItemKind::kTokenDeposit).size() == 2);
  assert(f.store.ListParked(ItemKind::kTokenDeposit).size() == 1);
  assert(f.store.ListActionable(ItemKind::kTokenDeposit, {ItemStatus::kQuarantineFailed}).size() == 1);

  const auto counts = f.store.CountByStatus(ItemKind::kTokenDeposit);
  assert(counts.at(ItemStatus::kDetected) == 2);
  assert(counts.at(ItemStatus::kQuarantineFailed) == 1);

  Fixture empty;
  assert(!empty.store.OldestOpen(ItemKind::kTokenDeposit).has_value());
}

} // namespace

int main() {
  TestRecordDetectedIsIdempotent();
  TestTransitionChecksStatus();
  TestSaveKeepsStatusSince();
  TestCompleteMovesToTerminal();
  TestCompleteRejectsWrongOutcome();
  TestListingAndCounts();

  std::cout << "settle_unit_deposit_store: pass\n";
  return 0;
}
