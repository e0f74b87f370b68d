#include "internal/factory.hpp"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "tests/support/fake_ledger.hpp"
#include "tests/support/fake_publisher.hpp"
#include "tests/support/manual_clock.hpp"

namespace {

using settle::chain::ConfirmStatus;
using settle::model::ItemKind;
using settle::model::ItemStatus;
using settle::runtime::config::RuntimeConfig;
using settle::testing::FakeLedger;
using settle::testing::FakePublisher;
using settle::testing::ManualClock;

constexpr std::int64_t kNow = 1700000000;

RuntimeConfig BaseConfig() {
  RuntimeConfig config;
  config.mutable_token_ledger()->set_asset("USDC");
  config.mutable_token_ledger()->set_decimals(6);
  config.mutable_register_ledger()->set_asset("USDD");
  config.mutable_register_ledger()->set_decimals(8);
  config.mutable_reservations()->set_holder("factory-test");
  return config;
}

struct Ledgers {
  std::shared_ptr<FakeLedger>    token     = std::make_shared<FakeLedger>();
  std::shared_ptr<FakeLedger>    reg       = std::make_shared<FakeLedger>();
  std::shared_ptr<FakePublisher> publisher = std::make_shared<FakePublisher>();
  std::shared_ptr<ManualClock>   clock     = std::make_shared<ManualClock>(kNow);

  Ledgers() {
    reg->AddAccount("dest-1", "USDD");
    token->AddEvent("sig-1", kNow - 30, "src-sig-1", 1000000, "register:dest-1");
  }

  settle::factory::Application Build(const RuntimeConfig& config) { return settle::factory::Build(config, token, reg, publisher, clock); }
};

void TestMemoryApplication() {
  Ledgers l;
  auto    app = l.Build(BaseConfig());
  assert(app.repository != nullptr);
  assert(app.engine != nullptr);
  assert(app.scheduler != nullptr);
  assert(!app.scheduler->Running());
  const auto& holder = app.engine->Options().holder;
  assert(holder.rfind("factory-test@", 0) == 0);
  assert(holder.size() > std::string("factory-test@").size() + 36);
  assert(app.engine->Options().register_ledger.name == "register");

  const auto cycle = app.scheduler->RunCycle();
  assert(cycle.token_pass.processed == 1);
  assert(l.reg->submitted.at(0).amount_units == 100000000);
}

void TestHolderIsUniquePerProcess() {
  Ledgers l;
  auto    first  = l.Build(BaseConfig());
  auto    second = l.Build(BaseConfig());
  assert(first.engine->Options().holder != second.engine->Options().holder);

  const auto holder = settle::factory::ProcessHolder("worker");
  assert(holder.rfind("worker@", 0) == 0);
  assert(holder.find(":" + std::to_string(getpid()) + ":") != std::string::npos);
  // version 4 uuid at the end
  const auto uuid = holder.substr(holder.size() - 36);
  assert(uuid[8] == '-' && uuid[13] == '-' && uuid[18] == '-' && uuid[23] == '-');
  assert(uuid[14] == '4');
  assert(holder != settle::factory::ProcessHolder("worker"));

  // one process's reservation is not released by another sharing the name
  settle::reservation::ReservationManager a(first.repository, l.clock, first.engine->Options().holder);
  settle::reservation::ReservationManager b(first.repository, l.clock, second.engine->Options().holder);
  assert(a.Acquire("item", "token_deposit:sig-x", 300));
  b.Release("item", "token_deposit:sig-x");
  assert(!b.Acquire("item", "token_deposit:sig-x", 300));
}

void TestMissingLedgerIsRejected() {
  Ledgers l;
  bool    threw = false;
  try {
    settle::factory::Build(BaseConfig(), l.token, nullptr, l.publisher, l.clock);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

#if !SETTLE_DB_POSTGRES
void TestPostgresNotBuiltIsReported() {
  auto config = BaseConfig();
  config.mutable_database()->mutable_postgres()->set_connection_uri("postgresql://localhost/settle");
  bool threw = false;
  try {
    settle::factory::BuildRepository(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}
#endif

#if SETTLE_DB_SQLITE
void TestSqliteStateSurvivesRestart() {
  const auto path = std::filesystem::temp_directory_path() / "swap_settlement_factory_test.db";
  std::filesystem::remove(path);

  auto config = BaseConfig();
  config.mutable_database()->mutable_sqlite()->set_path(path.string());

  Ledgers l;
  l.reg->new_transfer_status = ConfirmStatus::kPending;
  {
    auto       app   = l.Build(config);
    const auto cycle = app.scheduler->RunCycle();
    assert(cycle.token_pass.advanced == 1);
    assert(cycle.maintenance.watermark_committed);
  }

  // restart: the open item and its transfer handle come back from disk
  auto app     = l.Build(config);
  auto pending = app.engine->Store().Get(ItemKind::kTokenDeposit, "sig-1");
  assert(pending.has_value());
  assert(pending->status == ItemStatus::kValueTransferred);
  assert(pending->transfer_id == "tx-1");
  assert(app.engine->Watermarks().Committed("token") == kNow - 30 - 600);

  l.reg->SetTransferStatus("tx-1", ConfirmStatus::kConfirmed);
  const auto cycle = app.scheduler->RunCycle();
  assert(cycle.token_detection.duplicates == 1);
  assert(cycle.token_pass.processed == 1);
  assert(l.reg->SubmitCount() == 1);

  app = {};
  std::filesystem::remove(path);
}
#endif

} // namespace

int main() {
  TestMemoryApplication();
  TestHolderIsUniquePerProcess();
  TestMissingLedgerIsRejected();
#if !SETTLE_DB_POSTGRES
  TestPostgresNotBuiltIsReported();
#endif
#if SETTLE_DB_SQLITE
  TestSqliteStateSurvivesRestart();
#endif

  std::cout << "settle_unit_factory: pass\n";
  return 0;
}
