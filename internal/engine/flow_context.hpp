#pragma once

#include <memory>

#include "internal/chain/ledger_adapter.hpp"
#include "internal/engine/engine_options.hpp"
#include "internal/fees/backing_guard.hpp"
#include "internal/governor/attempt_governor.hpp"
#include "internal/store/deposit_store.hpp"
#include "internal/util/time.hpp"

namespace settle::engine {

struct FlowContext {
  std::shared_ptr<store::DepositStore>       store;
  std::shared_ptr<governor::AttemptGovernor> governor;
  std::shared_ptr<fees::BackingGuard>        backing;
  std::shared_ptr<chain::LedgerAdapter>      token_ledger;
  std::shared_ptr<chain::LedgerAdapter>      register_ledger;
  std::shared_ptr<const util::TimeSource>    clock;
  EngineOptions                              options;
};

} // namespace settle::engine
