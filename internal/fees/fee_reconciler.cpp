#include "internal/fees/fee_reconciler.hpp"

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"

namespace settle::fees {

FeeReconciler::FeeReconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

db::model::FeeSummary FeeReconciler::Refresh() {
  auto tx      = repository_->Begin();
  auto entries = repository_->ListFeeEntries(*tx);

  db::model::FeeSummary summary;
  for (const auto& entry : entries) {
    summary.token_units_total += entry.amount_token_units;
    summary.register_units_total += entry.amount_register_units;
    ++summary.entry_count;
  }
  summary.refreshed_at = clock_->NowSeconds();

  auto previous = repository_->GetFeeSummary(*tx);
  db::ThrowIfDbError(repository_->UpsertFeeSummary(*tx, summary), "refresh fee summary");
  tx->Commit();

  if (previous.has_value() && (previous->token_units_total > summary.token_units_total || previous->register_units_total > summary.register_units_total)) {
    SETTLE_LOG_WARN("fee summary shrank on rebuild", {observability::UintField("previous_token_units", previous->token_units_total),
                                                      observability::UintField("token_units", summary.token_units_total),
                                                      observability::UintField("previous_register_units", previous->register_units_total),
                                                      observability::UintField("register_units", summary.register_units_total)});
  }
  return summary;
}

std::optional<db::model::FeeSummary> FeeReconciler::Summary() {
  auto tx      = repository_->Begin();
  auto summary = repository_->GetFeeSummary(*tx);
  tx->Commit();
  return summary;
}

} // namespace settle::fees
