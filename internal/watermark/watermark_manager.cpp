#include "internal/watermark/watermark_manager.hpp"

#include <algorithm>
#include <vector>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"

namespace settle::watermark {

namespace {

const std::vector<std::string>& KnownChains() {
  static const std::vector<std::string> kChains = {std::string(settle::model::SourceChain(settle::model::ItemKind::kTokenDeposit)),
                                                   std::string(settle::model::SourceChain(settle::model::ItemKind::kRegisterCredit))};
  return kChains;
}

} // namespace

WatermarkManager::WatermarkManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::WatermarkPublisher> publisher,
                                   std::shared_ptr<const util::TimeSource> clock, WatermarkOptions options)
    : repository_(std::move(repository)), publisher_(std::move(publisher)), clock_(std::move(clock)), options_(options) {
}

std::int64_t WatermarkManager::Propose(const std::string& chain, std::optional<std::int64_t> oldest_open, std::int64_t pass_start) {
  const auto anchor = oldest_open.has_value() ? std::min(*oldest_open, pass_start) : pass_start;

  db::model::WatermarkProposal proposal;
  proposal.chain      = chain;
  proposal.value      = std::max<std::int64_t>(0, anchor - options_.safety_margin_seconds);
  proposal.created_at = clock_->NowSeconds();

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertWatermarkProposal(*tx, proposal), "propose watermark " + chain);
  tx->Commit();
  return proposal.value;
}

CommitResult WatermarkManager::Commit() {
  CommitResult result;

  const auto last = last_published_at_.load();
  if (options_.min_publish_interval_seconds > 0 && last != kNeverPublished &&
      clock_->NowSeconds() - last < options_.min_publish_interval_seconds) {
    result.throttled = true;
    return result;
  }

  std::vector<db::model::WatermarkProposal> proposals;
  {
    auto tx   = repository_->Begin();
    proposals = repository_->ListWatermarkProposals(*tx);
    for (const auto& proposal : proposals) {
      auto current = repository_->GetWatermark(*tx, proposal.chain);
      auto value   = proposal.value;
      if (current.has_value() && proposal.value < current->value) {
        SETTLE_LOG_WARN("watermark proposal below committed value; clamped", {observability::StringField("chain", proposal.chain),
                                                                              observability::IntField("proposed", proposal.value),
                                                                              observability::IntField("committed", current->value)});
        value = current->value;
        ++result.clamped;
      }
      result.committed[proposal.chain] = value;
    }
    tx->Commit();
  }

  if (proposals.empty()) {
    return result;
  }

  if (publisher_) {
    try {
      publisher_->Publish(result.committed);
    } catch (const std::exception& e) {
      SETTLE_LOG_WARN("watermark publish failed; proposals kept", {observability::ErrorField(e)});
      result.committed.clear();
      return result;
    }
    result.published = true;
  }

  const auto now = clock_->NowSeconds();
  auto       tx  = repository_->Begin();
  for (const auto& proposal : proposals) {
    db::model::WatermarkRecord record;
    record.chain        = proposal.chain;
    record.value        = result.committed[proposal.chain];
    record.committed_at = now;

    auto current = repository_->GetWatermark(*tx, proposal.chain);
    if (!current.has_value() || current->value <= record.value) {
      db::ThrowIfDbError(repository_->UpsertWatermark(*tx, record), "commit watermark " + proposal.chain);
    }

    // a newer proposal written during publish waits for the next commit
    const auto latest = repository_->ListWatermarkProposals(*tx);
    const auto it     = std::find_if(latest.begin(), latest.end(), [&](const auto& p) { return p.chain == proposal.chain; });
    if (it != latest.end() && it->value == proposal.value && it->created_at == proposal.created_at) {
      db::ThrowIfDbError(repository_->DeleteWatermarkProposal(*tx, proposal.chain), "clear watermark proposal " + proposal.chain);
    }
  }
  tx->Commit();
  last_published_at_ = now;

  for (const auto& [chain, value] : result.committed) {
    SETTLE_LOG_INFO("watermark committed", {observability::StringField("chain", chain), observability::IntField("value", value)});
  }
  return result;
}

std::optional<std::int64_t> WatermarkManager::Committed(const std::string& chain) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetWatermark(*tx, chain);
  tx->Commit();
  if (!record.has_value()) return std::nullopt;
  return record->value;
}

std::int64_t WatermarkManager::ScanFrom(const std::string& chain) {
  const auto floor = std::max<std::int64_t>(0, clock_->NowSeconds() - options_.max_lookback_seconds);
  const auto value = Committed(chain);
  return value.has_value() ? std::max(*value, floor) : floor;
}

void WatermarkManager::Recover() {
  std::map<std::string, std::int64_t> published;
  if (publisher_) {
    try {
      published = publisher_->ReadPublished();
    } catch (const std::exception& e) {
      SETTLE_LOG_WARN("reading published watermarks failed; using local values", {observability::ErrorField(e)});
    }
  }

  const auto now   = clock_->NowSeconds();
  const auto floor = std::max<std::int64_t>(0, now - options_.max_lookback_seconds);

  auto tx = repository_->Begin();
  for (const auto& chain : KnownChains()) {
    auto local = repository_->GetWatermark(*tx, chain);
    auto it    = published.find(chain);
    if (it == published.end() && !local.has_value()) {
      continue;
    }

    std::int64_t seed = floor;
    if (it != published.end()) seed = std::max(seed, it->second);
    if (local.has_value()) seed = std::max(seed, local->value);

    if (!local.has_value() || local->value != seed) {
      db::model::WatermarkRecord record;
      record.chain        = chain;
      record.value        = seed;
      record.committed_at = now;
      db::ThrowIfDbError(repository_->UpsertWatermark(*tx, record), "recover watermark " + chain);
    }

    SETTLE_LOG_INFO("watermark recovered", {observability::StringField("chain", chain), observability::IntField("value", seed),
                                            observability::BoolField("from_published", it != published.end())});
  }
  tx->Commit();
}

} // namespace settle::watermark
