#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "internal/chain/watermark_publisher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace settle::watermark {

struct WatermarkOptions {
  std::int64_t safety_margin_seconds = 600;
  // Recovery never scans further back than this.
  std::int64_t max_lookback_seconds = 7 * 24 * 3600;
  // Publishing costs a chain write. Commits closer than this to the last
  // successful publish leave the proposals for later; 0 publishes on
  // every commit.
  std::int64_t min_publish_interval_seconds = 0;
};

struct CommitResult {
  std::map<std::string, std::int64_t> committed;
  std::size_t                         clamped   = 0;
  bool                                published = false;
  // Skipped: the last publish is more recent than the minimum interval.
  bool throttled = false;
};

/*
  WatermarkManager

  Detection passes write proposals; Commit() publishes and applies them
  later. A committed watermark never decreases: a proposal below it is
  clamped to the committed value.

  Commit publishes before it applies. If publishing fails nothing is
  applied and the proposals stay for the next attempt. Proposals
  rewritten while a publish was in flight are kept.
*/
class WatermarkManager {
 public:
  WatermarkManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::WatermarkPublisher> publisher,
                   std::shared_ptr<const util::TimeSource> clock, WatermarkOptions options);

  // Writes min(oldest_open, pass_start) - safety margin as the chain's
  // proposal and returns it.
  std::int64_t Propose(const std::string& chain, std::optional<std::int64_t> oldest_open, std::int64_t pass_start);

  CommitResult Commit();

  std::optional<std::int64_t> Committed(const std::string& chain);

  // Where the next detection pass on chain starts.
  std::int64_t ScanFrom(const std::string& chain);

  // Seeds local watermarks from the published ones after a restart.
  void Recover();

 private:
  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<chain::WatermarkPublisher> publisher_;
  std::shared_ptr<const util::TimeSource>    clock_;
  WatermarkOptions                           options_;

  static constexpr std::int64_t kNeverPublished = -1;
  std::atomic<std::int64_t>     last_published_at_{kNeverPublished};
};

} // namespace settle::watermark
