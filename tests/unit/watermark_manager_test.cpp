#include "internal/watermark/watermark_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "tests/support/fake_publisher.hpp"
#include "tests/support/manual_clock.hpp"

namespace {

using settle::testing::FakePublisher;
using settle::testing::ManualClock;
using settle::watermark::WatermarkManager;
using settle::watermark::WatermarkOptions;

constexpr std::int64_t kNow = 1700000000;

struct Fixture {
  std::shared_ptr<settle::db::memory::MemoryRepository> repo      = std::make_shared<settle::db::memory::MemoryRepository>();
  std::shared_ptr<ManualClock>                          clock     = std::make_shared<ManualClock>(kNow);
  std::shared_ptr<FakePublisher>                        publisher = std::make_shared<FakePublisher>();

  WatermarkManager Manager(std::int64_t margin = 600, std::int64_t lookback = 86400, std::int64_t min_publish_interval = 0) {
    WatermarkOptions options;
    options.safety_margin_seconds        = margin;
    options.max_lookback_seconds         = lookback;
    options.min_publish_interval_seconds = min_publish_interval;
    return WatermarkManager(repo, publisher, clock, options);
  }

  std::size_t ProposalCount() {
    auto tx        = repo->Begin();
    auto proposals = repo->ListWatermarkProposals(*tx);
    tx->Commit();
    return proposals.size();
  }
};

void TestProposalAnchorsOnOldestOpenItem() {
  Fixture f;
  auto    manager = f.Manager();

  assert(manager.Propose("token", std::nullopt, kNow) == kNow - 600);
  assert(manager.Propose("token", kNow - 5000, kNow) == kNow - 5600);
  assert(manager.Propose("token", kNow + 50, kNow) == kNow - 600);
  assert(manager.Propose("register", std::int64_t{10}, kNow) == 0);

  // proposals do nothing until committed
  assert(!manager.Committed("token").has_value());
  assert(f.ProposalCount() == 2);
}

void TestCommitPublishesThenApplies() {
  Fixture f;
  auto    manager = f.Manager();

  manager.Propose("token", std::nullopt, kNow);
  const auto result = manager.Commit();
  assert(result.published);
  assert(result.committed.at("token") == kNow - 600);
  assert(manager.Committed("token") == kNow - 600);
  assert(f.publisher->published.at("token") == kNow - 600);
  assert(f.ProposalCount() == 0);

  // nothing proposed, nothing published
  const auto idle = manager.Commit();
  assert(idle.committed.empty());
  assert(f.publisher->publish_calls == 1);
}

void TestPublishFailureKeepsProposal() {
  Fixture f;
  auto    manager = f.Manager();

  manager.Propose("token", std::nullopt, kNow);
  f.publisher->fail_publish = true;
  const auto failed         = manager.Commit();
  assert(!failed.published);
  assert(failed.committed.empty());
  assert(!manager.Committed("token").has_value());
  assert(f.ProposalCount() == 1);

  f.publisher->fail_publish = false;
  assert(manager.Commit().published);
  assert(manager.Committed("token") == kNow - 600);
}

void TestWatermarkNeverMovesBackward() {
  Fixture f;
  auto    manager = f.Manager();

  manager.Propose("token", std::nullopt, kNow);
  manager.Commit();

  // an old open item would pull the proposal back; the commit clamps it
  manager.Propose("token", kNow - 10000, kNow);
  const auto result = manager.Commit();
  assert(result.clamped == 1);
  assert(result.committed.at("token") == kNow - 600);
  assert(manager.Committed("token") == kNow - 600);
  assert(f.ProposalCount() == 0);
}

void TestPublishIsThrottledByMinInterval() {
  Fixture f;
  auto    manager = f.Manager(600, 86400, 60);

  manager.Propose("token", std::nullopt, kNow);
  assert(manager.Commit().published);
  assert(f.publisher->publish_calls == 1);

  f.clock->Advance(30);
  manager.Propose("token", std::nullopt, kNow + 30);
  const auto early = manager.Commit();
  assert(early.throttled);
  assert(!early.published);
  assert(early.committed.empty());
  assert(f.publisher->publish_calls == 1);
  assert(manager.Committed("token") == kNow - 600);
  assert(f.ProposalCount() == 1);

  f.clock->Advance(30);
  const auto due = manager.Commit();
  assert(!due.throttled);
  assert(due.published);
  assert(f.publisher->publish_calls == 2);
  assert(manager.Committed("token") == kNow + 30 - 600);
  assert(f.ProposalCount() == 0);
}

void TestFailedPublishDoesNotStartInterval() {
  Fixture f;
  auto    manager = f.Manager(600, 86400, 60);

  manager.Propose("token", std::nullopt, kNow);
  f.publisher->fail_publish = true;
  assert(!manager.Commit().published);

  f.publisher->fail_publish = false;
  const auto retry          = manager.Commit();
  assert(!retry.throttled);
  assert(retry.published);
}

void TestScanFromHonoursLookback() {
  Fixture f;
  auto    manager = f.Manager(600, 3600);

  assert(manager.ScanFrom("token") == kNow - 3600);
  manager.Propose("token", std::nullopt, kNow);
  manager.Commit();
  assert(manager.ScanFrom("token") == kNow - 600);

  f.clock->Advance(7200);
  assert(manager.ScanFrom("token") == kNow + 7200 - 3600);
}

void TestRecoverSeedsFromPublished() {
  Fixture f;
  f.publisher->published["token"]    = kNow - 100;
  f.publisher->published["register"] = kNow - 999999;

  auto manager = f.Manager(600, 86400);
  manager.Recover();
  assert(manager.Committed("token") == kNow - 100);
  // clamped to the lookback floor
  assert(manager.Committed("register") == kNow - 86400);
}

void TestRecoverKeepsNewerLocalValue() {
  Fixture f;
  auto    manager = f.Manager();
  manager.Propose("token", std::nullopt, kNow);
  manager.Commit();

  f.publisher->published["token"] = kNow - 50000;
  manager.Recover();
  assert(manager.Committed("token") == kNow - 600);
  assert(!manager.Committed("register").has_value());
}

} // namespace

int main() {
  TestProposalAnchorsOnOldestOpenItem();
  TestCommitPublishesThenApplies();
  TestPublishFailureKeepsProposal();
  TestWatermarkNeverMovesBackward();
  TestPublishIsThrottledByMinInterval();
  TestFailedPublishDoesNotStartInterval();
  TestScanFromHonoursLookback();
  TestRecoverSeedsFromPublished();
  TestRecoverKeepsNewerLocalValue();

  std::cout << "settle_unit_watermark_manager: pass\n";
  return 0;
}
