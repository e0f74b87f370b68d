#pragma once

#include <memory>
#include <optional>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace settle::fees {

/*
  Rebuilds the fee summary row from the append-only fee ledger. The
  summary is a cache; the entries are authoritative.
*/
class FeeReconciler {
 public:
  FeeReconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock);

  db::model::FeeSummary Refresh();

  std::optional<db::model::FeeSummary> Summary();

 private:
  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<const util::TimeSource> clock_;
};

} // namespace settle::fees
