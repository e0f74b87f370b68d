#include "memo.hpp"

#include <cctype>

namespace settle::chain {

namespace {

constexpr std::size_t kMaxAddressLength = 128;

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

} // namespace

std::string PayoutMemo(settle::model::ItemKind kind, std::string_view id) {
  const char* tag = kind == settle::model::ItemKind::kTokenDeposit ? "deposit:" : "credit:";
  return tag + std::string(id);
}

std::string RefundMemo(std::string_view id) {
  return "refund:" + std::string(id);
}

std::string QuarantineMemo(std::string_view id) {
  return "quarantine:" + std::string(id);
}

std::optional<std::string> ParseDestinationReference(std::string_view memo, std::string_view prefix) {
  memo = Trim(memo);

  const auto colon = memo.find(':');
  if (colon == std::string_view::npos) return std::nullopt;
  if (!EqualsIgnoreCase(Trim(memo.substr(0, colon)), Trim(prefix))) return std::nullopt;

  const auto address = Trim(memo.substr(colon + 1));
  if (address.empty() || address.size() > kMaxAddressLength) return std::nullopt;
  for (char c : address) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == ':') return std::nullopt;
  }
  return std::string(address);
}

} // namespace settle::chain
