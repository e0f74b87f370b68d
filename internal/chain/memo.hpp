#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/item.hpp"

namespace settle::chain {

// Markers written on outgoing transfers. Recovery searches for them.
std::string PayoutMemo(settle::model::ItemKind kind, std::string_view id);
std::string RefundMemo(std::string_view id);
std::string QuarantineMemo(std::string_view id);

/*
  Destination reference carried in a token deposit memo:

    <prefix>:<address>

  Prefix comparison ignores case, surrounding whitespace is trimmed.
  Returns nullopt for anything else, including an empty address or one
  containing whitespace.
*/
std::optional<std::string> ParseDestinationReference(std::string_view memo, std::string_view prefix);

} // namespace settle::chain
