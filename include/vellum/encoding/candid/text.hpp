#pragma once
#include <vellum/encoding/candid/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::encoding::candid {

/// Label of a field id among the ledger and governance interfaces this tool
/// speaks, or nullopt for an id no known interface declares.
std::optional<std::string_view> field_name(uint32_t id);

/// Candid textual syntax, e.g.
/// `(record { memo = 42 : nat64; to = "1c7a..." })`. Unknown labels are
/// printed as their numeric id.
std::string to_text(const value_t& value);
std::string to_text(const std::vector<value_t>& args);

/// "1_234_567".
std::string group_digits(std::string digits);

}  // namespace vellum::encoding::candid
