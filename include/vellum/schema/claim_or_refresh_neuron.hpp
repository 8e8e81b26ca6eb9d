#pragma once
#include <vellum/schema/principal.hpp>

#include <cstdint>
#include <optional>

// Schema type: claim or refresh neuron.
// Governance staking: claims the neuron funded through the staking
// subaccount derived from (controller, memo), or refreshes its stake after a
// top up.
namespace vellum::schema {

struct claim_or_refresh_neuron_t final {
  uint64_t memo{};
  std::optional<principal_t> controller;

  bool operator==(const claim_or_refresh_neuron_t&) const = default;
};

}  // namespace vellum::schema
