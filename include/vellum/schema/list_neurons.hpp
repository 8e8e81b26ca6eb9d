#pragma once

#include <cstdint>
#include <vector>

// Schema type: list neurons.
// Governance query for the neurons controlled by (or readable by) the caller.
namespace vellum::schema {

struct list_neurons_t final {
  std::vector<uint64_t> neuron_ids;
  bool include_neurons_readable_by_caller{true};

  bool operator==(const list_neurons_t&) const = default;
};

}  // namespace vellum::schema
