#pragma once
#include <vellum/schema/enum_string.hpp>
#include <vellum/schema/principal.hpp>
#include <vellum/schema/tokens.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

// Schema type: manage neuron.
// Governance command applied to one neuron owned by the signer.
namespace vellum::schema {

struct add_hot_key_t final {
  principal_t new_hot_key;
  bool operator==(const add_hot_key_t&) const = default;
};

struct remove_hot_key_t final {
  principal_t hot_key_to_remove;
  bool operator==(const remove_hot_key_t&) const = default;
};

struct start_dissolving_t final {
  bool operator==(const start_dissolving_t&) const = default;
};

struct stop_dissolving_t final {
  bool operator==(const stop_dissolving_t&) const = default;
};

struct increase_dissolve_delay_t final {
  uint32_t additional_dissolve_delay_seconds{};
  bool operator==(const increase_dissolve_delay_t&) const = default;
};

// Disburses the whole stake to the controller's default account.
struct disburse_t final {
  bool operator==(const disburse_t&) const = default;
};

// Spawns the maturity into a new neuron controlled by the same principal.
struct spawn_t final {
  bool operator==(const spawn_t&) const = default;
};

struct split_t final {
  tokens_t amount;
  bool operator==(const split_t&) const = default;
};

struct merge_t final {
  uint64_t source_neuron_id{};
  bool operator==(const merge_t&) const = default;
};

struct merge_maturity_t final {
  uint32_t percentage_to_merge{};
  bool operator==(const merge_maturity_t&) const = default;
};

using neuron_command_t = std::variant<add_hot_key_t,
                                      remove_hot_key_t,
                                      start_dissolving_t,
                                      stop_dissolving_t,
                                      increase_dissolve_delay_t,
                                      disburse_t,
                                      spawn_t,
                                      split_t,
                                      merge_t,
                                      merge_maturity_t>;

enum class neuron_command_kind_t : uint8_t {
  add_hot_key = 0,
  remove_hot_key = 1,
  start_dissolving = 2,
  stop_dissolving = 3,
  increase_dissolve_delay = 4,
  disburse = 5,
  spawn = 6,
  split = 7,
  merge = 8,
  merge_maturity = 9
};

inline constexpr auto kNeuronCommandKindMappings = std::array{
    std::pair<std::string_view, neuron_command_kind_t>{
        "add_hot_key", neuron_command_kind_t::add_hot_key},
    std::pair<std::string_view, neuron_command_kind_t>{
        "remove_hot_key", neuron_command_kind_t::remove_hot_key},
    std::pair<std::string_view, neuron_command_kind_t>{
        "start_dissolving", neuron_command_kind_t::start_dissolving},
    std::pair<std::string_view, neuron_command_kind_t>{
        "stop_dissolving", neuron_command_kind_t::stop_dissolving},
    std::pair<std::string_view, neuron_command_kind_t>{
        "increase_dissolve_delay",
        neuron_command_kind_t::increase_dissolve_delay},
    std::pair<std::string_view, neuron_command_kind_t>{
        "disburse", neuron_command_kind_t::disburse},
    std::pair<std::string_view, neuron_command_kind_t>{
        "spawn", neuron_command_kind_t::spawn},
    std::pair<std::string_view, neuron_command_kind_t>{
        "split", neuron_command_kind_t::split},
    std::pair<std::string_view, neuron_command_kind_t>{
        "merge", neuron_command_kind_t::merge},
    std::pair<std::string_view, neuron_command_kind_t>{
        "merge_maturity", neuron_command_kind_t::merge_maturity}};

template <>
inline std::optional<neuron_command_kind_t>
try_from_string<neuron_command_kind_t>(const std::string_view value) {
  return from_string(value, kNeuronCommandKindMappings);
}

inline constexpr std::string_view to_string(const neuron_command_kind_t value) {
  return to_string(value, kNeuronCommandKindMappings).value_or("unknown");
}

/// Alternatives of `neuron_command_t` are declared in kind order.
inline neuron_command_kind_t kind_of(const neuron_command_t& command) {
  return static_cast<neuron_command_kind_t>(command.index());
}

struct manage_neuron_t final {
  uint64_t neuron_id{};
  neuron_command_t command;

  bool operator==(const manage_neuron_t&) const = default;
};

}  // namespace vellum::schema
