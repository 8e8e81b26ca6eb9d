#include <vellum/schema/operation.hpp>

namespace vellum::schema {

method_t method_of(const operation_t& operation) {
  return std::visit(
      overloaded{
          [](const transfer_t&) {
            return method_t{.canister_id = ledger_canister_id(),
                            .method_name = "send_dfx",
                            .call_type = call_type_t::update};
          },
          [](const account_balance_t&) {
            return method_t{.canister_id = ledger_canister_id(),
                            .method_name = "account_balance_dfx",
                            .call_type = call_type_t::query};
          },
          [](const notify_t&) {
            return method_t{.canister_id = ledger_canister_id(),
                            .method_name = "notify_dfx",
                            .call_type = call_type_t::update};
          },
          [](const claim_or_refresh_neuron_t&) {
            return method_t{
                .canister_id = governance_canister_id(),
                .method_name = "claim_or_refresh_neuron_from_account",
                .call_type = call_type_t::update};
          },
          [](const manage_neuron_t&) {
            return method_t{.canister_id = governance_canister_id(),
                            .method_name = "manage_neuron",
                            .call_type = call_type_t::update};
          },
          [](const list_neurons_t&) {
            return method_t{.canister_id = governance_canister_id(),
                            .method_name = "list_neurons",
                            .call_type = call_type_t::query};
          }},
      operation);
}

std::string_view operation_name(const operation_t& operation) {
  return std::visit(
      overloaded{
          [](const transfer_t&) { return std::string_view{"transfer"}; },
          [](const account_balance_t&) {
            return std::string_view{"account_balance"};
          },
          [](const notify_t&) { return std::string_view{"notify"}; },
          [](const claim_or_refresh_neuron_t&) {
            return std::string_view{"neuron_stake"};
          },
          [](const manage_neuron_t&) {
            return std::string_view{"manage_neuron"};
          },
          [](const list_neurons_t&) {
            return std::string_view{"list_neurons"};
          }},
      operation);
}

}  // namespace vellum::schema
