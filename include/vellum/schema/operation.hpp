#pragma once
#include <vellum/schema/account_balance.hpp>
#include <vellum/schema/call_type.hpp>
#include <vellum/schema/claim_or_refresh_neuron.hpp>
#include <vellum/schema/list_neurons.hpp>
#include <vellum/schema/manage_neuron.hpp>
#include <vellum/schema/notify.hpp>
#include <vellum/schema/principal.hpp>
#include <vellum/schema/transfer.hpp>

#include <string_view>
#include <variant>

namespace vellum::schema {

using operation_t = std::variant<transfer_t,
                                 account_balance_t,
                                 notify_t,
                                 claim_or_refresh_neuron_t,
                                 manage_neuron_t,
                                 list_neurons_t>;

/// Routing of an operation: which canister and method receive it and
/// whether it is an update or a query.
struct method_t final {
  principal_t canister_id;
  std::string_view method_name;
  call_type_t call_type{call_type_t::update};
};

method_t method_of(const operation_t& operation);

/// Short operation name used by the dry-run output ("transfer", ...).
std::string_view operation_name(const operation_t& operation);

}  // namespace vellum::schema
