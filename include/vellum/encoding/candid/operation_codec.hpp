#pragma once
#include <vellum/common/error.hpp>
#include <vellum/encoding/candid/value.hpp>
#include <vellum/schema/operation.hpp>
#include <vellum/schema/primitives.hpp>

#include <optional>
#include <string_view>
#include <vector>

// Candid argument records of the ledger and governance methods.
namespace vellum::encoding::candid {

std::vector<value_t> to_values(const vellum::schema::operation_t& operation);

/// The `arg` blob of the call carrying `operation`.
vellum::schema::bytes_t encode_operation(
    const vellum::schema::operation_t& operation);

/// Recovers the typed operation from decoded arguments. Fails with an
/// encoding error when the method is not one of the known ledger or
/// governance methods of `canister_id` or the arguments do not have the
/// expected shape.
std::optional<vellum::schema::operation_t> decode_operation(
    const vellum::schema::principal_t& canister_id,
    std::string_view method_name,
    const std::vector<value_t>& args,
    vellum::common::error& error);

}  // namespace vellum::encoding::candid
