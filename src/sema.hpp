#pragma once

#include <llvm/ADT/MapVector.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cfg.hpp"
#include "target.hpp"
#include "types.hpp"

namespace keel {

// Name of the dispatch CFG every account-based contract carries.
inline constexpr std::string_view kDispatchCfgName = "solana_dispatch";

// Reserved account names that never index into the caller's accounts.
inline constexpr std::string_view kDataAccount = "dataAccount";
inline constexpr std::string_view kSystemAccount = "systemProgram";

struct AccountFlags {
    bool is_signer = false;
    bool is_writer = false;
};

// Insertion order is the positional layout of the account list.
using AccountSpec =
    llvm::MapVector<std::string, AccountFlags,
                    std::unordered_map<std::string, unsigned>>;

std::optional<std::size_t> account_index(const AccountSpec& spec,
                                         std::string_view name);

enum class FunctionKind : std::uint8_t {
    Constructor,
    Function,
};

struct Param {
    std::string name{};
    TypeId ty = 0;
};

struct Function {
    Span span{};
    std::string name{};
    FunctionKind kind = FunctionKind::Function;
    ContractNo contract_no = 0;
    std::vector<Param> params{};
    std::vector<TypeId> returns{};
    std::optional<std::vector<std::uint8_t>> selector{};
    AccountSpec accounts{};

    bool is_constructor() const { return kind == FunctionKind::Constructor; }
};

struct Contract {
    Span span{};
    std::string name{};
    // Deployed program id, for targets where contracts are instantiated by
    // invoking an existing program.
    std::optional<std::vector<std::uint8_t>> program_id{};
    // Functions in declaration order.
    std::vector<FunctionNo> functions{};
    // function_no -> index into `cfgs`
    std::unordered_map<FunctionNo, std::size_t> all_functions{};
    std::vector<ControlFlowGraph> cfgs{};

    ControlFlowGraph* find_cfg(std::string_view name);
    const ControlFlowGraph* find_cfg(std::string_view name) const;
};

struct Namespace {
    TargetKind target = TargetKind::Polkadot;
    TypeStore types{};
    std::vector<Function> functions{};
    std::vector<Contract> contracts{};

    std::uint32_t address_length() const;
    std::uint32_t value_length() const;

    std::optional<ContractNo> find_contract(std::string_view name) const;
    std::optional<FunctionNo> find_function(ContractNo contract_no,
                                            std::string_view name) const;
    std::optional<FunctionNo> constructor_of(ContractNo contract_no) const;

    // The unsigned integer type the target uses for transferred value.
    TypeId value_type() const;
};

// The dispatch CFG name used for `target`.
std::string dispatch_cfg_name(TargetKind target);

}  // namespace keel
