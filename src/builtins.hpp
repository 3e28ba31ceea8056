#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "target.hpp"

namespace keel {

enum class BuiltinKind : std::uint8_t {
    Accounts,
    ProgramId,
    Origin,
    Sender,
    Value,
    Calldata,
    Timestamp,
    BlockNumber,
    Slot,
    ChainId,
    Gasleft,
    GetAddress,
    Keccak256,
    Sha256,
    Ripemd160,
    Blake2_128,
    Blake2_256,
};

struct Prototype {
    BuiltinKind builtin{};
    std::optional<std::string_view> namespace_{};
    std::string_view name{};
    std::vector<std::string_view> params{};
    // Type name as accepted by the module reader. `value` stands for the
    // target's native currency width.
    std::string_view ret{};
    // Empty means every target.
    std::vector<TargetKind> targets{};
    std::string_view doc{};
    // Can be evaluated in a constant context (hash functions).
    bool constant = false;

    bool available_on(TargetKind target) const;
    std::string qualified_name() const;
};

// The table is built on first use and never mutated afterwards.
const std::vector<Prototype>& builtin_prototypes();

const Prototype& get_prototype(BuiltinKind kind);

// Looks up `ns.name` (or a bare `name`) among the builtins available on
// `target`.
const Prototype* find_builtin(std::optional<std::string_view> ns,
                              std::string_view name, TargetKind target);

// Splits a dotted name like `tx.accounts` and looks it up.
const Prototype* find_builtin(std::string_view qualified, TargetKind target);

bool is_hash_builtin(BuiltinKind kind);

}  // namespace keel
