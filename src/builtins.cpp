#include "builtins.hpp"

#include <algorithm>

namespace keel {
namespace {

static std::vector<Prototype> make_prototypes() {
    using T = TargetKind;
    return {
        Prototype{
            .builtin = BuiltinKind::Accounts,
            .namespace_ = "tx",
            .name = "accounts",
            .ret = "slice(AccountInfo)",
            .targets = {T::Solana},
            .doc = "Accounts passed into transaction",
        },
        Prototype{
            .builtin = BuiltinKind::ProgramId,
            .namespace_ = "tx",
            .name = "program_id",
            .ret = "address",
            .targets = {T::Solana},
            .doc = "Program id of the executing program",
        },
        Prototype{
            .builtin = BuiltinKind::Origin,
            .namespace_ = "tx",
            .name = "origin",
            .ret = "address",
            .targets = {T::Stylus},
            .doc = "Original address of sender current transaction",
        },
        Prototype{
            .builtin = BuiltinKind::Sender,
            .namespace_ = "msg",
            .name = "sender",
            .ret = "address",
            .targets = {T::Polkadot, T::Stylus},
            .doc = "Address of caller",
        },
        Prototype{
            .builtin = BuiltinKind::Value,
            .namespace_ = "msg",
            .name = "value",
            .ret = "value",
            .targets = {T::Polkadot, T::Stylus},
            .doc = "Value sent with current call",
        },
        Prototype{
            .builtin = BuiltinKind::Calldata,
            .namespace_ = "msg",
            .name = "data",
            .ret = "bytes",
            .targets = {T::Solana, T::Polkadot, T::Stylus},
            .doc = "Raw input bytes to current call",
        },
        Prototype{
            .builtin = BuiltinKind::Timestamp,
            .namespace_ = "block",
            .name = "timestamp",
            .ret = "uint64",
            .doc = "Current timestamp in unix epoch (seconds since 1970)",
        },
        Prototype{
            .builtin = BuiltinKind::BlockNumber,
            .namespace_ = "block",
            .name = "number",
            .ret = "uint64",
            .doc = "Current block number",
        },
        Prototype{
            .builtin = BuiltinKind::Slot,
            .namespace_ = "block",
            .name = "slot",
            .ret = "uint64",
            .targets = {T::Solana},
            .doc = "Current slot number",
        },
        Prototype{
            .builtin = BuiltinKind::ChainId,
            .namespace_ = "block",
            .name = "chainid",
            .ret = "uint256",
            .targets = {T::Stylus},
            .doc = "Current chain id",
        },
        Prototype{
            .builtin = BuiltinKind::Gasleft,
            .name = "gasleft",
            .ret = "uint64",
            .targets = {T::Polkadot, T::Stylus},
            .doc = "Return remaining gas left in current call",
        },
        Prototype{
            .builtin = BuiltinKind::GetAddress,
            .namespace_ = "this",
            .name = "address",
            .ret = "address",
            .targets = {T::Solana, T::Polkadot, T::Stylus},
            .doc = "Address of the executing contract",
        },
        Prototype{
            .builtin = BuiltinKind::Keccak256,
            .name = "keccak256",
            .params = {"bytes"},
            .ret = "bytes32",
            .doc = "Calculates keccak256 hash",
            .constant = true,
        },
        Prototype{
            .builtin = BuiltinKind::Sha256,
            .name = "sha256",
            .params = {"bytes"},
            .ret = "bytes32",
            .targets = {T::Solana, T::Polkadot, T::Soroban},
            .doc = "Calculates sha256 hash",
            .constant = true,
        },
        Prototype{
            .builtin = BuiltinKind::Ripemd160,
            .name = "ripemd160",
            .params = {"bytes"},
            .ret = "bytes20",
            .targets = {T::Polkadot},
            .doc = "Calculates ripemd hash",
            .constant = true,
        },
        Prototype{
            .builtin = BuiltinKind::Blake2_128,
            .name = "blake2_128",
            .params = {"bytes"},
            .ret = "bytes16",
            .targets = {T::Polkadot},
            .doc = "Calculates blake2-128 hash",
            .constant = true,
        },
        Prototype{
            .builtin = BuiltinKind::Blake2_256,
            .name = "blake2_256",
            .params = {"bytes"},
            .ret = "bytes32",
            .targets = {T::Polkadot},
            .doc = "Calculates blake2-256 hash",
            .constant = true,
        },
    };
}

}  // namespace

bool Prototype::available_on(TargetKind target) const {
    if (targets.empty()) return true;
    return std::find(targets.begin(), targets.end(), target) != targets.end();
}

std::string Prototype::qualified_name() const {
    if (!namespace_) return std::string(name);
    return std::string(*namespace_) + "." + std::string(name);
}

const std::vector<Prototype>& builtin_prototypes() {
    static const std::vector<Prototype> table = make_prototypes();
    return table;
}

const Prototype& get_prototype(BuiltinKind kind) {
    const auto& table = builtin_prototypes();
    auto it = std::find_if(table.begin(), table.end(), [&](const Prototype& p) {
        return p.builtin == kind;
    });
    // Every BuiltinKind has exactly one entry.
    return *it;
}

const Prototype* find_builtin(std::optional<std::string_view> ns,
                              std::string_view name, TargetKind target) {
    for (const Prototype& p : builtin_prototypes()) {
        if (p.name != name || p.namespace_ != ns) continue;
        if (!p.available_on(target)) continue;
        return &p;
    }
    return nullptr;
}

const Prototype* find_builtin(std::string_view qualified, TargetKind target) {
    size_t dot = qualified.find('.');
    if (dot == std::string_view::npos)
        return find_builtin(std::nullopt, qualified, target);
    return find_builtin(qualified.substr(0, dot), qualified.substr(dot + 1),
                        target);
}

bool is_hash_builtin(BuiltinKind kind) {
    switch (kind) {
        case BuiltinKind::Keccak256:
        case BuiltinKind::Sha256:
        case BuiltinKind::Ripemd160:
        case BuiltinKind::Blake2_128:
        case BuiltinKind::Blake2_256:
            return true;
        default:
            return false;
    }
}

}  // namespace keel
