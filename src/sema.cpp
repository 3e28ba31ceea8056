#include "sema.hpp"

namespace keel {

std::optional<std::size_t> account_index(const AccountSpec& spec,
                                         std::string_view name) {
    auto it = spec.find(std::string(name));
    if (it == spec.end()) return std::nullopt;
    return static_cast<std::size_t>(it - spec.begin());
}

ControlFlowGraph* Contract::find_cfg(std::string_view name) {
    for (ControlFlowGraph& cfg : cfgs) {
        if (cfg.name == name) return &cfg;
    }
    return nullptr;
}

const ControlFlowGraph* Contract::find_cfg(std::string_view name) const {
    for (const ControlFlowGraph& cfg : cfgs) {
        if (cfg.name == name) return &cfg;
    }
    return nullptr;
}

std::uint32_t Namespace::address_length() const {
    return make_target_spec(target).address_length;
}

std::uint32_t Namespace::value_length() const {
    return make_target_spec(target).value_length;
}

std::optional<ContractNo> Namespace::find_contract(
    std::string_view name) const {
    for (ContractNo i = 0; i < contracts.size(); i++) {
        if (contracts[i].name == name) return i;
    }
    return std::nullopt;
}

std::optional<FunctionNo> Namespace::find_function(
    ContractNo contract_no, std::string_view name) const {
    for (FunctionNo f : contracts.at(contract_no).functions) {
        if (functions[f].name == name) return f;
    }
    return std::nullopt;
}

std::optional<FunctionNo> Namespace::constructor_of(
    ContractNo contract_no) const {
    for (FunctionNo f : contracts.at(contract_no).functions) {
        if (functions[f].is_constructor()) return f;
    }
    return std::nullopt;
}

TypeId Namespace::value_type() const {
    return types.uint(static_cast<std::uint16_t>(value_length() * 8));
}

std::string dispatch_cfg_name(TargetKind target) {
    if (target == TargetKind::Solana) return std::string(kDispatchCfgName);
    return std::string(target_name(target)) + "_dispatch";
}

}  // namespace keel
