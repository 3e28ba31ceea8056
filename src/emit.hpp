#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "binary.hpp"
#include "cfg.hpp"

namespace keel {

struct Namespace;
struct Session;
struct TargetSpec;

struct EmitOptions {
    std::optional<std::filesystem::path> out_ll{};
    std::optional<std::filesystem::path> out_bc{};
    std::optional<std::filesystem::path> out_obj{};
};

// Lowers every CFG of the contract into one LLVM module, wraps the dispatch
// function in the target's entry point and verifies the result. Returns
// nullptr if any diagnostic was reported.
std::unique_ptr<Binary> emit_contract(Session& session, const Namespace& ns,
                                      ContractNo contract_no,
                                      const TargetSpec& target);

bool write_outputs(Binary& bin, const EmitOptions& opts);

// Emits every contract of the module and only then writes the outputs, so a
// module with errors leaves no files behind. With several contracts `out.ll`
// becomes `out.Name.ll`.
bool emit_module(Session& session, const Namespace& ns,
                 const TargetSpec& target, const EmitOptions& opts);

}  // namespace keel
