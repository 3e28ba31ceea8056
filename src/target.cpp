#include "target.hpp"

#include <llvm/IR/DataLayout.h>
#include <llvm/MC/TargetRegistry.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Target/TargetMachine.h>
#include <llvm/ADT/Triple.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "session.hpp"

namespace keel {

void ensure_llvm_target_init() {
    static bool done = false;
    if (done) return;
    done = true;
    llvm::InitializeAllTargetInfos();
    llvm::InitializeAllTargets();
    llvm::InitializeAllTargetMCs();
    llvm::InitializeAllAsmParsers();
    llvm::InitializeAllAsmPrinters();
}

std::optional<TargetKind> parse_target_kind(std::string_view name) {
    if (name == "solana") return TargetKind::Solana;
    if (name == "polkadot") return TargetKind::Polkadot;
    if (name == "soroban") return TargetKind::Soroban;
    if (name == "stylus") return TargetKind::Stylus;
    return std::nullopt;
}

std::string_view target_name(TargetKind kind) {
    switch (kind) {
        case TargetKind::Solana:
            return "solana";
        case TargetKind::Polkadot:
            return "polkadot";
        case TargetKind::Soroban:
            return "soroban";
        case TargetKind::Stylus:
            return "stylus";
    }
    return "unknown";
}

bool is_account_based(TargetKind kind) { return kind == TargetKind::Solana; }

// Solana programs are eBPF; every other ledger runs wasm32.
TargetSpec make_target_spec(TargetKind kind) {
    TargetSpec out{};
    out.kind = kind;
    out.cpu = "generic";
    switch (kind) {
        case TargetKind::Solana:
            out.triple = "bpfel-unknown-unknown";
            out.pointer_bits = 64;
            out.address_length = 32;
            out.value_length = 8;
            out.slot_bits = 32;
            break;
        case TargetKind::Polkadot:
            out.triple = "wasm32-unknown-unknown";
            out.pointer_bits = 32;
            out.address_length = 32;
            out.value_length = 16;
            out.slot_bits = 256;
            break;
        case TargetKind::Soroban:
            out.triple = "wasm32-unknown-unknown";
            out.pointer_bits = 32;
            out.address_length = 32;
            out.value_length = 16;
            out.slot_bits = 64;
            break;
        case TargetKind::Stylus:
            out.triple = "wasm32-unknown-unknown";
            out.pointer_bits = 32;
            out.address_length = 20;
            out.value_length = 32;
            out.slot_bits = 256;
            break;
    }
    return out;
}

std::optional<TargetSpec> compute_target_spec(Session& session,
                                              TargetKind kind) {
    ensure_llvm_target_init();

    TargetSpec out = make_target_spec(kind);

    std::string error{};
    const llvm::Target* target =
        llvm::TargetRegistry::lookupTarget(out.triple, error);
    if (!target) {
        session.error(kCodegenSpan, "LLVM target lookup failed for `" +
                                        out.triple + "`: " + error);
        return std::nullopt;
    }

    llvm::TargetOptions opt{};
    auto reloc = llvm::Optional<llvm::Reloc::Model>{};
    auto tm = std::unique_ptr<llvm::TargetMachine>(target->createTargetMachine(
        out.triple, out.cpu, out.features, opt, reloc));
    if (!tm) {
        session.error(kCodegenSpan, "failed to create LLVM TargetMachine for `" +
                                        out.triple + "`");
        return std::nullopt;
    }

    llvm::DataLayout dl = tm->createDataLayout();
    out.data_layout = dl.getStringRepresentation();
    out.pointer_bits = dl.getPointerSizeInBits(0);
    return out;
}

}  // namespace keel
