#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace keel {

struct Session;

enum class TargetKind : std::uint8_t {
    Solana,
    Polkadot,
    Soroban,
    Stylus,
};

std::optional<TargetKind> parse_target_kind(std::string_view name);
std::string_view target_name(TargetKind kind);

// Account-based targets pass accounts explicitly and need the account
// metadata pass before emission.
bool is_account_based(TargetKind kind);

struct TargetSpec {
    TargetKind kind = TargetKind::Polkadot;
    std::string triple{};
    std::string cpu{};
    std::string features{};
    std::string data_layout{};

    std::uint32_t pointer_bits = 32;
    std::uint32_t address_length = 32;
    std::uint32_t value_length = 16;
    // Width of a storage slot number.
    std::uint32_t slot_bits = 256;
};

// Fixed properties of the target; does not consult the LLVM registry, so the
// data layout is left empty.
TargetSpec make_target_spec(TargetKind kind);

// Registers every LLVM target once per process.
void ensure_llvm_target_init();

std::optional<TargetSpec> compute_target_spec(Session& session,
                                              TargetKind kind);

}  // namespace keel
