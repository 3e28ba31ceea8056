#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "builtins.hpp"
#include "cfg.hpp"
#include "target.hpp"
#include "types.hpp"

namespace llvm {
class Function;
class Type;
class Value;
}  // namespace llvm

namespace keel {

class Binary;
struct Contract;

enum class HashTy : std::uint8_t {
    Keccak256,
    Sha256,
    Ripemd160,
    Blake2_128,
    Blake2_256,
};

// Empty for builtins that are not hash functions.
std::optional<HashTy> hash_ty_of(BuiltinKind kind);
std::uint32_t hash_length(HashTy ty);

// Optional arguments of contract creation and external calls. A null value
// means the caller did not supply it.
struct ContractArgs {
    llvm::Value* program_id = nullptr;
    llvm::Value* value = nullptr;
    llvm::Value* gas = nullptr;
    llvm::Value* salt = nullptr;
    llvm::Value* seeds = nullptr;
    llvm::Value* seeds_len = nullptr;
    llvm::Value* accounts = nullptr;
    llvm::Value* accounts_len = nullptr;
    llvm::Value* flags = nullptr;
};

// Placement of contract state. `slot` is passed by reference where a load,
// store or clear of a composite value walks it forward.
class Storage {
   public:
    virtual ~Storage() = default;

    virtual llvm::Value* load(Binary& bin, TypeId ty, llvm::Value*& slot) = 0;
    // `existing` is true when the slot may hold dynamic data that has to be
    // released before it is overwritten.
    virtual void store(Binary& bin, TypeId ty, bool existing,
                       llvm::Value*& slot, llvm::Value* value) = 0;
    virtual void clear(Binary& bin, TypeId ty, llvm::Value*& slot) = 0;

    virtual llvm::Value* subscript(Binary& bin, TypeId array_ty,
                                   llvm::Value* slot, llvm::Value* index) = 0;
    virtual llvm::Value* member(Binary& bin, TypeId struct_ty,
                                llvm::Value* slot, std::uint32_t field) = 0;

    // Appends `value`, or a zeroed element when it is null, and returns the
    // pushed value or the slot of the new element.
    virtual llvm::Value* push(Binary& bin, TypeId array_ty, llvm::Value* slot,
                              llvm::Value* value) = 0;
    virtual llvm::Value* pop(Binary& bin, TypeId array_ty, llvm::Value* slot,
                             bool load) = 0;
    // uint32
    virtual llvm::Value* array_length(Binary& bin, TypeId array_ty,
                                      llvm::Value* slot) = 0;
};

// Everything the code generator needs from a ledger. Implementations emit
// host calls through `bin`; capabilities a ledger lacks report an error
// diagnostic and return a placeholder value.
class TargetRuntime {
   public:
    virtual ~TargetRuntime() = default;

    virtual TargetKind kind() const = 0;
    virtual Storage& storage() = 0;

    // Returns the digest as an integer of `hash_length(ty) * 8` bits.
    virtual llvm::Value* hash(Binary& bin, HashTy ty, llvm::Value* data,
                              llvm::Value* len) = 0;
    virtual void print(Binary& bin, llvm::Value* data, llvm::Value* len) = 0;

    // When `success` is null a failed call aborts through `assert_failure`,
    // otherwise `*success` receives an i1 status.
    virtual void create_contract(Binary& bin, llvm::Value** success,
                                 ContractNo contract_no, llvm::Value* address,
                                 llvm::Value* args, llvm::Value* args_len,
                                 const ContractArgs& contract_args) = 0;
    virtual void external_call(Binary& bin, llvm::Value** success,
                               llvm::Value* payload, llvm::Value* payload_len,
                               llvm::Value* address,
                               const ContractArgs& contract_args,
                               CallTy ty) = 0;
    virtual void value_transfer(Binary& bin, llvm::Value** success,
                                llvm::Value* address, llvm::Value* value) = 0;

    virtual llvm::Value* builtin(Binary& bin, BuiltinKind kind,
                                 const std::vector<llvm::Value*>& args,
                                 TypeId ty) = 0;
    // Vector holding the output of the last call.
    virtual llvm::Value* return_data(Binary& bin) = 0;
    virtual llvm::Value* value_transferred(Binary& bin) = 0;
    virtual void selfdestruct(Binary& bin, llvm::Value* address) = 0;
    virtual void emit_event(Binary& bin, llvm::Value* data,
                            llvm::Value* data_len,
                            const std::vector<llvm::Value*>& topics) = 0;

    // The following end the current block.
    virtual void return_abi_data(Binary& bin, llvm::Value* data,
                                 llvm::Value* len) = 0;
    virtual void return_empty_abi(Binary& bin) = 0;
    virtual void return_code(Binary& bin, llvm::Value* code) = 0;
    virtual void assert_failure(Binary& bin, llvm::Value* data,
                                llvm::Value* len) = 0;

    virtual std::uint64_t return_code_value(ReturnCode code) const;

    // Wraps the dispatch function (null when the contract has none) in the
    // symbols the host invokes.
    virtual void emit_entrypoint(Binary& bin, const Contract& contract,
                                 llvm::Function* dispatch) = 0;
};

// Reports "`op` is not supported on target `t`".
void report_unsupported(Binary& bin, std::string_view op);

// Branches to `assert_failure` unless `cond` holds and continues in a fresh
// block.
void check_or_fail(Binary& bin, TargetRuntime& runtime, llvm::Value* cond,
                   std::string_view name);

std::unique_ptr<TargetRuntime> make_solana_runtime(Binary& bin);
std::unique_ptr<TargetRuntime> make_polkadot_runtime(Binary& bin);
std::unique_ptr<TargetRuntime> make_soroban_runtime(Binary& bin);
std::unique_ptr<TargetRuntime> make_stylus_runtime(Binary& bin);

std::unique_ptr<TargetRuntime> make_runtime(Binary& bin);

}  // namespace keel
