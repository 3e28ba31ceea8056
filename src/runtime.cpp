#include "runtime.hpp"

#include <llvm/IR/Constants.h>

#include <string>

#include "binary.hpp"

namespace keel {

std::optional<HashTy> hash_ty_of(BuiltinKind kind) {
    switch (kind) {
        case BuiltinKind::Keccak256:
            return HashTy::Keccak256;
        case BuiltinKind::Sha256:
            return HashTy::Sha256;
        case BuiltinKind::Ripemd160:
            return HashTy::Ripemd160;
        case BuiltinKind::Blake2_128:
            return HashTy::Blake2_128;
        case BuiltinKind::Blake2_256:
            return HashTy::Blake2_256;
        default:
            return std::nullopt;
    }
}

std::uint32_t hash_length(HashTy ty) {
    switch (ty) {
        case HashTy::Ripemd160:
            return 20;
        case HashTy::Blake2_128:
            return 16;
        default:
            return 32;
    }
}

std::uint64_t TargetRuntime::return_code_value(ReturnCode code) const {
    return static_cast<std::uint64_t>(code);
}

void report_unsupported(Binary& bin, std::string_view op) {
    bin.error("`" + std::string(op) + "` is not supported on target `" +
              std::string(target_name(bin.target.kind)) + "`");
}

void check_or_fail(Binary& bin, TargetRuntime& runtime, llvm::Value* cond,
                   std::string_view name) {
    llvm::BasicBlock* ok_bb = bin.new_block(std::string(name) + ".ok");
    llvm::BasicBlock* fail_bb = bin.new_block(std::string(name) + ".fail");
    bin.builder.CreateCondBr(cond, ok_bb, fail_bb);

    bin.builder.SetInsertPoint(fail_bb);
    runtime.assert_failure(bin, llvm::ConstantPointerNull::get(bin.ptr_ty()),
                           bin.const_i32(0));

    bin.builder.SetInsertPoint(ok_bb);
}

std::unique_ptr<TargetRuntime> make_runtime(Binary& bin) {
    switch (bin.target.kind) {
        case TargetKind::Solana:
            return make_solana_runtime(bin);
        case TargetKind::Polkadot:
            return make_polkadot_runtime(bin);
        case TargetKind::Soroban:
            return make_soroban_runtime(bin);
        case TargetKind::Stylus:
            return make_stylus_runtime(bin);
    }
    return nullptr;
}

}  // namespace keel
