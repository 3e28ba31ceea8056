#include <llvm/IR/Constants.h>

#include "binary.hpp"
#include "runtime.hpp"
#include "sema.hpp"
#include "slot_storage.hpp"

namespace keel {
namespace {

constexpr std::string_view kEnv = "env";

// Tags of the 64-bit host value encoding.
constexpr std::uint64_t kTagTrue = 1;
constexpr std::uint64_t kTagError = 3;
constexpr std::uint64_t kTagU32 = 4;
constexpr std::uint64_t kTagU64Small = 6;

constexpr std::uint64_t kPersistent = 1;

llvm::Value* u32_val(Binary& bin, llvm::Value* x) {
    llvm::IRBuilder<>& b = bin.builder;
    llvm::Value* wide = b.CreateZExtOrTrunc(x, bin.i64_ty());
    return b.CreateOr(b.CreateShl(wide, 32), bin.const_i64(kTagU32));
}

llvm::Value* u32_const(Binary& bin, std::uint64_t x) {
    return bin.const_i64((x << 32) | kTagU32);
}

llvm::Value* ptr_val(Binary& bin, llvm::Value* ptr) {
    return u32_val(bin, bin.builder.CreatePtrToInt(ptr, bin.size_ty()));
}

// Host bytes object holding `len` bytes copied from linear memory.
llvm::Value* bytes_object(Binary& bin, llvm::Value* data, llvm::Value* len) {
    return bin.call("bytes_new_from_linear_memory", bin.i64_ty(),
                    {ptr_val(bin, data), u32_val(bin, len)}, kEnv);
}

void copy_to_linear_memory(Binary& bin, llvm::Value* obj, llvm::Value* dest,
                           llvm::Value* len) {
    bin.call("bytes_copy_to_linear_memory", bin.i64_ty(),
             {obj, u32_const(bin, 0), ptr_val(bin, dest), u32_val(bin, len)},
             kEnv);
}

// Copies a 32-byte hash object out of the host and reads it big-endian.
llvm::Value* load_hash(Binary& bin, llvm::Value* obj, std::uint32_t bytes) {
    llvm::AllocaInst* out =
        bin.build_alloca(llvm::ArrayType::get(bin.int_ty(8), 32), "hash");
    copy_to_linear_memory(bin, obj, out, bin.const_i32(32));
    return bin.load_be(out, bytes);
}

class SorobanSlot final : public StorageSlot {
   public:
    void set_storage(Binary& bin, llvm::Value* slot_ptr, llvm::Value* value,
                     llvm::Value* len) override {
        llvm::Value* obj = bytes_object(bin, value, len);
        bin.call("put_contract_data", bin.i64_ty(),
                 {key(bin, slot_ptr), obj, u32_const(bin, kPersistent)}, kEnv);
    }

    void get_storage(Binary& bin, llvm::Value* slot_ptr, llvm::Value* dest,
                     llvm::Value* len) override {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* k = key(bin, slot_ptr);

        llvm::BasicBlock* present = bin.new_block("storage.present");
        llvm::BasicBlock* missing = bin.new_block("storage.missing");
        llvm::BasicBlock* done = bin.new_block("storage.done");
        b.CreateCondBr(has(bin, k), present, missing);

        b.SetInsertPoint(present);
        llvm::Value* obj = bin.call("get_contract_data", bin.i64_ty(),
                                    {k, u32_const(bin, kPersistent)}, kEnv);
        copy_to_linear_memory(bin, obj, dest, len);
        b.CreateBr(done);

        b.SetInsertPoint(missing);
        b.CreateMemSet(dest, b.getInt8(0), len, llvm::MaybeAlign(1));
        b.CreateBr(done);

        b.SetInsertPoint(done);
    }

    void set_storage_bytes(Binary& bin, llvm::Value* slot_ptr,
                           llvm::Value* vector) override {
        set_storage(bin, slot_ptr, bin.vector_bytes(vector),
                    bin.vector_len(vector));
    }

    llvm::Value* get_storage_bytes(Binary& bin,
                                   llvm::Value* slot_ptr) override {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* k = key(bin, slot_ptr);

        llvm::Value* empty =
            bin.vector_new(bin.const_i32(0), bin.const_i32(1), nullptr);
        llvm::BasicBlock* entry = b.GetInsertBlock();
        llvm::BasicBlock* present = bin.new_block("storage.present");
        llvm::BasicBlock* done = bin.new_block("storage.done");
        b.CreateCondBr(has(bin, k), present, done);

        b.SetInsertPoint(present);
        llvm::Value* obj = bin.call("get_contract_data", bin.i64_ty(),
                                    {k, u32_const(bin, kPersistent)}, kEnv);
        llvm::Value* len_val = bin.call("bytes_len", bin.i64_ty(), {obj}, kEnv);
        llvm::Value* len = b.CreateTrunc(b.CreateLShr(len_val, 32), bin.i32_ty());
        llvm::Value* v = bin.vector_new(len, bin.const_i32(1), nullptr);
        copy_to_linear_memory(bin, obj, bin.vector_bytes(v), len);
        llvm::BasicBlock* present_end = b.GetInsertBlock();
        b.CreateBr(done);

        b.SetInsertPoint(done);
        llvm::PHINode* phi = b.CreatePHI(bin.ptr_ty(), 2, "bytes");
        phi->addIncoming(empty, entry);
        phi->addIncoming(v, present_end);
        return phi;
    }

    void delete_single_slot(Binary& bin, llvm::Value* slot_ptr) override {
        bin.call("del_contract_data", bin.i64_ty(),
                 {key(bin, slot_ptr), u32_const(bin, kPersistent)}, kEnv);
    }

    // The low 64 bits of sha256 over the data.
    llvm::Value* hash_to_slot(Binary& bin, llvm::Value* data,
                              llvm::Value* len) override {
        llvm::Value* obj = bin.call("compute_hash_sha256", bin.i64_ty(),
                                    {bytes_object(bin, data, len)}, kEnv);
        llvm::Value* digest = load_hash(bin, obj, 32);
        return bin.builder.CreateTrunc(digest, bin.slot_ty());
    }

   private:
    static llvm::Value* key(Binary& bin, llvm::Value* slot_ptr) {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* slot = b.CreateLoad(bin.slot_ty(), slot_ptr, "slot");
        return b.CreateOr(b.CreateShl(slot, 8), bin.const_i64(kTagU64Small),
                          "key");
    }

    static llvm::Value* has(Binary& bin, llvm::Value* k) {
        llvm::Value* rc = bin.call("has_contract_data", bin.i64_ty(),
                                   {k, u32_const(bin, kPersistent)}, kEnv);
        return bin.builder.CreateICmpEQ(rc, bin.const_i64(kTagTrue), "has");
    }
};

class SorobanRuntime final : public TargetRuntime {
   public:
    SorobanRuntime() : storage_(*this, slots_) {}

    TargetKind kind() const override { return TargetKind::Soroban; }
    Storage& storage() override { return storage_; }

    llvm::Value* hash(Binary& bin, HashTy ty, llvm::Value* data,
                      llvm::Value* len) override {
        const char* host = nullptr;
        if (ty == HashTy::Sha256) host = "compute_hash_sha256";
        if (ty == HashTy::Keccak256) host = "compute_hash_keccak256";
        if (!host) {
            report_unsupported(bin, "hash function");
            return llvm::UndefValue::get(bin.int_ty(hash_length(ty) * 8));
        }
        llvm::Value* obj =
            bin.call(host, bin.i64_ty(), {bytes_object(bin, data, len)}, kEnv);
        return load_hash(bin, obj, 32);
    }

    void print(Binary& bin, llvm::Value* data, llvm::Value* len) override {
        bin.call("log_from_linear_memory", bin.i64_ty(),
                 {ptr_val(bin, data), u32_val(bin, len), u32_const(bin, 0),
                  u32_const(bin, 0)},
                 kEnv);
    }

    void create_contract(Binary& bin, llvm::Value**, ContractNo, llvm::Value*,
                         llvm::Value*, llvm::Value*,
                         const ContractArgs&) override {
        report_unsupported(bin, "contract creation");
    }

    void external_call(Binary& bin, llvm::Value**, llvm::Value*, llvm::Value*,
                       llvm::Value*, const ContractArgs&, CallTy) override {
        report_unsupported(bin, "external call");
    }

    void value_transfer(Binary& bin, llvm::Value**, llvm::Value*,
                        llvm::Value*) override {
        report_unsupported(bin, "value transfer");
    }

    llvm::Value* builtin(Binary& bin, BuiltinKind kind,
                         const std::vector<llvm::Value*>&, TypeId ty) override {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Type* out = bin.llvm_type(ty);
        switch (kind) {
            case BuiltinKind::Timestamp: {
                llvm::Value* v =
                    bin.call("get_ledger_timestamp", bin.i64_ty(), {}, kEnv);
                return b.CreateZExtOrTrunc(b.CreateLShr(v, 8), out);
            }
            case BuiltinKind::BlockNumber: {
                llvm::Value* v =
                    bin.call("get_ledger_sequence", bin.i64_ty(), {}, kEnv);
                return b.CreateZExtOrTrunc(b.CreateLShr(v, 32), out);
            }
            default:
                report_unsupported(bin, get_prototype(kind).qualified_name());
                return llvm::UndefValue::get(bin.llvm_var_ty(ty));
        }
    }

    llvm::Value* return_data(Binary& bin) override {
        report_unsupported(bin, "return data");
        return llvm::ConstantPointerNull::get(bin.ptr_ty());
    }

    llvm::Value* value_transferred(Binary& bin) override {
        report_unsupported(bin, "msg.value");
        return llvm::UndefValue::get(bin.int_ty(bin.target.value_length * 8));
    }

    void selfdestruct(Binary& bin, llvm::Value*) override {
        report_unsupported(bin, "selfdestruct");
    }

    void emit_event(Binary& bin, llvm::Value*, llvm::Value*,
                    const std::vector<llvm::Value*>&) override {
        report_unsupported(bin, "emit");
    }

    void return_abi_data(Binary& bin, llvm::Value*, llvm::Value*) override {
        report_unsupported(bin, "return of abi encoded data");
    }

    void return_empty_abi(Binary& bin) override {
        bin.builder.CreateRet(bin.const_i32(0));
    }

    void return_code(Binary& bin, llvm::Value* code) override {
        bin.builder.CreateRet(code);
    }

    void assert_failure(Binary& bin, llvm::Value*, llvm::Value*) override {
        bin.call("fail_with_error", bin.i64_ty(),
                 {bin.const_i64((std::uint64_t{1} << 32) | kTagError)}, kEnv);
        bin.builder.CreateUnreachable();
    }

    // Contract functions are invoked by name; there is no dispatcher.
    void emit_entrypoint(Binary& bin, const Contract& contract,
                         llvm::Function*) override {
        for (const ControlFlowGraph& cfg : contract.cfgs) {
            if (!cfg.function_no) continue;
            if (llvm::Function* f = bin.module->getFunction(cfg.name))
                f->addFnAttr("wasm-export-name", cfg.name);
        }
    }

   private:
    SorobanSlot slots_{};
    SlotStorage storage_;
};

}  // namespace

std::unique_ptr<TargetRuntime> make_soroban_runtime(Binary&) {
    return std::make_unique<SorobanRuntime>();
}

}  // namespace keel
