#include <llvm/IR/Constants.h>

#include <string>

#include "binary.hpp"
#include "runtime.hpp"
#include "sema.hpp"
#include "slot_storage.hpp"

namespace keel {
namespace {

constexpr std::string_view kSeal = "seal0";

// Size of the scratch buffer host calls write variable-length output into.
constexpr std::uint32_t kScratchSize = 32 * 1024;

// flags of seal_call
constexpr std::uint32_t kReadOnly = 16;

class PolkadotSlot final : public StorageSlot {
   public:
    void set_storage(Binary& bin, llvm::Value* slot_ptr, llvm::Value* value,
                     llvm::Value* len) override {
        bin.call("seal_set_storage", bin.i32_ty(),
                 {slot_ptr, bin.const_i32(32), value, len}, kSeal);
    }

    void get_storage(Binary& bin, llvm::Value* slot_ptr, llvm::Value* dest,
                     llvm::Value* len) override {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* len_ptr = bin.spill(len, "len");
        llvm::Value* rc = bin.call("seal_get_storage", bin.i32_ty(),
                                   {slot_ptr, bin.const_i32(32), dest, len_ptr},
                                   kSeal);

        llvm::BasicBlock* missing = bin.new_block("storage.missing");
        llvm::BasicBlock* done = bin.new_block("storage.done");
        b.CreateCondBr(b.CreateICmpEQ(rc, bin.const_i32(0)), done, missing);

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
        llvm::Value* scratch = bin.malloc(bin.const_i32(kScratchSize));
        llvm::Value* len_ptr = bin.spill(bin.const_i32(kScratchSize), "len");
        llvm::Value* rc = bin.call(
            "seal_get_storage", bin.i32_ty(),
            {slot_ptr, bin.const_i32(32), scratch, len_ptr}, kSeal);
        llvm::Value* len = b.CreateSelect(b.CreateICmpEQ(rc, bin.const_i32(0)),
                                          b.CreateLoad(bin.i32_ty(), len_ptr),
                                          bin.const_i32(0), "len");
        return bin.vector_new(len, bin.const_i32(1), scratch);
    }

    void delete_single_slot(Binary& bin, llvm::Value* slot_ptr) override {
        bin.call("seal_clear_storage", llvm::Type::getVoidTy(bin.context),
                 {slot_ptr, bin.const_i32(32)}, kSeal);
    }

    llvm::Value* hash_to_slot(Binary& bin, llvm::Value* data,
                              llvm::Value* len) override {
        llvm::AllocaInst* out =
            bin.build_alloca(llvm::ArrayType::get(bin.int_ty(8), 32), "hash");
        bin.call("seal_hash_keccak_256", llvm::Type::getVoidTy(bin.context),
                 {data, len, out}, kSeal);
        return bin.load_be(out, 32);
    }
};

class PolkadotRuntime final : public TargetRuntime {
   public:
    PolkadotRuntime() : storage_(*this, slots_) {}

    TargetKind kind() const override { return TargetKind::Polkadot; }
    Storage& storage() override { return storage_; }

    llvm::Value* hash(Binary& bin, HashTy ty, llvm::Value* data,
                      llvm::Value* len) override {
        std::uint32_t n = hash_length(ty);
        llvm::AllocaInst* out =
            bin.build_alloca(llvm::ArrayType::get(bin.int_ty(8), n), "hash");
        llvm::Type* void_ty = llvm::Type::getVoidTy(bin.context);
        switch (ty) {
            case HashTy::Keccak256:
                bin.call("seal_hash_keccak_256", void_ty, {data, len, out}, kSeal);
                break;
            case HashTy::Sha256:
                bin.call("seal_hash_sha2_256", void_ty, {data, len, out}, kSeal);
                break;
            case HashTy::Blake2_128:
                bin.call("seal_hash_blake2_128", void_ty, {data, len, out}, kSeal);
                break;
            case HashTy::Blake2_256:
                bin.call("seal_hash_blake2_256", void_ty, {data, len, out}, kSeal);
                break;
            case HashTy::Ripemd160:
                // Not a host function; provided by the linked runtime library.
                bin.call("ripemd160", void_ty, {data, len, out});
                break;
        }
        return bin.load_be(out, n);
    }

    void print(Binary& bin, llvm::Value* data, llvm::Value* len) override {
        bin.call("seal_debug_message", bin.i32_ty(), {data, len}, kSeal);
    }

    void create_contract(Binary& bin, llvm::Value** success,
                         ContractNo contract_no, llvm::Value* address,
                         llvm::Value* args, llvm::Value* args_len,
                         const ContractArgs& ca) override {
        llvm::IRBuilder<>& b = bin.builder;
        const Contract& target = bin.ns.contracts.at(contract_no);

        // The code hash of the instantiated contract is resolved at link time.
        auto* code_hash = llvm::cast<llvm::GlobalVariable>(
            bin.module->getOrInsertGlobal(target.name + "::code_hash",
                                          llvm::ArrayType::get(bin.int_ty(8), 32)));

        llvm::Value* value = value_ptr(bin, ca.value);
        llvm::Value* gas = ca.gas ? b.CreateZExtOrTrunc(ca.gas, bin.i64_ty())
                                  : bin.const_i64(0);
        llvm::Value* salt = ca.salt ? ca.salt
                                    : llvm::ConstantPointerNull::get(bin.ptr_ty());
        llvm::Value* salt_len = bin.const_i32(ca.salt ? 32 : 0);

        llvm::Value* address_len =
            bin.spill(bin.const_i32(bin.target.address_length), "address_len");
        llvm::Value* scratch = scratch_buffer(bin);
        llvm::Value* scratch_len = bin.spill(bin.const_i32(kScratchSize), "len");

        llvm::Value* rc = bin.call(
            "seal_instantiate", bin.i32_ty(),
            {code_hash, gas, value, args, args_len, address, address_len,
             scratch, scratch_len, salt, salt_len},
            kSeal);
        finish_call(bin, success, rc, scratch, scratch_len, "instantiate");
    }

    void external_call(Binary& bin, llvm::Value** success,
                       llvm::Value* payload, llvm::Value* payload_len,
                       llvm::Value* address, const ContractArgs& ca,
                       CallTy ty) override {
        llvm::IRBuilder<>& b = bin.builder;
        if (!address) {
            bin.error("external call on target `polkadot` needs an address");
            return;
        }
        llvm::Value* scratch = scratch_buffer(bin);
        llvm::Value* scratch_len = bin.spill(bin.const_i32(kScratchSize), "len");

        llvm::Value* rc = nullptr;
        if (ty == CallTy::Delegate) {
            // The callee is a code hash here.
            rc = bin.call("seal_delegate_call", bin.i32_ty(),
                          {bin.const_i32(0), address, payload, payload_len,
                           scratch, scratch_len},
                          kSeal);
        } else {
            std::uint32_t flags = ty == CallTy::Static ? kReadOnly : 0;
            llvm::Value* gas = ca.gas ? b.CreateZExtOrTrunc(ca.gas, bin.i64_ty())
                                      : bin.const_i64(0);
            rc = bin.call("seal_call", bin.i32_ty(),
                          {bin.const_i32(flags), address, gas,
                           value_ptr(bin, ca.value), payload, payload_len,
                           scratch, scratch_len},
                          kSeal);
        }
        finish_call(bin, success, rc, scratch, scratch_len, "call");
    }

    void value_transfer(Binary& bin, llvm::Value** success,
                        llvm::Value* address, llvm::Value* value) override {
        llvm::Value* rc = bin.call(
            "seal_transfer", bin.i32_ty(),
            {address, bin.const_i32(bin.target.address_length),
             value_ptr(bin, value), bin.const_i32(bin.target.value_length)},
            kSeal);
        llvm::Value* ok = bin.builder.CreateICmpEQ(rc, bin.const_i32(0), "ok");
        if (success) {
            *success = ok;
        } else {
            check_or_fail(bin, *this, ok, "transfer");
        }
    }

    llvm::Value* builtin(Binary& bin, BuiltinKind kind,
                         const std::vector<llvm::Value*>&,
                         TypeId ty) override {
        llvm::IRBuilder<>& b = bin.builder;
        switch (kind) {
            case BuiltinKind::Sender:
                return read_address(bin, "seal_caller");
            case BuiltinKind::GetAddress:
                return read_address(bin, "seal_address");
            case BuiltinKind::Value:
                return value_transferred(bin);
            case BuiltinKind::Timestamp:
                return read_int(bin, "seal_now", 64, ty);
            case BuiltinKind::BlockNumber:
                return read_int(bin, "seal_block_number", 32, ty);
            case BuiltinKind::Gasleft:
                return read_int(bin, "seal_gas_left", 64, ty);
            case BuiltinKind::Calldata: {
                llvm::Value* scratch = scratch_buffer(bin);
                llvm::Value* len_ptr =
                    bin.spill(bin.const_i32(kScratchSize), "len");
                bin.call("seal_input", llvm::Type::getVoidTy(bin.context),
                         {scratch, len_ptr}, kSeal);
                return bin.vector_new(b.CreateLoad(bin.i32_ty(), len_ptr),
                                      bin.const_i32(1), scratch);
            }
            default:
                report_unsupported(bin, get_prototype(kind).qualified_name());
                return llvm::UndefValue::get(bin.llvm_var_ty(ty));
        }
    }

    llvm::Value* return_data(Binary& bin) override {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* len =
            b.CreateLoad(bin.i32_ty(), bin.global("return_data_len", bin.i32_ty()));
        llvm::Value* data =
            b.CreateLoad(bin.ptr_ty(), bin.global("return_data", bin.ptr_ty()));
        return bin.vector_new(len, bin.const_i32(1), data);
    }

    llvm::Value* value_transferred(Binary& bin) override {
        llvm::Type* ty = bin.int_ty(bin.target.value_length * 8);
        llvm::AllocaInst* out = bin.build_alloca(ty, "value");
        llvm::Value* len_ptr =
            bin.spill(bin.const_i32(bin.target.value_length), "len");
        bin.call("seal_value_transferred", llvm::Type::getVoidTy(bin.context),
                 {out, len_ptr}, kSeal);
        return bin.builder.CreateLoad(ty, out, "value");
    }

    void selfdestruct(Binary& bin, llvm::Value* address) override {
        bin.call("seal_terminate", llvm::Type::getVoidTy(bin.context),
                 {address}, kSeal);
        bin.builder.CreateUnreachable();
    }

    void emit_event(Binary& bin, llvm::Value* data, llvm::Value* data_len,
                    const std::vector<llvm::Value*>& topics) override {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* topic_buf = llvm::ConstantPointerNull::get(bin.ptr_ty());
        std::uint32_t topic_len = 0;
        if (!topics.empty()) {
            // SCALE encoded Vec<[u8; 32]>: compact length then the topics.
            topic_len = 1 + 32 * topics.size();
            topic_buf = bin.build_alloca(
                llvm::ArrayType::get(bin.int_ty(8), topic_len), "topics");
            b.CreateStore(b.getInt8(topics.size() << 2), topic_buf);
            for (size_t i = 0; i < topics.size(); i++) {
                llvm::Value* dest =
                    b.CreateGEP(bin.int_ty(8), topic_buf,
                                {bin.const_i32(1 + 32 * i)});
                llvm::Value* t = b.CreateZExtOrTrunc(topics[i], bin.int_ty(256));
                bin.store_be(dest, t, 32);
            }
        }
        bin.call("seal_deposit_event", llvm::Type::getVoidTy(bin.context),
                 {topic_buf, bin.const_i32(topic_len), data, data_len}, kSeal);
    }

    void return_abi_data(Binary& bin, llvm::Value* data,
                         llvm::Value* len) override {
        seal_return(bin, 0, data, len);
    }

    void return_empty_abi(Binary& bin) override {
        bin.builder.CreateRet(bin.const_i32(0));
    }

    void return_code(Binary& bin, llvm::Value* code) override {
        bin.builder.CreateRet(code);
    }

    void assert_failure(Binary& bin, llvm::Value* data,
                        llvm::Value* len) override {
        seal_return(bin, 1, data, len);
    }

    void emit_entrypoint(Binary& bin, const Contract&,
                         llvm::Function* dispatch) override {
        for (const char* name : {"deploy", "call"}) {
            auto* fty = llvm::FunctionType::get(
                llvm::Type::getVoidTy(bin.context), {}, /*isVarArg=*/false);
            llvm::Function* f = llvm::Function::Create(
                fty, llvm::GlobalValue::ExternalLinkage, name, bin.module.get());
            f->addFnAttr("wasm-export-name", name);
            bin.function = f;

            llvm::IRBuilder<>& b = bin.builder;
            b.SetInsertPoint(llvm::BasicBlock::Create(bin.context, "entry", f));
            if (!dispatch) {
                b.CreateRetVoid();
                continue;
            }
            llvm::Value* rc = b.CreateCall(dispatch, {});
            llvm::BasicBlock* fail = bin.new_block("fail");
            llvm::BasicBlock* done = bin.new_block("done");
            b.CreateCondBr(b.CreateICmpEQ(rc, bin.const_i32(0)), done, fail);

            b.SetInsertPoint(fail);
            seal_return(bin, 1, llvm::ConstantPointerNull::get(bin.ptr_ty()),
                        bin.const_i32(0));

            b.SetInsertPoint(done);
            b.CreateRetVoid();
        }
    }

   private:
    PolkadotSlot slots_{};
    SlotStorage storage_;

    static llvm::Value* scratch_buffer(Binary& bin) {
        return bin.malloc(bin.const_i32(kScratchSize));
    }

    static llvm::Value* value_ptr(Binary& bin, llvm::Value* value) {
        llvm::Type* ty = bin.int_ty(bin.target.value_length * 8);
        llvm::Value* v = value ? bin.builder.CreateZExtOrTrunc(value, ty)
                               : llvm::ConstantInt::get(ty, 0);
        return bin.spill(v, "value");
    }

    static llvm::Value* read_address(Binary& bin, std::string_view host) {
        llvm::AllocaInst* out = bin.build_alloca(bin.address_ty(), "address");
        llvm::Value* len_ptr =
            bin.spill(bin.const_i32(bin.target.address_length), "len");
        bin.call(host, llvm::Type::getVoidTy(bin.context), {out, len_ptr}, kSeal);
        return bin.load_address(out);
    }

    static llvm::Value* read_int(Binary& bin, std::string_view host,
                                 unsigned bits, TypeId ty) {
        llvm::Type* int_ty = bin.int_ty(bits);
        llvm::AllocaInst* out = bin.build_alloca(int_ty, "out");
        llvm::Value* len_ptr = bin.spill(bin.const_i32(bits / 8), "len");
        bin.call(host, llvm::Type::getVoidTy(bin.context), {out, len_ptr}, kSeal);
        llvm::Value* v = bin.builder.CreateLoad(int_ty, out);
        return bin.builder.CreateZExtOrTrunc(v, bin.llvm_type(ty));
    }

    // Keeps the output of the last call for `return_data` and maps the host
    // status onto `success` or a trap.
    void finish_call(Binary& bin, llvm::Value** success, llvm::Value* rc,
                     llvm::Value* scratch, llvm::Value* scratch_len,
                     std::string_view name) {
        llvm::IRBuilder<>& b = bin.builder;
        b.CreateStore(scratch, bin.global("return_data", bin.ptr_ty()));
        b.CreateStore(b.CreateLoad(bin.i32_ty(), scratch_len),
                      bin.global("return_data_len", bin.i32_ty()));
        llvm::Value* ok = b.CreateICmpEQ(rc, bin.const_i32(0), "ok");
        if (success) {
            *success = ok;
        } else {
            check_or_fail(bin, *this, ok, name);
        }
    }

    static void seal_return(Binary& bin, std::uint32_t flags,
                            llvm::Value* data, llvm::Value* len) {
        bin.call("seal_return", llvm::Type::getVoidTy(bin.context),
                 {bin.const_i32(flags), data, len}, kSeal);
        bin.builder.CreateUnreachable();
    }
};

}  // namespace

std::unique_ptr<TargetRuntime> make_polkadot_runtime(Binary&) {
    return std::make_unique<PolkadotRuntime>();
}

}  // namespace keel
