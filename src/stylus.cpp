#include <llvm/IR/Constants.h>

#include "binary.hpp"
#include "runtime.hpp"
#include "sema.hpp"

namespace keel {
namespace {

constexpr std::string_view kHooks = "vm_hooks";

bool is_word(const TypeData& d) {
    switch (d.kind) {
        case TypeKind::Bool:
        case TypeKind::Address:
        case TypeKind::Bytes:
        case TypeKind::StorageRef:
            return true;
        case TypeKind::Int:
            return d.bits <= 256;
        default:
            return false;
    }
}

// The host keeps 32-byte words under 32-byte keys and caches writes until
// they are flushed. Only values that fit one word can be placed.
class HostStorage final : public Storage {
   public:
    llvm::Value* load(Binary& bin, TypeId ty, llvm::Value*& slot) override {
        if (!supported(bin, ty, "storage load")) return undef(bin, ty);
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* slot_ptr = bin.spill(slot, "slot");
        llvm::AllocaInst* value = bin.build_alloca(bin.int_ty(256), "value");
        bin.call("storage_load_bytes32", llvm::Type::getVoidTy(bin.context),
                 {slot_ptr, value}, kHooks);
        slot = b.CreateAdd(slot, llvm::ConstantInt::get(bin.slot_ty(), 1));
        return b.CreateLoad(bin.llvm_type(ty), value, "value");
    }

    void store(Binary& bin, TypeId ty, bool, llvm::Value*& slot,
               llvm::Value* value) override {
        if (!supported(bin, ty, "storage store")) return;
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* slot_ptr = bin.spill(slot, "slot");
        llvm::AllocaInst* word = bin.build_alloca(bin.int_ty(256), "value");
        b.CreateStore(llvm::ConstantInt::get(bin.int_ty(256), 0), word);
        b.CreateStore(value, word);
        bin.call("storage_cache_bytes32", llvm::Type::getVoidTy(bin.context),
                 {slot_ptr, word}, kHooks);
        bin.call("storage_flush_cache", llvm::Type::getVoidTy(bin.context),
                 {bin.const_i32(1)}, kHooks);
        slot = b.CreateAdd(slot, llvm::ConstantInt::get(bin.slot_ty(), 1));
    }

    void clear(Binary& bin, TypeId ty, llvm::Value*& slot) override {
        if (!supported(bin, ty, "storage delete")) return;
        store(bin, ty, true, slot,
              llvm::Constant::getNullValue(bin.llvm_type(ty)));
    }

    llvm::Value* subscript(Binary& bin, TypeId, llvm::Value*,
                           llvm::Value*) override {
        report_unsupported(bin, "storage subscript");
        return llvm::UndefValue::get(bin.slot_ty());
    }

    llvm::Value* member(Binary& bin, TypeId, llvm::Value*,
                        std::uint32_t) override {
        report_unsupported(bin, "storage struct member");
        return llvm::UndefValue::get(bin.slot_ty());
    }

    llvm::Value* push(Binary& bin, TypeId, llvm::Value*,
                      llvm::Value*) override {
        report_unsupported(bin, "storage push");
        return llvm::UndefValue::get(bin.slot_ty());
    }

    llvm::Value* pop(Binary& bin, TypeId, llvm::Value*, bool) override {
        report_unsupported(bin, "storage pop");
        return nullptr;
    }

    llvm::Value* array_length(Binary& bin, TypeId, llvm::Value*) override {
        report_unsupported(bin, "storage array length");
        return llvm::UndefValue::get(bin.i32_ty());
    }

   private:
    static bool supported(Binary& bin, TypeId ty, std::string_view op) {
        if (is_word(bin.ns.types.get(ty))) return true;
        report_unsupported(bin, std::string(op) + " of `" +
                                    bin.ns.types.to_string(ty) + "`");
        return false;
    }

    static llvm::Value* undef(Binary& bin, TypeId ty) {
        return llvm::UndefValue::get(bin.llvm_var_ty(ty));
    }
};

class StylusRuntime final : public TargetRuntime {
   public:
    TargetKind kind() const override { return TargetKind::Stylus; }
    Storage& storage() override { return storage_; }

    llvm::Value* hash(Binary& bin, HashTy ty, llvm::Value* data,
                      llvm::Value* len) override {
        if (ty != HashTy::Keccak256) {
            report_unsupported(bin, "hash function");
            return llvm::UndefValue::get(bin.int_ty(hash_length(ty) * 8));
        }
        llvm::Value* res = bin.build_array_alloca(bin.const_i32(32), "res");
        bin.call("native_keccak256", llvm::Type::getVoidTy(bin.context),
                 {data, len, res}, kHooks);
        // bytes32 is held little-endian.
        return bin.load_be(res, 32);
    }

    void print(Binary& bin, llvm::Value* data, llvm::Value* len) override {
        bin.call("log_txt", llvm::Type::getVoidTy(bin.context), {data, len},
                 kHooks);
    }

    void create_contract(Binary& bin, llvm::Value** success, ContractNo,
                         llvm::Value* address, llvm::Value* args,
                         llvm::Value* args_len,
                         const ContractArgs& ca) override {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* endowment = value_word(bin, ca.value);
        llvm::Value* revert_len = bin.build_alloca(bin.i32_ty(), "revert_data_len");

        if (ca.salt) {
            bin.call("create2", llvm::Type::getVoidTy(bin.context),
                     {args, args_len, endowment, ca.salt, address, revert_len},
                     kHooks);
        } else {
            bin.call("create1", llvm::Type::getVoidTy(bin.context),
                     {args, args_len, endowment, address, revert_len}, kHooks);
        }
        b.CreateStore(b.CreateLoad(bin.i32_ty(), revert_len),
                      return_data_len(bin));

        // The host writes the zero address when deployment fails.
        auto* int_ty = bin.int_ty(bin.target.address_length * 8);
        llvm::Value* created = b.CreateICmpNE(
            b.CreateLoad(int_ty, address), llvm::ConstantInt::get(int_ty, 0),
            "created");
        if (success) {
            *success = created;
        } else {
            check_or_fail(bin, *this, created, "create");
        }
    }

    void external_call(Binary& bin, llvm::Value** success,
                       llvm::Value* payload, llvm::Value* payload_len,
                       llvm::Value* address, const ContractArgs& ca,
                       CallTy ty) override {
        llvm::IRBuilder<>& b = bin.builder;
        if (!address) {
            bin.error("external call on target `stylus` needs an address");
            return;
        }
        llvm::Value* data_len = bin.build_alloca(bin.i32_ty(), "return_data_len");

        const char* name = "call_contract";
        if (ty == CallTy::Delegate) name = "delegate_call_contract";
        if (ty == CallTy::Static) name = "static_call_contract";

        std::vector<llvm::Value*> args{address, payload, payload_len};
        if (ty == CallTy::Regular) args.push_back(value_word(bin, ca.value));
        args.push_back(gas_calculation(bin, ca.gas));
        args.push_back(data_len);

        // Nonzero status means failure.
        llvm::Value* status = bin.call(name, bin.int_ty(8), args, kHooks);
        b.CreateStore(b.CreateLoad(bin.i32_ty(), data_len), return_data_len(bin));
        finish(bin, success, status, "call");
    }

    void value_transfer(Binary& bin, llvm::Value** success,
                        llvm::Value* address, llvm::Value* value) override {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* data_len = bin.build_alloca(bin.i32_ty(), "return_data_len");
        llvm::Value* status = bin.call(
            "call_contract", bin.int_ty(8),
            {address, llvm::ConstantPointerNull::get(bin.ptr_ty()),
             bin.const_i32(0), value_word(bin, value),
             gas_calculation(bin, nullptr), data_len},
            kHooks);
        b.CreateStore(b.CreateLoad(bin.i32_ty(), data_len), return_data_len(bin));
        finish(bin, success, status, "transfer");
    }

    llvm::Value* builtin(Binary& bin, BuiltinKind kind,
                         const std::vector<llvm::Value*>&, TypeId ty) override {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Type* out = bin.llvm_type(ty);
        llvm::Type* void_ty = llvm::Type::getVoidTy(bin.context);
        switch (kind) {
            case BuiltinKind::GetAddress:
                return read_address(bin, "contract_address");
            case BuiltinKind::Origin:
                return read_address(bin, "tx_origin");
            case BuiltinKind::Sender:
                return read_address(bin, "msg_sender");
            case BuiltinKind::Value:
                return b.CreateZExtOrTrunc(value_transferred(bin), out);
            case BuiltinKind::Timestamp:
                return b.CreateZExtOrTrunc(
                    bin.call("block_timestamp", bin.i64_ty(), {}, kHooks), out);
            case BuiltinKind::BlockNumber:
                return b.CreateZExtOrTrunc(
                    bin.call("block_number", bin.i64_ty(), {}, kHooks), out);
            case BuiltinKind::Gasleft:
                return b.CreateZExtOrTrunc(
                    bin.call("evm_gas_left", bin.i64_ty(), {}, kHooks), out);
            case BuiltinKind::ChainId:
                return b.CreateZExtOrTrunc(
                    bin.call("chainid", bin.i64_ty(), {}, kHooks), out);
            case BuiltinKind::Calldata: {
                llvm::Value* len = b.CreateLoad(
                    bin.i32_ty(), bin.global("args_len", bin.i32_ty()), "args_len");
                llvm::Value* v = bin.vector_new(len, bin.const_i32(1), nullptr);
                bin.call("read_args", void_ty, {bin.vector_bytes(v)}, kHooks);
                return v;
            }
            default:
                report_unsupported(bin, get_prototype(kind).qualified_name());
                return llvm::UndefValue::get(bin.llvm_var_ty(ty));
        }
    }

    llvm::Value* return_data(Binary& bin) override {
        llvm::Value* size = bin.builder.CreateLoad(
            bin.i32_ty(), return_data_len(bin), "return_data_len");
        llvm::Value* data = bin.build_array_alloca(size, "return_data");
        bin.call("read_return_data", bin.i32_ty(),
                 {data, bin.const_i32(0), size}, kHooks);
        return bin.vector_new(size, bin.const_i32(1), data);
    }

    llvm::Value* value_transferred(Binary& bin) override {
        llvm::AllocaInst* value = bin.build_alloca(bin.int_ty(256), "value");
        bin.call("msg_value", llvm::Type::getVoidTy(bin.context), {value},
                 kHooks);
        return bin.load_be(value, 32);
    }

    void selfdestruct(Binary& bin, llvm::Value*) override {
        report_unsupported(bin, "selfdestruct");
    }

    void emit_event(Binary& bin, llvm::Value* data, llvm::Value* data_len,
                    const std::vector<llvm::Value*>& topics) override {
        llvm::IRBuilder<>& b = bin.builder;
        // Topics as 32-byte big-endian words, followed by the data.
        llvm::Value* topics_len = bin.const_i32(32 * topics.size());
        llvm::Value* total = b.CreateAdd(topics_len, data_len, "log_len");
        llvm::Value* buf = bin.build_array_alloca(total, "log");
        for (size_t i = 0; i < topics.size(); i++) {
            llvm::Value* dest =
                b.CreateGEP(bin.int_ty(8), buf, {bin.const_i32(32 * i)});
            bin.store_be(dest, b.CreateZExtOrTrunc(topics[i], bin.int_ty(256)),
                         32);
        }
        b.CreateMemCpy(b.CreateGEP(bin.int_ty(8), buf, {topics_len}),
                       llvm::MaybeAlign(1), data, llvm::MaybeAlign(1), data_len);
        bin.call("emit_log", llvm::Type::getVoidTy(bin.context),
                 {buf, total, bin.const_i32(topics.size())}, kHooks);
    }

    void return_abi_data(Binary& bin, llvm::Value* data,
                         llvm::Value* len) override {
        bin.call("write_result", llvm::Type::getVoidTy(bin.context), {data, len},
                 kHooks);
        bin.builder.CreateRet(bin.const_i32(0));
    }

    void return_empty_abi(Binary& bin) override {
        bin.builder.CreateRet(bin.const_i32(0));
    }

    // Any code other than success is reported as a failed execution.
    void return_code(Binary& bin, llvm::Value* code) override {
        llvm::IRBuilder<>& b = bin.builder;
        if (auto* c = llvm::dyn_cast<llvm::ConstantInt>(code); c && c->isZero()) {
            b.CreateRet(code);
            return;
        }
        assert_failure(bin, llvm::ConstantPointerNull::get(bin.ptr_ty()),
                       bin.const_i32(0));
    }

    void assert_failure(Binary& bin, llvm::Value*, llvm::Value*) override {
        bin.builder.CreateStore(bin.const_i32(1),
                                bin.global("return_code", bin.i32_ty()));
        bin.builder.CreateRet(bin.const_i32(1));
    }

    void emit_entrypoint(Binary& bin, const Contract&,
                         llvm::Function* dispatch) override {
        auto* fty = llvm::FunctionType::get(bin.i32_ty(), {bin.i32_ty()},
                                            /*isVarArg=*/false);
        llvm::Function* f =
            llvm::Function::Create(fty, llvm::GlobalValue::ExternalLinkage,
                                   "user_entrypoint", bin.module.get());
        f->addFnAttr("wasm-export-name", "user_entrypoint");
        f->getArg(0)->setName("args_len");
        bin.function = f;

        llvm::IRBuilder<>& b = bin.builder;
        b.SetInsertPoint(llvm::BasicBlock::Create(bin.context, "entry", f));
        b.CreateStore(f->getArg(0), bin.global("args_len", bin.i32_ty()));
        if (!dispatch) {
            b.CreateRet(bin.const_i32(0));
            return;
        }
        b.CreateRet(b.CreateCall(dispatch, {}));
    }

   private:
    HostStorage storage_{};

    static llvm::Value* return_data_len(Binary& bin) {
        return bin.global("return_data_len", bin.i32_ty());
    }

    // The host expects the value as a 32-byte word.
    static llvm::Value* value_word(Binary& bin, llvm::Value* value) {
        llvm::Type* ty = bin.int_ty(256);
        llvm::Value* v = value ? bin.builder.CreateZExtOrTrunc(value, ty)
                               : llvm::ConstantInt::get(ty, 0);
        return bin.spill(v, "value");
    }

    // Zero gas means all remaining gas.
    static llvm::Value* gas_calculation(Binary& bin, llvm::Value* gas) {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* all = llvm::ConstantInt::get(bin.i64_ty(), -1, true);
        if (!gas) return all;
        llvm::Value* g = b.CreateZExtOrTrunc(gas, bin.i64_ty());
        return b.CreateSelect(b.CreateICmpEQ(g, bin.const_i64(0)), all, g,
                              "gas");
    }

    static llvm::Value* read_address(Binary& bin, std::string_view host) {
        llvm::Value* address = bin.build_array_alloca(
            bin.const_i32(bin.target.address_length), "address");
        bin.call(host, llvm::Type::getVoidTy(bin.context), {address}, kHooks);
        return bin.load_address(address);
    }

    void finish(Binary& bin, llvm::Value** success, llvm::Value* status,
                std::string_view name) {
        llvm::Value* ok = bin.builder.CreateICmpEQ(
            status, llvm::ConstantInt::get(bin.int_ty(8), 0), "ok");
        if (success) {
            *success = ok;
        } else {
            check_or_fail(bin, *this, ok, name);
        }
    }
};

}  // namespace

std::unique_ptr<TargetRuntime> make_stylus_runtime(Binary&) {
    return std::make_unique<StylusRuntime>();
}

}  // namespace keel
