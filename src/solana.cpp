#include <llvm/IR/Constants.h>

#include "binary.hpp"
#include "runtime.hpp"
#include "sema.hpp"

namespace keel {
namespace {

// Upper bound on the accounts a transaction hands to the program.
constexpr std::uint64_t kMaxAccounts = 64;

constexpr std::uint64_t kErrorShift = 32;

std::uint64_t error_code(std::uint64_t n) { return n << kErrorShift; }

llvm::StructType* named_struct(Binary& bin, llvm::StringRef name,
                               llvm::ArrayRef<llvm::Type*> fields) {
    if (auto* st = llvm::StructType::getTypeByName(bin.context, name))
        return st;
    return llvm::StructType::create(bin.context, fields, name);
}

llvm::StructType* sol_parameters_ty(Binary& bin) {
    return named_struct(bin, "struct.SolParameters",
                        {bin.ptr_ty(), bin.i64_ty(), bin.ptr_ty(),
                         bin.i64_ty(), bin.ptr_ty()});
}

llvm::StructType* sol_bytes_ty(Binary& bin) {
    return named_struct(bin, "struct.SolBytes", {bin.ptr_ty(), bin.i64_ty()});
}

llvm::StructType* sol_instruction_ty(Binary& bin) {
    return named_struct(bin, "struct.SolInstruction",
                        {bin.ptr_ty(), bin.ptr_ty(), bin.i64_ty(),
                         bin.ptr_ty(), bin.i64_ty()});
}

// slot, epoch_start_timestamp, epoch, leader_schedule_epoch, unix_timestamp
llvm::StructType* clock_ty(Binary& bin) {
    return named_struct(bin, "struct.Clock",
                        {bin.i64_ty(), bin.i64_ty(), bin.i64_ty(),
                         bin.i64_ty(), bin.i64_ty()});
}

llvm::Type* account_info_ty(Binary& bin) {
    return bin.llvm_type(bin.ns.types.struct_(StructKind::AccountInfo));
}

// Every contract function receives the deserialized parameters first.
llvm::Value* params(Binary& bin) { return bin.function->getArg(0); }

llvm::Value* param_field(Binary& bin, unsigned field, llvm::Type* ty,
                         std::string_view name) {
    llvm::Value* p =
        bin.builder.CreateStructGEP(sol_parameters_ty(bin), params(bin), field);
    return bin.builder.CreateLoad(ty, p,
                                  llvm::StringRef(name.data(), name.size()));
}

// Ends the block with `code` unless `ok` holds.
void check_or_return(Binary& bin, llvm::Value* ok, std::uint64_t code,
                     std::string_view name) {
    llvm::IRBuilder<>& b = bin.builder;
    llvm::BasicBlock* ok_bb = bin.new_block(std::string(name) + ".ok");
    llvm::BasicBlock* fail_bb = bin.new_block(std::string(name) + ".fail");
    b.CreateCondBr(ok, ok_bb, fail_bb);

    b.SetInsertPoint(fail_bb);
    b.CreateRet(bin.const_i64(code));

    b.SetInsertPoint(ok_bb);
}

// Contract state lives in the data account: a slot is a byte offset into
// its data. Fixed-size values are stored inline; strings, bytes and dynamic
// arrays store the uint32 offset of a heap allocation inside the account
// managed by the runtime library. Offset 0 means no allocation.
class SolanaStorage final : public Storage {
   public:
    explicit SolanaStorage(TargetRuntime& runtime) : runtime_(runtime) {}

    llvm::Value* load(Binary& bin, TypeId ty, llvm::Value*& slot) override {
        const TypeStore& ts = bin.ns.types;
        const TypeData& d = ts.get(ty);
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* out = nullptr;

        switch (d.kind) {
            case TypeKind::Bool:
            case TypeKind::Int:
            case TypeKind::Address:
            case TypeKind::Bytes:
            case TypeKind::StorageRef:
                out = b.CreateLoad(bin.llvm_type(ty), at(bin, slot), "value");
                break;
            case TypeKind::DynamicBytes:
            case TypeKind::String: {
                llvm::Value* offset = heap_offset(bin, slot);
                out = bin.vector_new(heap_len(bin, offset), bin.const_i32(1),
                                     at(bin, offset));
                break;
            }
            case TypeKind::Array: {
                llvm::Type* elem_ll = bin.llvm_type(d.elem);
                llvm::Value* base = slot;
                llvm::Value* buf = nullptr;
                llvm::Value* n = nullptr;
                if (d.array_len) {
                    out = bin.build_alloca(bin.llvm_type(ty), "array");
                    buf = out;
                    n = bin.const_i32(*d.array_len);
                } else {
                    base = heap_offset(bin, slot);
                    n = array_length(bin, ty, slot);
                    out = bin.vector_new(n, bin.const_i32(bin.store_size(elem_ll)),
                                         nullptr);
                    buf = bin.vector_bytes(out);
                }
                bin.emit_loop(n, "load", [&](llvm::Value* i) {
                    llvm::Value* s = element(bin, base, d.elem, i);
                    llvm::Value* v = load(bin, d.elem, s);
                    bin.store_value(d.elem, b.CreateGEP(elem_ll, buf, {i}), v);
                });
                break;
            }
            case TypeKind::Struct: {
                llvm::Type* ll = bin.llvm_type(ty);
                out = bin.build_alloca(ll, "struct");
                const auto& fields = ts.struct_fields(ty);
                for (std::uint32_t i = 0; i < fields.size(); i++) {
                    llvm::Value* s = member(bin, ty, slot, i);
                    llvm::Value* v = load(bin, fields[i].type, s);
                    bin.store_value(fields[i].type, b.CreateStructGEP(ll, out, i),
                                    v);
                }
                break;
            }
            default:
                unsupported(bin, "storage load", ty);
                return llvm::UndefValue::get(bin.llvm_var_ty(ty));
        }
        slot = advance(bin, slot, bin.layout.storage_bytes(ty));
        return out;
    }

    void store(Binary& bin, TypeId ty, bool existing, llvm::Value*& slot,
               llvm::Value* value) override {
        const TypeStore& ts = bin.ns.types;
        const TypeData& d = ts.get(ty);
        llvm::IRBuilder<>& b = bin.builder;

        switch (d.kind) {
            case TypeKind::Bool:
            case TypeKind::Int:
            case TypeKind::Address:
            case TypeKind::Bytes:
            case TypeKind::StorageRef:
                b.CreateStore(value, at(bin, slot));
                break;
            case TypeKind::DynamicBytes:
            case TypeKind::String: {
                llvm::Value* len = bin.vector_len(value);
                llvm::Value* offset = resize(bin, slot, len, existing);
                b.CreateMemCpy(at(bin, offset), llvm::MaybeAlign(1),
                               bin.vector_bytes(value), llvm::MaybeAlign(1), len);
                break;
            }
            case TypeKind::Array: {
                llvm::Type* elem_ll = bin.llvm_type(d.elem);
                llvm::Value* base = slot;
                llvm::Value* buf = value;
                llvm::Value* n = nullptr;
                if (d.array_len) {
                    n = bin.const_i32(*d.array_len);
                } else {
                    n = bin.vector_len(value);
                    if (existing && ts.is_dynamic(d.elem))
                        release_tail(bin, ty, slot, n);
                    llvm::Value* bytes =
                        b.CreateMul(n, bin.const_i32(stride(bin, d.elem)));
                    base = resize(bin, slot, bytes, existing);
                    buf = bin.vector_bytes(value);
                }
                bin.emit_loop(n, "store", [&](llvm::Value* i) {
                    llvm::Value* s = element(bin, base, d.elem, i);
                    llvm::Value* v = bin.load_value(
                        d.elem, b.CreateGEP(elem_ll, buf, {i}));
                    store(bin, d.elem, existing, s, v);
                });
                break;
            }
            case TypeKind::Struct: {
                llvm::Type* ll = bin.llvm_type(ty);
                const auto& fields = ts.struct_fields(ty);
                for (std::uint32_t i = 0; i < fields.size(); i++) {
                    llvm::Value* s = member(bin, ty, slot, i);
                    llvm::Value* v = bin.load_value(
                        fields[i].type, b.CreateStructGEP(ll, value, i));
                    store(bin, fields[i].type, existing, s, v);
                }
                break;
            }
            default:
                unsupported(bin, "storage store", ty);
                return;
        }
        slot = advance(bin, slot, bin.layout.storage_bytes(ty));
    }

    void clear(Binary& bin, TypeId ty, llvm::Value*& slot) override {
        const TypeStore& ts = bin.ns.types;
        const TypeData& d = ts.get(ty);
        llvm::IRBuilder<>& b = bin.builder;

        switch (d.kind) {
            case TypeKind::Bool:
            case TypeKind::Int:
            case TypeKind::Address:
            case TypeKind::Bytes:
            case TypeKind::StorageRef: {
                llvm::Type* ll = bin.llvm_type(ty);
                b.CreateStore(llvm::Constant::getNullValue(ll), at(bin, slot));
                break;
            }
            case TypeKind::DynamicBytes:
            case TypeKind::String:
                free_heap(bin, slot);
                break;
            case TypeKind::Array:
                if (d.array_len) {
                    llvm::Value* base = slot;
                    bin.emit_loop(bin.const_i32(*d.array_len), "clear",
                                  [&](llvm::Value* i) {
                                      llvm::Value* s =
                                          element(bin, base, d.elem, i);
                                      clear(bin, d.elem, s);
                                  });
                } else {
                    if (ts.is_dynamic(d.elem))
                        release_tail(bin, ty, slot, bin.const_i32(0));
                    free_heap(bin, slot);
                }
                break;
            case TypeKind::Struct: {
                const auto& fields = ts.struct_fields(ty);
                for (std::uint32_t i = 0; i < fields.size(); i++) {
                    llvm::Value* s = member(bin, ty, slot, i);
                    clear(bin, fields[i].type, s);
                }
                break;
            }
            default:
                unsupported(bin, "storage delete", ty);
                return;
        }
        slot = advance(bin, slot, bin.layout.storage_bytes(ty));
    }

    llvm::Value* subscript(Binary& bin, TypeId array_ty, llvm::Value* slot,
                           llvm::Value* index) override {
        const TypeStore& ts = bin.ns.types;
        const TypeData& d = ts.get(array_ty);
        llvm::IRBuilder<>& b = bin.builder;

        if (d.kind != TypeKind::Array && d.kind != TypeKind::DynamicBytes &&
            d.kind != TypeKind::String) {
            unsupported(bin, "storage subscript", array_ty);
            return llvm::UndefValue::get(bin.slot_ty());
        }
        TypeId elem = d.kind == TypeKind::Array ? d.elem : ts.uint(8);
        llvm::Value* idx = b.CreateZExtOrTrunc(index, bin.i32_ty());
        llvm::Value* len = array_length(bin, array_ty, slot);
        check_or_fail(bin, runtime_, b.CreateICmpULT(idx, len), "bounds");

        llvm::Value* base = d.kind == TypeKind::Array && d.array_len
                                ? slot
                                : heap_offset(bin, slot);
        return element(bin, base, elem, idx);
    }

    llvm::Value* member(Binary& bin, TypeId struct_ty, llvm::Value* slot,
                        std::uint32_t field) override {
        return advance(bin, slot, bin.layout.field_offset(struct_ty, field));
    }

    llvm::Value* push(Binary& bin, TypeId array_ty, llvm::Value* slot,
                      llvm::Value* value) override {
        const TypeStore& ts = bin.ns.types;
        if (!ts.is_dynamic_array(array_ty)) {
            unsupported(bin, "push", array_ty);
            return llvm::UndefValue::get(bin.slot_ty());
        }
        llvm::IRBuilder<>& b = bin.builder;
        TypeId elem = ts.get(array_ty).elem;
        llvm::Value* elem_bytes = bin.const_i32(stride(bin, elem));

        llvm::Value* old_bytes = heap_len(bin, heap_offset(bin, slot));
        llvm::Value* offset =
            resize(bin, slot, b.CreateAdd(old_bytes, elem_bytes), true);
        llvm::Value* elem_slot = b.CreateAdd(offset, old_bytes, "elem_slot");
        if (value) {
            llvm::Value* s = elem_slot;
            store(bin, elem, false, s, value);
        }
        return value ? value : elem_slot;
    }

    llvm::Value* pop(Binary& bin, TypeId array_ty, llvm::Value* slot,
                     bool load_value) override {
        const TypeStore& ts = bin.ns.types;
        if (!ts.is_dynamic_array(array_ty)) {
            unsupported(bin, "pop", array_ty);
            return nullptr;
        }
        llvm::IRBuilder<>& b = bin.builder;
        TypeId elem = ts.get(array_ty).elem;
        llvm::Value* elem_bytes = bin.const_i32(stride(bin, elem));

        llvm::Value* offset = heap_offset(bin, slot);
        llvm::Value* bytes = heap_len(bin, offset);
        check_or_fail(bin, runtime_, b.CreateICmpNE(bytes, bin.const_i32(0)),
                      "pop_empty");

        llvm::Value* new_bytes = b.CreateSub(bytes, elem_bytes, "new_bytes");
        llvm::Value* elem_slot = b.CreateAdd(offset, new_bytes, "elem_slot");
        llvm::Value* out = nullptr;
        if (load_value) {
            llvm::Value* s = elem_slot;
            out = load(bin, elem, s);
        }
        llvm::Value* s = elem_slot;
        clear(bin, elem, s);
        resize(bin, slot, new_bytes, true);
        return out;
    }

    llvm::Value* array_length(Binary& bin, TypeId array_ty,
                              llvm::Value* slot) override {
        const TypeStore& ts = bin.ns.types;
        const TypeData& d = ts.get(array_ty);
        if (d.kind == TypeKind::Array && d.array_len)
            return bin.const_i32(*d.array_len);
        if (d.kind != TypeKind::Array && d.kind != TypeKind::DynamicBytes &&
            d.kind != TypeKind::String) {
            unsupported(bin, "storage array length", array_ty);
            return llvm::UndefValue::get(bin.i32_ty());
        }
        llvm::Value* bytes = heap_len(bin, heap_offset(bin, slot));
        if (d.kind != TypeKind::Array) return bytes;
        return bin.builder.CreateUDiv(bytes, bin.const_i32(stride(bin, d.elem)),
                                      "len");
    }

   private:
    TargetRuntime& runtime_;

    static void unsupported(Binary& bin, std::string_view op, TypeId ty) {
        report_unsupported(bin, std::string(op) + " of `" +
                                    bin.ns.types.to_string(ty) + "`");
    }

    static std::uint64_t stride(Binary& bin, TypeId elem) {
        Layout l = bin.layout.layout_of(elem);
        return StorageLayout::align_up(l.size, l.align);
    }

    static llvm::Value* advance(Binary& bin, llvm::Value* slot,
                                std::uint64_t n) {
        if (n == 0) return slot;
        return bin.builder.CreateAdd(slot, bin.const_i32(n), "slot");
    }

    static llvm::Value* element(Binary& bin, llvm::Value* base, TypeId elem,
                                llvm::Value* index) {
        llvm::IRBuilder<>& b = bin.builder;
        return b.CreateAdd(base, b.CreateMul(index, bin.const_i32(stride(bin, elem))),
                           "elem_slot");
    }

    static llvm::Value* data(Binary& bin) {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::Value* ka = param_field(bin, 0, bin.ptr_ty(), "ka");
        llvm::Value* field = b.CreateStructGEP(account_info_ty(bin), ka, 3);
        return b.CreateLoad(bin.ptr_ty(), field, "account_data");
    }

    static llvm::Value* at(Binary& bin, llvm::Value* offset) {
        return bin.builder.CreateGEP(bin.int_ty(8), data(bin), {offset});
    }

    static llvm::Value* heap_offset(Binary& bin, llvm::Value* slot) {
        return bin.builder.CreateLoad(bin.i32_ty(), at(bin, slot), "offset");
    }

    // Allocation size in bytes; 0 for offset 0.
    static llvm::Value* heap_len(Binary& bin, llvm::Value* offset) {
        return bin.call("account_data_len", bin.i32_ty(), {data(bin), offset});
    }

    void free_heap(Binary& bin, llvm::Value* slot) {
        bin.call("account_data_free", llvm::Type::getVoidTy(bin.context),
                 {data(bin), heap_offset(bin, slot)});
        bin.builder.CreateStore(bin.const_i32(0), at(bin, slot));
    }

    // (Re)allocates the heap object referenced from `slot` to `bytes` and
    // returns its offset. Growth is zero-filled.
    llvm::Value* resize(Binary& bin, llvm::Value* slot, llvm::Value* bytes,
                        bool existing) {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::AllocaInst* new_offset = bin.build_alloca(bin.i32_ty(), "new_offset");
        llvm::Value* rc = nullptr;
        if (existing) {
            rc = bin.call("account_data_realloc", bin.i64_ty(),
                          {data(bin), heap_offset(bin, slot), bytes, new_offset});
        } else {
            rc = bin.call("account_data_alloc", bin.i64_ty(),
                          {data(bin), bytes, new_offset});
        }
        check_or_return(bin, b.CreateICmpEQ(rc, bin.const_i64(0)),
                        error_code(5), "account_data");
        llvm::Value* offset = b.CreateLoad(bin.i32_ty(), new_offset, "offset");
        b.CreateStore(offset, at(bin, slot));
        return offset;
    }

    // Clears the elements from `keep` to the current end.
    void release_tail(Binary& bin, TypeId array_ty, llvm::Value* slot,
                      llvm::Value* keep) {
        llvm::IRBuilder<>& b = bin.builder;
        TypeId elem = bin.ns.types.get(array_ty).elem;
        llvm::Value* old_len = array_length(bin, array_ty, slot);
        llvm::Value* excess = b.CreateSelect(b.CreateICmpUGT(old_len, keep),
                                             b.CreateSub(old_len, keep),
                                             bin.const_i32(0), "excess");
        llvm::Value* base = heap_offset(bin, slot);
        bin.emit_loop(excess, "release", [&](llvm::Value* i) {
            llvm::Value* s = element(bin, base, elem, b.CreateAdd(keep, i));
            clear(bin, elem, s);
        });
    }
};

class SolanaRuntime final : public TargetRuntime {
   public:
    SolanaRuntime() : storage_(*this) {}

    TargetKind kind() const override { return TargetKind::Solana; }
    Storage& storage() override { return storage_; }

    llvm::Value* hash(Binary& bin, HashTy ty, llvm::Value* data,
                      llvm::Value* len) override {
        const char* host = nullptr;
        if (ty == HashTy::Keccak256) host = "sol_keccak256";
        if (ty == HashTy::Sha256) host = "sol_sha256";
        if (!host) {
            report_unsupported(bin, "hash function");
            return llvm::UndefValue::get(bin.int_ty(hash_length(ty) * 8));
        }
        llvm::Value* input = sol_bytes(bin, {{data, len}});
        llvm::AllocaInst* out =
            bin.build_alloca(llvm::ArrayType::get(bin.int_ty(8), 32), "hash");
        bin.call(host, bin.i64_ty(), {input, bin.const_i64(1), out});
        return bin.load_be(out, 32);
    }

    void print(Binary& bin, llvm::Value* data, llvm::Value* len) override {
        bin.call("sol_log_", llvm::Type::getVoidTy(bin.context),
                 {data, bin.builder.CreateZExt(len, bin.i64_ty())});
    }

    void create_contract(Binary& bin, llvm::Value** success,
                         ContractNo contract_no, llvm::Value*,
                         llvm::Value* args, llvm::Value* args_len,
                         const ContractArgs& ca) override {
        const Contract& c = bin.ns.contracts.at(contract_no);
        llvm::Value* program_id = ca.program_id;
        if (!program_id && c.program_id) {
            program_id = bin.emit_global_string(c.name + ".program_id",
                                                *c.program_id);
        }
        if (!program_id) {
            bin.error("contract `" + c.name +
                      "` has no program_id; it cannot be created on target "
                      "`solana`");
            return;
        }
        if (!ca.accounts) {
            bin.error("accounts for creating `" + c.name +
                      "` were not resolved");
            return;
        }
        invoke(bin, success, program_id, args, args_len, ca, "create");
    }

    void external_call(Binary& bin, llvm::Value** success,
                       llvm::Value* payload, llvm::Value* payload_len,
                       llvm::Value* address, const ContractArgs& ca,
                       CallTy ty) override {
        if (ty != CallTy::Regular) {
            report_unsupported(bin, std::string(call_ty_name(ty)) + " call");
            return;
        }
        llvm::Value* program_id = address ? address : ca.program_id;
        if (!program_id || !ca.accounts) {
            bin.error(
                "external call on target `solana` needs a program id and "
                "an accounts list");
            return;
        }
        // Lamports move through the system program, never with the call.
        invoke(bin, success, program_id, payload, payload_len, ca, "call");
    }

    void value_transfer(Binary& bin, llvm::Value**, llvm::Value*,
                        llvm::Value*) override {
        report_unsupported(bin, "value transfer");
    }

    llvm::Value* builtin(Binary& bin, BuiltinKind kind,
                         const std::vector<llvm::Value*>&, TypeId ty) override {
        llvm::IRBuilder<>& b = bin.builder;
        switch (kind) {
            case BuiltinKind::Accounts: {
                llvm::Value* ka = param_field(bin, 0, bin.ptr_ty(), "ka");
                llvm::Value* ka_num = param_field(bin, 1, bin.i64_ty(), "ka_num");
                llvm::Value* slice =
                    llvm::UndefValue::get(bin.slice_ty());
                slice = b.CreateInsertValue(slice, ka, {0});
                slice = b.CreateInsertValue(
                    slice, b.CreateZExtOrTrunc(ka_num, bin.size_ty()), {1});
                return slice;
            }
            case BuiltinKind::ProgramId:
            case BuiltinKind::GetAddress: {
                llvm::Value* id = param_field(bin, 4, bin.ptr_ty(), "program_id");
                return bin.load_address(id);
            }
            case BuiltinKind::Calldata: {
                llvm::Value* data = param_field(bin, 2, bin.ptr_ty(), "input");
                llvm::Value* len = param_field(bin, 3, bin.i64_ty(), "input_len");
                return bin.vector_new(b.CreateTrunc(len, bin.i32_ty()),
                                      bin.const_i32(1), data);
            }
            case BuiltinKind::Timestamp:
                return clock_field(bin, 4, ty);
            case BuiltinKind::BlockNumber:
            case BuiltinKind::Slot:
                return clock_field(bin, 0, ty);
            default:
                report_unsupported(bin, get_prototype(kind).qualified_name());
                return llvm::UndefValue::get(bin.llvm_var_ty(ty));
        }
    }

    // The host reports the length first; a second call copies the data.
    llvm::Value* return_data(Binary& bin) override {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::AllocaInst* program_id = bin.build_alloca(bin.address_ty(), "program_id");
        llvm::Value* len = bin.call(
            "sol_get_return_data", bin.i64_ty(),
            {llvm::ConstantPointerNull::get(bin.ptr_ty()), bin.const_i64(0),
             program_id});
        llvm::Value* len32 = b.CreateTrunc(len, bin.i32_ty(), "len");
        llvm::Value* v = bin.vector_new(len32, bin.const_i32(1), nullptr);
        bin.call("sol_get_return_data", bin.i64_ty(),
                 {bin.vector_bytes(v), len, program_id});
        return v;
    }

    llvm::Value* value_transferred(Binary& bin) override {
        report_unsupported(bin, "msg.value");
        return llvm::UndefValue::get(bin.int_ty(bin.target.value_length * 8));
    }

    void selfdestruct(Binary& bin, llvm::Value*) override {
        report_unsupported(bin, "selfdestruct");
    }

    void emit_event(Binary& bin, llvm::Value* data, llvm::Value* data_len,
                    const std::vector<llvm::Value*>& topics) override {
        llvm::IRBuilder<>& b = bin.builder;
        std::vector<std::pair<llvm::Value*, llvm::Value*>> fields{};
        for (llvm::Value* t : topics) {
            llvm::Value* buf = bin.build_alloca(
                llvm::ArrayType::get(bin.int_ty(8), 32), "topic");
            bin.store_be(buf, b.CreateZExtOrTrunc(t, bin.int_ty(256)), 32);
            fields.push_back({buf, bin.const_i32(32)});
        }
        fields.push_back({data, data_len});
        bin.call("sol_log_data", llvm::Type::getVoidTy(bin.context),
                 {sol_bytes(bin, fields), bin.const_i64(fields.size())});
    }

    void return_abi_data(Binary& bin, llvm::Value* data,
                         llvm::Value* len) override {
        set_return_data(bin, data, len);
        bin.builder.CreateRet(bin.const_i64(0));
    }

    void return_empty_abi(Binary& bin) override {
        bin.builder.CreateRet(bin.const_i64(0));
    }

    void return_code(Binary& bin, llvm::Value* code) override {
        bin.builder.CreateRet(code);
    }

    void assert_failure(Binary& bin, llvm::Value* data,
                        llvm::Value* len) override {
        set_return_data(bin, data, len);
        bin.builder.CreateRet(bin.const_i64(error_code(1)));
    }

    std::uint64_t return_code_value(ReturnCode code) const override {
        switch (code) {
            case ReturnCode::Success:
                return 0;
            case ReturnCode::FunctionSelectorInvalid:
                return error_code(2);
            case ReturnCode::AbiEncodingInvalid:
                return error_code(3);
            case ReturnCode::InvalidDataError:
                return error_code(4);
            case ReturnCode::AccountDataTooSmall:
                return error_code(5);
            case ReturnCode::InvalidProgramId:
                return error_code(7);
        }
        return error_code(1);
    }

    void emit_entrypoint(Binary& bin, const Contract& contract,
                         llvm::Function* dispatch) override {
        if (!dispatch) {
            bin.error("contract `" + contract.name + "` has no `" +
                      std::string(kDispatchCfgName) + "` function");
            return;
        }
        auto* fty = llvm::FunctionType::get(bin.i64_ty(), {bin.ptr_ty()},
                                            /*isVarArg=*/false);
        llvm::Function* f = llvm::Function::Create(
            fty, llvm::GlobalValue::ExternalLinkage, "entrypoint",
            bin.module.get());
        f->getArg(0)->setName("input");
        bin.function = f;

        llvm::IRBuilder<>& b = bin.builder;
        b.SetInsertPoint(llvm::BasicBlock::Create(bin.context, "entry", f));
        llvm::StructType* params_ty = sol_parameters_ty(bin);
        llvm::AllocaInst* p = bin.build_alloca(params_ty, "params");
        llvm::AllocaInst* ka = bin.build_alloca(
            llvm::ArrayType::get(account_info_ty(bin), kMaxAccounts), "ka");
        b.CreateStore(ka, b.CreateStructGEP(params_ty, p, 0));

        llvm::Value* rc = bin.call("sol_deserialize", bin.i64_ty(),
                                   {f->getArg(0), p, bin.const_i64(kMaxAccounts)});
        llvm::BasicBlock* ok = bin.new_block("deserialized");
        llvm::BasicBlock* fail = bin.new_block("invalid_input");
        b.CreateCondBr(b.CreateICmpEQ(rc, bin.const_i64(0)), ok, fail);

        b.SetInsertPoint(fail);
        b.CreateRet(rc);

        b.SetInsertPoint(ok);
        b.CreateRet(b.CreateCall(dispatch, {p}));
    }

   private:
    SolanaStorage storage_;

    // Array of SolBytes {ptr, u64 len} describing each input.
    static llvm::Value* sol_bytes(
        Binary& bin,
        const std::vector<std::pair<llvm::Value*, llvm::Value*>>& fields) {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::StructType* ty = sol_bytes_ty(bin);
        llvm::AllocaInst* arr = bin.build_alloca(
            llvm::ArrayType::get(ty, fields.size()), "sol_bytes");
        for (size_t i = 0; i < fields.size(); i++) {
            llvm::Value* entry = b.CreateGEP(ty, arr, {bin.const_i32(i)});
            b.CreateStore(fields[i].first, b.CreateStructGEP(ty, entry, 0));
            b.CreateStore(b.CreateZExt(fields[i].second, bin.i64_ty()),
                          b.CreateStructGEP(ty, entry, 1));
        }
        return arr;
    }

    static void set_return_data(Binary& bin, llvm::Value* data,
                                llvm::Value* len) {
        bin.call("sol_set_return_data", llvm::Type::getVoidTy(bin.context),
                 {data, bin.builder.CreateZExt(len, bin.i64_ty())});
    }

    static llvm::Value* clock_field(Binary& bin, unsigned field, TypeId ty) {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::StructType* clock = clock_ty(bin);
        llvm::AllocaInst* out = bin.build_alloca(clock, "clock");
        bin.call("sol_get_clock_sysvar", bin.i64_ty(), {out});
        llvm::Value* v = b.CreateLoad(bin.i64_ty(),
                                      b.CreateStructGEP(clock, out, field));
        return b.CreateZExtOrTrunc(v, bin.llvm_type(ty));
    }

    // Cross-program invocation signed with the optional seeds.
    void invoke(Binary& bin, llvm::Value** success, llvm::Value* program_id,
                llvm::Value* data, llvm::Value* data_len,
                const ContractArgs& ca, std::string_view name) {
        llvm::IRBuilder<>& b = bin.builder;
        llvm::StructType* ins_ty = sol_instruction_ty(bin);
        llvm::AllocaInst* ins = bin.build_alloca(ins_ty, "instruction");
        b.CreateStore(program_id, b.CreateStructGEP(ins_ty, ins, 0));
        b.CreateStore(ca.accounts, b.CreateStructGEP(ins_ty, ins, 1));
        b.CreateStore(b.CreateZExt(ca.accounts_len, bin.i64_ty()),
                      b.CreateStructGEP(ins_ty, ins, 2));
        b.CreateStore(data, b.CreateStructGEP(ins_ty, ins, 3));
        b.CreateStore(b.CreateZExt(data_len, bin.i64_ty()),
                      b.CreateStructGEP(ins_ty, ins, 4));

        llvm::Value* seeds = ca.seeds ? ca.seeds
                                      : llvm::ConstantPointerNull::get(bin.ptr_ty());
        llvm::Value* seeds_len =
            ca.seeds_len ? b.CreateZExt(ca.seeds_len, bin.i64_ty())
                         : bin.const_i64(0);
        llvm::Value* ka = param_field(bin, 0, bin.ptr_ty(), "ka");
        llvm::Value* ka_num = param_field(bin, 1, bin.i64_ty(), "ka_num");

        llvm::Value* rc = bin.call("sol_invoke_signed_c", bin.i64_ty(),
                                   {ins, ka, ka_num, seeds, seeds_len});
        llvm::Value* ok = b.CreateICmpEQ(rc, bin.const_i64(0), "ok");
        if (success) {
            *success = ok;
        } else {
            check_or_fail(bin, *this, ok, name);
        }
    }
};

}  // namespace

std::unique_ptr<TargetRuntime> make_solana_runtime(Binary&) {
    return std::make_unique<SolanaRuntime>();
}

}  // namespace keel
