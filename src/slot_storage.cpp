#include "slot_storage.hpp"

#include <llvm/IR/Constants.h>

#include "binary.hpp"
#include "sema.hpp"

namespace keel {
namespace {

static bool is_word(const TypeData& d) {
    switch (d.kind) {
        case TypeKind::Bool:
        case TypeKind::Int:
        case TypeKind::Address:
        case TypeKind::Bytes:
        case TypeKind::StorageRef:
            return true;
        default:
            return false;
    }
}

}  // namespace

llvm::Value* SlotStorage::advance(Binary& bin, llvm::Value* slot,
                                  std::uint64_t n) {
    return bin.builder.CreateAdd(slot, llvm::ConstantInt::get(bin.slot_ty(), n),
                                 "slot");
}

llvm::Value* SlotStorage::element_slot(Binary& bin, llvm::Value* base,
                                       TypeId elem, llvm::Value* index) {
    llvm::Value* idx = bin.builder.CreateZExtOrTrunc(index, bin.slot_ty());
    llvm::Value* stride =
        llvm::ConstantInt::get(bin.slot_ty(), bin.layout.slot_count(elem));
    return bin.builder.CreateAdd(base, bin.builder.CreateMul(idx, stride),
                                 "elem_slot");
}

llvm::Value* SlotStorage::read_length(Binary& bin, llvm::Value* slot) {
    llvm::AllocaInst* len = bin.build_alloca(bin.i32_ty(), "len");
    slots_.get_storage(bin, bin.spill(slot, "slot"), len, bin.const_i32(4));
    return bin.builder.CreateLoad(bin.i32_ty(), len, "len");
}

void SlotStorage::write_length(Binary& bin, llvm::Value* slot,
                               llvm::Value* len) {
    slots_.set_storage(bin, bin.spill(slot, "slot"), bin.spill(len, "len"),
                       bin.const_i32(4));
}

llvm::Value* SlotStorage::array_base(Binary& bin, llvm::Value* slot) {
    llvm::Value* slot_ptr = bin.spill(slot, "slot");
    std::uint64_t bytes = bin.store_size(bin.slot_ty());
    return slots_.hash_to_slot(bin, slot_ptr, bin.const_i32(bytes));
}

llvm::Value* SlotStorage::load(Binary& bin, TypeId ty, llvm::Value*& slot) {
    const TypeStore& ts = bin.ns.types;
    const TypeData& d = ts.get(ty);
    llvm::IRBuilder<>& b = bin.builder;

    if (is_word(d)) {
        llvm::Type* ll = bin.llvm_type(ty);
        llvm::AllocaInst* dest = bin.build_alloca(ll, "value");
        slots_.get_storage(bin, bin.spill(slot, "slot"), dest,
                           bin.const_i32(bin.store_size(ll)));
        slot = advance(bin, slot, 1);
        return b.CreateLoad(ll, dest, "value");
    }

    switch (d.kind) {
        case TypeKind::DynamicBytes:
        case TypeKind::String: {
            llvm::Value* v = slots_.get_storage_bytes(bin, bin.spill(slot, "slot"));
            slot = advance(bin, slot, 1);
            return v;
        }
        case TypeKind::Struct: {
            llvm::Type* ll = bin.llvm_type(ty);
            llvm::AllocaInst* dest = bin.build_alloca(ll, "struct");
            const auto& fields = ts.struct_fields(ty);
            for (std::uint32_t i = 0; i < fields.size(); i++) {
                llvm::Value* v = load(bin, fields[i].type, slot);
                bin.store_value(fields[i].type, b.CreateStructGEP(ll, dest, i),
                                v);
            }
            return dest;
        }
        case TypeKind::Array: {
            llvm::Type* elem_ll = bin.llvm_type(d.elem);
            llvm::Value* data = nullptr;
            llvm::Value* len = nullptr;
            llvm::Value* result = nullptr;
            llvm::AllocaInst* cursor = bin.build_alloca(bin.slot_ty(), "cursor");
            if (d.array_len) {
                result = bin.build_alloca(bin.llvm_type(ty), "array");
                data = result;
                len = bin.const_i32(*d.array_len);
                b.CreateStore(slot, cursor);
            } else {
                len = read_length(bin, slot);
                result = bin.vector_new(
                    len, bin.const_i32(bin.store_size(elem_ll)), nullptr);
                data = bin.vector_bytes(result);
                b.CreateStore(array_base(bin, slot), cursor);
            }
            bin.emit_loop(len, "load", [&](llvm::Value* i) {
                llvm::Value* s = b.CreateLoad(bin.slot_ty(), cursor);
                llvm::Value* v = load(bin, d.elem, s);
                bin.store_value(d.elem, b.CreateGEP(elem_ll, data, {i}), v);
                b.CreateStore(s, cursor);
            });
            if (d.array_len)
                slot = b.CreateLoad(bin.slot_ty(), cursor, "slot");
            else
                slot = advance(bin, slot, 1);
            return result;
        }
        default:
            bin.error("cannot load a value of type `" + ts.to_string(ty) +
                      "` from storage");
            return llvm::UndefValue::get(bin.llvm_var_ty(ty));
    }
}

void SlotStorage::store(Binary& bin, TypeId ty, bool existing,
                        llvm::Value*& slot, llvm::Value* value) {
    const TypeStore& ts = bin.ns.types;
    const TypeData& d = ts.get(ty);
    llvm::IRBuilder<>& b = bin.builder;

    if (is_word(d)) {
        llvm::Type* ll = bin.llvm_type(ty);
        slots_.set_storage(bin, bin.spill(slot, "slot"), bin.spill(value, "value"),
                           bin.const_i32(bin.store_size(ll)));
        slot = advance(bin, slot, 1);
        return;
    }

    switch (d.kind) {
        case TypeKind::DynamicBytes:
        case TypeKind::String:
            slots_.set_storage_bytes(bin, bin.spill(slot, "slot"), value);
            slot = advance(bin, slot, 1);
            return;
        case TypeKind::Struct: {
            llvm::Type* ll = bin.llvm_type(ty);
            const auto& fields = ts.struct_fields(ty);
            for (std::uint32_t i = 0; i < fields.size(); i++) {
                llvm::Value* v = bin.load_value(
                    fields[i].type, b.CreateStructGEP(ll, value, i));
                store(bin, fields[i].type, existing, slot, v);
            }
            return;
        }
        case TypeKind::Array: {
            llvm::Type* elem_ll = bin.llvm_type(d.elem);
            llvm::AllocaInst* cursor = bin.build_alloca(bin.slot_ty(), "cursor");
            llvm::Value* data = nullptr;
            llvm::Value* len = nullptr;
            llvm::Value* base = nullptr;
            llvm::Value* old_len = nullptr;
            if (d.array_len) {
                data = value;
                len = bin.const_i32(*d.array_len);
                b.CreateStore(slot, cursor);
            } else {
                data = bin.vector_bytes(value);
                len = bin.vector_len(value);
                if (existing) old_len = read_length(bin, slot);
                write_length(bin, slot, len);
                base = array_base(bin, slot);
                b.CreateStore(base, cursor);
            }
            bin.emit_loop(len, "store", [&](llvm::Value* i) {
                llvm::Value* s = b.CreateLoad(bin.slot_ty(), cursor);
                llvm::Value* v =
                    bin.load_value(d.elem, b.CreateGEP(elem_ll, data, {i}));
                store(bin, d.elem, existing, s, v);
                b.CreateStore(s, cursor);
            });
            if (d.array_len) {
                slot = b.CreateLoad(bin.slot_ty(), cursor, "slot");
                return;
            }
            if (old_len) {
                // Release the tail the shorter array no longer covers.
                llvm::Value* shrunk = b.CreateICmpUGT(old_len, len);
                llvm::Value* excess = b.CreateSelect(
                    shrunk, b.CreateSub(old_len, len), bin.const_i32(0));
                bin.emit_loop(excess, "release", [&](llvm::Value*) {
                    llvm::Value* s = b.CreateLoad(bin.slot_ty(), cursor);
                    clear(bin, d.elem, s);
                    b.CreateStore(s, cursor);
                });
            }
            slot = advance(bin, slot, 1);
            return;
        }
        default:
            bin.error("cannot store a value of type `" + ts.to_string(ty) +
                      "` in storage");
            return;
    }
}

void SlotStorage::clear(Binary& bin, TypeId ty, llvm::Value*& slot) {
    const TypeStore& ts = bin.ns.types;
    const TypeData& d = ts.get(ty);
    llvm::IRBuilder<>& b = bin.builder;

    switch (d.kind) {
        case TypeKind::Struct:
            for (const StructField& f : ts.struct_fields(ty))
                clear(bin, f.type, slot);
            return;
        case TypeKind::Array: {
            llvm::AllocaInst* cursor = bin.build_alloca(bin.slot_ty(), "cursor");
            llvm::Value* len = nullptr;
            if (d.array_len) {
                len = bin.const_i32(*d.array_len);
                b.CreateStore(slot, cursor);
            } else {
                len = read_length(bin, slot);
                b.CreateStore(array_base(bin, slot), cursor);
            }
            bin.emit_loop(len, "clear", [&](llvm::Value*) {
                llvm::Value* s = b.CreateLoad(bin.slot_ty(), cursor);
                clear(bin, d.elem, s);
                b.CreateStore(s, cursor);
            });
            if (d.array_len) {
                slot = b.CreateLoad(bin.slot_ty(), cursor, "slot");
                return;
            }
            slots_.delete_single_slot(bin, bin.spill(slot, "slot"));
            slot = advance(bin, slot, 1);
            return;
        }
        case TypeKind::Mapping:
            // Entries cannot be enumerated; they stay behind.
            slot = advance(bin, slot, 1);
            return;
        default:
            slots_.delete_single_slot(bin, bin.spill(slot, "slot"));
            slot = advance(bin, slot, 1);
            return;
    }
}

llvm::Value* SlotStorage::subscript(Binary& bin, TypeId array_ty,
                                    llvm::Value* slot, llvm::Value* index) {
    const TypeStore& ts = bin.ns.types;
    const TypeData& d = ts.get(array_ty);
    llvm::IRBuilder<>& b = bin.builder;

    if (d.kind == TypeKind::Mapping) {
        llvm::Value* key = nullptr;
        llvm::Value* key_len = nullptr;
        const TypeData& kd = ts.get(d.key);
        if (kd.kind == TypeKind::String || kd.kind == TypeKind::DynamicBytes) {
            key = bin.vector_bytes(index);
            key_len = bin.vector_len(index);
        } else {
            key = bin.spill(index, "key");
            key_len = bin.const_i32(bin.store_size(index->getType()));
        }
        std::uint64_t slot_bytes = bin.store_size(bin.slot_ty());
        llvm::Value* total = b.CreateAdd(key_len, bin.const_i32(slot_bytes));
        llvm::Value* buf = bin.build_array_alloca(total, "mapping_key");
        b.CreateMemCpy(buf, llvm::MaybeAlign(1), key, llvm::MaybeAlign(1),
                       key_len);
        b.CreateStore(slot, b.CreateGEP(bin.int_ty(8), buf, {key_len}));
        return slots_.hash_to_slot(bin, buf, total);
    }

    if (d.kind != TypeKind::Array) {
        report_unsupported(bin, "storage subscript of `" +
                                    ts.to_string(array_ty) + "`");
        return llvm::UndefValue::get(bin.slot_ty());
    }

    llvm::Value* idx = b.CreateZExtOrTrunc(index, bin.slot_ty());
    if (d.array_len) {
        llvm::Value* in_bounds = b.CreateICmpULT(
            idx, llvm::ConstantInt::get(bin.slot_ty(), *d.array_len));
        check_or_fail(bin, runtime_, in_bounds, "bounds");
        return element_slot(bin, slot, d.elem, idx);
    }

    llvm::Value* len = b.CreateZExt(read_length(bin, slot), bin.slot_ty());
    check_or_fail(bin, runtime_, b.CreateICmpULT(idx, len), "bounds");
    return element_slot(bin, array_base(bin, slot), d.elem, idx);
}

llvm::Value* SlotStorage::member(Binary& bin, TypeId struct_ty,
                                 llvm::Value* slot, std::uint32_t field) {
    return advance(bin, slot, bin.layout.field_slot(struct_ty, field));
}

llvm::Value* SlotStorage::push(Binary& bin, TypeId array_ty, llvm::Value* slot,
                               llvm::Value* value) {
    const TypeStore& ts = bin.ns.types;
    const TypeData& d = ts.get(array_ty);
    llvm::IRBuilder<>& b = bin.builder;

    if (!ts.is_dynamic_array(array_ty)) {
        report_unsupported(bin, "push on `" + ts.to_string(array_ty) + "`");
        return llvm::UndefValue::get(bin.slot_ty());
    }

    llvm::Value* len = read_length(bin, slot);
    llvm::Value* elem_slot =
        element_slot(bin, array_base(bin, slot), d.elem, len);

    // The element is written before the length grows.
    if (value) {
        llvm::Value* s = elem_slot;
        store(bin, d.elem, false, s, value);
    }
    write_length(bin, slot, b.CreateAdd(len, bin.const_i32(1), "new_len"));
    return value ? value : elem_slot;
}

llvm::Value* SlotStorage::pop(Binary& bin, TypeId array_ty, llvm::Value* slot,
                              bool load_value) {
    const TypeStore& ts = bin.ns.types;
    const TypeData& d = ts.get(array_ty);
    llvm::IRBuilder<>& b = bin.builder;

    if (!ts.is_dynamic_array(array_ty)) {
        report_unsupported(bin, "pop on `" + ts.to_string(array_ty) + "`");
        return nullptr;
    }

    llvm::Value* len = read_length(bin, slot);
    check_or_fail(bin, runtime_, b.CreateICmpNE(len, bin.const_i32(0)),
                  "pop_empty");

    llvm::Value* new_len = b.CreateSub(len, bin.const_i32(1), "new_len");
    llvm::Value* elem_slot =
        element_slot(bin, array_base(bin, slot), d.elem, new_len);

    llvm::Value* out = nullptr;
    if (load_value) {
        llvm::Value* s = elem_slot;
        out = load(bin, d.elem, s);
    }
    // The element is cleared before the length shrinks.
    llvm::Value* s = elem_slot;
    clear(bin, d.elem, s);
    write_length(bin, slot, new_len);
    return out;
}

llvm::Value* SlotStorage::array_length(Binary& bin, TypeId array_ty,
                                       llvm::Value* slot) {
    const TypeData& d = bin.ns.types.get(array_ty);
    if (d.kind == TypeKind::Array && d.array_len)
        return bin.const_i32(*d.array_len);
    return read_length(bin, slot);
}

}  // namespace keel
