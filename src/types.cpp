#include "types.hpp"

#include <sstream>

namespace keel {

TypeId TypeStore::make(TypeData d) const {
    TypeId id = static_cast<TypeId>(types_.size());
    types_.push_back(std::move(d));
    return id;
}

TypeId TypeStore::error() const {
    if (cached_error_) return *cached_error_;
    cached_error_ = make(TypeData{.kind = TypeKind::Error});
    return *cached_error_;
}

TypeId TypeStore::void_() const {
    if (cached_void_) return *cached_void_;
    cached_void_ = make(TypeData{.kind = TypeKind::Void});
    return *cached_void_;
}

TypeId TypeStore::bool_() const {
    if (cached_bool_) return *cached_bool_;
    cached_bool_ = make(TypeData{.kind = TypeKind::Bool});
    return *cached_bool_;
}

TypeId TypeStore::address() const {
    if (cached_address_) return *cached_address_;
    cached_address_ = make(TypeData{.kind = TypeKind::Address});
    return *cached_address_;
}

TypeId TypeStore::dynamic_bytes() const {
    if (cached_dynamic_bytes_) return *cached_dynamic_bytes_;
    cached_dynamic_bytes_ = make(TypeData{.kind = TypeKind::DynamicBytes});
    return *cached_dynamic_bytes_;
}

TypeId TypeStore::string() const {
    if (cached_string_) return *cached_string_;
    cached_string_ = make(TypeData{.kind = TypeKind::String});
    return *cached_string_;
}

TypeId TypeStore::cached_int(std::uint16_t bits, bool is_signed) const {
    std::uint32_t key = (static_cast<std::uint32_t>(bits) << 1) | is_signed;
    if (auto it = cached_ints_.find(key); it != cached_ints_.end())
        return it->second;
    TypeId id = make(
        TypeData{.kind = TypeKind::Int, .bits = bits, .is_signed = is_signed});
    cached_ints_.insert({key, id});
    return id;
}

TypeId TypeStore::uint(std::uint16_t bits) const {
    return cached_int(bits, false);
}

TypeId TypeStore::sint(std::uint16_t bits) const {
    return cached_int(bits, true);
}

TypeId TypeStore::bytes(std::uint8_t len) const {
    if (auto it = cached_bytes_.find(len); it != cached_bytes_.end())
        return it->second;
    TypeId id = make(TypeData{.kind = TypeKind::Bytes, .byte_len = len});
    cached_bytes_.insert({len, id});
    return id;
}

TypeId TypeStore::array(TypeId elem, std::optional<std::uint64_t> len) const {
    return make(
        TypeData{.kind = TypeKind::Array, .elem = elem, .array_len = len});
}

TypeId TypeStore::slice(TypeId elem) const {
    return make(TypeData{.kind = TypeKind::Slice, .elem = elem});
}

TypeId TypeStore::mapping(TypeId key, TypeId value) const {
    return make(
        TypeData{.kind = TypeKind::Mapping, .key = key, .value = value});
}

TypeId TypeStore::struct_(StructKind kind, std::uint32_t struct_no) const {
    std::uint64_t key =
        (static_cast<std::uint64_t>(kind) << 32) | struct_no;
    if (auto it = cached_structs_.find(key); it != cached_structs_.end())
        return it->second;
    TypeId id = make(TypeData{.kind = TypeKind::Struct,
                              .struct_kind = kind,
                              .struct_no = struct_no});
    cached_structs_.insert({key, id});
    return id;
}

TypeId TypeStore::ref(TypeId pointee) const {
    return make(TypeData{.kind = TypeKind::Ref, .pointee = pointee});
}

TypeId TypeStore::storage_ref(TypeId pointee) const {
    return make(TypeData{.kind = TypeKind::StorageRef, .pointee = pointee});
}

std::uint32_t TypeStore::declare_struct(std::string name) {
    std::uint32_t no = static_cast<std::uint32_t>(structs_.size());
    structs_.push_back(StructDecl{.name = std::move(name)});
    return no;
}

void TypeStore::set_struct_fields(std::uint32_t struct_no,
                                  std::vector<StructField> fields) {
    structs_.at(struct_no).fields = std::move(fields);
}

std::optional<std::uint32_t> TypeStore::find_struct(
    std::string_view name) const {
    for (std::uint32_t i = 0; i < structs_.size(); i++) {
        if (structs_[i].name == name) return i;
    }
    return std::nullopt;
}

const std::vector<StructField>& TypeStore::struct_fields(TypeId ty) const {
    static const std::vector<StructField> empty{};
    const TypeData& d = get(ty);
    if (d.kind != TypeKind::Struct) return empty;

    switch (d.struct_kind) {
        case StructKind::AccountMeta:
            if (!account_meta_fields_) {
                account_meta_fields_ = std::vector<StructField>{
                    {"pubkey", ref(address())},
                    {"is_writable", bool_()},
                    {"is_signer", bool_()},
                };
            }
            return *account_meta_fields_;
        case StructKind::AccountInfo:
            if (!account_info_fields_) {
                account_info_fields_ = std::vector<StructField>{
                    {"key", ref(address())},
                    {"lamports", ref(uint(64))},
                    {"data_len", uint(64)},
                    {"data", ref(uint(8))},
                    {"owner", ref(address())},
                    {"rent_epoch", uint(64)},
                    {"is_signer", bool_()},
                    {"is_writable", bool_()},
                    {"executable", bool_()},
                };
            }
            return *account_info_fields_;
        case StructKind::User:
            if (d.struct_no < structs_.size())
                return structs_[d.struct_no].fields;
            return empty;
    }
    return empty;
}

bool TypeStore::equal(TypeId a, TypeId b) const {
    if (a == b) return true;
    const TypeData& ta = get(a);
    const TypeData& tb = get(b);
    if (ta.kind != tb.kind) return false;

    switch (ta.kind) {
        case TypeKind::Error:
        case TypeKind::Void:
        case TypeKind::Bool:
        case TypeKind::Address:
        case TypeKind::DynamicBytes:
        case TypeKind::String:
            return true;
        case TypeKind::Int:
            return ta.bits == tb.bits && ta.is_signed == tb.is_signed;
        case TypeKind::Bytes:
            return ta.byte_len == tb.byte_len;
        case TypeKind::Array:
            return ta.array_len == tb.array_len && equal(ta.elem, tb.elem);
        case TypeKind::Slice:
            return equal(ta.elem, tb.elem);
        case TypeKind::Mapping:
            return equal(ta.key, tb.key) && equal(ta.value, tb.value);
        case TypeKind::Struct:
            return ta.struct_kind == tb.struct_kind &&
                   ta.struct_no == tb.struct_no;
        case TypeKind::Ref:
        case TypeKind::StorageRef:
            return equal(ta.pointee, tb.pointee);
    }
    return false;
}

TypeId TypeStore::deref(TypeId t) const {
    const TypeData& d = get(t);
    if (d.kind == TypeKind::Ref || d.kind == TypeKind::StorageRef)
        return d.pointee;
    return t;
}

bool TypeStore::is_storage(TypeId t) const {
    return get(t).kind == TypeKind::StorageRef;
}

bool TypeStore::is_dynamic_array(TypeId t) const {
    const TypeData& d = get(t);
    return d.kind == TypeKind::Array && !d.array_len;
}

bool TypeStore::is_dynamic(TypeId t) const {
    const TypeData& d = get(t);
    switch (d.kind) {
        case TypeKind::DynamicBytes:
        case TypeKind::String:
        case TypeKind::Slice:
        case TypeKind::Mapping:
            return true;
        case TypeKind::Array:
            return !d.array_len || is_dynamic(d.elem);
        case TypeKind::Struct:
            for (const StructField& f : struct_fields(t)) {
                if (is_dynamic(f.type)) return true;
            }
            return false;
        default:
            return false;
    }
}

bool TypeStore::is_reference_type(TypeId t) const {
    switch (get(t).kind) {
        case TypeKind::DynamicBytes:
        case TypeKind::String:
        case TypeKind::Array:
        case TypeKind::Struct:
            return true;
        default:
            return false;
    }
}

std::string TypeStore::to_string(TypeId t) const {
    const TypeData& d = get(t);
    switch (d.kind) {
        case TypeKind::Error:
            return "<error>";
        case TypeKind::Void:
            return "void";
        case TypeKind::Bool:
            return "bool";
        case TypeKind::Int:
            return (d.is_signed ? "int" : "uint") + std::to_string(d.bits);
        case TypeKind::Address:
            return "address";
        case TypeKind::Bytes:
            return "bytes" + std::to_string(d.byte_len);
        case TypeKind::DynamicBytes:
            return "bytes";
        case TypeKind::String:
            return "string";
        case TypeKind::Array: {
            std::ostringstream out;
            out << to_string(d.elem) << "[";
            if (d.array_len) out << *d.array_len;
            out << "]";
            return out.str();
        }
        case TypeKind::Slice:
            return "slice(" + to_string(d.elem) + ")";
        case TypeKind::Mapping:
            return "mapping(" + to_string(d.key) + "," + to_string(d.value) +
                   ")";
        case TypeKind::Struct:
            switch (d.struct_kind) {
                case StructKind::AccountMeta:
                    return "AccountMeta";
                case StructKind::AccountInfo:
                    return "AccountInfo";
                case StructKind::User:
                    if (d.struct_no < structs_.size())
                        return structs_[d.struct_no].name;
                    return "<struct>";
            }
            return "<struct>";
        case TypeKind::Ref:
            return "ref(" + to_string(d.pointee) + ")";
        case TypeKind::StorageRef:
            return "storage(" + to_string(d.pointee) + ")";
    }
    return "<type>";
}

}  // namespace keel
