#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace keel {

using TypeId = std::uint32_t;

enum class TypeKind : std::uint8_t {
    Error,
    Void,
    Bool,
    Int,
    Address,
    Bytes,  // fixed-length bytesN, value type
    DynamicBytes,
    String,
    Array,
    Slice,
    Mapping,
    Struct,
    Ref,
    StorageRef,
};

enum class StructKind : std::uint8_t {
    AccountMeta,
    AccountInfo,
    User,
};

struct TypeData {
    TypeKind kind = TypeKind::Error;

    // Int
    std::uint16_t bits = 0;
    bool is_signed = false;

    // Bytes
    std::uint8_t byte_len = 0;

    // Array/Slice (`array_len` is empty for dynamic arrays)
    TypeId elem = 0;
    std::optional<std::uint64_t> array_len{};

    // Mapping
    TypeId key = 0;
    TypeId value = 0;

    // Struct
    StructKind struct_kind = StructKind::User;
    std::uint32_t struct_no = 0;

    // Ref/StorageRef
    TypeId pointee = 0;
};

struct StructField {
    std::string name{};
    TypeId type = 0;
};

struct StructDecl {
    std::string name{};
    std::vector<StructField> fields{};
};

class TypeStore {
   public:
    TypeStore() = default;

    TypeId error() const;
    TypeId void_() const;
    TypeId bool_() const;
    TypeId address() const;
    TypeId dynamic_bytes() const;
    TypeId string() const;

    TypeId uint(std::uint16_t bits) const;
    TypeId sint(std::uint16_t bits) const;
    TypeId bytes(std::uint8_t len) const;
    TypeId array(TypeId elem, std::optional<std::uint64_t> len) const;
    TypeId slice(TypeId elem) const;
    TypeId mapping(TypeId key, TypeId value) const;
    TypeId struct_(StructKind kind, std::uint32_t struct_no = 0) const;
    TypeId ref(TypeId pointee) const;
    TypeId storage_ref(TypeId pointee) const;

    const TypeData& get(TypeId id) const {
        return types_.at(static_cast<size_t>(id));
    }

    // User structs are numbered in declaration order.
    std::uint32_t declare_struct(std::string name);
    void set_struct_fields(std::uint32_t struct_no,
                           std::vector<StructField> fields);
    std::optional<std::uint32_t> find_struct(std::string_view name) const;
    const std::vector<StructField>& struct_fields(TypeId ty) const;
    std::size_t struct_count() const { return structs_.size(); }
    const StructDecl& struct_decl(std::uint32_t struct_no) const {
        return structs_.at(struct_no);
    }

    bool equal(TypeId a, TypeId b) const;
    std::string to_string(TypeId t) const;

    // Strips one level of Ref/StorageRef; other types are returned as is.
    TypeId deref(TypeId t) const;
    bool is_storage(TypeId t) const;
    bool is_dynamic_array(TypeId t) const;
    // True if a value of this type owns variable-length data.
    bool is_dynamic(TypeId t) const;
    // True if values of this type are passed around as a pointer to memory.
    bool is_reference_type(TypeId t) const;

   private:
    // Types are appended while references into the store are live.
    mutable std::deque<TypeData> types_{};

    mutable std::optional<TypeId> cached_error_{};
    mutable std::optional<TypeId> cached_void_{};
    mutable std::optional<TypeId> cached_bool_{};
    mutable std::optional<TypeId> cached_address_{};
    mutable std::optional<TypeId> cached_dynamic_bytes_{};
    mutable std::optional<TypeId> cached_string_{};

    mutable std::unordered_map<std::uint32_t, TypeId> cached_ints_{};
    mutable std::unordered_map<std::uint8_t, TypeId> cached_bytes_{};
    mutable std::unordered_map<std::uint64_t, TypeId> cached_structs_{};

    std::vector<StructDecl> structs_{};
    mutable std::optional<std::vector<StructField>> account_meta_fields_{};
    mutable std::optional<std::vector<StructField>> account_info_fields_{};

    TypeId make(TypeData d) const;
    TypeId cached_int(std::uint16_t bits, bool is_signed) const;
};

}  // namespace keel
