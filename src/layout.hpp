#pragma once

#include <cstdint>
#include <unordered_map>

#include "types.hpp"

namespace keel {

struct Layout {
    std::uint64_t size = 0;
    std::uint64_t align = 1;
};

// Storage placement of contract state. Slot-based targets count whole slots;
// the account-data target lays values out byte by byte.
class StorageLayout {
   public:
    StorageLayout(const TypeStore& types, std::uint32_t address_length);

    // Number of consecutive slots a value of `ty` occupies. Dynamic arrays,
    // strings and mappings take one slot holding their length or nothing.
    std::uint64_t slot_count(TypeId ty) const;

    // Inline size and alignment in account data. Variable-length values are
    // a uint32 offset into the account heap.
    Layout layout_of(TypeId ty) const;
    std::uint64_t storage_bytes(TypeId ty) const { return layout_of(ty).size; }
    std::uint64_t storage_align(TypeId ty) const {
        return layout_of(ty).align;
    }

    std::uint64_t field_offset(TypeId struct_ty, std::uint32_t field) const;
    std::uint64_t field_slot(TypeId struct_ty, std::uint32_t field) const;

    static std::uint64_t align_up(std::uint64_t x, std::uint64_t a);

   private:
    const TypeStore& types_;
    std::uint32_t address_length_ = 32;

    mutable std::unordered_map<TypeId, Layout> cache_{};

    Layout compute_layout(TypeId ty) const;
};

}  // namespace keel
