#include "layout.hpp"

#include <algorithm>

namespace keel {

StorageLayout::StorageLayout(const TypeStore& types,
                             std::uint32_t address_length)
    : types_(types), address_length_(address_length) {}

std::uint64_t StorageLayout::align_up(std::uint64_t x, std::uint64_t a) {
    if (a == 0) return x;
    std::uint64_t r = x % a;
    if (r == 0) return x;
    return x + (a - r);
}

std::uint64_t StorageLayout::slot_count(TypeId ty) const {
    const TypeData& d = types_.get(ty);
    switch (d.kind) {
        case TypeKind::Struct: {
            std::uint64_t n = 0;
            for (const StructField& f : types_.struct_fields(ty))
                n += slot_count(f.type);
            return n;
        }
        case TypeKind::Array:
            if (d.array_len) return slot_count(d.elem) * *d.array_len;
            return 1;
        default:
            return 1;
    }
}

std::uint64_t StorageLayout::field_slot(TypeId struct_ty,
                                        std::uint32_t field) const {
    const auto& fields = types_.struct_fields(struct_ty);
    std::uint64_t n = 0;
    for (std::uint32_t i = 0; i < field && i < fields.size(); i++)
        n += slot_count(fields[i].type);
    return n;
}

Layout StorageLayout::layout_of(TypeId ty) const {
    if (auto it = cache_.find(ty); it != cache_.end()) return it->second;
    Layout out = compute_layout(ty);
    cache_.insert({ty, out});
    return out;
}

Layout StorageLayout::compute_layout(TypeId ty) const {
    const TypeData& d = types_.get(ty);
    switch (d.kind) {
        case TypeKind::Bool:
            return Layout{.size = 1, .align = 1};
        case TypeKind::Int: {
            std::uint64_t bytes = d.bits / 8;
            return Layout{.size = bytes,
                          .align = std::min<std::uint64_t>(bytes, 8)};
        }
        case TypeKind::Address:
            return Layout{.size = address_length_, .align = 1};
        case TypeKind::Bytes:
            return Layout{.size = d.byte_len, .align = 1};
        case TypeKind::DynamicBytes:
        case TypeKind::String:
            return Layout{.size = 4, .align = 4};
        case TypeKind::Array: {
            if (!d.array_len) return Layout{.size = 4, .align = 4};
            Layout elem = layout_of(d.elem);
            std::uint64_t stride = align_up(elem.size, elem.align);
            return Layout{.size = stride * *d.array_len, .align = elem.align};
        }
        case TypeKind::Struct: {
            std::uint64_t offset = 0;
            std::uint64_t align = 1;
            for (const StructField& f : types_.struct_fields(ty)) {
                Layout fl = layout_of(f.type);
                offset = align_up(offset, fl.align);
                offset += fl.size;
                align = std::max(align, fl.align);
            }
            return Layout{.size = align_up(offset, align), .align = align};
        }
        case TypeKind::StorageRef:
        case TypeKind::Ref:
            return Layout{.size = 4, .align = 4};
        case TypeKind::Error:
        case TypeKind::Void:
        case TypeKind::Slice:
        case TypeKind::Mapping:
            return Layout{.size = 0, .align = 1};
    }
    return Layout{};
}

std::uint64_t StorageLayout::field_offset(TypeId struct_ty,
                                          std::uint32_t field) const {
    const auto& fields = types_.struct_fields(struct_ty);
    std::uint64_t offset = 0;
    for (std::uint32_t i = 0; i < fields.size(); i++) {
        Layout fl = layout_of(fields[i].type);
        offset = align_up(offset, fl.align);
        if (i == field) return offset;
        offset += fl.size;
    }
    return offset;
}

}  // namespace keel
