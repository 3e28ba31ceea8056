#pragma once

#include "runtime.hpp"

namespace keel {

// Per-target primitives of a slot-keyed store. Every `slot_ptr` points to a
// slot number of `Binary::slot_ty()`.
class StorageSlot {
   public:
    virtual ~StorageSlot() = default;

    // Writes `len` bytes from `value` under the slot.
    virtual void set_storage(Binary& bin, llvm::Value* slot_ptr,
                             llvm::Value* value, llvm::Value* len) = 0;
    // Reads `len` bytes into `dest`. A slot never written reads as zeros.
    virtual void get_storage(Binary& bin, llvm::Value* slot_ptr,
                             llvm::Value* dest, llvm::Value* len) = 0;

    virtual void set_storage_bytes(Binary& bin, llvm::Value* slot_ptr,
                                   llvm::Value* vector) = 0;
    // Returns a vector, empty if the slot was never written.
    virtual llvm::Value* get_storage_bytes(Binary& bin,
                                           llvm::Value* slot_ptr) = 0;

    virtual void delete_single_slot(Binary& bin, llvm::Value* slot_ptr) = 0;

    // Slot number derived from hashing `len` bytes at `data`.
    virtual llvm::Value* hash_to_slot(Binary& bin, llvm::Value* data,
                                      llvm::Value* len) = 0;
};

// Recursive placement of composite values over single slots:
//  - struct fields take consecutive slots, each field as many as its type,
//  - fixed arrays repeat their element's slots,
//  - dynamic arrays keep the length in their slot and the elements from
//    hash(slot) onwards,
//  - mapping entries live at hash(key ++ slot).
class SlotStorage final : public Storage {
   public:
    SlotStorage(TargetRuntime& runtime, StorageSlot& slots)
        : runtime_(runtime), slots_(slots) {}

    llvm::Value* load(Binary& bin, TypeId ty, llvm::Value*& slot) override;
    void store(Binary& bin, TypeId ty, bool existing, llvm::Value*& slot,
               llvm::Value* value) override;
    void clear(Binary& bin, TypeId ty, llvm::Value*& slot) override;

    llvm::Value* subscript(Binary& bin, TypeId array_ty, llvm::Value* slot,
                           llvm::Value* index) override;
    llvm::Value* member(Binary& bin, TypeId struct_ty, llvm::Value* slot,
                        std::uint32_t field) override;

    llvm::Value* push(Binary& bin, TypeId array_ty, llvm::Value* slot,
                      llvm::Value* value) override;
    llvm::Value* pop(Binary& bin, TypeId array_ty, llvm::Value* slot,
                     bool load) override;
    llvm::Value* array_length(Binary& bin, TypeId array_ty,
                              llvm::Value* slot) override;

   private:
    TargetRuntime& runtime_;
    StorageSlot& slots_;

    llvm::Value* read_length(Binary& bin, llvm::Value* slot);
    void write_length(Binary& bin, llvm::Value* slot, llvm::Value* len);
    llvm::Value* array_base(Binary& bin, llvm::Value* slot);
    llvm::Value* advance(Binary& bin, llvm::Value* slot, std::uint64_t n);
    llvm::Value* element_slot(Binary& bin, llvm::Value* base, TypeId elem,
                              llvm::Value* index);
};

}  // namespace keel
