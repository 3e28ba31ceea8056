#pragma once

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "layout.hpp"
#include "target.hpp"
#include "types.hpp"

namespace keel {

struct Namespace;
struct Session;

// One LLVM module under construction plus the helpers every target shares.
class Binary {
   public:
    Binary(Session& session, const Namespace& ns, TargetSpec target,
           std::string_view name);
    Binary(const Binary&) = delete;
    Binary& operator=(const Binary&) = delete;

    Session& session;
    const Namespace& ns;
    const TargetSpec target;
    const StorageLayout layout;

    llvm::LLVMContext context{};
    std::unique_ptr<llvm::Module> module{};
    llvm::IRBuilder<> builder;

    // Function currently being emitted.
    llvm::Function* function = nullptr;

    void error(std::string message);

    llvm::PointerType* ptr_ty();
    llvm::IntegerType* int_ty(unsigned bits);
    llvm::IntegerType* i32_ty() { return int_ty(32); }
    llvm::IntegerType* i64_ty() { return int_ty(64); }
    llvm::IntegerType* size_ty();
    llvm::IntegerType* slot_ty();
    llvm::IntegerType* return_code_ty();
    llvm::ArrayType* address_ty();
    // {i32 len, i32 size, [0 x i8] data}
    llvm::StructType* vector_ty();
    llvm::StructType* slice_ty();

    // Representation of a value in memory.
    llvm::Type* llvm_type(TypeId ty);
    // Representation of a value held in a variable. Structs and fixed arrays
    // are held as a pointer to their memory.
    llvm::Type* llvm_var_ty(TypeId ty);
    std::uint64_t store_size(llvm::Type* ty) const;

    llvm::ConstantInt* const_i32(std::uint64_t v);
    llvm::ConstantInt* const_i64(std::uint64_t v);

    llvm::FunctionCallee import(std::string_view name, llvm::Type* ret,
                                std::vector<llvm::Type*> params,
                                std::string_view wasm_module = {});
    llvm::CallInst* call(std::string_view name, llvm::Type* ret,
                         std::vector<llvm::Value*> args,
                         std::string_view wasm_module = {});

    // Zero-initialized internal global, created on first use.
    llvm::GlobalVariable* global(std::string_view name, llvm::Type* ty);
    llvm::Constant* emit_global_string(std::string_view name,
                                       const std::vector<std::uint8_t>& data);

    // Allocas are placed in the entry block of `function`.
    llvm::AllocaInst* build_alloca(llvm::Type* ty, std::string_view name);
    llvm::AllocaInst* build_array_alloca(llvm::Value* len,
                                         std::string_view name);
    llvm::BasicBlock* new_block(std::string_view name);

    llvm::Value* malloc(llvm::Value* size);
    llvm::Value* vector_new(llvm::Value* len, llvm::Value* elem_size,
                            llvm::Value* init);
    // Both accept a null vector pointer as empty.
    llvm::Value* vector_len(llvm::Value* vector);
    llvm::Value* vector_bytes(llvm::Value* vector);

    // Reads a big-endian integer of `bytes` length from `src`.
    llvm::Value* load_be(llvm::Value* src, std::uint32_t bytes);
    // Writes `value` to `dest` in big-endian byte order.
    void store_be(llvm::Value* dest, llvm::Value* value, std::uint32_t bytes);

    // Reads a value of `ty` from memory into its variable representation.
    llvm::Value* load_value(TypeId ty, llvm::Value* src);
    // Writes a value held in its variable representation to memory.
    void store_value(TypeId ty, llvm::Value* dest, llvm::Value* value);

    // Address value ([N x i8]) from a pointer to its bytes.
    llvm::Value* load_address(llvm::Value* ptr);
    // Spills a value to a fresh stack slot and returns its address.
    llvm::Value* spill(llvm::Value* value, std::string_view name);

    // Runs `body` for i in [0, n) with an i32 counter.
    template <typename Body>
    void emit_loop(llvm::Value* n, std::string_view name, Body&& body) {
        llvm::AllocaInst* counter = build_alloca(i32_ty(), name);
        builder.CreateStore(const_i32(0), counter);
        llvm::BasicBlock* cond_bb = new_block(std::string(name) + ".cond");
        llvm::BasicBlock* body_bb = new_block(std::string(name) + ".body");
        llvm::BasicBlock* done_bb = new_block(std::string(name) + ".done");
        builder.CreateBr(cond_bb);

        builder.SetInsertPoint(cond_bb);
        llvm::Value* i = builder.CreateLoad(i32_ty(), counter, "i");
        builder.CreateCondBr(builder.CreateICmpULT(i, n), body_bb, done_bb);

        builder.SetInsertPoint(body_bb);
        body(i);
        builder.CreateStore(builder.CreateAdd(i, const_i32(1)), counter);
        builder.CreateBr(cond_bb);

        builder.SetInsertPoint(done_bb);
    }

    bool verify();
    bool write_ll(const std::filesystem::path& out_ll);
    bool write_bc(const std::filesystem::path& out_bc);
    bool write_obj(const std::filesystem::path& out_obj);

   private:
    std::unordered_map<TypeId, llvm::Type*> types_{};
    llvm::StructType* vector_ty_ = nullptr;
    llvm::StructType* slice_ty_ = nullptr;
};

}  // namespace keel
