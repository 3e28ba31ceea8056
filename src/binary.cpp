#include "binary.hpp"

#include <llvm/Bitcode/BitcodeWriter.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/LegacyPassManager.h>
#include <llvm/IR/Verifier.h>
#include <llvm/MC/TargetRegistry.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>
#include <llvm/Target/TargetMachine.h>
#include <llvm/ADT/Triple.h>

#include <optional>
#include <utility>

#include "sema.hpp"
#include "session.hpp"

namespace keel {

Binary::Binary(Session& session, const Namespace& ns, TargetSpec target,
               std::string_view name)
    : session(session),
      ns(ns),
      target(std::move(target)),
      layout(ns.types, this->target.address_length),
      module(std::make_unique<llvm::Module>(
          llvm::StringRef(name.data(), name.size()), context)),
      builder(context) {
    // LLVM 14 defaults to typed pointers; the IR here is built for opaque ones.
    context.enableOpaquePointers();
    module->setTargetTriple(this->target.triple);
    if (!this->target.data_layout.empty())
        module->setDataLayout(this->target.data_layout);
}

void Binary::error(std::string message) {
    session.error(kCodegenSpan, std::move(message));
}

llvm::PointerType* Binary::ptr_ty() { return llvm::PointerType::get(context, 0); }

llvm::IntegerType* Binary::int_ty(unsigned bits) {
    return llvm::IntegerType::get(context, bits);
}

llvm::IntegerType* Binary::size_ty() { return int_ty(target.pointer_bits); }

llvm::IntegerType* Binary::slot_ty() { return int_ty(target.slot_bits); }

llvm::IntegerType* Binary::return_code_ty() {
    return target.kind == TargetKind::Solana ? i64_ty() : i32_ty();
}

llvm::ArrayType* Binary::address_ty() {
    return llvm::ArrayType::get(int_ty(8), target.address_length);
}

llvm::StructType* Binary::vector_ty() {
    if (vector_ty_) return vector_ty_;
    vector_ty_ = llvm::StructType::create(context, "struct.vector");
    vector_ty_->setBody({i32_ty(), i32_ty(), llvm::ArrayType::get(int_ty(8), 0)},
                        /*isPacked=*/false);
    return vector_ty_;
}

llvm::StructType* Binary::slice_ty() {
    if (slice_ty_) return slice_ty_;
    slice_ty_ = llvm::StructType::create(context, "struct.slice");
    slice_ty_->setBody({ptr_ty(), size_ty()}, /*isPacked=*/false);
    return slice_ty_;
}

llvm::Type* Binary::llvm_type(TypeId ty) {
    if (auto it = types_.find(ty); it != types_.end()) return it->second;

    const TypeStore& ts = ns.types;
    const TypeData& d = ts.get(ty);
    llvm::Type* out = nullptr;
    switch (d.kind) {
        case TypeKind::Error:
        case TypeKind::Void:
            out = int_ty(8);
            break;
        case TypeKind::Bool:
            out = int_ty(1);
            break;
        case TypeKind::Int:
            out = int_ty(d.bits);
            break;
        case TypeKind::Address:
            out = address_ty();
            break;
        case TypeKind::Bytes:
            out = int_ty(d.byte_len * 8u);
            break;
        case TypeKind::DynamicBytes:
        case TypeKind::String:
        case TypeKind::Ref:
            out = ptr_ty();
            break;
        case TypeKind::Array:
            if (d.array_len)
                out = llvm::ArrayType::get(llvm_type(d.elem), *d.array_len);
            else
                out = ptr_ty();
            break;
        case TypeKind::Slice:
            out = slice_ty();
            break;
        case TypeKind::Mapping:
        case TypeKind::StorageRef:
            out = slot_ty();
            break;
        case TypeKind::Struct: {
            auto* st =
                llvm::StructType::create(context, "struct." + ts.to_string(ty));
            types_.insert({ty, st});
            std::vector<llvm::Type*> fields{};
            for (const StructField& f : ts.struct_fields(ty))
                fields.push_back(llvm_type(f.type));
            st->setBody(fields, /*isPacked=*/false);
            return st;
        }
    }
    types_.insert({ty, out});
    return out;
}

llvm::Type* Binary::llvm_var_ty(TypeId ty) {
    const TypeData& d = ns.types.get(ty);
    if (d.kind == TypeKind::Struct) return ptr_ty();
    if (d.kind == TypeKind::Array) return ptr_ty();
    return llvm_type(ty);
}

std::uint64_t Binary::store_size(llvm::Type* ty) const {
    return module->getDataLayout().getTypeStoreSize(ty).getFixedValue();
}

llvm::ConstantInt* Binary::const_i32(std::uint64_t v) {
    return llvm::ConstantInt::get(i32_ty(), v);
}

llvm::ConstantInt* Binary::const_i64(std::uint64_t v) {
    return llvm::ConstantInt::get(i64_ty(), v);
}

llvm::FunctionCallee Binary::import(std::string_view name, llvm::Type* ret,
                                    std::vector<llvm::Type*> params,
                                    std::string_view wasm_module) {
    auto* fty = llvm::FunctionType::get(ret, params, /*isVarArg=*/false);
    llvm::StringRef fname(name.data(), name.size());
    llvm::FunctionCallee callee = module->getOrInsertFunction(fname, fty);
    if (!wasm_module.empty()) {
        if (auto* f = llvm::dyn_cast<llvm::Function>(callee.getCallee())) {
            f->addFnAttr("wasm-import-module",
                         llvm::StringRef(wasm_module.data(), wasm_module.size()));
            f->addFnAttr("wasm-import-name", fname);
        }
    }
    return callee;
}

llvm::CallInst* Binary::call(std::string_view name, llvm::Type* ret,
                             std::vector<llvm::Value*> args,
                             std::string_view wasm_module) {
    std::vector<llvm::Type*> params{};
    params.reserve(args.size());
    for (llvm::Value* a : args) params.push_back(a->getType());
    llvm::FunctionCallee callee = import(name, ret, params, wasm_module);
    return builder.CreateCall(callee, args);
}

llvm::GlobalVariable* Binary::global(std::string_view name, llvm::Type* ty) {
    llvm::StringRef gname(name.data(), name.size());
    if (auto* g = module->getNamedGlobal(gname)) return g;
    return new llvm::GlobalVariable(*module, ty, /*isConstant=*/false,
                                    llvm::GlobalValue::InternalLinkage,
                                    llvm::Constant::getNullValue(ty), gname);
}

llvm::Constant* Binary::emit_global_string(
    std::string_view name, const std::vector<std::uint8_t>& data) {
    llvm::Constant* init = llvm::ConstantDataArray::get(
        context, llvm::ArrayRef<std::uint8_t>(data.data(), data.size()));
    auto* g = new llvm::GlobalVariable(
        *module, init->getType(), /*isConstant=*/true,
        llvm::GlobalValue::PrivateLinkage, init,
        llvm::StringRef(name.data(), name.size()));
    g->setUnnamedAddr(llvm::GlobalValue::UnnamedAddr::Global);
    return g;
}

llvm::AllocaInst* Binary::build_alloca(llvm::Type* ty, std::string_view name) {
    llvm::IRBuilder<> entry_builder(&function->getEntryBlock(),
                                    function->getEntryBlock().begin());
    return entry_builder.CreateAlloca(ty, nullptr,
                                      llvm::StringRef(name.data(), name.size()));
}

llvm::AllocaInst* Binary::build_array_alloca(llvm::Value* len,
                                             std::string_view name) {
    return builder.CreateAlloca(int_ty(8), len,
                                llvm::StringRef(name.data(), name.size()));
}

llvm::BasicBlock* Binary::new_block(std::string_view name) {
    return llvm::BasicBlock::Create(
        context, llvm::StringRef(name.data(), name.size()), function);
}

llvm::Value* Binary::malloc(llvm::Value* size) {
    return call("__malloc", ptr_ty(), {size});
}

llvm::Value* Binary::vector_new(llvm::Value* len, llvm::Value* elem_size,
                                llvm::Value* init) {
    if (!init) init = llvm::ConstantPointerNull::get(ptr_ty());
    return call("vector_new", ptr_ty(), {len, elem_size, init});
}

llvm::Value* Binary::vector_len(llvm::Value* vector) {
    llvm::BasicBlock* entry = builder.GetInsertBlock();
    llvm::BasicBlock* read_bb = new_block("vector_len.read");
    llvm::BasicBlock* done_bb = new_block("vector_len.done");

    llvm::Value* is_null = builder.CreateIsNull(vector, "is_null");
    builder.CreateCondBr(is_null, done_bb, read_bb);

    builder.SetInsertPoint(read_bb);
    llvm::Value* len_ptr = builder.CreateStructGEP(vector_ty(), vector, 0);
    llvm::Value* len = builder.CreateLoad(i32_ty(), len_ptr, "len");
    builder.CreateBr(done_bb);

    builder.SetInsertPoint(done_bb);
    llvm::PHINode* phi = builder.CreatePHI(i32_ty(), 2, "vector_len");
    phi->addIncoming(const_i32(0), entry);
    phi->addIncoming(len, read_bb);
    return phi;
}

llvm::Value* Binary::vector_bytes(llvm::Value* vector) {
    return builder.CreateStructGEP(vector_ty(), vector, 2, "data");
}

llvm::Value* Binary::load_be(llvm::Value* src, std::uint32_t bytes) {
    llvm::Type* ty = int_ty(bytes * 8);
    llvm::AllocaInst* tmp = build_alloca(ty, "le");
    call("__beNtoleN", llvm::Type::getVoidTy(context),
         {src, tmp, const_i32(bytes)});
    return builder.CreateLoad(ty, tmp, "value");
}

void Binary::store_be(llvm::Value* dest, llvm::Value* value,
                      std::uint32_t bytes) {
    llvm::AllocaInst* tmp = build_alloca(int_ty(bytes * 8), "le");
    builder.CreateStore(value, tmp);
    call("__leNtobeN", llvm::Type::getVoidTy(context),
         {tmp, dest, const_i32(bytes)});
}

llvm::Value* Binary::load_value(TypeId ty, llvm::Value* src) {
    // Structs and fixed arrays are referenced in place.
    if (llvm_var_ty(ty) != llvm_type(ty)) return src;
    return builder.CreateLoad(llvm_type(ty), src);
}

void Binary::store_value(TypeId ty, llvm::Value* dest, llvm::Value* value) {
    llvm::Type* mem_ty = llvm_type(ty);
    if (llvm_var_ty(ty) != mem_ty) {
        builder.CreateMemCpy(dest, llvm::MaybeAlign(1), value,
                             llvm::MaybeAlign(1), store_size(mem_ty));
        return;
    }
    builder.CreateStore(value, dest);
}

llvm::Value* Binary::load_address(llvm::Value* ptr) {
    return builder.CreateLoad(address_ty(), ptr, "address");
}

llvm::Value* Binary::spill(llvm::Value* value, std::string_view name) {
    llvm::AllocaInst* slot = build_alloca(value->getType(), name);
    builder.CreateStore(value, slot);
    return slot;
}

bool Binary::verify() {
    std::string out{};
    llvm::raw_string_ostream os(out);
    if (!llvm::verifyModule(*module, &os)) return true;
    error("LLVM module verification failed:\n" + os.str());
    return false;
}

bool Binary::write_ll(const std::filesystem::path& out_ll) {
    std::error_code ec{};
    llvm::raw_fd_ostream out(out_ll.string(), ec, llvm::sys::fs::OF_None);
    if (ec) {
        error("failed to open output file `" + out_ll.string() +
              "`: " + ec.message());
        return false;
    }
    module->print(out, nullptr);
    return true;
}

bool Binary::write_bc(const std::filesystem::path& out_bc) {
    std::error_code ec{};
    llvm::raw_fd_ostream out(out_bc.string(), ec, llvm::sys::fs::OF_None);
    if (ec) {
        error("failed to open output file `" + out_bc.string() +
              "`: " + ec.message());
        return false;
    }
    llvm::WriteBitcodeToFile(*module, out);
    return true;
}

bool Binary::write_obj(const std::filesystem::path& out_obj) {
    ensure_llvm_target_init();

    std::string error_message{};
    const llvm::Target* llvm_target =
        llvm::TargetRegistry::lookupTarget(target.triple, error_message);
    if (!llvm_target) {
        error("LLVM target lookup failed for `" + target.triple +
              "`: " + error_message);
        return false;
    }

    llvm::TargetOptions opts{};
    auto reloc = llvm::Optional<llvm::Reloc::Model>{};
    auto machine = std::unique_ptr<llvm::TargetMachine>(
        llvm_target->createTargetMachine(target.triple,
                                         target.cpu, target.features, opts,
                                         reloc));
    if (!machine) {
        error("failed to create LLVM TargetMachine for `" + target.triple +
              "`");
        return false;
    }
    module->setDataLayout(machine->createDataLayout());

    std::error_code ec{};
    llvm::raw_fd_ostream out(out_obj.string(), ec, llvm::sys::fs::OF_None);
    if (ec) {
        error("failed to open output file `" + out_obj.string() +
              "`: " + ec.message());
        return false;
    }

    llvm::legacy::PassManager pm;
    if (machine->addPassesToEmitFile(pm, out, nullptr,
                                     llvm::CGFT_ObjectFile)) {
        error("LLVM target does not support object emission");
        return false;
    }
    pm.run(*module);
    return true;
}

}  // namespace keel
