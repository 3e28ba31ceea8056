#include "emit.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/DerivedTypes.h>

#include <string>
#include <vector>

#include "runtime.hpp"
#include "sema.hpp"
#include "session.hpp"

namespace keel {
namespace {

// Pointer/length of a byte vector value.
struct Bytes {
    llvm::Value* data = nullptr;
    llvm::Value* len = nullptr;
};

class CfgEmitter {
   public:
    CfgEmitter(Binary& bin, TargetRuntime& runtime, const Contract& contract)
        : bin_(bin),
          ns_(bin.ns),
          ts_(bin.ns.types),
          b_(bin.builder),
          runtime_(runtime),
          contract_(contract) {}

    bool run() {
        for (const ControlFlowGraph& cfg : contract_.cfgs) declare(cfg);
        for (size_t i = 0; i < contract_.cfgs.size(); i++) {
            emit_body(contract_.cfgs[i], functions_[i]);
            if (bin_.session.has_errors()) return false;
        }

        llvm::Function* dispatch = nullptr;
        for (size_t i = 0; i < contract_.cfgs.size(); i++) {
            if (!contract_.cfgs[i].function_no) dispatch = functions_[i];
        }
        bin_.function = nullptr;
        runtime_.emit_entrypoint(bin_, contract_, dispatch);
        return !bin_.session.has_errors();
    }

   private:
    Binary& bin_;
    const Namespace& ns_;
    const TypeStore& ts_;
    llvm::IRBuilder<>& b_;
    TargetRuntime& runtime_;
    const Contract& contract_;

    std::vector<llvm::Function*> functions_{};

    // Per function state.
    const ControlFlowGraph* cfg_ = nullptr;
    std::vector<llvm::AllocaInst*> vars_{};
    std::vector<llvm::BasicBlock*> blocks_{};
    unsigned arg_offset_ = 0;

    void error(const std::string& message) {
        bin_.error(message + " in `" + cfg_->name + "`");
    }

    bool has_params_arg() const { return ns_.target == TargetKind::Solana; }

    void declare(const ControlFlowGraph& cfg) {
        std::vector<llvm::Type*> params{};
        if (has_params_arg()) params.push_back(bin_.ptr_ty());
        for (TypeId p : cfg.params) params.push_back(bin_.llvm_var_ty(p));
        for (size_t i = 0; i < cfg.returns.size(); i++)
            params.push_back(bin_.ptr_ty());

        auto* fty = llvm::FunctionType::get(bin_.return_code_ty(), params,
                                            /*isVarArg=*/false);
        llvm::Function* f =
            llvm::Function::Create(fty, llvm::GlobalValue::ExternalLinkage,
                                   cfg.name, bin_.module.get());
        unsigned i = 0;
        if (has_params_arg()) f->getArg(i++)->setName("params");
        if (cfg.function_no) {
            const Function& fn = ns_.functions[*cfg.function_no];
            for (const Param& p : fn.params) f->getArg(i++)->setName(p.name);
        }
        functions_.push_back(f);
    }

    void emit_body(const ControlFlowGraph& cfg, llvm::Function* f) {
        cfg_ = &cfg;
        bin_.function = f;
        arg_offset_ = has_params_arg() ? 1 : 0;

        llvm::BasicBlock* entry = llvm::BasicBlock::Create(bin_.context, "entry", f);
        b_.SetInsertPoint(entry);

        if (cfg.blocks.empty()) {
            error("function has no blocks");
            b_.CreateUnreachable();
            return;
        }

        vars_.clear();
        for (const CfgVar& v : cfg.vars) {
            llvm::Type* ty = bin_.llvm_var_ty(v.ty);
            llvm::AllocaInst* slot = b_.CreateAlloca(ty, nullptr, v.name);
            b_.CreateStore(llvm::Constant::getNullValue(ty), slot);
            vars_.push_back(slot);
        }

        blocks_.clear();
        for (size_t i = 0; i < cfg.blocks.size(); i++) {
            std::string name = cfg.blocks[i].name.empty()
                                   ? "bb" + std::to_string(i)
                                   : cfg.blocks[i].name;
            blocks_.push_back(llvm::BasicBlock::Create(bin_.context, name, f));
        }
        b_.CreateBr(blocks_[0]);

        for (size_t i = 0; i < cfg.blocks.size(); i++) {
            const BasicBlock& block = cfg.blocks[i];
            b_.SetInsertPoint(blocks_[i]);
            for (const Instr& ins : block.instr) {
                emit_instr(ins);
                if (bin_.session.has_errors()) return;
                if (ins.is_terminator()) break;
            }
            if (!b_.GetInsertBlock()->getTerminator()) {
                error("block `" + std::string(blocks_[i]->getName()) +
                      "` does not end with a terminator");
                b_.CreateUnreachable();
            }
        }
    }

    // ---- expressions -------------------------------------------------------

    Bytes bytes_of(llvm::Value* vector) {
        return Bytes{.data = bin_.vector_bytes(vector),
                     .len = bin_.vector_len(vector)};
    }

    Bytes bytes_expr(const ExprRef& e) {
        if (!e) {
            return Bytes{.data = llvm::ConstantPointerNull::get(bin_.ptr_ty()),
                         .len = bin_.const_i32(0)};
        }
        return bytes_of(expr(*e));
    }

    llvm::Value* expr_or_null(const ExprRef& e) {
        return e ? expr(*e) : nullptr;
    }

    // Pointer to the bytes of an address-typed expression.
    llvm::Value* address_ptr(const ExprRef& e) {
        if (!e) return nullptr;
        return bin_.spill(expr(*e), "address");
    }

    llvm::Constant* address_constant(const llvm::APInt& value) {
        std::uint32_t n = bin_.target.address_length;
        llvm::APInt v = value.zextOrTrunc(n * 8);
        std::vector<std::uint8_t> bytes(n);
        for (std::uint32_t i = 0; i < n; i++) {
            bytes[i] = static_cast<std::uint8_t>(
                v.lshr((n - 1 - i) * 8).trunc(8).getZExtValue());
        }
        return llvm::ConstantDataArray::get(bin_.context,
                                            llvm::ArrayRef<std::uint8_t>(bytes));
    }

    llvm::Value* number(const Expression& e,
                        const Expression::NumberLiteral& n) {
        const TypeData& d = ts_.get(e.ty);
        if (d.kind == TypeKind::Address) return address_constant(n.value);
        if (d.kind == TypeKind::Bool)
            return b_.getInt1(!n.value.isZero());
        auto* ty = llvm::dyn_cast<llvm::IntegerType>(bin_.llvm_type(e.ty));
        if (!ty) {
            error("numeric literal of type `" + ts_.to_string(e.ty) + "`");
            return llvm::UndefValue::get(bin_.llvm_var_ty(e.ty));
        }
        return llvm::ConstantInt::get(bin_.context,
                                      n.value.zextOrTrunc(ty->getBitWidth()));
    }

    llvm::Value* bytes_literal(const Expression& e,
                               const Expression::BytesLiteral& lit) {
        const TypeData& d = ts_.get(e.ty);
        if (d.kind == TypeKind::Bytes) {
            // bytesN literals are left aligned.
            llvm::APInt v(d.byte_len * 8u, 0);
            for (std::uint32_t i = 0; i < d.byte_len; i++) {
                std::uint64_t byte = i < lit.value.size() ? lit.value[i] : 0;
                v = v.shl(8) | llvm::APInt(d.byte_len * 8u, byte);
            }
            return llvm::ConstantInt::get(bin_.context, v);
        }
        if (d.kind == TypeKind::Address) {
            std::vector<std::uint8_t> bytes(bin_.target.address_length, 0);
            for (size_t i = 0; i < bytes.size() && i < lit.value.size(); i++)
                bytes[i] = lit.value[i];
            return llvm::ConstantDataArray::get(
                bin_.context, llvm::ArrayRef<std::uint8_t>(bytes));
        }
        llvm::Constant* data = bin_.emit_global_string("const_string", lit.value);
        return bin_.vector_new(bin_.const_i32(lit.value.size()),
                               bin_.const_i32(1), data);
    }

    llvm::Value* compare_equal(const Expression& left, llvm::Value* l,
                               llvm::Value* r) {
        if (l->getType()->isIntegerTy()) return b_.CreateICmpEQ(l, r);
        if (l->getType()->isArrayTy()) {
            auto* int_ty = bin_.int_ty(bin_.store_size(l->getType()) * 8);
            llvm::Value* li = b_.CreateLoad(int_ty, bin_.spill(l, "lhs"));
            llvm::Value* ri = b_.CreateLoad(int_ty, bin_.spill(r, "rhs"));
            return b_.CreateICmpEQ(li, ri);
        }
        const TypeData& d = ts_.get(left.ty);
        if (d.kind == TypeKind::String || d.kind == TypeKind::DynamicBytes) {
            Bytes lb = bytes_of(l);
            Bytes rb = bytes_of(r);
            llvm::Value* same_len = b_.CreateICmpEQ(lb.len, rb.len);
            llvm::Value* len = b_.CreateSelect(same_len, lb.len, bin_.const_i32(0));
            llvm::Value* same =
                bin_.call("__memcmp", b_.getInt1Ty(), {lb.data, rb.data, len});
            return b_.CreateAnd(same_len, same);
        }
        error("cannot compare values of type `" + ts_.to_string(left.ty) + "`");
        return b_.getFalse();
    }

    llvm::Value* binary(const Expression::Binary& bin) {
        llvm::Value* l = expr(*bin.left);
        llvm::Value* r = expr(*bin.right);
        const TypeData& d = ts_.get(bin.left->ty);
        bool is_signed = d.kind == TypeKind::Int && d.is_signed;

        if ((bin.op == BinaryOp::Add || bin.op == BinaryOp::Sub ||
             bin.op == BinaryOp::Mul || bin.op == BinaryOp::Lt ||
             bin.op == BinaryOp::Gt) &&
            !l->getType()->isIntegerTy()) {
            error("operator `" + std::string(binary_op_name(bin.op)) +
                  "` needs integer operands");
            return llvm::UndefValue::get(l->getType());
        }
        if (l->getType() != r->getType()) {
            error("operands of `" + std::string(binary_op_name(bin.op)) +
                  "` have different types");
            return llvm::UndefValue::get(l->getType());
        }

        switch (bin.op) {
            case BinaryOp::Add:
                return b_.CreateAdd(l, r);
            case BinaryOp::Sub:
                return b_.CreateSub(l, r);
            case BinaryOp::Mul:
                return b_.CreateMul(l, r);
            case BinaryOp::Eq:
                return compare_equal(*bin.left, l, r);
            case BinaryOp::Ne:
                return b_.CreateNot(compare_equal(*bin.left, l, r));
            case BinaryOp::Lt:
                return is_signed ? b_.CreateICmpSLT(l, r) : b_.CreateICmpULT(l, r);
            case BinaryOp::Gt:
                return is_signed ? b_.CreateICmpSGT(l, r) : b_.CreateICmpUGT(l, r);
        }
        return b_.getFalse();
    }

    llvm::Value* subscript(const Expression& e,
                           const Expression::Subscript& s) {
        llvm::Value* base = expr(*s.expr);
        llvm::Value* index = expr(*s.index);
        if (!index->getType()->isIntegerTy() &&
            ts_.get(ts_.deref(s.array_ty)).kind != TypeKind::Mapping) {
            error("subscript index must be an integer");
            return llvm::UndefValue::get(bin_.llvm_var_ty(e.ty));
        }

        if (ts_.is_storage(s.array_ty) || ts_.is_storage(s.expr->ty)) {
            return runtime_.storage().subscript(bin_, ts_.deref(s.array_ty),
                                                base, index);
        }

        TypeId array_ty = ts_.deref(s.array_ty);
        const TypeData& d = ts_.get(array_ty);
        switch (d.kind) {
            case TypeKind::Slice: {
                llvm::Value* data = b_.CreateExtractValue(base, {0}, "data");
                llvm::Value* len = b_.CreateExtractValue(base, {1}, "len");
                llvm::Value* idx = b_.CreateZExtOrTrunc(index, bin_.size_ty());
                check_or_fail(bin_, runtime_, b_.CreateICmpULT(idx, len),
                              "bounds");
                return b_.CreateGEP(bin_.llvm_type(d.elem), data, {idx});
            }
            case TypeKind::Array:
                if (d.array_len) {
                    llvm::Value* idx = b_.CreateZExtOrTrunc(index, bin_.i32_ty());
                    check_or_fail(
                        bin_, runtime_,
                        b_.CreateICmpULT(idx, bin_.const_i32(*d.array_len)),
                        "bounds");
                    return b_.CreateGEP(bin_.llvm_type(array_ty), base,
                                        {bin_.const_i32(0), idx});
                }
                [[fallthrough]];
            case TypeKind::DynamicBytes:
            case TypeKind::String: {
                TypeId elem = d.kind == TypeKind::Array ? d.elem : ts_.uint(8);
                Bytes v = bytes_of(base);
                llvm::Value* idx = b_.CreateZExtOrTrunc(index, bin_.i32_ty());
                check_or_fail(bin_, runtime_, b_.CreateICmpULT(idx, v.len),
                              "bounds");
                return b_.CreateGEP(bin_.llvm_type(elem), v.data, {idx});
            }
            default:
                error("cannot subscript a value of type `" +
                      ts_.to_string(array_ty) + "`");
                return llvm::UndefValue::get(bin_.llvm_var_ty(e.ty));
        }
    }

    llvm::Value* struct_member(const Expression::StructMember& m) {
        llvm::Value* base = expr(*m.expr);
        TypeId struct_ty = ts_.deref(m.expr->ty);
        if (ts_.get(struct_ty).kind != TypeKind::Struct ||
            m.member >= ts_.struct_fields(struct_ty).size()) {
            error("invalid struct member access");
            return llvm::UndefValue::get(bin_.ptr_ty());
        }
        if (ts_.is_storage(m.expr->ty))
            return runtime_.storage().member(bin_, struct_ty, base, m.member);
        return b_.CreateStructGEP(bin_.llvm_type(struct_ty), base, m.member);
    }

    llvm::Value* expr(const Expression& e) {
        return std::visit(
            [&](const auto& node) -> llvm::Value* {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, Expression::NumberLiteral>) {
                    return number(e, node);
                } else if constexpr (std::is_same_v<T,
                                                    Expression::BoolLiteral>) {
                    return b_.getInt1(node.value);
                } else if constexpr (std::is_same_v<T,
                                                    Expression::BytesLiteral>) {
                    return bytes_literal(e, node);
                } else if constexpr (std::is_same_v<T, Expression::Variable>) {
                    llvm::AllocaInst* slot = vars_.at(node.var_no);
                    return b_.CreateLoad(slot->getAllocatedType(), slot,
                                         cfg_->vars[node.var_no].name);
                } else if constexpr (std::is_same_v<T,
                                                    Expression::FunctionArg>) {
                    return bin_.function->getArg(arg_offset_ + node.arg_no);
                } else if constexpr (std::is_same_v<T, Expression::Load>) {
                    return bin_.load_value(e.ty, expr(*node.expr));
                } else if constexpr (std::is_same_v<T,
                                                    Expression::StructMember>) {
                    return struct_member(node);
                } else if constexpr (std::is_same_v<T,
                                                    Expression::StructLiteral>) {
                    llvm::Type* ll = bin_.llvm_type(e.ty);
                    llvm::AllocaInst* dest = bin_.build_alloca(ll, "struct");
                    const auto& fields = ts_.struct_fields(e.ty);
                    for (std::uint32_t i = 0; i < node.values.size(); i++) {
                        bin_.store_value(fields[i].type,
                                         b_.CreateStructGEP(ll, dest, i),
                                         expr(*node.values[i]));
                    }
                    return dest;
                } else if constexpr (std::is_same_v<T,
                                                    Expression::ArrayLiteral>) {
                    return array_literal(e, node);
                } else if constexpr (std::is_same_v<T, Expression::Subscript>) {
                    return subscript(e, node);
                } else if constexpr (std::is_same_v<T, Expression::GetRef>) {
                    llvm::Value* v = expr(*node.expr);
                    if (bin_.llvm_var_ty(node.expr->ty) !=
                        bin_.llvm_type(node.expr->ty))
                        return v;
                    return bin_.spill(v, "ref");
                } else if constexpr (std::is_same_v<T, Expression::Builtin>) {
                    return builtin(e, node);
                } else if constexpr (std::is_same_v<T, Expression::Binary>) {
                    return binary(node);
                } else if constexpr (std::is_same_v<T,
                                                    Expression::StorageLoad>) {
                    llvm::Value* slot = expr(*node.slot);
                    return runtime_.storage().load(bin_, e.ty, slot);
                } else if constexpr (std::is_same_v<
                                         T, Expression::StorageArrayLength>) {
                    llvm::Value* slot = expr(*node.array);
                    return runtime_.storage().array_length(
                        bin_, ts_.deref(node.array_ty), slot);
                } else {
                    static_assert(std::is_same_v<T, Expression::ReturnData>);
                    return runtime_.return_data(bin_);
                }
            },
            e.data);
    }

    llvm::Value* array_literal(const Expression& e,
                               const Expression::ArrayLiteral& lit) {
        const TypeData& d = ts_.get(e.ty);
        if (d.kind != TypeKind::Array) {
            error("array literal of type `" + ts_.to_string(e.ty) + "`");
            return llvm::UndefValue::get(bin_.llvm_var_ty(e.ty));
        }
        llvm::Type* elem_ll = bin_.llvm_type(d.elem);
        llvm::Value* data = nullptr;
        llvm::Value* out = nullptr;
        if (d.array_len) {
            out = bin_.build_alloca(bin_.llvm_type(e.ty), "array");
            data = out;
        } else {
            out = bin_.vector_new(bin_.const_i32(lit.values.size()),
                                  bin_.const_i32(bin_.store_size(elem_ll)),
                                  nullptr);
            data = bin_.vector_bytes(out);
        }
        for (std::uint32_t i = 0; i < lit.values.size(); i++) {
            bin_.store_value(d.elem,
                             b_.CreateGEP(elem_ll, data, {bin_.const_i32(i)}),
                             expr(*lit.values[i]));
        }
        return out;
    }

    llvm::Value* builtin(const Expression& e, const Expression::Builtin& node) {
        if (std::optional<HashTy> hash = hash_ty_of(node.kind)) {
            Bytes input = bytes_expr(node.args.at(0));
            return runtime_.hash(bin_, *hash, input.data, input.len);
        }
        std::vector<llvm::Value*> args{};
        for (const ExprRef& a : node.args) args.push_back(expr(*a));
        return runtime_.builtin(bin_, node.kind, args, e.ty);
    }

    // ---- instructions ------------------------------------------------------

    void store_var(VarNo var_no, llvm::Value* v) {
        llvm::AllocaInst* slot = vars_.at(var_no);
        if (slot->getAllocatedType() != v->getType()) {
            if (slot->getAllocatedType()->isIntegerTy(1) &&
                v->getType()->isIntegerTy()) {
                v = b_.CreateICmpNE(v, llvm::Constant::getNullValue(v->getType()));
            } else {
                error("value assigned to variable " + std::to_string(var_no) +
                      " does not match its type `" +
                      ts_.to_string(cfg_->vars[var_no].ty) + "`");
                return;
            }
        }
        b_.CreateStore(v, slot);
    }

    // Length of an accounts or seeds expression: fixed arrays carry it in
    // their type, slices at runtime.
    void array_arg(const ExprRef& e, llvm::Value*& ptr, llvm::Value*& len) {
        if (!e) return;
        llvm::Value* v = expr(*e);
        const TypeData& d = ts_.get(e->ty);
        if (d.kind == TypeKind::Slice) {
            ptr = b_.CreateExtractValue(v, {0});
            len = b_.CreateZExtOrTrunc(b_.CreateExtractValue(v, {1}),
                                       bin_.i32_ty());
        } else if (d.kind == TypeKind::Array && d.array_len) {
            ptr = v;
            len = bin_.const_i32(*d.array_len);
        } else if (d.kind == TypeKind::Array) {
            ptr = bin_.vector_bytes(v);
            len = bin_.vector_len(v);
        } else {
            ptr = v;
            len = bin_.const_i32(1);
        }
    }

    void store_success(std::optional<VarNo> var, llvm::Value* status) {
        if (var && status) store_var(*var, status);
    }

    void emit_instr(const Instr& ins) {
        std::visit(
            [&](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, Instr::Set>) {
                    store_var(node.res, expr(*node.expr));
                } else if constexpr (std::is_same_v<T, Instr::Branch>) {
                    b_.CreateBr(blocks_.at(node.block));
                } else if constexpr (std::is_same_v<T, Instr::BranchCond>) {
                    llvm::Value* cond = expr(*node.cond);
                    if (!cond->getType()->isIntegerTy(1)) {
                        error("branch condition is not a bool");
                        return;
                    }
                    b_.CreateCondBr(cond, blocks_.at(node.true_block),
                                    blocks_.at(node.false_block));
                } else if constexpr (std::is_same_v<T, Instr::Return>) {
                    emit_return(node);
                } else if constexpr (std::is_same_v<T, Instr::ReturnCode>) {
                    runtime_.return_code(
                        bin_, llvm::ConstantInt::get(
                                  bin_.return_code_ty(),
                                  runtime_.return_code_value(node.code)));
                } else if constexpr (std::is_same_v<T, Instr::Constructor>) {
                    emit_constructor(node);
                } else if constexpr (std::is_same_v<T, Instr::ExternalCall>) {
                    emit_external_call(node);
                } else if constexpr (std::is_same_v<T, Instr::AccountAccess>) {
                    if (bin_.target.kind == TargetKind::Solana) {
                        error("internal error: account `" + node.name +
                              "` was not resolved before emission");
                    } else {
                        report_unsupported(bin_, "account access");
                    }
                } else if constexpr (std::is_same_v<T, Instr::SetStorage>) {
                    llvm::Value* slot = expr(*node.storage);
                    llvm::Value* value = expr(*node.value);
                    runtime_.storage().store(bin_, node.ty, true, slot, value);
                } else if constexpr (std::is_same_v<T, Instr::ClearStorage>) {
                    llvm::Value* slot = expr(*node.storage);
                    runtime_.storage().clear(bin_, node.ty, slot);
                } else if constexpr (std::is_same_v<T, Instr::PushStorage>) {
                    llvm::Value* slot = expr(*node.storage);
                    llvm::Value* value = expr_or_null(node.value);
                    llvm::Value* res = runtime_.storage().push(
                        bin_, ts_.deref(node.ty), slot, value);
                    store_var(node.res, res);
                } else if constexpr (std::is_same_v<T, Instr::PopStorage>) {
                    llvm::Value* slot = expr(*node.storage);
                    llvm::Value* res = runtime_.storage().pop(
                        bin_, ts_.deref(node.ty), slot, node.res.has_value());
                    if (node.res && res) store_var(*node.res, res);
                } else if constexpr (std::is_same_v<T, Instr::Print>) {
                    Bytes msg = bytes_expr(node.expr);
                    runtime_.print(bin_, msg.data, msg.len);
                } else if constexpr (std::is_same_v<T, Instr::AssertFailure>) {
                    Bytes data = bytes_expr(node.encoded_args);
                    runtime_.assert_failure(bin_, data.data, data.len);
                } else if constexpr (std::is_same_v<T, Instr::ReturnData>) {
                    Bytes data = bytes_expr(node.data);
                    runtime_.return_abi_data(bin_, data.data, data.len);
                } else if constexpr (std::is_same_v<T, Instr::ValueTransfer>) {
                    llvm::Value* address = address_ptr(node.address);
                    llvm::Value* value = expr(*node.value);
                    llvm::Value* status = nullptr;
                    runtime_.value_transfer(
                        bin_, node.success ? &status : nullptr, address, value);
                    store_success(node.success, status);
                } else if constexpr (std::is_same_v<T, Instr::SelfDestruct>) {
                    runtime_.selfdestruct(bin_, address_ptr(node.recipient));
                } else if constexpr (std::is_same_v<T, Instr::EmitEvent>) {
                    Bytes data = bytes_expr(node.data);
                    std::vector<llvm::Value*> topics{};
                    for (const ExprRef& t : node.topics)
                        topics.push_back(expr(*t));
                    runtime_.emit_event(bin_, data.data, data.len, topics);
                } else if constexpr (std::is_same_v<T, Instr::Unreachable>) {
                    b_.CreateUnreachable();
                } else {
                    static_assert(std::is_same_v<T, Instr::Nop>);
                }
            },
            ins.data);
    }

    void emit_return(const Instr::Return& ret) {
        if (ret.values.size() != cfg_->returns.size()) {
            error("return with " + std::to_string(ret.values.size()) +
                  " values, expected " + std::to_string(cfg_->returns.size()));
            return;
        }
        unsigned first_out = arg_offset_ + cfg_->params.size();
        for (size_t i = 0; i < ret.values.size(); i++) {
            b_.CreateStore(expr(*ret.values[i]),
                           bin_.function->getArg(first_out + i));
        }
        b_.CreateRet(llvm::ConstantInt::get(bin_.return_code_ty(), 0));
    }

    void emit_constructor(const Instr::Constructor& c) {
        Bytes args = bytes_expr(c.encoded_args);

        llvm::Value* address = nullptr;
        if (c.address) {
            address = address_ptr(c.address);
        } else {
            address = bin_.build_alloca(bin_.address_ty(), "address");
            b_.CreateStore(llvm::Constant::getNullValue(bin_.address_ty()),
                           address);
        }

        ContractArgs ca{};
        ca.value = expr_or_null(c.value);
        ca.gas = expr_or_null(c.gas);
        if (c.salt) ca.salt = bin_.spill(expr(*c.salt), "salt");
        array_arg(c.seeds, ca.seeds, ca.seeds_len);
        array_arg(c.accounts, ca.accounts, ca.accounts_len);

        llvm::Value* status = nullptr;
        runtime_.create_contract(bin_, c.success ? &status : nullptr,
                                 c.contract_no, address, args.data, args.len,
                                 ca);
        store_success(c.success, status);
        store_var(c.res, bin_.load_address(address));
    }

    void emit_external_call(const Instr::ExternalCall& call) {
        Bytes payload = bytes_expr(call.payload);
        llvm::Value* address = address_ptr(call.address);

        ContractArgs ca{};
        ca.value = expr_or_null(call.value);
        ca.gas = expr_or_null(call.gas);
        array_arg(call.seeds, ca.seeds, ca.seeds_len);
        array_arg(call.accounts, ca.accounts, ca.accounts_len);

        llvm::Value* status = nullptr;
        runtime_.external_call(bin_, call.success ? &status : nullptr,
                               payload.data, payload.len, address, ca,
                               call.callty);
        store_success(call.success, status);
    }
};

}  // namespace

std::unique_ptr<Binary> emit_contract(Session& session, const Namespace& ns,
                                      ContractNo contract_no,
                                      const TargetSpec& target) {
    const Contract& contract = ns.contracts.at(contract_no);
    auto bin = std::make_unique<Binary>(session, ns, target, contract.name);
    std::unique_ptr<TargetRuntime> runtime = make_runtime(*bin);

    CfgEmitter emitter(*bin, *runtime, contract);
    if (!emitter.run()) return nullptr;
    if (!bin->verify()) return nullptr;
    return bin;
}

bool write_outputs(Binary& bin, const EmitOptions& opts) {
    if (opts.out_ll && !bin.write_ll(*opts.out_ll)) return false;
    if (opts.out_bc && !bin.write_bc(*opts.out_bc)) return false;
    if (opts.out_obj && !bin.write_obj(*opts.out_obj)) return false;
    return true;
}

static std::optional<std::filesystem::path> contract_path(
    const std::optional<std::filesystem::path>& out, const std::string& contract,
    bool several) {
    if (!out || !several) return out;
    std::filesystem::path p = *out;
    p.replace_filename(p.stem().string() + "." + contract +
                       p.extension().string());
    return p;
}

bool emit_module(Session& session, const Namespace& ns,
                 const TargetSpec& target, const EmitOptions& opts) {
    std::vector<std::unique_ptr<Binary>> bins{};
    for (ContractNo c = 0; c < ns.contracts.size(); c++) {
        std::unique_ptr<Binary> bin = emit_contract(session, ns, c, target);
        if (!bin) return false;
        bins.push_back(std::move(bin));
    }
    if (session.has_errors()) return false;

    bool several = bins.size() > 1;
    for (ContractNo c = 0; c < bins.size(); c++) {
        const std::string& name = ns.contracts[c].name;
        EmitOptions out{
            .out_ll = contract_path(opts.out_ll, name, several),
            .out_bc = contract_path(opts.out_bc, name, several),
            .out_obj = contract_path(opts.out_obj, name, several),
        };
        if (!write_outputs(*bins[c], out)) return false;
    }
    return true;
}

}  // namespace keel
