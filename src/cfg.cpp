#include "cfg.hpp"

#include <llvm/ADT/SmallString.h>

#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

#include "sema.hpp"

namespace keel {

std::string_view binary_op_name(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
            return "add";
        case BinaryOp::Sub:
            return "sub";
        case BinaryOp::Mul:
            return "mul";
        case BinaryOp::Eq:
            return "eq";
        case BinaryOp::Ne:
            return "ne";
        case BinaryOp::Lt:
            return "lt";
        case BinaryOp::Gt:
            return "gt";
    }
    return "?";
}

std::string_view call_ty_name(CallTy ty) {
    switch (ty) {
        case CallTy::Regular:
            return "regular";
        case CallTy::Delegate:
            return "delegate";
        case CallTy::Static:
            return "static";
    }
    return "?";
}

std::string_view return_code_name(ReturnCode code) {
    switch (code) {
        case ReturnCode::Success:
            return "success";
        case ReturnCode::FunctionSelectorInvalid:
            return "selector-invalid";
        case ReturnCode::AbiEncodingInvalid:
            return "abi-invalid";
        case ReturnCode::InvalidDataError:
            return "invalid-data";
        case ReturnCode::AccountDataTooSmall:
            return "account-data-too-small";
        case ReturnCode::InvalidProgramId:
            return "invalid-program-id";
    }
    return "?";
}

bool Instr::is_terminator() const {
    return std::holds_alternative<Branch>(data) ||
           std::holds_alternative<BranchCond>(data) ||
           std::holds_alternative<Return>(data) ||
           std::holds_alternative<ReturnCode>(data) ||
           std::holds_alternative<AssertFailure>(data) ||
           std::holds_alternative<ReturnData>(data) ||
           std::holds_alternative<SelfDestruct>(data) ||
           std::holds_alternative<Unreachable>(data);
}

std::vector<BlockNo> BasicBlock::edges() const {
    std::vector<BlockNo> out{};
    for (const Instr& ins : instr) {
        if (const auto* b = std::get_if<Instr::Branch>(&ins.data)) {
            out.push_back(b->block);
        } else if (const auto* c = std::get_if<Instr::BranchCond>(&ins.data)) {
            out.push_back(c->true_block);
            out.push_back(c->false_block);
        }
    }
    return out;
}

const CfgVar* ControlFlowGraph::var(VarNo no) const {
    if (no >= vars.size()) return nullptr;
    return &vars[no];
}

namespace {

static const char* kHexDigits = "0123456789abcdef";

static void dump_hex(std::ostream& os, const std::vector<std::uint8_t>& bytes) {
    os << "0x";
    for (std::uint8_t b : bytes) os << kHexDigits[b >> 4] << kHexDigits[b & 0xf];
}

static std::string block_label(const ControlFlowGraph& cfg, BlockNo no) {
    if (no < cfg.blocks.size() && !cfg.blocks[no].name.empty())
        return cfg.blocks[no].name;
    return "bb" + std::to_string(no);
}

static bool is_signed_int(const TypeStore& ts, TypeId ty) {
    const TypeData& d = ts.get(ty);
    return d.kind == TypeKind::Int && d.is_signed;
}

static void dump_opt_expr(std::ostream& os, const Namespace& ns,
                          std::string_view key, const ExprRef& e) {
    if (!e) return;
    os << " " << key << "=";
    dump_expr(os, ns, *e);
}

static void dump_instr(std::ostream& os, const Namespace& ns,
                       const ControlFlowGraph& cfg, const Instr& ins) {
    const TypeStore& ts = ns.types;
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Instr::Set>) {
                os << "set " << v.res << " ";
                dump_expr(os, ns, *v.expr);
            } else if constexpr (std::is_same_v<T, Instr::Branch>) {
                os << "branch " << block_label(cfg, v.block);
            } else if constexpr (std::is_same_v<T, Instr::BranchCond>) {
                os << "cond ";
                dump_expr(os, ns, *v.cond);
                os << " " << block_label(cfg, v.true_block) << " "
                   << block_label(cfg, v.false_block);
            } else if constexpr (std::is_same_v<T, Instr::Return>) {
                os << "return";
                for (const ExprRef& e : v.values) {
                    os << " ";
                    dump_expr(os, ns, *e);
                }
            } else if constexpr (std::is_same_v<T, Instr::ReturnCode>) {
                os << "return-code " << return_code_name(v.code);
            } else if constexpr (std::is_same_v<T, Instr::Constructor>) {
                os << "constructor res=" << v.res;
                os << " contract=" << ns.contracts.at(v.contract_no).name;
                if (v.success) os << " success=" << *v.success;
                if (!v.constructor_no) os << " callee=none";
                dump_opt_expr(os, ns, "args", v.encoded_args);
                dump_opt_expr(os, ns, "value", v.value);
                dump_opt_expr(os, ns, "gas", v.gas);
                dump_opt_expr(os, ns, "salt", v.salt);
                dump_opt_expr(os, ns, "seeds", v.seeds);
                dump_opt_expr(os, ns, "address", v.address);
                dump_opt_expr(os, ns, "accounts", v.accounts);
            } else if constexpr (std::is_same_v<T, Instr::ExternalCall>) {
                os << "call";
                if (v.success) os << " success=" << *v.success;
                if (v.callty != CallTy::Regular)
                    os << " kind=" << call_ty_name(v.callty);
                dump_opt_expr(os, ns, "address", v.address);
                dump_opt_expr(os, ns, "payload", v.payload);
                dump_opt_expr(os, ns, "accounts", v.accounts);
                dump_opt_expr(os, ns, "seeds", v.seeds);
                dump_opt_expr(os, ns, "value", v.value);
                dump_opt_expr(os, ns, "gas", v.gas);
            } else if constexpr (std::is_same_v<T, Instr::AccountAccess>) {
                os << "account " << v.var_no << " " << v.name;
            } else if constexpr (std::is_same_v<T, Instr::SetStorage>) {
                os << "set-storage " << ts.to_string(v.ty) << " ";
                dump_expr(os, ns, *v.storage);
                os << " ";
                dump_expr(os, ns, *v.value);
            } else if constexpr (std::is_same_v<T, Instr::ClearStorage>) {
                os << "clear-storage " << ts.to_string(v.ty) << " ";
                dump_expr(os, ns, *v.storage);
            } else if constexpr (std::is_same_v<T, Instr::PushStorage>) {
                os << "push-storage " << v.res << " " << ts.to_string(v.ty)
                   << " ";
                dump_expr(os, ns, *v.storage);
                if (v.value) {
                    os << " ";
                    dump_expr(os, ns, *v.value);
                }
            } else if constexpr (std::is_same_v<T, Instr::PopStorage>) {
                os << "pop-storage " << ts.to_string(v.ty) << " ";
                dump_expr(os, ns, *v.storage);
                if (v.res) os << " res=" << *v.res;
            } else if constexpr (std::is_same_v<T, Instr::Print>) {
                os << "print ";
                dump_expr(os, ns, *v.expr);
            } else if constexpr (std::is_same_v<T, Instr::AssertFailure>) {
                os << "assert-failure";
                if (v.encoded_args) {
                    os << " ";
                    dump_expr(os, ns, *v.encoded_args);
                }
            } else if constexpr (std::is_same_v<T, Instr::ReturnData>) {
                os << "return-data ";
                dump_expr(os, ns, *v.data);
            } else if constexpr (std::is_same_v<T, Instr::ValueTransfer>) {
                os << "transfer";
                if (v.success) os << " success=" << *v.success;
                dump_opt_expr(os, ns, "address", v.address);
                dump_opt_expr(os, ns, "value", v.value);
            } else if constexpr (std::is_same_v<T, Instr::SelfDestruct>) {
                os << "selfdestruct ";
                dump_expr(os, ns, *v.recipient);
            } else if constexpr (std::is_same_v<T, Instr::EmitEvent>) {
                os << "emit";
                dump_opt_expr(os, ns, "data", v.data);
                for (const ExprRef& t : v.topics) dump_opt_expr(os, ns, "topic", t);
            } else if constexpr (std::is_same_v<T, Instr::Unreachable>) {
                os << "unreachable";
            } else if constexpr (std::is_same_v<T, Instr::Nop>) {
                os << "nop";
            }
        },
        ins.data);
}

static void dump_body(std::ostream& os, const Namespace& ns,
                      const ControlFlowGraph& cfg) {
    for (VarNo i = 0; i < cfg.vars.size(); i++) {
        os << "  var " << i << " " << cfg.vars[i].name << ": "
           << ns.types.to_string(cfg.vars[i].ty) << "\n";
    }
    for (BlockNo b = 0; b < cfg.blocks.size(); b++) {
        os << "  block " << block_label(cfg, b) << "\n";
        for (const Instr& ins : cfg.blocks[b].instr) {
            os << "    ";
            dump_instr(os, ns, cfg, ins);
            os << "\n";
        }
    }
}

}  // namespace

void dump_expr(std::ostream& os, const Namespace& ns, const Expression& e) {
    const TypeStore& ts = ns.types;
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Expression::NumberLiteral>) {
                llvm::SmallString<40> digits{};
                v.value.toString(digits, 10, is_signed_int(ts, e.ty));
                os << "(num " << ts.to_string(e.ty) << " " << digits.str().str()
                   << ")";
            } else if constexpr (std::is_same_v<T, Expression::BoolLiteral>) {
                os << "(bool " << (v.value ? "true" : "false") << ")";
            } else if constexpr (std::is_same_v<T, Expression::BytesLiteral>) {
                os << "(bytes " << ts.to_string(e.ty) << " ";
                dump_hex(os, v.value);
                os << ")";
            } else if constexpr (std::is_same_v<T, Expression::Variable>) {
                os << "(var " << v.var_no << ")";
            } else if constexpr (std::is_same_v<T, Expression::FunctionArg>) {
                os << "(arg " << v.arg_no << ")";
            } else if constexpr (std::is_same_v<T, Expression::Load>) {
                os << "(load " << ts.to_string(e.ty) << " ";
                dump_expr(os, ns, *v.expr);
                os << ")";
            } else if constexpr (std::is_same_v<T, Expression::StructMember>) {
                os << "(member " << ts.to_string(e.ty) << " ";
                dump_expr(os, ns, *v.expr);
                os << " " << v.member << ")";
            } else if constexpr (std::is_same_v<T, Expression::StructLiteral>) {
                os << "(struct " << ts.to_string(e.ty);
                for (const ExprRef& f : v.values) {
                    os << " ";
                    dump_expr(os, ns, *f);
                }
                os << ")";
            } else if constexpr (std::is_same_v<T, Expression::ArrayLiteral>) {
                os << "(array " << ts.to_string(e.ty);
                for (const ExprRef& f : v.values) {
                    os << " ";
                    dump_expr(os, ns, *f);
                }
                os << ")";
            } else if constexpr (std::is_same_v<T, Expression::Subscript>) {
                os << "(subscript " << ts.to_string(e.ty) << " "
                   << ts.to_string(v.array_ty) << " ";
                dump_expr(os, ns, *v.expr);
                os << " ";
                dump_expr(os, ns, *v.index);
                os << ")";
            } else if constexpr (std::is_same_v<T, Expression::GetRef>) {
                os << "(ref " << ts.to_string(e.ty) << " ";
                dump_expr(os, ns, *v.expr);
                os << ")";
            } else if constexpr (std::is_same_v<T, Expression::Builtin>) {
                os << "(builtin " << get_prototype(v.kind).qualified_name();
                for (const ExprRef& a : v.args) {
                    os << " ";
                    dump_expr(os, ns, *a);
                }
                os << ")";
            } else if constexpr (std::is_same_v<T, Expression::Binary>) {
                os << "(" << binary_op_name(v.op) << " ";
                dump_expr(os, ns, *v.left);
                os << " ";
                dump_expr(os, ns, *v.right);
                os << ")";
            } else if constexpr (std::is_same_v<T, Expression::StorageLoad>) {
                os << "(storage-load " << ts.to_string(e.ty) << " ";
                dump_expr(os, ns, *v.slot);
                os << ")";
            } else if constexpr (std::is_same_v<T,
                                                Expression::StorageArrayLength>) {
                os << "(storage-length " << ts.to_string(v.array_ty) << " ";
                dump_expr(os, ns, *v.array);
                os << ")";
            } else if constexpr (std::is_same_v<T, Expression::ReturnData>) {
                os << "(return-data)";
            }
        },
        e.data);
}

void dump_cfg(std::ostream& os, const Namespace& ns,
              const ControlFlowGraph& cfg) {
    os << "# cfg " << cfg.name << "\n";
    dump_body(os, ns, cfg);
}

void dump_module(std::ostream& os, const Namespace& ns) {
    const TypeStore& ts = ns.types;
    os << "target " << target_name(ns.target) << "\n";

    for (std::uint32_t s = 0; s < ts.struct_count(); s++) {
        const StructDecl& decl = ts.struct_decl(s);
        os << "struct " << decl.name << " {";
        for (size_t i = 0; i < decl.fields.size(); i++) {
            os << (i ? ", " : " ") << decl.fields[i].name << ": "
               << ts.to_string(decl.fields[i].type);
        }
        os << " }\n";
    }

    for (const Contract& c : ns.contracts) {
        os << "\ncontract " << c.name;
        if (c.program_id) {
            os << " program_id=";
            dump_hex(os, *c.program_id);
        }
        os << "\n";
        for (FunctionNo f : c.functions) {
            const Function& fn = ns.functions[f];
            os << "function " << fn.name;
            if (fn.is_constructor()) os << " constructor";
            if (fn.selector) {
                os << " selector=";
                dump_hex(os, *fn.selector);
            }
            os << "\n";
            if (!fn.accounts.empty()) {
                os << "  accounts";
                for (const auto& [name, flags] : fn.accounts) {
                    os << " " << name;
                    if (flags.is_signer && flags.is_writer)
                        os << "(signer,writer)";
                    else if (flags.is_signer)
                        os << "(signer)";
                    else if (flags.is_writer)
                        os << "(writer)";
                }
                os << "\n";
            }
            for (const Param& p : fn.params)
                os << "  param " << p.name << ": " << ts.to_string(p.ty) << "\n";
            for (TypeId r : fn.returns)
                os << "  returns " << ts.to_string(r) << "\n";

            auto it = c.all_functions.find(f);
            if (it != c.all_functions.end()) dump_body(os, ns, c.cfgs[it->second]);
        }
        for (const ControlFlowGraph& cfg : c.cfgs) {
            if (cfg.function_no) continue;
            os << "dispatch\n";
            dump_body(os, ns, cfg);
        }
    }
}

}  // namespace keel
