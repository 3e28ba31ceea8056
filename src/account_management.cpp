#include "account_management.hpp"

#include <deque>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "sema.hpp"
#include "session.hpp"

namespace keel {
namespace {

class AccountRewriter {
   public:
    AccountRewriter(Session& session, const Namespace& ns, FunctionNo ast_no)
        : session_(session), ns_(ns), ast_no_(ast_no) {}

    bool traverse(ControlFlowGraph& cfg) {
        if (cfg.blocks.empty()) return true;

        std::deque<BlockNo> queue{};
        std::unordered_set<BlockNo> visited{};
        queue.push_back(0);
        visited.insert(0);

        bool ok = true;
        while (!queue.empty()) {
            BlockNo cur = queue.front();
            queue.pop_front();

            for (Instr& ins : cfg.blocks[cur].instr) {
                ok &= process_instruction(ins);
            }

            for (BlockNo edge : cfg.blocks[cur].edges()) {
                if (edge >= cfg.blocks.size()) continue;
                if (visited.insert(edge).second) queue.push_back(edge);
            }
        }
        return ok;
    }

   private:
    Session& session_;
    const Namespace& ns_;
    FunctionNo ast_no_;

    const Function& current() const { return ns_.functions[ast_no_]; }

    std::optional<std::size_t> caller_index(Span span, const std::string& name) {
        auto idx = account_index(current().accounts, name);
        if (!idx) {
            session_.error(span, "internal error: account `" + name +
                                     "` is not declared by function `" +
                                     current().name + "`");
        }
        return idx;
    }

    bool process_instruction(Instr& ins) {
        if (auto* c = std::get_if<Instr::Constructor>(&ins.data)) {
            return process_constructor(ins.span, *c);
        }
        if (auto* a = std::get_if<Instr::AccountAccess>(&ins.data)) {
            auto idx = caller_index(ins.span, a->name);
            if (!idx) return false;
            Instr replacement{
                .span = ins.span,
                .data = Instr::Set{.res = a->var_no,
                                   .expr = index_accounts_vector(ns_, *idx)},
            };
            ins = std::move(replacement);
        }
        return true;
    }

    bool process_constructor(Span span, Instr::Constructor& c) {
        if (c.accounts || !c.constructor_no) return true;

        const Function& callee = ns_.functions.at(*c.constructor_no);
        const TypeStore& ts = ns_.types;

        std::vector<ExprRef> metas{};
        metas.reserve(callee.accounts.size());
        for (const auto& [name, flags] : callee.accounts) {
            if (name == kDataAccount) {
                if (!c.address) {
                    session_.error(span,
                                   "internal error: constructor call needs "
                                   "an address for `" +
                                       std::string(kDataAccount) + "`");
                    return false;
                }
                ExprRef address_ref = make_expr(
                    kCodegenSpan, ts.ref(ts.address()),
                    Expression::GetRef{.expr = c.address});
                metas.push_back(account_meta_literal(
                    ns_, std::move(address_ref), flags.is_signer,
                    flags.is_writer));
            } else if (name == kSystemAccount) {
                ExprRef system_address = make_expr(
                    kCodegenSpan, ts.address(),
                    Expression::NumberLiteral{
                        .value = llvm::APInt(ns_.address_length() * 8, 0)});
                ExprRef system_ref =
                    make_expr(kCodegenSpan, ts.ref(ts.address()),
                              Expression::GetRef{.expr = system_address});
                metas.push_back(account_meta_literal(
                    ns_, std::move(system_ref), false, false));
            } else {
                auto idx = caller_index(span, name);
                if (!idx) return false;
                metas.push_back(account_meta_literal(
                    ns_, accounts_vector_key_at_index(ns_, *idx),
                    flags.is_signer, flags.is_writer));
            }
        }

        auto len = static_cast<std::uint32_t>(metas.size());
        ExprRef metas_vector = make_expr(
            kCodegenSpan,
            ts.array(ts.struct_(StructKind::AccountMeta), std::uint64_t{len}),
            Expression::ArrayLiteral{.dimensions = {len},
                                     .values = std::move(metas)});

        c.address = nullptr;
        c.accounts = std::move(metas_vector);
        return true;
    }
};

}  // namespace

ExprRef index_accounts_vector(const Namespace& ns, std::size_t index) {
    const TypeStore& ts = ns.types;
    TypeId info = ts.struct_(StructKind::AccountInfo);
    TypeId accounts_ty = ts.slice(info);

    ExprRef accounts = make_expr(
        kCodegenSpan, accounts_ty,
        Expression::Builtin{.kind = BuiltinKind::Accounts, .args = {}});
    ExprRef idx = make_expr(
        kCodegenSpan, ts.uint(32),
        Expression::NumberLiteral{.value = llvm::APInt(32, index)});

    return make_expr(kCodegenSpan, ts.ref(info),
                     Expression::Subscript{.array_ty = accounts_ty,
                                           .expr = std::move(accounts),
                                           .index = std::move(idx)});
}

ExprRef accounts_vector_key_at_index(const Namespace& ns, std::size_t index) {
    return retrieve_key_from_account_info(ns, index_accounts_vector(ns, index));
}

ExprRef retrieve_key_from_account_info(const Namespace& ns,
                                       ExprRef account_info) {
    const TypeStore& ts = ns.types;
    TypeId address_ref = ts.ref(ts.address());

    ExprRef key_field = make_expr(
        kCodegenSpan, ts.ref(address_ref),
        Expression::StructMember{.expr = std::move(account_info), .member = 0});

    return make_expr(kCodegenSpan, address_ref,
                     Expression::Load{.expr = std::move(key_field)});
}

ExprRef account_meta_literal(const Namespace& ns, ExprRef address,
                             bool is_signer, bool is_writer) {
    const TypeStore& ts = ns.types;
    auto flag = [&](bool value) {
        return make_expr(kCodegenSpan, ts.bool_(),
                         Expression::BoolLiteral{.value = value});
    };
    return make_expr(
        kCodegenSpan, ts.struct_(StructKind::AccountMeta),
        Expression::StructLiteral{
            .values = {std::move(address), flag(is_writer), flag(is_signer)}});
}

bool manage_contract_accounts(Session& session, Namespace& ns,
                              ContractNo contract_no) {
    Contract& contract = ns.contracts.at(contract_no);
    bool ok = true;

    std::optional<FunctionNo> constructor_no{};
    for (FunctionNo function_no : contract.functions) {
        if (ns.functions[function_no].is_constructor())
            constructor_no = function_no;
        auto it = contract.all_functions.find(function_no);
        if (it == contract.all_functions.end()) continue;

        AccountRewriter rewriter(session, ns, function_no);
        ok &= rewriter.traverse(contract.cfgs[it->second]);
    }

    if (constructor_no) {
        ControlFlowGraph* dispatch = contract.find_cfg(kDispatchCfgName);
        if (!dispatch) {
            session.error(contract.span, "internal error: contract `" +
                                             contract.name +
                                             "` has no dispatch function");
            return false;
        }
        AccountRewriter rewriter(session, ns, *constructor_no);
        ok &= rewriter.traverse(*dispatch);
    }
    return ok;
}

bool run_account_management(Session& session, Namespace& ns) {
    if (!is_account_based(ns.target)) return true;
    bool ok = true;
    for (ContractNo c = 0; c < ns.contracts.size(); c++) {
        ok &= manage_contract_accounts(session, ns, c);
    }
    return ok;
}

}  // namespace keel
