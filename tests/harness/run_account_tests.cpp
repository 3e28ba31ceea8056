#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

#include "account_management.hpp"
#include "cfg.hpp"
#include "cfg_text.hpp"
#include "sema.hpp"
#include "session.hpp"

namespace {

static bool require_(bool cond, const char* msg) {
    if (cond) return true;
    std::cerr << "  - " << msg << "\n";
    return false;
}

static bool has_error_(const keel::Session& s, std::string_view needle) {
    for (const keel::Diagnostic& d : s.diags) {
        if (d.message.find(needle) != std::string::npos) return true;
    }
    return false;
}

// C deploys into the address it is handed; F creates a C and reads its own
// accounts.
static const char* kFactory =
    "target solana\n"
    "\n"
    "contract C\n"
    "function new constructor\n"
    "  accounts dataAccount(signer,writer) vault(writer) systemProgram(signer,writer)\n"
    "  block entry\n"
    "    return\n"
    "dispatch\n"
    "  block entry\n"
    "    return-code success\n"
    "\n"
    "contract F\n"
    "function new constructor\n"
    "  accounts dataAccount(writer) payer(signer,writer)\n"
    "  block entry\n"
    "    return\n"
    "function build\n"
    "  accounts payer(signer,writer) vault(writer)\n"
    "  param target: address\n"
    "  var 0 child: address\n"
    "  var 1 info: ref(AccountInfo)\n"
    "  block entry\n"
    "    account 1 vault\n"
    "    constructor res=0 contract=C address=(arg 0)\n"
    "    return\n"
    "function later\n"
    "  param target: address\n"
    "  var 0 child: address\n"
    "  block entry\n"
    "    constructor res=0 contract=C callee=none address=(arg 0)\n"
    "    return\n"
    "dispatch\n"
    "  var 0 info: ref(AccountInfo)\n"
    "  block entry\n"
    "    account 0 payer\n"
    "    return-code success\n";

static std::optional<keel::Namespace> read_(keel::Session& s,
                                           const std::string& text) {
    return keel::read_module_text(s, "accounts.kir", text, std::nullopt);
}

static std::string dump_(const keel::Namespace& ns) {
    std::ostringstream os{};
    keel::dump_module(os, ns);
    return os.str();
}

static const keel::Instr& instr_(const keel::Namespace& ns,
                                 std::string_view contract,
                                 std::string_view cfg, size_t block,
                                 size_t index) {
    const keel::Contract& c = ns.contracts[*ns.find_contract(contract)];
    return c.find_cfg(cfg)->blocks[block].instr[index];
}

static bool flag_(const keel::ExprRef& meta, size_t field) {
    const auto& lit = std::get<keel::Expression::StructLiteral>(meta->data);
    return std::get<keel::Expression::BoolLiteral>(lit.values[field]->data)
        .value;
}

static const keel::ExprRef& meta_address_(const keel::ExprRef& meta) {
    return std::get<keel::Expression::StructLiteral>(meta->data).values[0];
}

// Index of `tx.accounts[i].key` or `tx.accounts[i]`.
static std::optional<std::uint64_t> accounts_index_(const keel::ExprRef& e) {
    const keel::Expression* cur = e.get();
    if (auto* load = std::get_if<keel::Expression::Load>(&cur->data)) {
        auto* member =
            std::get_if<keel::Expression::StructMember>(&load->expr->data);
        if (!member || member->member != 0) return std::nullopt;
        cur = member->expr.get();
    }
    auto* sub = std::get_if<keel::Expression::Subscript>(&cur->data);
    if (!sub) return std::nullopt;
    auto* base = std::get_if<keel::Expression::Builtin>(&sub->expr->data);
    if (!base || base->kind != keel::BuiltinKind::Accounts) return std::nullopt;
    auto* idx = std::get_if<keel::Expression::NumberLiteral>(&sub->index->data);
    if (!idx) return std::nullopt;
    return idx->value.getZExtValue();
}

// True for `&(arg n)`.
static bool refers_to_arg_(const keel::ExprRef& e, std::uint32_t n) {
    const auto* ref = std::get_if<keel::Expression::GetRef>(&e->data);
    if (!ref) return false;
    const auto* arg =
        std::get_if<keel::Expression::FunctionArg>(&ref->expr->data);
    return arg && arg->arg_no == n;
}

static bool test_constructor_accounts_are_synthesized() {
    keel::Session s{};
    auto ns = read_(s, kFactory);
    if (!require_(ns.has_value(), "module must read without errors"))
        return false;

    bool ok = true;
    ok &= require_(keel::run_account_management(s, *ns), "pass must succeed");
    ok &= require_(!s.has_errors(), "pass must not report errors");

    const auto& c =
        std::get<keel::Instr::Constructor>(instr_(*ns, "F", "build", 0, 1).data);
    ok &= require_(c.address == nullptr, "raw address operand must be cleared");
    ok &= require_(c.accounts != nullptr, "account list must be resolved");
    if (!c.accounts) return false;

    const auto* metas =
        std::get_if<keel::Expression::ArrayLiteral>(&c.accounts->data);
    ok &= require_(metas && metas->values.size() == 3,
                   "one AccountMeta per callee account");
    if (!metas || metas->values.size() != 3) return false;

    const keel::TypeStore& ts = ns->types;
    ok &= require_(ts.equal(c.accounts->ty,
                            ts.array(ts.struct_(keel::StructKind::AccountMeta),
                                     std::uint64_t{3})),
                   "account list is AccountMeta[3]");

    // dataAccount: the supplied address, with the callee's flags.
    const keel::ExprRef& data = metas->values[0];
    ok &= require_(refers_to_arg_(meta_address_(data), 0),
                   "dataAccount refers to the supplied address");
    ok &= require_(flag_(data, 1) && flag_(data, 2),
                   "dataAccount is writable and signer");

    // vault: the caller's own account, by position.
    const keel::ExprRef& vault = metas->values[1];
    ok &= require_(accounts_index_(meta_address_(vault)) == 1u,
                   "vault is read from tx.accounts[1].key");
    ok &= require_(flag_(vault, 1) && !flag_(vault, 2),
                   "vault is writable, not signer");

    // systemProgram: zero address, never signer or writer.
    const keel::ExprRef& system = metas->values[2];
    const auto* ref =
        std::get_if<keel::Expression::GetRef>(&meta_address_(system)->data);
    ok &= require_(ref != nullptr, "systemProgram is a reference");
    if (ref) {
        const auto* zero =
            std::get_if<keel::Expression::NumberLiteral>(&ref->expr->data);
        ok &= require_(zero && zero->value.isZero(),
                       "systemProgram refers to the zero address");
    }
    ok &= require_(!flag_(system, 1) && !flag_(system, 2),
                   "systemProgram flags are always cleared");
    return ok;
}

static bool test_constructor_accounts_follow_callee_order() {
    keel::Session s{};
    auto ns = read_(s,
                    "target solana\n"
                    "contract C\n"
                    "function new constructor\n"
                    "  accounts payer(signer) dataAccount vault(writer)\n"
                    "  block entry\n"
                    "    return\n"
                    "dispatch\n"
                    "  block entry\n"
                    "    return-code success\n"
                    "contract F\n"
                    "function new constructor\n"
                    "  accounts dataAccount(writer)\n"
                    "  block entry\n"
                    "    return\n"
                    "function build\n"
                    "  accounts vault(writer) extra payer(signer,writer)\n"
                    "  param target: address\n"
                    "  var 0 child: address\n"
                    "  block entry\n"
                    "    constructor res=0 contract=C address=(arg 0)\n"
                    "    return\n"
                    "dispatch\n"
                    "  block entry\n"
                    "    return-code success\n");
    if (!require_(ns.has_value(), "module must read without errors"))
        return false;

    bool ok = true;
    ok &= require_(keel::run_account_management(s, *ns), "pass must succeed");

    const auto& c =
        std::get<keel::Instr::Constructor>(instr_(*ns, "F", "build", 0, 0).data);
    if (!require_(c.accounts != nullptr, "account list must be resolved"))
        return false;
    const auto* metas =
        std::get_if<keel::Expression::ArrayLiteral>(&c.accounts->data);
    if (!require_(metas && metas->values.size() == 3,
                  "one AccountMeta per callee account"))
        return false;

    // Callee order, caller positions, callee flags.
    const keel::ExprRef& payer = metas->values[0];
    ok &= require_(accounts_index_(meta_address_(payer)) == 2u,
                   "payer is read from the caller's tx.accounts[2].key");
    ok &= require_(!flag_(payer, 1) && flag_(payer, 2),
                   "payer keeps the callee's signer-only flags");

    const keel::ExprRef& data = metas->values[1];
    ok &= require_(refers_to_arg_(meta_address_(data), 0),
                   "dataAccount is second and refers to the supplied address");
    ok &= require_(!flag_(data, 1) && !flag_(data, 2),
                   "dataAccount keeps the callee's empty flags");

    const keel::ExprRef& vault = metas->values[2];
    ok &= require_(accounts_index_(meta_address_(vault)) == 0u,
                   "vault is read from the caller's tx.accounts[0].key");
    ok &= require_(flag_(vault, 1) && !flag_(vault, 2),
                   "vault keeps the callee's writer flag");
    return ok;
}

static bool test_account_access_becomes_set() {
    keel::Session s{};
    auto ns = read_(s, kFactory);
    if (!require_(ns.has_value(), "module must read without errors"))
        return false;

    bool ok = true;
    ok &= require_(keel::run_account_management(s, *ns), "pass must succeed");

    const auto* set =
        std::get_if<keel::Instr::Set>(&instr_(*ns, "F", "build", 0, 0).data);
    ok &= require_(set != nullptr, "account access must become a Set");
    if (set) {
        ok &= require_(set->res == 1, "Set keeps the destination variable");
        ok &= require_(accounts_index_(set->expr) == 1u,
                       "vault is tx.accounts[1] in `build`");
    }

    // The dispatch function runs with the constructor's account list.
    const auto* dispatch_set = std::get_if<keel::Instr::Set>(
        &instr_(*ns, "F", "solana_dispatch", 0, 0).data);
    ok &= require_(dispatch_set != nullptr,
                   "dispatch account access must become a Set");
    if (dispatch_set) {
        ok &= require_(accounts_index_(dispatch_set->expr) == 1u,
                       "payer is tx.accounts[1] of the constructor");
    }
    return ok;
}

static bool test_pass_is_idempotent() {
    keel::Session s{};
    auto ns = read_(s, kFactory);
    if (!require_(ns.has_value(), "module must read without errors"))
        return false;

    bool ok = true;
    ok &= require_(keel::run_account_management(s, *ns), "first run");
    std::string once = dump_(*ns);
    ok &= require_(keel::run_account_management(s, *ns), "second run");
    ok &= require_(dump_(*ns) == once, "second run must not change the CFG");
    ok &= require_(!s.has_errors(), "no errors expected");
    return ok;
}

static bool test_unresolved_callee_is_untouched() {
    keel::Session s{};
    auto ns = read_(s, kFactory);
    if (!require_(ns.has_value(), "module must read without errors"))
        return false;

    bool ok = true;
    ok &= require_(keel::run_account_management(s, *ns), "pass must succeed");
    const auto& c =
        std::get<keel::Instr::Constructor>(instr_(*ns, "F", "later", 0, 0).data);
    ok &= require_(!c.constructor_no.has_value(), "callee stays unknown");
    ok &= require_(c.address != nullptr, "address operand is kept");
    ok &= require_(c.accounts == nullptr, "account list stays unresolved");
    return ok;
}

static bool test_loops_are_rewritten_once() {
    keel::Session s{};
    auto ns = read_(s,
                    "target solana\n"
                    "contract L\n"
                    "function new constructor\n"
                    "  accounts dataAccount(writer)\n"
                    "  block entry\n"
                    "    return\n"
                    "function spin\n"
                    "  accounts payer(signer) vault(writer)\n"
                    "  var 0 i: uint32\n"
                    "  var 1 a: ref(AccountInfo)\n"
                    "  var 2 b: ref(AccountInfo)\n"
                    "  block entry\n"
                    "    branch head\n"
                    "  block head\n"
                    "    cond (lt (var 0) (num uint32 3)) body done\n"
                    "  block body\n"
                    "    account 1 vault\n"
                    "    set 0 (add (var 0) (num uint32 1))\n"
                    "    branch head\n"
                    "  block done\n"
                    "    account 2 payer\n"
                    "    return\n"
                    "dispatch\n"
                    "  block entry\n"
                    "    return-code success\n");
    if (!require_(ns.has_value(), "module must read without errors"))
        return false;

    bool ok = true;
    ok &= require_(keel::run_account_management(s, *ns), "pass must succeed");

    const keel::ControlFlowGraph* cfg = ns->contracts[0].find_cfg("spin");
    size_t remaining = 0;
    for (const keel::BasicBlock& bb : cfg->blocks) {
        for (const keel::Instr& ins : bb.instr) {
            if (std::holds_alternative<keel::Instr::AccountAccess>(ins.data))
                remaining++;
        }
    }
    ok &= require_(remaining == 0, "every reachable account access is rewritten");

    const auto& body = std::get<keel::Instr::Set>(cfg->blocks[2].instr[0].data);
    ok &= require_(accounts_index_(body.expr) == 1u, "vault inside the loop");
    const auto& done = std::get<keel::Instr::Set>(cfg->blocks[3].instr[0].data);
    ok &= require_(accounts_index_(done.expr) == 0u, "payer after the loop");
    return ok;
}

static bool test_undeclared_account_fails() {
    keel::Session s{};
    auto ns = read_(s,
                    "target solana\n"
                    "contract U\n"
                    "function peek\n"
                    "  accounts payer(signer)\n"
                    "  var 0 a: ref(AccountInfo)\n"
                    "  block entry\n"
                    "    account 0 treasury\n"
                    "    return\n");
    if (!require_(ns.has_value(), "module must read without errors"))
        return false;

    bool ok = true;
    ok &= require_(!keel::run_account_management(s, *ns),
                   "unknown account must fail the pass");
    ok &= require_(has_error_(s, "account `treasury` is not declared by "
                                 "function `peek`"),
                   "diagnostic must name the account and function");
    return ok;
}

static bool test_non_account_targets_are_skipped() {
    keel::Session s{};
    auto ns = read_(s,
                    "target polkadot\n"
                    "contract P\n"
                    "function f\n"
                    "  var 0 a: ref(AccountInfo)\n"
                    "  block entry\n"
                    "    account 0 payer\n"
                    "    return\n");
    if (!require_(ns.has_value(), "module must read without errors"))
        return false;

    bool ok = true;
    std::string before = dump_(*ns);
    ok &= require_(keel::run_account_management(s, *ns),
                   "pass is a no-op on polkadot");
    ok &= require_(dump_(*ns) == before, "polkadot CFG must be unchanged");
    return ok;
}

}  // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"constructor_accounts_are_synthesized",
         test_constructor_accounts_are_synthesized},
        {"constructor_accounts_follow_callee_order",
         test_constructor_accounts_follow_callee_order},
        {"account_access_becomes_set", test_account_access_becomes_set},
        {"pass_is_idempotent", test_pass_is_idempotent},
        {"unresolved_callee_is_untouched", test_unresolved_callee_is_untouched},
        {"loops_are_rewritten_once", test_loops_are_rewritten_once},
        {"undeclared_account_fails", test_undeclared_account_fails},
        {"non_account_targets_are_skipped", test_non_account_targets_are_skipped},
    };

    int failed = 0;
    for (const auto& tc : cases) {
        std::cout << "[TEST] " << tc.name << "\n";
        const bool ok = tc.def();
        std::cout << (ok ? "  -> PASS\n" : "  -> FAIL\n");
        if (!ok) ++failed;
    }

    if (failed != 0) {
        std::cout << "FAILED: " << failed << " test(s)\n";
        return 1;
    }

    std::cout << "ALL ACCOUNT TESTS PASSED\n";
    return 0;
}
