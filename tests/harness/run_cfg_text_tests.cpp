#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "cfg.hpp"
#include "cfg_text.hpp"
#include "sema.hpp"
#include "session.hpp"
#include "target.hpp"

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

static std::optional<std::uint32_t> error_line_(const keel::Session& s,
                                                std::string_view needle) {
    for (const keel::Diagnostic& d : s.diags) {
        if (d.message.find(needle) != std::string::npos)
            return d.span.begin.line;
    }
    return std::nullopt;
}

static std::string program_id_(char digit) {
    return "0x" + std::string(64, digit);
}

static const char* kCounter =
    "target polkadot\n"
    "\n"
    "struct Pair { a: uint64, b: bool }\n"
    "\n"
    "contract Counter\n"
    "function new constructor selector=0x0a0b0c0d\n"
    "  block entry\n"
    "    set-storage uint64 (num storage(uint64) 0) (num uint64 0)\n"
    "    return\n"
    "function get selector=0x01020304\n"
    "  returns uint64\n"
    "  var 0 x: uint64\n"
    "  block entry\n"
    "    set 0 (storage-load uint64 (num storage(uint64) 0))\n"
    "    return (var 0)\n"
    "function bump  # increments by the argument\n"
    "  param by: uint64\n"
    "  var 0 x: uint64\n"
    "  block entry\n"
    "    set 0 (add (storage-load uint64 (num storage(uint64) 0)) (arg 0))\n"
    "    cond (gt (var 0) (num uint64 100)) big small\n"
    "  block big\n"
    "    assert-failure\n"
    "  block small\n"
    "    set-storage uint64 (num storage(uint64) 0) (var 0)\n"
    "    return\n"
    "dispatch\n"
    "  block entry\n"
    "    return-code success\n";

static bool test_reads_contract_structure() {
    keel::Session s{};
    auto ns = keel::read_module_text(s, "counter.kir", kCounter, std::nullopt);

    bool ok = true;
    ok &= require_(ns.has_value(), "module must read without errors");
    if (!ns) return false;

    ok &= require_(ns->target == keel::TargetKind::Polkadot,
                   "target line must select polkadot");
    ok &= require_(ns->contracts.size() == 1, "one contract expected");
    const keel::Contract& c = ns->contracts[0];
    ok &= require_(c.name == "Counter", "contract name");
    ok &= require_(c.functions.size() == 3, "three functions expected");
    ok &= require_(c.cfgs.size() == 4, "three function CFGs plus dispatch");
    ok &= require_(!c.program_id.has_value(), "no program_id was given");

    auto ctor = ns->constructor_of(0);
    ok &= require_(ctor.has_value() && ns->functions[*ctor].name == "new",
                   "`new` must be the constructor");

    auto bump = ns->find_function(0, "bump");
    ok &= require_(bump.has_value(), "`bump` must be declared");
    if (bump) {
        const keel::Function& f = ns->functions[*bump];
        ok &= require_(f.params.size() == 1 && f.params[0].name == "by",
                       "`bump` takes one parameter `by`");
        ok &= require_(!f.selector.has_value(), "`bump` has no selector");
    }

    auto get = ns->find_function(0, "get");
    if (get) {
        const keel::Function& f = ns->functions[*get];
        ok &= require_(f.selector.has_value() && f.selector->size() == 4 &&
                           (*f.selector)[0] == 0x01 && (*f.selector)[3] == 0x04,
                       "selector bytes must be decoded in order");
        ok &= require_(f.returns.size() == 1, "`get` returns one value");
    }

    const keel::ControlFlowGraph* cfg = c.find_cfg("bump");
    ok &= require_(cfg != nullptr, "`bump` CFG must exist");
    if (cfg) {
        ok &= require_(cfg->blocks.size() == 3, "`bump` has three blocks");
        const auto& cond =
            std::get<keel::Instr::BranchCond>(cfg->blocks[0].instr[1].data);
        ok &= require_(cond.true_block == 1 && cond.false_block == 2,
                       "branch labels must resolve to block numbers");
    }

    const keel::ControlFlowGraph* dispatch =
        c.find_cfg(keel::dispatch_cfg_name(ns->target));
    ok &= require_(dispatch != nullptr && !dispatch->function_no,
                   "dispatch CFG has no function number");
    ok &= require_(ns->types.find_struct("Pair").has_value(),
                   "struct declaration must be registered");
    return ok;
}

static bool test_account_lists_keep_declaration_order() {
    std::string text =
        "target solana\n"
        "contract Vault program_id=" + program_id_('2') + "\n"
        "function new constructor\n"
        "  accounts dataAccount(signer,writer) payer(signer) systemProgram\n"
        "  block entry\n"
        "    return\n"
        "dispatch\n"
        "  block entry\n"
        "    return-code success\n";
    keel::Session s{};
    auto ns = keel::read_module_text(s, "vault.kir", text, std::nullopt);

    bool ok = true;
    ok &= require_(ns.has_value(), "module must read without errors");
    if (!ns) return false;

    const keel::Contract& c = ns->contracts[0];
    ok &= require_(c.program_id.has_value() && c.program_id->size() == 32 &&
                       (*c.program_id)[0] == 0x22,
                   "program_id must be decoded into 32 bytes");

    const keel::Function& f = ns->functions[0];
    ok &= require_(f.accounts.size() == 3, "three accounts expected");
    ok &= require_(keel::account_index(f.accounts, "dataAccount") == 0,
                   "dataAccount is first");
    ok &= require_(keel::account_index(f.accounts, "payer") == 1,
                   "payer is second");
    ok &= require_(keel::account_index(f.accounts, "systemProgram") == 2,
                   "systemProgram is third");
    ok &= require_(!keel::account_index(f.accounts, "missing").has_value(),
                   "unknown account has no index");

    auto data = f.accounts.find("dataAccount");
    ok &= require_(data != f.accounts.end() && data->second.is_signer &&
                       data->second.is_writer,
                   "dataAccount is signer and writer");
    auto payer = f.accounts.find("payer");
    ok &= require_(payer != f.accounts.end() && payer->second.is_signer &&
                       !payer->second.is_writer,
                   "payer is signer only");

    ok &= require_(c.find_cfg("solana_dispatch") != nullptr,
                   "solana dispatch CFG uses the fixed name");
    return ok;
}

static bool test_missing_target_is_reported() {
    keel::Session s{};
    auto ns = keel::read_module_text(s, "bare.kir",
                                     "contract A\n"
                                     "dispatch\n"
                                     "  block entry\n"
                                     "    return-code success\n",
                                     std::nullopt);
    bool ok = true;
    ok &= require_(!ns.has_value(), "module without a target must fail");
    ok &= require_(has_error_(s, "no `target` line"),
                   "missing target must be diagnosed");

    keel::Session s2{};
    auto ns2 = keel::read_module_text(s2, "bare.kir",
                                      "contract A\n"
                                      "dispatch\n"
                                      "  block entry\n"
                                      "    return-code success\n",
                                      keel::TargetKind::Soroban);
    ok &= require_(ns2.has_value() && ns2->target == keel::TargetKind::Soroban,
                   "requested target fills in a missing target line");
    return ok;
}

static bool test_target_conflict_is_reported() {
    keel::Session s{};
    auto ns = keel::read_module_text(s, "conflict.kir", kCounter,
                                     keel::TargetKind::Stylus);
    bool ok = true;
    ok &= require_(!ns.has_value(), "conflicting target must fail");
    ok &= require_(has_error_(s, "module targets `polkadot` but `stylus`"),
                   "conflict must name both targets");
    return ok;
}

static bool test_errors_carry_line_numbers() {
    keel::Session s{};
    auto ns = keel::read_module_text(s, "bad.kir",
                                     "target polkadot\n"
                                     "contract A\n"
                                     "function f\n"
                                     "  block entry\n"
                                     "    jump nowhere\n"
                                     "    branch missing\n"
                                     "dispatch\n"
                                     "  block entry\n"
                                     "    return-code success\n",
                                     std::nullopt);
    bool ok = true;
    ok &= require_(!ns.has_value(), "malformed module must fail");
    ok &= require_(error_line_(s, "unknown instruction `jump`") == 5u,
                   "unknown instruction reported on line 5");
    ok &= require_(error_line_(s, "unknown block `missing`") == 6u,
                   "unknown block reported on line 6");
    return ok;
}

static bool test_rejects_malformed_declarations() {
    bool ok = true;
    {
        keel::Session s{};
        auto ns = keel::read_module_text(
            s, "pid.kir", "target solana\ncontract A program_id=0x1234\n",
            std::nullopt);
        ok &= require_(!ns.has_value(), "short program_id must fail");
        ok &= require_(has_error_(s, "program_id must be 32 hex bytes"),
                       "program_id length must be diagnosed");
    }
    {
        keel::Session s{};
        auto ns = keel::read_module_text(s, "ctor.kir",
                                         "target polkadot\n"
                                         "contract A\n"
                                         "function a constructor\n"
                                         "  block entry\n"
                                         "    return\n"
                                         "function b constructor\n",
                                         std::nullopt);
        ok &= require_(!ns.has_value(), "second constructor must fail");
        ok &= require_(has_error_(s, "already has a constructor"),
                       "duplicate constructor must be diagnosed");
    }
    {
        keel::Session s{};
        auto ns = keel::read_module_text(s, "late.kir",
                                         "target polkadot\n"
                                         "contract A\n"
                                         "target solana\n",
                                         std::nullopt);
        ok &= require_(!ns.has_value(), "late target must fail");
        ok &= require_(has_error_(s, "must appear once, before any contract"),
                       "late target must be diagnosed");
    }
    {
        keel::Session s{};
        auto ns = keel::read_module_text(s, "flags.kir",
                                         "target solana\n"
                                         "contract A\n"
                                         "function f\n"
                                         "  accounts payer(owner)\n",
                                         std::nullopt);
        ok &= require_(!ns.has_value(), "unknown account flag must fail");
        ok &= require_(has_error_(s, "unknown account flag `owner`"),
                       "account flag must be diagnosed");
    }
    {
        keel::Session s{};
        auto ns = keel::read_module_text(s, "ctor.kir",
                                         "target polkadot\n"
                                         "contract A\n"
                                         "function f\n"
                                         "  var 0 a: address\n"
                                         "  block entry\n"
                                         "    constructor res=0 contract=B\n"
                                         "    return\n",
                                         std::nullopt);
        ok &= require_(!ns.has_value(), "unknown callee contract must fail");
        ok &= require_(has_error_(s, "unknown contract `B`"),
                       "callee contract must be diagnosed");
    }
    return ok;
}

static bool test_builtins_are_filtered_by_target() {
    const char* body =
        "contract A\n"
        "function f\n"
        "  var 0 who: address\n"
        "  block entry\n"
        "    set 0 (builtin msg.sender)\n"
        "    return\n";

    bool ok = true;
    keel::Session polkadot{};
    auto ns = keel::read_module_text(polkadot, "a.kir",
                                     std::string("target polkadot\n") + body,
                                     std::nullopt);
    ok &= require_(ns.has_value(), "msg.sender is available on polkadot");

    keel::Session solana{};
    auto ns2 = keel::read_module_text(solana, "a.kir",
                                      std::string("target solana\n") + body,
                                      std::nullopt);
    ok &= require_(!ns2.has_value(), "msg.sender is not available on solana");
    ok &= require_(
        has_error_(solana, "builtin `msg.sender` is not available on target "
                           "`solana`"),
        "unavailable builtin must name the target");
    return ok;
}

static bool test_dump_is_read_back_unchanged() {
    keel::Session s{};
    auto ns = keel::read_module_text(s, "counter.kir", kCounter, std::nullopt);
    if (!require_(ns.has_value(), "module must read without errors"))
        return false;

    std::ostringstream first{};
    keel::dump_module(first, *ns);

    keel::Session s2{};
    auto again =
        keel::read_module_text(s2, "dumped.kir", first.str(), std::nullopt);
    if (!require_(again.has_value(), "dumped module must read back"))
        return false;

    std::ostringstream second{};
    keel::dump_module(second, *again);
    return require_(first.str() == second.str(),
                    "dump of the re-read module must match");
}

}  // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"reads_contract_structure", test_reads_contract_structure},
        {"account_lists_keep_declaration_order",
         test_account_lists_keep_declaration_order},
        {"missing_target_is_reported", test_missing_target_is_reported},
        {"target_conflict_is_reported", test_target_conflict_is_reported},
        {"errors_carry_line_numbers", test_errors_carry_line_numbers},
        {"rejects_malformed_declarations", test_rejects_malformed_declarations},
        {"builtins_are_filtered_by_target", test_builtins_are_filtered_by_target},
        {"dump_is_read_back_unchanged", test_dump_is_read_back_unchanged},
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

    std::cout << "ALL CFG TEXT TESTS PASSED\n";
    return 0;
}
