#include <llvm/IR/Constants.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/Module.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "account_management.hpp"
#include "binary.hpp"
#include "builtins.hpp"
#include "cfg_text.hpp"
#include "emit.hpp"
#include "runtime.hpp"
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

static void dump_errors_(const keel::Session& s) {
    for (const keel::Diagnostic& d : s.diags)
        std::cerr << "    " << keel::format_diagnostic(s.sources, d) << "\n";
}

static const llvm::CallInst* call_to_(const llvm::Instruction& i,
                                     llvm::StringRef callee) {
    const auto* call = llvm::dyn_cast<llvm::CallInst>(&i);
    if (!call) return nullptr;
    const llvm::Function* f = call->getCalledFunction();
    if (!f || f->getName() != callee) return nullptr;
    return call;
}

static bool const_arg_(const llvm::CallInst* call, unsigned arg,
                       std::uint64_t value) {
    const auto* c = llvm::dyn_cast<llvm::ConstantInt>(call->getArgOperand(arg));
    return c && c->getZExtValue() == value;
}

static bool calls_(const llvm::Function* f, llvm::StringRef callee) {
    if (!f) return false;
    for (const llvm::BasicBlock& bb : *f) {
        for (const llvm::Instruction& i : bb) {
            if (call_to_(i, callee)) return true;
        }
    }
    return false;
}

// True if some block holds an instruction matching `first` followed by one
// matching `second`.
template <typename First, typename Second>
static bool in_order_(const llvm::Function* f, First first, Second second) {
    if (!f) return false;
    for (const llvm::BasicBlock& bb : *f) {
        bool seen = false;
        for (const llvm::Instruction& i : bb) {
            if (seen && second(i)) return true;
            if (first(i)) seen = true;
        }
    }
    return false;
}

// The failure block of a runtime check named `check` is the false edge of a
// conditional branch. `host`, if given, must be called there.
static bool fails_to_(const llvm::Function* f, llvm::StringRef check,
                      llvm::StringRef host = {}) {
    if (!f) return false;
    std::string prefix = (check + ".fail").str();
    for (const llvm::BasicBlock& bb : *f) {
        for (const llvm::Instruction& i : bb) {
            const auto* br = llvm::dyn_cast<llvm::BranchInst>(&i);
            if (!br || !br->isConditional()) continue;
            const llvm::BasicBlock* fail = br->getSuccessor(1);
            if (!fail->getName().startswith(prefix)) continue;
            if (host.empty()) return true;
            for (const llvm::Instruction& j : *fail) {
                if (call_to_(j, host)) return true;
            }
        }
    }
    return false;
}

static const keel::TargetKind kAllTargets[] = {
    keel::TargetKind::Solana,
    keel::TargetKind::Polkadot,
    keel::TargetKind::Soroban,
    keel::TargetKind::Stylus,
};

static const char* kCounter =
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
    "function bump\n"
    "  param by: uint64\n"
    "  var 0 x: uint64\n"
    "  block entry\n"
    "    set 0 (add (storage-load uint64 (num storage(uint64) 0)) (arg 0))\n"
    "    cond (gt (var 0) (num uint64 100)) big small\n"
    "  block big\n"
    "    assert-failure\n"
    "  block small\n"
    "    set-storage uint64 (num storage(uint64) 0) (var 0)\n"
    "    clear-storage uint64 (num storage(uint64) 1)\n"
    "    return\n"
    "dispatch\n"
    "  block entry\n"
    "    return-code success\n";

struct Emitted {
    keel::Session session{};
    std::optional<keel::Namespace> ns{};
    std::unique_ptr<keel::Binary> bin{};
};

// The namespace must outlive the binary that refers to it.
static std::unique_ptr<Emitted> emit_(const std::string& text,
                                      keel::TargetKind target,
                                      std::string_view contract) {
    auto out = std::make_unique<Emitted>();
    out->ns = keel::read_module_text(out->session, "emit.kir", text, target);
    if (!out->ns) return out;
    if (!keel::run_account_management(out->session, *out->ns)) return out;
    auto c = out->ns->find_contract(contract);
    if (!c) return out;
    out->bin = keel::emit_contract(out->session, *out->ns, *c,
                                   keel::make_target_spec(target));
    return out;
}

static bool test_counter_verifies_on_every_target() {
    bool ok = true;
    for (keel::TargetKind target : kAllTargets) {
        auto e = emit_(kCounter, target, "Counter");
        std::string name(keel::target_name(target));
        bool emitted = e->bin != nullptr;
        if (!emitted) dump_errors_(e->session);
        ok &= require_(emitted, ("counter must emit on " + name).c_str());
        if (!emitted) continue;

        llvm::Module& m = *e->bin->module;
        ok &= require_(m.getFunction("get") && m.getFunction("bump") &&
                           m.getFunction("new"),
                       ("every function is lowered on " + name).c_str());

        llvm::Function* get = m.getFunction("get");
        if (get) {
            unsigned expected_args = target == keel::TargetKind::Solana ? 2 : 1;
            ok &= require_(get->arg_size() == expected_args,
                           ("`get` returns through an out-parameter on " + name)
                               .c_str());
        }

        switch (target) {
            case keel::TargetKind::Solana:
                ok &= require_(m.getFunction("entrypoint") != nullptr,
                               "solana exports `entrypoint`");
                ok &= require_(get && get->getReturnType()->isIntegerTy(64),
                               "solana functions return a 64-bit code");
                break;
            case keel::TargetKind::Polkadot:
                ok &= require_(m.getFunction("deploy") && m.getFunction("call"),
                               "polkadot exports `deploy` and `call`");
                ok &= require_(m.getFunction("seal_get_storage") &&
                                   m.getFunction("seal_set_storage"),
                               "polkadot storage goes through seal0");
                break;
            case keel::TargetKind::Soroban:
                ok &= require_(get && get->hasFnAttribute("wasm-export-name"),
                               "soroban exports functions by name");
                ok &= require_(m.getFunction("put_contract_data") &&
                                   m.getFunction("get_contract_data"),
                               "soroban storage goes through contract data");
                break;
            case keel::TargetKind::Stylus:
                ok &= require_(m.getFunction("user_entrypoint") != nullptr,
                               "stylus exports `user_entrypoint`");
                ok &= require_(m.getFunction("storage_load_bytes32") &&
                                   m.getFunction("storage_cache_bytes32"),
                               "stylus storage goes through the host cache");
                break;
        }
    }
    return ok;
}

static bool test_keccak_uses_host_hash() {
    const char* text =
        "contract H\n"
        "function digest\n"
        "  returns bytes32\n"
        "  var 0 h: bytes32\n"
        "  block entry\n"
        "    set 0 (builtin keccak256 (bytes bytes 0x616263))\n"
        "    return (var 0)\n"
        "dispatch\n"
        "  block entry\n"
        "    return-code success\n";

    struct Expect {
        keel::TargetKind target;
        const char* host;
    };
    const Expect expects[] = {
        {keel::TargetKind::Solana, "sol_keccak256"},
        {keel::TargetKind::Polkadot, "seal_hash_keccak_256"},
        {keel::TargetKind::Soroban, "compute_hash_keccak256"},
        {keel::TargetKind::Stylus, "native_keccak256"},
    };

    bool ok = true;
    for (const Expect& x : expects) {
        auto e = emit_(text, x.target, "H");
        if (!e->bin) dump_errors_(e->session);
        ok &= require_(e->bin != nullptr, "hash module must emit");
        if (!e->bin) continue;
        ok &= require_(e->bin->module->getFunction(x.host) != nullptr,
                       (std::string("keccak256 calls ") + x.host).c_str());
    }
    return ok;
}

static bool test_struct_storage_needs_slot_storage() {
    const char* text =
        "struct Pair { a: uint64, b: bool }\n"
        "contract S\n"
        "function put\n"
        "  block entry\n"
        "    set-storage Pair (num storage(Pair) 0) (struct Pair (num uint64 1) (bool true))\n"
        "    return\n"
        "dispatch\n"
        "  block entry\n"
        "    return-code success\n";

    bool ok = true;
    auto polkadot = emit_(text, keel::TargetKind::Polkadot, "S");
    if (!polkadot->bin) dump_errors_(polkadot->session);
    ok &= require_(polkadot->bin != nullptr,
                   "slot storage places a struct field by field");

    auto stylus = emit_(text, keel::TargetKind::Stylus, "S");
    ok &= require_(stylus->bin == nullptr, "stylus cannot place a struct");
    ok &= require_(has_error_(stylus->session,
                              "is not supported on target `stylus`"),
                   "stylus must report the unsupported store");
    return ok;
}

static bool test_unsupported_operation_yields_no_binary() {
    const char* text =
        "contract T\n"
        "function pay\n"
        "  param to: address\n"
        "  block entry\n"
        "    transfer address=(arg 0) value=(num uint128 1)\n"
        "    return\n"
        "dispatch\n"
        "  block entry\n"
        "    return-code success\n";

    bool ok = true;
    auto e = emit_(text, keel::TargetKind::Soroban, "T");
    ok &= require_(e->ns.has_value(), "module must read without errors");
    ok &= require_(e->bin == nullptr, "no binary for an unsupported operation");
    ok &= require_(has_error_(e->session,
                              "`value transfer` is not supported on target "
                              "`soroban`"),
                   "diagnostic must name the operation and target");
    return ok;
}

// Dynamic array at slot 0, mapping at slot 1, struct at slot 2.
static const char* kBook =
    "struct Entry { owner: address, amount: uint64 }\n"
    "contract Book\n"
    "function append\n"
    "  param v: uint64\n"
    "  var 0 x: uint64\n"
    "  block entry\n"
    "    push-storage 0 storage(uint64[]) (num storage(uint64[]) 0) (arg 0)\n"
    "    return\n"
    "function take\n"
    "  returns uint64\n"
    "  var 0 x: uint64\n"
    "  block entry\n"
    "    pop-storage storage(uint64[]) (num storage(uint64[]) 0) res=0\n"
    "    return (var 0)\n"
    "function discard\n"
    "  block entry\n"
    "    pop-storage storage(uint64[]) (num storage(uint64[]) 0)\n"
    "    return\n"
    "function item\n"
    "  param i: uint32\n"
    "  returns uint64\n"
    "  var 0 x: uint64\n"
    "  block entry\n"
    "    set 0 (storage-load uint64 (subscript storage(uint64) storage(uint64[]) (num storage(uint64[]) 0) (arg 0)))\n"
    "    return (var 0)\n"
    "function count\n"
    "  returns uint32\n"
    "  var 0 n: uint32\n"
    "  block entry\n"
    "    set 0 (storage-length storage(uint64[]) (num storage(uint64[]) 0))\n"
    "    return (var 0)\n"
    "function snapshot\n"
    "  var 0 all: uint64[]\n"
    "  block entry\n"
    "    set 0 (storage-load uint64[] (num storage(uint64[]) 0))\n"
    "    return\n"
    "function replace\n"
    "  param all: uint64[]\n"
    "  block entry\n"
    "    set-storage uint64[] (num storage(uint64[]) 0) (arg 0)\n"
    "    return\n"
    "function wipe\n"
    "  block entry\n"
    "    clear-storage uint64[] (num storage(uint64[]) 0)\n"
    "    return\n"
    "function amount\n"
    "  returns uint64\n"
    "  var 0 x: uint64\n"
    "  block entry\n"
    "    set 0 (storage-load uint64 (member storage(uint64) (num storage(Entry) 2) 1))\n"
    "    return (var 0)\n"
    "%MAPPING%"
    "dispatch\n"
    "  block entry\n"
    "    return-code success\n";

static const char* kBalance =
    "function balance\n"
    "  param who: address\n"
    "  returns uint64\n"
    "  var 0 x: uint64\n"
    "  block entry\n"
    "    set 0 (storage-load uint64 (subscript storage(uint64) storage(mapping(address,uint64)) (num storage(mapping(address,uint64)) 1) (arg 0)))\n"
    "    return (var 0)\n";

static std::string book_(bool with_mapping) {
    std::string text = kBook;
    std::string marker = "%MAPPING%";
    text.replace(text.find(marker), marker.size(),
                 with_mapping ? kBalance : "");
    return text;
}

static bool test_polkadot_dynamic_array_storage() {
    auto e = emit_(book_(true), keel::TargetKind::Polkadot, "Book");
    if (!e->bin) dump_errors_(e->session);
    if (!require_(e->bin != nullptr, "array and mapping storage must emit"))
        return false;

    bool ok = true;
    llvm::Module& m = *e->bin->module;
    const llvm::Function* append = m.getFunction("append");
    const llvm::Function* take = m.getFunction("take");
    const llvm::Function* discard = m.getFunction("discard");

    // The element (8 bytes) is written before the length word (4 bytes).
    ok &= require_(
        in_order_(append,
                  [](const llvm::Instruction& i) {
                      auto* c = call_to_(i, "seal_set_storage");
                      return c && const_arg_(c, 3, 8);
                  },
                  [](const llvm::Instruction& i) {
                      auto* c = call_to_(i, "seal_set_storage");
                      return c && const_arg_(c, 3, 4);
                  }),
        "push stores the element before the new length");
    ok &= require_(
        !in_order_(append,
                   [](const llvm::Instruction& i) {
                       auto* c = call_to_(i, "seal_set_storage");
                       return c && const_arg_(c, 3, 4);
                   },
                   [](const llvm::Instruction& i) {
                       auto* c = call_to_(i, "seal_set_storage");
                       return c && const_arg_(c, 3, 8);
                   }),
        "push never writes the element after the length");
    ok &= require_(calls_(append, "seal_hash_keccak_256"),
                   "elements live at keccak256(slot)");

    for (const llvm::Function* pop : {take, discard}) {
        ok &= require_(in_order_(pop,
                                 [](const llvm::Instruction& i) {
                                     return call_to_(i, "seal_clear_storage") !=
                                            nullptr;
                                 },
                                 [](const llvm::Instruction& i) {
                                     return call_to_(i, "seal_set_storage") !=
                                            nullptr;
                                 }),
                       "pop clears the element before the new length");
        ok &= require_(fails_to_(pop, "pop_empty", "seal_return"),
                       "pop of an empty array fails the call");
    }

    ok &= require_(fails_to_(m.getFunction("item"), "bounds", "seal_return"),
                   "out-of-bounds subscript fails the call");
    ok &= require_(calls_(m.getFunction("count"), "seal_get_storage"),
                   "length is read from the base slot");
    ok &= require_(calls_(m.getFunction("snapshot"), "seal_get_storage"),
                   "whole array load reads storage");
    ok &= require_(calls_(m.getFunction("replace"), "seal_clear_storage"),
                   "overwriting releases the tail of a longer array");
    ok &= require_(calls_(m.getFunction("wipe"), "seal_clear_storage"),
                   "delete clears the array");
    ok &= require_(calls_(m.getFunction("balance"), "seal_hash_keccak_256"),
                   "mapping entries live at hash(key, slot)");
    ok &= require_(calls_(m.getFunction("amount"), "seal_get_storage"),
                   "struct member is read from its field slot");
    return ok;
}

// `put_contract_data` of a host bytes object built with the tagged length
// `len`.
static bool puts_bytes_(const llvm::Instruction& i, std::uint64_t len) {
    const llvm::CallInst* put = call_to_(i, "put_contract_data");
    if (!put) return false;
    const auto* obj = llvm::dyn_cast<llvm::Instruction>(put->getArgOperand(1));
    if (!obj) return false;
    const llvm::CallInst* bytes = call_to_(*obj, "bytes_new_from_linear_memory");
    return bytes && const_arg_(bytes, 1, len);
}

static bool test_soroban_dynamic_array_storage() {
    auto e = emit_(book_(true), keel::TargetKind::Soroban, "Book");
    if (!e->bin) dump_errors_(e->session);
    if (!require_(e->bin != nullptr, "array and mapping storage must emit"))
        return false;

    // Byte lengths travel as tagged u32 host values.
    constexpr std::uint64_t kElem = (std::uint64_t{8} << 32) | 4;
    constexpr std::uint64_t kLen = (std::uint64_t{4} << 32) | 4;

    bool ok = true;
    llvm::Module& m = *e->bin->module;
    const llvm::Function* append = m.getFunction("append");
    ok &= require_(in_order_(append,
                             [&](const llvm::Instruction& i) {
                                 return puts_bytes_(i, kElem);
                             },
                             [&](const llvm::Instruction& i) {
                                 return puts_bytes_(i, kLen);
                             }),
        "push stores the element before the new length");
    ok &= require_(calls_(append, "put_contract_data"),
                   "push writes contract data");

    for (const char* name : {"take", "discard"}) {
        const llvm::Function* pop = m.getFunction(name);
        ok &= require_(in_order_(pop,
                                 [](const llvm::Instruction& i) {
                                     return call_to_(i, "del_contract_data") !=
                                            nullptr;
                                 },
                                 [](const llvm::Instruction& i) {
                                     return call_to_(i, "put_contract_data") !=
                                            nullptr;
                                 }),
                       "pop clears the element before the new length");
        ok &= require_(fails_to_(pop, "pop_empty", "fail_with_error"),
                       "pop of an empty array fails the call");
    }

    ok &= require_(fails_to_(m.getFunction("item"), "bounds", "fail_with_error"),
                   "out-of-bounds subscript fails the call");
    ok &= require_(calls_(m.getFunction("balance"), "compute_hash_sha256"),
                   "mapping entries live at the target hash of key and slot");
    ok &= require_(calls_(m.getFunction("wipe"), "del_contract_data"),
                   "delete clears the array");
    return ok;
}

static bool test_solana_dynamic_array_storage() {
    auto e = emit_(book_(false), keel::TargetKind::Solana, "Book");
    if (!e->bin) dump_errors_(e->session);
    if (!require_(e->bin != nullptr, "array storage must emit on solana"))
        return false;

    bool ok = true;
    llvm::Module& m = *e->bin->module;
    ok &= require_(calls_(m.getFunction("append"), "account_data_realloc"),
                   "push grows the heap allocation");

    // Clearing a uint64 element is a zero store into account data.
    ok &= require_(
        in_order_(m.getFunction("discard"),
                  [](const llvm::Instruction& i) {
                      const auto* st = llvm::dyn_cast<llvm::StoreInst>(&i);
                      if (!st) return false;
                      const auto* c =
                          llvm::dyn_cast<llvm::ConstantInt>(st->getValueOperand());
                      return c && c->isZero() && c->getBitWidth() == 64;
                  },
                  [](const llvm::Instruction& i) {
                      return call_to_(i, "account_data_realloc") != nullptr;
                  }),
        "pop clears the element before shrinking the allocation");
    ok &= require_(fails_to_(m.getFunction("discard"), "pop_empty"),
                   "pop of an empty array fails the call");
    ok &= require_(fails_to_(m.getFunction("item"), "bounds"),
                   "out-of-bounds subscript fails the call");
    ok &= require_(calls_(m.getFunction("count"), "account_data_len"),
                   "length comes from the allocation size");
    ok &= require_(calls_(m.getFunction("wipe"), "account_data_free"),
                   "delete frees the allocation");

    auto mapping = emit_(book_(true), keel::TargetKind::Solana, "Book");
    ok &= require_(mapping->bin == nullptr, "solana has no mapping storage");
    ok &= require_(has_error_(mapping->session,
                              "is not supported on target `solana`"),
                   "mapping subscript must be reported");
    return ok;
}

static bool test_stylus_rejects_composite_storage_access() {
    struct Op {
        const char* body;
        const char* message;
    };
    const Op ops[] = {
        {"    set 0 (storage-load uint64 (subscript storage(uint64) storage(uint64[]) (num storage(uint64[]) 0) (num uint32 0)))\n",
         "`storage subscript` is not supported on target `stylus`"},
        {"    push-storage 0 storage(uint64[]) (num storage(uint64[]) 0) (num uint64 1)\n",
         "`storage push` is not supported on target `stylus`"},
        {"    pop-storage storage(uint64[]) (num storage(uint64[]) 0)\n",
         "`storage pop` is not supported on target `stylus`"},
        {"    set 1 (storage-length storage(uint64[]) (num storage(uint64[]) 0))\n",
         "`storage array length` is not supported on target `stylus`"},
    };

    bool ok = true;
    for (const Op& op : ops) {
        std::string text = std::string(
                               "contract W\n"
                               "function f\n"
                               "  var 0 x: uint64\n"
                               "  var 1 n: uint32\n"
                               "  block entry\n") +
                           op.body +
                           "    return\n"
                           "dispatch\n"
                           "  block entry\n"
                           "    return-code success\n";
        auto e = emit_(text, keel::TargetKind::Stylus, "W");
        ok &= require_(e->ns.has_value(), "module must read without errors");
        ok &= require_(e->bin == nullptr, "no binary for composite storage");
        ok &= require_(has_error_(e->session, op.message), op.message);
    }
    return ok;
}

static std::string factory_(const std::string& program_id) {
    return "contract C program_id=" + program_id +
           "\n"
           "function new constructor\n"
           "  accounts dataAccount(signer,writer) systemProgram\n"
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
           "  accounts payer(signer,writer)\n"
           "  param target: address\n"
           "  var 0 child: address\n"
           "  block entry\n"
           "    constructor res=0 contract=C address=(arg 0)\n"
           "    return\n"
           "dispatch\n"
           "  block entry\n"
           "    return-code success\n";
}

static bool test_solana_creation_invokes_program() {
    auto e = emit_(factory_("0x" + std::string(64, '7')),
                   keel::TargetKind::Solana, "F");
    if (!e->bin) dump_errors_(e->session);

    bool ok = true;
    ok &= require_(e->bin != nullptr, "factory must emit on solana");
    if (!e->bin) return false;
    llvm::Module& m = *e->bin->module;
    ok &= require_(m.getFunction("sol_invoke_signed_c") != nullptr,
                   "creation goes through sol_invoke_signed_c");
    ok &= require_(m.getNamedGlobal("C.program_id") != nullptr,
                   "callee program id is emitted as a constant");
    ok &= require_(m.getFunction("entrypoint") != nullptr,
                   "solana exports `entrypoint`");
    return ok;
}

static bool test_solana_account_access_needs_the_pass() {
    const char* text =
        "contract A\n"
        "function peek\n"
        "  accounts payer(signer)\n"
        "  var 0 a: ref(AccountInfo)\n"
        "  block entry\n"
        "    account 0 payer\n"
        "    return\n"
        "dispatch\n"
        "  block entry\n"
        "    return-code success\n";

    bool ok = true;
    keel::Session s{};
    auto ns = keel::read_module_text(s, "a.kir", text, keel::TargetKind::Solana);
    ok &= require_(ns.has_value(), "module must read without errors");
    if (!ns) return false;

    auto bin = keel::emit_contract(s, *ns, 0,
                                   keel::make_target_spec(keel::TargetKind::Solana));
    ok &= require_(bin == nullptr, "raw account access must not be emitted");
    ok &= require_(has_error_(s, "account `payer` was not resolved"),
                   "emission must name the unresolved account");

    auto e = emit_(text, keel::TargetKind::Solana, "A");
    if (!e->bin) dump_errors_(e->session);
    ok &= require_(e->bin != nullptr, "after the pass the module emits");
    return ok;
}

static bool test_failing_contract_writes_no_output() {
    const char* good =
        "contract Good\n"
        "function f\n"
        "  block entry\n"
        "    return\n"
        "dispatch\n"
        "  block entry\n"
        "    return-code success\n";
    const char* bad =
        "contract Bad\n"
        "function pay\n"
        "  param to: address\n"
        "  block entry\n"
        "    transfer address=(arg 0) value=(num uint128 1)\n"
        "    return\n"
        "dispatch\n"
        "  block entry\n"
        "    return-code success\n";

    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path();
    fs::path out = dir / "keel_emit_module.ll";
    fs::path good_out = dir / "keel_emit_module.Good.ll";
    fs::path bad_out = dir / "keel_emit_module.Bad.ll";
    std::error_code ec{};
    for (const fs::path& p : {out, good_out, bad_out}) fs::remove(p, ec);

    keel::EmitOptions opts{.out_ll = out};
    keel::TargetSpec spec = keel::make_target_spec(keel::TargetKind::Soroban);

    bool ok = true;
    {
        keel::Session s{};
        auto ns = keel::read_module_text(s, "m.kir", std::string(good) + bad,
                                         keel::TargetKind::Soroban);
        ok &= require_(ns.has_value(), "module must read without errors");
        if (!ns) return false;
        ok &= require_(!keel::emit_module(s, *ns, spec, opts),
                       "second contract fails emission");
        ok &= require_(has_error_(s, "`value transfer` is not supported"),
                       "failure is reported");
        ok &= require_(!fs::exists(good_out) && !fs::exists(bad_out) &&
                           !fs::exists(out),
                       "no output is written for a module with errors");
    }
    {
        keel::Session s{};
        auto ns = keel::read_module_text(
            s, "m.kir", std::string(good) + "\n" + kCounter,
            keel::TargetKind::Soroban);
        ok &= require_(ns.has_value(), "module must read without errors");
        if (!ns) return false;
        bool written = keel::emit_module(s, *ns, spec, opts);
        if (!written) dump_errors_(s);
        ok &= require_(written, "a clean module is written");
        ok &= require_(fs::exists(good_out) &&
                           fs::exists(dir / "keel_emit_module.Counter.ll"),
                       "one file per contract");
        fs::remove(good_out, ec);
        fs::remove(dir / "keel_emit_module.Counter.ll", ec);
    }
    return ok;
}

static bool test_hash_kinds_match_hash_builtins() {
    bool ok = true;
    for (const keel::Prototype& p : keel::builtin_prototypes()) {
        bool hashed = keel::hash_ty_of(p.builtin).has_value();
        ok &= require_(hashed == keel::is_hash_builtin(p.builtin),
                       ("hash lowering of " + p.qualified_name()).c_str());
    }
    ok &= require_(keel::hash_ty_of(keel::BuiltinKind::Keccak256) ==
                       keel::HashTy::Keccak256,
                   "keccak256 lowers to keccak");
    ok &= require_(!keel::hash_ty_of(keel::BuiltinKind::Timestamp),
                   "block.timestamp is not a hash");
    return ok;
}

static bool test_builtin_registry_per_target() {
    bool ok = true;
    ok &= require_(keel::find_builtin("tx.accounts", keel::TargetKind::Solana),
                   "tx.accounts exists on solana");
    ok &= require_(!keel::find_builtin("tx.accounts", keel::TargetKind::Stylus),
                   "tx.accounts does not exist on stylus");
    ok &= require_(keel::find_builtin("tx.origin", keel::TargetKind::Stylus),
                   "tx.origin exists on stylus");
    ok &= require_(!keel::find_builtin("tx.origin", keel::TargetKind::Polkadot),
                   "tx.origin does not exist on polkadot");
    ok &= require_(keel::find_builtin("ripemd160", keel::TargetKind::Polkadot),
                   "ripemd160 exists on polkadot");
    ok &= require_(!keel::find_builtin("ripemd160", keel::TargetKind::Soroban),
                   "ripemd160 does not exist on soroban");

    for (keel::TargetKind target : kAllTargets) {
        ok &= require_(keel::find_builtin("keccak256", target) != nullptr,
                       "keccak256 exists everywhere");
        ok &= require_(keel::find_builtin("block.timestamp", target) != nullptr,
                       "block.timestamp exists everywhere");
    }

    const keel::Prototype& accounts =
        keel::get_prototype(keel::BuiltinKind::Accounts);
    ok &= require_(accounts.qualified_name() == "tx.accounts",
                   "prototype qualified name");
    ok &= require_(accounts.ret == "slice(AccountInfo)",
                   "tx.accounts is a slice of AccountInfo");
    return ok;
}

}  // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"counter_verifies_on_every_target",
         test_counter_verifies_on_every_target},
        {"keccak_uses_host_hash", test_keccak_uses_host_hash},
        {"struct_storage_needs_slot_storage",
         test_struct_storage_needs_slot_storage},
        {"unsupported_operation_yields_no_binary",
         test_unsupported_operation_yields_no_binary},
        {"solana_creation_invokes_program", test_solana_creation_invokes_program},
        {"solana_account_access_needs_the_pass",
         test_solana_account_access_needs_the_pass},
        {"polkadot_dynamic_array_storage",
         test_polkadot_dynamic_array_storage},
        {"soroban_dynamic_array_storage", test_soroban_dynamic_array_storage},
        {"solana_dynamic_array_storage", test_solana_dynamic_array_storage},
        {"stylus_rejects_composite_storage_access",
         test_stylus_rejects_composite_storage_access},
        {"failing_contract_writes_no_output",
         test_failing_contract_writes_no_output},
        {"hash_kinds_match_hash_builtins", test_hash_kinds_match_hash_builtins},
        {"builtin_registry_per_target", test_builtin_registry_per_target},
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

    std::cout << "ALL EMIT TESTS PASSED\n";
    return 0;
}
