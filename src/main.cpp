#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "account_management.hpp"
#include "builtins.hpp"
#include "cfg.hpp"
#include "cfg_text.hpp"
#include "diag.hpp"
#include "emit.hpp"
#include "sema.hpp"
#include "session.hpp"
#include "target.hpp"

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--target <solana|polkadot|soroban|stylus>] "
                 "[--emit-cfg <out.kir>] [--emit-cfg-after accounts <out.kir>] "
                 "[--emit-llvm <out.ll>] [--emit-bc <out.bc>] "
                 "[--emit-obj <out.o>] [--list-builtins] <module.kir>\n";
}

static void list_builtins(std::optional<keel::TargetKind> target) {
    for (const keel::Prototype& p : keel::builtin_prototypes()) {
        if (target && !p.available_on(*target)) continue;
        std::cout << p.qualified_name() << "(";
        for (size_t i = 0; i < p.params.size(); i++) {
            if (i) std::cout << ", ";
            std::cout << p.params[i];
        }
        std::cout << ") -> " << p.ret << "  # " << p.doc << "\n";
    }
}

static bool write_cfg(keel::Session& session, const keel::Namespace& ns,
                      std::string_view out, std::string_view flag) {
    std::ofstream os{std::string(out)};
    if (!os) {
        session.error(keel::kCodegenSpan,
                      "failed to open output file for " + std::string(flag));
        return false;
    }
    keel::dump_module(os, ns);
    return true;
}

static std::optional<std::filesystem::path> to_path(
    std::optional<std::string_view> out) {
    if (!out) return std::nullopt;
    return std::filesystem::path{std::string(*out)};
}

int main(int argc, char** argv) {
    bool show_builtins = false;
    std::optional<keel::TargetKind> target{};
    std::optional<std::string_view> emit_cfg{};
    std::optional<std::string_view> emit_cfg_after_pass{};
    std::optional<std::string_view> emit_cfg_after_out{};
    std::optional<std::string_view> emit_llvm{};
    std::optional<std::string_view> emit_bc{};
    std::optional<std::string_view> emit_obj{};
    const char* input_path = nullptr;

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "--list-builtins") {
            show_builtins = true;
            continue;
        }
        if (arg == "--target") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            target = keel::parse_target_kind(argv[++i]);
            if (!target) {
                std::cerr << argv[0] << ": unknown target `" << argv[i]
                          << "`\n";
                usage(argv[0]);
                return 2;
            }
            continue;
        }
        if (arg == "--emit-cfg") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            emit_cfg = std::string_view(argv[++i]);
            continue;
        }
        if (arg == "--emit-cfg-after") {
            if (i + 2 >= argc) {
                usage(argv[0]);
                return 2;
            }
            emit_cfg_after_pass = std::string_view(argv[++i]);
            emit_cfg_after_out = std::string_view(argv[++i]);
            continue;
        }
        if (arg == "--emit-llvm") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            emit_llvm = std::string_view(argv[++i]);
            continue;
        }
        if (arg == "--emit-bc") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            emit_bc = std::string_view(argv[++i]);
            continue;
        }
        if (arg == "--emit-obj") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            emit_obj = std::string_view(argv[++i]);
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            usage(argv[0]);
            return 2;
        }
        input_path = argv[i];
    }

    if (show_builtins) {
        list_builtins(target);
        if (!input_path) return 0;
    }
    if (!input_path) {
        usage(argv[0]);
        return 2;
    }

    keel::Session session{};
    keel::FileId file = session.add_file(input_path);

    std::optional<keel::Namespace> ns = keel::read_module(session, file, target);
    bool ok = ns.has_value() && !session.has_errors();

    if (ok && emit_cfg) ok = write_cfg(session, *ns, *emit_cfg, "--emit-cfg");

    if (ok) ok = keel::run_account_management(session, *ns);

    if (ok && emit_cfg_after_pass && emit_cfg_after_out) {
        if (*emit_cfg_after_pass != "accounts") {
            session.error(keel::kCodegenSpan,
                          "unsupported --emit-cfg-after pass `" +
                              std::string(*emit_cfg_after_pass) +
                              "` (supported: accounts)");
            ok = false;
        } else {
            ok = write_cfg(session, *ns, *emit_cfg_after_out,
                           "--emit-cfg-after");
        }
    }

    if (ok && (emit_llvm || emit_bc || emit_obj)) {
        std::optional<keel::TargetSpec> spec =
            keel::compute_target_spec(session, ns->target);
        keel::EmitOptions opts{
            .out_ll = to_path(emit_llvm),
            .out_bc = to_path(emit_bc),
            .out_obj = to_path(emit_obj),
        };
        ok = spec && keel::emit_module(session, *ns, *spec, opts);
    }

    if (!ok || session.has_errors()) {
        for (const auto& d : session.diags)
            std::cerr << keel::format_diagnostic(session.sources, d) << "\n";
        return 1;
    }
    return 0;
}
