#include "cfg_text.hpp"

#include <llvm/ADT/APInt.h>
#include <llvm/ADT/StringRef.h>

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "session.hpp"

namespace keel {
namespace {

static bool is_word_char(char c) {
    if (std::isspace(static_cast<unsigned char>(c))) return false;
    switch (c) {
        case '(':
        case ')':
        case '[':
        case ']':
        case '=':
        case ',':
        case ':':
        case '{':
        case '}':
        case '"':
            return false;
        default:
            return true;
    }
}

static bool parse_u64(std::string_view text, std::uint64_t& out) {
    if (text.empty()) return false;
    std::uint64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        std::uint64_t next = v * 10 + static_cast<std::uint64_t>(c - '0');
        if (next / 10 != v) return false;
        v = next;
    }
    out = v;
    return true;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool parse_hex_bytes(std::string_view text,
                            std::vector<std::uint8_t>& out) {
    if (text.size() < 2 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X'))
        return false;
    text.remove_prefix(2);
    if (text.size() % 2 != 0) return false;
    out.clear();
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return true;
}

// Cursor over one line of input.
class LineCursor {
   public:
    LineCursor(FileId file, std::uint32_t line, std::string_view text)
        : file_(file), line_(line), text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_])))
            pos_++;
    }

    bool at_end() {
        skip_ws();
        return pos_ >= text_.size();
    }

    char peek() {
        skip_ws();
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    // Peeks without skipping whitespace first.
    char peek_raw() const {
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    bool eat(char c) {
        if (peek() != c) return false;
        pos_++;
        return true;
    }

    std::string_view word() {
        skip_ws();
        size_t start = pos_;
        while (pos_ < text_.size() && is_word_char(text_[pos_])) pos_++;
        return text_.substr(start, pos_ - start);
    }

    // Reads a double-quoted string with \n, \t, \\ and \" escapes.
    bool quoted(std::string& out) {
        if (!eat('"')) return false;
        out.clear();
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return true;
            if (c == '\\' && pos_ < text_.size()) {
                char e = text_[pos_++];
                switch (e) {
                    case 'n':
                        out.push_back('\n');
                        break;
                    case 't':
                        out.push_back('\t');
                        break;
                    default:
                        out.push_back(e);
                        break;
                }
                continue;
            }
            out.push_back(c);
        }
        return false;
    }

    size_t pos() const { return pos_; }
    void reset(size_t pos) { pos_ = pos; }

    Span span_at(size_t pos, size_t len = 1) const {
        auto col = static_cast<std::uint32_t>(pos + 1);
        return Span{.file = file_,
                    .begin = SourceLoc{line_, col},
                    .end = SourceLoc{line_,
                                     col + static_cast<std::uint32_t>(len)}};
    }

    Span here() {
        skip_ws();
        return span_at(pos_);
    }

    std::uint32_t line() const { return line_; }

   private:
    FileId file_ = 0;
    std::uint32_t line_ = 1;
    std::string_view text_{};
    size_t pos_ = 0;
};

struct PendingBranch {
    BlockNo block = 0;
    size_t instr = 0;
    // 0 = Branch/true edge, 1 = false edge
    int which = 0;
    std::string label{};
    Span span{};
};

struct PendingConstructor {
    ContractNo contract = 0;
    size_t cfg = 0;
    BlockNo block = 0;
    size_t instr = 0;
    std::string contract_name{};
    bool callee_none = false;
    Span span{};
};

struct KeyValue {
    std::string key{};
    Span span{};
    ExprRef expr{};
    std::string word{};
};

class ModuleReader {
   public:
    ModuleReader(Session& session, FileId file,
                 std::optional<TargetKind> target)
        : session_(session), file_(file), cli_target_(target) {
        if (target) ns_.target = *target;
    }

    std::optional<Namespace> run(std::string_view text) {
        std::uint32_t line_no = 0;
        size_t start = 0;
        while (start <= text.size()) {
            size_t end = text.find('\n', start);
            if (end == std::string_view::npos) end = text.size();
            line_no++;
            std::string_view line = text.substr(start, end - start);
            size_t hash = line.find('#');
            if (hash != std::string_view::npos) line = line.substr(0, hash);
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            LineCursor cur(file_, line_no, line);
            if (!cur.at_end()) read_line(cur);
            if (end == text.size()) break;
            start = end + 1;
        }
        finish_cfg();
        resolve_constructors();

        if (!target_known_ && !cli_target_) {
            session_.error(Span{.file = file_},
                           "module has no `target` line and no target was "
                           "given");
        }
        if (session_.has_errors()) return std::nullopt;
        return std::move(ns_);
    }

   private:
    Session& session_;
    FileId file_ = 0;
    std::optional<TargetKind> cli_target_{};
    bool target_known_ = false;
    bool seen_contract_ = false;
    bool seen_struct_ = false;

    Namespace ns_{};
    std::optional<ContractNo> contract_{};
    std::optional<size_t> cfg_{};
    std::optional<BlockNo> block_{};
    bool dispatch_seen_ = false;

    std::unordered_map<std::string, BlockNo> labels_{};
    std::vector<PendingBranch> pending_branches_{};
    std::vector<PendingConstructor> pending_constructors_{};

    void error(Span span, std::string message) {
        session_.error(span, std::move(message));
    }

    ControlFlowGraph& cfg() {
        return ns_.contracts[*contract_].cfgs[*cfg_];
    }

    Function* current_function() {
        if (!contract_ || !cfg_) return nullptr;
        auto f = cfg().function_no;
        if (!f) return nullptr;
        return &ns_.functions[*f];
    }

    bool expect(LineCursor& cur, char c) {
        if (cur.eat(c)) return true;
        error(cur.here(), std::string("expected `") + c + "`");
        return false;
    }

    bool expect_end(LineCursor& cur) {
        if (cur.at_end()) return true;
        error(cur.here(), "unexpected trailing input");
        return false;
    }

    std::optional<std::uint64_t> read_number(LineCursor& cur,
                                             std::string_view what) {
        size_t at = (cur.skip_ws(), cur.pos());
        std::string_view w = cur.word();
        std::uint64_t v = 0;
        if (!parse_u64(w, v)) {
            error(cur.span_at(at, w.size()), "expected " + std::string(what));
            return std::nullopt;
        }
        return v;
    }

    std::optional<VarNo> read_var_no(LineCursor& cur) {
        size_t at = (cur.skip_ws(), cur.pos());
        auto v = read_number(cur, "variable number");
        if (!v) return std::nullopt;
        if (!cfg_ || *v >= cfg().vars.size()) {
            error(cur.span_at(at), "unknown variable " + std::to_string(*v));
            return std::nullopt;
        }
        return static_cast<VarNo>(*v);
    }

    // ---- types -------------------------------------------------------------

    std::optional<TypeId> base_type(std::string_view w) {
        const TypeStore& ts = ns_.types;
        if (w == "bool") return ts.bool_();
        if (w == "void") return ts.void_();
        if (w == "address") return ts.address();
        if (w == "string") return ts.string();
        if (w == "bytes") return ts.dynamic_bytes();
        if (w == "value") return ns_.value_type();
        if (w == "AccountMeta") return ts.struct_(StructKind::AccountMeta);
        if (w == "AccountInfo") return ts.struct_(StructKind::AccountInfo);

        std::uint64_t n = 0;
        if (w.size() > 5 && w.substr(0, 5) == "bytes" &&
            parse_u64(w.substr(5), n) && n >= 1 && n <= 32)
            return ts.bytes(static_cast<std::uint8_t>(n));
        if (w.size() > 4 && w.substr(0, 4) == "uint" &&
            parse_u64(w.substr(4), n) && n >= 8 && n <= 256 && n % 8 == 0)
            return ts.uint(static_cast<std::uint16_t>(n));
        if (w.size() > 3 && w.substr(0, 3) == "int" &&
            parse_u64(w.substr(3), n) && n >= 8 && n <= 256 && n % 8 == 0)
            return ts.sint(static_cast<std::uint16_t>(n));

        if (auto s = ts.find_struct(w)) return ts.struct_(StructKind::User, *s);
        return std::nullopt;
    }

    std::optional<TypeId> parse_type(LineCursor& cur) {
        const TypeStore& ts = ns_.types;
        size_t at = (cur.skip_ws(), cur.pos());
        std::string_view w = cur.word();
        if (w.empty()) {
            error(cur.span_at(at), "expected a type");
            return std::nullopt;
        }

        std::optional<TypeId> ty{};
        if ((w == "ref" || w == "storage" || w == "slice" || w == "mapping") &&
            cur.peek_raw() == '(') {
            cur.eat('(');
            auto inner = parse_type(cur);
            if (!inner) return std::nullopt;
            if (w == "mapping") {
                if (!expect(cur, ',')) return std::nullopt;
                auto value = parse_type(cur);
                if (!value) return std::nullopt;
                ty = ts.mapping(*inner, *value);
            } else if (w == "ref") {
                ty = ts.ref(*inner);
            } else if (w == "storage") {
                ty = ts.storage_ref(*inner);
            } else {
                ty = ts.slice(*inner);
            }
            if (!expect(cur, ')')) return std::nullopt;
        } else {
            ty = base_type(w);
            if (!ty) {
                error(cur.span_at(at, w.size()),
                      "unknown type `" + std::string(w) + "`");
                return std::nullopt;
            }
        }

        while (cur.peek_raw() == '[') {
            cur.eat('[');
            if (cur.eat(']')) {
                ty = ts.array(*ty, std::nullopt);
                continue;
            }
            auto len = read_number(cur, "array length");
            if (!len) return std::nullopt;
            if (!expect(cur, ']')) return std::nullopt;
            ty = ts.array(*ty, *len);
        }
        return ty;
    }

    std::optional<TypeId> parse_type_name(std::string_view name, Span span) {
        LineCursor cur(file_, span.begin.line, name);
        auto ty = parse_type(cur);
        if (ty && !cur.at_end()) {
            error(span, "malformed type `" + std::string(name) + "`");
            return std::nullopt;
        }
        return ty;
    }

    unsigned literal_bits(TypeId ty) {
        const TypeData& d = ns_.types.get(ty);
        switch (d.kind) {
            case TypeKind::Int:
                return d.bits;
            case TypeKind::Address:
                return ns_.address_length() * 8;
            case TypeKind::Bytes:
                return d.byte_len * 8u;
            case TypeKind::StorageRef:
                return make_target_spec(ns_.target).slot_bits;
            default:
                return 0;
        }
    }

    // ---- expressions -------------------------------------------------------

    ExprRef parse_expr(LineCursor& cur) {
        Span span = cur.here();
        if (!expect(cur, '(')) return nullptr;
        size_t op_at = cur.pos();
        std::string op(cur.word());
        ExprRef out = parse_expr_body(cur, op, span, op_at);
        if (!out) return nullptr;
        if (!expect(cur, ')')) return nullptr;
        return out;
    }

    bool parse_expr_list(LineCursor& cur, std::vector<ExprRef>& out) {
        while (cur.peek() == '(') {
            ExprRef e = parse_expr(cur);
            if (!e) return false;
            out.push_back(std::move(e));
        }
        return true;
    }

    ExprRef parse_expr_body(LineCursor& cur, const std::string& op, Span span,
                            size_t op_at) {
        const TypeStore& ts = ns_.types;

        if (op == "num") {
            auto ty = parse_type(cur);
            if (!ty) return nullptr;
            unsigned bits = literal_bits(*ty);
            if (bits == 0) {
                error(span, "`num` needs an integer, address, bytesN or storage type");
                return nullptr;
            }
            size_t at = (cur.skip_ws(), cur.pos());
            std::string_view w = cur.word();
            auto value = parse_integer(w, bits, ts.get(*ty).kind ==
                                                        TypeKind::Int &&
                                                    ts.get(*ty).is_signed);
            if (!value) {
                error(cur.span_at(at, w.size()),
                      "invalid literal `" + std::string(w) + "` for type `" +
                          ts.to_string(*ty) + "`");
                return nullptr;
            }
            return make_expr(span, *ty,
                             Expression::NumberLiteral{.value = *value});
        }
        if (op == "bool") {
            size_t at = (cur.skip_ws(), cur.pos());
            std::string_view w = cur.word();
            if (w != "true" && w != "false") {
                error(cur.span_at(at, w.size()), "expected `true` or `false`");
                return nullptr;
            }
            return make_expr(span, ts.bool_(),
                             Expression::BoolLiteral{.value = w == "true"});
        }
        if (op == "bytes") {
            auto ty = parse_type(cur);
            if (!ty) return nullptr;
            std::vector<std::uint8_t> bytes{};
            if (cur.peek() == '"') {
                std::string s{};
                if (!cur.quoted(s)) {
                    error(span, "unterminated string");
                    return nullptr;
                }
                bytes.assign(s.begin(), s.end());
            } else {
                size_t at = (cur.skip_ws(), cur.pos());
                std::string_view w = cur.word();
                if (!parse_hex_bytes(w, bytes)) {
                    error(cur.span_at(at, w.size()),
                          "expected hex bytes or a quoted string");
                    return nullptr;
                }
            }
            return make_expr(span, *ty,
                             Expression::BytesLiteral{.value = std::move(bytes)});
        }
        if (op == "var") {
            auto v = read_var_no(cur);
            if (!v) return nullptr;
            return make_expr(span, cfg().vars[*v].ty,
                             Expression::Variable{.var_no = *v});
        }
        if (op == "arg") {
            size_t at = (cur.skip_ws(), cur.pos());
            auto n = read_number(cur, "argument number");
            if (!n) return nullptr;
            if (*n >= cfg().params.size()) {
                error(cur.span_at(at), "unknown argument " + std::to_string(*n));
                return nullptr;
            }
            return make_expr(
                span, cfg().params[*n],
                Expression::FunctionArg{.arg_no = static_cast<std::uint32_t>(*n)});
        }
        if (op == "load" || op == "ref" || op == "storage-load") {
            auto ty = parse_type(cur);
            if (!ty) return nullptr;
            ExprRef inner = parse_expr(cur);
            if (!inner) return nullptr;
            if (op == "load")
                return make_expr(span, *ty, Expression::Load{.expr = inner});
            if (op == "ref")
                return make_expr(span, *ty, Expression::GetRef{.expr = inner});
            return make_expr(span, *ty, Expression::StorageLoad{.slot = inner});
        }
        if (op == "member") {
            auto ty = parse_type(cur);
            if (!ty) return nullptr;
            ExprRef inner = parse_expr(cur);
            if (!inner) return nullptr;
            auto member = read_number(cur, "member number");
            if (!member) return nullptr;
            return make_expr(
                span, *ty,
                Expression::StructMember{
                    .expr = inner,
                    .member = static_cast<std::uint32_t>(*member)});
        }
        if (op == "struct" || op == "array") {
            auto ty = parse_type(cur);
            if (!ty) return nullptr;
            std::vector<ExprRef> values{};
            if (!parse_expr_list(cur, values)) return nullptr;
            if (op == "struct") {
                if (ts.get(*ty).kind != TypeKind::Struct) {
                    error(span, "`struct` needs a struct type");
                    return nullptr;
                }
                if (values.size() != ts.struct_fields(*ty).size()) {
                    error(span, "struct literal for `" + ts.to_string(*ty) +
                                    "` has " + std::to_string(values.size()) +
                                    " fields, expected " +
                                    std::to_string(ts.struct_fields(*ty).size()));
                    return nullptr;
                }
                return make_expr(
                    span, *ty,
                    Expression::StructLiteral{.values = std::move(values)});
            }
            auto n = static_cast<std::uint32_t>(values.size());
            return make_expr(span, *ty,
                             Expression::ArrayLiteral{.dimensions = {n},
                                                      .values = std::move(values)});
        }
        if (op == "subscript") {
            auto ty = parse_type(cur);
            if (!ty) return nullptr;
            auto array_ty = parse_type(cur);
            if (!array_ty) return nullptr;
            ExprRef array = parse_expr(cur);
            if (!array) return nullptr;
            ExprRef index = parse_expr(cur);
            if (!index) return nullptr;
            return make_expr(span, *ty,
                             Expression::Subscript{.array_ty = *array_ty,
                                                   .expr = array,
                                                   .index = index});
        }
        if (op == "builtin") {
            size_t at = (cur.skip_ws(), cur.pos());
            std::string_view name = cur.word();
            const Prototype* proto = find_builtin(name, ns_.target);
            if (!proto) {
                error(cur.span_at(at, name.size()),
                      "builtin `" + std::string(name) +
                          "` is not available on target `" +
                          std::string(target_name(ns_.target)) + "`");
                return nullptr;
            }
            auto ty = parse_type_name(proto->ret, span);
            if (!ty) return nullptr;
            std::vector<ExprRef> args{};
            if (!parse_expr_list(cur, args)) return nullptr;
            if (args.size() != proto->params.size()) {
                error(span, "builtin `" + proto->qualified_name() + "` takes " +
                                std::to_string(proto->params.size()) +
                                " arguments");
                return nullptr;
            }
            return make_expr(span, *ty,
                             Expression::Builtin{.kind = proto->builtin,
                                                 .args = std::move(args)});
        }
        if (op == "storage-length") {
            auto array_ty = parse_type(cur);
            if (!array_ty) return nullptr;
            ExprRef array = parse_expr(cur);
            if (!array) return nullptr;
            return make_expr(span, ts.uint(32),
                             Expression::StorageArrayLength{.array_ty = *array_ty,
                                                            .array = array});
        }
        if (op == "return-data") {
            return make_expr(span, ts.dynamic_bytes(), Expression::ReturnData{});
        }

        static const std::pair<std::string_view, BinaryOp> kBinaryOps[] = {
            {"add", BinaryOp::Add}, {"sub", BinaryOp::Sub},
            {"mul", BinaryOp::Mul}, {"eq", BinaryOp::Eq},
            {"ne", BinaryOp::Ne},   {"lt", BinaryOp::Lt},
            {"gt", BinaryOp::Gt},
        };
        for (const auto& [name, bop] : kBinaryOps) {
            if (op != name) continue;
            ExprRef left = parse_expr(cur);
            if (!left) return nullptr;
            ExprRef right = parse_expr(cur);
            if (!right) return nullptr;
            bool compare = bop != BinaryOp::Add && bop != BinaryOp::Sub &&
                           bop != BinaryOp::Mul;
            TypeId ty = compare ? ts.bool_() : left->ty;
            return make_expr(span, ty,
                             Expression::Binary{.op = bop,
                                                .left = left,
                                                .right = right});
        }

        error(cur.span_at(op_at, op.size()),
              "unknown expression `" + op + "`");
        return nullptr;
    }

    std::optional<llvm::APInt> parse_integer(std::string_view w, unsigned bits,
                                             bool is_signed) {
        bool negative = !w.empty() && w[0] == '-';
        std::string_view digits = negative ? w.substr(1) : w;
        unsigned radix = 10;
        if (digits.size() > 2 && digits[0] == '0' &&
            (digits[1] == 'x' || digits[1] == 'X')) {
            radix = 16;
            digits.remove_prefix(2);
        }
        if (digits.empty()) return std::nullopt;
        for (char c : digits) {
            if (radix == 10 ? !std::isdigit(static_cast<unsigned char>(c))
                            : hex_value(c) < 0)
                return std::nullopt;
        }
        if (negative && !is_signed) return std::nullopt;

        unsigned wide = bits + 8 + static_cast<unsigned>(digits.size()) * 4;
        llvm::APInt v(wide, llvm::StringRef(digits.data(), digits.size()),
                      static_cast<std::uint8_t>(radix));
        if (negative) v.negate();

        if (is_signed ? !v.isSignedIntN(bits) : !v.isIntN(bits))
            return std::nullopt;
        return v.trunc(bits);
    }

    // ---- keyed operands ----------------------------------------------------

    bool parse_keyed(LineCursor& cur, std::vector<KeyValue>& out) {
        while (!cur.at_end()) {
            size_t at = (cur.skip_ws(), cur.pos());
            std::string_view key = cur.word();
            if (key.empty() || !cur.eat('=')) {
                error(cur.span_at(at), "expected `key=value`");
                return false;
            }
            KeyValue kv{.key = std::string(key), .span = cur.span_at(at, key.size())};
            if (cur.peek() == '(') {
                kv.expr = parse_expr(cur);
                if (!kv.expr) return false;
            } else {
                kv.word = std::string(cur.word());
                if (kv.word.empty()) {
                    error(cur.here(), "missing value for `" + kv.key + "`");
                    return false;
                }
            }
            out.push_back(std::move(kv));
        }
        return true;
    }

    std::optional<VarNo> keyed_var(const KeyValue& kv) {
        std::uint64_t v = 0;
        if (!parse_u64(kv.word, v) || v >= cfg().vars.size()) {
            error(kv.span, "`" + kv.key + "` needs a variable number");
            return std::nullopt;
        }
        return static_cast<VarNo>(v);
    }

    bool need_expr(const KeyValue& kv) {
        if (kv.expr) return true;
        error(kv.span, "`" + kv.key + "` needs an expression");
        return false;
    }

    // ---- lines -------------------------------------------------------------

    void read_line(LineCursor& cur) {
        Span span = cur.here();
        std::string kw(cur.word());

        if (kw == "target") return read_target(cur, span);
        if (kw == "struct") return read_struct(cur, span);
        if (kw == "contract") return read_contract(cur, span);
        if (kw == "function") return read_function(cur, span);
        if (kw == "dispatch") return read_dispatch(cur, span);
        if (kw == "accounts" || kw == "param" || kw == "returns" ||
            kw == "var")
            return read_header(cur, kw, span);
        if (kw == "block") return read_block(cur, span);

        if (!contract_ || !cfg_) {
            error(span, "`" + kw + "` outside of a function");
            return;
        }
        if (!block_) {
            error(span, "instruction `" + kw + "` outside of a block");
            return;
        }
        read_instr(cur, kw, span);
    }

    void read_target(LineCursor& cur, Span span) {
        if (seen_contract_ || target_known_ || seen_struct_) {
            error(span, "`target` must appear once, before any contract");
            return;
        }
        size_t at = (cur.skip_ws(), cur.pos());
        std::string_view name = cur.word();
        auto kind = parse_target_kind(name);
        if (!kind) {
            error(cur.span_at(at, name.size()),
                  "unknown target `" + std::string(name) + "`");
            return;
        }
        if (cli_target_ && *cli_target_ != *kind) {
            error(span, "module targets `" + std::string(name) +
                            "` but `" +
                            std::string(target_name(*cli_target_)) +
                            "` was requested");
            return;
        }
        ns_.target = *kind;
        target_known_ = true;
        expect_end(cur);
    }

    void read_struct(LineCursor& cur, Span span) {
        TypeStore& ts = ns_.types;
        std::string name(cur.word());
        if (name.empty()) {
            error(span, "expected struct name");
            return;
        }
        if (ts.find_struct(name) || base_type(name)) {
            error(span, "type `" + name + "` is already defined");
            return;
        }
        seen_struct_ = true;
        std::uint32_t no = ts.declare_struct(name);
        if (!expect(cur, '{')) return;

        std::vector<StructField> fields{};
        while (!cur.eat('}')) {
            if (!fields.empty() && !expect(cur, ',')) return;
            size_t at = (cur.skip_ws(), cur.pos());
            std::string field(cur.word());
            if (field.empty()) {
                error(cur.span_at(at), "expected field name");
                return;
            }
            if (!expect(cur, ':')) return;
            auto ty = parse_type(cur);
            if (!ty) return;
            fields.push_back(StructField{.name = field, .type = *ty});
        }
        ts.set_struct_fields(no, std::move(fields));
        expect_end(cur);
    }

    void read_contract(LineCursor& cur, Span span) {
        finish_cfg();
        std::string name(cur.word());
        if (name.empty()) {
            error(span, "expected contract name");
            return;
        }
        if (ns_.find_contract(name)) {
            error(span, "contract `" + name + "` is already defined");
            return;
        }
        Contract contract{.span = span, .name = name};
        if (!cur.at_end()) {
            size_t at = (cur.skip_ws(), cur.pos());
            std::string_view w = cur.word();
            if (w != "program_id" || !cur.eat('=')) {
                error(cur.span_at(at, w.size()),
                      "unexpected `" + std::string(w) + "`");
                return;
            }
            size_t hex_at = (cur.skip_ws(), cur.pos());
            std::string_view hex = cur.word();
            std::vector<std::uint8_t> bytes{};
            if (!parse_hex_bytes(hex, bytes) ||
                bytes.size() != ns_.address_length()) {
                error(cur.span_at(hex_at, hex.size()),
                      "program_id must be " +
                          std::to_string(ns_.address_length()) +
                          " hex bytes");
                return;
            }
            contract.program_id = std::move(bytes);
        }
        seen_contract_ = true;
        ns_.contracts.push_back(std::move(contract));
        contract_ = static_cast<ContractNo>(ns_.contracts.size() - 1);
        dispatch_seen_ = false;
        expect_end(cur);
    }

    void read_function(LineCursor& cur, Span span) {
        if (!contract_) {
            error(span, "`function` outside of a contract");
            return;
        }
        finish_cfg();
        std::string name(cur.word());
        if (name.empty()) {
            error(span, "expected function name");
            return;
        }
        if (ns_.find_function(*contract_, name)) {
            error(span, "function `" + name + "` is already defined");
            return;
        }

        Function fn{.span = span, .name = name, .contract_no = *contract_};
        while (!cur.at_end()) {
            size_t at = (cur.skip_ws(), cur.pos());
            std::string_view w = cur.word();
            if (w == "constructor") {
                fn.kind = FunctionKind::Constructor;
            } else if (w == "selector" && cur.eat('=')) {
                size_t hex_at = (cur.skip_ws(), cur.pos());
                std::string_view hex = cur.word();
                std::vector<std::uint8_t> bytes{};
                if (!parse_hex_bytes(hex, bytes)) {
                    error(cur.span_at(hex_at, hex.size()),
                          "selector must be hex bytes");
                    return;
                }
                fn.selector = std::move(bytes);
            } else {
                error(cur.span_at(at, w.size()),
                      "unexpected `" + std::string(w) + "`");
                return;
            }
        }

        if (fn.is_constructor() && ns_.constructor_of(*contract_)) {
            error(span, "contract `" + ns_.contracts[*contract_].name +
                            "` already has a constructor");
            return;
        }

        auto f = static_cast<FunctionNo>(ns_.functions.size());
        ns_.functions.push_back(std::move(fn));
        Contract& c = ns_.contracts[*contract_];
        c.functions.push_back(f);
        c.cfgs.push_back(ControlFlowGraph{.name = name, .function_no = f});
        c.all_functions[f] = c.cfgs.size() - 1;
        cfg_ = c.cfgs.size() - 1;
    }

    void read_dispatch(LineCursor& cur, Span span) {
        if (!contract_) {
            error(span, "`dispatch` outside of a contract");
            return;
        }
        if (dispatch_seen_) {
            error(span, "contract `" + ns_.contracts[*contract_].name +
                            "` already has a dispatch function");
            return;
        }
        finish_cfg();
        dispatch_seen_ = true;
        Contract& c = ns_.contracts[*contract_];
        c.cfgs.push_back(
            ControlFlowGraph{.name = dispatch_cfg_name(ns_.target)});
        cfg_ = c.cfgs.size() - 1;
        expect_end(cur);
    }

    void read_header(LineCursor& cur, const std::string& kw, Span span) {
        if (!contract_ || !cfg_) {
            error(span, "`" + kw + "` outside of a function");
            return;
        }
        if (block_) {
            error(span, "`" + kw + "` must precede the first block");
            return;
        }
        Function* fn = current_function();

        if (kw == "var") {
            auto n = read_number(cur, "variable number");
            if (!n) return;
            std::string name(cur.word());
            if (!expect(cur, ':')) return;
            auto ty = parse_type(cur);
            if (!ty) return;
            auto& vars = cfg().vars;
            if (*n < vars.size() && !vars[*n].name.empty()) {
                error(span, "variable " + std::to_string(*n) +
                                " is already declared");
                return;
            }
            if (*n >= vars.size()) vars.resize(*n + 1);
            vars[*n] = CfgVar{.name = name.empty() ? "v" + std::to_string(*n)
                                                   : name,
                              .ty = *ty};
            expect_end(cur);
            return;
        }

        if (!fn) {
            error(span, "`" + kw + "` is not allowed in the dispatch function");
            return;
        }

        if (kw == "param") {
            std::string name(cur.word());
            if (!expect(cur, ':')) return;
            auto ty = parse_type(cur);
            if (!ty) return;
            fn->params.push_back(Param{.name = name, .ty = *ty});
            cfg().params.push_back(*ty);
            expect_end(cur);
        } else if (kw == "returns") {
            auto ty = parse_type(cur);
            if (!ty) return;
            fn->returns.push_back(*ty);
            cfg().returns.push_back(*ty);
            expect_end(cur);
        } else {
            while (!cur.at_end()) {
                size_t at = (cur.skip_ws(), cur.pos());
                std::string name(cur.word());
                if (name.empty()) {
                    error(cur.span_at(at), "expected account name");
                    return;
                }
                AccountFlags flags{};
                if (cur.peek_raw() == '(') {
                    cur.eat('(');
                    while (!cur.eat(')')) {
                        size_t flag_at = (cur.skip_ws(), cur.pos());
                        std::string_view flag = cur.word();
                        if (flag == "signer") {
                            flags.is_signer = true;
                        } else if (flag == "writer") {
                            flags.is_writer = true;
                        } else {
                            error(cur.span_at(flag_at, flag.size()),
                                  "unknown account flag `" +
                                      std::string(flag) + "`");
                            return;
                        }
                        cur.eat(',');
                    }
                }
                if (fn->accounts.count(name)) {
                    error(cur.span_at(at, name.size()),
                          "account `" + name + "` is listed twice");
                    return;
                }
                fn->accounts.insert({name, flags});
            }
        }
    }

    void read_block(LineCursor& cur, Span span) {
        if (!contract_ || !cfg_) {
            error(span, "`block` outside of a function");
            return;
        }
        std::string label(cur.word());
        if (label.empty()) {
            error(span, "expected block label");
            return;
        }
        if (labels_.count(label)) {
            error(span, "block `" + label + "` is already defined");
            return;
        }
        auto no = static_cast<BlockNo>(cfg().blocks.size());
        cfg().blocks.push_back(BasicBlock{.name = label});
        labels_[label] = no;
        block_ = no;
        expect_end(cur);
    }

    void push(Span span, decltype(Instr{}.data) data) {
        cfg().blocks[*block_].instr.push_back(
            Instr{.span = span, .data = std::move(data)});
    }

    void branch_to(LineCursor& cur, int which) {
        Span span = cur.here();
        std::string label(cur.word());
        if (label.empty()) {
            error(span, "expected block label");
            return;
        }
        pending_branches_.push_back(PendingBranch{
            .block = *block_,
            .instr = cfg().blocks[*block_].instr.size(),
            .which = which,
            .label = std::move(label),
            .span = span,
        });
    }

    void read_instr(LineCursor& cur, const std::string& kw, Span span) {
        if (kw == "set") {
            auto res = read_var_no(cur);
            if (!res) return;
            ExprRef e = parse_expr(cur);
            if (!e || !expect_end(cur)) return;
            push(span, Instr::Set{.res = *res, .expr = e});
        } else if (kw == "branch") {
            branch_to(cur, 0);
            if (!expect_end(cur)) return;
            push(span, Instr::Branch{});
        } else if (kw == "cond") {
            ExprRef c = parse_expr(cur);
            if (!c) return;
            branch_to(cur, 0);
            branch_to(cur, 1);
            if (!expect_end(cur)) return;
            push(span, Instr::BranchCond{.cond = c});
        } else if (kw == "return") {
            std::vector<ExprRef> values{};
            if (!parse_expr_list(cur, values) || !expect_end(cur)) return;
            push(span, Instr::Return{.values = std::move(values)});
        } else if (kw == "return-code") {
            size_t at = (cur.skip_ws(), cur.pos());
            std::string_view name = cur.word();
            for (auto code :
                 {ReturnCode::Success, ReturnCode::FunctionSelectorInvalid,
                  ReturnCode::AbiEncodingInvalid, ReturnCode::InvalidDataError,
                  ReturnCode::AccountDataTooSmall,
                  ReturnCode::InvalidProgramId}) {
                if (return_code_name(code) == name) {
                    if (!expect_end(cur)) return;
                    push(span, Instr::ReturnCode{.code = code});
                    return;
                }
            }
            error(cur.span_at(at, name.size()),
                  "unknown return code `" + std::string(name) + "`");
        } else if (kw == "constructor") {
            read_constructor(cur, span);
        } else if (kw == "call") {
            read_call(cur, span);
        } else if (kw == "account") {
            auto res = read_var_no(cur);
            if (!res) return;
            std::string name(cur.word());
            if (name.empty()) {
                error(cur.here(), "expected account name");
                return;
            }
            if (!expect_end(cur)) return;
            push(span, Instr::AccountAccess{.name = std::move(name),
                                            .var_no = *res});
        } else if (kw == "set-storage" || kw == "clear-storage") {
            auto ty = parse_type(cur);
            if (!ty) return;
            ExprRef slot = parse_expr(cur);
            if (!slot) return;
            if (kw == "clear-storage") {
                if (!expect_end(cur)) return;
                push(span, Instr::ClearStorage{.ty = *ty, .storage = slot});
                return;
            }
            ExprRef value = parse_expr(cur);
            if (!value || !expect_end(cur)) return;
            push(span, Instr::SetStorage{.ty = *ty, .value = value,
                                         .storage = slot});
        } else if (kw == "push-storage") {
            auto res = read_var_no(cur);
            if (!res) return;
            auto ty = parse_type(cur);
            if (!ty) return;
            ExprRef slot = parse_expr(cur);
            if (!slot) return;
            ExprRef value{};
            if (cur.peek() == '(') {
                value = parse_expr(cur);
                if (!value) return;
            }
            if (!expect_end(cur)) return;
            push(span, Instr::PushStorage{.res = *res, .ty = *ty,
                                          .value = value, .storage = slot});
        } else if (kw == "pop-storage") {
            auto ty = parse_type(cur);
            if (!ty) return;
            ExprRef slot = parse_expr(cur);
            if (!slot) return;
            std::vector<KeyValue> kvs{};
            if (!parse_keyed(cur, kvs)) return;
            Instr::PopStorage pop{.ty = *ty, .storage = slot};
            for (const KeyValue& kv : kvs) {
                if (kv.key != "res") {
                    error(kv.span, "unknown operand `" + kv.key + "`");
                    return;
                }
                pop.res = keyed_var(kv);
                if (!pop.res) return;
            }
            push(span, std::move(pop));
        } else if (kw == "print" || kw == "return-data" ||
                   kw == "selfdestruct") {
            ExprRef e = parse_expr(cur);
            if (!e || !expect_end(cur)) return;
            if (kw == "print")
                push(span, Instr::Print{.expr = e});
            else if (kw == "return-data")
                push(span, Instr::ReturnData{.data = e});
            else
                push(span, Instr::SelfDestruct{.recipient = e});
        } else if (kw == "assert-failure") {
            ExprRef e{};
            if (cur.peek() == '(') {
                e = parse_expr(cur);
                if (!e) return;
            }
            if (!expect_end(cur)) return;
            push(span, Instr::AssertFailure{.encoded_args = e});
        } else if (kw == "transfer") {
            std::vector<KeyValue> kvs{};
            if (!parse_keyed(cur, kvs)) return;
            Instr::ValueTransfer t{};
            for (const KeyValue& kv : kvs) {
                if (kv.key == "success") {
                    t.success = keyed_var(kv);
                    if (!t.success) return;
                } else if (kv.key == "address" && need_expr(kv)) {
                    t.address = kv.expr;
                } else if (kv.key == "value" && need_expr(kv)) {
                    t.value = kv.expr;
                } else {
                    error(kv.span, "unknown operand `" + kv.key + "`");
                    return;
                }
            }
            if (!t.address || !t.value) {
                error(span, "`transfer` needs `address` and `value`");
                return;
            }
            push(span, std::move(t));
        } else if (kw == "emit") {
            std::vector<KeyValue> kvs{};
            if (!parse_keyed(cur, kvs)) return;
            Instr::EmitEvent ev{};
            for (const KeyValue& kv : kvs) {
                if (!need_expr(kv)) return;
                if (kv.key == "data") {
                    ev.data = kv.expr;
                } else if (kv.key == "topic") {
                    ev.topics.push_back(kv.expr);
                } else {
                    error(kv.span, "unknown operand `" + kv.key + "`");
                    return;
                }
            }
            if (!ev.data) {
                error(span, "`emit` needs `data`");
                return;
            }
            push(span, std::move(ev));
        } else if (kw == "unreachable") {
            if (!expect_end(cur)) return;
            push(span, Instr::Unreachable{});
        } else if (kw == "nop") {
            if (!expect_end(cur)) return;
            push(span, Instr::Nop{});
        } else {
            error(span, "unknown instruction `" + kw + "`");
        }
    }

    void read_constructor(LineCursor& cur, Span span) {
        std::vector<KeyValue> kvs{};
        if (!parse_keyed(cur, kvs)) return;

        Instr::Constructor c{};
        std::optional<VarNo> res{};
        std::string contract_name{};
        bool callee_none = false;
        for (const KeyValue& kv : kvs) {
            if (kv.key == "res") {
                res = keyed_var(kv);
                if (!res) return;
            } else if (kv.key == "success") {
                c.success = keyed_var(kv);
                if (!c.success) return;
            } else if (kv.key == "contract") {
                contract_name = kv.word;
            } else if (kv.key == "callee") {
                if (kv.word != "none") {
                    error(kv.span, "`callee` only accepts `none`");
                    return;
                }
                callee_none = true;
            } else if (!need_expr(kv)) {
                return;
            } else if (kv.key == "args") {
                c.encoded_args = kv.expr;
            } else if (kv.key == "value") {
                c.value = kv.expr;
            } else if (kv.key == "gas") {
                c.gas = kv.expr;
            } else if (kv.key == "salt") {
                c.salt = kv.expr;
            } else if (kv.key == "seeds") {
                c.seeds = kv.expr;
            } else if (kv.key == "address") {
                c.address = kv.expr;
            } else if (kv.key == "accounts") {
                c.accounts = kv.expr;
            } else {
                error(kv.span, "unknown operand `" + kv.key + "`");
                return;
            }
        }
        if (!res || contract_name.empty()) {
            error(span, "`constructor` needs `res` and `contract`");
            return;
        }
        c.res = *res;

        pending_constructors_.push_back(PendingConstructor{
            .contract = *contract_,
            .cfg = *cfg_,
            .block = *block_,
            .instr = cfg().blocks[*block_].instr.size(),
            .contract_name = std::move(contract_name),
            .callee_none = callee_none,
            .span = span,
        });
        push(span, std::move(c));
    }

    void read_call(LineCursor& cur, Span span) {
        std::vector<KeyValue> kvs{};
        if (!parse_keyed(cur, kvs)) return;

        Instr::ExternalCall call{};
        for (const KeyValue& kv : kvs) {
            if (kv.key == "success") {
                call.success = keyed_var(kv);
                if (!call.success) return;
            } else if (kv.key == "kind") {
                if (kv.word == "regular") {
                    call.callty = CallTy::Regular;
                } else if (kv.word == "delegate") {
                    call.callty = CallTy::Delegate;
                } else if (kv.word == "static") {
                    call.callty = CallTy::Static;
                } else {
                    error(kv.span, "unknown call kind `" + kv.word + "`");
                    return;
                }
            } else if (!need_expr(kv)) {
                return;
            } else if (kv.key == "address") {
                call.address = kv.expr;
            } else if (kv.key == "payload") {
                call.payload = kv.expr;
            } else if (kv.key == "accounts") {
                call.accounts = kv.expr;
            } else if (kv.key == "seeds") {
                call.seeds = kv.expr;
            } else if (kv.key == "value") {
                call.value = kv.expr;
            } else if (kv.key == "gas") {
                call.gas = kv.expr;
            } else {
                error(kv.span, "unknown operand `" + kv.key + "`");
                return;
            }
        }
        if (!call.payload) {
            error(span, "`call` needs `payload`");
            return;
        }
        push(span, std::move(call));
    }

    void finish_cfg() {
        if (contract_ && cfg_) {
            ControlFlowGraph& g = cfg();
            for (const PendingBranch& p : pending_branches_) {
                auto it = labels_.find(p.label);
                if (it == labels_.end()) {
                    error(p.span, "unknown block `" + p.label + "`");
                    continue;
                }
                Instr& ins = g.blocks[p.block].instr[p.instr];
                if (auto* b = std::get_if<Instr::Branch>(&ins.data)) {
                    b->block = it->second;
                } else if (auto* c = std::get_if<Instr::BranchCond>(&ins.data)) {
                    (p.which == 0 ? c->true_block : c->false_block) = it->second;
                }
            }
        }
        pending_branches_.clear();
        labels_.clear();
        cfg_.reset();
        block_.reset();
    }

    void resolve_constructors() {
        for (const PendingConstructor& p : pending_constructors_) {
            auto callee_contract = ns_.find_contract(p.contract_name);
            if (!callee_contract) {
                error(p.span, "unknown contract `" + p.contract_name + "`");
                continue;
            }
            Instr& ins = ns_.contracts[p.contract]
                             .cfgs[p.cfg]
                             .blocks[p.block]
                             .instr[p.instr];
            auto& c = std::get<Instr::Constructor>(ins.data);
            c.contract_no = *callee_contract;
            if (!p.callee_none) c.constructor_no = ns_.constructor_of(*callee_contract);
        }
    }
};

}  // namespace

std::optional<Namespace> read_module(Session& session, FileId file,
                                     std::optional<TargetKind> target) {
    const std::string* text = session.sources.text(file);
    if (!text) {
        session.error(kCodegenSpan, "failed to read `" +
                                        session.sources.path(file) + "`");
        return std::nullopt;
    }
    ModuleReader reader(session, file, target);
    return reader.run(*text);
}

std::optional<Namespace> read_module_text(Session& session, std::string path,
                                          std::string text,
                                          std::optional<TargetKind> target) {
    FileId file = session.sources.add_buffer(std::move(path), std::move(text));
    return read_module(session, file, target);
}

}  // namespace keel
