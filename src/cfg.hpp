#pragma once

#include <llvm/ADT/APInt.h>

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "builtins.hpp"
#include "span.hpp"
#include "types.hpp"

namespace keel {

using VarNo = std::uint32_t;
using BlockNo = std::uint32_t;
using FunctionNo = std::uint32_t;
using ContractNo = std::uint32_t;

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Eq,
    Ne,
    Lt,
    Gt,
};

enum class CallTy : std::uint8_t {
    Regular,
    Delegate,
    Static,
};

enum class ReturnCode : std::uint8_t {
    Success,
    FunctionSelectorInvalid,
    AbiEncodingInvalid,
    InvalidDataError,
    AccountDataTooSmall,
    InvalidProgramId,
};

std::string_view binary_op_name(BinaryOp op);
std::string_view call_ty_name(CallTy ty);
std::string_view return_code_name(ReturnCode code);

struct Expression;

// Expressions are immutable once built and shared between instructions.
using ExprRef = std::shared_ptr<const Expression>;

struct Expression {
    struct NumberLiteral {
        llvm::APInt value{};
    };
    struct BoolLiteral {
        bool value = false;
    };
    struct BytesLiteral {
        std::vector<std::uint8_t> value{};
    };
    struct Variable {
        VarNo var_no = 0;
    };
    struct FunctionArg {
        std::uint32_t arg_no = 0;
    };
    struct Load {
        ExprRef expr{};
    };
    // Yields a reference to field `member` of the struct `expr` points to.
    struct StructMember {
        ExprRef expr{};
        std::uint32_t member = 0;
    };
    struct StructLiteral {
        std::vector<ExprRef> values{};
    };
    struct ArrayLiteral {
        std::vector<std::uint32_t> dimensions{};
        std::vector<ExprRef> values{};
    };
    struct Subscript {
        TypeId array_ty = 0;
        ExprRef expr{};
        ExprRef index{};
    };
    struct GetRef {
        ExprRef expr{};
    };
    struct Builtin {
        BuiltinKind kind{};
        std::vector<ExprRef> args{};
    };
    struct Binary {
        BinaryOp op{};
        ExprRef left{};
        ExprRef right{};
    };
    struct StorageLoad {
        ExprRef slot{};
    };
    struct StorageArrayLength {
        TypeId array_ty = 0;
        ExprRef array{};
    };
    struct ReturnData {};

    Span span{};
    TypeId ty = 0;
    std::variant<NumberLiteral, BoolLiteral, BytesLiteral, Variable,
                 FunctionArg, Load, StructMember, StructLiteral, ArrayLiteral,
                 Subscript, GetRef, Builtin, Binary, StorageLoad,
                 StorageArrayLength, ReturnData>
        data;
};

template <typename Node>
ExprRef make_expr(Span span, TypeId ty, Node node) {
    return std::make_shared<const Expression>(
        Expression{.span = span, .ty = ty, .data = std::move(node)});
}

struct Instr {
    struct Set {
        VarNo res = 0;
        ExprRef expr{};
    };
    struct Branch {
        BlockNo block = 0;
    };
    struct BranchCond {
        ExprRef cond{};
        BlockNo true_block = 0;
        BlockNo false_block = 0;
    };
    struct Return {
        std::vector<ExprRef> values{};
    };
    struct ReturnCode {
        keel::ReturnCode code{};
    };
    // Null `address` and `accounts` mean "not supplied".
    struct Constructor {
        std::optional<VarNo> success{};
        VarNo res = 0;
        ContractNo contract_no = 0;
        std::optional<FunctionNo> constructor_no{};
        ExprRef encoded_args{};
        ExprRef value{};
        ExprRef gas{};
        ExprRef salt{};
        ExprRef seeds{};
        ExprRef address{};
        ExprRef accounts{};
    };
    struct ExternalCall {
        std::optional<VarNo> success{};
        ExprRef address{};
        ExprRef accounts{};
        ExprRef seeds{};
        ExprRef payload{};
        ExprRef value{};
        ExprRef gas{};
        CallTy callty = CallTy::Regular;
    };
    // Reads the account `name` of the executing function into `var_no`.
    struct AccountAccess {
        std::string name{};
        VarNo var_no = 0;
    };
    struct SetStorage {
        TypeId ty = 0;
        ExprRef value{};
        ExprRef storage{};
    };
    struct ClearStorage {
        TypeId ty = 0;
        ExprRef storage{};
    };
    struct PushStorage {
        VarNo res = 0;
        TypeId ty = 0;
        ExprRef value{};
        ExprRef storage{};
    };
    struct PopStorage {
        std::optional<VarNo> res{};
        TypeId ty = 0;
        ExprRef storage{};
    };
    struct Print {
        ExprRef expr{};
    };
    struct AssertFailure {
        ExprRef encoded_args{};
    };
    struct ReturnData {
        ExprRef data{};
    };
    struct ValueTransfer {
        std::optional<VarNo> success{};
        ExprRef address{};
        ExprRef value{};
    };
    struct SelfDestruct {
        ExprRef recipient{};
    };
    struct EmitEvent {
        std::vector<ExprRef> topics{};
        ExprRef data{};
    };
    struct Unreachable {};
    struct Nop {};

    Span span{};
    std::variant<Set, Branch, BranchCond, Return, ReturnCode, Constructor,
                 ExternalCall, AccountAccess, SetStorage, ClearStorage,
                 PushStorage, PopStorage, Print, AssertFailure, ReturnData,
                 ValueTransfer, SelfDestruct, EmitEvent, Unreachable, Nop>
        data{Nop{}};

    // True if the instruction ends its block.
    bool is_terminator() const;
};

struct BasicBlock {
    std::string name{};
    std::vector<Instr> instr{};

    // Successor blocks, derived from the branch instructions of the block.
    std::vector<BlockNo> edges() const;
};

struct CfgVar {
    std::string name{};
    TypeId ty = 0;
};

struct ControlFlowGraph {
    std::string name{};
    std::optional<FunctionNo> function_no{};
    std::vector<TypeId> params{};
    std::vector<TypeId> returns{};
    std::vector<CfgVar> vars{};
    std::vector<BasicBlock> blocks{};

    const CfgVar* var(VarNo no) const;
};

struct Namespace;

// The dump uses the syntax accepted by `read_module`.
void dump_expr(std::ostream& os, const Namespace& ns, const Expression& e);
void dump_cfg(std::ostream& os, const Namespace& ns,
              const ControlFlowGraph& cfg);
void dump_module(std::ostream& os, const Namespace& ns);

}  // namespace keel
