//
// Lambda AST
//
// Owned syntax tree for the restricted signal-lambda grammar. Node names follow
// Python's ast module. Every node carries its 1-based source position.
//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace signal_lambda {

struct ASTNode {
    virtual ~ASTNode() = default;

    int lineno = 0;
    int col_offset = 0;
};

struct Expr : ASTNode {};
struct Stmt : ASTNode {};

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using ExprList = std::vector<ExprPtr>;
using StmtList = std::vector<StmtPtr>;

enum class BinOpType {
    Add, Sub, Mult, Div, FloorDiv, Mod, Pow,
    Lt, Gt, LtE, GtE, Eq, NotEq, In, NotIn, Is, IsNot,
    And, Or
};

enum class UnaryOpType { Not, USub, UAdd };

const char* BinOpSymbol(BinOpType op);

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

struct Name : Expr {
    std::string id;
    explicit Name(std::string id) : id(std::move(id)) {}
};

struct Constant : Expr {
    using ValueType = std::variant<std::monostate, bool, std::int64_t, double, std::string>;
    ValueType value;
    explicit Constant(ValueType value) : value(std::move(value)) {}
};

struct Attribute : Expr {
    ExprPtr value;
    std::string attr;
    Attribute(ExprPtr value, std::string attr) : value(std::move(value)), attr(std::move(attr)) {}
};

struct Call : Expr {
    ExprPtr func;
    ExprList args;
    std::vector<std::pair<std::string, ExprPtr>> keywords;
    explicit Call(ExprPtr func) : func(std::move(func)) {}
};

struct BinOp : Expr {
    BinOpType op;
    ExprPtr left;
    ExprPtr right;
    BinOp(BinOpType op, ExprPtr left, ExprPtr right)
        : op(op), left(std::move(left)), right(std::move(right)) {}
};

struct UnaryOp : Expr {
    UnaryOpType op;
    ExprPtr operand;
    UnaryOp(UnaryOpType op, ExprPtr operand) : op(op), operand(std::move(operand)) {}
};

// Flattened: `a and b and c` is one BoolOp with three values
struct BoolOp : Expr {
    BinOpType op;
    ExprList values;
    explicit BoolOp(BinOpType op) : op(op) {}
};

// Chained: `a < b <= c`
struct Compare : Expr {
    ExprPtr left;
    std::vector<BinOpType> ops;
    ExprList comparators;
    explicit Compare(ExprPtr left) : left(std::move(left)) {}
};

struct IfExp : Expr {
    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;
    IfExp(ExprPtr test, ExprPtr body, ExprPtr orelse)
        : test(std::move(test)), body(std::move(body)), orelse(std::move(orelse)) {}
};

struct Slice : Expr {
    ExprPtr lower;  // each may be null
    ExprPtr upper;
    ExprPtr step;
};

struct Subscript : Expr {
    ExprPtr value;
    ExprPtr slice;
    Subscript(ExprPtr value, ExprPtr slice) : value(std::move(value)), slice(std::move(slice)) {}
};

struct Tuple : Expr {
    ExprList elts;
};

struct List : Expr {
    ExprList elts;
};

struct Dict : Expr {
    ExprList keys;
    ExprList values;
};

struct Comprehension {
    ExprPtr target;
    ExprPtr iter;
    ExprList ifs;
};

// Also used for generator expressions, which are materialized eagerly
struct ListComp : Expr {
    ExprPtr elt;
    std::vector<Comprehension> generators;
};

struct DictComp : Expr {
    ExprPtr key;
    ExprPtr value;
    std::vector<Comprehension> generators;
};

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

struct ExprStmt : Stmt {
    ExprPtr value;
    explicit ExprStmt(ExprPtr value) : value(std::move(value)) {}
};

// `a = b = value` has two targets
struct Assign : Stmt {
    ExprList targets;
    ExprPtr value;
    explicit Assign(ExprPtr value) : value(std::move(value)) {}
};

struct AugAssign : Stmt {
    ExprPtr target;
    BinOpType op;
    ExprPtr value;
    AugAssign(ExprPtr target, BinOpType op, ExprPtr value)
        : target(std::move(target)), op(op), value(std::move(value)) {}
};

struct If : Stmt {
    ExprPtr test;
    StmtList body;
    StmtList orelse;
    explicit If(ExprPtr test) : test(std::move(test)) {}
};

struct For : Stmt {
    ExprPtr target;
    ExprPtr iter;
    StmtList body;
    For(ExprPtr target, ExprPtr iter) : target(std::move(target)), iter(std::move(iter)) {}
};

struct Delete : Stmt {
    ExprList targets;
};

struct Pass : Stmt {};
struct Break : Stmt {};
struct Continue : Stmt {};

struct Module {
    StmtList body;
};

using ModulePtr = std::unique_ptr<Module>;

} // namespace signal_lambda
