#pragma once
//
// Interpreter - tree-walking evaluator for the lambda AST
//
// Runs a validated Module against one ExecutionNamespace. Every statement and
// expression is charged to the namespace's ResourceBudget, so runaway loops end
// in ResourceLimitExceeded rather than a hang. Errors raised by the program are
// ScriptErrors pinned to the innermost statement that raised them.
//

#include "builtins.h"
#include "execution_namespace.h"
#include "output_capture.h"
#include "value.h"
#include "../../compiler/parser/ast_nodes.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace signal_lambda::runtime {

class Interpreter {
public:
    // recordIndex tags print() output in per-record mode
    Interpreter(ExecutionNamespace& ns, OutputCapture& output, std::optional<std::size_t> recordIndex = std::nullopt);

    void Execute(const Module& module);

    Value Evaluate(const Expr& expr);

private:
    enum class Flow { Normal, Break, Continue };

    ExecutionNamespace& m_namespace;
    Heap& m_heap;
    ResourceBudget& m_budget;
    CallContext m_ctx;

    Flow ExecBlock(const StmtList& body);
    Flow ExecStatement(const Stmt& stmt);
    void ExecAssign(const Assign& stmt);
    void ExecAugAssign(const AugAssign& stmt);
    Flow ExecFor(const For& stmt);
    void ExecDelete(const Delete& stmt);

    struct SliceArgs {
        std::optional<std::int64_t> lower;
        std::optional<std::int64_t> upper;
        std::optional<std::int64_t> step;
    };

    // Binding
    void AssignTo(const Expr& target, const Value& value);
    void Unpack(const ExprList& targets, const Value& value);
    void SetItem(const Value& container, const Value& key, const Value& value);
    void SetSlice(const Value& container, const SliceArgs& args, const Value& value);
    void DeleteItem(const Value& container, const Expr& index);
    Value InPlaceOp(BinOpType op, const Value& current, const Value& operand);

    // Iterates any iterable, calling body per item; body returns false to stop
    template <typename Fn>
    void ForEach(const Value& iterable, Fn&& body);

    // Expressions
    Value EvalCall(const Call& call);
    // map() and filter() return lists
    Value EvalMapFilter(const std::string& function, const Call& call);
    Value EvalAttribute(const Attribute& attribute);
    Value EvalSubscript(const Subscript& subscript);
    Value EvalCompare(const signal_lambda::Compare& compare);
    Value EvalBoolOp(const BoolOp& boolOp);
    Value EvalListComp(const ListComp& comp);
    Value EvalDictComp(const DictComp& comp);

    SliceArgs EvalSliceArgs(const Slice& slice);

    template <typename Fn>
    void RunGenerators(const std::vector<Comprehension>& generators, std::size_t level, Fn&& emit);

    // Comprehension variables do not leak into the enclosing namespace
    class ComprehensionScope;
};

} // namespace signal_lambda::runtime
