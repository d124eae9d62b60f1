#include "interpreter.h"
#include "script_error.h"
#include "value_ops.h"
#include "../../compiler/lambda_grammar.h"

#include <algorithm>
#include <format>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace signal_lambda::runtime {

namespace {

std::optional<std::int64_t> SliceIndex(const Value& value) {
    if (value.IsNone()) {
        return std::nullopt;
    }
    if (!value.IsIntegral()) {
        throw TypeError("slice indices must be integers or None");
    }
    return value.ToInteger();
}

std::int64_t ListIndex(const Value& key, std::string_view typeName) {
    if (!key.IsIntegral()) {
        throw TypeError(std::format("{} indices must be integers or slices, not {}", typeName, key.TypeName()));
    }
    return key.ToInteger();
}

void CollectTargetNames(const Expr& target, std::vector<std::string>& names) {
    if (const auto* name = dynamic_cast<const Name*>(&target)) {
        names.push_back(name->id);
    } else if (const auto* tuple = dynamic_cast<const Tuple*>(&target)) {
        for (const auto& elt : tuple->elts) CollectTargetNames(*elt, names);
    } else if (const auto* list = dynamic_cast<const List*>(&target)) {
        for (const auto& elt : list->elts) CollectTargetNames(*elt, names);
    }
}

} // namespace

class Interpreter::ComprehensionScope {
public:
    ComprehensionScope(ExecutionNamespace& ns, const std::vector<Comprehension>& generators) : m_namespace(ns) {
        std::vector<std::string> names;
        for (const auto& generator : generators) {
            CollectTargetNames(*generator.target, names);
        }
        for (auto& name : names) {
            const Value* previous = ns.Lookup(name);
            m_saved.emplace_back(std::move(name), previous ? std::optional<Value>{*previous} : std::nullopt);
        }
    }

    ~ComprehensionScope() {
        // Restore in reverse so a name listed twice ends up with its outer value
        for (auto it = m_saved.rbegin(); it != m_saved.rend(); ++it) {
            if (it->second) {
                m_namespace.Bind(it->first, *it->second);
            } else {
                m_namespace.Unbind(it->first);
            }
        }
    }

    ComprehensionScope(const ComprehensionScope&) = delete;
    ComprehensionScope& operator=(const ComprehensionScope&) = delete;

private:
    ExecutionNamespace& m_namespace;
    std::vector<std::pair<std::string, std::optional<Value>>> m_saved;
};

Interpreter::Interpreter(ExecutionNamespace& ns, OutputCapture& output, std::optional<std::size_t> recordIndex)
    : m_namespace(ns),
      m_heap(ns.GetHeap()),
      m_budget(ns.GetHeap().GetBudget()),
      m_ctx{ns.GetHeap(), ns.GetHeap().GetBudget(), output, recordIndex} {}

void Interpreter::Execute(const Module& module) {
    Flow flow = ExecBlock(module.body);
    if (flow != Flow::Normal) {
        // The parser only accepts break/continue inside loops
        throw RuntimeError("'break' or 'continue' outside loop");
    }
}

// ============================================================================
// Statements
// ============================================================================

Interpreter::Flow Interpreter::ExecBlock(const StmtList& body) {
    for (const auto& stmt : body) {
        Flow flow = ExecStatement(*stmt);
        if (flow != Flow::Normal) {
            return flow;
        }
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::ExecStatement(const Stmt& stmt) {
    m_budget.Tick();

    try {
        if (const auto* exprStmt = dynamic_cast<const ExprStmt*>(&stmt)) {
            Evaluate(*exprStmt->value);
        } else if (const auto* assign = dynamic_cast<const Assign*>(&stmt)) {
            ExecAssign(*assign);
        } else if (const auto* augAssign = dynamic_cast<const AugAssign*>(&stmt)) {
            ExecAugAssign(*augAssign);
        } else if (const auto* ifStmt = dynamic_cast<const If*>(&stmt)) {
            return ExecBlock(Truthy(Evaluate(*ifStmt->test)) ? ifStmt->body : ifStmt->orelse);
        } else if (const auto* forStmt = dynamic_cast<const For*>(&stmt)) {
            return ExecFor(*forStmt);
        } else if (const auto* del = dynamic_cast<const Delete*>(&stmt)) {
            ExecDelete(*del);
        } else if (dynamic_cast<const Break*>(&stmt)) {
            return Flow::Break;
        } else if (dynamic_cast<const Continue*>(&stmt)) {
            return Flow::Continue;
        } else if (!dynamic_cast<const Pass*>(&stmt)) {
            throw std::logic_error("unhandled statement node");
        }
    } catch (ScriptError& error) {
        error.SetLocationIfUnset(stmt.lineno, stmt.col_offset);
        throw;
    }
    return Flow::Normal;
}

void Interpreter::ExecAssign(const Assign& stmt) {
    Value value = Evaluate(*stmt.value);
    // a = b = value assigns left to right
    for (const auto& target : stmt.targets) {
        AssignTo(*target, value);
    }
}

void Interpreter::ExecAugAssign(const AugAssign& stmt) {
    if (const auto* name = dynamic_cast<const Name*>(stmt.target.get())) {
        Value current = m_namespace.Get(name->id);
        Value operand = Evaluate(*stmt.value);
        m_namespace.Bind(name->id, InPlaceOp(stmt.op, current, operand));
        return;
    }

    if (const auto* subscript = dynamic_cast<const Subscript*>(stmt.target.get())) {
        // Container and key are evaluated once
        Value container = Evaluate(*subscript->value);
        if (const auto* slice = dynamic_cast<const Slice*>(subscript->slice.get())) {
            SliceArgs bounds = EvalSliceArgs(*slice);
            Value current = GetSlice(container, bounds.lower, bounds.upper, bounds.step, m_heap);
            Value operand = Evaluate(*stmt.value);
            SetSlice(container, bounds, InPlaceOp(stmt.op, current, operand));
            return;
        }
        Value key = Evaluate(*subscript->slice);
        Value current = GetItem(container, key);
        Value operand = Evaluate(*stmt.value);
        SetItem(container, key, InPlaceOp(stmt.op, current, operand));
        return;
    }

    throw TypeError("illegal expression for augmented assignment");
}

Value Interpreter::InPlaceOp(BinOpType op, const Value& current, const Value& operand) {
    // list += iterable extends the list itself
    if (op == BinOpType::Add && current.IsList()) {
        ListObject* list = current.AsList();
        m_heap.GuardWrite(*list);
        std::vector<Value> items = Materialize(operand, m_heap);
        m_heap.Charge(items.size());
        list->items.insert(list->items.end(), std::make_move_iterator(items.begin()),
                           std::make_move_iterator(items.end()));
        return current;
    }
    return BinaryOp(op, current, operand, m_heap);
}

template <typename Fn>
void Interpreter::ForEach(const Value& iterable, Fn&& body) {
    if (iterable.IsRange()) {
        const RangeValue range = iterable.AsRange();
        const std::size_t size = range.Size();
        for (std::size_t i = 0; i < size; ++i) {
            if (!body(Value::Int(range.At(i)))) return;
        }
        return;
    }
    if (iterable.IsSequenceObject()) {
        // Indexed so that appends made by the body are visited
        ListObject* list = iterable.AsList();
        for (std::size_t i = 0; i < list->items.size(); ++i) {
            Value item = list->items[i];
            if (!body(std::move(item))) return;
        }
        return;
    }
    if (iterable.IsDict()) {
        DictObject* dict = iterable.AsDict();
        const std::size_t size = dict->Size();
        for (std::size_t i = 0; i < size; ++i) {
            if (dict->Size() != size) {
                throw RuntimeError("dictionary changed size during iteration");
            }
            Value key = dict->entries[i].first;
            if (!body(std::move(key))) return;
        }
        if (dict->Size() != size) {
            throw RuntimeError("dictionary changed size during iteration");
        }
        return;
    }
    if (iterable.IsStr()) {
        const std::string text = iterable.AsStr();
        for (char c : text) {
            if (!body(m_heap.NewStr(std::string(1, c)))) return;
        }
        return;
    }
    throw TypeError(std::format("'{}' object is not iterable", iterable.TypeName()));
}

Interpreter::Flow Interpreter::ExecFor(const For& stmt) {
    Value iterable = Evaluate(*stmt.iter);

    ForEach(iterable, [&](Value item) {
        m_budget.Tick();
        AssignTo(*stmt.target, item);
        Flow flow = ExecBlock(stmt.body);
        return flow != Flow::Break;
    });
    return Flow::Normal;
}

void Interpreter::ExecDelete(const Delete& stmt) {
    for (const auto& target : stmt.targets) {
        const auto* subscript = dynamic_cast<const Subscript*>(target.get());
        if (!subscript) {
            throw TypeError("only subscripts can be deleted");
        }
        Value container = Evaluate(*subscript->value);
        DeleteItem(container, *subscript->slice);
    }
}

// ============================================================================
// Binding
// ============================================================================

void Interpreter::AssignTo(const Expr& target, const Value& value) {
    if (const auto* name = dynamic_cast<const Name*>(&target)) {
        m_namespace.Bind(name->id, value);
    } else if (const auto* tuple = dynamic_cast<const Tuple*>(&target)) {
        Unpack(tuple->elts, value);
    } else if (const auto* list = dynamic_cast<const List*>(&target)) {
        Unpack(list->elts, value);
    } else if (const auto* subscript = dynamic_cast<const Subscript*>(&target)) {
        Value container = Evaluate(*subscript->value);
        if (const auto* slice = dynamic_cast<const Slice*>(subscript->slice.get())) {
            SetSlice(container, EvalSliceArgs(*slice), value);
        } else {
            SetItem(container, Evaluate(*subscript->slice), value);
        }
    } else {
        throw TypeError("cannot assign to expression");
    }
}

void Interpreter::Unpack(const ExprList& targets, const Value& value) {
    std::vector<Value> items = Materialize(value, m_heap);
    if (items.size() < targets.size()) {
        throw ValueError(std::format("not enough values to unpack (expected {}, got {})", targets.size(), items.size()));
    }
    if (items.size() > targets.size()) {
        throw ValueError(std::format("too many values to unpack (expected {})", targets.size()));
    }
    for (std::size_t i = 0; i < targets.size(); ++i) {
        AssignTo(*targets[i], items[i]);
    }
}

void Interpreter::SetItem(const Value& container, const Value& key, const Value& value) {
    if (container.IsDict()) {
        DictObject* dict = container.AsDict();
        m_heap.GuardWrite(*dict);
        if (dict->Set(MakeDictKey(key), key, value)) {
            m_heap.Charge(1);
        }
        return;
    }
    if (container.IsSequenceObject()) {
        ListObject* list = container.AsList();
        m_heap.GuardWrite(*list);
        std::size_t index = NormalizeIndex(ListIndex(key, "list"), list->items.size(), "list assignment");
        list->items[index] = value;
        return;
    }
    throw TypeError(std::format("'{}' object does not support item assignment", container.TypeName()));
}

void Interpreter::SetSlice(const Value& container, const SliceArgs& args, const Value& value) {
    if (!container.IsSequenceObject()) {
        throw TypeError(std::format("'{}' object does not support item assignment", container.TypeName()));
    }
    ListObject* list = container.AsList();
    m_heap.GuardWrite(*list);

    std::vector<Value> items = Materialize(value, m_heap);
    SliceBounds bounds = ResolveSlice(args.lower, args.upper, args.step, list->items.size());

    if (bounds.step == 1) {
        auto begin = list->items.begin() + bounds.start;
        auto end = list->items.begin() + std::max(bounds.start, bounds.stop);
        if (items.size() > bounds.length) {
            m_heap.Charge(items.size() - bounds.length);
        }
        list->items.erase(begin, end);
        list->items.insert(list->items.begin() + bounds.start, items.begin(), items.end());
        return;
    }

    if (items.size() != bounds.length) {
        throw ValueError(std::format("attempt to assign sequence of size {} to extended slice of size {}",
                                     items.size(), bounds.length));
    }
    for (std::size_t i = 0; i < bounds.length; ++i) {
        list->items[static_cast<std::size_t>(bounds.start + static_cast<std::int64_t>(i) * bounds.step)] = items[i];
    }
}

void Interpreter::DeleteItem(const Value& container, const Expr& index) {
    if (container.IsDict()) {
        DictObject* dict = container.AsDict();
        m_heap.GuardWrite(*dict);
        Value key = Evaluate(index);
        if (!dict->Erase(MakeDictKey(key))) {
            throw KeyError(Repr(key));
        }
        return;
    }
    if (!container.IsSequenceObject()) {
        throw TypeError(std::format("'{}' object does not support item deletion", container.TypeName()));
    }

    ListObject* list = container.AsList();
    if (list->frozen) {
        throw TypeError("'tuple' object doesn't support item deletion");
    }
    m_heap.GuardWrite(*list);

    if (const auto* slice = dynamic_cast<const Slice*>(&index)) {
        SliceArgs args = EvalSliceArgs(*slice);
        SliceBounds bounds = ResolveSlice(args.lower, args.upper, args.step, list->items.size());
        std::vector<bool> doomed(list->items.size(), false);
        for (std::size_t i = 0; i < bounds.length; ++i) {
            doomed[static_cast<std::size_t>(bounds.start + static_cast<std::int64_t>(i) * bounds.step)] = true;
        }
        std::vector<Value> kept;
        kept.reserve(list->items.size() - bounds.length);
        for (std::size_t i = 0; i < list->items.size(); ++i) {
            if (!doomed[i]) kept.push_back(std::move(list->items[i]));
        }
        list->items = std::move(kept);
        return;
    }

    std::size_t position = NormalizeIndex(ListIndex(Evaluate(index), "list"), list->items.size(), "list assignment");
    list->items.erase(list->items.begin() + static_cast<std::ptrdiff_t>(position));
}

// ============================================================================
// Expressions
// ============================================================================

Value Interpreter::Evaluate(const Expr& expr) {
    m_budget.Tick();

    if (const auto* constant = dynamic_cast<const Constant*>(&expr)) {
        return std::visit(
            [this](const auto& value) -> Value {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return Value::None();
                } else if constexpr (std::is_same_v<T, bool>) {
                    return Value::Bool(value);
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    return Value::Int(value);
                } else if constexpr (std::is_same_v<T, double>) {
                    return Value::Float(value);
                } else {
                    return m_heap.NewStr(value);
                }
            },
            constant->value);
    }
    if (const auto* name = dynamic_cast<const Name*>(&expr)) {
        return m_namespace.Get(name->id);
    }
    if (const auto* binOp = dynamic_cast<const BinOp*>(&expr)) {
        Value lhs = Evaluate(*binOp->left);
        Value rhs = Evaluate(*binOp->right);
        return BinaryOp(binOp->op, lhs, rhs, m_heap);
    }
    if (const auto* unary = dynamic_cast<const signal_lambda::UnaryOp*>(&expr)) {
        Value operand = Evaluate(*unary->operand);
        if (unary->op == UnaryOpType::Not) {
            return Value::Bool(!Truthy(operand));
        }
        return UnaryOp(unary->op, operand);
    }
    if (const auto* boolOp = dynamic_cast<const BoolOp*>(&expr)) {
        return EvalBoolOp(*boolOp);
    }
    if (const auto* compare = dynamic_cast<const signal_lambda::Compare*>(&expr)) {
        return EvalCompare(*compare);
    }
    if (const auto* call = dynamic_cast<const Call*>(&expr)) {
        return EvalCall(*call);
    }
    if (const auto* attribute = dynamic_cast<const Attribute*>(&expr)) {
        return EvalAttribute(*attribute);
    }
    if (const auto* subscript = dynamic_cast<const Subscript*>(&expr)) {
        return EvalSubscript(*subscript);
    }
    if (const auto* ifExp = dynamic_cast<const IfExp*>(&expr)) {
        return Truthy(Evaluate(*ifExp->test)) ? Evaluate(*ifExp->body) : Evaluate(*ifExp->orelse);
    }
    if (const auto* list = dynamic_cast<const List*>(&expr)) {
        std::vector<Value> items;
        items.reserve(list->elts.size());
        for (const auto& elt : list->elts) {
            items.push_back(Evaluate(*elt));
        }
        return Value::List(m_heap.NewList(std::move(items)));
    }
    if (const auto* tuple = dynamic_cast<const Tuple*>(&expr)) {
        std::vector<Value> items;
        items.reserve(tuple->elts.size());
        for (const auto& elt : tuple->elts) {
            items.push_back(Evaluate(*elt));
        }
        return Value::List(m_heap.NewTuple(std::move(items)));
    }
    if (const auto* dict = dynamic_cast<const Dict*>(&expr)) {
        DictObject* object = m_heap.NewDict();
        for (std::size_t i = 0; i < dict->keys.size(); ++i) {
            Value key = Evaluate(*dict->keys[i]);
            Value value = Evaluate(*dict->values[i]);
            if (object->Set(MakeDictKey(key), key, std::move(value))) {
                m_heap.Charge(1);
            }
        }
        return Value::Dict(object);
    }
    if (const auto* listComp = dynamic_cast<const ListComp*>(&expr)) {
        return EvalListComp(*listComp);
    }
    if (const auto* dictComp = dynamic_cast<const DictComp*>(&expr)) {
        return EvalDictComp(*dictComp);
    }
    if (dynamic_cast<const Slice*>(&expr)) {
        throw TypeError("slice is only valid inside a subscript");
    }

    throw std::logic_error("unhandled expression node");
}

Value Interpreter::EvalCall(const Call& call) {
    if (const auto* name = dynamic_cast<const Name*>(call.func.get());
        name && grammar::TakesFunctionArgument(name->id)) {
        return EvalMapFilter(name->id, call);
    }

    PositionalArgs args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        args.push_back(Evaluate(*arg));
    }
    KeywordArgs kwargs;
    for (const auto& [name, value] : call.keywords) {
        kwargs.emplace_back(name, Evaluate(*value));
    }

    if (const auto* name = dynamic_cast<const Name*>(call.func.get())) {
        if (!grammar::IsBuiltin(name->id)) {
            const Value* bound = m_namespace.Lookup(name->id);
            throw TypeError(bound ? std::format("'{}' object is not callable", bound->TypeName())
                                  : std::format("name '{}' is not defined", name->id));
        }
        return CallBuiltin(name->id, args, kwargs, m_ctx);
    }

    if (const auto* attribute = dynamic_cast<const Attribute*>(call.func.get())) {
        const auto* base = dynamic_cast<const Name*>(attribute->value.get());
        if (base && base->id == "math" && !m_namespace.Lookup("math")) {
            return CallMath(attribute->attr, args, kwargs, m_ctx);
        }
        Value self = Evaluate(*attribute->value);
        return CallMethod(self, attribute->attr, args, kwargs, m_ctx);
    }

    Value callee = Evaluate(*call.func);
    throw TypeError(std::format("'{}' object is not callable", callee.TypeName()));
}

Value Interpreter::EvalMapFilter(const std::string& function, const Call& call) {
    m_ctx.budget.Tick();
    if (!call.keywords.empty()) {
        throw TypeError(std::format("{}() takes no keyword arguments", function));
    }
    const bool isFilter = function == "filter";
    if (isFilter && call.args.size() != 2) {
        throw TypeError(std::format("filter expected 2 arguments, got {}", call.args.size()));
    }
    if (call.args.size() < 2) {
        throw TypeError("map() must have at least two arguments.");
    }

    // The function is a builtin named in place; filter also takes None
    std::optional<std::string> callee;
    if (const auto* fname = dynamic_cast<const Name*>(call.args.front().get());
        fname && grammar::IsBuiltin(fname->id)) {
        callee = fname->id;
    } else {
        Value fn = Evaluate(*call.args.front());
        if (!isFilter || !fn.IsNone()) {
            throw TypeError(std::format("'{}' object is not callable", fn.TypeName()));
        }
    }

    std::vector<std::vector<Value>> columns;
    std::size_t shortest = std::numeric_limits<std::size_t>::max();
    for (std::size_t i = 1; i < call.args.size(); ++i) {
        columns.push_back(Materialize(Evaluate(*call.args[i]), m_heap));
        shortest = std::min(shortest, columns.back().size());
    }

    std::vector<Value> out;
    for (std::size_t row = 0; row < shortest; ++row) {
        m_ctx.budget.Tick();
        PositionalArgs args;
        for (const auto& column : columns) {
            args.push_back(column[row]);
        }
        KeywordArgs kwargs;
        if (isFilter) {
            const bool keep = callee ? Truthy(CallBuiltin(*callee, args, kwargs, m_ctx)) : Truthy(columns[0][row]);
            if (keep) {
                out.push_back(columns[0][row]);
            }
        } else {
            out.push_back(CallBuiltin(*callee, args, kwargs, m_ctx));
        }
    }
    return Value::List(m_heap.NewList(std::move(out)));
}

Value Interpreter::EvalAttribute(const Attribute& attribute) {
    const auto* base = dynamic_cast<const Name*>(attribute.value.get());
    if (base && base->id == "math") {
        return GetMathConstant(attribute.attr);
    }
    Value self = Evaluate(*attribute.value);
    throw AttributeError(std::format("'{}' object has no attribute '{}'", self.TypeName(), attribute.attr));
}

Interpreter::SliceArgs Interpreter::EvalSliceArgs(const Slice& slice) {
    SliceArgs args;
    if (slice.lower) args.lower = SliceIndex(Evaluate(*slice.lower));
    if (slice.upper) args.upper = SliceIndex(Evaluate(*slice.upper));
    if (slice.step) args.step = SliceIndex(Evaluate(*slice.step));
    return args;
}

Value Interpreter::EvalSubscript(const Subscript& subscript) {
    Value container = Evaluate(*subscript.value);
    if (const auto* slice = dynamic_cast<const Slice*>(subscript.slice.get())) {
        SliceArgs args = EvalSliceArgs(*slice);
        return GetSlice(container, args.lower, args.upper, args.step, m_heap);
    }
    return GetItem(container, Evaluate(*subscript.slice));
}

Value Interpreter::EvalCompare(const signal_lambda::Compare& compare) {
    Value lhs = Evaluate(*compare.left);
    for (std::size_t i = 0; i < compare.ops.size(); ++i) {
        Value rhs = Evaluate(*compare.comparators[i]);
        if (!Compare(compare.ops[i], lhs, rhs)) {
            return Value::Bool(false);
        }
        lhs = std::move(rhs);
    }
    return Value::Bool(true);
}

Value Interpreter::EvalBoolOp(const BoolOp& boolOp) {
    // Returns the deciding operand, not a bool
    Value result;
    for (const auto& operand : boolOp.values) {
        result = Evaluate(*operand);
        bool truthy = Truthy(result);
        if (boolOp.op == BinOpType::And ? !truthy : truthy) {
            return result;
        }
    }
    return result;
}

template <typename Fn>
void Interpreter::RunGenerators(const std::vector<Comprehension>& generators, std::size_t level, Fn&& emit) {
    if (level == generators.size()) {
        emit();
        return;
    }

    const Comprehension& generator = generators[level];
    Value iterable = Evaluate(*generator.iter);
    ForEach(iterable, [&](Value item) {
        m_budget.Tick();
        AssignTo(*generator.target, item);
        for (const auto& condition : generator.ifs) {
            if (!Truthy(Evaluate(*condition))) {
                return true;
            }
        }
        RunGenerators(generators, level + 1, emit);
        return true;
    });
}

Value Interpreter::EvalListComp(const ListComp& comp) {
    ComprehensionScope scope(m_namespace, comp.generators);
    ListObject* result = m_heap.NewList();
    RunGenerators(comp.generators, 0, [&]() {
        Value item = Evaluate(*comp.elt);
        m_heap.Charge(1);
        result->items.push_back(std::move(item));
    });
    return Value::List(result);
}

Value Interpreter::EvalDictComp(const DictComp& comp) {
    ComprehensionScope scope(m_namespace, comp.generators);
    DictObject* result = m_heap.NewDict();
    RunGenerators(comp.generators, 0, [&]() {
        Value key = Evaluate(*comp.key);
        Value value = Evaluate(*comp.value);
        if (result->Set(MakeDictKey(key), key, std::move(value))) {
            m_heap.Charge(1);
        }
    });
    return Value::Dict(result);
}

} // namespace signal_lambda::runtime
