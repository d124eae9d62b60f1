//
// Grammar validator: parse, then walk the AST against the lambda grammar
//

#include <signal_lambda/compiler/grammar_validator.h>
#include <signal_lambda/core/constants.h>
#include "parser/python_parser.h"
#include "error_formatting/argument_error.h"
#include "lambda_grammar.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <cctype>
#include <set>
#include <tuple>

namespace signal_lambda {

namespace {

enum class NameContext {
    Load,
    Store,
    CallTarget,
    AttributeBase
};

bool IsPredefined(std::string_view name) {
    return name == constants::kSignalsName || name == constants::kSignalName ||
           name == constants::kResultName;
}

// Walks a parsed module and throws GrammarViolation on the first construct
// the sandbox does not admit. Also determines the execution mode.
class LambdaChecker {
public:
    void Check(const Module& module) {
        for (const auto& stmt : module.body) {
            CollectBindings(*stmt);
        }
        for (const auto& stmt : module.body) {
            CheckStmt(*stmt);
        }

        if (m_signalUse && m_signalsUse) {
            const auto& later = std::max(*m_signalUse, *m_signalsUse, [](const auto& a, const auto& b) {
                return std::tie(a.line, a.column) < std::tie(b.line, b.column);
            });
            throw GrammarViolation(
                "Code may reference either 'signal' (per-record) or 'signals' (batch), not both", later);
        }
    }

    [[nodiscard]] ExecutionMode GetMode() const {
        return m_signalUse ? ExecutionMode::PerRecord : ExecutionMode::Batch;
    }

private:
    std::set<std::string, std::less<>> m_bound;
    std::optional<SourceLocation> m_signalUse;
    std::optional<SourceLocation> m_signalsUse;

    [[noreturn]] static void ThrowError(const std::string& msg, const ASTNode& node) {
        throw GrammarViolation(msg, node.lineno, node.col_offset);
    }

    // ------------------------------------------------------------------
    // Pass 1: every name the program binds, wherever it binds it
    // ------------------------------------------------------------------

    void CollectTarget(const Expr& target) {
        if (auto* name = dynamic_cast<const Name*>(&target)) {
            m_bound.insert(name->id);
        } else if (auto* tuple = dynamic_cast<const Tuple*>(&target)) {
            for (const auto& elt : tuple->elts) {
                CollectTarget(*elt);
            }
        } else if (auto* list = dynamic_cast<const List*>(&target)) {
            for (const auto& elt : list->elts) {
                CollectTarget(*elt);
            }
        }
    }

    void CollectComprehensions(const std::vector<Comprehension>& generators) {
        for (const auto& generator : generators) {
            CollectTarget(*generator.target);
            CollectExprBindings(*generator.iter);
        }
    }

    void CollectExprBindings(const Expr& expr) {
        if (auto* comp = dynamic_cast<const ListComp*>(&expr)) {
            CollectComprehensions(comp->generators);
            CollectExprBindings(*comp->elt);
        } else if (auto* dcomp = dynamic_cast<const DictComp*>(&expr)) {
            CollectComprehensions(dcomp->generators);
        } else if (auto* call = dynamic_cast<const Call*>(&expr)) {
            for (const auto& arg : call->args) {
                CollectExprBindings(*arg);
            }
        }
    }

    void CollectBindings(const Stmt& stmt) {
        if (auto* assign = dynamic_cast<const Assign*>(&stmt)) {
            for (const auto& target : assign->targets) {
                CollectTarget(*target);
            }
            CollectExprBindings(*assign->value);
        } else if (auto* loop = dynamic_cast<const For*>(&stmt)) {
            CollectTarget(*loop->target);
            CollectExprBindings(*loop->iter);
            for (const auto& child : loop->body) {
                CollectBindings(*child);
            }
        } else if (auto* branch = dynamic_cast<const If*>(&stmt)) {
            for (const auto& child : branch->body) {
                CollectBindings(*child);
            }
            for (const auto& child : branch->orelse) {
                CollectBindings(*child);
            }
        } else if (auto* exprStmt = dynamic_cast<const ExprStmt*>(&stmt)) {
            CollectExprBindings(*exprStmt->value);
        } else if (auto* aug = dynamic_cast<const AugAssign*>(&stmt)) {
            CollectExprBindings(*aug->value);
        }
    }

    // ------------------------------------------------------------------
    // Pass 2: admission rules, in source order
    // ------------------------------------------------------------------

    void CheckBlock(const StmtList& body) {
        for (const auto& stmt : body) {
            CheckStmt(*stmt);
        }
    }

    void CheckStmt(const Stmt& stmt) {
        if (auto* exprStmt = dynamic_cast<const ExprStmt*>(&stmt)) {
            CheckExpr(*exprStmt->value);
        } else if (auto* assign = dynamic_cast<const Assign*>(&stmt)) {
            CheckExpr(*assign->value);
            for (const auto& target : assign->targets) {
                CheckTarget(*target);
            }
        } else if (auto* aug = dynamic_cast<const AugAssign*>(&stmt)) {
            if (!dynamic_cast<const Name*>(aug->target.get()) &&
                !dynamic_cast<const Subscript*>(aug->target.get())) {
                ThrowError("Invalid augmented assignment target", *aug->target);
            }
            CheckExpr(*aug->target);
            CheckTarget(*aug->target);
            CheckExpr(*aug->value);
        } else if (auto* branch = dynamic_cast<const If*>(&stmt)) {
            CheckExpr(*branch->test);
            CheckBlock(branch->body);
            CheckBlock(branch->orelse);
        } else if (auto* loop = dynamic_cast<const For*>(&stmt)) {
            CheckExpr(*loop->iter);
            CheckTarget(*loop->target);
            CheckBlock(loop->body);
        } else if (auto* del = dynamic_cast<const Delete*>(&stmt)) {
            for (const auto& target : del->targets) {
                if (!dynamic_cast<const Subscript*>(target.get())) {
                    ThrowError("Only subscripts can be deleted (del x[key])", *target);
                }
                CheckExpr(*target);
            }
        } else if (dynamic_cast<const Pass*>(&stmt) || dynamic_cast<const Break*>(&stmt) ||
                   dynamic_cast<const Continue*>(&stmt)) {
            return;
        } else {
            ThrowError("Unsupported statement", stmt);
        }
    }

    void CheckTarget(const Expr& target) {
        if (auto* name = dynamic_cast<const Name*>(&target)) {
            CheckName(*name, NameContext::Store);
        } else if (auto* subscript = dynamic_cast<const Subscript*>(&target)) {
            CheckExpr(*subscript->value);
            CheckExpr(*subscript->slice);
        } else if (auto* tuple = dynamic_cast<const Tuple*>(&target)) {
            for (const auto& elt : tuple->elts) {
                CheckTarget(*elt);
            }
        } else if (auto* list = dynamic_cast<const List*>(&target)) {
            for (const auto& elt : list->elts) {
                CheckTarget(*elt);
            }
        } else if (auto* attribute = dynamic_cast<const Attribute*>(&target)) {
            if (attribute->attr.starts_with("_")) {
                ThrowError("Forbidden attribute access: " + attribute->attr, target);
            }
            ThrowError("Attribute assignment is not allowed: " + attribute->attr, target);
        } else {
            ThrowError("Invalid assignment target", target);
        }
    }

    void CheckName(const Name& name, NameContext ctx) {
        const std::string& id = name.id;

        if (grammar::IsDeniedName(id)) {
            ThrowError(std::format("Forbidden {}: {}", ctx == NameContext::CallTarget ? "function" : "name", id),
                       name);
        }
        if (id.starts_with("__")) {
            ThrowError("Forbidden name: " + id, name);
        }

        if (id == constants::kSignalName && !m_signalUse) {
            m_signalUse = SourceLocation{name.lineno, name.col_offset};
        } else if (id == constants::kSignalsName && !m_signalsUse) {
            m_signalsUse = SourceLocation{name.lineno, name.col_offset};
        }

        if (ctx == NameContext::Store) {
            if (grammar::IsBuiltin(id) || id == constants::kMathName) {
                ThrowError("Cannot assign to predefined name: " + id, name);
            }
            return;
        }

        if (grammar::IsBuiltin(id)) {
            if (ctx != NameContext::CallTarget) {
                ThrowError(std::format("Builtin '{}' can only be called directly", id), name);
            }
            return;
        }
        if (id == constants::kMathName) {
            if (ctx != NameContext::AttributeBase) {
                ThrowError("'math' can only be used as math.<name>", name);
            }
            return;
        }
        if (ctx == NameContext::CallTarget) {
            ThrowError(std::format("'{}' is not callable", id), name);
        }
        if (IsPredefined(id) || m_bound.contains(id)) {
            return;
        }

        std::vector<std::string> known{m_bound.begin(), m_bound.end()};
        known.emplace_back(constants::kSignalsName);
        known.emplace_back(constants::kSignalName);
        known.emplace_back(constants::kResultName);
        for (const auto& builtin : grammar::Builtins()) {
            known.emplace_back(builtin.name);
        }
        ThrowError(error_formatting::UnknownIdentifierError(id, known).Format(), name);
    }

    void CheckAttribute(const Attribute& attribute, NameContext ctx) {
        const std::string& attr = attribute.attr;

        // Reserved-prefix access is rejected before looking at the receiver
        if (attr.starts_with("_")) {
            ThrowError("Forbidden attribute access: " + attr, attribute);
        }

        if (auto* base = dynamic_cast<const Name*>(attribute.value.get());
            base && base->id == constants::kMathName) {
            CheckName(*base, NameContext::AttributeBase);
            if (grammar::IsMathConstant(attr)) {
                if (ctx == NameContext::CallTarget) {
                    ThrowError(std::format("'math.{}' is not callable", attr), attribute);
                }
                return;
            }
            if (grammar::IsMathFunction(attr)) {
                if (ctx != NameContext::CallTarget) {
                    ThrowError(std::format("Math function 'math.{}' can only be called directly", attr), attribute);
                }
                return;
            }
            ThrowError("Unknown math member: math." + attr, attribute);
        }

        CheckExpr(*attribute.value);

        if (!grammar::IsMethod(attr)) {
            ThrowError("Unsupported attribute: " + attr, attribute);
        }
        if (ctx != NameContext::CallTarget) {
            ThrowError(std::format("Method '{}' can only be called directly", attr), attribute);
        }
    }

    void CheckComprehensions(const std::vector<Comprehension>& generators) {
        for (const auto& generator : generators) {
            CheckExpr(*generator.iter);
            CollectTarget(*generator.target);
            CheckTarget(*generator.target);
            for (const auto& condition : generator.ifs) {
                CheckExpr(*condition);
            }
        }
    }

    void CheckExpr(const Expr& expr) {
        if (auto* name = dynamic_cast<const Name*>(&expr)) {
            CheckName(*name, NameContext::Load);
        } else if (dynamic_cast<const Constant*>(&expr)) {
            return;
        } else if (auto* attribute = dynamic_cast<const Attribute*>(&expr)) {
            CheckAttribute(*attribute, NameContext::Load);
        } else if (auto* call = dynamic_cast<const Call*>(&expr)) {
            const Expr* functionArgument = nullptr;
            if (auto* fname = dynamic_cast<const Name*>(call->func.get())) {
                CheckName(*fname, NameContext::CallTarget);
                if (grammar::TakesFunctionArgument(fname->id) && !call->args.empty()) {
                    functionArgument = call->args.front().get();
                }
            } else if (auto* method = dynamic_cast<const Attribute*>(call->func.get())) {
                CheckAttribute(*method, NameContext::CallTarget);
            } else {
                ThrowError("Only builtins and methods can be called", *call->func);
            }
            for (const auto& arg : call->args) {
                // map(str, xs) passes a builtin by name
                auto* passed = dynamic_cast<const Name*>(arg.get());
                if (arg.get() == functionArgument && passed && grammar::IsBuiltin(passed->id)) {
                    CheckName(*passed, NameContext::CallTarget);
                } else {
                    CheckExpr(*arg);
                }
            }
            for (const auto& [keyword, value] : call->keywords) {
                if (keyword.starts_with("_")) {
                    ThrowError("Forbidden keyword argument: " + keyword, *value);
                }
                CheckExpr(*value);
            }
        } else if (auto* binop = dynamic_cast<const BinOp*>(&expr)) {
            CheckExpr(*binop->left);
            CheckExpr(*binop->right);
        } else if (auto* unary = dynamic_cast<const UnaryOp*>(&expr)) {
            CheckExpr(*unary->operand);
        } else if (auto* boolop = dynamic_cast<const BoolOp*>(&expr)) {
            for (const auto& value : boolop->values) {
                CheckExpr(*value);
            }
        } else if (auto* compare = dynamic_cast<const Compare*>(&expr)) {
            CheckExpr(*compare->left);
            for (const auto& comparator : compare->comparators) {
                CheckExpr(*comparator);
            }
        } else if (auto* ifexp = dynamic_cast<const IfExp*>(&expr)) {
            CheckExpr(*ifexp->test);
            CheckExpr(*ifexp->body);
            CheckExpr(*ifexp->orelse);
        } else if (auto* subscript = dynamic_cast<const Subscript*>(&expr)) {
            CheckExpr(*subscript->value);
            CheckExpr(*subscript->slice);
        } else if (auto* slice = dynamic_cast<const Slice*>(&expr)) {
            for (const auto* part : {slice->lower.get(), slice->upper.get(), slice->step.get()}) {
                if (part) {
                    CheckExpr(*part);
                }
            }
        } else if (auto* tuple = dynamic_cast<const Tuple*>(&expr)) {
            for (const auto& elt : tuple->elts) {
                CheckExpr(*elt);
            }
        } else if (auto* list = dynamic_cast<const List*>(&expr)) {
            for (const auto& elt : list->elts) {
                CheckExpr(*elt);
            }
        } else if (auto* dict = dynamic_cast<const Dict*>(&expr)) {
            for (std::size_t i = 0; i < dict->keys.size(); ++i) {
                CheckExpr(*dict->keys[i]);
                CheckExpr(*dict->values[i]);
            }
        } else if (auto* comp = dynamic_cast<const ListComp*>(&expr)) {
            CheckComprehensions(comp->generators);
            CheckExpr(*comp->elt);
        } else if (auto* dcomp = dynamic_cast<const DictComp*>(&expr)) {
            CheckComprehensions(dcomp->generators);
            CheckExpr(*dcomp->key);
            CheckExpr(*dcomp->value);
        } else {
            ThrowError("Unsupported expression", expr);
        }
    }
};

bool IsBlank(std::string_view code) {
    return std::ranges::all_of(code, [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

CompiledLambda GrammarValidator::Compile(std::string_view code) const {
    if (IsBlank(code)) {
        throw GrammarViolation("Empty code provided");
    }
    if (code.size() > constants::kMaxCodeLength) {
        throw GrammarViolation(std::format("Code too long ({} characters, limit {})", code.size(),
                                           constants::kMaxCodeLength));
    }

    PythonParser parser;
    ModulePtr module = parser.parse(std::string{code});

    LambdaChecker checker;
    checker.Check(*module);

    return CompiledLambda{.module = std::shared_ptr<const Module>(std::move(module)), .mode = checker.GetMode()};
}

ValidationResult GrammarValidator::Validate(std::string_view code) const {
    try {
        [[maybe_unused]] auto compiled = Compile(code);
        return ValidationResult{.valid = true};
    } catch (const GrammarViolation& e) {
        SPDLOG_DEBUG("Lambda rejected by grammar validator: {}", e.what());
        ValidationDiagnostic diagnostic{.message = e.what()};
        if (const auto& location = e.GetLocation()) {
            diagnostic.line = location->line;
            diagnostic.column = location->column;
        }
        return ValidationResult{.valid = false, .error = std::move(diagnostic)};
    }
}

} // namespace signal_lambda
