//
// Lambda Python Parser Implementation
//

#include "python_parser.h"
#include <signal_lambda/core/constants.h>
#include <tree_sitter/api.h>
#include <algorithm>
#include <charconv>
#include <format>

// Declare the tree-sitter-python language function
extern "C" {
    const TSLanguage *tree_sitter_python();
}

namespace signal_lambda {

namespace {

struct ForbiddenStatement {
    std::string_view type;
    std::string_view description;
};

// Statement kinds the lambda grammar never accepts
constexpr ForbiddenStatement kForbiddenStatements[] = {
    {"import_statement", "import"},
    {"import_from_statement", "import"},
    {"future_import_statement", "import"},
    {"function_definition", "function definition"},
    {"decorated_definition", "decorated definition"},
    {"class_definition", "class definition"},
    {"while_statement", "while loop (use a for loop over a finite iterable)"},
    {"with_statement", "with statement"},
    {"try_statement", "try statement"},
    {"raise_statement", "raise statement"},
    {"assert_statement", "assert statement"},
    {"global_statement", "global declaration"},
    {"nonlocal_statement", "nonlocal declaration"},
    {"return_statement", "return statement"},
    {"print_statement", "print statement"},
    {"exec_statement", "exec statement"},
    {"match_statement", "match statement"},
    {"type_alias_statement", "type alias"},
};

struct ForbiddenExpression {
    std::string_view type;
    std::string_view description;
};

constexpr ForbiddenExpression kForbiddenExpressions[] = {
    {"lambda", "lambda"},
    {"await", "await"},
    {"yield", "yield"},
    {"named_expression", "assignment expression (:=)"},
    {"list_splat", "argument unpacking"},
    {"dictionary_splat", "argument unpacking"},
    {"list_splat_pattern", "argument unpacking"},
    {"set", "set literal"},
    {"set_comprehension", "set comprehension"},
    {"ellipsis", "ellipsis"},
};

} // namespace

PythonParser::PythonParser() {
    // Initialize parser with Python language
    parser_.emplace(ts::Language{tree_sitter_python()});
}

std::uint32_t PythonParser::languageVersion() {
    return ts_language_version(tree_sitter_python());
}

PythonParser::DepthGuard::DepthGuard(PythonParser& parser, const ts::Node& node) : parser_(parser) {
    if (++parser_.depth_ > constants::kMaxNestingDepth) {
        --parser_.depth_;
        throwError(std::format("Code is nested too deeply (limit {})", constants::kMaxNestingDepth), node);
    }
}

ModulePtr PythonParser::parse(const std::string& source) {
    depth_ = 0;
    ts::Tree tree = parser_->parseString(source);

    ts::Node root = tree.getRootNode();

    // Check for parse errors
    if (root.hasError()) {
        ts::Node errorNode = findErrorNode(root);
        std::string near = getNodeText(errorNode, source);
        if (near.size() > 40) {
            near = near.substr(0, 40) + "...";
        }
        throwError(near.empty() ? "Syntax error" : "Syntax error near '" + near + "'", errorNode);
    }

    return parseModule(root, source);
}

// Helper functions
std::string PythonParser::getNodeText(const ts::Node& node, std::string_view source) {
    return std::string{node.getSourceRange(source)};
}

void PythonParser::throwError(const std::string& msg, const ts::Node& node) {
    auto range = node.getPointRange();
    throw GrammarViolation(msg, static_cast<int>(range.start.row + 1), static_cast<int>(range.start.column + 1));
}

void PythonParser::setLocation(ASTNode& target, const ts::Node& node) {
    auto range = node.getPointRange();
    target.lineno = static_cast<int>(range.start.row + 1);
    target.col_offset = static_cast<int>(range.start.column + 1);
}

ts::Node PythonParser::findErrorNode(const ts::Node& node) {
    if (node.getType() == "ERROR") {
        return node;
    }
    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (child.getType() == "ERROR" || child.hasError()) {
            return findErrorNode(child);
        }
    }
    // Nothing below carries the error: this is a MISSING node
    return node;
}

bool PythonParser::isPunctuation(std::string_view type) {
    return type == "(" || type == ")" || type == "[" || type == "]" || type == "{" ||
           type == "}" || type == "," || type == ":" || type == "comment";
}

// Module parsing
ModulePtr PythonParser::parseModule(const ts::Node& node, std::string_view source) {
    auto module = std::make_unique<Module>();

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        parseStatementInto(node.getChild(i), source, module->body);
    }

    return module;
}

// Statement parsing
void PythonParser::parseStatementInto(const ts::Node& node, std::string_view source, StmtList& out) {
    std::string type{node.getType()};

    // Skip comments and whitespace
    if (type == "comment" || type == "\n" || type == ";") {
        return;
    }

    if (type == "expression_statement") {
        out.push_back(parseExprStmt(node, source));
        return;
    } else if (type == "if_statement") {
        out.push_back(parseIf(node, source));
        return;
    } else if (type == "for_statement") {
        out.push_back(parseFor(node, source));
        return;
    } else if (type == "delete_statement") {
        out.push_back(parseDelete(node, source));
        return;
    } else if (type == "pass_statement") {
        auto stmt = std::make_unique<Pass>();
        setLocation(*stmt, node);
        out.push_back(std::move(stmt));
        return;
    } else if (type == "break_statement") {
        auto stmt = std::make_unique<Break>();
        setLocation(*stmt, node);
        out.push_back(std::move(stmt));
        return;
    } else if (type == "continue_statement") {
        auto stmt = std::make_unique<Continue>();
        setLocation(*stmt, node);
        out.push_back(std::move(stmt));
        return;
    }

    // Disallowed constructs
    for (const auto& forbidden : kForbiddenStatements) {
        if (type == forbidden.type) {
            throwError(std::format("Forbidden operation: {}", forbidden.description), node);
        }
    }

    throwError("Unsupported statement: " + type, node);
}

StmtList PythonParser::parseBlock(const ts::Node& node, std::string_view source) {
    DepthGuard guard{*this, node};
    StmtList body;

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        parseStatementInto(node.getChild(i), source, body);
    }

    return body;
}

StmtPtr PythonParser::parseExprStmt(const ts::Node& node, std::string_view source) {
    // Collect the expression children; `a, b` as a statement is a tuple
    std::vector<ts::Node> parts;
    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (!isPunctuation(child.getType())) {
            parts.push_back(child);
        }
    }

    if (parts.empty()) {
        throwError("Empty expression statement", node);
    }

    std::string childType{parts.front().getType()};
    if (parts.size() == 1 && childType == "assignment") {
        return parseAssignment(parts.front(), source);
    }
    if (parts.size() == 1 && childType == "augmented_assignment") {
        return parseAugmentedAssignment(parts.front(), source);
    }

    ExprPtr expr;
    if (parts.size() == 1) {
        expr = parseExpression(parts.front(), source);
    } else {
        auto tuple = std::make_unique<Tuple>();
        setLocation(*tuple, node);
        for (const auto& part : parts) {
            tuple->elts.push_back(parseExpression(part, source));
        }
        expr = std::move(tuple);
    }

    auto stmt = std::make_unique<ExprStmt>(std::move(expr));
    setLocation(*stmt, node);
    return stmt;
}

StmtPtr PythonParser::parseAssignment(const ts::Node& node, std::string_view source) {
    ts::Node leftNode = node.getChildByFieldName("left");
    ts::Node rightNode = node.getChildByFieldName("right");

    if (leftNode.isNull()) {
        throwError("Invalid assignment: missing target", node);
    }
    if (!node.getChildByFieldName("type").isNull()) {
        throwError("Type annotations are not supported", node);
    }
    if (rightNode.isNull()) {
        throwError("Invalid assignment: missing value", node);
    }

    // `a = b = value` nests assignments on the right; flatten into one Assign
    ExprList targets;
    targets.push_back(parseExpression(leftNode, source));
    while (std::string{rightNode.getType()} == "assignment") {
        ts::Node nextLeft = rightNode.getChildByFieldName("left");
        ts::Node nextRight = rightNode.getChildByFieldName("right");
        if (nextLeft.isNull() || nextRight.isNull()) {
            throwError("Invalid assignment: missing target or value", rightNode);
        }
        targets.push_back(parseExpression(nextLeft, source));
        rightNode = nextRight;
    }

    auto stmt = std::make_unique<Assign>(parseExpression(rightNode, source));
    stmt->targets = std::move(targets);
    setLocation(*stmt, node);
    return stmt;
}

StmtPtr PythonParser::parseAugmentedAssignment(const ts::Node& node, std::string_view source) {
    ts::Node leftNode = node.getChildByFieldName("left");
    ts::Node opNode = node.getChildByFieldName("operator");
    ts::Node rightNode = node.getChildByFieldName("right");

    if (leftNode.isNull() || opNode.isNull() || rightNode.isNull()) {
        throwError("Invalid augmented assignment", node);
    }

    BinOpType op = parseAugOpType(getNodeText(opNode, source), opNode);
    auto stmt = std::make_unique<AugAssign>(parseExpression(leftNode, source), op,
                                            parseExpression(rightNode, source));
    setLocation(*stmt, node);
    return stmt;
}

StmtPtr PythonParser::parseIf(const ts::Node& node, std::string_view source) {
    ts::Node conditionNode = node.getChildByFieldName("condition");
    ts::Node consequenceNode = node.getChildByFieldName("consequence");

    if (conditionNode.isNull() || consequenceNode.isNull()) {
        throwError("Invalid if statement: missing condition or body", node);
    }

    auto stmt = std::make_unique<If>(parseExpression(conditionNode, source));
    setLocation(*stmt, node);
    stmt->body = parseBlock(consequenceNode, source);

    // The alternative clauses follow the consequence as siblings
    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};
        if (childType == "elif_clause") {
            stmt->orelse.push_back(parseElif(node, source, i));
            break;
        }
        if (childType == "else_clause") {
            ts::Node bodyNode = child.getChildByFieldName("body");
            if (bodyNode.isNull()) {
                throwError("Invalid else clause: missing body", child);
            }
            stmt->orelse = parseBlock(bodyNode, source);
            break;
        }
    }

    return stmt;
}

// Turns the elif at clauseIndex (and everything after it) into a nested If
StmtPtr PythonParser::parseElif(const ts::Node& node, std::string_view source, uint32_t clauseIndex) {
    ts::Node clause = node.getChild(clauseIndex);
    DepthGuard guard{*this, clause};

    ts::Node conditionNode = clause.getChildByFieldName("condition");
    ts::Node consequenceNode = clause.getChildByFieldName("consequence");
    if (conditionNode.isNull() || consequenceNode.isNull()) {
        throwError("Invalid elif clause: missing condition or body", clause);
    }

    auto stmt = std::make_unique<If>(parseExpression(conditionNode, source));
    setLocation(*stmt, clause);
    stmt->body = parseBlock(consequenceNode, source);

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = clauseIndex + 1; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};
        if (childType == "elif_clause") {
            stmt->orelse.push_back(parseElif(node, source, i));
            break;
        }
        if (childType == "else_clause") {
            ts::Node bodyNode = child.getChildByFieldName("body");
            if (bodyNode.isNull()) {
                throwError("Invalid else clause: missing body", child);
            }
            stmt->orelse = parseBlock(bodyNode, source);
            break;
        }
    }

    return stmt;
}

StmtPtr PythonParser::parseFor(const ts::Node& node, std::string_view source) {
    if (node.getNumChildren() > 0 && node.getChild(0).getType() == "async") {
        throwError("Forbidden operation: async for", node);
    }
    if (!node.getChildByFieldName("alternative").isNull()) {
        throwError("for-else is not supported", node);
    }

    ts::Node leftNode = node.getChildByFieldName("left");
    ts::Node rightNode = node.getChildByFieldName("right");
    ts::Node bodyNode = node.getChildByFieldName("body");
    if (leftNode.isNull() || rightNode.isNull() || bodyNode.isNull()) {
        throwError("Invalid for loop: missing target, iterable or body", node);
    }

    auto stmt = std::make_unique<For>(parseExpression(leftNode, source), parseExpression(rightNode, source));
    setLocation(*stmt, node);
    stmt->body = parseBlock(bodyNode, source);
    return stmt;
}

StmtPtr PythonParser::parseDelete(const ts::Node& node, std::string_view source) {
    auto stmt = std::make_unique<Delete>();
    setLocation(*stmt, node);

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};
        if (childType == "del" || isPunctuation(childType)) {
            continue;
        }
        if (childType == "expression_list") {
            uint32_t count = child.getNumChildren();
            for (uint32_t j = 0; j < count; ++j) {
                ts::Node target = child.getChild(j);
                if (!isPunctuation(target.getType())) {
                    stmt->targets.push_back(parseExpression(target, source));
                }
            }
        } else {
            stmt->targets.push_back(parseExpression(child, source));
        }
    }

    if (stmt->targets.empty()) {
        throwError("Invalid del statement: missing target", node);
    }
    return stmt;
}

// Expression parsing
ExprPtr PythonParser::parseExpression(const ts::Node& node, std::string_view source) {
    DepthGuard guard{*this, node};
    std::string type{node.getType()};

    ExprPtr expr;
    if (type == "call") {
        expr = parseCall(node, source);
    } else if (type == "attribute") {
        expr = parseAttribute(node, source);
    } else if (type == "identifier") {
        expr = parseName(node, source);
    } else if (type == "string" || type == "concatenated_string") {
        expr = parseString(node, source);
    } else if (type == "integer" || type == "float" || type == "true" || type == "false" || type == "none") {
        expr = parseConstant(node, source);
    } else if (type == "binary_operator") {
        expr = parseBinaryOp(node, source);
    } else if (type == "comparison_operator") {
        expr = parseCompare(node, source);
    } else if (type == "boolean_operator") {
        expr = parseBoolOp(node, source);
    } else if (type == "unary_operator" || type == "not_operator") {
        // not_operator is a separate node type in tree-sitter for logical not
        expr = parseUnaryOp(node, source);
    } else if (type == "conditional_expression") {
        expr = parseIfExp(node, source);
    } else if (type == "subscript") {
        expr = parseSubscript(node, source);
    } else if (type == "slice") {
        expr = parseSlice(node, source);
    } else if (type == "tuple" || type == "pattern_list" || type == "tuple_pattern" ||
               type == "list_pattern" || type == "expression_list") {
        // Assignment and loop targets (a, b = ...) are handled as tuples
        expr = parseTuple(node, source);
    } else if (type == "list") {
        expr = parseList(node, source);
    } else if (type == "dictionary") {
        expr = parseDict(node, source);
    } else if (type == "list_comprehension" || type == "generator_expression") {
        expr = parseListComp(node, source);
    } else if (type == "dictionary_comprehension") {
        expr = parseDictComp(node, source);
    } else if (type == "parenthesized_expression") {
        // Unwrap parentheses
        ts::Node child = node.getChild(1);  // Skip opening paren
        return parseExpression(child, source);
    } else {
        for (const auto& forbidden : kForbiddenExpressions) {
            if (type == forbidden.type) {
                throwError(std::format("Forbidden operation: {}", forbidden.description), node);
            }
        }
        throwError("Unsupported expression type: " + type, node);
    }

    setLocation(*expr, node);
    return expr;
}

ExprPtr PythonParser::parseName(const ts::Node& node, std::string_view source) {
    std::string name = getNodeText(node, source);
    return std::make_unique<Name>(name);
}

ExprPtr PythonParser::parseConstant(const ts::Node& node, std::string_view source) {
    std::string type{node.getType()};
    std::string text = getNodeText(node, source);
    std::erase(text, '_');

    if (type == "integer") {
        if (!text.empty() && (text.back() == 'j' || text.back() == 'J')) {
            throwError("Complex numbers are not supported", node);
        }
        if (!text.empty() && (text.back() == 'l' || text.back() == 'L')) {
            text.pop_back();
        }

        int base = 10;
        std::string_view digits{text};
        if (digits.size() > 2 && digits[0] == '0') {
            char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
            if (prefix == 'x') base = 16;
            if (prefix == 'o') base = 8;
            if (prefix == 'b') base = 2;
            if (base != 10) digits.remove_prefix(2);
        }

        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
        if (ec == std::errc::result_out_of_range) {
            throwError("Integer literal out of range: " + text, node);
        }
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            throwError("Invalid integer literal: " + text, node);
        }
        return std::make_unique<Constant>(value);
    } else if (type == "float") {
        if (!text.empty() && (text.back() == 'j' || text.back() == 'J')) {
            throwError("Complex numbers are not supported", node);
        }
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            throwError("Invalid float literal: " + text, node);
        }
        return std::make_unique<Constant>(value);
    } else if (type == "true") {
        return std::make_unique<Constant>(true);
    } else if (type == "false") {
        return std::make_unique<Constant>(false);
    } else if (type == "none") {
        return std::make_unique<Constant>(std::monostate{});
    }

    throwError("Unknown constant type: " + type, node);
}

ExprPtr PythonParser::parseString(const ts::Node& node, std::string_view source) {
    std::string type{node.getType()};

    if (type == "concatenated_string") {
        // Adjacent literals: "a" "b"
        std::string joined;
        uint32_t childCount = node.getNumChildren();
        for (uint32_t i = 0; i < childCount; ++i) {
            ts::Node child = node.getChild(i);
            if (child.getType() != "string") {
                continue;
            }
            joined += decodeStringLiteral(getNodeText(child, source), child);
        }
        return std::make_unique<Constant>(joined);
    }

    return std::make_unique<Constant>(decodeStringLiteral(getNodeText(node, source), node));
}

std::string PythonParser::decodeStringLiteral(const std::string& text, const ts::Node& node) {
    // Split off the prefix (r, u, f, b and combinations)
    std::size_t quotePos = text.find_first_of("\"'");
    if (quotePos == std::string::npos) {
        throwError("Invalid string literal", node);
    }

    std::string prefix = text.substr(0, quotePos);
    std::ranges::transform(prefix, prefix.begin(), [](unsigned char c) { return std::tolower(c); });
    if (prefix.find('f') != std::string::npos) {
        throwError("Forbidden operation: f-string", node);
    }
    if (prefix.find('b') != std::string::npos) {
        throwError("Byte strings are not supported", node);
    }
    const bool raw = prefix.find('r') != std::string::npos;

    std::string str = text.substr(quotePos);

    // Check for triple quotes (""" or ''')
    if (str.length() >= 6 &&
        ((str.starts_with("\"\"\"") && str.ends_with("\"\"\"")) ||
         (str.starts_with("'''") && str.ends_with("'''")))) {
        str = str.substr(3, str.length() - 6);
    }
    // Check for single quotes (" or ')
    else if (str.length() >= 2 && str.front() == str.back()) {
        str = str.substr(1, str.length() - 2);
    } else {
        throwError("Invalid string literal", node);
    }

    if (raw) {
        return str;
    }

    std::string decoded;
    decoded.reserve(str.size());
    for (std::size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c != '\\' || i + 1 == str.size()) {
            decoded.push_back(c);
            continue;
        }

        char next = str[++i];
        switch (next) {
            case '\n': break;  // line continuation
            case '\\': decoded.push_back('\\'); break;
            case '\'': decoded.push_back('\''); break;
            case '"': decoded.push_back('"'); break;
            case 'n': decoded.push_back('\n'); break;
            case 't': decoded.push_back('\t'); break;
            case 'r': decoded.push_back('\r'); break;
            case '0': decoded.push_back('\0'); break;
            case 'x': {
                if (i + 2 >= str.size()) {
                    throwError("Truncated \\x escape in string literal", node);
                }
                unsigned int code = 0;
                auto [ptr, ec] = std::from_chars(str.data() + i + 1, str.data() + i + 3, code, 16);
                if (ec != std::errc{} || ptr != str.data() + i + 3) {
                    throwError("Invalid \\x escape in string literal", node);
                }
                decoded.push_back(static_cast<char>(code));
                i += 2;
                break;
            }
            default:
                // Unknown escapes are kept verbatim, as Python does
                decoded.push_back('\\');
                decoded.push_back(next);
                break;
        }
    }
    return decoded;
}

ExprPtr PythonParser::parseAttribute(const ts::Node& node, std::string_view source) {
    ts::Node objectNode = node.getChildByFieldName("object");
    ts::Node attributeNode = node.getChildByFieldName("attribute");

    if (objectNode.isNull() || attributeNode.isNull()) {
        throwError("Invalid attribute access", node);
    }

    auto object = parseExpression(objectNode, source);
    std::string attr = getNodeText(attributeNode, source);

    return std::make_unique<Attribute>(std::move(object), attr);
}

ExprPtr PythonParser::parseCall(const ts::Node& node, std::string_view source) {
    ts::Node funcNode = node.getChildByFieldName("function");
    ts::Node argsNode = node.getChildByFieldName("arguments");

    if (funcNode.isNull()) {
        throwError("Invalid call: missing function", node);
    }

    auto func = parseExpression(funcNode, source);
    auto call = std::make_unique<Call>(std::move(func));

    if (argsNode.isNull()) {
        return call;
    }

    // sum(x for x in values): the generator is the whole argument list
    if (argsNode.getType() == "generator_expression") {
        auto generator = parseListComp(argsNode, source);
        setLocation(*generator, argsNode);
        call->args.push_back(std::move(generator));
        return call;
    }

    // Parse arguments
    uint32_t childCount = argsNode.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = argsNode.getChild(i);
        std::string childType{child.getType()};

        if (isPunctuation(childType)) {
            continue;  // Skip delimiters and comments
        }

        if (childType == "keyword_argument") {
            ts::Node nameNode = child.getChildByFieldName("name");
            ts::Node valueNode = child.getChildByFieldName("value");
            if (nameNode.isNull() || valueNode.isNull()) {
                throwError("Invalid keyword argument", child);
            }

            std::string name = getNodeText(nameNode, source);
            auto value = parseExpression(valueNode, source);
            call->keywords.emplace_back(name, std::move(value));
        } else {
            if (!call->keywords.empty()) {
                throwError("Positional argument follows keyword argument", child);
            }
            // Positional argument
            call->args.push_back(parseExpression(child, source));
        }
    }

    return call;
}

BinOpType PythonParser::parseBinOpType(const std::string& opText, const ts::Node& node) {
    if (opText == "+") return BinOpType::Add;
    if (opText == "-") return BinOpType::Sub;
    if (opText == "*") return BinOpType::Mult;
    if (opText == "/") return BinOpType::Div;
    if (opText == "//") return BinOpType::FloorDiv;
    if (opText == "%") return BinOpType::Mod;
    if (opText == "**") return BinOpType::Pow;
    if (opText == "<") return BinOpType::Lt;
    if (opText == ">") return BinOpType::Gt;
    if (opText == "<=") return BinOpType::LtE;
    if (opText == ">=") return BinOpType::GtE;
    if (opText == "==") return BinOpType::Eq;
    if (opText == "!=") return BinOpType::NotEq;
    if (opText == "in") return BinOpType::In;
    if (opText == "not in") return BinOpType::NotIn;
    if (opText == "is") return BinOpType::Is;
    if (opText == "is not") return BinOpType::IsNot;
    if (opText == "and") return BinOpType::And;
    if (opText == "or") return BinOpType::Or;

    if (opText == "&" || opText == "|" || opText == "^" || opText == "<<" || opText == ">>" || opText == "@") {
        throwError("Forbidden operator: " + opText, node);
    }
    throwError("Unknown binary operator: " + opText, node);
}

BinOpType PythonParser::parseAugOpType(const std::string& opText, const ts::Node& node) {
    if (opText.size() < 2 || opText.back() != '=') {
        throwError("Unknown augmented assignment operator: " + opText, node);
    }
    BinOpType op = parseBinOpType(opText.substr(0, opText.size() - 1), node);
    switch (op) {
        case BinOpType::Add:
        case BinOpType::Sub:
        case BinOpType::Mult:
        case BinOpType::Div:
        case BinOpType::FloorDiv:
        case BinOpType::Mod:
        case BinOpType::Pow:
            return op;
        default:
            throwError("Unsupported augmented assignment operator: " + opText, node);
    }
}

UnaryOpType PythonParser::parseUnaryOpType(const std::string& opText, const ts::Node& node) {
    if (opText == "not") return UnaryOpType::Not;
    if (opText == "-") return UnaryOpType::USub;
    if (opText == "+") return UnaryOpType::UAdd;
    if (opText == "~") {
        throwError("Forbidden operator: ~", node);
    }

    throwError("Unknown unary operator: " + opText, node);
}

ExprPtr PythonParser::parseBinaryOp(const ts::Node& node, std::string_view source) {
    ts::Node leftNode = node.getChildByFieldName("left");
    ts::Node opNode = node.getChildByFieldName("operator");
    ts::Node rightNode = node.getChildByFieldName("right");

    if (leftNode.isNull() || opNode.isNull() || rightNode.isNull()) {
        throwError("Invalid binary operation", node);
    }

    BinOpType op = parseBinOpType(getNodeText(opNode, source), opNode);
    auto left = parseExpression(leftNode, source);
    auto right = parseExpression(rightNode, source);

    return std::make_unique<BinOp>(op, std::move(left), std::move(right));
}

ExprPtr PythonParser::parseCompare(const ts::Node& node, std::string_view source) {
    // comparison_operator: left operand, then alternating operator tokens and operands.
    // `not in` / `is not` arrive either as one aliased token or as two tokens.
    if (node.getNumChildren() < 3) {
        throwError("Invalid comparison: missing operand", node);
    }

    auto compare = std::make_unique<Compare>(parseExpression(node.getChild(0), source));

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 1; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};

        if (childType == "comment") {
            continue;
        }

        if (childType == "not" && i + 1 < childCount && node.getChild(i + 1).getType() == "in") {
            compare->ops.push_back(BinOpType::NotIn);
            ++i;
        } else if (childType == "is" && i + 1 < childCount && node.getChild(i + 1).getType() == "not") {
            compare->ops.push_back(BinOpType::IsNot);
            ++i;
        } else if (childType == "<" || childType == ">" || childType == "<=" || childType == ">=" ||
                   childType == "==" || childType == "!=" || childType == "in" || childType == "not in" ||
                   childType == "is" || childType == "is not" || childType == "<>") {
            if (childType == "<>") {
                throwError("Unsupported operator: <>", child);
            }
            compare->ops.push_back(parseBinOpType(childType, child));
        } else {
            compare->comparators.push_back(parseExpression(child, source));
        }
    }

    if (compare->ops.empty() || compare->ops.size() != compare->comparators.size()) {
        throwError("Invalid comparison: operators and operands do not match", node);
    }

    return compare;
}

ExprPtr PythonParser::parseBoolOp(const ts::Node& node, std::string_view source) {
    ts::Node leftNode = node.getChildByFieldName("left");
    ts::Node opNode = node.getChildByFieldName("operator");
    ts::Node rightNode = node.getChildByFieldName("right");

    if (leftNode.isNull() || opNode.isNull() || rightNode.isNull()) {
        throwError("Invalid boolean operation", node);
    }

    BinOpType op = parseBinOpType(getNodeText(opNode, source), opNode);
    auto boolOp = std::make_unique<BoolOp>(op);

    // Flatten chained boolean operations (like Python's ast module)
    // e.g., "a and b and c" becomes BoolOp([a, b, c]) instead of BoolOp(BoolOp(a, b), c)
    auto append = [&](ExprPtr expr) {
        if (auto* nested = dynamic_cast<BoolOp*>(expr.get()); nested && nested->op == op) {
            for (auto& val : nested->values) {
                boolOp->values.push_back(std::move(val));
            }
        } else {
            boolOp->values.push_back(std::move(expr));
        }
    };

    append(parseExpression(leftNode, source));
    append(parseExpression(rightNode, source));

    return boolOp;
}

ExprPtr PythonParser::parseUnaryOp(const ts::Node& node, std::string_view source) {
    std::string nodeType{node.getType()};

    // not_operator has different structure: "not" keyword is first child, argument is second
    if (nodeType == "not_operator") {
        if (node.getNumChildren() < 2) {
            throwError("Invalid not_operator: missing argument", node);
        }

        auto operand = parseExpression(node.getChild(1), source);
        return std::make_unique<UnaryOp>(UnaryOpType::Not, std::move(operand));
    }

    // For unary_operator: use field names
    ts::Node opNode = node.getChildByFieldName("operator");
    ts::Node operandNode = node.getChildByFieldName("argument");

    if (opNode.isNull() || operandNode.isNull()) {
        throwError("Invalid unary operator: missing operator or argument", node);
    }

    UnaryOpType op = parseUnaryOpType(getNodeText(opNode, source), opNode);
    auto operand = parseExpression(operandNode, source);

    return std::make_unique<UnaryOp>(op, std::move(operand));
}

ExprPtr PythonParser::parseIfExp(const ts::Node& node, std::string_view source) {
    // conditional_expression has no named fields, structure is:
    // child[0]: body, child[1]: "if", child[2]: test, child[3]: "else", child[4]: orelse
    if (node.getNumChildren() < 5) {
        throwError("Invalid conditional expression: missing body, test, or else clause", node);
    }

    auto test = parseExpression(node.getChild(2), source);
    auto body = parseExpression(node.getChild(0), source);
    auto orelse = parseExpression(node.getChild(4), source);

    return std::make_unique<IfExp>(std::move(test), std::move(body), std::move(orelse));
}

ExprPtr PythonParser::parseSubscript(const ts::Node& node, std::string_view source) {
    ts::Node valueNode = node.getChildByFieldName("value");
    if (valueNode.isNull()) {
        throwError("Invalid subscript: missing value", node);
    }

    // Everything after the value that is not punctuation is an index
    std::vector<ts::Node> indices;
    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 1; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (!isPunctuation(child.getType())) {
            indices.push_back(child);
        }
    }

    if (indices.empty()) {
        throwError("Invalid subscript: missing index", node);
    }
    if (indices.size() > 1) {
        throwError("Multiple subscripts are not supported", node);
    }

    auto value = parseExpression(valueNode, source);
    auto slice = parseExpression(indices.front(), source);

    return std::make_unique<Subscript>(std::move(value), std::move(slice));
}

ExprPtr PythonParser::parseSlice(const ts::Node& node, std::string_view source) {
    // slice: [lower] ':' [upper] [':' [step]] without field names
    auto slice = std::make_unique<Slice>();
    int position = 0;

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};

        if (childType == ":") {
            ++position;
            continue;
        }
        if (childType == "comment") {
            continue;
        }

        auto expr = parseExpression(child, source);
        switch (position) {
            case 0: slice->lower = std::move(expr); break;
            case 1: slice->upper = std::move(expr); break;
            case 2: slice->step = std::move(expr); break;
            default: throwError("Invalid slice", node);
        }
    }

    return slice;
}

ExprPtr PythonParser::parseTuple(const ts::Node& node, std::string_view source) {
    auto tuple = std::make_unique<Tuple>();

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (isPunctuation(child.getType())) {
            continue;  // Skip delimiters and comments
        }
        tuple->elts.push_back(parseExpression(child, source));
    }

    return tuple;
}

ExprPtr PythonParser::parseList(const ts::Node& node, std::string_view source) {
    auto list = std::make_unique<List>();

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (isPunctuation(child.getType())) {
            continue;  // Skip delimiters and comments
        }
        list->elts.push_back(parseExpression(child, source));
    }

    return list;
}

ExprPtr PythonParser::parseDict(const ts::Node& node, std::string_view source) {
    auto dict = std::make_unique<Dict>();

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};

        if (isPunctuation(childType)) {
            continue;  // Skip delimiters and comments
        }

        // Each child should be a "pair" node with key and value
        if (childType != "pair") {
            if (childType == "dictionary_splat") {
                throwError("Forbidden operation: argument unpacking", child);
            }
            throwError("Invalid dictionary entry: " + childType, child);
        }

        ts::Node keyNode = child.getChildByFieldName("key");
        ts::Node valueNode = child.getChildByFieldName("value");
        if (keyNode.isNull() || valueNode.isNull()) {
            throwError("Invalid dictionary entry: missing key or value", child);
        }

        dict->keys.push_back(parseExpression(keyNode, source));
        dict->values.push_back(parseExpression(valueNode, source));
    }

    return dict;
}

std::vector<Comprehension> PythonParser::parseComprehensionClauses(const ts::Node& node, std::string_view source) {
    std::vector<Comprehension> generators;

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};

        if (childType == "for_in_clause") {
            if (child.getNumChildren() > 0 && child.getChild(0).getType() == "async") {
                throwError("Forbidden operation: async comprehension", child);
            }
            ts::Node leftNode = child.getChildByFieldName("left");
            ts::Node rightNode = child.getChildByFieldName("right");
            if (leftNode.isNull() || rightNode.isNull()) {
                throwError("Invalid comprehension: missing target or iterable", child);
            }
            Comprehension generator;
            generator.target = parseExpression(leftNode, source);
            generator.iter = parseExpression(rightNode, source);
            generators.push_back(std::move(generator));
        } else if (childType == "if_clause") {
            if (generators.empty() || child.getNumChildren() < 2) {
                throwError("Invalid comprehension condition", child);
            }
            generators.back().ifs.push_back(parseExpression(child.getChild(1), source));
        }
    }

    if (generators.empty()) {
        throwError("Invalid comprehension: missing for clause", node);
    }
    return generators;
}

ExprPtr PythonParser::parseListComp(const ts::Node& node, std::string_view source) {
    ts::Node bodyNode = node.getChildByFieldName("body");
    if (bodyNode.isNull()) {
        throwError("Invalid comprehension: missing element", node);
    }

    auto comp = std::make_unique<ListComp>();
    comp->elt = parseExpression(bodyNode, source);
    comp->generators = parseComprehensionClauses(node, source);
    return comp;
}

ExprPtr PythonParser::parseDictComp(const ts::Node& node, std::string_view source) {
    ts::Node bodyNode = node.getChildByFieldName("body");
    if (bodyNode.isNull() || bodyNode.getType() != "pair") {
        throwError("Invalid dictionary comprehension: missing key/value pair", node);
    }

    ts::Node keyNode = bodyNode.getChildByFieldName("key");
    ts::Node valueNode = bodyNode.getChildByFieldName("value");
    if (keyNode.isNull() || valueNode.isNull()) {
        throwError("Invalid dictionary comprehension: missing key or value", bodyNode);
    }

    auto comp = std::make_unique<DictComp>();
    comp->key = parseExpression(keyNode, source);
    comp->value = parseExpression(valueNode, source);
    comp->generators = parseComprehensionClauses(node, source);
    return comp;
}

const char* BinOpSymbol(BinOpType op) {
    switch (op) {
        case BinOpType::Add: return "+";
        case BinOpType::Sub: return "-";
        case BinOpType::Mult: return "*";
        case BinOpType::Div: return "/";
        case BinOpType::FloorDiv: return "//";
        case BinOpType::Mod: return "%";
        case BinOpType::Pow: return "**";
        case BinOpType::Lt: return "<";
        case BinOpType::Gt: return ">";
        case BinOpType::LtE: return "<=";
        case BinOpType::GtE: return ">=";
        case BinOpType::Eq: return "==";
        case BinOpType::NotEq: return "!=";
        case BinOpType::In: return "in";
        case BinOpType::NotIn: return "not in";
        case BinOpType::Is: return "is";
        case BinOpType::IsNot: return "is not";
        case BinOpType::And: return "and";
        case BinOpType::Or: return "or";
    }
    return "?";
}

} // namespace signal_lambda
