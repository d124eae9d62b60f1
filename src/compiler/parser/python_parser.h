//
// Lambda Python Parser
//
// Parses the restricted Python subset with tree-sitter-python and converts the
// concrete syntax tree into the owned lambda AST. Constructs that the AST cannot
// represent (imports, function/class definitions, while loops, lambdas, ...) are
// rejected here with a GrammarViolation pointing at the offending node.
//
// A parser instance is single-threaded; create one per compilation.
//

#pragma once

#include "ast_nodes.h"
#include <signal_lambda/core/sandbox_error.h>
#include <cpp-tree-sitter.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace signal_lambda {

class PythonParser {
public:
    PythonParser();

    // Throws GrammarViolation on syntax errors or unsupported constructs
    ModulePtr parse(const std::string& source);

    // Version of the tree-sitter-python grammar linked into this binary
    static std::uint32_t languageVersion();

private:
    std::optional<ts::Parser> parser_;
    std::size_t depth_ = 0;

    class DepthGuard {
    public:
        DepthGuard(PythonParser& parser, const ts::Node& node);
        ~DepthGuard() { --parser_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        PythonParser& parser_;
    };

    // Helper functions
    static std::string getNodeText(const ts::Node& node, std::string_view source);
    [[noreturn]] static void throwError(const std::string& msg, const ts::Node& node);
    static void setLocation(ASTNode& target, const ts::Node& node);
    static ts::Node findErrorNode(const ts::Node& node);
    static bool isPunctuation(std::string_view type);

    // Module and statement parsing
    ModulePtr parseModule(const ts::Node& node, std::string_view source);
    void parseStatementInto(const ts::Node& node, std::string_view source, StmtList& out);
    StmtList parseBlock(const ts::Node& node, std::string_view source);
    StmtPtr parseExprStmt(const ts::Node& node, std::string_view source);
    StmtPtr parseAssignment(const ts::Node& node, std::string_view source);
    StmtPtr parseAugmentedAssignment(const ts::Node& node, std::string_view source);
    StmtPtr parseIf(const ts::Node& node, std::string_view source);
    StmtPtr parseElif(const ts::Node& node, std::string_view source, uint32_t clauseIndex);
    StmtPtr parseFor(const ts::Node& node, std::string_view source);
    StmtPtr parseDelete(const ts::Node& node, std::string_view source);

    // Expression parsing
    ExprPtr parseExpression(const ts::Node& node, std::string_view source);
    ExprPtr parseName(const ts::Node& node, std::string_view source);
    ExprPtr parseConstant(const ts::Node& node, std::string_view source);
    ExprPtr parseString(const ts::Node& node, std::string_view source);
    ExprPtr parseAttribute(const ts::Node& node, std::string_view source);
    ExprPtr parseCall(const ts::Node& node, std::string_view source);
    ExprPtr parseBinaryOp(const ts::Node& node, std::string_view source);
    ExprPtr parseCompare(const ts::Node& node, std::string_view source);
    ExprPtr parseBoolOp(const ts::Node& node, std::string_view source);
    ExprPtr parseUnaryOp(const ts::Node& node, std::string_view source);
    ExprPtr parseIfExp(const ts::Node& node, std::string_view source);
    ExprPtr parseSubscript(const ts::Node& node, std::string_view source);
    ExprPtr parseSlice(const ts::Node& node, std::string_view source);
    ExprPtr parseTuple(const ts::Node& node, std::string_view source);
    ExprPtr parseList(const ts::Node& node, std::string_view source);
    ExprPtr parseDict(const ts::Node& node, std::string_view source);
    ExprPtr parseListComp(const ts::Node& node, std::string_view source);
    ExprPtr parseDictComp(const ts::Node& node, std::string_view source);
    std::vector<Comprehension> parseComprehensionClauses(const ts::Node& node, std::string_view source);

    static BinOpType parseBinOpType(const std::string& opText, const ts::Node& node);
    static BinOpType parseAugOpType(const std::string& opText, const ts::Node& node);
    static UnaryOpType parseUnaryOpType(const std::string& opText, const ts::Node& node);
    static std::string decodeStringLiteral(const std::string& text, const ts::Node& node);
};

} // namespace signal_lambda
