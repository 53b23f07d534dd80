/*
 * autopo_internal.h
 *
 *  Internal declarations: the method body language (lexer, AST, parser,
 *  interpreter), the sandbox wire codec and diagnostics.
 */

#ifndef AUTOPO_INTERNAL_H
#define AUTOPO_INTERNAL_H

#include "autopoCore.h"
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <json/json.h>

#define AUTOPO_MAX_CALL_DEPTH 64
#define AUTOPO_DEFAULT_STEP_LIMIT 1000000
#define AUTOPO_MAX_NESTING 200

namespace autopo
{
    /** True when AUTOPO_DIAG is set; read once. */
    bool diagEnabled();

    //=========================================================================
    // Lexer
    //=========================================================================

    enum class TokenType
    {
        Identifier,
        Integer,
        Float,
        String,
        // Keywords
        Def, Let, If, Else, While, For, In, Return, Break, Continue,
        Commit, Raise, Import, From, Del, Pass, And, Or, Not,
        True, False, Null, Self,
        // Punctuation
        LeftParen, RightParen, LeftBrace, RightBrace, LeftBracket, RightBracket,
        Comma, Colon, Semicolon, Dot,
        Assign, PlusAssign, MinusAssign, StarAssign,
        Plus, Minus, Star, Slash, Percent,
        Equal, NotEqual, Less, LessEqual, Greater, GreaterEqual,
        EndOfInput
    };

    const char* toString(TokenType type);

    struct Token
    {
        TokenType type;
        std::string text;
        int line;
        int column;
    };

    /** Raised by the lexer and the parser; carries the source position. */
    class ParseError : public std::runtime_error
    {
    public:
        ParseError(const std::string& message, int line, int column);
        int getLine() const { return line; }
        int getColumn() const { return column; }

    private:
        int line;
        int column;
    };

    class Lexer
    {
    public:
        explicit Lexer(const std::string& source);
        std::vector<Token> tokenize();

    private:
        char current() const;
        char peek(int offset = 1) const;
        void advance();
        void skipWhitespaceAndComments();
        Token readNumber();
        Token readString();
        Token readIdentifier();
        Token makeToken(TokenType type, std::string text, int line, int column) const;

        const std::string& source;
        size_t pos;
        int line;
        int column;
    };

    //=========================================================================
    // AST
    //=========================================================================

    enum class NodeKind
    {
        Program,
        FunctionDef,
        Parameter,
        Block,
        Let,
        Assign,
        If,
        While,
        For,
        Return,
        Break,
        Continue,
        Commit,
        Raise,
        Import,
        Delete,
        Pass,
        ExpressionStatement,
        Literal,
        Name,
        SelfRef,
        Member,
        Index,
        Call,
        KeywordArgument,
        Binary,
        Unary,
        ListLiteral,
        MapLiteral,
        MapEntry
    };

    const char* toString(NodeKind kind);

    /**
     * @brief Uniform AST node.
     *
     * `text` holds the identifier, member name, operator or dotted module
     * path depending on the kind; `literal` holds Literal values.
     *
     * Children by kind:
     *  - FunctionDef: Parameter*, Block (last)
     *  - Parameter: [default expression]
     *  - Let/Assign: target (Assign only), value
     *  - If: condition, Block, [Block | If]
     *  - While: condition, Block
     *  - For: iterable, Block (loop variable in text)
     *  - Return: [value]; Raise: value; Delete: target
     *  - Member: object; Index: object, index
     *  - Call: callee, argument*, KeywordArgument*
     *  - Binary: left, right; Unary: operand
     */
    struct Node
    {
        NodeKind kind;
        int line;
        int column;
        std::string text;
        Value literal;
        std::vector<std::unique_ptr<Node>> children;
        // Levels in this subtree, the node itself included.
        int height;

        Node(NodeKind kind, int line, int column, std::string text = std::string());

        Node* add(std::unique_ptr<Node> child);
        const Node& child(size_t index) const { return *children.at(index); }
        size_t size() const { return children.size(); }
    };

    /** Pre-order walk over \a node and all of its descendants. */
    void walk(const Node& node, const std::function<void(const Node&)>& visitor);

    /** Returns the top-level definition named \a name, or nullptr. */
    const Node* findFunction(const Node& program, const std::string& name);

    //=========================================================================
    // Parser
    //=========================================================================

    class Parser
    {
    public:
        explicit Parser(std::vector<Token> tokens);

        std::unique_ptr<Node> parseProgram();

    private:
        const Token& current() const;
        const Token& peek(int offset = 1) const;
        bool check(TokenType type) const;
        bool match(TokenType type);
        const Token& expect(TokenType type, const char* what);
        [[noreturn]] void fail(const std::string& message) const;

        // Bounds recursion and tree height by AUTOPO_MAX_NESTING.
        class NestingGuard
        {
        public:
            explicit NestingGuard(Parser& parser);
            ~NestingGuard();

        private:
            Parser& parser;
        };
        std::unique_ptr<Node> checkHeight(std::unique_ptr<Node> node) const;

        std::unique_ptr<Node> parseFunction();
        std::unique_ptr<Node> parseImport();
        std::unique_ptr<Node> parseBlock();
        std::unique_ptr<Node> parseStatement();
        std::unique_ptr<Node> parseIf();
        std::unique_ptr<Node> parseSimpleStatement();

        std::unique_ptr<Node> parseExpression();
        std::unique_ptr<Node> parseOr();
        std::unique_ptr<Node> parseAnd();
        std::unique_ptr<Node> parseNot();
        std::unique_ptr<Node> parseComparison();
        std::unique_ptr<Node> parseAdditive();
        std::unique_ptr<Node> parseMultiplicative();
        std::unique_ptr<Node> parseUnary();
        std::unique_ptr<Node> parsePostfix();
        std::unique_ptr<Node> parsePrimary();

        std::vector<Token> tokens;
        size_t pos;
        int loopDepth;
        int nesting;
    };

    /** Lex and parse \a source. Throws ParseError. */
    std::unique_ptr<Node> parseSource(const std::string& source);

    //=========================================================================
    // Interpreter
    //=========================================================================

    /** A fault raised by a body while it runs (surfaced as ExecutionResult::error). */
    class ScriptError : public std::runtime_error
    {
    public:
        ScriptError(const std::string& type, const std::string& message, int line = 0);
        const std::string& getType() const { return type; }
        int getLine() const { return line; }
        /** "Type: message (line N)" */
        std::string describe() const;

    private:
        std::string type;
        int line;
    };

    /**
     * Splits \a text into its UTF-8 encoded code points. Returns false, with
     * \a out unspecified, when \a text is not well-formed UTF-8.
     */
    bool splitCodePoints(const std::string& text, std::vector<std::string>& out);

    /** True when every string in \a value, map keys included, is well-formed UTF-8. */
    bool isWellFormedUtf8(const Value& value);

    /**
     * @class Interpreter
     * @brief Tree-walking evaluator for one parsed body against one
     *        attribute snapshot. Runs inside the sandbox helper.
     */
    class Interpreter
    {
    public:
        Interpreter(const Node& program, AttributeMap attributes,
                    unsigned long stepLimit = AUTOPO_DEFAULT_STEP_LIMIT);

        /** Calls the definition named \a methodName with `self` first. Throws ScriptError. */
        Value invoke(const std::string& methodName, const ArgumentList& args, const KeywordArguments& kwargs);

        const AttributeMap& getAttributes() const { return attributes; }
        bool isDirty() const { return dirty; }
        bool isCommitted() const { return committed; }
        unsigned long getSteps() const { return steps; }

    private:
        struct Frame;
        enum class Flow { Normal, Break, Continue, Return };

        Value callFunction(const Node& function, ArgumentList args, const KeywordArguments& kwargs, bool passSelf);
        Flow execBlock(const Node& block, Frame& frame);
        Flow execStatement(const Node& statement, Frame& frame);
        Value evaluate(const Node& expression, Frame& frame);
        Value evaluateCall(const Node& call, Frame& frame);
        Value callBuiltin(const std::string& name, ArgumentList& args, const Node& site, Frame& frame);
        Value callValueMethod(const Node& receiver, const std::string& name, ArgumentList& args, const Node& site, Frame& frame);
        Value evaluateBinary(const Node& expression, Frame& frame);
        void assign(const Node& target, Value value, Frame& frame);
        Value& lvalueRef(const Node& target, Frame& frame);
        Value& selfAttributeRef(const std::string& name, const Node& site);
        void tick(const Node& site);

        const Node& program;
        AttributeMap attributes;
        unsigned long stepLimit;
        unsigned long steps;
        int callDepth;
        bool dirty;
        bool committed;
    };

    //=========================================================================
    // Wire codec (JSON)
    //=========================================================================

    Json::Value valueToJson(const Value& value);
    Value valueFromJson(const Json::Value& json);
    Json::Value documentToJson(const ObjectDocument& document);

    std::string encodeExecutionRequest(const ExecutionRequest& request, unsigned long stepLimit);
    /** Throws std::invalid_argument on a malformed document. */
    ExecutionRequest decodeExecutionRequest(const std::string& text, unsigned long& stepLimit);
    std::string encodeExecutionResult(const ExecutionResult& result);
    /** Throws std::invalid_argument on a malformed document. */
    ExecutionResult decodeExecutionResult(const std::string& text);

    std::string writeJson(const Json::Value& json);
    /** Throws std::invalid_argument when \a text is not JSON. */
    Json::Value readJson(const std::string& text);

    /** Runs one decoded request end to end; the sandbox helper's whole job. */
    ExecutionResult runSandboxed(const ExecutionRequest& request, unsigned long stepLimit);
}

#endif /* AUTOPO_INTERNAL_H */
