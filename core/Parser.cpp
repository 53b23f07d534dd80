/*
 * Parser.cpp
 *
 *  Recursive descent parser producing the uniform AST used by the
 *  auditor and the interpreter.
 */

#include "../headers/autopo_internal.h"
#include <cerrno>

namespace autopo
{
    //=========================================================================
    // Node
    //=========================================================================

    Node::Node(NodeKind kind, int line, int column, std::string text) :
        kind(kind), line(line), column(column), text(std::move(text)), height(1)
    {
    }

    Node* Node::add(std::unique_ptr<Node> child)
    {
        if (child->height + 1 > height)
            height = child->height + 1;
        children.push_back(std::move(child));
        return children.back().get();
    }

    void walk(const Node& node, const std::function<void(const Node&)>& visitor)
    {
        visitor(node);
        for (const auto& child : node.children)
            walk(*child, visitor);
    }

    const Node* findFunction(const Node& program, const std::string& name)
    {
        for (const auto& child : program.children)
        {
            if (child->kind == NodeKind::FunctionDef && child->text == name)
                return child.get();
        }
        return nullptr;
    }

    const char* toString(NodeKind kind)
    {
        switch (kind)
        {
        case NodeKind::Program: return "Program";
        case NodeKind::FunctionDef: return "FunctionDef";
        case NodeKind::Parameter: return "Parameter";
        case NodeKind::Block: return "Block";
        case NodeKind::Let: return "Let";
        case NodeKind::Assign: return "Assign";
        case NodeKind::If: return "If";
        case NodeKind::While: return "While";
        case NodeKind::For: return "For";
        case NodeKind::Return: return "Return";
        case NodeKind::Break: return "Break";
        case NodeKind::Continue: return "Continue";
        case NodeKind::Commit: return "Commit";
        case NodeKind::Raise: return "Raise";
        case NodeKind::Import: return "Import";
        case NodeKind::Delete: return "Delete";
        case NodeKind::Pass: return "Pass";
        case NodeKind::ExpressionStatement: return "ExpressionStatement";
        case NodeKind::Literal: return "Literal";
        case NodeKind::Name: return "Name";
        case NodeKind::SelfRef: return "SelfRef";
        case NodeKind::Member: return "Member";
        case NodeKind::Index: return "Index";
        case NodeKind::Call: return "Call";
        case NodeKind::KeywordArgument: return "KeywordArgument";
        case NodeKind::Binary: return "Binary";
        case NodeKind::Unary: return "Unary";
        case NodeKind::ListLiteral: return "ListLiteral";
        case NodeKind::MapLiteral: return "MapLiteral";
        case NodeKind::MapEntry: return "MapEntry";
        }
        return "Node";
    }

    //=========================================================================
    // Parser
    //=========================================================================

    namespace {
        bool isAssignable(const Node& node)
        {
            return node.kind == NodeKind::Name || node.kind == NodeKind::Member || node.kind == NodeKind::Index;
        }

        std::unique_ptr<Node> makeNode(NodeKind kind, const Token& at, std::string text = std::string())
        {
            return std::make_unique<Node>(kind, at.line, at.column, std::move(text));
        }
    }

    Parser::Parser(std::vector<Token> tokens) : tokens(std::move(tokens)), pos(0), loopDepth(0), nesting(0)
    {
        if (this->tokens.empty() || this->tokens.back().type != TokenType::EndOfInput)
            this->tokens.push_back(Token{TokenType::EndOfInput, "", 0, 0});
    }

    const Token& Parser::current() const
    {
        return tokens[pos];
    }

    const Token& Parser::peek(int offset) const
    {
        const size_t at = pos + offset;
        return at < tokens.size() ? tokens[at] : tokens.back();
    }

    bool Parser::check(TokenType type) const
    {
        return current().type == type;
    }

    bool Parser::match(TokenType type)
    {
        if (!check(type)) return false;
        if (pos + 1 < tokens.size()) pos++;
        return true;
    }

    const Token& Parser::expect(TokenType type, const char* what)
    {
        if (!check(type))
            fail(std::string("expected ") + what + " but found " + toString(current().type) +
                 (current().text.empty() ? "" : " '" + current().text + "'"));
        const Token& token = tokens[pos];
        if (pos + 1 < tokens.size()) pos++;
        return token;
    }

    void Parser::fail(const std::string& message) const
    {
        throw ParseError(message, current().line, current().column);
    }

    Parser::NestingGuard::NestingGuard(Parser& parser) : parser(parser)
    {
        if (++parser.nesting > AUTOPO_MAX_NESTING)
        {
            parser.nesting--;
            parser.fail("nesting too deep");
        }
    }

    Parser::NestingGuard::~NestingGuard()
    {
        parser.nesting--;
    }

    /**
     * @brief Left-associative chains grow the tree without recursing, so
     * their height is checked as each link is added.
     */
    std::unique_ptr<Node> Parser::checkHeight(std::unique_ptr<Node> node) const
    {
        if (node->height > AUTOPO_MAX_NESTING)
            throw ParseError("nesting too deep", node->line, node->column);
        return node;
    }

    /**
     * @brief program := (def | import)*
     *
     * Only definitions and import statements may appear at top level. The
     * imports are kept in the tree so the auditor can reject them.
     */
    std::unique_ptr<Node> Parser::parseProgram()
    {
        auto program = makeNode(NodeKind::Program, current());
        while (!check(TokenType::EndOfInput))
        {
            if (check(TokenType::Def))
            {
                auto function = parseFunction();
                for (const auto& existing : program->children)
                {
                    if (existing->kind == NodeKind::FunctionDef && existing->text == function->text)
                        throw ParseError("duplicate definition of '" + function->text + "'", function->line, function->column);
                }
                program->add(std::move(function));
            }
            else if (check(TokenType::Import) || check(TokenType::From))
            {
                program->add(parseImport());
            }
            else
            {
                fail("only 'def' and 'import' are allowed at top level");
            }
        }
        return program;
    }

    std::unique_ptr<Node> Parser::parseFunction()
    {
        const Token& keyword = expect(TokenType::Def, "'def'");
        const Token& name = expect(TokenType::Identifier, "function name");
        auto function = std::make_unique<Node>(NodeKind::FunctionDef, keyword.line, keyword.column, name.text);

        expect(TokenType::LeftParen, "'('");
        bool sawDefault = false;
        if (!check(TokenType::RightParen))
        {
            do
            {
                if (check(TokenType::Self))
                {
                    if (!function->children.empty())
                        fail("'self' must be the first parameter");
                    function->add(makeNode(NodeKind::Parameter, current(), "self"));
                    match(TokenType::Self);
                    continue;
                }
                const Token& parameter = expect(TokenType::Identifier, "parameter name");
                for (const auto& existing : function->children)
                {
                    if (existing->text == parameter.text)
                        throw ParseError("duplicate parameter '" + parameter.text + "'", parameter.line, parameter.column);
                }
                auto node = makeNode(NodeKind::Parameter, parameter, parameter.text);
                if (match(TokenType::Assign))
                {
                    node->add(parseExpression());
                    sawDefault = true;
                }
                else if (sawDefault)
                {
                    throw ParseError("parameter '" + parameter.text + "' without default follows a default",
                                     parameter.line, parameter.column);
                }
                function->add(std::move(node));
            } while (match(TokenType::Comma));
        }
        expect(TokenType::RightParen, "')'");
        function->add(parseBlock());
        return function;
    }

    std::unique_ptr<Node> Parser::parseImport()
    {
        const Token& start = current();
        std::string path;
        std::string imported;
        if (match(TokenType::From))
        {
            path = expect(TokenType::Identifier, "module name").text;
            while (match(TokenType::Dot))
                path += "." + expect(TokenType::Identifier, "module name").text;
            expect(TokenType::Import, "'import'");
            imported = expect(TokenType::Identifier, "imported name").text;
            path += ":" + imported;
        }
        else
        {
            expect(TokenType::Import, "'import'");
            path = expect(TokenType::Identifier, "module name").text;
            while (match(TokenType::Dot))
                path += "." + expect(TokenType::Identifier, "module name").text;
        }
        expect(TokenType::Semicolon, "';'");
        return makeNode(NodeKind::Import, start, path);
    }

    std::unique_ptr<Node> Parser::parseBlock()
    {
        NestingGuard guard(*this);
        const Token& open = expect(TokenType::LeftBrace, "'{'");
        auto block = makeNode(NodeKind::Block, open);
        while (!check(TokenType::RightBrace))
        {
            if (check(TokenType::EndOfInput))
                fail("unterminated block, expected '}'");
            block->add(parseStatement());
        }
        expect(TokenType::RightBrace, "'}'");
        return block;
    }

    std::unique_ptr<Node> Parser::parseStatement()
    {
        const Token& start = current();
        switch (start.type)
        {
        case TokenType::Let:
            {
                match(TokenType::Let);
                const Token& name = expect(TokenType::Identifier, "variable name");
                auto let = makeNode(NodeKind::Let, start, name.text);
                expect(TokenType::Assign, "'='");
                let->add(parseExpression());
                expect(TokenType::Semicolon, "';'");
                return let;
            }
        case TokenType::If:
            return parseIf();
        case TokenType::While:
            {
                match(TokenType::While);
                auto loop = makeNode(NodeKind::While, start);
                expect(TokenType::LeftParen, "'('");
                loop->add(parseExpression());
                expect(TokenType::RightParen, "')'");
                loopDepth++;
                loop->add(parseBlock());
                loopDepth--;
                return loop;
            }
        case TokenType::For:
            {
                match(TokenType::For);
                expect(TokenType::LeftParen, "'('");
                const Token& variable = expect(TokenType::Identifier, "loop variable");
                auto loop = makeNode(NodeKind::For, start, variable.text);
                expect(TokenType::In, "'in'");
                loop->add(parseExpression());
                expect(TokenType::RightParen, "')'");
                loopDepth++;
                loop->add(parseBlock());
                loopDepth--;
                return loop;
            }
        case TokenType::Return:
            {
                match(TokenType::Return);
                auto ret = makeNode(NodeKind::Return, start);
                if (!check(TokenType::Semicolon))
                    ret->add(parseExpression());
                expect(TokenType::Semicolon, "';'");
                return ret;
            }
        case TokenType::Break:
        case TokenType::Continue:
            {
                if (loopDepth == 0)
                    fail(std::string(toString(start.type)) + " outside of a loop");
                match(start.type);
                expect(TokenType::Semicolon, "';'");
                return makeNode(start.type == TokenType::Break ? NodeKind::Break : NodeKind::Continue, start);
            }
        case TokenType::Commit:
            match(TokenType::Commit);
            expect(TokenType::Semicolon, "';'");
            return makeNode(NodeKind::Commit, start);
        case TokenType::Pass:
            match(TokenType::Pass);
            expect(TokenType::Semicolon, "';'");
            return makeNode(NodeKind::Pass, start);
        case TokenType::Raise:
            {
                match(TokenType::Raise);
                auto raise = makeNode(NodeKind::Raise, start);
                raise->add(parseExpression());
                expect(TokenType::Semicolon, "';'");
                return raise;
            }
        case TokenType::Import:
        case TokenType::From:
            return parseImport();
        case TokenType::Del:
            {
                match(TokenType::Del);
                auto del = makeNode(NodeKind::Delete, start);
                auto target = parseExpression();
                if (!isAssignable(*target))
                    throw ParseError("cannot delete this expression", target->line, target->column);
                del->add(std::move(target));
                expect(TokenType::Semicolon, "';'");
                return del;
            }
        case TokenType::Def:
            fail("nested definitions are not supported");
        default:
            return parseSimpleStatement();
        }
    }

    std::unique_ptr<Node> Parser::parseIf()
    {
        NestingGuard guard(*this);
        const Token& start = expect(TokenType::If, "'if'");
        auto node = makeNode(NodeKind::If, start);
        expect(TokenType::LeftParen, "'('");
        node->add(parseExpression());
        expect(TokenType::RightParen, "')'");
        node->add(parseBlock());
        if (match(TokenType::Else))
        {
            if (check(TokenType::If))
                node->add(parseIf());
            else
                node->add(parseBlock());
        }
        return node;
    }

    /**
     * @brief Expression statement or assignment; `a op= b` becomes `a = a op b`.
     */
    std::unique_ptr<Node> Parser::parseSimpleStatement()
    {
        const Token& start = current();
        const size_t targetStart = pos;
        auto expression = parseExpression();

        if (check(TokenType::Assign) || check(TokenType::PlusAssign) ||
            check(TokenType::MinusAssign) || check(TokenType::StarAssign))
        {
            const Token& op = current();
            if (!isAssignable(*expression))
                throw ParseError("cannot assign to this expression", expression->line, expression->column);
            pos++;
            auto value = parseExpression();
            expect(TokenType::Semicolon, "';'");

            auto assign = makeNode(NodeKind::Assign, start);
            if (op.type == TokenType::Assign)
            {
                assign->add(std::move(expression));
                assign->add(std::move(value));
                return assign;
            }

            // Re-parse the target so the read side is an independent subtree.
            const char* symbol = op.type == TokenType::PlusAssign ? "+" : (op.type == TokenType::MinusAssign ? "-" : "*");
            const size_t resume = pos;
            pos = targetStart;
            auto readSide = parsePostfix();
            pos = resume;

            auto binary = makeNode(NodeKind::Binary, op, symbol);
            binary->add(std::move(readSide));
            binary->add(std::move(value));
            assign->add(std::move(expression));
            assign->add(std::move(binary));
            return assign;
        }

        expect(TokenType::Semicolon, "';'");
        auto statement = makeNode(NodeKind::ExpressionStatement, start);
        statement->add(std::move(expression));
        return statement;
    }

    std::unique_ptr<Node> Parser::parseExpression()
    {
        NestingGuard guard(*this);
        return checkHeight(parseOr());
    }

    std::unique_ptr<Node> Parser::parseOr()
    {
        auto left = parseAnd();
        while (check(TokenType::Or))
        {
            const Token& op = current();
            match(TokenType::Or);
            auto node = makeNode(NodeKind::Binary, op, "or");
            node->add(std::move(left));
            node->add(parseAnd());
            left = checkHeight(std::move(node));
        }
        return left;
    }

    std::unique_ptr<Node> Parser::parseAnd()
    {
        auto left = parseNot();
        while (check(TokenType::And))
        {
            const Token& op = current();
            match(TokenType::And);
            auto node = makeNode(NodeKind::Binary, op, "and");
            node->add(std::move(left));
            node->add(parseNot());
            left = checkHeight(std::move(node));
        }
        return left;
    }

    std::unique_ptr<Node> Parser::parseNot()
    {
        if (check(TokenType::Not))
        {
            const Token& op = current();
            match(TokenType::Not);
            NestingGuard guard(*this);
            auto node = makeNode(NodeKind::Unary, op, "not");
            node->add(parseNot());
            return node;
        }
        return parseComparison();
    }

    std::unique_ptr<Node> Parser::parseComparison()
    {
        auto left = parseAdditive();
        const Token& op = current();
        std::string symbol;
        switch (op.type)
        {
        case TokenType::Equal: symbol = "=="; break;
        case TokenType::NotEqual: symbol = "!="; break;
        case TokenType::Less: symbol = "<"; break;
        case TokenType::LessEqual: symbol = "<="; break;
        case TokenType::Greater: symbol = ">"; break;
        case TokenType::GreaterEqual: symbol = ">="; break;
        case TokenType::In: symbol = "in"; break;
        case TokenType::Not:
            if (peek().type != TokenType::In)
                return left;
            symbol = "not in";
            pos++;
            break;
        default:
            return left;
        }
        pos++;
        auto node = makeNode(NodeKind::Binary, op, symbol);
        node->add(std::move(left));
        node->add(parseAdditive());
        return node;
    }

    std::unique_ptr<Node> Parser::parseAdditive()
    {
        auto left = parseMultiplicative();
        while (check(TokenType::Plus) || check(TokenType::Minus))
        {
            const Token& op = current();
            pos++;
            auto node = makeNode(NodeKind::Binary, op, op.text);
            node->add(std::move(left));
            node->add(parseMultiplicative());
            left = checkHeight(std::move(node));
        }
        return left;
    }

    std::unique_ptr<Node> Parser::parseMultiplicative()
    {
        auto left = parseUnary();
        while (check(TokenType::Star) || check(TokenType::Slash) || check(TokenType::Percent))
        {
            const Token& op = current();
            pos++;
            auto node = makeNode(NodeKind::Binary, op, op.text);
            node->add(std::move(left));
            node->add(parseUnary());
            left = checkHeight(std::move(node));
        }
        return left;
    }

    std::unique_ptr<Node> Parser::parseUnary()
    {
        if (check(TokenType::Minus))
        {
            const Token& op = current();
            pos++;
            NestingGuard guard(*this);
            auto node = makeNode(NodeKind::Unary, op, "-");
            node->add(parseUnary());
            return node;
        }
        return parsePostfix();
    }

    std::unique_ptr<Node> Parser::parsePostfix()
    {
        auto expression = parsePrimary();
        while (true)
        {
            const Token& at = current();
            if (match(TokenType::Dot))
            {
                const Token& name = expect(TokenType::Identifier, "member name");
                auto member = makeNode(NodeKind::Member, at, name.text);
                member->add(std::move(expression));
                expression = checkHeight(std::move(member));
            }
            else if (match(TokenType::LeftBracket))
            {
                auto index = makeNode(NodeKind::Index, at);
                index->add(std::move(expression));
                index->add(parseExpression());
                expect(TokenType::RightBracket, "']'");
                expression = checkHeight(std::move(index));
            }
            else if (match(TokenType::LeftParen))
            {
                auto call = makeNode(NodeKind::Call, at);
                call->add(std::move(expression));
                bool sawKeyword = false;
                if (!check(TokenType::RightParen))
                {
                    do
                    {
                        if (check(TokenType::Identifier) && peek().type == TokenType::Assign)
                        {
                            const Token& name = current();
                            pos += 2;
                            auto keyword = makeNode(NodeKind::KeywordArgument, name, name.text);
                            keyword->add(parseExpression());
                            for (size_t i = 1; i < call->size(); ++i)
                            {
                                if (call->child(i).kind == NodeKind::KeywordArgument && call->child(i).text == name.text)
                                    throw ParseError("keyword argument '" + name.text + "' repeated", name.line, name.column);
                            }
                            call->add(std::move(keyword));
                            sawKeyword = true;
                        }
                        else
                        {
                            if (sawKeyword)
                                fail("positional argument follows keyword argument");
                            call->add(parseExpression());
                        }
                    } while (match(TokenType::Comma));
                }
                expect(TokenType::RightParen, "')'");
                expression = checkHeight(std::move(call));
            }
            else
            {
                return expression;
            }
        }
    }

    std::unique_ptr<Node> Parser::parsePrimary()
    {
        const Token& token = current();
        switch (token.type)
        {
        case TokenType::Integer:
            {
                errno = 0;
                const long long value = std::strtoll(token.text.c_str(), nullptr, 10);
                if (errno == ERANGE)
                    fail("integer literal out of range");
                auto literal = makeNode(NodeKind::Literal, token, token.text);
                literal->literal = Value(value);
                pos++;
                return literal;
            }
        case TokenType::Float:
            {
                auto literal = makeNode(NodeKind::Literal, token, token.text);
                literal->literal = Value(std::strtod(token.text.c_str(), nullptr));
                pos++;
                return literal;
            }
        case TokenType::String:
            {
                auto literal = makeNode(NodeKind::Literal, token);
                literal->literal = Value(token.text);
                pos++;
                return literal;
            }
        case TokenType::True:
        case TokenType::False:
            {
                auto literal = makeNode(NodeKind::Literal, token, token.text);
                literal->literal = Value(token.type == TokenType::True);
                pos++;
                return literal;
            }
        case TokenType::Null:
            pos++;
            return makeNode(NodeKind::Literal, token, "null");
        case TokenType::Self:
            pos++;
            return makeNode(NodeKind::SelfRef, token, "self");
        case TokenType::Identifier:
            pos++;
            return makeNode(NodeKind::Name, token, token.text);
        case TokenType::LeftParen:
            {
                pos++;
                auto inner = parseExpression();
                expect(TokenType::RightParen, "')'");
                return inner;
            }
        case TokenType::LeftBracket:
            {
                pos++;
                auto list = makeNode(NodeKind::ListLiteral, token);
                if (!check(TokenType::RightBracket))
                {
                    do
                    {
                        if (check(TokenType::RightBracket)) break;
                        list->add(parseExpression());
                    } while (match(TokenType::Comma));
                }
                expect(TokenType::RightBracket, "']'");
                return list;
            }
        case TokenType::LeftBrace:
            {
                pos++;
                auto map = makeNode(NodeKind::MapLiteral, token);
                if (!check(TokenType::RightBrace))
                {
                    do
                    {
                        if (check(TokenType::RightBrace)) break;
                        auto entry = makeNode(NodeKind::MapEntry, current());
                        entry->add(parseExpression());
                        expect(TokenType::Colon, "':'");
                        entry->add(parseExpression());
                        map->add(std::move(entry));
                    } while (match(TokenType::Comma));
                }
                expect(TokenType::RightBrace, "'}'");
                return map;
            }
        default:
            fail(std::string("unexpected ") + toString(token.type) +
                 (token.text.empty() ? "" : " '" + token.text + "'"));
        }
    }

    std::unique_ptr<Node> parseSource(const std::string& source)
    {
        Lexer lexer(source);
        Parser parser(lexer.tokenize());
        return parser.parseProgram();
    }
}
