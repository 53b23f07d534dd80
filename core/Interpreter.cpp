/*
 * Interpreter.cpp
 *
 *  Tree-walking evaluator for method bodies. Runs only inside the
 *  sandbox helper process.
 */

#include "../headers/autopo_internal.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <limits>

namespace autopo
{
    ScriptError::ScriptError(const std::string& type, const std::string& message, int line) :
        std::runtime_error(message), type(type), line(line)
    {
    }

    std::string ScriptError::describe() const
    {
        std::string text = type + ": " + what();
        if (line > 0)
            text += " (line " + std::to_string(line) + ")";
        return text;
    }

    struct Interpreter::Frame
    {
        std::map<std::string, Value> locals;
        Value returnValue;
    };

    namespace {
        [[noreturn]] void fault(const char* type, const std::string& message, const Node& site)
        {
            throw ScriptError(type, message, site.line);
        }

        bool isAssignable(const Node& node)
        {
            return node.kind == NodeKind::Name || node.kind == NodeKind::Member || node.kind == NodeKind::Index;
        }

        void expectArity(const std::string& name, const ArgumentList& args, size_t minimum, size_t maximum, const Node& site)
        {
            if (args.size() < minimum || args.size() > maximum)
            {
                std::string expected = minimum == maximum ? std::to_string(minimum)
                                                          : std::to_string(minimum) + " to " + std::to_string(maximum);
                fault("TypeError", name + "() takes " + expected + " arguments (" + std::to_string(args.size()) + " given)", site);
            }
        }

        const std::string& stringArg(const std::string& name, const Value& value, const Node& site)
        {
            if (!value.isString())
                fault("TypeError", name + "() expects a str, got " + Value::kindName(value.getKind()), site);
            return value.asString();
        }

        long long integerArg(const std::string& name, const Value& value, const Node& site)
        {
            if (!value.isInteger())
                fault("TypeError", name + "() expects an int, got " + Value::kindName(value.getKind()), site);
            return value.asLong();
        }

        /** Normalizes a possibly negative index against \a size. */
        size_t checkedIndex(long long index, size_t size, const Node& site)
        {
            const long long length = static_cast<long long>(size);
            const long long normalized = index < 0 ? index + length : index;
            if (normalized < 0 || normalized >= length)
                fault("IndexError", "index " + std::to_string(index) + " out of range", site);
            return static_cast<size_t>(normalized);
        }

        /** Code points of \a text; a body holding malformed UTF-8 faults. */
        std::vector<std::string> characters(const std::string& text, const Node& site)
        {
            std::vector<std::string> out;
            if (!splitCodePoints(text, out))
                fault("UnicodeError", "string is not valid UTF-8", site);
            return out;
        }

        std::string toUpper(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return text;
        }

        std::string toLower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::string strip(const std::string& text)
        {
            size_t begin = 0;
            size_t end = text.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) begin++;
            while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
            return text.substr(begin, end - begin);
        }

        Value split(const std::string& text, const Value* separator, const Node& site)
        {
            Value::List parts;
            if (!separator || separator->isNone())
            {
                size_t pos = 0;
                while (pos < text.size())
                {
                    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) pos++;
                    if (pos >= text.size()) break;
                    size_t end = pos;
                    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) end++;
                    parts.emplace_back(text.substr(pos, end - pos));
                    pos = end;
                }
                return Value(std::move(parts));
            }
            const std::string& sep = stringArg("split", *separator, site);
            if (sep.empty())
                fault("ValueError", "empty separator", site);
            size_t start = 0;
            while (true)
            {
                const size_t found = text.find(sep, start);
                if (found == std::string::npos)
                {
                    parts.emplace_back(text.substr(start));
                    break;
                }
                parts.emplace_back(text.substr(start, found - start));
                start = found + sep.size();
            }
            return Value(std::move(parts));
        }

        std::string replaceAll(const std::string& text, const std::string& from, const std::string& to)
        {
            if (from.empty()) return text;
            std::string out;
            size_t start = 0;
            while (true)
            {
                const size_t found = text.find(from, start);
                if (found == std::string::npos)
                {
                    out += text.substr(start);
                    return out;
                }
                out += text.substr(start, found - start);
                out += to;
                start = found + from.size();
            }
        }

        bool startsWith(const std::string& text, const std::string& prefix)
        {
            return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
        }

        bool endsWith(const std::string& text, const std::string& suffix)
        {
            return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        bool contains(const Value& container, const Value& item, const Node& site)
        {
            if (container.isString())
            {
                if (!item.isString())
                    fault("TypeError", "'in <str>' requires a str operand", site);
                return container.asString().find(item.asString()) != std::string::npos;
            }
            if (container.isList())
            {
                for (const auto& element : container.asList())
                {
                    if (element == item) return true;
                }
                return false;
            }
            if (container.isMap())
                return item.isString() && container.asMap().count(item.asString()) > 0;
            fault("TypeError", std::string("argument of type '") + Value::kindName(container.getKind()) + "' is not a container", site);
        }

        Value keysOf(const Value::Map& map)
        {
            Value::List keys;
            for (const auto& entry : map)
                keys.emplace_back(entry.first);
            return Value(std::move(keys));
        }

        Value valuesOf(const Value::Map& map)
        {
            Value::List values;
            for (const auto& entry : map)
                values.push_back(entry.second);
            return Value(std::move(values));
        }

        Value extreme(const std::string& name, const ArgumentList& args, bool wantMax, const Node& site)
        {
            const Value::List* items = nullptr;
            Value::List packed;
            if (args.size() == 1)
            {
                if (!args[0].isList())
                    fault("TypeError", name + "() expects a list or several values", site);
                items = &args[0].asList();
            }
            else
            {
                packed = args;
                items = &packed;
            }
            if (items->empty())
                fault("ValueError", name + "() of an empty sequence", site);
            const Value* best = &items->front();
            for (const auto& item : *items)
            {
                if (item.isNumber() != best->isNumber() || (!item.isNumber() && item.getKind() != best->getKind()))
                    fault("TypeError", name + "() over mixed types", site);
                const int order = item.compare(*best);
                if ((wantMax && order > 0) || (!wantMax && order < 0))
                    best = &item;
            }
            return *best;
        }

        long long checkedArithmetic(char op, long long left, long long right, const Node& site)
        {
            long long result = 0;
            bool overflow = false;
            switch (op)
            {
            case '+': overflow = __builtin_add_overflow(left, right, &result); break;
            case '-': overflow = __builtin_sub_overflow(left, right, &result); break;
            case '*': overflow = __builtin_mul_overflow(left, right, &result); break;
            }
            if (overflow)
                fault("OverflowError", "integer overflow", site);
            return result;
        }

        Value repeat(const Value& sequence, long long times, const Node& site)
        {
            if (times <= 0)
                return sequence.isString() ? Value(std::string()) : Value::newList();
            const size_t unit = sequence.isString() ? sequence.asString().size() : sequence.asList().size();
            if (unit > 0 && static_cast<unsigned long long>(times) > (1ULL << 24) / unit)
                fault("MemoryError", "repetition too large", site);
            if (sequence.isString())
            {
                std::string out;
                for (long long i = 0; i < times; ++i)
                    out += sequence.asString();
                return Value(std::move(out));
            }
            Value::List out;
            for (long long i = 0; i < times; ++i)
                out.insert(out.end(), sequence.asList().begin(), sequence.asList().end());
            return Value(std::move(out));
        }
    }

    //- UTF-8

    bool splitCodePoints(const std::string& text, std::vector<std::string>& out)
    {
        out.clear();
        size_t pos = 0;
        while (pos < text.size())
        {
            const unsigned char lead = static_cast<unsigned char>(text[pos]);
            size_t length = 0;
            unsigned char low = 0x80;
            unsigned char high = 0xBF;
            if (lead < 0x80) length = 1;
            else if (lead >= 0xC2 && lead <= 0xDF) length = 2;
            else if (lead >= 0xE0 && lead <= 0xEF)
            {
                length = 3;
                if (lead == 0xE0) low = 0xA0;
                if (lead == 0xED) high = 0x9F;
            }
            else if (lead >= 0xF0 && lead <= 0xF4)
            {
                length = 4;
                if (lead == 0xF0) low = 0x90;
                if (lead == 0xF4) high = 0x8F;
            }
            else
            {
                return false;
            }
            if (pos + length > text.size())
                return false;
            for (size_t i = 1; i < length; ++i)
            {
                const unsigned char next = static_cast<unsigned char>(text[pos + i]);
                // only the first continuation byte has a narrowed range
                if (i == 1 ? (next < low || next > high) : (next < 0x80 || next > 0xBF))
                    return false;
            }
            out.emplace_back(text, pos, length);
            pos += length;
        }
        return true;
    }

    bool isWellFormedUtf8(const Value& value)
    {
        std::vector<std::string> scratch;
        switch (value.getKind())
        {
        case Value::Kind::String:
            return splitCodePoints(value.asString(), scratch);
        case Value::Kind::List:
            for (const auto& item : value.asList())
            {
                if (!isWellFormedUtf8(item)) return false;
            }
            return true;
        case Value::Kind::Map:
            for (const auto& entry : value.asMap())
            {
                if (!splitCodePoints(entry.first, scratch) || !isWellFormedUtf8(entry.second)) return false;
            }
            return true;
        default:
            return true;
        }
    }

    Interpreter::Interpreter(const Node& program, AttributeMap attributes, unsigned long stepLimit) :
        program(program), attributes(std::move(attributes)), stepLimit(stepLimit),
        steps(0), callDepth(0), dirty(false), committed(false)
    {
    }

    Value Interpreter::invoke(const std::string& methodName, const ArgumentList& args, const KeywordArguments& kwargs)
    {
        const Node* function = findFunction(program, methodName);
        if (!function)
            throw ScriptError("NameError", "method '" + methodName + "' is not defined by the body");
        if (function->size() < 2 || function->child(0).text != "self")
            throw ScriptError("TypeError", "method '" + methodName + "' must take self as its first parameter", function->line);
        return callFunction(*function, args, kwargs, true);
    }

    void Interpreter::tick(const Node& site)
    {
        if (++steps > stepLimit)
            fault("StepLimitExceeded", "step limit of " + std::to_string(stepLimit) + " exceeded", site);
    }

    Value Interpreter::callFunction(const Node& function, ArgumentList args, const KeywordArguments& kwargs, bool passSelf)
    {
        if (callDepth >= AUTOPO_MAX_CALL_DEPTH)
            fault("RecursionError", "maximum call depth of " + std::to_string(AUTOPO_MAX_CALL_DEPTH) + " exceeded", function);
        tick(function);

        std::vector<const Node*> parameters;
        for (size_t i = 0; i + 1 < function.size(); ++i)
            parameters.push_back(&function.child(i));
        if (passSelf && !parameters.empty() && parameters.front()->text == "self")
            parameters.erase(parameters.begin());

        const std::string& name = function.text;
        if (args.size() > parameters.size())
            fault("TypeError", name + "() takes " + std::to_string(parameters.size()) + " positional arguments but " +
                  std::to_string(args.size()) + " were given", function);

        Frame frame;
        for (size_t i = 0; i < args.size(); ++i)
            frame.locals[parameters[i]->text] = std::move(args[i]);

        for (const auto& keyword : kwargs)
        {
            auto parameter = std::find_if(parameters.begin(), parameters.end(),
                                          [&keyword](const Node* p) { return p->text == keyword.first; });
            if (parameter == parameters.end())
                fault("TypeError", name + "() got an unexpected keyword argument '" + keyword.first + "'", function);
            if (frame.locals.count(keyword.first))
                fault("TypeError", name + "() got multiple values for argument '" + keyword.first + "'", function);
            frame.locals[keyword.first] = keyword.second;
        }

        for (const Node* parameter : parameters)
        {
            if (frame.locals.count(parameter->text))
                continue;
            if (parameter->size() == 0)
                fault("TypeError", name + "() missing required argument '" + parameter->text + "'", function);
            Frame defaults;
            frame.locals[parameter->text] = evaluate(parameter->child(0), defaults);
        }

        callDepth++;
        try
        {
            execBlock(function.child(function.size() - 1), frame);
        }
        catch (...)
        {
            callDepth--;
            throw;
        }
        callDepth--;
        return std::move(frame.returnValue);
    }

    Interpreter::Flow Interpreter::execBlock(const Node& block, Frame& frame)
    {
        for (const auto& statement : block.children)
        {
            const Flow flow = execStatement(*statement, frame);
            if (flow != Flow::Normal)
                return flow;
        }
        return Flow::Normal;
    }

    Interpreter::Flow Interpreter::execStatement(const Node& statement, Frame& frame)
    {
        tick(statement);
        switch (statement.kind)
        {
        case NodeKind::Let:
            frame.locals[statement.text] = evaluate(statement.child(0), frame);
            return Flow::Normal;

        case NodeKind::Assign:
            assign(statement.child(0), evaluate(statement.child(1), frame), frame);
            return Flow::Normal;

        case NodeKind::ExpressionStatement:
            evaluate(statement.child(0), frame);
            return Flow::Normal;

        case NodeKind::If:
            if (evaluate(statement.child(0), frame).isTruthy())
                return execBlock(statement.child(1), frame);
            if (statement.size() > 2)
            {
                const Node& alternative = statement.child(2);
                if (alternative.kind == NodeKind::If)
                    return execStatement(alternative, frame);
                return execBlock(alternative, frame);
            }
            return Flow::Normal;

        case NodeKind::While:
            while (evaluate(statement.child(0), frame).isTruthy())
            {
                tick(statement);
                const Flow flow = execBlock(statement.child(1), frame);
                if (flow == Flow::Break) break;
                if (flow == Flow::Return) return flow;
            }
            return Flow::Normal;

        case NodeKind::For:
            {
                const Value iterable = evaluate(statement.child(0), frame);
                Value::List items;
                if (iterable.isList())
                    items = iterable.asList();
                else if (iterable.isMap())
                    items = keysOf(iterable.asMap()).asList();
                else if (iterable.isString())
                {
                    for (std::string& c : characters(iterable.asString(), statement))
                        items.emplace_back(std::move(c));
                }
                else
                    fault("TypeError", std::string("'") + Value::kindName(iterable.getKind()) + "' is not iterable", statement);

                for (auto& item : items)
                {
                    tick(statement);
                    frame.locals[statement.text] = std::move(item);
                    const Flow flow = execBlock(statement.child(1), frame);
                    if (flow == Flow::Break) break;
                    if (flow == Flow::Return) return flow;
                }
                return Flow::Normal;
            }

        case NodeKind::Return:
            frame.returnValue = statement.size() > 0 ? evaluate(statement.child(0), frame) : Value();
            return Flow::Return;

        case NodeKind::Break:
            return Flow::Break;

        case NodeKind::Continue:
            return Flow::Continue;

        case NodeKind::Pass:
            return Flow::Normal;

        case NodeKind::Commit:
            committed = true;
            return Flow::Normal;

        case NodeKind::Raise:
            {
                const Value value = evaluate(statement.child(0), frame);
                if (value.isMap() && value.asMap().count("type") && value.asMap().at("type").isString())
                {
                    const Value::Map& map = value.asMap();
                    auto message = map.find("message");
                    throw ScriptError(map.at("type").asString(),
                                      message != map.end() ? message->second.toString() : std::string(),
                                      statement.line);
                }
                throw ScriptError("Error", value.toString(), statement.line);
            }

        case NodeKind::Import:
            fault("ImportError", "imports are not available ('" + statement.text + "')", statement);

        case NodeKind::Delete:
            fault("PermissionError", "del is not available", statement);

        default:
            fault("SyntaxError", std::string("unexpected ") + toString(statement.kind) + " statement", statement);
        }
    }

    Value& Interpreter::selfAttributeRef(const std::string& name, const Node& site)
    {
        auto it = attributes.find(name);
        if (it == attributes.end())
            fault("AttributeError", "object has no attribute '" + name + "'", site);
        dirty = true;
        return it->second;
    }

    Value& Interpreter::lvalueRef(const Node& target, Frame& frame)
    {
        switch (target.kind)
        {
        case NodeKind::Name:
            {
                auto it = frame.locals.find(target.text);
                if (it == frame.locals.end())
                    fault("NameError", "name '" + target.text + "' is not defined", target);
                return it->second;
            }
        case NodeKind::Member:
            {
                if (target.child(0).kind == NodeKind::SelfRef)
                    return selfAttributeRef(target.text, target);
                Value& container = lvalueRef(target.child(0), frame);
                if (!container.isMap())
                    fault("AttributeError", std::string("'") + Value::kindName(container.getKind()) + "' has no member '" + target.text + "'", target);
                auto it = container.asMap().find(target.text);
                if (it == container.asMap().end())
                    fault("KeyError", "'" + target.text + "'", target);
                return it->second;
            }
        case NodeKind::Index:
            {
                const Value index = evaluate(target.child(1), frame);
                Value& container = lvalueRef(target.child(0), frame);
                if (container.isList())
                {
                    if (!index.isInteger())
                        fault("TypeError", "list indices must be integers", target);
                    return container.asList()[checkedIndex(index.asLong(), container.asList().size(), target)];
                }
                if (container.isMap())
                {
                    if (!index.isString())
                        fault("TypeError", "map keys must be strings", target);
                    auto it = container.asMap().find(index.asString());
                    if (it == container.asMap().end())
                        fault("KeyError", index.toRepr(), target);
                    return it->second;
                }
                fault("TypeError", std::string("'") + Value::kindName(container.getKind()) + "' does not support item assignment", target);
            }
        default:
            fault("SyntaxError", "cannot assign to this expression", target);
        }
    }

    void Interpreter::assign(const Node& target, Value value, Frame& frame)
    {
        switch (target.kind)
        {
        case NodeKind::Name:
            frame.locals[target.text] = std::move(value);
            return;
        case NodeKind::Member:
            {
                if (target.child(0).kind == NodeKind::SelfRef)
                {
                    attributes[target.text] = std::move(value);
                    dirty = true;
                    return;
                }
                Value& container = lvalueRef(target.child(0), frame);
                if (!container.isMap())
                    fault("AttributeError", std::string("'") + Value::kindName(container.getKind()) + "' has no member '" + target.text + "'", target);
                container.asMap()[target.text] = std::move(value);
                return;
            }
        case NodeKind::Index:
            {
                const Value index = evaluate(target.child(1), frame);
                Value& container = lvalueRef(target.child(0), frame);
                if (container.isList())
                {
                    if (!index.isInteger())
                        fault("TypeError", "list indices must be integers", target);
                    container.asList()[checkedIndex(index.asLong(), container.asList().size(), target)] = std::move(value);
                    return;
                }
                if (container.isMap())
                {
                    if (!index.isString())
                        fault("TypeError", "map keys must be strings", target);
                    container.asMap()[index.asString()] = std::move(value);
                    return;
                }
                fault("TypeError", std::string("'") + Value::kindName(container.getKind()) + "' does not support item assignment", target);
            }
        default:
            fault("SyntaxError", "cannot assign to this expression", target);
        }
    }

    Value Interpreter::evaluate(const Node& expression, Frame& frame)
    {
        switch (expression.kind)
        {
        case NodeKind::Literal:
            return expression.literal;

        case NodeKind::Name:
            {
                auto it = frame.locals.find(expression.text);
                if (it == frame.locals.end())
                    fault("NameError", "name '" + expression.text + "' is not defined", expression);
                return it->second;
            }

        case NodeKind::SelfRef:
            return Value(attributes);

        case NodeKind::Member:
            {
                if (expression.child(0).kind == NodeKind::SelfRef)
                {
                    auto it = attributes.find(expression.text);
                    if (it == attributes.end())
                        fault("AttributeError", "object has no attribute '" + expression.text + "'", expression);
                    return it->second;
                }
                const Value object = evaluate(expression.child(0), frame);
                if (!object.isMap())
                    fault("AttributeError", std::string("'") + Value::kindName(object.getKind()) + "' has no member '" + expression.text + "'", expression);
                auto it = object.asMap().find(expression.text);
                if (it == object.asMap().end())
                    fault("KeyError", "'" + expression.text + "'", expression);
                return it->second;
            }

        case NodeKind::Index:
            {
                const Value object = evaluate(expression.child(0), frame);
                const Value index = evaluate(expression.child(1), frame);
                if (object.isList() || object.isString())
                {
                    if (!index.isInteger())
                        fault("TypeError", "indices must be integers", expression);
                    if (object.isList())
                        return object.asList()[checkedIndex(index.asLong(), object.asList().size(), expression)];
                    const std::vector<std::string> text = characters(object.asString(), expression);
                    return Value(text[checkedIndex(index.asLong(), text.size(), expression)]);
                }
                if (object.isMap())
                {
                    if (!index.isString())
                        fault("TypeError", "map keys must be strings", expression);
                    auto it = object.asMap().find(index.asString());
                    if (it == object.asMap().end())
                        fault("KeyError", index.toRepr(), expression);
                    return it->second;
                }
                fault("TypeError", std::string("'") + Value::kindName(object.getKind()) + "' is not subscriptable", expression);
            }

        case NodeKind::Call:
            return evaluateCall(expression, frame);

        case NodeKind::Binary:
            return evaluateBinary(expression, frame);

        case NodeKind::Unary:
            {
                const Value operand = evaluate(expression.child(0), frame);
                if (expression.text == "not")
                    return Value(!operand.isTruthy());
                if (operand.isInteger())
                {
                    if (operand.asLong() == std::numeric_limits<long long>::min())
                        fault("OverflowError", "integer overflow", expression);
                    return Value(-operand.asLong());
                }
                if (operand.isDouble())
                    return Value(-operand.asDouble());
                fault("TypeError", std::string("bad operand type for unary -: '") + Value::kindName(operand.getKind()) + "'", expression);
            }

        case NodeKind::ListLiteral:
            {
                Value::List items;
                for (const auto& child : expression.children)
                    items.push_back(evaluate(*child, frame));
                return Value(std::move(items));
            }

        case NodeKind::MapLiteral:
            {
                Value::Map entries;
                for (const auto& entry : expression.children)
                {
                    const Value key = evaluate(entry->child(0), frame);
                    if (!key.isString())
                        fault("TypeError", "map keys must be strings", *entry);
                    entries[key.asString()] = evaluate(entry->child(1), frame);
                }
                return Value(std::move(entries));
            }

        default:
            fault("SyntaxError", std::string("unexpected ") + toString(expression.kind) + " expression", expression);
        }
    }

    Value Interpreter::evaluateCall(const Node& call, Frame& frame)
    {
        tick(call);
        const Node& callee = call.child(0);
        ArgumentList args;
        KeywordArguments kwargs;
        for (size_t i = 1; i < call.size(); ++i)
        {
            const Node& argument = call.child(i);
            if (argument.kind == NodeKind::KeywordArgument)
                kwargs[argument.text] = evaluate(argument.child(0), frame);
            else
                args.push_back(evaluate(argument, frame));
        }

        if (callee.kind == NodeKind::Name)
        {
            const Node* function = findFunction(program, callee.text);
            if (function)
            {
                const bool passSelf = function->size() > 1 && function->child(0).text == "self";
                return callFunction(*function, std::move(args), kwargs, passSelf);
            }
            if (!kwargs.empty())
                fault("TypeError", callee.text + "() takes no keyword arguments", call);
            return callBuiltin(callee.text, args, call, frame);
        }
        if (callee.kind == NodeKind::Member)
        {
            if (!kwargs.empty())
                fault("TypeError", callee.text + "() takes no keyword arguments", call);
            return callValueMethod(callee.child(0), callee.text, args, call, frame);
        }
        fault("TypeError", "expression is not callable", call);
    }

    /**
     * @brief Built-in functions.
     *
     * append(), put() and setattr() write through their first argument when
     * it is assignable (a local, `self.attr`, or an element of either) and
     * return the updated container.
     */
    Value Interpreter::callBuiltin(const std::string& name, ArgumentList& args, const Node& site, Frame& frame)
    {
        if (name == "len")
        {
            expectArity(name, args, 1, 1, site);
            const Value& value = args[0];
            if (value.isString()) return Value(static_cast<long long>(characters(value.asString(), site).size()));
            if (value.isList()) return Value(static_cast<long long>(value.asList().size()));
            if (value.isMap()) return Value(static_cast<long long>(value.asMap().size()));
            fault("TypeError", std::string("object of type '") + Value::kindName(value.getKind()) + "' has no len()", site);
        }
        if (name == "str")
        {
            expectArity(name, args, 1, 1, site);
            return Value(args[0].toString());
        }
        if (name == "int")
        {
            expectArity(name, args, 1, 1, site);
            const Value& value = args[0];
            if (value.isInteger()) return value;
            if (value.isBoolean()) return Value(static_cast<long long>(value.asBoolean() ? 1 : 0));
            if (value.isDouble())
            {
                const double truncated = std::trunc(value.asDouble());
                if (!std::isfinite(truncated) || std::fabs(truncated) >= 9.2e18)
                    fault("OverflowError", "cannot convert " + value.toRepr() + " to int", site);
                return Value(static_cast<long long>(truncated));
            }
            if (value.isString())
            {
                const std::string text = strip(value.asString());
                char* end = nullptr;
                errno = 0;
                const long long parsed = std::strtoll(text.c_str(), &end, 10);
                if (text.empty() || *end != '\0' || errno == ERANGE)
                    fault("ValueError", "invalid literal for int(): " + value.toRepr(), site);
                return Value(parsed);
            }
            fault("TypeError", std::string("int() argument must be a number or str, not '") + Value::kindName(value.getKind()) + "'", site);
        }
        if (name == "float")
        {
            expectArity(name, args, 1, 1, site);
            const Value& value = args[0];
            if (value.isNumber() || value.isBoolean()) return Value(value.asDouble());
            if (value.isString())
            {
                const std::string text = strip(value.asString());
                char* end = nullptr;
                const double parsed = std::strtod(text.c_str(), &end);
                if (text.empty() || *end != '\0')
                    fault("ValueError", "could not convert string to float: " + value.toRepr(), site);
                return Value(parsed);
            }
            fault("TypeError", std::string("float() argument must be a number or str, not '") + Value::kindName(value.getKind()) + "'", site);
        }
        if (name == "bool")
        {
            expectArity(name, args, 1, 1, site);
            return Value(args[0].isTruthy());
        }
        if (name == "type")
        {
            expectArity(name, args, 1, 1, site);
            return Value(Value::kindName(args[0].getKind()));
        }
        if (name == "abs")
        {
            expectArity(name, args, 1, 1, site);
            if (args[0].isInteger())
            {
                if (args[0].asLong() == std::numeric_limits<long long>::min())
                    fault("OverflowError", "integer overflow", site);
                return Value(args[0].asLong() < 0 ? -args[0].asLong() : args[0].asLong());
            }
            if (args[0].isDouble()) return Value(std::fabs(args[0].asDouble()));
            fault("TypeError", "abs() expects a number", site);
        }
        if (name == "min" || name == "max")
        {
            if (args.empty())
                fault("TypeError", name + "() expects at least one argument", site);
            return extreme(name, args, name == "max", site);
        }
        if (name == "sum")
        {
            expectArity(name, args, 1, 1, site);
            if (!args[0].isList())
                fault("TypeError", "sum() expects a list", site);
            long long integerTotal = 0;
            double doubleTotal = 0.0;
            bool useDouble = false;
            for (const auto& item : args[0].asList())
            {
                if (!item.isNumber())
                    fault("TypeError", std::string("unsupported operand for sum(): '") + Value::kindName(item.getKind()) + "'", site);
                if (item.isDouble()) useDouble = true;
                doubleTotal += item.asDouble();
                if (!useDouble)
                    integerTotal = checkedArithmetic('+', integerTotal, item.asLong(), site);
            }
            return useDouble ? Value(doubleTotal) : Value(integerTotal);
        }
        if (name == "round")
        {
            expectArity(name, args, 1, 2, site);
            if (!args[0].isNumber())
                fault("TypeError", "round() expects a number", site);
            if (args.size() == 1)
            {
                const double rounded = std::round(args[0].asDouble());
                if (!std::isfinite(rounded) || std::fabs(rounded) >= 9.2e18)
                    fault("OverflowError", "cannot round " + args[0].toRepr() + " to int", site);
                return Value(static_cast<long long>(rounded));
            }
            const double scale = std::pow(10.0, static_cast<double>(integerArg(name, args[1], site)));
            return Value(std::round(args[0].asDouble() * scale) / scale);
        }
        if (name == "range")
        {
            expectArity(name, args, 1, 3, site);
            long long start = 0;
            long long stop = 0;
            long long step = 1;
            if (args.size() == 1)
            {
                stop = integerArg(name, args[0], site);
            }
            else
            {
                start = integerArg(name, args[0], site);
                stop = integerArg(name, args[1], site);
                if (args.size() == 3)
                    step = integerArg(name, args[2], site);
            }
            if (step == 0)
                fault("ValueError", "range() step must not be zero", site);
            Value::List items;
            for (long long i = start; step > 0 ? i < stop : i > stop;)
            {
                tick(site);
                items.emplace_back(i);
                // the next value past either end of long long is past stop too
                if (__builtin_add_overflow(i, step, &i))
                    break;
            }
            return Value(std::move(items));
        }
        if (name == "keys" || name == "values")
        {
            expectArity(name, args, 1, 1, site);
            if (!args[0].isMap())
                fault("TypeError", name + "() expects a map", site);
            return name == "keys" ? keysOf(args[0].asMap()) : valuesOf(args[0].asMap());
        }
        if (name == "append")
        {
            expectArity(name, args, 2, 2, site);
            if (!args[0].isList())
                fault("TypeError", "append() expects a list", site);
            if (isAssignable(site.child(1)))
            {
                Value& target = lvalueRef(site.child(1), frame);
                if (!target.isList())
                    fault("TypeError", "append() expects a list", site);
                target.asList().push_back(args[1]);
                return target;
            }
            args[0].asList().push_back(args[1]);
            return args[0];
        }
        if (name == "put")
        {
            expectArity(name, args, 3, 3, site);
            if (!args[0].isMap())
                fault("TypeError", "put() expects a map", site);
            const std::string& key = stringArg(name, args[1], site);
            if (isAssignable(site.child(1)))
            {
                Value& target = lvalueRef(site.child(1), frame);
                if (!target.isMap())
                    fault("TypeError", "put() expects a map", site);
                target.asMap()[key] = args[2];
                return target;
            }
            args[0].asMap()[key] = args[2];
            return args[0];
        }
        if (name == "join")
        {
            expectArity(name, args, 1, 2, site);
            if (!args[0].isList())
                fault("TypeError", "join() expects a list", site);
            const std::string separator = args.size() > 1 ? stringArg(name, args[1], site) : std::string();
            std::string out;
            bool first = true;
            for (const auto& item : args[0].asList())
            {
                if (!first) out += separator;
                first = false;
                out += item.toString();
            }
            return Value(std::move(out));
        }
        if (name == "split")
        {
            expectArity(name, args, 1, 2, site);
            return split(stringArg(name, args[0], site), args.size() > 1 ? &args[1] : nullptr, site);
        }
        if (name == "upper" || name == "lower")
        {
            expectArity(name, args, 1, 1, site);
            const std::string& text = stringArg(name, args[0], site);
            return Value(name == "upper" ? toUpper(text) : toLower(text));
        }
        if (name == "contains")
        {
            expectArity(name, args, 2, 2, site);
            return Value(contains(args[0], args[1], site));
        }
        if (name == "get")
        {
            expectArity(name, args, 2, 3, site);
            if (!args[0].isMap())
                fault("TypeError", "get() expects a map", site);
            auto it = args[0].asMap().find(stringArg(name, args[1], site));
            if (it != args[0].asMap().end()) return it->second;
            return args.size() > 2 ? args[2] : Value();
        }
        if (name == "sorted")
        {
            expectArity(name, args, 1, 1, site);
            if (!args[0].isList())
                fault("TypeError", "sorted() expects a list", site);
            Value::List items = args[0].asList();
            for (const auto& item : items)
            {
                if (item.getKind() != items.front().getKind() && !(item.isNumber() && items.front().isNumber()))
                    fault("TypeError", "sorted() over mixed types", site);
            }
            std::stable_sort(items.begin(), items.end(),
                             [](const Value& a, const Value& b) { return a.compare(b) < 0; });
            return Value(std::move(items));
        }
        if (name == "reversed")
        {
            expectArity(name, args, 1, 1, site);
            if (args[0].isString())
            {
                const std::vector<std::string> text = characters(args[0].asString(), site);
                std::string out;
                for (auto c = text.rbegin(); c != text.rend(); ++c)
                    out += *c;
                return Value(std::move(out));
            }
            if (!args[0].isList())
                fault("TypeError", "reversed() expects a list or str", site);
            Value::List items(args[0].asList().rbegin(), args[0].asList().rend());
            return Value(std::move(items));
        }
        if (name == "hasattr" || name == "getattr" || name == "setattr")
        {
            if (name == "getattr")
                expectArity(name, args, 2, 3, site);
            else
                expectArity(name, args, name == "hasattr" ? 2 : 3, name == "hasattr" ? 2 : 3, site);
            const std::string& key = stringArg(name, args[1], site);
            const bool onSelf = site.child(1).kind == NodeKind::SelfRef;

            if (name == "setattr")
            {
                if (onSelf)
                {
                    attributes[key] = args[2];
                    dirty = true;
                    return Value();
                }
                if (!isAssignable(site.child(1)))
                    fault("TypeError", "setattr() target is not assignable", site);
                Value& target = lvalueRef(site.child(1), frame);
                if (!target.isMap())
                    fault("TypeError", "setattr() expects self or a map", site);
                target.asMap()[key] = args[2];
                return Value();
            }

            if (!args[0].isMap())
                fault("TypeError", name + "() expects self or a map", site);
            auto it = args[0].asMap().find(key);
            const bool found = it != args[0].asMap().end();
            if (name == "hasattr")
                return Value(found);
            if (found)
                return it->second;
            if (args.size() > 2)
                return args[2];
            fault("AttributeError", "object has no attribute '" + key + "'", site);
        }

        fault("NameError", "name '" + name + "' is not defined", site);
    }

    /**
     * @brief Method-call syntax on values: `self.get(..)`, `text.upper()`,
     *        `items.append(..)`, `table.get(..)`.
     */
    Value Interpreter::callValueMethod(const Node& receiver, const std::string& name, ArgumentList& args, const Node& site, Frame& frame)
    {
        if (receiver.kind == NodeKind::SelfRef)
        {
            if (name == "get")
            {
                expectArity(name, args, 1, 2, site);
                auto it = attributes.find(stringArg(name, args[0], site));
                if (it != attributes.end()) return it->second;
                return args.size() > 1 ? args[1] : Value();
            }
            if (name == "has")
            {
                expectArity(name, args, 1, 1, site);
                return Value(attributes.count(stringArg(name, args[0], site)) > 0);
            }
            if (name == "keys")
            {
                expectArity(name, args, 0, 0, site);
                return keysOf(attributes);
            }
            fault("AttributeError", "self has no method '" + name + "'", site);
        }

        const Value value = evaluate(receiver, frame);
        if (value.isString())
        {
            const std::string& text = value.asString();
            if (name == "upper" || name == "lower" || name == "strip")
            {
                expectArity(name, args, 0, 0, site);
                return Value(name == "upper" ? toUpper(text) : (name == "lower" ? toLower(text) : strip(text)));
            }
            if (name == "split")
            {
                expectArity(name, args, 0, 1, site);
                return split(text, args.empty() ? nullptr : &args[0], site);
            }
            if (name == "startswith" || name == "endswith")
            {
                expectArity(name, args, 1, 1, site);
                const std::string& affix = stringArg(name, args[0], site);
                return Value(name == "startswith" ? startsWith(text, affix) : endsWith(text, affix));
            }
            if (name == "replace")
            {
                expectArity(name, args, 2, 2, site);
                return Value(replaceAll(text, stringArg(name, args[0], site), stringArg(name, args[1], site)));
            }
        }
        else if (value.isMap())
        {
            if (name == "get")
            {
                expectArity(name, args, 1, 2, site);
                auto it = value.asMap().find(stringArg(name, args[0], site));
                if (it != value.asMap().end()) return it->second;
                return args.size() > 1 ? args[1] : Value();
            }
            if (name == "keys" || name == "values")
            {
                expectArity(name, args, 0, 0, site);
                return name == "keys" ? keysOf(value.asMap()) : valuesOf(value.asMap());
            }
            if (name == "has")
            {
                expectArity(name, args, 1, 1, site);
                return Value(value.asMap().count(stringArg(name, args[0], site)) > 0);
            }
            if (name == "put")
            {
                expectArity(name, args, 2, 2, site);
                const std::string& key = stringArg(name, args[0], site);
                if (!isAssignable(receiver))
                    fault("TypeError", "put() on a temporary map", site);
                Value& target = lvalueRef(receiver, frame);
                target.asMap()[key] = args[1];
                return Value();
            }
        }
        else if (value.isList())
        {
            if (name == "append")
            {
                expectArity(name, args, 1, 1, site);
                if (!isAssignable(receiver))
                    fault("TypeError", "append() on a temporary list", site);
                Value& target = lvalueRef(receiver, frame);
                target.asList().push_back(args[0]);
                return Value();
            }
        }
        fault("AttributeError", std::string("'") + Value::kindName(value.getKind()) + "' has no method '" + name + "'", site);
    }

    Value Interpreter::evaluateBinary(const Node& expression, Frame& frame)
    {
        const std::string& op = expression.text;
        if (op == "and")
        {
            Value left = evaluate(expression.child(0), frame);
            if (!left.isTruthy()) return left;
            return evaluate(expression.child(1), frame);
        }
        if (op == "or")
        {
            Value left = evaluate(expression.child(0), frame);
            if (left.isTruthy()) return left;
            return evaluate(expression.child(1), frame);
        }

        const Value left = evaluate(expression.child(0), frame);
        const Value right = evaluate(expression.child(1), frame);
        auto mismatch = [&]() -> Value {
            fault("TypeError", "unsupported operand types for " + op + ": '" + Value::kindName(left.getKind()) +
                  "' and '" + Value::kindName(right.getKind()) + "'", expression);
        };

        if (op == "==") return Value(left == right);
        if (op == "!=") return Value(left != right);
        if (op == "in") return Value(contains(right, left, expression));
        if (op == "not in") return Value(!contains(right, left, expression));

        if (op == "<" || op == "<=" || op == ">" || op == ">=")
        {
            const bool comparable = (left.isNumber() && right.isNumber()) ||
                                    (left.isString() && right.isString()) ||
                                    (left.isList() && right.isList());
            if (!comparable) return mismatch();
            const int order = left.compare(right);
            if (op == "<") return Value(order < 0);
            if (op == "<=") return Value(order <= 0);
            if (op == ">") return Value(order > 0);
            return Value(order >= 0);
        }

        if (op == "+")
        {
            if (left.isString() && right.isString()) return Value(left.asString() + right.asString());
            if (left.isList() && right.isList())
            {
                Value::List joined = left.asList();
                joined.insert(joined.end(), right.asList().begin(), right.asList().end());
                return Value(std::move(joined));
            }
        }
        if (op == "*")
        {
            if ((left.isString() || left.isList()) && right.isInteger()) return repeat(left, right.asLong(), expression);
            if (left.isInteger() && (right.isString() || right.isList())) return repeat(right, left.asLong(), expression);
        }

        if (!left.isNumber() || !right.isNumber())
            return mismatch();

        if (op == "/")
        {
            if (right.asDouble() == 0.0)
                fault("ZeroDivisionError", "division by zero", expression);
            return Value(left.asDouble() / right.asDouble());
        }
        if (op == "%")
        {
            if (right.asDouble() == 0.0)
                fault("ZeroDivisionError", "modulo by zero", expression);
            if (left.isInteger() && right.isInteger())
            {
                const long long divisor = right.asLong();
                if (divisor == -1) return Value(0LL);
                long long remainder = left.asLong() % divisor;
                if (remainder != 0 && ((remainder < 0) != (divisor < 0)))
                    remainder += divisor;
                return Value(remainder);
            }
            double remainder = std::fmod(left.asDouble(), right.asDouble());
            if (remainder != 0.0 && ((remainder < 0) != (right.asDouble() < 0)))
                remainder += right.asDouble();
            return Value(remainder);
        }
        if (op == "+" || op == "-" || op == "*")
        {
            if (left.isInteger() && right.isInteger())
                return Value(checkedArithmetic(op[0], left.asLong(), right.asLong(), expression));
            const double a = left.asDouble();
            const double b = right.asDouble();
            return Value(op == "+" ? a + b : (op == "-" ? a - b : a * b));
        }
        return mismatch();
    }
}
