/*
 * Value.cpp
 *
 *  Structured values held in object attributes and call arguments.
 */

#include "../headers/autopoCore.h"
#include <cmath>
#include <sstream>

namespace autopo
{
    namespace {
        int compareNumbers(double a, double b)
        {
            if (a < b) return -1;
            if (a > b) return 1;
            return 0;
        }

        int kindRank(Value::Kind kind)
        {
            switch (kind)
            {
            case Value::Kind::None: return 0;
            case Value::Kind::Boolean: return 1;
            case Value::Kind::Integer:
            case Value::Kind::Double: return 2;
            case Value::Kind::String: return 3;
            case Value::Kind::List: return 4;
            case Value::Kind::Map: return 5;
            }
            return 6;
        }

        void appendQuoted(std::string& out, const std::string& text)
        {
            out += '"';
            for (char c : text)
            {
                switch (c)
                {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\t': out += "\\t"; break;
                default: out += c;
                }
            }
            out += '"';
        }

        std::string formatDouble(double value)
        {
            std::ostringstream stream;
            stream.precision(15);
            stream << value;
            std::string text = stream.str();
            if (std::isfinite(value) && text.find_first_of(".eE") == std::string::npos)
                text += ".0";
            return text;
        }
    }

    Value::Value() : kind(Kind::None), booleanValue(false), integerValue(0), doubleValue(0.0) {}

    Value::Value(bool value) : kind(Kind::Boolean), booleanValue(value), integerValue(0), doubleValue(0.0) {}

    Value::Value(int value) : kind(Kind::Integer), booleanValue(false), integerValue(value), doubleValue(0.0) {}

    Value::Value(long value) : kind(Kind::Integer), booleanValue(false), integerValue(value), doubleValue(0.0) {}

    Value::Value(long long value) : kind(Kind::Integer), booleanValue(false), integerValue(value), doubleValue(0.0) {}

    Value::Value(double value) : kind(Kind::Double), booleanValue(false), integerValue(0), doubleValue(value) {}

    Value::Value(const char* value) : Value(std::string(value ? value : "")) {}

    Value::Value(std::string value) :
        kind(Kind::String), booleanValue(false), integerValue(0), doubleValue(0.0), stringValue(std::move(value))
    {
    }

    Value::Value(List value) :
        kind(Kind::List), booleanValue(false), integerValue(0), doubleValue(0.0),
        listValue(std::make_unique<List>(std::move(value)))
    {
    }

    Value::Value(Map value) :
        kind(Kind::Map), booleanValue(false), integerValue(0), doubleValue(0.0),
        mapValue(std::make_unique<Map>(std::move(value)))
    {
    }

    Value::Value(const Value& other) :
        kind(other.kind),
        booleanValue(other.booleanValue),
        integerValue(other.integerValue),
        doubleValue(other.doubleValue),
        stringValue(other.stringValue),
        listValue(other.listValue ? std::make_unique<List>(*other.listValue) : nullptr),
        mapValue(other.mapValue ? std::make_unique<Map>(*other.mapValue) : nullptr)
    {
    }

    Value::Value(Value&& other) noexcept :
        kind(other.kind),
        booleanValue(other.booleanValue),
        integerValue(other.integerValue),
        doubleValue(other.doubleValue),
        stringValue(std::move(other.stringValue)),
        listValue(std::move(other.listValue)),
        mapValue(std::move(other.mapValue))
    {
        other.kind = Kind::None;
    }

    Value& Value::operator=(const Value& other)
    {
        if (this != &other)
        {
            Value copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Value& Value::operator=(Value&& other) noexcept
    {
        if (this != &other)
        {
            kind = other.kind;
            booleanValue = other.booleanValue;
            integerValue = other.integerValue;
            doubleValue = other.doubleValue;
            stringValue = std::move(other.stringValue);
            listValue = std::move(other.listValue);
            mapValue = std::move(other.mapValue);
            other.kind = Kind::None;
        }
        return *this;
    }

    Value::~Value() = default;

    Value Value::newList()
    {
        return Value(List());
    }

    Value Value::newMap()
    {
        return Value(Map());
    }

    const char* Value::kindName(Kind kind)
    {
        switch (kind)
        {
        case Kind::None: return "none";
        case Kind::Boolean: return "bool";
        case Kind::Integer: return "int";
        case Kind::Double: return "float";
        case Kind::String: return "str";
        case Kind::List: return "list";
        case Kind::Map: return "map";
        }
        return "unknown";
    }

    //- Coercion

    bool Value::asBoolean() const
    {
        if (kind != Kind::Boolean)
            throw std::logic_error(std::string("value is not a bool but ") + kindName(kind));
        return booleanValue;
    }

    long long Value::asLong() const
    {
        if (kind == Kind::Integer) return integerValue;
        if (kind == Kind::Double) return static_cast<long long>(doubleValue);
        if (kind == Kind::Boolean) return booleanValue ? 1 : 0;
        throw std::logic_error(std::string("value is not a number but ") + kindName(kind));
    }

    double Value::asDouble() const
    {
        if (kind == Kind::Double) return doubleValue;
        if (kind == Kind::Integer) return static_cast<double>(integerValue);
        if (kind == Kind::Boolean) return booleanValue ? 1.0 : 0.0;
        throw std::logic_error(std::string("value is not a number but ") + kindName(kind));
    }

    const std::string& Value::asString() const
    {
        if (kind != Kind::String)
            throw std::logic_error(std::string("value is not a str but ") + kindName(kind));
        return stringValue;
    }

    const Value::List& Value::asList() const
    {
        if (kind != Kind::List)
            throw std::logic_error(std::string("value is not a list but ") + kindName(kind));
        return *listValue;
    }

    Value::List& Value::asList()
    {
        if (kind != Kind::List)
            throw std::logic_error(std::string("value is not a list but ") + kindName(kind));
        return *listValue;
    }

    const Value::Map& Value::asMap() const
    {
        if (kind != Kind::Map)
            throw std::logic_error(std::string("value is not a map but ") + kindName(kind));
        return *mapValue;
    }

    Value::Map& Value::asMap()
    {
        if (kind != Kind::Map)
            throw std::logic_error(std::string("value is not a map but ") + kindName(kind));
        return *mapValue;
    }

    //- Semantics

    bool Value::isTruthy() const
    {
        switch (kind)
        {
        case Kind::None: return false;
        case Kind::Boolean: return booleanValue;
        case Kind::Integer: return integerValue != 0;
        case Kind::Double: return doubleValue != 0.0;
        case Kind::String: return !stringValue.empty();
        case Kind::List: return !listValue->empty();
        case Kind::Map: return !mapValue->empty();
        }
        return false;
    }

    int Value::compare(const Value& other) const
    {
        const int rank = kindRank(kind);
        const int otherRank = kindRank(other.kind);
        if (rank != otherRank)
            return rank < otherRank ? -1 : 1;

        switch (kind)
        {
        case Kind::None:
            return 0;
        case Kind::Boolean:
            return static_cast<int>(booleanValue) - static_cast<int>(other.booleanValue);
        case Kind::Integer:
        case Kind::Double:
            if (kind == Kind::Integer && other.kind == Kind::Integer)
                return integerValue < other.integerValue ? -1 : (integerValue > other.integerValue ? 1 : 0);
            return compareNumbers(asDouble(), other.asDouble());
        case Kind::String:
            {
                const int c = stringValue.compare(other.stringValue);
                return c < 0 ? -1 : (c > 0 ? 1 : 0);
            }
        case Kind::List:
            {
                const List& a = *listValue;
                const List& b = *other.listValue;
                for (size_t i = 0; i < a.size() && i < b.size(); ++i)
                {
                    const int c = a[i].compare(b[i]);
                    if (c != 0) return c;
                }
                return a.size() < b.size() ? -1 : (a.size() > b.size() ? 1 : 0);
            }
        case Kind::Map:
            {
                auto i = mapValue->begin();
                auto j = other.mapValue->begin();
                for (; i != mapValue->end() && j != other.mapValue->end(); ++i, ++j)
                {
                    const int k = i->first.compare(j->first);
                    if (k != 0) return k < 0 ? -1 : 1;
                    const int c = i->second.compare(j->second);
                    if (c != 0) return c;
                }
                if (i == mapValue->end() && j == other.mapValue->end()) return 0;
                return i == mapValue->end() ? -1 : 1;
            }
        }
        return 0;
    }

    bool Value::operator==(const Value& other) const
    {
        if (isNumber() && other.isNumber())
            return compare(other) == 0;
        if (kind != other.kind)
            return false;
        switch (kind)
        {
        case Kind::None: return true;
        case Kind::Boolean: return booleanValue == other.booleanValue;
        case Kind::String: return stringValue == other.stringValue;
        case Kind::List: return *listValue == *other.listValue;
        case Kind::Map: return *mapValue == *other.mapValue;
        default: return false;
        }
    }

    std::string Value::toString() const
    {
        if (kind == Kind::String)
            return stringValue;
        return toRepr();
    }

    std::string Value::toRepr() const
    {
        switch (kind)
        {
        case Kind::None: return "null";
        case Kind::Boolean: return booleanValue ? "true" : "false";
        case Kind::Integer: return std::to_string(integerValue);
        case Kind::Double: return formatDouble(doubleValue);
        case Kind::String:
            {
                std::string out;
                appendQuoted(out, stringValue);
                return out;
            }
        case Kind::List:
            {
                std::string out = "[";
                for (size_t i = 0; i < listValue->size(); ++i)
                {
                    if (i > 0) out += ", ";
                    out += (*listValue)[i].toRepr();
                }
                return out + "]";
            }
        case Kind::Map:
            {
                std::string out = "{";
                bool first = true;
                for (const auto& entry : *mapValue)
                {
                    if (!first) out += ", ";
                    first = false;
                    appendQuoted(out, entry.first);
                    out += ": ";
                    out += entry.second.toRepr();
                }
                return out + "}";
            }
        }
        return "null";
    }
}
