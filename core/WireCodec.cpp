/*
 * WireCodec.cpp
 *
 *  JSON documents exchanged with the sandbox helper, and the helper's
 *  request runner.
 */

#include "../headers/autopo_internal.h"
#include <limits>
#include <memory>
#include <new>

namespace autopo
{
    Json::Value valueToJson(const Value& value)
    {
        switch (value.getKind())
        {
        case Value::Kind::None:
            return Json::Value();
        case Value::Kind::Boolean:
            return Json::Value(value.asBoolean());
        case Value::Kind::Integer:
            return Json::Value(static_cast<Json::Int64>(value.asLong()));
        case Value::Kind::Double:
            return Json::Value(value.asDouble());
        case Value::Kind::String:
            return Json::Value(value.asString());
        case Value::Kind::List:
            {
                Json::Value array(Json::arrayValue);
                for (const auto& item : value.asList())
                    array.append(valueToJson(item));
                return array;
            }
        case Value::Kind::Map:
            {
                Json::Value object(Json::objectValue);
                for (const auto& entry : value.asMap())
                    object[entry.first] = valueToJson(entry.second);
                return object;
            }
        }
        return Json::Value();
    }

    Value valueFromJson(const Json::Value& json)
    {
        switch (json.type())
        {
        case Json::nullValue:
            return Value();
        case Json::booleanValue:
            return Value(json.asBool());
        case Json::intValue:
            return Value(static_cast<long long>(json.asInt64()));
        case Json::uintValue:
            if (json.asUInt64() > static_cast<Json::UInt64>(std::numeric_limits<long long>::max()))
                return Value(json.asDouble());
            return Value(static_cast<long long>(json.asUInt64()));
        case Json::realValue:
            return Value(json.asDouble());
        case Json::stringValue:
            return Value(json.asString());
        case Json::arrayValue:
            {
                Value::List items;
                for (const auto& item : json)
                    items.push_back(valueFromJson(item));
                return Value(std::move(items));
            }
        case Json::objectValue:
            {
                Value::Map entries;
                for (const auto& name : json.getMemberNames())
                    entries[name] = valueFromJson(json[name]);
                return Value(std::move(entries));
            }
        }
        return Value();
    }

    Json::Value documentToJson(const ObjectDocument& document)
    {
        Json::Value json(Json::objectValue);
        json["id"] = document.getId();
        Json::Value attributes(Json::objectValue);
        for (const auto& entry : document.getAttributes())
            attributes[entry.first] = valueToJson(entry.second);
        json["attributes"] = attributes;
        Json::Value methods(Json::objectValue);
        for (const auto& entry : document.getMethods())
            methods[entry.first] = entry.second;
        json["methods"] = methods;
        return json;
    }

    std::string StateEvent::toJson() const
    {
        Json::Value json(Json::objectValue);
        json["event"] = event;
        json["state"] = documentToJson(state);
        return writeJson(json);
    }

    std::string writeJson(const Json::Value& json)
    {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, json);
    }

    Json::Value readJson(const std::string& text)
    {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value json;
        std::string errors;
        if (!reader->parse(text.data(), text.data() + text.size(), &json, &errors))
            throw std::invalid_argument("malformed JSON: " + errors);
        return json;
    }

    namespace {
        AttributeMap mapFromJson(const Json::Value& json, const char* field)
        {
            if (!json.isObject())
                throw std::invalid_argument(std::string("'") + field + "' must be an object");
            return valueFromJson(json).asMap();
        }
    }

    //- Requests

    std::string encodeExecutionRequest(const ExecutionRequest& request, unsigned long stepLimit)
    {
        Json::Value json(Json::objectValue);
        json["code"] = request.body;
        json["method_name"] = request.methodName;
        json["object_state"] = valueToJson(Value(request.attributes));
        json["args"] = valueToJson(Value(request.args));
        json["kwargs"] = valueToJson(Value(request.kwargs));
        Json::Value limits(Json::objectValue);
        limits["steps"] = static_cast<Json::UInt64>(stepLimit);
        json["limits"] = limits;
        return writeJson(json);
    }

    ExecutionRequest decodeExecutionRequest(const std::string& text, unsigned long& stepLimit)
    {
        const Json::Value json = readJson(text);
        if (!json.isObject())
            throw std::invalid_argument("request must be a JSON object");
        if (!json["code"].isString() || !json["method_name"].isString())
            throw std::invalid_argument("request needs string 'code' and 'method_name'");

        ExecutionRequest request;
        request.body = json["code"].asString();
        request.methodName = json["method_name"].asString();
        request.attributes = json.isMember("object_state") ? mapFromJson(json["object_state"], "object_state") : AttributeMap();
        if (json.isMember("args"))
        {
            if (!json["args"].isArray())
                throw std::invalid_argument("'args' must be an array");
            request.args = valueFromJson(json["args"]).asList();
        }
        if (json.isMember("kwargs"))
            request.kwargs = mapFromJson(json["kwargs"], "kwargs");

        stepLimit = AUTOPO_DEFAULT_STEP_LIMIT;
        const Json::Value& limits = json["limits"];
        if (limits.isObject() && limits["steps"].isUInt64())
            stepLimit = static_cast<unsigned long>(limits["steps"].asUInt64());
        return request;
    }

    //- Results

    std::string encodeExecutionResult(const ExecutionResult& result)
    {
        Json::Value json(Json::objectValue);
        json["output"] = valueToJson(result.output);
        json["state_changed"] = result.stateChanged;
        json["final_state"] = result.finalAttributes ? valueToJson(Value(*result.finalAttributes)) : Json::Value();
        json["error"] = result.error ? Json::Value(*result.error) : Json::Value();
        return writeJson(json);
    }

    ExecutionResult decodeExecutionResult(const std::string& text)
    {
        const Json::Value json = readJson(text);
        if (!json.isObject())
            throw std::invalid_argument("response must be a JSON object");
        if (!json["state_changed"].isBool())
            throw std::invalid_argument("response needs a boolean 'state_changed'");

        ExecutionResult result;
        result.output = valueFromJson(json["output"]);
        result.stateChanged = json["state_changed"].asBool();
        if (!json["final_state"].isNull())
            result.finalAttributes = mapFromJson(json["final_state"], "final_state");
        if (!json["error"].isNull())
        {
            if (!json["error"].isString())
                throw std::invalid_argument("'error' must be a string or null");
            result.error = json["error"].asString();
        }
        if (result.stateChanged && !result.finalAttributes)
            throw std::invalid_argument("'state_changed' without 'final_state'");
        return result;
    }

    /**
     * @brief Parses the body, calls the requested definition against a copy
     *        of the snapshot and compares the mapping before and after.
     *
     * Body faults and syntax errors are reported in the result, never thrown.
     */
    ExecutionResult runSandboxed(const ExecutionRequest& request, unsigned long stepLimit)
    {
        ExecutionResult result;
        std::unique_ptr<Node> program;
        try
        {
            program = parseSource(request.body);
        }
        catch (const ParseError& e)
        {
            result.error = std::string("SyntaxError: ") + e.what();
            return result;
        }

        Interpreter interpreter(*program, request.attributes, stepLimit);
        try
        {
            result.output = interpreter.invoke(request.methodName, request.args, request.kwargs);
        }
        catch (const ScriptError& e)
        {
            result.error = e.describe();
            return result;
        }
        catch (const std::bad_alloc&)
        {
            result.error = "MemoryError: out of memory";
            return result;
        }

        if (!isWellFormedUtf8(result.output) || !isWellFormedUtf8(Value(interpreter.getAttributes())))
        {
            result.output = Value();
            result.error = "UnicodeError: result holds a string that is not valid UTF-8";
            return result;
        }

        if (interpreter.getAttributes() != request.attributes)
        {
            result.stateChanged = true;
            result.finalAttributes = interpreter.getAttributes();
        }
        return result;
    }
}
