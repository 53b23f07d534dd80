#include <gtest/gtest.h>
#include "../headers/autopo_internal.h"

using namespace autopo;

class InterpreterTest : public ::testing::Test {
protected:
    ExecutionResult run(const std::string& body, const std::string& method,
                        AttributeMap attributes = AttributeMap(),
                        ArgumentList args = ArgumentList(),
                        KeywordArguments kwargs = KeywordArguments(),
                        unsigned long stepLimit = AUTOPO_DEFAULT_STEP_LIMIT) {
        ExecutionRequest request;
        request.body = body;
        request.methodName = method;
        request.attributes = std::move(attributes);
        request.args = std::move(args);
        request.kwargs = std::move(kwargs);
        return runSandboxed(request, stepLimit);
    }

    Value eval(const std::string& expression) {
        ExecutionResult result = run("def m(self) { return " + expression + "; }", "m");
        EXPECT_FALSE(result.error.has_value()) << *result.error;
        return result.output;
    }

    std::string errorOf(const std::string& body, const std::string& method = "m") {
        ExecutionResult result = run(body, method);
        EXPECT_TRUE(result.error.has_value());
        return result.error.value_or(std::string());
    }
};

TEST_F(InterpreterTest, Greeting) {
    ExecutionResult result = run("def greet(self, name) { return \"Hello, \" + name + \"!\"; }",
                                 "greet", AttributeMap(), ArgumentList{Value("Ada")});
    ASSERT_TRUE(result.succeeded());
    ASSERT_EQ(result.output, Value("Hello, Ada!"));
    ASSERT_FALSE(result.stateChanged);
    ASSERT_FALSE(result.finalAttributes.has_value());
}

TEST_F(InterpreterTest, AttributeWriteIsReported) {
    ExecutionResult result = run("def set_name(self, name) { self.name = name; commit; return self.name; }",
                                 "set_name", AttributeMap{{"age", Value(3)}}, ArgumentList{Value("Bob")});
    ASSERT_TRUE(result.succeeded());
    ASSERT_EQ(result.output, Value("Bob"));
    ASSERT_TRUE(result.stateChanged);
    ASSERT_EQ(*result.finalAttributes, (AttributeMap{{"age", Value(3)}, {"name", Value("Bob")}}));
}

TEST_F(InterpreterTest, RewritingSameValueIsNoChange) {
    ExecutionResult result = run("def m(self) { self.n = 1; }", "m", AttributeMap{{"n", Value(1)}});
    ASSERT_TRUE(result.succeeded());
    ASSERT_FALSE(result.stateChanged);
}

TEST_F(InterpreterTest, NestedContainerMutation) {
    ExecutionResult result = run(
        "def m(self, x) {\n"
        "    self.items.append(x);\n"
        "    self.table.put(\"last\", x);\n"
        "    self.table[\"count\"] += 1;\n"
        "    commit;\n"
        "}",
        "m",
        AttributeMap{{"items", Value::newList()}, {"table", Value(Value::Map{{"count", Value(0)}})}},
        ArgumentList{Value(7)});
    ASSERT_TRUE(result.succeeded()) << *result.error;
    ASSERT_TRUE(result.stateChanged);
    const AttributeMap& state = *result.finalAttributes;
    ASSERT_EQ(state.at("items"), Value(Value::List{Value(7)}));
    ASSERT_EQ(state.at("table").asMap().at("last"), Value(7));
    ASSERT_EQ(state.at("table").asMap().at("count"), Value(1));
}

TEST_F(InterpreterTest, ControlFlow) {
    ExecutionResult result = run(
        "def m(self, limit) {\n"
        "    let total = 0;\n"
        "    let i = 0;\n"
        "    while (true) {\n"
        "        i += 1;\n"
        "        if (i > limit) { break; }\n"
        "        else if (i % 2 == 0) { continue; }\n"
        "        total += i;\n"
        "    }\n"
        "    for (x in [10, 20]) { total = total + x; }\n"
        "    return total;\n"
        "}",
        "m", AttributeMap(), ArgumentList{Value(5)});
    ASSERT_TRUE(result.succeeded()) << *result.error;
    ASSERT_EQ(result.output, Value(1 + 3 + 5 + 30));
}

TEST_F(InterpreterTest, HelperDefinitionsAndKeywords) {
    const std::string body =
        "def scale(value, factor=2) { return value * factor; }\n"
        "def describe(self) { return self.name + \"!\"; }\n"
        "def m(self, n, factor=3) { return [scale(n), scale(n, factor=factor), describe()]; }";
    ExecutionResult result = run(body, "m", AttributeMap{{"name", Value("obj")}},
                                 ArgumentList{Value(4)}, KeywordArguments{{"factor", Value(10)}});
    ASSERT_TRUE(result.succeeded()) << *result.error;
    ASSERT_EQ(result.output, Value(Value::List{Value(8), Value(40), Value("obj!")}));
}

TEST_F(InterpreterTest, ArgumentBindingErrors) {
    ExecutionResult extra = run("def m(self, a) { return a; }", "m", AttributeMap(), ArgumentList{Value(1), Value(2)});
    ASSERT_EQ(extra.error->rfind("TypeError", 0), 0u);
    ExecutionResult missing = run("def m(self, a) { return a; }", "m");
    ASSERT_NE(missing.error->find("missing required argument 'a'"), std::string::npos);
    ExecutionResult unknown = run("def m(self) { return 1; }", "m", AttributeMap(), ArgumentList(),
                                  KeywordArguments{{"z", Value(1)}});
    ASSERT_NE(unknown.error->find("unexpected keyword argument 'z'"), std::string::npos);
}

TEST_F(InterpreterTest, Arithmetic) {
    ASSERT_EQ(eval("7 / 2"), Value(3.5));
    ASSERT_EQ(eval("-7 % 3"), Value(2));
    ASSERT_EQ(eval("2 + 3 * 4"), Value(14));
    ASSERT_EQ(eval("(2 + 3) * 4"), Value(20));
    ASSERT_EQ(eval("\"ab\" * 3"), Value("ababab"));
    ASSERT_EQ(eval("[1] + [2]"), Value(Value::List{Value(1), Value(2)}));
    ASSERT_EQ(eval("1 < 2 and \"b\" > \"a\""), Value(true));
    ASSERT_EQ(eval("null or \"fallback\""), Value("fallback"));
    ASSERT_EQ(eval("3 in [1, 2, 3]"), Value(true));
    ASSERT_EQ(eval("\"k\" not in {\"k\": 1}"), Value(false));
}

TEST_F(InterpreterTest, ArithmeticFaults) {
    ASSERT_EQ(errorOf("def m(self) { return 1 / 0; }").rfind("ZeroDivisionError", 0), 0u);
    ASSERT_EQ(errorOf("def m(self) { return 9223372036854775807 + 1; }").rfind("OverflowError", 0), 0u);
    ASSERT_EQ(errorOf("def m(self) { return 1 < \"a\"; }").rfind("TypeError", 0), 0u);
    ASSERT_EQ(errorOf("def m(self) { return \"a\" - 1; }").rfind("TypeError", 0), 0u);
}

TEST_F(InterpreterTest, Builtins) {
    ASSERT_EQ(eval("len(\"abc\")"), Value(3));
    ASSERT_EQ(eval("str(12) + \"!\""), Value("12!"));
    ASSERT_EQ(eval("int(\"42\")"), Value(42));
    ASSERT_EQ(eval("type({})"), Value("map"));
    ASSERT_EQ(eval("max([3, 9, 4])"), Value(9));
    ASSERT_EQ(eval("min(3, 1, 2)"), Value(1));
    ASSERT_EQ(eval("sum(range(5))"), Value(10));
    ASSERT_EQ(eval("sorted([3, 1, 2])"), Value(Value::List{Value(1), Value(2), Value(3)}));
    ASSERT_EQ(eval("join([\"a\", \"b\"], \"-\")"), Value("a-b"));
    ASSERT_EQ(eval("split(\"a,b\", \",\")"), Value(Value::List{Value("a"), Value("b")}));
    ASSERT_EQ(eval("get({\"a\": 1}, \"b\", 5)"), Value(5));
    ASSERT_EQ(eval("\"Hi\".upper()"), Value("HI"));
    ASSERT_EQ(eval("\"  x \".strip()"), Value("x"));
    ASSERT_EQ(eval("\"a.b\".replace(\".\", \"/\")"), Value("a/b"));
    ASSERT_EQ(eval("[1, 2, 3][-1]"), Value(3));
}

TEST_F(InterpreterTest, SelfReflection) {
    ExecutionResult result = run(
        "def m(self) { return [self.get(\"a\"), self.get(\"zz\", 0), self.has(\"a\"), hasattr(self, \"b\"), getattr(self, \"a\")]; }",
        "m", AttributeMap{{"a", Value(1)}});
    ASSERT_TRUE(result.succeeded()) << *result.error;
    ASSERT_EQ(result.output, Value(Value::List{Value(1), Value(0), Value(true), Value(false), Value(1)}));

    ExecutionResult written = run("def m(self) { setattr(self, \"b\", 2); }", "m");
    ASSERT_TRUE(written.stateChanged);
    ASSERT_EQ(written.finalAttributes->at("b"), Value(2));
}

TEST_F(InterpreterTest, LookupFaults) {
    ASSERT_EQ(errorOf("def m(self) { return self.missing; }").rfind("AttributeError", 0), 0u);
    ASSERT_EQ(errorOf("def m(self) { return nope; }").rfind("NameError", 0), 0u);
    ASSERT_EQ(errorOf("def m(self) { return {\"a\": 1}[\"b\"]; }").rfind("KeyError", 0), 0u);
    ASSERT_EQ(errorOf("def m(self) { return [1][5]; }").rfind("IndexError", 0), 0u);
}

TEST_F(InterpreterTest, RaiseSurfacesTypeAndMessage) {
    ASSERT_EQ(errorOf("def m(self) {\n    raise {\"type\": \"ValueError\", \"message\": \"bad input\"};\n}"),
              "ValueError: bad input (line 2)");
    ASSERT_EQ(errorOf("def m(self) { raise \"boom\"; }"), "Error: boom (line 1)");
}

TEST_F(InterpreterTest, FaultLeavesNoStateChange) {
    ExecutionResult result = run("def m(self) { self.n = 2; return 1 / 0; }", "m", AttributeMap{{"n", Value(1)}});
    ASSERT_TRUE(result.error.has_value());
    ASSERT_FALSE(result.stateChanged);
    ASSERT_FALSE(result.finalAttributes.has_value());
}

TEST_F(InterpreterTest, SyntaxErrorIsReported) {
    ASSERT_EQ(errorOf("def m(self) { return 1 +; }").rfind("SyntaxError", 0), 0u);
}

TEST_F(InterpreterTest, MissingDefinition) {
    ASSERT_EQ(errorOf("def other(self) { return 1; }", "m").rfind("NameError", 0), 0u);
}

TEST_F(InterpreterTest, StepLimitStopsRunawayLoops) {
    ExecutionResult result = run("def m(self) { while (true) { pass; } }", "m",
                                 AttributeMap(), ArgumentList(), KeywordArguments(), 1000);
    ASSERT_EQ(result.error->rfind("StepLimitExceeded", 0), 0u);
}

TEST_F(InterpreterTest, RecursionIsBounded) {
    ExecutionResult result = run("def loop(n) { return loop(n + 1); }\ndef m(self) { return loop(0); }", "m");
    ASSERT_EQ(result.error->rfind("RecursionError", 0), 0u);
}

TEST_F(InterpreterTest, RangeStopsAtIntegerLimits) {
    ExecutionResult up = run("def m(self) { return range(9223372036854775000, 9223372036854775807, 500); }", "m",
                             AttributeMap(), ArgumentList(), KeywordArguments(), 100);
    ASSERT_FALSE(up.error.has_value()) << *up.error;
    ASSERT_EQ(up.output, Value(Value::List{Value(9223372036854775000LL), Value(9223372036854775500LL)}));

    ExecutionResult down = run("def m(self) { return range(-9223372036854775000, -9223372036854775807, -500); }", "m",
                               AttributeMap(), ArgumentList(), KeywordArguments(), 100);
    ASSERT_FALSE(down.error.has_value()) << *down.error;
    ASSERT_EQ(down.output, Value(Value::List{Value(-9223372036854775000LL), Value(-9223372036854775500LL)}));
}

TEST_F(InterpreterTest, StringsAreSequencesOfCodePoints) {
    const std::string e = "\xc3\xa9";
    const std::string hello = "h" + e + "llo";
    ASSERT_EQ(eval("len(\"" + hello + "\")"), Value(5));
    ASSERT_EQ(eval("reversed(\"" + hello + "\")"), Value("oll" + e + "h"));
    ASSERT_EQ(eval("\"" + e + "\"[0]"), Value(e));
    ASSERT_EQ(eval("\"" + hello + "\"[-4]"), Value(e));
    ASSERT_EQ(eval("len(\"\xe2\x82\xac\xf0\x9f\x99\x82\")"), Value(2));

    ExecutionResult loop = run("def m(self) { let seen = \"\"; for (c in \"a" + e + "\") { seen = c + seen; } "
                               "return seen; }", "m");
    ASSERT_FALSE(loop.error.has_value()) << *loop.error;
    ASSERT_EQ(loop.output, Value(e + "a"));
}

TEST_F(InterpreterTest, ReversedStateSurvivesTheWire) {
    const std::string e = "\xc3\xa9";
    ExecutionResult result = run("def m(self) { self.s = reversed(\"h" + e + "llo\"); commit; }", "m");
    ASSERT_FALSE(result.error.has_value()) << *result.error;
    ASSERT_EQ(result.finalAttributes->at("s"), Value("oll" + e + "h"));

    ExecutionResult decoded = decodeExecutionResult(encodeExecutionResult(result));
    ASSERT_EQ(*decoded.finalAttributes, *result.finalAttributes);
}

TEST_F(InterpreterTest, MalformedUtf8IsUnicodeError) {
    ASSERT_EQ(errorOf("def m(self) { return len(\"a\xff\"); }").rfind("UnicodeError", 0), 0u);
    ASSERT_EQ(errorOf("def m(self) { return \"\xc3\"; }").rfind("UnicodeError", 0), 0u);

    ExecutionResult result = run("def m(self) { self.s = \"\xed\xa0\x80\"; commit; }", "m",
                                 AttributeMap{{"s", Value("ok")}});
    ASSERT_EQ(result.error->rfind("UnicodeError", 0), 0u);
    ASSERT_FALSE(result.stateChanged);
    ASSERT_FALSE(result.finalAttributes.has_value());
}

TEST_F(InterpreterTest, DirectInterpreterTracksCommit) {
    std::unique_ptr<Node> program = parseSource("def m(self) { self.x = 1; commit; }");
    Interpreter interpreter(*program, AttributeMap());
    interpreter.invoke("m", ArgumentList(), KeywordArguments());
    ASSERT_TRUE(interpreter.isDirty());
    ASSERT_TRUE(interpreter.isCommitted());
    ASSERT_GT(interpreter.getSteps(), 0u);
    ASSERT_EQ(interpreter.getAttributes().at("x"), Value(1));
}
