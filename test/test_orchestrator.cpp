#include <gtest/gtest.h>
#include "test_support.h"

using namespace autopo;
using namespace autopo_test;

namespace {
    const char* GREET = "def greet(self, name) { return \"Hello, \" + name + \"!\"; }";
    const char* SET_NAME = "def set_name(self, name) { self.name = name; commit; return \"ok\"; }";

    class UnreachableExecutor : public Executor {
    public:
        ExecutionResult execute(const ExecutionRequest&) override {
            throw TransportError("sandbox", "connection refused");
        }
        bool ping() override { return false; }
    };

    class FailingGenerator : public CodeGenerator {
    public:
        std::string generate(const GenerationRequest&) override {
            throw TransportError("generator", "HTTP 503");
        }
    };

    // Answers with a valid body, then cancels the request it is serving.
    class CancellingGenerator : public CodeGenerator {
    public:
        explicit CancellingGenerator(CancellationToken token) : token(std::move(token)) {}

        std::string generate(const GenerationRequest&) override {
            token.cancel();
            return GREET;
        }

    private:
        CancellationToken token;
    };
}

class OrchestratorTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingStore> store;
    std::shared_ptr<InProcessExecutor> executor;
    std::shared_ptr<ScriptedGenerator> generator;
    std::unique_ptr<Orchestrator> orchestrator;

    void SetUp() override {
        store = std::make_shared<RecordingStore>();
        executor = std::make_shared<InProcessExecutor>();
        generator = std::make_shared<ScriptedGenerator>();
        orchestrator.reset(new Orchestrator(store, executor, generator));
        orchestrator->initialize();
    }

    void TearDown() override {
        orchestrator->shutdown();
    }

    DispatchRequest request(const std::string& target, const std::string& method,
                            ArgumentList args = ArgumentList()) {
        DispatchRequest r;
        r.targetId = target;
        r.methodName = method;
        r.args = std::move(args);
        return r;
    }
};

TEST_F(OrchestratorTest, SynthesizesMissingMethod) {
    generator->push(GREET);
    DispatchOutcome outcome = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "greet", ArgumentList{Value("Ada")}));

    ASSERT_TRUE(outcome.success) << outcome.detail;
    ASSERT_EQ(outcome.output, Value("Hello, Ada!"));
    ASSERT_FALSE(outcome.stateChanged);
    ASSERT_TRUE(outcome.synthesized);
    ASSERT_EQ(outcome.declaringObjectId, AUTOPO_SYSTEM_OBJECT);
    ASSERT_EQ(generator->calls, 1);
    ASSERT_NE(generator->lastRequest.mandate.find("greet"), std::string::npos);

    std::optional<ResolvedMethod> resolved = orchestrator->getResolver().resolve(AUTOPO_SYSTEM_OBJECT, "greet");
    ASSERT_TRUE(resolved.has_value());
    ASSERT_EQ(resolved->depth, 0);

    const std::vector<DispatchState> expected{
        DispatchState::Resolving, DispatchState::Missed, DispatchState::Generating, DispatchState::Auditing,
        DispatchState::Installing, DispatchState::Resolving, DispatchState::Executing, DispatchState::Done};
    ASSERT_EQ(outcome.trace, expected);
}

TEST_F(OrchestratorTest, SecondCallHitsWithoutGenerating) {
    generator->push(GREET);
    orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "greet", ArgumentList{Value("Ada")}));
    DispatchOutcome outcome = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "greet", ArgumentList{Value("Bob")}));

    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.output, Value("Hello, Bob!"));
    ASSERT_FALSE(outcome.synthesized);
    ASSERT_EQ(generator->calls, 1);
    ASSERT_EQ(outcome.trace, (std::vector<DispatchState>{DispatchState::Resolving, DispatchState::Executing, DispatchState::Done}));
}

TEST_F(OrchestratorTest, MutationIsPersistedAndPublished) {
    std::vector<StateEvent> events;
    orchestrator->getStateChannel().subscribe([&events](const StateEvent& event) { events.push_back(event); });
    generator->push(SET_NAME);

    DispatchOutcome outcome = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "set_name", ArgumentList{Value("Bob")}));
    ASSERT_TRUE(outcome.success) << outcome.detail;
    ASSERT_TRUE(outcome.stateChanged);
    ASSERT_EQ(outcome.output, Value("ok"));
    ASSERT_EQ(store->get(AUTOPO_SYSTEM_OBJECT)->getAttribute("name")->asString(), "Bob");
    ASSERT_EQ(store->attributeWrites.load(), 1);

    // One event for the install, one for the state write.
    ASSERT_EQ(events.size(), 2u);
    ASSERT_EQ(events.back().event, AUTOPO_STATE_EVENT);
    ASSERT_EQ(events.back().state.getAttribute("name")->asString(), "Bob");
}

TEST_F(OrchestratorTest, PersistedStateMatchesExecutorView) {
    store->create(makeObject("counter", AttributeMap{{"n", Value(1)}, {"label", Value("c")}},
                             MethodMap{{"bump", "def bump(self) { self.n += 1; commit; return self.n; }"}}));
    store->link(AUTOPO_PROTOTYPE_LINKS, "counter", AUTOPO_NIL_OBJECT);

    DispatchOutcome outcome = orchestrator->dispatch(request("counter", "bump"));
    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.output, Value(2));
    ExecutionResult direct = runSandboxed(executor->lastRequest, AUTOPO_DEFAULT_STEP_LIMIT);
    ASSERT_EQ(store->get("counter")->getAttributes(), (AttributeMap{{"n", Value(2)}, {"label", Value("c")}}));
    ASSERT_EQ(store->get("counter")->getAttributes(), *direct.finalAttributes);
}

TEST_F(OrchestratorTest, DelegatedCallRunsAgainstDeclaringObject) {
    store->create(makeObject("B", AttributeMap{{"who", Value("B")}},
                             MethodMap{{"whoami", "def whoami(self) { return self.who; }"}}));
    store->link(AUTOPO_PROTOTYPE_LINKS, "B", AUTOPO_NIL_OBJECT);
    store->create(makeObject("A", AttributeMap{{"who", Value("A")}}));
    store->link(AUTOPO_PROTOTYPE_LINKS, "A", "B");

    DispatchOutcome outcome = orchestrator->dispatch(request("A", "whoami"));
    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.output, Value("B"));
    ASSERT_EQ(outcome.declaringObjectId, "B");
    ASSERT_EQ(executor->lastRequest.attributes, (AttributeMap{{"who", Value("B")}}));
    ASSERT_EQ(generator->calls, 0);
}

TEST_F(OrchestratorTest, UnsafeBodyIsRejectedAndNotInstalled) {
    generator->push("def read(self) { return open(\"/etc/passwd\"); }");
    DispatchOutcome outcome = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "read"));

    ASSERT_FALSE(outcome.success);
    ASSERT_EQ(outcome.failure, FailureKind::AuditRejection);
    ASSERT_EQ(outcome.component, "auditor");
    ASSERT_EQ(outcome.trace.back(), DispatchState::Rejected);
    ASSERT_EQ(store->methodInstalls.load(), 0);
    ASSERT_EQ(executor->calls.load(), 0);

    DispatchOutcome again = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "read"));
    ASSERT_EQ(again.failure, FailureKind::GenerationFailure);
    ASSERT_EQ(generator->calls, 2);
}

TEST_F(OrchestratorTest, DeeplyNestedBodyIsRejectedAndNotInstalled) {
    const int levels = 200000;
    generator->push("def greet(self, name) { return " + std::string(levels, '(') + "1" +
                    std::string(levels, ')') + "; }");
    DispatchOutcome outcome = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "greet", ArgumentList{Value("x")}));

    ASSERT_EQ(outcome.failure, FailureKind::AuditRejection);
    ASSERT_NE(outcome.detail.find("nesting too deep"), std::string::npos) << outcome.detail;
    ASSERT_EQ(outcome.trace.back(), DispatchState::Rejected);
    ASSERT_EQ(store->methodInstalls.load(), 0);
    ASSERT_EQ(executor->calls.load(), 0);
    ASSERT_FALSE(store->get(AUTOPO_SYSTEM_OBJECT)->hasMethod("greet"));
}

TEST_F(OrchestratorTest, TamperedInstalledBodyIsRejectedBeforeExecution) {
    store->create(makeObject("bad", AttributeMap(), MethodMap{{"m", "def m(self) { return eval(\"1\"); }"}}));
    DispatchOutcome outcome = orchestrator->dispatch(request("bad", "m"));
    ASSERT_EQ(outcome.failure, FailureKind::AuditRejection);
    ASSERT_EQ(executor->calls.load(), 0);
}

TEST_F(OrchestratorTest, BodyFaultIsExecutionFault) {
    generator->push("def explode(self) { return 1 / 0; }");
    DispatchOutcome outcome = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "explode"));
    ASSERT_EQ(outcome.failure, FailureKind::ExecutionFault);
    ASSERT_EQ(outcome.component, "sandbox");
    ASSERT_EQ(outcome.detail, "ZeroDivisionError: division by zero (line 1)");
    ASSERT_TRUE(outcome.synthesized);
    ASSERT_EQ(store->attributeWrites.load(), 0);
}

TEST_F(OrchestratorTest, EmptyGenerationIsGenerationFailure) {
    generator->push("   \n");
    DispatchOutcome outcome = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "nothing"));
    ASSERT_EQ(outcome.failure, FailureKind::GenerationFailure);
    ASSERT_EQ(outcome.component, "generator");
    ASSERT_EQ(store->methodInstalls.load(), 0);
}

TEST_F(OrchestratorTest, BodyWithoutRequestedMethodIsRejected) {
    generator->push("def other(self) { return 1; }");
    DispatchOutcome outcome = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "wanted"));
    ASSERT_EQ(outcome.failure, FailureKind::AuditRejection);
}

TEST_F(OrchestratorTest, MissingTargetIsPersistenceFailure) {
    DispatchOutcome outcome = orchestrator->dispatch(request("ghost", "anything"));
    ASSERT_EQ(outcome.failure, FailureKind::PersistenceFailure);
    ASSERT_EQ(generator->calls, 0);
}

TEST_F(OrchestratorTest, RetryHappensAtMostOnce) {
    store->hideInstalledMethods = true;
    generator->push(GREET);
    generator->push(GREET);
    DispatchOutcome outcome = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "greet", ArgumentList{Value("x")}));
    ASSERT_EQ(outcome.failure, FailureKind::PersistenceFailure);
    ASSERT_EQ(outcome.detail, "installed method not visible on retry");
    ASSERT_EQ(generator->calls, 1);
    ASSERT_EQ(store->methodInstalls.load(), 1);
}

TEST_F(OrchestratorTest, RefusedInstallIsPersistenceFailure) {
    store->refuseUpdates = true;
    generator->push(GREET);
    DispatchOutcome outcome = orchestrator->dispatch(request(AUTOPO_SYSTEM_OBJECT, "greet", ArgumentList{Value("x")}));
    ASSERT_EQ(outcome.failure, FailureKind::PersistenceFailure);
    ASSERT_EQ(outcome.component, "store");
    ASSERT_FALSE(outcome.synthesized);
}

TEST_F(OrchestratorTest, RefusedStateWriteIsPersistenceFailure) {
    store->create(makeObject("w", AttributeMap(), MethodMap{{"touch", "def touch(self) { self.t = 1; commit; }"}}));
    store->refuseUpdates = true;
    DispatchOutcome outcome = orchestrator->dispatch(request("w", "touch"));
    ASSERT_EQ(outcome.failure, FailureKind::PersistenceFailure);
    ASSERT_FALSE(store->get("w")->hasAttribute("t"));
}

TEST_F(OrchestratorTest, CancelledBeforeStart) {
    DispatchRequest r = request(AUTOPO_SYSTEM_OBJECT, "greet");
    r.cancellation.cancel();
    DispatchOutcome outcome = orchestrator->dispatch(r);
    ASSERT_EQ(outcome.failure, FailureKind::Cancelled);
    ASSERT_EQ(outcome.trace, (std::vector<DispatchState>{DispatchState::Resolving, DispatchState::Failed}));
    ASSERT_EQ(generator->calls, 0);
}

TEST_F(OrchestratorTest, CancelledWhileGenerating) {
    DispatchRequest r = request(AUTOPO_SYSTEM_OBJECT, "greet", ArgumentList{Value("x")});
    auto local = std::make_shared<RecordingStore>();
    Orchestrator cancelling(local, executor, std::make_shared<CancellingGenerator>(r.cancellation));
    cancelling.initialize();

    DispatchOutcome outcome = cancelling.dispatch(r);
    ASSERT_EQ(outcome.failure, FailureKind::Cancelled);
    ASSERT_EQ(outcome.detail, "cancelled before AUDITING");
    ASSERT_EQ(outcome.trace, (std::vector<DispatchState>{DispatchState::Resolving, DispatchState::Missed,
                                                         DispatchState::Generating, DispatchState::Auditing,
                                                         DispatchState::Failed}));
    ASSERT_EQ(local->methodInstalls.load(), 0);
    ASSERT_EQ(executor->calls.load(), 0);
    cancelling.shutdown();
}

TEST_F(OrchestratorTest, SynthesizesAndPersistsThroughHelperProcess) {
    auto local = std::make_shared<RecordingStore>();
    auto sandbox = std::make_shared<ProcessSandbox>(RuntimeConfig().sandboxHelperPath);
    Orchestrator isolated(local, sandbox, generator);
    isolated.initialize();
    generator->push(SET_NAME);

    DispatchOutcome outcome = isolated.dispatch(request(AUTOPO_SYSTEM_OBJECT, "set_name", ArgumentList{Value("Bob")}));
    ASSERT_TRUE(outcome.success) << outcome.detail;
    ASSERT_TRUE(outcome.synthesized);
    ASSERT_TRUE(outcome.stateChanged);
    ASSERT_EQ(outcome.output, Value("ok"));
    ASSERT_EQ(local->get(AUTOPO_SYSTEM_OBJECT)->getAttribute("name")->asString(), "Bob");

    generator->push("def explode(self) { return [1][3]; }");
    DispatchOutcome fault = isolated.dispatch(request(AUTOPO_SYSTEM_OBJECT, "explode"));
    ASSERT_EQ(fault.failure, FailureKind::ExecutionFault);
    ASSERT_EQ(fault.component, "sandbox");
    ASSERT_EQ(fault.detail.rfind("IndexError", 0), 0u) << fault.detail;
    isolated.shutdown();
}

TEST_F(OrchestratorTest, UnreachableExecutorIsTransportFailure) {
    auto local = std::make_shared<RecordingStore>();
    Orchestrator broken(local, std::make_shared<UnreachableExecutor>(), generator);
    broken.initialize();
    local->create(makeObject("o", AttributeMap(), MethodMap{{"m", "def m(self) { return 1; }"}}));

    DispatchOutcome outcome = broken.dispatch(request("o", "m"));
    ASSERT_EQ(outcome.failure, FailureKind::TransportFailure);
    ASSERT_EQ(outcome.component, "sandbox");
    ASSERT_FALSE(broken.checkHealth().isHealthy());
}

TEST_F(OrchestratorTest, UnreachableGeneratorIsTransportFailure) {
    Orchestrator broken(std::make_shared<RecordingStore>(), executor, std::make_shared<FailingGenerator>());
    broken.initialize();
    DispatchOutcome outcome = broken.dispatch(request(AUTOPO_SYSTEM_OBJECT, "greet"));
    ASSERT_EQ(outcome.failure, FailureKind::TransportFailure);
    ASSERT_EQ(outcome.component, "generator");
}

TEST_F(OrchestratorTest, MisuseThrows) {
    Orchestrator idle(store, executor, generator);
    ASSERT_THROW(idle.dispatch(request(AUTOPO_SYSTEM_OBJECT, "greet")), std::logic_error);
    ASSERT_THROW(orchestrator->dispatch(request("", "greet")), std::invalid_argument);
    ASSERT_THROW(Orchestrator(store, nullptr, generator), std::invalid_argument);
}

TEST_F(OrchestratorTest, HealthReport) {
    HealthReport report = orchestrator->checkHealth();
    ASSERT_TRUE(report.isHealthy());
    ASSERT_EQ(report.components.size(), 4u);
    ASSERT_EQ(report.components["store"], "OK");
}

TEST_F(OrchestratorTest, StateNames) {
    ASSERT_STREQ(toString(DispatchState::Installing), "INSTALLING");
    ASSERT_STREQ(toString(FailureKind::AuditRejection), "AuditRejection");
}
