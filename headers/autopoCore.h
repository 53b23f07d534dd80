/*
 * autopoCore
 *
 *  Self-extending object runtime: prototype-linked objects, delegated
 *  method resolution, sandboxed execution and the
 *  generate -> audit -> install -> retry loop.
 */

#ifndef AUTOPO_H_
#define AUTOPO_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace autopo
{
    //! Well known object ids and edge collections.
    #define AUTOPO_NIL_OBJECT "nil"
    #define AUTOPO_SYSTEM_OBJECT "system"
    #define AUTOPO_PROTOTYPE_LINKS "PrototypeLinks"
    #define AUTOPO_DEFAULT_MAX_DEPTH 100
    #define AUTOPO_STATE_EVENT "uvm_state_update"

    class Value;
    class ObjectDocument;
    class ObjectStore;
    class Executor;
    class CodeGenerator;
    class StateChannel;
    class Orchestrator;

    //=========================================================================
    // Value model
    //=========================================================================

    /**
     * @class Value
     * @brief Arbitrary structured value stored in object attributes and passed
     *        as call arguments: none, boolean, integer, double, string, list or
     *        string-keyed map.
     *
     * Values have plain value semantics; copies are deep.
     */
    class Value
    {
    public:
        enum class Kind { None, Boolean, Integer, Double, String, List, Map };

        typedef std::vector<Value> List;
        typedef std::map<std::string, Value> Map;

        Value();
        Value(bool value);
        Value(int value);
        Value(long value);
        Value(long long value);
        Value(double value);
        Value(const char* value);
        Value(std::string value);
        Value(List value);
        Value(Map value);

        Value(const Value& other);
        Value(Value&& other) noexcept;
        Value& operator=(const Value& other);
        Value& operator=(Value&& other) noexcept;
        ~Value();

        static Value newList();
        static Value newMap();

        //- Type Checking
        Kind getKind() const { return kind; }
        bool isNone() const { return kind == Kind::None; }
        bool isBoolean() const { return kind == Kind::Boolean; }
        bool isInteger() const { return kind == Kind::Integer; }
        bool isDouble() const { return kind == Kind::Double; }
        bool isNumber() const { return kind == Kind::Integer || kind == Kind::Double; }
        bool isString() const { return kind == Kind::String; }
        bool isList() const { return kind == Kind::List; }
        bool isMap() const { return kind == Kind::Map; }

        //- Coercion (throws std::logic_error on a kind mismatch)
        bool asBoolean() const;
        long long asLong() const;
        double asDouble() const;
        const std::string& asString() const;
        const List& asList() const;
        List& asList();
        const Map& asMap() const;
        Map& asMap();

        //- Semantics
        bool isTruthy() const;
        /** Total order used by sorting and comparisons; numbers compare numerically. */
        int compare(const Value& other) const;
        bool operator==(const Value& other) const;
        bool operator!=(const Value& other) const { return !(*this == other); }

        /** Human readable form; strings are returned unquoted. */
        std::string toString() const;
        /** Literal form; strings are quoted. */
        std::string toRepr() const;

        static const char* kindName(Kind kind);

    private:
        Kind kind;
        bool booleanValue;
        long long integerValue;
        double doubleValue;
        std::string stringValue;
        std::unique_ptr<List> listValue;
        std::unique_ptr<Map> mapValue;
    };

    typedef Value::Map AttributeMap;
    typedef std::map<std::string, std::string> MethodMap;
    typedef std::vector<Value> ArgumentList;
    typedef Value::Map KeywordArguments;

    //=========================================================================
    // Objects
    //=========================================================================

    /**
     * @class ObjectDocument
     * @brief A persistent object: stable id, attribute mapping and method
     *        mapping (method name -> source body).
     *
     * Attribute access is an explicit protocol: getAttribute() returns
     * nullptr for a missing name, setAttribute() inserts and raises the dirty
     * flag. Prototype links are not part of the document; they are edges
     * owned by the ObjectStore.
     */
    class ObjectDocument
    {
    public:
        explicit ObjectDocument(std::string id = std::string(),
                                AttributeMap attributes = AttributeMap(),
                                MethodMap methods = MethodMap());

        const std::string& getId() const { return id; }

        //- Attributes
        const Value* getAttribute(const std::string& name) const;
        bool hasAttribute(const std::string& name) const;
        void setAttribute(const std::string& name, Value value);
        const AttributeMap& getAttributes() const { return attributes; }
        void replaceAttributes(AttributeMap newAttributes);
        bool isDirty() const { return dirty; }
        void clearDirty() { dirty = false; }

        //- Methods
        const std::string* getMethod(const std::string& name) const;
        bool hasMethod(const std::string& name) const;
        void installMethod(const std::string& name, std::string body);
        const MethodMap& getMethods() const { return methods; }

        bool operator==(const ObjectDocument& other) const;

    private:
        std::string id;
        AttributeMap attributes;
        MethodMap methods;
        bool dirty;
    };

    //=========================================================================
    // Object Store
    //=========================================================================

    enum class StoreStatus { Ok, NotFound, Conflict };

    const char* toString(StoreStatus status);

    /**
     * @brief Partial document update.
     *
     * Methods are always merged key by key. Attributes, when present, are
     * merged key by key if the update is a merge, otherwise they replace the
     * whole attribute mapping.
     */
    struct DocumentPatch
    {
        std::optional<AttributeMap> attributes;
        MethodMap methods;
    };

    struct TraversalMatch
    {
        std::string objectId;
        int depth{0};
        ObjectDocument document;
    };

    typedef std::function<bool(const ObjectDocument&)> DocumentPredicate;

    /**
     * @brief Thrown when an external collaborator (store, sandbox, generator)
     * is unreachable or does not answer within its bound.
     */
    class TransportError : public std::runtime_error
    {
    public:
        TransportError(std::string component, const std::string& detail);
        const std::string& getComponent() const { return component; }

    private:
        std::string component;
    };

    /** Abstract persistent graph of objects and typed edges. Implementations must be thread safe. */
    class ObjectStore
    {
    public:
        virtual ~ObjectStore() = default;

        virtual std::optional<ObjectDocument> get(const std::string& objectId) = 0;
        /** Inserts a new document. Returns Conflict if the id is taken. */
        virtual StoreStatus create(const ObjectDocument& document) = 0;
        /** Atomic read-modify-write of one document. */
        virtual StoreStatus update(const std::string& objectId, const DocumentPatch& patch, bool merge = true) = 0;
        /** Adds a directed edge. Both endpoints must exist; a duplicate edge is a Conflict. */
        virtual StoreStatus link(const std::string& edgeType, const std::string& fromId, const std::string& toId) = 0;
        virtual std::vector<std::string> getLinks(const std::string& edgeType, const std::string& fromId) = 0;
        /**
         * Breadth first walk along outbound edges of \a edgeType starting at
         * depth 0 with \a startId. Returns matching documents ordered by depth,
         * then by edge insertion order, at most \a limit of them (0 = no limit).
         * Each object is visited once; nothing deeper than \a maxDepth is visited.
         */
        virtual std::vector<TraversalMatch> graphTraverse(
            const std::string& startId,
            const std::string& edgeType,
            int maxDepth,
            const DocumentPredicate& predicate,
            size_t limit = 0) = 0;
    };

    /**
     * @class MemoryObjectStore
     * @brief In-process ObjectStore guarded by a reader/writer lock.
     *
     * Every operation waits at most \a lockTimeout for the lock and throws
     * TransportError("store", ...) when the bound expires.
     */
    class MemoryObjectStore : public ObjectStore
    {
    public:
        explicit MemoryObjectStore(std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(5000));
        ~MemoryObjectStore() override;

        std::optional<ObjectDocument> get(const std::string& objectId) override;
        StoreStatus create(const ObjectDocument& document) override;
        StoreStatus update(const std::string& objectId, const DocumentPatch& patch, bool merge = true) override;
        StoreStatus link(const std::string& edgeType, const std::string& fromId, const std::string& toId) override;
        std::vector<std::string> getLinks(const std::string& edgeType, const std::string& fromId) override;
        std::vector<TraversalMatch> graphTraverse(
            const std::string& startId,
            const std::string& edgeType,
            int maxDepth,
            const DocumentPredicate& predicate,
            size_t limit = 0) override;

        size_t getSize();

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;
    };

    /** Creates the root `nil` object and the `system` object delegating to it. Idempotent. */
    void seedPrimordialObjects(ObjectStore& store);

    //=========================================================================
    // Method Resolver
    //=========================================================================

    struct ResolvedMethod
    {
        std::string declaringObjectId;
        std::string body;
        int depth{0};
    };

    /**
     * @class MethodResolver
     * @brief Finds the nearest object along the prototype chain that declares
     *        a method. The walk is bounded; exceeding the bound is a miss.
     */
    class MethodResolver
    {
    public:
        explicit MethodResolver(std::shared_ptr<ObjectStore> store, int maxDepth = AUTOPO_DEFAULT_MAX_DEPTH);

        std::optional<ResolvedMethod> resolve(const std::string& startId, const std::string& methodName) const;
        int getMaxDepth() const { return maxDepth; }

    private:
        std::shared_ptr<ObjectStore> store;
        int maxDepth;
    };

    //=========================================================================
    // Security Auditor
    //=========================================================================

    struct AuditVerdict
    {
        bool passed{false};
        std::string reason;
        std::vector<std::string> warnings;

        static AuditVerdict pass(std::vector<std::string> warnings = std::vector<std::string>());
        static AuditVerdict fail(std::string reason);
    };

    /**
     * @class SecurityAuditor
     * @brief Static inspection of a candidate method body. Never executes it.
     *
     * Rejects import constructs, denylisted identifiers (I/O, process,
     * environment, network, dynamic evaluation, dunder reflection), deletion
     * statements and anything that does not parse. A pure function of its
     * input text and configuration.
     */
    class SecurityAuditor
    {
    public:
        explicit SecurityAuditor(bool requireCommitMarker = false);

        AuditVerdict audit(const std::string& source) const;
        /** As audit(source), and also requires a definition named \a methodName. */
        AuditVerdict audit(const std::string& source, const std::string& methodName) const;

        static bool isDeniedIdentifier(const std::string& name);

    private:
        bool requireCommitMarker;
    };

    //=========================================================================
    // Sandboxed Executor
    //=========================================================================

    struct ExecutionRequest
    {
        std::string body;
        std::string methodName;
        AttributeMap attributes;
        ArgumentList args;
        KeywordArguments kwargs;
    };

    struct ExecutionResult
    {
        Value output;
        bool stateChanged{false};
        /** Full post-execution attribute mapping, present only when stateChanged. */
        std::optional<AttributeMap> finalAttributes;
        /** Fault raised by the body itself, surfaced verbatim. */
        std::optional<std::string> error;

        bool succeeded() const { return !error.has_value(); }
    };

    /**
     * Runs one method body against a copy of an object's attributes.
     * Body faults come back in ExecutionResult::error; an unreachable or
     * timed-out executor throws TransportError("sandbox", ...).
     */
    class Executor
    {
    public:
        virtual ~Executor() = default;
        virtual ExecutionResult execute(const ExecutionRequest& request) = 0;
        virtual bool ping() { return true; }
    };

    struct SandboxLimits
    {
        std::chrono::milliseconds timeout{10000};
        unsigned long memoryMb{256};
        unsigned long cpuSeconds{5};
        unsigned long stepLimit{1000000};
    };

    /**
     * @class ProcessSandbox
     * @brief Executor that runs every request in a fresh `autopo_sandbox`
     *        helper process, exchanging JSON over a socket pair.
     *
     * The helper gets an empty environment, `/` as working directory, no
     * inherited descriptors and hard resource limits. It is killed when the
     * timeout expires.
     */
    class ProcessSandbox : public Executor
    {
    public:
        ProcessSandbox(std::string helperPath, SandboxLimits limits = SandboxLimits());

        ExecutionResult execute(const ExecutionRequest& request) override;
        bool ping() override;

        const std::string& getHelperPath() const { return helperPath; }

    private:
        std::string helperPath;
        SandboxLimits limits;
    };

    //=========================================================================
    // Code Generator
    //=========================================================================

    struct GenerationRequest
    {
        std::string mandate;
        std::string methodName;
    };

    /** Text-generation oracle. Returns an empty string when it has nothing usable. */
    class CodeGenerator
    {
    public:
        virtual ~CodeGenerator() = default;
        virtual std::string generate(const GenerationRequest& request) = 0;
        virtual bool ping() { return true; }
    };

    /** System prompt given to the model for \a methodName. */
    std::string buildCodeGenerationPrompt(const std::string& methodName);
    /** Extracts `method_code` from a chat response document; "" when absent or malformed. */
    std::string parseCodeFromResponse(const std::string& responseBody);

    /**
     * @class OllamaCodeGenerator
     * @brief CodeGenerator backed by an Ollama server's `/api/chat` endpoint.
     */
    class OllamaCodeGenerator : public CodeGenerator
    {
    public:
        OllamaCodeGenerator(std::string host, std::string model,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(60000));

        std::string generate(const GenerationRequest& request) override;
        bool ping() override;

    private:
        std::string host;
        std::string model;
        std::chrono::milliseconds timeout;
    };

    //=========================================================================
    // Live-state channel
    //=========================================================================

    struct StateEvent
    {
        std::string event{AUTOPO_STATE_EVENT};
        ObjectDocument state;

        std::string toJson() const;
    };

    /**
     * @class StateChannel
     * @brief Fire-and-forget fan out of post-mutation object documents.
     */
    class StateChannel
    {
    public:
        typedef std::function<void(const StateEvent&)> Subscriber;

        unsigned long subscribe(Subscriber subscriber);
        void unsubscribe(unsigned long subscription);
        /** Delivers to every subscriber; a throwing subscriber is logged and skipped. */
        void publish(const StateEvent& event);
        size_t getSubscriberCount() const;

    private:
        mutable std::mutex mutex;
        std::map<unsigned long, Subscriber> subscribers;
        unsigned long nextSubscription{1};
    };

    //=========================================================================
    // Configuration
    //=========================================================================

    struct RuntimeConfig
    {
        int maxResolutionDepth{AUTOPO_DEFAULT_MAX_DEPTH};
        long storeTimeoutMs{5000};
        long sandboxTimeoutMs{10000};
        long generatorTimeoutMs{60000};
        std::string sandboxHelperPath;
        unsigned long sandboxMemoryMb{256};
        unsigned long sandboxCpuSeconds{5};
        unsigned long sandboxStepLimit{1000000};
        std::string ollamaHost{"http://localhost:11434"};
        std::string ollamaModel{"qwen3:4b"};
        unsigned int dispatchWorkers{4};
        bool auditBeforeExecute{true};
        bool requireCommitMarker{false};

        RuntimeConfig();

        /** Defaults overridden by AUTOPO_* environment variables. Throws std::invalid_argument on malformed values. */
        static RuntimeConfig fromEnvironment();

        SandboxLimits getSandboxLimits() const;
    };

    //=========================================================================
    // Dispatch
    //=========================================================================

    /** Shared flag a caller sets to abandon a request; observed at state transitions. */
    class CancellationToken
    {
    public:
        CancellationToken() : flag(std::make_shared<std::atomic<bool>>(false)) {}
        void cancel() const { flag->store(true); }
        bool isCancelled() const { return flag->load(); }

    private:
        std::shared_ptr<std::atomic<bool>> flag;
    };

    enum class DispatchState
    {
        Resolving,
        Executing,
        Persisting,
        Missed,
        Generating,
        Auditing,
        Installing,
        Done,
        Failed,
        Rejected
    };

    enum class FailureKind
    {
        None,
        ExecutionFault,
        AuditRejection,
        GenerationFailure,
        PersistenceFailure,
        TransportFailure,
        Cancelled
    };

    const char* toString(DispatchState state);
    const char* toString(FailureKind kind);

    struct DispatchRequest
    {
        std::string targetId;
        std::string methodName;
        ArgumentList args;
        KeywordArguments kwargs;
        CancellationToken cancellation;
    };

    /** The single typed result of one top-level dispatch. */
    struct DispatchOutcome
    {
        bool success{false};
        Value output;
        bool stateChanged{false};
        FailureKind failure{FailureKind::None};
        /** Component that failed ("store", "sandbox", "generator", "auditor", ...). */
        std::string component;
        std::string detail;
        std::string declaringObjectId;
        /** True when the method was generated and installed by this request. */
        bool synthesized{false};
        std::vector<DispatchState> trace;

        static DispatchOutcome succeeded(Value output, bool stateChanged);
        static DispatchOutcome failed(FailureKind kind, std::string component, std::string detail);
    };

    struct HealthReport
    {
        std::map<std::string, std::string> components;
        bool isHealthy() const;
    };

    /**
     * @class DispatchPool
     * @brief Fixed set of worker threads draining a FIFO of tasks.
     */
    class DispatchPool
    {
    public:
        explicit DispatchPool(unsigned int workers);
        ~DispatchPool();

        DispatchPool(const DispatchPool&) = delete;
        DispatchPool& operator=(const DispatchPool&) = delete;

        /** Queues \a task. Throws std::logic_error after shutdown(). */
        void submit(std::function<void()> task);
        /** Runs the queued tasks to completion and joins the workers. */
        void shutdown();
        unsigned int getWorkerCount() const { return static_cast<unsigned int>(workers.size()); }

    private:
        void workerLoop();

        std::vector<std::thread> workers;
        std::deque<std::function<void()>> queue;
        std::mutex mutex;
        std::condition_variable available;
        bool stopping{false};
    };

    /**
     * @class Orchestrator
     * @brief The dispatch state machine.
     *
     * RESOLVING -> EXECUTING -> PERSISTING -> DONE on a hit; on a miss
     * MISSED -> GENERATING -> AUDITING -> INSTALLING -> RESOLVING, at most
     * once per top-level request. Owns no persistent state.
     */
    class Orchestrator
    {
    public:
        Orchestrator(std::shared_ptr<ObjectStore> store,
                     std::shared_ptr<Executor> executor,
                     std::shared_ptr<CodeGenerator> generator,
                     RuntimeConfig config = RuntimeConfig());
        ~Orchestrator();

        Orchestrator(const Orchestrator&) = delete;
        Orchestrator& operator=(const Orchestrator&) = delete;

        //- Lifecycle
        void initialize();
        void shutdown();
        bool isInitialized() const { return initialized.load(); }

        //- Dispatch
        /** Synchronous entry point. Never throws for request-level failures. */
        DispatchOutcome dispatch(const DispatchRequest& request);
        /** Runs the request on the dispatch pool. */
        std::future<DispatchOutcome> dispatchAsync(DispatchRequest request);

        StateChannel& getStateChannel() { return stateChannel; }
        const MethodResolver& getResolver() const { return resolver; }
        const SecurityAuditor& getAuditor() const { return auditor; }
        const RuntimeConfig& getConfig() const { return config; }

        HealthReport checkHealth();

    private:
        struct DispatchFrame;

        DispatchState stepResolving(DispatchFrame& frame);
        DispatchState stepExecuting(DispatchFrame& frame);
        DispatchState stepPersisting(DispatchFrame& frame);
        DispatchState stepMissed(DispatchFrame& frame);
        DispatchState stepGenerating(DispatchFrame& frame);
        DispatchState stepAuditing(DispatchFrame& frame);
        DispatchState stepInstalling(DispatchFrame& frame);
        void publishState(const std::string& objectId);

        std::shared_ptr<ObjectStore> store;
        std::shared_ptr<Executor> executor;
        std::shared_ptr<CodeGenerator> generator;
        RuntimeConfig config;
        MethodResolver resolver;
        SecurityAuditor auditor;
        StateChannel stateChannel;
        std::unique_ptr<DispatchPool> pool;
        std::mutex lifecycleMutex;
        std::atomic<bool> initialized{false};
    };
}

#endif /* AUTOPO_H_ */
