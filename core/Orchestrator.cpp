/*
 * Orchestrator.cpp
 *
 *  The dispatch state machine: resolve, execute, persist, and on a miss
 *  generate, audit, install and retry once.
 */

#include "../headers/autopo_internal.h"

namespace autopo
{
    const char* toString(DispatchState state)
    {
        switch (state)
        {
        case DispatchState::Resolving: return "RESOLVING";
        case DispatchState::Executing: return "EXECUTING";
        case DispatchState::Persisting: return "PERSISTING";
        case DispatchState::Missed: return "MISSED";
        case DispatchState::Generating: return "GENERATING";
        case DispatchState::Auditing: return "AUDITING";
        case DispatchState::Installing: return "INSTALLING";
        case DispatchState::Done: return "DONE";
        case DispatchState::Failed: return "FAILED";
        case DispatchState::Rejected: return "REJECTED";
        }
        return "UNKNOWN";
    }

    const char* toString(FailureKind kind)
    {
        switch (kind)
        {
        case FailureKind::None: return "None";
        case FailureKind::ExecutionFault: return "ExecutionFault";
        case FailureKind::AuditRejection: return "AuditRejection";
        case FailureKind::GenerationFailure: return "GenerationFailure";
        case FailureKind::PersistenceFailure: return "PersistenceFailure";
        case FailureKind::TransportFailure: return "TransportFailure";
        case FailureKind::Cancelled: return "Cancelled";
        }
        return "Unknown";
    }

    DispatchOutcome DispatchOutcome::succeeded(Value output, bool stateChanged)
    {
        DispatchOutcome outcome;
        outcome.success = true;
        outcome.output = std::move(output);
        outcome.stateChanged = stateChanged;
        return outcome;
    }

    DispatchOutcome DispatchOutcome::failed(FailureKind kind, std::string component, std::string detail)
    {
        DispatchOutcome outcome;
        outcome.success = false;
        outcome.failure = kind;
        outcome.component = std::move(component);
        outcome.detail = std::move(detail);
        return outcome;
    }

    /** Per-request working state; lives only for one dispatch() call. */
    struct Orchestrator::DispatchFrame
    {
        const DispatchRequest& request;
        DispatchOutcome outcome;
        std::optional<ResolvedMethod> resolved;
        ExecutionResult execution;
        std::string mandate;
        std::string generated;
        bool retried{false};

        explicit DispatchFrame(const DispatchRequest& request) : request(request) {}
    };

    namespace {
        bool isTerminal(DispatchState state)
        {
            return state == DispatchState::Done || state == DispatchState::Failed || state == DispatchState::Rejected;
        }

        /** Failure reported when a step throws something other than TransportError. */
        DispatchOutcome unexpectedFailure(DispatchState state, const std::string& detail)
        {
            switch (state)
            {
            case DispatchState::Generating:
                return DispatchOutcome::failed(FailureKind::GenerationFailure, "generator", detail);
            case DispatchState::Executing:
                return DispatchOutcome::failed(FailureKind::TransportFailure, "sandbox", detail);
            case DispatchState::Persisting:
            case DispatchState::Installing:
                return DispatchOutcome::failed(FailureKind::PersistenceFailure, "store", detail);
            default:
                return DispatchOutcome::failed(FailureKind::TransportFailure, "store", detail);
            }
        }
    }

    Orchestrator::Orchestrator(std::shared_ptr<ObjectStore> store,
                               std::shared_ptr<Executor> executor,
                               std::shared_ptr<CodeGenerator> generator,
                               RuntimeConfig config) :
        store(std::move(store)),
        executor(std::move(executor)),
        generator(std::move(generator)),
        config(std::move(config)),
        resolver(this->store, this->config.maxResolutionDepth),
        auditor(this->config.requireCommitMarker)
    {
        if (!this->executor)
            throw std::invalid_argument("Orchestrator needs an executor");
        if (!this->generator)
            throw std::invalid_argument("Orchestrator needs a code generator");
    }

    Orchestrator::~Orchestrator()
    {
        shutdown();
    }

    //- Lifecycle

    void Orchestrator::initialize()
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        if (initialized.load())
            return;
        seedPrimordialObjects(*store);
        pool = std::make_unique<DispatchPool>(config.dispatchWorkers);
        initialized.store(true);
        fprintf(stderr, "INFO: [DISPATCH] orchestrator ready (max depth %d, %u workers)\n",
                config.maxResolutionDepth, config.dispatchWorkers);
    }

    /**
     * @brief Drains queued asynchronous dispatches, then stops accepting work.
     */
    void Orchestrator::shutdown()
    {
        std::unique_ptr<DispatchPool> draining;
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex);
            if (!initialized.load())
                return;
            draining = std::move(pool);
        }
        if (draining)
            draining->shutdown();
        initialized.store(false);
        fprintf(stderr, "INFO: [DISPATCH] orchestrator stopped\n");
    }

    //- Dispatch

    DispatchOutcome Orchestrator::dispatch(const DispatchRequest& request)
    {
        if (!initialized.load())
            throw std::logic_error("Orchestrator::dispatch before initialize()");
        if (request.targetId.empty() || request.methodName.empty())
            throw std::invalid_argument("dispatch needs a target id and a method name");

        DispatchFrame frame(request);
        std::vector<DispatchState> trace;
        DispatchState state = DispatchState::Resolving;

        while (true)
        {
            trace.push_back(state);
            if (isTerminal(state))
                break;

            if (request.cancellation.isCancelled())
            {
                frame.outcome = DispatchOutcome::failed(FailureKind::Cancelled, "orchestrator",
                                                        std::string("cancelled before ") + toString(state));
                trace.push_back(DispatchState::Failed);
                break;
            }

            if (diagEnabled())
                fprintf(stderr, "DEBUG: [DISPATCH] %s.%s -> %s\n",
                        request.targetId.c_str(), request.methodName.c_str(), toString(state));

            try
            {
                switch (state)
                {
                case DispatchState::Resolving: state = stepResolving(frame); break;
                case DispatchState::Executing: state = stepExecuting(frame); break;
                case DispatchState::Persisting: state = stepPersisting(frame); break;
                case DispatchState::Missed: state = stepMissed(frame); break;
                case DispatchState::Generating: state = stepGenerating(frame); break;
                case DispatchState::Auditing: state = stepAuditing(frame); break;
                case DispatchState::Installing: state = stepInstalling(frame); break;
                default: state = DispatchState::Failed; break;
                }
            }
            catch (const TransportError& e)
            {
                frame.outcome = DispatchOutcome::failed(FailureKind::TransportFailure, e.getComponent(), e.what());
                state = DispatchState::Failed;
            }
            catch (const std::exception& e)
            {
                frame.outcome = unexpectedFailure(state, e.what());
                state = DispatchState::Failed;
            }
        }

        DispatchOutcome outcome = std::move(frame.outcome);
        outcome.trace = std::move(trace);
        outcome.synthesized = frame.retried;
        if (frame.resolved)
            outcome.declaringObjectId = frame.resolved->declaringObjectId;

        if (!outcome.success)
            fprintf(stderr, "ERROR: [DISPATCH] %s.%s failed: %s (%s): %s\n",
                    request.targetId.c_str(), request.methodName.c_str(), toString(outcome.failure),
                    outcome.component.c_str(), outcome.detail.c_str());
        return outcome;
    }

    std::future<DispatchOutcome> Orchestrator::dispatchAsync(DispatchRequest request)
    {
        auto task = std::make_shared<std::packaged_task<DispatchOutcome()>>(
            [this, request = std::move(request)]() { return dispatch(request); });
        std::future<DispatchOutcome> result = task->get_future();

        std::lock_guard<std::mutex> lock(lifecycleMutex);
        if (!pool)
            throw std::logic_error("Orchestrator::dispatchAsync before initialize() or after shutdown()");
        pool->submit([task]() { (*task)(); });
        return result;
    }

    //- States

    DispatchState Orchestrator::stepResolving(DispatchFrame& frame)
    {
        frame.resolved = resolver.resolve(frame.request.targetId, frame.request.methodName);
        if (frame.resolved)
            return DispatchState::Executing;

        if (frame.retried)
        {
            // The install reported success but the walk still misses: never generate twice.
            frame.outcome = DispatchOutcome::failed(FailureKind::PersistenceFailure, "store",
                                                    "installed method not visible on retry");
            return DispatchState::Failed;
        }
        return DispatchState::Missed;
    }

    /**
     * @brief Runs the resolved body against the declaring object's attributes.
     *
     * The snapshot is read fresh from the store right before the call; the
     * body never sees the method mapping or any other object.
     */
    DispatchState Orchestrator::stepExecuting(DispatchFrame& frame)
    {
        const ResolvedMethod& method = *frame.resolved;

        if (config.auditBeforeExecute)
        {
            const AuditVerdict verdict = auditor.audit(method.body, frame.request.methodName);
            if (!verdict.passed)
            {
                frame.outcome = DispatchOutcome::failed(FailureKind::AuditRejection, "auditor",
                                                        "installed body of '" + frame.request.methodName + "' on " +
                                                        method.declaringObjectId + " rejected: " + verdict.reason);
                return DispatchState::Rejected;
            }
        }

        const std::optional<ObjectDocument> declaring = store->get(method.declaringObjectId);
        if (!declaring)
        {
            frame.outcome = DispatchOutcome::failed(FailureKind::PersistenceFailure, "store",
                                                    "declaring object '" + method.declaringObjectId + "' disappeared");
            return DispatchState::Failed;
        }

        ExecutionRequest request;
        request.body = method.body;
        request.methodName = frame.request.methodName;
        request.attributes = declaring->getAttributes();
        request.args = frame.request.args;
        request.kwargs = frame.request.kwargs;

        frame.execution = executor->execute(request);
        if (!frame.execution.succeeded())
        {
            frame.outcome = DispatchOutcome::failed(FailureKind::ExecutionFault, "sandbox", *frame.execution.error);
            return DispatchState::Failed;
        }
        if (frame.execution.stateChanged && frame.execution.finalAttributes)
            return DispatchState::Persisting;

        frame.outcome = DispatchOutcome::succeeded(frame.execution.output, false);
        return DispatchState::Done;
    }

    DispatchState Orchestrator::stepPersisting(DispatchFrame& frame)
    {
        const std::string& objectId = frame.resolved->declaringObjectId;
        DocumentPatch patch;
        patch.attributes = *frame.execution.finalAttributes;

        const StoreStatus status = store->update(objectId, patch, false);
        if (status != StoreStatus::Ok)
        {
            frame.outcome = DispatchOutcome::failed(FailureKind::PersistenceFailure, "store",
                                                    "cannot write state of '" + objectId + "': " + toString(status));
            return DispatchState::Failed;
        }

        frame.outcome = DispatchOutcome::succeeded(frame.execution.output, true);
        publishState(objectId);
        return DispatchState::Done;
    }

    DispatchState Orchestrator::stepMissed(DispatchFrame& frame)
    {
        const DispatchRequest& request = frame.request;
        if (!store->get(request.targetId))
        {
            frame.outcome = DispatchOutcome::failed(FailureKind::PersistenceFailure, "store",
                                                    "object '" + request.targetId + "' does not exist");
            return DispatchState::Failed;
        }

        frame.mandate = "Implement method '" + request.methodName + "' with args " +
                        Value(request.args).toRepr() + " and kwargs " + Value(request.kwargs).toRepr();
        fprintf(stderr, "INFO: [DISPATCH] %s.%s missed, requesting an implementation\n",
                request.targetId.c_str(), request.methodName.c_str());
        return DispatchState::Generating;
    }

    DispatchState Orchestrator::stepGenerating(DispatchFrame& frame)
    {
        GenerationRequest request;
        request.mandate = frame.mandate;
        request.methodName = frame.request.methodName;

        frame.generated = generator->generate(request);
        if (frame.generated.find_first_not_of(" \t\r\n") == std::string::npos)
        {
            frame.generated.clear();
            frame.outcome = DispatchOutcome::failed(FailureKind::GenerationFailure, "generator",
                                                    "no code generated for '" + frame.request.methodName + "'");
            return DispatchState::Failed;
        }
        return DispatchState::Auditing;
    }

    DispatchState Orchestrator::stepAuditing(DispatchFrame& frame)
    {
        const AuditVerdict verdict = auditor.audit(frame.generated, frame.request.methodName);
        if (!verdict.passed)
        {
            frame.generated.clear();
            frame.outcome = DispatchOutcome::failed(FailureKind::AuditRejection, "auditor", verdict.reason);
            return DispatchState::Rejected;
        }
        return DispatchState::Installing;
    }

    /**
     * @brief Installs the audited body on the original target itself, then
     *        re-enters resolution exactly once.
     */
    DispatchState Orchestrator::stepInstalling(DispatchFrame& frame)
    {
        const std::string& targetId = frame.request.targetId;
        DocumentPatch patch;
        patch.methods[frame.request.methodName] = frame.generated;

        const StoreStatus status = store->update(targetId, patch, true);
        if (status != StoreStatus::Ok)
        {
            frame.outcome = DispatchOutcome::failed(FailureKind::PersistenceFailure, "store",
                                                    "cannot install '" + frame.request.methodName + "' on '" +
                                                    targetId + "': " + toString(status));
            return DispatchState::Failed;
        }

        fprintf(stderr, "INFO: [DISPATCH] installed %s.%s\n", targetId.c_str(), frame.request.methodName.c_str());
        frame.retried = true;
        publishState(targetId);
        return DispatchState::Resolving;
    }

    /** Best effort; a failure here never changes the dispatch outcome. */
    void Orchestrator::publishState(const std::string& objectId)
    {
        try
        {
            std::optional<ObjectDocument> document = store->get(objectId);
            if (!document)
                return;
            StateEvent event;
            event.state = std::move(*document);
            stateChannel.publish(event);
        }
        catch (const std::exception& e)
        {
            fprintf(stderr, "WARNING: [CHANNEL] state of %s not published: %s\n", objectId.c_str(), e.what());
        }
    }

    HealthReport Orchestrator::checkHealth()
    {
        HealthReport report;
        report.components["orchestrator"] = initialized.load() ? "OK" : "FAIL: not initialized";

        try
        {
            report.components["store"] = store->get(AUTOPO_NIL_OBJECT) ? "OK" : "FAIL: root object missing";
        }
        catch (const std::exception& e)
        {
            report.components["store"] = std::string("FAIL: ") + e.what();
        }

        try
        {
            report.components["sandbox"] = executor->ping() ? "OK" : "FAIL: no answer";
        }
        catch (const std::exception& e)
        {
            report.components["sandbox"] = std::string("FAIL: ") + e.what();
        }

        try
        {
            report.components["generator"] = generator->ping() ? "OK" : "FAIL: no answer";
        }
        catch (const std::exception& e)
        {
            report.components["generator"] = std::string("FAIL: ") + e.what();
        }
        return report;
    }
}
