/*
 * dispatch_benchmark.cpp
 *
 *  Created on: 2026-10-19
 */

#include <iostream>
#include <chrono>
#include <vector>
#include "../headers/autopo_internal.h"

using namespace autopo;

// Runs bodies in process so the numbers measure the dispatch path itself.
class InlineExecutor : public Executor {
public:
    ExecutionResult execute(const ExecutionRequest& request) override {
        return runSandboxed(request, AUTOPO_DEFAULT_STEP_LIMIT);
    }
};

class SilentGenerator : public CodeGenerator {
public:
    std::string generate(const GenerationRequest&) override {
        return std::string();
    }
};

void benchmarks(Orchestrator& orchestrator, const std::shared_ptr<MemoryObjectStore>& store) {
    const int num_objects = 100;
    const int num_dispatches = 5000;
    std::cout << "--- Dispatch Benchmark ---" << std::endl;
    std::cout << "Objects: " << num_objects << ", Dispatches: " << num_dispatches << std::endl;

    store->create(ObjectDocument("counter", AttributeMap(),
                                 MethodMap{{"bump", "def bump(self) { self.n = self.get(\"n\", 0) + 1; commit; return self.n; }"}}));
    store->link(AUTOPO_PROTOTYPE_LINKS, "counter", AUTOPO_NIL_OBJECT);
    for (int i = 0; i < num_objects; ++i) {
        const std::string id = "instance" + std::to_string(i);
        store->create(ObjectDocument(id));
        store->link(AUTOPO_PROTOTYPE_LINKS, id, "counter");
    }

    // --- Synchronous dispatch; every call persists the declaring object ---
    auto start = std::chrono::high_resolution_clock::now();
    for (int j = 0; j < num_dispatches; ++j) {
        DispatchRequest request;
        request.targetId = "instance" + std::to_string(j % num_objects);
        request.methodName = "bump";
        orchestrator.dispatch(request);
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;

    // --- Verification ---
    const Value* n = store->get("counter")->getAttribute("n");
    if (!n || n->asLong() != num_dispatches) {
        std::cerr << "Checksum mismatch! Got " << (n ? n->asLong() : 0) << ", expected " << num_dispatches << std::endl;
    } else {
        std::cout << "Checksum verified." << std::endl;
    }

    // --- Asynchronous read-only dispatch ---
    store->update("counter", DocumentPatch{std::nullopt, MethodMap{{"peek", "def peek(self) { return self.n; }"}}});
    auto start_async = std::chrono::high_resolution_clock::now();
    std::vector<std::future<DispatchOutcome>> futures;
    for (int j = 0; j < num_dispatches; ++j) {
        DispatchRequest request;
        request.targetId = "instance" + std::to_string(j % num_objects);
        request.methodName = "peek";
        futures.push_back(orchestrator.dispatchAsync(std::move(request)));
    }
    int succeeded = 0;
    for (auto& future : futures) {
        if (future.get().success)
            succeeded++;
    }
    auto end_async = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff_async = end_async - start_async;

    std::cout << "Total sync dispatch time: " << diff.count() << " s" << std::endl;
    std::cout << "Total async dispatch time (" << succeeded << " ok): " << diff_async.count() << " s" << std::endl;
    std::cout << "--------------------------" << std::endl;
}

int main(int argc, char* argv[]) {
    auto store = std::make_shared<MemoryObjectStore>();
    Orchestrator orchestrator(store, std::make_shared<InlineExecutor>(), std::make_shared<SilentGenerator>());
    orchestrator.initialize();
    benchmarks(orchestrator, store);
    orchestrator.shutdown();
    return 0;
}
