/*
 * interpreter_benchmark.cpp
 *
 *  Created on: 2026-10-19
 */

#include <iostream>
#include <chrono>
#include "../headers/autopo_internal.h"

using namespace autopo;

void benchmarks() {
    const int num_runs = 2000;
    const int loop_size = 500;
    std::cout << "--- Interpreter Benchmark ---" << std::endl;
    std::cout << "Runs: " << num_runs << ", Loop size: " << loop_size << std::endl;

    ExecutionRequest request;
    request.body =
        "def accumulate(self, n) {\n"
        "    let total = 0;\n"
        "    for (i in range(n)) { total += i; }\n"
        "    self.total = total;\n"
        "    commit;\n"
        "    return total;\n"
        "}";
    request.methodName = "accumulate";
    request.attributes = AttributeMap{{"total", Value(0)}};
    request.args = ArgumentList{Value(loop_size)};

    // --- Parse, run and diff the state, as the helper does ---
    auto start = std::chrono::high_resolution_clock::now();
    long long checksum = 0;
    for (int i = 0; i < num_runs; ++i) {
        ExecutionResult result = runSandboxed(request, AUTOPO_DEFAULT_STEP_LIMIT);
        if (result.succeeded())
            checksum += result.output.asLong();
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;

    // --- Verification ---
    const long long expected_checksum = static_cast<long long>(num_runs) * (loop_size * (loop_size - 1) / 2);
    if (checksum != expected_checksum) {
        std::cerr << "Checksum mismatch! Got " << checksum << ", expected " << expected_checksum << std::endl;
    } else {
        std::cout << "Checksum verified." << std::endl;
    }

    std::cout << "Total run time: " << diff.count() << " s" << std::endl;
    std::cout << "--------------------------" << std::endl;
}

int main(int argc, char* argv[]) {
    benchmarks();
    return 0;
}
