/*
 * resolver_benchmark.cpp
 *
 *  Created on: 2026-10-19
 */

#include <iostream>
#include <chrono>
#include <string>
#include "../headers/autopoCore.h"

using namespace autopo;

void benchmarks(const std::shared_ptr<MemoryObjectStore>& store) {
    const int chain_length = 100;
    const int num_lookups = 20000;
    std::cout << "--- Method Resolution Benchmark ---" << std::endl;
    std::cout << "Chain length: " << chain_length << ", Lookups: " << num_lookups << std::endl;

    // --- Build a prototype chain; only the root declares the method ---
    store->create(ObjectDocument("link" + std::to_string(chain_length), AttributeMap(),
                                 MethodMap{{"answer", "def answer(self) { return 42; }"}}));
    store->link(AUTOPO_PROTOTYPE_LINKS, "link" + std::to_string(chain_length), AUTOPO_NIL_OBJECT);
    for (int i = chain_length - 1; i >= 0; --i) {
        store->create(ObjectDocument("link" + std::to_string(i)));
        store->link(AUTOPO_PROTOTYPE_LINKS, "link" + std::to_string(i), "link" + std::to_string(i + 1));
    }

    MethodResolver resolver(store);

    // --- Resolve from every position in the chain ---
    auto start = std::chrono::high_resolution_clock::now();
    long long checksum = 0;
    for (int j = 0; j < num_lookups; ++j) {
        std::optional<ResolvedMethod> resolved = resolver.resolve("link" + std::to_string(j % chain_length), "answer");
        if (resolved)
            checksum += resolved->depth;
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;

    // --- Verification ---
    long long expected_checksum = 0;
    for (int j = 0; j < num_lookups; ++j)
        expected_checksum += chain_length - (j % chain_length);
    if (checksum != expected_checksum) {
        std::cerr << "Checksum mismatch! Got " << checksum << ", expected " << expected_checksum << std::endl;
    } else {
        std::cout << "Checksum verified." << std::endl;
    }

    // --- Misses walk the whole bounded chain ---
    auto start_miss = std::chrono::high_resolution_clock::now();
    int misses = 0;
    for (int j = 0; j < num_lookups / 10; ++j) {
        if (!resolver.resolve("link0", "absent"))
            misses++;
    }
    auto end_miss = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff_miss = end_miss - start_miss;

    std::cout << "Total hit time: " << diff.count() << " s" << std::endl;
    std::cout << "Total miss time (" << misses << " misses): " << diff_miss.count() << " s" << std::endl;
    std::cout << "--------------------------" << std::endl;
}

int main(int argc, char* argv[]) {
    auto store = std::make_shared<MemoryObjectStore>();
    seedPrimordialObjects(*store);
    benchmarks(store);
    return 0;
}
