/*
 * SandboxMain.cpp
 *
 *  autopo_sandbox: reads one execution request from stdin, runs it and
 *  writes one result document to stdout.
 */

#include "../headers/autopo_internal.h"
#include <iostream>
#include <iterator>
#include <new>

int main()
{
    const std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    autopo::ExecutionResult result;
    try
    {
        unsigned long stepLimit = AUTOPO_DEFAULT_STEP_LIMIT;
        const autopo::ExecutionRequest request = autopo::decodeExecutionRequest(input, stepLimit);
        result = autopo::runSandboxed(request, stepLimit);
    }
    catch (const std::invalid_argument& e)
    {
        result.error = std::string("ProtocolError: ") + e.what();
    }
    catch (const std::bad_alloc&)
    {
        result.error = "MemoryError: out of memory";
    }

    std::cout << autopo::encodeExecutionResult(result);
    std::cout.flush();
    return std::cout.good() ? 0 : 1;
}
