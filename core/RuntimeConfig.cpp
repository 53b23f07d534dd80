/*
 * RuntimeConfig.cpp
 *
 *  Runtime configuration from AUTOPO_* environment variables, and the
 *  diagnostics switch.
 */

#include "../headers/autopo_internal.h"
#include <algorithm>
#include <cctype>
#include <cerrno>

#ifndef AUTOPO_SANDBOX_HELPER
#define AUTOPO_SANDBOX_HELPER "autopo_sandbox"
#endif

namespace autopo
{
    bool diagEnabled()
    {
        static const bool enabled = []() {
            const char* value = std::getenv("AUTOPO_DIAG");
            return value != nullptr && value[0] != '\0' && std::string(value) != "0";
        }();
        return enabled;
    }

    namespace {
        const char* lookup(const char* name)
        {
            const char* value = std::getenv(name);
            return value != nullptr && value[0] != '\0' ? value : nullptr;
        }

        long long readInteger(const char* name, long long current, long long minimum)
        {
            const char* text = lookup(name);
            if (!text)
                return current;
            char* end = nullptr;
            errno = 0;
            const long long value = std::strtoll(text, &end, 10);
            if (errno == ERANGE || *end != '\0' || end == text)
                throw std::invalid_argument(std::string(name) + " is not an integer: '" + text + "'");
            if (value < minimum)
                throw std::invalid_argument(std::string(name) + " must be at least " + std::to_string(minimum));
            return value;
        }

        bool readBoolean(const char* name, bool current)
        {
            const char* text = lookup(name);
            if (!text)
                return current;
            std::string value(text);
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (value == "1" || value == "true" || value == "yes" || value == "on")
                return true;
            if (value == "0" || value == "false" || value == "no" || value == "off")
                return false;
            throw std::invalid_argument(std::string(name) + " is not a boolean: '" + text + "'");
        }

        std::string readString(const char* name, const std::string& current)
        {
            const char* text = lookup(name);
            return text ? std::string(text) : current;
        }
    }

    RuntimeConfig::RuntimeConfig() : sandboxHelperPath(AUTOPO_SANDBOX_HELPER)
    {
    }

    RuntimeConfig RuntimeConfig::fromEnvironment()
    {
        RuntimeConfig config;
        config.maxResolutionDepth = static_cast<int>(readInteger("AUTOPO_MAX_RESOLUTION_DEPTH", config.maxResolutionDepth, 0));
        config.storeTimeoutMs = static_cast<long>(readInteger("AUTOPO_STORE_TIMEOUT_MS", config.storeTimeoutMs, 1));
        config.sandboxTimeoutMs = static_cast<long>(readInteger("AUTOPO_SANDBOX_TIMEOUT_MS", config.sandboxTimeoutMs, 1));
        config.generatorTimeoutMs = static_cast<long>(readInteger("AUTOPO_GENERATOR_TIMEOUT_MS", config.generatorTimeoutMs, 1));
        config.sandboxHelperPath = readString("AUTOPO_SANDBOX_HELPER", config.sandboxHelperPath);
        config.sandboxMemoryMb = static_cast<unsigned long>(readInteger("AUTOPO_SANDBOX_MEMORY_MB", config.sandboxMemoryMb, 0));
        config.sandboxCpuSeconds = static_cast<unsigned long>(readInteger("AUTOPO_SANDBOX_CPU_SECONDS", config.sandboxCpuSeconds, 0));
        config.sandboxStepLimit = static_cast<unsigned long>(readInteger("AUTOPO_SANDBOX_STEP_LIMIT", config.sandboxStepLimit, 1));
        config.ollamaHost = readString("AUTOPO_OLLAMA_HOST", config.ollamaHost);
        config.ollamaModel = readString("AUTOPO_OLLAMA_MODEL", config.ollamaModel);
        config.dispatchWorkers = static_cast<unsigned int>(readInteger("AUTOPO_DISPATCH_WORKERS", config.dispatchWorkers, 1));
        config.auditBeforeExecute = readBoolean("AUTOPO_AUDIT_BEFORE_EXECUTE", config.auditBeforeExecute);
        config.requireCommitMarker = readBoolean("AUTOPO_REQUIRE_COMMIT_MARKER", config.requireCommitMarker);
        return config;
    }

    SandboxLimits RuntimeConfig::getSandboxLimits() const
    {
        SandboxLimits limits;
        limits.timeout = std::chrono::milliseconds(sandboxTimeoutMs);
        limits.memoryMb = sandboxMemoryMb;
        limits.cpuSeconds = sandboxCpuSeconds;
        limits.stepLimit = sandboxStepLimit;
        return limits;
    }

    bool HealthReport::isHealthy() const
    {
        if (components.empty())
            return false;
        for (const auto& component : components)
        {
            if (component.second != "OK")
                return false;
        }
        return true;
    }
}
