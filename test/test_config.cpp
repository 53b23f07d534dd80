#include <gtest/gtest.h>
#include "../headers/autopoCore.h"
#include <cstdlib>

using namespace autopo;

class ConfigTest : public ::testing::Test {
protected:
    const std::vector<const char*> variables{
        "AUTOPO_MAX_RESOLUTION_DEPTH", "AUTOPO_STORE_TIMEOUT_MS", "AUTOPO_SANDBOX_TIMEOUT_MS",
        "AUTOPO_GENERATOR_TIMEOUT_MS", "AUTOPO_SANDBOX_HELPER", "AUTOPO_SANDBOX_MEMORY_MB",
        "AUTOPO_SANDBOX_CPU_SECONDS", "AUTOPO_SANDBOX_STEP_LIMIT", "AUTOPO_OLLAMA_HOST",
        "AUTOPO_OLLAMA_MODEL", "AUTOPO_DISPATCH_WORKERS", "AUTOPO_AUDIT_BEFORE_EXECUTE",
        "AUTOPO_REQUIRE_COMMIT_MARKER"};

    void SetUp() override {
        for (const char* name : variables)
            unsetenv(name);
    }

    void TearDown() override {
        for (const char* name : variables)
            unsetenv(name);
    }
};

TEST_F(ConfigTest, Defaults) {
    RuntimeConfig config = RuntimeConfig::fromEnvironment();
    ASSERT_EQ(config.maxResolutionDepth, 100);
    ASSERT_EQ(config.sandboxTimeoutMs, 10000);
    ASSERT_EQ(config.ollamaHost, "http://localhost:11434");
    ASSERT_TRUE(config.auditBeforeExecute);
    ASSERT_FALSE(config.requireCommitMarker);
    ASSERT_FALSE(config.sandboxHelperPath.empty());
}

TEST_F(ConfigTest, Overrides) {
    setenv("AUTOPO_MAX_RESOLUTION_DEPTH", "12", 1);
    setenv("AUTOPO_SANDBOX_TIMEOUT_MS", "250", 1);
    setenv("AUTOPO_OLLAMA_MODEL", "tiny", 1);
    setenv("AUTOPO_DISPATCH_WORKERS", "2", 1);
    setenv("AUTOPO_REQUIRE_COMMIT_MARKER", "Yes", 1);
    setenv("AUTOPO_AUDIT_BEFORE_EXECUTE", "off", 1);

    RuntimeConfig config = RuntimeConfig::fromEnvironment();
    ASSERT_EQ(config.maxResolutionDepth, 12);
    ASSERT_EQ(config.ollamaModel, "tiny");
    ASSERT_EQ(config.dispatchWorkers, 2u);
    ASSERT_TRUE(config.requireCommitMarker);
    ASSERT_FALSE(config.auditBeforeExecute);
    ASSERT_EQ(config.getSandboxLimits().timeout, std::chrono::milliseconds(250));
}

TEST_F(ConfigTest, EmptyMeansUnset) {
    setenv("AUTOPO_OLLAMA_HOST", "", 1);
    ASSERT_EQ(RuntimeConfig::fromEnvironment().ollamaHost, "http://localhost:11434");
}

TEST_F(ConfigTest, MalformedValuesThrow) {
    setenv("AUTOPO_SANDBOX_TIMEOUT_MS", "soon", 1);
    ASSERT_THROW(RuntimeConfig::fromEnvironment(), std::invalid_argument);
    unsetenv("AUTOPO_SANDBOX_TIMEOUT_MS");

    setenv("AUTOPO_DISPATCH_WORKERS", "0", 1);
    ASSERT_THROW(RuntimeConfig::fromEnvironment(), std::invalid_argument);
    unsetenv("AUTOPO_DISPATCH_WORKERS");

    setenv("AUTOPO_AUDIT_BEFORE_EXECUTE", "maybe", 1);
    ASSERT_THROW(RuntimeConfig::fromEnvironment(), std::invalid_argument);
}

TEST_F(ConfigTest, HealthRequiresEveryComponent) {
    HealthReport report;
    ASSERT_FALSE(report.isHealthy());
    report.components["store"] = "OK";
    ASSERT_TRUE(report.isHealthy());
    report.components["sandbox"] = "FAIL: no answer";
    ASSERT_FALSE(report.isHealthy());
}
