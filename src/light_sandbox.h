#pragma once

#include <memory>
#include <chrono>
#include "constants.h"
#include "execution_types.h"

namespace mockrun {

struct LightSandboxConfig {
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_MB * 1024 * 1024;
    size_t stack_limit_bytes = LIGHT_STACK_LIMIT_BYTES;
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
};

// In-process interpreter strategy. Each run gets a fresh QuickJS runtime holding
// only the ECMAScript built-ins and the harness globals: no module loader,
// timers, filesystem or network exist inside it.
class LightSandbox {
public:
    explicit LightSandbox(const LightSandboxConfig& config);
    ~LightSandbox();

    LightSandbox(const LightSandbox&) = delete;
    LightSandbox& operator=(const LightSandbox&) = delete;

    // Runtime errors in user code come back as success=false.
    // Throws ExecutionTimeout when the deadline interrupts the run.
    ExecutionResult run(const ExecutionContext& context);

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace mockrun
