#pragma once

#include <cstddef>  // for size_t

namespace mockrun {

// Code limits
constexpr size_t MAX_CODE_LENGTH = 50000;                         // Characters
constexpr int MAX_LOOP_CONSTRUCTS = 10;                           // for/while/do per snippet

// Time limits
constexpr int DEFAULT_TIMEOUT_MS = 5000;                          // Per-run deadline
constexpr int MIN_TIMEOUT_MS = 100;
constexpr int MAX_TIMEOUT_MS = 60000;                             // Accepted from callers
constexpr int MAX_RUN_DEADLINE_MS = 30000;                        // Hard cap on any run
constexpr int DESTROY_GRACE_PERIOD_MS = 2000;                     // SIGTERM -> SIGKILL
constexpr int SWEEP_INTERVAL_SECONDS = 300;                       // Every 5 minutes
constexpr int SWEEP_MAX_AGE_SECONDS = 3600;                       // Idle for 1 hour
constexpr int HEALTH_PROBE_INTERVAL_SECONDS = 60;                 // Re-probe isolation

// Memory limits
constexpr size_t DEFAULT_MEMORY_LIMIT_MB = 128;
constexpr size_t MIN_MEMORY_LIMIT_MB = 64;
constexpr size_t MAX_MEMORY_LIMIT_MB = 1024;
constexpr size_t LIGHT_STACK_LIMIT_BYTES = 1024 * 1024;          // QuickJS stack
constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;             // 10MB max stdout
constexpr size_t MAX_REQUEST_SIZE = 10 * 1024 * 1024;            // 10MB max request

// Environment limits
constexpr int DEFAULT_MAX_ENVIRONMENTS = 10;                     // Live Heavy environments
constexpr int MAX_OPEN_FILES = 64;                               // Per environment
constexpr size_t MAX_FILE_SIZE_BYTES = 1024 * 1024;              // Writes inside an environment

// Result cache
constexpr int CACHE_TTL_MS = 30000;                              // 30 seconds

// Rate limiting
constexpr int MAX_EXECUTIONS_PER_HOUR = 1000;                    // Per user
constexpr int RATE_LIMIT_CLEANUP_MINUTES = 60;                   // Forget idle users

// Audit
constexpr size_t MAX_LOGGED_BODY_BYTES = 10 * 1024;              // Truncate logged bodies
constexpr int DEFAULT_HISTORY_LIMIT = 20;
constexpr size_t MAX_RETAINED_LOG_RECORDS = 10000;             // In-memory call log, oldest dropped

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 8443;                               // Default server port
constexpr int LISTEN_BACKLOG = 64;                               // Socket listen backlog

} // namespace mockrun
