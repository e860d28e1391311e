#pragma once

#include <string>
#include <json/json.h>
#include "execution_types.h"

namespace mockrun {

// Key that marks the result line a Heavy program prints
constexpr const char* ENVELOPE_MARKER = "__mockrun";

// Source text that surrounds user code in both strategies.
//
// The prelude evaluates to a function (global, context, host) that installs the
// sandbox globals: read-only mockData/environment/request/currentCollection,
// Response, collection accessors, id helpers, the save helpers and a buffering
// console. host supplies generateId, generateToken, getTimestamp and log(line);
// Light binds them natively, Heavy implements them in the node program.
class Harness {
public:
    static const std::string& prelude();

    // {mockData, environment, request, currentCollection, executionId}
    static Json::Value build_context(const ExecutionContext& context);

    // Async function expression around user code; awaiting its call yields the result
    static std::string wrap_user_code(const std::string& code);

    // Complete node program. Prints one envelope line
    // {"__mockrun":1, success, data, error, logs} as the last line of stdout.
    static std::string build_node_program(const ExecutionContext& context);
};

} // namespace mockrun
