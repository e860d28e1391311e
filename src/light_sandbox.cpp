#include "light_sandbox.h"
#include "harness.h"
#include "hash_utils.h"
#include "json_utils.h"
#include "errors.h"
#include <quickjs.h>
#include <vector>

namespace mockrun {

namespace {

struct RunState {
    std::chrono::steady_clock::time_point deadline;
    bool timed_out = false;
    std::vector<std::string> logs;
};

int interrupt_handler(JSRuntime*, void* opaque) {
    auto* state = static_cast<RunState*>(opaque);
    if (std::chrono::steady_clock::now() >= state->deadline) {
        state->timed_out = true;
        return 1;
    }
    return 0;
}

struct RuntimeDeleter {
    void operator()(JSRuntime* rt) const { JS_FreeRuntime(rt); }
};

struct ContextDeleter {
    void operator()(JSContext* ctx) const { JS_FreeContext(ctx); }
};

// Frees one JSValue at scope exit
class ScopedValue {
public:
    ScopedValue(JSContext* ctx, JSValue value) : ctx_(ctx), value_(value) {}
    ~ScopedValue() { JS_FreeValue(ctx_, value_); }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

    JSValue get() const { return value_; }
    bool is_exception() const { return JS_IsException(value_); }

private:
    JSContext* ctx_;
    JSValue value_;
};

std::string to_std_string(JSContext* ctx, JSValueConst value) {
    size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, value);
    if (!str) {
        JS_FreeValue(ctx, JS_GetException(ctx));
        return "";
    }
    std::string out(str, len);
    JS_FreeCString(ctx, str);
    return out;
}

std::string exception_message(JSContext* ctx) {
    ScopedValue exception(ctx, JS_GetException(ctx));
    if (JS_IsError(ctx, exception.get())) {
        ScopedValue message(ctx, JS_GetPropertyStr(ctx, exception.get(), "message"));
        if (JS_IsString(message.get())) {
            return to_std_string(ctx, message.get());
        }
    }
    return to_std_string(ctx, exception.get());
}

JSValue to_js(JSContext* ctx, const Json::Value& value) {
    switch (value.type()) {
        case Json::nullValue:
            return JS_NULL;
        case Json::booleanValue:
            return JS_NewBool(ctx, value.asBool());
        case Json::intValue:
            return JS_NewInt64(ctx, value.asInt64());
        case Json::uintValue:
            if (value.isInt64()) {
                return JS_NewInt64(ctx, value.asInt64());
            }
            return JS_NewFloat64(ctx, value.asDouble());
        case Json::realValue:
            return JS_NewFloat64(ctx, value.asDouble());
        case Json::stringValue: {
            std::string str = value.asString();
            return JS_NewStringLen(ctx, str.data(), str.size());
        }
        case Json::arrayValue: {
            JSValue array = JS_NewArray(ctx);
            for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
                JS_SetPropertyUint32(ctx, array, i, to_js(ctx, value[i]));
            }
            return array;
        }
        case Json::objectValue: {
            JSValue object = JS_NewObject(ctx);
            for (const auto& key : value.getMemberNames()) {
                JS_SetPropertyStr(ctx, object, key.c_str(), to_js(ctx, value[key]));
            }
            return object;
        }
    }
    return JS_UNDEFINED;
}

JSValue js_generate_id(JSContext* ctx, JSValueConst, int, JSValueConst*) {
    try {
        std::string id = HashUtils::random_hex(5).substr(0, 9);
        return JS_NewStringLen(ctx, id.data(), id.size());
    } catch (const std::exception& e) {
        return JS_ThrowInternalError(ctx, "%s", e.what());
    }
}

JSValue js_generate_token(JSContext* ctx, JSValueConst, int, JSValueConst*) {
    try {
        std::string token = "mock_token_" + HashUtils::random_hex(16);
        return JS_NewStringLen(ctx, token.data(), token.size());
    } catch (const std::exception& e) {
        return JS_ThrowInternalError(ctx, "%s", e.what());
    }
}

JSValue js_get_timestamp(JSContext* ctx, JSValueConst, int, JSValueConst*) {
    std::string now = JsonUtils::iso8601_now();
    return JS_NewStringLen(ctx, now.data(), now.size());
}

JSValue js_log(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* state = static_cast<RunState*>(JS_GetContextOpaque(ctx));
    if (state && argc > 0) {
        state->logs.push_back(to_std_string(ctx, argv[0]));
    }
    return JS_UNDEFINED;
}

JSValue make_host(JSContext* ctx) {
    JSValue host = JS_NewObject(ctx);
    JS_SetPropertyStr(ctx, host, "generateId", JS_NewCFunction(ctx, js_generate_id, "generateId", 0));
    JS_SetPropertyStr(ctx, host, "generateToken", JS_NewCFunction(ctx, js_generate_token, "generateToken", 0));
    JS_SetPropertyStr(ctx, host, "getTimestamp", JS_NewCFunction(ctx, js_get_timestamp, "getTimestamp", 0));
    JS_SetPropertyStr(ctx, host, "log", JS_NewCFunction(ctx, js_log, "log", 1));
    return host;
}

// ECMAScript built-ins only; no std/os modules
JSContext* new_restricted_context(JSRuntime* rt) {
    JSContext* ctx = JS_NewContextRaw(rt);
    if (!ctx) {
        return nullptr;
    }
    JS_AddIntrinsicBaseObjects(ctx);
    JS_AddIntrinsicDate(ctx);
    JS_AddIntrinsicEval(ctx);          // Needed by JS_Eval; the eval global is removed by the prelude
    JS_AddIntrinsicStringNormalize(ctx);
    JS_AddIntrinsicRegExp(ctx);
    JS_AddIntrinsicJSON(ctx);
    JS_AddIntrinsicMapSet(ctx);
    JS_AddIntrinsicTypedArrays(ctx);
    JS_AddIntrinsicPromise(ctx);
    return ctx;
}

} // namespace

class LightSandbox::Impl {
public:
    LightSandboxConfig config_;

    explicit Impl(const LightSandboxConfig& config) : config_(config) {}

    ExecutionResult run(const ExecutionContext& context) {
        auto start_time = std::chrono::steady_clock::now();

        ExecutionResult result;
        result.strategy = Strategy::LIGHT;

        RunState state;
        state.deadline = start_time + config_.timeout;

        std::unique_ptr<JSRuntime, RuntimeDeleter> runtime(JS_NewRuntime());
        if (!runtime) {
            throw InternalError("Failed to create QuickJS runtime");
        }
        JS_SetMemoryLimit(runtime.get(), config_.memory_limit_bytes);
        JS_SetMaxStackSize(runtime.get(), config_.stack_limit_bytes);
        JS_SetInterruptHandler(runtime.get(), interrupt_handler, &state);

        std::unique_ptr<JSContext, ContextDeleter> js_context(new_restricted_context(runtime.get()));
        if (!js_context) {
            throw InternalError("Failed to create QuickJS context");
        }
        JSContext* ctx = js_context.get();
        JS_SetContextOpaque(ctx, &state);

        std::string error;
        Json::Value output;
        bool completed = execute(ctx, runtime.get(), context, state, output, error);

        if (state.timed_out) {
            throw ExecutionTimeout("Execution exceeded " + std::to_string(config_.timeout.count()) + "ms");
        }

        result.success = completed;
        result.output = completed ? output : Json::Value(Json::nullValue);
        result.error = error;
        result.logs = std::move(state.logs);
        result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return result;
    }

private:
    bool execute(JSContext* ctx, JSRuntime* rt, const ExecutionContext& context, RunState& state,
                 Json::Value& output, std::string& error) {
        const std::string& prelude = Harness::prelude();
        ScopedValue install(ctx, JS_Eval(ctx, prelude.c_str(), prelude.size(), "<prelude>",
                                         JS_EVAL_TYPE_GLOBAL));
        if (install.is_exception()) {
            error = "Harness setup failed: " + exception_message(ctx);
            return false;
        }

        {
            ScopedValue global(ctx, JS_GetGlobalObject(ctx));
            ScopedValue bound(ctx, to_js(ctx, Harness::build_context(context)));
            ScopedValue host(ctx, make_host(ctx));
            JSValue args[3] = {global.get(), bound.get(), host.get()};
            ScopedValue installed(ctx, JS_Call(ctx, install.get(), JS_UNDEFINED, 3, args));
            if (installed.is_exception()) {
                error = "Harness setup failed: " + exception_message(ctx);
                return false;
            }
        }

        std::string source = "(" + Harness::wrap_user_code(context.request.code) + ")";
        ScopedValue function(ctx, JS_Eval(ctx, source.c_str(), source.size(), "<endpoint>",
                                          JS_EVAL_TYPE_GLOBAL));
        if (function.is_exception()) {
            error = exception_message(ctx);
            return false;
        }

        ScopedValue promise(ctx, JS_Call(ctx, function.get(), JS_UNDEFINED, 0, nullptr));
        if (promise.is_exception()) {
            error = exception_message(ctx);
            return false;
        }

        // Drain the job queue until the async function settles
        while (JS_PromiseState(ctx, promise.get()) == JS_PROMISE_PENDING) {
            JSContext* job_ctx = nullptr;
            int rc = JS_ExecutePendingJob(rt, &job_ctx);
            if (rc < 0) {
                error = exception_message(job_ctx ? job_ctx : ctx);
                return false;
            }
            if (rc == 0) {
                error = "Returned promise never settled";
                return false;
            }
            if (state.timed_out) {
                return false;
            }
        }

        ScopedValue settled(ctx, JS_PromiseResult(ctx, promise.get()));
        if (JS_PromiseState(ctx, promise.get()) == JS_PROMISE_REJECTED) {
            JS_Throw(ctx, JS_DupValue(ctx, settled.get()));
            error = exception_message(ctx);
            return false;
        }

        ScopedValue json(ctx, JS_JSONStringify(ctx, settled.get(), JS_UNDEFINED, JS_UNDEFINED));
        if (json.is_exception()) {
            error = "Result is not JSON-serializable: " + exception_message(ctx);
            return false;
        }
        if (JS_IsUndefined(json.get())) {
            output = Json::Value(Json::nullValue);
            return true;
        }

        std::string parse_error;
        if (!JsonUtils::try_parse(to_std_string(ctx, json.get()), output, &parse_error)) {
            error = "Result is not JSON-serializable: " + parse_error;
            return false;
        }
        return true;
    }
};

LightSandbox::LightSandbox(const LightSandboxConfig& config)
    : impl(std::make_unique<Impl>(config)) {}

LightSandbox::~LightSandbox() = default;

ExecutionResult LightSandbox::run(const ExecutionContext& context) {
    return impl->run(context);
}

} // namespace mockrun
