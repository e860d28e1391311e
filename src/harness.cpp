#include "harness.h"
#include "json_utils.h"

namespace mockrun {

namespace {

const char* PRELUDE_SOURCE = R"JS((function (g, ctx, host) {
  'use strict';

  const freeze = (value) => {
    if (value && typeof value === 'object' && !Object.isFrozen(value)) {
      Object.freeze(value);
      Object.keys(value).forEach((key) => freeze(value[key]));
    }
    return value;
  };
  const copy = (value) => (value === undefined ? undefined : JSON.parse(JSON.stringify(value)));
  const stamp = () => host.getTimestamp();

  const mockData = freeze(ctx.mockData || {});
  const environment = freeze(ctx.environment || {});
  const request = freeze(ctx.request || {});
  const currentCollection = freeze(ctx.currentCollection || {});
  const collectionName = currentCollection.name || '';
  const collectionId = currentCollection.id || '';
  const executionId = ctx.executionId || '';

  // Helpers see each other's pending changes; mockData itself stays untouched
  const working = {};
  const itemsOf = (name) => {
    if (Object.prototype.hasOwnProperty.call(working, name)) return working[name];
    return Array.isArray(mockData[name]) ? mockData[name].slice() : [];
  };
  const matches = (item, id) => item !== null && typeof item === 'object' && (item.id == id || item._id == id);

  const format = (value) => {
    if (typeof value === 'string') return value;
    if (value instanceof Error) return value.stack || value.message;
    try {
      const text = JSON.stringify(value);
      return text === undefined ? String(value) : text;
    } catch (e) {
      return String(value);
    }
  };
  const emit = (level) => (...args) => {
    const text = args.map(format).join(' ');
    host.log(level === 'log' || level === 'info' ? text : '[' + level + '] ' + text);
  };
  const console = { log: emit('log'), info: emit('info'), warn: emit('warn'), error: emit('error') };

  const Response = {
    json: (data, status = 200) => ({ success: status >= 200 && status < 300, status, data, timestamp: stamp() }),
    error: (message, status = 400) => ({ success: false, status, error: message, timestamp: stamp() }),
    success: (data) => ({ success: true, status: 200, data, timestamp: stamp() })
  };

  // Copies, so callers can edit and hand the result to a save helper
  const getCollection = () => copy(mockData[collectionName] || []);
  const getCollectionByName = (name) => copy(mockData[name] || []);

  const saveMockData = async (items, customName) => {
    const name = customName || collectionName;
    if (!collectionId) {
      return { success: false, error: 'No mock data collection selected. Please select a collection first.', collection: name };
    }
    if (!Array.isArray(items)) {
      return { success: false, error: 'Data to save must be an array', collection: name };
    }
    const data = copy(items);
    working[name] = data.slice();
    return {
      success: true,
      message: data.length + ' items ready to save to ' + name,
      collection: name,
      itemsToSave: data.length,
      executionId,
      status: 'ready',
      _saveOperation: {
        type: 'save_mock_data',
        collectionId,
        collectionName: name,
        data,
        executionId,
        timestamp: stamp()
      }
    };
  };

  const updateAndSave = async (items, customName) => saveMockData(items, customName);

  const createAndSave = async (item, customName) => {
    const name = customName || collectionName;
    const items = itemsOf(name);
    const created = Object.assign({ id: 'item_' + Date.now() + '_' + host.generateId().slice(0, 6) },
                                  copy(item), { createdAt: stamp(), updatedAt: stamp() });
    items.push(created);
    const result = await saveMockData(items, name);
    return Object.assign({}, result, { item: created });
  };

  const updateAndSaveItem = async (id, updates, customName) => {
    const name = customName || collectionName;
    const items = itemsOf(name);
    const index = items.findIndex((item) => matches(item, id));
    if (index === -1) {
      return { success: false, error: 'Item with ID ' + id + ' not found in ' + name };
    }
    const updated = Object.assign({}, copy(items[index]), copy(updates), { updatedAt: stamp() });
    items[index] = updated;
    const result = await saveMockData(items, name);
    return Object.assign({}, result, { item: updated });
  };

  const deleteAndSave = async (id, customName) => {
    const name = customName || collectionName;
    const items = itemsOf(name);
    const index = items.findIndex((item) => matches(item, id));
    if (index === -1) {
      return { success: false, error: 'Item with ID ' + id + ' not found in ' + name };
    }
    const removed = items.splice(index, 1)[0];
    const result = await saveMockData(items, name);
    return Object.assign({}, result, { item: removed });
  };

  const globals = {
    mockData, environment, request, currentCollection, Response, console,
    getCollection, getCollectionByName,
    generateId: () => host.generateId(),
    generateToken: () => host.generateToken(),
    getTimestamp: stamp,
    saveMockData, updateAndSave, createAndSave, updateAndSaveItem, deleteAndSave
  };
  Object.keys(globals).forEach((name) => {
    Object.defineProperty(g, name, { value: globals[name], writable: false, enumerable: false, configurable: false });
  });

  // No code generation from strings
  const blocked = function () { throw new EvalError('Code generation from strings is disabled'); };
  const constructors = [function () {}, async function () {}, function* () {}, async function* () {}];
  constructors.forEach((fn) => {
    Object.defineProperty(Object.getPrototypeOf(fn), 'constructor', { value: blocked, writable: false, configurable: false });
  });
  Object.defineProperty(g, 'Function', { value: blocked, writable: false, configurable: false });
  delete g.eval;
}))JS";

// Trust boundary: context values and user code enter the program only as JSON
// literals produced by jsoncpp, and user code is compiled as a function body
// whose parameters shadow the module-scope capabilities.
const char* NODE_PROGRAM_HEAD = R"JS(const vm = require('vm');
const crypto = require('crypto');
const write = process.stdout.write.bind(process.stdout);
const logs = [];
const host = {
  generateId: () => crypto.randomBytes(8).toString('hex').slice(0, 9),
  generateToken: () => 'mock_token_' + crypto.randomBytes(16).toString('hex'),
  getTimestamp: () => new Date().toISOString(),
  log: (line) => { logs.push(String(line)); }
};
const emit = (success, data, error) => {
  let line;
  try {
    line = JSON.stringify({ __mockrun: 1, success, data: data === undefined ? null : data, error, logs });
  } catch (e) {
    line = JSON.stringify({ __mockrun: 1, success: false, data: null, error: 'Result is not JSON-serializable: ' + e.message, logs });
  }
  write('\n' + line + '\n');
};
const describe = (e) => (e && e.message ? e.message : String(e));
)JS";

const char* NODE_PROGRAM_TAIL = R"JS(
let run;
try {
  prelude(globalThis, context, host);
  run = vm.compileFunction('return (' + userFunction + ')();',
    ['require', 'module', 'exports', 'process', '__filename', '__dirname', 'global']);
} catch (e) {
  emit(false, null, describe(e));
  return;
}
delete globalThis.process;
Promise.resolve()
  .then(() => run())
  .then((data) => emit(true, data, null), (e) => emit(false, null, describe(e)));
)JS";

} // namespace

const std::string& Harness::prelude() {
    static const std::string source(PRELUDE_SOURCE);
    return source;
}

Json::Value Harness::build_context(const ExecutionContext& context) {
    Json::Value ctx(Json::objectValue);
    ctx["mockData"] = context.mock_data;
    ctx["environment"] = context.environment;
    ctx["request"] = context.request_descriptor();
    ctx["currentCollection"] = context.current_collection;
    ctx["executionId"] = context.request.execution_id;
    return ctx;
}

std::string Harness::wrap_user_code(const std::string& code) {
    return "async function () {\n" + code + "\n}";
}

std::string Harness::build_node_program(const ExecutionContext& context) {
    std::string program = NODE_PROGRAM_HEAD;
    program += "const context = " + JsonUtils::to_compact(build_context(context)) + ";\n";
    program += "const userFunction = " +
               JsonUtils::to_compact(Json::Value(wrap_user_code(context.request.code))) + ";\n";
    program += "const prelude = " + prelude() + ";\n";
    program += NODE_PROGRAM_TAIL;
    return program;
}

} // namespace mockrun
