#include <cerrno>
#include <exception>
#include <gradelib/file_contents.hh>
#include <gradelib/grader/harness/js.hh>
#include <gradelib/grader/js/deep_equal.hh>
#include <gradelib/logger.hh>
#include <gradelib/pipe.hh>
#include <gradelib/spawner.hh>
#include <gradelib/temporary_directory.hh>
#include <nlohmann/json.hpp>
#include <optional>
#include <sys/socket.h>
#include <unistd.h>

using std::string;
using std::string_view;
using std::vector;

namespace {

// File descriptor number of the driver channel in node
constexpr int CHANNEL_FD = 3;

// Usage: node --disallow-code-generation-from-strings driver.js <work dir> <budget in ms>
// Every line the driver sends on the channel (fd 3) is a tag and JSON:
//   Q<value graph> - toEqual() query, answered with a single '1' or '0'
//   R<record> - the report, sent once right before exiting
// Submitted code gets neither the process object nor a way to compile code
// from strings, so it cannot write to the channel.
constexpr string_view driver_script = R"JS('use strict';
const fs = require('fs');
const path = require('path');
const vm = require('vm');

const proc = process;
const workDir = proc.argv[2];
const budgetMs = Number(proc.argv[3]);
const startedAt = Date.now();
const CHANNEL_FD = 3;
// setTimeout() fires almost immediately for longer delays
const MAX_TIMER_DELAY_MS = 2147483647;

function writeAllSync(fd, buf) {
  let off = 0;
  while (off < buf.length) {
    try {
      off += fs.writeSync(fd, buf, off, buf.length - off);
    } catch (e) {
      if (e.code !== 'EAGAIN') throw e;
    }
  }
}

function send(tag, payload) {
  writeAllSync(CHANNEL_FD, Buffer.from(tag + JSON.stringify(payload) + '\n'));
}

function report(record) {
  send('R', record);
  proc.exit(0);
}

function safeString(v) {
  try {
    return String(v);
  } catch (e) {
    return Object.prototype.toString.call(v);
  }
}

// Every object, symbol and function becomes exactly one node
function encodeGraph(a, b) {
  const nodes = [];
  const ids = new Map();
  const push = (node) => {
    nodes.push(node);
    return nodes.length - 1;
  };
  const encode = (v) => {
    const t = typeof v;
    if (v === undefined) return push({t: 'undefined'});
    if (v === null) return push({t: 'null'});
    if (t === 'boolean') return push({t: 'boolean', v});
    if (t === 'number') return push({t: 'number', v: Object.is(v, -0) ? '-0' : String(v)});
    if (t === 'bigint') return push({t: 'bigint', v: String(v)});
    if (t === 'string') return push({t: 'string', v});
    if (ids.has(v)) return ids.get(v);
    const node = {};
    const id = push(node);
    ids.set(v, id);
    if (t === 'symbol' || t === 'function') {
      node.t = t;
      return id;
    }
    if (Array.isArray(v)) {
      node.t = 'array';
      node.items = [];
      for (let i = 0; i < v.length; i++) node.items.push(encode(v[i]));
      return id;
    }
    if (v instanceof Date) {
      node.t = 'date';
      node.v = String(v.getTime());
    } else if (v instanceof RegExp) {
      node.t = 'regexp';
      node.source = v.source;
      node.flags = v.flags;
    } else if (ArrayBuffer.isView(v)) {
      node.t = 'typed';
      node.ctor = (v.constructor && v.constructor.name) || '';
      node.items = [];
      if (typeof v.length === 'number') {
        for (let i = 0; i < v.length; i++) node.items.push(String(v[i]));
      }
    } else {
      node.t = 'object';
    }
    node.keys = [];
    for (const k of Object.keys(v)) node.keys.push([k, encode(v[k])]);
    return id;
  };
  const ia = encode(a);
  const ib = encode(b);
  return {nodes, a: ia, b: ib};
}

function deepEqual(a, b) {
  send('Q', encodeGraph(a, b));
  const verdict = Buffer.alloc(1);
  for (;;) {
    let n;
    try {
      n = fs.readSync(CHANNEL_FD, verdict, 0, 1, null);
    } catch (e) {
      if (e.code === 'EAGAIN') continue;
      throw e;
    }
    if (n === 0) throw new Error('Matcher channel closed');
    return verdict[0] === 0x31;
  }
}

const tests = [];
const suiteStack = [];
const logs = [];

const describe = (name, fn) => {
  suiteStack.push(name);
  try {
    fn();
  } finally {
    suiteStack.pop();
  }
};
const test = (name, fn) => {
  tests.push({name: [...suiteStack, name].join(' › '), fn});
};
const expect = (received) => ({
  toBe(expected) {
    if (!Object.is(received, expected)) {
      throw new Error(
        `Expected (toBe): ${safeString(expected)}\nReceived: ${safeString(received)}`);
    }
  },
  toEqual(expected) {
    if (!deepEqual(received, expected)) {
      const ser = (v) => {
        try {
          return JSON.stringify(v, (_k, x) => typeof x === 'bigint' ? `${x}n` : x, 2);
        } catch (e) {
          return safeString(v);
        }
      };
      throw new Error(`Expected (toEqual):\n${ser(expected)}\nReceived:\n${ser(received)}`);
    }
  },
});

const capture = (...args) => {
  logs.push(args.map(safeString).join(' '));
};
const capturedConsole = {
  log: capture, info: capture, warn: capture, error: capture, debug: capture, trace: capture,
  dir: capture,
};

const networkDisabled = () => {
  throw new Error('Network access is disabled inside the autograder sandbox');
};
globalThis.fetch = networkDisabled;
globalThis.XMLHttpRequest = function() { throw new Error('Network disabled'); };
globalThis.WebSocket = function() { throw new Error('Network disabled'); };
globalThis.EventSource = function() { throw new Error('Network disabled'); };

proc.on('unhandledRejection', (reason) => {
  logs.push(`Unhandled promise rejection: ${safeString(reason)}`);
});

// Compiled without importModuleDynamically, so import() rejects
function evalModule(filename, source, requireFn) {
  const module = {exports: {}};
  const scope = {
    console: capturedConsole, setTimeout, clearTimeout, setInterval, clearInterval,
    process: undefined,
  };
  const fn = vm.compileFunction(source,
    ['require', 'module', 'exports', '__filename', '__dirname', ...Object.keys(scope)],
    {filename});
  fn.call(undefined, requireFn, module, module.exports, filename, path.dirname(filename),
    ...Object.values(scope));
  return module.exports;
}

async function main() {
  const solutionFile = path.join(workDir, 'solution.js');
  const testsFile = path.join(workDir, 'tests.js');
  const solutionSrc = fs.readFileSync(solutionFile, 'utf8');
  const testsSrc = fs.readFileSync(testsFile, 'utf8');
  delete globalThis.process;
  globalThis.console = capturedConsole;

  let solutionModule = null;
  try {
    solutionModule = evalModule(solutionFile, solutionSrc, (p) => {
      if (p === './solution' || p === './solution.js') return solutionModule ?? {};
      if (p === './tests' || p === './tests.js') {
        throw new Error('Tests cannot be required directly');
      }
      throw new Error(`Unknown require path: ${p}`);
    });
    Object.assign(globalThis, solutionModule);

    globalThis.describe = describe;
    globalThis.test = test;
    globalThis.it = test;
    globalThis.expect = expect;

    evalModule(testsFile, testsSrc, (p) => {
      if (p === './solution' || p === './solution.js') return solutionModule;
      throw new Error(`Unknown require path: ${p}`);
    });
  } catch (e) {
    report({
      phase: 'load_error',
      name: (e && e.name) ? safeString(e.name) : '',
      message: safeString(e),
      stack: (e && e.stack) ? safeString(e.stack) : safeString(e),
    });
  }

  const timeoutMarker = {};
  const results = [];
  for (const t of tests) {
    const remaining = budgetMs - (Date.now() - startedAt);
    if (remaining <= 0) report({phase: 'timeout', test: t.name});
    try {
      const maybe = t.fn();
      if (maybe && typeof maybe.then === 'function') {
        let timer;
        try {
          await Promise.race([
            maybe,
            new Promise((_resolve, reject) => {
              timer = setTimeout(() => reject(timeoutMarker),
                Math.min(remaining, MAX_TIMER_DELAY_MS));
            }),
          ]);
        } finally {
          clearTimeout(timer);
        }
      }
      results.push({name: t.name, ok: true, err: ''});
    } catch (e) {
      if (e === timeoutMarker) report({phase: 'timeout', test: t.name});
      results.push({
        name: t.name, ok: false, err: (e && e.stack) ? safeString(e.stack) : safeString(e),
      });
    }
  }
  if (Date.now() - startedAt > budgetMs) report({phase: 'timeout', test: ''});

  report({phase: 'done', results, logs});
}

main().catch((e) => {
  proc.stderr.write(`Driver failure: ${(e && e.stack) || safeString(e)}\n`);
  proc.exit(70);
});
)JS";

// Serves the driver channel: answers toEqual() queries and keeps the report
class DriverChannel {
    int fd_;
    string buff_;
    std::optional<string> report_;
    size_t reports_received_ = 0;

public:
    explicit DriverChannel(int fd) : fd_(fd) {}

    // Returns false when the channel is closed
    bool on_readable() {
        char chunk[65536];
        ssize_t len = read(fd_, chunk, sizeof(chunk));
        if (len < 0) {
            if (errno == EINTR or errno == EAGAIN) {
                return true;
            }
            THROW("read()", errmsg());
        }
        if (len == 0) {
            return false;
        }
        buff_.append(chunk, len);

        size_t pos = 0;
        for (size_t eol; (eol = buff_.find('\n', pos)) != string::npos; pos = eol + 1) {
            handle_line(string_view{buff_}.substr(pos, eol - pos));
        }
        buff_.erase(0, pos);
        return true;
    }

    [[nodiscard]] size_t reports_received() const noexcept { return reports_received_; }

    [[nodiscard]] const std::optional<string>& report() const noexcept { return report_; }

private:
    void handle_line(string_view line) {
        if (line.starts_with('Q')) {
            auto query = grader::js::parse_matcher_query(line.substr(1));
            char verdict = grader::js::deep_equal(query.graph, query.a, query.b) ? '1' : '0';
            if (send(fd_, &verdict, 1, MSG_NOSIGNAL) != 1) {
                THROW("send()", errmsg());
            }
        } else if (line.starts_with('R')) {
            if (++reports_received_ == 1) {
                report_.emplace(line.substr(1));
            }
        } else {
            THROW("Unexpected message from the JS driver: ", line.substr(0, 64));
        }
    }
};

} // namespace

namespace grader::harness {

RunResult make_js_report(const vector<JsTestOutcome>& outcomes, const vector<string>& logs) {
    string text = concat_tostr("Ran ", outcomes.size(), " tests\n");
    size_t failed = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.ok) {
            back_insert(text, "✓ ", outcome.name, '\n');
        } else {
            ++failed;
            back_insert(text, "✗ ", outcome.name, '\n', outcome.err, '\n');
        }
    }
    if (not logs.empty()) {
        text += "\nConsole output:\n";
        for (size_t i = 0; i < logs.size(); ++i) {
            back_insert(text, logs[i], '\n');
        }
    }

    if (failed == 0) {
        text += "OK\n";
        return result_ok(std::move(text));
    }
    back_insert(text, "FAILED (failures=", failed, ")\n");
    return result_fail(std::move(text), ErrorKind::TESTS_FAILED);
}

RunResult run_js_harness(
    const HarnessContext& ctx,
    string_view solution,
    string_view tests,
    std::chrono::milliseconds timeout
) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto timeout_ms = static_cast<uint64_t>(timeout.count());

    string node;
    TemporaryDirectory work_dir;
    try {
        node = resolve_runtime(ctx, "node", ctx.config.node_executable);
        work_dir = TemporaryDirectory{ctx.config.work_dir_template};
        put_file_contents(work_dir.path() + "driver.js", driver_script);
        put_file_contents(work_dir.path() + "solution.js", solution);
        put_file_contents(work_dir.path() + "tests.js", tests);
    } catch (const std::exception& e) {
        errlog("JS harness: bootstrap failed: ", e.what());
        return result_fail(
            concat_tostr("Failed to initialize JS runtime: ", e.what()), ErrorKind::RUNTIME_ERROR
        );
    }

    auto channel = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    if (not channel) {
        THROW("socketpair()", errmsg());
    }

    ctx.after_bootstrap();

    DriverChannel driver{channel->our_end};
    auto res = Spawner::run(
        node,
        {
            "node",
            "--disallow-code-generation-from-strings",
            work_dir.path() + "driver.js",
            work_dir.path(),
            std::to_string(timeout_ms),
        },
        {
            .working_dir = work_dir.path(),
            .deadline = deadline,
            .inherited_fds = {{channel->other_end, CHANNEL_FD}},
            .watches = {{
                .fd = channel->our_end,
                .on_readable = [&driver](int /*fd*/) { return driver.on_readable(); },
            }},
        }
    );

    if (res.exit_stat.timed_out) {
        return result_run_timeout(timeout_ms);
    }

    if (driver.reports_received() > 1) {
        return result_fail(
            concat_tostr("The JS driver sent ", driver.reports_received(), " reports"),
            ErrorKind::RUNTIME_ERROR
        );
    }
    const auto& record_text = driver.report();
    if (not record_text) {
        const string& err = res.stderr_data;
        const string& out = res.stdout_data;
        return result_fail(
            not err.empty() ? err : not out.empty() ? out : concat_tostr("node ", res.exit_stat.message),
            ErrorKind::RUNTIME_ERROR
        );
    }

    try {
        auto record = nlohmann::json::parse(*record_text);
        auto phase = record.at("phase").get<string>();
        if (phase == "timeout") {
            return result_run_timeout(timeout_ms);
        }
        if (phase == "load_error") {
            auto name = record.value("name", "");
            auto message = record.value("message", "");
            bool is_compile = name.find("SyntaxError") != string::npos or
                message.find("Unknown require path") != string::npos;
            return result_fail(
                record.value("stack", message),
                is_compile ? ErrorKind::COMPILE_ERROR : ErrorKind::RUNTIME_ERROR
            );
        }
        if (phase != "done") {
            THROW("Unknown report phase: ", phase);
        }

        vector<JsTestOutcome> outcomes;
        for (const auto& r : record.at("results")) {
            outcomes.push_back({
                .name = r.at("name").get<string>(),
                .ok = r.at("ok").get<bool>(),
                .err = r.value("err", ""),
            });
        }
        return make_js_report(outcomes, record.at("logs").get<vector<string>>());
    } catch (const nlohmann::json::exception& e) {
        return result_fail(
            concat_tostr("Failed to parse report: ", e.what()),
            ErrorKind::RUNTIME_ERROR
        );
    }
}

} // namespace grader::harness
