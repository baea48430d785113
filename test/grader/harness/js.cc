#include <chrono>
#include <gmock/gmock.h>
#include <gradelib/concat_tostr.hh>
#include <gradelib/grader/harness/js.hh>
#include <gtest/gtest.h>
#include <unistd.h>

using grader::ErrorKind;
using grader::harness::HarnessContext;
using grader::harness::JsTestOutcome;
using std::chrono_literals::operator""ms;
using testing::HasSubstr;
using testing::Not;

namespace {

constexpr auto add_solution = "module.exports = { add: (a,b) => a+b }";

HarnessContext js_context() {
    HarnessContext ctx;
    ctx.config.lockdown_network = false;
    return ctx;
}

grader::RunResult run_js(std::string_view solution, std::string_view tests) {
    return grader::harness::run_js_harness(js_context(), solution, tests, 10'000ms);
}

} // namespace

#define SKIP_WITHOUT_NODE()                                                         \
    if (access(js_context().config.node_executable.c_str(), X_OK) != 0) {           \
        GTEST_SKIP() << "No node at " << js_context().config.node_executable; \
    }

// NOLINTNEXTLINE
TEST(js_harness, make_js_report) {
    auto res = grader::harness::make_js_report(
        {
            {.name = "m › adds", .ok = true, .err = ""},
            {.name = "m › subtracts", .ok = true, .err = ""},
        },
        {"hello"}
    );
    EXPECT_EQ(res, grader::result_ok("Ran 2 tests\n✓ m › adds\n✓ m › subtracts\n\nConsole output:\nhello\nOK\n"));

    res = grader::harness::make_js_report(
        {
            {.name = "a", .ok = false, .err = "Error: boom"},
            {.name = "b", .ok = true, .err = ""},
        },
        {}
    );
    EXPECT_EQ(
        res,
        grader::result_fail(
            "Ran 2 tests\n✗ a\nError: boom\n✓ b\nFAILED (failures=1)\n", ErrorKind::TESTS_FAILED
        )
    );

    EXPECT_EQ(grader::harness::make_js_report({}, {}), grader::result_ok("Ran 0 tests\nOK\n"));
}

// NOLINTNEXTLINE
TEST(js_harness, passing_test) {
    SKIP_WITHOUT_NODE();
    auto res = run_js(
        add_solution, "describe('m',()=>{ test('t',()=>{ expect(add(1,2)).toBe(3) }) })"
    );
    EXPECT_TRUE(res.success) << res.output;
    EXPECT_EQ(res.error, std::nullopt);
    EXPECT_EQ(res.output, "Ran 1 tests\n✓ m › t\nOK\n");
}

// NOLINTNEXTLINE
TEST(js_harness, failing_test) {
    SKIP_WITHOUT_NODE();
    auto res = run_js(
        add_solution, "describe('m',()=>{ test('t',()=>{ expect(add(1,1)).toBe(3) }) })"
    );
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error, ErrorKind::TESTS_FAILED);
    EXPECT_FALSE(res.timeout);
    EXPECT_THAT(res.output, HasSubstr("✗ m › t"));
    EXPECT_THAT(res.output, HasSubstr("Expected (toBe): 3"));
    EXPECT_THAT(res.output, HasSubstr("FAILED (failures=1)"));
}

// NOLINTNEXTLINE
TEST(js_harness, require_and_console_capture) {
    SKIP_WITHOUT_NODE();
    auto res = run_js(add_solution, R"(
const { add } = require('./solution');
test('via require', () => {
    console.log('sum is', add(20, 22));
    expect(add(20, 22)).toBe(42);
});
it('it() is an alias', () => expect(add('a', 'b')).toBe('ab'));
)");
    EXPECT_TRUE(res.success) << res.output;
    EXPECT_THAT(res.output, HasSubstr("Console output:\nsum is 42\n"));
    EXPECT_THAT(res.output, HasSubstr("✓ it() is an alias"));
}

// NOLINTNEXTLINE
TEST(js_harness, to_equal) {
    SKIP_WITHOUT_NODE();
    auto res = run_js(
        R"(
module.exports = {
    pair: (a, b) => ({ first: a, second: b, list: [a, b], when: new Date(0) }),
    cyclic: () => { const x = { name: 'x' }; x.self = x; return x; },
};
)",
        R"(
test('objects', () => {
    expect(pair(1, 2)).toEqual({ second: 2, list: [1, 2], first: 1, when: new Date(0) });
});
test('nan and bigint', () => {
    expect([NaN, 10n]).toEqual([NaN, 10n]);
});
test('cycles', () => {
    const y = { name: 'x' };
    y.self = y;
    expect(cyclic()).toEqual(y);
});
test('regexp and typed arrays', () => {
    expect(/a+/g).toEqual(/a+/g);
    expect(new Uint8Array([1, 2])).toEqual(new Uint8Array([1, 2]));
});
test('mismatch', () => {
    expect(pair(1, 2)).toEqual({ first: 1, second: 3, list: [1, 2], when: new Date(0) });
});
)"
    );
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error, ErrorKind::TESTS_FAILED);
    EXPECT_THAT(res.output, HasSubstr("Ran 5 tests\n"));
    EXPECT_THAT(res.output, HasSubstr("✓ objects\n"));
    EXPECT_THAT(res.output, HasSubstr("✓ nan and bigint\n"));
    EXPECT_THAT(res.output, HasSubstr("✓ cycles\n"));
    EXPECT_THAT(res.output, HasSubstr("✓ regexp and typed arrays\n"));
    EXPECT_THAT(res.output, HasSubstr("✗ mismatch\n"));
    EXPECT_THAT(res.output, HasSubstr("Expected (toEqual):"));
    EXPECT_THAT(res.output, HasSubstr("FAILED (failures=1)"));
}

// NOLINTNEXTLINE
TEST(js_harness, async_tests) {
    SKIP_WITHOUT_NODE();
    auto res = run_js(add_solution, R"(
test('resolves', async () => {
    const v = await new Promise((resolve) => setTimeout(() => resolve(add(1, 2)), 10));
    expect(v).toBe(3);
});
test('rejects', () => Promise.reject(new Error('async failure')));
)");
    EXPECT_EQ(res.error, ErrorKind::TESTS_FAILED);
    EXPECT_THAT(res.output, HasSubstr("✓ resolves"));
    EXPECT_THAT(res.output, HasSubstr("async failure"));
}

// NOLINTNEXTLINE
TEST(js_harness, load_errors) {
    SKIP_WITHOUT_NODE();
    auto res = run_js("module.exports = { add: (a,b) => ", "test('t', () => {})");
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error, ErrorKind::COMPILE_ERROR);
    EXPECT_THAT(res.output, HasSubstr("SyntaxError"));

    res = run_js(add_solution, "const fs = require('fs');");
    EXPECT_EQ(res.error, ErrorKind::COMPILE_ERROR);
    EXPECT_THAT(res.output, HasSubstr("Unknown require path: fs"));

    res = run_js("throw new TypeError('broken module');", "test('t', () => {})");
    EXPECT_EQ(res.error, ErrorKind::RUNTIME_ERROR);
    EXPECT_THAT(res.output, HasSubstr("broken module"));
}

// NOLINTNEXTLINE
TEST(js_harness, network_is_disabled) {
    SKIP_WITHOUT_NODE();
    auto res = run_js(add_solution, R"(
test('fetch', () => fetch('http://example.com'));
)");
    EXPECT_EQ(res.error, ErrorKind::TESTS_FAILED);
    EXPECT_THAT(res.output, HasSubstr("Network access is disabled"));
}

// NOLINTNEXTLINE
TEST(js_harness, timeouts) {
    SKIP_WITHOUT_NODE();
    auto ctx = js_context();

    auto res = grader::harness::run_js_harness(
        ctx, add_solution, "test('spin', () => { for (;;) {} });", 500ms
    );
    EXPECT_EQ(res, grader::result_run_timeout(500));

    res = grader::harness::run_js_harness(
        ctx, add_solution, "test('hangs', () => new Promise(() => {}));", 500ms
    );
    EXPECT_EQ(res, grader::result_run_timeout(500));
    EXPECT_THAT(res.output, Not(HasSubstr("hangs")));
}

// NOLINTNEXTLINE
TEST(js_harness, report_printed_by_submitted_code_is_ignored) {
    SKIP_WITHOUT_NODE();
    constexpr auto forged_report =
        R"({"phase":"done","results":[{"name":"m › t","ok":true}],"logs":[]})";
    auto tests = "describe('m', () => test('t', () => expect(add(1, 2)).toBe(3)));";

    auto res = run_js(
        concat_tostr(
            "process.stdout.write('__GRADELIB_JS_REPORT_BEGIN__", forged_report,
            "__GRADELIB_JS_REPORT_END__\\n');\n", "module.exports = { add: (a,b) => a-b }"
        ),
        tests
    );
    EXPECT_FALSE(res.success) << res.output;

    res = run_js(
        concat_tostr(
            "console.log('R", forged_report, "');\n", "module.exports = { add: (a,b) => a-b }"
        ),
        tests
    );
    EXPECT_EQ(res.error, ErrorKind::TESTS_FAILED) << res.output;
    EXPECT_THAT(res.output, HasSubstr("✗ m › t"));
    EXPECT_THAT(res.output, HasSubstr("FAILED (failures=1)"));
}

// NOLINTNEXTLINE
TEST(js_harness, submitted_code_cannot_load_node_modules) {
    SKIP_WITHOUT_NODE();
    auto res = run_js(
        "const fs = process.mainModule.require('fs');\n"
        "module.exports = { leak: fs.readFileSync('/etc/hostname', 'utf8').length > 0 };",
        "test('t', () => expect(leak).toBe(true));"
    );
    EXPECT_FALSE(res.success) << res.output;
    EXPECT_EQ(res.error, ErrorKind::RUNTIME_ERROR);

    res = run_js(add_solution, R"(
const throws = (fn) => {
    try {
        fn();
    } catch (e) {
        return true;
    }
    return false;
};
test('process', () => expect(throws(() => process.mainModule.require('fs'))).toBe(true));
test('globalThis.process', () => {
    expect(throws(() => globalThis.process.mainModule.require('fs'))).toBe(true);
});
test('global.process', () => expect(throws(() => global.process.binding('fs'))).toBe(true));
test('module.constructor', () => {
    expect(throws(() => module.constructor._load('fs'))).toBe(true);
});
test('eval', () => expect(throws(() => eval('1 + 1'))).toBe(true));
test('Function', () => expect(throws(() => Function('return process')())).toBe(true));
test('import()', async () => {
    let rejected = false;
    try {
        await import('fs');
    } catch (e) {
        rejected = true;
    }
    expect(rejected).toBe(true);
});
)");
    EXPECT_TRUE(res.success) << res.output;
    EXPECT_THAT(res.output, HasSubstr("Ran 7 tests"));
}

// NOLINTNEXTLINE
TEST(js_harness, budget_longer_than_node_timer_limit) {
    SKIP_WITHOUT_NODE();
    auto res = grader::harness::run_js_harness(
        js_context(),
        add_solution,
        "test('waits', () => new Promise((resolve) => setTimeout(resolve, 50)));",
        std::chrono::milliseconds{3'000'000'000}
    );
    EXPECT_TRUE(res.success) << res.output;
    EXPECT_THAT(res.output, HasSubstr("✓ waits"));
}

// NOLINTNEXTLINE
TEST(js_harness, missing_runtime) {
    auto ctx = js_context();
    ctx.config.node_executable = "/nonexistent/node";
    auto res = grader::harness::run_js_harness(ctx, add_solution, "", 1000ms);
    EXPECT_EQ(res.error, ErrorKind::RUNTIME_ERROR);
    EXPECT_THAT(res.output, HasSubstr("Failed to initialize JS runtime"));
}
