#include <gmock/gmock.h>
#include <gradelib/file_contents.hh>
#include <gradelib/grader/unit.hh>
#include <gradelib/pipe.hh>
#include <gtest/gtest.h>
#include <stdexcept>
#include <sys/socket.h>

using grader::Config;
using grader::ErrorKind;
using grader::Language;
using grader::RunMessage;
using grader::RunRequest;
using grader::RunResult;
using testing::HasSubstr;

namespace {

Config test_config() {
    Config config;
    config.lockdown_network = false;
    config.python_executable = "/nonexistent/python3";
    config.node_executable = "/nonexistent/node";
    config.ocamlfind_executable = "/nonexistent/ocamlfind";
    config.ocamlrun_executable = "/nonexistent/ocamlrun";
    return config;
}

} // namespace

// NOLINTNEXTLINE
TEST(unit, run_message_wire_format) {
    auto line = grader::encode_run_message({
        .req =
            {
                .solution = "def f(): pass",
                .tests = "import solution",
                .language = Language::PYTHON,
                .timeout_ms = 1234,
            },
        .assets_base = "/srv/assets",
    });
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);
    EXPECT_THAT(line, HasSubstr(R"("kind":"run")"));
    EXPECT_THAT(line, HasSubstr(R"("assetsBase":"/srv/assets")"));
    EXPECT_THAT(line, HasSubstr(R"("timeoutMs":1234)"));
    EXPECT_THAT(line, HasSubstr(R"("language":"python")"));

    auto msg = grader::decode_run_message(line);
    EXPECT_EQ(msg.req.solution, "def f(): pass");
    EXPECT_EQ(msg.req.tests, "import solution");
    EXPECT_EQ(msg.req.language, Language::PYTHON);
    EXPECT_EQ(msg.req.timeout_ms, 1234);
    EXPECT_EQ(msg.req.memory_mb, std::nullopt);
    EXPECT_EQ(msg.assets_base, "/srv/assets");

    auto bare = grader::decode_run_message(R"({"kind":"run","req":{"solution":"","tests":""}})");
    EXPECT_EQ(bare.req.language, std::nullopt);
    EXPECT_EQ(bare.assets_base, std::nullopt);
}

// NOLINTNEXTLINE
TEST(unit, run_message_carries_config) {
    auto config = test_config();
    config.default_timeout_ms = 777;
    auto line = grader::encode_run_message({
        .req = {.solution = "", .tests = ""},
        .config = config,
    });
    EXPECT_THAT(line, HasSubstr(R"("node_executable":"/nonexistent/node")"));

    auto msg = grader::decode_run_message(line);
    ASSERT_TRUE(msg.config.has_value());
    EXPECT_EQ(msg.config->node_executable, "/nonexistent/node");
    EXPECT_EQ(msg.config->default_timeout_ms, 777);
    EXPECT_FALSE(msg.config->lockdown_network);

    EXPECT_THROW(
        (void)grader::decode_run_message(
            R"({"kind":"run","req":{"solution":"","tests":""},"config":{"unit_executable":""}})"
        ),
        std::runtime_error
    );
}

// NOLINTNEXTLINE
TEST(unit, config_in_message_takes_precedence) {
    Config own_config; // would find a real interpreter
    own_config.lockdown_network = false;

    auto res = grader::handle_unit_message(
        grader::encode_run_message({
            .req = {.solution = "x", .tests = "y", .language = Language::PYTHON},
            .config = test_config(),
        }),
        own_config
    );
    EXPECT_EQ(res.error, ErrorKind::RUNTIME_ERROR);
    EXPECT_THAT(res.output, HasSubstr("Failed to initialize Python runtime"));
    EXPECT_THAT(res.output, HasSubstr("/nonexistent/python3"));
}

// NOLINTNEXTLINE
TEST(unit, result_message_wire_format) {
    auto line = grader::encode_result_message(grader::result_fail("boom\n", ErrorKind::TESTS_FAILED));
    EXPECT_EQ(line.back(), '\n');
    EXPECT_THAT(line, HasSubstr(R"("type":"result")"));
    EXPECT_THAT(line, HasSubstr(R"("error":"tests_failed")"));
    EXPECT_EQ(
        grader::decode_result_message(line), grader::result_fail("boom\n", ErrorKind::TESTS_FAILED)
    );

    EXPECT_EQ(
        grader::decode_result_message(
            R"({"type":"result","payload":{"success":true,"output":"ok\n","error":null,"timeout":false}})"
        ),
        grader::result_ok("ok\n")
    );
}

// NOLINTNEXTLINE
TEST(unit, malformed_messages) {
    EXPECT_THROW((void)grader::decode_run_message("not json"), std::runtime_error);
    EXPECT_THROW((void)grader::decode_run_message(R"({"kind":"stop"})"), std::runtime_error);
    EXPECT_THROW((void)grader::decode_run_message(R"({"kind":"run"})"), std::runtime_error);
    EXPECT_THROW(
        (void)grader::decode_run_message(
            R"({"kind":"run","req":{"solution":"","tests":"","language":"rust"}})"
        ),
        std::runtime_error
    );
    EXPECT_THROW((void)grader::decode_result_message(""), std::runtime_error);
    EXPECT_THROW(
        (void)grader::decode_result_message(R"({"type":"log","payload":{}})"), std::runtime_error
    );
    EXPECT_THROW(
        (void)grader::decode_result_message(R"({"type":"result","payload":{"success":true}})"),
        std::runtime_error
    );
}

// NOLINTNEXTLINE
TEST(unit, handle_unit_message_never_throws) {
    auto config = test_config();

    auto res = grader::handle_unit_message("{", config);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error, ErrorKind::RUNTIME_ERROR);
    EXPECT_THAT(res.output, HasSubstr("Malformed message"));

    res = grader::handle_unit_message(
        R"({"kind":"run","req":{"solution":"nothing to see","tests":"here"}})", config
    );
    EXPECT_EQ(res, grader::result_fail("Language detection failed", ErrorKind::BAD_LANGUAGE_DETECTION));

    // Explicit language with a runtime that does not exist
    res = grader::handle_unit_message(
        grader::encode_run_message({.req = {.solution = "x", .tests = "y", .language = Language::PYTHON}}),
        config
    );
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error, ErrorKind::RUNTIME_ERROR);
    EXPECT_FALSE(res.timeout);
}

// NOLINTNEXTLINE
TEST(unit, unit_main_answers_over_the_channel) {
    auto sp = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    ASSERT_TRUE(sp);

    write_all_throw(
        sp->our_end,
        grader::encode_run_message({.req = {.solution = "plain text", .tests = "more text"}})
    );
    EXPECT_EQ(grader::unit_main(sp->other_end, sp->other_end, test_config()), 0);
    ASSERT_EQ(shutdown(sp->other_end, SHUT_WR), 0);

    auto res = grader::decode_result_message(get_file_contents(sp->our_end));
    EXPECT_EQ(res, grader::result_fail("Language detection failed", ErrorKind::BAD_LANGUAGE_DETECTION));
}

// NOLINTNEXTLINE
TEST(unit, unit_main_handles_eof_without_message) {
    auto sp = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    ASSERT_TRUE(sp);
    ASSERT_EQ(shutdown(sp->our_end, SHUT_WR), 0);

    EXPECT_EQ(grader::unit_main(sp->other_end, sp->other_end, test_config()), 0);
    ASSERT_EQ(shutdown(sp->other_end, SHUT_WR), 0);

    auto res = grader::decode_result_message(get_file_contents(sp->our_end));
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error, ErrorKind::RUNTIME_ERROR);
}
