#include <gradelib/grader/types.hh>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using grader::ErrorKind;
using grader::Language;
using grader::RunRequest;
using grader::RunResult;
using nlohmann::json;

// NOLINTNEXTLINE
TEST(types, string_conversions) {
    EXPECT_EQ(grader::to_str(Language::JS), "js");
    EXPECT_EQ(grader::to_str(Language::PYTHON), "python");
    EXPECT_EQ(grader::to_str(Language::OCAML), "ocaml");
    EXPECT_EQ(grader::language_from_str("python"), Language::PYTHON);
    EXPECT_EQ(grader::language_from_str("Python"), std::nullopt);

    EXPECT_EQ(grader::to_str(ErrorKind::BAD_LANGUAGE_DETECTION), "bad_language_detection");
    EXPECT_EQ(grader::error_kind_from_str("tests_failed"), ErrorKind::TESTS_FAILED);
    EXPECT_EQ(grader::error_kind_from_str("oops"), std::nullopt);
}

// NOLINTNEXTLINE
TEST(types, result_constructors_keep_invariants) {
    auto ok = grader::result_ok("out");
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.output, "out");
    EXPECT_EQ(ok.error, std::nullopt);
    EXPECT_FALSE(ok.timeout);

    auto failed = grader::result_fail("bad", ErrorKind::TESTS_FAILED);
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.error, ErrorKind::TESTS_FAILED);
    EXPECT_FALSE(failed.timeout);

    auto timed_out = grader::result_fail("", ErrorKind::TIMEOUT);
    EXPECT_FALSE(timed_out.success);
    EXPECT_TRUE(timed_out.timeout);

    auto run_timeout = grader::result_run_timeout(1500);
    EXPECT_EQ(run_timeout.output, "Run exceeded 1500 ms during test execution phase.");
    EXPECT_EQ(run_timeout.error, ErrorKind::TIMEOUT);
    EXPECT_TRUE(run_timeout.timeout);
}

// NOLINTNEXTLINE
TEST(types, run_request_json) {
    RunRequest req{
        .solution = "s",
        .tests = "t",
        .language = Language::OCAML,
        .timeout_ms = 1000,
    };
    json j = req;
    EXPECT_EQ(j, json::parse(R"({"solution":"s","tests":"t","language":"ocaml","timeoutMs":1000})"));

    auto decoded = json::parse(R"({"solution":"a","tests":"b","memoryMb":64})").get<RunRequest>();
    EXPECT_EQ(decoded.solution, "a");
    EXPECT_EQ(decoded.tests, "b");
    EXPECT_EQ(decoded.language, std::nullopt);
    EXPECT_EQ(decoded.timeout_ms, std::nullopt);
    EXPECT_EQ(decoded.memory_mb, 64);
}

// NOLINTNEXTLINE
TEST(types, run_request_json_errors) {
    EXPECT_THROW(
        (void)json::parse(R"({"solution":"a","tests":"b","language":"cobol"})").get<RunRequest>(),
        std::runtime_error
    );
    EXPECT_THROW(
        (void)json::parse(R"({"solution":"a","tests":"b","timeoutMs":-5})").get<RunRequest>(),
        std::runtime_error
    );
    EXPECT_THROW((void)json::parse(R"({"tests":"b"})").get<RunRequest>(), json::exception);
}

// NOLINTNEXTLINE
TEST(types, run_result_json) {
    json ok = grader::result_ok("fine\n");
    EXPECT_EQ(ok, json::parse(R"({"success":true,"output":"fine\n","error":null,"timeout":false})"));

    json failed = grader::result_fail("x", ErrorKind::COMPILE_ERROR);
    EXPECT_EQ(failed["error"], "compile_error");

    auto decoded =
        json::parse(R"({"success":false,"output":"o","error":"timeout","timeout":false})")
            .get<RunResult>();
    EXPECT_EQ(decoded, grader::result_fail("o", ErrorKind::TIMEOUT));
}

// NOLINTNEXTLINE
TEST(types, run_result_decoding_restores_invariants) {
    // success contradicting the error
    auto res = json::parse(R"({"success":true,"output":"","error":"tests_failed","timeout":false})")
                   .get<RunResult>();
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error, ErrorKind::TESTS_FAILED);

    // timeout without an error
    res = json::parse(R"({"success":true,"output":"","error":null,"timeout":true})").get<RunResult>();
    EXPECT_EQ(res, grader::result_fail("", ErrorKind::TIMEOUT));

    // failure without an error
    res = json::parse(R"({"success":false,"output":"","error":null,"timeout":false})")
              .get<RunResult>();
    EXPECT_EQ(res.error, ErrorKind::RUNTIME_ERROR);

    EXPECT_THROW(
        (void)json::parse(R"({"success":false,"output":"","error":"weird","timeout":false})")
            .get<RunResult>(),
        std::runtime_error
    );
}
