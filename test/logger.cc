#include <gmock/gmock.h>
#include <gradelib/file_contents.hh>
#include <gradelib/logger.hh>
#include <gradelib/temporary_directory.hh>
#include <gtest/gtest.h>
#include <unistd.h>

using testing::ContainsRegex;
using testing::HasSubstr;

// NOLINTNEXTLINE
TEST(logger, writes_labeled_lines) {
    TemporaryDirectory tmp_dir("/tmp/gradelib-test.XXXXXX");
    auto log_file = tmp_dir.path() + "log";
    {
        Logger logger(nullptr);
        EXPECT_EQ(logger.fileno(), -1);
        logger("discarded");

        logger.open(log_file.c_str());
        EXPECT_NE(logger.fileno(), -1);
        logger("unit ", 42, " started");
        auto line = logger("partial");
        line(" line");
    }
    auto contents = get_file_contents(log_file);
    EXPECT_THAT(
        contents,
        ContainsRegex(concat_tostr(
            R"(^\[ [0-9-]+ [0-9:.]+ \] \[)", getpid(), R"(\] unit 42 started)"
        ))
    );
    EXPECT_THAT(contents, HasSubstr("] partial line\n"));
    EXPECT_THAT(contents, testing::Not(HasSubstr("discarded")));
}

// NOLINTNEXTLINE
TEST(logger, open_failure_keeps_the_stream) {
    Logger logger(stderr);
    EXPECT_THROW(logger.open("/nonexistent/dir/log"), std::runtime_error);
    EXPECT_EQ(logger.fileno(), STDERR_FILENO);
}
