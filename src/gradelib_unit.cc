#include <exception>
#include <gradelib/grader/config.hh>
#include <gradelib/grader/unit.hh>
#include <gradelib/logger.hh>
#include <unistd.h>

// Server-hosted isolated unit: reads one run message from stdin and writes the
// result message to stdout. The config from $GRADELIB_CONFIG sets up logging
// and is used only for messages that carry no config.
int main() {
    grader::Config config;
    try {
        config = grader::default_config();
        grader::configure_logging(config);
    } catch (const std::exception& e) {
        // The request is still answered with the built-in defaults
        errlog("gradelib-unit: cannot load config: ", e.what());
    }
    return grader::unit_main(STDIN_FILENO, STDOUT_FILENO, config);
}
