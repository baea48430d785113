#include <cstdlib>
#include <gradelib/config_file.hh>
#include <gradelib/file_contents.hh>
#include <gradelib/grader/config.hh>
#include <gradelib/temporary_directory.hh>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using grader::Config;

// NOLINTNEXTLINE
TEST(config, defaults) {
    Config config;
    EXPECT_EQ(config.python_executable, "/usr/bin/python3");
    EXPECT_EQ(config.node_executable, "/usr/bin/node");
    EXPECT_EQ(config.ocamlfind_executable, "/usr/bin/ocamlfind");
    EXPECT_EQ(config.ocamlrun_executable, "/usr/bin/ocamlrun");
    EXPECT_EQ(config.assets_base, "");
    EXPECT_EQ(config.unit_executable, "gradelib-unit");
    EXPECT_EQ(config.default_timeout_ms, 60'000);
    EXPECT_TRUE(config.lockdown_network);
    EXPECT_EQ(config.work_dir_template, "/tmp/gradelib-unit.XXXXXX");
    EXPECT_EQ(config.log_file, "");

    auto loaded = Config::load_from_string("# nothing set\n");
    EXPECT_EQ(loaded.python_executable, config.python_executable);
    EXPECT_EQ(loaded.default_timeout_ms, config.default_timeout_ms);
}

// NOLINTNEXTLINE
TEST(config, load_from_string) {
    auto config = Config::load_from_string(R"(
python_executable: /opt/python/bin/python3
node_executable: '/opt/node/bin/node'
assets_base: /srv/assets
unit_executable: /usr/local/bin/gradelib-unit
default_timeout_ms: 1500
lockdown_network: false
work_dir_template: /var/tmp/unit.XXXXXX
log_file: "/var/log/gradelib.log"
)");
    EXPECT_EQ(config.python_executable, "/opt/python/bin/python3");
    EXPECT_EQ(config.node_executable, "/opt/node/bin/node");
    EXPECT_EQ(config.ocamlfind_executable, "/usr/bin/ocamlfind");
    EXPECT_EQ(config.assets_base, "/srv/assets");
    EXPECT_EQ(config.unit_executable, "/usr/local/bin/gradelib-unit");
    EXPECT_EQ(config.default_timeout_ms, 1500);
    EXPECT_FALSE(config.lockdown_network);
    EXPECT_EQ(config.work_dir_template, "/var/tmp/unit.XXXXXX");
    EXPECT_EQ(config.log_file, "/var/log/gradelib.log");
}

// NOLINTNEXTLINE
TEST(config, invalid_values) {
    EXPECT_THROW((void)Config::load_from_string("default_timeout_ms: soon"), std::runtime_error);
    EXPECT_THROW((void)Config::load_from_string("default_timeout_ms: 0"), std::runtime_error);
    EXPECT_THROW((void)Config::load_from_string("work_dir_template: /tmp/x"), std::runtime_error);
    EXPECT_THROW((void)Config::load_from_string("unit_executable: ''"), std::runtime_error);
    EXPECT_THROW((void)Config::load_from_string("lockdown_network"), ConfigFile::ParseError);
}

// NOLINTNEXTLINE
TEST(config, json_uses_config_file_names) {
    Config config;
    config.node_executable = "/opt/node/bin/node";
    config.default_timeout_ms = 1500;
    config.lockdown_network = false;
    config.work_dir_template = "/var/tmp/run.XXXXXX/work.XXXXXX";

    nlohmann::json j = config;
    EXPECT_EQ(j.at("node_executable"), "/opt/node/bin/node");
    EXPECT_EQ(j.at("default_timeout_ms"), 1500);
    EXPECT_EQ(j.at("lockdown_network"), false);

    auto decoded = j.get<Config>();
    EXPECT_EQ(decoded.node_executable, "/opt/node/bin/node");
    EXPECT_EQ(decoded.python_executable, "/usr/bin/python3");
    EXPECT_EQ(decoded.default_timeout_ms, 1500);
    EXPECT_FALSE(decoded.lockdown_network);
    EXPECT_EQ(decoded.work_dir_template, "/var/tmp/run.XXXXXX/work.XXXXXX");

    // Missing keys keep their defaults
    auto partial = nlohmann::json{{"log_file", "/var/log/gradelib.log"}}.get<Config>();
    EXPECT_EQ(partial.log_file, "/var/log/gradelib.log");
    EXPECT_EQ(partial.unit_executable, "gradelib-unit");
    EXPECT_TRUE(partial.lockdown_network);

    EXPECT_THROW(
        ((void)nlohmann::json{{"default_timeout_ms", 0}}.get<Config>()), std::runtime_error
    );
    EXPECT_THROW(
        ((void)nlohmann::json{{"work_dir_template", "/tmp/x"}}.get<Config>()), std::runtime_error
    );
    EXPECT_THROW(
        ((void)nlohmann::json{{"lockdown_network", "yes"}}.get<Config>()), nlohmann::json::exception
    );
}

// NOLINTNEXTLINE
TEST(config, default_config_uses_environment) {
    TemporaryDirectory tmp_dir("/tmp/gradelib-test.XXXXXX");
    auto path = tmp_dir.path() + "gradelib.conf";
    put_file_contents(path, "default_timeout_ms: 777\n");

    ASSERT_EQ(setenv("GRADELIB_CONFIG", path.c_str(), 1), 0);
    EXPECT_EQ(grader::default_config().default_timeout_ms, 777);

    ASSERT_EQ(setenv("GRADELIB_CONFIG", (tmp_dir.path() + "missing").c_str(), 1), 0);
    EXPECT_THROW((void)grader::default_config(), std::runtime_error);

    ASSERT_EQ(unsetenv("GRADELIB_CONFIG"), 0);
    EXPECT_EQ(grader::default_config().default_timeout_ms, 60'000);
}

// NOLINTNEXTLINE
TEST(config, example_config_holds_the_defaults) {
    auto config = Config::load_from_file(GRADELIB_SOURCE_DIR "/gradelib.conf.example");
    Config defaults;
    EXPECT_EQ(config.python_executable, defaults.python_executable);
    EXPECT_EQ(config.node_executable, defaults.node_executable);
    EXPECT_EQ(config.ocamlfind_executable, defaults.ocamlfind_executable);
    EXPECT_EQ(config.ocamlrun_executable, defaults.ocamlrun_executable);
    EXPECT_EQ(config.assets_base, defaults.assets_base);
    EXPECT_EQ(config.unit_executable, defaults.unit_executable);
    EXPECT_EQ(config.default_timeout_ms, defaults.default_timeout_ms);
    EXPECT_EQ(config.lockdown_network, defaults.lockdown_network);
    EXPECT_EQ(config.work_dir_template, defaults.work_dir_template);
    EXPECT_EQ(config.log_file, defaults.log_file);
}
