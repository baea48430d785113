#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace grader {

struct Config {
    std::string python_executable = "/usr/bin/python3";
    std::string node_executable = "/usr/bin/node";
    std::string ocamlfind_executable = "/usr/bin/ocamlfind";
    std::string ocamlrun_executable = "/usr/bin/ocamlrun";
    // If not empty, runtimes are looked up in <assets_base>/bin/ first
    std::string assets_base;
    std::string unit_executable = "gradelib-unit"; // looked up in PATH if not a path
    uint64_t default_timeout_ms = 60'000;
    bool lockdown_network = true;
    std::string work_dir_template = "/tmp/gradelib-unit.XXXXXX";
    std::string log_file; // empty - stderr

    /**
     * @brief Loads the config from the config file format, variables that are
     *   not set keep their default values
     *
     * @errors Throws ConfigFile::ParseError on syntax errors and
     *   std::runtime_error on invalid values
     */
    static Config load_from_string(std::string str);

    static Config load_from_file(const std::string& path);
};

// nlohmann::json conversions with the names of the config file variables as
// keys. Missing keys keep their default values, from_json() throws
// std::runtime_error on invalid values.
void to_json(nlohmann::json& j, const Config& config);
void from_json(const nlohmann::json& j, Config& config);

// Config from the file named by $GRADELIB_CONFIG or the defaults if unset
Config default_config();

// Redirects stdlog and errlog to config.log_file (if set)
void configure_logging(const Config& config);

} // namespace grader
