#include <cstdlib>
#include <gradelib/config_file.hh>
#include <gradelib/file_contents.hh>
#include <gradelib/grader/config.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <nlohmann/json.hpp>

using std::string;

namespace {

void check_values(const grader::Config& config) {
    if (config.default_timeout_ms == 0) {
        THROW("default_timeout_ms has to be a positive integer");
    }
    if (not config.work_dir_template.ends_with("XXXXXX")) {
        THROW("work_dir_template has to end with XXXXXX, got: ", config.work_dir_template);
    }
    if (config.unit_executable.empty()) {
        THROW("unit_executable cannot be empty");
    }
}

} // namespace

namespace grader {

Config Config::load_from_string(string str) {
    ConfigFile cf;
    cf.add_vars(
        "python_executable",
        "node_executable",
        "ocamlfind_executable",
        "ocamlrun_executable",
        "assets_base",
        "unit_executable",
        "default_timeout_ms",
        "lockdown_network",
        "work_dir_template",
        "log_file"
    );
    cf.load_config_from_string(std::move(str));

    Config config;
    auto set_string = [&](const char* name, string& field) {
        if (const auto& var = cf[name]; var.is_set()) {
            field = var.as_string();
        }
    };
    set_string("python_executable", config.python_executable);
    set_string("node_executable", config.node_executable);
    set_string("ocamlfind_executable", config.ocamlfind_executable);
    set_string("ocamlrun_executable", config.ocamlrun_executable);
    set_string("assets_base", config.assets_base);
    set_string("unit_executable", config.unit_executable);
    set_string("work_dir_template", config.work_dir_template);
    set_string("log_file", config.log_file);

    if (const auto& var = cf["default_timeout_ms"]; var.is_set()) {
        auto val = var.as<uint64_t>();
        if (not val or *val == 0) {
            THROW("default_timeout_ms has to be a positive integer, got: ", var.as_string());
        }
        config.default_timeout_ms = *val;
    }
    if (const auto& var = cf["lockdown_network"]; var.is_set()) {
        config.lockdown_network = var.as_bool();
    }

    check_values(config);
    return config;
}

Config Config::load_from_file(const string& path) {
    return load_from_string(get_file_contents(path));
}

void to_json(nlohmann::json& j, const Config& config) {
    j = nlohmann::json{
        {"python_executable", config.python_executable},
        {"node_executable", config.node_executable},
        {"ocamlfind_executable", config.ocamlfind_executable},
        {"ocamlrun_executable", config.ocamlrun_executable},
        {"assets_base", config.assets_base},
        {"unit_executable", config.unit_executable},
        {"default_timeout_ms", config.default_timeout_ms},
        {"lockdown_network", config.lockdown_network},
        {"work_dir_template", config.work_dir_template},
        {"log_file", config.log_file},
    };
}

void from_json(const nlohmann::json& j, Config& config) {
    config = Config{};
    auto get = [&j](const char* name, auto& field) {
        if (auto it = j.find(name); it != j.end()) {
            it->get_to(field);
        }
    };
    get("python_executable", config.python_executable);
    get("node_executable", config.node_executable);
    get("ocamlfind_executable", config.ocamlfind_executable);
    get("ocamlrun_executable", config.ocamlrun_executable);
    get("assets_base", config.assets_base);
    get("unit_executable", config.unit_executable);
    get("default_timeout_ms", config.default_timeout_ms);
    get("lockdown_network", config.lockdown_network);
    get("work_dir_template", config.work_dir_template);
    get("log_file", config.log_file);
    check_values(config);
}

Config default_config() {
    const char* path = getenv("GRADELIB_CONFIG");
    if (path == nullptr or *path == '\0') {
        return Config{};
    }
    return Config::load_from_file(path);
}

void configure_logging(const Config& config) {
    if (config.log_file.empty()) {
        return;
    }
    stdlog.open(config.log_file.c_str());
    errlog.open(config.log_file.c_str());
}

} // namespace grader
