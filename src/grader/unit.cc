#include <cerrno>
#include <chrono>
#include <exception>
#include <gradelib/file_contents.hh>
#include <gradelib/grader/detect_language.hh>
#include <gradelib/grader/harness/run_harness.hh>
#include <gradelib/grader/lockdown.hh>
#include <gradelib/grader/unit.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <variant>

using std::string;
using std::string_view;

namespace {

nlohmann::json parse_message(string_view line) {
    try {
        return nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        THROW("Malformed message: ", e.what());
    }
}

// Reads up to the first '\n' (exclusive) or EOF
string read_line(int fd) {
    string line;
    char buff[65536];
    for (;;) {
        ssize_t len = read(fd, buff, sizeof(buff));
        if (len < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        if (len == 0) {
            return line;
        }
        line.append(buff, len);
        if (auto eol = line.find('\n'); eol != string::npos) {
            line.resize(eol);
            return line;
        }
    }
}

} // namespace

namespace grader {

string encode_run_message(const RunMessage& msg) {
    nlohmann::json j = {
        {"kind", "run"},
        {"req", msg.req},
    };
    if (msg.assets_base) {
        j["assetsBase"] = *msg.assets_base;
    }
    if (msg.config) {
        j["config"] = *msg.config;
    }
    return j.dump() + '\n';
}

RunMessage decode_run_message(string_view line) {
    auto j = parse_message(line);
    try {
        if (j.at("kind").get<string>() != "run") {
            THROW("Unexpected message kind: ", j.at("kind").dump());
        }
        RunMessage msg{.req = j.at("req").get<RunRequest>()};
        if (auto it = j.find("assetsBase"); it != j.end() and not it->is_null()) {
            msg.assets_base = it->get<string>();
        }
        if (auto it = j.find("config"); it != j.end() and not it->is_null()) {
            msg.config = it->get<Config>();
        }
        return msg;
    } catch (const nlohmann::json::exception& e) {
        THROW("Invalid run message: ", e.what());
    }
}

string encode_result_message(const RunResult& res) {
    nlohmann::json j = {
        {"type", "result"},
        {"payload", res},
    };
    return j.dump() + '\n';
}

RunResult decode_result_message(string_view line) {
    auto j = parse_message(line);
    try {
        if (j.at("type").get<string>() != "result") {
            THROW("Unexpected message type: ", j.at("type").dump());
        }
        return j.at("payload").get<RunResult>();
    } catch (const nlohmann::json::exception& e) {
        THROW("Invalid result message: ", e.what());
    }
}

RunResult handle_unit_message(string_view message, const Config& config) {
    try {
        auto msg = decode_run_message(message);
        auto lang_or_error = detect_language(msg.req);
        if (auto* res = std::get_if<RunResult>(&lang_or_error)) {
            return std::move(*res);
        }
        auto lang = std::get<Language>(lang_or_error);

        harness::HarnessContext ctx{.config = msg.config.value_or(config)};
        if (msg.assets_base) {
            ctx.config.assets_base = *msg.assets_base;
        }
        ctx.after_bootstrap = [lockdown = ctx.config.lockdown_network] {
            if (not lockdown) {
                return;
            }
            try {
                lockdown_network();
            } catch (const std::exception& e) {
                errlog("Network lockdown failed, continuing without it: ", e.what());
            }
        };

        auto timeout = std::chrono::milliseconds{
            msg.req.timeout_ms.value_or(ctx.config.default_timeout_ms)
        };
        return harness::run_harness(lang, ctx, msg.req.solution, msg.req.tests, timeout);
    } catch (const std::exception& e) {
        errlog("Unit ", getpid(), ": ", e.what());
        return result_fail(e.what(), ErrorKind::RUNTIME_ERROR);
    }
}

int unit_main(int in_fd, int out_fd, const Config& config) noexcept {
    try {
        auto res = handle_unit_message(read_line(in_fd), config);
        write_all_throw(out_fd, encode_result_message(res));
        return 0;
    } catch (const std::exception& e) {
        errlog("Unit ", getpid(), ": cannot deliver the result: ", e.what());
        return 1;
    }
}

} // namespace grader
