#include <cctype>
#include <gradelib/grader/detect_language.hh>
#include <regex>
#include <string>

using std::optional;
using std::string;
using std::string_view;

namespace {

optional<grader::Language> tag_to_language(string_view tag) {
    string t;
    for (char c : tag) {
        t += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (t == "js" or t == "javascript" or t == "node" or t == "nodejs") {
        return grader::Language::JS;
    }
    if (t == "py" or t == "python") {
        return grader::Language::PYTHON;
    }
    if (t == "ml" or t == "ocaml") {
        return grader::Language::OCAML;
    }
    return std::nullopt;
}

bool is_word_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) or c == '_';
}

// Tag of the first ```tag fence that is closed later in the text
optional<grader::Language> fence_language(string_view s) {
    for (size_t pos = s.find("```"); pos != string_view::npos; pos = s.find("```", pos + 1)) {
        size_t tag_beg = pos + 3;
        size_t tag_end = tag_beg;
        while (tag_end < s.size() and is_word_char(s[tag_end])) {
            ++tag_end;
        }
        if (tag_end == tag_beg) {
            continue;
        }
        if (s.find("```", tag_end) == string_view::npos) {
            return std::nullopt; // no fence is closed after this point
        }
        return tag_to_language(s.substr(tag_beg, tag_end - tag_beg));
    }
    return std::nullopt;
}

string_view first_non_blank_line(string_view s) {
    while (not s.empty()) {
        size_t eol = s.find('\n');
        auto line = s.substr(0, eol);
        for (char c : line) {
            if (not std::isspace(static_cast<unsigned char>(c))) {
                return line;
            }
        }
        if (eol == string_view::npos) {
            break;
        }
        s.remove_prefix(eol + 1);
    }
    return {};
}

optional<grader::Language> header_language(string_view s) {
    static const std::regex js_header(R"(^\s*//\s*LANG:\s*js\b)", std::regex::icase);
    static const std::regex python_header(R"(^\s*#\s*LANG:\s*python\b)", std::regex::icase);
    static const std::regex ocaml_header(R"(^\s*\(\*\s*LANG:\s*ocaml\s*\*\))", std::regex::icase);

    auto line = first_non_blank_line(s);
    auto matches = [line](const std::regex& re) {
        return std::regex_search(line.data(), line.data() + line.size(), re);
    };
    if (matches(js_header)) {
        return grader::Language::JS;
    }
    if (matches(python_header)) {
        return grader::Language::PYTHON;
    }
    if (matches(ocaml_header)) {
        return grader::Language::OCAML;
    }
    return std::nullopt;
}

optional<grader::Language> heuristic_language(string_view s) {
    static const std::regex js_hint(R"(module\.exports\b|require\()");
    static const std::regex python_hint(R"(from\s+typing\s+import\b|def\s+solve\s*\()");
    static const std::regex ocaml_hint(R"(let\s+solve\s*\(|open\s+OUnit2\b)");

    auto matches = [s](const std::regex& re) {
        return std::regex_search(s.data(), s.data() + s.size(), re);
    };
    if (matches(js_hint)) {
        return grader::Language::JS;
    }
    if (matches(python_hint)) {
        return grader::Language::PYTHON;
    }
    if (matches(ocaml_hint)) {
        return grader::Language::OCAML;
    }
    return std::nullopt;
}

} // namespace

namespace grader {

optional<Language> detect_language_of(string_view source) {
    if (auto lang = fence_language(source)) {
        return lang;
    }
    if (auto lang = header_language(source)) {
        return lang;
    }
    return heuristic_language(source);
}

optional<Language> detect_language_raw(string_view solution, string_view tests) {
    if (auto lang = detect_language_of(tests)) {
        return lang;
    }
    return detect_language_of(solution);
}

std::variant<Language, RunResult>
detect_language_or_error(string_view solution, string_view tests) {
    if (auto lang = detect_language_raw(solution, tests)) {
        return *lang;
    }
    return result_fail("Language detection failed", ErrorKind::BAD_LANGUAGE_DETECTION);
}

std::variant<Language, RunResult> detect_language(const RunRequest& req) {
    if (req.language) {
        return *req.language;
    }
    return detect_language_or_error(req.solution, req.tests);
}

} // namespace grader
