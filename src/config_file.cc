#include <algorithm>
#include <cctype>
#include <gradelib/config_file.hh>

using std::string;

namespace {

constexpr bool is_xdigit(char c) noexcept {
    return (c >= '0' and c <= '9') or (c >= 'a' and c <= 'f') or (c >= 'A' and c <= 'F');
}

constexpr int hex2dec(char c) noexcept {
    return (c >= 'a' ? c - 'a' + 10 : (c >= 'A' ? c - 'A' + 10 : c - '0'));
}

constexpr char dec2hex(int x) noexcept { return static_cast<char>(x < 10 ? '0' + x : 'a' + x - 10); }

} // namespace

const ConfigFile::Variable ConfigFile::null_var{};

void ConfigFile::load_config_from_string(string config) {
    // Set all variables as unused
    for (auto& [name, var] : vars) {
        var.unset();
    }

    // Checks whether c is a white-space but not a newline
    auto is_ws = [](char c) { return (c != '\n' and std::isspace(static_cast<unsigned char>(c))); };
    // Checks whether character is one of these [a-zA-Z0-9\-_.]
    auto is_name = [](char c) {
        return (std::isalnum(static_cast<unsigned char>(c)) or c == '-' or c == '_' or c == '.');
    };

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;

    auto throw_parse_error = [&](auto&&... args) {
        size_t line_beg = config.rfind('\n', pos == 0 ? 0 : pos - 1);
        line_beg = (line_beg == string::npos or line_beg >= pos ? 0 : line_beg + 1);
        auto line = 1 + std::count(config.begin(), config.begin() + line_beg, '\n');
        size_t col = pos - line_beg + 1; // Indexed from 1

        ParseError pe(static_cast<size_t>(line), col, std::forward<decltype(args)>(args)...);

        // Construct diagnostics
        auto& diags = pe.diagnostics_;
        auto append_char = [&](unsigned char c) {
            if (std::isprint(c)) {
                diags += static_cast<char>(c);
            } else {
                diags += "\\x";
                diags += dec2hex(c >> 4);
                diags += dec2hex(c & 15);
            }
        };

        for (size_t k = line_beg; k < pos; ++k) {
            append_char(config[k]);
        }
        size_t padding = diags.size();
        for (size_t k = pos; config[k] != '\n'; ++k) {
            append_char(config[k]);
        }
        diags += '\n';
        diags.append(padding, ' ');
        diags += '^';
        throw std::move(pe);
    };

    auto extract_value = [&] {
        string res;
        // Single-quoted string
        if (config[pos] == '\'') {
            while (config[++pos] != '\n') {
                if (config[pos] == '\'') {
                    if (config[pos + 1] != '\'') { // Safe (newline is at the end of every line)
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += config[pos];
            }
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[pos] == '"') {
            while (config[++pos] != '\n') {
                if (config[pos] == '"') {
                    ++pos;
                    return res;
                }

                if (config[pos] != '\\') {
                    res += config[pos];
                    continue;
                }

                // Escape sequence
                switch (config[++pos]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '\\': res += '\\'; continue;
                case 't': res += '\t'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case 'x':
                    // pos will not go out of the buffer - (guard = newline)
                    if (!is_xdigit(config[++pos]) or !is_xdigit(config[++pos])) {
                        throw_parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    res += static_cast<char>((hex2dec(config[pos - 1]) << 4) + hex2dec(config[pos]));
                    continue;
                default: throw_parse_error("Unknown escape sequence: `\\", config[pos], '`');
                }
            }
            throw_parse_error("Missing terminating \" character");
        }

        // String literal
        size_t beg = pos;
        while (config[pos] != '\n' and config[pos] != '#') {
            ++pos;
        }
        size_t end = pos;
        while (end > beg and is_ws(config[end - 1])) {
            --end;
        }
        res.assign(config, beg, end - beg);
        return res;
    };

    // Parse lines
    while (pos < config.size()) {
        while (is_ws(config[pos])) {
            ++pos;
        }
        // Empty line or comment
        if (config[pos] == '\n' or config[pos] == '#') {
            pos = config.find('\n', pos) + 1;
            continue;
        }

        // Variable name
        size_t name_beg = pos;
        while (is_name(config[pos])) {
            ++pos;
        }
        if (pos == name_beg) {
            throw_parse_error("Invalid character in the variable name: `", config[pos], '`');
        }
        string name = config.substr(name_beg, pos - name_beg);

        while (is_ws(config[pos])) {
            ++pos;
        }
        if (config[pos] != ':') {
            throw_parse_error("Missing ':' after the variable name");
        }
        ++pos;
        while (is_ws(config[pos])) {
            ++pos;
        }

        string value = extract_value();

        // Rest of the line
        while (is_ws(config[pos])) {
            ++pos;
        }
        if (config[pos] == '#') {
            pos = config.find('\n', pos);
        }
        if (config[pos] != '\n') {
            throw_parse_error("Unexpected character after the value: `", config[pos], '`');
        }
        ++pos;

        auto it = vars.find(name);
        if (it == vars.end()) {
            continue;
        }
        it->second.is_set_ = true;
        it->second.str_ = std::move(value);
    }
}
