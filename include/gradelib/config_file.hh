#pragma once

#include <charconv>
#include <cstdint>
#include <functional>
#include <gradelib/concat_tostr.hh>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

/**
 * Config file format:
 *   # comment
 *   name: value
 *   name: 'single-quoted value, '' is an escaped quote'
 *   name: "double-quoted value with \t, \n, \x41 escapes"
 *
 * Names consist of characters [a-zA-Z0-9\-_.]. Unquoted values end at '#' or
 * at the end of the line and have their trailing white-spaces removed.
 */
class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        explicit ParseError(const std::string& msg)
        : runtime_error(msg) {}

        template <class... Args>
        ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)) {}

        ParseError(const ParseError& pe) = default;
        ParseError(ParseError&&) noexcept = default;
        ParseError& operator=(const ParseError& pe) = default;
        ParseError& operator=(ParseError&&) noexcept = default;

        using runtime_error::what;

        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

        ~ParseError() noexcept override = default;

        friend class ConfigFile;
    };

    class Variable {
        bool is_set_ = false;
        std::string str_;

        void unset() noexcept {
            is_set_ = false;
            str_.clear();
        }

    public:
        [[nodiscard]] bool is_set() const noexcept { return is_set_; }

        // Returns value as bool or false on error
        [[nodiscard]] bool as_bool() const noexcept {
            return (str_ == "1" || str_ == "on" || str_ == "true");
        }

        template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            T res{};
            auto [ptr, ec] = std::from_chars(str_.data(), str_.data() + str_.size(), res);
            if (ec != std::errc{} or ptr != str_.data() + str_.size() or str_.empty()) {
                return std::nullopt;
            }
            return res;
        }

        // Returns value as string (empty if variable isn't set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars; // (name => value)
    static const Variable null_var;

public:
    ConfigFile() = default;

    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    // Returns a reference to a variable @p name from variable set or to a
    // null_var
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars.find(name);
        return (it != vars.end() ? it->second : null_var);
    }

    /**
     * @brief Loads values of the variables from the variable set from
     *   @p config, other variables are skipped
     *
     * @errors Throws an exception (ParseError) if an error occurs
     */
    void load_config_from_string(std::string config);
};
