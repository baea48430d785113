#pragma once

#include <atomic>
#include <cstdio>
#include <gradelib/concat_tostr.hh>
#include <string>
#include <utility>

/**
 * Line-oriented log shared by the dispatcher and the isolated units it
 * forks. Every line is written with a single locked fprintf() and labeled
 * with the time and the pid of the writing process, so that lines of
 * concurrent units can be told apart in one file.
 */
class Logger {
    FILE* f_;
    std::atomic<bool> owns_file_{false};

public:
    // nullptr makes a logger that discards everything
    explicit Logger(FILE* stream) noexcept : f_(stream) {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Switches to the file @p filename opened in append mode
     *
     * @errors Throws std::runtime_error if fopen() fails, the logger is left
     *   unchanged in that case
     */
    void open(const char* filename);

    // Descriptor of the underlying stream, -1 for a discarding logger
    [[nodiscard]] int fileno() const noexcept { return f_ ? ::fileno(f_) : -1; }

    // Collects one log line, the line is written on destruction
    class Line {
        friend class Logger;

        Logger& logger_;
        std::string buff_;
        bool pending_ = true;

        explicit Line(Logger& logger) noexcept : logger_(logger) {}

    public:
        Line(const Line&) = delete;
        Line& operator=(const Line&) = delete;
        Line& operator=(Line&&) = delete;

        Line(Line&& other) noexcept
        : logger_(other.logger_)
        , buff_(std::move(other.buff_))
        , pending_(std::exchange(other.pending_, false)) {}

        template <class... Args>
        Line& operator()(Args&&... args) {
            back_insert(buff_, std::forward<Args>(args)...);
            return *this;
        }

        void flush() noexcept;

        ~Line() { flush(); }
    };

    template <class... Args>
    Line operator()(Args&&... args) {
        Line line{*this};
        line(std::forward<Args>(args)...);
        return line;
    }

    ~Logger() {
        if (owns_file_) {
            (void)fclose(f_);
        }
    }
};

// Both write to stderr until configure_logging() redirects them
inline Logger stdlog(stderr);
inline Logger errlog(stderr);
