#include <ctime>
#include <gradelib/errmsg.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <sys/time.h>
#include <unistd.h>

namespace {

// "YYYY-mm-dd HH:MM:SS.mmm" or "unknown time"
void local_date(char (&buff)[32]) noexcept {
    timeval tv{};
    tm t{};
    size_t len = 0;
    if (gettimeofday(&tv, nullptr) == 0 and localtime_r(&tv.tv_sec, &t) != nullptr) {
        len = strftime(buff, sizeof(buff), "%Y-%m-%d %H:%M:%S", &t);
    }
    if (len == 0) {
        (void)snprintf(buff, sizeof(buff), "unknown time");
        return;
    }
    (void)snprintf(buff + len, sizeof(buff) - len, ".%03ld", static_cast<long>(tv.tv_usec / 1000));
}

} // namespace

void Logger::open(const char* filename) {
    FILE* f = fopen(filename, "abe");
    if (f == nullptr) {
        THROW("fopen('", filename, "')", errmsg());
    }
    if (owns_file_.exchange(true)) {
        (void)fclose(f_);
    }
    f_ = f;
}

void Logger::Line::flush() noexcept {
    if (not pending_) {
        return;
    }
    pending_ = false;
    FILE* f = logger_.f_;
    if (f == nullptr) {
        return;
    }

    char date[32];
    local_date(date);
    flockfile(f);
    (void)fprintf(
        f, "[ %s ] [%d] %.*s\n", date, getpid(), static_cast<int>(buff_.size()), buff_.data()
    );
    (void)fflush(f);
    funlockfile(f);
}
