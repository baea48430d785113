#pragma once

#include <cstddef>
#include <gradelib/errmsg.hh>
#include <gradelib/macros/throw.hh>
#include <string>
#include <string_view>

/**
 * @brief Write @p count bytes to @p fd from @p buff
 * @details Uses write(2), but writes until it is unable to write
 *
 * @return number of bytes written, if error occurs then errno is > 0
 *
 * @errors The same as for write(2) except EINTR
 */
[[nodiscard]] size_t write_all(int fd, const void* buff, size_t count) noexcept;

// Throws on error
inline void write_all_throw(int fd, std::string_view str) {
    if (write_all(fd, str.data(), str.size()) != str.size()) {
        THROW("write()", errmsg());
    }
}

// Reads from @p fd until EOF. Throws on error.
std::string get_file_contents(int fd);

// Reads the whole file @p file. Throws on error.
std::string get_file_contents(const char* file);

inline std::string get_file_contents(const std::string& file) {
    return get_file_contents(file.c_str());
}

// Creates or truncates @p file and writes @p data to it. Throws on error.
void put_file_contents(const char* file, std::string_view data, mode_t mode = 0644);

inline void put_file_contents(const std::string& file, std::string_view data, mode_t mode = 0644) {
    put_file_contents(file.c_str(), data, mode);
}
