#pragma once

#include <string>

// Work directory of a single run: created from a mkdtemp(3) template and
// removed recursively on destruction
class TemporaryDirectory {
    std::string path_; // absolute, with trailing '/', empty if none is held

public:
    TemporaryDirectory() = default; // Does NOT create a temporary directory

    // @p templ has to end with "XXXXXX", relative templates are resolved
    // against the current working directory
    explicit TemporaryDirectory(const std::string& templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    TemporaryDirectory(TemporaryDirectory&& other) noexcept;
    // Removes the currently held directory first, throws if that fails
    // NOLINTNEXTLINE(performance-noexcept-move-constructor)
    TemporaryDirectory& operator=(TemporaryDirectory&& other);

    ~TemporaryDirectory();

    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};
