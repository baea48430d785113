#include <cstdlib>
#include <gradelib/errmsg.hh>
#include <gradelib/file_manip.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/temporary_directory.hh>
#include <string_view>
#include <unistd.h>
#include <utility>

using std::string;

namespace {

string current_dir() {
    char buff[4096];
    if (getcwd(buff, sizeof(buff)) == nullptr) {
        THROW("getcwd()", errmsg());
    }
    string res = buff;
    if (res.back() != '/') {
        res += '/';
    }
    return res;
}

} // namespace

TemporaryDirectory::TemporaryDirectory(const string& templ) {
    if (not std::string_view{templ}.ends_with("XXXXXX")) {
        THROW("Invalid temporary directory template: ", templ);
    }

    string name = templ;
    // mkdtemp() creates the directory with mode 0700
    if (mkdtemp(name.data()) == nullptr) {
        THROW("Cannot create temporary directory from template `", templ, '`', errmsg());
    }
    path_ = name.front() == '/' ? std::move(name) : concat_tostr(current_dir(), name);
    path_ += '/';
}

TemporaryDirectory::TemporaryDirectory(TemporaryDirectory&& other) noexcept
: path_(std::exchange(other.path_, {})) {}

// NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& other) {
    if (exists() and remove_r(path_.c_str()) == -1) {
        THROW("remove_r(", path_, ')', errmsg());
    }
    path_ = std::exchange(other.path_, {});
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists() and remove_r(path_.c_str()) == -1) {
        errlog("Cannot remove work directory ", path_, errmsg());
    }
}
