#include <gradelib/concat_tostr.hh>
#include <gradelib/errmsg.hh>
#include <gradelib/grader/harness/context.hh>
#include <gradelib/macros/throw.hh>
#include <unistd.h>

using std::string;

namespace grader::harness {

string resolve_runtime(
    const HarnessContext& ctx, std::string_view program, const string& configured_path
) {
    if (not ctx.config.assets_base.empty()) {
        auto path = concat_tostr(ctx.config.assets_base, "/bin/", program);
        if (access(path.c_str(), X_OK) == 0) {
            return path;
        }
    }
    if (access(configured_path.c_str(), X_OK) != 0) {
        THROW(program, " is not an executable: ", configured_path, errmsg());
    }
    return configured_path;
}

string newline_terminated(string str) {
    if (not str.ends_with('\n')) {
        str += '\n';
    }
    return str;
}

} // namespace grader::harness
