#include <cerrno>
#include <gradelib/grader/lockdown.hh>
#include <gradelib/logger.hh>
#include <gradelib/sandbox/seccomp/bpf_builder.hh>
#include <sys/socket.h>
#include <unistd.h>

namespace {

bool locked_down = false; // per process, a forked unit starts with the parent's value

} // namespace

namespace grader {

void lockdown_network() {
    if (locked_down) {
        return;
    }

    using sandbox::seccomp::ARG0_NE;
    auto bpf = sandbox::seccomp::BpfBuilder{SCMP_ACT_ALLOW};
    bpf.err_syscall(EPERM, SCMP_SYS(socket), ARG0_NE{AF_UNIX});
    bpf.err_syscall(EPERM, SCMP_SYS(connect));
    bpf.err_syscall(EPERM, SCMP_SYS(bind));
    bpf.err_syscall(EPERM, SCMP_SYS(listen));
    bpf.err_syscall(EPERM, SCMP_SYS(accept));
    bpf.err_syscall(EPERM, SCMP_SYS(accept4));
    bpf.err_syscall(ENOSYS, SCMP_SYS(io_uring_setup));
    bpf.load();

    locked_down = true;
    stdlog("Network lockdown installed in process ", getpid());
}

bool network_is_locked_down() noexcept { return locked_down; }

} // namespace grader
