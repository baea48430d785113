#pragma once

#include <cstdint>
#include <gradelib/errmsg.hh>
#include <gradelib/macros/throw.hh>
#include <seccomp.h>
#include <utility>

namespace sandbox::seccomp {

// Argument comparison: the first syscall argument differs from datum
struct ARG0_NE {
    uint64_t datum;
};

// Builds a seccomp filter and installs it in the calling process
class BpfBuilder {
    scmp_filter_ctx seccomp_ctx;

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wc99-extensions"
#pragma clang diagnostic ignored "-Wmissing-field-initializers"
#endif

    static constexpr auto arg_cmp_to_seccomp_native(const ARG0_NE& arg_cmp) noexcept {
        return SCMP_A0(SCMP_CMP_NE, arg_cmp.datum);
    }

#ifdef __clang__
#pragma clang diagnostic pop
#endif

    template <class... Args>
    void add_rule(uint32_t action, int syscall, Args&&... args) {
        int err = seccomp_rule_add(
            seccomp_ctx,
            action,
            syscall,
            sizeof...(args),
            arg_cmp_to_seccomp_native(std::forward<Args>(args))...
        );
        if (err) {
            THROW("seccomp_rule_add()", errmsg(-err));
        }
    }

public:
    explicit BpfBuilder(uint32_t def_action = SCMP_ACT_ALLOW)
    : seccomp_ctx{seccomp_init(def_action)} {
        if (!seccomp_ctx) {
            THROW("seccomp_init() failed");
        }

        // Enable binary tree sorted syscalls in the filter
        int err = seccomp_attr_set(seccomp_ctx, SCMP_FLTATR_CTL_OPTIMIZE, 2);
        if (err) {
            seccomp_release(seccomp_ctx);
            THROW("seccomp_attr_set()", errmsg(-err));
        }
    }

    BpfBuilder(const BpfBuilder&) = delete;
    BpfBuilder(BpfBuilder&&) = delete;
    BpfBuilder& operator=(const BpfBuilder&) = delete;
    BpfBuilder& operator=(BpfBuilder&&) = delete;

    // Makes @p syscall fail with @p errnum if all argument comparisons match
    template <class... Args>
    void err_syscall(int errnum, int syscall, Args&&... args) {
        add_rule(SCMP_ACT_ERRNO(errnum), syscall, std::forward<Args>(args)...);
    }

    // Installs the filter in the calling process, it is inherited by its
    // children and cannot be removed
    void load() const {
        int err = seccomp_load(seccomp_ctx);
        if (err) {
            THROW("seccomp_load()", errmsg(-err));
        }
    }

    ~BpfBuilder() { seccomp_release(seccomp_ctx); }
};

} // namespace sandbox::seccomp
