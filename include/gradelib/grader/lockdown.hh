#pragma once

namespace grader {

/**
 * @brief Disables networking in the calling process and every process it
 *   spawns afterwards
 * @details Installs a seccomp filter: socket() of families other than AF_UNIX,
 *   connect(), bind(), listen(), accept() and accept4() fail with EPERM,
 *   io_uring_setup() fails with ENOSYS. Subsequent calls are no-ops.
 *
 * @errors Throws std::runtime_error if the filter cannot be installed
 */
void lockdown_network();

[[nodiscard]] bool network_is_locked_down() noexcept;

} // namespace grader
