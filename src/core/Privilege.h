// Linux privilege & sandbox helpers (best-effort; compile-time gated)
#pragma once
namespace netgrave {
// Clears every capability. With keep_proc_read, CAP_DAC_READ_SEARCH and
// CAP_SYS_PTRACE survive so other users' /proc/<pid>/fd stay readable.
bool drop_capabilities(bool keep_proc_read);
// Installs an allow-list filter covering the monitor loop's read-only syscalls.
bool apply_seccomp_profile();
bool is_privilege_available();
bool is_seccomp_available();
int get_seccomp_allowed_syscalls_count();
}
