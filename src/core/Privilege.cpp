#include "Privilege.h"
#include "Logging.h"
#include <string>
#include <unistd.h>
#ifdef NETGRAVE_HAVE_LIBCAP
#include <sys/capability.h>
#endif
#ifdef NETGRAVE_HAVE_SECCOMP
#include <seccomp.h>
#endif

namespace netgrave {

#ifdef NETGRAVE_HAVE_SECCOMP
namespace {
const int kAllowedSyscalls[] = {
    SCMP_SYS(read), SCMP_SYS(write), SCMP_SYS(writev), SCMP_SYS(pwrite64), SCMP_SYS(fsync), SCMP_SYS(fdatasync), SCMP_SYS(openat), SCMP_SYS(close), SCMP_SYS(fstat), SCMP_SYS(newfstatat),
    SCMP_SYS(statx), SCMP_SYS(lseek), SCMP_SYS(getdents64), SCMP_SYS(readlink), SCMP_SYS(readlinkat),
    SCMP_SYS(mmap), SCMP_SYS(munmap), SCMP_SYS(mremap), SCMP_SYS(madvise), SCMP_SYS(mprotect), SCMP_SYS(brk), SCMP_SYS(futex),
    SCMP_SYS(rt_sigaction), SCMP_SYS(rt_sigprocmask), SCMP_SYS(rt_sigreturn),
    SCMP_SYS(clock_gettime), SCMP_SYS(clock_nanosleep), SCMP_SYS(nanosleep),
    SCMP_SYS(getpid), SCMP_SYS(geteuid), SCMP_SYS(fcntl), SCMP_SYS(ioctl), SCMP_SYS(exit), SCMP_SYS(exit_group)
};
}
#endif

static void log_capabilities(const std::string& context) {
#ifdef NETGRAVE_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    }
    cap_free(caps);
#else
    (void)context;
#endif
}

bool drop_capabilities(bool keep_proc_read){
#ifdef NETGRAVE_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities (keep_proc_read=" + std::string(keep_proc_read ? "true" : "false") + ")");
    log_capabilities("before drop");
    cap_t caps = cap_get_proc();
    if(!caps) {
        Logger::instance().error("cap_get_proc failed");
        return false;
    }
    cap_clear(caps);
    if(keep_proc_read){
        cap_value_t keep[] = { CAP_DAC_READ_SEARCH, CAP_SYS_PTRACE };
        cap_set_flag(caps, CAP_PERMITTED, 2, keep, CAP_SET);
        cap_set_flag(caps, CAP_EFFECTIVE, 2, keep, CAP_SET);
    }
    bool ok = cap_set_proc(caps) == 0;
    if(!ok) {
        Logger::instance().error("cap_set_proc failed");
    } else {
        log_capabilities("after drop");
    }
    cap_free(caps);
    return ok;
#else
    (void)keep_proc_read;
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
    return false;
#endif
}

bool apply_seccomp_profile(){
#ifdef NETGRAVE_HAVE_SECCOMP
    static bool applied = false;
    if (applied) return true;

    Logger::instance().info("Applying seccomp profile");
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_KILL);
    if(!ctx) {
        Logger::instance().error("Failed to initialize seccomp context");
        return false;
    }
    for(int c : kAllowedSyscalls){
        if(seccomp_rule_add(ctx, SCMP_ACT_ALLOW, c, 0) != 0){
            Logger::instance().error("Failed to allow syscall " + std::to_string(c) + " in seccomp");
            seccomp_release(ctx);
            return false;
        }
    }
    if(seccomp_load(ctx) != 0){
        Logger::instance().error("Failed to load seccomp profile");
        seccomp_release(ctx);
        return false;
    }
    seccomp_release(ctx);
    applied = true;
    return true;
#else
    Logger::instance().info("Seccomp not available (not compiled in)");
    return false;
#endif
}

bool is_privilege_available(){
#ifdef NETGRAVE_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

bool is_seccomp_available(){
#ifdef NETGRAVE_HAVE_SECCOMP
    return true;
#else
    return false;
#endif
}

int get_seccomp_allowed_syscalls_count(){
#ifdef NETGRAVE_HAVE_SECCOMP
    return static_cast<int>(sizeof(kAllowedSyscalls) / sizeof(kAllowedSyscalls[0]));
#else
    return 0;
#endif
}

}
