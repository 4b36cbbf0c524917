#include "evogate/seccomp.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>

#if defined(__x86_64__)
  #define EVOGATE_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define EVOGATE_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define EVOGATE_AUDIT_ARCH 0
#endif

namespace evogate {

namespace {

sock_filter bpf_stmt(unsigned short code, unsigned int k) {
    return sock_filter{code, 0, 0, k};
}

sock_filter bpf_jump(unsigned short code, unsigned int k, unsigned char jt, unsigned char jf) {
    return sock_filter{code, jt, jf, k};
}

} // namespace

std::string install_seccomp_filter(bool allow_network) {
#if EVOGATE_AUDIT_ARCH == 0
    (void)allow_network;
    return "seccomp: unsupported architecture";
#else
#if defined(__x86_64__)
    static const unsigned int allowed[] = {
        0,    // read
        1,    // write
        2,    // open
        3,    // close
        4,    // stat
        5,    // fstat
        6,    // lstat
        7,    // poll
        8,    // lseek
        9,    // mmap
        10,   // mprotect (PROT_EXEC checked below)
        11,   // munmap
        12,   // brk
        13,   // rt_sigaction
        14,   // rt_sigprocmask
        15,   // rt_sigreturn
        16,   // ioctl
        17,   // pread64
        18,   // pwrite64
        19,   // readv
        20,   // writev
        21,   // access
        22,   // pipe
        23,   // select
        24,   // sched_yield
        25,   // mremap
        28,   // madvise
        32,   // dup
        33,   // dup2
        35,   // nanosleep
        37,   // alarm
        39,   // getpid
        56,   // clone (RLIMIT_NPROC caps it)
        57,   // fork
        59,   // execve (the interpreter itself)
        60,   // exit
        61,   // wait4
        62,   // kill
        63,   // uname
        72,   // fcntl
        73,   // flock
        74,   // fsync
        75,   // fdatasync
        76,   // truncate
        77,   // ftruncate
        78,   // getdents
        79,   // getcwd
        80,   // chdir
        81,   // fchdir
        82,   // rename
        83,   // mkdir
        84,   // rmdir
        85,   // creat
        86,   // link
        87,   // unlink
        89,   // readlink
        90,   // chmod
        91,   // fchmod
        95,   // umask
        96,   // gettimeofday
        97,   // getrlimit
        99,   // sysinfo
        100,  // times
        102,  // getuid
        104,  // getgid
        107,  // geteuid
        108,  // getegid
        110,  // getppid
        111,  // getpgrp
        112,  // setsid
        131,  // sigaltstack
        137,  // statfs
        138,  // fstatfs
        157,  // prctl
        158,  // arch_prctl
        186,  // gettid
        202,  // futex
        204,  // sched_getaffinity
        217,  // getdents64
        218,  // set_tid_address
        221,  // fadvise64
        228,  // clock_gettime
        229,  // clock_getres
        230,  // clock_nanosleep
        231,  // exit_group
        232,  // epoll_wait
        233,  // epoll_ctl
        234,  // tgkill
        257,  // openat
        258,  // mkdirat
        262,  // newfstatat
        263,  // unlinkat
        264,  // renameat
        267,  // readlinkat
        268,  // fchmodat
        269,  // faccessat
        270,  // pselect6
        271,  // ppoll
        273,  // set_robust_list
        281,  // epoll_pwait
        290,  // eventfd2
        291,  // epoll_create1
        292,  // dup3
        293,  // pipe2
        302,  // prlimit64
        316,  // renameat2
        318,  // getrandom
        332,  // statx
        334,  // rseq
        435,  // clone3
        439,  // faccessat2
    };
    static const unsigned int net_allowed[] = {
        41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, 52, 53, 54, 55,
        288,       // accept4
        299, 307,  // recvmmsg, sendmmsg
    };
    const unsigned int mprotect_nr = 10;
#elif defined(__aarch64__)
    static const unsigned int allowed[] = {
        5,    // epoll_create1
        17,   // getcwd
        19,   // eventfd2
        20,   // epoll_ctl
        21,   // epoll_pwait
        23,   // dup
        24,   // dup3
        25,   // fcntl
        29,   // ioctl
        32,   // flock
        34,   // mkdirat
        35,   // unlinkat
        37,   // linkat
        38,   // renameat
        43,   // statfs
        44,   // fstatfs
        46,   // ftruncate
        48,   // faccessat
        49,   // chdir
        50,   // fchdir
        52,   // fchmod
        53,   // fchmodat
        56,   // openat
        57,   // close
        59,   // pipe2
        61,   // getdents64
        62,   // lseek
        63,   // read
        64,   // write
        65,   // readv
        66,   // writev
        67,   // pread64
        68,   // pwrite64
        72,   // pselect6
        73,   // ppoll
        78,   // readlinkat
        79,   // newfstatat
        80,   // fstat
        82,   // fsync
        83,   // fdatasync
        93,   // exit
        94,   // exit_group
        96,   // set_tid_address
        98,   // futex
        99,   // set_robust_list
        101,  // nanosleep
        113,  // clock_gettime
        114,  // clock_getres
        115,  // clock_nanosleep
        123,  // sched_getaffinity
        124,  // sched_yield
        129,  // kill
        131,  // tgkill
        132,  // sigaltstack
        134,  // rt_sigaction
        135,  // rt_sigprocmask
        139,  // rt_sigreturn
        153,  // times
        157,  // setsid
        160,  // uname
        163,  // getrlimit
        166,  // umask
        167,  // prctl
        169,  // gettimeofday
        172,  // getpid
        173,  // getppid
        174,  // getuid
        175,  // geteuid
        176,  // getgid
        177,  // getegid
        178,  // gettid
        179,  // sysinfo
        214,  // brk
        215,  // munmap
        216,  // mremap
        220,  // clone
        221,  // execve
        222,  // mmap
        223,  // fadvise64
        226,  // mprotect
        233,  // madvise
        260,  // wait4
        261,  // prlimit64
        278,  // getrandom
        291,  // statx
        293,  // rseq
        435,  // clone3
        439,  // faccessat2
    };
    static const unsigned int net_allowed[] = {
        198, 199, 200, 201, 202, 203, 204, 205, 206, 207, 208, 209, 210, 211, 212,
        242,       // accept4
        243, 269,  // recvmmsg, sendmmsg
    };
    const unsigned int mprotect_nr = 226;
#endif

    std::vector<unsigned int> allowlist(std::begin(allowed), std::end(allowed));
    if (allow_network) {
        allowlist.insert(allowlist.end(), std::begin(net_allowed), std::end(net_allowed));
    }
    const size_t n = allowlist.size();

    // Layout:
    //   [0]        load arch
    //   [1]        arch ok -> skip kill
    //   [2]        KILL (arch mismatch)
    //   [3]        load syscall nr
    //   [4..4+n)   JEQ allowed[s] -> ALLOW (or MPROTECT_CHECK)
    //   [4+n]      KILL (default deny)
    //   [4+n+1]    MPROTECT_CHECK: load args[2] (prot)
    //   [4+n+2]    JSET PROT_EXEC -> KILL
    //   [4+n+3]    ALLOW (mprotect without PROT_EXEC)
    //   [4+n+4]    KILL (mprotect with PROT_EXEC)
    //   [4+n+5]    ALLOW
    std::vector<sock_filter> filter;
    filter.reserve(n + 10);
    filter.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    filter.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, EVOGATE_AUDIT_ARCH, 1, 0));
    filter.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    filter.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    for (size_t s = 0; s < n; s++) {
        // jump targets are relative to the next instruction
        const unsigned char jt = allowlist[s] == mprotect_nr
            ? (unsigned char)(n - s)
            : (unsigned char)(n + 4 - s);
        filter.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, allowlist[s], jt, 0));
    }
    filter.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    filter.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS,
                              offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    filter.push_back(bpf_jump(BPF_JMP | BPF_JSET | BPF_K, 0x4, 1, 0));
    filter.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    filter.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    filter.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog prog = {};
    prog.len = (unsigned short)filter.size();
    prog.filter = filter.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
#if EVOGATE_AUDIT_ARCH == 0
    return false;
#else
    // 0: available but inactive, 2: filter mode active, -1/EINVAL: unsupported
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
#endif
}

} // namespace evogate

#else // !__linux__

namespace evogate {

std::string install_seccomp_filter(bool) {
    return "";
}

bool seccomp_available() {
    return false;
}

} // namespace evogate

#endif
