#pragma once

// seccomp-BPF syscall allowlist for sandboxed interpreter processes.
//
// Allowlist-only: any syscall NOT on the list kills the process (SIGSYS).
// mprotect with PROT_EXEC is rejected. Socket syscalls are only on the list
// when the sandbox config allows network.
//
// Architecture-aware: supports x86_64 and aarch64.

#include <string>

namespace evogate {

// Install the filter in the calling process. Must be called AFTER
// prctl(PR_SET_NO_NEW_PRIVS, 1). Intended for the child between fork and exec.
//
// Returns empty string on success, error message on failure.
// On non-Linux platforms, returns success (no-op).
std::string install_seccomp_filter(bool allow_network);

// True when this kernel and architecture can take the filter. Backends refuse
// to create an instance whose config needs the filter when this is false.
bool seccomp_available();

} // namespace evogate
