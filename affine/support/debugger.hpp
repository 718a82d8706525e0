#pragma once

namespace affine::support {

// True iff the process is being traced (gdb, lldb, strace, ...)
// Linux only: reads TracerPid from /proc/self/status

bool DebuggerAttached();

}  // namespace affine::support
