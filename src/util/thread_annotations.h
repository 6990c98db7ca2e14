#pragma once

// Clang thread-safety analysis attributes. No-ops elsewhere.
// std::mutex is only annotated as a capability under libc++, so on other
// standard libraries these serve as documentation of the locking rules.
#if defined(__clang__)
# define RINGBUF_GUARDED_BY(x) __attribute__((guarded_by(x)))
# define RINGBUF_PT_GUARDED_BY(x) __attribute__((pt_guarded_by(x)))
# define RINGBUF_REQUIRES(...) __attribute__((requires_capability(__VA_ARGS__)))
# define RINGBUF_EXCLUDES(...) __attribute__((locks_excluded(__VA_ARGS__)))
#else
# define RINGBUF_GUARDED_BY(x)
# define RINGBUF_PT_GUARDED_BY(x)
# define RINGBUF_REQUIRES(...)
# define RINGBUF_EXCLUDES(...)
#endif
