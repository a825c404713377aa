#ifndef SHARE_UTILITIES_DEBUG_HPP
#define SHARE_UTILITIES_DEBUG_HPP

// ============================================================================
// Pico JVM - 断言与内部错误报告
// 对应 HotSpot: src/hotspot/share/utilities/debug.hpp
//
// 这里只处理 VM 自身的编程错误（不变式被破坏），打印后 abort()。
// 输入数据导致的错误（坏的 class 文件、未实现的字节码）不走这里，
// 而是通过 utilities/exceptions.hpp 的 TRAPS/CHECK 机制逐层返回。
// ============================================================================

#include <cstdio>
#include <cstdlib>
#include <cstdarg>

inline void report_vm_error(const char* file, int line, const char* msg) {
    fprintf(stderr, "\n# A fatal error has been detected by the Pico JVM:\n");
    fprintf(stderr, "#\n#  %s\n", msg);
    fprintf(stderr, "#  at %s:%d\n", file, line);
    fprintf(stderr, "#\n");
    fflush(stderr);
    abort();
}

inline void report_vm_error(const char* file, int line, const char* msg,
                            const char* detail) {
    fprintf(stderr, "\n# A fatal error has been detected by the Pico JVM:\n");
    fprintf(stderr, "#\n#  %s\n", msg);
    fprintf(stderr, "#  %s\n", detail);
    fprintf(stderr, "#  at %s:%d\n", file, line);
    fprintf(stderr, "#\n");
    fflush(stderr);
    abort();
}

// ----------------------------------------------------------------------------
// 断言宏
// HotSpot: debug.hpp
//
// vm_assert(p, msg) : 仅 ASSERT 构建生效
// guarantee(p, msg) : 始终生效
// fatal(msg)        : 无条件报错
// ----------------------------------------------------------------------------

#ifdef ASSERT
#define vm_assert(p, msg)                                           \
    do {                                                            \
        if (!(p)) {                                                 \
            report_vm_error(__FILE__, __LINE__,                     \
                "assert(" #p ") failed", msg);                      \
        }                                                           \
    } while (0)
#else
#define vm_assert(p, msg)  do {} while(0)
#endif

#define guarantee(p, msg)                                           \
    do {                                                            \
        if (!(p)) {                                                 \
            report_vm_error(__FILE__, __LINE__,                     \
                "guarantee(" #p ") failed", msg);                   \
        }                                                           \
    } while (0)

#define fatal(msg)                                                  \
    do {                                                            \
        report_vm_error(__FILE__, __LINE__, "fatal error", msg);    \
    } while (0)

#define ShouldNotCallThis()                                         \
    report_vm_error(__FILE__, __LINE__, "ShouldNotCallThis()")

#define ShouldNotReachHere()                                        \
    report_vm_error(__FILE__, __LINE__, "ShouldNotReachHere()")

// warning：非致命警告，printf 风格
inline void warning(const char* format, ...) {
    va_list ap;
    va_start(ap, format);
    fprintf(stderr, "WARNING: ");
    vfprintf(stderr, format, ap);
    fprintf(stderr, "\n");
    va_end(ap);
}

#endif // SHARE_UTILITIES_DEBUG_HPP
