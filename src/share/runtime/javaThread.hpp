#ifndef SHARE_RUNTIME_JAVATHREAD_HPP
#define SHARE_RUNTIME_JAVATHREAD_HPP

// ============================================================================
// Pico JVM - JavaThread（Java 线程）
// 对应 HotSpot: src/hotspot/share/runtime/thread.hpp
//
// HotSpot 继承层次：
//   ThreadShadow (pending exception)
//   └── Thread
//       └── JavaThread
//
// 这里只有一个线程，它承担三件事：
//   - 作为 TRAPS 参数承载 pending exception
//   - 记录当前正在解释执行的方法（出错时用于定位）
//   - 持有程序输出流（println 写到这里，默认 stdout，测试里换成临时文件）
// ============================================================================

#include "memory/allocation.hpp"
#include "utilities/exceptions.hpp"

class Method;

class JavaThread : public ThreadShadow, public CHeapObj<mtThread> {
private:
    const char* _name;
    FILE*       _output;            // 程序输出（不是诊断输出）
    Method*     _current_method;

public:
    explicit JavaThread(const char* name = "main")
        : _name(name),
          _output(stdout),
          _current_method(nullptr)
    {}

    ~JavaThread() {}

    // ======== 输出流 ========

    FILE* output() const { return _output; }
    void set_output(FILE* out) { _output = out; }

    // ======== 当前方法 ========

    Method* current_method() const { return _current_method; }
    void set_current_method(Method* m) { _current_method = m; }

    const char* name() const { return _name; }

    void print_on(FILE* out) const {
        fprintf(out, "JavaThread(%p) name=\"%s\"", (const void*)this, _name);
        if (has_pending_exception()) {
            fprintf(out, " [exception pending: %s: %s]",
                    Exceptions::name(_pending_kind), _exception_message);
        }
    }

    NONCOPYABLE(JavaThread);
};

#endif // SHARE_RUNTIME_JAVATHREAD_HPP
