#ifndef SHARE_UTILITIES_EXCEPTIONS_HPP
#define SHARE_UTILITIES_EXCEPTIONS_HPP

// ============================================================================
// Pico JVM - VM 内部异常传播
// 对应 HotSpot: src/hotspot/share/utilities/exceptions.hpp
//
// HotSpot 的 C++ 代码不使用 C++ 异常，而是：
//   1. 每个可能失败的函数最后一个参数是 TRAPS (= JavaThread* THREAD)
//   2. 失败时把异常挂到线程上（pending exception），然后 return
//   3. 调用者用 CHECK 宏检查：有 pending exception 就立即 return
//
//   void foo(TRAPS) {
//       bar(CHECK);              // bar 失败则 foo 立即返回
//       int x = baz(CHECK_0);    // baz 失败则 foo 返回 0
//   }
//
// 我们没有 Java 堆，"异常"只是一个 Kind + 一段消息 + 抛出位置。
// ============================================================================

#include "utilities/globalDefinitions.hpp"

class JavaThread;

// ----------------------------------------------------------------------------
// ThreadShadow - 线程上的 pending exception 存储
// HotSpot: exceptions.hpp 中的 ThreadShadow，JavaThread 继承它
// ----------------------------------------------------------------------------

class ThreadShadow {
public:
    enum { message_buffer_size = 256 };

protected:
    int         _pending_kind;                          // Exceptions::Kind
    char        _exception_message[message_buffer_size];
    const char* _exception_file;
    int         _exception_line;

public:
    ThreadShadow()
        : _pending_kind(0),
          _exception_file(nullptr),
          _exception_line(0) {
        _exception_message[0] = '\0';
    }

    bool has_pending_exception() const { return _pending_kind != 0; }
    int  pending_exception_kind() const { return _pending_kind; }
    const char* exception_message() const { return _exception_message; }
    const char* exception_file() const { return _exception_file; }
    int  exception_line() const { return _exception_line; }

    void set_pending_exception(int kind, const char* message,
                               const char* file, int line);
    void clear_pending_exception();
};

// ----------------------------------------------------------------------------
// Exceptions - 异常种类与抛出入口
// ----------------------------------------------------------------------------

class Exceptions {
public:
    enum Kind {
        _none = 0,
        _io_error,                          // 读失败或字节不足
        _malformed_constant_pool_tag,       // 未知常量池 tag
        _constant_pool_index_out_of_range,  // 索引 0 或越界
        _constant_pool_type_mismatch,       // 条目类型与访问器不符
        _unrecognized_attribute,            // 可恢复，只报告，不抛出
        _unsupported_feature,               // interfaces/fields 或不支持的操作数
        _unimplemented_opcode,
        _attribute_length_mismatch,         // 声明长度与实际消耗不符
        _no_such_method,                    // 入口方法或其 Code 属性缺失
        _operand_stack_error,               // 空栈弹出或操作数类型不对
        number_of_kinds
    };

    // 异常名，例如 "ConstantPoolTypeMismatch"
    static const char* name(int kind);

    // 是否会终止当前运行（_unrecognized_attribute 之外都是）
    static bool is_fatal(int kind) { return kind != _unrecognized_attribute; }

    static void _throw_msg(JavaThread* thread, const char* file, int line,
                           Kind kind, const char* message);

    // printf 风格
    static void fthrow(JavaThread* thread, const char* file, int line,
                       Kind kind, const char* format, ...)
        __attribute__((format(printf, 5, 6)));

    // 打印 pending exception 到 out，形如 "Error: IoError: Truncated class file ..."
    static void print_pending_exception(JavaThread* thread, FILE* out);
};

// ----------------------------------------------------------------------------
// TRAPS / CHECK 宏
// HotSpot: exceptions.hpp 尾部
// ----------------------------------------------------------------------------

#define THREAD                  __the_thread__
#define TRAPS                   JavaThread* THREAD

// 使用这些宏的 .cpp 需要 include "runtime/javaThread.hpp"
#define PENDING_EXCEPTION_KIND  (THREAD->pending_exception_kind())
#define HAS_PENDING_EXCEPTION   (THREAD->has_pending_exception())
#define CLEAR_PENDING_EXCEPTION (THREAD->clear_pending_exception())

#define CHECK                   THREAD); if (HAS_PENDING_EXCEPTION) return       ; (void)(0
#define CHECK_(result)          THREAD); if (HAS_PENDING_EXCEPTION) return result; (void)(0
#define CHECK_0                 CHECK_(0)
#define CHECK_NULL              CHECK_(nullptr)
#define CHECK_false             CHECK_(false)

#define THREAD_AND_LOCATION     THREAD, __FILE__, __LINE__

#define THROW_MSG(kind, msg)                                            \
    { Exceptions::_throw_msg(THREAD_AND_LOCATION, kind, msg); return; }

#define THROW_MSG_(kind, msg, result)                                   \
    { Exceptions::_throw_msg(THREAD_AND_LOCATION, kind, msg); return result; }

#define THROW_MSG_0(kind, msg)     THROW_MSG_(kind, msg, 0)
#define THROW_MSG_NULL(kind, msg)  THROW_MSG_(kind, msg, nullptr)

#endif // SHARE_UTILITIES_EXCEPTIONS_HPP
