// ============================================================================
// Pico JVM - VM 内部异常传播实现
// 对应 HotSpot: src/hotspot/share/utilities/exceptions.cpp
// ============================================================================

#include "utilities/exceptions.hpp"
#include "utilities/debug.hpp"
#include "runtime/javaThread.hpp"
#include <cstdarg>

// ============================================================================
// ThreadShadow
// ============================================================================

void ThreadShadow::set_pending_exception(int kind, const char* message,
                                         const char* file, int line) {
    vm_assert(kind > Exceptions::_none && kind < Exceptions::number_of_kinds,
              "invalid exception kind");
    _pending_kind = kind;
    snprintf(_exception_message, sizeof(_exception_message), "%s",
             message != nullptr ? message : "");
    _exception_file = file;
    _exception_line = line;
}

void ThreadShadow::clear_pending_exception() {
    _pending_kind = Exceptions::_none;
    _exception_message[0] = '\0';
    _exception_file = nullptr;
    _exception_line = 0;
}

// ============================================================================
// Exceptions
// ============================================================================

const char* Exceptions::name(int kind) {
    switch (kind) {
        case _none:                             return "None";
        case _io_error:                         return "IoError";
        case _malformed_constant_pool_tag:      return "MalformedConstantPoolTag";
        case _constant_pool_index_out_of_range: return "ConstantPoolIndexOutOfRange";
        case _constant_pool_type_mismatch:      return "ConstantPoolTypeMismatch";
        case _unrecognized_attribute:           return "UnrecognizedAttribute";
        case _unsupported_feature:              return "UnsupportedFeature";
        case _unimplemented_opcode:             return "UnimplementedOpcode";
        case _attribute_length_mismatch:        return "AttributeLengthMismatch";
        case _no_such_method:                   return "NoSuchMethod";
        case _operand_stack_error:              return "OperandStackError";
        default:                                return "Unknown";
    }
}

void Exceptions::_throw_msg(JavaThread* thread, const char* file, int line,
                            Kind kind, const char* message) {
    guarantee(thread != nullptr, "exception thrown without a thread");
    guarantee(is_fatal(kind), "recoverable conditions are reported, not thrown");

    // 和 HotSpot 一样，已有 pending exception 时保留第一个
    if (thread->has_pending_exception()) {
        return;
    }
    thread->set_pending_exception(kind, message, file, line);
}

void Exceptions::fthrow(JavaThread* thread, const char* file, int line,
                        Kind kind, const char* format, ...) {
    char msg[ThreadShadow::message_buffer_size];
    va_list ap;
    va_start(ap, format);
    vsnprintf(msg, sizeof(msg), format, ap);
    va_end(ap);
    _throw_msg(thread, file, line, kind, msg);
}

void Exceptions::print_pending_exception(JavaThread* thread, FILE* out) {
    if (thread == nullptr || !thread->has_pending_exception()) {
        return;
    }
    fprintf(out, "Error: %s: %s\n",
            name(thread->pending_exception_kind()),
            thread->exception_message());
}
