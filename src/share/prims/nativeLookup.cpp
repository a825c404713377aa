// ============================================================================
// Pico JVM - 本地方法表
// 对应 HotSpot: src/hotspot/share/prims/nativeLookup.cpp
//              + src/hotspot/share/prims/jvm.cpp 中的 JVM_ 入口
// ============================================================================

#include "prims/nativeLookup.hpp"
#include "runtime/frame.hpp"
#include "runtime/javaThread.hpp"

#include <string.h>

// ============================================================================
// java/io/PrintStream.println(Ljava/lang/String;)V
//
// 栈布局（栈顶在右）：..., receiver, string
// receiver 是 getstatic 压入的实例标记，没有真正的 PrintStream 对象，
// 所以输出直接写到线程的输出流。
// ============================================================================

static void PrintStream_println_String(InterpreterFrame* frame, TRAPS) {
    // 先把两个操作数都弹出再检查，出错时栈上不留半个调用
    StackValue arg = frame->pop(CHECK);
    StackValue receiver = frame->pop(CHECK);

    if (!arg.is_string()) {
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_operand_stack_error,
            "println(String) expects a string argument, found %s",
            StackValue::type_name(arg.type()));
        return;
    }
    if (!receiver.is_instance()) {
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_operand_stack_error,
            "println(String) expects a PrintStream receiver, found %s",
            StackValue::type_name(receiver.type()));
        return;
    }

    FILE* out = THREAD->output();
    fprintf(out, "%s\n", arg.get_string());
    fflush(out);
}

struct NativeEntry {
    const char*    klass_name;
    const char*    method_name;
    const char*    signature;
    NativeFunction function;
};

static const NativeEntry native_table[] = {
    { "java/io/PrintStream", "println", "(Ljava/lang/String;)V",
      PrintStream_println_String },
};

NativeFunction NativeLookup::lookup(const char* klass_name,
                                    const char* method_name,
                                    const char* signature) {
    for (int i = 0; i < (int)ARRAY_SIZE(native_table); i++) {
        const NativeEntry& e = native_table[i];
        if (strcmp(e.klass_name, klass_name) == 0 &&
            strcmp(e.method_name, method_name) == 0 &&
            strcmp(e.signature, signature) == 0) {
            return e.function;
        }
    }
    return nullptr;
}

int NativeLookup::number_of_natives() {
    return (int)ARRAY_SIZE(native_table);
}

void NativeLookup::print_natives_on(FILE* out) {
    for (int i = 0; i < (int)ARRAY_SIZE(native_table); i++) {
        fprintf(out, "  native %s.%s%s\n", native_table[i].klass_name,
                native_table[i].method_name, native_table[i].signature);
    }
}
