#ifndef SHARE_PRIMS_NATIVELOOKUP_HPP
#define SHARE_PRIMS_NATIVELOOKUP_HPP

// ============================================================================
// Pico JVM - 本地方法绑定
// 对应 HotSpot: src/hotspot/share/prims/nativeLookup.hpp
//
// HotSpot 用 "Java_<类名>_<方法名>" 的符号名在动态库里查找 JNI 函数。
// 这里没有 JNI，也没有 JDK 类库，invokevirtual 的目标直接按
// (类名, 方法名, 描述符) 三元组在一张静态表里查 C++ 实现。
//
// 表里只有一行：
//   java/io/PrintStream.println(Ljava/lang/String;)V
// ============================================================================

#include "memory/allocation.hpp"
#include "utilities/exceptions.hpp"

class InterpreterFrame;

// 本地方法：参数和 receiver 都在调用者的操作数栈上，由实现自己弹出
typedef void (*NativeFunction)(InterpreterFrame* frame, TRAPS);

class NativeLookup : AllStatic {
public:
    // 找不到返回 nullptr
    static NativeFunction lookup(const char* klass_name,
                                 const char* method_name,
                                 const char* signature);

    // 表的行数，仅供测试和 -verbose 输出
    static int  number_of_natives();
    static void print_natives_on(FILE* out);
};

#endif // SHARE_PRIMS_NATIVELOOKUP_HPP
