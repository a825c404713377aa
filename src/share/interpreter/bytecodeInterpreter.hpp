#ifndef SHARE_INTERPRETER_BYTECODEINTERPRETER_HPP
#define SHARE_INTERPRETER_BYTECODEINTERPRETER_HPP

// ============================================================================
// Pico JVM - C++ 字节码解释器
// 对应 HotSpot: src/hotspot/share/interpreter/bytecodeInterpreter.hpp/.cpp
//
// 纯 C++ switch-case 派发，只认三条指令：
//   getstatic      压入字段类型的实例标记（没有堆，不读真正的静态字段）
//   ldc            压入 String 常量
//   invokevirtual  经 NativeLookup 调用本地实现
//
// 执行模型：
//   1. run_main 找到第一个名为 main 的方法，取其 Code 属性
//   2. 创建 InterpreterFrame（字节码游标 + 操作数栈）
//   3. 循环：读操作码 → 派发 → 处理函数自己读操作数
//   4. 游标到达最后一个字节时结束（见 execute 的注释）
//
// 所有失败都以 pending exception 的形式返回给调用者。
// ============================================================================

#include "interpreter/bytecodes.hpp"
#include "runtime/frame.hpp"
#include "runtime/javaThread.hpp"
#include "oops/instanceKlass.hpp"

class BytecodeInterpreter : AllStatic {
public:
    // 入口方法名
    static const char* const entry_point_name;

    // 打印执行的字节码（-Xtrace:bytecodes）
    static bool _trace_bytecodes;

    // 执行 klass 中第一个名为 main 的方法
    //   方法不存在或没有 Code 属性 → _no_such_method
    static void run_main(InstanceKlass* klass, TRAPS);

    // 在已建好的帧上执行，直到字节码结束或出错
    static void execute(InterpreterFrame* frame, TRAPS);

private:
    static void handle_getstatic(InterpreterFrame* frame, TRAPS);
    static void handle_ldc(InterpreterFrame* frame, TRAPS);
    static void handle_invokevirtual(InterpreterFrame* frame, TRAPS);

    static void trace_bytecode(const InterpreterFrame* frame, int bci, u1 opcode);
};

#endif // SHARE_INTERPRETER_BYTECODEINTERPRETER_HPP
