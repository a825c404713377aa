#ifndef SHARE_INTERPRETER_BYTECODES_HPP
#define SHARE_INTERPRETER_BYTECODES_HPP

// ============================================================================
// Pico JVM - 字节码定义
// 对应 HotSpot: src/hotspot/share/interpreter/bytecodes.hpp
//
// 解释器只执行三条指令：getstatic、ldc、invokevirtual。
// 其余标准字节码只用于诊断（trace 和"未实现指令"报错里的助记符）。
// ============================================================================

#include "utilities/globalDefinitions.hpp"

class Bytecodes {
public:
    enum Code {
        _illegal       = -1,

        _nop           = 0x00,
        _iconst_0      = 0x03,
        _bipush        = 0x10,
        _ldc           = 0x12,
        _ldc_w         = 0x13,
        _aload_0       = 0x2A,
        _pop           = 0x57,
        _return        = 0xB1,
        _getstatic     = 0xB2,
        _putstatic     = 0xB3,
        _invokevirtual = 0xB6,
        _invokespecial = 0xB7,
        _invokestatic  = 0xB8,
        _breakpoint    = 0xCA,

        number_of_java_codes = 0xCB
    };

    // JVMS 定义的字节码（0x00 ~ 0xCA）
    static bool is_defined(int code) {
        return code >= 0 && code < number_of_java_codes;
    }

    // 助记符；未定义的值返回 "<illegal>"
    static const char* name(int code);
};

#endif // SHARE_INTERPRETER_BYTECODES_HPP
