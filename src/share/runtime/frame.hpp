#ifndef SHARE_RUNTIME_FRAME_HPP
#define SHARE_RUNTIME_FRAME_HPP

// ============================================================================
// Pico JVM - 解释器栈帧
// 对应 HotSpot: src/hotspot/share/interpreter/bytecodeInterpreter.hpp 中的状态
//              + src/hotspot/share/runtime/frame.hpp
//
// 一个帧 = 当前方法 + 字节码游标 + 操作数栈 + 常量池。
//
// 没有对象堆，操作数栈上的值是带类型标记的 StackValue：
//   instance  getstatic 压入的"实例标记"，记录字段的类型描述符
//   int       32 位整数
//   float     32 位浮点
//   string    ldc 压入的字符串（指向常量池 Utf8）
//
// 字节码游标就是一个 ClassFileStream，和解析 class 文件用同一套读取逻辑。
// 操作数栈从 max_stack 开始，不够时自动扩容。
// ============================================================================

#include "memory/allocation.hpp"
#include "classfile/classFileStream.hpp"
#include "oops/constantPool.hpp"
#include "oops/method.hpp"

// ============================================================================
// StackValue - 操作数栈条目
// ============================================================================

class StackValue {
public:
    enum Type {
        T_INSTANCE,
        T_INT,
        T_FLOAT,
        T_STRING
    };

private:
    Type _type;
    union {
        jint   i;
        jfloat f;
    } _value;
    const char* _text;     // T_INSTANCE: 类型描述符；T_STRING: 字符串内容

    StackValue(Type type, const char* text) : _type(type), _text(text) {
        _value.i = 0;
    }

public:
    StackValue() : _type(T_INT), _text(nullptr) { _value.i = 0; }

    static StackValue for_instance(const char* descriptor) {
        return StackValue(T_INSTANCE, descriptor);
    }
    static StackValue for_int(jint v) {
        StackValue sv(T_INT, nullptr);
        sv._value.i = v;
        return sv;
    }
    static StackValue for_float(jfloat v) {
        StackValue sv(T_FLOAT, nullptr);
        sv._value.f = v;
        return sv;
    }
    static StackValue for_string(const char* s) {
        return StackValue(T_STRING, s);
    }

    Type type() const { return _type; }
    bool is_instance() const { return _type == T_INSTANCE; }
    bool is_int()      const { return _type == T_INT; }
    bool is_float()    const { return _type == T_FLOAT; }
    bool is_string()   const { return _type == T_STRING; }

    jint        get_int()        const { return _value.i; }
    jfloat      get_float()      const { return _value.f; }
    const char* get_string()     const { return _text; }
    const char* instance_type()  const { return _text; }

    static const char* type_name(Type t) {
        switch (t) {
            case T_INSTANCE: return "instance";
            case T_INT:      return "int";
            case T_FLOAT:    return "float";
            case T_STRING:   return "string";
            default:         return "?";
        }
    }

    void print_on(FILE* out) const;
};

// ============================================================================
// InterpreterFrame - 单个方法的执行上下文
// ============================================================================

class InterpreterFrame : public CHeapObj<mtThread> {
private:
    Method*              _method;
    const CodeAttribute* _code;
    ConstantPool*        _constants;
    ClassFileStream      _bcs;          // 字节码游标

    StackValue*          _stack;
    int                  _sp;           // 下一个空位，0 = 空栈
    int                  _capacity;

public:
    InterpreterFrame(Method* method, const CodeAttribute* code, ConstantPool* cp);
    ~InterpreterFrame();

    Method*              method()    const { return _method; }
    const CodeAttribute* code()      const { return _code; }
    ConstantPool*        constants() const { return _constants; }

    // ======== 字节码游标 ========

    const ClassFileStream* bcs() const { return &_bcs; }
    int bci() const { return _bcs.current_offset(); }
    int code_length() const { return _bcs.length(); }

    // ======== 操作数栈 ========

    int  stack_depth() const { return _sp; }
    int  stack_capacity() const { return _capacity; }
    bool is_stack_empty() const { return _sp == 0; }

    void push(const StackValue& v);

    // 空栈时抛 _operand_stack_error
    StackValue pop(TRAPS);

    // 栈顶往下第 depth 个（0 = 栈顶），不检查
    const StackValue& peek(int depth) const {
        vm_assert(depth >= 0 && depth < _sp, "peek out of bounds");
        return _stack[_sp - 1 - depth];
    }

    void print_stack_on(FILE* out) const;

    NONCOPYABLE(InterpreterFrame);
};

#endif // SHARE_RUNTIME_FRAME_HPP
