// ============================================================================
// Pico JVM - C++ 字节码解释器实现
// 对应 HotSpot: src/hotspot/share/interpreter/bytecodeInterpreter.cpp
// ============================================================================

#include "interpreter/bytecodeInterpreter.hpp"
#include "prims/nativeLookup.hpp"

const char* const BytecodeInterpreter::entry_point_name = "main";

bool BytecodeInterpreter::_trace_bytecodes = false;

// ============================================================================
// run_main() - 外部入口
// ============================================================================

void BytecodeInterpreter::run_main(InstanceKlass* klass, TRAPS) {
    guarantee(klass != nullptr, "klass must not be null");

    Method* method = klass->find_method(entry_point_name);
    if (method == nullptr) {
        THROW_MSG(Exceptions::_no_such_method,
                  "Entry point 'main' not found");
    }

    const CodeAttribute* code = method->code();
    if (code == nullptr) {
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_no_such_method,
            "Method %s%s has no Code attribute",
            method->name(), method->signature());
        return;
    }

    if (_trace_bytecodes) {
        fprintf(stderr, "[Interpreter] Executing %s.%s%s (code_length=%u, max_stack=%u)\n",
                klass->name(), method->name(), method->signature(),
                (unsigned)code->code_length(), (unsigned)code->max_stack());
    }

    THREAD->set_current_method(method);

    InterpreterFrame frame(method, code, klass->constants());
    execute(&frame, THREAD);

    THREAD->set_current_method(nullptr);

    if (_trace_bytecodes && !HAS_PENDING_EXCEPTION) {
        fprintf(stderr, "[Interpreter] %s finished, stack depth %d\n",
                method->name(), frame.stack_depth());
    }
}

// ============================================================================
// execute() - 核心执行循环
//
// 对应 HotSpot: BytecodeInterpreter::run(interpreterState istate)
//
// 循环条件是 bci < code_length - 1：最后一个字节永远不会被派发。
// javac 生成的 main 以单字节 return 结尾，正好被跳过；
// 没有建模 return 指令，方法只能"走到头"结束。
// ============================================================================

void BytecodeInterpreter::execute(InterpreterFrame* frame, TRAPS) {
    const ClassFileStream* bcs = frame->bcs();

    while (frame->bci() < frame->code_length() - 1) {
        int bci = frame->bci();
        u1 opcode = bcs->get_u1(CHECK);

        if (_trace_bytecodes) {
            trace_bytecode(frame, bci, opcode);
        }

        switch (opcode) {
            case Bytecodes::_getstatic:
                handle_getstatic(frame, CHECK);
                break;

            case Bytecodes::_ldc:
                handle_ldc(frame, CHECK);
                break;

            case Bytecodes::_invokevirtual:
                handle_invokevirtual(frame, CHECK);
                break;

            default:
                // 操作数宽度因指令而异，不尝试跳过
                Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_unimplemented_opcode,
                    "Unimplemented opcode 0x%02x (%s) at bci %d in %s%s",
                    opcode, Bytecodes::name(opcode), bci,
                    frame->method()->name(), frame->method()->signature());
                return;
        }
    }
}

void BytecodeInterpreter::trace_bytecode(const InterpreterFrame* frame, int bci, u1 opcode) {
    fprintf(stderr, "  [%3d] %-16s sp=%d\n", bci, Bytecodes::name(opcode),
            frame->stack_depth());
}

// ============================================================================
// getstatic - 压入字段类型的实例标记
//
// 类名只做解析校验。没有类加载和对象堆，System.out 这样的字段
// 被表示成一个带描述符的标记，供后面的 invokevirtual 当 receiver。
// ============================================================================

void BytecodeInterpreter::handle_getstatic(InterpreterFrame* frame, TRAPS) {
    u2 cp_index = frame->bcs()->get_u2(CHECK);

    const char* klass_name = nullptr;
    const char* field_name = nullptr;
    const char* field_sig  = nullptr;
    frame->constants()->member_ref_at(cp_index, JVM_CONSTANT_Fieldref,
                                      &klass_name, &field_name, &field_sig, CHECK);

    if (_trace_bytecodes) {
        fprintf(stderr, "  [GETSTATIC] %s.%s:%s (cp#%d)\n",
                klass_name, field_name, field_sig, cp_index);
    }

    frame->push(StackValue::for_instance(field_sig));
}

// ============================================================================
// ldc - 只支持 String 常量
// ============================================================================

void BytecodeInterpreter::handle_ldc(InterpreterFrame* frame, TRAPS) {
    u1 cp_index = frame->bcs()->get_u1(CHECK);
    ConstantPool* cp = frame->constants();

    const ConstantPoolEntry* entry = cp->entry_at(cp_index, CHECK);
    if (!entry->tag().is_string()) {
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_unsupported_feature,
            "ldc of %s constant (cp#%d) is not supported",
            entry->tag().to_string(), cp_index);
        return;
    }

    const char* text = cp->string_at(cp_index, CHECK);

    if (_trace_bytecodes) {
        fprintf(stderr, "  [LDC] \"%s\" (cp#%d)\n", text, cp_index);
    }

    frame->push(StackValue::for_string(text));
}

// ============================================================================
// invokevirtual - 只调用本地方法表里的实现
// ============================================================================

void BytecodeInterpreter::handle_invokevirtual(InterpreterFrame* frame, TRAPS) {
    u2 cp_index = frame->bcs()->get_u2(CHECK);

    const char* klass_name  = nullptr;
    const char* method_name = nullptr;
    const char* method_sig  = nullptr;
    frame->constants()->member_ref_at(cp_index, JVM_CONSTANT_Methodref,
                                      &klass_name, &method_name, &method_sig, CHECK);

    if (_trace_bytecodes) {
        fprintf(stderr, "  [INVOKEVIRTUAL] %s.%s%s (cp#%d)\n",
                klass_name, method_name, method_sig, cp_index);
    }

    NativeFunction native = NativeLookup::lookup(klass_name, method_name, method_sig);
    if (native == nullptr) {
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_unsupported_feature,
            "Unimplemented native method %s.%s%s",
            klass_name, method_name, method_sig);
        return;
    }

    native(frame, THREAD);
}
