// ============================================================================
// Pico JVM - 解释器栈帧实现
// ============================================================================

#include "runtime/frame.hpp"
#include "runtime/javaThread.hpp"

void StackValue::print_on(FILE* out) const {
    switch (_type) {
        case T_INSTANCE: fprintf(out, "instance(%s)", _text); break;
        case T_INT:      fprintf(out, "int(%d)", _value.i); break;
        case T_FLOAT:    fprintf(out, "float(%g)", (double)_value.f); break;
        case T_STRING:   fprintf(out, "string(\"%s\")", _text); break;
        default:         ShouldNotReachHere();
    }
}

InterpreterFrame::InterpreterFrame(Method* method, const CodeAttribute* code,
                                   ConstantPool* cp)
    : _method(method),
      _code(code),
      _constants(cp),
      _bcs(code->code_base(), (int)code->code_length(), method->name()),
      _stack(nullptr),
      _sp(0),
      _capacity(MAX2((int)code->max_stack(), 1)) {
    _stack = NEW_C_HEAP_ARRAY(StackValue, _capacity, mtThread);
}

InterpreterFrame::~InterpreterFrame() {
    FREE_C_HEAP_ARRAY(StackValue, _stack);
}

void InterpreterFrame::push(const StackValue& v) {
    if (_sp == _capacity) {
        // max_stack 只是提示，超出时翻倍
        _capacity *= 2;
        _stack = REALLOC_C_HEAP_ARRAY(StackValue, _stack, _capacity, mtThread);
    }
    _stack[_sp++] = v;
}

StackValue InterpreterFrame::pop(TRAPS) {
    if (_sp == 0) {
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_operand_stack_error,
            "Operand stack underflow in %s%s at bci %d",
            _method->name(), _method->signature(), bci());
        return StackValue();
    }
    return _stack[--_sp];
}

void InterpreterFrame::print_stack_on(FILE* out) const {
    fprintf(out, "[");
    for (int i = 0; i < _sp; i++) {
        if (i > 0) fprintf(out, ", ");
        _stack[i].print_on(out);
    }
    fprintf(out, "]");
}
