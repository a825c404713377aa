#include "runtime/vm.hpp"
#include "runtime/arguments.hpp"
#include "runtime/javaThread.hpp"
#include "classfile/classFileParser.hpp"
#include "interpreter/bytecodeInterpreter.hpp"

#include <cstdio>

// ============================================================================
// VM - 虚拟机生命周期管理
// 对照 HotSpot: Threads::create_vm() [thread.cpp:3876]
// ============================================================================

bool        VM::_initialized = false;
JavaThread* VM::_main_thread = nullptr;

bool VM::create_vm() {
    guarantee(!_initialized, "VM already created");

    if (Arguments::verbose()) {
        fprintf(stderr, "========================================\n");
        fprintf(stderr, "  Pico JVM Starting...\n");
        fprintf(stderr, "========================================\n");
    }

    vm_init_globals();

    // 对照: thread.cpp:4018 new JavaThread()
    _main_thread = new JavaThread("main");
    if (Arguments::verbose()) {
        fprintf(stderr, "[VM] Main thread created: %p\n", (void*)_main_thread);
    }

    init_globals();

    _initialized = true;
    if (Arguments::verbose()) {
        fprintf(stderr, "[VM] VM created successfully\n");
    }
    return true;
}

void VM::vm_init_globals() {
    // 对照: globalDefinitions.cpp basic_types_init()
    vm_assert(sizeof(jbyte)  == 1, "jbyte size check");
    vm_assert(sizeof(jshort) == 2, "jshort size check");
    vm_assert(sizeof(jint)   == 4, "jint size check");
    vm_assert(sizeof(jlong)  == 8, "jlong size check");
    vm_assert(sizeof(jfloat) == 4, "jfloat size check");
    vm_assert(sizeof(jdouble)== 8, "jdouble size check");
}

void VM::init_globals() {
    ClassFileParser::_trace_parsing       = Arguments::trace_class();
    BytecodeInterpreter::_trace_bytecodes = Arguments::trace_bytecodes();

    if (Arguments::verbose()) {
        fprintf(stderr, "[VM] init_globals: trace class=%s bytecodes=%s\n",
                ClassFileParser::_trace_parsing ? "on" : "off",
                BytecodeInterpreter::_trace_bytecodes ? "on" : "off");
    }
}

void VM::destroy_vm() {
    if (Arguments::verbose()) {
        fprintf(stderr, "========================================\n");
        fprintf(stderr, "  Pico JVM Shutting down...\n");
        fprintf(stderr, "========================================\n");
    }

    if (_main_thread != nullptr) {
        delete _main_thread;
        _main_thread = nullptr;
    }

    _initialized = false;
}
