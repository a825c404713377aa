#ifndef SHARE_RUNTIME_VM_HPP
#define SHARE_RUNTIME_VM_HPP

// ============================================================================
// Pico JVM - VM（虚拟机生命周期管理）
// 对照 HotSpot: Threads::create_vm() [thread.cpp:3876]
//             + Threads::destroy_vm() [thread.cpp:4313]
//
// 启动流程:
//   1. vm_init_globals()  - 基本类型大小检查
//   2. 创建主线程 JavaThread
//   3. init_globals()     - 把 Arguments 里的开关写到各组件
//
// 没有堆、没有类字典，所以 destroy_vm 只需要释放主线程。
// ============================================================================

#include "memory/allocation.hpp"

class JavaThread;

class VM : AllStatic {
public:
    // 对照: Threads::create_vm() [thread.cpp:3876]
    static bool create_vm();

    // 对照: Threads::destroy_vm() [thread.cpp:4313]
    static void destroy_vm();

    static bool is_initialized() { return _initialized; }
    static JavaThread* main_thread() { return _main_thread; }

private:
    static bool _initialized;
    static JavaThread* _main_thread;

    // 对照: vm_init_globals() [init.cpp:90]
    static void vm_init_globals();

    // 对照: init_globals() [init.cpp:104]
    static void init_globals();
};

#endif // SHARE_RUNTIME_VM_HPP
