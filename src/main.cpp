// ============================================================================
// Pico JVM - 程序入口
// 对照 HotSpot: src/java.base/share/native/launcher/main.c
//             + src/java.base/share/native/libjli/java.c (JavaMain)
//
// 执行链:
//   main() → Arguments::parse() → VM::create_vm()
//          → ClassLoader::load_class_file()
//          → 魔数 / this / super 检查
//          → BytecodeInterpreter::run_main()
//          → VM::destroy_vm()
//
// 任何 pending exception 都在这里打印成 "Error: <种类>: <消息>"，退出码 1。
// ============================================================================

#include "runtime/arguments.hpp"
#include "runtime/vm.hpp"
#include "runtime/javaThread.hpp"
#include "classfile/classLoader.hpp"
#include "interpreter/bytecodeInterpreter.hpp"
#include "oops/instanceKlass.hpp"

#include <cstdio>
#include <cstring>

// 解析后的健全性检查，不属于解析器本身
static bool check_loaded_class(const InstanceKlass* klass, const char* path) {
    if (!klass->has_valid_magic()) {
        fprintf(stderr, "Error: Incompatible magic value 0x%08x in class file %s\n",
                (unsigned)klass->magic(), path);
        return false;
    }

    const char* expected = Arguments::expected_class();
    if (expected != nullptr && strcmp(klass->name(), expected) != 0) {
        fprintf(stderr, "Error: Class file %s defines %s, expected %s\n",
                path, klass->name(), expected);
        return false;
    }

    expected = Arguments::expected_super();
    if (expected != nullptr && strcmp(klass->super_name(), expected) != 0) {
        fprintf(stderr, "Error: Class %s extends %s, expected %s\n",
                klass->name(), klass->super_name(), expected);
        return false;
    }

    return true;
}

int main(int argc, char** argv) {
    // ═══ Step 1: 解析参数 ═══
    if (!Arguments::parse(argc, argv)) {
        bool help = Arguments::help_requested();
        Arguments::print_usage(help ? stdout : stderr);
        return help ? 0 : 1;
    }

    // ═══ Step 2: 创建 VM ═══
    if (!VM::create_vm()) {
        fprintf(stderr, "Error: Could not create the Java Virtual Machine.\n");
        return 1;
    }

    JavaThread* THREAD = VM::main_thread();
    const char* path = Arguments::class_file();
    int status = 0;

    // ═══ Step 3: 加载主类 ═══
    InstanceKlass* klass = ClassLoader::load_class_file(path, THREAD);

    if (HAS_PENDING_EXCEPTION) {
        Exceptions::print_pending_exception(THREAD, stderr);
        status = 1;
    } else if (!check_loaded_class(klass, path)) {
        status = 1;
    } else {
        if (Arguments::verbose()) {
            klass->print_on(stderr);
            fprintf(stderr, "[VM] Calling %s.main()\n", klass->name());
            fprintf(stderr, "----------------------------------------\n");
        }

        // ═══ Step 4: 执行 main ═══
        BytecodeInterpreter::run_main(klass, THREAD);

        if (Arguments::verbose()) {
            fprintf(stderr, "----------------------------------------\n");
        }

        if (HAS_PENDING_EXCEPTION) {
            Exceptions::print_pending_exception(THREAD, stderr);
            status = 1;
        }
    }

    delete klass;

    // ═══ Step 5: 销毁 VM ═══
    VM::destroy_vm();

    return status;
}
