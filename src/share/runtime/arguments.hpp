#ifndef SHARE_RUNTIME_ARGUMENTS_HPP
#define SHARE_RUNTIME_ARGUMENTS_HPP

// ============================================================================
// Pico JVM - Arguments（命令行参数解析）
// 对照 HotSpot: src/hotspot/share/runtime/arguments.hpp
//
// 支持的参数:
//   <classfile>              要执行的 .class 文件路径（必需）
//   -verbose                 打印 VM 生命周期信息和解析结果
//   -Xtrace:class            跟踪属性解析
//   -Xtrace:bytecodes        跟踪字节码执行
//   -expect-class <name>     解析后检查 this_class 名
//   -expect-super <name>     解析后检查 super_class 名
//   -help / -h               用法
//
// 用法: ./picojvm [options] <classfile>
// ============================================================================

#include "memory/allocation.hpp"

class Arguments : AllStatic {
public:
    // 对照: Arguments::parse() [arguments.cpp:4261]
    // 返回 false 表示参数有误（已打印原因）或请求了 -help
    static bool parse(int argc, char** argv);

    static void print_usage(FILE* out);

    // 恢复默认值，测试用
    static void reset();

    // ======== 参数值访问 ========

    static const char* class_file()     { return _class_file; }
    static bool verbose()               { return _verbose; }
    static bool trace_class()           { return _trace_class; }
    static bool trace_bytecodes()       { return _trace_bytecodes; }
    static const char* expected_class() { return _expected_class; }
    static const char* expected_super() { return _expected_super; }
    static bool help_requested()        { return _help_requested; }

private:
    static const char* _class_file;
    static bool        _verbose;
    static bool        _trace_class;
    static bool        _trace_bytecodes;
    static const char* _expected_class;
    static const char* _expected_super;
    static bool        _help_requested;

    // 带一个值的选项；缺值时打印错误返回 false
    static bool take_value(int argc, char** argv, int* i, const char** value);
};

#endif // SHARE_RUNTIME_ARGUMENTS_HPP
