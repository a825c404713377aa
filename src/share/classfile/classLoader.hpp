#ifndef SHARE_CLASSFILE_CLASSLOADER_HPP
#define SHARE_CLASSFILE_CLASSLOADER_HPP

// ============================================================================
// Pico JVM - ClassLoader（Bootstrap 类加载器）
// 对照 HotSpot: src/hotspot/share/classfile/classLoader.hpp
//
// HotSpot 的 ClassLoader 在 boot classpath（目录、jar、jimage）里搜索类。
// 这里没有 classpath：命令行直接给出 .class 文件路径。
//
// 加载链:
//   ClassLoader::load_class_file("HelloWorld.class")
//     → 读取整个文件到 C 堆缓冲区
//     → ClassFileStream
//     → ClassFileParser::parse_stream()
//     → InstanceKlass（拷贝了需要的一切，缓冲区随即释放）
// ============================================================================

#include "memory/allocation.hpp"
#include "utilities/exceptions.hpp"

class InstanceKlass;

class ClassLoader : AllStatic {
public:
    // 失败返回 nullptr 并留下 pending exception
    //   打不开 / 读不全 → _io_error
    //   解析错误         → 解析器抛出的种类
    static InstanceKlass* load_class_file(const char* path, TRAPS);

    // 从内存中的字节解析，source 只用于诊断信息
    static InstanceKlass* load_class_from_bytes(const u1* bytes, int length,
                                                const char* source, TRAPS);

private:
    // 返回 NEW_C_HEAP_ARRAY 分配的缓冲区，调用者负责释放
    static u1* read_file(const char* path, int* out_length, TRAPS);
};

#endif // SHARE_CLASSFILE_CLASSLOADER_HPP
