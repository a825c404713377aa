#include "classfile/classLoader.hpp"
#include "classfile/classFileStream.hpp"
#include "classfile/classFileParser.hpp"
#include "oops/instanceKlass.hpp"
#include "runtime/javaThread.hpp"

#include <cstdio>
#include <cstring>
#include <cerrno>
#include <climits>

// ============================================================================
// ClassLoader - Bootstrap 类加载器
// 对照 HotSpot: src/hotspot/share/classfile/classLoader.cpp
// ============================================================================

InstanceKlass* ClassLoader::load_class_file(const char* path, TRAPS) {
    guarantee(path != nullptr, "path must not be null");

    int file_length = 0;
    u1* buffer = read_file(path, &file_length, CHECK_NULL);

    if (ClassFileParser::_trace_parsing) {
        fprintf(stderr, "[Load] %s (%d bytes)\n", path, file_length);
    }

    InstanceKlass* klass = load_class_from_bytes(buffer, file_length, path, THREAD);

    // 解析器把需要的内容都拷贝走了，无论成败都可以释放
    FREE_C_HEAP_ARRAY(u1, buffer);
    return klass;
}

InstanceKlass* ClassLoader::load_class_from_bytes(const u1* bytes, int length,
                                                  const char* source, TRAPS) {
    // 对照: KlassFactory::create_from_stream() [klassFactory.cpp:166]
    ClassFileStream stream(bytes, length, source);
    ClassFileParser parser(&stream);
    return parser.parse_stream(THREAD);
}

u1* ClassLoader::read_file(const char* path, int* out_length, TRAPS) {
    FILE* f = fopen(path, "rb");
    if (f == nullptr) {
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_io_error,
            "Cannot open class file %s: %s", path, strerror(errno));
        return nullptr;
    }

    long size = -1;
    if (fseek(f, 0, SEEK_END) == 0) {
        size = ftell(f);
    }
    if (size < 0 || fseek(f, 0, SEEK_SET) != 0) {
        fclose(f);
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_io_error,
            "Cannot determine size of class file %s", path);
        return nullptr;
    }

    // ClassFileStream 以 int 计长度
    if (size > INT_MAX) {
        fclose(f);
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_io_error,
            "Class file %s is too large (%ld bytes)", path, size);
        return nullptr;
    }

    u1* buffer = NEW_C_HEAP_ARRAY(u1, size, mtClass);
    size_t read = fread(buffer, 1, (size_t)size, f);
    bool failed = ferror(f) != 0;
    fclose(f);

    if (failed || (long)read != size) {
        FREE_C_HEAP_ARRAY(u1, buffer);
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_io_error,
            "Short read on class file %s: got %ld of %ld bytes",
            path, (long)read, size);
        return nullptr;
    }

    *out_length = (int)size;
    return buffer;
}
