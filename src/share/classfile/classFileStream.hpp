#ifndef SHARE_CLASSFILE_CLASSFILESTREAM_HPP
#define SHARE_CLASSFILE_CLASSFILESTREAM_HPP

// ============================================================================
// Pico JVM - Class 文件字节流
// 对应 HotSpot: src/hotspot/share/classfile/classFileStream.hpp
//
// 封装一段已在内存中的字节，提供顺序的大端读取。
// 三个地方共用同一个类：
//   1. 整个 .class 文件
//   2. 每个属性的 payload（属性长度圈出的独立子游标）
//   3. 解释器遍历方法字节码
//
// 读取规则：
//   - 每次读取要么拿到全部字节，要么抛 _io_error，绝不返回半截数据
//   - 失败时游标不前移
//   - 流本身不拥有缓冲区
// ============================================================================

#include "utilities/globalDefinitions.hpp"
#include "utilities/debug.hpp"
#include "utilities/bytes.hpp"
#include "utilities/exceptions.hpp"
#include "memory/allocation.hpp"
#include "runtime/javaThread.hpp"

class ClassFileStream {
private:
    const u1* const _buffer_start;   // 缓冲区起始（不可变）
    const u1* const _buffer_end;     // 缓冲区终止（past-the-end，不可变）
    mutable const u1* _current;      // 当前读取位置
    const char* const _source;       // 来源描述（文件路径、属性名等）

public:
    ClassFileStream(const u1* buffer, int length, const char* source)
        : _buffer_start(buffer),
          _buffer_end(buffer + length),
          _current(buffer),
          _source(source) {
        guarantee(buffer != nullptr || length == 0, "buffer must not be null");
        guarantee(length >= 0, "negative stream length");
    }

    // ========== 位置查询 ==========

    const u1* buffer()   const { return _buffer_start; }
    int length()         const { return (int)(_buffer_end - _buffer_start); }
    const u1* current()  const { return _current; }
    const char* source() const { return _source; }

    int current_offset() const { return (int)(_current - _buffer_start); }
    bool at_eos()        const { return _current >= _buffer_end; }
    int remaining()      const { return (int)(_buffer_end - _current); }

    // ========== 边界检查 ==========

    bool check_remaining(int size) const {
        return size >= 0 && (_buffer_end - _current) >= size;
    }

    // HotSpot: guarantee_more(size, CHECK)
    void guarantee_more(int size, TRAPS) const {
        if (!check_remaining(size)) {
            Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_io_error,
                "Truncated class file [source: %s, offset: %d, wanted: %d, remaining: %d]",
                _source != nullptr ? _source : "<unknown>",
                current_offset(), size, remaining());
        }
    }

    // ========== 无符号读取 ==========

    u1 get_u1(TRAPS) const {
        guarantee_more(1, CHECK_0);
        return *_current++;
    }

    u2 get_u2(TRAPS) const {
        guarantee_more(2, CHECK_0);
        const u1* tmp = _current;
        _current += 2;
        return Bytes::get_Java_u2(tmp);
    }

    u4 get_u4(TRAPS) const {
        guarantee_more(4, CHECK_0);
        const u1* tmp = _current;
        _current += 4;
        return Bytes::get_Java_u4(tmp);
    }

    u8 get_u8(TRAPS) const {
        guarantee_more(8, CHECK_0);
        const u1* tmp = _current;
        _current += 8;
        return Bytes::get_Java_u8(tmp);
    }

    // ========== 有符号读取 ==========

    s1 get_s1(TRAPS) const { return (s1)get_u1(THREAD); }
    s2 get_s2(TRAPS) const { return (s2)get_u2(THREAD); }
    s4 get_s4(TRAPS) const { return (s4)get_u4(THREAD); }
    s8 get_s8(TRAPS) const { return (s8)get_u8(THREAD); }

    // ========== IEEE 754 ==========
    // 按位复制，不做数值转换（NaN 的位模式原样保留）

    jfloat get_float(TRAPS) const {
        u4 bits = get_u4(CHECK_0);
        jfloat f;
        memcpy(&f, &bits, sizeof(f));
        return f;
    }

    jdouble get_double(TRAPS) const {
        u8 bits = get_u8(CHECK_0);
        jdouble d;
        memcpy(&d, &bits, sizeof(d));
        return d;
    }

    // ========== 批量读取 ==========

    // 读取恰好 length 字节，返回指向流内部的指针（不复制）
    const u1* get_bytes(int length, TRAPS) const {
        guarantee_more(length, CHECK_NULL);
        const u1* tmp = _current;
        _current += length;
        return tmp;
    }

    // u2 长度前缀 + 字节，返回新分配的 '\0' 结尾字符串，调用者负责释放。
    // 长度前缀和正文都够了才前移游标。
    char* get_utf8(int* out_length, TRAPS) const {
        guarantee_more(2, CHECK_NULL);
        int len = (int)Bytes::get_Java_u2(_current);
        if (!check_remaining(2 + len)) {
            Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_io_error,
                "Truncated class file [source: %s, offset: %d, wanted: %d, remaining: %d]",
                _source != nullptr ? _source : "<unknown>",
                current_offset(), 2 + len, remaining());
            return nullptr;
        }
        char* s = NEW_C_HEAP_ARRAY(char, len + 1, mtClass);
        memcpy(s, _current + 2, len);
        s[len] = '\0';
        _current += 2 + len;
        if (out_length != nullptr) *out_length = len;
        return s;
    }

    void skip_u1(int length, TRAPS) const {
        guarantee_more(length, CHECK);
        _current += length;
    }

    NONCOPYABLE(ClassFileStream);
};

#endif // SHARE_CLASSFILE_CLASSFILESTREAM_HPP
