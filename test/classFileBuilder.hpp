#ifndef TEST_CLASSFILEBUILDER_HPP
#define TEST_CLASSFILEBUILDER_HPP

// ============================================================================
// Pico JVM - 测试用 class 文件构造器
//
// 在内存里按大端序拼出 class 文件（或其中一段），
// 用来喂给 ClassFileStream / ClassFileParser。
//
//   ClassFileBuilder b;
//   b.put_u4(JAVA_CLASSFILE_MAGIC).put_u2(0).put_u2(55);
//   b.cp_utf8("Main");
//   int at = b.begin_attribute(code_name_index);
//   ...
//   b.end_attribute(at);
// ============================================================================

#include "utilities/globalDefinitions.hpp"
#include "utilities/bytes.hpp"
#include "utilities/constantTag.hpp"
#include "memory/allocation.hpp"

#include <cstring>

class ClassFileBuilder : public StackObj {
private:
    u1* _buffer;
    int _length;
    int _capacity;

    address reserve(int n) {
        if (_length + n > _capacity) {
            int new_capacity = MAX2(_capacity * 2, _length + n);
            _buffer = REALLOC_C_HEAP_ARRAY(u1, _buffer, new_capacity, mtTest);
            _capacity = new_capacity;
        }
        address p = _buffer + _length;
        _length += n;
        return p;
    }

public:
    ClassFileBuilder() : _buffer(nullptr), _length(0), _capacity(64) {
        _buffer = NEW_C_HEAP_ARRAY(u1, _capacity, mtTest);
    }
    ~ClassFileBuilder() { FREE_C_HEAP_ARRAY(u1, _buffer); }

    const u1* buffer() const { return _buffer; }
    int length() const { return _length; }

    // ======== 原始写入 ========

    ClassFileBuilder& put_u1(u1 x) { *reserve(1) = x; return *this; }
    ClassFileBuilder& put_u2(u2 x) { Bytes::put_Java_u2(reserve(2), x); return *this; }
    ClassFileBuilder& put_u4(u4 x) { Bytes::put_Java_u4(reserve(4), x); return *this; }
    ClassFileBuilder& put_u8(u8 x) { Bytes::put_Java_u8(reserve(8), x); return *this; }

    ClassFileBuilder& bytes(const void* data, int n) {
        if (n > 0) memcpy(reserve(n), data, n);
        return *this;
    }

    // u2 长度 + 内容
    ClassFileBuilder& utf8(const char* s) {
        int n = (int)strlen(s);
        put_u2((u2)n);
        return bytes(s, n);
    }

    // 回填之前写下的 u4
    void patch_u4(int offset, u4 x) {
        vm_assert(offset >= 0 && offset + 4 <= _length, "patch out of range");
        Bytes::put_Java_u4(_buffer + offset, x);
    }

    // ======== 常量池条目（tag + payload）========

    ClassFileBuilder& cp_utf8(const char* s) {
        return put_u1(JVM_CONSTANT_Utf8).utf8(s);
    }
    ClassFileBuilder& cp_integer(jint v) {
        return put_u1(JVM_CONSTANT_Integer).put_u4((u4)v);
    }
    ClassFileBuilder& cp_float(jfloat v) {
        u4 bits;
        memcpy(&bits, &v, sizeof(bits));
        return put_u1(JVM_CONSTANT_Float).put_u4(bits);
    }
    ClassFileBuilder& cp_long(jlong v) {
        return put_u1(JVM_CONSTANT_Long).put_u8((u8)v);
    }
    ClassFileBuilder& cp_double(jdouble v) {
        u8 bits;
        memcpy(&bits, &v, sizeof(bits));
        return put_u1(JVM_CONSTANT_Double).put_u8(bits);
    }
    ClassFileBuilder& cp_class(u2 name_index) {
        return put_u1(JVM_CONSTANT_Class).put_u2(name_index);
    }
    ClassFileBuilder& cp_string(u2 utf8_index) {
        return put_u1(JVM_CONSTANT_String).put_u2(utf8_index);
    }
    ClassFileBuilder& cp_member_ref(jbyte tag, u2 class_index, u2 nat_index) {
        return put_u1((u1)tag).put_u2(class_index).put_u2(nat_index);
    }
    ClassFileBuilder& cp_name_and_type(u2 name_index, u2 descriptor_index) {
        return put_u1(JVM_CONSTANT_NameAndType).put_u2(name_index).put_u2(descriptor_index);
    }
    ClassFileBuilder& cp_method_handle(u1 ref_kind, u2 ref_index) {
        return put_u1(JVM_CONSTANT_MethodHandle).put_u1(ref_kind).put_u2(ref_index);
    }
    ClassFileBuilder& cp_method_type(u2 descriptor_index) {
        return put_u1(JVM_CONSTANT_MethodType).put_u2(descriptor_index);
    }
    ClassFileBuilder& cp_invoke_dynamic(u2 bsm_index, u2 nat_index) {
        return put_u1(JVM_CONSTANT_InvokeDynamic).put_u2(bsm_index).put_u2(nat_index);
    }

    // ======== 属性 ========

    // 写 name_index 和占位的 length，返回 length 的偏移
    int begin_attribute(u2 name_index) {
        put_u2(name_index);
        int at = _length;
        put_u4(0);
        return at;
    }

    void end_attribute(int length_offset) {
        patch_u4(length_offset, (u4)(_length - length_offset - 4));
    }

    NONCOPYABLE(ClassFileBuilder);
};

#endif // TEST_CLASSFILEBUILDER_HPP
