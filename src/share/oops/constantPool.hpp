#ifndef SHARE_OOPS_CONSTANTPOOL_HPP
#define SHARE_OOPS_CONSTANTPOOL_HPP

// ============================================================================
// Pico JVM - 常量池
// 对应 HotSpot: src/hotspot/share/oops/constantPool.hpp
//
// 常量池保存类中所有的字面量和符号引用，整个 class 文件通过索引引用它。
//
// 存储与索引：
//   - class 文件中的索引从 1 开始；0 永远非法
//   - 内部数组从 0 开始存放，公共访问器在边界处减 1
//   - 条目数 = constant_pool_count - 1，Long/Double 也只占一个位置
//     （class 文件格式本来给它们留两个索引，我们按顺序编号，不留空位）
//
// 条目在解析时写入一次，之后只读：
//   解析器在解析属性时用它查属性名，解释器用它解析操作数。
// ============================================================================

#include "memory/allocation.hpp"
#include "utilities/constantTag.hpp"
#include "utilities/exceptions.hpp"

// ============================================================================
// ConstantPoolEntry - 一个带 tag 的常量池条目
//
// 两个 u2 索引字段按 tag 解释：
//   Class              _index1 = name_index
//   String             _index1 = string_index
//   Field/Method/IMref _index1 = class_index,     _index2 = name_and_type_index
//   NameAndType        _index1 = name_index,      _index2 = descriptor_index
//   MethodHandle       _index1 = reference_kind,  _index2 = reference_index
//   MethodType         _index1 = descriptor_index
//   InvokeDynamic      _index1 = bootstrap_method_attr_index,
//                      _index2 = name_and_type_index
// ============================================================================

class ConstantPoolEntry {
    friend class ConstantPool;

private:
    jbyte _tag;
    u2    _index1;
    u2    _index2;
    union {
        jint    i;
        jfloat  f;
        jlong   l;
        jdouble d;
    } _value;
    char* _utf8;          // Utf8 内容，'\0' 结尾，由 ConstantPool 释放
    int   _utf8_length;   // 字节数（不含 '\0'）

public:
    ConstantPoolEntry()
        : _tag(JVM_CONSTANT_Invalid), _index1(0), _index2(0),
          _utf8(nullptr), _utf8_length(0) {
        _value.l = 0;
    }

    constantTag tag() const { return constantTag(_tag); }

    jint        int_value()    const { return _value.i; }
    jfloat      float_value()  const { return _value.f; }
    jlong       long_value()   const { return _value.l; }
    jdouble     double_value() const { return _value.d; }
    const char* utf8_value()   const { return _utf8; }
    int         utf8_length()  const { return _utf8_length; }
    u2          index1()       const { return _index1; }
    u2          index2()       const { return _index2; }
};

// ============================================================================
// ConstantPool
// ============================================================================

class ConstantPool : public CHeapObj<mtClass> {
private:
    ConstantPoolEntry* _entries;   // 0-based 存储
    int                _length;    // 条目个数 (constant_pool_count - 1)

    // 写入用，index 为 1-based
    ConstantPoolEntry* slot_at_put(int index, jbyte tag) {
        guarantee(index >= 1 && index <= _length, "constant pool write out of range");
        ConstantPoolEntry* e = &_entries[index - 1];
        guarantee(e->_tag == JVM_CONSTANT_Invalid, "constant pool entry written twice");
        e->_tag = tag;
        return e;
    }

public:
    explicit ConstantPool(int length);
    ~ConstantPool();

    // 条目个数；合法索引是 [1, length()]
    int length() const { return _length; }

    bool is_within_bounds(int index) const {
        return index >= 1 && index <= _length;
    }

    // 不检查类型的 tag 查询，越界返回 Invalid
    constantTag tag_at(int index) const {
        return is_within_bounds(index) ? _entries[index - 1].tag() : constantTag();
    }

    // ========== 写入方法（解析时使用）==========

    // 接管 utf8 的所有权（C 堆分配）
    void utf8_at_put(int index, char* utf8, int utf8_length) {
        ConstantPoolEntry* e = slot_at_put(index, JVM_CONSTANT_Utf8);
        e->_utf8 = utf8;
        e->_utf8_length = utf8_length;
    }

    void int_at_put(int index, jint value) {
        slot_at_put(index, JVM_CONSTANT_Integer)->_value.i = value;
    }

    void float_at_put(int index, jfloat value) {
        slot_at_put(index, JVM_CONSTANT_Float)->_value.f = value;
    }

    void long_at_put(int index, jlong value) {
        slot_at_put(index, JVM_CONSTANT_Long)->_value.l = value;
    }

    void double_at_put(int index, jdouble value) {
        slot_at_put(index, JVM_CONSTANT_Double)->_value.d = value;
    }

    void klass_index_at_put(int index, u2 name_index) {
        slot_at_put(index, JVM_CONSTANT_Class)->_index1 = name_index;
    }

    void string_index_at_put(int index, u2 string_index) {
        slot_at_put(index, JVM_CONSTANT_String)->_index1 = string_index;
    }

    // Fieldref / Methodref / InterfaceMethodref
    void member_ref_at_put(int index, jbyte tag, u2 class_index, u2 name_and_type_index) {
        vm_assert(constantTag(tag).is_field_or_method(), "not a member ref tag");
        ConstantPoolEntry* e = slot_at_put(index, tag);
        e->_index1 = class_index;
        e->_index2 = name_and_type_index;
    }

    void name_and_type_at_put(int index, u2 name_index, u2 signature_index) {
        ConstantPoolEntry* e = slot_at_put(index, JVM_CONSTANT_NameAndType);
        e->_index1 = name_index;
        e->_index2 = signature_index;
    }

    void method_handle_index_at_put(int index, u1 ref_kind, u2 ref_index) {
        ConstantPoolEntry* e = slot_at_put(index, JVM_CONSTANT_MethodHandle);
        e->_index1 = ref_kind;
        e->_index2 = ref_index;
    }

    void method_type_index_at_put(int index, u2 signature_index) {
        slot_at_put(index, JVM_CONSTANT_MethodType)->_index1 = signature_index;
    }

    void invoke_dynamic_at_put(int index, u2 bootstrap_method_attr_index,
                               u2 name_and_type_index) {
        ConstantPoolEntry* e = slot_at_put(index, JVM_CONSTANT_InvokeDynamic);
        e->_index1 = bootstrap_method_attr_index;
        e->_index2 = name_and_type_index;
    }

    // ========== 读取方法 ==========
    // 所有索引都是 1-based；越界抛 _constant_pool_index_out_of_range，
    // 类型不符抛 _constant_pool_type_mismatch。

    const ConstantPoolEntry* entry_at(int index, TRAPS) const;
    const ConstantPoolEntry* checked_entry_at(int index, jbyte expected, TRAPS) const;

    const char* utf8_at(int index, TRAPS) const;

    // Class -> name_index -> Utf8
    const char* klass_name_at(int index, TRAPS) const;

    // NameAndType -> (name Utf8, descriptor Utf8)
    void name_and_type_at(int index, const char** name, const char** signature,
                          TRAPS) const;

    // String -> string_index -> Utf8
    const char* string_at(int index, TRAPS) const;

    // Fieldref/Methodref/InterfaceMethodref -> (class name, name, descriptor)
    void member_ref_at(int index, jbyte expected, const char** klass_name,
                       const char** name, const char** signature, TRAPS) const;

    // ---------- 各条目的原始字段 ----------

    jint    int_at(int index, TRAPS) const;
    jfloat  float_at(int index, TRAPS) const;
    jlong   long_at(int index, TRAPS) const;
    jdouble double_at(int index, TRAPS) const;

    u2 klass_name_index_at(int index, TRAPS) const;
    u2 string_index_at(int index, TRAPS) const;

    // Fieldref/Methodref/InterfaceMethodref 的 class_index
    u2 klass_ref_index_at(int index, TRAPS) const;
    // Fieldref/Methodref/InterfaceMethodref/InvokeDynamic 的 name_and_type_index
    u2 name_and_type_ref_index_at(int index, TRAPS) const;

    u2 name_ref_index_at(int index, TRAPS) const;        // NameAndType.name_index
    u2 signature_ref_index_at(int index, TRAPS) const;   // NameAndType.descriptor_index

    u1 method_handle_ref_kind_at(int index, TRAPS) const;
    u2 method_handle_index_at(int index, TRAPS) const;
    u2 method_type_index_at(int index, TRAPS) const;
    u2 bootstrap_method_attr_index_at(int index, TRAPS) const;

    // ========== 调试打印 ==========

    void print_on(FILE* out) const;

    NONCOPYABLE(ConstantPool);
};

#endif // SHARE_OOPS_CONSTANTPOOL_HPP
