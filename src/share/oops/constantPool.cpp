// ============================================================================
// Pico JVM - 常量池实现
// 对应 HotSpot: src/hotspot/share/oops/constantPool.cpp
// ============================================================================

#include "oops/constantPool.hpp"
#include "runtime/javaThread.hpp"
#include <new>

ConstantPool::ConstantPool(int length)
    : _entries(nullptr),
      _length(length) {
    guarantee(length >= 0, "negative constant pool length");
    _entries = NEW_C_HEAP_ARRAY(ConstantPoolEntry, length, mtClass);
    for (int i = 0; i < length; i++) {
        new (&_entries[i]) ConstantPoolEntry();
    }
}

ConstantPool::~ConstantPool() {
    for (int i = 0; i < _length; i++) {
        if (_entries[i]._utf8 != nullptr) {
            FREE_C_HEAP_ARRAY(char, _entries[i]._utf8);
        }
    }
    FREE_C_HEAP_ARRAY(ConstantPoolEntry, _entries);
}

// ============================================================================
// 条目访问
// ============================================================================

const ConstantPoolEntry* ConstantPool::entry_at(int index, TRAPS) const {
    if (!is_within_bounds(index)) {
        Exceptions::fthrow(THREAD_AND_LOCATION,
            Exceptions::_constant_pool_index_out_of_range,
            "Constant pool index %d out of range [1, %d]", index, _length);
        return nullptr;
    }
    // 1-based -> 0-based
    return &_entries[index - 1];
}

const ConstantPoolEntry* ConstantPool::checked_entry_at(int index, jbyte expected,
                                                        TRAPS) const {
    const ConstantPoolEntry* e = entry_at(index, CHECK_NULL);
    if (e->_tag != expected) {
        Exceptions::fthrow(THREAD_AND_LOCATION,
            Exceptions::_constant_pool_type_mismatch,
            "Constant pool entry #%d is %s, expected %s",
            index, e->tag().to_string(), constantTag(expected).to_string());
        return nullptr;
    }
    return e;
}

const char* ConstantPool::utf8_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_Utf8, CHECK_NULL);
    return e->_utf8;
}

const char* ConstantPool::klass_name_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_Class, CHECK_NULL);
    return utf8_at(e->_index1, THREAD);
}

void ConstantPool::name_and_type_at(int index, const char** name,
                                    const char** signature, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_NameAndType, CHECK);
    const char* n = utf8_at(e->_index1, CHECK);
    const char* s = utf8_at(e->_index2, CHECK);
    *name = n;
    *signature = s;
}

const char* ConstantPool::string_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_String, CHECK_NULL);
    return utf8_at(e->_index1, THREAD);
}

void ConstantPool::member_ref_at(int index, jbyte expected, const char** klass_name,
                                 const char** name, const char** signature,
                                 TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, expected, CHECK);
    const char* k = klass_name_at(e->_index1, CHECK);
    const char* n = nullptr;
    const char* s = nullptr;
    name_and_type_at(e->_index2, &n, &s, CHECK);
    *klass_name = k;
    *name = n;
    *signature = s;
}

// ============================================================================
// 原始字段
// ============================================================================

jint ConstantPool::int_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_Integer, CHECK_0);
    return e->_value.i;
}

jfloat ConstantPool::float_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_Float, CHECK_0);
    return e->_value.f;
}

jlong ConstantPool::long_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_Long, CHECK_0);
    return e->_value.l;
}

jdouble ConstantPool::double_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_Double, CHECK_0);
    return e->_value.d;
}

u2 ConstantPool::klass_name_index_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_Class, CHECK_0);
    return e->_index1;
}

u2 ConstantPool::string_index_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_String, CHECK_0);
    return e->_index1;
}

u2 ConstantPool::klass_ref_index_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = entry_at(index, CHECK_0);
    if (!e->tag().is_field_or_method()) {
        Exceptions::fthrow(THREAD_AND_LOCATION,
            Exceptions::_constant_pool_type_mismatch,
            "Constant pool entry #%d is %s, expected a field or method reference",
            index, e->tag().to_string());
        return 0;
    }
    return e->_index1;
}

u2 ConstantPool::name_and_type_ref_index_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = entry_at(index, CHECK_0);
    if (!e->tag().is_field_or_method() && !e->tag().is_invoke_dynamic()) {
        Exceptions::fthrow(THREAD_AND_LOCATION,
            Exceptions::_constant_pool_type_mismatch,
            "Constant pool entry #%d is %s, expected an entry with a NameAndType",
            index, e->tag().to_string());
        return 0;
    }
    return e->_index2;
}

u2 ConstantPool::name_ref_index_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_NameAndType, CHECK_0);
    return e->_index1;
}

u2 ConstantPool::signature_ref_index_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_NameAndType, CHECK_0);
    return e->_index2;
}

u1 ConstantPool::method_handle_ref_kind_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_MethodHandle, CHECK_0);
    return (u1)e->_index1;
}

u2 ConstantPool::method_handle_index_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_MethodHandle, CHECK_0);
    return e->_index2;
}

u2 ConstantPool::method_type_index_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_MethodType, CHECK_0);
    return e->_index1;
}

u2 ConstantPool::bootstrap_method_attr_index_at(int index, TRAPS) const {
    const ConstantPoolEntry* e = checked_entry_at(index, JVM_CONSTANT_InvokeDynamic, CHECK_0);
    return e->_index1;
}

// ============================================================================
// 调试打印（javap -v 风格）
// 间接引用只在目标确实是 Utf8 时才附带注释
// ============================================================================

void ConstantPool::print_on(FILE* out) const {
    fprintf(out, "Constant pool [%d entries]:\n", _length);

    for (int i = 1; i <= _length; i++) {
        const ConstantPoolEntry& e = _entries[i - 1];
        fprintf(out, "  #%-4d = %-18s ", i, e.tag().to_string());

        switch (e._tag) {
            case JVM_CONSTANT_Utf8:
                fprintf(out, "%s", e._utf8);
                break;

            case JVM_CONSTANT_Integer:
                fprintf(out, "%d", e._value.i);
                break;

            case JVM_CONSTANT_Float:
                fprintf(out, "%ff", (double)e._value.f);
                break;

            case JVM_CONSTANT_Long:
                fprintf(out, "%ldl", e._value.l);
                break;

            case JVM_CONSTANT_Double:
                fprintf(out, "%fd", e._value.d);
                break;

            case JVM_CONSTANT_Class:
            case JVM_CONSTANT_String:
            case JVM_CONSTANT_MethodType:
                fprintf(out, "#%d", e._index1);
                if (tag_at(e._index1).is_utf8()) {
                    fprintf(out, "  // %s", _entries[e._index1 - 1]._utf8);
                }
                break;

            case JVM_CONSTANT_Fieldref:
            case JVM_CONSTANT_Methodref:
            case JVM_CONSTANT_InterfaceMethodref:
                fprintf(out, "#%d.#%d", e._index1, e._index2);
                break;

            case JVM_CONSTANT_NameAndType:
                fprintf(out, "#%d:#%d", e._index1, e._index2);
                if (tag_at(e._index1).is_utf8() && tag_at(e._index2).is_utf8()) {
                    fprintf(out, "  // %s:%s",
                            _entries[e._index1 - 1]._utf8,
                            _entries[e._index2 - 1]._utf8);
                }
                break;

            case JVM_CONSTANT_MethodHandle:
                fprintf(out, "kind=%d, #%d", e._index1, e._index2);
                break;

            case JVM_CONSTANT_InvokeDynamic:
                fprintf(out, "bsm=#%d, #%d", e._index1, e._index2);
                break;

            default:
                fprintf(out, "(empty)");
                break;
        }

        fprintf(out, "\n");
    }
}
