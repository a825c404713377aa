#ifndef SHARE_UTILITIES_CONSTANTTAG_HPP
#define SHARE_UTILITIES_CONSTANTTAG_HPP

// ============================================================================
// Pico JVM - 常量池标签定义
// 对应 HotSpot: src/hotspot/share/utilities/constantTag.hpp
//              + classfile_constants.h.template
//
// 常量池每个条目以一个 tag 字节开头（JVMS §4.4）。
// 我们只接受下表列出的 14 种，其它值（包括 2、13、14、17）都是坏 tag。
// 与 HotSpot 不同，这里没有 UnresolvedClass 之类的内部状态标签：
// 条目构建后不再改变。
// ============================================================================

#include "utilities/globalDefinitions.hpp"

enum {
    JVM_CONSTANT_Invalid            = 0,   // 空条目，不会出现在 class 文件中
    JVM_CONSTANT_Utf8               = 1,
    JVM_CONSTANT_Integer            = 3,
    JVM_CONSTANT_Float              = 4,
    JVM_CONSTANT_Long               = 5,
    JVM_CONSTANT_Double             = 6,
    JVM_CONSTANT_Class              = 7,
    JVM_CONSTANT_String             = 8,
    JVM_CONSTANT_Fieldref           = 9,
    JVM_CONSTANT_Methodref          = 10,
    JVM_CONSTANT_InterfaceMethodref = 11,
    JVM_CONSTANT_NameAndType        = 12,
    JVM_CONSTANT_MethodHandle       = 15,
    JVM_CONSTANT_MethodType         = 16,
    JVM_CONSTANT_InvokeDynamic      = 18
};

// ----------------------------------------------------------------------------
// constantTag - 标签的包装类
// ----------------------------------------------------------------------------

class constantTag {
private:
    jbyte _tag;

public:
    constantTag() : _tag(JVM_CONSTANT_Invalid) {}
    constantTag(jbyte tag) : _tag(tag) {}

    bool is_klass()             const { return _tag == JVM_CONSTANT_Class; }
    bool is_field()             const { return _tag == JVM_CONSTANT_Fieldref; }
    bool is_method()            const { return _tag == JVM_CONSTANT_Methodref; }
    bool is_interface_method()  const { return _tag == JVM_CONSTANT_InterfaceMethodref; }
    bool is_string()            const { return _tag == JVM_CONSTANT_String; }
    bool is_int()               const { return _tag == JVM_CONSTANT_Integer; }
    bool is_float()             const { return _tag == JVM_CONSTANT_Float; }
    bool is_long()              const { return _tag == JVM_CONSTANT_Long; }
    bool is_double()            const { return _tag == JVM_CONSTANT_Double; }
    bool is_name_and_type()     const { return _tag == JVM_CONSTANT_NameAndType; }
    bool is_utf8()              const { return _tag == JVM_CONSTANT_Utf8; }
    bool is_method_handle()     const { return _tag == JVM_CONSTANT_MethodHandle; }
    bool is_method_type()       const { return _tag == JVM_CONSTANT_MethodType; }
    bool is_invoke_dynamic()    const { return _tag == JVM_CONSTANT_InvokeDynamic; }
    bool is_invalid()           const { return _tag == JVM_CONSTANT_Invalid; }

    // Fieldref / Methodref / InterfaceMethodref 共用 {class_index, name_and_type_index}
    bool is_field_or_method() const {
        return is_field() || is_method() || is_interface_method();
    }

    // 是否是 class 文件中合法的 tag
    static bool is_valid_tag(u1 tag) {
        switch (tag) {
            case JVM_CONSTANT_Utf8:
            case JVM_CONSTANT_Integer:
            case JVM_CONSTANT_Float:
            case JVM_CONSTANT_Long:
            case JVM_CONSTANT_Double:
            case JVM_CONSTANT_Class:
            case JVM_CONSTANT_String:
            case JVM_CONSTANT_Fieldref:
            case JVM_CONSTANT_Methodref:
            case JVM_CONSTANT_InterfaceMethodref:
            case JVM_CONSTANT_NameAndType:
            case JVM_CONSTANT_MethodHandle:
            case JVM_CONSTANT_MethodType:
            case JVM_CONSTANT_InvokeDynamic:
                return true;
            default:
                return false;
        }
    }

    jbyte value() const { return _tag; }

    const char* to_string() const {
        switch (_tag) {
            case JVM_CONSTANT_Invalid:            return "Invalid";
            case JVM_CONSTANT_Utf8:               return "Utf8";
            case JVM_CONSTANT_Integer:            return "Integer";
            case JVM_CONSTANT_Float:              return "Float";
            case JVM_CONSTANT_Long:               return "Long";
            case JVM_CONSTANT_Double:             return "Double";
            case JVM_CONSTANT_Class:              return "Class";
            case JVM_CONSTANT_String:             return "String";
            case JVM_CONSTANT_Fieldref:           return "Fieldref";
            case JVM_CONSTANT_Methodref:          return "Methodref";
            case JVM_CONSTANT_InterfaceMethodref: return "InterfaceMethodref";
            case JVM_CONSTANT_NameAndType:        return "NameAndType";
            case JVM_CONSTANT_MethodHandle:       return "MethodHandle";
            case JVM_CONSTANT_MethodType:         return "MethodType";
            case JVM_CONSTANT_InvokeDynamic:      return "InvokeDynamic";
            default:                              return "Unknown";
        }
    }
};

#endif // SHARE_UTILITIES_CONSTANTTAG_HPP
