#ifndef SHARE_OOPS_METHOD_HPP
#define SHARE_OOPS_METHOD_HPP

// ============================================================================
// Pico JVM - Method（方法元数据）
// 对应 HotSpot: src/hotspot/share/oops/method.hpp
//
// method_info {
//     u2             access_flags;
//     u2             name_index;
//     u2             descriptor_index;
//     u2             attributes_count;
//     attribute_info attributes[attributes_count];
// }
//
// HotSpot 把方法拆成 Method（可变）+ ConstMethod（不可变）。
// 我们只解释执行一个入口方法，不需要这种拆分：
// Method 直接持有解析出的属性，字节码在 Code 属性里。
// ============================================================================

#include "memory/allocation.hpp"
#include "utilities/accessFlags.hpp"
#include "oops/attributeInfo.hpp"

class InstanceKlass;

class Method : public CHeapObj<mtClass> {
private:
    AccessFlags     _access_flags;
    u2              _name_index;
    u2              _signature_index;
    const char*     _name;              // 指向常量池 Utf8
    const char*     _signature;
    AttributeArray* _attributes;        // 拥有
    InstanceKlass*  _method_holder;

public:
    Method(u2 access_flags, u2 name_index, u2 signature_index,
           const char* name, const char* signature,
           AttributeArray* attributes)
        : _access_flags(access_flags, AccessFlags::method_flags),
          _name_index(name_index),
          _signature_index(signature_index),
          _name(name),
          _signature(signature),
          _attributes(attributes),
          _method_holder(nullptr) {}

    ~Method() { delete _attributes; }

    // ========== 基本信息 ==========

    const AccessFlags& access_flags() const { return _access_flags; }
    u2          name_index()      const { return _name_index; }
    u2          signature_index() const { return _signature_index; }
    const char* name()            const { return _name; }
    const char* signature()       const { return _signature; }

    const AttributeArray* attributes() const { return _attributes; }

    InstanceKlass* method_holder() const { return _method_holder; }
    void set_method_holder(InstanceKlass* k) { _method_holder = k; }

    bool is_static()   const { return _access_flags.is_static(); }
    bool is_native()   const { return _access_flags.is_native(); }
    bool is_abstract() const { return _access_flags.is_abstract(); }

    // ========== Code 属性 ==========

    // 第一个 Code 属性；abstract/native 方法没有，返回 nullptr
    const CodeAttribute* code() const;

    bool has_code() const { return code() != nullptr; }

    // 字节码 bci 对应的源码行，没有行号表返回 -1
    int line_number_from_bci(int bci) const;

    bool name_equals(const char* name) const {
        return strcmp(_name, name) == 0;
    }

    // ========== 调试 ==========

    void print_on(FILE* out) const;

    // 简短形式: "main([Ljava/lang/String;)V"
    void print_name(FILE* out) const;

    NONCOPYABLE(Method);
};

#endif // SHARE_OOPS_METHOD_HPP
