#ifndef SHARE_OOPS_INSTANCEKLASS_HPP
#define SHARE_OOPS_INSTANCEKLASS_HPP

// ============================================================================
// Pico JVM - InstanceKlass（解析出的类）
// 对应 HotSpot: src/hotspot/share/oops/instanceKlass.hpp
//
// 对应 class 文件的 ClassFile 结构本身：
//   magic、版本号、常量池、访问标志、this/super、方法、类属性。
//
// 没有 Klass 层次、没有链接/初始化状态机、没有字段和接口
// （带接口或字段的 class 文件在解析阶段就被拒绝）。
//
// 所有权：InstanceKlass 拥有常量池、全部 Method 和类属性。
// 类名、方法名等字符串都指向常量池，随 InstanceKlass 一起释放。
// ============================================================================

#include "memory/allocation.hpp"
#include "utilities/accessFlags.hpp"
#include "oops/constantPool.hpp"
#include "oops/method.hpp"
#include "oops/attributeInfo.hpp"

class InstanceKlass : public CHeapObj<mtClass> {
private:
    u4              _magic;
    u2              _minor_version;
    u2              _major_version;

    ConstantPool*   _constants;

    AccessFlags     _access_flags;
    u2              _this_class_index;
    u2              _super_class_index;
    const char*     _name;               // this_class 解析出的类名
    const char*     _super_name;         // super_class 解析出的类名

    int             _methods_count;
    Method**        _methods;

    AttributeArray* _attributes;

public:
    InstanceKlass();
    ~InstanceKlass();

    // ========== 构建（ClassFileParser 使用）==========

    void set_magic(u4 magic)                 { _magic = magic; }
    void set_version(u2 minor, u2 major)     { _minor_version = minor; _major_version = major; }
    void set_constants(ConstantPool* cp)     { _constants = cp; }
    void set_access_flags(u2 flags) {
        _access_flags = AccessFlags(flags, AccessFlags::class_flags);
    }
    void set_this_class(u2 index, const char* name)  { _this_class_index = index;  _name = name; }
    void set_super_class(u2 index, const char* name) { _super_class_index = index; _super_name = name; }

    // 接管 methods 数组及其中每个 Method；解析失败时数组尾部可以是 nullptr
    void set_methods(Method** methods, int count);
    void set_attributes(AttributeArray* attributes) { _attributes = attributes; }

    // ========== 查询 ==========

    u4 magic()         const { return _magic; }
    u2 minor_version() const { return _minor_version; }
    u2 major_version() const { return _major_version; }

    bool has_valid_magic() const { return _magic == JAVA_CLASSFILE_MAGIC; }

    ConstantPool* constants() const { return _constants; }

    const AccessFlags& access_flags() const { return _access_flags; }

    u2 this_class_index()  const { return _this_class_index; }
    u2 super_class_index() const { return _super_class_index; }
    const char* name()       const { return _name; }
    const char* super_name() const { return _super_name; }

    int     methods_count()  const { return _methods_count; }
    Method* method_at(int i) const {
        vm_assert(i >= 0 && i < _methods_count, "method index out of bounds");
        return _methods[i];
    }

    const AttributeArray* attributes() const { return _attributes; }

    // 第一个同名方法（不看描述符），找不到返回 nullptr
    Method* find_method(const char* name) const;

    // 名称 + 描述符精确匹配
    Method* find_method(const char* name, const char* signature) const;

    // SourceFile 属性，没有返回 nullptr
    const char* source_file() const;

    // ========== 调试 ==========

    void print_on(FILE* out) const;

    NONCOPYABLE(InstanceKlass);
};

#endif // SHARE_OOPS_INSTANCEKLASS_HPP
