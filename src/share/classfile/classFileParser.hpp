#ifndef SHARE_CLASSFILE_CLASSFILEPARSER_HPP
#define SHARE_CLASSFILE_CLASSFILEPARSER_HPP

// ============================================================================
// Pico JVM - Class 文件解析器
// 对应 HotSpot: src/hotspot/share/classfile/classFileParser.hpp
//
// 严格按 ClassFile 结构顺序读取：
//   magic → version → constant_pool → access_flags → this/super
//   → interfaces → fields → methods → attributes
//
// 解析与符号解析交织进行：常量池一读完，后面的方法名、属性名
// 就立即通过它解析成文本。
//
// 属性解析函数都是 static 的，常量池作为只读参数逐层传递，
// 不依赖解析器实例，测试里可以配合手工构造的常量池单独使用。
//
// 不支持的部分：interfaces_count、fields_count 非 0 直接报
// _unsupported_feature，不会跳过。
// ============================================================================

#include "classfile/classFileStream.hpp"
#include "oops/constantPool.hpp"
#include "oops/attributeInfo.hpp"

class InstanceKlass;
class Method;

class ClassFileParser : public StackObj {
private:
    const ClassFileStream* _stream;
    InstanceKlass*         _klass;     // 构建中的类；成功后交给调用者
    ConstantPool*          _cp;        // 归 _klass 所有

    // 按 class 文件结构顺序
    void parse_magic_and_version(TRAPS);
    void parse_constant_pool(TRAPS);
    void parse_access_flags(TRAPS);
    void parse_this_and_super_class(TRAPS);
    void parse_interfaces(TRAPS);
    void parse_fields(TRAPS);
    void parse_methods(TRAPS);
    void parse_class_attributes(TRAPS);

    // 各已知属性的 payload，stream 是属性自己的子游标
    static AttributeInfo* parse_constant_value_attribute(const ClassFileStream* stream,
                                                         u2 name_index, const char* name,
                                                         u4 length, TRAPS);
    static AttributeInfo* parse_code_attribute(const ClassFileStream* stream,
                                               const ConstantPool* cp,
                                               u2 name_index, const char* name,
                                               u4 length, TRAPS);
    static AttributeInfo* parse_source_file_attribute(const ClassFileStream* stream,
                                                      const ConstantPool* cp,
                                                      u2 name_index, const char* name,
                                                      u4 length, TRAPS);
    static AttributeInfo* parse_line_number_table_attribute(const ClassFileStream* stream,
                                                            u2 name_index, const char* name,
                                                            u4 length, TRAPS);
    static AttributeInfo* parse_unknown_attribute(const ClassFileStream* stream,
                                                  u2 name_index, const char* name,
                                                  u4 length, TRAPS);

public:
    // -Xtrace:class
    static bool _trace_parsing;

    explicit ClassFileParser(const ClassFileStream* stream);
    ~ClassFileParser();

    // 主入口，对应 HotSpot: ClassFileParser::parse_stream()
    // 成功返回新的 InstanceKlass（调用者拥有），失败返回 nullptr 并留下 pending exception
    InstanceKlass* parse_stream(TRAPS);

    // ========== 可单独使用的解析步骤 ==========

    // 读一个常量池条目（tag + payload）写入 cp 的 index 位置
    static void parse_constant_pool_entry(const ClassFileStream* stream,
                                          ConstantPool* cp, int index, TRAPS);

    // u2 attributes_count + attributes[]
    static AttributeArray* parse_attributes(const ClassFileStream* stream,
                                            const ConstantPool* cp, TRAPS);

    // 单个 attribute_info；payload 必须被恰好读完
    static AttributeInfo* parse_attribute(const ClassFileStream* stream,
                                          const ConstantPool* cp, TRAPS);

    static Method* parse_method(const ClassFileStream* stream,
                                const ConstantPool* cp, TRAPS);

    NONCOPYABLE(ClassFileParser);
};

#endif // SHARE_CLASSFILE_CLASSFILEPARSER_HPP
