#ifndef SHARE_OOPS_ATTRIBUTEINFO_HPP
#define SHARE_OOPS_ATTRIBUTEINFO_HPP

// ============================================================================
// Pico JVM - 属性（attribute_info）
// 对应 HotSpot: ConstMethod 中内嵌的 Code/异常表/行号表
//              + classFileParser.cpp 中对各属性的解析结果
//
// attribute_info {
//     u2 attribute_name_index;
//     u4 attribute_length;
//     u1 info[attribute_length];
// }
//
// 属性名决定 info 的形状。认识的属性解码为具体子类：
//   ConstantValue / Code / SourceFile / LineNumberTable
// 其余一律保存为 UnknownAttribute（原样保留 info 字节）。
//
// HotSpot 把这些表内嵌进 ConstMethod，不保留属性本身；
// 我们要求解析结果能完整还原属性结构，所以保留为对象树。
//
// 属性名等字符串都指向常量池中的 Utf8，生命周期跟随常量池。
// ============================================================================

#include "memory/allocation.hpp"

class CodeAttribute;
class AttributeArray;

// 异常表元素（JVMS §4.7.3）
struct ExceptionTableElement {
    u2 start_pc;
    u2 end_pc;
    u2 handler_pc;
    u2 catch_type_index;   // 0 表示 finally（捕获所有）
};

// 行号表元素（JVMS §4.7.12）
struct LineNumberTableElement {
    u2 start_pc;
    u2 line_number;
};

// ============================================================================
// AttributeInfo - 所有属性的基类
// ============================================================================

class AttributeInfo : public CHeapObj<mtClass> {
public:
    enum Kind {
        _constant_value_attr,
        _code_attr,
        _source_file_attr,
        _line_number_table_attr,
        _unknown_attr
    };

protected:
    Kind        _kind;
    u2          _name_index;
    const char* _name;
    u4          _length;       // attribute_length（info 的字节数）

    AttributeInfo(Kind kind, u2 name_index, const char* name, u4 length)
        : _kind(kind), _name_index(name_index), _name(name), _length(length) {}

public:
    virtual ~AttributeInfo() {}

    Kind        kind()       const { return _kind; }
    u2          name_index() const { return _name_index; }
    const char* name()       const { return _name; }
    u4          length()     const { return _length; }

    bool is_constant_value()    const { return _kind == _constant_value_attr; }
    bool is_code()              const { return _kind == _code_attr; }
    bool is_source_file()       const { return _kind == _source_file_attr; }
    bool is_line_number_table() const { return _kind == _line_number_table_attr; }
    bool is_unknown()           const { return _kind == _unknown_attr; }

    virtual void print_on(FILE* out, int indent) const = 0;

    NONCOPYABLE(AttributeInfo);
};

// ----------------------------------------------------------------------------
// ConstantValue { u2 constantvalue_index; }
// ----------------------------------------------------------------------------

class ConstantValueAttribute : public AttributeInfo {
private:
    u2 _constantvalue_index;

public:
    ConstantValueAttribute(u2 name_index, const char* name, u4 length,
                           u2 constantvalue_index)
        : AttributeInfo(_constant_value_attr, name_index, name, length),
          _constantvalue_index(constantvalue_index) {}

    u2 constantvalue_index() const { return _constantvalue_index; }

    void print_on(FILE* out, int indent) const;
};

// ----------------------------------------------------------------------------
// Code
//
// Code_attribute {
//     u2 max_stack;  u2 max_locals;
//     u4 code_length;  u1 code[code_length];
//     u2 exception_table_length;  {u2 x 4} exception_table[...];
//     u2 attributes_count;  attribute_info attributes[...];
// }
//
// 字节码、异常表复制到 C 堆，由 CodeAttribute 拥有。
// ----------------------------------------------------------------------------

class CodeAttribute : public AttributeInfo {
private:
    u2                     _max_stack;
    u2                     _max_locals;
    u4                     _code_length;
    u1*                    _code;
    int                    _exception_table_length;
    ExceptionTableElement* _exception_table;
    AttributeArray*        _attributes;          // 嵌套属性（LineNumberTable 等）

public:
    // 接管 code / exception_table / attributes 的所有权
    CodeAttribute(u2 name_index, const char* name, u4 length,
                  u2 max_stack, u2 max_locals,
                  u4 code_length, u1* code,
                  int exception_table_length, ExceptionTableElement* exception_table,
                  AttributeArray* attributes);
    ~CodeAttribute();

    u2  max_stack()   const { return _max_stack; }
    u2  max_locals()  const { return _max_locals; }
    u4  code_length() const { return _code_length; }
    const u1* code_base() const { return _code; }

    int exception_table_length() const { return _exception_table_length; }
    const ExceptionTableElement* exception_table_at(int i) const {
        vm_assert(i >= 0 && i < _exception_table_length, "exception table index");
        return &_exception_table[i];
    }

    const AttributeArray* attributes() const { return _attributes; }

    void print_on(FILE* out, int indent) const;
};

// ----------------------------------------------------------------------------
// SourceFile { u2 sourcefile_index; }，解析时立即解析为文本
// ----------------------------------------------------------------------------

class SourceFileAttribute : public AttributeInfo {
private:
    u2          _sourcefile_index;
    const char* _source_file;

public:
    SourceFileAttribute(u2 name_index, const char* name, u4 length,
                        u2 sourcefile_index, const char* source_file)
        : AttributeInfo(_source_file_attr, name_index, name, length),
          _sourcefile_index(sourcefile_index),
          _source_file(source_file) {}

    u2          sourcefile_index() const { return _sourcefile_index; }
    const char* source_file()      const { return _source_file; }

    void print_on(FILE* out, int indent) const;
};

// ----------------------------------------------------------------------------
// LineNumberTable
// ----------------------------------------------------------------------------

class LineNumberTableAttribute : public AttributeInfo {
private:
    int                     _table_length;
    LineNumberTableElement* _table;

public:
    LineNumberTableAttribute(u2 name_index, const char* name, u4 length,
                             int table_length, LineNumberTableElement* table)
        : AttributeInfo(_line_number_table_attr, name_index, name, length),
          _table_length(table_length),
          _table(table) {}

    ~LineNumberTableAttribute() {
        if (_table != nullptr) FREE_C_HEAP_ARRAY(LineNumberTableElement, _table);
    }

    int table_length() const { return _table_length; }
    const LineNumberTableElement* line_number_at(int i) const {
        vm_assert(i >= 0 && i < _table_length, "line number table index");
        return &_table[i];
    }

    // bci 所在的源码行，没有记录返回 -1
    int line_number_for_bci(int bci) const;

    void print_on(FILE* out, int indent) const;
};

// ----------------------------------------------------------------------------
// 不认识的属性：info 原样保留
// ----------------------------------------------------------------------------

class UnknownAttribute : public AttributeInfo {
private:
    u1* _info;

public:
    UnknownAttribute(u2 name_index, const char* name, u4 length, u1* info)
        : AttributeInfo(_unknown_attr, name_index, name, length),
          _info(info) {}

    ~UnknownAttribute() {
        if (_info != nullptr) FREE_C_HEAP_ARRAY(u1, _info);
    }

    const u1* info() const { return _info; }

    void print_on(FILE* out, int indent) const;
};

// ============================================================================
// AttributeArray - 按 class 文件顺序保存属性，拥有其中每个元素
// ============================================================================

class AttributeArray : public CHeapObj<mtClass> {
private:
    int             _length;
    AttributeInfo** _data;

public:
    explicit AttributeArray(int length);
    ~AttributeArray();

    int length() const { return _length; }

    AttributeInfo* at(int i) const {
        vm_assert(i >= 0 && i < _length, "attribute index out of bounds");
        return _data[i];
    }

    void at_put(int i, AttributeInfo* attr) {
        vm_assert(i >= 0 && i < _length, "attribute index out of bounds");
        vm_assert(_data[i] == nullptr, "attribute slot already filled");
        _data[i] = attr;
    }

    // 第一个指定种类的属性，没有返回 nullptr
    AttributeInfo* find(AttributeInfo::Kind kind) const;

    void print_on(FILE* out, int indent) const;

    NONCOPYABLE(AttributeArray);
};

#endif // SHARE_OOPS_ATTRIBUTEINFO_HPP
