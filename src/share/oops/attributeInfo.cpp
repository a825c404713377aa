// ============================================================================
// Pico JVM - 属性实现
// ============================================================================

#include "oops/attributeInfo.hpp"

static void print_indent(FILE* out, int indent) {
    fprintf(out, "%*s", indent, "");
}

// ============================================================================
// CodeAttribute
// ============================================================================

CodeAttribute::CodeAttribute(u2 name_index, const char* name, u4 length,
                             u2 max_stack, u2 max_locals,
                             u4 code_length, u1* code,
                             int exception_table_length,
                             ExceptionTableElement* exception_table,
                             AttributeArray* attributes)
    : AttributeInfo(_code_attr, name_index, name, length),
      _max_stack(max_stack),
      _max_locals(max_locals),
      _code_length(code_length),
      _code(code),
      _exception_table_length(exception_table_length),
      _exception_table(exception_table),
      _attributes(attributes) {
}

CodeAttribute::~CodeAttribute() {
    if (_code != nullptr)            FREE_C_HEAP_ARRAY(u1, _code);
    if (_exception_table != nullptr) FREE_C_HEAP_ARRAY(ExceptionTableElement, _exception_table);
    delete _attributes;
}

void CodeAttribute::print_on(FILE* out, int indent) const {
    print_indent(out, indent);
    fprintf(out, "%s: stack=%d, locals=%d, code_length=%u\n",
            _name, _max_stack, _max_locals, _code_length);

    print_indent(out, indent + 2);
    for (u4 i = 0; i < _code_length; i++) {
        fprintf(out, "%02x%s", _code[i], (i + 1 < _code_length) ? " " : "");
    }
    fprintf(out, "\n");

    if (_exception_table_length > 0) {
        print_indent(out, indent + 2);
        fprintf(out, "Exception table:\n");
        print_indent(out, indent + 4);
        fprintf(out, "from    to  target type\n");
        for (int i = 0; i < _exception_table_length; i++) {
            const ExceptionTableElement* e = &_exception_table[i];
            print_indent(out, indent + 4);
            fprintf(out, "%4d  %4d  %5d   #%d\n",
                    e->start_pc, e->end_pc, e->handler_pc, e->catch_type_index);
        }
    }

    if (_attributes != nullptr) {
        _attributes->print_on(out, indent + 2);
    }
}

// ============================================================================
// 其它属性
// ============================================================================

void ConstantValueAttribute::print_on(FILE* out, int indent) const {
    print_indent(out, indent);
    fprintf(out, "%s: #%d\n", _name, _constantvalue_index);
}

void SourceFileAttribute::print_on(FILE* out, int indent) const {
    print_indent(out, indent);
    fprintf(out, "%s: \"%s\"\n", _name, _source_file);
}

int LineNumberTableAttribute::line_number_for_bci(int bci) const {
    // 表按 start_pc 升序时，取最后一个 start_pc <= bci 的行
    int best_pc = -1;
    int line = -1;
    for (int i = 0; i < _table_length; i++) {
        int pc = _table[i].start_pc;
        if (pc <= bci && pc > best_pc) {
            best_pc = pc;
            line = _table[i].line_number;
        }
    }
    return line;
}

void LineNumberTableAttribute::print_on(FILE* out, int indent) const {
    print_indent(out, indent);
    fprintf(out, "%s:\n", _name);
    for (int i = 0; i < _table_length; i++) {
        print_indent(out, indent + 2);
        fprintf(out, "line %d: %d\n", _table[i].line_number, _table[i].start_pc);
    }
}

void UnknownAttribute::print_on(FILE* out, int indent) const {
    print_indent(out, indent);
    fprintf(out, "%s: length = 0x%x (unrecognized)\n", _name, _length);
}

// ============================================================================
// AttributeArray
// ============================================================================

AttributeArray::AttributeArray(int length)
    : _length(length),
      _data(nullptr) {
    guarantee(length >= 0, "negative attribute count");
    _data = NEW_C_HEAP_ARRAY(AttributeInfo*, length, mtClass);
    for (int i = 0; i < length; i++) {
        _data[i] = nullptr;
    }
}

AttributeArray::~AttributeArray() {
    // 解析中途失败时后面的槽位还是 nullptr
    for (int i = 0; i < _length; i++) {
        delete _data[i];
    }
    FREE_C_HEAP_ARRAY(AttributeInfo*, _data);
}

AttributeInfo* AttributeArray::find(AttributeInfo::Kind kind) const {
    for (int i = 0; i < _length; i++) {
        if (_data[i] != nullptr && _data[i]->kind() == kind) {
            return _data[i];
        }
    }
    return nullptr;
}

void AttributeArray::print_on(FILE* out, int indent) const {
    for (int i = 0; i < _length; i++) {
        if (_data[i] != nullptr) {
            _data[i]->print_on(out, indent);
        }
    }
}
