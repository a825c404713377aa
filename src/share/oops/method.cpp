// ============================================================================
// Pico JVM - Method 实现
// 对应 HotSpot: src/hotspot/share/oops/method.cpp
// ============================================================================

#include "oops/method.hpp"

const CodeAttribute* Method::code() const {
    if (_attributes == nullptr) return nullptr;
    AttributeInfo* attr = _attributes->find(AttributeInfo::_code_attr);
    return static_cast<const CodeAttribute*>(attr);
}

int Method::line_number_from_bci(int bci) const {
    const CodeAttribute* c = code();
    if (c == nullptr || c->attributes() == nullptr) return -1;

    AttributeInfo* attr = c->attributes()->find(AttributeInfo::_line_number_table_attr);
    if (attr == nullptr) return -1;
    return static_cast<LineNumberTableAttribute*>(attr)->line_number_for_bci(bci);
}

void Method::print_name(FILE* out) const {
    fprintf(out, "%s%s", _name, _signature);
}

void Method::print_on(FILE* out) const {
    fprintf(out, "  ");
    print_name(out);
    fprintf(out, "\n    flags: ");
    _access_flags.print_on(out);
    fprintf(out, "\n");
    if (_attributes != nullptr) {
        _attributes->print_on(out, 4);
    }
}
