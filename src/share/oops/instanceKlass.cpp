// ============================================================================
// Pico JVM - InstanceKlass 实现
// 对应 HotSpot: src/hotspot/share/oops/instanceKlass.cpp
// ============================================================================

#include "oops/instanceKlass.hpp"

// ============================================================================
// 构造/析构
// ============================================================================

InstanceKlass::InstanceKlass()
    : _magic(0),
      _minor_version(0),
      _major_version(0),
      _constants(nullptr),
      _access_flags(),
      _this_class_index(0),
      _super_class_index(0),
      _name(nullptr),
      _super_name(nullptr),
      _methods_count(0),
      _methods(nullptr),
      _attributes(nullptr)
{}

InstanceKlass::~InstanceKlass() {
    if (_methods != nullptr) {
        for (int i = 0; i < _methods_count; i++) {
            delete _methods[i];
        }
        FREE_C_HEAP_ARRAY(Method*, _methods);
    }

    delete _attributes;

    // 常量池最后释放：方法和属性里的名字都指向它
    delete _constants;
}

void InstanceKlass::set_methods(Method** methods, int count) {
    vm_assert(_methods == nullptr, "methods already set");
    _methods = methods;
    _methods_count = count;
}

// ============================================================================
// 查找
// ============================================================================

Method* InstanceKlass::find_method(const char* name) const {
    for (int i = 0; i < _methods_count; i++) {
        if (_methods[i]->name_equals(name)) {
            return _methods[i];
        }
    }
    return nullptr;
}

Method* InstanceKlass::find_method(const char* name, const char* signature) const {
    for (int i = 0; i < _methods_count; i++) {
        Method* m = _methods[i];
        if (m->name_equals(name) && strcmp(m->signature(), signature) == 0) {
            return m;
        }
    }
    return nullptr;
}

const char* InstanceKlass::source_file() const {
    if (_attributes == nullptr) return nullptr;
    AttributeInfo* attr = _attributes->find(AttributeInfo::_source_file_attr);
    if (attr == nullptr) return nullptr;
    return static_cast<SourceFileAttribute*>(attr)->source_file();
}

// ============================================================================
// 调试打印（javap -v 风格）
// ============================================================================

void InstanceKlass::print_on(FILE* out) const {
    fprintf(out, "class %s extends %s\n",
            _name != nullptr ? _name : "<unnamed>",
            _super_name != nullptr ? _super_name : "<none>");
    fprintf(out, "  magic: 0x%08X%s\n", _magic, has_valid_magic() ? "" : " (invalid)");
    fprintf(out, "  minor version: %d\n", _minor_version);
    fprintf(out, "  major version: %d\n", _major_version);
    fprintf(out, "  flags: ");
    _access_flags.print_on(out);
    fprintf(out, "\n");
    fprintf(out, "  this_class: #%d\n", _this_class_index);
    fprintf(out, "  super_class: #%d\n", _super_class_index);

    if (_constants != nullptr) {
        _constants->print_on(out);
    }

    fprintf(out, "{\n");
    for (int i = 0; i < _methods_count; i++) {
        _methods[i]->print_on(out);
        if (i + 1 < _methods_count) fprintf(out, "\n");
    }
    fprintf(out, "}\n");

    if (_attributes != nullptr) {
        _attributes->print_on(out, 0);
    }
}
