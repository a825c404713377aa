// ============================================================================
// Pico JVM - Class 文件解析器实现
// 对应 HotSpot: src/hotspot/share/classfile/classFileParser.cpp
//
// HotSpot 的 parse_stream() 严格按 ClassFile 结构顺序解析，这里也一样。
// 每一步都带 TRAPS，出错时留下 pending exception 并立即返回，
// 已经构建的部分由 _klass 的析构函数统一释放。
// ============================================================================

#include "classfile/classFileParser.hpp"
#include "oops/instanceKlass.hpp"
#include "oops/method.hpp"
#include "runtime/javaThread.hpp"

bool ClassFileParser::_trace_parsing = false;

// ============================================================================
// 构造/析构
// ============================================================================

ClassFileParser::ClassFileParser(const ClassFileStream* stream)
    : _stream(stream),
      _klass(nullptr),
      _cp(nullptr) {
}

ClassFileParser::~ClassFileParser() {
    // 解析失败时释放半成品；成功时 _klass 已被置空
    delete _klass;
}

// ============================================================================
// parse_stream() - 主入口
//
//   ClassFile {
//       u4             magic;
//       u2             minor_version;
//       u2             major_version;
//       u2             constant_pool_count;
//       cp_info        constant_pool[constant_pool_count-1];
//       u2             access_flags;
//       u2             this_class;
//       u2             super_class;
//       u2             interfaces_count;
//       u2             interfaces[interfaces_count];
//       u2             fields_count;
//       field_info     fields[fields_count];
//       u2             methods_count;
//       method_info    methods[methods_count];
//       u2             attributes_count;
//       attribute_info attributes[attributes_count];
//   }
// ============================================================================

InstanceKlass* ClassFileParser::parse_stream(TRAPS) {
    guarantee(_klass == nullptr, "parse_stream called twice");
    _klass = new InstanceKlass();

    parse_magic_and_version(CHECK_NULL);
    parse_constant_pool(CHECK_NULL);
    parse_access_flags(CHECK_NULL);
    parse_this_and_super_class(CHECK_NULL);
    parse_interfaces(CHECK_NULL);
    parse_fields(CHECK_NULL);
    parse_methods(CHECK_NULL);
    parse_class_attributes(CHECK_NULL);

    // 和 HotSpot 不同，不要求流恰好读完
    if (_trace_parsing && !_stream->at_eos()) {
        fprintf(stderr, "[Parse] %d trailing bytes ignored\n", _stream->remaining());
    }

    InstanceKlass* result = _klass;
    _klass = nullptr;
    return result;
}

// ============================================================================
// 步骤 1-2: Magic + Version
// 魔数只记录不校验，由调用方（launcher）检查
// ============================================================================

void ClassFileParser::parse_magic_and_version(TRAPS) {
    u4 magic = _stream->get_u4(CHECK);
    u2 minor = _stream->get_u2(CHECK);
    u2 major = _stream->get_u2(CHECK);

    _klass->set_magic(magic);
    _klass->set_version(minor, major);

    if (_trace_parsing) {
        fprintf(stderr, "[Parse] magic=0x%08X version=%d.%d\n", magic, major, minor);
    }
}

// ============================================================================
// 步骤 3: 常量池
//
// 读 constant_pool_count - 1 个条目，按顺序编号 1, 2, 3...
// Long/Double 不额外占用下一个索引。
// ============================================================================

void ClassFileParser::parse_constant_pool(TRAPS) {
    u2 cp_count = _stream->get_u2(CHECK);
    int length = cp_count > 0 ? cp_count - 1 : 0;

    _cp = new ConstantPool(length);
    _klass->set_constants(_cp);

    for (int index = 1; index <= length; index++) {
        parse_constant_pool_entry(_stream, _cp, index, CHECK);
    }

    if (_trace_parsing) {
        fprintf(stderr, "[Parse] constant pool: %d entries\n", length);
    }
}

// HotSpot: ClassFileParser::parse_constant_pool_entries()
void ClassFileParser::parse_constant_pool_entry(const ClassFileStream* cfs,
                                                ConstantPool* cp, int index, TRAPS) {
    u1 tag = cfs->get_u1(CHECK);

    switch (tag) {
        case JVM_CONSTANT_Class: {
            // CONSTANT_Class_info { u1 tag; u2 name_index; }
            u2 name_index = cfs->get_u2(CHECK);
            cp->klass_index_at_put(index, name_index);
            break;
        }

        case JVM_CONSTANT_Fieldref:
        case JVM_CONSTANT_Methodref:
        case JVM_CONSTANT_InterfaceMethodref: {
            // { u1 tag; u2 class_index; u2 name_and_type_index; }
            u2 class_index = cfs->get_u2(CHECK);
            u2 name_and_type_index = cfs->get_u2(CHECK);
            cp->member_ref_at_put(index, (jbyte)tag, class_index, name_and_type_index);
            break;
        }

        case JVM_CONSTANT_String: {
            // CONSTANT_String_info { u1 tag; u2 string_index; }
            u2 string_index = cfs->get_u2(CHECK);
            cp->string_index_at_put(index, string_index);
            break;
        }

        case JVM_CONSTANT_Integer: {
            s4 value = cfs->get_s4(CHECK);
            cp->int_at_put(index, value);
            break;
        }

        case JVM_CONSTANT_Float: {
            jfloat value = cfs->get_float(CHECK);
            cp->float_at_put(index, value);
            break;
        }

        case JVM_CONSTANT_Long: {
            // { u1 tag; u4 high_bytes; u4 low_bytes; }
            s8 value = cfs->get_s8(CHECK);
            cp->long_at_put(index, value);
            break;
        }

        case JVM_CONSTANT_Double: {
            jdouble value = cfs->get_double(CHECK);
            cp->double_at_put(index, value);
            break;
        }

        case JVM_CONSTANT_NameAndType: {
            // { u1 tag; u2 name_index; u2 descriptor_index; }
            u2 name_index = cfs->get_u2(CHECK);
            u2 descriptor_index = cfs->get_u2(CHECK);
            cp->name_and_type_at_put(index, name_index, descriptor_index);
            break;
        }

        case JVM_CONSTANT_Utf8: {
            // { u1 tag; u2 length; u1 bytes[length]; }
            // 字节原样保存（modified UTF-8 不做转换）
            int utf8_length = 0;
            char* utf8 = cfs->get_utf8(&utf8_length, CHECK);
            cp->utf8_at_put(index, utf8, utf8_length);
            break;
        }

        case JVM_CONSTANT_MethodHandle: {
            // { u1 tag; u1 reference_kind; u2 reference_index; }
            u1 ref_kind = cfs->get_u1(CHECK);
            u2 ref_index = cfs->get_u2(CHECK);
            cp->method_handle_index_at_put(index, ref_kind, ref_index);
            break;
        }

        case JVM_CONSTANT_MethodType: {
            u2 signature_index = cfs->get_u2(CHECK);
            cp->method_type_index_at_put(index, signature_index);
            break;
        }

        case JVM_CONSTANT_InvokeDynamic: {
            // { u1 tag; u2 bootstrap_method_attr_index; u2 name_and_type_index; }
            u2 bsm_index = cfs->get_u2(CHECK);
            u2 name_and_type_index = cfs->get_u2(CHECK);
            cp->invoke_dynamic_at_put(index, bsm_index, name_and_type_index);
            break;
        }

        default:
            Exceptions::fthrow(THREAD_AND_LOCATION,
                Exceptions::_malformed_constant_pool_tag,
                "Unexpected constant pool type %d at index %d", tag, index);
            return;
    }
}

// ============================================================================
// 步骤 4: 访问标志
// ============================================================================

void ClassFileParser::parse_access_flags(TRAPS) {
    u2 flags = _stream->get_u2(CHECK);
    _klass->set_access_flags(flags);
}

// ============================================================================
// 步骤 5-6: this_class / super_class
// 两者都必须是 Class 条目并能解析到 Utf8，否则整个解析失败
// ============================================================================

void ClassFileParser::parse_this_and_super_class(TRAPS) {
    u2 this_class_index = _stream->get_u2(CHECK);
    const char* class_name = _cp->klass_name_at(this_class_index, CHECK);
    _klass->set_this_class(this_class_index, class_name);

    u2 super_class_index = _stream->get_u2(CHECK);
    const char* super_name = _cp->klass_name_at(super_class_index, CHECK);
    _klass->set_super_class(super_class_index, super_name);

    if (_trace_parsing) {
        fprintf(stderr, "[Parse] class %s extends %s\n", class_name, super_name);
    }
}

// ============================================================================
// 步骤 7-8: 接口和字段（不支持）
// 只读计数，非 0 时在读任何条目之前失败
// ============================================================================

void ClassFileParser::parse_interfaces(TRAPS) {
    u2 interfaces_count = _stream->get_u2(CHECK);
    if (interfaces_count != 0) {
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_unsupported_feature,
            "Interfaces are not supported (interfaces_count = %d)", interfaces_count);
        return;
    }
}

void ClassFileParser::parse_fields(TRAPS) {
    u2 fields_count = _stream->get_u2(CHECK);
    if (fields_count != 0) {
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_unsupported_feature,
            "Fields are not supported (fields_count = %d)", fields_count);
        return;
    }
}

// ============================================================================
// 步骤 9: 方法
// ============================================================================

void ClassFileParser::parse_methods(TRAPS) {
    u2 methods_count = _stream->get_u2(CHECK);

    Method** methods = NEW_C_HEAP_ARRAY(Method*, methods_count, mtClass);
    for (int i = 0; i < methods_count; i++) {
        methods[i] = nullptr;
    }
    // 先交给 _klass，失败时由它释放已解析的部分
    _klass->set_methods(methods, methods_count);

    for (int i = 0; i < methods_count; i++) {
        Method* m = parse_method(_stream, _cp, CHECK);
        m->set_method_holder(_klass);
        methods[i] = m;
    }
}

// method_info {
//     u2 access_flags;  u2 name_index;  u2 descriptor_index;
//     u2 attributes_count;  attribute_info attributes[attributes_count];
// }
Method* ClassFileParser::parse_method(const ClassFileStream* stream,
                                      const ConstantPool* cp, TRAPS) {
    u2 access_flags     = stream->get_u2(CHECK_NULL);
    u2 name_index       = stream->get_u2(CHECK_NULL);
    u2 descriptor_index = stream->get_u2(CHECK_NULL);

    const char* name      = cp->utf8_at(name_index, CHECK_NULL);
    const char* signature = cp->utf8_at(descriptor_index, CHECK_NULL);

    if (_trace_parsing) {
        fprintf(stderr, "[Parse] method %s%s\n", name, signature);
    }

    AttributeArray* attributes = parse_attributes(stream, cp, CHECK_NULL);

    return new Method(access_flags, name_index, descriptor_index,
                      name, signature, attributes);
}

// ============================================================================
// 步骤 10: 类属性
// ============================================================================

void ClassFileParser::parse_class_attributes(TRAPS) {
    AttributeArray* attributes = parse_attributes(_stream, _cp, CHECK);
    _klass->set_attributes(attributes);
}

// ============================================================================
// 属性
// ============================================================================

AttributeArray* ClassFileParser::parse_attributes(const ClassFileStream* stream,
                                                  const ConstantPool* cp, TRAPS) {
    u2 attributes_count = stream->get_u2(CHECK_NULL);
    AttributeArray* attributes = new AttributeArray(attributes_count);

    for (int i = 0; i < attributes_count; i++) {
        AttributeInfo* attr = parse_attribute(stream, cp, THREAD);
        if (HAS_PENDING_EXCEPTION) {
            delete attributes;
            return nullptr;
        }
        attributes->at_put(i, attr);
    }
    return attributes;
}

// 属性长度是 u4，先和剩余字节比较，避免转成 int 时溢出
static const u1* get_attribute_payload(const ClassFileStream* stream, u4 length, TRAPS) {
    if (length > (u4)stream->remaining()) {
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_io_error,
            "Truncated class file [source: %s, offset: %d, wanted: %u, remaining: %d]",
            stream->source() != nullptr ? stream->source() : "<unknown>",
            stream->current_offset(), length, stream->remaining());
        return nullptr;
    }
    return stream->get_bytes((int)length, THREAD);
}

// ----------------------------------------------------------------------------
// attribute_info {
//     u2 attribute_name_index;
//     u4 attribute_length;
//     u1 info[attribute_length];
// }
//
// 名字必须能解析（它决定 payload 的形状）。
// info 被圈进一个独立的子游标，由具体属性的解析函数读取，
// 读完后子游标必须恰好到达末尾。
// ----------------------------------------------------------------------------

AttributeInfo* ClassFileParser::parse_attribute(const ClassFileStream* stream,
                                                const ConstantPool* cp, TRAPS) {
    u2 name_index = stream->get_u2(CHECK_NULL);
    const char* name = cp->utf8_at(name_index, CHECK_NULL);
    u4 length = stream->get_u4(CHECK_NULL);
    const u1* payload = get_attribute_payload(stream, length, CHECK_NULL);

    if (_trace_parsing) {
        fprintf(stderr, "[Parse] attribute %s (%u bytes)\n", name, length);
    }

    ClassFileStream info(payload, (int)length, name);
    AttributeInfo* attr = nullptr;

    if (strcmp(name, "ConstantValue") == 0) {
        attr = parse_constant_value_attribute(&info, name_index, name, length, CHECK_NULL);
    } else if (strcmp(name, "Code") == 0) {
        attr = parse_code_attribute(&info, cp, name_index, name, length, CHECK_NULL);
    } else if (strcmp(name, "SourceFile") == 0) {
        attr = parse_source_file_attribute(&info, cp, name_index, name, length, CHECK_NULL);
    } else if (strcmp(name, "LineNumberTable") == 0) {
        attr = parse_line_number_table_attribute(&info, name_index, name, length, CHECK_NULL);
    } else {
        attr = parse_unknown_attribute(&info, name_index, name, length, CHECK_NULL);
    }

    if (!info.at_eos()) {
        int consumed = info.current_offset();
        delete attr;
        Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_attribute_length_mismatch,
            "Attribute %s declares %u bytes but only %d were consumed",
            name, length, consumed);
        return nullptr;
    }
    return attr;
}

AttributeInfo* ClassFileParser::parse_constant_value_attribute(const ClassFileStream* info,
                                                               u2 name_index, const char* name,
                                                               u4 length, TRAPS) {
    u2 constantvalue_index = info->get_u2(CHECK_NULL);
    return new ConstantValueAttribute(name_index, name, length, constantvalue_index);
}

AttributeInfo* ClassFileParser::parse_code_attribute(const ClassFileStream* info,
                                                     const ConstantPool* cp,
                                                     u2 name_index, const char* name,
                                                     u4 length, TRAPS) {
    u2 max_stack   = info->get_u2(CHECK_NULL);
    u2 max_locals  = info->get_u2(CHECK_NULL);
    u4 code_length = info->get_u4(CHECK_NULL);

    const u1* code_start = get_attribute_payload(info, code_length, CHECK_NULL);

    // 异常表：每项 4 个 u2
    u2 exception_table_length = info->get_u2(CHECK_NULL);
    info->guarantee_more(exception_table_length * 8, CHECK_NULL);
    ExceptionTableElement* exception_table =
        NEW_C_HEAP_ARRAY(ExceptionTableElement, exception_table_length, mtClass);
    for (int i = 0; i < exception_table_length; i++) {
        ExceptionTableElement* e = &exception_table[i];
        // 剩余字节已确认足够
        e->start_pc         = info->get_u2(THREAD);
        e->end_pc           = info->get_u2(THREAD);
        e->handler_pc       = info->get_u2(THREAD);
        e->catch_type_index = info->get_u2(THREAD);
    }

    // 嵌套属性（LineNumberTable 等），使用同一个常量池递归解析
    AttributeArray* attributes = parse_attributes(info, cp, THREAD);
    if (HAS_PENDING_EXCEPTION) {
        FREE_C_HEAP_ARRAY(ExceptionTableElement, exception_table);
        return nullptr;
    }

    u1* code = NEW_C_HEAP_ARRAY(u1, code_length, mtClass);
    memcpy(code, code_start, code_length);

    return new CodeAttribute(name_index, name, length,
                             max_stack, max_locals,
                             code_length, code,
                             exception_table_length, exception_table,
                             attributes);
}

AttributeInfo* ClassFileParser::parse_source_file_attribute(const ClassFileStream* info,
                                                            const ConstantPool* cp,
                                                            u2 name_index, const char* name,
                                                            u4 length, TRAPS) {
    u2 sourcefile_index = info->get_u2(CHECK_NULL);
    const char* source_file = cp->utf8_at(sourcefile_index, CHECK_NULL);
    return new SourceFileAttribute(name_index, name, length, sourcefile_index, source_file);
}

AttributeInfo* ClassFileParser::parse_line_number_table_attribute(const ClassFileStream* info,
                                                                  u2 name_index, const char* name,
                                                                  u4 length, TRAPS) {
    u2 table_length = info->get_u2(CHECK_NULL);
    info->guarantee_more(table_length * 4, CHECK_NULL);

    LineNumberTableElement* table =
        NEW_C_HEAP_ARRAY(LineNumberTableElement, table_length, mtClass);
    for (int i = 0; i < table_length; i++) {
        table[i].start_pc    = info->get_u2(THREAD);
        table[i].line_number = info->get_u2(THREAD);
    }
    return new LineNumberTableAttribute(name_index, name, length, table_length, table);
}

AttributeInfo* ClassFileParser::parse_unknown_attribute(const ClassFileStream* info,
                                                        u2 name_index, const char* name,
                                                        u4 length, TRAPS) {
    // 可恢复：只报告，不抛出
    warning("Unrecognized attribute %s (%u bytes), keeping raw payload", name, length);

    const u1* bytes = info->get_bytes((int)length, CHECK_NULL);
    u1* copy = NEW_C_HEAP_ARRAY(u1, length, mtClass);
    memcpy(copy, bytes, length);
    return new UnknownAttribute(name_index, name, length, copy);
}
