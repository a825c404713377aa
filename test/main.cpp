// ============================================================================
// Pico JVM - 回归测试入口
// 覆盖：字节读取 + 常量池 + 属性解析 + class 文件解析 + 解释器 + 加载器
//
// 用法: picojvm_tests [path/to/HelloWorld.class]
// ============================================================================

#include "utilities/globalDefinitions.hpp"
#include "utilities/debug.hpp"
#include "utilities/bytes.hpp"
#include "utilities/exceptions.hpp"
#include "utilities/accessFlags.hpp"
#include "utilities/constantTag.hpp"
#include "memory/allocation.hpp"
#include "oops/constantPool.hpp"
#include "oops/attributeInfo.hpp"
#include "oops/method.hpp"
#include "oops/instanceKlass.hpp"
#include "classfile/classFileStream.hpp"
#include "classfile/classFileParser.hpp"
#include "classfile/classLoader.hpp"
#include "interpreter/bytecodes.hpp"
#include "interpreter/bytecodeInterpreter.hpp"
#include "prims/nativeLookup.hpp"
#include "runtime/frame.hpp"
#include "runtime/javaThread.hpp"

#include "classFileBuilder.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <climits>

// ----------------------------------------------------------------------------
// 工具函数
// ----------------------------------------------------------------------------

static bool contains(const char* haystack, const char* needle) {
    return haystack != nullptr && strstr(haystack, needle) != nullptr;
}

// 检查 pending exception 的种类，然后清除
static void expect_exception(JavaThread* thread, int kind, const char* what) {
    if (thread->pending_exception_kind() != kind) {
        fprintf(stderr, "  expected %s for %s, got %s (%s)\n",
                Exceptions::name(kind), what,
                Exceptions::name(thread->pending_exception_kind()),
                thread->exception_message());
    }
    guarantee(thread->pending_exception_kind() == kind, what);
    printf("  %s -> %s: %s  [PASS]\n", what, Exceptions::name(kind),
           thread->exception_message());
    thread->clear_pending_exception();
}

static void put_utf8(ConstantPool* cp, int index, const char* s) {
    cp->utf8_at_put(index, os_strdup(s, mtTest), (int)strlen(s));
}

// 执行 main，program 输出写到临时文件后读回 out
static int run_and_capture(InstanceKlass* klass, JavaThread* thread,
                           char* out, int out_size) {
    FILE* f = tmpfile();
    guarantee(f != nullptr, "tmpfile failed");

    thread->set_output(f);
    BytecodeInterpreter::run_main(klass, thread);
    thread->set_output(stdout);

    fflush(f);
    rewind(f);
    size_t n = fread(out, 1, out_size - 1, f);
    out[n] = '\0';
    fclose(f);
    return (int)n;
}

// ----------------------------------------------------------------------------
// 测试类 "Main" 的常量池
//
//   Main extends java/lang/Object
//   static main([Ljava/lang/String;)V
//     getstatic  #10  java/io/PrintStream.out:Ljava/io/PrintStream;
//     ldc        #16  "Hello, World!"
//     invokevirtual #14  java/io/PrintStream.println:(Ljava/lang/String;)V
// ----------------------------------------------------------------------------

enum {
    cp_main_utf8          = 1,
    cp_main_class         = 2,
    cp_object_utf8        = 3,
    cp_object_class       = 4,
    cp_printstream_utf8   = 5,
    cp_printstream_class  = 6,
    cp_out_utf8           = 7,
    cp_out_sig_utf8       = 8,
    cp_out_nat            = 9,
    cp_out_fieldref       = 10,
    cp_println_utf8       = 11,
    cp_println_sig_utf8   = 12,
    cp_println_nat        = 13,
    cp_println_methodref  = 14,
    cp_hello_utf8         = 15,
    cp_hello_string       = 16,
    cp_main_name_utf8     = 17,
    cp_main_sig_utf8      = 18,
    cp_code_utf8          = 19,
    cp_int_42             = 20,
    cp_print_utf8         = 21,
    cp_print_nat          = 22,
    cp_print_methodref    = 23,
    cp_count              = 24
};

static const u1 hello_code[] = {
    Bytecodes::_getstatic,     0x00, cp_out_fieldref,
    Bytecodes::_ldc,           cp_hello_string,
    Bytecodes::_invokevirtual, 0x00, cp_println_methodref
};

// magic .. super_class
static void write_class_header(ClassFileBuilder& b) {
    b.put_u4(JAVA_CLASSFILE_MAGIC).put_u2(0).put_u2(55);

    b.put_u2(cp_count);
    b.cp_utf8("Main");
    b.cp_class(cp_main_utf8);
    b.cp_utf8("java/lang/Object");
    b.cp_class(cp_object_utf8);
    b.cp_utf8("java/io/PrintStream");
    b.cp_class(cp_printstream_utf8);
    b.cp_utf8("out");
    b.cp_utf8("Ljava/io/PrintStream;");
    b.cp_name_and_type(cp_out_utf8, cp_out_sig_utf8);
    b.cp_member_ref(JVM_CONSTANT_Fieldref, cp_printstream_class, cp_out_nat);
    b.cp_utf8("println");
    b.cp_utf8("(Ljava/lang/String;)V");
    b.cp_name_and_type(cp_println_utf8, cp_println_sig_utf8);
    b.cp_member_ref(JVM_CONSTANT_Methodref, cp_printstream_class, cp_println_nat);
    b.cp_utf8("Hello, World!");
    b.cp_string(cp_hello_utf8);
    b.cp_utf8("main");
    b.cp_utf8("([Ljava/lang/String;)V");
    b.cp_utf8("Code");
    b.cp_integer(42);
    b.cp_utf8("print");
    b.cp_name_and_type(cp_print_utf8, cp_println_sig_utf8);
    b.cp_member_ref(JVM_CONSTANT_Methodref, cp_printstream_class, cp_print_nat);

    b.put_u2(JVM_ACC_PUBLIC | JVM_ACC_SUPER);
    b.put_u2(cp_main_class);
    b.put_u2(cp_object_class);
}

// 完整的 class 文件，只有一个方法，方法体是 code
static void build_main_class(ClassFileBuilder& b, const u1* code, int code_length,
                             u2 method_name_index = cp_main_name_utf8) {
    write_class_header(b);
    b.put_u2(0);                                 // interfaces_count
    b.put_u2(0);                                 // fields_count

    b.put_u2(1);                                 // methods_count
    b.put_u2(JVM_ACC_PUBLIC | JVM_ACC_STATIC);
    b.put_u2(method_name_index);
    b.put_u2(cp_main_sig_utf8);
    b.put_u2(1);
    int at = b.begin_attribute(cp_code_utf8);
    b.put_u2(2).put_u2(1);                       // max_stack, max_locals
    b.put_u4((u4)code_length).bytes(code, code_length);
    b.put_u2(0);                                 // exception_table_length
    b.put_u2(0);                                 // attributes_count
    b.end_attribute(at);

    b.put_u2(0);                                 // class attributes_count
}

static InstanceKlass* parse_builder(const ClassFileBuilder& b, TRAPS) {
    return ClassLoader::load_class_from_bytes(b.buffer(), b.length(), "Main", THREAD);
}

// ============================================================================
// 基础工具
// ============================================================================

void test_bytes() {
    printf("=== Test: Bytes (Endian) ===\n");
    u1 data_u2[] = { 0x00, 0x37 };
    u2 val_u2 = Bytes::get_Java_u2(data_u2);
    vm_assert(val_u2 == 55, "u2 byte swap failed");
    printf("  get_Java_u2 = %d  [PASS]\n", val_u2);

    u1 data_u4[] = { 0xCA, 0xFE, 0xBA, 0xBE };
    u4 val_u4 = Bytes::get_Java_u4(data_u4);
    vm_assert(val_u4 == 0xCAFEBABE, "u4 byte swap failed");
    printf("  get_Java_u4 = 0x%08X  [PASS]\n", val_u4);

    u1 data_u8[] = { 0x00, 0x00, 0x00, 0x01, 0x23, 0x45, 0x67, 0x89 };
    u8 val_u8 = Bytes::get_Java_u8(data_u8);
    vm_assert(val_u8 == 0x0000000123456789ULL, "u8 byte swap failed");
    printf("  get_Java_u8 = 0x%016llx  [PASS]\n", (unsigned long long)val_u8);

    u1 out[4];
    Bytes::put_Java_u4(out, 0x01020304);
    vm_assert(out[0] == 1 && out[1] == 2 && out[2] == 3 && out[3] == 4, "put_Java_u4");
    printf("  put_Java_u4 big-endian  [PASS]\n\n");
}

// 两次 CHECK_0：第一次成功，第二次越界
static int sum_two_u2(const ClassFileStream* s, TRAPS) {
    u2 a = s->get_u2(CHECK_0);
    u2 b = s->get_u2(CHECK_0);
    return a + b;
}

void test_exceptions() {
    printf("=== Test: Exceptions (pending exception protocol) ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    vm_assert(!HAS_PENDING_EXCEPTION, "fresh thread has no exception");

    Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_io_error, "first %d", 1);
    Exceptions::fthrow(THREAD_AND_LOCATION, Exceptions::_unimplemented_opcode, "second");
    vm_assert(PENDING_EXCEPTION_KIND == Exceptions::_io_error, "first exception is kept");
    vm_assert(strcmp(thread.exception_message(), "first 1") == 0, "first message is kept");
    vm_assert(thread.exception_file() != nullptr, "file recorded");
    printf("  first pending exception kept  [PASS]\n");
    CLEAR_PENDING_EXCEPTION;
    vm_assert(!HAS_PENDING_EXCEPTION, "cleared");

    vm_assert(strcmp(Exceptions::name(Exceptions::_malformed_constant_pool_tag),
                     "MalformedConstantPoolTag") == 0, "kind name");
    vm_assert(strcmp(Exceptions::name(Exceptions::_unimplemented_opcode),
                     "UnimplementedOpcode") == 0, "kind name");
    vm_assert(!Exceptions::is_fatal(Exceptions::_unrecognized_attribute),
              "unrecognized attribute is recoverable");
    vm_assert(Exceptions::is_fatal(Exceptions::_unsupported_feature), "fatal kind");
    printf("  kind names and classification  [PASS]\n");

    u1 data[] = { 0x00, 0x01, 0x00 };
    ClassFileStream s(data, sizeof(data), "check");
    int sum = sum_two_u2(&s, THREAD);
    vm_assert(sum == 0, "CHECK_0 returns 0");
    vm_assert(s.current_offset() == 2, "first read consumed, second did not");
    expect_exception(THREAD, Exceptions::_io_error, "CHECK_0 propagation");
    printf("\n");
}

// ============================================================================
// ClassFileStream
// ============================================================================

void test_classfile_stream() {
    printf("=== Test: ClassFileStream ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    u1 data[] = {
        0xCA, 0xFE, 0xBA, 0xBE,
        0x00, 0x00,
        0x00, 0x37,
        0x00, 0x05,
        0xFF,
    };
    ClassFileStream stream(data, sizeof(data), "test_data");
    u4 magic = stream.get_u4(THREAD);
    u2 minor = stream.get_u2(THREAD);
    u2 major = stream.get_u2(THREAD);
    u2 count = stream.get_u2(THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION, "reads succeed");
    vm_assert(magic == 0xCAFEBABE, "magic");
    vm_assert(minor == 0, "minor");
    vm_assert(major == 55, "major");
    vm_assert(count == 5, "cp_count");
    vm_assert(stream.remaining() == 1, "one byte left");
    printf("  [PASS] sequential reads\n");

    // 不够 4 字节：报 IoError，游标不动
    stream.get_u4(THREAD);
    vm_assert(stream.current_offset() == 10, "cursor unchanged on failure");
    vm_assert(contains(thread.exception_message(), "Truncated"), "message");
    vm_assert(contains(thread.exception_message(), "test_data"), "message names source");
    expect_exception(THREAD, Exceptions::_io_error, "get_u4 with 1 byte left");

    s1 last = stream.get_s1(THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && last == -1, "get_s1");
    vm_assert(stream.at_eos(), "eos");
    stream.get_u1(THREAD);
    expect_exception(THREAD, Exceptions::_io_error, "get_u1 at eos");

    // get_utf8: u2 长度 + 内容
    u1 utf8[] = { 0x00, 0x03, 'a', 'b', 'c' };
    ClassFileStream us(utf8, sizeof(utf8), "utf8");
    int len = 0;
    char* text = us.get_utf8(&len, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION, "get_utf8");
    vm_assert(len == 3 && strcmp(text, "abc") == 0, "utf8 content");
    FREE_C_HEAP_ARRAY(char, text);

    u1 short_utf8[] = { 0x00, 0x05, 'a' };
    ClassFileStream ss(short_utf8, sizeof(short_utf8), "short_utf8");
    char* none = ss.get_utf8(&len, THREAD);
    vm_assert(none == nullptr, "no string on failure");
    expect_exception(THREAD, Exceptions::_io_error, "get_utf8 past end");

    // get_bytes 恰好 n 字节
    ClassFileStream bs(data, sizeof(data), "bytes");
    const u1* p = bs.get_bytes(4, THREAD);
    vm_assert(p == data && bs.current_offset() == 4, "get_bytes");
    bs.get_bytes(100, THREAD);
    vm_assert(bs.current_offset() == 4, "cursor unchanged");
    expect_exception(THREAD, Exceptions::_io_error, "get_bytes(100)");
    printf("\n");
}

// ============================================================================
// 常量池
// ============================================================================

void test_constant_pool_entries() {
    printf("=== Test: Constant pool entry widths ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    ClassFileBuilder b;
    b.cp_utf8("abc");                                              // #1
    b.cp_integer(-7);                                              // #2
    b.cp_float(1.5f);                                              // #3
    b.cp_long(0x123456789LL);                                      // #4
    b.cp_double(2.25);                                             // #5
    b.cp_class(1);                                                 // #6
    b.cp_string(1);                                                // #7
    b.cp_member_ref(JVM_CONSTANT_Fieldref, 6, 11);                 // #8
    b.cp_member_ref(JVM_CONSTANT_Methodref, 6, 11);                // #9
    b.cp_member_ref(JVM_CONSTANT_InterfaceMethodref, 6, 11);       // #10
    b.cp_name_and_type(1, 1);                                      // #11
    b.cp_method_handle(6, 9);                                      // #12
    b.cp_method_type(1);                                           // #13
    b.cp_invoke_dynamic(0, 11);                                    // #14

    static const int widths[] = { 6, 5, 5, 9, 9, 3, 3, 5, 5, 5, 5, 4, 3, 5 };
    const int n = (int)ARRAY_SIZE(widths);

    ConstantPool cp(n);
    ClassFileStream s(b.buffer(), b.length(), "cp");
    for (int i = 1; i <= n; i++) {
        int before = s.current_offset();
        ClassFileParser::parse_constant_pool_entry(&s, &cp, i, THREAD);
        vm_assert(!HAS_PENDING_EXCEPTION, "entry parses");
        int consumed = s.current_offset() - before;
        if (consumed != widths[i - 1]) {
            fprintf(stderr, "  #%d consumed %d, expected %d\n", i, consumed, widths[i - 1]);
        }
        guarantee(consumed == widths[i - 1], "entry width");
    }
    vm_assert(s.at_eos(), "all bytes consumed");
    printf("  14 tags consumed exactly their widths  [PASS]\n");

    vm_assert(strcmp(cp.utf8_at(1, THREAD), "abc") == 0, "utf8");
    vm_assert(cp.int_at(2, THREAD) == -7, "int");
    vm_assert(cp.float_at(3, THREAD) == 1.5f, "float");
    vm_assert(cp.long_at(4, THREAD) == 0x123456789LL, "long");
    vm_assert(cp.double_at(5, THREAD) == 2.25, "double");
    vm_assert(cp.klass_name_index_at(6, THREAD) == 1, "class name index");
    vm_assert(cp.string_index_at(7, THREAD) == 1, "string index");
    vm_assert(cp.klass_ref_index_at(8, THREAD) == 6, "ref class index");
    vm_assert(cp.name_and_type_ref_index_at(9, THREAD) == 11, "ref nat index");
    vm_assert(cp.tag_at(10).is_interface_method(), "interface methodref");
    vm_assert(cp.name_ref_index_at(11, THREAD) == 1, "nat name");
    vm_assert(cp.signature_ref_index_at(11, THREAD) == 1, "nat descriptor");
    vm_assert(cp.method_handle_ref_kind_at(12, THREAD) == 6, "method handle kind");
    vm_assert(cp.method_handle_index_at(12, THREAD) == 9, "method handle ref");
    vm_assert(cp.method_type_index_at(13, THREAD) == 1, "method type");
    vm_assert(cp.bootstrap_method_attr_index_at(14, THREAD) == 0, "indy bsm");
    vm_assert(cp.name_and_type_ref_index_at(14, THREAD) == 11, "indy nat");
    vm_assert(!HAS_PENDING_EXCEPTION, "typed readers succeed");
    printf("  typed payload readers  [PASS]\n");

    // Long 只占一个槽：#5 紧跟在 #4 后面
    vm_assert(cp.tag_at(4).is_long() && cp.tag_at(5).is_double(), "long/double single slot");
    printf("  Long/Double occupy one slot  [PASS]\n");

    cp.print_on(stdout);
    printf("\n");
}

void test_malformed_constant_pool_tag() {
    printf("=== Test: Malformed constant pool tag ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    // 2 不是合法 tag
    u1 data[] = { 0x02, 0xAA, 0xBB };
    ConstantPool cp(1);
    ClassFileStream s(data, sizeof(data), "bad_tag");
    ClassFileParser::parse_constant_pool_entry(&s, &cp, 1, THREAD);
    vm_assert(s.current_offset() == 1, "only the tag byte consumed");
    vm_assert(cp.tag_at(1).is_invalid(), "slot left empty");
    expect_exception(THREAD, Exceptions::_malformed_constant_pool_tag, "tag 2");

    for (int tag = 0; tag < 256; tag++) {
        bool expected = tag == 1 || (tag >= 3 && tag <= 12) || tag == 15 ||
                        tag == 16 || tag == 18;
        guarantee(constantTag::is_valid_tag((u1)tag) == expected, "is_valid_tag");
    }
    printf("  is_valid_tag over 0..255  [PASS]\n\n");
}

void test_constant_pool_index() {
    printf("=== Test: Constant pool indexing and type checks ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    ConstantPool cp(4);
    put_utf8(&cp, 1, "Main");
    cp.klass_index_at_put(2, 1);
    cp.klass_index_at_put(3, 9);                // 名字指向越界位置
    cp.string_index_at_put(4, 1);

    vm_assert(cp.length() == 4, "length");
    vm_assert(cp.tag_at(0).is_invalid() && cp.tag_at(5).is_invalid(), "tag_at out of range");

    const char* s = cp.utf8_at(1, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && strcmp(s, "Main") == 0, "index 1 is the first entry");
    vm_assert(cp.entry_at(1, THREAD)->tag().is_utf8(), "entry_at(1)");
    vm_assert(cp.entry_at(1, THREAD)->utf8_length() == 4, "utf8 length");
    printf("  index 1 -> first entry  [PASS]\n");

    const char* k = cp.klass_name_at(2, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && strcmp(k, "Main") == 0, "klass_name_at");
    const char* str = cp.string_at(4, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && strcmp(str, "Main") == 0, "string_at");
    printf("  klass_name_at / string_at  [PASS]\n");

    cp.utf8_at(0, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_index_out_of_range, "utf8_at(0)");
    cp.entry_at(5, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_index_out_of_range, "entry_at(5)");
    cp.klass_name_at(0, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_index_out_of_range, "klass_name_at(0)");
    cp.klass_name_at(3, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_index_out_of_range,
                     "klass_name_at(3) -> name #9");

    cp.klass_name_at(1, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_type_mismatch, "klass_name_at(Utf8)");
    cp.utf8_at(2, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_type_mismatch, "utf8_at(Class)");
    cp.int_at(1, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_type_mismatch, "int_at(Utf8)");

    const char* name = nullptr;
    const char* sig = nullptr;
    cp.name_and_type_at(2, &name, &sig, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_type_mismatch, "name_and_type_at(Class)");

    // 空池：任何索引都越界
    ConstantPool empty(0);
    empty.entry_at(1, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_index_out_of_range, "empty pool");
    printf("\n");
}

void test_member_ref_resolution() {
    printf("=== Test: Member reference resolution ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    ClassFileBuilder b;
    write_class_header(b);
    b.put_u2(0).put_u2(0).put_u2(0).put_u2(0);  // interfaces, fields, methods, attributes

    InstanceKlass* klass = parse_builder(b, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && klass != nullptr, "header-only class parses");
    ConstantPool* cp = klass->constants();

    const char* k = nullptr;
    const char* n = nullptr;
    const char* s = nullptr;
    cp->member_ref_at(cp_out_fieldref, JVM_CONSTANT_Fieldref, &k, &n, &s, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION, "fieldref resolves");
    vm_assert(strcmp(k, "java/io/PrintStream") == 0, "owner");
    vm_assert(strcmp(n, "out") == 0, "name");
    vm_assert(strcmp(s, "Ljava/io/PrintStream;") == 0, "descriptor");
    printf("  Fieldref -> %s.%s:%s  [PASS]\n", k, n, s);

    cp->member_ref_at(cp_println_methodref, JVM_CONSTANT_Methodref, &k, &n, &s, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION, "methodref resolves");
    vm_assert(strcmp(n, "println") == 0 && strcmp(s, "(Ljava/lang/String;)V") == 0, "println");
    printf("  Methodref -> %s.%s%s  [PASS]\n", k, n, s);

    cp->member_ref_at(cp_out_fieldref, JVM_CONSTANT_Methodref, &k, &n, &s, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_type_mismatch, "Fieldref as Methodref");

    delete klass;
    printf("\n");
}

// ============================================================================
// AccessFlags
// ============================================================================

void test_access_flags() {
    printf("=== Test: AccessFlags ===\n");

    AccessFlags cls(JVM_ACC_PUBLIC | JVM_ACC_SUPER, AccessFlags::class_flags);
    vm_assert(cls.is_public() && cls.is_super(), "class public super");
    vm_assert(!cls.is_synchronized(), "0x0020 is not synchronized on a class");
    vm_assert(cls.length() == 2, "two class flags");
    vm_assert(strcmp(cls.name_at(0), "ACC_PUBLIC") == 0, "canonical order 0");
    vm_assert(strcmp(cls.name_at(1), "ACC_SUPER") == 0, "canonical order 1");
    printf("  class 0x0021 -> ");
    cls.print_on(stdout);
    printf("  [PASS]\n");

    AccessFlags m(JVM_ACC_STATIC | JVM_ACC_PUBLIC | JVM_ACC_SYNCHRONIZED, AccessFlags::method_flags);
    vm_assert(m.is_static() && m.is_public() && m.is_synchronized(), "method flags");
    vm_assert(!m.is_super(), "0x0020 is not super on a method");
    vm_assert(m.length() == 3, "three method flags");
    vm_assert(m.flag_at(0) == JVM_ACC_PUBLIC, "public first");
    vm_assert(m.flag_at(1) == JVM_ACC_STATIC, "static second");
    vm_assert(m.flag_at(2) == JVM_ACC_SYNCHRONIZED, "synchronized third");
    vm_assert(m.contains(JVM_ACC_STATIC) && !m.contains(JVM_ACC_FINAL), "contains");
    printf("  method 0x0029 -> ");
    m.print_on(stdout);
    printf("  [PASS]\n");

    AccessFlags none(0, AccessFlags::method_flags);
    vm_assert(none.length() == 0 && none.flag_at(0) == 0, "empty set");
    printf("  empty flags  [PASS]\n\n");
}

// ============================================================================
// 属性
// ============================================================================

void test_code_attribute() {
    printf("=== Test: Code attribute ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    ConstantPool cp(3);
    put_utf8(&cp, 1, "Code");
    put_utf8(&cp, 2, "LineNumberTable");
    put_utf8(&cp, 3, "Custom");

    static const u1 code[] = { 0x2A, 0xB7, 0x00, 0x01 };
    static const u1 custom[] = { 0x01, 0x02, 0x03 };

    ClassFileBuilder b;
    int code_at = b.begin_attribute(1);
    b.put_u2(3).put_u2(2);                       // max_stack, max_locals
    b.put_u4(sizeof(code)).bytes(code, sizeof(code));
    b.put_u2(2);                                 // exception_table_length
    b.put_u2(0).put_u2(4).put_u2(4).put_u2(0);
    b.put_u2(1).put_u2(3).put_u2(4).put_u2(5);
    b.put_u2(2);                                 // attributes_count
    int lnt_at = b.begin_attribute(2);
    b.put_u2(2).put_u2(0).put_u2(10).put_u2(1).put_u2(11);
    b.end_attribute(lnt_at);
    int custom_at = b.begin_attribute(3);
    b.bytes(custom, sizeof(custom));
    b.end_attribute(custom_at);
    b.end_attribute(code_at);

    ClassFileStream s(b.buffer(), b.length(), "code");
    AttributeInfo* attr = ClassFileParser::parse_attribute(&s, &cp, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && attr != nullptr, "Code parses");
    vm_assert(s.at_eos(), "whole attribute consumed");
    vm_assert(attr->is_code() && strcmp(attr->name(), "Code") == 0, "kind");
    vm_assert(attr->length() == (u4)(b.length() - 6), "declared length");

    CodeAttribute* ca = static_cast<CodeAttribute*>(attr);
    vm_assert(ca->max_stack() == 3 && ca->max_locals() == 2, "max_stack / max_locals");
    vm_assert(ca->code_length() == sizeof(code), "code_length");
    vm_assert(memcmp(ca->code_base(), code, sizeof(code)) == 0, "code bytes");
    printf("  max_stack=3 max_locals=2 code=4 bytes  [PASS]\n");

    vm_assert(ca->exception_table_length() == 2, "two rows");
    const ExceptionTableElement* e0 = ca->exception_table_at(0);
    const ExceptionTableElement* e1 = ca->exception_table_at(1);
    vm_assert(e0->start_pc == 0 && e0->end_pc == 4 && e0->handler_pc == 4 &&
              e0->catch_type_index == 0, "row 0");
    vm_assert(e1->start_pc == 1 && e1->end_pc == 3 && e1->handler_pc == 4 &&
              e1->catch_type_index == 5, "row 1");
    printf("  exception table in order  [PASS]\n");

    const AttributeArray* nested = ca->attributes();
    vm_assert(nested != nullptr && nested->length() == 2, "two nested attributes");
    vm_assert(nested->at(0)->is_line_number_table(), "nested 0 is LineNumberTable");
    vm_assert(nested->at(1)->is_unknown(), "nested 1 is opaque");

    const LineNumberTableAttribute* lnt =
        static_cast<const LineNumberTableAttribute*>(nested->at(0));
    vm_assert(lnt->table_length() == 2, "two lines");
    vm_assert(lnt->line_number_at(1)->line_number == 11, "second line");
    vm_assert(lnt->line_number_for_bci(3) == 11, "bci 3 on line 11");
    vm_assert(lnt->line_number_for_bci(0) == 10, "bci 0 on line 10");

    const UnknownAttribute* blob = static_cast<const UnknownAttribute*>(nested->at(1));
    vm_assert(strcmp(blob->name(), "Custom") == 0, "blob name");
    vm_assert(blob->length() == sizeof(custom), "blob length");
    vm_assert(memcmp(blob->info(), custom, sizeof(custom)) == 0, "blob payload");
    printf("  nested LineNumberTable + opaque blob in order  [PASS]\n");

    attr->print_on(stdout, 2);
    delete attr;
    printf("\n");
}

void test_attribute_length_mismatch() {
    printf("=== Test: Attribute length checks ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    ConstantPool cp(3);
    put_utf8(&cp, 1, "ConstantValue");
    put_utf8(&cp, 2, "SourceFile");
    put_utf8(&cp, 3, "Main.java");

    // ConstantValue 声明 3 字节，只用掉 2 字节
    ClassFileBuilder b1;
    int at = b1.begin_attribute(1);
    b1.put_u2(5).put_u1(0);
    b1.end_attribute(at);
    ClassFileStream s1(b1.buffer(), b1.length(), "cv");
    AttributeInfo* a1 = ClassFileParser::parse_attribute(&s1, &cp, THREAD);
    vm_assert(a1 == nullptr, "no attribute on mismatch");
    vm_assert(contains(thread.exception_message(), "ConstantValue"), "message names attribute");
    expect_exception(THREAD, Exceptions::_attribute_length_mismatch, "ConstantValue with 3 bytes");

    // SourceFile 声明 1 字节，读 u2 时子游标越界
    ClassFileBuilder b2;
    at = b2.begin_attribute(2);
    b2.put_u1(3);
    b2.end_attribute(at);
    ClassFileStream s2(b2.buffer(), b2.length(), "sf");
    ClassFileParser::parse_attribute(&s2, &cp, THREAD);
    expect_exception(THREAD, Exceptions::_io_error, "SourceFile with 1 byte");

    // 声明长度超过剩余字节
    ClassFileBuilder b3;
    b3.put_u2(2).put_u4(100).put_u2(3);
    ClassFileStream s3(b3.buffer(), b3.length(), "long");
    ClassFileParser::parse_attribute(&s3, &cp, THREAD);
    vm_assert(s3.current_offset() == 6, "payload not consumed");
    expect_exception(THREAD, Exceptions::_io_error, "length 100 with 2 bytes left");

    // 名字必须是 Utf8
    ClassFileBuilder b4;
    b4.put_u2(9).put_u4(0);
    ClassFileStream s4(b4.buffer(), b4.length(), "name");
    ClassFileParser::parse_attribute(&s4, &cp, THREAD);
    expect_exception(THREAD, Exceptions::_constant_pool_index_out_of_range, "name index 9");

    // 合法的 SourceFile
    ClassFileBuilder b5;
    at = b5.begin_attribute(2);
    b5.put_u2(3);
    b5.end_attribute(at);
    ClassFileStream s5(b5.buffer(), b5.length(), "sf");
    AttributeInfo* a5 = ClassFileParser::parse_attribute(&s5, &cp, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && a5 != nullptr && a5->is_source_file(), "SourceFile");
    vm_assert(strcmp(static_cast<SourceFileAttribute*>(a5)->source_file(), "Main.java") == 0,
              "SourceFile text");
    printf("  SourceFile -> Main.java  [PASS]\n");
    delete a5;
    printf("\n");
}

// ============================================================================
// ClassFileParser
// ============================================================================

void test_parse_class() {
    printf("=== Test: ClassFileParser ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    ClassFileBuilder b;
    build_main_class(b, hello_code, sizeof(hello_code));
    InstanceKlass* klass = parse_builder(b, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && klass != nullptr, "class parses");

    vm_assert(klass->has_valid_magic(), "magic");
    vm_assert(klass->major_version() == 55 && klass->minor_version() == 0, "version");
    vm_assert(klass->constants()->length() == cp_count - 1, "cp length");
    vm_assert(strcmp(klass->name(), "Main") == 0, "this_class");
    vm_assert(strcmp(klass->super_name(), "java/lang/Object") == 0, "super_class");
    vm_assert(klass->access_flags().is_public() && klass->access_flags().is_super(), "flags");
    vm_assert(klass->methods_count() == 1, "one method");
    vm_assert(klass->source_file() == nullptr, "no SourceFile");

    Method* m = klass->find_method("main", "([Ljava/lang/String;)V");
    vm_assert(m != nullptr && m == klass->find_method("main"), "find_method");
    vm_assert(m->method_holder() == klass, "holder");
    vm_assert(m->is_static() && m->has_code(), "static with code");
    vm_assert(m->code()->code_length() == sizeof(hello_code), "code length");
    vm_assert(klass->find_method("main", "()V") == nullptr, "signature must match");
    printf("  Main extends java/lang/Object, main([Ljava/lang/String;)V  [PASS]\n");

    klass->print_on(stdout);
    delete klass;

    // 魔数错误：解析器只记录，由启动器拒绝
    ClassFileBuilder bad;
    build_main_class(bad, hello_code, sizeof(hello_code));
    const_cast<u1*>(bad.buffer())[3] = 0xBF;
    InstanceKlass* k2 = parse_builder(bad, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && k2 != nullptr, "parses anyway");
    vm_assert(!k2->has_valid_magic(), "magic recorded as read");
    printf("  bad magic recorded, not rejected by the parser  [PASS]\n");
    delete k2;

    // 截断在方法表中间
    ClassFileStream trunc(b.buffer(), b.length() - 10, "truncated");
    ClassFileParser parser(&trunc);
    InstanceKlass* k3 = parser.parse_stream(THREAD);
    vm_assert(k3 == nullptr, "no class on failure");
    expect_exception(THREAD, Exceptions::_io_error, "truncated class file");
    printf("\n");
}

void test_interfaces_unsupported() {
    printf("=== Test: Unsupported interfaces / fields ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    // interfaces_count = 1，后面没有任何字节：
    // 如果解析器先读接口表，得到的会是 IoError
    ClassFileBuilder b;
    write_class_header(b);
    b.put_u2(1);
    InstanceKlass* k = parse_builder(b, THREAD);
    vm_assert(k == nullptr, "no class");
    vm_assert(contains(thread.exception_message(), "Interfaces"), "message");
    expect_exception(THREAD, Exceptions::_unsupported_feature, "interfaces_count = 1");

    ClassFileBuilder f;
    write_class_header(f);
    f.put_u2(0).put_u2(2);
    k = parse_builder(f, THREAD);
    vm_assert(k == nullptr, "no class");
    expect_exception(THREAD, Exceptions::_unsupported_feature, "fields_count = 2");

    // super_class = 0 不被接受
    ClassFileBuilder z;
    write_class_header(z);
    int super_at = z.length() - 2;
    const_cast<u1*>(z.buffer())[super_at] = 0;
    const_cast<u1*>(z.buffer())[super_at + 1] = 0;
    z.put_u2(0).put_u2(0).put_u2(0).put_u2(0);
    k = parse_builder(z, THREAD);
    vm_assert(k == nullptr, "no class");
    expect_exception(THREAD, Exceptions::_constant_pool_index_out_of_range, "super_class = 0");
    printf("\n");
}

// ============================================================================
// 解释器
// ============================================================================

void test_bytecodes() {
    printf("=== Test: Bytecodes ===\n");
    vm_assert(strcmp(Bytecodes::name(Bytecodes::_getstatic), "getstatic") == 0, "getstatic");
    vm_assert(strcmp(Bytecodes::name(Bytecodes::_ldc), "ldc") == 0, "ldc");
    vm_assert(strcmp(Bytecodes::name(Bytecodes::_invokevirtual), "invokevirtual") == 0, "invokevirtual");
    vm_assert(strcmp(Bytecodes::name(Bytecodes::_return), "return") == 0, "return");
    vm_assert(strcmp(Bytecodes::name(0x60), "iadd") == 0, "iadd");
    vm_assert(strcmp(Bytecodes::name(Bytecodes::_breakpoint), "breakpoint") == 0, "breakpoint");
    vm_assert(strcmp(Bytecodes::name(0xCB), "<illegal>") == 0, "0xCB undefined");
    vm_assert(strcmp(Bytecodes::name(0xFF), "<illegal>") == 0, "0xFF undefined");
    vm_assert(!Bytecodes::is_defined(-1), "negative");
    printf("  mnemonics  [PASS]\n\n");
}

void test_interpreter_frame() {
    printf("=== Test: InterpreterFrame ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    u1* code = NEW_C_HEAP_ARRAY(u1, 1, mtTest);
    code[0] = Bytecodes::_return;
    AttributeArray* attrs = new AttributeArray(1);
    attrs->at_put(0, new CodeAttribute(0, "Code", 13, 1, 0, 1, code, 0, nullptr, nullptr));
    Method method(JVM_ACC_STATIC, 0, 0, "main", "()V", attrs);
    ConstantPool cp(0);

    InterpreterFrame frame(&method, method.code(), &cp);
    vm_assert(frame.stack_capacity() == 1, "starts at max_stack");
    vm_assert(frame.is_stack_empty() && frame.code_length() == 1 && frame.bci() == 0, "fresh frame");

    frame.pop(THREAD);
    vm_assert(contains(thread.exception_message(), "underflow"), "message");
    expect_exception(THREAD, Exceptions::_operand_stack_error, "pop on empty stack");

    frame.push(StackValue::for_instance("Ljava/io/PrintStream;"));
    frame.push(StackValue::for_int(7));
    frame.push(StackValue::for_float(0.5f));
    frame.push(StackValue::for_string("hi"));
    vm_assert(frame.stack_depth() == 4, "depth");
    vm_assert(frame.stack_capacity() >= 4, "grew");
    vm_assert(frame.peek(0).is_string() && frame.peek(3).is_instance(), "peek");
    printf("  stack grows past max_stack: ");
    frame.print_stack_on(stdout);
    printf("  [PASS]\n");

    StackValue v = frame.pop(THREAD);
    vm_assert(v.is_string() && strcmp(v.get_string(), "hi") == 0, "LIFO 1");
    v = frame.pop(THREAD);
    vm_assert(v.is_float() && v.get_float() == 0.5f, "LIFO 2");
    v = frame.pop(THREAD);
    vm_assert(v.is_int() && v.get_int() == 7, "LIFO 3");
    v = frame.pop(THREAD);
    vm_assert(v.is_instance() && strcmp(v.instance_type(), "Ljava/io/PrintStream;") == 0, "LIFO 4");
    vm_assert(!HAS_PENDING_EXCEPTION && frame.is_stack_empty(), "empty again");
    printf("  pop order  [PASS]\n");

    // println 对操作数类型的检查
    NativeFunction println = NativeLookup::lookup("java/io/PrintStream", "println",
                                                  "(Ljava/lang/String;)V");
    vm_assert(println != nullptr, "println bound");
    frame.push(StackValue::for_instance("Ljava/io/PrintStream;"));
    frame.push(StackValue::for_int(1));
    println(&frame, THREAD);
    expect_exception(THREAD, Exceptions::_operand_stack_error, "println(int value)");
    // 出错的调用也消耗掉 receiver 和参数
    vm_assert(frame.is_stack_empty(), "failed println leaves no operands");

    frame.push(StackValue::for_int(3));
    frame.push(StackValue::for_string("x"));
    println(&frame, THREAD);
    expect_exception(THREAD, Exceptions::_operand_stack_error, "println on int receiver");
    vm_assert(frame.is_stack_empty(), "failed println leaves no operands");

    frame.push(StackValue::for_string("x"));
    println(&frame, THREAD);
    expect_exception(THREAD, Exceptions::_operand_stack_error, "println without receiver");
    vm_assert(frame.is_stack_empty(), "underflow leaves empty stack");
    printf("\n");
}

void test_native_lookup() {
    printf("=== Test: NativeLookup ===\n");
    vm_assert(NativeLookup::number_of_natives() == 1, "one native");
    vm_assert(NativeLookup::lookup("java/io/PrintStream", "println",
                                   "(Ljava/lang/String;)V") != nullptr, "println(String)");
    vm_assert(NativeLookup::lookup("java/io/PrintStream", "println", "(I)V") == nullptr,
              "println(int) not bound");
    vm_assert(NativeLookup::lookup("java/io/PrintStream", "print",
                                   "(Ljava/lang/String;)V") == nullptr, "print not bound");
    vm_assert(NativeLookup::lookup("java/lang/PrintStream", "println",
                                   "(Ljava/lang/String;)V") == nullptr, "owner must match");
    NativeLookup::print_natives_on(stdout);
    printf("  [PASS]\n\n");
}

void test_hello_world_execution() {
    printf("=== Test: Hello, World! ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    ClassFileBuilder b;
    build_main_class(b, hello_code, sizeof(hello_code));
    InstanceKlass* klass = parse_builder(b, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && klass != nullptr, "class parses");

    char out[256];
    run_and_capture(klass, THREAD, out, sizeof(out));
    vm_assert(!HAS_PENDING_EXCEPTION, "runs cleanly");
    vm_assert(strcmp(out, "Hello, World!\n") == 0, "exactly one line");
    vm_assert(thread.current_method() == nullptr, "current method reset");
    printf("  output = \"Hello, World!\\n\"  [PASS]\n");
    delete klass;

    // 末尾的单字节 return 不会被执行
    u1 with_return[sizeof(hello_code) + 1];
    memcpy(with_return, hello_code, sizeof(hello_code));
    with_return[sizeof(hello_code)] = Bytecodes::_return;
    ClassFileBuilder r;
    build_main_class(r, with_return, sizeof(with_return));
    klass = parse_builder(r, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && klass != nullptr, "class parses");
    run_and_capture(klass, THREAD, out, sizeof(out));
    vm_assert(!HAS_PENDING_EXCEPTION, "trailing return is not dispatched");
    vm_assert(strcmp(out, "Hello, World!\n") == 0, "same output");
    printf("  trailing return byte skipped  [PASS]\n");
    delete klass;
    printf("\n");
}

void test_unknown_opcode() {
    printf("=== Test: Unimplemented opcode ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    // hello + iadd + 填充字节
    u1 code[sizeof(hello_code) + 2];
    memcpy(code, hello_code, sizeof(hello_code));
    code[sizeof(hello_code)] = 0x60;
    code[sizeof(hello_code) + 1] = Bytecodes::_nop;

    ClassFileBuilder b;
    build_main_class(b, code, sizeof(code));
    InstanceKlass* klass = parse_builder(b, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && klass != nullptr, "class parses");

    char out[256];
    run_and_capture(klass, THREAD, out, sizeof(out));
    vm_assert(strcmp(out, "Hello, World!\n") == 0, "earlier output kept, nothing after");
    vm_assert(contains(thread.exception_message(), "0x60"), "opcode in message");
    vm_assert(contains(thread.exception_message(), "iadd"), "mnemonic in message");
    vm_assert(contains(thread.exception_message(), "bci 8"), "bci in message");
    vm_assert(thread.current_method() == nullptr, "current method reset");
    expect_exception(THREAD, Exceptions::_unimplemented_opcode, "iadd at bci 8");
    delete klass;
    printf("\n");
}

void test_ldc_non_string() {
    printf("=== Test: ldc of a non-String constant ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    u1 code[] = { Bytecodes::_ldc, cp_int_42, Bytecodes::_nop };
    ClassFileBuilder b;
    build_main_class(b, code, sizeof(code));
    InstanceKlass* klass = parse_builder(b, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && klass != nullptr, "class parses");

    char out[64];
    run_and_capture(klass, THREAD, out, sizeof(out));
    vm_assert(out[0] == '\0', "no output");
    vm_assert(contains(thread.exception_message(), "Integer"), "tag named");
    expect_exception(THREAD, Exceptions::_unsupported_feature, "ldc Integer");
    delete klass;

    // 操作数越界
    u1 bad[] = { Bytecodes::_ldc, 200, Bytecodes::_nop };
    ClassFileBuilder b2;
    build_main_class(b2, bad, sizeof(bad));
    klass = parse_builder(b2, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && klass != nullptr, "class parses");
    run_and_capture(klass, THREAD, out, sizeof(out));
    expect_exception(THREAD, Exceptions::_constant_pool_index_out_of_range, "ldc #200");
    delete klass;
    printf("\n");
}

void test_unknown_native() {
    printf("=== Test: Unbound native method ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    u1 code[] = {
        Bytecodes::_getstatic,     0x00, cp_out_fieldref,
        Bytecodes::_ldc,           cp_hello_string,
        Bytecodes::_invokevirtual, 0x00, cp_print_methodref,
        Bytecodes::_nop
    };
    ClassFileBuilder b;
    build_main_class(b, code, sizeof(code));
    InstanceKlass* klass = parse_builder(b, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && klass != nullptr, "class parses");

    char out[64];
    run_and_capture(klass, THREAD, out, sizeof(out));
    vm_assert(out[0] == '\0', "no output");
    vm_assert(contains(thread.exception_message(), "java/io/PrintStream.print("), "target named");
    expect_exception(THREAD, Exceptions::_unsupported_feature, "PrintStream.print");
    delete klass;

    // getstatic 的操作数必须是 Fieldref
    u1 wrong[] = { Bytecodes::_getstatic, 0x00, cp_println_methodref, Bytecodes::_nop };
    ClassFileBuilder b2;
    build_main_class(b2, wrong, sizeof(wrong));
    klass = parse_builder(b2, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && klass != nullptr, "class parses");
    run_and_capture(klass, THREAD, out, sizeof(out));
    expect_exception(THREAD, Exceptions::_constant_pool_type_mismatch, "getstatic Methodref");
    delete klass;
    printf("\n");
}

void test_missing_main() {
    printf("=== Test: Missing entry point ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    ClassFileBuilder b;
    build_main_class(b, hello_code, sizeof(hello_code), cp_println_utf8);
    InstanceKlass* klass = parse_builder(b, THREAD);
    vm_assert(!HAS_PENDING_EXCEPTION && klass != nullptr, "class parses");
    vm_assert(klass->find_method("main") == nullptr, "no main");

    BytecodeInterpreter::run_main(klass, THREAD);
    expect_exception(THREAD, Exceptions::_no_such_method, "class without main");
    delete klass;
    printf("\n");
}

// ============================================================================
// ClassLoader + 真实的 javac 产物
// ============================================================================

void test_class_loader(const char* path) {
    printf("=== Test: ClassLoader (%s) ===\n", path);
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    InstanceKlass* klass = ClassLoader::load_class_file(path, THREAD);
    if (HAS_PENDING_EXCEPTION) {
        Exceptions::print_pending_exception(THREAD, stderr);
    }
    guarantee(klass != nullptr, "HelloWorld.class loads");

    vm_assert(klass->has_valid_magic(), "magic");
    vm_assert(strcmp(klass->name(), "HelloWorld") == 0, "this_class");
    vm_assert(strcmp(klass->super_name(), "java/lang/Object") == 0, "super_class");
    vm_assert(klass->methods_count() == 2, "<init> and main");
    vm_assert(klass->source_file() != nullptr &&
              strcmp(klass->source_file(), "HelloWorld.java") == 0, "SourceFile");

    Method* main_method = klass->find_method("main", "([Ljava/lang/String;)V");
    vm_assert(main_method != nullptr && main_method->is_static() &&
              main_method->access_flags().is_public(), "main");
    vm_assert(main_method->line_number_from_bci(0) == 3, "line of getstatic");
    vm_assert(main_method->line_number_from_bci(8) == 4, "line of return");
    vm_assert(klass->find_method("<init>", "()V") != nullptr, "<init>");
    printf("  HelloWorld extends java/lang/Object, SourceFile HelloWorld.java  [PASS]\n");

    char out[256];
    run_and_capture(klass, THREAD, out, sizeof(out));
    vm_assert(!HAS_PENDING_EXCEPTION, "runs cleanly");
    vm_assert(strcmp(out, "Hello, World!\n") == 0, "output");
    printf("  output = \"Hello, World!\\n\"  [PASS]\n");
    delete klass;

    InstanceKlass* missing = ClassLoader::load_class_file("no/such/Class.class", THREAD);
    vm_assert(missing == nullptr, "nothing loaded");
    expect_exception(THREAD, Exceptions::_io_error, "missing file");
    printf("\n");
}

// 长度超过 int 的文件在分配缓冲区之前就被拒绝（稀疏文件，不占磁盘）
void test_class_loader_oversized_file() {
    printf("=== Test: ClassLoader rejects files over 2 GiB ===\n");
    JavaThread thread("test");
    JavaThread* THREAD = &thread;

    char path[] = "/tmp/picojvm_oversized_XXXXXX";
    int fd = mkstemp(path);
    guarantee(fd >= 0, "mkstemp");
    FILE* f = fdopen(fd, "wb");
    guarantee(f != nullptr, "fdopen");
    guarantee(fseek(f, (long)INT_MAX, SEEK_SET) == 0, "seek past 2 GiB");
    guarantee(fputc(0, f) != EOF, "write last byte");
    fclose(f);

    InstanceKlass* klass = ClassLoader::load_class_file(path, THREAD);
    vm_assert(klass == nullptr, "nothing loaded");
    vm_assert(contains(thread.exception_message(), "too large"), "size in message");
    expect_exception(THREAD, Exceptions::_io_error, "oversized file");
    remove(path);
    printf("\n");
}

int main(int argc, char** argv) {
    printf("========================================\n");
    printf("  Pico JVM - Regression Tests\n");
    printf("========================================\n\n");

    test_bytes();
    test_exceptions();
    test_classfile_stream();

    test_constant_pool_entries();
    test_malformed_constant_pool_tag();
    test_constant_pool_index();
    test_member_ref_resolution();
    test_access_flags();

    test_code_attribute();
    test_attribute_length_mismatch();
    test_parse_class();
    test_interfaces_unsupported();

    test_bytecodes();
    test_interpreter_frame();
    test_native_lookup();
    test_hello_world_execution();
    test_unknown_opcode();
    test_ldc_non_string();
    test_unknown_native();
    test_missing_main();

    if (argc > 1) {
        test_class_loader(argv[1]);
    } else {
        test_class_loader("test/HelloWorld.class");
    }

    test_class_loader_oversized_file();

    printf("========================================\n");
    printf("  All tests passed!\n");
    printf("========================================\n");
    return 0;
}
