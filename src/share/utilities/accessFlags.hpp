#ifndef SHARE_UTILITIES_ACCESSFLAGS_HPP
#define SHARE_UTILITIES_ACCESSFLAGS_HPP

// ============================================================================
// Pico JVM - 访问标志
// 对应 HotSpot: src/hotspot/share/utilities/accessFlags.hpp
//
// class 文件里的 access_flags 是一个 u2 位掩码。
// 同一个位在不同上下文含义不同（0x0020 对类是 ACC_SUPER，对方法是
// ACC_SYNCHRONIZED），所以解码时要指明是类标志还是方法标志。
//
// 解码出的"命名标志集合"按固定的规范顺序排列（不是位序）：
//   类:   public final super interface abstract synthetic annotation enum
//   方法: public private protected static final synchronized bridge
//         varargs native abstract strict synthetic
// ============================================================================

#include "utilities/globalDefinitions.hpp"

// JVMS Table 4.1-B, 4.6-A
const jint JVM_ACC_PUBLIC       = 0x0001;
const jint JVM_ACC_PRIVATE      = 0x0002;
const jint JVM_ACC_PROTECTED    = 0x0004;
const jint JVM_ACC_STATIC       = 0x0008;
const jint JVM_ACC_FINAL        = 0x0010;
const jint JVM_ACC_SYNCHRONIZED = 0x0020;   // 方法
const jint JVM_ACC_SUPER        = 0x0020;   // 类
const jint JVM_ACC_BRIDGE       = 0x0040;   // 方法
const jint JVM_ACC_VARARGS      = 0x0080;   // 方法
const jint JVM_ACC_NATIVE       = 0x0100;
const jint JVM_ACC_INTERFACE    = 0x0200;
const jint JVM_ACC_ABSTRACT     = 0x0400;
const jint JVM_ACC_STRICT       = 0x0800;
const jint JVM_ACC_SYNTHETIC    = 0x1000;
const jint JVM_ACC_ANNOTATION   = 0x2000;
const jint JVM_ACC_ENUM         = 0x4000;

// .class 文件中实际写入的标志掩码
const jint JVM_ACC_WRITTEN_FLAGS = 0x00007FFF;

// ============================================================================
// AccessFlags
//
// 构造时按上下文解码一次，之后只读。
// ============================================================================

class AccessFlags {
public:
    enum Context {
        class_flags,
        method_flags
    };

    enum { max_named_flags = 12 };

private:
    jint    _flags;
    Context _context;
    int     _length;                          // 解码出的命名标志个数
    jint    _named[max_named_flags];          // 按规范顺序排列的标志位

    void decode();

public:
    AccessFlags() : _flags(0), _context(class_flags), _length(0) {}
    AccessFlags(jint flags, Context context)
        : _flags(flags & JVM_ACC_WRITTEN_FLAGS), _context(context), _length(0) {
        decode();
    }

    // ======== 原始掩码 ========

    jint    get_flags() const { return _flags; }
    Context context()   const { return _context; }

    bool is_public()       const { return (_flags & JVM_ACC_PUBLIC)       != 0; }
    bool is_private()      const { return (_flags & JVM_ACC_PRIVATE)      != 0; }
    bool is_protected()    const { return (_flags & JVM_ACC_PROTECTED)    != 0; }
    bool is_static()       const { return (_flags & JVM_ACC_STATIC)       != 0; }
    bool is_final()        const { return (_flags & JVM_ACC_FINAL)        != 0; }
    bool is_native()       const { return (_flags & JVM_ACC_NATIVE)       != 0; }
    bool is_interface()    const { return (_flags & JVM_ACC_INTERFACE)    != 0; }
    bool is_abstract()     const { return (_flags & JVM_ACC_ABSTRACT)     != 0; }
    bool is_synthetic()    const { return (_flags & JVM_ACC_SYNTHETIC)    != 0; }

    // 0x0020 只有在对应上下文里才有意义
    bool is_super() const {
        return _context == class_flags && (_flags & JVM_ACC_SUPER) != 0;
    }
    bool is_synchronized() const {
        return _context == method_flags && (_flags & JVM_ACC_SYNCHRONIZED) != 0;
    }

    // ======== 命名标志集合 ========

    int  length() const { return _length; }

    jint flag_at(int i) const {
        return (i >= 0 && i < _length) ? _named[i] : 0;
    }

    // 例如 "ACC_PUBLIC"
    const char* name_at(int i) const;

    bool contains(jint bit) const {
        for (int i = 0; i < _length; i++) {
            if (_named[i] == bit) return true;
        }
        return false;
    }

    // 形如 "0x0021 [ACC_PUBLIC, ACC_SUPER]"
    void print_on(FILE* out) const;
};

#endif // SHARE_UTILITIES_ACCESSFLAGS_HPP
