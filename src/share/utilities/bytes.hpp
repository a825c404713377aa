#ifndef SHARE_UTILITIES_BYTES_HPP
#define SHARE_UTILITIES_BYTES_HPP

// ============================================================================
// Pico JVM - 字节序处理
// 对应 HotSpot: utilities/bytes.hpp + cpu/x86/bytes_x86.hpp
//
// .class 文件统一使用大端序 (Big-Endian)。
// 例如 u2 值 0x0037 (major_version 55):
//   文件字节: [0x00, 0x37]
//   小端机器直接读 = 0x3700，翻转后 = 0x0037
//
// 与 HotSpot 一样，本机字节序在编译期确定；大端机器上不做翻转。
// ============================================================================

#include "utilities/globalDefinitions.hpp"
#include <byteswap.h>   // bswap_16, bswap_32, bswap_64
#include <cstring>

class Endian {
public:
    enum Order {
        LITTLE,
        BIG,
        JAVA   = BIG,
#if defined(__BYTE_ORDER__) && (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)
        NATIVE = BIG
#else
        NATIVE = LITTLE
#endif
    };

    static inline bool is_Java_byte_ordering_different() {
        return NATIVE != JAVA;
    }
};

class Bytes {
public:
    static inline u2 swap_u2(u2 x) { return bswap_16(x); }
    static inline u4 swap_u4(u4 x) { return bswap_32(x); }
    static inline u8 swap_u8(u8 x) { return bswap_64(x); }

    // 对齐与否都用 memcpy，class 文件里的数据没有对齐保证
    template <typename T>
    static inline T get_native(const void* p) {
        T x;
        memcpy(&x, p, sizeof(T));
        return x;
    }

    // ========== Java (大端序) 读取 ==========

    static inline u2 get_Java_u2(const u1* p) {
        u2 x = get_native<u2>(p);
        return Endian::is_Java_byte_ordering_different() ? swap_u2(x) : x;
    }

    static inline u4 get_Java_u4(const u1* p) {
        u4 x = get_native<u4>(p);
        return Endian::is_Java_byte_ordering_different() ? swap_u4(x) : x;
    }

    static inline u8 get_Java_u8(const u1* p) {
        u8 x = get_native<u8>(p);
        return Endian::is_Java_byte_ordering_different() ? swap_u8(x) : x;
    }

    // ========== Java (大端序) 写入 ==========
    // 测试里用它拼装 class 文件

    static inline void put_Java_u2(address p, u2 x) {
        if (Endian::is_Java_byte_ordering_different()) {
            x = swap_u2(x);
        }
        memcpy(p, &x, sizeof(u2));
    }

    static inline void put_Java_u4(address p, u4 x) {
        if (Endian::is_Java_byte_ordering_different()) {
            x = swap_u4(x);
        }
        memcpy(p, &x, sizeof(u4));
    }

    static inline void put_Java_u8(address p, u8 x) {
        if (Endian::is_Java_byte_ordering_different()) {
            x = swap_u8(x);
        }
        memcpy(p, &x, sizeof(u8));
    }
};

#endif // SHARE_UTILITIES_BYTES_HPP
