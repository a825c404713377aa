#ifndef SHARE_UTILITIES_GLOBALDEFINITIONS_HPP
#define SHARE_UTILITIES_GLOBALDEFINITIONS_HPP

// ============================================================================
// Pico JVM - 基础类型定义
// 对应 HotSpot: src/hotspot/share/utilities/globalDefinitions.hpp
//
// 只保留 class 文件解析和解释器真正用到的部分：
//   JNI 基础类型、class 文件的 u1/u2/u4/u8、若干工具宏。
// ============================================================================

#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <cstdio>

// ----------------------------------------------------------------------------
// 1. JNI 基础类型（LP64 Linux）
// ----------------------------------------------------------------------------

typedef signed char    jbyte;
typedef unsigned char  jboolean;
typedef unsigned short jchar;
typedef short          jshort;
typedef int            jint;
typedef long           jlong;      // LP64 下 long = 64 bit
typedef float          jfloat;
typedef double         jdouble;

typedef unsigned char  jubyte;
typedef unsigned short jushort;
typedef unsigned int   juint;
typedef unsigned long  julong;

// ----------------------------------------------------------------------------
// 2. VM 扩展类型
// ----------------------------------------------------------------------------

typedef unsigned char  u_char;
typedef u_char*        address;

// ----------------------------------------------------------------------------
// 3. Class 文件格式类型（JVMS §4）
// ----------------------------------------------------------------------------

typedef jubyte  u1;
typedef jushort u2;
typedef juint   u4;
typedef julong  u8;

typedef jbyte   s1;
typedef jshort  s2;
typedef jint    s4;
typedef jlong   s8;

// Java Class 文件魔数
const u4 JAVA_CLASSFILE_MAGIC = 0xCAFEBABE;

// ----------------------------------------------------------------------------
// 4. 工具宏
// ----------------------------------------------------------------------------

template<class T> inline T MAX2(T a, T b) { return (a > b) ? a : b; }
template<class T> inline T MIN2(T a, T b) { return (a < b) ? a : b; }

#define ARRAY_SIZE(array) (sizeof(array) / sizeof((array)[0]))

// 禁止拷贝
#define NONCOPYABLE(C)  \
    C(const C&) = delete; \
    C& operator=(const C&) = delete

#endif // SHARE_UTILITIES_GLOBALDEFINITIONS_HPP
