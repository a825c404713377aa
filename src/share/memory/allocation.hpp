#ifndef SHARE_MEMORY_ALLOCATION_HPP
#define SHARE_MEMORY_ALLOCATION_HPP

// ============================================================================
// Pico JVM - 内存分配基类
// 对应 HotSpot: src/hotspot/share/memory/allocation.hpp
//
//   CHeapObj  - C 堆对象 (malloc/free)
//   StackObj  - 栈对象 (禁止 new)
//   AllStatic - 纯静态类 (无实例)
//
// 没有 Java 堆和 Metaspace：类元数据（常量池、方法、属性）都在 C 堆上，
// 由 InstanceKlass 逐层拥有并释放。
// ============================================================================

#include "utilities/globalDefinitions.hpp"
#include "utilities/debug.hpp"

// HotSpot 用于 NMT 分类，这里只做标注
enum MemoryType {
    mtClass,           // 类元数据
    mtThread,          // 线程与解释器帧
    mtInternal,        // 内部使用（文件缓冲区等）
    mtTest,            // 测试
    mt_number_of_types
};

typedef MemoryType MEMFLAGS;

inline void* AllocateHeap(size_t size, MEMFLAGS flags) {
    (void)flags;  // 没有 NMT，分类只用于标注调用点
    // malloc(0) 可能返回 nullptr，统一至少分配 1 字节
    void* p = ::malloc(size > 0 ? size : 1);
    if (p == nullptr) {
        report_vm_error(__FILE__, __LINE__,
            "OutOfMemoryError", "AllocateHeap: malloc failed");
    }
    return p;
}

inline void* ReallocateHeap(void* old_ptr, size_t size, MEMFLAGS flags) {
    (void)flags;
    void* p = ::realloc(old_ptr, size > 0 ? size : 1);
    if (p == nullptr) {
        report_vm_error(__FILE__, __LINE__,
            "OutOfMemoryError", "ReallocateHeap: realloc failed");
    }
    return p;
}

inline void FreeHeap(void* p) {
    ::free(p);
}

// ============================================================================
// CHeapObj - C 堆对象基类
// ============================================================================

template <MEMFLAGS F>
class CHeapObj {
public:
    void* operator new(size_t size) {
        return AllocateHeap(size, F);
    }

    void operator delete(void* p) {
        FreeHeap(p);
    }

    void* operator new[](size_t size) {
        return AllocateHeap(size, F);
    }

    void operator delete[](void* p) {
        FreeHeap(p);
    }
};

// ============================================================================
// StackObj - 栈对象基类
// ============================================================================

class StackObj {
private:
    void* operator new(size_t size) throw();
    void* operator new[](size_t size) throw();
    void  operator delete(void* p);
    void  operator delete[](void* p);
};

// ============================================================================
// AllStatic - 纯静态类
// ============================================================================

class AllStatic {
public:
    AllStatic()  { ShouldNotCallThis(); }
    ~AllStatic() { ShouldNotCallThis(); }
};

#define NEW_C_HEAP_ARRAY(type, size, memflags) \
    ((type*)AllocateHeap((size) * sizeof(type), memflags))

#define REALLOC_C_HEAP_ARRAY(type, old, size, memflags) \
    ((type*)ReallocateHeap((char*)(old), (size) * sizeof(type), memflags))

#define FREE_C_HEAP_ARRAY(type, old) \
    FreeHeap((char*)(old))

// 复制一个 C 字符串到 C 堆
inline char* os_strdup(const char* s, MEMFLAGS flags) {
    size_t len = strlen(s);
    char* dup = NEW_C_HEAP_ARRAY(char, len + 1, flags);
    memcpy(dup, s, len + 1);
    return dup;
}

#endif // SHARE_MEMORY_ALLOCATION_HPP
