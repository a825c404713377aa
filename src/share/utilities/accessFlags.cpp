// ============================================================================
// Pico JVM - 访问标志解码
// ============================================================================

#include "utilities/accessFlags.hpp"
#include "utilities/debug.hpp"

struct FlagName {
    jint        bit;
    const char* name;
};

// 规范顺序，不是位序
static const FlagName class_flag_table[] = {
    { JVM_ACC_PUBLIC,     "ACC_PUBLIC"     },
    { JVM_ACC_FINAL,      "ACC_FINAL"      },
    { JVM_ACC_SUPER,      "ACC_SUPER"      },
    { JVM_ACC_INTERFACE,  "ACC_INTERFACE"  },
    { JVM_ACC_ABSTRACT,   "ACC_ABSTRACT"   },
    { JVM_ACC_SYNTHETIC,  "ACC_SYNTHETIC"  },
    { JVM_ACC_ANNOTATION, "ACC_ANNOTATION" },
    { JVM_ACC_ENUM,       "ACC_ENUM"       },
};

static const FlagName method_flag_table[] = {
    { JVM_ACC_PUBLIC,       "ACC_PUBLIC"       },
    { JVM_ACC_PRIVATE,      "ACC_PRIVATE"      },
    { JVM_ACC_PROTECTED,    "ACC_PROTECTED"    },
    { JVM_ACC_STATIC,       "ACC_STATIC"       },
    { JVM_ACC_FINAL,        "ACC_FINAL"        },
    { JVM_ACC_SYNCHRONIZED, "ACC_SYNCHRONIZED" },
    { JVM_ACC_BRIDGE,       "ACC_BRIDGE"       },
    { JVM_ACC_VARARGS,      "ACC_VARARGS"      },
    { JVM_ACC_NATIVE,       "ACC_NATIVE"       },
    { JVM_ACC_ABSTRACT,     "ACC_ABSTRACT"     },
    { JVM_ACC_STRICT,       "ACC_STRICT"       },
    { JVM_ACC_SYNTHETIC,    "ACC_SYNTHETIC"    },
};

static const FlagName* table_for(AccessFlags::Context context, int* size) {
    if (context == AccessFlags::class_flags) {
        *size = (int)ARRAY_SIZE(class_flag_table);
        return class_flag_table;
    }
    *size = (int)ARRAY_SIZE(method_flag_table);
    return method_flag_table;
}

void AccessFlags::decode() {
    int size = 0;
    const FlagName* table = table_for(_context, &size);
    vm_assert(size <= max_named_flags, "flag table too large");

    _length = 0;
    for (int i = 0; i < size; i++) {
        if ((_flags & table[i].bit) != 0) {
            _named[_length++] = table[i].bit;
        }
    }
}

const char* AccessFlags::name_at(int i) const {
    jint bit = flag_at(i);
    int size = 0;
    const FlagName* table = table_for(_context, &size);
    for (int k = 0; k < size; k++) {
        if (table[k].bit == bit) return table[k].name;
    }
    return "?";
}

void AccessFlags::print_on(FILE* out) const {
    fprintf(out, "0x%04x [", (unsigned)_flags);
    for (int i = 0; i < _length; i++) {
        fprintf(out, "%s%s", i > 0 ? ", " : "", name_at(i));
    }
    fprintf(out, "]");
}
