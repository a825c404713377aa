#include "runtime/arguments.hpp"
#include <cstring>
#include <cstdio>

// ============================================================================
// Arguments - 命令行参数解析
// 对照 HotSpot: src/hotspot/share/runtime/arguments.cpp
// ============================================================================

const char* Arguments::_class_file      = nullptr;
bool        Arguments::_verbose         = false;
bool        Arguments::_trace_class     = false;
bool        Arguments::_trace_bytecodes = false;
const char* Arguments::_expected_class  = nullptr;
const char* Arguments::_expected_super  = nullptr;
bool        Arguments::_help_requested  = false;

void Arguments::reset() {
    _class_file      = nullptr;
    _verbose         = false;
    _trace_class     = false;
    _trace_bytecodes = false;
    _expected_class  = nullptr;
    _expected_super  = nullptr;
    _help_requested  = false;
}

bool Arguments::take_value(int argc, char** argv, int* i, const char** value) {
    if (*i + 1 >= argc) {
        fprintf(stderr, "Error: %s requires an argument\n", argv[*i]);
        return false;
    }
    *value = argv[*i + 1];
    *i += 2;
    return true;
}

bool Arguments::parse(int argc, char** argv) {
    int i = 1;
    while (i < argc) {
        const char* arg = argv[i];

        if (strcmp(arg, "-help") == 0 || strcmp(arg, "-h") == 0 ||
            strcmp(arg, "--help") == 0) {
            _help_requested = true;
            return false;
        }

        if (strcmp(arg, "-verbose") == 0) {
            _verbose = true;
            i++;
            continue;
        }

        // -Xtrace:<what>
        if (strncmp(arg, "-Xtrace:", 8) == 0) {
            const char* what = arg + 8;
            if (strcmp(what, "class") == 0) {
                _trace_class = true;
            } else if (strcmp(what, "bytecodes") == 0) {
                _trace_bytecodes = true;
            } else {
                fprintf(stderr, "Error: Unknown trace option: %s\n", what);
                return false;
            }
            i++;
            continue;
        }

        if (strcmp(arg, "-expect-class") == 0) {
            if (!take_value(argc, argv, &i, &_expected_class)) return false;
            continue;
        }

        if (strcmp(arg, "-expect-super") == 0) {
            if (!take_value(argc, argv, &i, &_expected_super)) return false;
            continue;
        }

        // 未知的 - 开头参数
        if (arg[0] == '-') {
            fprintf(stderr, "Error: Unrecognized option: %s\n", arg);
            return false;
        }

        if (_class_file != nullptr) {
            fprintf(stderr, "Error: More than one class file given: %s, %s\n",
                    _class_file, arg);
            return false;
        }
        _class_file = arg;
        i++;
    }

    if (_class_file == nullptr) {
        fprintf(stderr, "Error: No class file given\n");
        return false;
    }

    return true;
}

void Arguments::print_usage(FILE* out) {
    fprintf(out,
        "Usage: picojvm [options] <classfile>\n"
        "\n"
        "Options:\n"
        "  -verbose              Print VM lifecycle messages and the parsed class\n"
        "  -Xtrace:class         Trace attribute parsing\n"
        "  -Xtrace:bytecodes     Trace executed bytecodes\n"
        "  -expect-class <name>  Fail unless this_class resolves to <name>\n"
        "  -expect-super <name>  Fail unless super_class resolves to <name>\n"
        "  -help                 Print this message\n"
        "\n"
        "Examples:\n"
        "  picojvm test/HelloWorld.class\n"
        "  picojvm -expect-class HelloWorld -expect-super java/lang/Object HelloWorld.class\n"
        "  picojvm -Xtrace:bytecodes HelloWorld.class\n"
    );
}
