//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "usage.hpp"

#include "jnigen/version.hpp"

#include <iostream>

namespace jnigen::tools
{

void printVersion()
{
    std::cout << "jnigen v" << JNIGEN_VERSION_STR << "\n";
    std::cout << "JNI glue code generator\n";
}

void printUsage()
{
    std::cerr << "jnigen v" << JNIGEN_VERSION_STR << " - JNI glue code generator\n"
              << "\n"
              << "Usage: jnigen [options]\n"
              << "       jnigen unit <File.java> <File.h> [-o <out.cpp>]\n"
              << "\n"
              << "Usage Modes:\n"
              << "  jnigen                         Generate for every native class under src/\n"
              << "  jnigen unit Foo.java Foo.h     Print the unit for one source/header pair\n"
              << "\n"
              << "Options:\n"
              << "  --source DIR                   Java source root (default: src)\n"
              << "  --classpath DIR                Compiled classes (default: bin)\n"
              << "  --jni DIR                      Output directory (default: jni)\n"
              << "  --include PATTERN              Ant-style include pattern (repeatable)\n"
              << "  --exclude PATTERN              Ant-style exclude pattern (repeatable)\n"
              << "  --header-tool javah|javac|none How JNI headers are produced (default: javah)\n"
              << "  --jdk-include DIR              Copy jni.h and friends from DIR\n"
              << "  --project FILE                 Read settings from FILE (default: ./jnigen.project)\n"
              << "  -o, --output FILE              Output file for unit mode\n"
              << "  --trace                        Trace generation phases on stderr\n"
              << "  --quiet                        Suppress progress lines\n"
              << "  -h, --help                     Show this help message\n"
              << "  --version                      Show version information\n"
              << "\n"
              << "Environment:\n"
              << "  JNIGEN_TRACE                   Non-empty value enables --trace\n"
              << "\n";
}

} // namespace jnigen::tools
