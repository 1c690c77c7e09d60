// =============================================================================
// Kuzur — main entry point
// =============================================================================
//
// Usage:
//   kuzur <file.kz>          Execute a Kuzur script
//   kuzur --check <file.kz>  Parse-only check (lex + parse, no execution)
//   kuzur --version          Print version information
//   kuzur --help             Print usage help
//
// Exit status: 0 success, 1 Kuzur error, 2 usage error or unreadable file.
//
// =============================================================================

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "runner/runner.hpp"

#ifndef KUZUR_VERSION
#define KUZUR_VERSION "1.0.0"
#endif

static constexpr int EXIT_USAGE = 2;

// ---- Helpers ----------------------------------------------------------------

static bool readFile(const std::string &path, std::string &contents)
{
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
    {
        std::cerr << "Error: Cannot open file '" << path << "'\n";
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    contents = ss.str();
    return true;
}

static bool hasKuzurExtension(const std::string &path)
{
    const std::string ext = ".kz";
    return path.size() > ext.size() &&
           path.compare(path.size() - ext.size(), ext.size(), ext) == 0;
}

static void printVersion()
{
    std::cout << "Kuzur " << KUZUR_VERSION << "\n";
}

static void printHelp(std::ostream &os)
{
    os << "Usage:\n";
    os << "  kuzur <file.kz>          Execute a Kuzur script\n";
    os << "  kuzur --check <file.kz>  Parse-only check\n";
    os << "  kuzur --version          Show version\n";
    os << "  kuzur --help             Show this help\n";
}

// ---- Main -------------------------------------------------------------------

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        printHelp(std::cout);
        return 0;
    }

    std::string arg = argv[1];

    if (arg == "--version" || arg == "-V")
    {
        printVersion();
        return 0;
    }

    if (arg == "--help" || arg == "-h")
    {
        printHelp(std::cout);
        return 0;
    }

    if (arg == "--check")
    {
        if (argc != 3 || !hasKuzurExtension(argv[2]))
        {
            printHelp(std::cerr);
            return EXIT_USAGE;
        }
        std::string source;
        if (!readFile(argv[2], source))
            return EXIT_USAGE;
        return kuzur::checkSource(source, std::cout, std::cerr);
    }

    if (argc != 2 || !hasKuzurExtension(arg))
    {
        printHelp(std::cerr);
        return EXIT_USAGE;
    }

    std::string source;
    if (!readFile(arg, source))
        return EXIT_USAGE;

    return kuzur::runSource(source, std::cout, std::cin, std::cerr);
}
