#include "runner.hpp"
#include "../interpreter/interpreter.hpp"
#include "../lexer/lexer.hpp"
#include "../parser/parser.hpp"
#include "../lib/errors/error.hpp"

namespace kuzur
{

    static Program parseSource(const std::string &source)
    {
        Lexer lexer(source);
        auto tokens = lexer.tokenize();
        Parser parser(tokens);
        return parser.parse();
    }

    int runSource(const std::string &source, std::ostream &out, std::istream &in,
                  std::ostream &err)
    {
        try
        {
            Program program = parseSource(source);
            Interpreter interpreter(out, in);
            return interpreter.run(program);
        }
        catch (const KuzurError &e)
        {
            out.flush();
            err << e.what() << "\n";
            return 1;
        }
        catch (const std::exception &e)
        {
            out.flush();
            err << "Fatal error: " << e.what() << "\n";
            return 1;
        }
    }

    int checkSource(const std::string &source, std::ostream &out, std::ostream &err)
    {
        try
        {
            parseSource(source);
            out << "OK\n";
            return 0;
        }
        catch (const KuzurError &e)
        {
            err << e.what() << "\n";
            return 1;
        }
    }

} // namespace kuzur
