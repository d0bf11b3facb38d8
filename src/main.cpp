#include <csignal>
#include <cstdlib>

#ifdef _WIN32
#  include <io.h>
#  define write _write
#else
#  include <unistd.h>
#endif

#include "cli.hpp"
#include "util.hpp"

// Ctrl+C: only async-signal-safe calls in here
static void sigint_handler(int)
{
    static constexpr char msg[] = "\nOperation cancelled by user\n";
    (void)!write(2, msg, sizeof(msg) - 1);
    std::_Exit(130);
}

int main(int argc, char* argv[])
{
    std::signal(SIGINT, sigint_handler);

    return run_cli(argc, argv);
}
