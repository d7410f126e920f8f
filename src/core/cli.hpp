#pragma once

#include <ostream>

class CLI {
public:
    /// Parse argv and dispatch to subcommand. Returns the process exit code.
    static int run(int argc, char* argv[]);

    /// Exit code for a usage error (unknown command, missing argument)
    static constexpr int kUsageError = 1;

private:
    static int cmd_help(std::ostream& out);
    static int cmd_version();
    static int usage(const char* synopsis);
};
