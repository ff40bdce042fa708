#pragma once

namespace navis::cli
{

    /** Parse arguments and run the selected subcommand; returns the process exit code */
    int run(int argc, char *argv[]);

} // namespace navis::cli
