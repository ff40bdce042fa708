#include "navis/cli.hpp"

int main(int argc, char *argv[])
{
    return navis::cli::run(argc, argv);
}
