#include "cli/cli.hpp"

int main(int argc, char** argv) {
    return runCommandLine(argc, argv);
}
