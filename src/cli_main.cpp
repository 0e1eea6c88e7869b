#include <iostream>
#include "treedit/Cli.hpp"

int main(int argc, char** argv) {
    return treedit::run_cli(argc, argv, std::cout, std::cerr);
}
