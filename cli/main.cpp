#include "commands.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return stepfrag::cli::Run(argc, argv, std::cout, std::cerr);
}
