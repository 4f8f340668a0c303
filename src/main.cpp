#include "run.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
    return snyk_freq::runCli(argc, argv, std::getenv("SNYK_TOKEN"),
                             &std::cin, std::cout, std::cerr);
}
