#include <cstdlib>
#include <iostream>
#include "precondition.hpp"

void fatalError(const char* condition, const char* message, const char* file, int line) {
    std::cerr << "Fatal: " << message << " (" << condition << ") at "
              << file << ":" << line << std::endl;
    std::abort();
}
