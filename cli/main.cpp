/**
 * @file main.cpp
 * @brief aclink-cli entry point. See cli_app.hpp.
 */

#include <iostream>

#include "cli_app.hpp"

int main(int argc, char** argv) {
  return aclink::cli::run(argc, argv, std::cout, std::cerr);
}
