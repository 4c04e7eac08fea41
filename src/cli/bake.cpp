#include "cli/BakeTool.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.push_back(argv[i] ? std::string(argv[i]) : std::string());
  }
  return autotile::cli::RunBake(args, std::cout, std::cerr);
}
