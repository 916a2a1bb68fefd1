#include <treetags/cli_exit_codes.h>
#include <treetags/cli_options.h>
#include <treetags/treetags_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    return treetags::RunTreetags(arguments);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    treetags::PrintUsage(std::cerr);
    return treetags::kExitFatal;
  }
}
