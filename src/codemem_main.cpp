#include <codemem/codemem_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    if (arguments.empty()) {
      codemem::PrintUsage(std::cout);
      return 1;
    }
    return codemem::RunCodemem(arguments, std::cout, std::clog);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    codemem::PrintUsage(std::cerr);
    return 1;
  }
}
