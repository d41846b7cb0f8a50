#include <iostream>
#include <string>
#include <vector>

#include "cli_commands.hpp"

int main(int argc, char* argv[]) {
  std::vector < std::string > args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

  grim::cli::CommandResult result = grim::cli::execute_command(args, std::cin, std::cout, std::cerr);

  if (!result.message.empty()) {
    if (result.exit_code == 0) {
      std::cout << result.message << std::endl;
    } else {
      std::cerr << result.message << std::endl;
    }
  }
  return result.exit_code;
}
