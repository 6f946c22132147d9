#include <feedbacker/cli.h>
#include <feedbacker/cli_exit_codes.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout << "Usage: feedbackerd <command> [options]\n\n"
            << "Commands:\n"
            << "  serve     Run the job scheduler (default).\n"
            << "  run       Analyze one repository revision and exit.\n"
            << "  status    Show a stored job.\n"
            << "  health    Check dependencies and print a JSON report.\n\n"
            << "Run 'feedbackerd <command> --help' for options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return feedbacker::kExitOk;
    }

    std::string command = "serve";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "serve") {
      return feedbacker::RunServe(command_arguments, std::cin, std::cout);
    }
    if (command == "run") {
      return feedbacker::RunJob(command_arguments, std::cout);
    }
    if (command == "status") {
      return feedbacker::RunStatus(command_arguments, std::cout);
    }
    if (command == "health") {
      return feedbacker::RunHealth(command_arguments, std::cout);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return feedbacker::kExitUsage;
  }
}
