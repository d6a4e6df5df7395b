#include <codecheck/check_code_cli.h>

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front() == "analyze") {
      first_argument_index = 1;
    }
    const std::vector<std::string> analyze_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());
    return codecheck::RunAnalyze(analyze_arguments);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
