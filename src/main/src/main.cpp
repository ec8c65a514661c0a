#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>

#include "commandlineoptionsparser.hpp"
#include "meteocenteroptions.hpp"
#include "meteocenteroptionsdef.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "parseoptions.hpp"
#include "processcommandsfromcli.hpp"
#include "runmodes.hpp"

int main(int argc, const char* argv[]) {
  using namespace mtc;
  try {
    auto parser = CommandLineOptionsParser<MeteocenterCmdLineOptions>(
        MeteocenterAllowedOptions<MeteocenterCmdLineOptions>::value);
    const auto cmdLineOptions = ParseOptions(parser, argc, argv);

    if (cmdLineOptions) {
      return ProcessCommandsFromCLI(std::filesystem::path(argv[0]).filename().string(), *cmdLineOptions,
                                    settings::RunMode::kProd);
    }
  } catch (const invalid_argument& e) {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
