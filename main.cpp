#include "builtin_profiles.hpp"
#include "csv_writer.hpp"
#include "json_io.hpp"
#include "pipeline.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace tablestitch;

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--config=options.json] [--mode=hybrid|page_only|logical_only]"
               " [--strategy=score_domain|header_repetition] [--tolerance=X]"
               " [--no-validation] [--tables-out=dir] <fragments.json>\n";
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::string inputPath;
    std::string configPath;
    std::string tablesOutDir;
    ConversionOptions cliOverrides;
    bool modeSet = false, strategySet = false, toleranceSet = false, noValidation = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--no-validation") {
        noValidation = true;
      } else if (arg.rfind("--config=", 0) == 0) {
        configPath = arg.substr(std::string("--config=").size());
      } else if (arg.rfind("--mode=", 0) == 0) {
        cliOverrides.mode = parseExtractionMode(arg.substr(std::string("--mode=").size()));
        modeSet = true;
      } else if (arg.rfind("--strategy=", 0) == 0) {
        cliOverrides.forcedStrategy = parseSegmentationStrategy(arg.substr(std::string("--strategy=").size()));
        strategySet = true;
      } else if (arg.rfind("--tolerance=", 0) == 0) {
        cliOverrides.validation.tolerance = std::stod(arg.substr(std::string("--tolerance=").size()));
        toleranceSet = true;
      } else if (arg.rfind("--tables-out=", 0) == 0) {
        tablesOutDir = arg.substr(std::string("--tables-out=").size());
      } else if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (inputPath.empty()) {
        inputPath = arg;
      }
    }

    if (inputPath.empty() || !std::filesystem::exists(inputPath)) {
      if (!inputPath.empty()) std::cerr << "Input not found: " << inputPath << "\n";
      printUsage(argv[0]);
      return 2;
    }

    // Config file first, command-line flags on top.
    ConversionOptions options;
    if (!configPath.empty()) loadOptionsFile(configPath, options);
    if (modeSet) options.mode = cliOverrides.mode;
    if (strategySet) options.forcedStrategy = cliOverrides.forcedStrategy;
    if (toleranceSet) options.validation.tolerance = cliOverrides.validation.tolerance;
    if (noValidation) options.validationEnabled = false;

    ProfileRegistry registry;
    registerBuiltinProfiles(registry);

    DocumentInput input = loadDocumentInput(inputPath);
    ConversionPipeline pipeline(registry, options);
    ConversionResult result = pipeline.convert(input);

    std::cout << toJson(result).dump(2) << "\n";

    if (!result.success) return 1;

    if (!tablesOutDir.empty()) {
      auto files = writeTablesAsCsv(result.tables.tablesFor(options.mode), tablesOutDir);
      std::cerr << "Wrote " << files.size() << " table(s) to '" << tablesOutDir << "'\n";
    }
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
