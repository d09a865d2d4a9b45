// Ticket: 0011_generator_cli

#ifndef CPG_EXE_COMMAND_LINE_HPP
#define CPG_EXE_COMMAND_LINE_HPP

#include <filesystem>
#include <string>

#include "cpg-sim/src/Config/GeneratorConfig.hpp"

namespace cpg_exe
{

/**
 * @brief Everything the command line controls
 */
struct Options
{
  cpg_sim::GeneratorConfig generator;
  std::filesystem::path outputDir{"data/questions"};
  bool writeVideos{true};     // Ground-truth frame sequence
  bool showArrows{true};      // Velocity arrows on first/final frame
  bool showMassLabels{true};  // Mass text on every ball
  bool writeDatabase{true};   // <outputDir>/dataset.db
  bool verbose{false};        // Debug-level logging
  bool help{false};
};

/**
 * @brief Parse argv with getopt_long
 *
 * Values are written onto a default Options; the generator configuration is
 * validated afterwards unless --help was given.
 *
 * @throws cpg_sim::InvalidConfiguration on unknown options, missing or
 *         malformed values, or an invalid resulting configuration
 */
Options parseCommandLine(int argc, char* argv[]);

/**
 * @brief Help text listing every option and its default
 */
std::string usage(const std::string& program);

}  // namespace cpg_exe

#endif  // CPG_EXE_COMMAND_LINE_HPP
