// Ticket: 0011_generator_cli
// Modified: 0012_scene_labels

#include "cpg-exe/src/CommandLine.hpp"

#include <charconv>
#include <cstring>
#include <sstream>
#include <system_error>

#include <getopt.h>

#include "cpg-sim/src/Errors.hpp"

namespace cpg_exe
{

namespace
{

enum OptionId : int
{
  kNumSamples = 'n',
  kOutput = 'o',
  kSeed = 's',
  kThreads = 'j',
  kVerbose = 'v',
  kHelp = 'h',
  kNoVideos = 1000,
  kNoArrows,
  kNoMassLabels,
  kNoDatabase,
  kMinMass,
  kMaxMass,
  kMinVelocity,
  kMaxVelocity,
  kDuration,
  kFps,
  kSubsteps,
  kMinSeparation
};

const option kLongOptions[] = {
  {"num-samples", required_argument, nullptr, kNumSamples},
  {"output", required_argument, nullptr, kOutput},
  {"seed", required_argument, nullptr, kSeed},
  {"threads", required_argument, nullptr, kThreads},
  {"no-videos", no_argument, nullptr, kNoVideos},
  {"no-arrows", no_argument, nullptr, kNoArrows},
  {"no-mass-labels", no_argument, nullptr, kNoMassLabels},
  {"no-database", no_argument, nullptr, kNoDatabase},
  {"min-mass", required_argument, nullptr, kMinMass},
  {"max-mass", required_argument, nullptr, kMaxMass},
  {"min-velocity", required_argument, nullptr, kMinVelocity},
  {"max-velocity", required_argument, nullptr, kMaxVelocity},
  {"duration", required_argument, nullptr, kDuration},
  {"fps", required_argument, nullptr, kFps},
  {"substeps", required_argument, nullptr, kSubsteps},
  {"min-separation", required_argument, nullptr, kMinSeparation},
  {"verbose", no_argument, nullptr, kVerbose},
  {"help", no_argument, nullptr, kHelp},
  {nullptr, 0, nullptr, 0}};

constexpr const char* kShortOptions = ":n:o:s:j:vh";

template <typename T>
T parseValue(const char* text, const char* name)
{
  T value{};
  const char* const end = text + std::strlen(text);
  auto const [ptr, ec] = std::from_chars(text, end, value);
  if (ec != std::errc{} || ptr != end || ptr == text)
  {
    std::ostringstream oss;
    oss << "Invalid value '" << text << "' for --" << name;
    throw cpg_sim::InvalidConfiguration{oss.str()};
  }
  return value;
}

}  // anonymous namespace

std::string usage(const std::string& program)
{
  cpg_sim::GeneratorConfig const defaults{};
  std::ostringstream oss;
  oss << "usage: " << program << " [options]\n"
      << "\n"
      << "Generates two-ball elastic collision samples: first/final frame,\n"
      << "prompt text and a ground-truth frame sequence per sample.\n"
      << "\n"
      << "  -n, --num-samples N     samples to generate (" << defaults.numSamples << ")\n"
      << "  -o, --output DIR        output directory (data/questions)\n"
      << "  -s, --seed SEED         batch seed (random, logged)\n"
      << "  -j, --threads N         worker threads (" << defaults.workerThreads << ")\n"
      << "      --no-videos         skip ground-truth frame sequences\n"
      << "      --no-arrows         no velocity arrows on first/final frame\n"
      << "      --no-mass-labels    no mass text on the balls\n"
      << "      --no-database       skip dataset.db\n"
      << "      --min-mass KG       (" << defaults.sampler.mass.min << ")\n"
      << "      --max-mass KG       (" << defaults.sampler.mass.max << ")\n"
      << "      --min-velocity M/S  (" << defaults.sampler.speed.min << ")\n"
      << "      --max-velocity M/S  (" << defaults.sampler.speed.max << ")\n"
      << "      --duration S        simulated horizon (" << defaults.simulator.duration << ")\n"
      << "      --fps N             animation frame rate (" << defaults.simulator.videoFps << ")\n"
      << "      --substeps N        integrator steps per frame ("
      << defaults.simulator.substepsPerFrame << ")\n"
      << "      --min-separation M  final frame separation (" << defaults.minFinalSeparation
      << ")\n"
      << "  -v, --verbose           debug logging\n"
      << "  -h, --help              this text\n";
  return oss.str();
}

Options parseCommandLine(int argc, char* argv[])
{
  Options options{};
  cpg_sim::GeneratorConfig& config = options.generator;

  // getopt keeps global state; restart scanning for repeated calls (tests)
  optind = 0;
  opterr = 0;

  int opt = 0;
  while ((opt = getopt_long(argc, argv, kShortOptions, kLongOptions, nullptr)) != -1)
  {
    switch (opt)
    {
      case kNumSamples:
        config.numSamples = parseValue<std::size_t>(optarg, "num-samples");
        break;
      case kOutput:
        options.outputDir = optarg;
        break;
      case kSeed:
        config.randomSeed = parseValue<std::uint64_t>(optarg, "seed");
        break;
      case kThreads:
        config.workerThreads = parseValue<std::size_t>(optarg, "threads");
        break;
      case kNoVideos:
        options.writeVideos = false;
        break;
      case kNoArrows:
        options.showArrows = false;
        break;
      case kNoMassLabels:
        options.showMassLabels = false;
        break;
      case kNoDatabase:
        options.writeDatabase = false;
        break;
      case kMinMass:
        config.sampler.mass.min = parseValue<double>(optarg, "min-mass");
        break;
      case kMaxMass:
        config.sampler.mass.max = parseValue<double>(optarg, "max-mass");
        break;
      case kMinVelocity:
        config.sampler.speed.min = parseValue<double>(optarg, "min-velocity");
        break;
      case kMaxVelocity:
        config.sampler.speed.max = parseValue<double>(optarg, "max-velocity");
        break;
      case kDuration:
        config.simulator.duration = parseValue<double>(optarg, "duration");
        break;
      case kFps:
        config.simulator.videoFps = parseValue<int>(optarg, "fps");
        break;
      case kSubsteps:
        config.simulator.substepsPerFrame = parseValue<int>(optarg, "substeps");
        break;
      case kMinSeparation:
        config.minFinalSeparation = parseValue<double>(optarg, "min-separation");
        break;
      case kVerbose:
        options.verbose = true;
        break;
      case kHelp:
        options.help = true;
        break;
      case ':':
        throw cpg_sim::InvalidConfiguration{
          std::string{"Missing value for "} + argv[optind - 1]};
      case '?':
      default:
        throw cpg_sim::InvalidConfiguration{
          std::string{"Unknown option "} + argv[optind - 1]};
    }
  }

  if (optind < argc)
  {
    throw cpg_sim::InvalidConfiguration{std::string{"Unexpected argument "} +
                                        argv[optind]};
  }

  if (!options.help)
  {
    config.validate();
  }
  return options;
}

}  // namespace cpg_exe
