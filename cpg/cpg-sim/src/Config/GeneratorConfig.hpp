// Ticket: 0003_generator_configuration

#ifndef CPG_SIM_GENERATOR_CONFIG_HPP
#define CPG_SIM_GENERATOR_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace cpg_sim
{

/**
 * @brief Closed interval [min, max]
 */
struct Range
{
  double min{0.0};
  double max{0.0};

  [[nodiscard]] bool contains(double value) const
  {
    return value >= min && value <= max;
  }
};

/**
 * @brief Ranges the ParameterSampler draws from, plus fixed start positions
 */
struct SamplerConfig
{
  Range mass{1.0, 5.0};   // [kg]
  Range speed{2.0, 8.0};  // Speed magnitude [m/s]
  double positionA{2.0};  // Ball A start [m]
  double positionB{12.0}; // Ball B start [m]
};

/**
 * @brief Time discretisation and physical contact size
 *
 * The integrator step is 1 / (videoFps * substepsPerFrame). contactRadius is
 * the physical radius used for contact detection. It is the same for both
 * bodies and deliberately independent of the rendered radius, so collision
 * timing never changes when the visual style does.
 */
struct SimulatorConfig
{
  double duration{3.0};       // Simulated horizon [s]
  int videoFps{10};           // Animation frame rate [1/s]
  int substepsPerFrame{20};   // Integrator steps per animation frame
  double contactRadius{0.6};  // Physical radius of each ball [m]

  /**
   * @brief Fixed integrator step
   * @return 1 / (videoFps * substepsPerFrame) [s]
   */
  [[nodiscard]] double stepSize() const;

  /**
   * @brief Number of integrator steps covering the horizon
   *
   * The trajectory holds stepCount() + 1 samples (the initial state plus one
   * per step).
   */
  [[nodiscard]] std::size_t stepCount() const;
};

/**
 * @brief Image geometry and the mass-to-pixel radius rule
 *
 * The visible world spans [0, worldWidth] metres horizontally, mapped onto
 * imageWidth pixels. The vertical extent follows from the aspect ratio.
 */
struct ViewConfig
{
  int imageWidth{800};         // [px]
  int imageHeight{300};        // [px]
  double worldWidth{14.0};     // [m]
  int ballRadiusBase{30};      // [px]
  double radiusScaleMin{0.7};  // Lightest ball radius = base * scaleMin
  double radiusScaleMax{1.3};  // Heaviest ball radius = base * scaleMax

  [[nodiscard]] double pixelsPerMeter() const
  {
    return static_cast<double>(imageWidth) / worldWidth;
  }

  [[nodiscard]] double worldHeight() const
  {
    return static_cast<double>(imageHeight) / pixelsPerMeter();
  }
};

/**
 * @brief Complete configuration for one batch of generated samples
 *
 * Plain aggregate with defaults matching the reference dataset. Call
 * validate() before handing it to SampleGenerator or BatchGenerator.
 *
 * @ticket 0003_generator_configuration
 */
struct GeneratorConfig
{
  std::string domain{"collision_physics"};
  std::size_t numSamples{10};
  std::optional<std::uint64_t> randomSeed;  // Absent: seeded from the OS
  std::size_t maxAttemptsPerSample{10};
  std::size_t workerThreads{1};

  SamplerConfig sampler;
  SimulatorConfig simulator;
  ViewConfig view;
  double minFinalSeparation{2.0};  // [m]

  /**
   * @brief Check every field for consistency
   * @throws InvalidConfiguration naming the first offending field
   */
  void validate() const;
};

}  // namespace cpg_sim

#endif  // CPG_SIM_GENERATOR_CONFIG_HPP
