// Ticket: 0008_task_prompts

#ifndef CPG_SIM_PROMPTS_PROMPT_BUILDER_HPP
#define CPG_SIM_PROMPTS_PROMPT_BUILDER_HPP

#include <cstddef>
#include <random>
#include <string>

#include "cpg-sim/src/DataTypes/InitialConditions.hpp"

namespace cpg_sim
{

/**
 * @brief Natural-language task instruction for a sample
 *
 * Formats the sampled masses and velocities (one decimal) into one of a fixed
 * set of templates. The template is chosen with the run's own random stream,
 * so the prompt is reproducible from the run seed like everything else.
 *
 * @ticket 0008_task_prompts
 */
namespace PromptBuilder
{

/**
 * @brief Number of available templates
 */
std::size_t templateCount();

/**
 * @brief Render a specific template
 * @param templateIndex Index in [0, templateCount())
 * @param conditions Values to quote
 * @throws std::out_of_range if templateIndex is out of range
 */
std::string format(std::size_t templateIndex, const InitialConditions& conditions);

/**
 * @brief Render a template chosen uniformly with rng
 */
std::string build(const InitialConditions& conditions, std::mt19937_64& rng);

/**
 * @brief "right" for positive velocity, "left" otherwise
 */
std::string directionWord(double velocity);

}  // namespace PromptBuilder

}  // namespace cpg_sim

#endif  // CPG_SIM_PROMPTS_PROMPT_BUILDER_HPP
