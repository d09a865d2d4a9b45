// Ticket: 0007_batch_generation

#ifndef CPG_SIM_GENERATOR_RUN_SEED_HPP
#define CPG_SIM_GENERATOR_RUN_SEED_HPP

#include <cstddef>
#include <cstdint>
#include <random>

namespace cpg_sim
{

/**
 * @brief Seed of the independent random stream for one attempt of one sample
 *
 * Mixes the batch seed, sample index and attempt number through
 * std::seed_seq, so every run owns its stream and the result does not depend
 * on which worker thread executes it or in what order.
 *
 * @param batchSeed Seed of the whole batch
 * @param sampleIndex Zero-based sample index
 * @param attempt Zero-based resample attempt
 * @return 64-bit run seed
 */
std::uint64_t deriveRunSeed(std::uint64_t batchSeed,
                            std::size_t sampleIndex,
                            std::size_t attempt);

/**
 * @brief Engine for a run seed (see deriveRunSeed())
 */
std::mt19937_64 makeRunEngine(std::uint64_t runSeed);

/**
 * @brief Nondeterministic batch seed from std::random_device
 *
 * Used when the configuration has no seed. The value is logged by the caller
 * so the batch can still be reproduced afterwards.
 */
std::uint64_t randomBatchSeed();

}  // namespace cpg_sim

#endif  // CPG_SIM_GENERATOR_RUN_SEED_HPP
