// Ticket: 0010_dataset_recording

#ifndef CPG_TRANSFER_SAMPLE_RECORD_HPP
#define CPG_TRANSFER_SAMPLE_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

#include <string>

namespace cpg_transfer
{

/**
 * @brief Database record for one generated dataset sample
 *
 * One row per accepted sample. Per-step trajectory rows
 * (TrajectoryStateRecord) reference this record via
 * ForeignKey<SampleRecord>.
 *
 * The run seed is stored as a decimal string since the ORM has no 64-bit
 * integer column.
 *
 * @see cpg_sim::DatasetRecorder
 * @ticket 0010_dataset_recording
 */
struct SampleRecord : public cpp_sqlite::BaseTransferObject
{
  std::string task_id;   // e.g. "collision_physics_0003"
  std::string run_seed;  // Seed of the accepted attempt (decimal)
  uint32_t sample_index{0};
  uint32_t attempts{0};  // Attempts until accepted

  // Initial conditions
  double mass_a{0.0};      // [kg]
  double mass_b{0.0};      // [kg]
  double position_a{0.0};  // [m]
  double position_b{0.0};  // [m]
  double velocity_a{0.0};  // [m/s]
  double velocity_b{0.0};  // [m/s]

  // Geometry
  double contact_radius{0.0};  // Physical radius [m]
  uint32_t radius_px_a{0};     // Rendered radius [px]
  uint32_t radius_px_b{0};     // Rendered radius [px]

  // Collision (analytic)
  double collision_time{0.0};      // [s]
  double velocity_a_after{0.0};    // [m/s]
  double velocity_b_after{0.0};    // [m/s]
  uint32_t collision_index{0};     // First post-impulse trajectory sample
  uint32_t first_frame_index{0};
  uint32_t final_frame_index{0};

  // Diagnostics
  double momentum_rel_error{0.0};
  double energy_rel_error{0.0};

  std::string prompt;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(SampleRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (task_id,
                       run_seed,
                       sample_index,
                       attempts,
                       mass_a,
                       mass_b,
                       position_a,
                       position_b,
                       velocity_a,
                       velocity_b,
                       contact_radius,
                       radius_px_a,
                       radius_px_b,
                       collision_time,
                       velocity_a_after,
                       velocity_b_after,
                       collision_index,
                       first_frame_index,
                       final_frame_index,
                       momentum_rel_error,
                       energy_rel_error,
                       prompt));

}  // namespace cpg_transfer

#endif  // CPG_TRANSFER_SAMPLE_RECORD_HPP
