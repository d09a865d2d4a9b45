// Ticket: 0010_dataset_recording

#ifndef CPG_TRANSFER_TRAJECTORY_STATE_RECORD_HPP
#define CPG_TRANSFER_TRAJECTORY_STATE_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "cpg-transfer/src/SampleRecord.hpp"

namespace cpg_transfer
{

/**
 * @brief Database record for one time step of a sample's trajectory
 *
 * Uses ForeignKey<SampleRecord> to associate the step with its sample.
 *
 * @ticket 0010_dataset_recording
 */
struct TrajectoryStateRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t step{0};        // Trajectory index
  double time{0.0};        // [s]
  double position_a{0.0};  // [m]
  double position_b{0.0};  // [m]
  double velocity_a{0.0};  // [m/s]
  double velocity_b{0.0};  // [m/s]
  cpp_sqlite::ForeignKey<SampleRecord> sample;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(TrajectoryStateRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (step,
                       time,
                       position_a,
                       position_b,
                       velocity_a,
                       velocity_b,
                       sample));

}  // namespace cpg_transfer

#endif  // CPG_TRANSFER_TRAJECTORY_STATE_RECORD_HPP
