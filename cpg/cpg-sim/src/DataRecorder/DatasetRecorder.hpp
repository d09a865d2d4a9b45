// Ticket: 0010_dataset_recording

#ifndef CPG_SIM_DATASET_RECORDER_HPP
#define CPG_SIM_DATASET_RECORDER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "cpg-sim/src/Generator/BatchGenerator.hpp"

namespace cpg_transfer
{
struct SampleRecord;
}

namespace cpg_sim
{

/**
 * @brief Writes accepted samples and their trajectories to SQLite
 *
 * Record submission buffers into cpp_sqlite's DAOs; flush() writes all
 * buffers inside one transaction. Sample ids are pre-assigned so that the
 * trajectory rows can reference their sample before anything hits disk.
 *
 * recordSample() may be called from several threads. Flushes are serialized
 * by flushMutex_.
 *
 * @ticket 0010_dataset_recording
 */
class DatasetRecorder
{
public:
  struct Config
  {
    std::string databasePath;     // Path to SQLite database file
    bool recordTrajectory{true};  // Also store every trajectory step
  };

  /**
   * @brief Open (recreate) the database and create DAOs in FK order
   *
   * An existing file at databasePath is replaced.
   *
   * @throws std::runtime_error if the database cannot be opened
   */
  explicit DatasetRecorder(const Config& config);

  /**
   * @brief Flushes pending records
   *
   * A flush failure here is logged; call flush() explicitly to observe it.
   */
  ~DatasetRecorder();

  DatasetRecorder(const DatasetRecorder&) = delete;
  DatasetRecorder& operator=(const DatasetRecorder&) = delete;
  DatasetRecorder(DatasetRecorder&&) = delete;
  DatasetRecorder& operator=(DatasetRecorder&&) = delete;

  /**
   * @brief Buffer a sample row and (optionally) one row per trajectory step
   * @return Pre-assigned sample id
   */
  uint32_t recordSample(const TaskSample& sample);

  /**
   * @brief Write every buffered record in a single transaction
   */
  void flush();

  /**
   * @brief Build the sample row for a generated sample (id not set)
   */
  static cpg_transfer::SampleRecord toRecord(const TaskSample& sample);

  const cpp_sqlite::Database& getDatabase() const;

private:
  std::unique_ptr<cpp_sqlite::Database> database_;
  bool recordTrajectory_;
  std::mutex flushMutex_;
  std::atomic<uint32_t> nextSampleId_{1};
};

}  // namespace cpg_sim

#endif  // CPG_SIM_DATASET_RECORDER_HPP
