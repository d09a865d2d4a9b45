// Ticket: 0010_dataset_recording

#include "cpg-sim/src/DataRecorder/DatasetRecorder.hpp"

#include <exception>
#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>

#include "cpg-transfer/src/SampleRecord.hpp"
#include "cpg-transfer/src/TrajectoryStateRecord.hpp"

namespace cpg_sim
{

DatasetRecorder::DatasetRecorder(const Config& config)
  : recordTrajectory_{config.recordTrajectory}
{
  std::filesystem::path const path{config.databasePath};
  if (std::filesystem::exists(path))
  {
    spdlog::warn("DatasetRecorder: replacing existing database {}",
                 path.string());
    std::filesystem::remove(path);
  }

  database_ = std::make_unique<cpp_sqlite::Database>(config.databasePath, true);

  // Sample record first for FK integrity
  database_->getDAO<cpg_transfer::SampleRecord>();
  database_->getDAO<cpg_transfer::TrajectoryStateRecord>();
}

DatasetRecorder::~DatasetRecorder()
{
  try
  {
    flush();
  }
  catch (const std::exception& e)
  {
    spdlog::error("DatasetRecorder: final flush failed: {}", e.what());
  }
}

cpg_transfer::SampleRecord DatasetRecorder::toRecord(const TaskSample& sample)
{
  const SceneDescription& scene = sample.scene;

  cpg_transfer::SampleRecord record{};
  record.task_id = sample.taskId;
  record.run_seed = std::to_string(sample.runSeed);
  record.sample_index = static_cast<uint32_t>(sample.index);
  record.attempts = static_cast<uint32_t>(sample.attempts);

  record.mass_a = scene.initial.massA;
  record.mass_b = scene.initial.massB;
  record.position_a = scene.initial.positionA;
  record.position_b = scene.initial.positionB;
  record.velocity_a = scene.initial.velocityA;
  record.velocity_b = scene.initial.velocityB;

  record.contact_radius = scene.contactRadius;
  record.radius_px_a = static_cast<uint32_t>(scene.radiusPixelsA);
  record.radius_px_b = static_cast<uint32_t>(scene.radiusPixelsB);

  record.collision_time = scene.collision.time;
  record.velocity_a_after = scene.collision.velocityAAfter;
  record.velocity_b_after = scene.collision.velocityBAfter;
  record.collision_index =
    static_cast<uint32_t>(scene.collision.trajectoryIndex);
  record.first_frame_index = static_cast<uint32_t>(scene.frames.firstIndex);
  record.final_frame_index = static_cast<uint32_t>(scene.frames.finalIndex);

  record.momentum_rel_error = scene.conservation.relativeMomentumError();
  record.energy_rel_error = scene.conservation.relativeEnergyError();

  record.prompt = sample.prompt;
  return record;
}

uint32_t DatasetRecorder::recordSample(const TaskSample& sample)
{
  const uint32_t sampleId = nextSampleId_.fetch_add(1);

  auto record = toRecord(sample);
  record.id = sampleId;
  database_->getDAO<cpg_transfer::SampleRecord>().addToBuffer(record);

  if (recordTrajectory_)
  {
    auto& stateDAO = database_->getDAO<cpg_transfer::TrajectoryStateRecord>();
    const auto& states = sample.scene.trajectory.states;
    for (std::size_t i = 0; i < states.size(); ++i)
    {
      cpg_transfer::TrajectoryStateRecord stateRecord{};
      stateRecord.step = static_cast<uint32_t>(i);
      stateRecord.time = states[i].time;
      stateRecord.position_a = states[i].positionA;
      stateRecord.position_b = states[i].positionB;
      stateRecord.velocity_a = states[i].velocityA;
      stateRecord.velocity_b = states[i].velocityB;
      stateRecord.sample.id = sampleId;
      stateDAO.addToBuffer(stateRecord);
    }
  }

  spdlog::debug("DatasetRecorder: buffered {} as sample id {}",
                sample.taskId,
                sampleId);
  return sampleId;
}

void DatasetRecorder::flush()
{
  std::scoped_lock lock{flushMutex_};
  database_->withTransaction([this]() { database_->flushAllDAOs(); });
}

const cpp_sqlite::Database& DatasetRecorder::getDatabase() const
{
  return *database_;
}

}  // namespace cpg_sim
