#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <random>
#include <string>
#include <vector>
#include "data.hpp"
#include "layer.hpp"
#include "metric.hpp"
#include "schedule.hpp"
#include "som.hpp"
#include "config.hpp"
#include "model.hpp"

enum TrainerState
{
  INITIALIZED=0, TRAINING=1, FINISHED=2
};

inline std::string get_trainer_state_string(TrainerState state)
{
  switch (state)
  {
  case TrainerState::INITIALIZED:
    return "initialized";
  case TrainerState::TRAINING:
    return "training";
  case TrainerState::FINISHED:
    return "finished";
  default:
    return "UNKNOWN";
  }
}

// Returns true to stop training before the next step
typedef std::function<bool()> StopCallback;

// Receives a read-only copy of the grid every `snapshot_interval` steps
typedef std::function<void(const GridSnapshot&)> SnapshotCallback;


// Online training of one self-organizing map. The trainer validates the
// configuration and the data, fits the layers, encodes the table and seeds
// the grid on construction; training then advances one sample per step.
// `finalize` hands the grid over to a Model, after which the trainer can
// no longer be used.
class Trainer
{
public:
  Trainer(const TrainingConfig& config, const Table& table, std::ostream* convergence_log = nullptr);
  Trainer(const Trainer&) = delete;              // Disable copy
  Trainer& operator=(const Trainer&) = delete;   // Disable assignment

  // Apply one training step; returns false once the horizon is reached
  bool step();

  // Train until the horizon is reached or `should_stop` returns true.
  // Returns true if training finished.
  bool run(const StopCallback& should_stop = nullptr, const SnapshotCallback& on_snapshot = nullptr);

  // Label majority per node is recounted against the current grid
  GridSnapshot snapshot();

  Model finalize();

  const Grid& get_grid() const;
  TrainerState get_state() const;
  inline StepType get_step() const { return this->t; }
  inline StepType get_total_steps() const { return this->total_steps; }
  inline IndexType get_num_rows() const { return this->num_rows; }
  inline bool is_finalized() const { return this->finalized; }
  inline const std::vector<Layer>& get_layers() const { return this->layers; }
  inline const DistanceMetric& get_metric() const { return this->metric; }
  inline const SampleMatrix& get_samples() const { return *this->samples; }

  // Parameters at the current step
  Float get_alpha() const;
  Float get_radius() const;
  Float get_decay() const;

private:
  static TrainingConfig validated(const TrainingConfig& config);
  static std::vector<Layer> fit_layers(const TrainingConfig& config, const Table& table);

  void require_not_finalized() const;
  IndexType next_row();
  void end_of_block(bool is_full_block);
  void count_labels();

  TrainingConfig config;
  std::vector<Layer> layers;
  DistanceMetric metric;
  std::unique_ptr<SampleMatrix> samples;
  std::vector<std::string> labels;   // Label of each row, empty if missing
  std::unique_ptr<Grid> grid;
  Neighbourhood neighbourhood;
  Schedule alpha;
  Schedule radius;
  Schedule decay;
  std::default_random_engine random_number_generator;
  std::vector<IndexType> order;

  IndexType num_rows;
  StepType t;
  StepType total_steps;
  TrainerState state;
  bool finalized;

  Float block_distance_sum;
  StepType block_steps;
  std::ostream* convergence_log;
};
