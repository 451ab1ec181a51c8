#pragma once

#include <string>
#include <vector>
#include <iosfwd>
#include "data.hpp"
#include "topo.hpp"
#include "layer.hpp"
#include "schedule.hpp"
#include "som.hpp"
#include "argparse.hpp"

enum HorizonUnit
{
  EPOCHS=0, EPISODES=1
};

inline std::string get_horizon_unit_string(HorizonUnit unit)
{
  switch (unit)
  {
  case HorizonUnit::EPOCHS:
    return "epochs";
  case HorizonUnit::EPISODES:
    return "episodes";
  default:
    return "UNKNOWN";
  }
}

enum SampleOrder
{
  SEQUENTIAL=0, SHUFFLED=1
};

inline std::string get_sample_order_string(SampleOrder order)
{
  switch (order)
  {
  case SampleOrder::SEQUENTIAL:
    return "sequential";
  case SampleOrder::SHUFFLED:
    return "shuffled";
  default:
    return "UNKNOWN";
  }
}

enum Initialization
{
  RANDOM=0, SAMPLES=1
};

inline std::string get_initialization_string(Initialization initialization)
{
  switch (initialization)
  {
  case Initialization::RANDOM:
    return "random";
  case Initialization::SAMPLES:
    return "samples";
  default:
    return "UNKNOWN";
  }
}

SampleOrder parse_sample_order(const std::string& name);
Initialization parse_initialization(const std::string& name);
ColumnKind parse_column_kind(const std::string& name);


// Everything one training run needs besides the data
struct TrainingConfig
{
  int64_t rows = 10;
  int64_t cols = 10;
  std::vector<LayerSpec> layers;

  ScheduleSpec alpha = {0.2, 0.01, Curve::LINEAR};
  ScheduleSpec radius = {5., 0.5, Curve::LINEAR};
  bool has_decay = false;
  ScheduleSpec decay = {0., 0., Curve::LINEAR};

  NeighbourhoodKind neighbourhood = NeighbourhoodKind::GAUSSIAN;
  LocalTopology local_topology = LocalTopology::CIRC;
  GlobalTopology global_topology = GlobalTopology::PLANE;

  // EPOCHS: `horizon` passes over the dataset; EPISODES: `horizon` single steps
  HorizonUnit horizon_unit = HorizonUnit::EPOCHS;
  StepType horizon = 10;
  SampleOrder sample_order = SampleOrder::SHUFFLED;
  Initialization initialization = Initialization::RANDOM;
  uint32_t seed = 0;

  StepType snapshot_interval = 0;  // Zero disables snapshots
  std::string label_column;        // Empty if no label column

  // Throws ConfigError naming the first invalid parameter
  void validate() const;
};

std::ostream& operator<<(std::ostream& os, const TrainingConfig& config);


// Parse "name:kind:normalization:weight:column1,column2,..."
LayerSpec parse_layer_spec(const std::string& text);

ScheduleSpec parse_schedule_spec(const std::vector<std::string>& values, const std::string& parameter);

// Build a configuration from the options of the `create` mode
TrainingConfig parse_training_config(const ArgParser& args);
