#pragma once

#include "../data.hpp"
#include "../config.hpp"

// Four rows in two clusters: x = 0, 1 with class a and x = 10, 11 with class b
inline Table make_cluster_table()
{
  Table table({"id", "x", "class"}, {ColumnKind::CATEGORICAL, ColumnKind::NUMERIC, ColumnKind::CATEGORICAL});
  table.add_row({"r0", "0", "a"});
  table.add_row({"r1", "1", "a"});
  table.add_row({"r2", "10", "b"});
  table.add_row({"r3", "11", "b"});
  return table;
}


// 2 x 2 map, one sequential pass, alpha 0.5 -> 0.01 and radius 1 -> 0.1
inline TrainingConfig make_cluster_config(uint32_t seed = 42)
{
  TrainingConfig config;
  config.rows = 2;
  config.cols = 2;
  config.layers.push_back(LayerSpec{"x", {"x"}, ColumnKind::NUMERIC, Normalization::GAUSS, 1.});
  config.layers.push_back(LayerSpec{"class", {"class"}, ColumnKind::CATEGORICAL, Normalization::NONE, 1.});
  config.alpha = ScheduleSpec{0.5, 0.01, Curve::LINEAR};
  config.radius = ScheduleSpec{1., 0.1, Curve::LINEAR};
  config.neighbourhood = NeighbourhoodKind::GAUSSIAN;
  config.local_topology = LocalTopology::CIRC;
  config.global_topology = GlobalTopology::PLANE;
  config.horizon_unit = HorizonUnit::EPOCHS;
  config.horizon = 1;
  config.sample_order = SampleOrder::SEQUENTIAL;
  config.initialization = Initialization::RANDOM;
  config.seed = seed;
  return config;
}
