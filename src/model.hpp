#pragma once

#include <memory>
#include <string>
#include <vector>
#include "data.hpp"
#include "layer.hpp"
#include "metric.hpp"
#include "schedule.hpp"
#include "som.hpp"
#include "config.hpp"


// Trained map, frozen after training. All operations are read-only.
class Model
{
public:
  Model(
    std::unique_ptr<Grid> grid,
    std::vector<Layer> layers,
    const TrainingConfig& config,
    StepType steps
  );
  explicit Model(const std::string& filename);

  // Best matching unit of one table row; unknown categories raise UnknownCategory
  GridPosition query(const Table& table, IndexType row) const;

  // Best matching unit of an encoded sample (`get_input_dim()` values)
  GridPosition query(const std::vector<Float>& sample) const;

  std::vector<Float> encode(const Table& table, IndexType row) const;

  // Best matching unit of every row, computed in parallel
  std::vector<CellIndexType> map_rows(const Table& table) const;

  // Mean distance between each row and its best matching unit
  Float quantization_error(const Table& table) const;

  // Share of rows whose best and second best matching units are not adjacent
  Float topographic_error(const Table& table) const;

  GridSnapshot snapshot() const;

  void save_to_file(const std::string& filename) const;

  // One line per node: index, row, col, values in input units, majority
  // category of every categorical layer, and the label majority
  void save_units_csv(const std::string& filename, const char delimiter = ',') const;

  // One line per table row: preserved columns, then the best matching unit
  void save_best_matching_units_csv(
    const std::string& filename,
    const Table& table,
    const std::vector<std::string>& preserve,
    const char delimiter = ','
  ) const;

  inline const Grid& get_grid() const { return *this->grid; }
  inline const std::vector<Layer>& get_layers() const { return this->layers; }
  inline const TrainingConfig& get_config() const { return this->config; }
  inline const DistanceMetric& get_metric() const { return this->metric; }
  inline const Neighbourhood& get_neighbourhood() const { return this->neighbourhood; }
  inline IndexType get_input_dim() const { return this->grid->get_input_dim(); }
  inline StepType get_steps() const { return this->steps; }
  inline const std::string& get_label_majority(CellIndexType cell) const { return this->label_majority.at(cell); }

private:
  struct StoredModel
  {
    std::unique_ptr<Grid> grid;
    std::vector<Layer> layers;
    TrainingConfig config;
    StepType steps;
    std::vector<std::string> label_majority;
  };

  explicit Model(StoredModel stored);
  static StoredModel load_from_file(const std::string& filename);

  void encode_rows(const Table& table, SampleMatrix& samples) const;

  std::unique_ptr<Grid> grid;
  std::vector<Layer> layers;
  TrainingConfig config;
  DistanceMetric metric;
  Neighbourhood neighbourhood;
  StepType steps;
  std::vector<std::string> label_majority;  // Empty strings where no label was counted
};
