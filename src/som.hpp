#pragma once

#include <map>
#include <random>
#include <string>
#include <vector>
#include "data.hpp"
#include "topo.hpp"
#include "metric.hpp"


enum NeighbourhoodKind
{
  GAUSSIAN=0, BUBBLE=1
};

inline std::string get_neighbourhood_string(NeighbourhoodKind kind)
{
  switch (kind)
  {
  case NeighbourhoodKind::GAUSSIAN:
    return "gauss";
  case NeighbourhoodKind::BUBBLE:
    return "bubble";
  default:
    return "UNKNOWN";
  }
}

NeighbourhoodKind parse_neighbourhood(const std::string& name);

// Arguments are (grid distance, radius); returns a value in [0, 1]
typedef Float (*InfluenceFunction) (Float, Float);

Float gaussian_influence(const Float distance, const Float radius);
Float bubble_influence(const Float distance, const Float radius);

InfluenceFunction influence_function(NeighbourhoodKind kind);


class Neighbourhood
{
public:
  Neighbourhood(
    const CellIndexType height,
    const CellIndexType width,
    const GlobalTopology global_topology,
    const LocalTopology local_topology,
    const NeighbourhoodKind kind
  );

  Float influence(const CellIndexType source_cell, const CellIndexType target_cell, const Float radius) const;
  Float grid_distance(const CellIndexType source_cell, const CellIndexType target_cell) const;

  // Adjacent cells (grid distance at most 1), or the same cell
  bool are_neighbours(const CellIndexType cell1, const CellIndexType cell2) const;

  inline NeighbourhoodKind get_kind() const { return this->kind; }
  inline GlobalTopology get_global_topology() const { return this->global_topology; }
  inline LocalTopology get_local_topology() const { return this->local_topology; }

private:
  CellIndexType height, width;
  GlobalTopology global_topology;
  LocalTopology local_topology;
  NeighbourhoodKind kind;
  DistanceFunction distance;
  InfluenceFunction kernel;
};


struct GridPosition
{
  CellIndexType row;
  CellIndexType col;

  inline bool operator==(const GridPosition& other) const
  {
    return this->row == other.row && this->col == other.col;
  }
  inline bool operator!=(const GridPosition& other) const
  {
    return !(*this == other);
  }
};


// Read-only copy of the grid for external rendering
struct GridSnapshot
{
  StepType step;
  CellIndexType height;
  CellIndexType width;
  IndexType input_dim;
  std::vector<Float> prototypes;
  std::vector<std::string> label_majority;   // Empty strings where no label was counted

  void save_to_file(const std::string& filename) const;
};


// Rectangular array of nodes, each holding one prototype vector. Cells are
// numbered row by row: cell = row * width + col.
class Grid
{
public:
  Grid(
    CellIndexType height,
    CellIndexType width,
    IndexType input_dim
  );
  explicit Grid(std::ifstream& file);

public:
  // Uniform random values in [0, 1)
  void init(std::default_random_engine& random_number_generator);

  // Copies of randomly drawn samples; missing values are drawn uniformly
  void init(const SampleMatrix& samples, std::default_random_engine& random_number_generator);

  void save(std::ofstream& file) const;

  // Exhaustive scan; ties go to the smallest cell index, i.e. the smallest
  // row and then the smallest col
  CellIndexType find_best_matching_unit(
    const Float* const sample,
    const DistanceMetric& metric,
    Float* const distance = nullptr
  ) const;

  void find_best_and_next_best_matching_units(
    const Float* const sample,
    const DistanceMetric& metric,
    CellIndexType& best_matching_unit,
    CellIndexType& next_best_matching_unit
  ) const;

  GridPosition find_bmu(const Float* const sample, const DistanceMetric& metric) const;

  // Moves every prototype toward `sample` by alpha * influence; the nodes
  // are updated in parallel
  void apply_update(
    const Float* const sample,
    const CellIndexType best_matching_unit,
    const Float alpha,
    const Float radius,
    const Neighbourhood& neighbourhood
  );

  // Pulls every prototype component toward its mean over all nodes
  void apply_decay(const Float decay);

  void count_label(const CellIndexType cell, const std::string& label);
  void clear_labels();
  std::string label_majority(const CellIndexType cell) const;
  std::vector<std::string> label_majorities() const;

  GridSnapshot snapshot(StepType step) const;

  inline const Float* prototype(CellIndexType cell) const
  {
    return &this->array[static_cast<size_t>(cell) * this->input_dim];
  }

  inline Float* prototype(CellIndexType cell)
  {
    return &this->array[static_cast<size_t>(cell) * this->input_dim];
  }

  void set_prototype(CellIndexType cell, const std::vector<Float>& values);

  Float get_value(size_t index) const;

  inline const std::vector<Float>& get_values() const {
    return this->array;
  }

  inline GridPosition position(CellIndexType cell) const {
    return GridPosition{static_cast<CellIndexType>(cell / this->width), static_cast<CellIndexType>(cell % this->width)};
  }

  inline CellIndexType cell(CellIndexType row, CellIndexType col) const {
    return row * this->width + col;
  }

  inline IndexType get_input_dim() const {
    return this->input_dim;
  }

  inline CellIndexType get_num_cells() const {
    return this->num_cells;
  }

  inline CellIndexType get_height() const {
    return this->height;
  }

  inline CellIndexType get_width() const {
    return this->width;
  }

protected:
  CellIndexType height;
  CellIndexType width;
  IndexType input_dim;

  CellIndexType num_cells;
  size_t size;

  std::vector<Float> array;
  std::vector<std::map<std::string, CountType>> label_counts;
};
