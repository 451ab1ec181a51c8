#include <iostream>
#include <fstream>
#include <cmath>
#include <assert.h>
#include <algorithm>  // fill_n

#if defined(_OPENMP)
  #include <omp.h>
#endif

#include "som.hpp"
#include "topo.hpp"
#include "utils.hpp"
#include "errors.hpp"


NeighbourhoodKind parse_neighbourhood(const std::string& name)
{
  if (name == "gauss" || name == "gaussian")
    return NeighbourhoodKind::GAUSSIAN;
  if (name == "bubble" || name == "step")
    return NeighbourhoodKind::BUBBLE;
  throw ConfigError("neighbourhood", "'" + name + "' is not one of (gauss|bubble)");
}


Float gaussian_influence(const Float distance, const Float radius)
{
  // A vanishing radius only reaches the best matching unit itself
  if (radius <= 0.)
    return distance == 0. ? 1. : 0.;
  return std::exp(-squared(distance) / (2. * squared(radius)));
}


Float bubble_influence(const Float distance, const Float radius)
{
  return distance <= std::max(radius, static_cast<Float>(0.)) ? 1. : 0.;
}


InfluenceFunction influence_function(NeighbourhoodKind kind)
{
  switch (kind)
  {
  case NeighbourhoodKind::GAUSSIAN:
    return gaussian_influence;
  case NeighbourhoodKind::BUBBLE:
    return bubble_influence;
  default:
    throw ConfigError("neighbourhood", "Invalid neighbourhood specification");
  }
}


Neighbourhood::Neighbourhood(
    const CellIndexType height,
    const CellIndexType width,
    const GlobalTopology global_topology,
    const LocalTopology local_topology,
    const NeighbourhoodKind kind
  ) :
  height(height),
  width(width),
  global_topology(global_topology),
  local_topology(local_topology),
  kind(kind),
  distance(distance_function(global_topology, local_topology)),
  kernel(influence_function(kind))
{}


Float Neighbourhood::grid_distance(const CellIndexType source_cell, const CellIndexType target_cell) const
{
  const int y1 = source_cell / this->width,
            x1 = source_cell % this->width,
            y2 = target_cell / this->width,
            x2 = target_cell % this->width;
  return this->distance(y1, x1, y2, x2, this->height, this->width);
}


Float Neighbourhood::influence(const CellIndexType source_cell, const CellIndexType target_cell, const Float radius) const
{
  return this->kernel(this->grid_distance(source_cell, target_cell), radius);
}


bool Neighbourhood::are_neighbours(const CellIndexType cell1, const CellIndexType cell2) const
{
  return this->grid_distance(cell1, cell2) <= 1.;
}


void GridSnapshot::save_to_file(const std::string& filename) const
{
  std::cout << "Saving grid snapshot to '" << filename << "'" << std::endl;
  std::ofstream file;
  file.open(filename, std::ios::binary);

  if (!file.is_open())
    std::__throw_runtime_error("Unable to save grid snapshot to file");

  const uint8_t format = 0;
  write_uint8(file, format);
  write_uint64(file, this->step);
  write_uint64(file, this->height);
  write_uint64(file, this->width);
  write_uint64(file, this->input_dim);
  file.write(reinterpret_cast<const char*>(this->prototypes.data()), this->prototypes.size() * sizeof(Float));
  for (const auto& label : this->label_majority)
    write_string(file, label);

  file.close();
}


Grid::Grid(
    CellIndexType height,
    CellIndexType width,
    IndexType input_dim
  ) :
    height(height),
    width(width),
    input_dim(input_dim)
{
  if (height < 1 || width < 1)
    throw ConfigError("grid size", "the map width and height must be at least 1");
  if (static_cast<size_t>(height) * width > MAX_NUM_CELLS)
    throw ConfigError("grid size", "the map must have at most " + std::to_string(MAX_NUM_CELLS) + " cells");

  this->num_cells = height * width;
  this->size = static_cast<size_t>(this->num_cells) * input_dim;
  size_t required_bytes = this->size * sizeof(Float);

  try {
    this->array.resize(this->size, 0.);
  } catch (std::bad_alloc& e) {
    std::cerr << "Failed to allocate " << required_bytes << " bytes of memory for the grid";
    throw e;
  }
  this->label_counts.resize(this->num_cells);
}


Grid::Grid(std::ifstream& file) :
  height(0),
  width(0),
  input_dim(0),
  num_cells(0),
  size(0)
{
  const uint64_t height = read_uint64(file);
  const uint64_t width = read_uint64(file);
  const uint64_t input_dim = read_uint64(file);
  if (!file.good() || height < 1 || width < 1 || input_dim < 1)
    std::__throw_runtime_error("Stored model is corrupt");
  // Each side is bounded first so that the product cannot wrap
  if (height > MAX_NUM_CELLS || width > MAX_NUM_CELLS || height * width > MAX_NUM_CELLS || input_dim > MAX_INDEX_SIZE)
    std::__throw_runtime_error("Stored model is corrupt");

  this->height = static_cast<CellIndexType>(height);
  this->width = static_cast<CellIndexType>(width);
  this->input_dim = static_cast<IndexType>(input_dim);
  this->num_cells = this->height * this->width;
  this->size = static_cast<size_t>(this->num_cells) * this->input_dim;
  this->array.resize(this->size);
  this->label_counts.resize(this->num_cells);

  file.read(reinterpret_cast<char*>(this->array.data()), this->size * sizeof(Float));
  if (!file.good())
    std::__throw_runtime_error("Stored model is corrupt");
}


void Grid::init(std::default_random_engine& random_number_generator)
{
  std::cout << "Initializing grid with random values" << std::endl;
  std::uniform_real_distribution<Float> uniform(0., 1.);

  // Sequential on purpose: one generator, one fixed order of draws
  for (size_t i = 0; i < this->size; i++)
  {
      this->array[i] = uniform(random_number_generator);
  }
}


void Grid::init(const SampleMatrix& samples, std::default_random_engine& random_number_generator)
{
  if (samples.num_rows == 0)
    throw DataError("Cannot initialize the grid from an empty dataset");
  if (samples.input_dim != this->input_dim)
    throw DataError("Sample width does not match the grid");

  std::cout << "Initializing grid with samples" << std::endl;
  std::uniform_int_distribution<IndexType> pick(0, samples.num_rows - 1);
  std::uniform_real_distribution<Float> uniform(0., 1.);

  for (CellIndexType cell = 0; cell < this->num_cells; ++cell)
  {
    const Float* const x = samples.row(pick(random_number_generator));
    Float* const w = this->prototype(cell);
    for (IndexType i = 0; i < this->input_dim; ++i)
    {
      w[i] = std::isnan(x[i]) ? uniform(random_number_generator) : x[i];
    }
  }
}


void Grid::save(std::ofstream& file) const
{
  write_uint64(file, this->height);
  write_uint64(file, this->width);
  write_uint64(file, this->input_dim);
  file.write(reinterpret_cast<const char*>(this->array.data()), this->size * sizeof(Float));
}


CellIndexType Grid::find_best_matching_unit(
    const Float* const sample,
    const DistanceMetric& metric,
    Float* const distance
  ) const
{
  assert (metric.get_input_dim() == this->input_dim);

  CellIndexType best_matching_unit = 0;
  Float best_distance = metric.distance(sample, this->prototype(0));

  for (CellIndexType cell_index = 1; cell_index < this->num_cells; ++cell_index)
  {
    const Float d = metric.distance(sample, this->prototype(cell_index));
    if (d < best_distance)
    {
      best_matching_unit = cell_index;
      best_distance = d;
    }
  }

  if (distance)
    *distance = best_distance;
  return best_matching_unit;
}


void Grid::find_best_and_next_best_matching_units(
    const Float* const sample,
    const DistanceMetric& metric,
    CellIndexType& best_matching_unit,
    CellIndexType& next_best_matching_unit
  ) const
{
  best_matching_unit = 0;
  next_best_matching_unit = 0;
  Float distance = MAX_REAL_DISTANCE;
  Float next_distance = MAX_REAL_DISTANCE;

  for (CellIndexType cell_index = 0; cell_index < this->num_cells; ++cell_index)
  {
    const Float d = metric.distance(sample, this->prototype(cell_index));
    if (cell_index == 0 || d < distance)
    {
      next_best_matching_unit = best_matching_unit;
      next_distance = distance;
      best_matching_unit = cell_index;
      distance = d;
    }
    else if (cell_index == 1 || d < next_distance)
    {
      next_best_matching_unit = cell_index;
      next_distance = d;
    }
  }
}


GridPosition Grid::find_bmu(const Float* const sample, const DistanceMetric& metric) const
{
  return this->position(this->find_best_matching_unit(sample, metric));
}


void Grid::apply_update(
  const Float* const sample,
  const CellIndexType best_matching_unit,
  const Float alpha,
  const Float radius,
  const Neighbourhood& neighbourhood
)
{
  // Every node writes only its own prototype, so no locking is needed
  #pragma omp parallel for
  for (CellIndexType cell_index = 0; cell_index < this->num_cells; ++cell_index)
  {
    const Float influence = neighbourhood.influence(best_matching_unit, cell_index, radius);
    if (influence <= 0.)
      continue;

    const Float learning_rate = alpha * influence;
    Float* const w = this->prototype(cell_index);
    for (IndexType i = 0; i < this->input_dim; ++i)
    {
      if (!std::isnan(sample[i]))
        w[i] += learning_rate * (sample[i] - w[i]);
    }
  }
}


void Grid::apply_decay(const Float decay)
{
  if (decay <= 0.)
    return;

  std::vector<Float> means(this->input_dim, 0.);
  for (CellIndexType cell_index = 0; cell_index < this->num_cells; ++cell_index)
  {
    const Float* const w = this->prototype(cell_index);
    for (IndexType i = 0; i < this->input_dim; ++i)
      means[i] += w[i];
  }
  for (IndexType i = 0; i < this->input_dim; ++i)
    means[i] /= this->num_cells;

  #pragma omp parallel for
  for (CellIndexType cell_index = 0; cell_index < this->num_cells; ++cell_index)
  {
    Float* const w = this->prototype(cell_index);
    for (IndexType i = 0; i < this->input_dim; ++i)
      w[i] -= decay * (w[i] - means[i]);
  }
}


void Grid::count_label(const CellIndexType cell, const std::string& label)
{
  CountType& count = this->label_counts.at(cell)[label];
  if (count < MAX_COUNT)
    count += 1;
}


void Grid::clear_labels()
{
  for (auto& counts : this->label_counts)
    counts.clear();
}


std::string Grid::label_majority(const CellIndexType cell) const
{
  // Ties go to the label that sorts first
  std::string majority;
  CountType majority_count = 0;
  for (const auto& entry : this->label_counts.at(cell))
  {
    if (entry.second > majority_count)
    {
      majority = entry.first;
      majority_count = entry.second;
    }
  }
  return majority;
}


std::vector<std::string> Grid::label_majorities() const
{
  std::vector<std::string> result(this->num_cells);
  for (CellIndexType cell = 0; cell < this->num_cells; ++cell)
    result[cell] = this->label_majority(cell);
  return result;
}


GridSnapshot Grid::snapshot(StepType step) const
{
  return GridSnapshot{step, this->height, this->width, this->input_dim, this->array, this->label_majorities()};
}


void Grid::set_prototype(CellIndexType cell, const std::vector<Float>& values)
{
  if (cell >= this->num_cells)
    std::__throw_out_of_range("Grid has no cell with given index");
  if (values.size() != this->input_dim)
    throw DataError("Prototype has " + std::to_string(values.size()) + " values but the grid expects " + std::to_string(this->input_dim));
  std::copy(values.begin(), values.end(), this->prototype(cell));
}


Float Grid::get_value(size_t index) const
{
  if (index < this->size) {
    return this->array[index];
  } else {
    std::__throw_length_error("Grid has no entry with given index");
  }
}
