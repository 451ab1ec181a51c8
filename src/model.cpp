#include <iostream>
#include <fstream>
#include <limits>

#if defined(_OPENMP)
  #include <omp.h>
#endif

#include "model.hpp"
#include "errors.hpp"

const uint8_t MODEL_FORMAT = 1;


inline void write_schedule_spec(std::ofstream& file, const ScheduleSpec& spec)
{
  write_float(file, spec.start);
  write_float(file, spec.end);
  write_uint8(file, spec.curve);
}


inline ScheduleSpec read_schedule_spec(std::ifstream& file)
{
  ScheduleSpec spec;
  spec.start = read_float(file);
  spec.end = read_float(file);
  spec.curve = static_cast<Curve>(read_uint8(file));
  return spec;
}


Model::Model(
    std::unique_ptr<Grid> grid,
    std::vector<Layer> layers,
    const TrainingConfig& config,
    StepType steps
  ) :
  grid(std::move(grid)),
  layers(std::move(layers)),
  config(config),
  metric(this->layers),
  neighbourhood(this->grid->get_height(), this->grid->get_width(), config.global_topology, config.local_topology, config.neighbourhood),
  steps(steps),
  label_majority(this->grid->label_majorities())
{
  if (this->metric.get_input_dim() != this->grid->get_input_dim())
    std::__throw_logic_error("The layers do not match the grid");
}


Model::Model(const std::string& filename) :
  Model(load_from_file(filename))
{}


Model::Model(StoredModel stored) :
  grid(std::move(stored.grid)),
  layers(std::move(stored.layers)),
  config(std::move(stored.config)),
  metric(this->layers),
  neighbourhood(
    this->grid->get_height(),
    this->grid->get_width(),
    this->config.global_topology,
    this->config.local_topology,
    this->config.neighbourhood
  ),
  steps(stored.steps),
  label_majority(std::move(stored.label_majority))
{}


Model::StoredModel Model::load_from_file(const std::string& filename)
{
  std::cout << "Loading model from " << filename << std::endl;

  std::ifstream file;
  file.open(filename, std::ios::binary);

  if (!file.is_open())
    std::__throw_runtime_error("Unable to load model from file");

  const uint8_t format = read_uint8(file);
  if (!file.good() || format != MODEL_FORMAT)
    std::__throw_runtime_error("Stored model has unknown format");

  StoredModel stored;
  TrainingConfig& config = stored.config;
  stored.steps = read_uint64(file);
  config.neighbourhood = static_cast<NeighbourhoodKind>(read_uint8(file));
  config.local_topology = static_cast<LocalTopology>(read_uint8(file));
  config.global_topology = static_cast<GlobalTopology>(read_uint8(file));
  config.alpha = read_schedule_spec(file);
  config.radius = read_schedule_spec(file);
  config.has_decay = read_uint8(file) != 0;
  config.decay = read_schedule_spec(file);
  config.horizon_unit = static_cast<HorizonUnit>(read_uint8(file));
  config.horizon = read_uint64(file);
  config.sample_order = static_cast<SampleOrder>(read_uint8(file));
  config.initialization = static_cast<Initialization>(read_uint8(file));
  config.seed = static_cast<uint32_t>(read_uint64(file));
  config.snapshot_interval = read_uint64(file);
  config.label_column = read_string(file);

  const uint64_t num_layers = read_uint64(file);
  for (uint64_t i = 0; i < num_layers && file.good(); ++i)
  {
    stored.layers.emplace_back(file);
    config.layers.push_back(stored.layers.back().get_spec());
  }

  stored.grid = std::make_unique<Grid>(file);
  config.rows = stored.grid->get_height();
  config.cols = stored.grid->get_width();

  for (CellIndexType cell = 0; cell < stored.grid->get_num_cells() && file.good(); ++cell)
    stored.label_majority.push_back(read_string(file));

  if (!file.good() || stored.label_majority.size() != stored.grid->get_num_cells())
    std::__throw_runtime_error("Stored model is corrupt");
  if (total_width(stored.layers) != stored.grid->get_input_dim())
    std::__throw_runtime_error("Stored layers do not match the stored grid");

  file.close();
  return stored;
}


void Model::save_to_file(const std::string& filename) const
{
  std::cout << "Saving model to '" << filename << "'" << std::endl;
  std::ofstream file;
  file.open(filename, std::ios::binary);

  if (!file.is_open())
    std::__throw_runtime_error("Unable to save model to file");

  write_uint8(file, MODEL_FORMAT);
  write_uint64(file, this->steps);
  write_uint8(file, this->config.neighbourhood);
  write_uint8(file, this->config.local_topology);
  write_uint8(file, this->config.global_topology);
  write_schedule_spec(file, this->config.alpha);
  write_schedule_spec(file, this->config.radius);
  write_uint8(file, this->config.has_decay ? 1 : 0);
  write_schedule_spec(file, this->config.decay);
  write_uint8(file, this->config.horizon_unit);
  write_uint64(file, this->config.horizon);
  write_uint8(file, this->config.sample_order);
  write_uint8(file, this->config.initialization);
  write_uint64(file, this->config.seed);
  write_uint64(file, this->config.snapshot_interval);
  write_string(file, this->config.label_column);

  write_uint64(file, this->layers.size());
  for (const auto& layer : this->layers)
    layer.save(file);

  this->grid->save(file);
  for (const auto& label : this->label_majority)
    write_string(file, label);

  if (!file.good())
    std::__throw_runtime_error("Failed writing model file");
  file.close();
}


void Model::encode_rows(const Table& table, SampleMatrix& samples) const
{
  encode_table(this->layers, table, samples);
}


std::vector<Float> Model::encode(const Table& table, IndexType row) const
{
  if (row >= table.num_rows())
    std::__throw_out_of_range("Table has no row with given index");

  std::vector<Float> sample(this->get_input_dim());
  Float* out = sample.data();
  for (const auto& layer : this->layers)
  {
    layer.transform(table, row, out);
    out += layer.get_width();
  }
  return sample;
}


GridPosition Model::query(const Table& table, IndexType row) const
{
  return this->query(this->encode(table, row));
}


GridPosition Model::query(const std::vector<Float>& sample) const
{
  if (sample.size() != this->get_input_dim())
  {
    throw DataError(
      "Sample has " + std::to_string(sample.size()) + " values but the model expects " + std::to_string(this->get_input_dim())
    );
  }
  return this->grid->find_bmu(sample.data(), this->metric);
}


std::vector<CellIndexType> Model::map_rows(const Table& table) const
{
  const IndexType num_rows = table.num_rows();
  SampleMatrix samples(num_rows, this->get_input_dim());
  this->encode_rows(table, samples);

  std::vector<CellIndexType> best_matching_units(num_rows);
  #pragma omp parallel for
  for (IndexType row = 0; row < num_rows; ++row)
  {
    best_matching_units[row] = this->grid->find_best_matching_unit(samples.row(row), this->metric);
  }
  return best_matching_units;
}


Float Model::quantization_error(const Table& table) const
{
  const IndexType num_rows = table.num_rows();
  if (num_rows == 0)
    throw DataError("Cannot compute the quantization error of an empty table");

  SampleMatrix samples(num_rows, this->get_input_dim());
  this->encode_rows(table, samples);

  std::vector<Float> distances(num_rows);
  #pragma omp parallel for
  for (IndexType row = 0; row < num_rows; ++row)
  {
    this->grid->find_best_matching_unit(samples.row(row), this->metric, &distances[row]);
  }

  // Summed in row order so the result does not depend on the thread count
  Float sum = 0.;
  for (const auto distance : distances)
    sum += distance;
  return sum / num_rows;
}


Float Model::topographic_error(const Table& table) const
{
  const IndexType num_rows = table.num_rows();
  if (num_rows == 0)
    throw DataError("Cannot compute the topographic error of an empty table");

  SampleMatrix samples(num_rows, this->get_input_dim());
  this->encode_rows(table, samples);

  std::vector<uint8_t> discontinuous(num_rows, 0);
  #pragma omp parallel for
  for (IndexType row = 0; row < num_rows; ++row)
  {
    CellIndexType best_matching_unit, next_best_matching_unit;
    this->grid->find_best_and_next_best_matching_units(samples.row(row), this->metric, best_matching_unit, next_best_matching_unit);
    discontinuous[row] = this->neighbourhood.are_neighbours(best_matching_unit, next_best_matching_unit) ? 0 : 1;
  }

  IndexType count = 0;
  for (const auto flag : discontinuous)
    count += flag;
  return static_cast<Float>(count) / num_rows;
}


GridSnapshot Model::snapshot() const
{
  return GridSnapshot{
    this->steps,
    this->grid->get_height(),
    this->grid->get_width(),
    this->grid->get_input_dim(),
    this->grid->get_values(),
    this->label_majority
  };
}


void Model::save_units_csv(const std::string& filename, const char delimiter) const
{
  std::cout << "Saving units to '" << filename << "'" << std::endl;
  std::ofstream file(filename);
  if (!file.is_open())
    std::__throw_runtime_error("Unable to save units to file");
  file.precision(std::numeric_limits<Float>::max_digits10);

  file << "index" << delimiter << "row" << delimiter << "col";
  for (const auto& layer : this->layers)
  {
    if (layer.get_kind() == ColumnKind::NUMERIC)
    {
      for (const auto& column : layer.get_columns())
        file << delimiter << quote_cell(column, delimiter);
    } else {
      file << delimiter << quote_cell(layer.get_name(), delimiter);
    }
  }
  if (!this->config.label_column.empty())
    file << delimiter << quote_cell(this->config.label_column, delimiter);
  file << std::endl;

  for (CellIndexType cell = 0; cell < this->grid->get_num_cells(); ++cell)
  {
    const GridPosition position = this->grid->position(cell);
    file << cell << delimiter << position.row << delimiter << position.col;

    const Float* segment = this->grid->prototype(cell);
    for (const auto& layer : this->layers)
    {
      if (layer.get_kind() == ColumnKind::NUMERIC)
      {
        for (const auto value : layer.denormalize(segment))
          file << delimiter << value;
      } else {
        file << delimiter << quote_cell(layer.category(segment), delimiter);
      }
      segment += layer.get_width();
    }
    if (!this->config.label_column.empty())
      file << delimiter << quote_cell(this->label_majority[cell], delimiter);
    file << std::endl;
  }
  file.close();
}


void Model::save_best_matching_units_csv(
    const std::string& filename,
    const Table& table,
    const std::vector<std::string>& preserve,
    const char delimiter
  ) const
{
  std::vector<size_t> columns;
  for (const auto& name : preserve)
  {
    if (!table.has_column(name))
      throw DataError("Preserved column not found", NO_ROW, name);
    columns.push_back(table.column_index(name));
  }

  const auto best_matching_units = this->map_rows(table);

  std::cout << "Saving best matching units to '" << filename << "'" << std::endl;
  std::ofstream file(filename);
  if (!file.is_open())
    std::__throw_runtime_error("Cannot save best matching units");

  for (const auto& name : preserve)
    file << quote_cell(name, delimiter) << delimiter;
  file << "index" << delimiter << "row" << delimiter << "col" << std::endl;

  for (IndexType row = 0; row < table.num_rows(); ++row)
  {
    for (const auto column : columns)
      file << quote_cell(table.cell_string(row, column), delimiter) << delimiter;
    const CellIndexType cell = best_matching_units[row];
    const GridPosition position = this->grid->position(cell);
    file << cell << delimiter << position.row << delimiter << position.col << std::endl;
  }
  file.close();
}
