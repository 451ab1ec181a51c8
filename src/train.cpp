#include <iostream>
#include <algorithm>  // shuffle
#include <numeric>    // iota
#include <limits>

#if defined(_OPENMP)
  #include <omp.h>
#endif

#include "train.hpp"
#include "errors.hpp"
#include "utils.hpp"


Trainer::Trainer(const TrainingConfig& config, const Table& table, std::ostream* convergence_log) :
  config(validated(config)),
  layers(fit_layers(this->config, table)),
  metric(this->layers),
  neighbourhood(
    static_cast<CellIndexType>(this->config.rows),
    static_cast<CellIndexType>(this->config.cols),
    this->config.global_topology,
    this->config.local_topology,
    this->config.neighbourhood
  ),
  alpha("alpha", this->config.alpha),
  radius("radius", this->config.radius),
  decay("decay", this->config.has_decay ? this->config.decay : ScheduleSpec{0., 0., Curve::LINEAR}),
  random_number_generator(this->config.seed),
  num_rows(table.num_rows()),
  t(0),
  total_steps(0),
  state(TrainerState::INITIALIZED),
  finalized(false),
  block_distance_sum(0.),
  block_steps(0),
  convergence_log(convergence_log)
{
  if (this->config.horizon_unit == HorizonUnit::EPOCHS && this->config.horizon > std::numeric_limits<StepType>::max() / this->num_rows)
    throw ConfigError("epochs", "the number of training steps exceeds " + std::to_string(std::numeric_limits<StepType>::max()));

  const IndexType input_dim = this->metric.get_input_dim();
  if (input_dim == 0)
    throw DataError("The layers encode the data into zero dimensions");

  std::cout << "Encoding " << this->num_rows << " rows into " << input_dim << " dimensions" << std::endl;
  this->samples = std::make_unique<SampleMatrix>(this->num_rows, input_dim);
  encode_table(this->layers, table, *this->samples);

  if (!this->config.label_column.empty())
  {
    if (!table.has_column(this->config.label_column))
      throw DataError("Label column not found", NO_ROW, this->config.label_column);
    const size_t column = table.column_index(this->config.label_column);
    this->labels.resize(this->num_rows);
    for (IndexType row = 0; row < this->num_rows; ++row)
    {
      if (!table.is_missing(row, column))
        this->labels[row] = table.cell_string(row, column);
    }
  }

  if (this->config.horizon_unit == HorizonUnit::EPOCHS)
    this->total_steps = this->config.horizon * this->num_rows;
  else
    this->total_steps = this->config.horizon;

  this->order.resize(this->num_rows);
  std::iota(this->order.begin(), this->order.end(), 0);

  this->grid = std::make_unique<Grid>(
    static_cast<CellIndexType>(this->config.rows),
    static_cast<CellIndexType>(this->config.cols),
    input_dim
  );
  if (this->config.initialization == Initialization::SAMPLES)
    this->grid->init(*this->samples, this->random_number_generator);
  else
    this->grid->init(this->random_number_generator);

  if (this->convergence_log)
    *this->convergence_log << "Step\tUnixTime\tAlpha\tRadius\tDecay\tQuantizationError" << std::endl;
}


TrainingConfig Trainer::validated(const TrainingConfig& config)
{
  config.validate();
  return config;
}


std::vector<Layer> Trainer::fit_layers(const TrainingConfig& config, const Table& table)
{
  if (table.num_rows() == 0)
    throw DataError("Cannot train on an empty dataset");

  std::cout << "Fitting " << config.layers.size() << " layers to " << table.num_rows() << " rows" << std::endl;
  std::vector<Layer> layers;
  for (const auto& spec : config.layers)
  {
    layers.emplace_back(spec);
    layers.back().fit(table);
  }
  return layers;
}


void Trainer::require_not_finalized() const
{
  if (this->finalized)
    std::__throw_logic_error("The trainer has been finalized");
}


IndexType Trainer::next_row()
{
  if (this->config.horizon_unit == HorizonUnit::EPISODES)
  {
    std::uniform_int_distribution<IndexType> pick(0, this->num_rows - 1);
    return pick(this->random_number_generator);
  }

  // One pass over the dataset per epoch
  const IndexType position = static_cast<IndexType>(this->t % this->num_rows);
  if (position == 0 && this->config.sample_order == SampleOrder::SHUFFLED)
    std::shuffle(this->order.begin(), this->order.end(), this->random_number_generator);
  return this->order[position];
}


bool Trainer::step()
{
  this->require_not_finalized();
  if (this->state == TrainerState::FINISHED)
    return false;
  this->state = TrainerState::TRAINING;

  if (this->config.horizon_unit == HorizonUnit::EPOCHS && this->t % this->num_rows == 0)
    std::cout << "Epoch " << this->t / this->num_rows + 1 << " of " << this->config.horizon << std::endl;

  const IndexType row = this->next_row();
  const Float* const sample = this->samples->row(row);
  const Float progress = static_cast<Float>(this->t) / this->total_steps;
  const Float alpha = this->alpha.interpolate(progress);
  const Float radius = this->radius.interpolate(progress);

  Float distance = 0.;
  const CellIndexType best_matching_unit = this->grid->find_best_matching_unit(sample, this->metric, &distance);
  this->grid->apply_update(sample, best_matching_unit, alpha, radius, this->neighbourhood);

  this->block_distance_sum += distance;
  this->block_steps += 1;
  this->t += 1;

  if (this->t % this->num_rows == 0)
    this->end_of_block(true);
  else if (this->t == this->total_steps)
    this->end_of_block(false);

  if (this->t == this->total_steps)
  {
    this->state = TrainerState::FINISHED;
    std::cout << "Training finished after " << this->t << " steps" << std::endl;
  }
  return true;
}


void Trainer::end_of_block(bool is_full_block)
{
  const Float progress = static_cast<Float>(this->t) / this->total_steps;

  // Weight decay only applies after a complete block of num_rows steps
  Float decay = 0.;
  if (is_full_block && this->config.has_decay)
  {
    decay = this->decay.interpolate(progress);
    this->grid->apply_decay(decay);
  }

  if (this->convergence_log)
  {
    *this->convergence_log << this->t
      << "\t" << get_unix_time()
      << "\t" << this->alpha.interpolate(progress)
      << "\t" << this->radius.interpolate(progress)
      << "\t" << decay
      << "\t" << this->block_distance_sum / this->block_steps
      << std::endl;
  }
  this->block_distance_sum = 0.;
  this->block_steps = 0;
}


bool Trainer::run(const StopCallback& should_stop, const SnapshotCallback& on_snapshot)
{
  this->require_not_finalized();
  if (this->state == TrainerState::INITIALIZED)
    std::cout << "Training self-organizing map" << std::endl;

  while (this->state != TrainerState::FINISHED)
  {
    if (should_stop && should_stop())
    {
      std::cout << "WARNING: Training stopped at step " << this->t << " of " << this->total_steps << std::endl;
      return false;
    }
    this->step();
    if (on_snapshot && this->config.snapshot_interval > 0 && this->t % this->config.snapshot_interval == 0)
      on_snapshot(this->snapshot());
  }
  return true;
}


void Trainer::count_labels()
{
  this->grid->clear_labels();
  if (this->labels.empty())
    return;

  std::vector<CellIndexType> best_matching_units(this->num_rows);
  #pragma omp parallel for
  for (IndexType row = 0; row < this->num_rows; ++row)
  {
    best_matching_units[row] = this->grid->find_best_matching_unit(this->samples->row(row), this->metric);
  }

  for (IndexType row = 0; row < this->num_rows; ++row)
  {
    if (!this->labels[row].empty())
      this->grid->count_label(best_matching_units[row], this->labels[row]);
  }
}


GridSnapshot Trainer::snapshot()
{
  this->require_not_finalized();
  this->count_labels();
  return this->grid->snapshot(this->t);
}


Model Trainer::finalize()
{
  this->require_not_finalized();
  this->count_labels();
  std::cout << "Finalizing model after " << this->t << " of " << this->total_steps << " steps" << std::endl;
  this->finalized = true;
  return Model(std::move(this->grid), std::move(this->layers), this->config, this->t);
}


const Grid& Trainer::get_grid() const
{
  this->require_not_finalized();
  return *this->grid;
}


TrainerState Trainer::get_state() const
{
  this->require_not_finalized();
  return this->state;
}


Float Trainer::get_alpha() const
{
  return this->alpha.interpolate(static_cast<Float>(this->t) / this->total_steps);
}


Float Trainer::get_radius() const
{
  return this->radius.interpolate(static_cast<Float>(this->t) / this->total_steps);
}


Float Trainer::get_decay() const
{
  if (!this->config.has_decay)
    return 0.;
  return this->decay.interpolate(static_cast<Float>(this->t) / this->total_steps);
}
