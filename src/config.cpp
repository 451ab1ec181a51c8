#include <set>
#include <ostream>
#include <algorithm>
#include "config.hpp"
#include "errors.hpp"


SampleOrder parse_sample_order(const std::string& name)
{
  if (name == "sequential")
    return SampleOrder::SEQUENTIAL;
  if (name == "shuffled" || name == "random")
    return SampleOrder::SHUFFLED;
  throw ConfigError("sample order", "'" + name + "' is not one of (sequential|shuffled)");
}


Initialization parse_initialization(const std::string& name)
{
  if (name == "random")
    return Initialization::RANDOM;
  if (name == "samples")
    return Initialization::SAMPLES;
  throw ConfigError("initialization", "'" + name + "' is not one of (random|samples)");
}


ColumnKind parse_column_kind(const std::string& name)
{
  if (name == "num" || name == "numeric")
    return ColumnKind::NUMERIC;
  if (name == "cat" || name == "categorical")
    return ColumnKind::CATEGORICAL;
  throw ConfigError("layer kind", "'" + name + "' is not one of (num|cat)");
}


void TrainingConfig::validate() const
{
  if (this->rows < 1 || this->cols < 1)
    throw ConfigError("grid size", "the map width and height must be at least 1");
  if (this->rows > MAX_NUM_CELLS || this->cols > MAX_NUM_CELLS || this->rows * this->cols > MAX_NUM_CELLS)
    throw ConfigError("grid size", "the map must have at most " + std::to_string(MAX_NUM_CELLS) + " cells");
  if (this->local_topology == LocalTopology::HEXA && this->global_topology == GlobalTopology::TORUS && (this->rows & 1) == 1)
    throw ConfigError("topology", "for a hexagonal grid on a torus the number of rows has to be even");
  distance_function(this->global_topology, this->local_topology);
  influence_function(this->neighbourhood);

  if (this->layers.empty())
    throw ConfigError("layers", "at least one layer is required");
  std::set<std::string> names;
  Float weight_sum = 0.;
  for (const auto& spec : this->layers)
  {
    Layer layer(spec);  // Checks the layer on its own
    if (!names.insert(spec.name).second)
      throw ConfigError("layers", "the layer name '" + spec.name + "' is used twice");
    weight_sum += spec.weight;
  }
  if (weight_sum <= 0.)
    throw ConfigError("weights", "at least one layer needs a weight greater than 0");

  Schedule("alpha", this->alpha).require_bounds(0., 1.);
  Schedule("radius", this->radius).require_bounds(0., MAX_REAL_DISTANCE);
  if (this->has_decay)
    Schedule("decay", this->decay).require_bounds(0., 1.);

  if (this->horizon_unit != HorizonUnit::EPOCHS && this->horizon_unit != HorizonUnit::EPISODES)
    throw ConfigError("horizon", "unknown horizon unit");
  if (this->horizon == 0)
    throw ConfigError(get_horizon_unit_string(this->horizon_unit), "the training horizon must be at least 1");
  if (this->sample_order != SampleOrder::SEQUENTIAL && this->sample_order != SampleOrder::SHUFFLED)
    throw ConfigError("sample order", "unknown sample order");
  if (this->initialization != Initialization::RANDOM && this->initialization != Initialization::SAMPLES)
    throw ConfigError("initialization", "unknown initialization");
}


std::ostream& operator<<(std::ostream& os, const TrainingConfig& config)
{
  os << "Dimensions:            " << config.cols << " x " << config.rows << std::endl
     << "Learning rate:         " << config.alpha << std::endl
     << "Update radius:         " << config.radius << std::endl;
  if (config.has_decay)
    os << "Weight decay:          " << config.decay << std::endl;
  else
    os << "Weight decay:          none" << std::endl;
  os << "Neighbourhood:         " << get_neighbourhood_string(config.neighbourhood) << std::endl
     << "Local topology:        " << get_local_topology_string(config.local_topology) << std::endl
     << "Global topology:       " << get_global_topology_string(config.global_topology) << std::endl
     << "Training horizon:      " << config.horizon << " " << get_horizon_unit_string(config.horizon_unit) << std::endl
     << "Sample order:          " << get_sample_order_string(config.sample_order) << std::endl
     << "Initialization:        " << get_initialization_string(config.initialization) << std::endl
     << "Random seed:           " << config.seed << std::endl
     << "Snapshot interval:     " << config.snapshot_interval << std::endl
     << "Label column:          " << (config.label_column.empty() ? "none" : config.label_column) << std::endl
     << "Layers:" << std::endl;
  for (const auto& layer : config.layers)
  {
    os << "  " << layer.name << " (" << get_column_kind_string(layer.kind)
       << ", " << get_normalization_string(layer.normalization)
       << ", weight " << layer.weight;
    if (layer.scale != 1.)
      os << ", scale " << layer.scale;
    os << "):";
    for (const auto& column : layer.columns)
      os << " " << column;
    os << std::endl;
  }
  return os;
}


LayerSpec parse_layer_spec(const std::string& text)
{
  const auto fields = split_line(text, ':');
  if (fields.size() != 5 && fields.size() != 6)
    throw ConfigError("layer", "'" + text + "' is not of the form name:kind:normalization:weight:column1,column2[:scale]");

  LayerSpec spec;
  spec.name = fields[0];
  spec.kind = parse_column_kind(fields[1]);
  spec.normalization = parse_normalization(fields[2]);
  spec.weight = parse_float(fields[3], "weight of layer '" + spec.name + "'");
  for (const auto& column : split_line(fields[4], ','))
  {
    if (!column.empty())
      spec.columns.push_back(column);
  }
  if (fields.size() == 6)
    spec.scale = parse_float(fields[5], "scale of layer '" + spec.name + "'");
  return spec;
}


ScheduleSpec parse_schedule_spec(const std::vector<std::string>& values, const std::string& parameter)
{
  if (values.size() != 3)
    throw ConfigError(parameter, "expected start value, end value and curve (lin|exp)");
  return ScheduleSpec{
    parse_float(values[0], parameter),
    parse_float(values[1], parameter),
    parse_curve(values[2])
  };
}


inline StepType parse_count(const int64_t value, const std::string& parameter)
{
  if (value < 0)
    throw ConfigError(parameter, "must not be negative");
  return static_cast<StepType>(value);
}


TrainingConfig parse_training_config(const ArgParser& args)
{
  TrainingConfig config;
  config.rows = args.get_option_as_int("--rows", config.rows);
  config.cols = args.get_option_as_int("--cols", config.cols);

  for (const auto& text : args.get_options("--layer"))
    config.layers.push_back(parse_layer_spec(text));

  if (args.option_exists("--alpha"))
    config.alpha = parse_schedule_spec(args.get_option_values("--alpha", 3), "alpha");

  // By default the radius shrinks from half the map size to half a cell
  config.radius = ScheduleSpec{std::max(config.rows, config.cols) / 2., 0.5, Curve::LINEAR};
  if (args.option_exists("--radius"))
    config.radius = parse_schedule_spec(args.get_option_values("--radius", 3), "radius");

  config.has_decay = args.option_exists("--decay");
  if (config.has_decay)
    config.decay = parse_schedule_spec(args.get_option_values("--decay", 3), "decay");

  config.neighbourhood = parse_neighbourhood(args.get_option("--neighbourhood", "gauss"));
  config.local_topology = parse_local_topology(args.get_option("--local-topology", "circ"));
  config.global_topology = parse_global_topology(args.get_option("--global-topology", "plane"));

  if (args.option_exists("--epochs") && args.option_exists("--episodes"))
    throw ConfigError("horizon", "give either --epochs or --episodes");
  if (args.option_exists("--episodes"))
  {
    config.horizon_unit = HorizonUnit::EPISODES;
    config.horizon = parse_count(args.get_option_as_int("--episodes"), "episodes");
  } else {
    config.horizon_unit = HorizonUnit::EPOCHS;
    config.horizon = parse_count(args.get_option_as_int("--epochs", config.horizon), "epochs");
  }

  config.sample_order = parse_sample_order(args.get_option("--order", "shuffled"));
  config.initialization = parse_initialization(args.get_option("--init", "random"));
  config.seed = static_cast<uint32_t>(parse_count(args.get_option_as_int("--seed", 0), "seed"));
  config.snapshot_interval = parse_count(args.get_option_as_int("--snapshot-interval", 0), "snapshot interval");
  config.label_column = args.get_option("--labels");

  return config;
}
