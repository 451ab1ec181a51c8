#include <iostream>
#include <set>
#include <cmath>
#include <algorithm>
#include "layer.hpp"
#include "errors.hpp"
#include "utils.hpp"


Normalization parse_normalization(const std::string& name)
{
  if (name == "none")
    return Normalization::NONE;
  if (name == "gauss" || name == "z-score")
    return Normalization::GAUSS;
  if (name == "unit")
    return Normalization::UNIT;
  throw ConfigError("normalization", "'" + name + "' is not one of (none|gauss|unit)");
}


Layer::Layer(const LayerSpec& spec) :
  spec(spec),
  fitted(false)
{
  const std::string parameter = "layer '" + spec.name + "'";
  if (spec.name.empty())
    throw ConfigError("layer", "every layer needs a name");
  if (spec.columns.empty())
    throw ConfigError(parameter, "a layer needs at least one column");
  if (!std::isfinite(spec.weight) || spec.weight < 0.)
    throw ConfigError(parameter, "the weight must be a finite number >= 0");
  if (spec.kind == ColumnKind::CATEGORICAL && spec.columns.size() != 1)
    throw ConfigError(parameter, "a categorical layer has exactly one column");
  if (spec.kind == ColumnKind::CATEGORICAL && spec.normalization != Normalization::NONE)
    throw ConfigError(parameter, "a categorical layer cannot be normalized");
  if (!std::isfinite(spec.scale) || spec.scale <= 0.)
    throw ConfigError(parameter, "the scale must be a finite number > 0");
  if (spec.kind == ColumnKind::CATEGORICAL && spec.scale != 1.)
    throw ConfigError(parameter, "a categorical layer cannot be scaled");
  if (spec.kind != ColumnKind::NUMERIC && spec.kind != ColumnKind::CATEGORICAL)
    throw ConfigError(parameter, "unknown layer kind");
  for (const auto& column : spec.columns)
  {
    if (std::count(spec.columns.begin(), spec.columns.end(), column) > 1)
      throw ConfigError(parameter, "column '" + column + "' is listed twice");
  }
}


Layer::Layer(std::ifstream& file) :
  fitted(false)
{
  this->spec.name = read_string(file);
  const uint8_t kind = read_uint8(file);
  const uint8_t normalization = read_uint8(file);
  if (!file.good() || kind > static_cast<uint8_t>(ColumnKind::CATEGORICAL) || normalization > static_cast<uint8_t>(Normalization::UNIT))
    std::__throw_runtime_error("Stored model is corrupt");
  this->spec.kind = static_cast<ColumnKind>(kind);
  this->spec.normalization = static_cast<Normalization>(normalization);
  this->spec.weight = read_float(file);
  this->spec.scale = read_float(file);

  const uint64_t num_columns = read_uint64(file);
  for (uint64_t i = 0; i < num_columns && file.good(); ++i)
    this->spec.columns.push_back(read_string(file));

  this->fitted = read_uint8(file) != 0;
  const uint64_t num_parameters = read_uint64(file);
  for (uint64_t i = 0; i < num_parameters && file.good(); ++i)
  {
    this->offsets.push_back(read_float(file));
    this->scales.push_back(read_float(file));
  }
  const uint64_t num_categories = read_uint64(file);
  for (uint64_t i = 0; i < num_categories && file.good(); ++i)
    this->categories.push_back(read_string(file));

  if (!file.good() || !this->fitted || this->spec.columns.empty())
    std::__throw_runtime_error("Stored model is corrupt");
  if (this->spec.kind == ColumnKind::NUMERIC)
  {
    if (this->offsets.size() != this->spec.columns.size() || !this->categories.empty())
      std::__throw_runtime_error("Stored model is corrupt");
    for (const auto scale : this->scales)
    {
      if (!std::isfinite(scale) || scale == 0.)
        std::__throw_runtime_error("Stored model is corrupt");
    }
  } else if (this->spec.columns.size() != 1 || !this->offsets.empty()) {
    std::__throw_runtime_error("Stored model is corrupt");
  }
  this->build_category_codes();
}


void Layer::save(std::ofstream& file) const
{
  write_string(file, this->spec.name);
  write_uint8(file, this->spec.kind);
  write_uint8(file, this->spec.normalization);
  write_float(file, this->spec.weight);
  write_float(file, this->spec.scale);

  write_uint64(file, this->spec.columns.size());
  for (const auto& column : this->spec.columns)
    write_string(file, column);

  write_uint8(file, this->fitted ? 1 : 0);
  write_uint64(file, this->offsets.size());
  for (size_t i = 0; i < this->offsets.size(); ++i)
  {
    write_float(file, this->offsets[i]);
    write_float(file, this->scales[i]);
  }
  write_uint64(file, this->categories.size());
  for (const auto& category : this->categories)
    write_string(file, category);
}


IndexType Layer::get_width() const
{
  if (this->spec.kind == ColumnKind::CATEGORICAL)
  {
    if (!this->fitted)
      std::__throw_logic_error("The width of a categorical layer is known only after fitting");
    return static_cast<IndexType>(this->categories.size());
  }
  return static_cast<IndexType>(this->spec.columns.size());
}


std::vector<size_t> Layer::resolve_columns(const Table& table) const
{
  std::vector<size_t> columns;
  for (const auto& name : this->spec.columns)
  {
    if (!table.has_column(name))
      throw DataError("Column of layer '" + this->spec.name + "' not found", NO_ROW, name);
    const size_t column = table.column_index(name);
    if (table.column_kind(column) != this->spec.kind)
    {
      throw DataError(
        "Layer '" + this->spec.name + "' is " + get_column_kind_string(this->spec.kind)
          + " but the column is " + get_column_kind_string(table.column_kind(column)),
        NO_ROW,
        name
      );
    }
    columns.push_back(column);
  }
  return columns;
}


void Layer::fit(const Table& table)
{
  if (this->fitted)
    std::__throw_logic_error("Layer has already been fitted");

  const auto columns = this->resolve_columns(table);
  if (this->spec.kind == ColumnKind::CATEGORICAL)
    this->fit_categorical(table, columns[0]);
  else
    this->fit_numeric(table, columns);

  this->fitted = true;
}


void Layer::fit_numeric(const Table& table, const std::vector<size_t>& columns)
{
  this->offsets.assign(columns.size(), 0.);
  this->scales.assign(columns.size(), 1.);

  for (size_t i = 0; i < columns.size(); ++i)
  {
    IndexType count = 0;
    Float sum = 0., min = MAX_REAL_DISTANCE, max = -MAX_REAL_DISTANCE;
    for (IndexType row = 0; row < table.num_rows(); ++row)
    {
      const Float value = table.number(row, columns[i]);
      if (std::isnan(value))
        continue;
      count += 1;
      sum += value;
      min = std::min(min, value);
      max = std::max(max, value);
    }

    // Zero spread or too few values fall back to identity
    bool is_normalized = false;
    switch (this->spec.normalization)
    {
    case Normalization::GAUSS:
    {
      if (count < 2)
        break;
      const Float mean = sum / count;
      Float sum_of_squares = 0.;
      for (IndexType row = 0; row < table.num_rows(); ++row)
      {
        const Float value = table.number(row, columns[i]);
        if (!std::isnan(value))
          sum_of_squares += squared(value - mean);
      }
      const Float deviation = std::sqrt(sum_of_squares / (count - 1));
      if (deviation > 0.)
      {
        this->offsets[i] = mean;
        this->scales[i] = deviation;
        is_normalized = true;
      }
      break;
    }
    case Normalization::UNIT:
      if (count > 0 && max > min)
      {
        this->offsets[i] = min;
        this->scales[i] = max - min;
        is_normalized = true;
      }
      break;
    case Normalization::NONE:
      break;
    default:
      throw ConfigError("normalization", "unknown normalization of layer '" + this->spec.name + "'");
    }

    if (this->spec.normalization != Normalization::NONE && !is_normalized)
    {
      std::cout << "WARNING: Column '" << this->spec.columns[i] << "' of layer '" << this->spec.name
                << "' has no spread; it is not normalized" << std::endl;
    }
    this->scales[i] /= this->spec.scale;
  }
}


void Layer::fit_categorical(const Table& table, const size_t column)
{
  std::set<std::string> observed;
  for (IndexType row = 0; row < table.num_rows(); ++row)
  {
    if (!table.is_missing(row, column))
      observed.insert(table.category(row, column));
  }
  this->categories.assign(observed.begin(), observed.end());
  this->build_category_codes();

  if (this->categories.empty())
    std::cout << "WARNING: Categorical layer '" << this->spec.name << "' has no categories" << std::endl;
}


void Layer::build_category_codes()
{
  this->category_codes.clear();
  for (IndexType code = 0; code < this->categories.size(); ++code)
    this->category_codes[this->categories[code]] = code;
}


void Layer::transform(const Table& table, IndexType row, Float* const out) const
{
  this->transform(table, row, this->resolve_columns(table), out);
}


void Layer::transform(const Table& table, IndexType row, const std::vector<size_t>& columns, Float* const out) const
{
  if (!this->fitted)
    std::__throw_logic_error("Layer must be fitted before transforming data");

  if (this->spec.kind == ColumnKind::CATEGORICAL)
  {
    const IndexType width = this->get_width();
    if (table.is_missing(row, columns[0]))
    {
      std::fill_n(out, width, MISSING_VALUE);
      return;
    }
    const std::string& value = table.category(row, columns[0]);
    const auto itr = this->category_codes.find(value);
    if (itr == this->category_codes.end())
      throw UnknownCategory(this->spec.name, value, row);
    std::fill_n(out, width, 0.);
    out[itr->second] = 1.;
    return;
  }

  for (size_t i = 0; i < columns.size(); ++i)
  {
    const Float value = table.number(row, columns[i]);
    out[i] = std::isnan(value) ? MISSING_VALUE : (value - this->offsets[i]) / this->scales[i];
  }
}


std::vector<Float> Layer::denormalize(const Float* const segment) const
{
  std::vector<Float> values(segment, segment + this->get_width());
  if (this->spec.kind == ColumnKind::NUMERIC)
  {
    for (size_t i = 0; i < values.size(); ++i)
      values[i] = values[i] * this->scales[i] + this->offsets[i];
  }
  return values;
}


std::string Layer::category(const Float* const segment) const
{
  std::string result;
  Float best = -MAX_REAL_DISTANCE;
  for (IndexType i = 0; i < this->categories.size(); ++i)
  {
    if (!std::isnan(segment[i]) && segment[i] > best)
    {
      best = segment[i];
      result = this->categories[i];
    }
  }
  return result;
}


std::vector<std::string> Layer::dimension_names() const
{
  if (this->spec.kind == ColumnKind::NUMERIC)
    return this->spec.columns;

  std::vector<std::string> names;
  for (const auto& category : this->categories)
    names.push_back(this->spec.columns[0] + ":" + category);
  return names;
}


IndexType total_width(const std::vector<Layer>& layers)
{
  IndexType width = 0;
  for (const auto& layer : layers)
    width += layer.get_width();
  return width;
}


void encode_table(const std::vector<Layer>& layers, const Table& table, SampleMatrix& samples)
{
  if (samples.num_rows != table.num_rows() || samples.input_dim != total_width(layers))
    throw DataError("Sample matrix does not match the table and layers");

  std::vector<std::vector<size_t>> columns;
  for (const auto& layer : layers)
    columns.push_back(layer.resolve_columns(table));

  for (IndexType row = 0; row < table.num_rows(); ++row)
  {
    Float* out = samples.row(row);
    for (size_t i = 0; i < layers.size(); ++i)
    {
      layers[i].transform(table, row, columns[i], out);
      out += layers[i].get_width();
    }
  }
}
