#pragma once

#include <map>
#include <string>
#include <vector>
#include <fstream>
#include "data.hpp"

enum Normalization
{
  NONE=0, GAUSS=1, UNIT=2
};

inline std::string get_normalization_string(Normalization normalization)
{
  switch (normalization)
  {
  case Normalization::NONE:
    return "none";
  case Normalization::GAUSS:
    return "gauss";
  case Normalization::UNIT:
    return "unit";
  default:
    return "UNKNOWN";
  }
}

Normalization parse_normalization(const std::string& name);


// Configuration of one data layer
struct LayerSpec
{
  std::string name;
  std::vector<std::string> columns;
  ColumnKind kind;
  Normalization normalization;
  Float weight;
  Float scale = 1.;   // Numeric layers: normalized values are multiplied by this factor
};


// One named group of table columns, encoded into one segment of every
// sample and prototype vector. A numeric layer encodes each of its columns
// into one normalized value. A categorical layer has a single column and
// encodes it one-hot over the categories seen by `fit`.
class Layer
{
public:
  explicit Layer(const LayerSpec& spec);
  explicit Layer(std::ifstream& file);

  // Compute normalization parameters or the category list; only once
  void fit(const Table& table);

  // Table column indices of this layer, checked against the column kinds
  std::vector<size_t> resolve_columns(const Table& table) const;

  // Write the encoded segment of `row` to `out` (`get_width()` values)
  void transform(const Table& table, IndexType row, Float* const out) const;
  void transform(const Table& table, IndexType row, const std::vector<size_t>& columns, Float* const out) const;

  // Numeric values in the units of the input table
  std::vector<Float> denormalize(const Float* const segment) const;

  // Category with the largest component, empty if the segment has none
  std::string category(const Float* const segment) const;

  // Names of the segment's dimensions, e.g. "x" or "species:setosa"
  std::vector<std::string> dimension_names() const;

  void save(std::ofstream& file) const;

  inline const LayerSpec& get_spec() const { return this->spec; }
  inline const std::string& get_name() const { return this->spec.name; }
  inline ColumnKind get_kind() const { return this->spec.kind; }
  inline Normalization get_normalization() const { return this->spec.normalization; }
  inline Float get_weight() const { return this->spec.weight; }
  inline const std::vector<std::string>& get_columns() const { return this->spec.columns; }
  inline const std::vector<std::string>& get_categories() const { return this->categories; }
  inline const std::vector<Float>& get_offsets() const { return this->offsets; }
  inline const std::vector<Float>& get_scales() const { return this->scales; }
  inline bool is_fitted() const { return this->fitted; }

  // Width of the encoded segment; known only after `fit` for categorical layers
  IndexType get_width() const;

private:
  void fit_numeric(const Table& table, const std::vector<size_t>& columns);
  void fit_categorical(const Table& table, const size_t column);
  void build_category_codes();

  LayerSpec spec;
  bool fitted;

  // Numeric layers: encoded = (value - offset) / scale, where scale is the
  // fitted spread divided by the layer's scale factor
  std::vector<Float> offsets;
  std::vector<Float> scales;

  // Categorical layers: sorted categories and their one-hot positions
  std::vector<std::string> categories;
  std::map<std::string, IndexType> category_codes;
};


// Sum of the segment widths of fitted layers
IndexType total_width(const std::vector<Layer>& layers);

// Encode every row of `table` into `samples`, one segment per layer
void encode_table(const std::vector<Layer>& layers, const Table& table, SampleMatrix& samples);
