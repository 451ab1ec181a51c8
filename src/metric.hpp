#pragma once

#include <vector>
#include "data.hpp"
#include "layer.hpp"


// Where one layer's segment sits inside a sample vector
struct Segment
{
  IndexType offset;
  IndexType width;
  Float weight;
};


// Weighted sum of per-layer squared euclidean distances. Dimensions that are
// NaN on either side (missing values) do not contribute.
class DistanceMetric
{
public:
  DistanceMetric(const std::vector<Layer>& layers);
  DistanceMetric(const std::vector<Segment>& segments);

  Float distance(const Float* const sample, const Float* const prototype) const;

  inline IndexType get_input_dim() const { return this->input_dim; }
  inline const std::vector<Segment>& get_segments() const { return this->segments; }

private:
  std::vector<Segment> segments;
  IndexType input_dim;
};


Float squared_distance(const Float* const a, const Float* const b, const IndexType size);
