#include <cmath>
#include <algorithm>
#include "metric.hpp"
#include "utils.hpp"


DistanceMetric::DistanceMetric(const std::vector<Layer>& layers) :
  input_dim(0)
{
  for (const auto& layer : layers)
  {
    const IndexType width = layer.get_width();
    this->segments.push_back(Segment{this->input_dim, width, layer.get_weight()});
    this->input_dim += width;
  }
}


DistanceMetric::DistanceMetric(const std::vector<Segment>& segments) :
  segments(segments),
  input_dim(0)
{
  for (const auto& segment : segments)
    this->input_dim = std::max(this->input_dim, segment.offset + segment.width);
}


Float squared_distance(const Float* const a, const Float* const b, const IndexType size)
{
  Float result = 0.;
  for (IndexType i = 0; i < size; ++i)
  {
    const Float difference = a[i] - b[i];
    if (!std::isnan(difference))
      result += squared(difference);
  }
  return result;
}


Float DistanceMetric::distance(const Float* const sample, const Float* const prototype) const
{
  Float result = 0.;
  for (const auto& segment : this->segments)
  {
    if (segment.weight == 0. || segment.width == 0)
      continue;
    result += segment.weight * squared_distance(sample + segment.offset, prototype + segment.offset, segment.width);
  }
  return result;
}
