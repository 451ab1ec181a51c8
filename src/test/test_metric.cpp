#include <cmath>
#include <catch2/catch.hpp>
#include "../metric.hpp"


TEST_CASE("The distance is a weighted sum of squared euclidean layer distances")
{
  // Layer "a" covers dimensions 0-1, layer "b" dimensions 2-4
  DistanceMetric metric(std::vector<Segment>{{0, 2, 1.}, {2, 3, 0.5}});
  REQUIRE(metric.get_input_dim() == 5);

  const Float sample[5] = {1., 2., 1., 0., 0.};
  const Float prototype[5] = {0., 0., 0., 1., 0.};

  REQUIRE(metric.distance(sample, prototype) == Approx(1. * 5. + 0.5 * 2.));
  REQUIRE(metric.distance(sample, prototype) == metric.distance(prototype, sample));
  REQUIRE(metric.distance(sample, sample) == 0.);
}


TEST_CASE("Layers with zero weight or zero width do not contribute")
{
  DistanceMetric metric(std::vector<Segment>{{0, 1, 0.}, {1, 0, 1.}, {1, 1, 2.}});

  const Float sample[2] = {100., 1.};
  const Float prototype[2] = {0., 0.};
  REQUIRE(metric.distance(sample, prototype) == 2.);
}


TEST_CASE("Missing values are skipped")
{
  DistanceMetric metric(std::vector<Segment>{{0, 3, 1.}});

  const Float sample[3] = {MISSING_VALUE, 1., MISSING_VALUE};
  const Float prototype[3] = {5., 3., 0.};
  REQUIRE(metric.distance(sample, prototype) == 4.);
  REQUIRE(squared_distance(sample, prototype, 3) == 4.);

  const Float empty[3] = {MISSING_VALUE, MISSING_VALUE, MISSING_VALUE};
  REQUIRE(metric.distance(empty, prototype) == 0.);
}


TEST_CASE("A metric built from layers follows their order and widths")
{
  Table table({"x", "c"}, {ColumnKind::NUMERIC, ColumnKind::CATEGORICAL});
  table.add_row({"1", "u"});
  table.add_row({"2", "v"});

  std::vector<Layer> layers;
  layers.emplace_back(LayerSpec{"c", {"c"}, ColumnKind::CATEGORICAL, Normalization::NONE, 3.});
  layers.emplace_back(LayerSpec{"x", {"x"}, ColumnKind::NUMERIC, Normalization::NONE, 1.});
  for (auto& layer : layers)
    layer.fit(table);

  DistanceMetric metric(layers);
  REQUIRE(metric.get_input_dim() == 3);
  REQUIRE(metric.get_segments().size() == 2);
  REQUIRE(metric.get_segments()[0].offset == 0);
  REQUIRE(metric.get_segments()[0].width == 2);
  REQUIRE(metric.get_segments()[0].weight == 3.);
  REQUIRE(metric.get_segments()[1].offset == 2);
  REQUIRE(metric.get_segments()[1].width == 1);

  SampleMatrix samples(2, 3);
  encode_table(layers, table, samples);
  // One-hot segments differ in two components
  REQUIRE(metric.distance(samples.row(0), samples.row(1)) == 3. * 2. + 1.);
}
