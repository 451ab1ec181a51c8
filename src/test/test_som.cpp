#include <cmath>
#include <cstdio>
#include <fstream>
#include <random>
#include <catch2/catch.hpp>
#include "../som.hpp"
#include "../errors.hpp"


SCENARIO("Neighbourhood kernels concentrate the update around the best matching unit")
{
  GIVEN("A gaussian or bubble kernel")
  {
    InfluenceFunction kernel = GENERATE(
      as<InfluenceFunction>{},
      influence_function(NeighbourhoodKind::GAUSSIAN),
      influence_function(NeighbourhoodKind::BUBBLE)
    );

    WHEN("The radius is positive")
    {
      const Float radius = GENERATE(0.1, 0.5, 1., 3.7, 100.);

      THEN("The best matching unit receives the full update")
      {
        REQUIRE(kernel(0., radius) == 1.);
      }

      THEN("The influence does not increase with distance")
      {
        Float previous = kernel(0., radius);
        for (int i = 1; i <= 50; ++i)
        {
          const Float influence = kernel(i * 0.25, radius);
          REQUIRE(influence <= previous);
          REQUIRE(influence >= 0.);
          previous = influence;
        }
      }
    }

    WHEN("The radius is zero")
    {
      THEN("Only the best matching unit is updated")
      {
        REQUIRE(kernel(0., 0.) == 1.);
        REQUIRE(kernel(1., 0.) == 0.);
        REQUIRE(kernel(0.5, -1.) == 0.);
      }
    }
  }
}


TEST_CASE("Kernel values match their closed forms")
{
  REQUIRE(gaussian_influence(1., 1.) == Approx(std::exp(-0.5)));
  REQUIRE(gaussian_influence(2., 1.) == Approx(std::exp(-2.)));
  REQUIRE(bubble_influence(1., 1.) == 1.);
  REQUIRE(bubble_influence(1.0001, 1.) == 0.);

  REQUIRE(parse_neighbourhood("gauss") == NeighbourhoodKind::GAUSSIAN);
  REQUIRE(parse_neighbourhood("bubble") == NeighbourhoodKind::BUBBLE);
  REQUIRE_THROWS_AS(parse_neighbourhood("mexican-hat"), ConfigError);
}


TEST_CASE("The neighbourhood combines grid topology and kernel")
{
  Neighbourhood neighbourhood(2, 3, GlobalTopology::PLANE, LocalTopology::CIRC, NeighbourhoodKind::GAUSSIAN);

  // Cell 4 is (1, 1), cell 2 is (0, 2)
  REQUIRE(neighbourhood.grid_distance(4, 2) == Approx(std::sqrt(2.)));
  REQUIRE(neighbourhood.influence(4, 4, 0.7) == 1.);
  REQUIRE(neighbourhood.influence(4, 2, 1.) == Approx(std::exp(-1.)));
  REQUIRE(neighbourhood.are_neighbours(0, 1));
  REQUIRE(neighbourhood.are_neighbours(0, 3));
  REQUIRE_FALSE(neighbourhood.are_neighbours(0, 4));
  REQUIRE_FALSE(neighbourhood.are_neighbours(0, 2));
}


SCENARIO("The grid is correctly created and initialized")
{
  GIVEN("A randomly initialized grid")
  {
    std::default_random_engine random_number_generator(3);
    Grid grid(4, 3, 5);
    grid.init(random_number_generator);

    THEN("All its values are between 0 and 1")
    {
      REQUIRE(grid.get_num_cells() == 12);
      REQUIRE(grid.get_values().size() == 60);
      for (size_t i = 0; i < 60; ++i) {
        REQUIRE(0.0 <= grid.get_value(i));
        REQUIRE(grid.get_value(i) < 1.0);
      }
      REQUIRE_THROWS(grid.get_value(60));
    }

    THEN("The same seed gives the same grid")
    {
      std::default_random_engine other_generator(3);
      Grid other(4, 3, 5);
      other.init(other_generator);
      REQUIRE(other.get_values() == grid.get_values());
    }

    THEN("Cells are numbered row by row")
    {
      REQUIRE(grid.cell(2, 1) == 7);
      REQUIRE(grid.position(7) == GridPosition{2, 1});
    }
  }

  GIVEN("A grid initialized from samples")
  {
    SampleMatrix samples(2, 2);
    samples.row(0)[0] = 10.;
    samples.row(0)[1] = 20.;
    samples.row(1)[0] = 30.;
    samples.row(1)[1] = MISSING_VALUE;

    std::default_random_engine random_number_generator(5);
    Grid grid(2, 2, 2);
    grid.init(samples, random_number_generator);

    THEN("Every prototype is a copy of a sample with missing values drawn uniformly")
    {
      for (CellIndexType cell = 0; cell < 4; ++cell)
      {
        const Float* const w = grid.prototype(cell);
        REQUIRE((w[0] == 10. || w[0] == 30.));
        if (w[0] == 10.)
          REQUIRE(w[1] == 20.);
        else
          REQUIRE((0. <= w[1] && w[1] < 1.));
      }
    }
  }

  THEN("Grid sizes are bounded")
  {
    REQUIRE_THROWS_AS(Grid(0, 3, 2), ConfigError);
    REQUIRE_THROWS_AS(Grid(256, 256, 2), ConfigError);
  }
}


SCENARIO("Best matching units are found by exhaustive search")
{
  DistanceMetric metric(std::vector<Segment>{{0, 2, 1.}});
  Grid grid(2, 2, 2);
  grid.set_prototype(0, {1., 1.});
  grid.set_prototype(1, {0., 0.});
  grid.set_prototype(2, {0., 0.});
  grid.set_prototype(3, {5., 5.});

  GIVEN("A sample closest to a single node")
  {
    const Float sample[2] = {4., 4.};

    THEN("That node is the best matching unit")
    {
      Float distance;
      REQUIRE(grid.find_best_matching_unit(sample, metric, &distance) == 3);
      REQUIRE(distance == 2.);
      REQUIRE(grid.find_bmu(sample, metric) == GridPosition{1, 1});
    }

    THEN("The second best node is found as well")
    {
      CellIndexType best, next_best;
      grid.find_best_and_next_best_matching_units(sample, metric, best, next_best);
      REQUIRE(best == 3);
      REQUIRE(next_best == 0);
    }
  }

  GIVEN("A sample equally close to two nodes")
  {
    const Float sample[2] = {0., 0.};

    THEN("The node with the smaller row and column wins")
    {
      REQUIRE(grid.find_bmu(sample, metric) == GridPosition{0, 1});

      CellIndexType best, next_best;
      grid.find_best_and_next_best_matching_units(sample, metric, best, next_best);
      REQUIRE(best == 1);
      REQUIRE(next_best == 2);
    }
  }

  GIVEN("A prototype of the wrong width")
  {
    THEN("It is rejected")
    {
      REQUIRE_THROWS_AS(grid.set_prototype(0, {1.}), DataError);
      REQUIRE_THROWS_AS(grid.set_prototype(4, {1., 2.}), std::out_of_range);
    }
  }
}


SCENARIO("An update moves prototypes toward the sample")
{
  DistanceMetric metric(std::vector<Segment>{{0, 3, 1.}});
  Neighbourhood neighbourhood(3, 3, GlobalTopology::PLANE, LocalTopology::CIRC, NeighbourhoodKind::GAUSSIAN);
  std::default_random_engine random_number_generator(11);
  Grid grid(3, 3, 3);
  grid.init(random_number_generator);
  const Float sample[3] = {2., -1., 0.5};

  GIVEN("A learning rate in (0, 1]")
  {
    const Float alpha = GENERATE(0.01, 0.3, 1.);
    const Float radius = GENERATE(0., 0.5, 2.);

    THEN("The distance between the best matching unit and the sample strictly decreases")
    {
      Float before;
      const CellIndexType best_matching_unit = grid.find_best_matching_unit(sample, metric, &before);
      grid.apply_update(sample, best_matching_unit, alpha, radius, neighbourhood);
      const Float after = metric.distance(sample, grid.prototype(best_matching_unit));
      REQUIRE(after < before);
      if (alpha == 1.)
        REQUIRE(after == Approx(0.).margin(1e-12));
    }
  }

  GIVEN("A learning rate of zero")
  {
    THEN("Nothing changes")
    {
      const std::vector<Float> before = grid.get_values();
      grid.apply_update(sample, 4, 0., 2., neighbourhood);
      REQUIRE(grid.get_values() == before);
    }
  }

  GIVEN("A radius of zero")
  {
    THEN("Only the best matching unit changes")
    {
      const std::vector<Float> before = grid.get_values();
      grid.apply_update(sample, 4, 0.5, 0., neighbourhood);
      for (CellIndexType cell = 0; cell < 9; ++cell)
      {
        for (IndexType i = 0; i < 3; ++i)
        {
          if (cell == 4)
            REQUIRE(grid.prototype(cell)[i] != before[cell * 3 + i]);
          else
            REQUIRE(grid.prototype(cell)[i] == before[cell * 3 + i]);
        }
      }
    }
  }

  GIVEN("A sample with a missing value")
  {
    THEN("The missing dimension is left alone")
    {
      const Float partial[3] = {2., MISSING_VALUE, 0.5};
      const Float previous = grid.prototype(0)[1];
      grid.apply_update(partial, 0, 1., 1., neighbourhood);
      REQUIRE(grid.prototype(0)[1] == previous);
      REQUIRE(grid.prototype(0)[0] == Approx(2.));
    }
  }
}


TEST_CASE("Weight decay pulls prototypes toward their mean")
{
  Grid grid(1, 2, 1);
  grid.set_prototype(0, {0.});
  grid.set_prototype(1, {4.});

  grid.apply_decay(0.);
  REQUIRE(grid.prototype(0)[0] == 0.);

  grid.apply_decay(0.25);
  REQUIRE(grid.prototype(0)[0] == Approx(0.5));
  REQUIRE(grid.prototype(1)[0] == Approx(3.5));

  grid.apply_decay(1.);
  REQUIRE(grid.prototype(0)[0] == Approx(2.));
  REQUIRE(grid.prototype(1)[0] == Approx(2.));
}


TEST_CASE("Label counts give a majority per node")
{
  Grid grid(1, 2, 1);
  grid.count_label(0, "b");
  grid.count_label(0, "a");
  grid.count_label(0, "b");
  grid.count_label(1, "z");
  grid.count_label(1, "y");

  REQUIRE(grid.label_majority(0) == "b");
  REQUIRE(grid.label_majority(1) == "y");

  const GridSnapshot snapshot = grid.snapshot(17);
  REQUIRE(snapshot.step == 17);
  REQUIRE(snapshot.label_majority == std::vector<std::string>{"b", "y"});

  grid.clear_labels();
  REQUIRE(grid.label_majority(0).empty());
}


TEST_CASE("Saving and loading a grid works")
{
  // Generate a temporary filename
  std::string filename = std::tmpnam(nullptr);

  std::default_random_engine random_number_generator(1);
  Grid grid(2, 3, 4);
  grid.init(random_number_generator);
  {
    std::ofstream file(filename, std::ios::binary);
    grid.save(file);
  }

  std::ifstream file(filename, std::ios::binary);
  Grid loaded(file);
  file.close();
  std::remove(filename.c_str());

  REQUIRE(loaded.get_height() == 2);
  REQUIRE(loaded.get_width() == 3);
  REQUIRE(loaded.get_input_dim() == 4);
  REQUIRE(loaded.get_values() == grid.get_values());
}


TEST_CASE("Stored grids with an invalid shape are rejected")
{
  std::string filename = std::tmpnam(nullptr);
  const uint64_t height = GENERATE(as<uint64_t>{}, 0, 2, uint64_t(1) << 32);
  const uint64_t width = height == 2 ? 0 : uint64_t(1) << 32;
  {
    std::ofstream file(filename, std::ios::binary);
    write_uint64(file, height);
    write_uint64(file, width);
    write_uint64(file, 3);
    write_float(file, 0.);
  }

  std::ifstream file(filename, std::ios::binary);
  REQUIRE_THROWS_AS(Grid(file), std::runtime_error);
  file.close();
  std::remove(filename.c_str());
}
