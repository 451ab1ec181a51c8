#include <limits>
#include <sstream>
#include <string>
#include <catch2/catch.hpp>
#include "fixtures.hpp"
#include "../train.hpp"
#include "../errors.hpp"


static size_t count_lines(const std::string& text)
{
  size_t lines = 0;
  for (const char c : text)
    lines += (c == '\n');
  return lines;
}


SCENARIO("Training separates two clusters")
{
  GIVEN("Four rows in two clusters and a 2 x 2 map")
  {
    const uint32_t seed = GENERATE(1u, 7u, 42u, 123u);
    const Table table = make_cluster_table();
    Trainer trainer(make_cluster_config(seed), table);
    REQUIRE(trainer.get_state() == TrainerState::INITIALIZED);
    REQUIRE(trainer.get_total_steps() == 4);

    WHEN("The map is trained for one pass")
    {
      REQUIRE(trainer.run());
      REQUIRE(trainer.get_state() == TrainerState::FINISHED);
      const Model model = trainer.finalize();

      THEN("Rows of the same cluster share a node or adjacent nodes and the clusters do not meet")
      {
        const Grid& grid = model.get_grid();
        CellIndexType units[4];
        for (IndexType row = 0; row < 4; ++row)
        {
          const GridPosition position = model.query(table, row);
          units[row] = grid.cell(position.row, position.col);
        }
        REQUIRE(model.get_neighbourhood().are_neighbours(units[0], units[1]));
        REQUIRE(units[0] != units[2]);
        REQUIRE(units[0] != units[3]);
        REQUIRE(units[1] != units[2]);
        REQUIRE(units[1] != units[3]);
      }
    }
  }
}


TEST_CASE("Identical seeds, configurations and data give identical grids")
{
  const Table table = make_cluster_table();
  TrainingConfig config = make_cluster_config(9);
  config.rows = 3;
  config.cols = 4;
  config.sample_order = SampleOrder::SHUFFLED;
  config.horizon = 25;
  config.has_decay = true;
  config.decay = ScheduleSpec{0.1, 0.01, Curve::EXPONENTIAL};

  Trainer first(config, table);
  Trainer second(config, table);
  first.run();
  second.run();
  REQUIRE(first.get_grid().get_values() == second.get_grid().get_values());

  config.seed = 10;
  Trainer third(config, table);
  third.run();
  REQUIRE(third.get_grid().get_values() != first.get_grid().get_values());
}


TEST_CASE("Episodes draw single rows until the horizon")
{
  const Table table = make_cluster_table();
  TrainingConfig config = make_cluster_config();
  config.horizon_unit = HorizonUnit::EPISODES;
  config.horizon = 6;

  std::ostringstream log;
  Trainer trainer(config, table, &log);
  REQUIRE(trainer.get_total_steps() == 6);

  StepType steps = 0;
  while (trainer.step())
    steps += 1;
  REQUIRE(steps == 6);
  REQUIRE_FALSE(trainer.step());
  REQUIRE(trainer.get_state() == TrainerState::FINISHED);

  // Header, one full block of four steps and the final partial block
  REQUIRE(count_lines(log.str()) == 3);
  REQUIRE(log.str().rfind("Step\tUnixTime", 0) == 0);
}


TEST_CASE("The convergence log has one line per epoch")
{
  const Table table = make_cluster_table();
  TrainingConfig config = make_cluster_config();
  config.horizon = 3;

  std::ostringstream log;
  Trainer trainer(config, table, &log);
  trainer.run();
  REQUIRE(count_lines(log.str()) == 4);
}


TEST_CASE("Schedules advance with the step counter")
{
  const Table table = make_cluster_table();
  Trainer trainer(make_cluster_config(), table);

  REQUIRE(trainer.get_alpha() == 0.5);
  REQUIRE(trainer.get_radius() == 1.);
  trainer.step();
  trainer.step();
  REQUIRE(trainer.get_alpha() == Approx(0.255));
  REQUIRE(trainer.get_radius() == Approx(0.55));
  REQUIRE(trainer.get_decay() == 0.);
  trainer.run();
  REQUIRE(trainer.get_alpha() == 0.01);
  REQUIRE(trainer.get_radius() == 0.1);
}


TEST_CASE("Full weight decay collapses every prototype onto the mean")
{
  const Table table = make_cluster_table();
  TrainingConfig config = make_cluster_config();
  config.has_decay = true;
  config.decay = ScheduleSpec{1., 1., Curve::LINEAR};

  Trainer trainer(config, table);
  trainer.run();
  const Grid& grid = trainer.get_grid();
  for (CellIndexType cell = 1; cell < grid.get_num_cells(); ++cell)
  {
    for (IndexType i = 0; i < grid.get_input_dim(); ++i)
      REQUIRE(grid.prototype(cell)[i] == Approx(grid.prototype(0)[i]));
  }
}


SCENARIO("Training can be stopped between steps")
{
  const Table table = make_cluster_table();
  TrainingConfig config = make_cluster_config();
  config.horizon = 5;
  Trainer trainer(config, table);

  GIVEN("A stop callback that fires after three steps")
  {
    int calls = 0;
    const bool completed = trainer.run([&calls]() { return ++calls > 3; });

    THEN("The trainer keeps a usable grid and can resume")
    {
      REQUIRE_FALSE(completed);
      REQUIRE(trainer.get_step() == 3);
      REQUIRE(trainer.get_state() == TrainerState::TRAINING);
      REQUIRE(trainer.get_grid().get_values().size() == 4 * 3);

      REQUIRE(trainer.run());
      REQUIRE(trainer.get_step() == 20);
      REQUIRE(trainer.get_state() == TrainerState::FINISHED);
    }

    THEN("The partially trained map can be finalized")
    {
      const Model model = trainer.finalize();
      REQUIRE(model.get_steps() == 3);
      REQUIRE_NOTHROW(model.query(table, 0));
    }
  }
}


TEST_CASE("Snapshots arrive every snapshot interval")
{
  const Table table = make_cluster_table();
  TrainingConfig config = make_cluster_config();
  config.horizon = 2;
  config.snapshot_interval = 3;
  config.label_column = "class";

  std::vector<StepType> steps;
  Trainer trainer(config, table);
  trainer.run(nullptr, [&steps](const GridSnapshot& snapshot) {
    steps.push_back(snapshot.step);
    REQUIRE(snapshot.height == 2);
    REQUIRE(snapshot.width == 2);
    REQUIRE(snapshot.input_dim == 3);
    REQUIRE(snapshot.prototypes.size() == 12);
    REQUIRE(snapshot.label_majority.size() == 4);
  });
  REQUIRE(steps == std::vector<StepType>{3, 6});

  config.snapshot_interval = 0;
  Trainer silent(config, table);
  int snapshots = 0;
  silent.run(nullptr, [&snapshots](const GridSnapshot&) { snapshots += 1; });
  REQUIRE(snapshots == 0);
}


TEST_CASE("A finalized trainer rejects every further call")
{
  const Table table = make_cluster_table();
  Trainer trainer(make_cluster_config(), table);
  trainer.run();
  const Model model = trainer.finalize();

  REQUIRE(trainer.is_finalized());
  REQUIRE_THROWS_AS(trainer.step(), std::logic_error);
  REQUIRE_THROWS_AS(trainer.run(), std::logic_error);
  REQUIRE_THROWS_AS(trainer.finalize(), std::logic_error);
  REQUIRE_THROWS_AS(trainer.get_grid(), std::logic_error);
  REQUIRE_THROWS_AS(trainer.snapshot(), std::logic_error);
  REQUIRE_THROWS_AS(trainer.get_state(), std::logic_error);
}


TEST_CASE("Invalid configurations and data are rejected before the first step")
{
  const Table table = make_cluster_table();

  TrainingConfig config = make_cluster_config();
  config.alpha = ScheduleSpec{0.5, -0.1, Curve::LINEAR};
  REQUIRE_THROWS_AS(Trainer(config, table), ConfigError);

  config = make_cluster_config();
  config.layers[0].columns = {"z"};
  REQUIRE_THROWS_AS(Trainer(config, table), DataError);

  config = make_cluster_config();
  config.label_column = "label";
  REQUIRE_THROWS_AS(Trainer(config, table), DataError);

  config = make_cluster_config();
  config.layers[1].kind = ColumnKind::NUMERIC;
  REQUIRE_THROWS_AS(Trainer(config, table), DataError);

  config = make_cluster_config();
  config.horizon = std::numeric_limits<StepType>::max() / 4 + 1;
  REQUIRE_THROWS_AS(Trainer(config, table), ConfigError);
  config.horizon = std::numeric_limits<StepType>::max() / 3;
  REQUIRE_THROWS_AS(Trainer(config, table), ConfigError);

  Table empty({"x", "class"}, {ColumnKind::NUMERIC, ColumnKind::CATEGORICAL});
  REQUIRE_THROWS_AS(Trainer(make_cluster_config(), empty), DataError);
}


TEST_CASE("A disabled weight decay is not checked")
{
  const Table table = make_cluster_table();
  TrainingConfig config = make_cluster_config();
  config.has_decay = false;
  config.decay = ScheduleSpec{0., 0., Curve::EXPONENTIAL};

  Trainer trainer(config, table);
  REQUIRE(trainer.get_decay() == 0.);
  REQUIRE(trainer.run());

  config.has_decay = true;
  REQUIRE_THROWS_AS(Trainer(config, table), ConfigError);
}


TEST_CASE("Grids can be seeded from samples")
{
  const Table table = make_cluster_table();
  TrainingConfig config = make_cluster_config();
  config.initialization = Initialization::SAMPLES;

  Trainer trainer(config, table);
  const Grid& grid = trainer.get_grid();
  const SampleMatrix& samples = trainer.get_samples();
  for (CellIndexType cell = 0; cell < grid.get_num_cells(); ++cell)
  {
    bool matches_a_row = false;
    for (IndexType row = 0; row < samples.num_rows; ++row)
    {
      bool equal = true;
      for (IndexType i = 0; i < samples.input_dim; ++i)
        equal = equal && grid.prototype(cell)[i] == samples.row(row)[i];
      matches_a_row = matches_a_row || equal;
    }
    REQUIRE(matches_a_row);
  }
}
