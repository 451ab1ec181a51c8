#define VERSION_MAJOR 1
#define VERSION_MINOR 0
#define VERSION_PATCH 0

#include <iostream>
#include <vector>
#include <algorithm>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <thread>
#include <csignal>
#include "argparse.hpp"
#include "data.hpp"
#include "config.hpp"
#include "layer.hpp"
#include "model.hpp"
#include "som.hpp"
#include "train.hpp"
#include "utils.hpp"
#include "errors.hpp"


namespace fs = std::filesystem;

volatile std::sig_atomic_t stop_requested = 0;


void request_stop(int)
{
  stop_requested = 1;
}


char get_delimiter(const ArgParser& args)
{
  const std::string delimiter = args.get_option("--delimiter", ",");
  if (delimiter == "\\t" || delimiter == "tab")
    return '\t';
  if (delimiter.size() != 1)
    throw ConfigError("delimiter", "'" + delimiter + "' is not a single character");
  return delimiter[0];
}


std::vector<std::string> numeric_columns(const std::vector<LayerSpec>& layers)
{
  std::vector<std::string> columns;
  for (const auto& layer : layers)
  {
    if (layer.kind == ColumnKind::NUMERIC)
      columns.insert(columns.end(), layer.columns.begin(), layer.columns.end());
  }
  return columns;
}


void create_super_som(ArgParser& args) {
  // Determine settings
  const std::string training_data_filename = args.get_option(1);
  const fs::path directory = args.get_option("--directory", "");
  const fs::path name = args.get_option("--name", "");
  const std::string no_data = args.get_option("--no-data", "NA");
  const std::vector<std::string> preserve = args.get_options("--preserve");
  const char delimiter = get_delimiter(args);
  const bool verbose = args.option_exists("--verbose");
  TrainingConfig config = parse_training_config(args);

  // Check settings
  if (name.empty())
    throw ConfigError("name", "please provide a name with --name");
  if (directory.empty())
    throw ConfigError("directory", "please provide a base directory with --directory");
  if (verbose && config.snapshot_interval == 0)
    config.snapshot_interval = 1000;
  config.validate();

  const fs::path model_save_filename = directory / name / fs::path("model.bin");
  const fs::path units_save_filename = directory / name / fs::path("units.csv");
  const fs::path best_matching_units_save_filename = directory / name / fs::path("bmus.csv");
  const fs::path convergence_log_filename = directory / name / fs::path("convergence.tsv");
  const fs::path readme_log_filename = directory / name / fs::path("README.md");
  const fs::path preliminary_output_directory = directory / name;

  if (!fs::exists(directory / name))
    fs::create_directories(directory / name);

  std::ofstream readme;
  readme.open(readme_log_filename.c_str(), std::ofstream::out);

  // Print settings
  std::cout << "Creating a super-SOM " << name << " with" << std::endl
            << config
            << std::endl;

  readme << "# Super-SOM " << name << std::endl
    << std::endl
    << "ssom version:          " << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH << std::endl
    << "Training data:         " << training_data_filename << std::endl
    << "Verbose:               " << verbose << std::endl
    << std::endl
    << "## Hyperparameters" << std::endl
    << config
    << std::endl
    << "## Machine" << std::endl
    << "CPU:                   " << get_cpu_name() << std::endl
    << "Max. parallel threads: " << std::thread::hardware_concurrency() << std::endl
    << std::endl;

  std::ofstream convergence_log_stream;
  convergence_log_stream.open(convergence_log_filename.c_str(), std::ofstream::out);

  // Create the map
  auto stop_watch = StopWatch();
  stop_watch.start();

  std::vector<std::string> columns = numeric_columns(config.layers);
  const Table table = load_table(training_data_filename, columns, delimiter, no_data);

  std::cout << "Number of rows:        " << table.num_rows() << std::endl
            << "Number of columns:     " << table.num_cols() << std::endl;

  readme  << "## Dataset" << std::endl
          << "Number of rows:        " << table.num_rows() << std::endl
          << "Number of columns:     " << table.num_cols() << std::endl
          << std::endl;

  Trainer trainer(config, table, &convergence_log_stream);

  std::signal(SIGINT, request_stop);
  const bool completed = trainer.run(
    []() { return stop_requested != 0; },
    [&](const GridSnapshot& snapshot) {
      std::stringstream preliminary_filename;
      preliminary_filename << preliminary_output_directory.string() << "/prelim-" << snapshot.step << ".grid.bin";
      snapshot.save_to_file(preliminary_filename.str());
    }
  );
  std::signal(SIGINT, SIG_DFL);
  if (!completed)
    std::cout << "WARNING: Saving the partially trained map" << std::endl;

  const Model model = trainer.finalize();
  model.save_to_file(model_save_filename.string());
  model.save_units_csv(units_save_filename.string(), delimiter);
  model.save_best_matching_units_csv(best_matching_units_save_filename.string(), table, preserve, delimiter);

  const Float quantization_error = model.quantization_error(table);
  const Float topographic_error = model.topographic_error(table);
  std::cout << "Quantization error:    " << quantization_error << std::endl
            << "Topographic error:     " << topographic_error << std::endl;

  stop_watch.stop();
  std::cout << "Creating the super-SOM took " << stop_watch << std::endl;

  readme << "## Result" << std::endl
         << "Training steps:        " << model.get_steps() << std::endl
         << "Completed:             " << completed << std::endl
         << "Quantization error:    " << quantization_error << std::endl
         << "Topographic error:     " << topographic_error << std::endl
         << std::endl
         << "## Timing" << std::endl
         << "Creation started at UnixTime:   " << stop_watch.get_start_unix_time() << std::endl
         << "Creation ended at UnixTime:     " << get_unix_time() << std::endl
         << "Creating the super-SOM took:    " << stop_watch << std::endl;

  readme.close();
  convergence_log_stream.close();
}


void query_super_som(ArgParser& args) {
  const std::string model_filename = args.get_option(1);
  const std::string data_filename = args.get_option(2);
  const std::string output_filename = args.get_option(3);
  const std::string no_data = args.get_option("--no-data", "NA");
  const std::vector<std::string> preserve = args.get_options("--preserve");
  const char delimiter = get_delimiter(args);

  const Model model(model_filename);

  std::vector<std::string> columns;
  for (const auto& layer : model.get_layers())
  {
    if (layer.get_kind() == ColumnKind::NUMERIC)
      columns.insert(columns.end(), layer.get_columns().begin(), layer.get_columns().end());
  }
  const Table table = load_table(data_filename, columns, delimiter, no_data);

  model.save_best_matching_units_csv(output_filename, table, preserve, delimiter);
  std::cout << "Quantization error:    " << model.quantization_error(table) << std::endl;
}


void print_help()
{
  std::cout << "Usage:" << std::endl
            << "  ssom create <data file> --directory <dir> --name <name> --layer <layer> [--layer <layer> ...] [options]" << std::endl
            << "  ssom query <model file> <data file> <output file> [--preserve <column> ...]" << std::endl
            << std::endl
            << "A layer is given as name:kind:normalization:weight:column1,column2,...[:scale]" << std::endl
            << "  kind:          num | cat" << std::endl
            << "  normalization: none | gauss | unit" << std::endl
            << "  scale:         factor applied after normalization, numeric layers only (default 1)" << std::endl
            << std::endl
            << "Options of create:" << std::endl
            << "  --rows <n> --cols <n>                 Grid size (default 10 x 10)" << std::endl
            << "  --alpha <start> <end> <lin|exp>       Learning rate (default 0.2 0.01 lin)" << std::endl
            << "  --radius <start> <end> <lin|exp>      Neighbourhood radius (default half the map size to 0.5)" << std::endl
            << "  --decay <start> <end> <lin|exp>       Weight decay after every epoch (default none)" << std::endl
            << "  --neighbourhood <gauss|bubble>        Neighbourhood kernel (default gauss)" << std::endl
            << "  --local-topology <circ|rect|hexa>     Distance between cells (default circ)" << std::endl
            << "  --global-topology <plane|torus>       Map boundary (default plane)" << std::endl
            << "  --epochs <n> | --episodes <n>         Training horizon (default 10 epochs)" << std::endl
            << "  --order <shuffled|sequential>         Sample order within an epoch (default shuffled)" << std::endl
            << "  --init <random|samples>               Grid initialization (default random)" << std::endl
            << "  --seed <n>                            Random seed (default 0)" << std::endl
            << "  --snapshot-interval <n>               Save the grid every n steps (default never)" << std::endl
            << "  --labels <column>                     Column counted per node" << std::endl
            << "  --preserve <column>                   Column copied to bmus.csv" << std::endl
            << "  --delimiter <char>                    Field delimiter (default ,)" << std::endl
            << "  --no-data <token>                     Missing value token (default NA)" << std::endl
            << "  --verbose                             Save grid snapshots every 1000 steps" << std::endl
            << std::endl
            << "Maximum number of cells: " << MAX_NUM_CELLS << std::endl;
}


int main(int argc, char* argv[])
{
  if (is_big_endian())
  {
    // ToDo: Implement import/export routines for big endian systems
    std::cerr << "Sorry, ssom does not work on big endian systems" << std::endl;
    return 1;
  }

  try
  {
    ArgParser args(argc, argv);
    std::string mode = args.get_option(0);
    if (mode == "create") {
      create_super_som(args);
    } else if (mode == "query") {
      query_super_som(args);
    } else if (mode == "--version") {
      std::cout << "v" << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH << std::endl;
    } else if (mode == "--help" || mode == "-h") {
      print_help();
    } else {
      std::__throw_invalid_argument("Unknown mode");
    }

  } catch (const std::exception &exc) {
      std::cerr << exc.what() << std::endl;
      return 1;
  }

  return 0;
}
