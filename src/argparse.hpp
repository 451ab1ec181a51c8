#pragma once

#include <vector>
#include <string>
#include "data.hpp"

class ArgParser
{
  // ArgParser class based on https://stackoverflow.com/a/868894/6760298
  // Helps with parsing command line arguments. Malformed numbers raise a
  // ConfigError that names the option.

  public:
    ArgParser (int &argc, char **argv);
    explicit ArgParser (const std::vector<std::string>& tokens);

    const std::string& get_option(const uint position) const;
    const std::string& get_option(const std::string &name, const std::string &default_value) const;
    const std::string& get_option(const std::string &name) const;

    // Values following every occurrence of a repeatable option, e.g. `--layer`
    std::vector<std::string> get_options(const std::string &name) const;

    // The `count` tokens following `name`, e.g. `--alpha 0.5 0.01 lin`
    std::vector<std::string> get_option_values(const std::string &name, const size_t count) const;

    int64_t get_option_as_int(const uint position) const;
    int64_t get_option_as_int(const std::string &name, const int64_t default_value) const;
    int64_t get_option_as_int(const std::string &name) const;
    Float get_option_as_float(const std::string &name, const Float default_value) const;
    Float get_option_as_float(const std::string &name) const;

    bool option_exists(const std::string &option) const;

  private:
    std::vector <std::string> tokens;
};


int64_t parse_int(const std::string& text, const std::string& parameter);
Float parse_float(const std::string& text, const std::string& parameter);
