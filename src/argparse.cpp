#include "argparse.hpp"
#include "errors.hpp"
#include <algorithm>    // std::find
#include <exception>
#include <iterator>     // std::distance


ArgParser::ArgParser(int &argc, char **argv)
{
  for (int i=1; i < argc; ++i)
    this->tokens.push_back(std::string(argv[i]));
}


ArgParser::ArgParser(const std::vector<std::string>& tokens) :
  tokens(tokens)
{}


const std::string& ArgParser::get_option(const uint position) const
{
  if (this->tokens.size() <= position)
    std::__throw_invalid_argument("Missing argument");
  return this->tokens[position];
}


const std::string& ArgParser::get_option(const std::string &name, const std::string &default_value) const
{
  if (this->get_option(name) == "")
    return default_value;
  return this->get_option(name);
}


const std::string& ArgParser::get_option(const std::string &name) const
{
  std::vector<std::string>::const_iterator itr;
  itr =  std::find(this->tokens.begin(), this->tokens.end(), name);
  if (itr != this->tokens.end() && ++itr != this->tokens.end())
  {
    return *itr;
  }
  static const std::string empty_string("");
  return empty_string;
}


std::vector<std::string> ArgParser::get_options(const std::string &name) const
{
  std::vector<std::string> values;
  auto itr = this->tokens.begin();
  while ((itr = std::find(itr, this->tokens.end(), name)) != this->tokens.end())
  {
    if (++itr == this->tokens.end())
      throw ConfigError(name, "missing value");
    values.push_back(*itr);
  }
  return values;
}


std::vector<std::string> ArgParser::get_option_values(const std::string &name, const size_t count) const
{
  auto itr = std::find(this->tokens.begin(), this->tokens.end(), name);
  if (itr == this->tokens.end())
    return {};

  ++itr;
  if (static_cast<size_t>(std::distance(itr, this->tokens.end())) < count)
    throw ConfigError(name, "expected " + std::to_string(count) + " values");
  return std::vector<std::string>(itr, itr + count);
}


int64_t parse_int(const std::string& text, const std::string& parameter)
{
  size_t end = 0;
  int64_t value = 0;
  try {
    value = std::stoll(text, &end);
  } catch (const std::logic_error&) {
    end = 0;
  }
  if (text.empty() || end != text.size())
    throw ConfigError(parameter, "'" + text + "' is not an integer");
  return value;
}


Float parse_float(const std::string& text, const std::string& parameter)
{
  size_t end = 0;
  Float value = 0.;
  try {
    value = std::stod(text, &end);
  } catch (const std::logic_error&) {
    end = 0;
  }
  if (text.empty() || end != text.size())
    throw ConfigError(parameter, "'" + text + "' is not a number");
  return value;
}


int64_t ArgParser::get_option_as_int(const uint position) const
{
  return parse_int(this->get_option(position), "argument " + std::to_string(position));
}


int64_t ArgParser::get_option_as_int(const std::string &name, const int64_t default_value) const
{
  if (!this->option_exists(name))
    return default_value;
  return this->get_option_as_int(name);
}


int64_t ArgParser::get_option_as_int(const std::string &name) const
{
  return parse_int(this->get_option(name), name);
}


Float ArgParser::get_option_as_float(const std::string &name, const Float default_value) const
{
  if (!this->option_exists(name))
    return default_value;
  return this->get_option_as_float(name);
}


Float ArgParser::get_option_as_float(const std::string &name) const
{
  return parse_float(this->get_option(name), name);
}


bool ArgParser::option_exists(const std::string &option) const
{
  return std::find(this->tokens.begin(), this->tokens.end(), option) != this->tokens.end();
}
