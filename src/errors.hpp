#pragma once

#include <stdexcept>
#include <string>
#include <limits>
#include "data.hpp"

const IndexType NO_ROW = std::numeric_limits<IndexType>::max();


// Invalid training configuration, raised before any training step runs
class ConfigError : public std::invalid_argument
{
public:
  ConfigError(const std::string& parameter, const std::string& message) :
    std::invalid_argument("Invalid " + parameter + ": " + message),
    _parameter(parameter)
  {}

  inline const std::string& parameter() const { return this->_parameter; }

private:
  std::string _parameter;
};


// Input data that does not match the declared layers
class DataError : public std::runtime_error
{
public:
  DataError(const std::string& message, IndexType row = NO_ROW, const std::string& column = "") :
    std::runtime_error(message + context_string(row, column)),
    _row(row),
    _column(column)
  {}

  inline IndexType row() const { return this->_row; }
  inline const std::string& column() const { return this->_column; }

private:
  static std::string context_string(IndexType row, const std::string& column)
  {
    std::string context;
    if (row != NO_ROW)
      context += " (row " + std::to_string(row);
    if (!column.empty())
      context += (context.empty() ? " (" : ", ") + std::string("column '") + column + "'";
    if (!context.empty())
      context += ")";
    return context;
  }

  IndexType _row;
  std::string _column;
};


// A categorical value that was not observed when the layer was fitted
class UnknownCategory : public DataError
{
public:
  UnknownCategory(const std::string& layer, const std::string& category, IndexType row = NO_ROW) :
    DataError("Unknown category '" + category + "' in layer '" + layer + "'", row),
    _layer(layer),
    _category(category)
  {}

  inline const std::string& layer() const { return this->_layer; }
  inline const std::string& category() const { return this->_category; }

private:
  std::string _layer;
  std::string _category;
};
