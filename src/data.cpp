#include <fstream>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cmath>
#include "data.hpp"
#include "errors.hpp"


Table::Table(
  const std::vector<std::string>& column_names,
  const std::vector<ColumnKind>& column_kinds,
  const std::string& no_data
) :
  names(column_names),
  kinds(column_kinds),
  no_data(no_data),
  _num_rows(0),
  numbers(column_names.size()),
  categories(column_names.size()),
  missing(column_names.size())
{
  if (this->names.size() != this->kinds.size())
    throw DataError("Expected one column kind per column name");

  for (size_t col = 0; col < this->names.size(); ++col)
  {
    if (std::count(this->names.begin(), this->names.end(), this->names[col]) > 1)
      throw DataError("Duplicate column name", NO_ROW, this->names[col]);
  }
}


void Table::add_row(const std::vector<std::string>& cells)
{
  const IndexType row = this->_num_rows;
  if (cells.size() != this->names.size())
  {
    throw DataError(
      "Expected " + std::to_string(this->names.size()) + " cells but found " + std::to_string(cells.size()),
      row
    );
  }
  if (row == MAX_INDEX_SIZE - 1)
    throw DataError("Too many rows in table", row);

  // Parse everything first so that a failing row leaves the table unchanged
  std::vector<Float> parsed(cells.size(), MISSING_VALUE);
  for (size_t col = 0; col < cells.size(); ++col)
  {
    if (this->kinds[col] != ColumnKind::NUMERIC || cells[col] == this->no_data || cells[col].empty())
      continue;

    size_t end = 0;
    try {
      parsed[col] = std::stod(cells[col], &end);
    } catch (const std::logic_error&) {
      throw DataError("Unable to parse number '" + cells[col] + "'", row, this->names[col]);
    }
    if (end != cells[col].size() || !std::isfinite(parsed[col]))
      throw DataError("Unable to parse number '" + cells[col] + "'", row, this->names[col]);
  }

  for (size_t col = 0; col < cells.size(); ++col)
  {
    if (this->kinds[col] == ColumnKind::NUMERIC)
    {
      this->numbers[col].push_back(parsed[col]);
    }
    else
    {
      const bool is_missing = cells[col] == this->no_data || cells[col].empty();
      this->categories[col].push_back(is_missing ? std::string() : cells[col]);
      this->missing[col].push_back(is_missing);
    }
  }
  this->_num_rows += 1;
}


bool Table::has_column(const std::string& name) const
{
  return std::find(this->names.begin(), this->names.end(), name) != this->names.end();
}


size_t Table::column_index(const std::string& name) const
{
  auto itr = std::find(this->names.begin(), this->names.end(), name);
  if (itr == this->names.end())
    throw DataError("Column not found", NO_ROW, name);
  return static_cast<size_t>(itr - this->names.begin());
}


Float Table::number(IndexType row, size_t col) const
{
  if (this->kinds[col] != ColumnKind::NUMERIC)
    throw DataError("Column is not numeric", row, this->names[col]);
  return this->numbers[col].at(row);
}


const std::string& Table::category(IndexType row, size_t col) const
{
  if (this->kinds[col] != ColumnKind::CATEGORICAL)
    throw DataError("Column is not categorical", row, this->names[col]);
  return this->categories[col].at(row);
}


bool Table::is_missing(IndexType row, size_t col) const
{
  if (this->kinds[col] == ColumnKind::NUMERIC)
    return std::isnan(this->numbers[col].at(row));
  return this->missing[col].at(row);
}


std::string Table::cell_string(IndexType row, size_t col) const
{
  if (this->is_missing(row, col))
    return this->no_data;
  if (this->kinds[col] == ColumnKind::NUMERIC)
  {
    std::ostringstream stream;
    stream << this->numbers[col][row];
    return stream.str();
  }
  return this->categories[col][row];
}


SampleMatrix::SampleMatrix(IndexType num_rows, IndexType input_dim) :
  num_rows(num_rows),
  input_dim(input_dim)
{
  const size_t size = static_cast<size_t>(num_rows) * input_dim;
  try {
    this->values.resize(size, 0.);
  } catch (std::bad_alloc& e) {
    std::cerr << "Failed to allocate " << size * sizeof(Float) << " bytes of memory for samples";
    throw e;
  }
}


std::vector<std::string> split_line(const std::string& line, const char delimiter)
{
  std::vector<std::string> cells;
  std::string cell;
  bool quoted = false;

  for (size_t i = 0; i < line.size(); ++i)
  {
    const char c = line[i];
    if (c == '"')
    {
      if (quoted && i + 1 < line.size() && line[i + 1] == '"')
      {
        cell += '"';  // Escaped quote
        ++i;
      }
      else
      {
        quoted = !quoted;
      }
    }
    else if (c == delimiter && !quoted)
    {
      cells.push_back(cell);
      cell.clear();
    }
    else if (c != '\r' || quoted)
    {
      cell += c;
    }
  }
  cells.push_back(cell);
  return cells;
}


std::string quote_cell(const std::string& cell, const char delimiter)
{
  if (cell.find(delimiter) == std::string::npos && cell.find('"') == std::string::npos)
    return cell;

  std::string quoted = "\"";
  for (const char c : cell)
  {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  return quoted + "\"";
}


Table load_table(
  const std::string& filename,
  const std::vector<std::string>& numeric_columns,
  const char delimiter,
  const std::string& no_data
)
{
  std::cout << "Load table data from " << filename << std::endl;
  if (!file_exists(filename))
    std::__throw_runtime_error("File does not exist");

  std::ifstream file(filename);
  if (!file.is_open())
    std::__throw_runtime_error("Unable to open table file");

  std::string line;
  if (!std::getline(file, line))
    throw DataError("Table file has no header line");

  const std::vector<std::string> names = split_line(line, delimiter);
  std::vector<ColumnKind> kinds;
  for (const auto& name : names)
  {
    const bool is_numeric = std::find(numeric_columns.begin(), numeric_columns.end(), name) != numeric_columns.end();
    kinds.push_back(is_numeric ? ColumnKind::NUMERIC : ColumnKind::CATEGORICAL);
  }
  for (const auto& name : numeric_columns)
  {
    if (std::find(names.begin(), names.end(), name) == names.end())
      throw DataError("Column not found in '" + filename + "'", NO_ROW, name);
  }

  Table table(names, kinds, no_data);
  while (std::getline(file, line))
  {
    if (line.empty() || line == "\r")
      continue;
    table.add_row(split_line(line, delimiter));
  }
  file.close();

  return table;
}
