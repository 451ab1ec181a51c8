#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <limits>
#include <fstream>
#include <sys/stat.h>

typedef uint32_t IndexType;					// Can enumerate all rows of the training data
typedef uint64_t StepType;					// Can enumerate all training steps
typedef uint16_t CellIndexType;			// Can enumerate all cells in the map (e.g. 128**2)
typedef uint32_t CountType;					// Can count how often a label was matched to one cell
typedef double Float;								// Prototype and sample values

const Float MAX_REAL_DISTANCE = std::numeric_limits<Float>::max();
const CellIndexType MAX_NUM_CELLS = std::numeric_limits<CellIndexType>::max();
const CountType MAX_COUNT = std::numeric_limits<CountType>::max();
const IndexType MAX_INDEX_SIZE = std::numeric_limits<IndexType>::max();
const Float MISSING_VALUE = std::numeric_limits<Float>::quiet_NaN();


inline bool file_exists (const std::string& filename)
{
  // Returns `true` iff the given file exists
  // https://stackoverflow.com/a/12774387/6760298
  struct stat buffer;
  return (stat (filename.c_str(), &buffer) == 0);
}


inline bool is_big_endian()
{
    union {
        uint32_t i;
        char c[4];
    } temp = {0x01020304};

    return temp.c[0] == 1;
}


template<typename T> inline void write_uint8(std::ofstream& file, const T value)
{
	uint8_t _value = static_cast<uint8_t>(value);
	file.write((const char*) &_value, sizeof(uint8_t));
}


template<typename T> inline void write_uint64(std::ofstream& file, const T value)
{
	uint64_t _value = static_cast<uint64_t>(value);
	file.write((const char*) &_value, sizeof(uint64_t));
}


inline void write_float(std::ofstream& file, const Float value)
{
	file.write((const char*) &value, sizeof(Float));
}


inline void write_string(std::ofstream& file, const std::string& value)
{
	write_uint64(file, value.size());
	file.write(value.data(), value.size());
}


inline uint8_t read_uint8(std::ifstream& file)
{
	uint8_t _value;
	file.read((char*)&_value, sizeof(_value));
	return _value;
}


inline uint64_t read_uint64(std::ifstream& file)
{
	uint64_t _value;
	file.read((char*)&_value, sizeof(_value));
	return _value;
}


inline Float read_float(std::ifstream& file)
{
	Float _value;
	file.read((char*)&_value, sizeof(_value));
	return _value;
}


inline std::string read_string(std::ifstream& file)
{
	const uint64_t size = read_uint64(file);
	if (!file.good() || size > std::numeric_limits<uint32_t>::max())
		std::__throw_runtime_error("Stored string is corrupt");
	std::string _value(size, '\0');
	file.read(&_value[0], size);
	return _value;
}


enum ColumnKind
{
	NUMERIC=0, CATEGORICAL=1
};


inline std::string get_column_kind_string(ColumnKind kind)
{
	switch (kind)
	{
	case ColumnKind::NUMERIC:
		return "numeric";
	case ColumnKind::CATEGORICAL:
		return "categorical";
	default:
		return "UNKNOWN";
	}
}


// Parsed tabular input. Columns are named and tagged numeric or categorical
// when the table is created. Numeric cells are stored as Float (NaN if
// missing), categorical cells as strings (flagged if missing).
class Table
{
public:
	Table(
		const std::vector<std::string>& column_names,
		const std::vector<ColumnKind>& column_kinds,
		const std::string& no_data = "NA"
	);

	void add_row(const std::vector<std::string>& cells);

	inline IndexType num_rows() const
	{
		return this->_num_rows;
	}

	inline size_t num_cols() const
	{
		return this->names.size();
	}

	inline const std::string& column_name(size_t col) const
	{
		return this->names[col];
	}

	inline ColumnKind column_kind(size_t col) const
	{
		return this->kinds[col];
	}

	inline const std::string& get_no_data() const
	{
		return this->no_data;
	}

	bool has_column(const std::string& name) const;
	size_t column_index(const std::string& name) const;

	// Value of a numeric cell, NaN if missing
	Float number(IndexType row, size_t col) const;

	// Value of a categorical cell; check `is_missing` first
	const std::string& category(IndexType row, size_t col) const;

	bool is_missing(IndexType row, size_t col) const;

	// Text of any cell, the no-data token if missing
	std::string cell_string(IndexType row, size_t col) const;

protected:
	std::vector<std::string> names;
	std::vector<ColumnKind> kinds;
	std::string no_data;
	IndexType _num_rows;

	// One entry per column; only the vector matching the column kind is filled
	std::vector<std::vector<Float>> numbers;
	std::vector<std::vector<std::string>> categories;
	std::vector<std::vector<bool>> missing;
};


// Encoded samples, row-major, `num_rows x input_dim`
class SampleMatrix
{
public:
	SampleMatrix(IndexType num_rows, IndexType input_dim);
	SampleMatrix(const SampleMatrix&) = delete;                 // Disable copy
	SampleMatrix& operator=(const SampleMatrix&) = delete;      // Disable assignment

	inline const Float* row(IndexType index) const
	{
		return &this->values[static_cast<size_t>(index) * this->input_dim];
	}

	inline Float* row(IndexType index)
	{
		return &this->values[static_cast<size_t>(index) * this->input_dim];
	}

	const IndexType num_rows;
	const IndexType input_dim;

protected:
	std::vector<Float> values;
};


// Load a delimited text file with a header line. Columns listed in
// `numeric_columns` are parsed as numbers, all others are kept as text.
Table load_table(
	const std::string& filename,
	const std::vector<std::string>& numeric_columns,
	const char delimiter = ',',
	const std::string& no_data = "NA"
);

std::vector<std::string> split_line(const std::string& line, const char delimiter);

// Quote a cell for delimited output if it contains the delimiter or quotes
std::string quote_cell(const std::string& cell, const char delimiter);
