#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnKind { INTEGER, REAL };
using ColumnStorage = std::variant<std::vector<int64_t>, std::vector<double>>;

struct DataColumn {
    std::string name;
    ColumnKind kind = ColumnKind::INTEGER;
    ColumnStorage values = std::vector<int64_t>{};
};

// Shortest round-trip text; fixed notation in [1e-4, 1e16), integral values keep a ".0".
void appendReal(std::string& out, double v);

/**
 * In-memory column store for a table of tax filing units.
 * Every cell is numeric; a column is INTEGER when all of its source tokens are
 * integral, REAL otherwise. Column order is the source header order and is
 * preserved by every mutation except dropColumn.
 */
class TaxDataset {
public:
    TaxDataset() = default;
    explicit TaxDataset(std::string filename, char delimiter = ',');

    /**
     * @brief Loads the CSV file named at construction.
     * @post columns() holds one aligned vector per header column.
     * @throws TaxSynth::IOException when the file cannot be opened.
     * @throws TaxSynth::DatasetException on malformed CSV, ragged rows or non-numeric cells.
     */
    void load();

    /**
     * @brief Writes the table as CSV to a temporary sibling and renames it into place.
     * @throws TaxSynth::IOException when the file cannot be written.
     */
    void save(const std::string& path) const;

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    const std::string& filename() const noexcept { return filename_; }

    const std::vector<DataColumn>& columns() const noexcept { return columns_; }
    std::vector<std::string> columnNames() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;
    bool hasColumn(const std::string& name) const { return findColumnIndex(name) >= 0; }

    /**
     * @brief Appends a column; the first column fixes the row count.
     * @throws TaxSynth::DatasetException on duplicate name or length mismatch.
     */
    void addColumn(std::string name, std::vector<int64_t> values);
    void addColumn(std::string name, std::vector<double> values);

    /**
     * @throws TaxSynth::DatasetException when the column is absent.
     */
    void dropColumn(const std::string& name);

    /**
     * @brief Replaces the values of an existing column, or appends a new one.
     * @throws TaxSynth::DatasetException on length mismatch.
     */
    void setIntegerColumn(const std::string& name, std::vector<int64_t> values);

    /**
     * @brief Column values rounded half-to-even and converted to int64.
     * @throws TaxSynth::DatasetException when the column is absent or a
     *         rounded value lies outside the int64 range.
     */
    std::vector<int64_t> integerValues(const std::string& name) const;

    /**
     * @brief Keeps the rows listed in rowOrder, in that order.
     * @pre every index is < rowCount(); duplicates are allowed.
     * @throws TaxSynth::DatasetException on an out-of-bounds index.
     */
    void selectRows(const std::vector<size_t>& rowOrder);

    /**
     * @brief Sum of every column, in column order.
     */
    std::vector<long double> columnTotals() const;

private:
    std::string filename_;
    char delimiter_ = ',';
    size_t rowCount_ = 0;
    std::vector<DataColumn> columns_;

    DataColumn& columnRef(const std::string& name);
    const DataColumn& columnRef(const std::string& name) const;
    void checkAppendLength(const std::string& name, size_t length) const;
};
