#include "TaxDataset.h"
#include "CSVUtils.h"
#include "TaxSynthExceptions.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <type_traits>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr size_t kLoadChunkRows = 8192;
constexpr size_t kWriteFlushBytes = 1 << 20;
// 2^63; every double in [-2^63, 2^63) converts to int64 exactly.
constexpr double kInt64Bound = 9223372036854775808.0;

bool parseInteger(const std::string& token, int64_t& out) {
    const char* b = token.data();
    const char* e = b + token.size();
    if (b != e && *b == '+') ++b;
    auto [p, ec] = std::from_chars(b, e, out);
    return ec == std::errc{} && p == e;
}

bool parseFiniteDouble(const std::string& token, double& out) {
    const char* b = token.data();
    const char* e = b + token.size();
    if (b != e && *b == '+') ++b;
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

// Column under construction: integral until the first non-integral token.
struct ColumnBuilder {
    std::vector<int64_t> ints;
    std::vector<double> reals;
    bool integral = true;

    void push(const std::string& token, const std::string& column, size_t dataRow) {
        if (integral) {
            int64_t iv = 0;
            if (parseInteger(token, iv)) {
                ints.push_back(iv);
                return;
            }
            reals.reserve(ints.capacity());
            for (int64_t v : ints) reals.push_back(static_cast<double>(v));
            ints.clear();
            ints.shrink_to_fit();
            integral = false;
        }
        double dv = 0.0;
        if (!parseFiniteDouble(token, dv)) {
            throw TaxSynth::DatasetException("Non-numeric value '" + token + "' in column " + column +
                                             " at data row " + std::to_string(dataRow));
        }
        reals.push_back(dv);
    }
};
}

void appendReal(std::string& out, double v) {
    char buf[400];
    const double mag = std::fabs(v);
    const auto format = (v == 0.0 || (mag >= 1e-4 && mag < 1e16)) ? std::chars_format::fixed
                                                                  : std::chars_format::scientific;
    auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), v, format);
    if (ec != std::errc{}) {
        throw TaxSynth::DatasetException("Unable to format numeric value");
    }
    const std::string_view text(buf, static_cast<size_t>(p - buf));
    out.append(text);
    if (text.find_first_of(".eE") == std::string_view::npos) out += ".0";
}

TaxDataset::TaxDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

void TaxDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw TaxSynth::IOException("Could not open file: " + filename_);

    CSVUtils::skipBOM(in);

    CSVUtils::ParseStatus status;
    const auto header = CSVUtils::parseCSVLine(in, delimiter_, &status);
    if (status.malformed || status.limitExceeded || header.empty()) {
        throw TaxSynth::DatasetException("Malformed or empty CSV header in " + filename_);
    }
    CSVUtils::validateHeader(header);

    std::vector<ColumnBuilder> builders(header.size());
    CSVUtils::CSVChunkReader reader(in, delimiter_);
    size_t dataRows = 0;
    while (true) {
        auto chunk = reader.readChunk(kLoadChunkRows);
        if (chunk.empty()) break;
        for (const auto& row : chunk) {
            ++dataRows;
            if (row.size() != header.size()) {
                throw TaxSynth::DatasetException("Data row " + std::to_string(dataRows) + " has " +
                                                 std::to_string(row.size()) + " fields, expected " +
                                                 std::to_string(header.size()));
            }
            for (size_t c = 0; c < header.size(); ++c) {
                builders[c].push(row[c], header[c], dataRows);
            }
        }
    }

    columns_.clear();
    columns_.reserve(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        DataColumn col;
        col.name = header[c];
        if (builders[c].integral) {
            col.kind = ColumnKind::INTEGER;
            col.values = std::move(builders[c].ints);
        } else {
            col.kind = ColumnKind::REAL;
            col.values = std::move(builders[c].reals);
        }
        columns_.push_back(std::move(col));
    }
    rowCount_ = dataRows;
}

void TaxDataset::save(const std::string& path) const {
    namespace fs = std::filesystem;
    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out) throw TaxSynth::IOException("Unable to write output file: " + path);

        std::string chunk;
        chunk.reserve(kWriteFlushBytes + 4096);
        for (size_t c = 0; c < columns_.size(); ++c) {
            if (c) chunk.push_back(delimiter_);
            chunk += CSVUtils::quoteField(columns_[c].name, delimiter_);
        }
        chunk.push_back('\n');

        for (size_t r = 0; r < rowCount_; ++r) {
            for (size_t c = 0; c < columns_.size(); ++c) {
                if (c) chunk.push_back(delimiter_);
                if (columns_[c].kind == ColumnKind::INTEGER) {
                    chunk += std::to_string(std::get<std::vector<int64_t>>(columns_[c].values)[r]);
                } else {
                    appendReal(chunk, std::get<std::vector<double>>(columns_[c].values)[r]);
                }
            }
            chunk.push_back('\n');
            if (chunk.size() >= kWriteFlushBytes) {
                out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                chunk.clear();
            }
        }
        if (!chunk.empty()) {
            out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        }
        out.flush();
        if (!out.good()) {
            out.close();
            std::error_code ec;
            fs::remove(tmpPath, ec);
            throw TaxSynth::IOException("Failed while writing output file: " + path);
        }
    }

    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw TaxSynth::IOException("Unable to move output into place: " + path + " (" + ec.message() + ")");
    }
}

std::vector<std::string> TaxDataset::columnNames() const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& col : columns_) out.push_back(col.name);
    return out;
}

int TaxDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

void TaxDataset::checkAppendLength(const std::string& name, size_t length) const {
    if (hasColumn(name)) throw TaxSynth::DatasetException("Column already present: " + name);
    if (!columns_.empty() && length != rowCount_) {
        throw TaxSynth::DatasetException("Column " + name + " has " + std::to_string(length) +
                                         " rows, expected " + std::to_string(rowCount_));
    }
}

void TaxDataset::addColumn(std::string name, std::vector<int64_t> values) {
    checkAppendLength(name, values.size());
    rowCount_ = values.size();
    columns_.push_back(DataColumn{std::move(name), ColumnKind::INTEGER, std::move(values)});
}

void TaxDataset::addColumn(std::string name, std::vector<double> values) {
    checkAppendLength(name, values.size());
    rowCount_ = values.size();
    columns_.push_back(DataColumn{std::move(name), ColumnKind::REAL, std::move(values)});
}

void TaxDataset::dropColumn(const std::string& name) {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw TaxSynth::DatasetException("Cannot drop absent column: " + name);
    columns_.erase(columns_.begin() + idx);
}

DataColumn& TaxDataset::columnRef(const std::string& name) {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw TaxSynth::DatasetException("Column not found: " + name);
    return columns_[static_cast<size_t>(idx)];
}

const DataColumn& TaxDataset::columnRef(const std::string& name) const {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw TaxSynth::DatasetException("Column not found: " + name);
    return columns_[static_cast<size_t>(idx)];
}

void TaxDataset::setIntegerColumn(const std::string& name, std::vector<int64_t> values) {
    if (!hasColumn(name)) {
        addColumn(name, std::move(values));
        return;
    }
    if (values.size() != rowCount_) {
        throw TaxSynth::DatasetException("Column " + name + " has " + std::to_string(values.size()) +
                                         " rows, expected " + std::to_string(rowCount_));
    }
    DataColumn& col = columnRef(name);
    col.kind = ColumnKind::INTEGER;
    col.values = std::move(values);
}

std::vector<int64_t> TaxDataset::integerValues(const std::string& name) const {
    const DataColumn& col = columnRef(name);
    if (col.kind == ColumnKind::INTEGER) return std::get<std::vector<int64_t>>(col.values);

    const auto& reals = std::get<std::vector<double>>(col.values);
    std::vector<int64_t> out;
    out.reserve(reals.size());
    for (size_t r = 0; r < reals.size(); ++r) {
        // nearbyint honours the default round-half-to-even mode.
        const double rounded = std::nearbyint(reals[r]);
        if (!(rounded >= -kInt64Bound && rounded < kInt64Bound)) {
            throw TaxSynth::DatasetException("Value in column " + name + " at row " + std::to_string(r + 1) +
                                             " does not fit in int64");
        }
        out.push_back(static_cast<int64_t>(rounded));
    }
    return out;
}

void TaxDataset::selectRows(const std::vector<size_t>& rowOrder) {
    for (size_t idx : rowOrder) {
        if (idx >= rowCount_) {
            throw TaxSynth::DatasetException("Row index " + std::to_string(idx) + " out of bounds for " +
                                             std::to_string(rowCount_) + " rows");
        }
    }
    for (auto& col : columns_) {
        std::visit([&](auto& values) {
            std::remove_reference_t<decltype(values)> next;
            next.reserve(rowOrder.size());
            for (size_t idx : rowOrder) next.push_back(values[idx]);
            values = std::move(next);
        }, col.values);
    }
    rowCount_ = rowOrder.size();
}

std::vector<long double> TaxDataset::columnTotals() const {
    std::vector<long double> totals(columns_.size(), 0.0L);
    const long long colCount = static_cast<long long>(columns_.size());
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long long c = 0; c < colCount; ++c) {
        long double sum = 0.0L;
        std::visit([&](const auto& values) {
            for (const auto v : values) sum += static_cast<long double>(v);
        }, columns_[static_cast<size_t>(c)].values);
        totals[static_cast<size_t>(c)] = sum;
    }
    return totals;
}
