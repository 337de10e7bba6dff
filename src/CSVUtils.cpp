#include "CSVUtils.h"
#include "TaxSynthExceptions.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != kBom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3) return;

    is.clear(is.rdstate() & ~std::ios::eofbit);
    for (size_t i = 0; i < matched; ++i) is.unget();
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      ParseStatus* status,
                                      const ParseLimits& limits) {
    ParseStatus local;
    ParseStatus& st = status ? *status : local;
    st = ParseStatus{};
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    size_t recordBytes = 0;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) st.limitExceeded = true;
    };

    while (is.get(c)) {
        if (limits.maxRecordBytes > 0 && ++recordBytes > limits.maxRecordBytes) {
            st.limitExceeded = true;
            break;
        }

        if (c == '"') {
            if (!inQuotes && CSVUtils::trimUnquotedField(val).empty() && !fieldQuoted) {
                val.clear();
                inQuotes = true;
                fieldQuoted = true;
            } else if (inQuotes && is.peek() == '"') {
                is.get();
                val += '"';
            } else if (inQuotes) {
                inQuotes = false;
            } else {
                val += c;
            }
        } else if (c == delimiter && !inQuotes) {
            sawDelimiter = true;
            pushField();
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            ++st.consumedLines;
            if (!inQuotes) break;
            val += '\n';
        } else {
            val += c;
        }

        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) st.limitExceeded = true;
        if (st.limitExceeded) break;
    }

    if (inQuotes) st.malformed = true;

    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(val).empty()) {
        return {};
    }
    pushField();
    return row;
}

void validateHeader(const std::vector<std::string>& header) {
    std::unordered_set<std::string> seen;
    seen.reserve(header.size());
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i].empty()) {
            throw TaxSynth::DatasetException("Empty column name at header position " + std::to_string(i + 1));
        }
        if (!seen.insert(header[i]).second) {
            throw TaxSynth::DatasetException("Duplicate column name in header: " + header[i]);
        }
    }
}

std::string quoteField(const std::string& value, char delimiter) {
    if (value.find_first_of(std::string{delimiter, '"', '\n', '\r'}) == std::string::npos) {
        return value;
    }
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

CSVChunkReader::CSVChunkReader(std::istream& is, char delimiter, ParseLimits limits)
    : is_(is), delimiter_(delimiter), limits_(limits) {}

std::vector<std::vector<std::string>> CSVChunkReader::readChunk(size_t maxRows) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(maxRows);
    while (rows.size() < maxRows && is_.peek() != EOF) {
        ParseStatus status;
        const size_t recordLine = lineNumber_;
        auto row = parseCSVLine(is_, delimiter_, &status, limits_);
        lineNumber_ += status.consumedLines;
        if (status.limitExceeded) {
            throw TaxSynth::DatasetException("CSV record starting at line " + std::to_string(recordLine) +
                                             " exceeds parser limits");
        }
        if (status.malformed) {
            throw TaxSynth::DatasetException("Unterminated quoted field in record starting at line " +
                                             std::to_string(recordLine));
        }
        if (row.empty()) continue;
        rows.push_back(std::move(row));
    }
    return rows;
}
} // namespace CSVUtils
