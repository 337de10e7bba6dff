#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization, header checks and field quoting.
// Numeric interpretation of fields lives in TaxDataset.
struct ParseLimits {
	size_t maxFieldBytes = 1024 * 1024;               // 1 MiB
	size_t maxRecordBytes = 64 * 1024 * 1024;         // 64 MiB
	size_t maxColumns = 20000;
};

struct ParseStatus {
	bool malformed = false;      // unterminated quote
	bool limitExceeded = false;
	size_t consumedLines = 0;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical CSV record (quoted fields may span lines).
 * @return Empty vector on EOF or on a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  ParseStatus* status = nullptr,
									  const ParseLimits& limits = ParseLimits{});

/**
 * @brief Rejects empty or duplicated column names.
 * @throws TaxSynth::DatasetException naming the offending column.
 */
void validateHeader(const std::vector<std::string>& header);

// Quotes a field only when it contains the delimiter, a quote or a line break.
std::string quoteField(const std::string& value, char delimiter);

class CSVChunkReader {
public:
	explicit CSVChunkReader(std::istream& is, char delimiter, ParseLimits limits = ParseLimits{});

	/**
	 * @brief Reads up to maxRows non-blank records.
	 * @throws TaxSynth::DatasetException on a malformed record or exceeded limit,
	 *         naming the physical line where the record started.
	 */
	std::vector<std::vector<std::string>> readChunk(size_t maxRows);
	size_t lineNumber() const noexcept { return lineNumber_; }

private:
	std::istream& is_;
	char delimiter_;
	ParseLimits limits_;
	size_t lineNumber_ = 1;
};
}
