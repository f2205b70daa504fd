#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// RFC 4180-style tokenization for report files. Values stay text; typing happens in the loader.
struct ParseLimits {
	size_t maxFieldBytes = 1024 * 1024;      // 1 MiB
	size_t maxColumns = 4096;
	size_t maxPhysicalLinesPerRecord = 1000;
};

enum class RowStatus { OK, END, UNTERMINATED_QUOTE, LIMIT_EXCEEDED };

struct Row {
	std::vector<std::string> fields;
	RowStatus status = RowStatus::END;
	size_t firstLine = 0;   // 1-based physical line the record starts on
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Guesses the delimiter from a header line: the most frequent of , ; \t | outside quotes.
 */
char sniffDelimiter(const std::string& headerLine);

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

// Quotes a field when it holds the delimiter, a quote, or a line break.
std::string quoteField(const std::string& value, char delimiter = ',');
void writeRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter = ',');

class Reader {
public:
	Reader(std::istream& is, char delimiter, ParseLimits limits = ParseLimits{});

	/**
	 * @brief Reads the next logical record; blank lines are skipped.
	 * @post status is END only when the stream is exhausted.
	 */
	Row next();

private:
	std::istream& is_;
	char delimiter_;
	ParseLimits limits_;
	size_t line_ = 0;
};
} // namespace CSVUtils
