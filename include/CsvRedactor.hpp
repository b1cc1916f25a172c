#ifndef PII_CSV_REDACTOR_HPP
#define PII_CSV_REDACTOR_HPP

#include "DetectionProvider.hpp"
#include "PiiTypes.hpp"

#include <string>
#include <vector>

namespace pii {

using CsvRow = std::vector<std::string>;
using CsvTable = std::vector<CsvRow>;

/**
 * @brief Configuration options for CSV analysis and redaction
 */
struct CsvOptions {
  char delimiter = ',';              ///< Field delimiter
  bool skipHeader = true;            ///< Leave the first row untouched
  std::string language = "en";       ///< Language passed to the provider
  double minScore = 0.0;             ///< Drop spans scoring below this
  std::vector<std::string> entities; ///< Entity filter (empty = all)
  char redactionChar = '*';          ///< Mask character
  bool useEntityLabels = false;      ///< Replace with "<TYPE>" instead of masking
  bool verbose = false;              ///< Print DEBUG lines to stderr
};

/**
 * @brief One detection inside one CSV cell
 */
struct CellDetection {
  int row = 0;            ///< 0-based row, header included
  int column = 0;         ///< 0-based column
  std::string entityType;
  int start = 0;          ///< Byte offset within the cell
  int end = 0;
  double score = 0.0;
  std::string value;      ///< Detected text
  std::string cellValue;  ///< Full cell text
};

/**
 * @brief Result of analyzing a CSV table
 */
struct CsvAnalysisResult {
  bool success = false;
  ErrorKind errorKind = ErrorKind::None;
  std::string errorMessage;
  CsvTable rows;
  std::vector<CellDetection> detections;
};

/**
 * @brief Result of redacting a CSV file
 */
struct CsvRedactionResult {
  bool success = false;
  ErrorKind errorKind = ErrorKind::None;
  std::string errorMessage;
  std::string outputPath;
  std::vector<CellDetection> detections;
  int redactedCellCount = 0;
  double processingTimeMs = 0;
};

/**
 * @brief Detects and redacts sensitive values cell by cell in CSV files
 *
 * Files are read and written as RFC 4180 CSV (quoted fields, doubled quotes,
 * embedded line breaks, CRLF row terminators on output).
 */
class CsvRedactor {
public:
  CsvRedactor();
  explicit CsvRedactor(const CsvOptions &options);

  CsvAnalysisResult analyzeFile(const std::string &path,
                                const DetectionProvider &provider) const;

  /**
   * @brief Run the provider over every non-blank cell
   */
  CsvAnalysisResult analyzeTable(const CsvTable &rows,
                                 const DetectionProvider &provider) const;

  /**
   * @brief Redact every cell with detections and write the table
   */
  CsvRedactionResult redactFile(const std::string &inputPath,
                                const std::string &outputPath,
                                const DetectionProvider &provider) const;

  /**
   * @brief Parse CSV text
   * @throws std::runtime_error on an unterminated quoted field
   */
  static CsvTable parse(const std::string &content, char delimiter);

  /**
   * @brief Format a table, quoting fields only where needed
   */
  static std::string format(const CsvTable &rows, char delimiter);

  /**
   * @brief Redact the given spans of one cell
   *
   * Overlapping spans are resolved in favour of the higher score. Masking
   * replaces each character (code point) with `redactionChar`.
   */
  static std::string redactCell(const std::string &value,
                                const std::vector<DetectionSpan> &spans,
                                char redactionChar, bool useEntityLabels);

  const CsvOptions &getOptions() const;
  void setOptions(const CsvOptions &options);

private:
  CsvOptions m_options;
};

} // namespace pii

#endif // PII_CSV_REDACTOR_HPP
