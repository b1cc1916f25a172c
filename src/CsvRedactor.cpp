#include "CsvRedactor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace pii {

namespace {

bool isBlank(const std::string &value) {
  return std::all_of(value.begin(), value.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}

int codePointCount(const std::string &text) {
  int count = 0;
  for (char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      count++;
    }
  }
  return count;
}

} // anonymous namespace

CsvRedactor::CsvRedactor() : m_options() {}

CsvRedactor::CsvRedactor(const CsvOptions &options) : m_options(options) {}

CsvTable CsvRedactor::parse(const std::string &content, char delimiter) {
  CsvTable rows;
  CsvRow row;
  std::string field;
  bool inQuotes = false;
  bool rowHasData = false;

  auto endField = [&]() {
    row.push_back(std::move(field));
    field.clear();
  };
  auto endRow = [&]() {
    if (rowHasData) {
      endField();
    }
    rows.push_back(std::move(row));
    row.clear();
    rowHasData = false;
  };

  for (size_t i = 0; i < content.size(); i++) {
    const char c = content[i];

    if (inQuotes) {
      if (c == '"') {
        if (i + 1 < content.size() && content[i + 1] == '"') {
          field += '"';
          i++;
        } else {
          inQuotes = false;
        }
      } else {
        field += c;
      }
      continue;
    }

    if (c == '"') {
      inQuotes = true;
      rowHasData = true;
    } else if (c == delimiter) {
      endField();
      rowHasData = true;
    } else if (c == '\r' || c == '\n') {
      if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
        i++;
      }
      endRow();
    } else {
      field += c;
      rowHasData = true;
    }
  }

  if (inQuotes) {
    throw std::runtime_error("Unterminated quoted field in row " +
                             std::to_string(rows.size() + 1));
  }
  if (rowHasData) {
    endRow();
  }

  return rows;
}

std::string CsvRedactor::format(const CsvTable &rows, char delimiter) {
  std::string out;

  for (const auto &row : rows) {
    for (size_t col = 0; col < row.size(); col++) {
      if (col > 0) {
        out += delimiter;
      }

      const std::string &value = row[col];
      const bool needsQuotes =
          value.find_first_of(std::string("\"\r\n") + delimiter) !=
          std::string::npos;
      if (!needsQuotes) {
        out += value;
        continue;
      }

      out += '"';
      for (char c : value) {
        if (c == '"') {
          out += '"';
        }
        out += c;
      }
      out += '"';
    }
    out += "\r\n";
  }

  return out;
}

std::string CsvRedactor::redactCell(const std::string &value,
                                    const std::vector<DetectionSpan> &spans,
                                    char redactionChar, bool useEntityLabels) {
  // Highest score first, then earliest; a span overlapping an accepted one
  // is dropped
  std::vector<DetectionSpan> ordered = spans;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const DetectionSpan &a, const DetectionSpan &b) {
                     if (a.score != b.score) {
                       return a.score > b.score;
                     }
                     return a.start < b.start;
                   });

  const int len = static_cast<int>(value.size());
  std::vector<DetectionSpan> accepted;
  for (const auto &span : ordered) {
    if (span.start < 0 || span.end > len || span.end <= span.start) {
      continue;
    }
    const bool overlaps =
        std::any_of(accepted.begin(), accepted.end(),
                    [&span](const DetectionSpan &other) {
                      return span.start < other.end && other.start < span.end;
                    });
    if (!overlaps) {
      accepted.push_back(span);
    }
  }

  std::sort(accepted.begin(), accepted.end(),
            [](const DetectionSpan &a, const DetectionSpan &b) {
              return a.start > b.start;
            });

  std::string redacted = value;
  for (const auto &span : accepted) {
    std::string replacement;
    if (useEntityLabels) {
      replacement = "<" + span.entityType + ">";
    } else {
      const std::string original =
          value.substr(span.start, span.end - span.start);
      replacement.assign(codePointCount(original), redactionChar);
    }
    redacted.replace(span.start, span.end - span.start, replacement);
  }

  return redacted;
}

CsvAnalysisResult
CsvRedactor::analyzeTable(const CsvTable &rows,
                          const DetectionProvider &provider) const {
  CsvAnalysisResult result;
  result.success = false;
  result.rows = rows;

  const size_t startRow = (m_options.skipHeader && !rows.empty()) ? 1 : 0;

  for (size_t rowIdx = startRow; rowIdx < rows.size(); rowIdx++) {
    const CsvRow &row = rows[rowIdx];
    for (size_t colIdx = 0; colIdx < row.size(); colIdx++) {
      const std::string &cell = row[colIdx];
      if (cell.empty() || isBlank(cell)) {
        continue;
      }

      std::vector<DetectionSpan> spans;
      try {
        spans = provider.analyze(cell, m_options.language, m_options.entities);
      } catch (const std::exception &e) {
        result.errorKind = ErrorKind::DetectionFailure;
        result.errorMessage = "Detection failed at row " +
                              std::to_string(rowIdx) + ", column " +
                              std::to_string(colIdx) + ": " + e.what();
        return result;
      }

      for (const auto &span : spans) {
        if (span.score < m_options.minScore || span.start < 0 ||
            span.end <= span.start ||
            span.end > static_cast<int>(cell.size())) {
          continue;
        }
        CellDetection detection;
        detection.row = static_cast<int>(rowIdx);
        detection.column = static_cast<int>(colIdx);
        detection.entityType = span.entityType;
        detection.start = span.start;
        detection.end = span.end;
        detection.score = span.score;
        detection.value = cell.substr(span.start, span.end - span.start);
        detection.cellValue = cell;
        result.detections.push_back(std::move(detection));
      }
    }
  }

  if (m_options.verbose) {
    std::cerr << "DEBUG: " << result.detections.size() << " detections in "
              << rows.size() << " rows" << std::endl;
  }

  result.success = true;
  return result;
}

CsvAnalysisResult
CsvRedactor::analyzeFile(const std::string &path,
                         const DetectionProvider &provider) const {
  CsvAnalysisResult result;
  result.success = false;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    result.errorKind = ErrorKind::IOFailure;
    result.errorMessage = "Failed to open CSV file: " + path;
    return result;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  CsvTable rows;
  try {
    rows = parse(buffer.str(), m_options.delimiter);
  } catch (const std::exception &e) {
    result.errorKind = ErrorKind::InvalidArgument;
    result.errorMessage = "Malformed CSV file " + path + ": " + e.what();
    return result;
  }

  return analyzeTable(rows, provider);
}

CsvRedactionResult
CsvRedactor::redactFile(const std::string &inputPath,
                        const std::string &outputPath,
                        const DetectionProvider &provider) const {
  CsvRedactionResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  CsvAnalysisResult analysis = analyzeFile(inputPath, provider);
  if (!analysis.success) {
    result.errorKind = analysis.errorKind;
    result.errorMessage = analysis.errorMessage;
    return result;
  }

  std::map<std::pair<int, int>, std::vector<DetectionSpan>> cellSpans;
  for (const auto &detection : analysis.detections) {
    DetectionSpan span;
    span.start = detection.start;
    span.end = detection.end;
    span.entityType = detection.entityType;
    span.score = detection.score;
    cellSpans[{detection.row, detection.column}].push_back(std::move(span));
  }

  CsvTable redacted = analysis.rows;
  for (const auto &cell : cellSpans) {
    std::string &value = redacted[cell.first.first][cell.first.second];
    value = redactCell(value, cell.second, m_options.redactionChar,
                       m_options.useEntityLabels);
    result.redactedCellCount++;
  }

  std::ofstream out(outputPath, std::ios::binary);
  if (!out) {
    result.errorKind = ErrorKind::IOFailure;
    result.errorMessage = "Failed to open output file: " + outputPath;
    return result;
  }
  out << format(redacted, m_options.delimiter);
  out.close();
  if (!out) {
    result.errorKind = ErrorKind::IOFailure;
    result.errorMessage = "Failed to write output file: " + outputPath;
    return result;
  }

  result.success = true;
  result.outputPath = outputPath;
  result.detections = std::move(analysis.detections);

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

const CsvOptions &CsvRedactor::getOptions() const { return m_options; }

void CsvRedactor::setOptions(const CsvOptions &options) { m_options = options; }

} // namespace pii
