#ifndef PII_CHUNK_SCANNER_HPP
#define PII_CHUNK_SCANNER_HPP

#include "DetectionProvider.hpp"
#include "PiiTypes.hpp"

#include <string>
#include <vector>

namespace pii {

/**
 * @brief Configuration options for scanning long text
 */
struct ScanConfig {
  int size = 5000;                    ///< Window size in bytes (must be > 0)
  int overlap = 300;                  ///< Bytes shared at each seam (>= 0)
  double minScore = 0.0;              ///< Drop spans scoring below this
  std::string language = "en";        ///< Language passed to the provider
  std::vector<std::string> entities;  ///< Entity filter (empty = all)
  bool verbose = false;               ///< Print DEBUG lines to stderr
};

/**
 * @brief One detection window over the full text
 */
struct ChunkWindow {
  int start = 0; ///< Global offset of the first byte
  int end = 0;   ///< Global offset one past the last byte
};

/**
 * @brief Result of a chunked scan
 */
struct ScanResult {
  bool success = false;                  ///< Whether the scan succeeded
  ErrorKind errorKind = ErrorKind::None; ///< Failure category
  std::string errorMessage;              ///< Error message if failed
  std::vector<MergedSpan> spans;         ///< Merged, ordered spans
  int windowCount = 0;                   ///< Number of provider calls made
  double processingTimeMs = 0;           ///< Processing time in milliseconds
};

/**
 * @brief Drives a DetectionProvider over overlapping windows of long text
 *
 * Window 0 covers [0, size). Window i starts at max(0, i*size - overlap) and
 * ends at min(len, i*size + size); only the left edge is backed up, so
 * consecutive windows share `overlap` bytes at the seam. Window edges that
 * fall inside a UTF-8 sequence are moved back to the sequence start.
 *
 * Spans are merged on the exact key (start, end, entityType), keeping the
 * highest score. A span cut differently by two windows produces two keys and
 * survives twice.
 *
 * Example usage:
 * @code
 * pii::PatternRecognizer recognizer;
 * pii::ChunkScanner scanner;
 * auto result = scanner.scan(text, recognizer);
 * if (result.success) {
 *     for (const auto &span : result.spans) { ... }
 * }
 * @endcode
 */
class ChunkScanner {
public:
  ChunkScanner();
  explicit ChunkScanner(const ScanConfig &config);

  /**
   * @brief Scan text window by window and merge the detections
   * @param text Full UTF-8 text
   * @param provider Detection provider called once per window
   * @return ScanResult with globally-offset, deduplicated spans
   */
  ScanResult scan(const std::string &text,
                  const DetectionProvider &provider) const;

  /**
   * @brief Compute the detection windows for a text
   * @param text Full UTF-8 text (used for length and code-point snapping)
   * @param size Window size (must be > 0)
   * @param overlap Overlap (must be >= 0)
   * @return Windows in scan order; empty when text is empty
   * @throws std::invalid_argument on a bad size or overlap
   */
  static std::vector<ChunkWindow> computeWindows(const std::string &text,
                                                 int size, int overlap);

  /**
   * @brief Merge spans on the exact (start, end, entityType) key
   *
   * The highest-scoring instance of each key survives; the output is sorted
   * by (start, end, entityType). Merging an already merged list returns it
   * unchanged.
   */
  static std::vector<MergedSpan>
  mergeSpans(const std::vector<DetectionSpan> &spans);

  const ScanConfig &getConfig() const;
  void setConfig(const ScanConfig &config);

private:
  ScanConfig m_config;
};

} // namespace pii

#endif // PII_CHUNK_SCANNER_HPP
