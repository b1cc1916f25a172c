#ifndef PII_DETECTION_FORMATTER_HPP
#define PII_DETECTION_FORMATTER_HPP

#include "CsvRedactor.hpp"
#include "ImageRedactor.hpp"
#include "PiiTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pii {

/**
 * @brief Converts detection results to JSON documents
 *
 * Scores are rounded to 4 decimals.
 */
class DetectionFormatter {
public:
  /**
   * @brief [{type, start, end, score, value}] with value sliced from text
   */
  static nlohmann::json spansToJson(const std::vector<DetectionSpan> &spans,
                                    const std::string &text);

  /**
   * @brief [{row, column, entity_type, start, end, score, value,
   * cell_value}]
   */
  static nlohmann::json
  cellDetectionsToJson(const std::vector<CellDetection> &detections);

  /**
   * @brief {total_detections, affected_cells, by_entity_type}
   */
  static nlohmann::json
  summarizeDetections(const std::vector<CellDetection> &detections);

  /**
   * @brief [{left, top, width, height, entity_type, score}]
   */
  static nlohmann::json imageBoxesToJson(const std::vector<ImageBox> &boxes);

  /**
   * @brief [{page, x0, y0, x1, y1, entity_type, score}], pages 1-based
   */
  static nlohmann::json pageBoxesToJson(const std::vector<PageBoxes> &pages);

  static double roundScore(double score);
};

} // namespace pii

#endif // PII_DETECTION_FORMATTER_HPP
