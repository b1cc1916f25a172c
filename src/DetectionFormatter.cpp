#include "DetectionFormatter.hpp"

#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace pii {

double DetectionFormatter::roundScore(double score) {
  return std::round(score * 10000.0) / 10000.0;
}

nlohmann::json
DetectionFormatter::spansToJson(const std::vector<DetectionSpan> &spans,
                                const std::string &text) {
  nlohmann::json results = nlohmann::json::array();

  for (const auto &span : spans) {
    nlohmann::json item;
    item["type"] = span.entityType;
    item["start"] = span.start;
    item["end"] = span.end;
    item["score"] = roundScore(span.score);

    const bool inRange = span.start >= 0 && span.end >= span.start &&
                         span.end <= static_cast<int>(text.size());
    item["value"] =
        inRange ? text.substr(span.start, span.end - span.start) : "";
    results.push_back(std::move(item));
  }

  return results;
}

nlohmann::json DetectionFormatter::cellDetectionsToJson(
    const std::vector<CellDetection> &detections) {
  nlohmann::json results = nlohmann::json::array();

  for (const auto &d : detections) {
    nlohmann::json item;
    item["row"] = d.row;
    item["column"] = d.column;
    item["entity_type"] = d.entityType;
    item["start"] = d.start;
    item["end"] = d.end;
    item["score"] = roundScore(d.score);
    item["value"] = d.value;
    item["cell_value"] = d.cellValue;
    results.push_back(std::move(item));
  }

  return results;
}

nlohmann::json DetectionFormatter::summarizeDetections(
    const std::vector<CellDetection> &detections) {
  std::map<std::string, int> counts;
  std::set<std::pair<int, int>> cells;

  for (const auto &d : detections) {
    counts[d.entityType]++;
    cells.insert({d.row, d.column});
  }

  nlohmann::json summary;
  summary["total_detections"] = detections.size();
  summary["affected_cells"] = cells.size();
  summary["by_entity_type"] = counts;
  return summary;
}

nlohmann::json
DetectionFormatter::imageBoxesToJson(const std::vector<ImageBox> &boxes) {
  nlohmann::json results = nlohmann::json::array();

  for (const auto &box : boxes) {
    nlohmann::json item;
    item["left"] = box.left;
    item["top"] = box.top;
    item["width"] = box.width;
    item["height"] = box.height;
    item["entity_type"] = box.entityType;
    if (box.score) {
      item["score"] = roundScore(*box.score);
    } else {
      item["score"] = nullptr;
    }
    results.push_back(std::move(item));
  }

  return results;
}

nlohmann::json
DetectionFormatter::pageBoxesToJson(const std::vector<PageBoxes> &pages) {
  nlohmann::json results = nlohmann::json::array();

  for (size_t pageIndex = 0; pageIndex < pages.size(); pageIndex++) {
    for (const auto &box : pages[pageIndex]) {
      nlohmann::json item;
      item["page"] = pageIndex + 1;
      item["x0"] = box.x0;
      item["y0"] = box.y0;
      item["x1"] = box.x1;
      item["y1"] = box.y1;
      item["entity_type"] = box.entityType;
      if (box.score) {
        item["score"] = roundScore(*box.score);
      } else {
        item["score"] = nullptr;
      }
      results.push_back(std::move(item));
    }
  }

  return results;
}

} // namespace pii
