#ifndef PII_TYPES_HPP
#define PII_TYPES_HPP

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace pii {

/**
 * @brief Failure categories reported by the redaction components
 */
enum class ErrorKind {
  None,                   ///< Operation succeeded
  InvalidArgument,        ///< Bad chunk size/overlap or other bad input
  InvalidSpan,            ///< Span bounds are empty, inverted or out of range
  DetectionFailure,       ///< The detection provider threw
  GeometryMappingFailure, ///< A span could not be mapped to page geometry
  RedactionFailure,       ///< Content-stream synthesis or document save failed
  IOFailure               ///< Reading the source or writing the destination
};

/**
 * @brief Human readable name of an error kind (e.g. "InvalidArgument")
 */
const char *errorKindName(ErrorKind kind);

/**
 * @brief A detected span of sensitive text
 *
 * Offsets are byte offsets into one UTF-8 reference text, half-open
 * [start, end).
 */
struct DetectionSpan {
  int start = 0;          ///< First byte of the span
  int end = 0;            ///< One past the last byte of the span
  std::string entityType; ///< Entity type, e.g. "PERSON", "EMAIL_ADDRESS"
  double score = 0.0;     ///< Confidence score (0..1)
};

/**
 * @brief A detection span expressed in global text coordinates after
 * chunk reconciliation
 */
using MergedSpan = DetectionSpan;

inline bool operator==(const DetectionSpan &a, const DetectionSpan &b) {
  return a.start == b.start && a.end == b.end &&
         a.entityType == b.entityType && a.score == b.score;
}

inline bool operator!=(const DetectionSpan &a, const DetectionSpan &b) {
  return !(a == b);
}

/**
 * @brief Strict ordering by (start, end, entityType)
 */
inline bool spanKeyLess(const DetectionSpan &a, const DetectionSpan &b) {
  return std::tie(a.start, a.end, a.entityType) <
         std::tie(b.start, b.end, b.entityType);
}

/**
 * @brief A person span used as the anchor for relationship placeholders
 */
struct Owner {
  int id = 0;         ///< 1-based id in first-seen order
  int start = 0;      ///< Span start of the person mention
  int end = 0;        ///< Span end of the person mention
  std::string name;   ///< Literal text of the person mention
};

/**
 * @brief Ownership decision for one merged span
 */
struct Assignment {
  MergedSpan span;
  std::optional<int> ownerId; ///< Owner id, never set for PERSON spans
};

/**
 * @brief A redaction rectangle on one PDF page
 *
 * Coordinates are in PDF user space with the origin at the bottom-left of
 * the page.
 */
struct PageBoundingBox {
  double x0 = 0.0;
  double y0 = 0.0;
  double x1 = 0.0;
  double y1 = 0.0;
  std::string entityType;
  std::optional<double> score; ///< Unknown when the source had no score
};

using PageBoxes = std::vector<PageBoundingBox>;

/**
 * @brief RGB colour with components in 0..1
 */
struct RgbColor {
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;
};

inline bool operator==(const RgbColor &a, const RgbColor &b) {
  return a.r == b.r && a.g == b.g && a.b == b.b;
}

/**
 * @brief How detected regions are painted over
 */
enum class RedactionMode {
  Fill,      ///< Solid fill with fillColor
  Blur,      ///< Gaussian blur (images only)
  Pixelate,  ///< Block pixelation (images only)
  Rectangle  ///< Fill plus an outline in outlineColor
};

/**
 * @brief Redaction style configuration
 *
 * The PDF writer only consumes mode and fillColor; blur and pixelate are
 * meaningful for raster images only.
 */
struct RedactionStyle {
  RedactionMode mode = RedactionMode::Fill;
  RgbColor fillColor{0.0, 0.0, 0.0};
  RgbColor outlineColor{1.0, 0.0, 0.0};
  int blurRadius = 8;  ///< Blur radius in pixels
  int pixelSize = 12;  ///< Pixelation block size in pixels
  int strokeWidth = 3; ///< Outline thickness in pixels
  int padding = 2;     ///< Extra pixels added on every side of a box
};

/**
 * @brief Parse "fill", "blur", "pixelate" or "rectangle"
 * @return The mode, or std::nullopt for an unknown name
 */
std::optional<RedactionMode> parseRedactionMode(const std::string &name);

} // namespace pii

#endif // PII_TYPES_HPP
