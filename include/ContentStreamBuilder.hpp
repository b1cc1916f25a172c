#ifndef PII_CONTENT_STREAM_BUILDER_HPP
#define PII_CONTENT_STREAM_BUILDER_HPP

#include "EntityPalette.hpp"
#include "PiiTypes.hpp"

#include <optional>
#include <string>

namespace pii {

/**
 * @brief Options for the label overlay drawn on each redaction box
 */
struct LabelOptions {
  bool drawLabels = true;                  ///< Draw type and confidence text
  std::string labelPrefix;                 ///< Prepended to the entity type
  std::string fontResource = "PIIHelv";    ///< Page font resource name
  double fontSize = 8.0;                   ///< Label font size in points
};

/**
 * @brief Synthesizes raw PDF page content-stream operators for redaction
 * overlays
 *
 * Each box becomes a filled, unstroked rectangle in its severity colour
 * wrapped in q/Q. With labels enabled, the entity label is drawn near the
 * inside top-left corner (white on dark fills, black on light fills) with
 * the confidence line below it, always in black.
 */
class ContentStreamBuilder {
public:
  explicit ContentStreamBuilder(const EntityPalette &palette);

  /**
   * @brief Operators painting every box of one page
   * @param boxes Boxes in PDF user space
   * @param labels Label overlay options
   * @return Content-stream bytes, empty when there are no boxes
   */
  std::string buildPageOverlay(const PageBoxes &boxes,
                               const LabelOptions &labels) const;

  /**
   * @brief "q r g b rg x y w h re f Q" for one box
   */
  static std::string rectangleOps(const PageBoundingBox &box,
                                  const RgbColor &fill);

  /**
   * @brief "BT /F size Tf r g b rg 1 0 0 1 x y Tm (text) Tj ET"
   */
  static std::string textOps(double x, double y, const std::string &text,
                             const std::string &fontResource, double fontSize,
                             const RgbColor &color);

  /**
   * @brief "conf: 0.87", or "conf: n/a" when the score is unknown
   */
  static std::string confidenceText(const std::optional<double> &score);

  /**
   * @brief Escape a string for a PDF literal string
   *
   * Backslash and parentheses are escaped; bytes outside printable ASCII
   * are written as octal escapes.
   */
  static std::string escapeText(const std::string &text);

  /**
   * @brief Compact decimal form of a coordinate (up to 3 decimals)
   */
  static std::string formatNumber(double value);

private:
  const EntityPalette &m_palette;
};

} // namespace pii

#endif // PII_CONTENT_STREAM_BUILDER_HPP
