#ifndef PII_ENTITY_PALETTE_HPP
#define PII_ENTITY_PALETTE_HPP

#include "PiiTypes.hpp"

#include <map>
#include <string>
#include <vector>

namespace pii {

using SeverityMap = std::map<std::string, std::string>;
using ColorMap = std::map<std::string, RgbColor>;

/**
 * @brief Result of loading palette overrides from a JSON file
 */
struct PaletteLoadResult {
  bool success = false;                  ///< Whether loading succeeded
  ErrorKind errorKind = ErrorKind::None; ///< Failure category
  std::string errorMessage;              ///< Error message if failed
  SeverityMap severityOverrides;         ///< "severity" object of the file
  ColorMap colorOverrides;               ///< "colors" object of the file
};

/**
 * @brief Maps entity types to severity tiers and severity tiers to colours
 *
 * Lookup: entityType -> severity ("low" when unmapped) -> RGB (the
 * "_default" colour, black unless overridden, when the severity is
 * unmapped). Overrides passed to the constructor are merged over the
 * built-in tables, so a partial override keeps every other default.
 * Colour depends on the entity type only, never on the score.
 */
class EntityPalette {
public:
  /// Key of the colour used when a severity has no colour entry
  static const char *const DEFAULT_COLOR_KEY;
  /// Severity used when an entity type has no severity entry
  static const char *const DEFAULT_SEVERITY;

  EntityPalette();
  EntityPalette(const SeverityMap &severityOverrides,
                const ColorMap &colorOverrides);

  /**
   * @brief Severity tier of an entity type
   */
  std::string severityFor(const std::string &entityType) const;

  /**
   * @brief Fill colour of an entity type
   */
  RgbColor colorFor(const std::string &entityType) const;

  const SeverityMap &getSeverityMap() const;
  const ColorMap &getColorMap() const;

  /**
   * @brief Built-in entity type -> severity table
   */
  static const SeverityMap &defaultSeverityMap();

  /**
   * @brief Built-in severity -> colour table
   */
  static const ColorMap &defaultColorMap();

  /**
   * @brief Entity types of a named group ("financial", "government_id",
   * "personal", "geographic", "all_au_specific", "all_au")
   * @return The group, or an empty vector for an unknown name
   */
  static std::vector<std::string> entitiesInGroup(const std::string &group);

  /**
   * @brief Perceived luminance 0.2126 R + 0.7152 G + 0.0722 B
   */
  static double luminance(const RgbColor &color);

  /**
   * @brief White on dark fills (luminance < 0.5), black otherwise
   */
  static RgbColor labelColorFor(const RgbColor &fill);

  /**
   * @brief Load overrides from a JSON file
   *
   * Expected shape:
   * @code
   * {"severity": {"AU_TFN": "high"}, "colors": {"high": [0.9, 0.1, 0.1]}}
   * @endcode
   */
  static PaletteLoadResult loadOverrides(const std::string &jsonPath);

private:
  SeverityMap m_severity;
  ColorMap m_colors;
};

} // namespace pii

#endif // PII_ENTITY_PALETTE_HPP
