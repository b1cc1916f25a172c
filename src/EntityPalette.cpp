#include "EntityPalette.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace pii {

const char *const EntityPalette::DEFAULT_COLOR_KEY = "_default";
const char *const EntityPalette::DEFAULT_SEVERITY = "low";

EntityPalette::EntityPalette()
    : m_severity(defaultSeverityMap()), m_colors(defaultColorMap()) {}

EntityPalette::EntityPalette(const SeverityMap &severityOverrides,
                             const ColorMap &colorOverrides)
    : EntityPalette() {
  for (const auto &entry : severityOverrides) {
    m_severity[entry.first] = entry.second;
  }
  for (const auto &entry : colorOverrides) {
    m_colors[entry.first] = entry.second;
  }
}

const SeverityMap &EntityPalette::defaultSeverityMap() {
  static const SeverityMap severity = {
      // Government identifiers
      {"AU_TFN", "critical"},
      {"AU_MEDICARE", "critical"},
      {"AU_PASSPORT", "critical"},
      {"AU_CENTRELINK_CRN", "critical"},

      // Financial
      {"AU_DRIVER_LICENSE", "high"},
      {"AU_ABN", "high"},
      {"AU_ACN", "high"},
      {"AU_BANK_ACCOUNT", "high"},
      {"AU_BSB", "high"},
      {"CREDIT_CARD", "high"},
      {"IBAN_CODE", "high"},
      {"AU_ACCOUNT_NUMBER", "high"},

      // Identity and contact details
      {"PERSON", "medium"},
      {"PERSON_WITH_TITLE", "medium"},
      {"PERSON_AFTER_GREETING", "medium"},
      {"REPEATED_NAME", "medium"},
      {"EMAIL_ADDRESS", "medium"},
      {"AU_PHONE_NUMBER", "medium"},
      {"PHONE_NUMBER", "medium"},
      {"DATE_TIME", "medium"},
      {"AU_ADDRESS", "medium"},
      {"ORGANIZATION", "medium"},
      {"IP_ADDRESS", "medium"},
      {"URL", "medium"},

      // Geographic
      {"AU_STATE", "low"},
      {"AU_POSTCODE", "low"},
      {"NAME_TITLE", "low"},
      {"LOCATION", "low"},
      {"CITY", "low"},
  };
  return severity;
}

const ColorMap &EntityPalette::defaultColorMap() {
  static const ColorMap colors = {
      {"critical", {0.90, 0.00, 0.00}}, // bright red
      {"high", {0.85, 0.10, 0.10}},     // dark red
      {"medium", {1.00, 0.55, 0.00}},   // orange
      {"low", {0.10, 0.40, 0.85}},      // blue
      {"_default", {0.00, 0.00, 0.00}}, // black
  };
  return colors;
}

std::vector<std::string>
EntityPalette::entitiesInGroup(const std::string &group) {
  static const std::vector<std::string> allAu = {
      "AU_TFN",          "AU_MEDICARE",       "AU_PASSPORT",
      "AU_CENTRELINK_CRN", "AU_DRIVER_LICENSE", "AU_ABN",
      "AU_ACN",          "AU_BANK_ACCOUNT",   "AU_BSB",
      "AU_PHONE_NUMBER", "AU_STATE",          "AU_POSTCODE",
      "PERSON",          "EMAIL_ADDRESS",     "PHONE_NUMBER",
      "CREDIT_CARD",     "DATE_TIME",         "LOCATION",
      "ORGANIZATION"};

  static const std::map<std::string, std::vector<std::string>> groups = {
      {"financial",
       {"AU_ABN", "AU_ACN", "AU_BANK_ACCOUNT", "AU_BSB", "CREDIT_CARD",
        "IBAN_CODE"}},
      {"government_id",
       {"AU_TFN", "AU_MEDICARE", "AU_PASSPORT", "AU_DRIVER_LICENSE",
        "AU_CENTRELINK_CRN"}},
      {"personal",
       {"PERSON", "PERSON_WITH_TITLE", "PERSON_AFTER_GREETING",
        "REPEATED_NAME", "EMAIL_ADDRESS", "AU_PHONE_NUMBER", "PHONE_NUMBER",
        "DATE_TIME"}},
      {"geographic",
       {"AU_STATE", "AU_POSTCODE", "LOCATION", "CITY", "AU_ADDRESS"}},
      {"all_au_specific",
       {"AU_TFN", "AU_MEDICARE", "AU_PASSPORT", "AU_CENTRELINK_CRN",
        "AU_DRIVER_LICENSE", "AU_ABN", "AU_ACN", "AU_BANK_ACCOUNT", "AU_BSB",
        "AU_PHONE_NUMBER", "AU_STATE", "AU_POSTCODE"}},
      {"all_au", allAu},
  };

  auto it = groups.find(group);
  if (it == groups.end()) {
    return {};
  }
  return it->second;
}

std::string EntityPalette::severityFor(const std::string &entityType) const {
  auto it = m_severity.find(entityType);
  if (it == m_severity.end()) {
    return DEFAULT_SEVERITY;
  }
  return it->second;
}

RgbColor EntityPalette::colorFor(const std::string &entityType) const {
  auto it = m_colors.find(severityFor(entityType));
  if (it != m_colors.end()) {
    return it->second;
  }

  auto fallback = m_colors.find(DEFAULT_COLOR_KEY);
  if (fallback != m_colors.end()) {
    return fallback->second;
  }
  return RgbColor{0.0, 0.0, 0.0};
}

const SeverityMap &EntityPalette::getSeverityMap() const { return m_severity; }

const ColorMap &EntityPalette::getColorMap() const { return m_colors; }

double EntityPalette::luminance(const RgbColor &color) {
  return 0.2126 * color.r + 0.7152 * color.g + 0.0722 * color.b;
}

RgbColor EntityPalette::labelColorFor(const RgbColor &fill) {
  if (luminance(fill) < 0.5) {
    return RgbColor{1.0, 1.0, 1.0};
  }
  return RgbColor{0.0, 0.0, 0.0};
}

PaletteLoadResult EntityPalette::loadOverrides(const std::string &jsonPath) {
  PaletteLoadResult result;
  result.success = false;

  std::ifstream in(jsonPath);
  if (!in) {
    result.errorKind = ErrorKind::IOFailure;
    result.errorMessage = "Failed to open palette file: " + jsonPath;
    return result;
  }

  try {
    nlohmann::json doc = nlohmann::json::parse(in);

    if (doc.contains("severity")) {
      for (const auto &item : doc.at("severity").items()) {
        result.severityOverrides[item.key()] = item.value().get<std::string>();
      }
    }

    if (doc.contains("colors")) {
      for (const auto &item : doc.at("colors").items()) {
        const auto &rgb = item.value();
        if (!rgb.is_array() || rgb.size() != 3) {
          result.errorKind = ErrorKind::InvalidArgument;
          result.errorMessage = "Colour for '" + item.key() +
                                "' must be an array of three numbers";
          return result;
        }
        result.colorOverrides[item.key()] =
            RgbColor{rgb[0].get<double>(), rgb[1].get<double>(),
                     rgb[2].get<double>()};
      }
    }
  } catch (const nlohmann::json::exception &e) {
    result.errorKind = ErrorKind::InvalidArgument;
    result.errorMessage =
        "Malformed palette file " + jsonPath + ": " + e.what();
    return result;
  }

  result.success = true;
  return result;
}

} // namespace pii
