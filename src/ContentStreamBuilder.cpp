#include "ContentStreamBuilder.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace pii {

namespace {

// Label baseline offsets from the top-left inside corner of a box
const double LABEL_INSET_X = 2.0;
const double LABEL_OFFSET_Y = 10.0;
const double CONFIDENCE_OFFSET_Y = 20.0;

std::string formatColor(const RgbColor &color) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << color.r << " " << color.g
      << " " << color.b;
  return out.str();
}

} // anonymous namespace

ContentStreamBuilder::ContentStreamBuilder(const EntityPalette &palette)
    : m_palette(palette) {}

std::string ContentStreamBuilder::formatNumber(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  std::string text = out.str();

  // Trim "12.500" to "12.5" and "12.000" to "12"
  if (text.find('.') != std::string::npos) {
    while (!text.empty() && text.back() == '0') {
      text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
      text.pop_back();
    }
  }
  if (text == "-0") {
    text = "0";
  }
  return text;
}

std::string ContentStreamBuilder::escapeText(const std::string &text) {
  std::string escaped;
  escaped.reserve(text.size());

  for (char c : text) {
    unsigned char byte = static_cast<unsigned char>(c);
    if (c == '\\' || c == '(' || c == ')') {
      escaped += '\\';
      escaped += c;
    } else if (byte < 0x20 || byte > 0x7E) {
      char octal[5];
      std::snprintf(octal, sizeof(octal), "\\%03o", byte);
      escaped += octal;
    } else {
      escaped += c;
    }
  }
  return escaped;
}

std::string
ContentStreamBuilder::confidenceText(const std::optional<double> &score) {
  if (!score) {
    return "conf: n/a";
  }
  std::ostringstream out;
  out << "conf: " << std::fixed << std::setprecision(2) << *score;
  return out.str();
}

std::string ContentStreamBuilder::rectangleOps(const PageBoundingBox &box,
                                               const RgbColor &fill) {
  const double width = std::max(0.0, box.x1 - box.x0);
  const double height = std::max(0.0, box.y1 - box.y0);

  std::ostringstream ops;
  ops << "q " << formatColor(fill) << " rg " << formatNumber(box.x0) << " "
      << formatNumber(box.y0) << " " << formatNumber(width) << " "
      << formatNumber(height) << " re f Q\n";
  return ops.str();
}

std::string ContentStreamBuilder::textOps(double x, double y,
                                          const std::string &text,
                                          const std::string &fontResource,
                                          double fontSize,
                                          const RgbColor &color) {
  std::ostringstream ops;
  ops << "BT /" << fontResource << " " << formatNumber(fontSize) << " Tf "
      << formatColor(color) << " rg 1 0 0 1 " << formatNumber(x) << " "
      << formatNumber(y) << " Tm (" << escapeText(text) << ") Tj ET\n";
  return ops.str();
}

std::string
ContentStreamBuilder::buildPageOverlay(const PageBoxes &boxes,
                                       const LabelOptions &labels) const {
  std::string ops;

  for (const auto &box : boxes) {
    const RgbColor fill = m_palette.colorFor(box.entityType);
    ops += rectangleOps(box, fill);

    if (!labels.drawLabels) {
      continue;
    }

    const double textX = box.x0 + LABEL_INSET_X;
    ops += textOps(textX, box.y1 - LABEL_OFFSET_Y,
                   labels.labelPrefix + box.entityType, labels.fontResource,
                   labels.fontSize, EntityPalette::labelColorFor(fill));
    ops += textOps(textX, box.y1 - CONFIDENCE_OFFSET_Y,
                   confidenceText(box.score), labels.fontResource,
                   labels.fontSize, RgbColor{0.0, 0.0, 0.0});
  }

  return ops;
}

} // namespace pii
