#include "PiiTypes.hpp"

#include <algorithm>
#include <cctype>

namespace pii {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::InvalidArgument:
    return "InvalidArgument";
  case ErrorKind::InvalidSpan:
    return "InvalidSpan";
  case ErrorKind::DetectionFailure:
    return "DetectionFailure";
  case ErrorKind::GeometryMappingFailure:
    return "GeometryMappingFailure";
  case ErrorKind::RedactionFailure:
    return "RedactionFailure";
  case ErrorKind::IOFailure:
    return "IOFailure";
  }
  return "Unknown";
}

std::optional<RedactionMode> parseRedactionMode(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

  if (lower == "fill") {
    return RedactionMode::Fill;
  } else if (lower == "blur") {
    return RedactionMode::Blur;
  } else if (lower == "pixelate") {
    return RedactionMode::Pixelate;
  } else if (lower == "rectangle") {
    return RedactionMode::Rectangle;
  }
  return std::nullopt;
}

} // namespace pii
