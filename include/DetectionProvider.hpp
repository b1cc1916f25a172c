#ifndef PII_DETECTION_PROVIDER_HPP
#define PII_DETECTION_PROVIDER_HPP

#include "PiiTypes.hpp"

#include <string>
#include <vector>

namespace pii {

/**
 * @brief Source of candidate PII spans for a piece of text
 *
 * Implementations must be deterministic for identical input so that chunk
 * merging stays stable, and must be safe to call concurrently when shared
 * between batch workers. Failures are reported by throwing; callers convert
 * them to ErrorKind::DetectionFailure.
 */
class DetectionProvider {
public:
  virtual ~DetectionProvider() = default;

  /**
   * @brief Detect spans in a piece of text
   * @param text UTF-8 text to analyze
   * @param language Language code (e.g. "en")
   * @param entityTypes Restrict output to these types (empty = all)
   * @return Spans with offsets local to text
   */
  virtual std::vector<DetectionSpan>
  analyze(const std::string &text, const std::string &language,
          const std::vector<std::string> &entityTypes) const = 0;
};

} // namespace pii

#endif // PII_DETECTION_PROVIDER_HPP
