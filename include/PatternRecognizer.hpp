#ifndef PII_PATTERN_RECOGNIZER_HPP
#define PII_PATTERN_RECOGNIZER_HPP

#include "DetectionProvider.hpp"

#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace pii {

/**
 * @brief One regular expression of a recognizer
 */
struct PatternRule {
  std::string name;  ///< Pattern name, e.g. "tfn_dashed"
  std::regex regex;  ///< ECMAScript expression
  double score;      ///< Base score of a match
  int group = 0;     ///< Capture group reported as the span
};

/**
 * @brief Detects one entity type with a set of patterns
 *
 * A validator, when present, decides every match: valid matches score 1.0
 * and invalid ones are dropped. Otherwise a context word among the few words
 * before a match raises its score.
 */
struct Recognizer {
  std::string entityType;
  std::vector<PatternRule> patterns;
  std::vector<std::string> context; ///< Lower-case context words or phrases
  std::function<bool(const std::string &)> validator;
};

/**
 * @brief Configuration options for the pattern recognizer
 */
struct RecognizerOptions {
  bool includeAustralian = true; ///< Register the AU_* recognizers
  int contextWindowWords = 5;    ///< Words before a match searched for context
};

/**
 * @brief Deterministic regex-based detection provider
 *
 * Covers e-mail addresses, phone numbers, Luhn-checked credit card numbers,
 * IP addresses, URLs, titled / greeted / labelled person names and the
 * Australian identifiers (TFN, Medicare, Centrelink CRN, ABN, ACN, BSB,
 * driver licences, phone numbers, passports, bank accounts, states and
 * postcodes).
 *
 * Only English ("en") is supported; any other language yields no spans.
 * Identical (start, end, type) matches from several patterns are reported
 * once with the highest score. analyze() is const and may be called from
 * several threads at once.
 *
 * Example usage:
 * @code
 * pii::PatternRecognizer recognizer;
 * auto spans = recognizer.analyze("Call 0412 345 678", "en", {});
 * @endcode
 */
class PatternRecognizer : public DetectionProvider {
public:
  /// Score added when a context word precedes a match
  static const double CONTEXT_BOOST;
  /// Floor of a boosted score
  static const double MIN_BOOSTED_SCORE;

  PatternRecognizer();
  explicit PatternRecognizer(const RecognizerOptions &options);

  std::vector<DetectionSpan>
  analyze(const std::string &text, const std::string &language,
          const std::vector<std::string> &entityTypes) const override;

  /**
   * @brief Register an additional recognizer
   */
  void addRecognizer(Recognizer recognizer);

  /**
   * @brief Entity types this instance can report, sorted and unique
   */
  std::vector<std::string> supportedEntities() const;

  /**
   * @brief Generic recognizers (e-mail, phone, card, IP, URL, person)
   */
  static std::vector<Recognizer> defaultRecognizers();

  /**
   * @brief Australian identifier recognizers
   */
  static std::vector<Recognizer> australianRecognizers();

  /**
   * @brief Recognizer matching whole words from a fixed list (score 1.0)
   */
  static Recognizer denyListRecognizer(const std::string &entityType,
                                       const std::vector<std::string> &words);

  /**
   * @brief Luhn checksum over the digits of `text` (13 to 19 digits)
   */
  static bool luhnValid(const std::string &text);

  /**
   * @brief ABN checksum over the digits of `text` (exactly 11 digits)
   */
  static bool abnValid(const std::string &text);

  /**
   * @brief Whether one of `context` occurs among the `windowWords` words
   * before byte offset `start`
   */
  static bool hasContext(const std::string &text, int start,
                         const std::vector<std::string> &context,
                         int windowWords);

private:
  RecognizerOptions m_options;
  std::vector<Recognizer> m_recognizers;
};

} // namespace pii

#endif // PII_PATTERN_RECOGNIZER_HPP
