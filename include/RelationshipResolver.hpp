#ifndef PII_RELATIONSHIP_RESOLVER_HPP
#define PII_RELATIONSHIP_RESOLVER_HPP

#include "PiiTypes.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pii {

/**
 * @brief A text line, including its trailing newline
 */
struct LineSpan {
  int start = 0; ///< Offset of the first byte of the line
  int end = 0;   ///< Offset one past the newline (or end of text)
};

/**
 * @brief Everything an ownership rule may look at
 */
struct OwnershipContext {
  const std::string &text;
  const std::vector<Owner> &owners;
  const std::vector<LineSpan> &lines;
};

/**
 * @brief One named heuristic deciding which owner a span belongs to
 */
struct OwnershipRule {
  std::string name;
  std::function<std::optional<int>(const OwnershipContext &,
                                   const MergedSpan &)>
      match; ///< Returns the owner id, or std::nullopt to fall through
};

/**
 * @brief Result of the ownership assignment pass
 */
struct AssignmentResult {
  bool success = false;                  ///< Whether assignment succeeded
  ErrorKind errorKind = ErrorKind::None; ///< Failure category
  std::string errorMessage;              ///< Error message if failed
  std::vector<Owner> owners;             ///< One owner per PERSON span
  std::vector<Assignment> assignments;   ///< One assignment per input span
};

/**
 * @brief Result of relationship-aware placeholder rendering
 */
struct RenderResult {
  bool success = false;                  ///< Whether rendering succeeded
  ErrorKind errorKind = ErrorKind::None; ///< Failure category
  std::string errorMessage;              ///< Error message if failed
  std::string text;                      ///< Masked text
};

/**
 * @brief Links non-person spans (email, phone, account numbers, ...) to the
 * person they most likely belong to and renders relationship-aware
 * placeholders
 *
 * Every PERSON span becomes an Owner (ids 1-based in list order). Each
 * non-person span is then passed through an ordered rule list; the first rule
 * returning an owner wins:
 *   1. sameLine       - closest owner whose mention lies on the same line
 *   2. emailLocalPart - owner whose name token appears in an email local part
 *   3. nearest        - closest owner anywhere in the text
 *
 * Rendering replaces PERSON spans with PERSON_<id>, owned spans with
 * <TYPE_PERSON_<id>> and unowned spans with <TYPE>. Phone numbers also carry
 * one '*' per digit of the original number.
 */
class RelationshipResolver {
public:
  /**
   * @brief Construct with the default rule list
   */
  RelationshipResolver();

  /**
   * @brief Construct with a custom ordered rule list
   * @param rules Rules tried in order, first match wins
   */
  explicit RelationshipResolver(std::vector<OwnershipRule> rules);

  /**
   * @brief Build owners and assign every non-person span
   * @param text Reference text the spans index into
   * @param spans Merged spans in (start, end, entityType) order
   * @return AssignmentResult; InvalidSpan when a span is empty or out of range
   */
  AssignmentResult assign(const std::string &text,
                          const std::vector<MergedSpan> &spans) const;

  /**
   * @brief Replace every assigned span with its placeholder
   *
   * Replacements are spliced from the highest start down so earlier offsets
   * stay valid. When spans overlap, the span spliced first wins and the
   * overlapping ones are left out.
   */
  RenderResult render(const std::string &text,
                      const std::vector<Owner> &owners,
                      const std::vector<Assignment> &assignments) const;

  /**
   * @brief assign() followed by render()
   */
  RenderResult mask(const std::string &text,
                    const std::vector<MergedSpan> &spans) const;

  /**
   * @brief Placeholder text for one assignment
   */
  static std::string placeholderFor(const std::string &text,
                                    const std::vector<Owner> &owners,
                                    const Assignment &assignment);

  /**
   * @brief The default rules: sameLine, emailLocalPart, nearest
   */
  static std::vector<OwnershipRule> defaultRules();

  static std::optional<int> matchSameLine(const OwnershipContext &context,
                                          const MergedSpan &span);
  static std::optional<int>
  matchEmailLocalPart(const OwnershipContext &context, const MergedSpan &span);
  static std::optional<int> matchNearest(const OwnershipContext &context,
                                         const MergedSpan &span);

  /**
   * @brief Split text into '\n'-terminated lines with their offsets
   */
  static std::vector<LineSpan> splitLines(const std::string &text);

  /**
   * @brief Lower-cased alphanumeric tokens of a person name
   */
  static std::vector<std::string> nameTokens(const std::string &name);

  const std::vector<OwnershipRule> &getRules() const;

private:
  static bool validateSpans(const std::string &text,
                            const std::vector<MergedSpan> &spans,
                            std::string &errorMessage);

  std::vector<OwnershipRule> m_rules;
};

} // namespace pii

#endif // PII_RELATIONSHIP_RESOLVER_HPP
