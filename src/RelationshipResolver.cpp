#include "RelationshipResolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace pii {

namespace {

const char *const PERSON_TYPE = "PERSON";
const char *const EMAIL_TYPE = "EMAIL_ADDRESS";
const char *const PHONE_TYPE = "PHONE_NUMBER";

// Minimum length of a name token used for email local-part matching
const size_t MIN_NAME_TOKEN_LENGTH = 3;

bool isAsciiAlnum(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 &&
         static_cast<unsigned char>(c) < 0x80;
}

std::string normalizeLocalPart(const std::string &localPart) {
  std::string normalized;
  for (char c : localPart) {
    if (isAsciiAlnum(c)) {
      normalized += static_cast<char>(
          std::tolower(static_cast<unsigned char>(c)));
    }
  }
  return normalized;
}

// Closest owner by distance between mention starts; ties keep the first.
std::optional<int> closestOwner(const std::vector<const Owner *> &candidates,
                                int position) {
  const Owner *best = nullptr;
  int bestDistance = 0;
  for (const Owner *owner : candidates) {
    int distance = std::abs(owner->start - position);
    if (best == nullptr || distance < bestDistance) {
      best = owner;
      bestDistance = distance;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return best->id;
}

} // anonymous namespace

RelationshipResolver::RelationshipResolver() : m_rules(defaultRules()) {}

RelationshipResolver::RelationshipResolver(std::vector<OwnershipRule> rules)
    : m_rules(std::move(rules)) {}

std::vector<OwnershipRule> RelationshipResolver::defaultRules() {
  return {
      {"sameLine", &RelationshipResolver::matchSameLine},
      {"emailLocalPart", &RelationshipResolver::matchEmailLocalPart},
      {"nearest", &RelationshipResolver::matchNearest},
  };
}

const std::vector<OwnershipRule> &RelationshipResolver::getRules() const {
  return m_rules;
}

std::vector<LineSpan> RelationshipResolver::splitLines(const std::string &text) {
  std::vector<LineSpan> lines;
  int lineStart = 0;
  const int len = static_cast<int>(text.size());

  for (int i = 0; i < len; i++) {
    if (text[i] == '\n') {
      lines.push_back({lineStart, i + 1});
      lineStart = i + 1;
    }
  }
  if (lineStart < len) {
    lines.push_back({lineStart, len});
  }

  if (lines.empty()) {
    lines.push_back({0, len});
  }
  return lines;
}

std::vector<std::string>
RelationshipResolver::nameTokens(const std::string &name) {
  std::vector<std::string> tokens;
  std::string current;

  for (char c : name) {
    if (isAsciiAlnum(c)) {
      current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else if (!current.empty()) {
      tokens.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

std::optional<int>
RelationshipResolver::matchSameLine(const OwnershipContext &context,
                                    const MergedSpan &span) {
  for (const auto &line : context.lines) {
    if (span.start >= line.start && span.end <= line.end) {
      std::vector<const Owner *> sameLine;
      for (const auto &owner : context.owners) {
        if (owner.start >= line.start && owner.end <= line.end) {
          sameLine.push_back(&owner);
        }
      }
      return closestOwner(sameLine, span.start);
    }
  }
  return std::nullopt;
}

std::optional<int>
RelationshipResolver::matchEmailLocalPart(const OwnershipContext &context,
                                          const MergedSpan &span) {
  if (span.entityType != EMAIL_TYPE) {
    return std::nullopt;
  }

  const std::string value =
      context.text.substr(span.start, span.end - span.start);
  const size_t at = value.find('@');
  if (at == std::string::npos) {
    return std::nullopt;
  }
  const std::string localPart = normalizeLocalPart(value.substr(0, at));

  for (const auto &owner : context.owners) {
    for (const auto &token : nameTokens(owner.name)) {
      if (token.size() >= MIN_NAME_TOKEN_LENGTH &&
          localPart.find(token) != std::string::npos) {
        return owner.id;
      }
    }
  }
  return std::nullopt;
}

std::optional<int>
RelationshipResolver::matchNearest(const OwnershipContext &context,
                                   const MergedSpan &span) {
  std::vector<const Owner *> all;
  all.reserve(context.owners.size());
  for (const auto &owner : context.owners) {
    all.push_back(&owner);
  }
  return closestOwner(all, span.start);
}

bool RelationshipResolver::validateSpans(const std::string &text,
                                         const std::vector<MergedSpan> &spans,
                                         std::string &errorMessage) {
  const int len = static_cast<int>(text.size());
  for (const auto &span : spans) {
    if (span.end <= span.start || span.start < 0 || span.end > len) {
      errorMessage = "Invalid span [" + std::to_string(span.start) + ", " +
                     std::to_string(span.end) + ") of type " +
                     span.entityType + " for text of length " +
                     std::to_string(len);
      return false;
    }
  }
  return true;
}

AssignmentResult
RelationshipResolver::assign(const std::string &text,
                             const std::vector<MergedSpan> &spans) const {
  AssignmentResult result;
  result.success = false;

  if (!validateSpans(text, spans, result.errorMessage)) {
    result.errorKind = ErrorKind::InvalidSpan;
    return result;
  }

  for (const auto &span : spans) {
    if (span.entityType == PERSON_TYPE) {
      Owner owner;
      owner.id = static_cast<int>(result.owners.size()) + 1;
      owner.start = span.start;
      owner.end = span.end;
      owner.name = text.substr(span.start, span.end - span.start);
      result.owners.push_back(std::move(owner));
    }
  }

  const std::vector<LineSpan> lines = splitLines(text);
  const OwnershipContext context{text, result.owners, lines};

  for (const auto &span : spans) {
    Assignment assignment;
    assignment.span = span;

    if (span.entityType != PERSON_TYPE) {
      for (const auto &rule : m_rules) {
        assignment.ownerId = rule.match(context, span);
        if (assignment.ownerId) {
          break;
        }
      }
    }

    result.assignments.push_back(std::move(assignment));
  }

  result.success = true;
  return result;
}

std::string RelationshipResolver::placeholderFor(
    const std::string &text, const std::vector<Owner> &owners,
    const Assignment &assignment) {
  const MergedSpan &span = assignment.span;

  if (span.entityType == PERSON_TYPE) {
    for (const auto &owner : owners) {
      if (owner.start == span.start && owner.end == span.end) {
        return "PERSON_" + std::to_string(owner.id);
      }
    }
    return "<PERSON>";
  }

  std::string base = span.entityType;
  if (assignment.ownerId) {
    base += "_PERSON_" + std::to_string(*assignment.ownerId);
  }

  if (span.entityType == PHONE_TYPE) {
    const std::string original = text.substr(span.start, span.end - span.start);
    const auto digitCount =
        std::count_if(original.begin(), original.end(), [](char c) {
          return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
    if (digitCount > 0) {
      base += "_" + std::string(static_cast<size_t>(digitCount), '*');
    }
  }

  return "<" + base + ">";
}

RenderResult
RelationshipResolver::render(const std::string &text,
                             const std::vector<Owner> &owners,
                             const std::vector<Assignment> &assignments) const {
  RenderResult result;
  result.success = false;

  std::vector<MergedSpan> spans;
  spans.reserve(assignments.size());
  for (const auto &assignment : assignments) {
    spans.push_back(assignment.span);
  }
  if (!validateSpans(text, spans, result.errorMessage)) {
    result.errorKind = ErrorKind::InvalidSpan;
    return result;
  }

  struct Replacement {
    int start;
    int end;
    double score;
    std::string value;
  };

  std::vector<Replacement> replacements;
  replacements.reserve(assignments.size());
  for (const auto &assignment : assignments) {
    replacements.push_back({assignment.span.start, assignment.span.end,
                            assignment.span.score,
                            placeholderFor(text, owners, assignment)});
  }

  // Highest start first; for the same start the stronger detection wins.
  std::stable_sort(replacements.begin(), replacements.end(),
                   [](const Replacement &a, const Replacement &b) {
                     if (a.start != b.start) {
                       return a.start > b.start;
                     }
                     return a.score > b.score;
                   });

  std::string masked = text;
  int lowestSpliced = static_cast<int>(text.size()) + 1;
  for (const auto &replacement : replacements) {
    if (replacement.end > lowestSpliced) {
      continue; // overlaps a span that was already replaced
    }
    masked.replace(replacement.start, replacement.end - replacement.start,
                   replacement.value);
    lowestSpliced = replacement.start;
  }

  result.text = std::move(masked);
  result.success = true;
  return result;
}

RenderResult RelationshipResolver::mask(const std::string &text,
                                        const std::vector<MergedSpan> &spans) const {
  AssignmentResult assigned = assign(text, spans);
  if (!assigned.success) {
    RenderResult result;
    result.errorKind = assigned.errorKind;
    result.errorMessage = assigned.errorMessage;
    return result;
  }
  return render(text, assigned.owners, assigned.assignments);
}

} // namespace pii
