#include "RelationshipResolver.hpp"

#include <gtest/gtest.h>

namespace {

pii::MergedSpan spanOf(const std::string &text, const std::string &value,
                       const std::string &type, double score = 0.9) {
  const size_t pos = text.find(value);
  EXPECT_NE(pos, std::string::npos) << value;
  pii::MergedSpan span;
  span.start = static_cast<int>(pos);
  span.end = static_cast<int>(pos + value.size());
  span.entityType = type;
  span.score = score;
  return span;
}

} // namespace

TEST(RelationshipResolverTest, EmailAndPhoneBelongToTheOnlyPerson) {
  const std::string text = "Dear John Smith,\n"
                           "Contact: john.smith@example.com\n"
                           "Phone: 555-123-4567\n";
  std::vector<pii::MergedSpan> spans = {
      spanOf(text, "John Smith", "PERSON"),
      spanOf(text, "john.smith@example.com", "EMAIL_ADDRESS"),
      spanOf(text, "555-123-4567", "PHONE_NUMBER", 0.4),
  };

  pii::RelationshipResolver resolver;
  auto result = resolver.mask(text, spans);

  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.text, "Dear PERSON_1,\n"
                         "Contact: <EMAIL_ADDRESS_PERSON_1>\n"
                         "Phone: <PHONE_NUMBER_PERSON_1_**********>\n");
}

TEST(RelationshipResolverTest, OwnersAreNumberedInOrder) {
  const std::string text = "Alice Brown met Bob Green.";
  std::vector<pii::MergedSpan> spans = {
      spanOf(text, "Alice Brown", "PERSON"),
      spanOf(text, "Bob Green", "PERSON"),
  };

  pii::RelationshipResolver resolver;
  auto assigned = resolver.assign(text, spans);

  ASSERT_TRUE(assigned.success);
  ASSERT_EQ(assigned.owners.size(), 2u);
  EXPECT_EQ(assigned.owners[0].id, 1);
  EXPECT_EQ(assigned.owners[0].name, "Alice Brown");
  EXPECT_EQ(assigned.owners[1].id, 2);
  EXPECT_EQ(assigned.owners[1].name, "Bob Green");
  for (const auto &assignment : assigned.assignments) {
    EXPECT_FALSE(assignment.ownerId.has_value());
  }

  auto rendered =
      resolver.render(text, assigned.owners, assigned.assignments);
  ASSERT_TRUE(rendered.success);
  EXPECT_EQ(rendered.text, "PERSON_1 met PERSON_2.");
}

TEST(RelationshipResolverTest, SameLineOwnerWinsOverNearer) {
  // The phone on line 2 is closer to Bob on line 3 but shares a line with
  // Alice
  const std::string text = "x\n"
                           "Alice Brown ........................ 0412345678\n"
                           "Bob Green\n";
  std::vector<pii::MergedSpan> spans = {
      spanOf(text, "Alice Brown", "PERSON"),
      spanOf(text, "0412345678", "AU_PHONE_NUMBER"),
      spanOf(text, "Bob Green", "PERSON"),
  };

  pii::RelationshipResolver resolver;
  auto assigned = resolver.assign(text, spans);

  ASSERT_TRUE(assigned.success);
  ASSERT_TRUE(assigned.assignments[1].ownerId.has_value());
  EXPECT_EQ(*assigned.assignments[1].ownerId, 1);
}

TEST(RelationshipResolverTest, EmailLocalPartMatchesNameToken) {
  const std::string text = "Alice Brown\n"
                           "Bob Green\n"
                           "Reach out via green.b@example.org\n";
  std::vector<pii::MergedSpan> spans = {
      spanOf(text, "Alice Brown", "PERSON"),
      spanOf(text, "Bob Green", "PERSON"),
      spanOf(text, "green.b@example.org", "EMAIL_ADDRESS"),
  };

  auto assigned = pii::RelationshipResolver().assign(text, spans);

  ASSERT_TRUE(assigned.success);
  ASSERT_TRUE(assigned.assignments[2].ownerId.has_value());
  EXPECT_EQ(*assigned.assignments[2].ownerId, 2);
}

TEST(RelationshipResolverTest, NoPersonsLeavesSpansUnowned) {
  const std::string text = "Call 555-123-4567 or mail help@example.com";
  std::vector<pii::MergedSpan> spans = {
      spanOf(text, "555-123-4567", "PHONE_NUMBER"),
      spanOf(text, "help@example.com", "EMAIL_ADDRESS"),
  };

  auto result = pii::RelationshipResolver().mask(text, spans);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.text,
            "Call <PHONE_NUMBER_**********> or mail <EMAIL_ADDRESS>");
}

TEST(RelationshipResolverTest, PhoneWithoutDigitsHasNoMask) {
  const std::string text = "phone: TBA";
  pii::Assignment assignment;
  assignment.span = spanOf(text, "TBA", "PHONE_NUMBER");

  EXPECT_EQ(pii::RelationshipResolver::placeholderFor(text, {}, assignment),
            "<PHONE_NUMBER>");
}

TEST(RelationshipResolverTest, InvalidSpansAreRejected) {
  const std::string text = "short";
  pii::RelationshipResolver resolver;

  std::vector<pii::MergedSpan> empty = {{2, 2, "PERSON", 0.9}};
  auto emptyResult = resolver.mask(text, empty);
  EXPECT_FALSE(emptyResult.success);
  EXPECT_EQ(emptyResult.errorKind, pii::ErrorKind::InvalidSpan);

  std::vector<pii::MergedSpan> outOfRange = {{3, 50, "EMAIL_ADDRESS", 0.9}};
  auto rangeResult = resolver.assign(text, outOfRange);
  EXPECT_FALSE(rangeResult.success);
  EXPECT_EQ(rangeResult.errorKind, pii::ErrorKind::InvalidSpan);
}

TEST(RelationshipResolverTest, SameStartKeepsTheHigherScore) {
  const std::string text = "id 123456789 end";
  std::vector<pii::MergedSpan> spans = {
      {3, 12, "AU_ACN", 0.5},
      {3, 12, "AU_TFN", 0.9},
  };

  auto result = pii::RelationshipResolver().mask(text, spans);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.text, "id <AU_TFN> end");
}

TEST(RelationshipResolverTest, OverlapWithALaterSpanIsSkipped) {
  // Splicing runs from the highest start down, so [6,12) is replaced first
  // and [3,12) overlaps it
  const std::string text = "id 123456789 end";
  std::vector<pii::MergedSpan> spans = {
      {3, 12, "AU_TFN", 0.9},
      {6, 12, "AU_BSB", 0.4},
  };

  auto result = pii::RelationshipResolver().mask(text, spans);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.text, "id 123<AU_BSB> end");
}

TEST(RelationshipResolverTest, TextOutsideSpansIsPreserved) {
  const std::string text = "Before Jane Doe middle jane@doe.io after";
  std::vector<pii::MergedSpan> spans = {
      spanOf(text, "Jane Doe", "PERSON"),
      spanOf(text, "jane@doe.io", "EMAIL_ADDRESS"),
  };

  auto result = pii::RelationshipResolver().mask(text, spans);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.text, "Before PERSON_1 middle <EMAIL_ADDRESS_PERSON_1> after");
}

TEST(RelationshipResolverTest, CustomRulesAreTriedInOrder) {
  const std::string text = "Ann Lee\nfax 0299998888";
  std::vector<pii::MergedSpan> spans = {
      spanOf(text, "Ann Lee", "PERSON"),
      spanOf(text, "0299998888", "AU_PHONE_NUMBER"),
  };

  std::vector<pii::OwnershipRule> rules = {
      {"never", [](const pii::OwnershipContext &, const pii::MergedSpan &) {
         return std::optional<int>();
       }},
  };
  pii::RelationshipResolver resolver(rules);
  auto result = resolver.mask(text, spans);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.text, "PERSON_1\nfax <AU_PHONE_NUMBER>");
  EXPECT_EQ(resolver.getRules().size(), 1u);
}

TEST(RelationshipResolverTest, SplitLinesKeepsNewlines) {
  auto lines = pii::RelationshipResolver::splitLines("ab\ncd\n\nef");
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0].start, 0);
  EXPECT_EQ(lines[0].end, 3);
  EXPECT_EQ(lines[2].start, 6);
  EXPECT_EQ(lines[2].end, 7);
  EXPECT_EQ(lines[3].end, 9);
}
