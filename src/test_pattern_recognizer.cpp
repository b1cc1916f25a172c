#include "PatternRecognizer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>

namespace {

// Score of the span of `type` covering exactly `value`, if reported
std::optional<double> scoreOf(const std::vector<pii::DetectionSpan> &spans,
                              const std::string &text, const std::string &type,
                              const std::string &value) {
  for (const auto &span : spans) {
    if (span.entityType == type &&
        text.substr(span.start, span.end - span.start) == value) {
      return span.score;
    }
  }
  return std::nullopt;
}

int countOf(const std::vector<pii::DetectionSpan> &spans,
            const std::string &type) {
  return static_cast<int>(
      std::count_if(spans.begin(), spans.end(),
                    [&type](const pii::DetectionSpan &span) {
                      return span.entityType == type;
                    }));
}

class PatternRecognizerTest : public ::testing::Test {
protected:
  std::vector<pii::DetectionSpan> analyze(const std::string &text) {
    return m_recognizer.analyze(text, "en", {});
  }

  pii::PatternRecognizer m_recognizer;
};

} // namespace

TEST_F(PatternRecognizerTest, EmailAddress) {
  const std::string text = "Contact john.smith@example.com today";
  auto score = scoreOf(analyze(text), text, "EMAIL_ADDRESS",
                       "john.smith@example.com");
  ASSERT_TRUE(score.has_value());
  EXPECT_DOUBLE_EQ(*score, 1.0);
}

TEST_F(PatternRecognizerTest, AustralianMobileWithAndWithoutContext) {
  const std::string plain = "My number 0412 345 678";
  auto base = scoreOf(analyze(plain), plain, "AU_PHONE_NUMBER", "0412 345 678");
  ASSERT_TRUE(base.has_value());
  EXPECT_DOUBLE_EQ(*base, 0.65);

  const std::string withContext = "Call 0412 345 678";
  auto boosted = scoreOf(analyze(withContext), withContext, "AU_PHONE_NUMBER",
                         "0412 345 678");
  ASSERT_TRUE(boosted.has_value());
  EXPECT_DOUBLE_EQ(*boosted, 1.0);
}

TEST_F(PatternRecognizerTest, ContextBoostIsAdditive) {
  const std::string text = "TFN 123 456 782";
  auto score = scoreOf(analyze(text), text, "AU_TFN", "123 456 782");
  ASSERT_TRUE(score.has_value());
  EXPECT_NEAR(*score, 0.85, 1e-9);
}

TEST_F(PatternRecognizerTest, SameSpanFromSeveralPatternsIsReportedOnce) {
  const std::string text = "ref 123456789";
  auto spans = analyze(text);
  EXPECT_EQ(countOf(spans, "AU_TFN"), 1);
  auto score = scoreOf(spans, text, "AU_TFN", "123456789");
  ASSERT_TRUE(score.has_value());
  EXPECT_DOUBLE_EQ(*score, 0.5);
}

TEST_F(PatternRecognizerTest, ValidatedAbn) {
  const std::string valid = "ABN 51 824 753 556";
  auto score = scoreOf(analyze(valid), valid, "AU_ABN", "51 824 753 556");
  ASSERT_TRUE(score.has_value());
  EXPECT_DOUBLE_EQ(*score, 1.0);

  const std::string invalid = "ABN 51 824 753 557";
  EXPECT_EQ(countOf(analyze(invalid), "AU_ABN"), 0);
}

TEST_F(PatternRecognizerTest, LuhnCheckedCreditCard) {
  const std::string valid = "card 4111 1111 1111 1111";
  auto score =
      scoreOf(analyze(valid), valid, "CREDIT_CARD", "4111 1111 1111 1111");
  ASSERT_TRUE(score.has_value());
  EXPECT_DOUBLE_EQ(*score, 1.0);

  const std::string invalid = "card 4111 1111 1111 1112";
  EXPECT_EQ(countOf(analyze(invalid), "CREDIT_CARD"), 0);
}

TEST_F(PatternRecognizerTest, CentrelinkReferenceNumber) {
  const std::string withContext = "Centrelink CRN 204 123 4567";
  auto boosted = scoreOf(analyze(withContext), withContext,
                         "AU_CENTRELINK_CRN", "204 123 4567");
  ASSERT_TRUE(boosted.has_value());
  EXPECT_NEAR(*boosted, 0.8, 1e-9);

  // The unspaced form matches both the 10-digit and spaced patterns
  const std::string plain = "ref 2041234567";
  auto base =
      scoreOf(analyze(plain), plain, "AU_CENTRELINK_CRN", "2041234567");
  ASSERT_TRUE(base.has_value());
  EXPECT_DOUBLE_EQ(*base, 0.45);
}

TEST_F(PatternRecognizerTest, DriverLicence) {
  const std::string sa = "Driver licence 123456B";
  auto saScore = scoreOf(analyze(sa), sa, "AU_DRIVER_LICENSE", "123456B");
  ASSERT_TRUE(saScore.has_value());
  EXPECT_NEAR(*saScore, 0.85, 1e-9);

  const std::string nsw = "licence number 12345678";
  auto nswScore = scoreOf(analyze(nsw), nsw, "AU_DRIVER_LICENSE", "12345678");
  ASSERT_TRUE(nswScore.has_value());
  EXPECT_NEAR(*nswScore, 0.75, 1e-9);

  const std::string general = "code AB12CD34";
  auto generalScore =
      scoreOf(analyze(general), general, "AU_DRIVER_LICENSE", "AB12CD34");
  ASSERT_TRUE(generalScore.has_value());
  EXPECT_DOUBLE_EQ(*generalScore, 0.3);
}

TEST_F(PatternRecognizerTest, GovernmentIdFilterFindsCrnAndLicence) {
  const std::string text = "CRN 204123456 and DL no 7654321";
  auto spans = m_recognizer.analyze(
      text, "en", {"AU_CENTRELINK_CRN", "AU_DRIVER_LICENSE"});

  EXPECT_TRUE(
      scoreOf(spans, text, "AU_CENTRELINK_CRN", "204123456").has_value());
  EXPECT_TRUE(
      scoreOf(spans, text, "AU_DRIVER_LICENSE", "7654321").has_value());
  for (const auto &span : spans) {
    EXPECT_TRUE(span.entityType == "AU_CENTRELINK_CRN" ||
                span.entityType == "AU_DRIVER_LICENSE");
  }
}

TEST_F(PatternRecognizerTest, PersonSpanCoversOnlyTheName) {
  const std::string titled = "Dr Jane Doe attended";
  auto titledScore = scoreOf(analyze(titled), titled, "PERSON", "Jane Doe");
  ASSERT_TRUE(titledScore.has_value());
  EXPECT_DOUBLE_EQ(*titledScore, 0.85);

  const std::string greeting = "Dear John Smith,\nThanks";
  auto greetingScore =
      scoreOf(analyze(greeting), greeting, "PERSON", "John Smith");
  ASSERT_TRUE(greetingScore.has_value());
  EXPECT_DOUBLE_EQ(*greetingScore, 0.75);

  const std::string labelled = "Name: Ann Lee";
  auto labelledScore = scoreOf(analyze(labelled), labelled, "PERSON", "Ann Lee");
  ASSERT_TRUE(labelledScore.has_value());
  EXPECT_DOUBLE_EQ(*labelledScore, 0.7);
}

TEST_F(PatternRecognizerTest, StatesAndPostcodes) {
  const std::string text = "Sydney NSW 2000";
  auto spans = analyze(text);

  auto state = scoreOf(spans, text, "AU_STATE", "NSW");
  ASSERT_TRUE(state.has_value());
  EXPECT_DOUBLE_EQ(*state, 1.0);

  auto postcode = scoreOf(spans, text, "AU_POSTCODE", "2000");
  ASSERT_TRUE(postcode.has_value());
  EXPECT_DOUBLE_EQ(*postcode, 0.35);

  EXPECT_EQ(countOf(analyze("lower case nsw"), "AU_STATE"), 0);
}

TEST_F(PatternRecognizerTest, LongestStateNameWins) {
  const std::string text = "Adelaide, South Australia";
  auto spans = analyze(text);
  EXPECT_TRUE(scoreOf(spans, text, "AU_STATE", "South Australia").has_value());
  EXPECT_EQ(countOf(spans, "AU_STATE"), 1);
}

TEST_F(PatternRecognizerTest, EntityFilter) {
  const std::string text = "Call 0412 345 678 or mail a@b.com";
  auto spans = m_recognizer.analyze(text, "en", {"EMAIL_ADDRESS"});
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].entityType, "EMAIL_ADDRESS");
}

TEST_F(PatternRecognizerTest, OnlyEnglishIsSupported) {
  EXPECT_TRUE(m_recognizer.analyze("mail a@b.com", "de", {}).empty());
  EXPECT_TRUE(m_recognizer.analyze("", "en", {}).empty());
}

TEST(PatternRecognizerOptionsTest, AustralianRecognizersAreOptional) {
  pii::RecognizerOptions options;
  options.includeAustralian = false;
  pii::PatternRecognizer generic(options);

  auto entities = generic.supportedEntities();
  EXPECT_EQ(std::find(entities.begin(), entities.end(), "AU_TFN"),
            entities.end());
  EXPECT_NE(std::find(entities.begin(), entities.end(), "EMAIL_ADDRESS"),
            entities.end());

  auto all = pii::PatternRecognizer().supportedEntities();
  EXPECT_NE(std::find(all.begin(), all.end(), "AU_TFN"), all.end());
  EXPECT_NE(std::find(all.begin(), all.end(), "AU_CENTRELINK_CRN"), all.end());
  EXPECT_NE(std::find(all.begin(), all.end(), "AU_DRIVER_LICENSE"), all.end());
  EXPECT_TRUE(std::is_sorted(all.begin(), all.end()));
}

TEST(PatternRecognizerOptionsTest, CustomRecognizer) {
  pii::RecognizerOptions options;
  options.includeAustralian = false;
  pii::PatternRecognizer recognizer(options);

  pii::Recognizer employeeId;
  employeeId.entityType = "EMPLOYEE_ID";
  employeeId.patterns.push_back(
      {"employee_id", std::regex("\\bEMP-\\d{5}\\b"), 0.6, 0});
  employeeId.context = {"staff"};
  recognizer.addRecognizer(employeeId);

  const std::string text = "staff EMP-12345";
  auto score = scoreOf(recognizer.analyze(text, "en", {}), text, "EMPLOYEE_ID",
                       "EMP-12345");
  ASSERT_TRUE(score.has_value());
  EXPECT_NEAR(*score, 0.95, 1e-9);
}

TEST(PatternRecognizerChecksumTest, Luhn) {
  EXPECT_TRUE(pii::PatternRecognizer::luhnValid("4111-1111-1111-1111"));
  EXPECT_TRUE(pii::PatternRecognizer::luhnValid("378282246310005"));
  EXPECT_FALSE(pii::PatternRecognizer::luhnValid("4111111111111112"));
  EXPECT_FALSE(pii::PatternRecognizer::luhnValid("0"));
}

TEST(PatternRecognizerChecksumTest, Abn) {
  EXPECT_TRUE(pii::PatternRecognizer::abnValid("51824753556"));
  EXPECT_FALSE(pii::PatternRecognizer::abnValid("51824753557"));
  EXPECT_FALSE(pii::PatternRecognizer::abnValid("5182475355"));
}

TEST(PatternRecognizerContextTest, WindowLimitsTheLookBack) {
  const std::string near = "my tax file number is 123";
  EXPECT_TRUE(pii::PatternRecognizer::hasContext(
      near, static_cast<int>(near.find("123")), {"tax file number"}, 5));

  const std::string far = "tfn a b c d e f 123";
  EXPECT_FALSE(pii::PatternRecognizer::hasContext(
      far, static_cast<int>(far.find("123")), {"tfn"}, 5));
  EXPECT_TRUE(pii::PatternRecognizer::hasContext(
      far, static_cast<int>(far.find("123")), {"tfn"}, 7));
}
