#include "ContentStreamBuilder.hpp"

#include <gtest/gtest.h>

namespace {

pii::PageBoundingBox makeBox(double x0, double y0, double x1, double y1,
                             const std::string &type,
                             std::optional<double> score = std::nullopt) {
  pii::PageBoundingBox box;
  box.x0 = x0;
  box.y0 = y0;
  box.x1 = x1;
  box.y1 = y1;
  box.entityType = type;
  box.score = score;
  return box;
}

} // namespace

TEST(ContentStreamBuilderTest, RectangleUsesWidthAndHeight) {
  auto ops = pii::ContentStreamBuilder::rectangleOps(
      makeBox(10, 10, 50, 30, "AU_TFN"), {0.9, 0.0, 0.0});
  EXPECT_EQ(ops, "q 0.900 0.000 0.000 rg 10 10 40 20 re f Q\n");
}

TEST(ContentStreamBuilderTest, OverlayWithoutLabelsIsRectanglesOnly) {
  pii::EntityPalette palette;
  pii::ContentStreamBuilder builder(palette);
  pii::LabelOptions labels;
  labels.drawLabels = false;

  auto ops = builder.buildPageOverlay(
      {makeBox(10, 10, 50, 30, "AU_TFN"), makeBox(0, 0, 5, 5, "PERSON")},
      labels);

  EXPECT_EQ(ops, "q 0.900 0.000 0.000 rg 10 10 40 20 re f Q\n"
                 "q 1.000 0.550 0.000 rg 0 0 5 5 re f Q\n");
  EXPECT_EQ(ops.find("BT"), std::string::npos);
}

TEST(ContentStreamBuilderTest, LabelsSitInsideTheTopLeftCorner) {
  pii::EntityPalette palette;
  pii::ContentStreamBuilder builder(palette);
  pii::LabelOptions labels;
  labels.labelPrefix = "PII: ";

  auto ops =
      builder.buildPageOverlay({makeBox(10, 10, 50, 30, "AU_TFN", 0.87)}, labels);

  EXPECT_NE(ops.find("BT /PIIHelv 8 Tf 1.000 1.000 1.000 rg 1 0 0 1 12 20 Tm "
                     "(PII: AU_TFN) Tj ET\n"),
            std::string::npos);
  EXPECT_NE(ops.find("BT /PIIHelv 8 Tf 0.000 0.000 0.000 rg 1 0 0 1 12 10 Tm "
                     "(conf: 0.87) Tj ET\n"),
            std::string::npos);
}

TEST(ContentStreamBuilderTest, LightFillGetsBlackLabel) {
  pii::EntityPalette palette;
  pii::ContentStreamBuilder builder(palette);

  auto ops = builder.buildPageOverlay({makeBox(0, 0, 100, 40, "PERSON")},
                                      pii::LabelOptions());

  EXPECT_NE(ops.find("0.000 0.000 0.000 rg 1 0 0 1 2 30 Tm (PERSON)"),
            std::string::npos);
  EXPECT_NE(ops.find("(conf: n/a)"), std::string::npos);
}

TEST(ContentStreamBuilderTest, EmptyPageHasNoOperators) {
  pii::EntityPalette palette;
  pii::ContentStreamBuilder builder(palette);
  EXPECT_TRUE(builder.buildPageOverlay({}, pii::LabelOptions()).empty());
}

TEST(ContentStreamBuilderTest, EscapeText) {
  EXPECT_EQ(pii::ContentStreamBuilder::escapeText("a(b)c\\d"),
            "a\\(b\\)c\\\\d");
  EXPECT_EQ(pii::ContentStreamBuilder::escapeText("caf\xC3\xA9"),
            "caf\\303\\251");
  EXPECT_EQ(pii::ContentStreamBuilder::escapeText("tab\t"), "tab\\011");
}

TEST(ContentStreamBuilderTest, FormatNumberTrimsZeros) {
  EXPECT_EQ(pii::ContentStreamBuilder::formatNumber(12.0), "12");
  EXPECT_EQ(pii::ContentStreamBuilder::formatNumber(12.5), "12.5");
  EXPECT_EQ(pii::ContentStreamBuilder::formatNumber(0.1234), "0.123");
  EXPECT_EQ(pii::ContentStreamBuilder::formatNumber(-0.0001), "0");
  EXPECT_EQ(pii::ContentStreamBuilder::formatNumber(-3.25), "-3.25");
}

TEST(ContentStreamBuilderTest, ConfidenceText) {
  EXPECT_EQ(pii::ContentStreamBuilder::confidenceText(0.5), "conf: 0.50");
  EXPECT_EQ(pii::ContentStreamBuilder::confidenceText(std::nullopt),
            "conf: n/a");
}
