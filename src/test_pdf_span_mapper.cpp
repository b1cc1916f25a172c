#include "PdfSpanMapper.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

// One 10pt-wide glyph per character on a single line at y 100..110;
// spaces become separators without geometry
pii::LayoutElement lineElement(const std::string &text, double x = 0.0) {
  pii::LayoutElement element;
  double cursor = x;
  for (char c : text) {
    if (c == ' ') {
      element.appendSeparator(' ');
    } else {
      element.appendGlyph(static_cast<unsigned char>(c),
                          pii::GlyphBox{cursor, 100.0, cursor + 10.0, 110.0});
    }
    cursor += 10.0;
  }
  element.bounds = pii::GlyphBox{x, 100.0, cursor, 110.0};
  return element;
}

pii::DetectionSpan spanOf(const std::string &text, const std::string &value,
                          const std::string &type, double score = 0.8) {
  const size_t pos = text.find(value);
  EXPECT_NE(pos, std::string::npos) << value;
  return {static_cast<int>(pos), static_cast<int>(pos + value.size()), type,
          score};
}

class LiteralProvider : public pii::DetectionProvider {
public:
  LiteralProvider(std::string needle, std::string type, double score)
      : m_needle(std::move(needle)), m_type(std::move(type)), m_score(score) {}

  std::vector<pii::DetectionSpan>
  analyze(const std::string &text, const std::string &,
          const std::vector<std::string> &) const override {
    std::vector<pii::DetectionSpan> spans;
    size_t pos = text.find(m_needle);
    if (pos != std::string::npos) {
      spans.push_back({static_cast<int>(pos),
                       static_cast<int>(pos + m_needle.size()), m_type,
                       m_score});
    }
    return spans;
  }

private:
  std::string m_needle;
  std::string m_type;
  double m_score;
};

// Writes a one-page PDF drawing "SECRET" in 10pt Helvetica at (x, y) of user
// space and returns its path
std::string writeTextPdf(const std::string &name, const std::string &mediaBox,
                         int rotate, double x, double y) {
  char content[128];
  std::snprintf(content, sizeof(content),
                "BT /F1 10 Tf %g %g Td (SECRET) Tj ET", x, y);
  const std::string stream = content;

  std::string page = "<< /Type /Page /Parent 2 0 R /MediaBox [" + mediaBox +
                     "] ";
  if (rotate != 0) {
    page += "/Rotate " + std::to_string(rotate) + " ";
  }
  page += "/Resources << /Font << /F1 5 0 R >> >> /Contents 4 0 R >>";

  std::vector<std::string> objects = {
      "<< /Type /Catalog /Pages 2 0 R >>",
      "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
      page,
      "<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" +
          stream + "\nendstream",
      "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>",
  };

  std::string pdf = "%PDF-1.4\n";
  std::vector<size_t> offsets;
  for (size_t i = 0; i < objects.size(); i++) {
    offsets.push_back(pdf.size());
    pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
  }
  const size_t xrefOffset = pdf.size();
  pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
  pdf += "0000000000 65535 f \n";
  for (size_t offset : offsets) {
    char entry[32];
    std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
    pdf += entry;
  }
  pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) +
         " /Root 1 0 R >>\nstartxref\n" + std::to_string(xrefOffset) +
         "\n%%EOF\n";

  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / name;
  std::ofstream out(path, std::ios::binary);
  out << pdf;
  return path.string();
}

// Helvetica advance of "SECRET" at 10pt
const double SECRET_WIDTH = 40.56;

} // namespace

TEST(LayoutElementTest, MultiByteGlyphsMapEveryByte) {
  pii::LayoutElement element;
  element.appendGlyph('a', {0, 0, 1, 1});
  element.appendGlyph(0xE9, {1, 0, 2, 1});
  element.appendSeparator(' ');
  element.appendGlyph(0x20AC, {3, 0, 4, 1});

  EXPECT_EQ(element.text, "a\xC3\xA9 \xE2\x82\xAC");
  EXPECT_EQ(element.glyphAtByte,
            (std::vector<int>{0, 1, 1, -1, 2, 2, 2}));
}

TEST(PdfSpanMapperTest, PreciseBoxIsUnionOfGlyphs) {
  auto element = lineElement("Call 0412 345 678 now");
  std::set<std::string> seen;
  int skipped = 0;

  auto boxes = pii::PdfSpanMapper::mapElementSpans(
      element, {spanOf(element.text, "0412 345 678", "AU_PHONE_NUMBER")},
      seen, pii::MappingMode::Precise, skipped);

  ASSERT_EQ(boxes.size(), 1u);
  EXPECT_DOUBLE_EQ(boxes[0].x0, 50.0);
  EXPECT_DOUBLE_EQ(boxes[0].x1, 170.0);
  EXPECT_DOUBLE_EQ(boxes[0].y0, 100.0);
  EXPECT_DOUBLE_EQ(boxes[0].y1, 110.0);
  EXPECT_EQ(boxes[0].entityType, "AU_PHONE_NUMBER");
  ASSERT_TRUE(boxes[0].score.has_value());
  EXPECT_DOUBLE_EQ(*boxes[0].score, 0.8);
  EXPECT_EQ(skipped, 0);
}

TEST(PdfSpanMapperTest, CoarseBoxIsTheWholeElement) {
  auto element = lineElement("id 123", 20.0);
  std::set<std::string> seen;
  int skipped = 0;

  auto boxes = pii::PdfSpanMapper::mapElementSpans(
      element, {spanOf(element.text, "123", "AU_BSB")}, seen,
      pii::MappingMode::Coarse, skipped);

  ASSERT_EQ(boxes.size(), 1u);
  EXPECT_DOUBLE_EQ(boxes[0].x0, 20.0);
  EXPECT_DOUBLE_EQ(boxes[0].x1, 80.0);
}

TEST(PdfSpanMapperTest, LabelPrefixIsDroppedFromNames) {
  auto element = lineElement("Name: Jo Li");
  std::set<std::string> seen;
  int skipped = 0;

  // The provider reported the space after the colon as part of the name
  auto boxes = pii::PdfSpanMapper::mapElementSpans(
      element, {spanOf(element.text, " Jo Li", "PERSON")}, seen,
      pii::MappingMode::Precise, skipped);

  ASSERT_EQ(boxes.size(), 1u);
  EXPECT_DOUBLE_EQ(boxes[0].x0, 60.0);
  EXPECT_DOUBLE_EQ(boxes[0].x1, 110.0);
  EXPECT_EQ(seen.count("PERSON:Jo Li"), 1u);
}

TEST(PdfSpanMapperTest, LabelPrefixIsKeptForOtherTypes) {
  auto element = lineElement("Tel: 0299998888");
  std::set<std::string> seen;
  int skipped = 0;

  auto boxes = pii::PdfSpanMapper::mapElementSpans(
      element, {{4, 15, "AU_PHONE_NUMBER", 0.7}}, seen,
      pii::MappingMode::Precise, skipped);

  ASSERT_EQ(boxes.size(), 1u);
  EXPECT_EQ(seen.count("AU_PHONE_NUMBER: 0299998888"), 1u);
}

TEST(PdfSpanMapperTest, TrailingPunctuationIsTrimmed) {
  auto element = lineElement("mail a@b.io.");
  std::set<std::string> seen;
  int skipped = 0;

  auto boxes = pii::PdfSpanMapper::mapElementSpans(
      element, {spanOf(element.text, "a@b.io.", "EMAIL_ADDRESS")}, seen,
      pii::MappingMode::Precise, skipped);

  ASSERT_EQ(boxes.size(), 1u);
  EXPECT_DOUBLE_EQ(boxes[0].x1, 110.0);
  EXPECT_EQ(seen.count("EMAIL_ADDRESS:a@b.io"), 1u);
}

TEST(PdfSpanMapperTest, PunctuationOnlySpanIsDropped) {
  auto element = lineElement("a ., b");
  std::set<std::string> seen;
  int skipped = 0;

  auto boxes = pii::PdfSpanMapper::mapElementSpans(
      element, {{2, 4, "AU_STATE", 1.0}}, seen, pii::MappingMode::Precise,
      skipped);

  EXPECT_TRUE(boxes.empty());
  EXPECT_TRUE(seen.empty());
  EXPECT_EQ(skipped, 0);
}

TEST(PdfSpanMapperTest, SameTextIsBoxedOncePerPage) {
  auto first = lineElement("NSW office");
  auto second = lineElement("NSW again", 0.0);
  LiteralProvider provider("NSW", "AU_STATE", 1.0);

  pii::PdfSpanMapper mapper;
  int skipped = 0;
  auto boxes = mapper.mapPage({first, second}, provider, skipped);

  EXPECT_EQ(boxes.size(), 1u);
}

TEST(PdfSpanMapperTest, SeparatorOnlySpanIsSkipped) {
  auto element = lineElement("a   b");
  std::set<std::string> seen;
  int skipped = 0;

  auto boxes = pii::PdfSpanMapper::mapElementSpans(
      element, {{1, 4, "URL", 0.6}}, seen, pii::MappingMode::Precise,
      skipped);

  EXPECT_TRUE(boxes.empty());
  EXPECT_EQ(skipped, 1);
}

TEST(PdfSpanMapperTest, InvalidSpansAreIgnored) {
  auto element = lineElement("abc");
  std::set<std::string> seen;
  int skipped = 0;

  auto boxes = pii::PdfSpanMapper::mapElementSpans(
      element, {{-1, 2, "URL", 0.6}, {1, 9, "URL", 0.6}, {2, 2, "URL", 0.6}},
      seen, pii::MappingMode::Precise, skipped);

  EXPECT_TRUE(boxes.empty());
  EXPECT_EQ(skipped, 0);
}

TEST(PdfSpanMapperTest, MinScoreAndEmptyElements) {
  pii::PdfAnalysisOptions options;
  options.minScore = 0.5;
  pii::PdfSpanMapper mapper(options);
  LiteralProvider provider("TFN", "AU_TFN", 0.3);

  int skipped = 0;
  auto boxes = mapper.mapPage({lineElement("my TFN"), pii::LayoutElement(),
                               lineElement("   ")},
                              provider, skipped);
  EXPECT_TRUE(boxes.empty());

  options.minScore = 0.3;
  mapper.setOptions(options);
  boxes = mapper.mapPage({lineElement("my TFN")}, provider, skipped);
  EXPECT_EQ(boxes.size(), 1u);
  EXPECT_DOUBLE_EQ(mapper.getOptions().minScore, 0.3);
}

TEST(PdfSpanMapperTest, MissingFileIsAnIoFailure) {
  LiteralProvider provider("x", "TEST", 1.0);
  auto result =
      pii::PdfSpanMapper().analyze("/nonexistent/input.pdf", provider);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, pii::ErrorKind::IOFailure);
}

TEST(PdfSpanMapperTest, BoxesFromAPdfAreInUserSpace) {
  const std::string path =
      writeTextPdf("pii_mapper_plain.pdf", "0 0 200 200", 0, 20, 150);
  LiteralProvider provider("SECRET", "AU_TFN", 0.9);
  auto result = pii::PdfSpanMapper().analyze(path, provider);
  std::remove(path.c_str());

  ASSERT_TRUE(result.success) << result.errorMessage;
  ASSERT_EQ(result.pageCount, 1);
  ASSERT_EQ(result.pages[0].size(), 1u);
  const auto &box = result.pages[0][0];
  EXPECT_NEAR(box.x0, 20.0, 0.5);
  EXPECT_NEAR(box.x1, 20.0 + SECRET_WIDTH, 1.0);
  EXPECT_LT(box.y0, 150.0);
  EXPECT_GT(box.y1, 150.0);
  EXPECT_LT(box.y1 - box.y0, 15.0);
  EXPECT_EQ(box.entityType, "AU_TFN");
}

TEST(PdfSpanMapperTest, OffsetMediaBoxKeepsUserCoordinates) {
  const std::string path =
      writeTextPdf("pii_mapper_offset.pdf", "100 200 400 500", 0, 150, 300);
  LiteralProvider provider("SECRET", "AU_TFN", 0.9);
  auto result = pii::PdfSpanMapper().analyze(path, provider);
  std::remove(path.c_str());

  ASSERT_TRUE(result.success) << result.errorMessage;
  ASSERT_EQ(result.pages[0].size(), 1u);
  const auto &box = result.pages[0][0];
  EXPECT_NEAR(box.x0, 150.0, 0.5);
  EXPECT_NEAR(box.x1, 150.0 + SECRET_WIDTH, 1.0);
  EXPECT_LT(box.y0, 300.0);
  EXPECT_GT(box.y1, 300.0);
}

TEST(PdfSpanMapperTest, RotatedPageBoxesAreUnrotated) {
  for (int rotate : {90, 180, 270}) {
    const std::string path =
        writeTextPdf("pii_mapper_rotate_" + std::to_string(rotate) + ".pdf",
                     "0 0 200 100", rotate, 20, 60);
    LiteralProvider provider("SECRET", "AU_TFN", 0.9);
    auto result = pii::PdfSpanMapper().analyze(path, provider);
    std::remove(path.c_str());

    ASSERT_TRUE(result.success) << result.errorMessage;
    ASSERT_EQ(result.pages[0].size(), 1u) << "rotate " << rotate;
    const auto &box = result.pages[0][0];
    EXPECT_NEAR(box.x0, 20.0, 0.5) << "rotate " << rotate;
    EXPECT_NEAR(box.x1, 20.0 + SECRET_WIDTH, 1.0) << "rotate " << rotate;
    EXPECT_LT(box.y0, 60.0) << "rotate " << rotate;
    EXPECT_GT(box.y1, 60.0) << "rotate " << rotate;
  }
}
