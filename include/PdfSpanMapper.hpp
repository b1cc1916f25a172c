#ifndef PII_PDF_SPAN_MAPPER_HPP
#define PII_PDF_SPAN_MAPPER_HPP

#include "DetectionProvider.hpp"
#include "PiiTypes.hpp"

#include <set>
#include <string>
#include <vector>

namespace pii {

/**
 * @brief Bounding box of one glyph in PDF user space (origin bottom-left)
 */
struct GlyphBox {
  double x0 = 0.0;
  double y0 = 0.0;
  double x1 = 0.0;
  double y1 = 0.0;
};

/**
 * @brief One text-bearing layout element (a Poppler text block)
 *
 * The element's glyphs are concatenated into `text` as UTF-8, words joined
 * by a space and lines by '\n'. `glyphAtByte` maps every byte of `text` to
 * the index of the glyph it came from, or -1 for inserted separators.
 */
struct LayoutElement {
  std::string text;
  std::vector<GlyphBox> glyphs;
  std::vector<int> glyphAtByte;
  GlyphBox bounds; ///< Bounding box of the whole element

  /**
   * @brief Append one glyph with its Unicode code point and box
   */
  void appendGlyph(unsigned int codePoint, const GlyphBox &box);

  /**
   * @brief Append a separator byte that has no geometry of its own
   */
  void appendSeparator(char separator);
};

/**
 * @brief How span ranges become rectangles
 */
enum class MappingMode {
  Precise, ///< Union of the span's glyph boxes
  Coarse   ///< Whole element box for every span inside it
};

/**
 * @brief Configuration options for span-to-geometry mapping
 */
struct PdfAnalysisOptions {
  std::string language = "en";          ///< Language passed to the provider
  double minScore = 0.0;                ///< Drop spans scoring below this
  std::vector<std::string> entities;    ///< Entity filter (empty = all)
  MappingMode mode = MappingMode::Precise; ///< Geometry mapping mode
  bool verbose = false;                 ///< Print DEBUG lines to stderr
};

/**
 * @brief Result of mapping one PDF's detections onto page geometry
 */
struct PdfAnalysisResult {
  bool success = false;                  ///< Whether analysis succeeded
  ErrorKind errorKind = ErrorKind::None; ///< Failure category
  std::string errorMessage;              ///< Error message if failed
  int failedPage = -1;                   ///< 0-based page of the failure
  std::vector<PageBoxes> pages;          ///< Boxes per page, in page order
  int pageCount = 0;                     ///< Number of pages in the document
  int boxCount = 0;                      ///< Total boxes over all pages
  int skippedSpans = 0;                  ///< Spans without usable geometry
  double processingTimeMs = 0;           ///< Processing time in milliseconds
};

/**
 * @brief Maps detected text spans back onto PDF page geometry
 *
 * For every text block of a page, the block text is run through the
 * detection provider and each span is cleaned up before mapping:
 * - PERSON / ORGANIZATION spans preceded by a "label:" prefix start after
 *   the colon and any following whitespace
 * - trailing ". , ; :" are trimmed
 * - spans that collapse to nothing are dropped
 * - the first occurrence of each "TYPE:text" key on a page wins, so the
 *   same phrase detected again anywhere on that page is not boxed twice
 *
 * Example usage:
 * @code
 * pii::PatternRecognizer recognizer;
 * pii::PdfSpanMapper mapper;
 * auto result = mapper.analyze("letter.pdf", recognizer);
 * @endcode
 */
class PdfSpanMapper {
public:
  PdfSpanMapper();
  explicit PdfSpanMapper(const PdfAnalysisOptions &options);

  /**
   * @brief Analyze every page of a PDF file
   * @param pdfPath Path to the PDF file
   * @param provider Detection provider run once per text block
   * @return PdfAnalysisResult with one box list per page
   */
  PdfAnalysisResult analyze(const std::string &pdfPath,
                            const DetectionProvider &provider) const;

  /**
   * @brief Detect and map the spans of every element of one page
   * @param elements Layout elements of the page
   * @param provider Detection provider
   * @param skippedSpans Incremented for spans without geometry
   * @return Boxes of the page
   * @throws whatever the provider throws
   */
  PageBoxes mapPage(const std::vector<LayoutElement> &elements,
                    const DetectionProvider &provider,
                    int &skippedSpans) const;

  /**
   * @brief Clean up and map detected spans of one element
   * @param element Layout element the spans index into
   * @param spans Spans local to element.text
   * @param seenKeys Page-wide "TYPE:text" keys already boxed; updated
   * @param mode Precise or coarse mapping
   * @param skippedSpans Incremented for spans without geometry
   * @return Boxes for the surviving spans
   */
  static PageBoxes mapElementSpans(const LayoutElement &element,
                                   const std::vector<DetectionSpan> &spans,
                                   std::set<std::string> &seenKeys,
                                   MappingMode mode, int &skippedSpans);

  const PdfAnalysisOptions &getOptions() const;
  void setOptions(const PdfAnalysisOptions &options);

private:
  PdfAnalysisOptions m_options;
};

} // namespace pii

#endif // PII_PDF_SPAN_MAPPER_HPP
