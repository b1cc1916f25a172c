#include "PdfSpanMapper.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

// Poppler low-level API for per-glyph text geometry
#include <GlobalParams.h>
#include <PDFDoc.h>
#include <Page.h>
#include <TextOutputDev.h>
#include <goo/GooString.h>

namespace pii {

namespace {

bool isAsciiSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isTrailingPunctuation(char c) {
  return c == '.' || c == ',' || c == ';' || c == ':';
}

std::string encodeUtf8(unsigned int codePoint) {
  std::string out;
  if (codePoint < 0x80) {
    out += static_cast<char>(codePoint);
  } else if (codePoint < 0x800) {
    out += static_cast<char>(0xC0 | (codePoint >> 6));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else if (codePoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codePoint >> 12));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else if (codePoint < 0x110000) {
    out += static_cast<char>(0xF0 | (codePoint >> 18));
    out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else {
    out += "\xEF\xBF\xBD"; // U+FFFD replacement character
  }
  return out;
}

bool hasNonSpace(const std::string &text) {
  return std::any_of(text.begin(), text.end(),
                     [](char c) { return !isAsciiSpace(c); });
}

struct TextPageDeleter {
  void operator()(TextPage *page) const {
    if (page) {
      page->decRefCnt();
    }
  }
};

// Collect the text blocks of one page, converting Poppler's top-left device
// space (72 dpi, media box) to PDF user space.
std::vector<LayoutElement> extractPageLayout(PDFDoc *doc, int pageNum,
                                             bool verbose) {
  std::vector<LayoutElement> elements;

  Page *page = doc->getPage(pageNum);
  if (!page) {
    throw std::runtime_error("Failed to load page " + std::to_string(pageNum));
  }
  const PDFRectangle *mediaBox = page->getMediaBox();
  const double originX = mediaBox->x1;
  const double top = mediaBox->y2;

  TextOutputDev textDev(nullptr, false, 0, false, false);
  if (!textDev.isOk()) {
    throw std::runtime_error("Failed to create text output device");
  }

  // displayPage adds the page's /Rotate to the requested rotation; cancel it
  // so device space stays aligned with unrotated user space
  const int rotation = (360 - page->getRotate()) % 360;
  if (verbose && rotation != 0) {
    std::cerr << "DEBUG: Page " << pageNum << " has /Rotate "
              << page->getRotate() << ", rendering text at " << rotation
              << " degrees" << std::endl;
  }

  doc->displayPage(&textDev, pageNum, 72.0, 72.0, rotation,
                   true,   // useMediaBox
                   false,  // crop
                   false); // printing

  std::unique_ptr<TextPage, TextPageDeleter> textPage(textDev.takeText());
  if (!textPage) {
    return elements;
  }

  auto toUserSpace = [originX, top](double xMin, double yMin, double xMax,
                                    double yMax) {
    GlyphBox box;
    box.x0 = originX + xMin;
    box.x1 = originX + xMax;
    box.y0 = top - yMax;
    box.y1 = top - yMin;
    return box;
  };

  for (TextFlow *flow = textPage->getFlows(); flow; flow = flow->getNext()) {
    for (TextBlock *block = flow->getBlocks(); block;
         block = block->getNext()) {
      LayoutElement element;

      double bxMin, byMin, bxMax, byMax;
      block->getBBox(&bxMin, &byMin, &bxMax, &byMax);
      element.bounds = toUserSpace(bxMin, byMin, bxMax, byMax);

      for (TextLine *line = block->getLines(); line; line = line->getNext()) {
        if (!element.text.empty()) {
          element.appendSeparator('\n');
        }

        for (TextWord *word = line->getWords(); word; word = word->getNext()) {
          for (int i = 0; i < word->getLength(); i++) {
            double xMin, yMin, xMax, yMax;
            word->getCharBBox(i, &xMin, &yMin, &xMax, &yMax);
            element.appendGlyph(*word->getChar(i),
                                toUserSpace(xMin, yMin, xMax, yMax));
          }
          if (word->getSpaceAfter() && word->getNext()) {
            element.appendSeparator(' ');
          }
        }
      }

      elements.push_back(std::move(element));
    }
  }

  return elements;
}

} // anonymous namespace

void LayoutElement::appendGlyph(unsigned int codePoint, const GlyphBox &box) {
  const int glyphIndex = static_cast<int>(glyphs.size());
  glyphs.push_back(box);

  const std::string bytes = encodeUtf8(codePoint);
  text += bytes;
  glyphAtByte.insert(glyphAtByte.end(), bytes.size(), glyphIndex);
}

void LayoutElement::appendSeparator(char separator) {
  text += separator;
  glyphAtByte.push_back(-1);
}

PdfSpanMapper::PdfSpanMapper() : m_options() {}

PdfSpanMapper::PdfSpanMapper(const PdfAnalysisOptions &options)
    : m_options(options) {}

PageBoxes PdfSpanMapper::mapElementSpans(const LayoutElement &element,
                                         const std::vector<DetectionSpan> &spans,
                                         std::set<std::string> &seenKeys,
                                         MappingMode mode, int &skippedSpans) {
  PageBoxes boxes;
  const std::string &text = element.text;
  const int len = static_cast<int>(text.size());

  for (const auto &span : spans) {
    int start = span.start;
    int end = span.end;
    if (start < 0 || end > len || end <= start) {
      continue;
    }

    // Drop a leading "label:" in front of names, e.g. "Name: John Smith"
    if (span.entityType == "PERSON" || span.entityType == "ORGANIZATION") {
      int prefixEnd = start;
      while (prefixEnd > 0 && isAsciiSpace(text[prefixEnd - 1])) {
        prefixEnd--;
      }
      if (prefixEnd > 0 && text[prefixEnd - 1] == ':') {
        start = prefixEnd;
        while (start < end && isAsciiSpace(text[start])) {
          start++;
        }
      }
    }

    while (end > start && isTrailingPunctuation(text[end - 1])) {
      end--;
    }

    if (end <= start) {
      continue;
    }

    const std::string key =
        span.entityType + ":" + text.substr(start, end - start);
    if (!seenKeys.insert(key).second) {
      continue;
    }

    PageBoundingBox box;
    box.entityType = span.entityType;
    box.score = span.score;

    if (mode == MappingMode::Coarse) {
      box.x0 = element.bounds.x0;
      box.y0 = element.bounds.y0;
      box.x1 = element.bounds.x1;
      box.y1 = element.bounds.y1;
      boxes.push_back(std::move(box));
      continue;
    }

    bool found = false;
    int lastGlyph = -1;
    for (int offset = start; offset < end; offset++) {
      const int glyphIndex = element.glyphAtByte[offset];
      if (glyphIndex < 0 || glyphIndex == lastGlyph) {
        continue;
      }
      lastGlyph = glyphIndex;

      const GlyphBox &glyph = element.glyphs[glyphIndex];
      if (!found) {
        box.x0 = glyph.x0;
        box.y0 = glyph.y0;
        box.x1 = glyph.x1;
        box.y1 = glyph.y1;
        found = true;
      } else {
        box.x0 = std::min(box.x0, glyph.x0);
        box.y0 = std::min(box.y0, glyph.y0);
        box.x1 = std::max(box.x1, glyph.x1);
        box.y1 = std::max(box.y1, glyph.y1);
      }
    }

    if (!found) {
      skippedSpans++;
      continue;
    }
    boxes.push_back(std::move(box));
  }

  return boxes;
}

PageBoxes PdfSpanMapper::mapPage(const std::vector<LayoutElement> &elements,
                                 const DetectionProvider &provider,
                                 int &skippedSpans) const {
  PageBoxes pageBoxes;
  std::set<std::string> seenKeys;

  for (const auto &element : elements) {
    if (element.glyphs.empty() || !hasNonSpace(element.text)) {
      if (m_options.verbose && element.glyphs.empty()) {
        std::cerr << "DEBUG: Skipping text element without glyphs"
                  << std::endl;
      }
      continue;
    }

    std::vector<DetectionSpan> spans =
        provider.analyze(element.text, m_options.language, m_options.entities);
    spans.erase(std::remove_if(spans.begin(), spans.end(),
                               [this](const DetectionSpan &span) {
                                 return span.score < m_options.minScore;
                               }),
                spans.end());

    const int skippedBefore = skippedSpans;
    PageBoxes elementBoxes = mapElementSpans(element, spans, seenKeys,
                                             m_options.mode, skippedSpans);
    if (m_options.verbose && skippedSpans > skippedBefore) {
      std::cerr << "DEBUG: "
                << errorKindName(ErrorKind::GeometryMappingFailure) << ": "
                << (skippedSpans - skippedBefore)
                << " span(s) mapped to no glyph geometry, skipped"
                << std::endl;
    }

    pageBoxes.insert(pageBoxes.end(),
                     std::make_move_iterator(elementBoxes.begin()),
                     std::make_move_iterator(elementBoxes.end()));
  }

  return pageBoxes;
}

PdfAnalysisResult PdfSpanMapper::analyze(const std::string &pdfPath,
                                         const DetectionProvider &provider) const {
  PdfAnalysisResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  GlobalParamsIniter globalParamsInit(nullptr);

  auto fileName = std::make_unique<GooString>(pdfPath);
  std::unique_ptr<PDFDoc> doc(new PDFDoc(std::move(fileName)));

  if (!doc->isOk()) {
    result.errorKind = ErrorKind::IOFailure;
    result.errorMessage = "Failed to load PDF file: " + pdfPath;
    return result;
  }

  result.pageCount = doc->getNumPages();
  if (m_options.verbose) {
    std::cerr << "DEBUG: PDF has " << result.pageCount << " pages"
              << std::endl;
  }

  for (int pageIndex = 0; pageIndex < result.pageCount; pageIndex++) {
    std::vector<LayoutElement> elements;
    try {
      elements = extractPageLayout(doc.get(), pageIndex + 1, m_options.verbose);
    } catch (const std::exception &e) {
      result.errorKind = ErrorKind::IOFailure;
      result.failedPage = pageIndex;
      result.errorMessage = "Failed to read text layout of page " +
                            std::to_string(pageIndex + 1) + ": " + e.what();
      return result;
    }

    try {
      PageBoxes boxes = mapPage(elements, provider, result.skippedSpans);
      result.boxCount += static_cast<int>(boxes.size());
      if (m_options.verbose) {
        std::cerr << "DEBUG: Page " << (pageIndex + 1) << ": "
                  << elements.size() << " text elements, " << boxes.size()
                  << " boxes" << std::endl;
      }
      result.pages.push_back(std::move(boxes));
    } catch (const std::exception &e) {
      result.errorKind = ErrorKind::DetectionFailure;
      result.failedPage = pageIndex;
      result.errorMessage = "Detection failed on page " +
                            std::to_string(pageIndex + 1) + ": " + e.what();
      return result;
    }
  }

  result.success = true;

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

const PdfAnalysisOptions &PdfSpanMapper::getOptions() const {
  return m_options;
}

void PdfSpanMapper::setOptions(const PdfAnalysisOptions &options) {
  m_options = options;
}

} // namespace pii
