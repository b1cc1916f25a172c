#include "ImageRedactor.hpp"
#include "EntityPalette.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace pii {

namespace {

cv::Scalar toScalar(const RgbColor &color) {
  // OpenCV images are BGR
  return cv::Scalar(color.b * 255.0, color.g * 255.0, color.r * 255.0);
}

} // anonymous namespace

ImageRedactor::ImageRedactor()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_options(), m_initialized(false) {}

ImageRedactor::ImageRedactor(const OCRConfig &config,
                             const ImageRedactionOptions &options)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_options(options), m_initialized(false) {}

ImageRedactor::~ImageRedactor() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

bool ImageRedactor::initialize() {
  if (m_initialized) {
    return true;
  }

  // An explicit tessdata directory beats TESSDATA_PREFIX; with neither,
  // nullptr lets Tesseract fall back to its build-time location
  const char *tessDataPath = m_config.tessDataPath.empty()
                                 ? std::getenv("TESSDATA_PREFIX")
                                 : m_config.tessDataPath.c_str();
  if (m_options.verbose) {
    std::cerr << "DEBUG: Loading OCR language '" << m_config.language
              << "' from "
              << (tessDataPath ? tessDataPath : "the built-in tessdata path")
              << std::endl;
  }

  if (m_tesseract->Init(tessDataPath, m_config.language.c_str()) != 0) {
    std::cerr << "Tesseract could not load language '" << m_config.language
              << "'" << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  return true;
}

bool ImageRedactor::isInitialized() const { return m_initialized; }

cv::Mat ImageRedactor::preprocessImage(const cv::Mat &image) {
  cv::Mat gray;
  switch (image.channels()) {
  case 4:
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    break;
  case 3:
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    break;
  default:
    gray = image.clone();
    break;
  }

  // Light denoise, then binarize against the local neighbourhood so uneven
  // scans keep their text
  cv::Mat binary;
  cv::GaussianBlur(gray, gray, cv::Size(3, 3), 0);
  cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                        cv::THRESH_BINARY, 11, 2);
  return binary;
}

void ImageRedactor::setImage(const cv::Mat &image) {
  // Tesseract copies the pixels. Single-channel input is passed as 8-bit
  // gray, colour input as RGB.
  if (image.channels() == 1) {
    m_tesseract->SetImage(image.data, image.cols, image.rows, 1,
                          static_cast<int>(image.step));
    return;
  }

  cv::Mat rgb;
  cv::cvtColor(image, rgb,
               image.channels() == 4 ? cv::COLOR_BGRA2RGB : cv::COLOR_BGR2RGB);
  m_tesseract->SetImage(rgb.data, rgb.cols, rgb.rows, 3,
                        static_cast<int>(rgb.step));
}

std::vector<OcrWord> ImageRedactor::recognizeWords(const cv::Mat &image) {
  std::vector<OcrWord> words;

  if (!m_initialized || image.empty()) {
    return words;
  }

  setImage(m_config.preprocessImage ? preprocessImage(image) : image);

  // The result iterator is only valid after a full recognition pass
  if (m_tesseract->Recognize(nullptr) != 0) {
    throw std::runtime_error("Tesseract recognition failed");
  }

  std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
  const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;

  if (ri) {
    do {
      std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
      if (!word || *word.get() == '\0') {
        continue;
      }

      OcrWord info;
      info.text = word.get();
      info.confidence = ri->Confidence(level);
      info.startsLine = ri->IsAtBeginningOf(tesseract::RIL_TEXTLINE);

      int x1, y1, x2, y2;
      ri->BoundingBox(level, &x1, &y1, &x2, &y2);
      info.box = cv::Rect(x1, y1, x2 - x1, y2 - y1);

      if (info.confidence < m_config.minConfidence) {
        continue;
      }
      words.push_back(std::move(info));
    } while (ri->Next(level));
  }

  return words;
}

std::string ImageRedactor::joinWords(std::vector<OcrWord> &words) {
  std::string text;
  for (auto &word : words) {
    if (!text.empty()) {
      text += word.startsLine ? '\n' : ' ';
    }
    word.start = static_cast<int>(text.size());
    text += word.text;
    word.end = static_cast<int>(text.size());
  }
  return text;
}

std::vector<ImageBox>
ImageRedactor::mapSpans(const std::vector<OcrWord> &words,
                        const std::vector<DetectionSpan> &spans, int padding,
                        const cv::Size &imageSize) {
  std::vector<ImageBox> boxes;
  const cv::Rect bounds(0, 0, imageSize.width, imageSize.height);

  for (const auto &span : spans) {
    cv::Rect region;
    bool found = false;

    for (const auto &word : words) {
      if (word.end <= span.start || word.start >= span.end) {
        continue;
      }
      region = found ? (region | word.box) : word.box;
      found = true;
    }

    if (!found) {
      continue;
    }

    region.x -= padding;
    region.y -= padding;
    region.width += 2 * padding;
    region.height += 2 * padding;
    region &= bounds;
    if (region.area() == 0) {
      continue;
    }

    ImageBox box;
    box.left = region.x;
    box.top = region.y;
    box.width = region.width;
    box.height = region.height;
    box.entityType = span.entityType;
    box.score = span.score;
    boxes.push_back(std::move(box));
  }

  return boxes;
}

void ImageRedactor::applyStyle(cv::Mat &image, const cv::Rect &region,
                               const RedactionStyle &style) {
  const cv::Rect clipped = region & cv::Rect(0, 0, image.cols, image.rows);
  if (clipped.area() == 0) {
    return;
  }

  cv::Mat roi = image(clipped);

  switch (style.mode) {
  case RedactionMode::Fill:
    cv::rectangle(image, clipped, toScalar(style.fillColor), cv::FILLED);
    break;

  case RedactionMode::Rectangle:
    cv::rectangle(image, clipped, toScalar(style.fillColor), cv::FILLED);
    cv::rectangle(image, clipped, toScalar(style.outlineColor),
                  std::max(1, style.strokeWidth));
    break;

  case RedactionMode::Blur: {
    const int kernel = 2 * std::max(1, style.blurRadius) + 1;
    cv::Mat blurred;
    cv::GaussianBlur(roi, blurred, cv::Size(kernel, kernel), 0);
    blurred.copyTo(roi);
    break;
  }

  case RedactionMode::Pixelate: {
    const int block = std::max(1, style.pixelSize);
    cv::Mat small;
    cv::resize(roi, small,
               cv::Size(std::max(1, clipped.width / block),
                        std::max(1, clipped.height / block)),
               0, 0, cv::INTER_LINEAR);
    cv::Mat pixelated;
    cv::resize(small, pixelated, clipped.size(), 0, 0, cv::INTER_NEAREST);
    pixelated.copyTo(roi);
    break;
  }
  }
}

void ImageRedactor::drawLabel(cv::Mat &image, const ImageBox &box) const {
  const RgbColor fill = m_options.style.fillColor;
  const bool solid = m_options.style.mode == RedactionMode::Fill ||
                     m_options.style.mode == RedactionMode::Rectangle;
  const RgbColor textColor =
      solid ? EntityPalette::labelColorFor(fill) : RgbColor{1.0, 1.0, 1.0};

  cv::putText(image, box.entityType, cv::Point(box.left + 2, box.top + 12),
              cv::FONT_HERSHEY_SIMPLEX, 0.4, toScalar(textColor), 1,
              cv::LINE_AA);
}

ImageRedactionResult ImageRedactor::redactImage(cv::Mat &image,
                                                const DetectionProvider &provider) {
  ImageRedactionResult result;
  result.success = false;

  if (!m_initialized) {
    result.errorKind = ErrorKind::InvalidArgument;
    result.errorMessage =
        "OCR engine not initialized. Call initialize() first.";
    return result;
  }

  if (image.empty()) {
    result.errorKind = ErrorKind::InvalidArgument;
    result.errorMessage = "Input image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  std::vector<OcrWord> words;
  try {
    words = recognizeWords(image);
  } catch (const std::exception &e) {
    result.errorKind = ErrorKind::DetectionFailure;
    result.errorMessage = std::string("OCR failed: ") + e.what();
    return result;
  }

  result.text = joinWords(words);
  if (m_options.verbose) {
    std::cerr << "DEBUG: OCR found " << words.size() << " words ("
              << result.text.size() << " bytes of text)" << std::endl;
  }

  try {
    result.textEntities =
        provider.analyze(result.text, m_options.language, m_options.entities);
  } catch (const std::exception &e) {
    result.errorKind = ErrorKind::DetectionFailure;
    result.errorMessage = std::string("Detection failed: ") + e.what();
    return result;
  }

  result.textEntities.erase(
      std::remove_if(result.textEntities.begin(), result.textEntities.end(),
                     [this](const DetectionSpan &span) {
                       return span.score < m_options.minScore;
                     }),
      result.textEntities.end());

  result.boxes = mapSpans(words, result.textEntities, m_options.style.padding,
                          image.size());

  for (const auto &box : result.boxes) {
    applyStyle(image, cv::Rect(box.left, box.top, box.width, box.height),
               m_options.style);
    if (m_options.drawLabels) {
      drawLabel(image, box);
    }
  }

  result.success = true;

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

ImageRedactionResult ImageRedactor::redactFile(const std::string &inputPath,
                                               const std::string &outputPath,
                                               const DetectionProvider &provider) {
  ImageRedactionResult result;
  result.success = false;

  cv::Mat image = cv::imread(inputPath);
  if (image.empty()) {
    result.errorKind = ErrorKind::IOFailure;
    result.errorMessage = "Failed to load image: " + inputPath;
    return result;
  }

  result = redactImage(image, provider);
  if (!result.success) {
    return result;
  }

  bool written = false;
  std::string writeError;
  try {
    written = cv::imwrite(outputPath, image);
  } catch (const cv::Exception &e) {
    writeError = std::string(": ") + e.what();
  }

  if (!written) {
    result.success = false;
    result.errorKind = ErrorKind::IOFailure;
    result.errorMessage =
        "Failed to save redacted image to " + outputPath + writeError;
    return result;
  }

  result.outputPath = outputPath;
  return result;
}

const OCRConfig &ImageRedactor::getConfig() const { return m_config; }

const ImageRedactionOptions &ImageRedactor::getOptions() const {
  return m_options;
}

void ImageRedactor::setOptions(const ImageRedactionOptions &options) {
  m_options = options;
}

} // namespace pii
