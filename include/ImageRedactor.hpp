#ifndef PII_IMAGE_REDACTOR_HPP
#define PII_IMAGE_REDACTOR_HPP

#include "DetectionProvider.hpp"
#include "PiiTypes.hpp"

#include <opencv2/opencv.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pii {

/**
 * @brief Configuration options for OCR processing
 */
struct OCRConfig {
  std::string language = "eng"; ///< Tesseract language code (e.g. "eng")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_AUTO;     ///< Page segmentation mode
  bool preprocessImage = true; ///< Grayscale + adaptive threshold before OCR
  int minConfidence = 0;       ///< Drop words below this confidence (0-100)
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX)
};

/**
 * @brief One recognized word and its place in the joined OCR text
 */
struct OcrWord {
  cv::Rect box;                  ///< Word box in image pixels
  std::string text;              ///< Recognized UTF-8 text
  float confidence = 0.0f;       ///< Tesseract confidence (0-100)
  bool startsLine = false;       ///< First word of a text line
  int start = 0;                 ///< Byte offset in the joined text
  int end = 0;                   ///< One past the last byte in the joined text
};

/**
 * @brief A redacted region of an image
 */
struct ImageBox {
  int left = 0;
  int top = 0;
  int width = 0;
  int height = 0;
  std::string entityType;
  std::optional<double> score;
};

/**
 * @brief Configuration options for image redaction
 */
struct ImageRedactionOptions {
  RedactionStyle style;              ///< How regions are painted over
  bool drawLabels = false;           ///< Write the entity type on each box
  double minScore = 0.35;            ///< Drop spans scoring below this
  std::vector<std::string> entities; ///< Entity filter (empty = all)
  std::string language = "en";       ///< Language passed to the provider
  bool verbose = false;              ///< Print DEBUG lines to stderr
};

/**
 * @brief Result of redacting one image
 */
struct ImageRedactionResult {
  bool success = false;                  ///< Whether redaction succeeded
  ErrorKind errorKind = ErrorKind::None; ///< Failure category
  std::string errorMessage;              ///< Error message if failed
  std::string outputPath;                ///< Written image path
  std::string text;                      ///< Joined OCR text
  std::vector<ImageBox> boxes;           ///< Painted regions
  std::vector<DetectionSpan> textEntities; ///< Spans found in the OCR text
  double processingTimeMs = 0;           ///< Processing time in milliseconds
};

/**
 * @brief Redacts sensitive text in raster images using Tesseract and OpenCV
 *
 * The image is OCR'd at word level; the words are joined into one text
 * (space between words, newline between lines) that is passed to the
 * detection provider. Every span is mapped to the union of the word boxes it
 * overlaps, grown by the style padding, and painted over according to the
 * style mode.
 *
 * Example usage:
 * @code
 * pii::ImageRedactor redactor;
 * if (redactor.initialize()) {
 *     pii::PatternRecognizer recognizer;
 *     auto result = redactor.redactFile("scan.png", "scan_redacted.png",
 *                                       recognizer);
 * }
 * @endcode
 */
class ImageRedactor {
public:
  ImageRedactor();
  ImageRedactor(const OCRConfig &config, const ImageRedactionOptions &options);
  ~ImageRedactor();

  // Tesseract API is not copyable
  ImageRedactor(const ImageRedactor &) = delete;
  ImageRedactor &operator=(const ImageRedactor &) = delete;

  /**
   * @brief Initialize the OCR engine
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  bool isInitialized() const;

  /**
   * @brief Redact an image file and write the result
   * @param inputPath Image to read
   * @param outputPath Image to write (format from the extension)
   * @param provider Detection provider run over the OCR text
   */
  ImageRedactionResult redactFile(const std::string &inputPath,
                                  const std::string &outputPath,
                                  const DetectionProvider &provider);

  /**
   * @brief Redact an image in place
   */
  ImageRedactionResult redactImage(cv::Mat &image,
                                   const DetectionProvider &provider);

  /**
   * @brief OCR an image into words with boxes (offsets not yet assigned)
   */
  std::vector<OcrWord> recognizeWords(const cv::Mat &image);

  /**
   * @brief Join words into one text and assign each word its offsets
   */
  static std::string joinWords(std::vector<OcrWord> &words);

  /**
   * @brief Union of the word boxes each span overlaps, padded and clipped
   * @param imageSize Image bounds used for clipping
   * @return One box per span that overlaps at least one word
   */
  static std::vector<ImageBox> mapSpans(const std::vector<OcrWord> &words,
                                        const std::vector<DetectionSpan> &spans,
                                        int padding, const cv::Size &imageSize);

  /**
   * @brief Paint one region according to a redaction style
   */
  static void applyStyle(cv::Mat &image, const cv::Rect &region,
                         const RedactionStyle &style);

  const OCRConfig &getConfig() const;
  const ImageRedactionOptions &getOptions() const;
  void setOptions(const ImageRedactionOptions &options);

private:
  cv::Mat preprocessImage(const cv::Mat &image);
  void setImage(const cv::Mat &image);
  void drawLabel(cv::Mat &image, const ImageBox &box) const;

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  OCRConfig m_config;
  ImageRedactionOptions m_options;
  bool m_initialized;
};

} // namespace pii

#endif // PII_IMAGE_REDACTOR_HPP
