#ifndef PII_PDF_REDACTION_WRITER_HPP
#define PII_PDF_REDACTION_WRITER_HPP

#include "EntityPalette.hpp"
#include "PiiTypes.hpp"

#include <string>
#include <vector>

namespace pii {

/**
 * @brief Configuration options for writing a redacted PDF
 */
struct PdfWriteOptions {
  bool drawLabels = true;        ///< Overlay entity type and confidence
  std::string labelPrefix;       ///< Prepended to every entity label
  bool attachOriginal = false;   ///< Embed the source PDF as an attachment
  SeverityMap severityOverrides; ///< Merged over the built-in severities
  ColorMap colorOverrides;       ///< Merged over the built-in colours
  bool verbose = false;          ///< Print DEBUG lines to stderr
};

/**
 * @brief Result of writing a redacted PDF
 */
struct PdfWriteResult {
  bool success = false;                  ///< Whether the document was saved
  ErrorKind errorKind = ErrorKind::None; ///< Failure category
  std::string errorMessage;              ///< Error message if failed
  int failedPage = -1;                   ///< 0-based page of the failure
  std::string outputPath;                ///< Destination that was written
  int pagesRedacted = 0;                 ///< Pages that received an overlay
  int boxesDrawn = 0;                    ///< Rectangles painted
  double processingTimeMs = 0;           ///< Processing time in milliseconds
};

/**
 * @brief Paints opaque, severity-coloured boxes over PDF page regions
 *
 * For every page with boxes, the page's existing content streams are kept
 * and wrapped in q/Q, and a new content stream with the overlay operators is
 * appended after them. Nothing on the page is removed: the overlay hides the
 * text visually, the glyphs stay in the file. When labels are drawn, a
 * Helvetica font resource is registered on the page once.
 *
 * The source file is never modified. The output is saved once, at the end,
 * through a temporary file that is renamed onto the destination, so a
 * failure leaves no partial output behind.
 *
 * Example usage:
 * @code
 * pii::PdfWriteOptions options;
 * options.attachOriginal = true;
 * pii::PdfRedactionWriter writer(options);
 * auto result = writer.write("in.pdf", "in_redacted.pdf", analysis.pages);
 * @endcode
 */
class PdfRedactionWriter {
public:
  PdfRedactionWriter();
  explicit PdfRedactionWriter(const PdfWriteOptions &options);

  /**
   * @brief Write a redacted copy of a PDF
   * @param sourcePath Source PDF (read only)
   * @param destPath Destination PDF path, must differ from sourcePath
   * @param perPageBoxes Boxes for page 0, 1, ...; may be shorter than the
   * document
   * @return PdfWriteResult; RedactionFailure carries the failing page
   */
  PdfWriteResult write(const std::string &sourcePath,
                       const std::string &destPath,
                       const std::vector<PageBoxes> &perPageBoxes) const;

  /**
   * @brief Default destination "<dir>/<stem>_redacted.pdf" of a source PDF
   */
  static std::string defaultOutputPath(const std::string &sourcePath);

  /**
   * @brief Drop paths naming a file already listed, keeping the first
   * spelling and the input order
   */
  static std::vector<std::string>
  uniqueSources(const std::vector<std::string> &paths);

  const PdfWriteOptions &getOptions() const;
  void setOptions(const PdfWriteOptions &options);

private:
  PdfWriteOptions m_options;
};

} // namespace pii

#endif // PII_PDF_REDACTION_WRITER_HPP
