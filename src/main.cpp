#include "ChunkScanner.hpp"
#include "CsvRedactor.hpp"
#include "DetectionFormatter.hpp"
#include "EntityPalette.hpp"
#include "ImageRedactor.hpp"
#include "PatternRecognizer.hpp"
#include "PdfRedactionWriter.hpp"
#include "PdfSpanMapper.hpp"
#include "RelationshipResolver.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace {

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <command> [options]\n"
      << "\nCommands:\n"
      << "  text    Detect PII in text, optionally write relationship-masked "
         "text\n"
      << "  pdf     Redact PDF files with severity-coloured boxes\n"
      << "  image   Redact an image using OCR\n"
      << "  csv     Detect and redact PII cell by cell in a CSV file\n"
      << "\nText options:\n"
      << "  --text <s> | --in <file>    Input text\n"
      << "  --lang <lang>               Language (default: en)\n"
      << "  --size <n>                  Window size (default: 5000)\n"
      << "  --overlap <n>               Window overlap (default: 300)\n"
      << "  --min-score <f>             Minimum score (default: 0.0)\n"
      << "  --anonymize                 Print type-only redacted text to "
         "stderr\n"
      << "  --mask-to-file <file>       Write relationship-masked text\n"
      << "  --print-text                Print input length and preview\n"
      << "  --entities <type>...        Only detect these entity types\n"
      << "\nPDF options:\n"
      << "  --in <file>...              Input PDF(s)\n"
      << "  --out <file>                Output PDF (single input only; "
         "default <name>_redacted.pdf)\n"
      << "  --lang <lang>               Language (default: en)\n"
      << "  --coarse                    Box whole text blocks\n"
      << "  --no-labels                 Do not draw labels on boxes\n"
      << "  --label-prefix <p>          Prefix for labels\n"
      << "  --attach-original           Embed the source PDF in the output\n"
      << "  --min-score <f>             Minimum score (default: 0.0)\n"
      << "  --entities <type>...        Only detect these entity types\n"
      << "  --group <name>              Only detect an entity group\n"
      << "  --palette <file>            JSON severity/colour overrides\n"
      << "  --jobs <n>                  Process inputs in parallel\n"
      << "\nImage options:\n"
      << "  --in <file> --out <file>    Input and output images\n"
      << "  --mode <m>                  fill|blur|pixelate|rectangle "
         "(default: fill)\n"
      << "  --fill <#RRGGBB>            Fill colour (default: #000000)\n"
      << "  --outline <#RRGGBB>         Outline colour (default: #FF0000)\n"
      << "  --padding <n>               Box padding (default: 2)\n"
      << "  --blur <n>                  Blur radius (default: 8)\n"
      << "  --pixel <n>                 Pixel block size (default: 12)\n"
      << "  --labels                    Draw entity labels\n"
      << "  --ocr-lang <lang>           Tesseract language (default: eng)\n"
      << "  --tessdata <dir>            Tesseract data directory\n"
      << "  --min-score <f>             Minimum score (default: 0.35)\n"
      << "  --entities <type>...        Only detect these entity types\n"
      << "\nCSV options:\n"
      << "  --in <file>                 Input CSV\n"
      << "  --out <file>                Write redacted CSV\n"
      << "  --lang <lang>               Language (default: en)\n"
      << "  --min-score <f>             Minimum score (default: 0.0)\n"
      << "  --delimiter <c>             Field delimiter (default: ,)\n"
      << "  --no-skip-header            Treat the first row as data\n"
      << "  --redaction-char <c>        Mask character (default: *)\n"
      << "  --use-labels                Replace values with <TYPE>\n"
      << "  --json-output <file>        Save detections as JSON\n"
      << "  --summary                   Print a detection summary\n"
      << "  --entities <type>...        Only detect these entity types\n"
      << "\nCommon options:\n"
      << "  -v, --verbose               Print debug output\n"
      << "  -h, --help                  Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " text --in letter.txt --mask-to-file "
         "masked.txt\n"
      << "  " << programName << " pdf --in a.pdf b.pdf --jobs 2 --group "
         "all_au\n"
      << "  " << programName << " image --in scan.png --out redacted.png "
         "--mode blur\n"
      << "  " << programName << " csv --in people.csv --out redacted.csv "
         "--use-labels\n";
}

// Reads the value of option argv[i], advancing i
bool takeValue(int argc, char *argv[], int &i, std::string &value) {
  if (i + 1 < argc) {
    value = argv[++i];
    return true;
  }
  std::cerr << "Error: " << argv[i] << " requires an argument\n";
  return false;
}

// Reads values up to the next option
std::vector<std::string> takeList(int argc, char *argv[], int &i) {
  std::vector<std::string> values;
  while (i + 1 < argc && argv[i + 1][0] != '-') {
    values.push_back(argv[++i]);
  }
  return values;
}

bool parseNumber(const std::string &text, double &value) {
  try {
    size_t used = 0;
    value = std::stod(text, &used);
    return used == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool parseInt(const std::string &text, int &value) {
  try {
    size_t used = 0;
    value = std::stoi(text, &used);
    return used == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool parseHexColor(const std::string &text, pii::RgbColor &color) {
  std::string hex = text;
  if (!hex.empty() && hex[0] == '#') {
    hex = hex.substr(1);
  }
  if (hex.size() != 6 ||
      hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
    return false;
  }
  const unsigned long rgb = std::stoul(hex, nullptr, 16);
  color.r = ((rgb >> 16) & 0xFF) / 255.0;
  color.g = ((rgb >> 8) & 0xFF) / 255.0;
  color.b = (rgb & 0xFF) / 255.0;
  return true;
}

bool readTextFile(const std::string &path, std::string &content) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  content = buffer.str();
  return true;
}

int reportFailure(const std::string &what, pii::ErrorKind kind,
                  const std::string &message) {
  std::cerr << what << " failed [" << pii::errorKindName(kind)
            << "]: " << message << "\n";
  return 1;
}

int runText(int argc, char *argv[]) {
  pii::ScanConfig config;
  std::string text;
  std::string inputPath;
  std::string maskPath;
  bool haveText = false;
  bool anonymize = false;
  bool printText = false;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;

    if (arg == "--text") {
      if (!takeValue(argc, argv, i, text))
        return 1;
      haveText = true;
    } else if (arg == "--in") {
      if (!takeValue(argc, argv, i, inputPath))
        return 1;
    } else if (arg == "--lang") {
      if (!takeValue(argc, argv, i, config.language))
        return 1;
    } else if (arg == "--size" || arg == "--overlap") {
      int number = 0;
      if (!takeValue(argc, argv, i, value))
        return 1;
      if (!parseInt(value, number)) {
        std::cerr << "Error: " << arg << " expects an integer\n";
        return 1;
      }
      (arg == "--size" ? config.size : config.overlap) = number;
    } else if (arg == "--min-score") {
      if (!takeValue(argc, argv, i, value))
        return 1;
      if (!parseNumber(value, config.minScore)) {
        std::cerr << "Error: --min-score expects a number\n";
        return 1;
      }
    } else if (arg == "--anonymize") {
      anonymize = true;
    } else if (arg == "--mask-to-file") {
      if (!takeValue(argc, argv, i, maskPath))
        return 1;
    } else if (arg == "--print-text") {
      printText = true;
    } else if (arg == "--entities") {
      config.entities = takeList(argc, argv, i);
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return 1;
    }
  }

  if (haveText == !inputPath.empty()) {
    std::cerr << "Error: exactly one of --text or --in is required\n";
    return 1;
  }
  if (!inputPath.empty() && !readTextFile(inputPath, text)) {
    std::cerr << "Error: cannot read input file " << inputPath << "\n";
    return 1;
  }

  if (printText) {
    std::string preview = text.substr(0, 200);
    std::replace(preview.begin(), preview.end(), '\n', ' ');
    std::cerr << "# Input Chars: " << text.size() << " | Preview: " << preview
              << "...\n\n";
  }

  pii::PatternRecognizer recognizer;
  pii::ChunkScanner scanner(config);
  pii::ScanResult scan = scanner.scan(text, recognizer);
  if (!scan.success) {
    return reportFailure("Scan", scan.errorKind, scan.errorMessage);
  }

  std::cout << pii::DetectionFormatter::spansToJson(scan.spans, text).dump(2)
            << std::endl;

  if (anonymize) {
    std::cerr << "\n# Anonymized text (type-only):\n"
              << pii::CsvRedactor::redactCell(text, scan.spans, '*', true)
              << "\n";
  }

  if (!maskPath.empty()) {
    pii::RelationshipResolver resolver;
    pii::RenderResult masked = resolver.mask(text, scan.spans);
    if (!masked.success) {
      return reportFailure("Masking", masked.errorKind, masked.errorMessage);
    }

    std::ofstream out(maskPath, std::ios::binary);
    out << masked.text;
    out.close();
    if (!out) {
      std::cerr << "Error: cannot write " << maskPath << "\n";
      return 1;
    }
    std::cerr << "\n# Saved relationship-masked text -> "
              << fs::absolute(maskPath).string() << "\n";
  }

  if (config.verbose) {
    std::cerr << "DEBUG: " << scan.windowCount << " windows, "
              << scan.spans.size() << " spans in " << std::fixed
              << std::setprecision(2) << scan.processingTimeMs << " ms\n";
  }

  return 0;
}

struct PdfJob {
  std::string input;
  std::string output;
  bool ok = false;
  std::string message;
  int boxes = 0;
  int pages = 0;
};

int runPdf(int argc, char *argv[]) {
  pii::PdfAnalysisOptions analysisOptions;
  pii::PdfWriteOptions writeOptions;
  std::vector<std::string> inputs;
  std::string outputPath;
  std::string group;
  std::string palettePath;
  int jobs = 1;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;

    if (arg == "--in") {
      std::vector<std::string> files = takeList(argc, argv, i);
      inputs.insert(inputs.end(), files.begin(), files.end());
    } else if (arg == "--out") {
      if (!takeValue(argc, argv, i, outputPath))
        return 1;
    } else if (arg == "--lang") {
      if (!takeValue(argc, argv, i, analysisOptions.language))
        return 1;
    } else if (arg == "--coarse") {
      analysisOptions.mode = pii::MappingMode::Coarse;
    } else if (arg == "--no-labels") {
      writeOptions.drawLabels = false;
    } else if (arg == "--label-prefix") {
      if (!takeValue(argc, argv, i, writeOptions.labelPrefix))
        return 1;
    } else if (arg == "--attach-original") {
      writeOptions.attachOriginal = true;
    } else if (arg == "--min-score") {
      if (!takeValue(argc, argv, i, value))
        return 1;
      if (!parseNumber(value, analysisOptions.minScore)) {
        std::cerr << "Error: --min-score expects a number\n";
        return 1;
      }
    } else if (arg == "--entities") {
      analysisOptions.entities = takeList(argc, argv, i);
    } else if (arg == "--group") {
      if (!takeValue(argc, argv, i, group))
        return 1;
    } else if (arg == "--palette") {
      if (!takeValue(argc, argv, i, palettePath))
        return 1;
    } else if (arg == "--jobs") {
      if (!takeValue(argc, argv, i, value))
        return 1;
      if (!parseInt(value, jobs) || jobs < 1) {
        std::cerr << "Error: --jobs expects a positive integer\n";
        return 1;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      analysisOptions.verbose = true;
      writeOptions.verbose = true;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return 1;
    }
  }

  // The same file listed twice would race on one output
  inputs = pii::PdfRedactionWriter::uniqueSources(inputs);
  if (inputs.empty()) {
    std::cerr << "Error: No input PDF provided\n";
    return 1;
  }
  if (!outputPath.empty() && inputs.size() > 1) {
    std::cerr << "Error: --out can only be used with a single input\n";
    return 1;
  }

  if (!group.empty()) {
    std::vector<std::string> members = pii::EntityPalette::entitiesInGroup(group);
    if (members.empty()) {
      std::cerr << "Error: unknown entity group: " << group << "\n";
      return 1;
    }
    analysisOptions.entities.insert(analysisOptions.entities.end(),
                                    members.begin(), members.end());
  }

  if (!palettePath.empty()) {
    pii::PaletteLoadResult palette =
        pii::EntityPalette::loadOverrides(palettePath);
    if (!palette.success) {
      return reportFailure("Loading palette", palette.errorKind,
                           palette.errorMessage);
    }
    writeOptions.severityOverrides = palette.severityOverrides;
    writeOptions.colorOverrides = palette.colorOverrides;
  }

  std::vector<PdfJob> work(inputs.size());
  std::set<std::string> outputs;
  for (size_t i = 0; i < inputs.size(); ++i) {
    work[i].input = inputs[i];
    work[i].output = outputPath.empty()
                         ? pii::PdfRedactionWriter::defaultOutputPath(inputs[i])
                         : outputPath;
    if (!outputs.insert(work[i].output).second) {
      std::cerr << "Error: " << inputs[i] << " would overwrite the output of "
                << "another input: " << work[i].output << "\n";
      return 1;
    }
  }

  // One recognizer shared read-only by all workers
  const pii::PatternRecognizer recognizer;
  std::atomic<size_t> next(0);

  auto worker = [&]() {
    pii::PdfSpanMapper mapper(analysisOptions);
    pii::PdfRedactionWriter writer(writeOptions);

    for (size_t index = next++; index < work.size(); index = next++) {
      PdfJob &job = work[index];

      pii::PdfAnalysisResult analysis = mapper.analyze(job.input, recognizer);
      if (!analysis.success) {
        job.message = std::string("Analysis [") +
                      pii::errorKindName(analysis.errorKind) +
                      "]: " + analysis.errorMessage;
        continue;
      }

      pii::PdfWriteResult written =
          writer.write(job.input, job.output, analysis.pages);
      if (!written.success) {
        job.message = std::string("Writing [") +
                      pii::errorKindName(written.errorKind) +
                      "]: " + written.errorMessage;
        continue;
      }

      job.ok = true;
      job.boxes = analysis.boxCount;
      job.pages = analysis.pageCount;
    }
  };

  const int threadCount =
      std::min<int>(jobs, static_cast<int>(work.size()));
  if (threadCount <= 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
      threads.emplace_back(worker);
    }
    for (auto &thread : threads) {
      thread.join();
    }
  }

  int failures = 0;
  for (const auto &job : work) {
    if (job.ok) {
      std::cout << job.input << ": " << job.boxes << " PII spans across "
                << job.pages << " pages -> " << job.output << "\n";
    } else {
      std::cerr << job.input << ": " << job.message << "\n";
      failures++;
    }
  }

  return failures == 0 ? 0 : 1;
}

int runImage(int argc, char *argv[]) {
  pii::OCRConfig ocrConfig;
  pii::ImageRedactionOptions options;
  std::string inputPath;
  std::string outputPath;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;

    if (arg == "--in") {
      if (!takeValue(argc, argv, i, inputPath))
        return 1;
    } else if (arg == "--out") {
      if (!takeValue(argc, argv, i, outputPath))
        return 1;
    } else if (arg == "--mode") {
      if (!takeValue(argc, argv, i, value))
        return 1;
      std::optional<pii::RedactionMode> mode = pii::parseRedactionMode(value);
      if (!mode) {
        std::cerr << "Error: unknown mode: " << value << "\n";
        return 1;
      }
      options.style.mode = *mode;
    } else if (arg == "--fill" || arg == "--outline") {
      if (!takeValue(argc, argv, i, value))
        return 1;
      pii::RgbColor &color = arg == "--fill" ? options.style.fillColor
                                             : options.style.outlineColor;
      if (!parseHexColor(value, color)) {
        std::cerr << "Error: " << arg << " expects a colour like #RRGGBB\n";
        return 1;
      }
    } else if (arg == "--padding" || arg == "--blur" || arg == "--pixel") {
      int number = 0;
      if (!takeValue(argc, argv, i, value))
        return 1;
      if (!parseInt(value, number) || number < 0) {
        std::cerr << "Error: " << arg << " expects a non-negative integer\n";
        return 1;
      }
      if (arg == "--padding") {
        options.style.padding = number;
      } else if (arg == "--blur") {
        options.style.blurRadius = number;
      } else {
        options.style.pixelSize = number;
      }
    } else if (arg == "--labels") {
      options.drawLabels = true;
    } else if (arg == "--ocr-lang") {
      if (!takeValue(argc, argv, i, ocrConfig.language))
        return 1;
    } else if (arg == "--tessdata") {
      if (!takeValue(argc, argv, i, ocrConfig.tessDataPath))
        return 1;
    } else if (arg == "--min-score") {
      if (!takeValue(argc, argv, i, value))
        return 1;
      if (!parseNumber(value, options.minScore)) {
        std::cerr << "Error: --min-score expects a number\n";
        return 1;
      }
    } else if (arg == "--entities") {
      options.entities = takeList(argc, argv, i);
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return 1;
    }
  }

  if (inputPath.empty() || outputPath.empty()) {
    std::cerr << "Error: --in and --out are required\n";
    return 1;
  }

  pii::ImageRedactor redactor(ocrConfig, options);
  if (!redactor.initialize()) {
    std::cerr
        << "Failed to initialize OCR engine.\n"
        << "Make sure Tesseract is installed and tessdata is available.\n";
    return 1;
  }

  pii::PatternRecognizer recognizer;
  pii::ImageRedactionResult result =
      redactor.redactFile(inputPath, outputPath, recognizer);
  if (!result.success) {
    return reportFailure("Image redaction", result.errorKind,
                         result.errorMessage);
  }

  std::cout << pii::DetectionFormatter::imageBoxesToJson(result.boxes).dump(2)
            << std::endl;
  std::cerr << "# Redacted " << result.boxes.size() << " regions -> "
            << result.outputPath << " (" << std::fixed << std::setprecision(2)
            << result.processingTimeMs << " ms)\n";
  return 0;
}

int runCsv(int argc, char *argv[]) {
  pii::CsvOptions options;
  std::string inputPath;
  std::string outputPath;
  std::string jsonPath;
  bool summary = false;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;

    if (arg == "--in") {
      if (!takeValue(argc, argv, i, inputPath))
        return 1;
    } else if (arg == "--out") {
      if (!takeValue(argc, argv, i, outputPath))
        return 1;
    } else if (arg == "--lang") {
      if (!takeValue(argc, argv, i, options.language))
        return 1;
    } else if (arg == "--min-score") {
      if (!takeValue(argc, argv, i, value))
        return 1;
      if (!parseNumber(value, options.minScore)) {
        std::cerr << "Error: --min-score expects a number\n";
        return 1;
      }
    } else if (arg == "--delimiter" || arg == "--redaction-char") {
      if (!takeValue(argc, argv, i, value))
        return 1;
      if (value.size() != 1) {
        std::cerr << "Error: " << arg << " expects a single character\n";
        return 1;
      }
      (arg == "--delimiter" ? options.delimiter : options.redactionChar) =
          value[0];
    } else if (arg == "--no-skip-header") {
      options.skipHeader = false;
    } else if (arg == "--use-labels") {
      options.useEntityLabels = true;
    } else if (arg == "--json-output") {
      if (!takeValue(argc, argv, i, jsonPath))
        return 1;
    } else if (arg == "--summary") {
      summary = true;
    } else if (arg == "--entities") {
      options.entities = takeList(argc, argv, i);
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return 1;
    }
  }

  if (inputPath.empty()) {
    std::cerr << "Error: --in is required\n";
    return 1;
  }

  std::cerr << "# Analyzing CSV: " << inputPath << "\n";

  pii::PatternRecognizer recognizer;
  pii::CsvRedactor redactor(options);
  std::vector<pii::CellDetection> detections;

  if (!outputPath.empty()) {
    pii::CsvRedactionResult result =
        redactor.redactFile(inputPath, outputPath, recognizer);
    if (!result.success) {
      return reportFailure("CSV redaction", result.errorKind,
                           result.errorMessage);
    }
    std::cerr << "# Redacted " << result.redactedCellCount << " cells -> "
              << result.outputPath << "\n";
    detections = std::move(result.detections);
  } else {
    pii::CsvAnalysisResult result = redactor.analyzeFile(inputPath, recognizer);
    if (!result.success) {
      return reportFailure("CSV analysis", result.errorKind,
                           result.errorMessage);
    }
    detections = std::move(result.detections);
  }

  const nlohmann::json json =
      pii::DetectionFormatter::cellDetectionsToJson(detections);

  if (!jsonPath.empty()) {
    std::ofstream out(jsonPath);
    out << json.dump(2) << "\n";
    out.close();
    if (!out) {
      std::cerr << "Error: cannot write " << jsonPath << "\n";
      return 1;
    }
    std::cerr << "# Saved detections -> " << jsonPath << "\n";
  } else if (outputPath.empty()) {
    std::cout << json.dump(2) << std::endl;
  }

  if (summary) {
    std::cout << pii::DetectionFormatter::summarizeDetections(detections).dump(2)
              << std::endl;
  }

  return 0;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string command = argv[1];

  if (command == "-h" || command == "--help") {
    printUsage(argv[0]);
    return 0;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    }
  }

  if (command == "text") {
    return runText(argc, argv);
  } else if (command == "pdf") {
    return runPdf(argc, argv);
  } else if (command == "image") {
    return runImage(argc, argv);
  } else if (command == "csv") {
    return runCsv(argc, argv);
  }

  std::cerr << "Unknown command: " << command << "\n";
  printUsage(argv[0]);
  return 1;
}
