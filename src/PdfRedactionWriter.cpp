#include "PdfRedactionWriter.hpp"
#include "ContentStreamBuilder.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <set>
#include <stdexcept>
#include <system_error>
#include <vector>

// Poppler low-level API for editing page objects
#include <Array.h>
#include <Dict.h>
#include <GlobalParams.h>
#include <Object.h>
#include <PDFDoc.h>
#include <Page.h>
#include <Stream.h>
#include <XRef.h>
#include <goo/GooString.h>
#include <goo/gmem.h>

namespace fs = std::filesystem;

namespace pii {

namespace {

const char *const LABEL_FONT_RESOURCE = "PIIHelv";

// Adds an indirect stream object holding `data`. Extra entries of the stream
// dictionary may be passed in `dict`.
Ref addStream(XRef *xref, const std::string &data, Object dict) {
  if (!dict.isDict()) {
    dict = Object(new Dict(xref));
  }
  dict.dictSet("Length", Object(static_cast<int>(data.size())));

  const size_t size = data.empty() ? 1 : data.size();
  char *buffer = static_cast<char *>(gmalloc(size));
  std::memcpy(buffer, data.data(), data.size());

  Stream *stream =
      new AutoFreeMemStream(buffer, 0, data.size(), std::move(dict));
  Object streamObj(stream);
  return xref->addIndirectObject(streamObj);
}

Ref addStream(XRef *xref, const std::string &data) {
  return addStream(xref, data, Object(new Dict(xref)));
}

// A dictionary-valued entry of `parent`, either indirect or direct. When the
// entry is missing a new direct dictionary is created but not yet stored.
struct DictEntry {
  Object obj;
  Ref ref = Ref::INVALID();
  bool existed = false;

  bool isIndirect() const { return ref != Ref::INVALID(); }
};

DictEntry lookupDictEntry(XRef *xref, Dict *parent, const char *key) {
  DictEntry entry;
  const Object &value = parent->lookupNF(key);
  if (value.isRef()) {
    entry.ref = value.getRef();
    entry.obj = xref->fetch(entry.ref);
  } else if (value.isDict()) {
    entry.obj = value.copy();
  }

  if (entry.obj.isDict()) {
    entry.existed = true;
  } else {
    entry.obj = Object(new Dict(xref));
    entry.ref = Ref::INVALID();
  }
  return entry;
}

// Persist an entry after its dictionary has been edited
void storeDictEntry(XRef *xref, Dict *parent, const char *key,
                    DictEntry &entry) {
  if (entry.isIndirect()) {
    xref->setModifiedObject(&entry.obj, entry.ref);
  } else {
    parent->set(key, entry.obj.copy());
  }
}

// Register a Helvetica font under `fontName` in the page resources, unless
// the name is already taken.
void ensureLabelFont(XRef *xref, Page *page, Dict *pageDict,
                     const std::string &fontName) {
  DictEntry resources = lookupDictEntry(xref, pageDict, "Resources");
  if (!resources.existed) {
    // Resources inherited from the page tree are copied onto the page so the
    // font does not leak into sibling pages.
    Dict *inherited = page->getResourceDict();
    if (inherited) {
      resources.obj = Object(inherited->copy(xref));
    }
  }

  Dict *resourceDict = resources.obj.getDict();
  DictEntry fonts = lookupDictEntry(xref, resourceDict, "Font");
  if (fonts.obj.getDict()->hasKey(fontName.c_str())) {
    return;
  }

  Object font(new Dict(xref));
  font.dictSet("Type", Object(objName, "Font"));
  font.dictSet("Subtype", Object(objName, "Type1"));
  font.dictSet("BaseFont", Object(objName, "Helvetica"));
  font.dictSet("Encoding", Object(objName, "WinAnsiEncoding"));
  const Ref fontRef = xref->addIndirectObject(font);

  fonts.obj.getDict()->add(fontName.c_str(), Object(fontRef));
  storeDictEntry(xref, resourceDict, "Font", fonts);
  storeDictEntry(xref, pageDict, "Resources", resources);
}

// Replace /Contents with [q-stream, <original streams>, Q+overlay-stream]
void wrapPageContents(XRef *xref, Dict *pageDict, const std::string &overlay) {
  Array *contents = new Array(xref);
  contents->add(Object(addStream(xref, "q\n")));

  const Object &existing = pageDict->lookupNF("Contents");
  if (existing.isRef()) {
    Object resolved = xref->fetch(existing.getRef());
    if (resolved.isArray()) {
      for (int i = 0; i < resolved.arrayGetLength(); i++) {
        contents->add(resolved.arrayGetNF(i).copy());
      }
    } else if (resolved.isStream()) {
      contents->add(existing.copy());
    }
  } else if (existing.isArray()) {
    for (int i = 0; i < existing.arrayGetLength(); i++) {
      contents->add(existing.arrayGetNF(i).copy());
    }
  } else if (!existing.isNull()) {
    throw std::runtime_error("Unsupported /Contents entry on page");
  }

  contents->add(Object(addStream(xref, "Q\n" + overlay)));
  pageDict->set("Contents", Object(contents));
}

std::string readFileBytes(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Cannot read " + path);
  }
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

// Copy of a name tree /Names array with (key, value) inserted in key order
Array *namesWith(XRef *xref, const Array *names, const std::string &key,
                 const Object &value) {
  Array *result = new Array(xref);
  bool inserted = false;
  for (int i = 0; i + 1 < names->getLength(); i += 2) {
    const Object &existing = names->getNF(i);
    if (!inserted && existing.isString() &&
        key < existing.getString()->c_str()) {
      result->add(Object(new GooString(key)));
      result->add(value.copy());
      inserted = true;
    }
    result->add(existing.copy());
    result->add(names->getNF(i + 1).copy());
  }
  if (!inserted) {
    result->add(Object(new GooString(key)));
    result->add(value.copy());
  }
  return result;
}

// Widen the /Limits of an intermediate or leaf node to cover `key`
void widenLimits(XRef *xref, Dict *node, const std::string &key) {
  Object limits = node->lookup("Limits");
  if (!limits.isArray() || limits.arrayGetLength() != 2) {
    return;
  }
  Object low = limits.arrayGet(0);
  Object high = limits.arrayGet(1);
  std::string lowKey = low.isString() ? low.getString()->c_str() : key;
  std::string highKey = high.isString() ? high.getString()->c_str() : key;
  lowKey = std::min(lowKey, key);
  highKey = std::max(highKey, key);

  Array *widened = new Array(xref);
  widened->add(Object(new GooString(lowKey)));
  widened->add(Object(new GooString(highKey)));
  node->set("Limits", Object(widened));
}

// Lower bound of a kid's /Limits, or nothing when the kid has none
bool lowerLimit(const Object &kid, std::string &out) {
  if (!kid.isDict()) {
    return false;
  }
  Object limits = kid.dictLookup("Limits");
  if (!limits.isArray() || limits.arrayGetLength() < 1) {
    return false;
  }
  Object low = limits.arrayGet(0);
  if (!low.isString()) {
    return false;
  }
  out = low.getString()->c_str();
  return true;
}

// Insert (key, value) into the name tree rooted at `node`. Leaves and kids
// held as indirect objects are edited in place and written back through the
// XRef; direct ones are replaced in their parent.
void insertIntoNameTree(XRef *xref, Dict *node, const std::string &key,
                        const Object &value, int depth) {
  if (depth > 32) {
    throw std::runtime_error("EmbeddedFiles name tree is too deep");
  }
  const bool isRoot = depth == 0;

  const Object &namesEntry = node->lookupNF("Names");
  if (namesEntry.isRef()) {
    const Ref namesRef = namesEntry.getRef();
    Object names = xref->fetch(namesRef);
    if (!names.isArray()) {
      throw std::runtime_error("EmbeddedFiles /Names is not an array");
    }
    Object updated(namesWith(xref, names.getArray(), key, value));
    xref->setModifiedObject(&updated, namesRef);
    if (!isRoot) {
      widenLimits(xref, node, key);
    }
    return;
  }
  if (namesEntry.isArray()) {
    node->set("Names",
              Object(namesWith(xref, namesEntry.getArray(), key, value)));
    if (!isRoot) {
      widenLimits(xref, node, key);
    }
    return;
  }

  if (!node->hasKey("Kids")) {
    Array *leaf = new Array(xref);
    leaf->add(Object(new GooString(key)));
    leaf->add(value.copy());
    node->set("Names", Object(leaf));
    return;
  }

  const Object kidsEntry = node->lookupNF("Kids").copy();
  Object kids = node->lookup("Kids");
  if (!kids.isArray() || kids.arrayGetLength() == 0) {
    throw std::runtime_error("EmbeddedFiles /Kids is not a non-empty array");
  }

  // Descend into the last kid whose range starts at or before the key
  int target = 0;
  for (int i = 0; i < kids.arrayGetLength(); i++) {
    Object kid = kids.arrayGet(i);
    std::string low;
    if (lowerLimit(kid, low) && low <= key) {
      target = i;
    }
  }

  const Object &kidEntry = kids.arrayGetNF(target);
  if (kidEntry.isRef()) {
    const Ref kidRef = kidEntry.getRef();
    Object kid = xref->fetch(kidRef);
    if (!kid.isDict()) {
      throw std::runtime_error("EmbeddedFiles kid is not a dictionary");
    }
    insertIntoNameTree(xref, kid.getDict(), key, value, depth + 1);
    xref->setModifiedObject(&kid, kidRef);
  } else if (kidEntry.isDict()) {
    Object kid = kidEntry.copy();
    insertIntoNameTree(xref, kid.getDict(), key, value, depth + 1);

    Array *newKids = new Array(xref);
    for (int i = 0; i < kids.arrayGetLength(); i++) {
      newKids->add(i == target ? kid.copy() : kids.arrayGetNF(i).copy());
    }
    Object newKidsObj(newKids);
    if (kidsEntry.isRef()) {
      xref->setModifiedObject(&newKidsObj, kidsEntry.getRef());
    } else {
      node->set("Kids", std::move(newKidsObj));
    }
  } else {
    throw std::runtime_error("EmbeddedFiles kid is not a dictionary");
  }

  if (!isRoot) {
    widenLimits(xref, node, key);
  }
}

// Embed the source PDF in the document's EmbeddedFiles name tree, keyed by
// the source file name.
void attachOriginalFile(PDFDoc *doc, const std::string &sourcePath,
                        bool verbose) {
  XRef *xref = doc->getXRef();
  const std::string bytes = readFileBytes(sourcePath);
  const std::string attachmentName = fs::path(sourcePath).filename().string();

  Object params(new Dict(xref));
  params.dictSet("Size", Object(static_cast<int>(bytes.size())));
  Object fileDict(new Dict(xref));
  fileDict.dictSet("Type", Object(objName, "EmbeddedFile"));
  fileDict.dictSet("Subtype", Object(objName, "application/pdf"));
  fileDict.dictSet("Params", std::move(params));
  const Ref fileRef = addStream(xref, bytes, std::move(fileDict));

  Object embedded(new Dict(xref));
  embedded.dictSet("F", Object(fileRef));
  Object fileSpec(new Dict(xref));
  fileSpec.dictSet("Type", Object(objName, "Filespec"));
  fileSpec.dictSet("F", Object(new GooString(attachmentName)));
  fileSpec.dictSet("UF", Object(new GooString(attachmentName)));
  fileSpec.dictSet("Desc", Object(new GooString("Original unredacted PDF")));
  fileSpec.dictSet("EF", std::move(embedded));
  const Ref specRef = xref->addIndirectObject(fileSpec);

  Ref catalogRef;
  catalogRef.num = xref->getRootNum();
  catalogRef.gen = xref->getRootGen();
  Object catalog = xref->fetch(catalogRef);
  if (!catalog.isDict()) {
    throw std::runtime_error("Document catalog is not a dictionary");
  }

  Dict *catalogDict = catalog.getDict();
  DictEntry names = lookupDictEntry(xref, catalogDict, "Names");
  DictEntry files = lookupDictEntry(xref, names.obj.getDict(), "EmbeddedFiles");
  insertIntoNameTree(xref, files.obj.getDict(), attachmentName, Object(specRef),
                     0);

  storeDictEntry(xref, names.obj.getDict(), "EmbeddedFiles", files);
  storeDictEntry(xref, catalogDict, "Names", names);
  xref->setModifiedObject(&catalog, catalogRef);

  if (verbose) {
    std::cerr << "DEBUG: Attached original as " << attachmentName << " ("
              << bytes.size() << " bytes)" << std::endl;
  }
}

bool samePath(const std::string &a, const std::string &b) {
  std::error_code ec;
  if (fs::exists(b, ec) && fs::equivalent(a, b, ec)) {
    return true;
  }
  const fs::path canonicalA = fs::weakly_canonical(a, ec);
  if (ec) {
    return false;
  }
  const fs::path canonicalB = fs::weakly_canonical(b, ec);
  return !ec && canonicalA == canonicalB;
}

} // anonymous namespace

PdfRedactionWriter::PdfRedactionWriter() : m_options() {}

std::string PdfRedactionWriter::defaultOutputPath(const std::string &sourcePath) {
  const fs::path source(sourcePath);
  return (source.parent_path() / (source.stem().string() + "_redacted.pdf"))
      .string();
}

std::vector<std::string>
PdfRedactionWriter::uniqueSources(const std::vector<std::string> &paths) {
  std::vector<std::string> unique;
  std::set<fs::path> seen;
  for (const auto &path : paths) {
    std::error_code ec;
    fs::path key = fs::weakly_canonical(path, ec);
    if (ec) {
      key = fs::absolute(path, ec).lexically_normal();
    }
    if (seen.insert(key).second) {
      unique.push_back(path);
    }
  }
  return unique;
}

PdfRedactionWriter::PdfRedactionWriter(const PdfWriteOptions &options)
    : m_options(options) {}

PdfWriteResult
PdfRedactionWriter::write(const std::string &sourcePath,
                          const std::string &destPath,
                          const std::vector<PageBoxes> &perPageBoxes) const {
  PdfWriteResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  if (samePath(sourcePath, destPath)) {
    result.errorKind = ErrorKind::InvalidArgument;
    result.errorMessage = "Destination must differ from source: " + destPath;
    return result;
  }

  GlobalParamsIniter globalParamsInit(nullptr);

  auto fileName = std::make_unique<GooString>(sourcePath);
  std::unique_ptr<PDFDoc> doc(new PDFDoc(std::move(fileName)));

  if (!doc->isOk()) {
    result.errorKind = ErrorKind::IOFailure;
    result.errorMessage = "Failed to load PDF file: " + sourcePath;
    return result;
  }

  const int numPages = doc->getNumPages();
  if (static_cast<int>(perPageBoxes.size()) > numPages) {
    result.errorKind = ErrorKind::InvalidArgument;
    result.errorMessage = "Boxes given for " +
                          std::to_string(perPageBoxes.size()) +
                          " pages, document has " + std::to_string(numPages);
    return result;
  }

  XRef *xref = doc->getXRef();
  EntityPalette palette(m_options.severityOverrides, m_options.colorOverrides);
  ContentStreamBuilder builder(palette);

  LabelOptions labels;
  labels.drawLabels = m_options.drawLabels;
  labels.labelPrefix = m_options.labelPrefix;
  labels.fontResource = LABEL_FONT_RESOURCE;

  for (size_t pageIndex = 0; pageIndex < perPageBoxes.size(); pageIndex++) {
    const PageBoxes &boxes = perPageBoxes[pageIndex];
    if (boxes.empty()) {
      continue;
    }

    try {
      Page *page = doc->getPage(static_cast<int>(pageIndex) + 1);
      if (!page) {
        throw std::runtime_error("page could not be loaded");
      }

      const Ref pageRef = page->getRef();
      Object pageObj = xref->fetch(pageRef);
      if (!pageObj.isDict()) {
        throw std::runtime_error("page object is not a dictionary");
      }
      Dict *pageDict = pageObj.getDict();

      const std::string overlay = builder.buildPageOverlay(boxes, labels);
      if (m_options.drawLabels) {
        ensureLabelFont(xref, page, pageDict, labels.fontResource);
      }
      wrapPageContents(xref, pageDict, overlay);
      xref->setModifiedObject(&pageObj, pageRef);

      result.pagesRedacted++;
      result.boxesDrawn += static_cast<int>(boxes.size());

      if (m_options.verbose) {
        std::cerr << "DEBUG: Page " << (pageIndex + 1) << ": drew "
                  << boxes.size() << " boxes (" << overlay.size()
                  << " bytes of operators)" << std::endl;
      }
    } catch (const std::exception &e) {
      result.errorKind = ErrorKind::RedactionFailure;
      result.failedPage = static_cast<int>(pageIndex);
      result.errorMessage = "Failed to redact page " +
                            std::to_string(pageIndex + 1) + ": " + e.what();
      return result;
    }
  }

  if (m_options.attachOriginal) {
    try {
      attachOriginalFile(doc.get(), sourcePath, m_options.verbose);
    } catch (const std::exception &e) {
      result.errorKind = ErrorKind::IOFailure;
      result.errorMessage =
          std::string("Failed to attach original PDF: ") + e.what();
      return result;
    }
  }

  // Save next to the destination, then move into place
  const std::string tempPath = destPath + ".tmp";
  const int saveCode = doc->saveAs(GooString(tempPath), writeForceRewrite);
  if (saveCode != errNone) {
    std::error_code ec;
    fs::remove(tempPath, ec);
    result.errorKind = ErrorKind::RedactionFailure;
    result.errorMessage = "Failed to save PDF (error code " +
                          std::to_string(saveCode) + "): " + destPath;
    return result;
  }

  std::error_code renameError;
  fs::rename(tempPath, destPath, renameError);
  if (renameError) {
    std::error_code ec;
    fs::remove(tempPath, ec);
    result.errorKind = ErrorKind::IOFailure;
    result.errorMessage =
        "Failed to move output into place: " + renameError.message();
    return result;
  }

  result.success = true;
  result.outputPath = destPath;

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  if (m_options.verbose) {
    std::cerr << "DEBUG: Wrote " << destPath << " (" << result.pagesRedacted
              << " pages, " << result.boxesDrawn << " boxes)" << std::endl;
  }

  return result;
}

const PdfWriteOptions &PdfRedactionWriter::getOptions() const {
  return m_options;
}

void PdfRedactionWriter::setOptions(const PdfWriteOptions &options) {
  m_options = options;
}

} // namespace pii
