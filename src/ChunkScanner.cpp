#include "ChunkScanner.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <stdexcept>
#include <tuple>

namespace pii {

namespace {

bool isContinuationByte(const std::string &text, int offset) {
  return (static_cast<unsigned char>(text[offset]) & 0xC0) == 0x80;
}

// Move an offset back to the first byte of the UTF-8 sequence it falls in.
int snapToCodePoint(const std::string &text, int offset) {
  const int len = static_cast<int>(text.size());
  while (offset > 0 && offset < len && isContinuationByte(text, offset)) {
    offset--;
  }
  return offset;
}

// Move an offset forward past any continuation bytes.
int advanceToCodePoint(const std::string &text, int offset) {
  const int len = static_cast<int>(text.size());
  while (offset < len && isContinuationByte(text, offset)) {
    offset++;
  }
  return offset;
}

} // anonymous namespace

ChunkScanner::ChunkScanner() : m_config() {}

ChunkScanner::ChunkScanner(const ScanConfig &config) : m_config(config) {}

std::vector<ChunkWindow> ChunkScanner::computeWindows(const std::string &text,
                                                      int size, int overlap) {
  if (size <= 0) {
    throw std::invalid_argument("Chunk size must be > 0");
  }
  if (overlap < 0) {
    throw std::invalid_argument("Chunk overlap must be >= 0");
  }

  std::vector<ChunkWindow> windows;
  const long long len = static_cast<long long>(text.size());

  // The cursor advances by the un-overlapped size; only the window start is
  // backed up by the overlap.
  for (long long cursor = 0; cursor < len; cursor += size) {
    long long start = (cursor == 0) ? 0 : std::max(0LL, cursor - overlap);
    long long end = std::min(len, cursor + size);

    ChunkWindow window;
    window.start = snapToCodePoint(text, static_cast<int>(start));
    window.end = snapToCodePoint(text, static_cast<int>(end));
    if (window.end <= window.start) {
      // A single multi-byte sequence is wider than the window.
      window.end = advanceToCodePoint(text, window.start + 1);
    }
    windows.push_back(window);
  }

  return windows;
}

std::vector<MergedSpan>
ChunkScanner::mergeSpans(const std::vector<DetectionSpan> &spans) {
  std::map<std::tuple<int, int, std::string>, MergedSpan> byKey;

  for (const auto &span : spans) {
    auto key = std::make_tuple(span.start, span.end, span.entityType);
    auto it = byKey.find(key);
    if (it == byKey.end()) {
      byKey.emplace(std::move(key), span);
    } else if (span.score > it->second.score) {
      it->second = span;
    }
  }

  // std::map iteration order is already (start, end, entityType).
  std::vector<MergedSpan> merged;
  merged.reserve(byKey.size());
  for (auto &entry : byKey) {
    merged.push_back(std::move(entry.second));
  }
  return merged;
}

ScanResult ChunkScanner::scan(const std::string &text,
                              const DetectionProvider &provider) const {
  ScanResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  std::vector<ChunkWindow> windows;
  try {
    windows = computeWindows(text, m_config.size, m_config.overlap);
  } catch (const std::invalid_argument &e) {
    result.errorKind = ErrorKind::InvalidArgument;
    result.errorMessage = e.what();
    return result;
  }

  if (m_config.verbose) {
    std::cerr << "DEBUG: Scanning " << text.size() << " bytes in "
              << windows.size() << " windows (size=" << m_config.size
              << ", overlap=" << m_config.overlap << ")" << std::endl;
  }

  std::vector<DetectionSpan> candidates;

  for (size_t windowIndex = 0; windowIndex < windows.size(); windowIndex++) {
    const ChunkWindow &window = windows[windowIndex];
    const std::string chunk =
        text.substr(window.start, window.end - window.start);
    const int chunkLength = static_cast<int>(chunk.size());

    std::vector<DetectionSpan> local;
    try {
      local = provider.analyze(chunk, m_config.language, m_config.entities);
    } catch (const std::exception &e) {
      result.errorKind = ErrorKind::DetectionFailure;
      result.errorMessage = "Detection failed in window " +
                            std::to_string(windowIndex) + " at offset " +
                            std::to_string(window.start) + ": " + e.what();
      return result;
    }
    result.windowCount++;

    for (const auto &span : local) {
      if (span.score < m_config.minScore) {
        continue;
      }

      if (span.start < 0 || span.end > chunkLength || span.end <= span.start) {
        if (m_config.verbose) {
          std::cerr << "DEBUG: Ignoring out-of-window span [" << span.start
                    << ", " << span.end << ") " << span.entityType
                    << " in window " << windowIndex << std::endl;
        }
        continue;
      }

      DetectionSpan global = span;
      global.start = window.start + span.start;
      global.end = window.start + span.end;
      candidates.push_back(std::move(global));
    }
  }

  result.spans = mergeSpans(candidates);
  result.success = true;

  if (m_config.verbose) {
    std::cerr << "DEBUG: Merged " << candidates.size() << " candidates into "
              << result.spans.size() << " spans" << std::endl;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

const ScanConfig &ChunkScanner::getConfig() const { return m_config; }

void ChunkScanner::setConfig(const ScanConfig &config) { m_config = config; }

} // namespace pii
