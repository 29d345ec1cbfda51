#include "docparse/PostProcessor.hpp"

#include "docparse/Geometry.hpp"
#include "docparse/Log.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace docparse {

namespace {

bool isMergeableType(BlockType type) {
  switch (type) {
  case BlockType::Table:
  case BlockType::Figure:
    return false;
  case BlockType::Text:
  case BlockType::Title:
  case BlockType::List:
  case BlockType::InferredFromGap:
  case BlockType::Ambiguous:
    return true;
  }
  return false;
}

std::optional<double> mergedConfidence(const std::optional<double> &a,
                                       const std::optional<double> &b) {
  if (a && b) {
    return std::min(*a, *b);
  }
  return a ? a : b;
}

} // anonymous namespace

PostProcessor::PostProcessor(PageLayout layout,
                             const PostProcessingConfig &config)
    : m_layout(std::move(layout)), m_config(config) {}

void PostProcessor::postprocess() {
  mergeAdjacent();
  dropDegenerate();
  sortByReadingOrder(m_layout.regions, m_config.rowTolerance);

  if (m_layout.regions.empty()) {
    log(LogLevel::Info, "postprocess p" + std::to_string(m_layout.pageNumber),
        "", "No extractable content after post-processing.");
  }
}

const std::vector<Region> &PostProcessor::ocrBlocks() const {
  return m_layout.regions;
}

bool PostProcessor::hasContent() const { return !m_layout.regions.empty(); }

int PostProcessor::mergedCount() const { return m_merged; }

int PostProcessor::droppedCount() const { return m_dropped; }

bool PostProcessor::canMerge(const Region &a, const Region &b) const {
  if (a.type != b.type || !isMergeableType(a.type)) {
    return false;
  }

  double overlapX = std::min(a.box.x + a.box.width, b.box.x + b.box.width) -
                    std::max(a.box.x, b.box.x);
  double overlapY = std::min(a.box.y + a.box.height, b.box.y + b.box.height) -
                    std::max(a.box.y, b.box.y);

  // A negative overlap along an axis is the gap between the regions
  bool stacked = overlapX >= m_config.alignmentRatio *
                                 std::min(a.box.width, b.box.width) &&
                 -overlapY <= m_config.mergeGapTolerance;
  bool sideBySide = overlapY >= m_config.alignmentRatio *
                                    std::min(a.box.height, b.box.height) &&
                    -overlapX <= m_config.mergeGapTolerance;

  return stacked || sideBySide;
}

void PostProcessor::mergeAdjacent() {
  std::vector<Region> &regions = m_layout.regions;

  bool changed = true;
  while (changed) {
    changed = false;

    for (std::size_t i = 0; i < regions.size() && !changed; ++i) {
      for (std::size_t j = i + 1; j < regions.size() && !changed; ++j) {
        if (!canMerge(regions[i], regions[j])) {
          continue;
        }

        // The union must not swallow any other region
        Box merged = unionBox(regions[i].box, regions[j].box);
        bool blocked = false;
        for (std::size_t k = 0; k < regions.size(); ++k) {
          if (k != i && k != j && overlaps(merged, regions[k].box)) {
            blocked = true;
            break;
          }
        }
        if (blocked) {
          continue;
        }

        regions[i].box = merged;
        regions[i].sourceConfidence = mergedConfidence(
            regions[i].sourceConfidence, regions[j].sourceConfidence);
        regions.erase(regions.begin() + static_cast<std::ptrdiff_t>(j));
        m_merged++;
        changed = true;
      }
    }
  }
}

void PostProcessor::dropDegenerate() {
  std::vector<Region> &regions = m_layout.regions;
  auto isNoise = [this](const Region &region) {
    return !isValidBox(region.box) || region.box.width < m_config.minWidth ||
           region.box.height < m_config.minHeight ||
           boxArea(region.box) < m_config.minArea;
  };

  auto firstDropped = std::remove_if(regions.begin(), regions.end(), isNoise);
  m_dropped += static_cast<int>(std::distance(firstDropped, regions.end()));
  regions.erase(firstDropped, regions.end());
}

} // namespace docparse
