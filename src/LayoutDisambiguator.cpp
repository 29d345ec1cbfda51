#include "docparse/LayoutDisambiguator.hpp"

#include "docparse/Geometry.hpp"
#include "docparse/Log.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

namespace docparse {

namespace {

struct Candidate {
  Detection detection;
  Box box; ///< Clamped to the page
  double area;
  std::size_t index; ///< Position in the model output
};

std::vector<double> uniqueSorted(std::vector<double> values) {
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
  return values;
}

bool coversPoint(const std::vector<Box> &boxes, double x, double y) {
  for (const auto &box : boxes) {
    if (x > box.x && x < box.x + box.width && y > box.y &&
        y < box.y + box.height) {
      return true;
    }
  }
  return false;
}

} // anonymous namespace

LayoutDisambiguator::LayoutDisambiguator(const DisambiguationConfig &config)
    : m_config(config) {}

const DisambiguationConfig &LayoutDisambiguator::getConfig() const {
  return m_config;
}

DisambiguationResult
LayoutDisambiguator::disambiguate(const std::vector<Detection> &detections,
                                  int pageNumber, double pageWidth,
                                  double pageHeight,
                                  const TextPresenceOracle *oracle) const {
  DisambiguationResult result;
  result.layout.pageNumber = pageNumber;
  result.layout.width = pageWidth;
  result.layout.height = pageHeight;

  const bool hasPage = pageWidth > 0.0 && pageHeight > 0.0;
  const std::string stage = "layout p" + std::to_string(pageNumber);

  // Confidence filter and geometry validation
  std::vector<Candidate> candidates;
  candidates.reserve(detections.size());
  for (std::size_t i = 0; i < detections.size(); ++i) {
    const Detection &detection = detections[i];

    if (!std::isfinite(detection.confidence) ||
        detection.confidence < m_config.detectionThreshold) {
      result.lowConfidenceCount++;
      continue;
    }

    Box box = detection.box;
    if (isValidBox(box) && hasPage) {
      box = clampToPage(box, pageWidth, pageHeight);
    }
    if (!isValidBox(box)) {
      result.invalidCount++;
      continue;
    }

    candidates.push_back({detection, box, boxArea(box), i});
  }

  // Priority: confidence, then area, then model output order
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate &a, const Candidate &b) {
                     if (a.detection.confidence != b.detection.confidence) {
                       return a.detection.confidence > b.detection.confidence;
                     }
                     if (a.area != b.area) {
                       return a.area > b.area;
                     }
                     return a.index < b.index;
                   });

  std::vector<Candidate> accepted;
  for (const auto &candidate : candidates) {
    bool duplicate = false;
    for (const auto &existing : accepted) {
      if (intersectionOverUnion(candidate.box, existing.box) >=
          m_config.overlapThreshold) {
        duplicate = true;
        break;
      }
    }

    if (duplicate) {
      result.overlapCount++;
    } else {
      accepted.push_back(candidate);
    }
  }

  if (accepted.empty()) {
    log(LogLevel::Info, stage, "",
        "No layout found: " + std::to_string(detections.size()) +
            " detections, none accepted.");
    return result;
  }
  result.layoutFound = true;

  std::vector<Region> regions;
  regions.reserve(accepted.size());
  for (const auto &candidate : accepted) {
    Region region;
    region.box = candidate.box;
    region.sourceConfidence = candidate.detection.confidence;

    if (candidate.detection.confidence <
        m_config.detectionThreshold + m_config.ambiguityMargin) {
      region.type = BlockType::Ambiguous;
      result.ambiguousCount++;
    } else {
      region.type = toBlockType(candidate.detection.label);
    }

    if (m_config.trimOverlaps) {
      for (const auto &stronger : regions) {
        if (overlaps(region.box, stronger.box)) {
          region.box = trimAgainst(region.box, stronger.box);
          if (!isValidBox(region.box)) {
            break;
          }
        }
      }
      if (!isValidBox(region.box)) {
        result.trimmedAwayCount++;
        continue;
      }
    }

    regions.push_back(region);
  }

  if (m_config.inferGaps && hasPage) {
    std::vector<Box> covered;
    covered.reserve(regions.size());
    for (const auto &region : regions) {
      covered.push_back(region.box);
    }

    for (const auto &gap :
         uncoveredRectangles(covered, pageWidth, pageHeight)) {
      if (boxArea(gap) <= m_config.minGapArea ||
          gap.width < m_config.minGapWidth ||
          gap.height < m_config.minGapHeight) {
        continue;
      }
      if (oracle != nullptr && !oracle->hasText(gap)) {
        continue;
      }

      Region region;
      region.box = gap;
      region.type = BlockType::InferredFromGap;
      regions.push_back(region);
      result.inferredCount++;
    }
  }

  sortByReadingOrder(regions, m_config.rowTolerance);
  result.layout.regions = std::move(regions);

  log(LogLevel::Debug, stage, "",
      std::to_string(result.layout.regions.size()) + " regions (" +
          std::to_string(result.lowConfidenceCount) + " low confidence, " +
          std::to_string(result.overlapCount) + " overlapping, " +
          std::to_string(result.ambiguousCount) + " ambiguous, " +
          std::to_string(result.inferredCount) + " inferred).");

  return result;
}

std::vector<Box>
LayoutDisambiguator::uncoveredRectangles(const std::vector<Box> &covered,
                                         double pageWidth, double pageHeight) {
  std::vector<Box> gaps;
  if (pageWidth <= 0.0 || pageHeight <= 0.0) {
    return gaps;
  }

  std::vector<double> xs = {0.0, pageWidth};
  std::vector<double> ys = {0.0, pageHeight};
  for (const auto &box : covered) {
    xs.push_back(std::clamp(box.x, 0.0, pageWidth));
    xs.push_back(std::clamp(box.x + box.width, 0.0, pageWidth));
    ys.push_back(std::clamp(box.y, 0.0, pageHeight));
    ys.push_back(std::clamp(box.y + box.height, 0.0, pageHeight));
  }
  xs = uniqueSorted(xs);
  ys = uniqueSorted(ys);

  // Rectangles still growing downwards, keyed by their x extent
  struct OpenGap {
    double x1;
    double x2;
    double y1;
    double y2;
  };
  std::vector<OpenGap> open;

  for (std::size_t row = 0; row + 1 < ys.size(); ++row) {
    double top = ys[row];
    double bottom = ys[row + 1];
    double centerY = (top + bottom) / 2.0;

    // Horizontal runs of uncovered cells in this band
    std::vector<std::pair<double, double>> runs;
    for (std::size_t col = 0; col + 1 < xs.size(); ++col) {
      double centerX = (xs[col] + xs[col + 1]) / 2.0;
      if (coversPoint(covered, centerX, centerY)) {
        continue;
      }
      if (!runs.empty() && runs.back().second == xs[col]) {
        runs.back().second = xs[col + 1];
      } else {
        runs.emplace_back(xs[col], xs[col + 1]);
      }
    }

    std::vector<OpenGap> stillOpen;
    for (const auto &run : runs) {
      auto match = std::find_if(open.begin(), open.end(),
                                [&run, top](const OpenGap &gap) {
                                  return gap.x1 == run.first &&
                                         gap.x2 == run.second &&
                                         gap.y2 == top;
                                });
      if (match != open.end()) {
        OpenGap extended = *match;
        extended.y2 = bottom;
        stillOpen.push_back(extended);
        open.erase(match);
      } else {
        stillOpen.push_back({run.first, run.second, top, bottom});
      }
    }

    // Whatever did not continue into this band is finished
    for (const auto &gap : open) {
      gaps.emplace_back(gap.x1, gap.y1, gap.x2 - gap.x1, gap.y2 - gap.y1);
    }
    open = std::move(stillOpen);
  }

  for (const auto &gap : open) {
    gaps.emplace_back(gap.x1, gap.y1, gap.x2 - gap.x1, gap.y2 - gap.y1);
  }

  return gaps;
}

Box LayoutDisambiguator::trimAgainst(const Box &box, const Box &blocker) {
  if (!overlaps(box, blocker)) {
    return box;
  }

  double boxRight = box.x + box.width;
  double boxBottom = box.y + box.height;
  double cutLeft = std::max(box.x, blocker.x);
  double cutTop = std::max(box.y, blocker.y);
  double cutRight = std::min(boxRight, blocker.x + blocker.width);
  double cutBottom = std::min(boxBottom, blocker.y + blocker.height);

  const Box strips[] = {
      Box(box.x, box.y, box.width, cutTop - box.y),            // above
      Box(box.x, cutBottom, box.width, boxBottom - cutBottom), // below
      Box(box.x, box.y, cutLeft - box.x, box.height),          // left
      Box(cutRight, box.y, boxRight - cutRight, box.height)    // right
  };

  Box best;
  double bestArea = kAreaEpsilon;
  for (const auto &strip : strips) {
    double area = boxArea(strip);
    if (area > bestArea) {
      best = strip;
      bestArea = area;
    }
  }
  return best;
}

} // namespace docparse
