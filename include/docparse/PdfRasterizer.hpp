#ifndef DOCPARSE_PDF_RASTERIZER_HPP
#define DOCPARSE_PDF_RASTERIZER_HPP

#include <opencv2/opencv.hpp>

#include <string>
#include <vector>

namespace docparse {

/**
 * @brief One rendered PDF page
 */
struct RasterizedPage {
  cv::Mat image;      ///< BGR page image, empty if rendering failed
  int pageNumber = 0; ///< 0-indexed
  int width = 0;      ///< Width in pixels
  int height = 0;     ///< Height in pixels
};

/**
 * @brief Result of rendering a whole PDF
 */
struct RasterizedDocument {
  std::vector<RasterizedPage> pages; ///< Every page, in order
  double dpi = 0.0;                  ///< Rendering resolution
  double processingTimeMs = 0.0;     ///< Processing time in milliseconds
  bool success = false;              ///< Whether rendering succeeded
  std::string errorMessage;          ///< Error message if failed
};

/**
 * @brief Renders PDF bytes into page images
 */
class PageRasterizer {
public:
  virtual ~PageRasterizer() = default;

  /**
   * @brief Render every page of a PDF
   * @param pdf PDF file content
   * @param dpi Rendering resolution
   */
  virtual RasterizedDocument rasterize(const std::vector<char> &pdf,
                                       double dpi) = 0;
};

/**
 * @brief PageRasterizer backed by poppler-cpp
 *
 * Locked and empty documents are rejected. Pages are rendered with
 * antialiasing and converted to BGR. A page that fails to render is
 * logged and kept with an empty image; the document still succeeds.
 */
class PopplerRasterizer : public PageRasterizer {
public:
  RasterizedDocument rasterize(const std::vector<char> &pdf,
                               double dpi) override;
};

} // namespace docparse

#endif // DOCPARSE_PDF_RASTERIZER_HPP
