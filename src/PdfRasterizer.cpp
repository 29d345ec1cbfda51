#include "docparse/PdfRasterizer.hpp"

#include "docparse/Log.hpp"

#include <poppler-document.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

#include <chrono>
#include <memory>
#include <string>

namespace docparse {

namespace {

/**
 * @brief Copy a Poppler image into a BGR cv::Mat
 * @return Empty matrix for unsupported formats
 */
cv::Mat toBgrMat(const poppler::image &popplerImage) {
  int width = popplerImage.width();
  int height = popplerImage.height();
  char *data = const_cast<char *>(popplerImage.const_data());
  int stride = popplerImage.bytes_per_row();

  cv::Mat mat;
  switch (popplerImage.format()) {
  case poppler::image::format_argb32:
    // Stored as B, G, R, A bytes on little-endian machines
    cv::cvtColor(cv::Mat(height, width, CV_8UC4, data, stride), mat,
                 cv::COLOR_BGRA2BGR);
    break;
  case poppler::image::format_rgb24:
    cv::cvtColor(cv::Mat(height, width, CV_8UC3, data, stride), mat,
                 cv::COLOR_RGB2BGR);
    break;
  case poppler::image::format_bgr24:
    mat = cv::Mat(height, width, CV_8UC3, data, stride).clone();
    break;
  case poppler::image::format_gray8:
    cv::cvtColor(cv::Mat(height, width, CV_8UC1, data, stride), mat,
                 cv::COLOR_GRAY2BGR);
    break;
  default:
    break;
  }
  return mat;
}

} // anonymous namespace

RasterizedDocument PopplerRasterizer::rasterize(const std::vector<char> &pdf,
                                                double dpi) {
  RasterizedDocument result;
  result.dpi = dpi;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    if (pdf.empty()) {
      result.errorMessage = "PDF content is empty";
      return result;
    }

    poppler::byte_array data(pdf.begin(), pdf.end());
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_raw_data(data.data(),
                                              static_cast<int>(data.size())));

    if (!doc) {
      result.errorMessage = "Failed to load PDF";
      return result;
    }

    if (doc->is_locked()) {
      result.errorMessage = "PDF file is password protected";
      return result;
    }

    int pageCount = doc->pages();
    if (pageCount < 1) {
      result.errorMessage = "PDF has no pages";
      return result;
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    for (int pageIndex = 0; pageIndex < pageCount; ++pageIndex) {
      // A page that cannot be rendered keeps its slot with an empty image
      RasterizedPage rendered;
      rendered.pageNumber = pageIndex;

      std::unique_ptr<poppler::page> page(doc->create_page(pageIndex));
      poppler::image popplerImage;
      if (page) {
        popplerImage = renderer.render_page(page.get(), dpi, dpi);
      }
      if (popplerImage.is_valid()) {
        rendered.image = toBgrMat(popplerImage);
      }

      if (rendered.image.empty()) {
        log(LogLevel::Warning, "rasterize", "",
            "Failed to render page " + std::to_string(pageIndex));
      } else {
        rendered.width = rendered.image.cols;
        rendered.height = rendered.image.rows;
      }
      result.pages.push_back(rendered);
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF rendering failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  if (result.success) {
    log(LogLevel::Debug, "rasterize", "",
        "Rendered " + std::to_string(result.pages.size()) + " pages at " +
            std::to_string(static_cast<int>(dpi)) + " dpi in " +
            std::to_string(result.processingTimeMs) + " ms");
  }
  return result;
}

} // namespace docparse
