#include "PageRenderer.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <memory>

#include <poppler-document.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace annot {

PageRenderResult renderPDFPage(const std::string &pdfPath, int pageNumber,
                               double dpi) {
  PageRenderResult result;
  result.success = false;
  result.pageNumber = pageNumber;
  result.dpi = dpi;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(pdfPath));

    if (!doc) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    if (doc->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + pdfPath;
      return result;
    }

    result.pageCount = doc->pages();
    if (pageNumber < 1 || pageNumber > result.pageCount) {
      result.errorMessage = "Page " + std::to_string(pageNumber) +
                            " out of range (document has " +
                            std::to_string(result.pageCount) + " pages)";
      return result;
    }

    std::unique_ptr<poppler::page> page(doc->create_page(pageNumber - 1));
    if (!page) {
      result.errorMessage =
          "Failed to create page " + std::to_string(pageNumber);
      return result;
    }

    poppler::rectf box = page->page_rect(poppler::media_box);
    result.pageWidth = box.width();
    result.pageHeight = box.height();

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);
    if (!popplerImage.is_valid()) {
      result.errorMessage =
          "Failed to render page " + std::to_string(pageNumber);
      return result;
    }

    int width = popplerImage.width();
    int height = popplerImage.height();
    cv::Mat mat;

    switch (popplerImage.format()) {
    case poppler::image::format_argb32: {
      // ARGB32 is stored as BGRA bytes on little endian hosts
      mat = cv::Mat(height, width, CV_8UC4,
                    const_cast<char *>(popplerImage.const_data()),
                    popplerImage.bytes_per_row())
                .clone();
      cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
      break;
    }
    case poppler::image::format_rgb24: {
      mat = cv::Mat(height, width, CV_8UC3,
                    const_cast<char *>(popplerImage.const_data()),
                    popplerImage.bytes_per_row())
                .clone();
      cv::cvtColor(mat, mat, cv::COLOR_RGB2BGR);
      break;
    }
    case poppler::image::format_bgr24: {
      mat = cv::Mat(height, width, CV_8UC3,
                    const_cast<char *>(popplerImage.const_data()),
                    popplerImage.bytes_per_row())
                .clone();
      break;
    }
    case poppler::image::format_gray8: {
      mat = cv::Mat(height, width, CV_8UC1,
                    const_cast<char *>(popplerImage.const_data()),
                    popplerImage.bytes_per_row())
                .clone();
      break;
    }
    default:
      result.errorMessage = "Unsupported image format";
      return result;
    }

    result.image = mat;
    result.success = true;

  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF page rendering failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

PageRenderResult loadPage(const std::string &path, int pageNumber) {
  std::string extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });

  if (extension == ".pdf") {
    return renderPDFPage(path, pageNumber);
  }

  PageRenderResult result;
  result.success = false;
  result.pageNumber = 1;
  result.pageCount = 1;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    result.image = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (result.image.empty()) {
      result.errorMessage = "Failed to load image: " + path;
      return result;
    }

    // A raster page is assumed to be rendered at the context resolution
    result.dpi = kContextDpi;
    result.pageWidth = result.image.cols / kScaleUpFactor;
    result.pageHeight = result.image.rows / kScaleUpFactor;
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Image loading failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace annot
