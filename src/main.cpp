#include "AnnotationContext.hpp"
#include "PageRenderer.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <page.pdf|page.png> [options]\n"
      << "\nOptions:\n"
      << "  -p, --page <n>              Page to render for PDF input "
         "(default: 1)\n"
      << "  -r, --rect <llx,lly,urx,ury> Annotation bounds in PDF points\n"
      << "  -q, --quads <x0,y0,...>     Quad points in PDF points (8 per "
         "quad)\n"
      << "  -m, --markup <kind>         none, highlight or popup\n"
      << "  -c, --comment-box <image>   Comment box image for popups\n"
      << "  -o, --output <path>         Output image (default: "
         "annotation.png)\n"
      << "  -h, --help                  Show this help message\n"
      << "\nSet DEBUG=true to also dump every sub image to debug/.\n"
      << "\nExamples:\n"
      << "  " << programName << " paper.pdf -p 3 -q 100,200,150,200,100,230,150,230\n"
      << "  " << programName << " page.png -r 72,500,90,518 -m popup -c box.png\n";
}

/**
 * @brief Parse a comma separated list of numbers
 */
bool parseFloats(const std::string &text, std::vector<float> &values) {
  std::stringstream stream(text);
  std::string item;
  values.clear();
  while (std::getline(stream, item, ',')) {
    try {
      std::size_t used = 0;
      values.push_back(std::stof(item, &used));
      if (used != item.size()) {
        return false;
      }
    } catch (const std::exception &) {
      return false;
    }
  }
  return !values.empty();
}

bool parseMarkup(std::string text, annot::MarkupKind &markup) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (text == "none" || text == "plain") {
    markup = annot::MarkupKind::None;
  } else if (text == "highlight") {
    markup = annot::MarkupKind::Highlight;
  } else if (text == "popup") {
    markup = annot::MarkupKind::Popup;
  } else {
    return false;
  }
  return true;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string inputPath;
  std::string outputPath = "annotation.png";
  std::string commentBoxPath;
  int pageNumber = 1;
  annot::QuadPoints quadPoints;
  bool haveRect = false;
  bool haveMarkup = false;
  annot::MarkupKind markup = annot::MarkupKind::None;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-p" || arg == "--page") {
      if (i + 1 < argc) {
        try {
          pageNumber = std::stoi(argv[++i]);
        } catch (const std::exception &) {
          std::cerr << "Error: --page expects a number\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --page requires an argument\n";
        return 1;
      }
    } else if (arg == "-r" || arg == "--rect") {
      std::vector<float> bounds;
      if (i + 1 >= argc || !parseFloats(argv[++i], bounds) ||
          bounds.size() != 4) {
        std::cerr << "Error: --rect requires llx,lly,urx,ury\n";
        return 1;
      }
      annot::PDFRect rect;
      rect.lowerLeftX = bounds[0];
      rect.lowerLeftY = bounds[1];
      rect.upperRightX = bounds[2];
      rect.upperRightY = bounds[3];
      quadPoints = annot::rectToQuad(rect);
      haveRect = true;
    } else if (arg == "-q" || arg == "--quads") {
      if (i + 1 >= argc || !parseFloats(argv[++i], quadPoints)) {
        std::cerr << "Error: --quads requires a comma separated list\n";
        return 1;
      }
      haveRect = false;
    } else if (arg == "-m" || arg == "--markup") {
      if (i + 1 >= argc || !parseMarkup(argv[++i], markup)) {
        std::cerr << "Error: --markup must be none, highlight or popup\n";
        return 1;
      }
      haveMarkup = true;
    } else if (arg == "-c" || arg == "--comment-box") {
      if (i + 1 < argc) {
        commentBoxPath = argv[++i];
      } else {
        std::cerr << "Error: --comment-box requires an argument\n";
        return 1;
      }
    } else if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        outputPath = argv[++i];
      } else {
        std::cerr << "Error: --output requires an argument\n";
        return 1;
      }
    } else if (arg[0] != '-') {
      inputPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (inputPath.empty()) {
    std::cerr << "Error: No page path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  if (quadPoints.empty()) {
    std::cerr << "Error: One of --rect or --quads is required\n";
    return 1;
  }

  if (!haveMarkup) {
    markup = haveRect ? annot::MarkupKind::None : annot::MarkupKind::Highlight;
  }

  if (quadPoints.size() % annot::kValuesPerQuad != 0) {
    std::cerr << "Warning: " << quadPoints.size()
              << " quad values is not a multiple of 8, trailing values only "
                 "widen the crop\n";
  }

  annot::ContextConfig config = annot::ContextConfig::fromEnvironment();
  if (config.debug) {
    config.debugSink = annot::makeFileDebugSink("debug");
  }

  std::cout << "=== Annotation Context ===\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Input: " << inputPath << "\n"
            << "Markup: " << annot::markupName(markup) << "\n"
            << "Quads: " << annot::quadCount(quadPoints) << "\n"
            << "==========================\n\n";

  auto page = annot::loadPage(inputPath, pageNumber);
  if (!page.success) {
    std::cerr << "Error: " << page.errorMessage << "\n";
    return 1;
  }

  std::cout << "Page " << page.pageNumber << ": " << page.image.cols << "x"
            << page.image.rows << " pixels (" << std::fixed
            << std::setprecision(1) << page.pageWidth << " x "
            << page.pageHeight << " pt)\n";

  cv::Mat commentBox;
  if (!commentBoxPath.empty()) {
    commentBox = cv::imread(commentBoxPath, cv::IMREAD_UNCHANGED);
    if (commentBox.empty()) {
      std::cerr << "Warning: Could not load comment box image "
                << commentBoxPath << ", drawing an outline instead\n";
    }
  }

  annot::AnnotationContext context(config);
  auto result = context.makeSubImage(page.image, quadPoints, markup, commentBox);

  if (!result.success) {
    std::cerr << "Sub image extraction failed: " << result.errorMessage << "\n";
    return 1;
  }

  const cv::Rect &rect = result.subImageRect;
  std::cout << "Sub image: (" << rect.x << "," << rect.y << ") size "
            << rect.width << "x" << rect.height << "\n";
  if (result.degraded) {
    std::cout << "Comment box drawn as an outline\n";
  }

  try {
    if (!cv::imwrite(outputPath, result.image)) {
      std::cerr << "Error: Could not write " << outputPath << "\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error writing " << outputPath << ": " << e.what() << "\n";
    return 1;
  }

  std::cout << "Output: " << outputPath << "\n";
  std::cout << "\nProcessing time: " << std::fixed << std::setprecision(2)
            << result.processingTimeMs << " ms\n";

  return 0;
}
