#include "MergerLogic.h"

#include <fpdfview.h> // For the FPDF_ERR_* codes

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {
// Longest paths accepted on the command line
constexpr std::size_t kMaxPosixPathLength = 4096;
constexpr std::size_t kMaxWindowsPathLength = 260;

// "C:" alone or followed by a separator
bool HasDriveSpec(std::string_view path) {
  return path.size() >= 2 &&
         std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':' &&
         (path.size() == 2 || path[2] == '\\' || path[2] == '/');
}

// Case-insensitive string comparison
bool iequals(std::string_view a, std::string_view b) {
  if (a.length() != b.length()) {
    return false;
  }
  return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                    [](char char_a, char char_b) {
                      return std::toupper(static_cast<unsigned char>(char_a)) ==
                             std::toupper(static_cast<unsigned char>(char_b));
                    });
}

// Device names that cannot be used as a file name on Windows, with or
// without an extension
bool IsReservedDeviceName(std::string_view component) {
  static const std::array<std::string_view, 4> fixedNames = {"CON", "PRN",
                                                             "AUX", "NUL"};
  const std::string_view stem = component.substr(0, component.find('.'));
  for (auto name : fixedNames) {
    if (iequals(stem, name)) {
      return true;
    }
  }
  if (stem.size() == 4 && std::isdigit(static_cast<unsigned char>(stem[3])) &&
      stem[3] != '0') {
    return iequals(stem.substr(0, 3), "COM") ||
           iequals(stem.substr(0, 3), "LPT");
  }
  return false;
}
} // namespace

// Splits "archive.tar.gz" into "archive" and {"tar", "gz"}; empty segments
// between consecutive dots are kept
std::pair<std::string, std::vector<std::string>>
MergerLogic::SplitFileName(const std::string &fileName) {
  std::vector<std::string> segments;
  std::size_t start = 0;
  while (true) {
    const std::size_t dot = fileName.find('.', start);
    if (dot == std::string::npos) {
      segments.push_back(fileName.substr(start));
      break;
    }
    segments.push_back(fileName.substr(start, dot - start));
    start = dot + 1;
  }
  std::string first = segments.front();
  segments.erase(segments.begin());
  return {first, segments};
}

// Checks that 'path' is a syntactically legal file path under 'platform'
// rules; returns a description of the first problem found
std::optional<std::string>
MergerLogic::ValidateFilePath(const std::string &path, PathPlatform platform) {
  const bool windows = platform == PathPlatform::Windows;
  const std::size_t maxLength =
      windows ? kMaxWindowsPathLength : kMaxPosixPathLength;

  if (path.empty()) {
    return "path is empty";
  }
  if (path.length() > maxLength) {
    return "path is longer than " + std::to_string(maxLength) + " characters";
  }
  for (unsigned char c : path) {
    if (c < 0x20) {
      return "path contains a control character";
    }
  }
  if (!windows) {
    return std::nullopt; // Only NUL and '/' are special in POSIX file names
  }

  // A drive spec ("C:" or "C:\...") is the one place a colon may appear
  std::size_t start = 0;
  if (HasDriveSpec(path)) {
    start = 2;
  }

  constexpr std::string_view invalidChars = R"(:*?"<>|)";
  while (start <= path.size()) {
    std::size_t end = path.find_first_of("/\\", start);
    if (end == std::string::npos) {
      end = path.size();
    }
    const std::string_view component(path.data() + start, end - start);
    for (char c : component) {
      if (invalidChars.find(c) != std::string_view::npos) {
        return std::string("path contains invalid character '") + c + "'";
      }
    }
    if (!component.empty()) {
      if (IsReservedDeviceName(component)) {
        return "'" + std::string(component) + "' is a reserved name";
      }
      if (component.back() == ' ') {
        return "'" + std::string(component) + "' ends with a space";
      }
    }
    start = end + 1;
  }
  return std::nullopt;
}

// Maps FPDF_GetLastError() codes to a readable reason
std::string MergerLogic::DescribePdfError(unsigned long errorCode) {
  switch (errorCode) {
  case FPDF_ERR_SUCCESS:
    return "no error reported";
  case FPDF_ERR_FILE:
    return "file not found or could not be opened";
  case FPDF_ERR_FORMAT:
    return "file is not a PDF document or is corrupted";
  case FPDF_ERR_PASSWORD:
    return "document is password protected";
  case FPDF_ERR_SECURITY:
    return "unsupported security scheme";
  case FPDF_ERR_PAGE:
    return "page not found or content error";
  case FPDF_ERR_UNKNOWN:
  default:
    return "unknown error";
  }
}

// Renders the parsed arguments the way they are echoed before a merge
std::string
MergerLogic::FormatArgumentDetails(const std::vector<std::string> &inputFiles,
                                   const std::string &outFile) {
  std::ostringstream ss;
  ss << "inputfiles:\n";
  for (const auto &input : inputFiles) {
    ss << '\t' << input << '\n';
  }
  ss << "outfile: " << outFile << '\n';
  return ss.str();
}
