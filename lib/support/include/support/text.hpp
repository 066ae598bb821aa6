#ifndef maze_escape_lib_support_include_support_text_hpp
#define maze_escape_lib_support_include_support_text_hpp

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/std.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include "support/maze_escape_exception.hpp"

// strips the '\r' of CRLF line endings
[[nodiscard]] inline std::vector<std::string>
splitLines(const std::string_view Text) {
  return Text | ranges::views::split('\n') |
         ranges::views::transform([](auto &&Line) {
           auto Result = Line | ranges::to<std::string>();
           if (!Result.empty() && Result.back() == '\r') {
             Result.pop_back();
           }
           return Result;
         }) |
         ranges::to_vector;
}

[[nodiscard]] inline std::string
readTextFile(const std::filesystem::path &File, const std::string_view Kind) {
  MazeEscapeException::verify(std::filesystem::exists(File),
                              "{} file does not exist ({})", Kind, File);
  auto FileStream = std::ifstream{File};
  MazeEscapeException::verify(FileStream.good(), "Failed to open {} file ({})",
                              Kind, File);
  return std::string{std::istreambuf_iterator<char>{FileStream},
                     std::istreambuf_iterator<char>{}};
}

#endif
