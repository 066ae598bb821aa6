#ifndef maze_escape_lib_support_include_support_maze_escape_exception_hpp
#define maze_escape_lib_support_include_support_maze_escape_exception_hpp

#include <exception>
#include <filesystem>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

// A message format together with the place that reports the error. Built
// implicitly from the format string at the call site of verify/fail.
struct ErrorFormat {
  // NOLINTNEXTLINE(google-explicit-constructor)
  ErrorFormat(const char *FormatText, const std::source_location CallSite =
                                          std::source_location::current())
      : Text(FormatText),
        Location(CallSite) {}

  // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
  std::string_view Text;
  std::source_location Location;
  // NOLINTEND(misc-non-private-member-variables-in-classes)
};

// Invalid input to the search tooling: malformed graph, maze, query or config
// files and bad command line values. The message is logged with the reporting
// location, followed by the spdlog backtrace.
class MazeEscapeException : public std::exception {
public:
  explicit MazeEscapeException(
      std::string Message,
      const std::source_location Location = std::source_location::current())
      : Message_(std::move(Message)),
        Location_(Location) {
    spdlog::error("{} [{}:{}]", Message_,
                  std::filesystem::path{Location_.file_name()}
                      .filename()
                      .string(),
                  Location_.line());
    spdlog::dump_backtrace();
  }

  [[nodiscard]] const char *what() const noexcept final {
    return Message_.c_str();
  }

  [[nodiscard]] const std::source_location &where() const noexcept {
    return Location_;
  }

  template <typename... Ts>
  static void verify(const bool Condition, const ErrorFormat Format,
                     Ts &&...Args) {
    if (!Condition) {
      fail(Format, std::forward<Ts>(Args)...);
    }
  }

  template <typename... Ts>
  [[noreturn]] static void fail(const ErrorFormat Format, Ts &&...Args) {
    throw MazeEscapeException{
        fmt::format(fmt::runtime(Format.Text), std::forward<Ts>(Args)...),
        Format.Location};
  }

private:
  std::string Message_;
  std::source_location Location_;
};

#endif
