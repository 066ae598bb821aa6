#include "maze_escape/config.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/range/concepts.hpp>
#include <range/v3/utility/tuple_algorithm.hpp>

#include "support/maze_escape_exception.hpp"
#include "support/text.hpp"

Config Config::parse(const std::filesystem::path &File) {
  const auto FileData = readTextFile(File, "Config");
  auto Input = llvm::yaml::Input{FileData};
  auto Conf = Config{};
  Input >> Conf;

  const auto Error = Input.error();
  MazeEscapeException::verify(!Error, "Failed to parse config file: {}",
                              Error.message());
  return Conf;
}

void Config::save(const std::filesystem::path &File) {
  auto Error = std::error_code{};
  const auto FileName = File.string();
  auto FileStream = llvm::raw_fd_ostream{FileName, Error};
  MazeEscapeException::verify(!Error, "Error while opening config file: {}",
                              Error.message());
  auto OutStream = llvm::yaml::Output{FileStream};
  OutStream << *this;
  FileStream.flush();
  MazeEscapeException::verify(!FileStream.has_error(),
                              "Error while writing config file: {}",
                              FileStream.error().message());
}

void llvm::yaml::MappingTraits<Config>::mapping(llvm::yaml::IO &YamlIO,
                                                Config &Conf) {
  const auto MapOptionals = [&Conf,
                             &YamlIO](const ranges::range auto &Mappings) {
    const auto MapOptional =
        [&Conf, &YamlIO]<typename ValueType>(
            const Config::MappingType<ValueType> &MappingValue) {
          const auto &[ValueName, ValueAddress] = MappingValue;
          YamlIO.mapOptional(ValueName.data(), std::invoke(ValueAddress, Conf));
        };

    ranges::for_each(Mappings, MapOptional);
  };

  ranges::tuple_for_each(Config::getConfigMapping(), MapOptionals);
}
