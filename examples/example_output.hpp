#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace plumix_examples {

/// examples_output/<name>, or the directory passed with --output-dir.
inline std::filesystem::path make_example_output_dir(std::string_view example_name,
                                                      int argc,
                                                      char* argv[]) {
  std::filesystem::path output_dir =
      std::filesystem::path("examples_output") / std::string(example_name);
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--output-dir" && i + 1 < argc) {
      output_dir = argv[++i];
    }
  }
  std::filesystem::create_directories(output_dir);
  return output_dir;
}

inline std::string output_file(const std::filesystem::path& dir,
                               std::string_view filename) {
  return (dir / std::string(filename)).string();
}

/// <prefix>_stepNNNN.vtk
inline std::string step_file_name(std::string_view prefix, int step) {
  std::ostringstream oss;
  oss << prefix << "_step" << std::setw(4) << std::setfill('0') << step << ".vtk";
  return oss.str();
}

} // namespace plumix_examples
