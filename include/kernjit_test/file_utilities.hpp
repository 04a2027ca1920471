/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/utilities/error.hpp>
#include <kernjit/utilities/export.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

/**
 * @brief RAII class for creating a temporary directory.
 *
 */
class KERNJIT_EXPORT temp_directory {
  std::string _path;

 public:
  /**
   * @brief Construct a new temp directory object
   *
   * @param base_name The base name of the temporary directory
   */
  temp_directory(std::string const& base_name)
  {
    std::string dir_template{std::filesystem::temp_directory_path().string()};

    dir_template += "/" + base_name + ".XXXXXX";
    auto const tmpdirptr = mkdtemp(const_cast<char*>(dir_template.data()));
    KERNJIT_EXPECTS(tmpdirptr != nullptr, "Temporary directory creation failure: " + dir_template);

    _path = dir_template + "/";
  }

  temp_directory& operator=(temp_directory const&) = delete;
  temp_directory(temp_directory const&)            = delete;
  /**
   * @brief Move assignment operator
   *
   * @return Reference to this object
   */
  temp_directory& operator=(temp_directory&&) = default;
  temp_directory(temp_directory&&)            = default;  ///< Move constructor

  ~temp_directory()
  {
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::path{_path}, ec);
  }

  /**
   * @brief Returns the path of the temporary directory
   *
   * @return string path of the temporary directory, with a trailing `/`
   */
  [[nodiscard]] std::string const& path() const { return _path; }
};

namespace KERNJIT_EXPORT kernjit {
namespace test {

/**
 * @brief Returns the contents of the file at `path`, or an empty string if it cannot be read
 */
inline std::string file_contents(std::string const& path)
{
  std::ifstream file{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

/**
 * @brief Replaces the file at `path` with `content`
 */
inline void overwrite_file(std::string const& path, std::string const& content)
{
  std::ofstream file{path, std::ios::binary | std::ios::trunc};
  KERNJIT_EXPECTS(file.is_open(), "Failed to open " + path, std::runtime_error);
  file << content;
}

}  // namespace test
}  // namespace KERNJIT_EXPORT kernjit
