#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ephem_core {

class Compression {
 public:
  /**
   * @brief Compresses chunk text with Zstandard.
   * @param data The text to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return The compressed frame, empty for empty input.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Restores text produced by compress().
   * @throws CorruptedIndexError if the buffer is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char>& compressed_data);
};

}  // namespace ephem_core
