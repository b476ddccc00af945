#include "ephem_core/util/compression.hpp"

#include <zstd.h>

#include <stdexcept>

#include "ephem_core/errors.hpp"

namespace ephem_core {

std::vector<char> Compression::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  std::vector<char> frame(ZSTD_compressBound(data.size()));

  size_t const written =
      ZSTD_compress(frame.data(), frame.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw std::runtime_error("ZSTD compression failed: " + std::string(ZSTD_getErrorName(written)));
  }

  frame.resize(written);
  frame.shrink_to_fit();
  return frame;
}

std::string Compression::decompress(const std::vector<char>& compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  unsigned long long const content_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CorruptedIndexError("Stored chunk text is not a zstd frame");
  }

  std::string text(content_size, '\0');
  size_t const read =
      ZSTD_decompress(text.data(), text.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(read) || read != content_size) {
    throw CorruptedIndexError("ZSTD decompression failed: " +
                              std::string(ZSTD_isError(read) ? ZSTD_getErrorName(read)
                                                             : "short frame"));
  }
  return text;
}

}  // namespace ephem_core
