#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace ds {

// Reads a file as raw fixed-size chunks. Chunks are cut at arbitrary byte
// offsets; records and even CRLF pairs may straddle two chunks.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024; // 512 KiB
  };

  explicit ChunkReader(std::string path);      // uses default Config{}; "-" reads stdin
  ChunkReader(std::string path, Config cfg);   // explicit Config

  // Return false from the callback to stop reading early.
  using ChunkCallback = std::function<bool(std::string_view)>;

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;
  ~ChunkReader();

  bool for_each_chunk(const ChunkCallback& cb);
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t chunks_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
