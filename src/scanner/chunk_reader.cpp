#include "delim_scanner/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <utility>
#include <vector>

namespace ds {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  int last_errno{0};
  std::uint64_t bytes{0};
  std::uint64_t chunks{0};

  bool for_each_chunk(const ChunkCallback& cb) {
    const bool use_stdin = (path == "-");
    FILE* f = use_stdin ? stdin : std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return false; }
    auto close = [&]{ if (!use_stdin) std::fclose(f); };

    std::vector<char> buf(cfg.chunk_bytes > 0 ? cfg.chunk_bytes : 1);
    while (true) {
      std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
      if (n == 0 && std::ferror(f)) { last_errno = errno; close(); return false; }
      if (n == 0 && std::feof(f))   break;
      bytes += n;
      ++chunks;
      if (!cb(std::string_view(buf.data(), n))) break;
    }

    close();
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::for_each_chunk(const ChunkCallback& cb) { return p_->for_each_chunk(cb); }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::chunks_read() const noexcept { return p_->chunks; }

}
