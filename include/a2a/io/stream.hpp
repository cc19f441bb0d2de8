#pragma once

#include "a2a/core/error.hpp"

#include <cstddef>
#include <span>

namespace a2a::io {

// Pull-based byte source. read() blocks until at least one byte is
// available; 0 means end of stream.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  [[nodiscard]] virtual auto read(std::span<char> buf)
      -> Result<std::size_t> = 0;
};

}  // namespace a2a::io
