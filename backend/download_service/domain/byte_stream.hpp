#pragma once
#include "domain/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace download_service {

// Pull-based source of bytes. read() blocks until data, end of stream (0) or
// an error. abort() may be called from any thread and makes a blocked read()
// return promptly.
class ByteStream {
public:
  virtual ~ByteStream() = default;
  virtual Result<std::size_t> read(std::span<std::uint8_t> buffer) = 0;
  virtual void abort() = 0;
};

// Live response towards the requesting client. A failed write means the
// client went away; the caller treats it as a disconnect.
class ClientSink {
public:
  virtual ~ClientSink() = default;
  virtual bool write(std::span<const std::uint8_t> data) = 0;
};

} // namespace download_service
