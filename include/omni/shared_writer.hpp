#pragma once

#include <boost/json.hpp>
#include <mutex>
#include <ostream>
#include <string_view>
#include <utility>

#include "omni/encoding.hpp"

namespace xpto::omni {

// One writer per output stream.  Each frame is written and flushed while
// holding the lock, so frames from concurrent requests never interleave.
// Frames are given in UTF-8 and written in the stream's encoding.
class shared_writer {
 public:
  explicit shared_writer(std::ostream& out, stream_encoding encoding = {})
      : out_{&out}, encoding_{std::move(encoding)} {}

  void write_frame(std::string_view frame);
  void write_frame(const boost::json::value& frame);

  const stream_encoding& encoding() const { return encoding_; }

 private:
  std::mutex mutex_;
  std::ostream* out_;
  stream_encoding encoding_;
};

}  // namespace xpto::omni
