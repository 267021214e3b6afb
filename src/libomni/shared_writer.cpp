#include "omni/shared_writer.hpp"

#include <string>

namespace xpto::omni {

void shared_writer::write_frame(std::string_view frame) {
  // Convert outside the lock.
  std::string bytes{encoding_.encode(frame)};
  std::lock_guard<std::mutex> lock{mutex_};
  out_->write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out_->put('\n');
  out_->flush();
}

void shared_writer::write_frame(const boost::json::value& frame) {
  write_frame(boost::json::serialize(frame));
}

}  // namespace xpto::omni
