#include "omni/encoding.hpp"

#include <boost/locale/encoding.hpp>

#include "logger.hpp"
#include "omni/errors.hpp"
#include "utils.hpp"

namespace conv = boost::locale::conv;

namespace xpto::omni {

namespace {

// "en_US.ISO-8859-1@euro" -> "ISO-8859-1"
std::string charset_of(std::string_view name) {
  if (auto dot = name.find('.'); dot != std::string_view::npos)
    name.remove_prefix(dot + 1);
  if (auto at = name.find('@'); at != std::string_view::npos)
    name = name.substr(0, at);
  return std::string{name};
}

bool names_utf8(std::string_view charset) {
  std::string folded{};
  for (char c : utils::to_lower(charset))
    if (c != '-' && c != '_') folded += c;
  return folded == "utf8";
}

}  // namespace

stream_encoding::stream_encoding(std::string_view name)
    : charset_{charset_of(name)} {
  if (charset_.empty())
    utils::throwf<configuration_error>("bad encoding name '{}'", name);
  utf8_ = names_utf8(charset_);
  if (utf8_) {
    charset_ = "UTF-8";
    return;
  }

  const std::string_view sample{"omni"};
  try {
    conv::to_utf<char>(sample.data(), sample.data() + sample.size(), charset_);
  } catch (const conv::invalid_charset_error& e) {
    utils::throwf<configuration_error>(
        "unsupported encoding '{}': {}", name, e.what());
  }
  LOG_DEBUG("stdio streams use {}", charset_);
}

std::string stream_encoding::encode(std::string_view utf8) const {
  if (utf8_) return std::string{utf8};
  return conv::from_utf<char>(utf8.data(), utf8.data() + utf8.size(), charset_);
}

std::string stream_encoding::decode(std::string_view bytes) const {
  if (utf8_) return std::string{bytes};
  return conv::to_utf<char>(bytes.data(), bytes.data() + bytes.size(), charset_);
}

}  // namespace xpto::omni
