#pragma once

#include <string>
#include <string_view>

namespace xpto::omni {

/// Character set spoken on the stdio streams.  Frames are UTF-8 inside
/// the server; a stream_encoding converts them at the process boundary.
class stream_encoding {
 public:
  // UTF-8, which needs no conversion.
  stream_encoding() = default;

  /** @brief Encoding named @p name.
   *
   * @p name is a charset ("utf-8", "iso-8859-1", "cp1252") or a locale
   * name whose charset follows the dot ("en_US.ISO-8859-1").  Throws
   * configuration_error if the charset is unknown.
   */
  explicit stream_encoding(std::string_view name);

  const std::string& charset() const { return charset_; }
  bool is_utf8() const { return utf8_; }

  // UTF-8 -> stream bytes.  Characters the charset lacks are dropped.
  std::string encode(std::string_view utf8) const;
  // Stream bytes -> UTF-8.
  std::string decode(std::string_view bytes) const;

 private:
  std::string charset_{"UTF-8"};
  bool utf8_{true};
};

}  // namespace xpto::omni
