#pragma once

#include <map>
#include <string>
#include <string_view>

namespace kvproxy {

using HeaderMap = std::map<std::string, std::string>;

// The client side of one request. Every call returns false once the client
// can no longer be written to; callers stop producing at that point.
class ClientChannel {
 public:
  virtual ~ClientChannel() = default;

  // A complete, buffered response.
  virtual bool send(unsigned status, const std::string& content_type, const std::string& body,
                    const HeaderMap& extra_headers) = 0;

  // A chunked response whose body arrives through write_chunk().
  virtual bool begin_stream(unsigned status, const std::string& content_type, const HeaderMap& extra_headers) = 0;
  virtual bool write_chunk(std::string_view bytes) = 0;
  virtual bool end_stream() = 0;
};

}  // namespace kvproxy
