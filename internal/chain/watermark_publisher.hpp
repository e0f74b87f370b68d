#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace settle::chain {

/*
  Externally visible recovery boundary.

  Publish may cost a chain write, so the watermark manager batches it.
  Keys are chain names ("token", "register"), values unix seconds.
*/
class WatermarkPublisher {
 public:
  virtual ~WatermarkPublisher() = default;

  // Throws on failure; nothing is assumed published then.
  virtual void Publish(const std::map<std::string, std::int64_t>& watermarks) = 0;

  virtual std::map<std::string, std::int64_t> ReadPublished() = 0;
};

} // namespace settle::chain
