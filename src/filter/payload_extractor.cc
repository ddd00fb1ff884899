/**
 * Payload Extractor Implementation
 */

#include "bodyroute/filter/payload_extractor.h"

#include <cstdint>

#include "bodyroute/json/json_bridge.h"

#define BODYROUTE_LOG_COMPONENT "filter.payload_extractor"
#include "bodyroute/logging/log_macros.h"

namespace bodyroute {
namespace filter {

bool isValidUtf8(const std::string& data) {
  const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());
  const size_t len = data.size();
  size_t i = 0;

  while (i < len) {
    unsigned char c = bytes[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t extra;
    uint32_t code_point;
    uint32_t min_code_point;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      code_point = c & 0x1F;
      min_code_point = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      code_point = c & 0x0F;
      min_code_point = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      code_point = c & 0x07;
      min_code_point = 0x10000;
    } else {
      return false;  // Stray continuation byte or invalid lead byte
    }

    if (i + extra >= len) {
      return false;  // Truncated sequence
    }
    for (size_t k = 1; k <= extra; ++k) {
      unsigned char cc = bytes[i + k];
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (cc & 0x3F);
    }

    if (code_point < min_code_point || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

PayloadExtractor::PayloadExtractor(const std::string& field_name)
    : field_name_(field_name), key_token_("\"" + field_name + "\"") {}

optional<std::string> PayloadExtractor::extract(
    const std::string& body) const {
  if (body.empty()) {
    return nullopt;
  }

  if (!isValidUtf8(body)) {
    BODYROUTE_LOG(Debug, "Body of {} bytes is not valid UTF-8", body.size());
    return nullopt;
  }

  // The JSON parser would skip a leading byte order mark; a JSON text
  // must not begin with one
  if (body.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    BODYROUTE_LOG(Debug, "Body starts with a byte order mark");
    return nullopt;
  }

  // Cheap skip for bodies that cannot contain the field
  if (body.find(key_token_) == std::string::npos) {
    return nullopt;
  }

  json::JsonValue document;
  try {
    document = json::JsonValue::parse(body);
  } catch (const json::JsonException& e) {
    BODYROUTE_LOG(Debug, "Body is not valid JSON: {}", e.what());
    return nullopt;
  }

  if (!document.isObject() || !document.contains(field_name_)) {
    return nullopt;
  }

  json::JsonValue field = document.at(field_name_);
  if (!field.isString()) {
    BODYROUTE_LOG(Debug, "Field '{}' is not a string", field_name_);
    return nullopt;
  }
  return field.getString();
}

optional<std::string> extractField(const std::string& body,
                                   const std::string& field_name) {
  return PayloadExtractor(field_name).extract(body);
}

}  // namespace filter
}  // namespace bodyroute
