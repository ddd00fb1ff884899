#ifndef BODYROUTE_FILTER_PAYLOAD_EXTRACTOR_H
#define BODYROUTE_FILTER_PAYLOAD_EXTRACTOR_H

#include <string>

#include "bodyroute/core/compat.h"

namespace bodyroute {
namespace filter {

/**
 * Payload Extractor
 *
 * Pulls a named top-level string field out of a JSON request body. Any
 * body that is not valid UTF-8, starts with a byte order mark, is not a
 * JSON object, or lacks a string-typed field yields no signal. Extraction
 * never throws.
 */
class PayloadExtractor {
 public:
  explicit PayloadExtractor(const std::string& field_name);

  optional<std::string> extract(const std::string& body) const;

  const std::string& fieldName() const { return field_name_; }

 private:
  std::string field_name_;
  // Quoted key token used for the containment check before parsing
  std::string key_token_;
};

/**
 * One-shot form of PayloadExtractor::extract().
 */
optional<std::string> extractField(const std::string& body,
                                   const std::string& field_name);

/**
 * True if data is well-formed UTF-8 (no overlongs, surrogates or code
 * points above U+10FFFF).
 */
bool isValidUtf8(const std::string& data);

}  // namespace filter
}  // namespace bodyroute

#endif  // BODYROUTE_FILTER_PAYLOAD_EXTRACTOR_H
