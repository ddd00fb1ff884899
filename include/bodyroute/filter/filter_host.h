/**
 * @file filter_host.h
 * @brief Boundary between the routing filter and the proxy that hosts it
 *
 * The proxy drives a filter through its decode callbacks and interprets the
 * returned status to pause, buffer or resume the request stream. Everything
 * the filter needs from the proxy goes through RequestFilterHost.
 */

#ifndef BODYROUTE_FILTER_FILTER_HOST_H
#define BODYROUTE_FILTER_FILTER_HOST_H

#include <string>

#include "bodyroute/core/compat.h"

namespace bodyroute {
namespace filter {

/**
 * Status returned from decodeHeaders()
 */
enum class FilterHeadersStatus {
  Continue,      // Continue to further filters and upstream selection
  StopIteration  // Hold the request; no upstream connection yet
};

/**
 * Status returned from decodeData()
 */
enum class FilterDataStatus {
  Continue,               // Resume normal processing
  StopIterationAndBuffer  // Keep holding the request and buffer the body
};

/**
 * Status returned from decodeTrailers()
 */
enum class FilterTrailersStatus {
  Continue
};

/**
 * Per-request services the proxy exposes to a filter instance.
 *
 * Implementations report failures by throwing; the filter does not mask
 * them, since it cannot make a routing decision without these primitives.
 */
class RequestFilterHost {
 public:
  virtual ~RequestFilterHost() = default;

  /**
   * Correlation id the proxy assigned to this request, or empty if the
   * proxy does not assign one.
   */
  virtual std::string requestId() const = 0;

  virtual optional<std::string> getRequestHeader(
      const std::string& name) const = 0;

  /**
   * Set a request header, replacing any existing value.
   */
  virtual void setRequestHeader(const std::string& name,
                                const std::string& value) = 0;

  /**
   * Discard any upstream selection computed for this request so the
   * routing table is matched again against the current headers.
   */
  virtual void clearRouteCache() = 0;
};

const char* toString(FilterHeadersStatus status);
const char* toString(FilterDataStatus status);

}  // namespace filter
}  // namespace bodyroute

#endif  // BODYROUTE_FILTER_FILTER_HOST_H
