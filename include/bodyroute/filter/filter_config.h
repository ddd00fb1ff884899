#ifndef BODYROUTE_FILTER_FILTER_CONFIG_H
#define BODYROUTE_FILTER_FILTER_CONFIG_H

#include <cstdint>
#include <memory>
#include <string>

#include "bodyroute/filter/rule_matcher.h"
#include "bodyroute/json/json_bridge.h"

namespace bodyroute {
namespace filter {

constexpr char kDefaultSignalField[] = "method";
constexpr char kDefaultRouteHeader[] = "x-route-to";
constexpr char kDefaultRoute[] = "echo1";

/**
 * Filter Configuration
 *
 * Created once per filter chain from the configuration string supplied at
 * setup and shared read-only by every request the chain handles.
 *
 * Recognized keys (all optional, unknown keys are ignored):
 * ```json
 * {
 *   "debug": false,
 *   "field": "method",
 *   "header": "x-route-to",
 *   "default_route": "echo1",
 *   "rules": [{"match": "contains", "value": "echo2", "route": "echo2"}],
 *   "max_body_bytes": 0
 * }
 * ```
 */
struct FilterConfig {
  // Raises diagnostic verbosity only; never changes routing
  bool debug{false};

  // Top-level JSON field carrying the routing signal
  std::string field_name{kDefaultSignalField};

  // Request header receiving the route id
  std::string route_header{kDefaultRouteHeader};

  std::string default_route{kDefaultRoute};

  RuleSet rules{RuleMatcher::defaultRules()};

  // 0 means unbounded
  uint64_t max_body_bytes{0};

  /**
   * Parse configuration text. Never fails: empty, malformed or mis-shaped
   * input yields the default configuration.
   */
  static FilterConfig parse(const std::string& raw);

  /**
   * Strict form used by parse().
   * @throws config::ConfigParseError if a recognized key is invalid or the
   * document is not an object
   */
  static FilterConfig fromJson(const json::JsonValue& value);

  json::JsonValue toJson() const;
};

using FilterConfigConstSharedPtr = std::shared_ptr<const FilterConfig>;

}  // namespace filter
}  // namespace bodyroute

#endif  // BODYROUTE_FILTER_FILTER_CONFIG_H
