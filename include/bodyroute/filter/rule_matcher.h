#ifndef BODYROUTE_FILTER_RULE_MATCHER_H
#define BODYROUTE_FILTER_RULE_MATCHER_H

#include <string>
#include <vector>

#include "bodyroute/core/compat.h"

namespace bodyroute {
namespace filter {

/**
 * How a rule's value is compared against the extracted signal
 */
enum class MatchType { Contains, Exact, Prefix, Suffix };

const char* toString(MatchType type);

/**
 * Parse "contains" / "exact" / "prefix" / "suffix".
 * Returns nullopt for anything else.
 */
optional<MatchType> parseMatchType(const std::string& name);

/**
 * A single routing rule: predicate over the signal plus target route
 */
struct Rule {
  MatchType match{MatchType::Contains};
  std::string value;
  std::string route_id;

  bool matches(const std::string& signal) const;
};

using RuleSet = std::vector<Rule>;

/**
 * Rule Matcher
 *
 * Evaluates rules in declared order against the extracted signal. The first
 * matching rule wins; an absent signal or no match yields the default route.
 * Immutable after construction and safe to share between requests.
 */
class RuleMatcher {
 public:
  RuleMatcher(RuleSet rules, std::string default_route);

  const std::string& match(const optional<std::string>& signal) const;

  const RuleSet& rules() const { return rules_; }
  const std::string& defaultRoute() const { return default_route_; }

  /**
   * Built-in rule list: signal containing "echo2" routes to "echo2".
   */
  static RuleSet defaultRules();

 private:
  const RuleSet rules_;
  const std::string default_route_;
};

/**
 * Stateless form of RuleMatcher::match().
 */
std::string matchRoute(const optional<std::string>& signal,
                       const RuleSet& rules,
                       const std::string& default_route);

}  // namespace filter
}  // namespace bodyroute

#endif  // BODYROUTE_FILTER_RULE_MATCHER_H
