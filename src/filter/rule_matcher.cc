#include "bodyroute/filter/rule_matcher.h"

#include <utility>

namespace bodyroute {
namespace filter {

namespace {

bool startsWith(const std::string& str, const std::string& prefix) {
  if (prefix.length() > str.length()) {
    return false;
  }
  return str.compare(0, prefix.length(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
  if (suffix.length() > str.length()) {
    return false;
  }
  return str.compare(str.length() - suffix.length(), suffix.length(),
                     suffix) == 0;
}

}  // namespace

const char* toString(MatchType type) {
  switch (type) {
    case MatchType::Contains:
      return "contains";
    case MatchType::Exact:
      return "exact";
    case MatchType::Prefix:
      return "prefix";
    case MatchType::Suffix:
      return "suffix";
  }
  return "unknown";
}

optional<MatchType> parseMatchType(const std::string& name) {
  if (name == "contains") {
    return MatchType::Contains;
  }
  if (name == "exact") {
    return MatchType::Exact;
  }
  if (name == "prefix") {
    return MatchType::Prefix;
  }
  if (name == "suffix") {
    return MatchType::Suffix;
  }
  return nullopt;
}

bool Rule::matches(const std::string& signal) const {
  switch (match) {
    case MatchType::Contains:
      return signal.find(value) != std::string::npos;
    case MatchType::Exact:
      return signal == value;
    case MatchType::Prefix:
      return startsWith(signal, value);
    case MatchType::Suffix:
      return endsWith(signal, value);
  }
  return false;
}

RuleMatcher::RuleMatcher(RuleSet rules, std::string default_route)
    : rules_(std::move(rules)), default_route_(std::move(default_route)) {}

const std::string& RuleMatcher::match(
    const optional<std::string>& signal) const {
  if (!signal.has_value()) {
    return default_route_;
  }
  for (const auto& rule : rules_) {
    if (rule.matches(*signal)) {
      return rule.route_id;
    }
  }
  return default_route_;
}

RuleSet RuleMatcher::defaultRules() {
  Rule echo2;
  echo2.match = MatchType::Contains;
  echo2.value = "echo2";
  echo2.route_id = "echo2";
  return RuleSet{echo2};
}

std::string matchRoute(const optional<std::string>& signal,
                       const RuleSet& rules,
                       const std::string& default_route) {
  return RuleMatcher(rules, default_route).match(signal);
}

}  // namespace filter
}  // namespace bodyroute
