/**
 * Filter Configuration Implementation
 *
 * Parsing is permissive at the top level: any failure is logged and the
 * default configuration is used, so a bad config string never prevents the
 * filter chain from being instantiated.
 */

#include "bodyroute/filter/filter_config.h"

#include <algorithm>
#include <cctype>

#include "bodyroute/config/parse_error.h"

#define BODYROUTE_LOG_COMPONENT "config.filter"
#include "bodyroute/logging/log_macros.h"

namespace bodyroute {
namespace filter {

namespace {

bool isBlank(const std::string& raw) {
  return std::all_of(raw.begin(), raw.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

std::string requireNonEmptyString(const json::JsonValue& value,
                                  const config::ParseContext& ctx) {
  if (!value.isString()) {
    throw ctx.createError("expected a string");
  }
  std::string result = value.getString();
  if (result.empty()) {
    throw ctx.createError("must not be empty");
  }
  return result;
}

Rule parseRule(const json::JsonValue& value, config::ParseContext& ctx) {
  if (!value.isObject()) {
    throw ctx.createError("rule must be an object");
  }

  Rule rule;
  if (value.contains("match")) {
    config::ParseContext::FieldScope scope(ctx, "match");
    json::JsonValue match = value.at("match");
    if (!match.isString()) {
      throw ctx.createError("expected a string");
    }
    auto type = parseMatchType(match.getString());
    if (!type.has_value()) {
      throw ctx.createError("unknown match type '" + match.getString() + "'");
    }
    rule.match = *type;
  }

  {
    config::ParseContext::FieldScope scope(ctx, "value");
    if (!value.contains("value") || !value.at("value").isString()) {
      throw ctx.createError("expected a string");
    }
    rule.value = value.at("value").getString();
  }

  {
    config::ParseContext::FieldScope scope(ctx, "route");
    if (!value.contains("route")) {
      throw ctx.createError("required field is missing");
    }
    rule.route_id = requireNonEmptyString(value.at("route"), ctx);
  }

  return rule;
}

}  // namespace

FilterConfig FilterConfig::parse(const std::string& raw) {
  if (isBlank(raw)) {
    BODYROUTE_LOG(Debug, "Empty filter config, using defaults");
    return FilterConfig();
  }

  try {
    FilterConfig config = fromJson(json::JsonValue::parse(raw));
    BODYROUTE_LOG(Debug, "Parsed filter config: debug={} rules={}",
                  config.debug, config.rules.size());
    return config;
  } catch (const json::JsonException& e) {
    BODYROUTE_LOG(Warning, "Error parsing filter config, using defaults: {}",
                  e.what());
  } catch (const config::ConfigParseError& e) {
    BODYROUTE_LOG(Warning, "Invalid filter config, using defaults: {}",
                  e.what());
  }
  return FilterConfig();
}

FilterConfig FilterConfig::fromJson(const json::JsonValue& value) {
  config::ParseContext ctx;
  if (!value.isObject()) {
    throw ctx.createError("filter config must be a JSON object");
  }

  FilterConfig config;

  if (value.contains("debug")) {
    config::ParseContext::FieldScope scope(ctx, "debug");
    json::JsonValue debug = value.at("debug");
    if (!debug.isBoolean()) {
      throw ctx.createError("expected a boolean");
    }
    config.debug = debug.getBool();
  }

  if (value.contains("field")) {
    config::ParseContext::FieldScope scope(ctx, "field");
    config.field_name = requireNonEmptyString(value.at("field"), ctx);
  }

  if (value.contains("header")) {
    config::ParseContext::FieldScope scope(ctx, "header");
    config.route_header = requireNonEmptyString(value.at("header"), ctx);
  }

  if (value.contains("default_route")) {
    config::ParseContext::FieldScope scope(ctx, "default_route");
    config.default_route =
        requireNonEmptyString(value.at("default_route"), ctx);
  }

  if (value.contains("rules")) {
    config::ParseContext::FieldScope scope(ctx, "rules");
    json::JsonValue rules = value.at("rules");
    if (!rules.isArray()) {
      throw ctx.createError("expected an array");
    }
    RuleSet parsed;
    parsed.reserve(rules.size());
    for (size_t i = 0; i < rules.size(); ++i) {
      config::ParseContext::FieldScope index_scope(ctx, std::to_string(i));
      parsed.push_back(parseRule(rules[i], ctx));
    }
    config.rules = std::move(parsed);
  }

  if (value.contains("max_body_bytes")) {
    config::ParseContext::FieldScope scope(ctx, "max_body_bytes");
    json::JsonValue limit = value.at("max_body_bytes");
    if (!limit.isInteger()) {
      throw ctx.createError("expected a non-negative integer");
    }
    if (!limit.isUnsigned()) {
      throw ctx.createError("must not be negative");
    }
    config.max_body_bytes = limit.getUInt64();
  }

  return config;
}

json::JsonValue FilterConfig::toJson() const {
  json::JsonArrayBuilder rule_array;
  for (const auto& rule : rules) {
    rule_array.add(json::JsonObjectBuilder()
                       .add("match", toString(rule.match))
                       .add("value", rule.value)
                       .add("route", rule.route_id)
                       .build());
  }

  return json::JsonObjectBuilder()
      .add("debug", debug)
      .add("field", field_name)
      .add("header", route_header)
      .add("default_route", default_route)
      .add("rules", rule_array.build())
      .add("max_body_bytes",
           json::JsonValue(static_cast<uint64_t>(max_body_bytes)))
      .build();
}

}  // namespace filter
}  // namespace bodyroute
