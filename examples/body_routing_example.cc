/**
 * @file body_routing_example.cc
 * @brief Drives the body routing filter with a simulated proxy
 *
 * This example demonstrates how to:
 * 1. Create a filter factory from a configuration string
 * 2. Create one filter per request against a host
 * 3. Feed headers and chunked bodies through the decode callbacks
 * 4. Read back the route header the filter wrote
 *
 * Usage: body_routing_example [config-json] [filter-log-level]
 */

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "bodyroute/filter/body_routing_filter.h"
#include "bodyroute/logging/logger_registry.h"

using namespace bodyroute;

// ============================================================================
// Simulated Proxy
// ============================================================================

// Per-request host backed by a header map
class SimulatedRequest : public filter::RequestFilterHost {
 public:
  explicit SimulatedRequest(const std::string& id) : id_(id) {}

  std::string requestId() const override { return id_; }

  optional<std::string> getRequestHeader(
      const std::string& name) const override {
    auto it = headers_.find(name);
    if (it == headers_.end()) {
      return nullopt;
    }
    return it->second;
  }

  void setRequestHeader(const std::string& name,
                        const std::string& value) override {
    headers_[name] = value;
  }

  void clearRouteCache() override { ++route_cache_clears_; }

  int routeCacheClears() const { return route_cache_clears_; }

 private:
  std::string id_;
  std::map<std::string, std::string> headers_;
  int route_cache_clears_{0};
};

struct ExampleRequest {
  std::string name;
  bool has_body;
  std::vector<std::string> chunks;
};

void runRequest(filter::BodyRoutingFilterFactory& factory,
                const ExampleRequest& request) {
  SimulatedRequest host(request.name);
  auto routing_filter = factory.createFilter(host);

  auto headers_status = routing_filter->decodeHeaders(!request.has_body);
  std::cout << "[" << request.name << "] headers -> "
            << filter::toString(headers_status) << std::endl;

  for (size_t i = 0; i < request.chunks.size(); ++i) {
    bool last = (i + 1 == request.chunks.size());
    auto data_status = routing_filter->decodeData(request.chunks[i], last);
    std::cout << "[" << request.name << "] chunk " << i << " ("
              << request.chunks[i].size() << " bytes) -> "
              << filter::toString(data_status) << std::endl;
  }

  routing_filter->onDestroy();

  const std::string& header = factory.config().route_header;
  auto route = host.getRequestHeader(header);
  std::cout << "[" << request.name << "] " << header << ": "
            << (route ? *route : "<unset>")
            << " (route cache cleared " << host.routeCacheClears()
            << "x)" << std::endl;
}

int main(int argc, char** argv) {
  logging::LogLevel filter_level =
      argc > 2 ? logging::stringToLogLevel(argv[2]) : logging::LogLevel::Debug;
  logging::LoggerRegistry::instance().setPattern("filter.*", filter_level);

  std::string config = argc > 1 ? argv[1] : "{\"debug\": true}";
  filter::BodyRoutingFilterFactory factory(config);

  std::vector<ExampleRequest> requests = {
      {"echo2-single", true, {R"({"method":"invoke_echo2_service"})"}},
      {"echo1-single", true, {R"({"method":"invoke_echo1"})"}},
      {"echo2-chunked", true, {R"({"jsonrpc":"2.0",)", R"("method":"ec)",
                               R"(ho2/ping","id":1})"}},
      {"empty-object", true, {"{}"}},
      {"not-json", true, {"not json at all"}},
      {"no-body", false, {}},
  };

  try {
    for (const auto& request : requests) {
      runRequest(factory, request);
    }
  } catch (const filter::FilterStateError& e) {
    std::cerr << "Filter error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
