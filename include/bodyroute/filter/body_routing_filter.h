/**
 * @file body_routing_filter.h
 * @brief Content-based request routing filter
 *
 * The filter holds a request between its headers and the end of its body,
 * derives a route id from a JSON field in the body and writes it into a
 * request header. The proxy's cached route is then cleared so upstream
 * selection sees the new header.
 *
 * State machine (one instance per request):
 *
 *   AwaitingHeaders --headers, end_stream--------------------> Completed
 *   AwaitingHeaders --headers--> BufferingBody --last chunk--> Completed
 *                                      (decision runs in between, Deciding)
 *
 * Callbacks for one request are sequential and never reentrant, so the
 * filter does no locking. Config, matcher and extractor are shared
 * read-only between requests.
 */

#ifndef BODYROUTE_FILTER_BODY_ROUTING_FILTER_H
#define BODYROUTE_FILTER_BODY_ROUTING_FILTER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "bodyroute/core/compat.h"
#include "bodyroute/filter/body_accumulator.h"
#include "bodyroute/filter/filter_config.h"
#include "bodyroute/filter/filter_host.h"
#include "bodyroute/filter/payload_extractor.h"
#include "bodyroute/filter/rule_matcher.h"
#include "bodyroute/logging/log_message.h"

namespace bodyroute {
namespace filter {

enum class RequestState {
  AwaitingHeaders,
  BufferingBody,
  Deciding,
  Completed
};

const char* toString(RequestState state);

/**
 * Raised when the host invokes callbacks out of order, e.g. body data
 * before any headers.
 */
class FilterStateError : public std::logic_error {
 public:
  FilterStateError(const std::string& callback, RequestState state)
      : std::logic_error(std::string(callback) + " called in state " +
                         toString(state)),
        state_(state) {}

  RequestState state() const { return state_; }

 private:
  RequestState state_;
};

struct RoutingDecision {
  std::string route_id;
  // Extracted signal, absent when the body carried none
  optional<std::string> signal;
};

/**
 * Per-request state, owned by exactly one filter
 */
struct RequestContext {
  explicit RequestContext(const std::string& id, uint64_t max_body_bytes)
      : request_id(id), body(max_body_bytes) {}

  const std::string request_id;
  RequestState state{RequestState::AwaitingHeaders};
  BodyAccumulator body;
  optional<RoutingDecision> decision;
};

/**
 * Scoped per-request diagnostics.
 *
 * Acquired when the filter is created and released exactly once, either
 * when the host signals teardown or when the filter is destroyed.
 */
class RequestScope {
 public:
  RequestScope(const logging::LogContext& log_context,
               const RequestContext& request);
  ~RequestScope();

  RequestScope(const RequestScope&) = delete;
  RequestScope& operator=(const RequestScope&) = delete;

  void release();
  bool released() const { return released_; }

 private:
  const logging::LogContext& log_context_;
  const RequestContext& request_;
  std::chrono::steady_clock::time_point start_;
  bool released_{false};
};

/**
 * Request Lifecycle Controller
 */
class BodyRoutingFilter {
 public:
  BodyRoutingFilter(FilterConfigConstSharedPtr config,
                    std::shared_ptr<const RuleMatcher> matcher,
                    std::shared_ptr<const PayloadExtractor> extractor,
                    RequestFilterHost& host,
                    const std::string& request_id);
  ~BodyRoutingFilter();

  BodyRoutingFilter(const BodyRoutingFilter&) = delete;
  BodyRoutingFilter& operator=(const BodyRoutingFilter&) = delete;

  // Host callbacks. Each throws FilterStateError on an illegal sequence.
  FilterHeadersStatus decodeHeaders(bool end_stream);
  FilterDataStatus decodeData(const std::string& data, bool end_stream);
  FilterTrailersStatus decodeTrailers();

  /**
   * Host signals the request is finished or aborted.
   */
  void onDestroy();

  /**
   * Compute the route for the assembled body. Runs extraction and matching
   * at most once per request; later calls return the stored decision.
   */
  const RoutingDecision& decide();

  RequestState state() const { return context_.state; }
  const std::string& requestId() const { return context_.request_id; }
  const BodyAccumulator& body() const { return context_.body; }
  const optional<RoutingDecision>& decision() const {
    return context_.decision;
  }
  const FilterConfig& config() const { return *config_; }

 private:
  // Deciding -> Completed: write header, then clear the route cache
  void completeRequest();

  RoutingDecision computeDecision() const;

  FilterConfigConstSharedPtr config_;
  std::shared_ptr<const RuleMatcher> matcher_;
  std::shared_ptr<const PayloadExtractor> extractor_;
  RequestFilterHost& host_;

  RequestContext context_;
  logging::LogContext log_context_;
  RequestScope scope_;
};

/**
 * Creates filter instances for one filter chain. Parses the configuration
 * once; every filter it creates shares the result.
 */
class BodyRoutingFilterFactory {
 public:
  explicit BodyRoutingFilterFactory(const std::string& raw_config);
  explicit BodyRoutingFilterFactory(FilterConfig config);

  /**
   * Create the filter for a new request. Uses host.requestId() for
   * correlation, generating a unique id if the host supplies none.
   */
  std::unique_ptr<BodyRoutingFilter> createFilter(RequestFilterHost& host);

  const FilterConfig& config() const { return *config_; }
  const RuleMatcher& matcher() const { return *matcher_; }

 private:
  static std::string generateRequestId();

  FilterConfigConstSharedPtr config_;
  std::shared_ptr<const RuleMatcher> matcher_;
  std::shared_ptr<const PayloadExtractor> extractor_;

  static std::atomic<uint64_t> next_request_id_;
};

}  // namespace filter
}  // namespace bodyroute

#endif  // BODYROUTE_FILTER_BODY_ROUTING_FILTER_H
