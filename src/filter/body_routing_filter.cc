/**
 * Body Routing Filter Implementation
 *
 * Drives the per-request state machine from the host's decode callbacks.
 * The request is held from the header event until the last body chunk so
 * that the route header is in place before upstream selection runs.
 */

#include "bodyroute/filter/body_routing_filter.h"

#include <utility>

#define BODYROUTE_LOG_COMPONENT "filter.body_routing"
#include "bodyroute/logging/log_macros.h"

// Lifecycle diagnostics; the debug config flag promotes them to Info
#define ROUTING_TRACE(...)                                         \
  do {                                                             \
    if (config_->debug) {                                          \
      BODYROUTE_LOG_WITH_CONTEXT(Info, log_context_, __VA_ARGS__); \
    } else {                                                       \
      BODYROUTE_LOG_WITH_CONTEXT(Debug, log_context_, __VA_ARGS__); \
    }                                                              \
  } while (0)

namespace bodyroute {
namespace filter {

const char* toString(RequestState state) {
  switch (state) {
    case RequestState::AwaitingHeaders:
      return "AwaitingHeaders";
    case RequestState::BufferingBody:
      return "BufferingBody";
    case RequestState::Deciding:
      return "Deciding";
    case RequestState::Completed:
      return "Completed";
  }
  return "Unknown";
}

namespace {

logging::LogContext makeLogContext(const std::string& request_id) {
  logging::LogContext context;
  context.request_id = request_id;
  context.component = logging::Component::Filter;
  context.component_name = "body_routing";
  return context;
}

}  // namespace

// ===== RequestScope =====

RequestScope::RequestScope(const logging::LogContext& log_context,
                           const RequestContext& request)
    : log_context_(log_context),
      request_(request),
      start_(std::chrono::steady_clock::now()) {
  BODYROUTE_LOG_WITH_CONTEXT(Debug, log_context_, "Request scope opened");
}

RequestScope::~RequestScope() { release(); }

void RequestScope::release() {
  if (released_) {
    return;
  }
  released_ = true;

  auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start_);
  BODYROUTE_LOG_WITH_CONTEXT(
      Debug, log_context_,
      "Request scope released: state={} body_bytes={} chunks={} elapsed_us={}",
      toString(request_.state), request_.body.bytesReceived(),
      request_.body.chunkCount(), elapsed.count());
}

// ===== BodyRoutingFilter =====

BodyRoutingFilter::BodyRoutingFilter(
    FilterConfigConstSharedPtr config,
    std::shared_ptr<const RuleMatcher> matcher,
    std::shared_ptr<const PayloadExtractor> extractor,
    RequestFilterHost& host,
    const std::string& request_id)
    : config_(std::move(config)),
      matcher_(std::move(matcher)),
      extractor_(std::move(extractor)),
      host_(host),
      context_(request_id, config_->max_body_bytes),
      log_context_(makeLogContext(request_id)),
      scope_(log_context_, context_) {}

BodyRoutingFilter::~BodyRoutingFilter() = default;

FilterHeadersStatus BodyRoutingFilter::decodeHeaders(bool end_stream) {
  if (context_.state != RequestState::AwaitingHeaders) {
    throw FilterStateError("decodeHeaders", context_.state);
  }

  ROUTING_TRACE("decodeHeaders end_stream={}", end_stream);

  if (end_stream) {
    // No body will follow; route on the default without pausing
    context_.body.seal();
    context_.state = RequestState::Deciding;
    completeRequest();
    return FilterHeadersStatus::Continue;
  }

  // Hold the request so upstream selection waits for the route header
  context_.state = RequestState::BufferingBody;
  return FilterHeadersStatus::StopIteration;
}

FilterDataStatus BodyRoutingFilter::decodeData(const std::string& data,
                                               bool end_stream) {
  switch (context_.state) {
    case RequestState::AwaitingHeaders:
    case RequestState::Deciding:
      throw FilterStateError("decodeData", context_.state);
    case RequestState::Completed:
      ROUTING_TRACE("decodeData after completion ignored: {} bytes",
                    data.size());
      return FilterDataStatus::Continue;
    case RequestState::BufferingBody:
      break;
  }

  context_.body.append(data, end_stream);
  ROUTING_TRACE("decodeData chunk={} bytes total={} end_stream={}",
                data.size(), context_.body.bytesReceived(), end_stream);

  if (!end_stream) {
    return FilterDataStatus::StopIterationAndBuffer;
  }

  context_.state = RequestState::Deciding;
  completeRequest();
  return FilterDataStatus::Continue;
}

FilterTrailersStatus BodyRoutingFilter::decodeTrailers() {
  switch (context_.state) {
    case RequestState::AwaitingHeaders:
    case RequestState::Deciding:
      throw FilterStateError("decodeTrailers", context_.state);
    case RequestState::Completed:
      return FilterTrailersStatus::Continue;
    case RequestState::BufferingBody:
      break;
  }

  // Trailers terminate the body
  ROUTING_TRACE("decodeTrailers ends body at {} bytes",
                context_.body.bytesReceived());
  context_.body.seal();
  context_.state = RequestState::Deciding;
  completeRequest();
  return FilterTrailersStatus::Continue;
}

void BodyRoutingFilter::onDestroy() {
  if (context_.state == RequestState::BufferingBody) {
    ROUTING_TRACE("Request torn down while buffering body ({} bytes)",
                  context_.body.bytesReceived());
  }
  scope_.release();
}

const RoutingDecision& BodyRoutingFilter::decide() {
  if (context_.state != RequestState::Deciding &&
      context_.state != RequestState::Completed) {
    throw FilterStateError("decide", context_.state);
  }
  if (!context_.decision.has_value()) {
    context_.decision = computeDecision();
  }
  return *context_.decision;
}

RoutingDecision BodyRoutingFilter::computeDecision() const {
  RoutingDecision decision;
  const BodyAccumulator& body = context_.body;

  if (body.overflowed()) {
    BODYROUTE_LOG_WITH_CONTEXT(
        Warning, log_context_,
        "Body of {} bytes exceeds limit of {} bytes, using default route",
        body.bytesReceived(), config_->max_body_bytes);
    decision.route_id = matcher_->defaultRoute();
    return decision;
  }

  try {
    decision.signal = extractor_->extract(body.data());
    decision.route_id = matcher_->match(decision.signal);
  } catch (const std::exception& e) {
    BODYROUTE_LOG_WITH_CONTEXT(Error, log_context_,
                               "Route decision failed, using default: {}",
                               e.what());
    decision.signal = nullopt;
    decision.route_id = matcher_->defaultRoute();
  }
  return decision;
}

void BodyRoutingFilter::completeRequest() {
  const RoutingDecision& decision = decide();

  log_context_.route_id = decision.route_id;
  log_context_.bytes_processed = context_.body.bytesReceived();
  ROUTING_TRACE("Routing decision: {}={} signal={}", config_->route_header,
                decision.route_id,
                decision.signal.has_value() ? *decision.signal : "<none>");

  host_.setRequestHeader(config_->route_header, decision.route_id);
  // Upstream selection may already have run on stale headers
  host_.clearRouteCache();

  context_.state = RequestState::Completed;
}

// ===== BodyRoutingFilterFactory =====

std::atomic<uint64_t> BodyRoutingFilterFactory::next_request_id_{1};

BodyRoutingFilterFactory::BodyRoutingFilterFactory(
    const std::string& raw_config)
    : BodyRoutingFilterFactory(FilterConfig::parse(raw_config)) {}

BodyRoutingFilterFactory::BodyRoutingFilterFactory(FilterConfig config)
    : config_(std::make_shared<const FilterConfig>(std::move(config))),
      matcher_(std::make_shared<const RuleMatcher>(config_->rules,
                                                   config_->default_route)),
      extractor_(
          std::make_shared<const PayloadExtractor>(config_->field_name)) {
  BODYROUTE_LOG(Info,
                "Body routing filter chain created: field={} header={} "
                "default_route={} rules={} max_body_bytes={} debug={}",
                config_->field_name, config_->route_header,
                config_->default_route, config_->rules.size(),
                config_->max_body_bytes, config_->debug);
}

std::unique_ptr<BodyRoutingFilter> BodyRoutingFilterFactory::createFilter(
    RequestFilterHost& host) {
  std::string request_id = host.requestId();
  if (request_id.empty()) {
    request_id = generateRequestId();
  }
  return std::make_unique<BodyRoutingFilter>(config_, matcher_, extractor_,
                                             host, request_id);
}

std::string BodyRoutingFilterFactory::generateRequestId() {
  return "req-" + std::to_string(next_request_id_.fetch_add(1));
}

}  // namespace filter
}  // namespace bodyroute
