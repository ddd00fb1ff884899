#include "bodyroute/filter/filter_host.h"

namespace bodyroute {
namespace filter {

const char* toString(FilterHeadersStatus status) {
  switch (status) {
    case FilterHeadersStatus::Continue:
      return "Continue";
    case FilterHeadersStatus::StopIteration:
      return "StopIteration";
  }
  return "Unknown";
}

const char* toString(FilterDataStatus status) {
  switch (status) {
    case FilterDataStatus::Continue:
      return "Continue";
    case FilterDataStatus::StopIterationAndBuffer:
      return "StopIterationAndBuffer";
  }
  return "Unknown";
}

}  // namespace filter
}  // namespace bodyroute
