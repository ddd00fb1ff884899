#ifndef BODYROUTE_COMPAT_H
#define BODYROUTE_COMPAT_H

#include <optional>

namespace bodyroute {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

}  // namespace bodyroute

#endif  // BODYROUTE_COMPAT_H
