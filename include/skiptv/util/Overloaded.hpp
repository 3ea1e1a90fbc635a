// Repository: SkipTV
// Component: Overloaded
// Purpose: Builds a std::visit visitor from a set of lambdas.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_UTIL_OVERLOADED_HPP_
#define SKIPTV_UTIL_OVERLOADED_HPP_

namespace skiptv::util {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace skiptv::util

#endif  // SKIPTV_UTIL_OVERLOADED_HPP_
