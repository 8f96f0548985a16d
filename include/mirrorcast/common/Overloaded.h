// Repository: MirrorCast
// Component: Common
// Purpose: Lambda overload set for exhaustive std::visit over status variants.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_COMMON_OVERLOADED_H_
#define MIRRORCAST_COMMON_OVERLOADED_H_

namespace mirrorcast {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace mirrorcast

#endif  // MIRRORCAST_COMMON_OVERLOADED_H_
