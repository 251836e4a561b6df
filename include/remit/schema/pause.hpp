#pragma once
#include <remit/schema/primitives.hpp>

// Schema type: pause / unpause.
// Governance workflow: circuit breaker toggles for the settlement entry point.
namespace remit::schema {

template <uint16_t Version>
struct pause;

template <>
struct pause<1> final {
  uint16_t version{1};
};

using pause_t = pause<1>;

template <uint16_t Version>
struct unpause;

template <>
struct unpause<1> final {
  uint16_t version{1};
};

using unpause_t = unpause<1>;

}  // namespace remit::schema
