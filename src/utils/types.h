#pragma once

#include <NTL/ZZ.h>
#include <NTL/ZZ_p.h>

namespace eos::utils {

// All protocol values live in the scalar field of BLS12-381.
using Field = NTL::ZZ_p;

constexpr char kFieldModulus[] =
    "52435875175126190479447740508185965837690552500527637822603658699938581184513";

};  // namespace eos::utils
