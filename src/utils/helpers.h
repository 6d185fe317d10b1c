#pragma once

#include <NTL/ZZ_p.h>
#include <emp-tool/emp-tool.h>

#include <cstddef>
#include <vector>

#include "types.h"

namespace eos::utils {

// Sets the ZZ_p modulus. NTL keeps it per thread, so every thread doing field
// arithmetic has to call this first.
void initField();

// Samples a uniform field element from the given PRG.
void randomizeZZp(emp::PRG& prg, Field& val);

Field randomField(emp::PRG& prg);

// Embeds a party index or evaluation point into the field.
Field fieldFromIndex(size_t idx);

// Serialized size of a field element, used for communication accounting.
size_t fieldBytes();
};  // namespace eos::utils
