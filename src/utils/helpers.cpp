#include "helpers.h"

#include <NTL/ZZ.h>

namespace eos::utils {

void initField() {
  NTL::ZZ_p::init(NTL::conv<NTL::ZZ>(kFieldModulus));
}

void randomizeZZp(emp::PRG& prg, Field& val) {
  // Extra 16 bytes keep the modular bias negligible.
  auto nbytes = NTL::NumBytes(Field::modulus()) + 16;
  std::vector<unsigned char> buf(nbytes);
  prg.random_data(buf.data(), static_cast<int>(nbytes));
  NTL::ZZ tmp = NTL::ZZFromBytes(buf.data(), nbytes);
  NTL::conv(val, tmp);
}

Field randomField(emp::PRG& prg) {
  Field val;
  randomizeZZp(prg, val);
  return val;
}

Field fieldFromIndex(size_t idx) {
  return NTL::conv<Field>(NTL::conv<NTL::ZZ>(static_cast<unsigned long>(idx)));
}

size_t fieldBytes() {
  return static_cast<size_t>(NTL::NumBytes(Field::modulus()));
}

};  // namespace eos::utils
