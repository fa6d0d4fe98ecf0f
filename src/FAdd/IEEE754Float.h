#ifndef IEEE754_FLOAT_H
#define IEEE754_FLOAT_H

#include <systemc.h>
#include <stdint.h>

// Host float <-> bit pattern, simulation side only (stimulus and reference)

static inline sc_uint<32> float_to_ieee754_bits(float f) {
    union { float f; uint32_t i; } u;
    u.f = f;
    return sc_uint<32>(u.i);
}

static inline float ieee754_bits_to_float(sc_uint<32> ieee) {
    union { float f; uint32_t i; } u;
    u.i = ieee.to_uint();
    return u.f;
}

#endif
