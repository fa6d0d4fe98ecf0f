#ifndef IEEE754_FIELDS_H
#define IEEE754_FIELDS_H

#include <systemc.h>

// ---------------- Single-precision format ----------------
#define IEEE754_WIDTH           32
#define IEEE754_SIGN_BIT        31
#define IEEE754_EXP_HIGH        30
#define IEEE754_EXP_LOW         23
#define IEEE754_MANT_HIGH       22
#define IEEE754_MANT_LOW        0
#define IEEE754_EXP_WIDTH       8
#define IEEE754_MANT_WIDTH      23
#define IEEE754_SIG_WIDTH       24      // hidden bit + fraction
#define IEEE754_BIAS            127
#define IEEE754_EXP_MAX         0xFF

// ---------------- Far path ----------------
#define IEEE754_GRS_WIDTH       3
#define IEEE754_FAR_WIDTH       27      // significand + guard/round/sticky
#define IEEE754_ALIGN_WIDTH     32      // alignment window below the significand
#define IEEE754_EXT_MANT_WIDTH  56      // significand + alignment window
#define IEEE754_LARGE_SHIFT_HIGH 7      // exp_diff[7:5] != 0 -> shift of 32 or more
#define IEEE754_LARGE_SHIFT_LOW  5

// ---------------- Close path ----------------
#define IEEE754_CLOSE_WIDTH     25      // significand + one alignment bit
#define IEEE754_LZA_WIDTH       24

struct ieee754_fields {
    bool        sign;
    sc_uint<8>  exponent;   // biased
    sc_uint<23> mantissa;   // fraction, hidden bit not included
};

static inline ieee754_fields ieee754_breakdown(sc_uint<32> value) {
    ieee754_fields f;
    f.sign     = value[IEEE754_SIGN_BIT];
    f.exponent = value.range(IEEE754_EXP_HIGH, IEEE754_EXP_LOW);
    f.mantissa = value.range(IEEE754_MANT_HIGH, IEEE754_MANT_LOW);
    return f;
}

static inline sc_uint<32> ieee754_compose(bool sign, sc_uint<8> exponent, sc_uint<23> mantissa) {
    return (sc_uint<32>(sign) << IEEE754_SIGN_BIT) |
           (sc_uint<32>(exponent) << IEEE754_EXP_LOW) |
           sc_uint<32>(mantissa);
}

// 24-bit significand with the hidden 1 in front of the fraction
static inline sc_uint<24> ieee754_significand(const ieee754_fields& f) {
    return (sc_uint<24>(1) << IEEE754_MANT_WIDTH) | sc_uint<24>(f.mantissa);
}

static inline sc_uint<32> ieee754_flip_sign(sc_uint<32> value) {
    return value ^ (sc_uint<32>(1) << IEEE754_SIGN_BIT);
}

// Normalized finite operand: exponent in [1, 254]
static inline bool ieee754_is_normal(sc_uint<32> value) {
    sc_uint<8> exp = value.range(IEEE754_EXP_HIGH, IEEE754_EXP_LOW);
    return exp != 0 && exp != IEEE754_EXP_MAX;
}

// src1 + src2 + cin over W bits, carry-out returned separately.
// Subtraction is src1 + ~src2 + 1.
template <int W>
static inline sc_uint<W> ieee754_carry_add(sc_uint<W> src1, sc_uint<W> src2, bool cin, bool& carry) {
    sc_uint<W + 1> full = sc_uint<W + 1>(src1) + sc_uint<W + 1>(src2) + sc_uint<W + 1>(cin);
    carry = full[W];
    return full.range(W - 1, 0);
}

// Biased exponent plus a signed normalization adjustment, wrapping at 8 bits
static inline sc_uint<8> ieee754_adjust_exponent(sc_uint<8> exponent, sc_int<7> adjust) {
    return sc_uint<8>(exponent.to_int() + adjust.to_int());
}

//==============================================================================
//
// Module: ieee754_extractor
//
SC_MODULE(ieee754_extractor)
{
    sc_in<sc_uint<32> > A;
    sc_out<bool> sign;
    sc_out<sc_uint<8> > exponent;
    sc_out<sc_uint<23> > mantissa;

    void process() {
        ieee754_fields f = ieee754_breakdown(A.read());
        sign.write(f.sign);
        exponent.write(f.exponent);
        mantissa.write(f.mantissa);
    }

    SC_CTOR(ieee754_extractor) {
        SC_METHOD(process);
        sensitive << A;
    }
};

#endif
