#ifndef IEEE754_CLOSE_PATH_H
#define IEEE754_CLOSE_PATH_H

#include <systemc.h>
#include "IEEE754Fields.h"

// Internal decisions of one close-path evaluation, for waveforms and tests
struct ieee754_close_probe {
    sc_uint<5> predicted;       // leading-zero prediction picked by the subtraction carry
    bool       fix_prediction;  // prediction was one short and was corrected
    bool       sub_fix;         // |smaller| > |bigger|: magnitude negated, sign inverted
    bool       round_up;
};

// Leading-zero anticipation for a - b (a >= b) over the 25-bit close-path frame.
// The result is the exact leading-zero count of a - b or one less.
sc_uint<5> ieee754_lza_predict(sc_uint<IEEE754_CLOSE_WIDTH> a, sc_uint<IEEE754_CLOSE_WIDTH> b);

// Close-path sum for exponent differences of 0 or 1.
// Requires exponent(bigger) >= exponent(smaller); op: false = add, true = subtract.
sc_uint<32> ieee754_add_close(sc_uint<32> bigger, sc_uint<32> smaller, bool op, sc_uint<8> exp_diff);
sc_uint<32> ieee754_add_close(sc_uint<32> bigger, sc_uint<32> smaller, bool op, sc_uint<8> exp_diff,
                              ieee754_close_probe& probe);

//==============================================================================
//
// Module: ieee754_close_path
//
SC_MODULE(ieee754_close_path)
{
    sc_in<sc_uint<32> > bigger, smaller;
    sc_in<bool> op;
    sc_in<sc_uint<8> > exp_diff;
    sc_out<sc_uint<32> > result;

    // Debug outputs
    sc_out<sc_uint<5> > lz_predicted;
    sc_out<bool> lz_fix;

    void process();

    SC_CTOR(ieee754_close_path) {
        SC_METHOD(process);
        sensitive << bigger << smaller << op << exp_diff;
    }
};

#endif
