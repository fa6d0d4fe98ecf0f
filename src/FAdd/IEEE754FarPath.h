#ifndef IEEE754_FAR_PATH_H
#define IEEE754_FAR_PATH_H

#include <systemc.h>
#include "IEEE754Fields.h"

// Far-path sum for exponent differences of 2 or more.
// Requires exponent(bigger) >= exponent(smaller) and exp_diff == the difference;
// op: false = add, true = subtract.
sc_uint<32> ieee754_add_far(sc_uint<32> bigger, sc_uint<32> smaller, bool op, sc_uint<8> exp_diff);

//==============================================================================
//
// Module: ieee754_far_path
//
SC_MODULE(ieee754_far_path)
{
    sc_in<sc_uint<32> > bigger, smaller;
    sc_in<bool> op;
    sc_in<sc_uint<8> > exp_diff;
    sc_out<sc_uint<32> > result;

    void process();

    SC_CTOR(ieee754_far_path) {
        SC_METHOD(process);
        sensitive << bigger << smaller << op << exp_diff;
    }
};

#endif
