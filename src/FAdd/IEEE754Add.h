#ifndef IEEE754_ADD_H
#define IEEE754_ADD_H

#include <systemc.h>
#include "IEEE754Fields.h"
#include "IEEE754FarPath.h"
#include "IEEE754ClosePath.h"

enum ieee754_path {
    IEEE754_PATH_CLOSE = 0,     // exp_diff in {0, 1}
    IEEE754_PATH_FAR   = 1      // exp_diff >= 2
};

struct ieee754_order {
    sc_uint<32>  bigger;
    sc_uint<32>  smaller;
    sc_uint<8>   exp_diff;
    bool         swapped;       // b had the larger exponent
    ieee754_path path;
};

// Orders the operands by exponent and picks the datapath. Equal exponents keep a first.
ieee754_order ieee754_order_operands(sc_uint<32> a, sc_uint<32> b, sc_uint<8> exp_a, sc_uint<8> exp_b);
ieee754_order ieee754_select_path(sc_uint<32> a, sc_uint<32> b);

// a + b (subtract == false) or a - b (subtract == true) for normalized finite operands
sc_uint<32> ieee754_add(sc_uint<32> a, sc_uint<32> b, bool subtract);

//==============================================================================
//
// Module: ieee754_path_select
//
SC_MODULE(ieee754_path_select)
{
    sc_in<sc_uint<32> > A, B;
    sc_in<sc_uint<8> > exp_a, exp_b;
    sc_out<sc_uint<32> > bigger, smaller;
    sc_out<sc_uint<8> > exp_diff;
    sc_out<bool> swapped;
    sc_out<bool> far_sel;

    void process();

    SC_CTOR(ieee754_path_select) {
        SC_METHOD(process);
        sensitive << A << B << exp_a << exp_b;
    }
};

//==============================================================================
//
// Module: ieee754_result_mux
//
SC_MODULE(ieee754_result_mux)
{
    sc_in<sc_uint<32> > far_result, close_result;
    sc_in<bool> far_sel;
    sc_in<bool> swapped;
    sc_in<bool> op;
    sc_out<sc_uint<32> > O;

    void process();

    SC_CTOR(ieee754_result_mux) {
        SC_METHOD(process);
        sensitive << far_result << close_result << far_sel << swapped << op;
    }
};

//==============================================================================
//
// Module: ieee754_adder
//
SC_MODULE(ieee754_adder)
{
    sc_in<sc_uint<32> > A, B;
    sc_in<bool> op;                 // 0: add, 1: subtract
    sc_out<sc_uint<32> > O;

    // Warn on operands outside the normalized finite range
    bool check_operands;

    // Internal signals
    sc_signal<bool> sign_a, sign_b;
    sc_signal<sc_uint<8> > exp_a, exp_b;
    sc_signal<sc_uint<23> > mant_a, mant_b;
    sc_signal<sc_uint<32> > bigger, smaller;
    sc_signal<sc_uint<8> > exp_diff;
    sc_signal<bool> swapped, far_sel;
    sc_signal<sc_uint<32> > far_result, close_result;
    sc_signal<sc_uint<5> > lz_predicted;
    sc_signal<bool> lz_fix;

    // Submodules
    ieee754_extractor   *extractA;
    ieee754_extractor   *extractB;
    ieee754_path_select *pathSelect;
    ieee754_far_path    *farPath;
    ieee754_close_path  *closePath;
    ieee754_result_mux  *resultMux;

    void check_process();

    SC_CTOR(ieee754_adder) : check_operands(false) {
        extractA = new ieee754_extractor("extractA");
        extractA->A(A);
        extractA->sign(sign_a);
        extractA->exponent(exp_a);
        extractA->mantissa(mant_a);

        extractB = new ieee754_extractor("extractB");
        extractB->A(B);
        extractB->sign(sign_b);
        extractB->exponent(exp_b);
        extractB->mantissa(mant_b);

        pathSelect = new ieee754_path_select("pathSelect");
        pathSelect->A(A);
        pathSelect->B(B);
        pathSelect->exp_a(exp_a);
        pathSelect->exp_b(exp_b);
        pathSelect->bigger(bigger);
        pathSelect->smaller(smaller);
        pathSelect->exp_diff(exp_diff);
        pathSelect->swapped(swapped);
        pathSelect->far_sel(far_sel);

        farPath = new ieee754_far_path("farPath");
        farPath->bigger(bigger);
        farPath->smaller(smaller);
        farPath->op(op);
        farPath->exp_diff(exp_diff);
        farPath->result(far_result);

        closePath = new ieee754_close_path("closePath");
        closePath->bigger(bigger);
        closePath->smaller(smaller);
        closePath->op(op);
        closePath->exp_diff(exp_diff);
        closePath->result(close_result);
        closePath->lz_predicted(lz_predicted);
        closePath->lz_fix(lz_fix);

        resultMux = new ieee754_result_mux("resultMux");
        resultMux->far_result(far_result);
        resultMux->close_result(close_result);
        resultMux->far_sel(far_sel);
        resultMux->swapped(swapped);
        resultMux->op(op);
        resultMux->O(O);

        SC_METHOD(check_process);
        sensitive << A << B;
        dont_initialize();
    }

    ~ieee754_adder() {
        delete extractA;
        delete extractB;
        delete pathSelect;
        delete farPath;
        delete closePath;
        delete resultMux;
    }
};

#endif
