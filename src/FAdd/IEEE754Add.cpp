#include "IEEE754Add.h"
#include <sstream>

typedef sc_uint<32> (*ieee754_path_fn)(sc_uint<32>, sc_uint<32>, bool, sc_uint<8>);

// Indexed by ieee754_path
static const ieee754_path_fn path_table[2] = {
    ieee754_add_close,
    ieee754_add_far
};

ieee754_order ieee754_order_operands(sc_uint<32> a, sc_uint<32> b, sc_uint<8> exp_a, sc_uint<8> exp_b)
{
    // Both differences in parallel; the carry of a - b tells which one is non-negative
    bool carry_ab, carry_ba;
    sc_uint<8> diff_ab = ieee754_carry_add<IEEE754_EXP_WIDTH>(exp_a, sc_uint<8>(~exp_b), true, carry_ab);
    sc_uint<8> diff_ba = ieee754_carry_add<IEEE754_EXP_WIDTH>(exp_b, sc_uint<8>(~exp_a), true, carry_ba);

    ieee754_order order;
    order.swapped  = !carry_ab;
    order.bigger   = order.swapped ? b : a;
    order.smaller  = order.swapped ? a : b;
    order.exp_diff = order.swapped ? diff_ba : diff_ab;
    order.path     = order.exp_diff.range(IEEE754_EXP_WIDTH - 1, 1).or_reduce() ? IEEE754_PATH_FAR : IEEE754_PATH_CLOSE;
    return order;
}

ieee754_order ieee754_select_path(sc_uint<32> a, sc_uint<32> b)
{
    ieee754_fields fa = ieee754_breakdown(a);
    ieee754_fields fb = ieee754_breakdown(b);
    return ieee754_order_operands(a, b, fa.exponent, fb.exponent);
}

sc_uint<32> ieee754_add(sc_uint<32> a, sc_uint<32> b, bool subtract)
{
    ieee754_order order = ieee754_select_path(a, b);
    sc_uint<32> result = path_table[order.path](order.bigger, order.smaller, subtract, order.exp_diff);

    // a - b == -(b - a)
    if (order.swapped && subtract)
        result = ieee754_flip_sign(result);
    return result;
}

void ieee754_path_select::process()
{
    ieee754_order order = ieee754_order_operands(A.read(), B.read(), exp_a.read(), exp_b.read());
    bigger.write(order.bigger);
    smaller.write(order.smaller);
    exp_diff.write(order.exp_diff);
    swapped.write(order.swapped);
    far_sel.write(order.path == IEEE754_PATH_FAR);
}

void ieee754_result_mux::process()
{
    sc_uint<32> result = far_sel.read() ? far_result.read() : close_result.read();
    if (swapped.read() && op.read())
        result = ieee754_flip_sign(result);
    O.write(result);
}

void ieee754_adder::check_process()
{
    if (!check_operands)
        return;

    if (!ieee754_is_normal(A.read()) || !ieee754_is_normal(B.read())) {
        std::ostringstream msg;
        msg << "operand outside the normalized finite range: A=0x" << std::hex << A.read().to_uint()
            << " B=0x" << B.read().to_uint() << ", result unspecified";
        SC_REPORT_WARNING("fadd/adder", msg.str().c_str());
    }
}
