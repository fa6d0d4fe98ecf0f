#include "IEEE754ClosePath.h"

template <int W>
static sc_uint<5> leading_zeros(sc_uint<W> value)
{
    sc_uint<5> lz = 0;
    for (int i = W - 1; i >= 0 && !value[i]; i--)
        lz++;
    return lz;
}

sc_uint<5> ieee754_lza_predict(sc_uint<IEEE754_CLOSE_WIDTH> a, sc_uint<IEEE754_CLOSE_WIDTH> b)
{
    // f[i] = (a ^ b)[i+1] & (a | ~b)[i]
    sc_uint<IEEE754_CLOSE_WIDTH> t = a ^ b;
    sc_uint<IEEE754_CLOSE_WIDTH> g = a | sc_uint<IEEE754_CLOSE_WIDTH>(~b);
    sc_uint<IEEE754_LZA_WIDTH> f = (t >> 1) & g;
    return leading_zeros<IEEE754_LZA_WIDTH>(f);
}

sc_uint<32> ieee754_add_close(sc_uint<32> bigger, sc_uint<32> smaller, bool op, sc_uint<8> exp_diff)
{
    ieee754_close_probe probe;
    return ieee754_add_close(bigger, smaller, op, exp_diff, probe);
}

sc_uint<32> ieee754_add_close(sc_uint<32> bigger, sc_uint<32> smaller, bool op, sc_uint<8> exp_diff,
                              ieee754_close_probe& probe)
{
    ieee754_fields big    = ieee754_breakdown(bigger);
    ieee754_fields little = ieee754_breakdown(smaller);

    bool close_op = big.sign ^ little.sign ^ op;

    // One extra low bit holds the smaller operand's last bit when exp_diff == 1
    sc_uint<IEEE754_CLOSE_WIDTH> big_sig = sc_uint<IEEE754_CLOSE_WIDTH>(ieee754_significand(big)) << 1;
    sc_uint<IEEE754_CLOSE_WIDTH> little_sig = ieee754_significand(little);
    if (exp_diff == 0)
        little_sig <<= 1;

    sc_uint<IEEE754_CLOSE_WIDTH> addend = close_op ? sc_uint<IEEE754_CLOSE_WIDTH>(~little_sig) : little_sig;
    bool carry;
    sc_uint<IEEE754_CLOSE_WIDTH> raw = ieee754_carry_add<IEEE754_CLOSE_WIDTH>(big_sig, addend, close_op, carry);

    // No carry on a subtraction: the smaller-exponent operand had the larger
    // significand (exp_diff == 0 only)
    bool sub_fix = close_op && !carry;
    sc_uint<IEEE754_CLOSE_WIDTH> magnitude = sub_fix ? sc_uint<IEEE754_CLOSE_WIDTH>(~raw + 1) : raw;

    // Both predictions are formed from the operands alone; the carry picks one
    sc_uint<5> predicted_ab = ieee754_lza_predict(big_sig, little_sig);
    sc_uint<5> predicted_ba = ieee754_lza_predict(little_sig, big_sig);
    sc_uint<5> predicted = 0;
    if (close_op)
        predicted = carry ? predicted_ab : predicted_ba;

    probe.predicted = predicted;
    probe.sub_fix = sub_fix;
    probe.fix_prediction = false;
    probe.round_up = false;

    // Exact cancellation
    if (close_op && magnitude == 0)
        return 0;

    // Rounding ahead of normalization. Bits can only be dropped when the
    // result does not need a left shift: an addition carry (drop two bits)
    // or a leading one already in place (drop one bit).
    sc_uint<IEEE754_CLOSE_WIDTH + 1> wide =
        (sc_uint<IEEE754_CLOSE_WIDTH + 1>(!close_op && carry) << IEEE754_CLOSE_WIDTH) | magnitude;
    bool add_overflow = wide[IEEE754_CLOSE_WIDTH];
    bool leading_one  = wide[IEEE754_CLOSE_WIDTH - 1];

    bool lsb = false, guard = false, sticky = false;
    if (add_overflow) {
        lsb    = wide[2];
        guard  = wide[1];
        sticky = wide[0];
    } else if (leading_one) {
        lsb   = wide[1];
        guard = wide[0];
    }
    bool round_up = guard && (sticky || lsb);
    sc_uint<IEEE754_CLOSE_WIDTH + 2> rounded =
        sc_uint<IEEE754_CLOSE_WIDTH + 2>(wide) + (sc_uint<IEEE754_CLOSE_WIDTH + 2>(round_up) << (add_overflow ? 2 : 1));

    // Check the prediction by shifting the rounded value: if the leading one
    // does not reach the top, the anticipator was one short.
    sc_uint<IEEE754_CLOSE_WIDTH> low = rounded.range(IEEE754_CLOSE_WIDTH - 1, 0);
    sc_uint<IEEE754_CLOSE_WIDTH> test_shift = low << predicted.to_uint();
    bool carry_out = rounded.range(IEEE754_CLOSE_WIDTH + 1, IEEE754_CLOSE_WIDTH).or_reduce();
    bool fix_prediction = !carry_out && !test_shift[IEEE754_CLOSE_WIDTH - 1];
    sc_uint<5> shift = predicted + (fix_prediction ? 1 : 0);

    sc_uint<IEEE754_SIG_WIDTH> result_sig;
    sc_int<7> exp_adjust;
    if (rounded[IEEE754_CLOSE_WIDTH + 1]) {
        // rounding carried past an addition overflow
        result_sig = rounded.range(IEEE754_CLOSE_WIDTH + 1, 3);
        exp_adjust = 2;
    } else if (rounded[IEEE754_CLOSE_WIDTH]) {
        result_sig = rounded.range(IEEE754_CLOSE_WIDTH, 2);
        exp_adjust = 1;
    } else {
        sc_uint<IEEE754_CLOSE_WIDTH> normalized = low << shift.to_uint();
        result_sig = normalized.range(IEEE754_CLOSE_WIDTH - 1, 1);
        exp_adjust = -shift.to_int();
    }

    probe.fix_prediction = fix_prediction;
    probe.round_up = round_up;

    sc_uint<8> result_exp = ieee754_adjust_exponent(big.exponent, exp_adjust);
    return ieee754_compose(big.sign ^ sub_fix, result_exp, result_sig.range(IEEE754_MANT_HIGH, IEEE754_MANT_LOW));
}

void ieee754_close_path::process()
{
    ieee754_close_probe probe;
    result.write(ieee754_add_close(bigger.read(), smaller.read(), op.read(), exp_diff.read(), probe));
    lz_predicted.write(probe.predicted);
    lz_fix.write(probe.fix_prediction);
}
