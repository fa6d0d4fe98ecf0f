#include "IEEE754FarPath.h"

sc_uint<32> ieee754_add_far(sc_uint<32> bigger, sc_uint<32> smaller, bool op, sc_uint<8> exp_diff)
{
    ieee754_fields big    = ieee754_breakdown(bigger);
    ieee754_fields little = ieee754_breakdown(smaller);

    // 1: magnitudes are subtracted
    bool far_op = big.sign ^ little.sign ^ op;

    sc_uint<IEEE754_FAR_WIDTH> big_full =
        sc_uint<IEEE754_FAR_WIDTH>(ieee754_significand(big)) << IEEE754_GRS_WIDTH;

    // Alignment: the top 24 bits of the window line up with big_full's
    // significand, the 32 below it hold everything shifted out.
    sc_uint<IEEE754_EXT_MANT_WIDTH> small_ext =
        sc_uint<IEEE754_EXT_MANT_WIDTH>(ieee754_significand(little)) << IEEE754_ALIGN_WIDTH;
    sc_uint<IEEE754_EXT_MANT_WIDTH> small_shifted = 0;
    if (exp_diff < IEEE754_EXT_MANT_WIDTH)
        small_shifted = small_ext >> exp_diff.to_uint();

    sc_uint<IEEE754_SIG_WIDTH> small_sig = small_shifted.range(IEEE754_EXT_MANT_WIDTH - 1, IEEE754_ALIGN_WIDTH);
    bool guard = small_shifted[IEEE754_ALIGN_WIDTH - 1];
    bool round_bit = small_shifted[IEEE754_ALIGN_WIDTH - 2];

    // Once the shift reaches 32 the whole smaller fraction is below guard/round
    bool large_shift = exp_diff.range(IEEE754_LARGE_SHIFT_HIGH, IEEE754_LARGE_SHIFT_LOW).or_reduce();
    bool sticky = large_shift ? little.mantissa.or_reduce()
                              : small_shifted.range(IEEE754_ALIGN_WIDTH - 3, 0).or_reduce();

    sc_uint<IEEE754_FAR_WIDTH> small_full = (sc_uint<IEEE754_FAR_WIDTH>(small_sig) << IEEE754_GRS_WIDTH) |
                                            (sc_uint<IEEE754_FAR_WIDTH>(guard) << 2) |
                                            (sc_uint<IEEE754_FAR_WIDTH>(round_bit) << 1) |
                                            sc_uint<IEEE754_FAR_WIDTH>(sticky);

    sc_uint<IEEE754_FAR_WIDTH> addend = far_op ? sc_uint<IEEE754_FAR_WIDTH>(~small_full) : small_full;
    bool carry;
    sc_uint<IEEE754_FAR_WIDTH> sum = ieee754_carry_add<IEEE754_FAR_WIDTH>(big_full, addend, far_op, carry);

    // First normalization: one position either way
    bool regular_plus1  = (carry == !far_op);
    bool regular_minus1 = !sum[IEEE754_FAR_WIDTH - 1] && !regular_plus1;

    sc_uint<IEEE754_FAR_WIDTH> regularized = sum;
    if (regular_minus1) {
        regularized = sum << 1;
    } else if (regular_plus1) {
        sc_uint<IEEE754_FAR_WIDTH + 1> wide =
            (sc_uint<IEEE754_FAR_WIDTH + 1>(carry && !far_op) << IEEE754_FAR_WIDTH) | sum;
        regularized = ((wide >> 2) << 1) | sc_uint<IEEE754_FAR_WIDTH>(sum.range(1, 0).or_reduce());
    }

    sc_uint<IEEE754_SIG_WIDTH> sig = regularized.range(IEEE754_FAR_WIDTH - 1, IEEE754_GRS_WIDTH);
    bool g = regularized[2];
    bool r = regularized[1];
    bool s = regularized[0];

    // Round to nearest, ties to even
    bool round_up = g && (r || s || sig[0]);
    bool overflow;
    sc_uint<IEEE754_SIG_WIDTH> rounded = ieee754_carry_add<IEEE754_SIG_WIDTH>(sig, 0, round_up, overflow);

    // Second normalization: rounding carried out of the significand
    sc_uint<IEEE754_SIG_WIDTH> result_sig = rounded;
    if (overflow)
        result_sig = ((sc_uint<IEEE754_SIG_WIDTH + 1>(1) << IEEE754_SIG_WIDTH) | rounded) >> 1;

    sc_int<7> exp_adjust = (regular_plus1 ? 1 : 0) + (overflow ? 1 : 0) - (regular_minus1 ? 1 : 0);
    sc_uint<8> result_exp = ieee754_adjust_exponent(big.exponent, exp_adjust);

    return ieee754_compose(big.sign, result_exp, result_sig.range(IEEE754_MANT_HIGH, IEEE754_MANT_LOW));
}

void ieee754_far_path::process()
{
    result.write(ieee754_add_far(bigger.read(), smaller.read(), op.read(), exp_diff.read()));
}
