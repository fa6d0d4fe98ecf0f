#include <systemc.h>
#include "IEEE754FarPath.h"
#include "tb_common.h"

struct far_float_case {
    float       bigger;
    float       smaller;
    bool        subtract;
    int         exp_diff;
    sc_uint<32> expected;
};

struct far_bits_case {
    int         b_sign, b_exp, b_mant;
    int         s_sign, s_exp, s_mant;
    bool        subtract;
    sc_uint<32> expected;
    const char* description;
};

SC_MODULE(FarPathTestbench)
{
    sc_signal<sc_uint<32> > bigger, smaller, result;
    sc_signal<bool> op;
    sc_signal<sc_uint<8> > exp_diff;

    ieee754_far_path* dut;
    tb_score score;

    sc_uint<32> apply(sc_uint<32> b, sc_uint<32> s, bool subtract, int diff) {
        bigger.write(b);
        smaller.write(s);
        op.write(subtract);
        exp_diff.write(diff);
        wait(1, SC_NS);
        return result.read();
    }

    void run_float_cases(const char* title, const far_float_case* cases, int n) {
        cout << "\n--- " << title << " ---\n";
        for (int i = 0; i < n; ++i) {
            const far_float_case& tc = cases[i];
            sc_uint<32> b = float_to_ieee754_bits(tc.bigger);
            sc_uint<32> s = float_to_ieee754_bits(tc.smaller);
            std::ostringstream name;
            name << tc.bigger << (tc.subtract ? " - " : " + ") << tc.smaller << " (expDiff=" << tc.exp_diff << ")";
            score.check(name.str(), apply(b, s, tc.subtract, tc.exp_diff), tc.expected);
        }
    }

    void run_bits_cases(const char* title, const far_bits_case* cases, int n) {
        cout << "\n--- " << title << " ---\n";
        for (int i = 0; i < n; ++i) {
            const far_bits_case& tc = cases[i];
            sc_uint<32> b = make_ieee754(tc.b_sign, tc.b_exp, tc.b_mant);
            sc_uint<32> s = make_ieee754(tc.s_sign, tc.s_exp, tc.s_mant);
            sc_uint<32> actual = apply(b, s, tc.subtract, tc.b_exp - tc.s_exp);
            score.check(tc.description, actual, tc.expected);
            score.check(std::string(tc.description) + " vs host float", actual, reference_add(b, s, tc.subtract));
        }
    }

    void test_basic() {
        static const far_float_case addition[] = {
            { 2.0f,  0.5f,   false, 2, 0x40200000 },
            { 16.0f, 0.125f, false, 7, 0x41810000 },
            { 8.0f,  2.0f,   false, 2, 0x41200000 },
            { 4.0f,  1.0f,   false, 2, 0x40A00000 },
            { 3.0f,  0.75f,  false, 2, 0x40700000 }
        };
        static const far_float_case subtraction[] = {
            { 8.0f,   1.0f, true, 3, 0x40E00000 },
            { 16.0f,  0.5f, true, 5, 0x41780000 },
            { 4.0f,   1.0f, true, 2, 0x40400000 },
            { 10.0f,  2.0f, true, 2, 0x41000000 },
            { 100.0f, 3.0f, true, 5, 0x42C20000 }
        };
        static const far_float_case mixed[] = {
            { 4.0f,   -1.0f,  true,  2, 0x40A00000 },
            { -8.0f,  2.0f,   false, 2, 0xC0C00000 },
            { -16.0f, -0.5f,  false, 5, 0xC1840000 },
            { 8.0f,   -0.25f, false, 5, 0x40F80000 }
        };
        run_float_cases("Basic addition", addition, 5);
        run_float_cases("Basic subtraction", subtraction, 5);
        run_float_cases("Mixed signs", mixed, 4);
    }

    void test_normalization() {
        static const far_bits_case plus1[] = {
            { 0, 130, 0x7FFFFF, 0, 128, 0x7FFFFF, false, 0x419FFFFF, "addition carry, all-ones mantissas, expDiff=2" },
            { 0, 131, 0x7FFFFF, 0, 129, 0x7FFFFF, false, 0x421FFFFF, "addition carry, all-ones mantissas, expDiff=2 (b)" }
        };
        static const far_bits_case minus1[] = {
            { 0, 130, 0x000000, 0, 128, 0x7FFFFF, true, 0x40800000, "subtraction loses leading one, expDiff=2" },
            { 0, 131, 0x000000, 0, 129, 0x7FFFFF, true, 0x41000000, "subtraction loses leading one, expDiff=2 (b)" }
        };
        static const far_bits_case rounding[] = {
            { 0, 150, 0x7FFFFF, 0, 126, 0x000000, false, 0x4B800000, "rounding carries out of all-ones significand" },
            { 0, 127, 0x000000, 0, 101, 0x000000, true,  0x3F800000, "left shift then rounding carry cancel out" },
            { 0, 133, 0x7FFFFF, 0, 130, 0x7FFFF0, false, 0x430FFFFE, "addition carry with sticky" }
        };
        run_bits_cases("First normalization: +1", plus1, 2);
        run_bits_cases("First normalization: -1", minus1, 2);
        run_bits_cases("Second normalization", rounding, 3);
    }

    void test_large_shift() {
        static const far_bits_case large[] = {
            { 0, 150, 0x000000, 0, 118, 0x7FFFFF, false, 0x4B000000, "expDiff=32" },
            { 0, 150, 0x000000, 0, 100, 0x7FFFFF, false, 0x4B000000, "expDiff=50" },
            { 0, 200, 0x400000, 0, 130, 0x7FFFFF, false, 0x64400000, "expDiff=70" },
            { 0, 180, 0x7FFFFF, 0, 140, 0x7FFFFF, false, 0x5A7FFFFF, "expDiff=40" },
            { 0, 150, 0x000000, 0, 118, 0x000000, true,  0x4B000000, "expDiff=32, subtract, zero fraction" },
            { 0, 150, 0x000000, 0, 118, 0x7FFFFF, true,  0x4B000000, "expDiff=32, subtract" },
            { 1, 190, 0x123456, 0, 10,  0x654321, false, 0xDF123456, "expDiff=180" }
        };
        run_bits_cases("Large exponent differences", large, 7);
    }

    void test_ties() {
        static const far_bits_case ties[] = {
            { 0, 127, 0x000000, 0, 103, 0x000000, false, 0x3F800000, "1 + 2^-24 ties to even (down)" },
            { 0, 127, 0x000001, 0, 103, 0x000000, false, 0x3F800002, "(1 + 2^-23) + 2^-24 ties to even (up)" },
            { 0, 127, 0x000000, 0, 102, 0x000000, true,  0x3F800000, "1 - 2^-25 ties to even" },
            { 0, 127, 0x000000, 0, 103, 0x000000, true,  0x3F7FFFFF, "1 - 2^-24 exact" }
        };
        run_bits_cases("Round to nearest even", ties, 4);
    }

    // Seeded sweep: pure function for every sample, the module for the first few
    void random_sweep(const char* name, unsigned seed, int count, int diff_lo, int diff_hi,
                      int force_subtract, bool same_sign) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> diff_dist(diff_lo, diff_hi);
        std::uniform_int_distribution<int> exp_dist(diff_hi + 1, 253);
        std::uniform_int_distribution<int> bit(0, 1);
        std::uniform_int_distribution<int> mant(0, 0x7FFFFF);

        int mismatches = 0;
        for (int i = 0; i < count; ++i) {
            int diff = diff_dist(rng);
            int b_exp = exp_dist(rng);
            int b_sign = bit(rng);
            int s_sign = same_sign ? b_sign : bit(rng);
            bool subtract = force_subtract < 0 ? bit(rng) != 0 : force_subtract != 0;
            sc_uint<32> b = make_ieee754(b_sign, b_exp, mant(rng));
            sc_uint<32> s = make_ieee754(s_sign, b_exp - diff, mant(rng));

            sc_uint<32> expected = reference_add(b, s, subtract);
            sc_uint<32> actual = ieee754_add_far(b, s, subtract, diff);
            bool ok = score.expect(name, b, s, subtract, actual, expected);
            if (ok && i < 500)
                ok = score.expect(name, b, s, subtract, apply(b, s, subtract, diff), expected);
            // far path keeps the bigger operand's sign
            if (ok && ieee754_breakdown(actual).sign != ieee754_breakdown(b).sign)
                ok = false;
            if (!ok)
                mismatches++;
        }
        score.sweep(name, count, mismatches);
    }

    void test_thread() {
        cout << "\n=== IEEE754 FAR PATH ===\n";

        test_basic();
        test_normalization();
        test_large_shift();
        test_ties();

        cout << "\n--- Random sweeps ---\n";
        random_sweep("random addition, expDiff 2-21",    10000, 20000, 2, 21, 0, false);
        random_sweep("random subtraction, expDiff 2-21", 20000, 20000, 2, 21, 1, false);
        random_sweep("random add/sub, expDiff 11-40",    30000, 20000, 11, 40, -1, false);
        random_sweep("random same-sign, expDiff 2-21",   40000, 20000, 2, 21, -1, true);
        random_sweep("random minimum expDiff = 2",       50000, 20000, 2, 2, -1, false);
        random_sweep("random add/sub, expDiff 2-120", 60000, 100000, 2, 120, -1, false);

        score.summary();
        sc_stop();
    }

    SC_CTOR(FarPathTestbench) {
        dut = new ieee754_far_path("dut");
        dut->bigger(bigger);
        dut->smaller(smaller);
        dut->op(op);
        dut->exp_diff(exp_diff);
        dut->result(result);

        SC_THREAD(test_thread);
    }

    ~FarPathTestbench() {
        delete dut;
    }
};

int sc_main(int argc, char* argv[])
{
    FarPathTestbench tb("tb");

    try {
        sc_start();
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    cout << "\nSimulation done.\n";
    return tb.score.tests_failed == 0 ? 0 : 1;
}
