#include <systemc.h>
#include "IEEE754ClosePath.h"
#include "tb_common.h"

struct close_float_case {
    float       bigger;
    float       smaller;
    bool        subtract;
    sc_uint<32> expected;
};

struct close_bits_case {
    sc_uint<32> bigger;
    sc_uint<32> smaller;
    bool        subtract;
    sc_uint<32> expected;
    const char* description;
};

struct lza_case {
    sc_uint<32> bigger;
    sc_uint<32> smaller;
    int         predicted;
    bool        fix;
    sc_uint<32> expected;
    const char* description;
};

SC_MODULE(ClosePathTestbench)
{
    sc_signal<sc_uint<32> > bigger, smaller, result;
    sc_signal<bool> op;
    sc_signal<sc_uint<8> > exp_diff;
    sc_signal<sc_uint<5> > lz_predicted;
    sc_signal<bool> lz_fix;

    ieee754_close_path* dut;
    tb_score score;

    static int exponent_difference(sc_uint<32> b, sc_uint<32> s) {
        return ieee754_breakdown(b).exponent.to_int() - ieee754_breakdown(s).exponent.to_int();
    }

    sc_uint<32> apply(sc_uint<32> b, sc_uint<32> s, bool subtract) {
        bigger.write(b);
        smaller.write(s);
        op.write(subtract);
        exp_diff.write(exponent_difference(b, s));
        wait(1, SC_NS);
        return result.read();
    }

    void run_float_cases(const char* title, const close_float_case* cases, int n) {
        cout << "\n--- " << title << " ---\n";
        for (int i = 0; i < n; ++i) {
            const close_float_case& tc = cases[i];
            sc_uint<32> b = float_to_ieee754_bits(tc.bigger);
            sc_uint<32> s = float_to_ieee754_bits(tc.smaller);
            std::ostringstream name;
            name << tc.bigger << (tc.subtract ? " - " : " + ") << tc.smaller
                 << " (expDiff=" << exponent_difference(b, s) << ")";
            score.check(name.str(), apply(b, s, tc.subtract), tc.expected);
        }
    }

    void run_bits_cases(const char* title, const close_bits_case* cases, int n) {
        cout << "\n--- " << title << " ---\n";
        for (int i = 0; i < n; ++i) {
            const close_bits_case& tc = cases[i];
            score.check(tc.description, apply(tc.bigger, tc.smaller, tc.subtract), tc.expected);
        }
    }

    void test_basic() {
        static const close_float_case exp_diff0[] = {
            { 1.75f, 1.25f, false, 0x40400000 },
            { 3.0f,  2.0f,  false, 0x40A00000 },
            { 1.5f,  1.25f, false, 0x40300000 },
            { 5.0f,  4.0f,  false, 0x41100000 },
            { 7.0f,  6.0f,  false, 0x41500000 },
            { 3.0f,  2.0f,  true,  0x3F800000 },
            { 7.0f,  5.0f,  true,  0x40000000 },
            { 1.75f, 1.5f,  true,  0x3E800000 },
            { 7.0f,  4.0f,  true,  0x40400000 },
            { 1.5f,  1.25f, true,  0x3E800000 }
        };
        static const close_float_case exp_diff1[] = {
            { 4.0f,  2.0f,  false, 0x40C00000 },
            { 6.0f,  3.0f,  false, 0x41100000 },
            { 8.0f,  4.0f,  false, 0x41400000 },
            { 3.0f,  1.5f,  false, 0x40900000 },
            { 5.0f,  2.5f,  false, 0x40F00000 },
            { 6.0f,  3.0f,  true,  0x40400000 },
            { 8.0f,  4.0f,  true,  0x40800000 },
            { 5.0f,  2.5f,  true,  0x40200000 },
            { 3.0f,  1.5f,  true,  0x3FC00000 },
            { 10.0f, 5.0f,  true,  0x40A00000 }
        };
        static const close_float_case mixed[] = {
            { 5.0f,  -4.0f, false, 0x3F800000 },
            { -5.0f, 4.0f,  false, 0xBF800000 },
            { -5.0f, -4.0f, false, 0xC1100000 },
            { 3.0f,  -2.0f, true,  0x40A00000 },
            { 8.0f,  -4.0f, false, 0x40800000 },
            { -8.0f, 4.0f,  false, 0xC0800000 },
            { -8.0f, -4.0f, false, 0xC1400000 },
            { 6.0f,  -3.0f, true,  0x41100000 }
        };
        run_float_cases("expDiff = 0", exp_diff0, 10);
        run_float_cases("expDiff = 1", exp_diff1, 10);
        run_float_cases("Mixed signs", mixed, 8);
    }

    void test_special() {
        static const close_bits_case negative[] = {
            { make_ieee754(0, 130, 0x400000), make_ieee754(0, 130, 0x600000), true, 0xC0000000,
              "smaller significand first, result -2" },
            { make_ieee754(0, 128, 0x200000), make_ieee754(0, 128, 0x600000), true, 0xBF800000,
              "smaller significand first, result -1" },
            { make_ieee754(0, 131, 0x000000), make_ieee754(0, 131, 0x400000), true, 0xC1000000,
              "smaller significand first, result -8" }
        };
        static const close_bits_case rounding[] = {
            { 0x40000000, 0x3F800001, false, 0x40400000, "addition carry, tie rounds to even (down)" },
            { 0x40000001, 0x3F800001, false, 0x40400002, "addition carry, tie rounds to even (up)" },
            { 0x3FFFFFFF, 0x3F7FFFFF, false, 0x403FFFFF, "all-ones addition, expDiff=1" },
            { 0x3FFFFFFF, 0x3FFFFFFF, false, 0x407FFFFF, "all-ones addition, expDiff=0" }
        };
        static const close_bits_case cancellation[] = {
            { 0x3F800000, 0x3F7FFFFF, true,  0x33800000, "1 - (1 - 2^-24)" },
            { 0x3F800001, 0x3F800000, true,  0x34000000, "(1 + 2^-23) - 1" },
            { 0x3FFFFFFF, 0xBFFFFFFF, false, 0x00000000, "x + (-x) is +0" },
            { 0xC0400000, 0xC0400000, true,  0x00000000, "(-3) - (-3) is +0" }
        };
        run_bits_cases("Smaller-exponent operand is larger", negative, 3);
        run_bits_cases("Rounding", rounding, 4);
        run_bits_cases("Massive cancellation", cancellation, 4);
    }

    void test_leading_zero_anticipation() {
        static const lza_case cases[] = {
            { 0x3FC00000, 0x3F400000, 0,  true,  0x3F400000, "1.5 - 0.75: prediction one short" },
            { 0x40400000, 0x40000000, 1,  false, 0x3F800000, "3 - 2: exact prediction" },
            { 0x3F800000, 0x3F7FFFFF, 24, false, 0x33800000, "1 - (1 - 2^-24): full-width shift" },
            { make_ieee754(0, 130, 0x400000), make_ieee754(0, 130, 0x600000), 2, false, 0xC0000000,
              "negated difference uses the swapped prediction" }
        };
        cout << "\n--- Leading zero anticipation ---\n";
        for (int i = 0; i < 4; ++i) {
            const lza_case& tc = cases[i];
            sc_uint<32> actual = apply(tc.bigger, tc.smaller, true);
            score.check(tc.description, actual, tc.expected);
            score.check_true(std::string(tc.description) + ", lz_predicted",
                             lz_predicted.read() == (unsigned)tc.predicted);
            score.check_true(std::string(tc.description) + ", lz_fix", lz_fix.read() == tc.fix);

            ieee754_close_probe probe;
            ieee754_add_close(tc.bigger, tc.smaller, true, exponent_difference(tc.bigger, tc.smaller), probe);
            score.check_true(std::string(tc.description) + ", probe",
                             probe.predicted == (unsigned)tc.predicted && probe.fix_prediction == tc.fix);
        }

        // Anticipator bound: prediction is the exact count or one less
        std::mt19937 rng(7);
        std::uniform_int_distribution<int> mant(0, 0x7FFFFF);
        int mismatches = 0;
        for (int i = 0; i < 20000; ++i) {
            sc_uint<IEEE754_CLOSE_WIDTH> a = (sc_uint<IEEE754_CLOSE_WIDTH>(0x800000 | mant(rng))) << 1;
            sc_uint<IEEE754_CLOSE_WIDTH> b = 0x800000 | mant(rng);
            if (i & 1)
                b <<= 1;
            if (a < b) {
                sc_uint<IEEE754_CLOSE_WIDTH> t = a;
                a = b;
                b = t;
            }
            sc_uint<IEEE754_CLOSE_WIDTH> diff = a - b;
            if (diff == 0)
                continue;
            int exact = 0;
            for (int bit = IEEE754_CLOSE_WIDTH - 1; bit >= 0 && !diff[bit]; bit--)
                exact++;
            int predicted = ieee754_lza_predict(a, b).to_int();
            if (predicted != exact && predicted + 1 != exact)
                mismatches++;
        }
        score.sweep("prediction within one of exact count", 20000, mismatches);
    }

    // Every sign, operation and expDiff combination over boundary mantissas
    void test_boundary_grid() {
        static const int mantissas[] = { 0x000000, 0x000001, 0x3FFFFF, 0x400000, 0x400001, 0x7FFFFE, 0x7FFFFF };
        static const int exponents[] = { 100, 127, 200 };
        const int n = sizeof(mantissas) / sizeof(mantissas[0]);

        int total = 0;
        int mismatches = 0;
        for (int e = 0; e < 3; ++e)
            for (int sb = 0; sb < 2; ++sb)
                for (int ss = 0; ss < 2; ++ss)
                    for (int sub = 0; sub < 2; ++sub)
                        for (int diff = 0; diff < 2; ++diff)
                            for (int i = 0; i < n; ++i)
                                for (int j = 0; j < n; ++j) {
                                    sc_uint<32> b = make_ieee754(sb, exponents[e], mantissas[i]);
                                    sc_uint<32> s = make_ieee754(ss, exponents[e] - diff, mantissas[j]);
                                    sc_uint<32> expected = reference_add(b, s, sub != 0);
                                    sc_uint<32> actual = ieee754_add_close(b, s, sub != 0, diff);
                                    total++;
                                    if (!score.expect("boundary grid", b, s, sub != 0, actual, expected))
                                        mismatches++;
                                }
        score.sweep("boundary grid", total, mismatches);
    }

    void random_sweep(const char* name, unsigned seed, int count, int fixed_diff) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> diff_dist(0, 1);
        std::uniform_int_distribution<int> exp_dist(60, 250);
        std::uniform_int_distribution<int> bit(0, 1);
        std::uniform_int_distribution<int> mant(0, 0x7FFFFF);

        int mismatches = 0;
        for (int i = 0; i < count; ++i) {
            int diff = fixed_diff < 0 ? diff_dist(rng) : fixed_diff;
            int b_exp = exp_dist(rng);
            bool subtract = bit(rng) != 0;
            sc_uint<32> b = make_ieee754(bit(rng), b_exp, mant(rng));
            sc_uint<32> s = make_ieee754(bit(rng), b_exp - diff, mant(rng));
            if (i % 8 == 0) {
                // share the top mantissa bits to force deep cancellation
                s.range(22, 8) = b.range(22, 8);
            }

            sc_uint<32> expected = reference_add(b, s, subtract);
            bool ok = score.expect(name, b, s, subtract, ieee754_add_close(b, s, subtract, diff), expected);
            if (ok && i < 500)
                ok = score.expect(name, b, s, subtract, apply(b, s, subtract), expected);
            if (!ok)
                mismatches++;
        }
        score.sweep(name, count, mismatches);
    }

    void test_thread() {
        cout << "\n=== IEEE754 CLOSE PATH ===\n";

        test_basic();
        test_special();
        test_leading_zero_anticipation();

        cout << "\n--- Exhaustive and random sweeps ---\n";
        test_boundary_grid();
        random_sweep("random expDiff = 0", 1000, 40000, 0);
        random_sweep("random expDiff = 1", 2000, 40000, 1);
        random_sweep("random expDiff 0-1", 3000, 40000, -1);

        score.summary();
        sc_stop();
    }

    SC_CTOR(ClosePathTestbench) {
        dut = new ieee754_close_path("dut");
        dut->bigger(bigger);
        dut->smaller(smaller);
        dut->op(op);
        dut->exp_diff(exp_diff);
        dut->result(result);
        dut->lz_predicted(lz_predicted);
        dut->lz_fix(lz_fix);

        SC_THREAD(test_thread);
    }

    ~ClosePathTestbench() {
        delete dut;
    }
};

int sc_main(int argc, char* argv[])
{
    ClosePathTestbench tb("tb");

    try {
        sc_start();
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    cout << "\nSimulation done.\n";
    return tb.score.tests_failed == 0 ? 0 : 1;
}
