#include <systemc.h>
#include "IEEE754Add.h"
#include "tb_common.h"

struct add_case {
    float       a;
    float       b;
    bool        subtract;
    sc_uint<32> expected;
    bool        far;
};

SC_MODULE(AdderTestbench)
{
    sc_signal<sc_uint<32> > A, B, O;
    sc_signal<bool> op;

    ieee754_adder* dut;
    tb_score score;

    sc_uint<32> apply(sc_uint<32> a, sc_uint<32> b, bool subtract) {
        A.write(a);
        B.write(b);
        op.write(subtract);
        wait(1, SC_NS);
        return O.read();
    }

    void test_scenarios() {
        static const add_case cases[] = {
            { 2.0f,  0.5f,   false, 0x40200000, true  },
            { 16.0f, 0.125f, false, 0x41810000, true  },
            { 4.0f,  -1.0f,  true,  0x40A00000, true  },
            { 6.0f,  3.0f,   true,  0x40400000, false },
            { 3.0f,  2.0f,   true,  0x3F800000, false },
            { 0.5f,  2.0f,   true,  0xBFC00000, true  },
            { 1.0f,  3.0f,   true,  0xC0000000, false },
            { 2.0f,  3.0f,   true,  0xBF800000, false }
        };
        cout << "\n--- Adder scenarios ---\n";
        for (int i = 0; i < 8; ++i) {
            const add_case& tc = cases[i];
            sc_uint<32> a = float_to_ieee754_bits(tc.a);
            sc_uint<32> b = float_to_ieee754_bits(tc.b);
            std::ostringstream name;
            name << tc.a << (tc.subtract ? " - " : " + ") << tc.b;

            score.check(name.str(), apply(a, b, tc.subtract), tc.expected);
            score.check(name.str() + " (function)", ieee754_add(a, b, tc.subtract), tc.expected);
            score.check_true(name.str() + (tc.far ? " takes far path" : " takes close path"),
                             dut->far_sel.read() == tc.far);
        }
    }

    void test_path_select() {
        cout << "\n--- Path selection ---\n";
        ieee754_order order = ieee754_select_path(make_ieee754(0, 130, 0), make_ieee754(0, 128, 0));
        score.check_true("expDiff 2 selects far path, no swap",
                         order.path == IEEE754_PATH_FAR && !order.swapped && order.exp_diff == 2);

        order = ieee754_select_path(make_ieee754(0, 128, 0), make_ieee754(0, 130, 0));
        score.check_true("expDiff -2 selects far path, swapped",
                         order.path == IEEE754_PATH_FAR && order.swapped && order.exp_diff == 2
                         && order.bigger == make_ieee754(0, 130, 0));

        order = ieee754_select_path(make_ieee754(1, 129, 5), make_ieee754(0, 130, 7));
        score.check_true("expDiff -1 selects close path, swapped",
                         order.path == IEEE754_PATH_CLOSE && order.swapped && order.exp_diff == 1);

        order = ieee754_select_path(make_ieee754(0, 140, 1), make_ieee754(0, 140, 0x7FFFFF));
        score.check_true("equal exponents keep operand order",
                         order.path == IEEE754_PATH_CLOSE && !order.swapped && order.exp_diff == 0
                         && order.bigger == make_ieee754(0, 140, 1));

        order = ieee754_select_path(make_ieee754(0, 254, 0), make_ieee754(0, 1, 0));
        score.check_true("expDiff 253 selects far path",
                         order.path == IEEE754_PATH_FAR && !order.swapped && order.exp_diff == 253);

        apply(make_ieee754(0, 120, 0), make_ieee754(0, 127, 0), false);
        score.check_true("path_select module output",
                         dut->far_sel.read() && dut->swapped.read() && dut->exp_diff.read() == 7
                         && dut->bigger.read() == make_ieee754(0, 127, 0));
    }

    void test_ties() {
        cout << "\n--- Round half to even ---\n";
        score.check("1 + 2^-24", ieee754_add(0x3F800000, 0x33800000, false), 0x3F800000);
        score.check("(1 + 2^-23) + 2^-24", ieee754_add(0x3F800001, 0x33800000, false), 0x3F800002);
        score.check("2 + (1 + 2^-23)", ieee754_add(0x40000000, 0x3F800001, false), 0x40400000);
        score.check("(2 + 2^-22) + (1 + 2^-23)", ieee754_add(0x40000001, 0x3F800001, false), 0x40400002);

        // a +/- half an ulp of a is always a tie
        std::mt19937 rng(11);
        std::uniform_int_distribution<int> exp_dist(30, 250);
        std::uniform_int_distribution<int> mant(1, 0x7FFFFF);
        std::uniform_int_distribution<int> bit(0, 1);
        int mismatches = 0;
        for (int i = 0; i < 20000; ++i) {
            int e = exp_dist(rng);
            int sign = bit(rng);
            bool subtract = bit(rng) != 0;
            sc_uint<32> a = make_ieee754(sign, e, mant(rng));
            sc_uint<32> half_ulp = make_ieee754(sign, e - 24, 0);
            bool swap = bit(rng) != 0;
            sc_uint<32> x = swap ? half_ulp : a;
            sc_uint<32> y = swap ? a : half_ulp;
            sc_uint<32> actual = ieee754_add(x, y, subtract);
            bool ok = score.expect("ties", x, y, subtract, actual, reference_add(x, y, subtract));
            if (ok && actual[0])
                ok = false;
            if (!ok)
                mismatches++;
        }
        score.sweep("random ties have even LSB", 20000, mismatches);
    }

    void test_algebra() {
        cout << "\n--- Operand order ---\n";
        std::mt19937 rng(21);
        std::uniform_int_distribution<int> exp_dist(40, 250);
        int commute = 0;
        int anticommute = 0;
        for (int i = 0; i < 20000; ++i) {
            int e = exp_dist(rng);
            sc_uint<32> a = random_ieee754(rng, e - 3, e);
            sc_uint<32> b = random_ieee754(rng, 40, 250);
            if (i & 1)
                b = random_ieee754(rng, e - 3, e);
            if (ieee754_add(a, b, false) != ieee754_add(b, a, false))
                commute++;
            sc_uint<32> ab = ieee754_add(a, b, true);
            sc_uint<32> ba = ieee754_add(b, a, true);
            // x - x is +0 both ways
            if (ab == 0 && ba == 0)
                continue;
            if (ab != ieee754_flip_sign(ba))
                anticommute++;
        }
        score.sweep("a + b == b + a", 20000, commute);
        score.sweep("a - b == -(b - a)", 20000, anticommute);
    }

    void test_seam() {
        cout << "\n--- Far/close seam ---\n";
        std::mt19937 rng(31);
        std::uniform_int_distribution<int> exp_dist(30, 250);
        std::uniform_int_distribution<int> bit(0, 1);
        std::uniform_int_distribution<int> mant(0, 0x7FFFFF);

        int compared = 0;
        int mismatches = 0;
        for (int i = 0; i < 40000; ++i) {
            int e = exp_dist(rng);
            bool subtract = bit(rng) != 0;
            sc_uint<32> big = make_ieee754(bit(rng), e, mant(rng));
            sc_uint<32> little = make_ieee754(bit(rng), e - 1, mant(rng));
            sc_uint<32> close_result = ieee754_add_close(big, little, subtract, 1);
            bool effective_sub = ieee754_breakdown(big).sign ^ ieee754_breakdown(little).sign ^ subtract;
            // the far path cannot shift left by more than one bit
            if (effective_sub && ieee754_breakdown(close_result).exponent.to_int() < e - 1)
                continue;
            compared++;
            if (!score.expect("seam expDiff=1", big, little, subtract,
                              ieee754_add_far(big, little, subtract, 1), close_result))
                mismatches++;
        }
        score.sweep("far and close agree at expDiff 1", compared, mismatches);

        mismatches = 0;
        for (int i = 0; i < 40000; ++i) {
            int e = exp_dist(rng);
            bool subtract = bit(rng) != 0;
            sc_uint<32> a = make_ieee754(bit(rng), e, mant(rng));
            sc_uint<32> b = make_ieee754(bit(rng), e - 2, mant(rng));
            if (!score.expect("seam expDiff=2", a, b, subtract,
                              ieee754_add_far(a, b, subtract, 2), ieee754_add(a, b, subtract)))
                mismatches++;
        }
        score.sweep("far path and adder agree at expDiff 2", 40000, mismatches);
    }

    // Cycle the exponent difference through 0, 1, 2 across the path boundary
    void test_boundary_cycle() {
        cout << "\n--- Boundary cycle ---\n";
        std::mt19937 rng(41);
        std::uniform_int_distribution<int> exp_dist(40, 250);
        std::uniform_int_distribution<int> bit(0, 1);
        std::uniform_int_distribution<int> mant(0, 0x7FFFFF);
        int mismatches = 0;
        for (int i = 0; i < 3000; ++i) {
            int diff = i % 3;
            int e = exp_dist(rng);
            bool subtract = bit(rng) != 0;
            sc_uint<32> a = make_ieee754(bit(rng), e, mant(rng));
            sc_uint<32> b = make_ieee754(bit(rng), e - diff, mant(rng));
            if (i & 1) {
                sc_uint<32> t = a;
                a = b;
                b = t;
            }
            sc_uint<32> expected = reference_add(a, b, subtract);
            bool ok = score.expect("boundary cycle", a, b, subtract, apply(a, b, subtract), expected);
            if (ok && dut->far_sel.read() != (diff == 2))
                ok = false;
            if (!ok)
                mismatches++;
        }
        score.sweep("expDiff 0/1/2 through the module", 3000, mismatches);
    }

    void test_random() {
        cout << "\n--- Random sweep ---\n";
        std::mt19937 rng(12345);
        std::uniform_int_distribution<int> bit(0, 1);
        int mismatches = 0;
        for (int i = 0; i < 100000; ++i) {
            sc_uint<32> a = random_ieee754(rng, 40, 250);
            sc_uint<32> b = random_ieee754(rng, 40, 250);
            if (i % 4 == 0)
                b.range(30, 23) = a.range(30, 23);
            bool subtract = bit(rng) != 0;
            if (!score.expect("random", a, b, subtract, ieee754_add(a, b, subtract), reference_add(a, b, subtract)))
                mismatches++;
        }
        score.sweep("random operands, bit-exact", 100000, mismatches);
    }

    void test_operand_check() {
        cout << "\n--- Operand check ---\n";
        int before = sc_report_handler::get_count("fadd/adder");
        dut->check_operands = true;
        apply(0x00000000, 0x3F800000, false);
        apply(0x3F800000, 0x40000000, false);
        dut->check_operands = false;
        score.check_true("zero operand raises one warning",
                         sc_report_handler::get_count("fadd/adder") == before + 1);
    }

    void test_thread() {
        cout << "\n=== IEEE754 ADDER ===\n";

        test_scenarios();
        test_path_select();
        test_ties();
        test_algebra();
        test_seam();
        test_boundary_cycle();
        test_random();
        test_operand_check();

        score.summary();
        sc_stop();
    }

    SC_CTOR(AdderTestbench) {
        dut = new ieee754_adder("dut");
        dut->A(A);
        dut->B(B);
        dut->op(op);
        dut->O(O);

        SC_THREAD(test_thread);
    }

    ~AdderTestbench() {
        delete dut;
    }
};

int sc_main(int argc, char* argv[])
{
    AdderTestbench tb("tb");

    sc_trace_file* tf = sc_create_vcd_trace_file("fadd_adder_tb");
    tf->set_time_unit(1, SC_NS);
    sc_trace(tf, tb.A, "A");
    sc_trace(tf, tb.B, "B");
    sc_trace(tf, tb.op, "op");
    sc_trace(tf, tb.O, "O");
    sc_trace(tf, tb.dut->bigger, "bigger");
    sc_trace(tf, tb.dut->smaller, "smaller");
    sc_trace(tf, tb.dut->exp_diff, "exp_diff");
    sc_trace(tf, tb.dut->swapped, "swapped");
    sc_trace(tf, tb.dut->far_sel, "far_sel");
    sc_trace(tf, tb.dut->far_result, "far_result");
    sc_trace(tf, tb.dut->close_result, "close_result");
    sc_trace(tf, tb.dut->lz_predicted, "lz_predicted");
    sc_trace(tf, tb.dut->lz_fix, "lz_fix");

    try {
        sc_start();
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << endl;
        sc_close_vcd_trace_file(tf);
        return 1;
    }

    sc_close_vcd_trace_file(tf);
    cout << "\nSimulation done.\n";
    return tb.score.tests_failed == 0 ? 0 : 1;
}
