#ifndef TB_COMMON_H
#define TB_COMMON_H

#include <systemc.h>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include "IEEE754Fields.h"
#include "IEEE754Float.h"

static inline sc_uint<32> make_ieee754(int sign, int exponent, int mantissa) {
    return ieee754_compose(sign != 0, sc_uint<8>(exponent), sc_uint<23>(mantissa));
}

// Host single-precision arithmetic (round to nearest even) as the reference
static inline sc_uint<32> reference_add(sc_uint<32> a, sc_uint<32> b, bool subtract) {
    volatile float fa = ieee754_bits_to_float(a);
    volatile float fb = ieee754_bits_to_float(b);
    volatile float r = subtract ? fa - fb : fa + fb;
    return float_to_ieee754_bits(r);
}

static inline std::string hex32(sc_uint<32> v) {
    std::ostringstream os;
    os << "0x" << std::hex << std::setw(8) << std::setfill('0') << v.to_uint();
    return os.str();
}

// Random normalized operand with exponent in [exp_lo, exp_hi]
static inline sc_uint<32> random_ieee754(std::mt19937& rng, int exp_lo, int exp_hi) {
    std::uniform_int_distribution<int> sign(0, 1);
    std::uniform_int_distribution<int> exponent(exp_lo, exp_hi);
    std::uniform_int_distribution<int> mantissa(0, 0x7FFFFF);
    return make_ieee754(sign(rng), exponent(rng), mantissa(rng));
}

struct tb_score {
    int tests_passed;
    int tests_failed;
    int failures_printed;

    tb_score() : tests_passed(0), tests_failed(0), failures_printed(0) {}

    // Named check, always reported
    bool check(const std::string& name, sc_uint<32> actual, sc_uint<32> expected) {
        bool pass = actual == expected;
        cout << name << ": " << hex32(actual) << " (exp " << hex32(expected) << ") - "
             << (pass ? "PASS" : "FAIL") << "\n";
        if (pass) tests_passed++; else tests_failed++;
        return pass;
    }

    bool check_true(const std::string& name, bool condition) {
        cout << name << " - " << (condition ? "PASS" : "FAIL") << "\n";
        if (condition) tests_passed++; else tests_failed++;
        return condition;
    }

    // Sweep check: silent on success, reports the first few mismatches
    bool expect(const char* what, sc_uint<32> a, sc_uint<32> b, bool subtract,
                sc_uint<32> actual, sc_uint<32> expected) {
        if (actual == expected)
            return true;
        if (failures_printed < 10) {
            cout << "=== FAILED (" << what << "): " << ieee754_bits_to_float(a)
                 << (subtract ? " - " : " + ") << ieee754_bits_to_float(b) << " ===\n"
                 << "  a:         " << hex32(a) << "\n"
                 << "  b:         " << hex32(b) << "\n"
                 << "  result:    " << hex32(actual) << "\n"
                 << "  reference: " << hex32(expected) << "\n";
            failures_printed++;
        }
        return false;
    }

    void sweep(const std::string& name, int total, int mismatches) {
        cout << name << ": " << (total - mismatches) << "/" << total << " - "
             << (mismatches == 0 ? "PASS" : "FAIL") << "\n";
        if (mismatches == 0) tests_passed++; else tests_failed++;
    }

    void summary() const {
        cout << "\n=== FINAL SUMMARY ===\n";
        cout << "Passed: " << tests_passed << "  Failed: " << tests_failed << "\n";
    }
};

#endif
