#include <systemc.h>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <string>
#include "IEEE754Add.h"
#include "IEEE754Float.h"

static void usage()
{
    cout << "usage: fadd_sim [-s] [-t <trace>] <a> <b>\n"
         << "  a, b       operands, hex bit patterns (0x40200000) or decimal (2.5)\n"
         << "  -s         subtract (a - b) instead of add\n"
         << "  -t <trace> write internal signals to <trace>.vcd\n";
}

static sc_uint<32> parse_operand(const char* text)
{
    char* end = 0;
    if (std::strncmp(text, "0x", 2) == 0 || std::strncmp(text, "0X", 2) == 0) {
        unsigned long bits = std::strtoul(text + 2, &end, 16);
        if (end == text + 2 || *end != '\0' || bits > 0xFFFFFFFFul)
            SC_REPORT_ERROR("fadd/sim", (std::string("malformed hex operand: ") + text).c_str());
        return sc_uint<32>(bits);
    }

    float value = std::strtof(text, &end);
    if (end == text || *end != '\0')
        SC_REPORT_ERROR("fadd/sim", (std::string("malformed operand: ") + text).c_str());
    return float_to_ieee754_bits(value);
}

int sc_main(int argc, char* argv[])
{
    bool subtract = false;
    const char* trace_name = 0;
    const char* operands[2] = { 0, 0 };
    int n_operands = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            subtract = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            trace_name = argv[++i];
        } else if (n_operands < 2) {
            operands[n_operands++] = argv[i];
        } else {
            usage();
            return 1;
        }
    }
    if (n_operands != 2) {
        usage();
        return 1;
    }

    sc_signal<sc_uint<32> > a_sig, b_sig, result_sig;
    sc_signal<bool> op_sig;

    ieee754_adder adder("float_adder");
    adder.A(a_sig);
    adder.B(b_sig);
    adder.op(op_sig);
    adder.O(result_sig);
    adder.check_operands = true;

    sc_trace_file* tf = 0;
    if (trace_name) {
        tf = sc_create_vcd_trace_file(trace_name);
        sc_trace(tf, a_sig, "A");
        sc_trace(tf, b_sig, "B");
        sc_trace(tf, op_sig, "op");
        sc_trace(tf, result_sig, "O");
        sc_trace(tf, adder.bigger, "bigger");
        sc_trace(tf, adder.smaller, "smaller");
        sc_trace(tf, adder.exp_diff, "exp_diff");
        sc_trace(tf, adder.swapped, "swapped");
        sc_trace(tf, adder.far_sel, "far_sel");
        sc_trace(tf, adder.far_result, "far_result");
        sc_trace(tf, adder.close_result, "close_result");
        sc_trace(tf, adder.lz_predicted, "lz_predicted");
        sc_trace(tf, adder.lz_fix, "lz_fix");
    }

    try {
        sc_uint<32> a = parse_operand(operands[0]);
        sc_uint<32> b = parse_operand(operands[1]);

        a_sig.write(a);
        b_sig.write(b);
        op_sig.write(subtract);
        sc_start(1, SC_NS);

        sc_uint<32> result = result_sig.read();
        cout << std::setprecision(9)
             << ieee754_bits_to_float(a) << " (0x" << hex << std::setw(8) << std::setfill('0') << a.to_uint() << ") "
             << (subtract ? "-" : "+") << " "
             << dec << ieee754_bits_to_float(b) << " (0x" << hex << std::setw(8) << std::setfill('0') << b.to_uint() << ") = "
             << dec << ieee754_bits_to_float(result) << " (0x" << hex << std::setw(8) << std::setfill('0') << result.to_uint() << ")"
             << dec << endl;
        SC_REPORT_INFO("fadd/sim", adder.far_sel.read() ? "far path" : "close path");
    } catch (const std::exception& e) {
        cout << "Simulation error: " << e.what() << endl;
        if (tf) sc_close_vcd_trace_file(tf);
        return 1;
    }

    if (tf) sc_close_vcd_trace_file(tf);
    return 0;
}
