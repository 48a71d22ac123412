
#include <cstdarg>

#include "i8080core.h"

using i8080core::fast_u8;
using i8080core::fast_u16;
using i8080core::least_u8;
using i8080core::flag;
using i8080core::reg;
using i8080core::state_error;

namespace {

#if defined(__GNUC__) || defined(__clang__)
# define LIKE_PRINTF(format, args) \
      __attribute__((__format__(__printf__, format, args)))
#else
# define LIKE_PRINTF(format, args) /* nothing */
#endif

const char program_name[] = "executing_add";

[[noreturn]] LIKE_PRINTF(1, 2)
void error(const char *format, ...) {
    va_list args;
    va_start(args, format);
    std::fprintf(stderr, "%s: ", program_name);
    std::vfprintf(stderr, format, args);
    std::fprintf(stderr, "\n");
    va_end(args);
    std::exit(EXIT_FAILURE);
}

void check(state_error e) {
    if(e != state_error::none)
        error("%s", i8080core::get_error_name(e));
}

template<typename T>
T check(const i8080core::result<T> &r) {
    if(!r)
        error("%s", i8080core::get_error_name(r.get_error()));
    return r.get();
}

const unsigned address_space_size = 0x10000;

// A minimal engine that knows a handful of instructions. The
// register file and the flags hold all of its state except the
// program counter.
class my_engine {
public:
    my_engine() {}

    void step() {
        fast_u8 op = memory[pc];
        pc = (pc + 1) & 0xffff;

        if(op == 0x76)
            halted = true;
        else if((op & 0370) == 0200)
            on_add(get_operand(
                i8080core::register_file::get_register_from_opcode(op, 0)));
        else if((op & 0307) == 0006)
            on_mvi(i8080core::register_file::get_register_from_opcode(op, 3),
                   read_imm8());
        else if((op & 0317) == 0001)
            on_lxi(check(i8080core::register_file::get_pair_from_opcode(op)),
                   read_imm16());
        else
            error("unknown opcode 0x%02x", static_cast<unsigned>(op));
    }

    bool is_halted() const { return halted; }

    const i8080core::i8080_flags &get_flags() const { return flags; }
    const i8080core::register_file &get_regs() const { return regs; }

private:
    fast_u8 read_imm8() {
        fast_u8 n = memory[pc];
        pc = (pc + 1) & 0xffff;
        return n;
    }

    fast_u16 read_imm16() {
        fast_u8 lo = read_imm8();
        fast_u8 hi = read_imm8();
        return i8080core::make16(hi, lo);
    }

    fast_u8 get_operand(reg r) {
        if(r != reg::at_hl)
            return check(regs.get(r));
        return memory[check(regs.get_address_from_pair(reg::h))];
    }

    void set_operand(reg r, fast_u8 n) {
        if(r != reg::at_hl)
            return check(regs.set(r, n));
        memory[check(regs.get_address_from_pair(reg::h))] =
            static_cast<least_u8>(n);
    }

    void on_add(fast_u8 n) {
        fast_u8 a = check(regs.get(reg::a));
        fast_u16 r = a + n;
        fast_u8 r8 = i8080core::mask8(r);

        check(r > 0xff ? flags.set(flag::cf) : flags.clear(flag::cf));
        check(((a ^ n ^ r) & 0x10) ? flags.set(flag::hf) :
                                     flags.clear(flag::hf));
        flags.set_zero(r8);
        flags.set_sign(r8);
        flags.calculate_parity(r8);

        check(regs.set(reg::a, r8));
    }

    void on_mvi(reg r, fast_u8 n) {
        set_operand(r, n);
    }

    void on_lxi(i8080core::register_pair rp, fast_u16 nn) {
        check(regs.set_pair_value(rp, nn));
    }

    fast_u16 pc = 0;
    bool halted = false;
    i8080core::i8080_flags flags;
    i8080core::register_file regs;

    least_u8 memory[address_space_size] = {
        0x21, 0x00, 0x20,  // lxi h, 0x2000
        0x36, 0x45,        // mvi m, 0x45
        0x3e, 0x3b,        // mvi a, 0x3b
        0x86,              // add m
        0x06, 0x80,        // mvi b, 0x80
        0x80,              // add b
        0x76,              // hlt
    };
};

}  // anonymous namespace

int main() {
    my_engine e;
    while(!e.is_halted()) {
        e.step();
        i8080core::print_state(stdout, e.get_flags(), e.get_regs());
    }
}
