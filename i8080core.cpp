
/*  Intel 8080 CPU State Core.

    Copyright (c) 2017 Ivan Kosarev <mail@ivankosarev.com>
    Published under the MIT license.
*/

#include "i8080core.h"

namespace i8080core {

const char *get_error_name(state_error e) {
    switch(e) {
    case state_error::none: return "none";
    case state_error::invalid_flag: return "invalid condition flag";
    case state_error::out_of_range_flag: return "flag bit out of range";
    case state_error::invalid_register: return "invalid register";
    case state_error::invalid_pair: return "invalid register pair";
    case state_error::type_mismatch: return "expected an integer key";
    case state_error::invalid_value: return "flags can only be 0 or 1";
    }
    unreachable("Unknown error kind.");
}

const char *get_reg_name(reg r) {
    switch(r) {
    case reg::b: return "b";
    case reg::c: return "c";
    case reg::d: return "d";
    case reg::e: return "e";
    case reg::h: return "h";
    case reg::l: return "l";
    case reg::at_hl: return "m";
    case reg::a: return "a";
    }
    unreachable("Unknown register.");
}

const char *get_flag_name(flag f) {
    switch(f) {
    case flag::cf: return "cf";
    case flag::pf: return "pf";
    case flag::hf: return "hf";
    case flag::zf: return "zf";
    case flag::sf: return "sf";
    }
    return "?";
}

const char *get_pair_name(register_pair rp) {
    if(rp == bc_pair)
        return "bc";
    if(rp == de_pair)
        return "de";
    if(rp == hl_pair)
        return "hl";
    return "?";
}

static unsigned get_reg_value(const register_file &regs, reg r) {
    return static_cast<unsigned>(regs.get(r).get());
}

void print_state(std::FILE *out, fast_u8 psw, const register_file &regs) {
    std::fprintf(out, "BC=%02x%02x DE=%02x%02x HL=%02x%02x A=%02x F=%02x",
                 get_reg_value(regs, reg::b), get_reg_value(regs, reg::c),
                 get_reg_value(regs, reg::d), get_reg_value(regs, reg::e),
                 get_reg_value(regs, reg::h), get_reg_value(regs, reg::l),
                 get_reg_value(regs, reg::a), static_cast<unsigned>(psw));

    static const char letters[] = "CPAZS";
    std::fputc(' ', out);
    for(unsigned i = 0; i != num_of_flags; ++i) {
        unsigned bit = static_cast<unsigned>(flag_list[i]);
        std::fputc((psw >> bit) & 1 ? letters[i] : '-', out);
    }
    std::fputc('\n', out);
}

}  // namespace i8080core
