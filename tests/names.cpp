
#include <cstring>

#include "i8080core.h"

#include "check.h"

using i8080core::flag;
using i8080core::reg;
using i8080core::state_error;

static bool equal(const char *a, const char *b) {
    return std::strcmp(a, b) == 0;
}

static void test_error_names() {
    CHECK(equal(i8080core::get_error_name(state_error::invalid_flag),
                "invalid condition flag"));
    CHECK(equal(i8080core::get_error_name(state_error::invalid_pair),
                "invalid register pair"));
    CHECK(equal(i8080core::get_error_name(state_error::invalid_value),
                "flags can only be 0 or 1"));
}

static void test_reg_names() {
    CHECK(equal(i8080core::get_reg_name(reg::b), "b"));
    CHECK(equal(i8080core::get_reg_name(reg::at_hl), "m"));
    CHECK(equal(i8080core::get_reg_name(reg::a), "a"));
    CHECK(equal(i8080core::get_pair_name(i8080core::de_pair), "de"));
    CHECK(equal(i8080core::get_pair_name(
                    i8080core::register_pair(reg::a, reg::b)), "?"));
}

static void test_flag_names() {
    CHECK(equal(i8080core::get_flag_name(flag::hf), "hf"));
    CHECK(equal(i8080core::get_flag_name(static_cast<flag>(1)), "?"));
}

static void test_print_state() {
    std::FILE *f = std::tmpfile();
    CHECK(f != nullptr);

    i8080core::i8080_flags flags;
    flags.set(flag::cf);
    flags.set(flag::zf);

    i8080core::register_file regs;
    regs.set_pair_value(i8080core::hl_pair, 0x2000);
    regs.set(reg::a, 0x5a);

    i8080core::print_state(f, flags, regs);

    char line[128];
    std::rewind(f);
    CHECK(std::fgets(line, sizeof(line), f) != nullptr);
    CHECK(equal(line, "BC=0000 DE=0000 HL=2000 A=5a F=43 C--Z-\n"));
    std::fclose(f);
}

int main() {
    test_error_names();
    test_reg_names();
    test_flag_names();
    test_print_state();
}
