
/*  Intel 8080 CPU State Core.

    Copyright (c) 2017 Ivan Kosarev <mail@ivankosarev.com>
    Published under the MIT license.
*/

#ifndef I8080CORE_H
#define I8080CORE_H

#include <cassert>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace i8080core {

#if UINT_FAST8_MAX < UINT_MAX
typedef unsigned fast_u8;
#else
typedef uint_fast8_t fast_u8;
#endif

#if UINT_FAST16_MAX < UINT_MAX
typedef unsigned fast_u16;
#else
typedef uint_fast16_t fast_u16;
#endif

typedef uint_least8_t least_u8;
typedef uint_least16_t least_u16;

static inline void unused(...) {}

[[noreturn]] static inline void unreachable(const char *msg) {
#if !defined(NDEBUG)
    std::fprintf(stderr, "%s\n", msg);
    std::abort();
#elif defined(_MSC_VER)
    __assume(0);
#else
    __builtin_unreachable();
#endif
}

template<typename T>
static inline constexpr fast_u8 mask8(T n) {
    return n & 0xff;
}

static inline constexpr fast_u16 mask16(fast_u16 n) {
    return n & 0xffff;
}

// The default negativity test: a byte is negative if its
// most significant bit is raised.
static inline constexpr bool get_sign8(fast_u8 n) {
    return (n & 0x80) != 0;
}

static inline constexpr fast_u8 get_low8(fast_u16 n) {
    return mask8(static_cast<fast_u8>(n));
}

static inline constexpr fast_u8 get_high8(fast_u16 n) {
    return mask8(static_cast<fast_u8>(n >> 8));
}

static inline constexpr fast_u16 make16(fast_u8 hi, fast_u8 lo) {
    return (static_cast<fast_u16>(hi) << 8) | lo;
}

// Register codes as they are encoded in instructions. at_hl is
// the M pseudo-register: the operand is in memory at the address
// held by the HL pair and there is no storage cell for it.
enum class reg { b, c, d, e, h, l, at_hl, a };

// Addressable condition flags. The values are bit positions
// within the flag byte.
enum class flag : unsigned {
    cf = 0,  // Carry.
    pf = 2,  // Parity.
    hf = 4,  // Auxiliary carry.
    zf = 6,  // Zero.
    sf = 7,  // Sign.
};

enum class state_error {
    none,
    invalid_flag,
    out_of_range_flag,
    invalid_register,
    invalid_pair,
    type_mismatch,
    invalid_value,
};

const char *get_error_name(state_error e);
const char *get_reg_name(reg r);
const char *get_flag_name(flag f);

// Either a value or the kind of error that prevented producing it.
template<typename T>
class result {
public:
    result(T v) : v(v) {}
    result(state_error e) : v(), e(e) {
        assert(e != state_error::none);
    }

    bool ok() const { return e == state_error::none; }
    explicit operator bool () const { return ok(); }

    state_error get_error() const { return e; }

    T get() const {
        assert(ok());
        return v;
    }

private:
    T v;
    state_error e = state_error::none;
};

static const unsigned num_of_flags = 5;

// In the order flag values are listed on iteration.
static constexpr flag flag_list[num_of_flags] = {
    flag::cf, flag::pf, flag::hf, flag::zf, flag::sf };

static inline constexpr bool is_addressable_flag(unsigned bit) {
    return bit == static_cast<unsigned>(flag::cf) ||
           bit == static_cast<unsigned>(flag::pf) ||
           bit == static_cast<unsigned>(flag::hf) ||
           bit == static_cast<unsigned>(flag::zf) ||
           bit == static_cast<unsigned>(flag::sf);
}

// A fixed-length snapshot of the addressable flag values.
struct flag_values {
    least_u8 values[num_of_flags];

    unsigned size() const { return num_of_flags; }
    const least_u8 *begin() const { return values; }
    const least_u8 *end() const { return values + num_of_flags; }
    fast_u8 operator [] (unsigned i) const { return values[i]; }
};

// The 8080 flag register.
//
// Bit  Use
//  0   Carry.
//  1   Reserved, always one.
//  2   Parity, raised if the number of raised result bits is even.
//  3   Reserved, always zero.
//  4   Auxiliary carry, carry out of bit 3 or borrow into bit 4.
//  5   Reserved, always zero.
//  6   Zero.
//  7   Sign, the most significant bit of the result.
//
// Some 8080 documentation lists the auxiliary carry as bit 3.
// The hardware pushes it as bit 4 of the PSW, so this is where
// it lives here and bit 3 is reserved.
template<typename D>
class flags_state {
public:
    typedef D derived;

    static const fast_u8 reserved_ones_mask = 1 << 1;
    static const fast_u8 reserved_zeros_mask = (1 << 3) | (1 << 5);
    static const fast_u8 addressable_mask =
        (1 << static_cast<unsigned>(flag::cf)) |
        (1 << static_cast<unsigned>(flag::pf)) |
        (1 << static_cast<unsigned>(flag::hf)) |
        (1 << static_cast<unsigned>(flag::zf)) |
        (1 << static_cast<unsigned>(flag::sf));

    flags_state() {}

    state_error set(flag f) {
        if(!is_addressable_flag(static_cast<unsigned>(f)))
            return state_error::invalid_flag;
        raise_bit(static_cast<unsigned>(f));
        return state_error::none;
    }

    state_error clear(flag f) {
        if(!is_addressable_flag(static_cast<unsigned>(f)))
            return state_error::invalid_flag;
        clear_bit(static_cast<unsigned>(f));
        return state_error::none;
    }

    result<fast_u8> get(unsigned bit) const {
        if(!is_addressable_flag(bit))
            return state_error::out_of_range_flag;
        return get_bit(bit);
    }

    state_error set_value(unsigned bit, fast_u8 value) {
        if(!is_addressable_flag(bit))
            return state_error::out_of_range_flag;
        switch(value) {
        case 0:
            clear_bit(bit);
            return state_error::none;
        case 1:
            raise_bit(bit);
            return state_error::none;
        }
        return state_error::invalid_value;
    }

    result<fast_u8> get(flag f) const {
        return get(static_cast<unsigned>(f));
    }

    void clear_all() {
        f &= static_cast<least_u8>(~addressable_mask);
    }

    unsigned size() const { return num_of_flags; }

    // Produces a new snapshot on every call, so may be iterated
    // any number of times.
    flag_values get_values() const {
        flag_values fv;
        for(unsigned i = 0; i != num_of_flags; ++i) {
            unsigned bit = static_cast<unsigned>(flag_list[i]);
            fv.values[i] = static_cast<least_u8>(get_bit(bit));
        }
        return fv;
    }

    void calculate_parity(fast_u8 n) {
        // Halve the range of bits to consider by xor'ing nibbles,
        // then look up the parity of the four-bit remainder.
        fast_u8 n4 = ((n >> 4) ^ n) & 0xf;
        bool even = ((0x9669 >> n4) & 1) != 0;
        update_bit(static_cast<unsigned>(flag::pf), even);
    }

    void set_zero(fast_u16 n) {
        update_bit(static_cast<unsigned>(flag::zf), n == 0);
    }

    void set_sign(fast_u8 n) {
        clear_bit(static_cast<unsigned>(flag::sf));
        if(self().on_is_negative(n))
            raise_bit(static_cast<unsigned>(flag::sf));
    }

    // Whole flag byte, as pushed along with the accumulator.
    fast_u8 get_psw() const { return f; }

    void set_psw(fast_u8 n) {
        f = static_cast<least_u8>((n & addressable_mask) |
                                  reserved_ones_mask);
    }

    void reset() { f = reserved_ones_mask; }

    bool on_is_negative(fast_u8 n) const { return get_sign8(n); }

protected:
    D &self() { return static_cast<D&>(*this); }
    const D &self() const { return static_cast<const D&>(*this); }

private:
    fast_u8 get_bit(unsigned bit) const {
        return (f >> bit) & 1;
    }

    void raise_bit(unsigned bit) {
        f = static_cast<least_u8>(f | (1u << bit));
    }

    void clear_bit(unsigned bit) {
        f = static_cast<least_u8>(f & ~(1u << bit));
    }

    void update_bit(unsigned bit, bool raised) {
        if(raised)
            raise_bit(bit);
        else
            clear_bit(bit);
    }

    least_u8 f = reserved_ones_mask;
};

class i8080_flags : public flags_state<i8080_flags> {
public:
    i8080_flags() {}
};

// Describes a register pair. The first register is the high byte.
class register_pair {
public:
    constexpr register_pair() : hi(), lo() {}
    constexpr register_pair(reg hi, reg lo) : hi(hi), lo(lo) {}

    constexpr reg get_hi() const { return hi; }
    constexpr reg get_lo() const { return lo; }

    constexpr bool operator == (const register_pair &other) const {
        return hi == other.hi && lo == other.lo;
    }

    constexpr bool operator != (const register_pair &other) const {
        return !(*this == other);
    }

private:
    reg hi, lo;
};

static constexpr register_pair bc_pair(reg::b, reg::c);
static constexpr register_pair de_pair(reg::d, reg::e);
static constexpr register_pair hl_pair(reg::h, reg::l);

const char *get_pair_name(register_pair rp);

static inline constexpr bool is_storage_reg(unsigned code) {
    return code <= static_cast<unsigned>(reg::a) &&
           code != static_cast<unsigned>(reg::at_hl);
}

// The general-purpose registers of the 8080.
class register_file {
public:
    static const unsigned num_of_codes = 8;

    register_file() {}

    result<fast_u8> get(unsigned code) const {
        if(!is_storage_reg(code))
            return state_error::invalid_register;
        return regs[code];
    }

    state_error set(unsigned code, fast_u8 n) {
        if(!is_storage_reg(code))
            return state_error::invalid_register;
        regs[code] = static_cast<least_u8>(mask8(n));
        return state_error::none;
    }

    result<fast_u8> get(reg r) const {
        return get(static_cast<unsigned>(r));
    }

    state_error set(reg r, fast_u8 n) {
        return set(static_cast<unsigned>(r), n);
    }

    // Resolves the address held by the pair named by its high
    // register. This is how memory operands, including M, are
    // addressed.
    result<fast_u16> get_address_from_pair(unsigned code) const {
        switch(code) {
        case static_cast<unsigned>(reg::b): return get_pair(bc_pair);
        case static_cast<unsigned>(reg::d): return get_pair(de_pair);
        case static_cast<unsigned>(reg::h): return get_pair(hl_pair);
        }
        return state_error::invalid_pair;
    }

    result<fast_u16> get_address_from_pair(reg r) const {
        return get_address_from_pair(static_cast<unsigned>(r));
    }

    result<fast_u16> get_pair_value(register_pair rp) const {
        if(!is_storage_pair(rp))
            return state_error::invalid_register;
        return get_pair(rp);
    }

    state_error set_pair_value(register_pair rp, fast_u16 nn) {
        if(!is_storage_pair(rp))
            return state_error::invalid_register;
        nn = mask16(nn);
        regs[code(rp.get_hi())] = static_cast<least_u8>(get_high8(nn));
        regs[code(rp.get_lo())] = static_cast<least_u8>(get_low8(nn));
        return state_error::none;
    }

    // Extracts the three-bit register field at the given offset.
    // The offset is not validated; bits shifted out of the opcode
    // read as zeros. The opcode is a byte, so bits above bit 7 are
    // dropped before extraction and get_register_from_opcode(0x1ff, 8)
    // gives reg::b.
    static reg get_register_from_opcode(fast_u8 op, unsigned offset) {
        if(offset >= 8)
            return reg::b;
        return static_cast<reg>((mask8(op) >> offset) & 07);
    }

    // Pair selectors of the register-pair instruction groups.
    // Note these differ from the register codes that
    // get_address_from_pair() takes.
    static result<register_pair> get_pair_from_encoding(fast_u8 p) {
        switch(p) {
        case 0: return bc_pair;
        case 1: return de_pair;
        case 2: return hl_pair;
        }
        return state_error::invalid_pair;
    }

    // Selector 3 is SP or PSW depending on the group and neither
    // is a pair of this register file.
    static result<register_pair> get_pair_from_opcode(fast_u8 op) {
        return get_pair_from_encoding((mask8(op) & p_mask) >> 4);
    }

    void reset() {
        for(least_u8 &r : regs)
            r = 0;
    }

private:
    static const fast_u8 p_mask = 0060;

    static constexpr unsigned code(reg r) {
        return static_cast<unsigned>(r);
    }

    static constexpr bool is_storage_pair(register_pair rp) {
        return is_storage_reg(code(rp.get_hi())) &&
               is_storage_reg(code(rp.get_lo()));
    }

    fast_u16 get_pair(register_pair rp) const {
        return make16(regs[code(rp.get_hi())], regs[code(rp.get_lo())]);
    }

    // Indexed by register code; the at_hl slot is never accessed.
    least_u8 regs[num_of_codes] = {};
};

// Writes a one-line dump of the state.
void print_state(std::FILE *out, fast_u8 psw, const register_file &regs);

template<typename F>
void print_state(std::FILE *out, const flags_state<F> &flags,
                 const register_file &regs) {
    print_state(out, flags.get_psw(), regs);
}

}  // namespace i8080core

#endif  // I8080CORE_H
