
#include "i8080core.h"

using i8080core::fast_u8;
using i8080core::flag;

// Flags that report every sign test and treat values as
// negative only when they are at least 0xc0.
class my_flags : public i8080core::flags_state<my_flags> {
public:
    my_flags() {}

    bool on_is_negative(fast_u8 n) const {
        bool res = n >= 0xc0;
        std::printf("is_negative(0x%02x) = %d\n", static_cast<unsigned>(n),
                    res ? 1 : 0);
        return res;
    }
};

int main() {
    my_flags f;
    f.set_sign(0x80);
    f.set_sign(0xc1);

    for(fast_u8 v : f.get_values())
        std::printf("%u", static_cast<unsigned>(v));
    std::printf("\npsw = 0x%02x\n", static_cast<unsigned>(f.get_psw()));
}
