
#ifndef CHECK_H
#define CHECK_H

#include <cstdio>
#include <cstdlib>

#define CHECK(c) (check((c), #c, __FILE__, __LINE__))

static void check(bool c, const char *expr, const char *file,
                  unsigned line_no) {
    if(c)
        return;

    std::fprintf(stderr, "%s:%u: check failed: %s\n", file,
                 static_cast<unsigned>(line_no), expr);
    std::abort();
}

#endif
