#include "trialbox/concat_tostr.hh"
#include "trialbox/errmsg.hh"

#include <cstring>

std::string errmsg(int errnum) {
    const char* descr = strerrordesc_np(errnum);
    if (descr) {
        return concat_tostr(" - ", errnum, ": ", descr);
    }
    return concat_tostr(" - ", errnum, ": Unknown error");
}
