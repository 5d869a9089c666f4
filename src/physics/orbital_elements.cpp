#include "physics/orbital_elements.hpp"
#include <cmath>

namespace solcat {

double OsculatingElements::mean_motion() const {
    return TWO_PI / p;
}

double OsculatingElements::proxy_mu() const {
    double n = mean_motion();
    return n * n * a * a * a;
}

OsculatingElements make_degenerate_elements(double epoch, const std::string& ref_id) {
    OsculatingElements elem;
    elem.epoch = epoch;
    elem.ref_id = ref_id;
    elem.e = 1.0;
    return elem;
}

} // namespace solcat
