// TSAM - subsidence_curve.cpp
// Thermal subsidence age curve and its derived constants

#include "model/subsidence_curve.h"
#include "util/errors.h"

#include <cmath>
#include <limits>
#include <sstream>

namespace tsam {

namespace {

constexpr double kPi = 3.14159265358979323846;

void require_positive(const char* name, double value) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        std::ostringstream ss;
        ss << "Physical constant '" << name << "' must be positive and finite (got " << value << ")";
        throw ConfigError(ss.str());
    }
}

}  // namespace

SubsidenceCurve::SubsidenceCurve(const PhysicalConstants& constants)
    : constants_(constants), e0_(0.0), tau_(0.0), tau_units_(0.0) {
    require_positive("lithosphere_thickness", constants.lithosphere_thickness);
    require_positive("mantle_density", constants.mantle_density);
    require_positive("infill_density", constants.infill_density);
    require_positive("thermal_diffusivity", constants.thermal_diffusivity);
    require_positive("mantle_temperature", constants.mantle_temperature);
    require_positive("thermal_expansion", constants.thermal_expansion);
    require_positive("seconds_per_unit", constants.seconds_per_unit);

    const double density_contrast = constants.mantle_density - constants.infill_density;
    if (!(density_contrast > 0.0)) {
        throw ConfigError("Infill density must be lower than mantle density");
    }

    const double L = constants.lithosphere_thickness;
    e0_ = 4.0 * L * constants.mantle_density * constants.thermal_expansion *
          constants.mantle_temperature / (kPi * kPi * density_contrast);
    tau_ = L * L / (kPi * kPi * constants.thermal_diffusivity);
    tau_units_ = tau_ / constants.seconds_per_unit;
}

double SubsidenceCurve::height_scale(double b) const {
    return kPi / (e0_ * b * std::sin(kPi / b));
}

double SubsidenceCurve::log_argument(double height, double b) const {
    if (!(b > 0.0)) return std::numeric_limits<double>::quiet_NaN();
    return 1.0 - height * height_scale(b);
}

bool SubsidenceCurve::in_domain(double height, double b) const {
    const double arg = log_argument(height, b);
    return std::isfinite(arg) && arg > 0.0;
}

double SubsidenceCurve::domain_top(double b) const {
    if (!(b > 0.0)) return std::numeric_limits<double>::quiet_NaN();
    return 1.0 / height_scale(b);
}

double SubsidenceCurve::mean_age(double height, double a, double b) const {
    if (!(b > 0.0)) return std::numeric_limits<double>::quiet_NaN();
    // log of a negative argument is NaN, of zero is -inf
    return a + tau_units_ * std::log(log_argument(height, b));
}

double SubsidenceCurve::d_mean_age_db(double height, double b) const {
    if (!(b > 0.0)) return std::numeric_limits<double>::quiet_NaN();
    // k(b) = pi / (E0 s(b)),  s(b) = b sin(pi/b)
    // dk/db = -k s'(b) / s(b),  s'(b) = sin(pi/b) - (pi/b) cos(pi/b)
    const double u = kPi / b;
    const double s = b * std::sin(u);
    const double ds = std::sin(u) - u * std::cos(u);
    const double k = kPi / (e0_ * s);
    const double dk = -k * ds / s;
    return tau_units_ * (-height * dk) / (1.0 - height * k);
}

std::vector<double> SubsidenceCurve::mean_ages(const std::vector<double>& heights,
                                               double a, double b) const {
    std::vector<double> out;
    out.reserve(heights.size());
    for (double h : heights) {
        out.push_back(mean_age(h, a, b));
    }
    return out;
}

}  // namespace tsam
