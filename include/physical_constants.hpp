#ifndef PHYSICAL_CONSTANTS_HPP
#define PHYSICAL_CONSTANTS_HPP

namespace ocdb {
namespace constants {

// SI 2019 defining constants (exact)
constexpr double speed_of_light = 299792458.0;        // m/s (c₀)
constexpr double elementary_charge = 1.602176634e-19; // C (e)
constexpr double planck = 6.62607015e-34;             // J·s (h)

// E[eV] = nm_ev_factor / λ[nm] and λ[nm] = nm_ev_factor / E[eV]
constexpr double nm_ev_factor = planck * speed_of_light / elementary_charge * 1e9; // ≈ 1239.84198

} // namespace constants
} // namespace ocdb

#endif // PHYSICAL_CONSTANTS_HPP
