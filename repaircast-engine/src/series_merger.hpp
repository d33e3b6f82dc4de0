#ifndef REPAIRCAST_SERIES_MERGER_HPP
#define REPAIRCAST_SERIES_MERGER_HPP

#include "damage.hpp"

namespace repaircast {

// Overlay authoritative yearly rows onto a synthetic baseline.
//
// For each year 1..15 the authoritative row replaces the synthetic one only
// when it exists and its cost is strictly positive; a zero or missing row
// keeps the placeholder. Rows outside 1..15 are ignored and, for a repeated
// year, the first positive row wins. An overriding cost is rounded to the
// nearest whole unit.
//
// The result always holds exactly years 1..15 in ascending order. Synthetic
// rows missing from a short baseline are filled as empty years.
YearlySeries merge_series(const YearlySeries& synthetic, const YearlySeries& authoritative);

} // namespace repaircast

#endif // REPAIRCAST_SERIES_MERGER_HPP
