#ifndef REPAIRCAST_SEED_HPP
#define REPAIRCAST_SEED_HPP

#include <cstdint>
#include <string>

namespace repaircast {

// Deterministic string hash used wherever synthetic data must be reproducible:
// sum of the byte values of text, plus offset. Empty text yields offset.
uint64_t seed_from_string(const std::string& text, uint64_t offset = 0);

} // namespace repaircast

#endif // REPAIRCAST_SEED_HPP
