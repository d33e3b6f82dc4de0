#include "seed.hpp"

namespace repaircast {

uint64_t seed_from_string(const std::string& text, uint64_t offset) {
    uint64_t seed = offset;
    for (char c : text) {
        seed += static_cast<unsigned char>(c);
    }
    return seed;
}

} // namespace repaircast
