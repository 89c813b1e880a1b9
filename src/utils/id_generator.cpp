#include "utils/id_generator.h"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace docbridge {
namespace utils {

std::string generateUuid() {
    static thread_local std::mt19937_64 gen((std::random_device())());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);
    // Version 4, Variante 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << "-"
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-"
        << std::setw(4) << (hi & 0xFFFF) << "-"
        << std::setw(4) << (lo >> 48) << "-"
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

} // namespace utils
} // namespace docbridge
