#include "Ids.hpp"

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>

namespace axiom {

std::string generate_id() {
    static std::mutex mutex;
    static std::mt19937_64 gen{std::random_device{}()};

    std::uint64_t hi = 0;
    std::uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = gen();
        lo = gen();
    }

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
        static_cast<unsigned>(hi >> 32),
        static_cast<unsigned>((hi >> 16) & 0xFFFF),
        static_cast<unsigned>(hi & 0xFFFF),
        static_cast<unsigned>(lo >> 48),
        static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

} // namespace axiom
