#include "multigraph/Identifier.hpp"
#include <iomanip>           // std::setw, std::setfill
#include <random>            // std::random_device, std::mt19937_64, std::seed_seq
#include <sstream>           // std::ostringstream

// Seed a 64-bit Mersenne Twister from 256 bits of OS entropy.
static std::mt19937_64 makeEngine() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}

Identifier generateIdentifier() {
    thread_local std::mt19937_64 engine = makeEngine();    // one stream per thread
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << engine()                       // high 64 bits
        << std::setw(16) << engine();                      // low 64 bits
    return oss.str();
}
