#include "util/Uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace util {

// A single random_device word would leave only 2^32 reachable id streams.
static std::mt19937_64 seeded_engine() {
    std::random_device rd;
    std::array<std::uint32_t, 8> words{};
    for (auto& w : words) w = rd();
    std::seed_seq seq(words.begin(), words.end());
    return std::mt19937_64(seq);
}

Uuid generate_uuid() {
    static thread_local std::mt19937_64 rng = seeded_engine();

    Uuid id{};
    uint64_t bits = 0;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i % 8 == 0) bits = rng();
        id[i] = static_cast<uint8_t>(bits & 0xFF);
        bits >>= 8;
    }

    // RFC4122 variant + version 4
    id[6] = (id[6] & 0x0F) | 0x40;
    id[8] = (id[8] & 0x3F) | 0x80;

    return id;
}

std::string to_string(const Uuid& id) {
    std::ostringstream oss;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
    }
    return oss.str();
}

std::string new_id() {
    return to_string(generate_uuid());
}

} // namespace util
