#include <langlint/util/hash.hpp>

namespace langlint {

uint64_t Fnv1a::compute(std::string_view data) {
    return update(OFFSET_BASIS, data);
}

uint64_t Fnv1a::update(uint64_t hash, const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        hash ^= data[i];
        hash *= PRIME;
    }
    return hash;
}

uint64_t Fnv1a::update(uint64_t hash, std::string_view data) {
    return update(hash, reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string Fnv1a::to_hex(uint64_t hash) {
    static const char digits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = digits[hash & 0xF];
        hash >>= 4;
    }
    return out;
}

}  // namespace langlint
