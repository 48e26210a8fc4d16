#include "collabscribe/utils/id_generator.hpp"
#include <cctype>
#include <cstdint>
#include <random>

namespace collabscribe {
namespace utils {

namespace {

std::mt19937_64& threadGenerator() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    return generator;
}

const char* kHexDigits = "0123456789abcdef";

} // namespace

std::string generateUuid() {
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t high = dist(threadGenerator());
    uint64_t low = dist(threadGenerator());

    // version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::string out;
    out.reserve(36);
    for (int i = 15; i >= 0; --i) {
        out.push_back(kHexDigits[(high >> (i * 4)) & 0xF]);
        if (i == 8 || i == 4) {
            out.push_back('-');
        }
    }
    out.push_back('-');
    for (int i = 15; i >= 0; --i) {
        out.push_back(kHexDigits[(low >> (i * 4)) & 0xF]);
        if (i == 12) {
            out.push_back('-');
        }
    }
    return out;
}

std::string generateShortId() {
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(8);
    for (int i = 0; i < 8; ++i) {
        out.push_back(kHexDigits[dist(threadGenerator())]);
    }
    return out;
}

bool isValidUuid(const std::string& value) {
    if (value.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (value[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace utils
} // namespace collabscribe
