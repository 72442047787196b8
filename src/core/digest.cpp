#include "core/digest.hpp"

#include <openssl/sha.h>

#include <format>

namespace doubleblind {

Digest::Bytes Digest::sha256(std::string_view data) {
    Bytes out{};
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
    return out;
}

std::string Digest::sha256_hex(std::string_view data) {
    const auto hash = sha256(data);
    std::string result;
    result.reserve(hash.size() * 2);
    for (const uint8_t b : hash) {
        result += std::format("{:02x}", b);
    }
    return result;
}

std::string Digest::value_key(std::string_view category, const Scalar& value) {
    std::string material;
    const std::string canonical = scalar_to_string(value);
    material.reserve(category.size() + canonical.size() + 4);
    material.append(category);
    material.push_back('\0');
    material.push_back(static_cast<char>('0' + static_cast<int>(primitive_type_of(value))));
    material.push_back('\0');
    material.append(canonical);
    return sha256_hex(material);
}

uint64_t Digest::seed_from(std::string_view data) {
    const auto hash = sha256(data);
    uint64_t seed = 0;
    for (int i = 7; i >= 0; --i) {
        seed = (seed << 8) | hash[static_cast<size_t>(i)];
    }
    return seed;
}

} // namespace doubleblind
