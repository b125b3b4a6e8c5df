#include "toolmux/protocol/request_id.hpp"

#include <algorithm>
#include <array>
#include <mutex>
#include <random>

namespace toolmux {
namespace {

// Most significant limb first
using Limbs = std::array<std::uint32_t, 4>;

constexpr std::size_t kMaxDecimalDigits = 39;  // 2^128 - 1 has 39 digits

Limbs to_limbs(const RequestId& id) noexcept {
    return Limbs{
        static_cast<std::uint32_t>(id.high >> 32),
        static_cast<std::uint32_t>(id.high & 0xffffffffu),
        static_cast<std::uint32_t>(id.low >> 32),
        static_cast<std::uint32_t>(id.low & 0xffffffffu)};
}

RequestId from_limbs(const Limbs& limbs) noexcept {
    RequestId id;
    id.high = (static_cast<std::uint64_t>(limbs[0]) << 32) | limbs[1];
    id.low = (static_cast<std::uint64_t>(limbs[2]) << 32) | limbs[3];
    return id;
}

bool is_zero(const Limbs& limbs) noexcept {
    return std::all_of(limbs.begin(), limbs.end(), [](std::uint32_t limb) { return limb == 0; });
}

// Divides in place and returns the remainder
std::uint32_t divide_by_ten(Limbs& limbs) noexcept {
    std::uint64_t remainder = 0;
    for (auto& limb : limbs) {
        const std::uint64_t current = (remainder << 32) | limb;
        limb = static_cast<std::uint32_t>(current / 10);
        remainder = current % 10;
    }
    return static_cast<std::uint32_t>(remainder);
}

// Returns false on overflow
bool multiply_add(Limbs& limbs, std::uint32_t digit) noexcept {
    std::uint64_t carry = digit;
    for (auto it = limbs.rbegin(); it != limbs.rend(); ++it) {
        const std::uint64_t current = static_cast<std::uint64_t>(*it) * 10 + carry;
        *it = static_cast<std::uint32_t>(current & 0xffffffffu);
        carry = current >> 32;
    }
    return carry == 0;
}

}  // namespace

RequestId RequestId::random() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    std::lock_guard<std::mutex> lock(rng_mutex);
    RequestId id;
    id.high = rng();
    id.low = rng();
    return id;
}

std::optional<RequestId> RequestId::parse(std::string_view text) {
    const bool bad_length = text.empty() || (text.size() > kMaxDecimalDigits);
    if (bad_length) {
        return std::nullopt;
    }

    Limbs limbs{};
    for (const char c : text) {
        const bool is_digit = (c >= '0') && (c <= '9');
        if (is_digit == false) {
            return std::nullopt;
        }
        if (multiply_add(limbs, static_cast<std::uint32_t>(c - '0')) == false) {
            return std::nullopt;
        }
    }
    return from_limbs(limbs);
}

std::string RequestId::to_string() const {
    Limbs limbs = to_limbs(*this);
    if (is_zero(limbs)) {
        return "0";
    }

    std::string digits;
    digits.reserve(kMaxDecimalDigits);
    while (is_zero(limbs) == false) {
        digits.push_back(static_cast<char>('0' + divide_by_ten(limbs)));
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

}  // namespace toolmux
