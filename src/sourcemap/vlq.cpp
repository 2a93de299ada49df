#include <stylebind/sourcemap/vlq.h>

#include <climits>

namespace stylebind::sourcemap {

namespace {

constexpr char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int kVlqShift = 5;
constexpr int kVlqBase = 1 << kVlqShift;       // 32
constexpr int kVlqMask = kVlqBase - 1;         // 0b11111
constexpr int kVlqContinuation = kVlqBase;     // 0b100000

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

void encode_vlq(int value, std::string& out) {
    // Sign goes in the lowest bit.
    unsigned int vlq = value < 0 ? ((static_cast<unsigned int>(-(value + 1)) + 1) << 1) | 1u
                                 : static_cast<unsigned int>(value) << 1;
    do {
        unsigned int digit = vlq & kVlqMask;
        vlq >>= kVlqShift;
        if (vlq > 0) digit |= kVlqContinuation;
        out += kBase64Chars[digit];
    } while (vlq > 0);
}

std::optional<std::vector<int>> decode_vlq_segment(std::string_view segment) {
    std::vector<int> values;
    long long accumulated = 0;
    int shift = 0;
    bool in_value = false;

    for (char c : segment) {
        int digit = base64_value(c);
        if (digit < 0) return std::nullopt;
        in_value = true;
        accumulated += static_cast<long long>(digit & kVlqMask) << shift;
        if (shift > 31) return std::nullopt;
        if (digit & kVlqContinuation) {
            shift += kVlqShift;
            continue;
        }
        bool negative = accumulated & 1;
        long long magnitude = accumulated >> 1;
        if (magnitude > INT_MAX) return std::nullopt;
        values.push_back(static_cast<int>(negative ? -magnitude : magnitude));
        accumulated = 0;
        shift = 0;
        in_value = false;
    }
    if (in_value) return std::nullopt;
    return values;
}

} // namespace stylebind::sourcemap
