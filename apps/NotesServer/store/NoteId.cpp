#include "NoteId.h"

#include <limits>

bool NoteId::parse(const std::string& segment, NoteId& outId) {
    if (segment.empty()) {
        return false;
    }

    const uint64_t kMax = std::numeric_limits<uint64_t>::max();
    uint64_t v = 0;
    for (size_t i = 0; i < segment.size(); ++i) {
        const char c = segment[i];
        if (c < '0' || c > '9') {
            return false;
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (v > (kMax - digit) / 10) {
            return false; // 溢出
        }
        v = v * 10 + digit;
    }

    outId = NoteId(v);
    return true;
}
