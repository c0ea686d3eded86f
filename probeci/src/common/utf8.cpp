#include "common/utf8.hpp"

#include <cstddef>
#include <cstdint>

namespace probeci {

namespace {

/// Length of the sequence introduced by `lead` and the accepted range of its
/// second byte (RFC 3629, table 3-7). Zero length means `lead` cannot start
/// a sequence.
struct LeadInfo {
    size_t length;
    uint8_t second_lo;
    uint8_t second_hi;
};

auto classify_lead(uint8_t lead) -> LeadInfo {
    if (lead >= 0xC2 && lead <= 0xDF)
        return {2, 0x80, 0xBF};
    if (lead == 0xE0)
        return {3, 0xA0, 0xBF};
    if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF)
        return {3, 0x80, 0xBF};
    if (lead == 0xED)
        return {3, 0x80, 0x9F}; // excludes surrogates
    if (lead == 0xF0)
        return {4, 0x90, 0xBF};
    if (lead >= 0xF1 && lead <= 0xF3)
        return {4, 0x80, 0xBF};
    if (lead == 0xF4)
        return {4, 0x80, 0x8F};
    return {0, 0, 0};
}

/// Number of bytes of `bytes[pos..]` that form a valid prefix of a sequence.
/// Equals the full sequence length when the sequence is complete and valid.
auto valid_prefix(std::string_view bytes, size_t pos, const LeadInfo& info) -> size_t {
    size_t matched = 1;
    while (matched < info.length && pos + matched < bytes.size()) {
        auto b = static_cast<uint8_t>(bytes[pos + matched]);
        uint8_t lo = matched == 1 ? info.second_lo : 0x80;
        uint8_t hi = matched == 1 ? info.second_hi : 0xBF;
        if (b < lo || b > hi)
            break;
        ++matched;
    }
    return matched;
}

} // namespace

auto utf8_lossy(std::string_view bytes) -> std::string {
    std::string out;
    out.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        auto lead = static_cast<uint8_t>(bytes[pos]);
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++pos;
            continue;
        }

        LeadInfo info = classify_lead(lead);
        if (info.length == 0) {
            out += UTF8_REPLACEMENT;
            ++pos;
            continue;
        }

        size_t matched = valid_prefix(bytes, pos, info);
        if (matched == info.length) {
            out.append(bytes.substr(pos, matched));
        } else {
            out += UTF8_REPLACEMENT;
        }
        pos += matched;
    }

    return out;
}

auto is_valid_utf8(std::string_view bytes) -> bool {
    size_t pos = 0;
    while (pos < bytes.size()) {
        auto lead = static_cast<uint8_t>(bytes[pos]);
        if (lead < 0x80) {
            ++pos;
            continue;
        }
        LeadInfo info = classify_lead(lead);
        if (info.length == 0 || valid_prefix(bytes, pos, info) != info.length)
            return false;
        pos += info.length;
    }
    return true;
}

} // namespace probeci
