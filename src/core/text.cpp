#include <browser_mcp/core/text.hpp>

namespace browser_mcp {

namespace {

constexpr char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the sequence introduced by a lead byte (1-4), or 0 if the byte
// cannot start a sequence.
size_t LeadLength(unsigned char byte) {
    if (byte < 0x80u) return 1;
    if (byte >= 0xC2u && byte <= 0xDFu) return 2;
    if (byte >= 0xE0u && byte <= 0xEFu) return 3;
    if (byte >= 0xF0u && byte <= 0xF4u) return 4;
    return 0;
}

bool IsContinuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

// Allowed range of the byte after `lead`. Excludes overlong forms,
// surrogates (U+D800..U+DFFF) and code points above U+10FFFF.
bool ValidSecondByte(unsigned char lead, unsigned char byte) {
    switch (lead) {
        case 0xE0u: return byte >= 0xA0u && byte <= 0xBFu;
        case 0xEDu: return byte >= 0x80u && byte <= 0x9Fu;
        case 0xF0u: return byte >= 0x90u && byte <= 0xBFu;
        case 0xF4u: return byte >= 0x80u && byte <= 0x8Fu;
        default:    return IsContinuation(byte);
    }
}

} // anonymous namespace

std::string SanitizeUtf8(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        const auto lead = static_cast<unsigned char>(text[pos]);
        const size_t length = LeadLength(lead);

        bool valid = length != 0 && pos + length <= text.size();
        if (valid && length > 1) {
            valid = ValidSecondByte(lead, static_cast<unsigned char>(text[pos + 1]));
        }
        for (size_t i = 2; valid && i < length; ++i) {
            valid = IsContinuation(static_cast<unsigned char>(text[pos + i]));
        }

        if (!valid) {
            result.append(kReplacement);
            ++pos;
            continue;
        }
        result.append(text.substr(pos, length));
        pos += length;
    }
    return result;
}

size_t Utf8Length(std::string_view text) {
    size_t count = 0;
    for (char c : text) {
        if (!IsContinuation(static_cast<unsigned char>(c))) {
            ++count;
        }
    }
    return count;
}

std::string_view Utf8Prefix(std::string_view text, size_t count) {
    size_t seen = 0;
    for (size_t pos = 0; pos < text.size(); ++pos) {
        if (!IsContinuation(static_cast<unsigned char>(text[pos]))) {
            if (seen == count) {
                return text.substr(0, pos);
            }
            ++seen;
        }
    }
    return text;
}

} // namespace browser_mcp
