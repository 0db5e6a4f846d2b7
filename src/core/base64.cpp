#include <browser_mcp/core/base64.hpp>

#include <array>
#include <cstdint>

namespace browser_mcp {

namespace {

constexpr std::array<int8_t, 256> MakeDecodeTable() {
    std::array<int8_t, 256> table{};
    for (auto& entry : table) entry = -1;
    constexpr const char* kAlphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    for (int i = 0; i < 64; ++i) {
        table[static_cast<uint8_t>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

} // anonymous namespace

Result<std::string, std::string> Base64Decode(std::string_view encoded) {
    static constexpr auto kTable = MakeDecodeTable();

    std::string result;
    result.reserve((encoded.size() / 4) * 3);

    uint32_t buffer = 0;
    int bits = 0;
    bool padding = false;
    for (char c : encoded) {
        if (c == '\n' || c == '\r') continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        auto value = kTable[static_cast<uint8_t>(c)];
        if (value < 0 || padding) {
            return Result<std::string, std::string>::Err(
                "invalid base64 character at offset " +
                std::to_string(static_cast<size_t>(&c - encoded.data())));
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }
    return Result<std::string, std::string>::Ok(std::move(result));
}

} // namespace browser_mcp
