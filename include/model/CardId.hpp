#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace rfidaudio::model {

// Identifier read from a card, kept as lowercase hex of the UID bytes.
struct CardId {
    std::string hex;

    static CardId from_bytes(const uint8_t* data, size_t len) {
        static const char* digits = "0123456789abcdef";
        CardId id;
        id.hex.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            id.hex.push_back(digits[data[i] >> 4]);
            id.hex.push_back(digits[data[i] & 0x0F]);
        }
        return id;
    }

    bool operator==(const CardId&) const = default;
};

}  // namespace rfidaudio::model
