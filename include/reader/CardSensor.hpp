#pragma once

#include "model/CardId.hpp"
#include <optional>

namespace rfidaudio::reader {

class CardSensor {
public:
    virtual ~CardSensor() = default;

    // One detection attempt. std::nullopt when no card answered, including
    // transient reader errors.
    virtual std::optional<model::CardId> poll() = 0;
};

}  // namespace rfidaudio::reader
