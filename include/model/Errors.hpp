#pragma once

#include <string_view>

namespace rfidaudio::model {

enum class ErrorKind {
    None,
    CardUnmapped,
    AssetMissing,
    AssetUnreadable,
    PlaybackStartFailure,
    SensorFailure,
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::CardUnmapped: return "CardUnmapped";
        case ErrorKind::AssetMissing: return "AssetMissing";
        case ErrorKind::AssetUnreadable: return "AssetUnreadable";
        case ErrorKind::PlaybackStartFailure: return "PlaybackStartFailure";
        case ErrorKind::SensorFailure: return "SensorFailure";
    }
    return "Unknown";
}

}  // namespace rfidaudio::model
