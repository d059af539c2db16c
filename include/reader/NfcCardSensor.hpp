#pragma once

#include "reader/CardSensor.hpp"
#include <string>

struct nfc_context;
struct nfc_device;

namespace rfidaudio::reader {

struct NfcConfig {
    std::string connstring;  // Empty = first device libnfc finds
};

// ISO14443A reader through libnfc. Opening is the only fatal step;
// poll errors afterwards read as "no card".
class NfcCardSensor : public CardSensor {
public:
    explicit NfcCardSensor(NfcConfig config = {});
    ~NfcCardSensor() override;

    NfcCardSensor(const NfcCardSensor&) = delete;
    NfcCardSensor& operator=(const NfcCardSensor&) = delete;

    // Throws std::runtime_error if no reader answers
    void open();
    void close();

    std::optional<model::CardId> poll() override;

private:
    NfcConfig config_;
    nfc_context* context_ = nullptr;
    nfc_device* device_ = nullptr;
    int consecutive_errors_ = 0;
};

}  // namespace rfidaudio::reader
