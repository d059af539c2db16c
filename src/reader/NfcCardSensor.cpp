#include "reader/NfcCardSensor.hpp"
#include "util/Logger.hpp"
#include <stdexcept>
extern "C" {
#include <nfc/nfc.h>
}

namespace rfidaudio::reader {

namespace {

const nfc_modulation kIso14443A = { NMT_ISO14443A, NBR_106 };

}  // namespace

NfcCardSensor::NfcCardSensor(NfcConfig config)
    : config_(std::move(config)) {}

NfcCardSensor::~NfcCardSensor() {
    close();
}

void NfcCardSensor::open() {
    if (device_) return;

    util::Logger::debug(std::string("NfcCardSensor: libnfc ") + nfc_version());

    nfc_init(&context_);
    if (!context_) {
        throw std::runtime_error("Couldn't find RFID reader: nfc_init failed");
    }

    const char* connstring = config_.connstring.empty() ? nullptr : config_.connstring.c_str();
    device_ = nfc_open(context_, connstring);
    if (!device_) {
        close();
        throw std::runtime_error("Couldn't find RFID reader" +
                                 (config_.connstring.empty() ? std::string() : " at " + config_.connstring));
    }

    if (nfc_initiator_init(device_) < 0) {
        std::string err = nfc_strerror(device_);
        close();
        throw std::runtime_error("Couldn't find RFID reader: nfc_initiator_init failed: " + err);
    }

    // One select attempt per poll instead of blocking until a card shows up
    if (nfc_device_set_property_bool(device_, NP_INFINITE_SELECT, false) < 0 ||
        nfc_device_set_property_bool(device_, NP_ACTIVATE_FIELD, true) < 0) {
        std::string err = nfc_strerror(device_);
        close();
        throw std::runtime_error("Couldn't configure RFID reader: " + err);
    }

    util::Logger::info(std::string("NfcCardSensor: Reader ") + nfc_device_get_name(device_) + " ready");
}

void NfcCardSensor::close() {
    if (device_) {
        nfc_close(device_);
        device_ = nullptr;
    }
    if (context_) {
        nfc_exit(context_);
        context_ = nullptr;
    }
}

std::optional<model::CardId> NfcCardSensor::poll() {
    if (!device_) return std::nullopt;

    nfc_target target{};
    int rc = nfc_initiator_select_passive_target(device_, kIso14443A, nullptr, 0, &target);
    if (rc < 0) {
        // SensorFailure: transient, same as no card this cycle
        if (consecutive_errors_++ % 20 == 0 && util::Logger::enabled(util::Logger::Level::Debug)) {
            util::Logger::debug(std::string("NfcCardSensor: Poll error: ") + nfc_strerror(device_));
        }
        return std::nullopt;
    }
    consecutive_errors_ = 0;

    if (rc == 0 || target.nti.nai.szUidLen == 0) {
        return std::nullopt;
    }

    auto id = model::CardId::from_bytes(target.nti.nai.abtUid, target.nti.nai.szUidLen);
    nfc_initiator_deselect_target(device_);
    return id;
}

}  // namespace rfidaudio::reader
