#include "../include/io_sample_decoder.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <cstdio>

static uint16_t readU16BE(const uint8_t* p) {
    return (uint16_t)(((uint16_t)p[0] << 8) | (uint16_t)p[1]);
}

std::vector<bool> expandPinBits(uint16_t word, uint8_t num_bits) {
    if (num_bits > 16) num_bits = 16;
    // Walk from the most significant relevant bit down, then flip the list
    // so that index 0 ends up holding bit 0.
    std::vector<bool> bits;
    bits.reserve(num_bits);
    for (int bit = num_bits - 1; bit >= 0; --bit) {
        bits.push_back(((word >> bit) & 0x1u) != 0);
    }
    std::reverse(bits.begin(), bits.end());
    return bits;
}

size_t ioSampleRequiredLength(uint8_t analog_mask) {
    size_t enabled = 0;
    for (uint8_t bit = 0; bit < NUM_ANALOG_PINS; ++bit) {
        if (analog_mask & (1u << bit)) enabled++;
    }
    return IO_SAMPLE_HEADER_LEN + 2 * enabled;
}

IoSample decodeIoSample(const uint8_t* data, size_t length) {
    if (!data && length > 0) {
        throw MalformedSampleException("IO sample buffer is null");
    }
    if (length < IO_SAMPLE_HEADER_LEN) {
        char msg[80];
        snprintf(msg, sizeof(msg), "IO sample too short: %u bytes, header needs %u",
                 (unsigned)length, (unsigned)IO_SAMPLE_HEADER_LEN);
        throw MalformedSampleException(msg);
    }

    uint16_t digital_mask = readU16BE(&data[0]);
    uint8_t analog_mask = data[2];
    uint16_t digital_sample = readU16BE(&data[3]);

    size_t required = ioSampleRequiredLength(analog_mask);
    if (length < required) {
        char msg[96];
        snprintf(msg, sizeof(msg), "IO sample too short: %u bytes, analog mask 0x%02X needs %u",
                 (unsigned)length, analog_mask, (unsigned)required);
        throw MalformedSampleException(msg);
    }

    std::vector<bool> digital_pins = expandPinBits(digital_mask, NUM_DIGITAL_PINS);
    std::vector<bool> analog_pins = expandPinBits(analog_mask, NUM_ANALOG_PINS);
    std::vector<bool> digital_samples = expandPinBits(digital_sample, NUM_DIGITAL_PINS);

    IoSample sample;
    for (uint8_t pin = 0; pin < NUM_DIGITAL_PINS; ++pin) {
        sample.digital_pin_enabled[pin] = digital_pins[pin];
        sample.digital_pin_value[pin] = digital_samples[pin];
    }

    size_t offset = IO_SAMPLE_HEADER_LEN;
    for (uint8_t pin = 0; pin < NUM_ANALOG_PINS; ++pin) {
        sample.analog_pin_enabled[pin] = analog_pins[pin];
        if (analog_pins[pin]) {
            sample.analog_pin_value[pin] = readU16BE(&data[offset]);
            offset += 2;
        } else {
            sample.analog_pin_value[pin] = 0;
        }
    }

    if (offset < length) {
        Logger::debug("[Decoder] Ignoring %u trailing bytes after IO sample",
                      (unsigned)(length - offset));
    }
    Logger::debug("[Decoder] IO sample: dmask=0x%04X amask=0x%02X dsample=0x%04X",
                  digital_mask, analog_mask, digital_sample);
    return sample;
}

IoSample decodeIoSample(const std::vector<uint8_t>& data) {
    return decodeIoSample(data.data(), data.size());
}
