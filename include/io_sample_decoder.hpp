#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "types.hpp"

// Fixed part of an IO sample report: digital mask (2), analog mask (1),
// digital samples (2)
const size_t IO_SAMPLE_HEADER_LEN = 5;

// Expand the low num_bits of word into a list ordered by pin index.
// Entry i is bit i of word (LSB = pin 0); higher bits are ignored.
std::vector<bool> expandPinBits(uint16_t word, uint8_t num_bits);

// Number of bytes a report with this analog enable mask must carry
size_t ioSampleRequiredLength(uint8_t analog_mask);

// Decode an XBee IO sample report (big-endian):
//   [0..1] digital enable mask   (pins 0-12)
//   [2]    analog enable mask    (pins 0-7)
//   [3..4] digital sample word   (pins 0-12)
//   [5..]  one 16-bit word per enabled analog pin, ascending pin index
// Throws MalformedSampleException when the buffer is shorter than its own
// masks require.
IoSample decodeIoSample(const uint8_t* data, size_t length);
IoSample decodeIoSample(const std::vector<uint8_t>& data);
