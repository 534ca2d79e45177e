// -*- mode: c++; c-basic-offset: 2; indent-tabs-mode: nil; -*-
// Part of dcf77wav, a DCF77 time signal waveform generator.
// Copyright (C) 2026 The dcf77wav Authors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#ifndef DCF77_FRAME_H
#define DCF77_FRAME_H

#include <stdint.h>
#include <string>

struct TimeDate {
  int hour;    // 0..23
  int minute;  // 0..59
  int day;     // 1..31
  int month;   // 1..12
  int year;    // Full year, e.g. 2024
};

struct DstFlags {
  bool active;               // Daylight saving time in effect.
  bool transition_imminent;  // Change to or from DST within the next hour.
};

// The 59 bits transmitted within one minute, bit 0 being sent at second 0.
// Stored in the lower bits of a uint64_t, bit n at (1 << n).
class Dcf77Frame {
public:
  static constexpr int kBits = 59;

  Dcf77Frame() : bits_(0) {}
  explicit Dcf77Frame(uint64_t bits) : bits_(bits & ((1ULL << kBits) - 1)) {}

  bool bit(int second) const { return (bits_ >> second) & 1; }
  uint64_t bits() const { return bits_; }

  // Decode "width" bits starting at "from" as binary number, with the
  // most significant bit at the lowest index.
  int Field(int from, int width) const;

  // Number of bits set in [from, to_excluding).
  int CountOnes(int from, int to_excluding) const;

  // Bits as '0'/'1' characters in transmission order.
  std::string ToString() const;

private:
  uint64_t bits_;
};

// Field positions within the frame.
enum Dcf77Bit {
  kDstActiveBit = 17,
  kDstChangeBit = 18,
  kMinuteBit    = 21,  // 7 bits
  kMinuteParity = 28,
  kHourBit      = 29,  // 6 bits
  kHourParity   = 35,
  kDayBit       = 36,  // 6 bits
  kWeekdayBit   = 42,  // 3 bits
  kMonthBit     = 45,  // 5 bits
  kYearBit      = 50,  // 8 bits, year within century
  kDateParity   = 58,
};

// Encode time, date and DST flags into a DCF77 frame.
// Returns 'false' if day, month and year do not form a valid date; "frame"
// is not modified in that case. The remaining fields are trusted to be
// within range.
bool EncodeDCF77Frame(const TimeDate &time, const DstFlags &dst,
                      Dcf77Frame *frame);

#endif // DCF77_FRAME_H
