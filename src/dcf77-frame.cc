// -*- mode: c++; c-basic-offset: 2; indent-tabs-mode: nil; -*-
// Part of dcf77wav, a DCF77 time signal waveform generator.
// Copyright (C) 2018 Henner Zeller <h.zeller@acm.org>
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

#include "dcf77-frame.h"
#include "calendar.h"

constexpr int Dcf77Frame::kBits;

int Dcf77Frame::Field(int from, int width) const {
  int result = 0;
  for (int i = from; i < from + width; ++i) {
    result = (result << 1) | (bit(i) ? 1 : 0);
  }
  return result;
}

int Dcf77Frame::CountOnes(int from, int to_excluding) const {
  int result = 0;
  for (int i = from; i < to_excluding; ++i) {
    if (bit(i)) result++;
  }
  return result;
}

std::string Dcf77Frame::ToString() const {
  std::string result;
  for (int i = 0; i < kBits; ++i) result.append(1, bit(i) ? '1' : '0');
  return result;
}

// Binary value in "width" bits at "from", most significant bit first.
// Value bits that don't fit the field are dropped.
static uint64_t to_field(int value, int from, int width) {
  uint64_t result = 0;
  for (int i = 0; i < width; ++i) {
    if (value & (1 << (width - 1 - i))) result |= 1ULL << (from + i);
  }
  return result;
}

static uint64_t parity(uint64_t d, uint8_t from, uint8_t to_including) {
  uint8_t result = 0;
  for (int bit = from; bit <= to_including; ++bit) {
    if (d & (1ULL << bit)) result++;
  }
  return result & 0x1;
}

bool EncodeDCF77Frame(const TimeDate &time, const DstFlags &dst,
                      Dcf77Frame *frame) {
  if (!IsValidDate(time.day, time.month, time.year))
    return false;

  // Bits 0..16 (minute marker, civil warning, call bit), 19 (leap second)
  // and 20 (start of time) stay zero.
  uint64_t time_bits = 0;
  time_bits |= (dst.active ? 1ULL : 0) << kDstActiveBit;
  time_bits |= (dst.transition_imminent ? 1ULL : 0) << kDstChangeBit;
  time_bits |= to_field(time.minute, kMinuteBit, 7);
  time_bits |= to_field(time.hour, kHourBit, 6);
  time_bits |= to_field(time.day, kDayBit, 6);
  time_bits |= to_field(IsoWeekday(time.day, time.month, time.year),
                        kWeekdayBit, 3);
  time_bits |= to_field(time.month, kMonthBit, 5);
  time_bits |= to_field(time.year % 100, kYearBit, 8);

  time_bits |= parity(time_bits, kMinuteBit, kMinuteParity - 1) << kMinuteParity;
  time_bits |= parity(time_bits, kHourBit, kHourParity - 1) << kHourParity;
  time_bits |= parity(time_bits, kDayBit, kDateParity - 1) << kDateParity;

  *frame = Dcf77Frame(time_bits);
  return true;
}
