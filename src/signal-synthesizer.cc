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

#include "signal-synthesizer.h"

#include <math.h>
#include <stdint.h>

#include <algorithm>

double CarrierAmplitude(CarrierPower power) {
  return power == CarrierPower::LOW ? 0.1 : 0.9;
}

BitModulation GetModulationForBit(bool bit) {
  return {{CarrierPower::LOW, bit ? 200 : 100}, {CarrierPower::HIGH, 0}};
}

int SamplesPerBit(int sample_rate_hz, double bit_duration_seconds) {
  return (int)lround(sample_rate_hz * bit_duration_seconds);
}

int MillisecondsToSamples(int duration_ms, int sample_rate_hz) {
  return (int)((int64_t)duration_ms * sample_rate_hz / 1000);
}

SampleBuffer SynthesizeDCF77Signal(const Dcf77Frame &frame,
                                   double carrier_frequency_hz,
                                   int sample_rate_hz,
                                   double bit_duration_seconds) {
  const int samples_per_bit = SamplesPerBit(sample_rate_hz,
                                            bit_duration_seconds);
  SampleBuffer result((size_t)samples_per_bit * Dcf77Frame::kBits);
  const double omega = 2 * M_PI * carrier_frequency_hz;

  for (int second = 0; second < Dcf77Frame::kBits; ++second) {
    const size_t slot_start = (size_t)second * samples_per_bit;
    const size_t slot_end = slot_start + samples_per_bit;
    size_t pos = slot_start;
    for (const ModulationDuration &m : GetModulationForBit(frame.bit(second))) {
      size_t end = slot_end;
      if (m.duration_ms > 0) {
        end = std::min(slot_end, pos + MillisecondsToSamples(m.duration_ms,
                                                             sample_rate_hz));
      }
      const double amplitude = CarrierAmplitude(m.power);
      for (/**/; pos < end; ++pos) {
        const double t = (double)pos / sample_rate_hz;
        result[pos] = amplitude * sin(omega * t);
      }
      if (m.duration_ms == 0) break;  // last one.
    }
  }
  return result;
}
