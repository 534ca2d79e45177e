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

#ifndef SIGNAL_SYNTHESIZER_H
#define SIGNAL_SYNTHESIZER_H

#include <vector>

#include "carrier-power.h"
#include "dcf77-frame.h"

struct ModulationDuration {
  CarrierPower power;
  int duration_ms;
};

// Sequence of power levels and durations within one bit slot. The last
// transition stays for the remainder of the slot and has duration 0.
// e.g. {{CarrierPower::LOW, 100},{CarrierPower::HIGH, 0}}
typedef std::vector<ModulationDuration> BitModulation;

// Carrier samples, amplitude within [-1, 1].
typedef std::vector<double> SampleBuffer;

// Amplitude factor the carrier is multiplied with at the given power.
double CarrierAmplitude(CarrierPower power);

// DCF77 amplitude keying: the carrier is reduced for 100ms to send a 0 and
// for 200ms to send a 1, at the beginning of the bit slot.
BitModulation GetModulationForBit(bool bit);

// Number of samples in one bit slot, rounded to the nearest sample.
int SamplesPerBit(int sample_rate_hz, double bit_duration_seconds);

// Number of whole samples within "duration_ms"; truncated.
int MillisecondsToSamples(int duration_ms, int sample_rate_hz);

// Generate the amplitude modulated carrier for all 59 bits of "frame".
// The result has SamplesPerBit() * 59 samples. The reduced power window of
// each bit is limited to its bit slot if the slot is shorter than that.
// Frequency, sample rate and bit duration need to be positive.
SampleBuffer SynthesizeDCF77Signal(const Dcf77Frame &frame,
                                   double carrier_frequency_hz,
                                   int sample_rate_hz,
                                   double bit_duration_seconds);

#endif // SIGNAL_SYNTHESIZER_H
