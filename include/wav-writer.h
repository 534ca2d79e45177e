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

#ifndef WAV_WRITER_H
#define WAV_WRITER_H

#include <stdint.h>
#include <stdio.h>
#include <vector>

#include "signal-synthesizer.h"

// Scale samples so that the largest absolute value maps to 32767. Values
// are truncated towards zero. A buffer without any signal stays silent.
std::vector<int16_t> NormalizeToPCM16(const SampleBuffer &samples);

// Write samples as normalized 16 bit single channel PCM WAV file.
// Returns 'true' on success, 'false' otherwise with errno set.
bool WriteNormalizedWav(FILE *out, const SampleBuffer &samples,
                        int sample_rate_hz);
bool WriteNormalizedWav(const char *filename, const SampleBuffer &samples,
                        int sample_rate_hz);

#endif // WAV_WRITER_H
