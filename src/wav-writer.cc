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

#include "wav-writer.h"

#include <errno.h>
#include <math.h>

#include <algorithm>

static const int kBitsPerSample = 16;
static const int kChannels = 1;
static const int kHeaderBytes = 44;

static void put_le16(std::vector<uint8_t> *out, uint16_t v) {
  out->push_back(v & 0xff);
  out->push_back(v >> 8);
}

static void put_le32(std::vector<uint8_t> *out, uint32_t v) {
  put_le16(out, v & 0xffff);
  put_le16(out, v >> 16);
}

static void put_tag(std::vector<uint8_t> *out, const char *tag) {
  out->insert(out->end(), tag, tag + 4);
}

std::vector<int16_t> NormalizeToPCM16(const SampleBuffer &samples) {
  double peak = 0;
  for (double s : samples) peak = std::max(peak, fabs(s));

  std::vector<int16_t> result(samples.size(), 0);
  if (peak == 0) return result;
  for (size_t i = 0; i < samples.size(); ++i) {
    result[i] = (int16_t)(samples[i] / peak * 32767);
  }
  return result;
}

bool WriteNormalizedWav(FILE *out, const SampleBuffer &samples,
                        int sample_rate_hz) {
  const std::vector<int16_t> pcm = NormalizeToPCM16(samples);
  const uint32_t block_align = kChannels * kBitsPerSample / 8;
  const uint32_t data_bytes = pcm.size() * block_align;

  std::vector<uint8_t> buffer;
  buffer.reserve(kHeaderBytes + data_bytes);
  put_tag(&buffer, "RIFF");
  put_le32(&buffer, kHeaderBytes - 8 + data_bytes);
  put_tag(&buffer, "WAVE");

  put_tag(&buffer, "fmt ");
  put_le32(&buffer, 16);  // Size of the PCM format chunk.
  put_le16(&buffer, 1);   // PCM
  put_le16(&buffer, kChannels);
  put_le32(&buffer, sample_rate_hz);
  put_le32(&buffer, sample_rate_hz * block_align);  // Bytes per second.
  put_le16(&buffer, block_align);
  put_le16(&buffer, kBitsPerSample);

  put_tag(&buffer, "data");
  put_le32(&buffer, data_bytes);
  for (int16_t s : pcm) put_le16(&buffer, (uint16_t)s);

  errno = 0;
  if (fwrite(buffer.data(), 1, buffer.size(), out) != buffer.size()) {
    if (errno == 0) errno = EIO;
    return false;
  }
  return fflush(out) == 0;
}

bool WriteNormalizedWav(const char *filename, const SampleBuffer &samples,
                        int sample_rate_hz) {
  FILE *out = fopen(filename, "wb");
  if (!out) return false;
  const bool success = WriteNormalizedWav(out, samples, sample_rate_hz);
  const int write_errno = errno;
  if (fclose(out) != 0 || !success) {
    if (!success) errno = write_errno;
    return false;
  }
  return true;
}
