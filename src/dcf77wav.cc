// -*- mode: c++; c-basic-offset: 2; indent-tabs-mode: nil; -*-
// This is dcf77wav, a DCF77 time signal waveform generator.
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
//
// Encodes a given time and date into a DCF77 minute frame and writes the
// amplitude modulated carrier as WAV file, one second per bit.

#include <errno.h>
#include <stdio.h>
#include <string.h>

#include "dcf77-frame.h"
#include "signal-synthesizer.h"
#include "user-input.h"
#include "wav-writer.h"

#ifndef DCF77WAV_VERSION
#define DCF77WAV_VERSION "unknown"
#endif

static bool verbose = false;

namespace {
// Show a full modulation of one bit slot as little ASCII-art.
void PrintModulationChart(const BitModulation &mod, int slot_ms) {
  static const int kMsPerDash = 100;
  fprintf(stderr, " [");
  int running_ms = 0;
  int target_ms = 0;
  bool power = false;
  for (const ModulationDuration &m : mod) {
    power = (m.power == CarrierPower::HIGH);
    target_ms += m.duration_ms;
    for (/**/; running_ms < target_ms && running_ms < slot_ms;
         running_ms += kMsPerDash)
      fprintf(stderr, "%s", power ? "#":"_");
  }
  for (/**/; running_ms < slot_ms; running_ms += kMsPerDash)
    fprintf(stderr, "%s", power ? "#":"_");
  fprintf(stderr, "]\n");
}

void PrintTimeDate(const TimeDate &t, const DstFlags &dst) {
  fprintf(stderr, "%04d-%02d-%02d %02d:%02d (DST: %d, DST change: %d)",
          t.year, t.month, t.day, t.hour, t.minute,
          dst.active, dst.transition_imminent);
}

int usage(const char *msg, const char *progname) {
  fprintf(stderr, "%susage: %s [options]\n"
          "Options:\n"
          "\t-t 'YYYY-MM-DD HH:MM' : Time to encode (default: ask)\n"
          "\t-d <0|1>              : DST active (default: ask)\n"
          "\t-c <0|1>              : DST change within the next hour "
          "(default: ask)\n"
          "\t-f <hz>               : Carrier frequency "
          "(default: 77500)\n"
          "\t-r <hz>               : Sample rate (default: 1024)\n"
          "\t-b <seconds>          : Duration of one bit (default: 1.0)\n"
          "\t-o <file>             : Output WAV file "
          "(default: dcf77_time_signal.wav)\n"
          "\t-i                    : Ask for all values interactively.\n"
          "\t-v                    : Verbose.\n"
          "\t-n                    : Dryrun, only showing modulation "
          "envelope.\n"
          "\t-h                    : This help.\n"
          "\t--version             : Print version.\n",
          msg, progname);
  return 1;
}

}  // end anonymous namespace

int main(int argc, char *argv[]) {
  UserInput input(argc, argv);
  if (input.show_version) {
    fprintf(stderr, "dcf77wav %s\n", DCF77WAV_VERSION);
    return 0;
  }
  if (input.show_help)
    return usage("", argv[0]);
  if (!input.error.empty())
    return usage(input.error.c_str(), argv[0]);
  if (SamplesPerBit(input.sample_rate_hz, input.bit_duration_seconds) < 1)
    return usage("Bit duration too short for sample rate\n", argv[0]);

  verbose = input.verbose;

  if (!input.PromptMissingValues(stdin, stdout)) {
    fprintf(stderr, "\nInput ended before all values were given\n");
    return 1;
  }

  const TimeDate &time_date = input.time_date;
  const DstFlags dst = { input.dst_active == 1, input.dst_change == 1 };

  Dcf77Frame frame;
  if (!EncodeDCF77Frame(time_date, dst, &frame)) {
    fprintf(stderr, "Invalid date %04d-%02d-%02d\n",
            time_date.year, time_date.month, time_date.day);
    return 1;
  }

  if (verbose) {
    PrintTimeDate(time_date, dst);
    fprintf(stderr, " -> %s\n", frame.ToString().c_str());
  }

  if (input.dryrun) {
    const int slot_ms = (int)(input.bit_duration_seconds * 1000);
    for (int second = 0; second < Dcf77Frame::kBits; ++second) {
      fprintf(stderr, ":%02d %d", second, frame.bit(second));
      PrintModulationChart(GetModulationForBit(frame.bit(second)), slot_ms);
    }
    return 0;
  }

  const SampleBuffer samples
    = SynthesizeDCF77Signal(frame, input.carrier_frequency_hz,
                            input.sample_rate_hz,
                            input.bit_duration_seconds);
  if (verbose) {
    fprintf(stderr, "Carrier %.1f Hz, %d Hz sample rate, %d samples per bit\n",
            input.carrier_frequency_hz, input.sample_rate_hz,
            SamplesPerBit(input.sample_rate_hz, input.bit_duration_seconds));
  }

  if (!WriteNormalizedWav(input.output_file.c_str(), samples,
                          input.sample_rate_hz)) {
    fprintf(stderr, "Can't write %s: %s\n", input.output_file.c_str(),
            strerror(errno));
    return 1;
  }
  if (verbose) {
    fprintf(stderr, "Wrote %zu samples to %s\n", samples.size(),
            input.output_file.c_str());
  }
  return 0;
}
