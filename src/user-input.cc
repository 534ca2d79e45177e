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

#include "user-input.h"

#include <ctype.h>
#include <errno.h>
#include <getopt.h>
#include <limits.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

static bool IsHour(int v) { return v >= 0 && v <= 23; }
static bool IsMinute(int v) { return v >= 0 && v <= 59; }
static bool IsDayOfMonth(int v) { return v >= 1 && v <= 31; }
static bool IsMonth(int v) { return v >= 1 && v <= 12; }
static bool IsYear(int v) { return v > 0; }
static bool IsFlag(int v) { return v == 0 || v == 1; }

const PromptField kHourPrompt = {
  "Hour (0-23): ", IsHour, "The hour must be between 0 and 23." };
const PromptField kMinutePrompt = {
  "Minute (0-59): ", IsMinute, "The minute must be between 0 and 59." };
const PromptField kDayPrompt = {
  "Day (1-31): ", IsDayOfMonth, "The day must be between 1 and 31." };
const PromptField kMonthPrompt = {
  "Month (1-12): ", IsMonth, "The month must be between 1 and 12." };
const PromptField kYearPrompt = {
  "Year: ", IsYear, "The year must be a positive number." };
const PromptField kDstStatusPrompt = {
  "DST Status (0 for standard, 1 for DST): ", IsFlag,
  "The DST status must be 0 (standard) or 1 (DST)." };
const PromptField kDstChangePrompt = {
  "DST Change (0 for no change, 1 for change within 1 hour): ", IsFlag,
  "The DST change must be 0 (no change) or 1 (change within 1 hour)." };

// The RIFF size in the WAV header (36 + data bytes) is a 32 bit field.
static const long kMaxSamplesPerBit
  = (UINT32_MAX - 36L) / 2 / Dcf77Frame::kBits;

static bool IsBlank(const char *str) {
  while (isspace((unsigned char)*str)) ++str;
  return *str == '\0';
}

bool ParseInteger(const char *str, int *result) {
  char *end;
  errno = 0;
  const long value = strtol(str, &end, 10);
  if (end == str || !IsBlank(end) || errno == ERANGE)
    return false;
  if (value < INT_MIN || value > INT_MAX)
    return false;
  *result = (int)value;
  return true;
}

static bool ParsePositiveDouble(const char *str, double *result) {
  char *end;
  const double value = strtod(str, &end);
  if (end == str || !IsBlank(end) || !(value > 0))
    return false;
  *result = value;
  return true;
}

bool ParseTimeDate(const char *time_string, TimeDate *result) {
  struct tm tm = {};
  const char *final_pos = strptime(time_string, "%Y-%m-%d %H:%M", &tm);
  if (!final_pos || *final_pos)
    return false;
  result->hour = tm.tm_hour;
  result->minute = tm.tm_min;
  result->day = tm.tm_mday;
  result->month = tm.tm_mon + 1;
  result->year = tm.tm_year + 1900;
  return true;
}

bool PromptForValue(FILE *in, FILE *out, const PromptField &field,
                    int *value) {
  char line[256];
  for (;;) {
    fputs(field.prompt, out);
    fflush(out);
    if (!fgets(line, sizeof(line), in))
      return false;
    // A line longer than the buffer is rejected as a whole.
    const bool complete_line = strchr(line, '\n') != nullptr || feof(in);
    if (!complete_line) {
      int c;
      while ((c = fgetc(in)) != EOF && c != '\n') {}
    }
    int parsed;
    if (complete_line && ParseInteger(line, &parsed)
        && field.is_valid(parsed)) {
      *value = parsed;
      return true;
    }
    fprintf(out, "%s\n", field.error_message);
  }
}

UserInput::UserInput(int argc, char *argv[])
    : output_file("dcf77_time_signal.wav") {
  Parse(argc, argv);
}

bool UserInput::PromptMissingValues(FILE *in, FILE *out) {
  if (interactive || !has_time_date) {
    TimeDate t = {};
    if (!PromptForValue(in, out, kHourPrompt, &t.hour)
        || !PromptForValue(in, out, kMinutePrompt, &t.minute)
        || !PromptForValue(in, out, kDayPrompt, &t.day)
        || !PromptForValue(in, out, kMonthPrompt, &t.month)
        || !PromptForValue(in, out, kYearPrompt, &t.year)) {
      return false;
    }
    time_date = t;
    has_time_date = true;
  }
  if (interactive || dst_active < 0) {
    if (!PromptForValue(in, out, kDstStatusPrompt, &dst_active))
      return false;
  }
  if (interactive || dst_change < 0) {
    if (!PromptForValue(in, out, kDstChangePrompt, &dst_change))
      return false;
  }
  return true;
}

void UserInput::Parse(int argc, char *argv[]) {
  int option_flag = 0;
  struct option long_options[] =
  {
      {"version", no_argument, &option_flag, 1},
      {nullptr, 0, nullptr, 0}
  };

  constexpr auto short_options = "t:d:c:f:r:b:o:invh";

  int option_index = 0;
  int opt{};

  while ((opt = getopt_long(argc, argv, short_options, long_options, &option_index)) != -1) {
    switch (opt) {
    case 0:   // long options
      if (option_flag == 1)
        show_version = true;
      break;

    // short options
    case 'v':
      verbose = true;
      break;
    case 't':
      has_time_date = ParseTimeDate(optarg, &time_date);
      if (!has_time_date) error = "Invalid time string\n";
      break;
    case 'd':
      if (!ParseInteger(optarg, &dst_active) || !IsFlag(dst_active))
        error = "DST status must be 0 or 1\n";
      break;
    case 'c':
      if (!ParseInteger(optarg, &dst_change) || !IsFlag(dst_change))
        error = "DST change must be 0 or 1\n";
      break;
    case 'f':
      if (!ParsePositiveDouble(optarg, &carrier_frequency_hz))
        error = "Carrier frequency must be positive\n";
      break;
    case 'r':
      if (!ParseInteger(optarg, &sample_rate_hz) || sample_rate_hz <= 0)
        error = "Sample rate must be a positive integer\n";
      break;
    case 'b':
      if (!ParsePositiveDouble(optarg, &bit_duration_seconds))
        error = "Bit duration must be positive\n";
      break;
    case 'o':
      output_file = optarg;
      break;
    case 'i':
      interactive = true;
      break;
    case 'n':
      dryrun = true;
      verbose = true;
      break;
    default:
      show_help = true;
      return;
    }
  }

  if (error.empty()
      && sample_rate_hz * bit_duration_seconds > kMaxSamplesPerBit) {
    error = "Sample rate times bit duration too large for a WAV file\n";
  }
}
