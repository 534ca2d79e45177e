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

#ifndef USER_INPUT_H
#define USER_INPUT_H

#include <stdio.h>
#include <string>

#include "dcf77-frame.h"

// Parse a decimal integer, allowing surrounding whitespace. Returns 'false'
// if there is anything else in the string or it is out of int range.
bool ParseInteger(const char *str, int *result);

// Parse 'YYYY-MM-DD HH:MM'. Only field ranges are checked here, not if the
// date exists.
bool ParseTimeDate(const char *time_string, TimeDate *result);

// A value asked for interactively.
struct PromptField {
  const char *prompt;
  bool (*is_valid)(int value);
  const char *error_message;
};

extern const PromptField kHourPrompt;
extern const PromptField kMinutePrompt;
extern const PromptField kDayPrompt;
extern const PromptField kMonthPrompt;
extern const PromptField kYearPrompt;
extern const PromptField kDstStatusPrompt;
extern const PromptField kDstChangePrompt;

// Print the prompt to "out" and read lines from "in" until one parses
// as integer accepted by the field; every rejected line prints the
// field's error message. Returns 'false' on end of input.
bool PromptForValue(FILE *in, FILE *out, const PromptField &field,
                    int *value);

class UserInput {
public:
  UserInput(int argc, char *argv[]);

  // Ask for everything not given on the command line, or everything if
  // 'interactive' is set. Returns 'false' if input ended prematurely.
  bool PromptMissingValues(FILE *in, FILE *out);

  TimeDate time_date = {};
  bool has_time_date = false;
  int dst_active = -1;   // -1: not given.
  int dst_change = -1;
  double carrier_frequency_hz = 77500;
  int sample_rate_hz = 1024;
  double bit_duration_seconds = 1.0;
  std::string output_file;
  bool interactive = false;
  bool verbose = false;
  bool dryrun = false;
  bool show_help = false;
  bool show_version = false;
  std::string error;  // Description of an invalid option value.

private:
  void Parse(int argc, char *argv[]);
};

#endif
