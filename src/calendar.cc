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

#include "calendar.h"

bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int month, int year) {
  static const int kDays[12] = { 31, 28, 31, 30, 31, 30,
                                 31, 31, 30, 31, 30, 31 };
  if (month < 1 || month > 12) return 0;
  if (month == 2 && IsLeapYear(year)) return 29;
  return kDays[month - 1];
}

bool IsValidDate(int day, int month, int year) {
  if (year < 1) return false;
  return day >= 1 && day <= DaysInMonth(month, year);
}

// http://howardhinnant.github.io/date_algorithms.html#days_from_civil
long DaysSinceEpoch(int day, int month, int year) {
  const long y = (month <= 2) ? year - 1 : year;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const long year_of_era = y - era * 400;                    // [0, 399]
  const long day_of_year = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5
    + day - 1;                                               // [0, 365]
  const long day_of_era = year_of_era * 365 + year_of_era / 4
    - year_of_era / 100 + day_of_year;                       // [0, 146096]
  return era * 146097 + day_of_era - 719468;
}

int IsoWeekday(int day, int month, int year) {
  const long days = DaysSinceEpoch(day, month, year);
  // 1970-01-01 was a Thursday.
  const long since_monday = ((days + 3) % 7 + 7) % 7;
  return since_monday + 1;
}
