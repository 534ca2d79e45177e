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

#ifndef CALENDAR_H
#define CALENDAR_H

// Proleptic Gregorian calendar helpers. Years are full years, e.g. 2024.

bool IsLeapYear(int year);

// Number of days in the given month (1..12), or 0 for an invalid month.
int DaysInMonth(int month, int year);

// Returns 'true' if day, month and year form a real calendar date. Only
// years from 1 onwards are considered valid.
bool IsValidDate(int day, int month, int year);

// Days since 1970-01-01; negative before that.
long DaysSinceEpoch(int day, int month, int year);

// ISO weekday of a valid date: Monday=1 ... Sunday=7.
int IsoWeekday(int day, int month, int year);

#endif // CALENDAR_H
