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

#include <gtest/gtest.h>

TEST(CalendarTest, LeapYears) {
  EXPECT_TRUE(IsLeapYear(2024));
  EXPECT_TRUE(IsLeapYear(2000));
  EXPECT_FALSE(IsLeapYear(1900));
  EXPECT_FALSE(IsLeapYear(2023));
}

TEST(CalendarTest, DaysInMonth) {
  EXPECT_EQ(31, DaysInMonth(1, 2023));
  EXPECT_EQ(28, DaysInMonth(2, 2023));
  EXPECT_EQ(29, DaysInMonth(2, 2024));
  EXPECT_EQ(30, DaysInMonth(4, 2024));
  EXPECT_EQ(31, DaysInMonth(12, 2024));
  EXPECT_EQ(0, DaysInMonth(0, 2024));
  EXPECT_EQ(0, DaysInMonth(13, 2024));
}

TEST(CalendarTest, ValidDates) {
  EXPECT_TRUE(IsValidDate(15, 6, 2024));
  EXPECT_TRUE(IsValidDate(29, 2, 2024));
  EXPECT_TRUE(IsValidDate(29, 2, 2000));
  EXPECT_TRUE(IsValidDate(31, 12, 1));
  EXPECT_TRUE(IsValidDate(1, 1, 1));
}

TEST(CalendarTest, InvalidDates) {
  EXPECT_FALSE(IsValidDate(29, 2, 2023));
  EXPECT_FALSE(IsValidDate(29, 2, 1900));
  EXPECT_FALSE(IsValidDate(31, 4, 2024));
  EXPECT_FALSE(IsValidDate(0, 1, 2024));
  EXPECT_FALSE(IsValidDate(32, 1, 2024));
  EXPECT_FALSE(IsValidDate(1, 13, 2024));
  EXPECT_FALSE(IsValidDate(1, 1, 0));
}

TEST(CalendarTest, DaysSinceEpoch) {
  EXPECT_EQ(0, DaysSinceEpoch(1, 1, 1970));
  EXPECT_EQ(-1, DaysSinceEpoch(31, 12, 1969));
  EXPECT_EQ(10957, DaysSinceEpoch(1, 1, 2000));
  EXPECT_EQ(19889, DaysSinceEpoch(15, 6, 2024));
}

TEST(CalendarTest, IsoWeekday) {
  EXPECT_EQ(4, IsoWeekday(1, 1, 1970));    // Thursday
  EXPECT_EQ(3, IsoWeekday(31, 12, 1969));
  EXPECT_EQ(6, IsoWeekday(15, 6, 2024));   // Saturday
  EXPECT_EQ(7, IsoWeekday(16, 6, 2024));   // Sunday
  EXPECT_EQ(1, IsoWeekday(17, 6, 2024));   // Monday
  EXPECT_EQ(6, IsoWeekday(1, 1, 2000));
  EXPECT_EQ(4, IsoWeekday(29, 2, 2024));
  EXPECT_EQ(5, IsoWeekday(15, 10, 1582));  // First Gregorian day.
  EXPECT_EQ(1, IsoWeekday(1, 1, 1));
}

TEST(CalendarTest, WeekdayAdvancesDaily) {
  int expected = IsoWeekday(1, 1, 2023);
  for (int month = 1; month <= 12; ++month) {
    for (int day = 1; day <= DaysInMonth(month, 2023); ++day) {
      ASSERT_EQ(expected, IsoWeekday(day, month, 2023))
        << "2023-" << month << "-" << day;
      expected = expected % 7 + 1;
    }
  }
  EXPECT_EQ(expected, IsoWeekday(1, 1, 2024));
}
