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

#ifndef CARRIER_POWER_H
#define CARRIER_POWER_H

enum class CarrierPower {
  LOW,   // Reduced carrier: 10% amplitude.
  HIGH,  // Regular carrier: 90% amplitude.
};

#endif // CARRIER_POWER_H
