/*
 *  This file is part of nexget.
 *
 *  Copyright (C) 2023-2024 The nexget Authors
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#ifndef SPEEDMETER_H
#define SPEEDMETER_H

/*
 * Average transfer speed over the last SPEEDMETER_SLOTS seconds.
 * Not thread safe, each transfer unit owns one.
 */
class SpeedMeter
{
public:
	SpeedMeter();
	void AddSpeedReading(int bytes);
	int CalcCurrentSpeed();
	void Reset();

private:
	static const int SPEEDMETER_SLOTS = 30;
	static const int SPEEDMETER_SLOTSIZE = 1; //Split elapsed time into this number of secs.

	int m_speedBytes[SPEEDMETER_SLOTS];
	int64 m_speedTotalBytes;
	int m_speedTime[SPEEDMETER_SLOTS];
	int m_speedStartTime;
	time_t m_speedCorrection;
	int m_speedBytesIndex;
};

#endif
