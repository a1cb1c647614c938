/*
    Settler - ledger-settled asset holds
    Copyright (C) 2021  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "private/intervaljob.hpp"

#include <glog/logging.h>

namespace settler
{

IntervalJob::~IntervalJob ()
{
  {
    std::lock_guard<std::mutex> lock(mut);
    stop = true;
  }
  cvStop.notify_all ();

  worker.join ();
  VLOG (1) << "Stopped job " << name;
}

void
IntervalJob::Loop ()
{
  VLOG (1) << "Starting job " << name;

  std::unique_lock<std::mutex> lock(mut);
  while (!stop)
    {
      lock.unlock ();
      VLOG (2) << "Running job " << name;
      job ();
      lock.lock ();

      cvStop.wait_for (lock, intv, [this] () { return stop; });
    }
}

} // namespace settler
