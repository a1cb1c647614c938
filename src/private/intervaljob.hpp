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

#ifndef SETTLER_INTERVALJOB_HPP
#define SETTLER_INTERVALJOB_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace settler
{

/**
 * Background thread that runs some maintenance work (retrying failed
 * writes, looking for stale holds) repeatedly, for as long as the
 * instance is alive.
 *
 * The work is run once right when the job is started, and then about
 * every interval.  Destructing the instance wakes up the thread and
 * waits for a currently running iteration to finish.
 */
class IntervalJob
{

private:

  /** Name of the job for log messages.  */
  const std::string name;

  /** The time to wait between runs.  */
  const std::chrono::nanoseconds intv;

  /** The work to run.  */
  std::function<void ()> job;

  /** Lock for the stop flag.  */
  std::mutex mut;

  /** Set when the thread should exit.  */
  bool stop = false;

  /** Signalled when stop is set.  */
  std::condition_variable cvStop;

  /** The background thread.  */
  std::thread worker;

  /**
   * Body of the background thread.
   */
  void Loop ();

public:

  template <typename Fcn, typename Rep, typename Period>
    explicit IntervalJob (const std::string& n,
                          const std::chrono::duration<Rep, Period> i,
                          const Fcn& j)
    : name(n), intv(i), job(j)
  {
    worker = std::thread ([this] () { Loop (); });
  }

  ~IntervalJob ();

  IntervalJob () = delete;
  IntervalJob (const IntervalJob&) = delete;
  void operator= (const IntervalJob&) = delete;

};

} // namespace settler

#endif // SETTLER_INTERVALJOB_HPP
