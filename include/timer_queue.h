#ifndef TIMER_QUEUE_H
#define TIMER_QUEUE_H

#include <Arduino.h>
#include <functional>
#include <vector>

// One-shot timers dispatched from loop(). Callbacks run on the polling task,
// so components that share a TimerQueue never race each other.

typedef uint32_t TimerToken;
#define VB_NO_TIMER ((TimerToken)0)

class TimerQueue {
public:
  typedef std::function<void()> Callback;

  TimerQueue();

  // Returns a token that stays valid until the timer fires or is cancelled
  TimerToken schedule(unsigned long delayMs, Callback callback);

  // Clears `token`. Returns false if it was not pending.
  bool cancel(TimerToken& token);

  bool isPending(TimerToken token) const;

  // Fires every timer due at or before nowMs, earliest first. While a
  // callback runs, now() reports that timer's due time.
  void poll(unsigned long nowMs);

  unsigned long now() const { return currentTime; }
  size_t pendingCount() const { return entries.size(); }
  void clear();

private:
  struct Entry {
    TimerToken token;
    unsigned long due;
    Callback callback;
  };

  std::vector<Entry> entries;
  TimerToken nextToken;
  unsigned long currentTime;
};

#endif
