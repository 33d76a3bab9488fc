#include "timer_queue.h"

static inline bool isDue(unsigned long due, unsigned long nowMs) {
  return (long)(due - nowMs) <= 0;
}

TimerQueue::TimerQueue() : nextToken(1), currentTime(0) {}

TimerToken TimerQueue::schedule(unsigned long delayMs, Callback callback) {
  TimerToken token = nextToken++;
  if (nextToken == VB_NO_TIMER) nextToken = 1;

  Entry entry;
  entry.token = token;
  entry.due = currentTime + delayMs;
  entry.callback = callback;
  entries.push_back(entry);
  return token;
}

bool TimerQueue::cancel(TimerToken& token) {
  if (token == VB_NO_TIMER) return false;

  for (size_t i = 0; i < entries.size(); i++) {
    if (entries[i].token == token) {
      entries.erase(entries.begin() + i);
      token = VB_NO_TIMER;
      return true;
    }
  }
  token = VB_NO_TIMER;
  return false;
}

bool TimerQueue::isPending(TimerToken token) const {
  if (token == VB_NO_TIMER) return false;
  for (size_t i = 0; i < entries.size(); i++) {
    if (entries[i].token == token) return true;
  }
  return false;
}

void TimerQueue::poll(unsigned long nowMs) {
  while (true) {
    // Earliest due entry; ties go to the one scheduled first
    int next = -1;
    for (size_t i = 0; i < entries.size(); i++) {
      if (!isDue(entries[i].due, nowMs)) continue;
      if (next < 0 || (long)(entries[i].due - entries[next].due) < 0) {
        next = (int)i;
      }
    }
    if (next < 0) break;

    Entry entry = entries[next];
    entries.erase(entries.begin() + next);
    if ((long)(entry.due - currentTime) > 0) {
      currentTime = entry.due;
    }
    entry.callback();
  }

  if ((long)(nowMs - currentTime) > 0) {
    currentTime = nowMs;
  }
}

void TimerQueue::clear() {
  entries.clear();
}
