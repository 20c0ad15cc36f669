#pragma once

#include <stdint.h>
#include <functional>

typedef std::function<uint32_t()>     ClockFn;  // monotonic ms, may wrap
typedef std::function<void(uint32_t)> SleepFn;  // blocks the calling task only

// Runs detached jobs. The caller keeps no handle and never waits.
class TaskRunner {
public:
    virtual ~TaskRunner() {}

    // false if the job could not be started; the job is then dropped
    virtual bool spawn(const char* name, std::function<void()> job) = 0;
};

// Total wait budget shared by a chain of outbound calls.
class Deadline {
public:
    Deadline(ClockFn clock, uint32_t budgetMs)
        : m_clock(clock), m_startMs(clock()), m_budgetMs(budgetMs) {}

    uint32_t elapsedMs() const { return m_clock() - m_startMs; }
    bool     expired() const { return elapsedMs() >= m_budgetMs; }

    uint32_t remainingMs() const {
        uint32_t elapsed = elapsedMs();
        return elapsed >= m_budgetMs ? 0 : m_budgetMs - elapsed;
    }

private:
    ClockFn  m_clock;
    uint32_t m_startMs;
    uint32_t m_budgetMs;
};
