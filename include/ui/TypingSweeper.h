#pragma once

#include <FL/Fl.H>

#include "state/RealtimeMerger.h"

/**
 * @brief Runs RealtimeMerger::sweep on an FLTK timer every half typing timeout
 */
class TypingSweeper {
  public:
    explicit TypingSweeper(RealtimeMerger &merger);
    ~TypingSweeper();

    TypingSweeper(const TypingSweeper &) = delete;
    TypingSweeper &operator=(const TypingSweeper &) = delete;

    void start();
    void stop();
    bool isRunning() const { return m_running; }

  private:
    double intervalSeconds() const;
    void tick();
    static void timerCallback(void *data);

    RealtimeMerger &m_merger;
    bool m_running = false;
};
