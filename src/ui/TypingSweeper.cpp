#include "ui/TypingSweeper.h"

TypingSweeper::TypingSweeper(RealtimeMerger &merger) : m_merger(merger) {}

TypingSweeper::~TypingSweeper() { stop(); }

void TypingSweeper::start() {
    if (m_running) {
        return;
    }
    m_running = true;
    Fl::add_timeout(intervalSeconds(), timerCallback, this);
}

void TypingSweeper::stop() {
    if (!m_running) {
        return;
    }
    m_running = false;
    Fl::remove_timeout(timerCallback, this);
}

double TypingSweeper::intervalSeconds() const {
    double seconds = static_cast<double>(m_merger.sweepInterval().count()) / 1000.0;
    return seconds > 0.0 ? seconds : 0.05;
}

void TypingSweeper::tick() {
    m_merger.sweep();
    if (m_running) {
        Fl::repeat_timeout(intervalSeconds(), timerCallback, this);
    }
}

void TypingSweeper::timerCallback(void *data) {
    auto *sweeper = static_cast<TypingSweeper *>(data);
    sweeper->tick();
}
