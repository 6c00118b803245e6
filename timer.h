#ifndef PHOSPHOR8_TIMER_H
#define PHOSPHOR8_TIMER_H

constexpr double TIMER_PERIOD = 1.0 / 60.0;

// Turns elapsed wall-clock time into whole 60Hz timer ticks, carrying the
// remainder into the next frame.
struct TimerClock
{
    double accumulated = 0.0;

    int advance(double elapsedSeconds)
    {
        if(elapsedSeconds > 0.0) {
            accumulated += elapsedSeconds;
        }
        int ticks = 0;
        // tolerate rounding when the host passes exactly 1/60
        while(accumulated + 1e-9 >= TIMER_PERIOD) {
            accumulated -= TIMER_PERIOD;
            ticks++;
        }
        if(accumulated < 0.0) {
            accumulated = 0.0;
        }
        return ticks;
    }

    void reset()
    {
        accumulated = 0.0;
    }
};

#endif // PHOSPHOR8_TIMER_H
