#ifndef TIMER_HPP
#define TIMER_HPP

class Timer {
public:
    Timer();
    virtual ~Timer();

    void start(unsigned int period_ms);

    /* Block until the timer expires. Returns false if it is not armed. */
    bool wait();

private:
    int fd;
    bool armed;
};

#endif
