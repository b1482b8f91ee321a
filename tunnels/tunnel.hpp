#ifndef TUNNEL_HPP
#define TUNNEL_HPP

#include <atomic>

// One side of a TLV session driving its own event loop. stop() may be
// called from any thread; run() returns after the current poll pass.
class Tunnel
{
protected:
    std::atomic<bool> running{true};

public:
    virtual ~Tunnel() = default;
    virtual void run() = 0;
    virtual void stop() { running = false; }
    bool is_running() const { return running; }
};

#endif
