#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

// Bounds an operation that has no timeout of its own (DNS resolution).
// onExpiry runs at most once, and never after disarm() or destruction.
class Deadline
{
private:
    struct State
    {
        bool done = false;
        bool expired = false;
        std::function<void()> onExpiry;
    };

    boost::asio::steady_timer timer;
    std::shared_ptr<State> state;

public:
    Deadline(boost::asio::any_io_executor executor, std::chrono::steady_clock::duration timeout,
             std::function<void()> onExpiry)
        : timer(executor, timeout)
        , state(std::make_shared<State>())
    {
        state->onExpiry = std::move(onExpiry);
        timer.async_wait([s = state](boost::system::error_code const& ec)
        {
            if (ec || s->done)
                return;
            s->expired = true;
            s->onExpiry();
        });
    }

    ~Deadline()
    {
        state->done = true;
    }

    Deadline(Deadline const&) = delete;
    Deadline& operator=(Deadline const&) = delete;

    void disarm()
    {
        state->done = true;
        timer.cancel();
    }

    [[nodiscard]] bool expired() const noexcept
    {
        return state->expired;
    }
};
