#pragma once

namespace JumpDash::Game {

// Frame clock, in seconds from an arbitrary origin
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual double Now() const = 0;
};

// std::chrono::steady_clock based source
class SteadyTimeSource : public TimeSource {
public:
    double Now() const override;
};

} // namespace JumpDash::Game
