#include <JumpDash/Game/TimeSource.hpp>
#include <JumpDash/Core/Types.hpp>

namespace JumpDash::Game {

double SteadyTimeSource::Now() const {
    return std::chrono::duration_cast<FloatSeconds>(Clock::now().time_since_epoch()).count();
}

} // namespace JumpDash::Game
