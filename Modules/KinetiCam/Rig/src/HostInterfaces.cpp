#include "KinetiCam/Rig/HostInterfaces.h"

#include <chrono>

namespace KinetiCam {

double SteadyClock::now() const {
    using Seconds = std::chrono::duration<double>;
    return std::chrono::duration_cast<Seconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace KinetiCam
