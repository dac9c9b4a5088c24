#include "KinetiCam/Rig/RigConfig.h"

#include <algorithm>

namespace KinetiCam {

RigConfig RigConfig::clamped() const {
    RigConfig result = *this;
    result.distanceMultiplier = std::clamp(distanceMultiplier, kMinDistanceMultiplier, kMaxDistanceMultiplier);
    result.speed = std::clamp(speed, kMinSpeed, kMaxSpeed);
    result.friction = std::clamp(friction, kMinFriction, kMaxFriction);
    result.driftIntensity = std::clamp(driftIntensity, kMinDriftIntensity, kMaxDriftIntensity);
    return result;
}

} // namespace KinetiCam
