#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include "DistanceEstimator.hpp"

const double DistanceEstimator::DEFAULT_REFERENCE_POWER    = -50.0;
const double DistanceEstimator::DEFAULT_PATH_LOSS_EXPONENT = 3.0;
const double DistanceEstimator::MINIMUM_DISTANCE           = 0.5;
const double DistanceEstimator::MAXIMUM_DISTANCE           = 100.0;

//=============================================================================================
DistanceEstimator::DistanceEstimator(double reference_power, double path_loss_exponent) :
    reference_power(reference_power),
    path_loss_exponent(path_loss_exponent)
{
    if (!std::isfinite(reference_power) ||
        !std::isfinite(path_loss_exponent) ||
        path_loss_exponent <= 0.0)
    {
        throw std::runtime_error("Invalid path-loss calibration");
    }
}

//=============================================================================================
// distance = 10 ^ ((reference_power - signal) / (10 * path_loss_exponent))
//=============================================================================================
bool DistanceEstimator::estimate(double       signal_average,
                                 double&      distance,
                                 std::string& error_message) const
{
    distance = 0.0;

    if (!std::isfinite(signal_average))
    {
        std::ostringstream error_stream;
        error_stream << "Cannot estimate distance from signal " << signal_average;
        error_message = error_stream.str();
        return false;
    }

    // Anything at least as strong as the calibration point is closer than it
    if (signal_average >= reference_power)
    {
        distance = MINIMUM_DISTANCE;
        return true;
    }

    double raw_distance =
        std::pow(10.0, (reference_power - signal_average) / (10.0 * path_loss_exponent));

    if (!std::isfinite(raw_distance))
    {
        std::ostringstream error_stream;
        error_stream << "Distance estimate for signal " << signal_average << " is not finite";
        error_message = error_stream.str();
        return false;
    }

    if (raw_distance < MINIMUM_DISTANCE)
    {
        raw_distance = MINIMUM_DISTANCE;
    }
    else if (raw_distance > MAXIMUM_DISTANCE)
    {
        raw_distance = MAXIMUM_DISTANCE;
    }

    distance = std::round(raw_distance * 100.0) / 100.0;

    return true;
}

//=============================================================================================
double DistanceEstimator::getReferencePower() const
{
    return reference_power;
}

//=============================================================================================
double DistanceEstimator::getPathLossExponent() const
{
    return path_loss_exponent;
}
