#if !defined DISTANCE_ESTIMATOR_HPP
#define DISTANCE_ESTIMATOR_HPP

#include <string>

// Converts an averaged signal strength into a distance using the log-distance path-loss model
class DistanceEstimator
{
public:

    // reference_power is the signal strength in dBm measured at one meter; path_loss_exponent
    // describes how quickly the environment attenuates the signal (2 in free space, around 3
    // indoors)
    explicit DistanceEstimator(double reference_power    = DEFAULT_REFERENCE_POWER,
                               double path_loss_exponent = DEFAULT_PATH_LOSS_EXPONENT);

    // Writes the estimated distance in meters, clamped to [MINIMUM_DISTANCE, MAXIMUM_DISTANCE]
    // and rounded to centimeters.  Returns false and writes a distance of 0 if the estimate
    // could not be computed; error_message says why.
    bool estimate(double signal_average, double& distance, std::string& error_message) const;

    double getReferencePower() const;
    double getPathLossExponent() const;

    static const double DEFAULT_REFERENCE_POWER;
    static const double DEFAULT_PATH_LOSS_EXPONENT;

    static const double MINIMUM_DISTANCE;
    static const double MAXIMUM_DISTANCE;

private:

    double reference_power;
    double path_loss_exponent;
};

#endif
