#pragma once

#include <Eigen/Dense>

namespace astrodynamics
{
    //
    // variables
    //

    constexpr double pi = 3.14159265358979323;
    constexpr double tau = 6.28318530717958647;

    //
    // structs
    //

    // physical constants of the earth--moon system, moon on a circular orbit
    struct EarthMoonSystem
    {
        double distance;        // earth--moon distance, m
        double omega;           // mean angular rate of the moon, rad/s
        double moon_velocity;   // mean velocity of the moon relative to earth, m/s
        double moon_radius;     // m
        double mu_moon;         // m^3/s^2
        double mu_earth;        // m^3/s^2
        double soi_radius;      // radius of the lunar sphere of influence, m
    };

    extern const EarthMoonSystem earth_moon;

    //
    // math functions
    //

    double safe_acos(double x);
    double safe_asin(double x);
    double clamp_unit(double x);
    double law_of_cosines(double a, double b, double angle);
    Eigen::Vector2d rotate(Eigen::Vector2d a, double angle);

    //
    // orbital property functions
    //

    // time between two eccentric anomalies of an elliptical orbit
    double kepler_time(double a, double e, double mu, double eccentric_anomaly0, double eccentric_anomaly1);

    // time unit of a canonical system with the given gravitational parameter and distance unit
    double canonical_time(double mu, double distance);
}
