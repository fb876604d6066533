#include <cmath>

#include <Eigen/Dense>

#include "astrodynamics.h"

namespace astrodynamics
{
    namespace
    {
        EarthMoonSystem make_earth_moon()
        {
            EarthMoonSystem s;
            s.distance = 384402000.0;
            s.omega = 2.649e-6;
            s.moon_velocity = s.omega * s.distance;
            s.moon_radius = 1737000.0;
            s.mu_moon = 4.9048695e12;
            s.mu_earth = 3.986004418e14;
            s.soi_radius = pow(s.mu_moon / s.mu_earth, 0.4) * s.distance;
            return s;
        }
    }

    const EarthMoonSystem earth_moon = make_earth_moon();

	//
	// math functions
	//

    double safe_acos(double x)
	{
		if (x > 1)
        {
			return 0.0;
        }
		else if (x < -1)
        {
			return pi;
        }
		else
        {
			return acos(x);
        }
	}

    double safe_asin(double x)
    {
        return asin(clamp_unit(x));
    }

    double clamp_unit(double x)
    {
        if (x > 1)
        {
            return 1.0;
        }
        else if (x < -1)
        {
            return -1.0;
        }
        else
        {
            return x;
        }
    }

    // length of the side opposite angle in a triangle with sides a and b
    double law_of_cosines(double a, double b, double angle)
    {
        return sqrt(a * a + b * b - 2.0 * a * b * cos(angle));
    }

    Eigen::Vector2d rotate(Eigen::Vector2d a, double angle)
    {
        return Eigen::Rotation2Dd(angle) * a;
    }

	//
    // orbital property functions
	//

    double kepler_time(double a, double e, double mu, double eccentric_anomaly0, double eccentric_anomaly1)
    {
        double m0 = eccentric_anomaly0 - e * sin(eccentric_anomaly0);
        double m1 = eccentric_anomaly1 - e * sin(eccentric_anomaly1);

        return sqrt(a * a * a / mu) * (m1 - m0);
    }

    double canonical_time(double mu, double distance)
    {
        return sqrt(distance * distance * distance / mu);
    }
}
