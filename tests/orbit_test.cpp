#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "astrodynamics.h"
#include "Orbit.h"

namespace
{
    inline double mu_earth() { return astrodynamics::earth_moon.mu_earth; }
    const double r_leo = 6556400.0;

    inline bool near_rel(const double a, const double b, const double rel_tol)
    {
        return std::abs(a - b) <= rel_tol * std::max(std::abs(a), std::abs(b));
    }

} // namespace

TEST(Orbit, CircularOrbitHasZeroEccentricity)
{
    Orbit orbit = Orbit::circular(mu_earth(), r_leo);

    EXPECT_EQ(orbit.get_e(), 0.0);
    EXPECT_TRUE(near_rel(orbit.get_v(), std::sqrt(mu_earth() / r_leo), 1e-15));
    EXPECT_TRUE(near_rel(orbit.get_a(), r_leo, 1e-12));
    EXPECT_TRUE(near_rel(orbit.get_periapsis(), r_leo, 1e-12));
    EXPECT_TRUE(near_rel(orbit.get_apoapsis(), r_leo, 1e-12));
    EXPECT_EQ(orbit.get_cos_nu(), 1.0);
    EXPECT_EQ(orbit.get_cos_E(), 1.0);
}

TEST(Orbit, CircularOrbitReachesItsOwnRadius)
{
    Orbit orbit = Orbit::circular(mu_earth(), r_leo);
    Orbit same = orbit.at(r_leo);

    ASSERT_TRUE(same.is_finite());
    EXPECT_TRUE(near_rel(same.get_v(), orbit.get_v(), 1e-12));
    EXPECT_NEAR(same.get_phi(), 0.0, 1e-6);
}

TEST(Orbit, AtConservesEnergyAndAngularMomentum)
{
    Orbit depart(mu_earth(), r_leo, std::sqrt(mu_earth() / r_leo) + 3225.0, 0.0);
    Orbit outbound = depart.at(390059740.89069444, 1);
    Orbit inbound = depart.at(390059740.89069444, -1);

    ASSERT_TRUE(outbound.is_finite());
    EXPECT_TRUE(near_rel(outbound.get_energy(), depart.get_energy(), 1e-10));
    EXPECT_TRUE(near_rel(outbound.get_h(), depart.get_h(), 1e-12));
    EXPECT_NEAR(outbound.get_v(), 1392.9969542334672, 1e-6);
    EXPECT_NEAR(outbound.get_phi(), 1.4374013691493597, 1e-9);

    ASSERT_TRUE(inbound.is_finite());
    EXPECT_DOUBLE_EQ(inbound.get_phi(), -outbound.get_phi());
    EXPECT_GT(outbound.get_nu(), 0.0);
    EXPECT_LT(inbound.get_nu(), 0.0);
}

TEST(Orbit, DepartureFromPeriapsisHasZeroAnomalies)
{
    Orbit depart(mu_earth(), r_leo, std::sqrt(mu_earth() / r_leo) + 3225.0, 0.0);

    EXPECT_GT(depart.get_e(), 0.9);
    EXPECT_LT(depart.get_e(), 1.0);
    EXPECT_TRUE(near_rel(depart.get_periapsis(), r_leo, 1e-12));
    EXPECT_NEAR(depart.get_nu(), 0.0, 1e-6);
    EXPECT_NEAR(depart.get_E(), 0.0, 1e-6);
}

TEST(Orbit, UnreachableRadiusGivesNonFiniteState)
{
    Orbit depart(mu_earth(), r_leo, std::sqrt(mu_earth() / r_leo) + 3000.0, 0.0);
    ASSERT_LT(depart.get_apoapsis(), 2.0e8);

    Orbit beyond = depart.at(3.9e8);

    EXPECT_FALSE(beyond.is_finite());
    EXPECT_TRUE(std::isnan(beyond.get_v()));
    EXPECT_TRUE(std::isnan(beyond.get_phi()));
}

TEST(Orbit, HyperbolicOrbitHasNoApoapsis)
{
    Orbit depart(mu_earth(), r_leo, std::sqrt(2.0 * mu_earth() / r_leo) * 1.01, 0.0);

    EXPECT_LT(depart.get_a(), 0.0);
    EXPECT_GT(depart.get_e(), 1.0);
    EXPECT_TRUE(std::isinf(depart.get_apoapsis()));
    EXPECT_TRUE(std::isnan(depart.get_cos_E()));
    EXPECT_TRUE(depart.at(1e10).is_finite());
}
