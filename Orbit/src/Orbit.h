#pragma once

// class Orbit
// Planar two-body state of a vessel: radius, speed and flight-path angle
// together with the conic section they define.

class Orbit
{
public:

    // Creates an orbit from radius, speed and flight-path angle (angle between
    // velocity and local horizontal, positive when moving away from periapsis)
    Orbit(double gravitational_parameter, double r, double v, double phi);

    // Creates a circular orbit of radius r
    static Orbit circular(double gravitational_parameter, double r);

    // Returns the state on the same conic at radius r. sign selects the
    // outbound (+1) or inbound (-1) branch of true anomaly. If r cannot be
    // reached, speed and flight-path angle of the returned state are nan.
    Orbit at(double r, int sign = 1) const;

    // false if the state is the result of an unreachable radius
    bool is_finite() const;

    // Get methods
    double get_mu() const;
    double get_r() const;
    double get_v() const;
    double get_phi() const;
    double get_energy() const;
    double get_h() const;
    double get_p() const;
    double get_e() const;
    double get_a() const;
    double get_cos_nu() const;
    double get_cos_E() const;
    double get_nu() const;
    double get_E() const;
    double get_periapsis() const;
    double get_apoapsis() const;

private:

    double mu_;
    double r_;
    double v_;
    double phi_;

    double energy_;
    double h_;
    double p_;
    double e_;
    double a_;
    double cos_nu_;
    double cos_E_;
};
