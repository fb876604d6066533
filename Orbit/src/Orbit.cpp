#include <cmath>
#include <limits>

#include "astrodynamics.h"
#include "Orbit.h"

Orbit::Orbit(double gravitational_parameter, double r, double v, double phi)
	:
	mu_(gravitational_parameter),
	r_(r),
	v_(v),
	phi_(phi)
{
	energy_ = 0.5 * v * v - mu_ / r;
	h_ = r * v * cos(phi);
	p_ = h_ * h_ / mu_;
	a_ = -mu_ / (2.0 * energy_);

	double e2 = 1.0 + 2.0 * energy_ * h_ * h_ / (mu_ * mu_);

	// round-off leaves a circular orbit with a small eccentricity and an
	// undefined periapsis, anomalies are measured from the current position
	if (e2 < 1e-10)
	{
		e_ = 0.0;
		cos_nu_ = 1.0;
		cos_E_ = 1.0;
		return;
	}

	e_ = sqrt(e2);
	cos_nu_ = (p_ / r - 1.0) / e_;

	if (a_ > 0)
	{
		cos_E_ = (1.0 - r / a_) / e_;
	}
	else
	{
		cos_E_ = std::numeric_limits<double>::quiet_NaN();
	}
}

Orbit Orbit::circular(double gravitational_parameter, double r)
{
	return Orbit(gravitational_parameter, r, sqrt(gravitational_parameter / r), 0.0);
}

Orbit Orbit::at(double r, int sign) const
{
	double nan = std::numeric_limits<double>::quiet_NaN();

	// vis-viva for the speed, conservation of angular momentum for the angle
	double v2 = 2.0 * (energy_ + mu_ / r);

	if (!(v2 >= 0.0))
	{
		return Orbit(mu_, r, nan, nan);
	}

	double v = sqrt(v2);
	double cos_phi = h_ / (r * v);

	// round-off at an apsis may leave cos_phi slightly above one
	if (!(std::abs(cos_phi) <= 1.0 + 1e-12))
	{
		return Orbit(mu_, r, nan, nan);
	}

	return Orbit(mu_, r, v, (sign < 0 ? -1.0 : 1.0) * astrodynamics::safe_acos(cos_phi));
}

bool Orbit::is_finite() const
{
	return std::isfinite(v_) && std::isfinite(phi_);
}

double Orbit::get_mu() const
{
	return mu_;
}

double Orbit::get_r() const
{
	return r_;
}

double Orbit::get_v() const
{
	return v_;
}

double Orbit::get_phi() const
{
	return phi_;
}

double Orbit::get_energy() const
{
	return energy_;
}

double Orbit::get_h() const
{
	return h_;
}

double Orbit::get_p() const
{
	return p_;
}

double Orbit::get_e() const
{
	return e_;
}

double Orbit::get_a() const
{
	return a_;
}

double Orbit::get_cos_nu() const
{
	return cos_nu_;
}

double Orbit::get_cos_E() const
{
	return cos_E_;
}

double Orbit::get_nu() const
{
	double nu = astrodynamics::safe_acos(cos_nu_);
	return phi_ < 0 ? -nu : nu;
}

double Orbit::get_E() const
{
	double eccentric_anomaly = astrodynamics::safe_acos(cos_E_);
	return phi_ < 0 ? -eccentric_anomaly : eccentric_anomaly;
}

double Orbit::get_periapsis() const
{
	return p_ / (1.0 + e_);
}

double Orbit::get_apoapsis() const
{
	if (a_ > 0)
	{
		return a_ * (1.0 + e_);
	}
	else
	{
		return std::numeric_limits<double>::infinity();
	}
}
