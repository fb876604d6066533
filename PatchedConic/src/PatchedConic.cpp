#include <cmath>

#include <Eigen/Dense>

#include "astrodynamics.h"
#include "Orbit.h"
#include "PatchedConic.h"

PatchedConic::PatchedConic(const Orbit& depart, const Orbit& arrive, double lam1, double rf)
    : depart_(depart), arrive_(arrive), lam1_(lam1), rf_(rf)
{
    if (!(arrive_.get_a() > 0))
    {
        throw EllipticalArrivalError("\nRuntime Error: \"patched conic\" expected elliptical trajectory at soi intercept");
    }

    compute_transfer();
    compute_gradients();
}

void PatchedConic::compute_transfer()
{
    const astrodynamics::EarthMoonSystem& s = astrodynamics::earth_moon;
    Transfer& t = transfer_;

    // duration from departure (time 0) to soi intercept (time 1)
    t.E0 = astrodynamics::safe_acos(depart_.get_cos_E());
    t.E1 = astrodynamics::safe_acos(arrive_.get_cos_E());
    t.tof = astrodynamics::kepler_time(arrive_.get_a(), arrive_.get_e(), arrive_.get_mu(), t.E0, t.E1);

    t.nu0 = astrodynamics::safe_acos(depart_.get_cos_nu());
    t.nu1 = astrodynamics::safe_acos(arrive_.get_cos_nu());

    // gam1 is opposite lam1 in the arrival triangle, phase angle at arrival
    t.gam1 = astrodynamics::safe_asin(s.soi_radius / arrive_.get_r() * sin(lam1_));

    // phase angle at departure
    t.gam0 = t.nu1 - t.nu0 - t.gam1 - s.omega * t.tof;

    double v1 = arrive_.get_v();
    double phi1 = arrive_.get_phi();
    double vm = s.moon_velocity;

    // velocity relative to the moon at soi intercept
    t.v2 = astrodynamics::law_of_cosines(v1, vm, phi1 - t.gam1);

    // miss angle of the hyperbolic trajectory
    t.eps2 = astrodynamics::safe_asin((vm * cos(lam1_) - v1 * cos(lam1_ + t.gam1 - phi1)) / -t.v2);

    // selenocentric flight-path angle
    t.phi2 = atan(-v1 * sin(phi1 - t.gam1) / (vm - v1 * cos(phi1 - t.gam1))) - lam1_;

    // lunar hyperbola and its perilune
    t.q = s.soi_radius * t.v2 * t.v2 / s.mu_moon;
    t.ef = sqrt(1.0 + t.q * (t.q - 2.0) * pow(cos(t.phi2), 2));
    t.af = s.soi_radius / (2.0 - t.q);
    t.rpl = t.af * (1.0 - t.ef);
    t.vpl = sqrt(s.mu_moon * (1.0 + t.ef) / (t.af * (1.0 - t.ef)));
    t.vf = sqrt(s.mu_moon / rf_);
}

void PatchedConic::compute_gradients()
{
    const astrodynamics::EarthMoonSystem& s = astrodynamics::earth_moon;
    const Transfer& t = transfer_;
    Sensitivity& d = sensitivity_;

    double mu = depart_.get_mu();
    double mu_moon = s.mu_moon;
    double vm = s.moon_velocity;

    double r0 = depart_.get_r();
    double r1 = arrive_.get_r();
    double r2 = s.soi_radius;
    double v0 = depart_.get_v();
    double v1 = arrive_.get_v();
    double v2 = t.v2;
    double h = arrive_.get_h();
    double q = t.q;
    double ef = t.ef;
    double af = t.af;

    double phi1 = arrive_.get_phi();
    double sphi1 = sin(phi1);
    double tphi1 = tan(phi1);
    double cphi2 = cos(t.phi2);
    double sphi2 = sin(t.phi2);
    double cgam1 = cos(t.gam1);
    double cpmg1 = cos(phi1 - t.gam1);
    double spmg1 = sin(phi1 - t.gam1);
    double slam1 = sin(lam1_);
    double clam1 = cos(lam1_);

    // departure speed
    d.dv1_dv0 = v0 / v1;
    d.dphi1_dv0 = (v0 / v1 - v1 / v0) / (v1 * tphi1);
    d.dv2_dv0 = ((v1 - vm * cpmg1) / v2) * d.dv1_dv0 + ((v1 * vm * spmg1) / v2) * d.dphi1_dv0;
    d.dphi2_dv1 = -vm * spmg1 / (v2 * v2);
    d.dphi2_dphi1 = (v1 * v1 - v1 * vm * cpmg1) / (v2 * v2);
    d.dphi2_dv0 = d.dphi2_dv1 * d.dv1_dv0 + d.dphi2_dphi1 * d.dphi1_dv0;

    d.def_dv2 = 2.0 * q * (q - 1.0) * cphi2 * cphi2 / (ef * v2);
    d.def_dphi2 = -q * (q - 2.0) * cphi2 * sphi2 / ef;
    d.def_dv0 = d.def_dv2 * d.dv2_dv0 + d.def_dphi2 * d.dphi2_dv0;
    d.daf_dv0 = 2.0 * af * af * v2 * d.dv2_dv0 / mu_moon;
    d.drpl_dv0 = (1.0 - ef) * d.daf_dv0 - af * d.def_dv0;

    // arrival phase angle
    d.dv1_dlam1 = -mu * s.distance * r2 * slam1 / (v1 * pow(r1, 3));
    d.dphi1_dlam1 = h * s.distance * r2 * slam1 / (v1 * pow(r1, 3) * sphi1)
        - h * s.distance * r2 * mu * slam1 / (pow(v1, 3) * pow(r1, 4) * sphi1);
    d.dgam1_dlam1 = r2 * clam1 / (r1 * cgam1) - s.distance * pow(r2 * slam1, 2) / (pow(r1, 3) * cgam1);

    d.dv2_dlam1 = ((v1 - vm * cpmg1) * d.dv1_dlam1
        + (v1 * vm * spmg1) * d.dphi1_dlam1
        - (v1 * vm * spmg1) * d.dgam1_dlam1) / v2;
    d.dphi2_dgam1 = (vm * v1 * cpmg1 - v1 * v1) / (v2 * v2);
    d.dphi2_dlam1 = d.dphi2_dphi1 * d.dphi1_dlam1 + d.dphi2_dgam1 * d.dgam1_dlam1 + d.dphi2_dv1 * d.dv1_dlam1 - 1.0;

    d.dq_dlam1 = 2.0 * r2 * v2 * d.dv2_dlam1 / mu_moon;
    d.daf_dq = af / (2.0 - q);
    d.def_dq = (q - 1.0) * cphi2 * cphi2 / ef;
    d.daf_dlam1 = d.daf_dq * d.dq_dlam1;
    d.def_dlam1 = d.def_dq * d.dq_dlam1 + d.def_dphi2 * d.dphi2_dlam1;
    d.drpl_dlam1 = (1.0 - ef) * d.daf_dlam1 - af * d.def_dlam1;

    // constraint and cost
    d.dg_dlam1 = -d.drpl_dlam1;
    d.dg_dv0 = -d.drpl_dv0;
    d.dvpl_daf = 0.5 * sqrt(mu_moon * (1.0 + ef) / (pow(af, 3) * (1.0 - ef)));
    d.dvpl_def = -sqrt(mu_moon / ((1.0 + ef) * af * pow(1.0 - ef, 3)));
    d.dvpl_dlam1 = d.dvpl_daf * d.daf_dlam1 + d.dvpl_def * d.def_dlam1;
    d.dvpl_dv0 = d.dvpl_def * d.def_dv0 + d.dvpl_daf * d.daf_dv0;

    double vc0 = sqrt(mu / r0);
    deltav1_ = std::abs(v0 - vc0);
    deltav2_ = t.vpl - t.vf;

    d.df_dlam1 = d.dvpl_dlam1;
    d.df_dv0 = (v0 < vc0 ? -1.0 : 1.0) + d.dvpl_dv0;

    f_ = deltav1_ + deltav2_;
    g_ = rf_ - t.rpl;

    df_dx_ << d.df_dlam1, d.df_dv0;
    dg_dx_ << d.dg_dlam1, d.dg_dv0;

    // multiplier that removes the component of df_dx along dg_dx
    double p = 1.0 / dg_dx_.dot(dg_dx_);
    lambda_ = -p * dg_dx_.dot(df_dx_);

    dF_dx_ = df_dx_ + lambda_ * dg_dx_;
    F_ = f_ + lambda_ * g_;
    Q_opt_ = dF_dx_.squaredNorm();
}

const Orbit& PatchedConic::get_depart() const
{
    return depart_;
}

const Orbit& PatchedConic::get_arrive() const
{
    return arrive_;
}

double PatchedConic::get_lam1() const
{
    return lam1_;
}

double PatchedConic::get_rf() const
{
    return rf_;
}

const PatchedConic::Transfer& PatchedConic::get_transfer() const
{
    return transfer_;
}

const PatchedConic::Sensitivity& PatchedConic::get_sensitivity() const
{
    return sensitivity_;
}

TransferParameters PatchedConic::get_parameters() const
{
    return { depart_.get_r(), depart_.get_v(), depart_.get_phi(), lam1_, rf_ };
}

Eigen::Vector2d PatchedConic::get_x() const
{
    return Eigen::Vector2d(lam1_, depart_.get_v());
}

double PatchedConic::get_deltav1() const
{
    return deltav1_;
}

double PatchedConic::get_deltav2() const
{
    return deltav2_;
}

double PatchedConic::get_f() const
{
    return f_;
}

double PatchedConic::get_g() const
{
    return g_;
}

Eigen::RowVector2d PatchedConic::get_df_dx() const
{
    return df_dx_;
}

Eigen::RowVector2d PatchedConic::get_dg_dx() const
{
    return dg_dx_;
}

double PatchedConic::get_lambda() const
{
    return lambda_;
}

double PatchedConic::get_F() const
{
    return F_;
}

Eigen::RowVector2d PatchedConic::get_dF_dx() const
{
    return dF_dx_;
}

double PatchedConic::get_Q_opt() const
{
    return Q_opt_;
}

PatchedConic::Geometry PatchedConic::geometry() const
{
    const astrodynamics::EarthMoonSystem& s = astrodynamics::earth_moon;
    Geometry geometry;

    geometry.moon = Eigen::Vector2d(s.distance, 0.0);
    geometry.soi_radius = s.soi_radius;

    // intercept seen from earth and from the moon
    geometry.r1 = astrodynamics::rotate(Eigen::Vector2d(arrive_.get_r(), 0.0), transfer_.gam1);
    geometry.r2 = astrodynamics::rotate(Eigen::Vector2d(-s.soi_radius, 0.0), -lam1_);

    // earth-relative velocity is the radial direction turned by the flight-path angle
    geometry.v1 = arrive_.get_v() * astrodynamics::rotate(geometry.r1.normalized(), 0.5 * astrodynamics::pi - arrive_.get_phi());
    geometry.vm = Eigen::Vector2d(0.0, s.moon_velocity);
    geometry.v2 = -transfer_.v2 * astrodynamics::rotate(geometry.r2.normalized(), transfer_.eps2);

    return geometry;
}

PatchedConic make_patched_conic(const TransferParameters& base, const Eigen::Vector2d& dx)
{
    const astrodynamics::EarthMoonSystem& s = astrodynamics::earth_moon;

    double v0 = base.v0 + dx(1);
    double lam1 = base.lam1 + dx(0);
    double r1 = astrodynamics::law_of_cosines(s.distance, s.soi_radius, lam1);

    Orbit depart(s.mu_earth, base.r0, v0, base.phi0);
    Orbit intercept = depart.at(r1, 1);

    if (!intercept.is_finite())
    {
        throw InvalidTrajectoryError("\nRuntime Error: \"patched conic\" soi intercept radius is not reached from departure state");
    }

    return PatchedConic(depart, intercept, lam1, base.rf);
}
