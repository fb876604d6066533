#pragma once

#include <stdexcept>
#include <string>

#include <Eigen/Dense>

#include "Orbit.h"

//
// errors raised for a candidate point that has no valid transfer
//

class TrajectoryError : public std::runtime_error
{
public:
    explicit TrajectoryError(const std::string& what) : std::runtime_error(what) {}
};

// arrival orbit is not elliptical
class EllipticalArrivalError : public TrajectoryError
{
public:
    explicit EllipticalArrivalError(const std::string& what) : TrajectoryError(what) {}
};

// sphere of influence intercept radius cannot be reached from the departure state
class InvalidTrajectoryError : public TrajectoryError
{
public:
    explicit InvalidTrajectoryError(const std::string& what) : TrajectoryError(what) {}
};

// scalars that define a transfer, the design vector is (lam1, v0)
struct TransferParameters
{
    double r0;      // departure radius
    double v0;      // departure speed after the burn
    double phi0;    // departure flight-path angle
    double lam1;    // phase angle of the spacecraft at soi arrival
    double rf;      // desired radius of the final lunar orbit
};

// class PatchedConic
// Planar patched conic approximation of an earth--moon transfer together with
// the partial derivatives of its cost and perilune constraint with respect to
// the design vector x = (lam1, v0).
//
// Arthur Gagg Filho, L., & da Silva Fernandes, S. 2016. Optimal round trip
// lunar missions based on the patched-conic approximation. Computational and
// Applied Mathematics, 35(3), 753-787.

class PatchedConic
{
public:

    // depart = earth-centered orbit just after the departure burn, the burn is
    //          relative to a circular orbit of the same radius
    // arrive = earth-centered orbit at the sphere of influence intercept
    // lam1   = angle between the soi intercept and the moon--earth line as seen
    //          from the moon
    // rf     = radius of the final lunar orbit
    PatchedConic(const Orbit& depart, const Orbit& arrive, double lam1, double rf);

    // transfer geometry, subscript 0 is departure, 1 is soi intercept in the
    // earth frame, 2 is soi intercept in the moon frame
    struct Transfer
    {
        double tof;
        double E0;
        double E1;
        double nu0;
        double nu1;
        double gam0;
        double gam1;
        double v2;
        double phi2;
        double eps2;
        double q;
        double ef;
        double af;
        double rpl;
        double vpl;
        double vf;
    };

    // partial derivatives of the transfer, evaluated in the order declared
    struct Sensitivity
    {
        double dv1_dv0;
        double dphi1_dv0;
        double dv2_dv0;
        double dphi2_dv1;
        double dphi2_dphi1;
        double dphi2_dv0;
        double def_dv2;
        double def_dphi2;
        double def_dv0;
        double daf_dv0;
        double drpl_dv0;

        double dv1_dlam1;
        double dphi1_dlam1;
        double dgam1_dlam1;
        double dv2_dlam1;
        double dphi2_dgam1;
        double dphi2_dlam1;
        double dq_dlam1;
        double daf_dq;
        double def_dq;
        double daf_dlam1;
        double def_dlam1;
        double drpl_dlam1;

        double dg_dlam1;
        double dg_dv0;
        double dvpl_daf;
        double dvpl_def;
        double dvpl_dlam1;
        double dvpl_dv0;
        double df_dlam1;
        double df_dv0;
    };

    // earth-centered plane with the moon on the +x axis
    struct Geometry
    {
        Eigen::Vector2d moon;       // position of the moon
        double soi_radius;
        Eigen::Vector2d r1;         // soi intercept
        Eigen::Vector2d v1;         // velocity at intercept relative to earth
        Eigen::Vector2d vm;         // velocity of the moon
        Eigen::Vector2d r2;         // soi intercept relative to the moon
        Eigen::Vector2d v2;         // velocity at intercept relative to the moon
    };

    const Orbit& get_depart() const;
    const Orbit& get_arrive() const;
    double get_lam1() const;
    double get_rf() const;

    const Transfer& get_transfer() const;
    const Sensitivity& get_sensitivity() const;

    // scalars that reproduce this transfer through make_patched_conic
    TransferParameters get_parameters() const;

    // design vector (lam1, v0)
    Eigen::Vector2d get_x() const;

    double get_deltav1() const;
    double get_deltav2() const;

    // cost, total delta-v
    double get_f() const;

    // perilune constraint, rf - rpl
    double get_g() const;

    Eigen::RowVector2d get_df_dx() const;
    Eigen::RowVector2d get_dg_dx() const;

    // lagrange multiplier estimate, augmented cost f + lambda * g and its gradient
    double get_lambda() const;
    double get_F() const;
    Eigen::RowVector2d get_dF_dx() const;

    // optimality residual, zero at a first-order optimal point
    double get_Q_opt() const;

    Geometry geometry() const;

private:

    Orbit depart_;
    Orbit arrive_;
    double lam1_;
    double rf_;

    Transfer transfer_;
    Sensitivity sensitivity_;

    double deltav1_;
    double deltav2_;
    double f_;
    double g_;
    double lambda_;
    double F_;
    double Q_opt_;
    Eigen::RowVector2d df_dx_;
    Eigen::RowVector2d dg_dx_;
    Eigen::RowVector2d dF_dx_;

    void compute_transfer();
    void compute_gradients();
};

// Returns the transfer defined by base with its design vector (lam1, v0)
// displaced by dx. Throws InvalidTrajectoryError if the soi intercept radius
// is not reached by the new departure state.
PatchedConic make_patched_conic(const TransferParameters& base, const Eigen::Vector2d& dx = Eigen::Vector2d::Zero());
