#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <tuple>
#include <vector>

#include <Eigen/Dense>
#include <nlopt.hpp>

#include "astrodynamics.h"
#include "PatchedConic.h"
#include "Scalar.h"
#include "LunarTransferPlan.h"

namespace
{
    // units of the decision vector (lam1, v0)
    const Scalar::Quantity decision_quantities[2] = { Scalar::Quantity::ANGLE, Scalar::Quantity::VELOCITY };
}

LunarTransferPlan::LunarTransferPlan()
{
    const astrodynamics::EarthMoonSystem& s = astrodynamics::earth_moon;

    data_.r0 = 6556400.0;
    data_.phi0 = 0.0;
    data_.rf = s.moon_radius + 200000.0;
    data_.min_phase = 45.0 * astrodynamics::pi / 180.0;
    data_.max_phase = 85.0 * astrodynamics::pi / 180.0;
    data_.scalar = Scalar(astrodynamics::canonical_time(s.mu_moon, s.moon_radius), s.moon_radius);

    run_ = false;
}

LunarTransferPlan::~LunarTransferPlan()
{

}

//
// constraint functions
//

void LunarTransferPlan::set_mission(double r0, double phi0, double rf)
{
    data_.r0 = r0;
    data_.phi0 = phi0;
    data_.rf = rf;
}

// window of the arrival phase angle lam1 in degrees
void LunarTransferPlan::add_phase_angle_constraint(double min, double max)
{
    if (!(min > 0.0 && max > min && max < 180.0))
    {
        throw std::runtime_error("\nRuntime Error: \"phase angle constraint\" requires 0 < min < max < 180");
    }

    data_.min_phase = min * astrodynamics::pi / 180.0;
    data_.max_phase = max * astrodynamics::pi / 180.0;
}

//
// model functions
//

void LunarTransferPlan::init_model(double lam1, double v0)
{
    x_ = { lam1, v0 };
    data_.scalar.ndim(decision_quantities, x_.data(), x_.size());
    run_ = false;
}

// nondimensional decision vector, e.g. the nlopt_solution of a previous result
void LunarTransferPlan::set_solution(const std::vector<double>& x)
{
    if (x.size() != 2)
    {
        throw std::runtime_error("\nRuntime Error: \"set solution\" expected 2 decision variables");
    }

    x_ = x;
    run_ = false;
}

void LunarTransferPlan::run_model(int max_eval, double eps_t, double eps_x)
{
    // one decision variable per design parameter, one perilune constraint
    int n = 2;
    int m = 1;

    if (x_.size() != static_cast<size_t>(n))
    {
        throw std::runtime_error("\nRuntime Error: \"run model\" model was not initialized");
    }

    std::vector<double> tol(m, eps_t);

    auto [lower_bounds, upper_bounds] = bounds();

    // start from inside the box
    for (int i = 0; i < n; i++)
    {
        x_[i] = std::min(std::max(x_[i], lower_bounds[i]), upper_bounds[i]);
    }

    double minf;
    opt_ = nlopt::opt("LD_SLSQP", n);
    opt_.set_lower_bounds(lower_bounds);
    opt_.set_upper_bounds(upper_bounds);
    opt_.set_min_objective(objective, &data_);
    opt_.add_equality_mconstraint(constraints, &data_, tol);
    opt_.set_maxeval(max_eval);
    opt_.set_xtol_abs(eps_x);

    try
    {
        opt_.optimize(x_, minf);
    }
    catch (const nlopt::roundoff_limited&)
    {
        // x_ holds the best point found, reported through last_optimize_result
    }

    run_ = true;
}

LunarTransferPlan::Result LunarTransferPlan::output_result()
{
    if (!run_)
    {
        throw std::runtime_error("\nRuntime Error: \"output result\" model has not been run");
    }

    Result result;

    int n = 2;
    int m = 1;

    result.nlopt_code = static_cast<int>(opt_.last_optimize_result());
    result.nlopt_value = opt_.last_optimum_value();
    result.nlopt_num_evals = opt_.get_numevals();
    result.nlopt_solution = x_;
    result.nlopt_constraints.resize(m);

    result.time_scale = data_.scalar.get_scale(Scalar::Quantity::TIME);
    result.distance_scale = data_.scalar.get_scale(Scalar::Quantity::DISTANCE);
    result.velocity_scale = data_.scalar.get_scale(Scalar::Quantity::VELOCITY);

    constraints(m, result.nlopt_constraints.data(), n, x_.data(), NULL, &data_);

    PatchedConic pc = transfer(x_.data(), data_);

    result.lam1 = pc.get_lam1();
    result.v0 = pc.get_depart().get_v();
    result.f = pc.get_f();
    result.g = pc.get_g();
    result.deltav1 = pc.get_deltav1();
    result.deltav2 = pc.get_deltav2();
    result.geometry = pc.geometry();

    return result;
}

// lam1 inside the requested window, v0 between the speed whose apogee clears
// the farthest soi intercept of the window and just below escape speed
std::tuple<std::vector<double>, std::vector<double>> LunarTransferPlan::bounds()
{
    const astrodynamics::EarthMoonSystem& s = astrodynamics::earth_moon;

    std::vector<double> lower_bounds;
    std::vector<double> upper_bounds;

    double mu = s.mu_earth;
    double r0 = data_.r0;
    double r1 = 1.001 * astrodynamics::law_of_cosines(s.distance, s.soi_radius, data_.max_phase);
    double cphi0 = cos(data_.phi0);

    // energy and angular momentum allow radius r1 to be reached
    double min_v0 = sqrt(2.0 * mu * r1 * r1 * (1.0 / r0 - 1.0 / r1) / (r1 * r1 - r0 * r0 * cphi0 * cphi0));
    double max_v0 = 0.999 * sqrt(2.0 * mu / r0);

    lower_bounds.push_back(data_.min_phase);
    upper_bounds.push_back(data_.max_phase);

    lower_bounds.push_back(data_.scalar.ndim(Scalar::Quantity::VELOCITY, min_v0));
    upper_bounds.push_back(data_.scalar.ndim(Scalar::Quantity::VELOCITY, max_v0));

    return { lower_bounds, upper_bounds };
}

PatchedConic LunarTransferPlan::transfer(const double* x, const TransferPlanData& data)
{
    double design[2] = { x[0], x[1] };
    data.scalar.rdim(decision_quantities, design, 2);

    TransferParameters parameters;
    parameters.r0 = data.r0;
    parameters.v0 = design[1];
    parameters.phi0 = data.phi0;
    parameters.lam1 = design[0];
    parameters.rf = data.rf;

    return make_patched_conic(parameters);
}

void LunarTransferPlan::constraints(unsigned m, double* result, unsigned n, const double* x, double* grad, void* f_data)
{
    try
    {
        TransferPlanData* data = reinterpret_cast<TransferPlanData*>(f_data);
        PatchedConic pc = transfer(x, *data);

        double distance = data->scalar.get_scale(Scalar::Quantity::DISTANCE);
        double velocity = data->scalar.get_scale(Scalar::Quantity::VELOCITY);

        result[0] = pc.get_g() / distance;

        if (grad)
        {
            grad[0] = pc.get_sensitivity().dg_dlam1 / distance;
            grad[1] = pc.get_sensitivity().dg_dv0 * velocity / distance;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "error in constraint function:" << '\n';
        std::cerr << e.what() << '\n';
        throw;
    }
}

double LunarTransferPlan::objective(unsigned n, const double* x, double* grad, void* f_data)
{
    try
    {
        TransferPlanData* data = reinterpret_cast<TransferPlanData*>(f_data);
        PatchedConic pc = transfer(x, *data);

        double velocity = data->scalar.get_scale(Scalar::Quantity::VELOCITY);

        if (grad)
        {
            grad[0] = pc.get_sensitivity().df_dlam1 / velocity;
            grad[1] = pc.get_sensitivity().df_dv0;
        }

        return pc.get_f() / velocity;
    }
    catch (const std::exception& e)
    {
        std::cerr << "error in objective function:" << '\n';
        std::cerr << e.what() << '\n';
        throw;
    }
}
