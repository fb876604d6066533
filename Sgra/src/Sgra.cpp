#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>
#include <nlopt.hpp>

#include "astrodynamics.h"
#include "PatchedConic.h"
#include "Scalar.h"
#include "Sgra.h"

Sgra::Sgra(double gtol, double ftol, double qtol, double alphatol, double beta)
    : gtol_(gtol), ftol_(ftol), qtol_(qtol), alphatol_(alphatol), beta_(beta)
{
    conjugate_ = false;
    disp_ = false;
    line_search_ = "GOLDEN";
    bracket_lo_ = 1e-14;
    bracket_hi_ = 3e-5;

    const astrodynamics::EarthMoonSystem& s = astrodynamics::earth_moon;
    scalar_ = Scalar(astrodynamics::canonical_time(s.mu_moon, s.moon_radius), s.moon_radius);
}

//
// restoration
//

Sgra::Restoration::Restoration(const Sgra& sgra, const PatchedConic& x, int max_iterations)
    : scalar_(sgra.scalar_), gtol_(sgra.gtol_), beta0_(sgra.beta_), disp_(sgra.disp_), x_(x), max_iterations_(max_iterations)
{
    iterations_ = 0;
    beta_ = beta0_;
    converged_ = false;
}

bool Sgra::Restoration::step()
{
    while (!converged_)
    {
        if (std::abs(scalar_.ndim(Scalar::Quantity::DISTANCE, x_.get_g())) <= gtol_)
        {
            converged_ = true;
            break;
        }

        if (iterations_ >= max_iterations_)
        {
            throw IterationLimitError("\nRuntime Error: \"restoration\" iteration limit reached, g = " + std::to_string(x_.get_g()));
        }

        iterations_++;

        double v0 = x_.get_depart().get_v();
        double dv0 = -beta_ * x_.get_g() / x_.get_sensitivity().dg_dv0;

        if (!std::isfinite(dv0) || v0 + dv0 == v0)
        {
            throw RestorationUnderflowError("\nRuntime Error: \"restoration\" step does not change departure speed");
        }

        try
        {
            PatchedConic trial = make_patched_conic(x_.get_parameters(), Eigen::Vector2d(0.0, dv0));

            if (std::abs(trial.get_g()) < std::abs(x_.get_g()))
            {
                x_ = trial;
                beta_ = beta0_;

                if (disp_)
                {
                    std::cout << std::setprecision(17);
                    std::cout << "restoration: " << iterations_ << " v0: " << x_.get_depart().get_v() << " g: " << x_.get_g() << '\n';
                }

                return true;
            }
        }
        catch (const TrajectoryError&)
        {
            // rejected trial, damp below
        }

        beta_ *= 0.5;
    }

    return false;
}

bool Sgra::Restoration::converged() const
{
    return converged_;
}

int Sgra::Restoration::get_iterations() const
{
    return iterations_;
}

double Sgra::Restoration::get_beta() const
{
    return beta_;
}

const PatchedConic& Sgra::Restoration::get_solution() const
{
    return x_;
}

Sgra::Restoration Sgra::optimize_v0(const PatchedConic& x, int max_iterations) const
{
    return Restoration(*this, x, max_iterations);
}

PatchedConic Sgra::restore(const PatchedConic& x, int max_iterations) const
{
    Restoration restoration(*this, x, max_iterations);
    while (restoration.step());
    return restoration.get_solution();
}

//
// gradient phase
//

Sgra::Result Sgra::optimize_deltav(const PatchedConic& x0, int max_restore, int max_optimize) const
{
    Result result;
    result.iterations = 0;
    result.termination = Termination::OPTIMALITY;

    PatchedConic x = restore(x0, max_restore);
    result.history.push_back(x);

    Eigen::RowVector2d p_prev = Eigen::RowVector2d::Zero();
    double q_prev = 0.0;

    if (disp_)
    {
        std::cout << "iter: lam1: v0: f: g: Q: alpha:\n";
    }

    if (optimality(x) <= qtol_)
    {
        return result;
    }

    for (int i = 0; i < max_optimize; i++)
    {
        Eigen::RowVector2d p = x.get_dF_dx();

        if (conjugate_ && i > 0)
        {
            p += (x.get_Q_opt() / q_prev) * p_prev;
        }

        double alpha = line_search(x, p);
        PatchedConic next = gradient_step(x, p, alpha, max_restore);
        double decrease = cost_decrease(x, next);

        p_prev = p;
        q_prev = x.get_Q_opt();
        x = next;

        result.iterations++;
        result.history.push_back(x);

        double q = optimality(x);

        if (disp_)
        {
            std::cout << std::setprecision(17);
            std::cout << result.iterations << " ";
            std::cout << x.get_lam1() << " ";
            std::cout << x.get_depart().get_v() << " ";
            std::cout << x.get_f() << " ";
            std::cout << x.get_g() << " ";
            std::cout << q << " ";
            std::cout << alpha << '\n';
        }

        if (q <= qtol_)
        {
            result.termination = Termination::OPTIMALITY;
            return result;
        }

        if (decrease <= ftol_)
        {
            result.termination = Termination::COST;
            return result;
        }
    }

    throw IterationLimitError("\nRuntime Error: \"gradient\" iteration limit reached");
}

PatchedConic Sgra::gradient_step(const PatchedConic& x, const Eigen::RowVector2d& p, double alpha, int max_restore) const
{
    Eigen::Vector2d x0 = x.get_x();

    while (alpha > 1e-15)
    {
        Eigen::Vector2d dx = -alpha * p.transpose();

        if (x0(0) + dx(0) == x0(0) && x0(1) + dx(1) == x0(1))
        {
            throw StepUnderflowError("\nRuntime Error: \"gradient\" step does not change design vector");
        }

        try
        {
            PatchedConic trial = restore(make_patched_conic(x.get_parameters(), dx), max_restore);

            if (trial.get_f() < x.get_f())
            {
                return trial;
            }
        }
        catch (const TrajectoryError&)
        {
            // invalid trial, shrink below
        }

        alpha *= 0.9;
    }

    throw StepUnderflowError("\nRuntime Error: \"gradient\" step length underflow");
}

double Sgra::merit(const PatchedConic& x, const Eigen::RowVector2d& p, double alpha) const
{
    try
    {
        PatchedConic y = make_patched_conic(x.get_parameters(), -alpha * p.transpose());
        return y.get_f() + y.get_g() * x.get_lambda();
    }
    catch (const TrajectoryError&)
    {
        return std::numeric_limits<double>::infinity();
    }
}

double Sgra::line_search(const PatchedConic& x, const Eigen::RowVector2d& p) const
{
    if (line_search_ == "GOLDEN")
    {
        return golden_search(x, p);
    }
    else
    {
        return nlopt_search(x, p);
    }
}

// downhill bracket expansion with parabolic extrapolation, then golden
// section reduction of the bracket
double Sgra::golden_search(const PatchedConic& x, const Eigen::RowVector2d& p) const
{
    const double gold = 1.618034;
    const double grow_limit = 110.0;
    const double very_small = 1e-21;
    const int max_bracket = 1000;
    const int max_section = 500;

    auto psi = [this, &x, &p](double alpha) { return merit(x, p, alpha); };

    double xa = bracket_lo_;
    double xb = bracket_hi_;
    double fa = psi(xa);
    double fb = psi(xb);

    if (fa < fb)
    {
        std::swap(xa, xb);
        std::swap(fa, fb);
    }

    double xc = xb + gold * (xb - xa);
    double fc = psi(xc);

    int iter = 0;
    while (fc < fb)
    {
        double tmp1 = (xb - xa) * (fb - fc);
        double tmp2 = (xb - xc) * (fb - fa);
        double val = tmp2 - tmp1;
        double denom = std::abs(val) < very_small ? 2.0 * very_small : 2.0 * val;
        double w = xb - ((xb - xc) * tmp2 - (xb - xa) * tmp1) / denom;
        double wlim = xb + grow_limit * (xc - xb);
        double fw;

        if (++iter > max_bracket)
        {
            throw IterationLimitError("\nRuntime Error: \"line search\" no bracket found");
        }

        if ((w - xc) * (xb - w) > 0.0)
        {
            fw = psi(w);
            if (fw < fc)
            {
                xa = xb;
                xb = w;
                fa = fb;
                fb = fw;
                break;
            }
            else if (fw > fb)
            {
                xc = w;
                fc = fw;
                break;
            }
            w = xc + gold * (xc - xb);
            fw = psi(w);
        }
        else if ((w - wlim) * (wlim - xc) >= 0.0)
        {
            w = wlim;
            fw = psi(w);
        }
        else if ((w - wlim) * (xc - w) > 0.0)
        {
            fw = psi(w);
            if (fw < fc)
            {
                xb = xc;
                xc = w;
                w = xc + gold * (xc - xb);
                fb = fc;
                fc = fw;
                fw = psi(w);
            }
        }
        else
        {
            w = xc + gold * (xc - xb);
            fw = psi(w);
        }

        xa = xb;
        xb = xc;
        xc = w;
        fa = fb;
        fb = fc;
        fc = fw;
    }

    const double r = 0.61803399;
    const double c = 1.0 - r;

    double x0 = xa;
    double x3 = xc;
    double x1;
    double x2;

    if (std::abs(xc - xb) > std::abs(xb - xa))
    {
        x1 = xb;
        x2 = xb + c * (xc - xb);
    }
    else
    {
        x2 = xb;
        x1 = xb - c * (xb - xa);
    }

    double f1 = psi(x1);
    double f2 = psi(x2);

    for (int i = 0; i < max_section && std::abs(x3 - x0) > alphatol_ * (std::abs(x1) + std::abs(x2)); i++)
    {
        if (f2 < f1)
        {
            x0 = x1;
            x1 = x2;
            x2 = r * x1 + c * x3;
            f1 = f2;
            f2 = psi(x2);
        }
        else
        {
            x3 = x2;
            x2 = x1;
            x1 = r * x2 + c * x0;
            f2 = f1;
            f1 = psi(x1);
        }
    }

    return f1 < f2 ? x1 : x2;
}

// step length is scaled by the upper end of the bracket
double Sgra::nlopt_search(const PatchedConic& x, const Eigen::RowVector2d& p) const
{
    LineSearchData data{ this, &x, p, bracket_hi_ };

    nlopt::opt opt(line_search_.c_str(), 1);
    opt.set_lower_bounds(bracket_lo_ / bracket_hi_);
    opt.set_upper_bounds(1e4);
    opt.set_min_objective(line_search_objective, &data);
    opt.set_xtol_rel(alphatol_);
    opt.set_maxeval(500);

    std::vector<double> s = { 1.0 };
    double minf;

    try
    {
        opt.optimize(s, minf);
    }
    catch (const nlopt::roundoff_limited&)
    {
        // s holds the best point found
    }

    return s[0] * bracket_hi_;
}

double Sgra::line_search_objective(unsigned n, const double* x, double* grad, void* f_data)
{
    try
    {
        LineSearchData* data = reinterpret_cast<LineSearchData*>(f_data);

        double psi = data->sgra->merit(*data->x, data->p, x[0] * data->scale);
        return std::isfinite(psi) ? psi : std::numeric_limits<double>::max();
    }
    catch (const std::exception& e)
    {
        std::cerr << "error in line search function:" << '\n';
        std::cerr << e.what() << '\n';
        throw;
    }
}

//
// nondimensional measures
//

double Sgra::constraint(const PatchedConic& x) const
{
    return std::abs(scalar_.ndim(Scalar::Quantity::DISTANCE, x.get_g()));
}

double Sgra::optimality(const PatchedConic& x) const
{
    Eigen::RowVector2d dF_dx = x.get_dF_dx();

    // dF/dlam1 is a velocity per radian, dF/dv0 is dimensionless
    double dF_dlam1 = scalar_.ndim(Scalar::Quantity::VELOCITY, dF_dx(0));
    return dF_dlam1 * dF_dlam1 + dF_dx(1) * dF_dx(1);
}

double Sgra::cost_decrease(const PatchedConic& previous, const PatchedConic& current) const
{
    return scalar_.ndim(Scalar::Quantity::VELOCITY, previous.get_f() - current.get_f());
}

//
// set methods
//

void Sgra::set_conjugate(bool conjugate)
{
    conjugate_ = conjugate;
}

void Sgra::set_disp(bool disp)
{
    disp_ = disp;
}

void Sgra::set_line_search(std::string method)
{
    if (method != "GOLDEN" && method.rfind("LN_", 0) != 0)
    {
        throw std::runtime_error("\nRuntime Error: \"line search\" method must be GOLDEN or an NLopt LN_ algorithm, got " + method);
    }

    line_search_ = method;
}

void Sgra::set_line_search_bracket(double lo, double hi)
{
    if (!(lo > 0.0 && hi > lo))
    {
        throw std::runtime_error("\nRuntime Error: \"line search\" bracket must satisfy 0 < lo < hi");
    }

    bracket_lo_ = lo;
    bracket_hi_ = hi;
}
