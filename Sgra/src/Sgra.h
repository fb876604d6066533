#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "PatchedConic.h"
#include "Scalar.h"

//
// errors raised when an optimizer cannot make progress
//

class SgraError : public std::runtime_error
{
public:
    explicit SgraError(const std::string& what) : std::runtime_error(what) {}
};

// restoration step too small to change the departure speed
class RestorationUnderflowError : public SgraError
{
public:
    explicit RestorationUnderflowError(const std::string& what) : SgraError(what) {}
};

// gradient step too small to change the design vector
class StepUnderflowError : public SgraError
{
public:
    explicit StepUnderflowError(const std::string& what) : SgraError(what) {}
};

// iteration budget exhausted without convergence
class IterationLimitError : public SgraError
{
public:
    explicit IterationLimitError(const std::string& what) : SgraError(what) {}
};

// class Sgra
// Sequential gradient-restoration algorithm for the patched conic transfer.
// Restoration drives the perilune constraint to zero by adjusting the
// departure speed, the gradient phase moves along the augmented gradient of
// the cost and restores again.
//
// All tolerances are nondimensional in lunar canonical units: distance is the
// radius of the moon and velocity is the circular speed at that radius.

class Sgra
{
public:

    // gtol     = tolerance on the constraint |g|
    // ftol     = tolerance on the decrease in cost of an accepted cycle
    // qtol     = tolerance on the optimality residual
    // alphatol = relative tolerance of the line search
    // beta     = initial restoration step scale, damped by halving
    Sgra(double gtol = 5e-8, double ftol = 1e-12, double qtol = 1e-6, double alphatol = 1e-6, double beta = 1.0);

    // Lazy restoration sequence at fixed lam1. Each call to step() performs
    // damped newton steps on v0 until one reduces |g|, then returns true with
    // the improved state available from get_solution(). Returns false once
    // the constraint is satisfied. Tolerances and display settings are copied
    // from the Sgra object at construction.
    class Restoration
    {
    public:
        Restoration(const Sgra& sgra, const PatchedConic& x, int max_iterations);

        bool step();

        bool converged() const;
        int get_iterations() const;
        double get_beta() const;
        const PatchedConic& get_solution() const;

    private:
        Scalar scalar_;
        double gtol_;
        double beta0_;
        bool disp_;

        PatchedConic x_;
        int max_iterations_;
        int iterations_;
        double beta_;
        bool converged_;
    };

    enum class Termination
    {
        OPTIMALITY,
        COST
    };

    struct Result
    {
        int iterations;
        Termination termination;
        std::vector<PatchedConic> history;  // restored state of every accepted cycle
    };

    Restoration optimize_v0(const PatchedConic& x, int max_iterations = 100) const;

    // runs the restoration sequence to convergence
    PatchedConic restore(const PatchedConic& x, int max_iterations = 100) const;

    // minimizes total delta-v subject to the perilune constraint
    Result optimize_deltav(const PatchedConic& x, int max_restore = 100, int max_optimize = 100) const;

    // augmented cost f + lambda * g at x - alpha * p using the multiplier of x,
    // infinite if the displaced trajectory is invalid
    double merit(const PatchedConic& x, const Eigen::RowVector2d& p, double alpha) const;

    // step length minimizing merit along p
    double line_search(const PatchedConic& x, const Eigen::RowVector2d& p) const;

    // nondimensional measures compared against the tolerances
    double constraint(const PatchedConic& x) const;
    double optimality(const PatchedConic& x) const;
    double cost_decrease(const PatchedConic& previous, const PatchedConic& current) const;

    // Set methods
    void set_conjugate(bool conjugate);
    void set_disp(bool disp);

    // "GOLDEN" or the name of an NLopt local derivative-free algorithm (LN_*)
    void set_line_search(std::string method);
    void set_line_search_bracket(double lo, double hi);

private:

    struct LineSearchData
    {
        const Sgra* sgra;
        const PatchedConic* x;
        Eigen::RowVector2d p;
        double scale;
    };

    double gtol_;
    double ftol_;
    double qtol_;
    double alphatol_;
    double beta_;

    bool conjugate_;
    bool disp_;
    std::string line_search_;
    double bracket_lo_;
    double bracket_hi_;

    Scalar scalar_;

    PatchedConic gradient_step(const PatchedConic& x, const Eigen::RowVector2d& p, double alpha, int max_restore) const;
    double golden_search(const PatchedConic& x, const Eigen::RowVector2d& p) const;
    double nlopt_search(const PatchedConic& x, const Eigen::RowVector2d& p) const;

    static double line_search_objective(unsigned n, const double* x, double* grad, void* f_data);
};
