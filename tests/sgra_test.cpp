#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include <Eigen/Dense>

#include "astrodynamics.h"
#include "PatchedConic.h"
#include "Sgra.h"

namespace
{

    // departure from a 178 km circular orbit, intercept at 90 degrees
    PatchedConic worked_scenario()
    {
        const astrodynamics::EarthMoonSystem& s = astrodynamics::earth_moon;

        TransferParameters parameters;
        parameters.r0 = 6556400.0;
        parameters.v0 = std::sqrt(s.mu_earth / parameters.r0) + 3225.0;
        parameters.phi0 = 0.0;
        parameters.lam1 = 0.5 * astrodynamics::pi;
        parameters.rf = 1937000.0;
        return make_patched_conic(parameters);
    }

} // namespace

TEST(Restoration, WorkedScenarioConverges)
{
    Sgra sgra;
    PatchedConic x = sgra.restore(worked_scenario(), 100);

    EXPECT_LE(sgra.constraint(x), 5e-8);
    EXPECT_LE(std::abs(x.get_g()), 5e-8 * astrodynamics::earth_moon.moon_radius);
    EXPECT_NEAR(x.get_depart().get_v(), 10935.795695, 1e-4);
    EXPECT_EQ(x.get_lam1(), 0.5 * astrodynamics::pi);
}

TEST(Restoration, StepsReduceConstraint)
{
    Sgra sgra;
    Sgra::Restoration restoration = sgra.optimize_v0(worked_scenario(), 100);

    EXPECT_FALSE(restoration.converged());
    EXPECT_EQ(restoration.get_iterations(), 0);

    double g = std::abs(restoration.get_solution().get_g());
    int accepted = 0;

    while (restoration.step())
    {
        double g_next = std::abs(restoration.get_solution().get_g());
        EXPECT_LT(g_next, g);
        EXPECT_EQ(restoration.get_beta(), 1.0);
        g = g_next;
        accepted++;
    }

    EXPECT_TRUE(restoration.converged());
    EXPECT_GT(accepted, 0);
    EXPECT_LE(restoration.get_iterations(), 100);
    EXPECT_GE(restoration.get_iterations(), accepted);

    // a converged sequence stays converged
    EXPECT_FALSE(restoration.step());
}

TEST(Restoration, CallerMayStopEarly)
{
    Sgra sgra;
    PatchedConic x = worked_scenario();
    Sgra::Restoration restoration = sgra.optimize_v0(x, 100);

    ASSERT_TRUE(restoration.step());
    EXPECT_FALSE(restoration.converged());
    EXPECT_LT(std::abs(restoration.get_solution().get_g()), std::abs(x.get_g()));
    EXPECT_GT(sgra.constraint(restoration.get_solution()), 5e-8);
}

TEST(Restoration, OutlivesOptimizer)
{
    Sgra::Restoration restoration = Sgra().optimize_v0(worked_scenario(), 100);

    while (restoration.step());

    EXPECT_TRUE(restoration.converged());
    EXPECT_NEAR(restoration.get_solution().get_depart().get_v(), 10935.795695, 1e-4);
}

TEST(Restoration, StepUnderflow)
{
    // a vanishing step scale cannot move v0
    Sgra sgra(5e-8, 1e-12, 1e-6, 1e-6, 1e-30);

    EXPECT_THROW(sgra.restore(worked_scenario()), RestorationUnderflowError);
    EXPECT_THROW(sgra.restore(worked_scenario()), SgraError);
}

TEST(Restoration, IterationLimit)
{
    Sgra sgra;
    EXPECT_THROW(sgra.restore(worked_scenario(), 2), IterationLimitError);
    EXPECT_THROW(sgra.restore(worked_scenario(), 2), SgraError);
}

TEST(Sgra, MeritOfInvalidTrajectoryIsInfinite)
{
    Sgra sgra;
    PatchedConic x = sgra.restore(worked_scenario());

    EXPECT_TRUE(std::isinf(sgra.merit(x, x.get_dF_dx(), 1e3)));
    EXPECT_NEAR(sgra.merit(x, x.get_dF_dx(), 0.0), x.get_F(), 1e-9);
}

TEST(Sgra, GoldenLineSearchExpandsBracket)
{
    Sgra sgra;
    PatchedConic x = sgra.restore(worked_scenario());
    Eigen::RowVector2d p = x.get_dF_dx();

    double alpha = sgra.line_search(x, p);

    EXPECT_GT(alpha, 3e-5);
    EXPECT_NEAR(alpha, 0.01747, 1e-3);
    EXPECT_LT(sgra.merit(x, p, alpha), sgra.merit(x, p, 1e-14));
    EXPECT_LT(sgra.merit(x, p, alpha), sgra.merit(x, p, 3e-5));
}

TEST(Sgra, NloptLineSearchImprovesMerit)
{
    Sgra sgra;
    sgra.set_line_search("LN_NELDERMEAD");

    PatchedConic x = sgra.restore(worked_scenario());
    Eigen::RowVector2d p = x.get_dF_dx();

    double alpha = sgra.line_search(x, p);

    EXPECT_GT(alpha, 0.0);
    EXPECT_LE(sgra.merit(x, p, alpha), sgra.merit(x, p, 3e-5));
    EXPECT_LT(sgra.merit(x, p, alpha), sgra.merit(x, p, 1e-14));
}

TEST(Sgra, LineSearchConfigurationIsValidated)
{
    Sgra sgra;

    EXPECT_THROW(sgra.set_line_search("LD_MMA"), std::runtime_error);
    EXPECT_THROW(sgra.set_line_search_bracket(3e-5, 1e-14), std::runtime_error);
    EXPECT_THROW(sgra.set_line_search_bracket(0.0, 1e-5), std::runtime_error);
    EXPECT_NO_THROW(sgra.set_line_search("GOLDEN"));
    EXPECT_NO_THROW(sgra.set_line_search_bracket(1e-12, 1e-4));
}

TEST(Sgra, GradientOptimizerConverges)
{
    Sgra sgra(5e-8, 1e-15, 1e-6);
    Sgra::Result result = sgra.optimize_deltav(worked_scenario());

    ASSERT_EQ(result.termination, Sgra::Termination::OPTIMALITY);
    ASSERT_EQ(result.history.size(), static_cast<size_t>(result.iterations + 1));
    EXPECT_GE(result.iterations, 5);
    EXPECT_LE(result.iterations, 20);

    const PatchedConic& x = result.history.back();

    EXPECT_LE(sgra.optimality(x), 1e-6);
    EXPECT_LE(sgra.constraint(x), 5e-8);
    EXPECT_NEAR(x.get_lam1(), 1.43978, 1e-3);
    EXPECT_NEAR(x.get_depart().get_v(), 10935.30106, 1e-2);
    EXPECT_NEAR(x.get_f(), 3909.456844, 1e-3);

    for (size_t i = 1; i < result.history.size(); i++)
    {
        EXPECT_LT(result.history[i].get_f(), result.history[i - 1].get_f()) << "iteration " << i;
        EXPECT_LE(sgra.optimality(result.history[i]), sgra.optimality(result.history[i - 1])) << "iteration " << i;
        EXPECT_LE(sgra.constraint(result.history[i]), 5e-8) << "iteration " << i;
    }
}

TEST(Sgra, DefaultTolerancesConverge)
{
    Sgra sgra;
    Sgra::Result result = sgra.optimize_deltav(worked_scenario());

    EXPECT_EQ(result.termination, Sgra::Termination::OPTIMALITY);
    EXPECT_LE(sgra.optimality(result.history.back()), 1e-6);
    EXPECT_NEAR(result.history.back().get_f(), 3909.456844, 1e-3);
}

TEST(Sgra, ConvergenceOnLastAllowedIteration)
{
    Sgra sgra;
    Sgra::Result result = sgra.optimize_deltav(worked_scenario());
    ASSERT_EQ(result.termination, Sgra::Termination::OPTIMALITY);

    Sgra::Result exact = sgra.optimize_deltav(worked_scenario(), 100, result.iterations);

    EXPECT_EQ(exact.termination, Sgra::Termination::OPTIMALITY);
    EXPECT_EQ(exact.iterations, result.iterations);
    EXPECT_THROW(sgra.optimize_deltav(worked_scenario(), 100, result.iterations - 1), IterationLimitError);
}

TEST(Sgra, GradientStepUnderflow)
{
    // residual below what round-off allows, steps eventually stop moving x
    Sgra sgra(5e-8, 1e-15, 2e-15);

    EXPECT_THROW(sgra.optimize_deltav(worked_scenario()), StepUnderflowError);
}

TEST(Sgra, ConjugateGradientDecreasesCost)
{
    Sgra sgra(5e-8, 1e-15, 30.0);
    sgra.set_conjugate(true);

    Sgra::Result result = sgra.optimize_deltav(worked_scenario());

    ASSERT_EQ(result.termination, Sgra::Termination::OPTIMALITY);
    ASSERT_GE(result.history.size(), static_cast<size_t>(3));
    EXPECT_LE(sgra.optimality(result.history.back()), 30.0);

    // first cycle is a plain gradient step, later directions carry memory
    EXPECT_NEAR(result.history[1].get_lam1(), 1.5565266, 1e-4);
    EXPECT_NEAR(result.history[2].get_lam1(), 1.5476190, 1e-4);

    for (size_t i = 1; i < result.history.size(); i++)
    {
        EXPECT_LT(result.history[i].get_f(), result.history[i - 1].get_f()) << "iteration " << i;
    }
}

TEST(Sgra, GradientIterationLimit)
{
    Sgra sgra(5e-8, 1e-15, 1e-6);
    EXPECT_THROW(sgra.optimize_deltav(worked_scenario(), 100, 3), IterationLimitError);
}

TEST(Sgra, CostToleranceStopsOptimizer)
{
    Sgra sgra(5e-8, 1.0, 1e-6);
    Sgra::Result result = sgra.optimize_deltav(worked_scenario());

    EXPECT_EQ(result.termination, Sgra::Termination::COST);
    EXPECT_EQ(result.iterations, 1);
}
