#pragma once

#include <tuple>
#include <vector>

#include <nlopt.hpp>

#include "PatchedConic.h"
#include "Scalar.h"

class LunarTransferPlan
{
public:

	LunarTransferPlan();

	~LunarTransferPlan();

	//
	// constraint functions
	//

    void set_mission(double r0, double phi0, double rf);
	void add_phase_angle_constraint(double min, double max);

	//
	// model functions
	//

    void init_model(double lam1, double v0);
    void set_solution(const std::vector<double>& x);
	void run_model(int max_eval, double eps_t, double eps_x);

    struct Result
    {
        int nlopt_code;
        int nlopt_num_evals;
        double nlopt_value;
        double time_scale;
        double distance_scale;
        double velocity_scale;
        std::vector<double> nlopt_solution;
        std::vector<double> nlopt_constraints;
        double lam1;
        double v0;
        double f;
        double g;
        double deltav1;
        double deltav2;
        PatchedConic::Geometry geometry;
    };

    Result output_result();

private:

    //
    // variables
    //

    struct TransferPlanData
    {
        double r0;
        double phi0;
        double rf;
        double min_phase;
        double max_phase;
        Scalar scalar;
    };

    nlopt::opt opt_;
    bool run_;

    TransferPlanData data_;
    std::vector<double> x_;

    std::tuple<std::vector<double>, std::vector<double>> bounds();

    static PatchedConic transfer(const double* x, const TransferPlanData& data);
    static void constraints(unsigned m, double* result, unsigned n, const double* x, double* grad, void* f_data);
    static double objective(unsigned n, const double* x, double* grad, void* f_data);
};
