#pragma once

#include <cstddef>

// class Scalar
// Converts dimensional quantities to and from a canonical unit system defined
// by a time and a distance unit.

class Scalar
{
public:
	Scalar();
	Scalar(double time, double distance);

	enum class Quantity
	{
		TIME = 0,
		RATE = 1,
		DISTANCE = 2,
		VELOCITY = 3,
		ACCELERATION = 4,
		ANGLE = 5
	};

	double ndim(Quantity quantity, double value) const;
	double rdim(Quantity quantity, double value) const;
	void ndim(const Quantity* quantities, double* values, size_t n) const;
	void rdim(const Quantity* quantities, double* values, size_t n) const;

	double get_scale(Quantity quantity) const;
private:
	double scalars_[6];
};
