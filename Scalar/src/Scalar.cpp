#include "Scalar.h"


Scalar::Scalar()
{
	for (size_t i = 0; i < 6; i++)
		scalars_[i] = 1.0;
}

Scalar::Scalar(double time, double distance)
{
	double rate = 1.0 / time;
	double velocity = distance * rate;

	scalars_[0] = time;
	scalars_[1] = rate;
	scalars_[2] = distance;
	scalars_[3] = velocity;
	scalars_[4] = velocity * rate;
	scalars_[5] = 1.0;
}


double Scalar::ndim(Quantity quantity, double value) const
{
	return value / scalars_[static_cast<int>(quantity)];
}

double Scalar::rdim(Quantity quantity, double value) const
{
	return value * scalars_[static_cast<int>(quantity)];
}

void Scalar::ndim(const Quantity* quantities, double* values, size_t n) const
{
	for (size_t i = 0; i < n; i++)
	{
		values[i] /= scalars_[static_cast<int>(quantities[i])];
	}
}

void Scalar::rdim(const Quantity* quantities, double* values, size_t n) const
{
	for (size_t i = 0; i < n; i++)
	{
		values[i] *= scalars_[static_cast<int>(quantities[i])];
	}
}

double Scalar::get_scale(Quantity quantity) const
{
	return scalars_[static_cast<int>(quantity)];
}
