#pragma once
#include <Eigen/Dense>
#include <complex>
namespace mrsfit {
	using Real     = double;
	using Complex  = std::complex<double>;
	using Vector   = Eigen::VectorXd;
	using Matrix   = Eigen::MatrixXd;
	using CVector  = Eigen::VectorXcd;
	using CMatrix  = Eigen::MatrixXcd;
} // namespace mrsfit
