/*
 *  LinearModel.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <vector>

#include <Eigen/Dense>
#include <boost/math/distributions/fisher_f.hpp>
#include <boost/math/distributions/normal.hpp>

#include "Exceptions.h"
#include "LinearModel.h"

namespace IBC {

const double ZFloor = -8.2095;

namespace {
const double MinP = 1e-300;
const double MaxP = 1. - 1e-16;

double PToZ(double const p) {
    boost::math::normal const norm;
    return boost::math::quantile(boost::math::complement(norm, std::clamp(p, MinP, MaxP)));
}
} // namespace

LinearModel::LinearModel(Eigen::MatrixXd const &X, Eigen::MatrixXd const &Y) {
    if (X.rows() != Y.rows()) {
        IBC_THROW(DesignError,
                  "Design has {} rows but there are {} observations",
                  X.rows(),
                  Y.rows());
    }
    Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> const cod(X);
    m_rank = cod.rank();
    m_dof  = X.rows() - m_rank;
    if (m_dof < 1) {
        IBC_THROW(DesignError,
                  "No residual degrees of freedom ({} observations, rank {})",
                  X.rows(),
                  m_rank);
    }
    Eigen::MatrixXd const pinv = cod.pseudoInverse();
    m_beta                     = pinv * Y;
    m_cov                      = pinv * pinv.transpose();
    Eigen::MatrixXd const residuals = Y - X * m_beta;
    m_sigma2 = residuals.colwise().squaredNorm().transpose().array() / m_dof;
}

Eigen::ArrayXd LinearModel::FStatistic(Eigen::MatrixXd const &C) const {
    if (C.cols() != m_beta.rows()) {
        IBC_THROW(DesignError,
                  "Contrast has {} columns but the design has {}",
                  C.cols(),
                  m_beta.rows());
    }
    Eigen::MatrixXd const effect = C * m_beta;
    Eigen::MatrixXd const M      = C * m_cov * C.transpose();
    Eigen::MatrixXd const Minv   = M.completeOrthogonalDecomposition().pseudoInverse();
    Eigen::ArrayXd const  num =
        (effect.array() * (Minv * effect).array()).colwise().sum().transpose();
    return num / (static_cast<double>(C.rows()) * m_sigma2);
}

Eigen::ArrayXd LinearModel::ZScore(Eigen::MatrixXd const &C) const {
    return FToZ(FStatistic(C), C.rows(), m_dof);
}

Eigen::ArrayXd FToZ(Eigen::ArrayXd const &F, double const df1, double const df2) {
    boost::math::fisher_f const dist(df1, df2);
    Eigen::ArrayXd              z(F.size());
    for (Eigen::Index i = 0; i < F.size(); i++) {
        if (std::isnan(F[i])) {
            z[i] = 0.0; // Zero variance with zero effect
        } else if (std::isinf(F[i])) {
            z[i] = PToZ(MinP);
        } else {
            z[i] = PToZ(boost::math::cdf(boost::math::complement(dist, std::max(F[i], 0.0))));
        }
    }
    return z;
}

Eigen::ArrayXd FloorZ(Eigen::ArrayXd const &z, double const floor) {
    return (z > floor).select(z, 0.0);
}

/*
 * Benjamini-Hochberg on one-sided p-values of z, with the (i - 0.5) / n correction.
 * Returns +inf when nothing survives.
 */
double FDRThreshold(Eigen::ArrayXd const &z, double const alpha) {
    if (alpha <= 0.0 || alpha >= 1.0) {
        IBC_THROW(DesignError, "FDR level must be in (0, 1), got {}", alpha);
    }
    std::vector<double> sorted(z.data(), z.data() + z.size());
    std::sort(sorted.begin(), sorted.end(), std::greater<double>());
    boost::math::normal const norm;
    double const              n         = sorted.size();
    double                    threshold = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < sorted.size(); i++) {
        double const p = boost::math::cdf(boost::math::complement(norm, sorted[i]));
        if (p < alpha * (i + 0.5) / n) {
            threshold = sorted[i] - 1e-12;
        }
    }
    return threshold;
}

} // End namespace IBC
