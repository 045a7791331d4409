/*
 *  LinearModel.h
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_LINEARMODEL_H
#define IBC_LINEARMODEL_H

#include <Eigen/Core>

namespace IBC {

/*
 * Mass-univariate ordinary least squares. Observations are rows of both the design and the
 * data, each data column is fitted independently.
 */
class LinearModel {
  public:
    LinearModel(Eigen::MatrixXd const &design, Eigen::MatrixXd const &data);

    Eigen::MatrixXd const &beta() const { return m_beta; }
    Eigen::ArrayXd const & variance() const { return m_sigma2; } //!< Residual variance per column
    Eigen::Index           rank() const { return m_rank; }
    Eigen::Index           dof() const { return m_dof; } //!< Residual degrees of freedom

    Eigen::ArrayXd FStatistic(Eigen::MatrixXd const &contrast) const;
    Eigen::ArrayXd ZScore(Eigen::MatrixXd const &contrast) const; //!< F-test converted to z

  private:
    Eigen::MatrixXd m_beta, m_cov;
    Eigen::ArrayXd  m_sigma2;
    Eigen::Index    m_rank, m_dof;
};

extern const double ZFloor; //!< -8.2095, the z of the largest representable p below 1

Eigen::ArrayXd FToZ(Eigen::ArrayXd const &F, double const df1, double const df2);
Eigen::ArrayXd FloorZ(Eigen::ArrayXd const &z, double const floor = ZFloor);
double         FDRThreshold(Eigen::ArrayXd const &z, double const alpha);

} // End namespace IBC

#endif // IBC_LINEARMODEL_H
