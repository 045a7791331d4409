/*
 *  Design.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <algorithm>
#include <set>

#include <Eigen/SVD>

#include "Design.h"
#include "Exceptions.h"

namespace IBC {

namespace {
const double DegenerateTolerance = 1e-10;
}

OneHot Encode(std::vector<std::string> const &values) {
    std::set<std::string> const unique(values.begin(), values.end());
    OneHot                      enc;
    enc.levels.assign(unique.begin(), unique.end());
    enc.matrix = Eigen::MatrixXd::Zero(values.size(), enc.levels.size());
    for (size_t i = 0; i < values.size(); i++) {
        auto const it = std::lower_bound(enc.levels.begin(), enc.levels.end(), values[i]);
        enc.matrix(i, std::distance(enc.levels.begin(), it)) = 1.0;
    }
    return enc;
}

FactorDesign::FactorDesign(std::vector<Factor> const &factors) {
    if (factors.empty()) {
        IBC_THROW(DesignError, "A factor design needs at least one factor");
    }
    size_t const         n = factors.front().values.size();
    std::vector<OneHot> encoded;
    Eigen::Index        cols = 1;
    for (auto const &f : factors) {
        if (f.values.size() != n) {
            IBC_THROW(DesignError,
                      "Factor {} has {} values, expected {}",
                      f.name,
                      f.values.size(),
                      n);
        }
        encoded.push_back(Encode(f.values));
        auto const &levels = encoded.back().levels;
        if (levels.size() < 2) {
            IBC_THROW(DesignError,
                      "Factor {} has {} level(s), at least 2 are required",
                      f.name,
                      levels.size());
        }
        m_names.push_back(f.name);
        m_levels.push_back(levels);
        m_offset.push_back(cols - 1);
        m_dof.push_back(levels.size() - 1);
        cols += levels.size() - 1;
    }

    m_matrix = Eigen::MatrixXd(n, cols);
    for (size_t f = 0; f < encoded.size(); f++) {
        m_matrix.middleCols(m_offset[f], m_dof[f]) = encoded[f].matrix.leftCols(m_dof[f]);
        m_labels.insert(m_labels.end(), m_levels[f].begin(), m_levels[f].end() - 1);
    }
    m_matrix.col(cols - 1).setOnes();
    m_labels.push_back("intercept");

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(m_matrix);
    auto const &                      sv = svd.singularValues();
    m_largest  = sv.maxCoeff();
    m_smallest = (m_matrix.rows() < m_matrix.cols()) ? 0.0 : sv.minCoeff();
}

bool FactorDesign::degenerate() const {
    return m_smallest <= DegenerateTolerance * m_largest;
}

Eigen::MatrixXd FactorDesign::contrast(size_t const f) const {
    Eigen::MatrixXd c = Eigen::MatrixXd::Zero(m_dof.at(f), m_matrix.cols());
    c.middleCols(m_offset[f], m_dof[f]).setIdentity();
    return c;
}

} // End namespace IBC
