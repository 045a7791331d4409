/*
 *  Design.h
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_DESIGN_H
#define IBC_DESIGN_H

#include <string>
#include <vector>

#include <Eigen/Core>

namespace IBC {

/*
 * One-hot encoding with the levels sorted lexicographically. Column j is 1 where the value is
 * levels[j].
 */
struct OneHot {
    Eigen::MatrixXd          matrix;
    std::vector<std::string> levels;
};
OneHot Encode(std::vector<std::string> const &values);

struct Factor {
    std::string              name;
    std::vector<std::string> values; //!< One per observation
};

/*
 * Reference-coded multi-factor design. Each factor contributes all but its last level, followed
 * by a single intercept column.
 */
class FactorDesign {
  public:
    explicit FactorDesign(std::vector<Factor> const &factors);

    Eigen::MatrixXd const &         matrix() const { return m_matrix; }
    std::vector<std::string> const &labels() const { return m_labels; }
    std::vector<std::string> const &levels(size_t const f) const { return m_levels.at(f); }
    Eigen::Index                    dof(size_t const f) const { return m_dof.at(f); }
    size_t                          factors() const { return m_names.size(); }
    std::string const &             name(size_t const f) const { return m_names.at(f); }
    double                          smallestSingularValue() const { return m_smallest; }
    double                          largestSingularValue() const { return m_largest; }
    bool                            degenerate() const;

    Eigen::MatrixXd contrast(size_t const f) const; //!< Identity rows over the columns of factor f

  private:
    Eigen::MatrixXd                       m_matrix;
    std::vector<std::string>              m_labels, m_names;
    std::vector<std::vector<std::string>> m_levels;
    std::vector<Eigen::Index>             m_dof, m_offset;
    double                                m_smallest = 0., m_largest = 0.;
};

} // End namespace IBC

#endif // IBC_DESIGN_H
